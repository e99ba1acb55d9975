#pragma once

/// @file log_sinks.hpp
/// @brief Concrete LogSink implementations.
///
/// Provides a sink that discards everything, one that writes to a pair
/// of streams for command-line use, and an in-memory buffer for tests.
///
/// @ingroup io_logging

#include <ganttgen/core/log_sink.hpp>

#include <ostream>
#include <string>
#include <vector>

namespace ganttgen::io {

/// @brief Log sink that silently discards all messages.
///
/// @ingroup io_logging
/// @see core::LogSink
class NullLogSink : public core::LogSink {
public:
    /// @brief Receive an informational line (ignored).
    /// @param message  Message text, without a trailing newline.
    void output(std::string_view message) override;

    /// @brief Receive a warning (ignored).
    /// @param message  Message text, without a trailing newline.
    void warning(std::string_view message) override;

    /// @brief Receive an error (ignored).
    /// @param message  Message text, without a trailing newline.
    void error(std::string_view message) override;
};

/// @brief Log sink that writes one line per message to a pair of streams.
///
/// Informational lines go to @c out unchanged. Warnings and errors go to
/// @c err, prefixed with `warning: ` and `error: `.
///
/// Non-copyable and non-movable because it holds references to the
/// streams.
///
/// @ingroup io_logging
/// @see core::LogSink, MemoryLogSink
class StreamLogSink : public core::LogSink {
public:
    /// @param out  Destination for output() (must outlive this sink).
    /// @param err  Destination for warning() and error() (must outlive this sink).
    StreamLogSink(std::ostream& out, std::ostream& err);

    StreamLogSink(const StreamLogSink&) = delete;
    StreamLogSink& operator=(const StreamLogSink&) = delete;
    StreamLogSink(StreamLogSink&&) = delete;
    StreamLogSink& operator=(StreamLogSink&&) = delete;
    ~StreamLogSink() override = default;

    /// @brief Write @p message and a newline to the output stream.
    /// @param message  Message text, without a trailing newline.
    void output(std::string_view message) override;

    /// @brief Write `warning: ` and @p message to the error stream.
    /// @param message  Message text, without a trailing newline.
    void warning(std::string_view message) override;

    /// @brief Write `error: ` and @p message to the error stream.
    /// @param message  Message text, without a trailing newline.
    void error(std::string_view message) override;

private:
    std::ostream& out_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    std::ostream& err_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
};

/// @brief Severity of a buffered log message.
/// @ingroup io_logging
enum class Severity {
    Output,
    Warning,
    Error
};

/// @brief A single message stored in memory.
/// @ingroup io_logging
struct LogRecord {
    Severity severity;    ///< Which LogSink method received the message.
    std::string message;  ///< Message text as passed to the sink.
};

/// @brief Log sink that buffers all messages as @ref LogRecord objects.
///
/// @ingroup io_logging
/// @see LogRecord, StreamLogSink
class MemoryLogSink : public core::LogSink {
public:
    /// @brief Append a Severity::Output record.
    /// @param message  Message text, without a trailing newline.
    void output(std::string_view message) override;

    /// @brief Append a Severity::Warning record.
    /// @param message  Message text, without a trailing newline.
    void warning(std::string_view message) override;

    /// @brief Append a Severity::Error record.
    /// @param message  Message text, without a trailing newline.
    void error(std::string_view message) override;

    /// @brief All buffered messages, oldest first.
    [[nodiscard]] const std::vector<LogRecord>& records() const { return records_; }

    /// @brief Number of buffered messages of @p severity.
    [[nodiscard]] std::size_t count(Severity severity) const;

    /// @brief Discard all buffered messages.
    void clear() { records_.clear(); }

private:
    std::vector<LogRecord> records_;
};

} // namespace ganttgen::io

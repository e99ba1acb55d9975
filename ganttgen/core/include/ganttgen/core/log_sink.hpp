#pragma once

#include <string_view>

namespace ganttgen::core {

/// @brief Abstract interface for reporting diagnostics.
/// @ingroup core
///
/// A LogSink receives plain text lines at three severities. The layout
/// engine holds an optional pointer to a sink; when none is installed the
/// overhead is a single null-pointer check.
///
/// @see layout::LayoutEngine::set_log_sink(), io::StreamLogSink
class LogSink {
public:
    /// @brief Virtual destructor for safe polymorphic deletion.
    virtual ~LogSink() = default;

    /// @brief Emit an informational line.
    /// @param message Text without a trailing newline.
    virtual void output(std::string_view message) = 0;

    /// @brief Emit a warning; processing continues.
    /// @param message Text without a trailing newline.
    virtual void warning(std::string_view message) = 0;

    /// @brief Emit an error; the caller is about to abort.
    /// @param message Text without a trailing newline.
    virtual void error(std::string_view message) = 0;

protected:
    /// @brief Default constructor (protected -- instantiate subclasses only).
    LogSink() = default;

    LogSink(const LogSink&) = default;
    LogSink& operator=(const LogSink&) = default;
    LogSink(LogSink&&) = default;
    LogSink& operator=(LogSink&&) = default;
};

} // namespace ganttgen::core

#include <ganttgen/io/log_sinks.hpp>

#include <algorithm>

namespace ganttgen::io {

// =============================================================================
// NullLogSink
// =============================================================================

void NullLogSink::output(std::string_view /*message*/) {}
void NullLogSink::warning(std::string_view /*message*/) {}
void NullLogSink::error(std::string_view /*message*/) {}

// =============================================================================
// StreamLogSink
// =============================================================================

StreamLogSink::StreamLogSink(std::ostream& out, std::ostream& err)
    : out_(out)
    , err_(err) {}

void StreamLogSink::output(std::string_view message) {
    out_ << message << '\n';
}

void StreamLogSink::warning(std::string_view message) {
    err_ << "warning: " << message << '\n';
}

void StreamLogSink::error(std::string_view message) {
    err_ << "error: " << message << '\n';
}

// =============================================================================
// MemoryLogSink
// =============================================================================

void MemoryLogSink::output(std::string_view message) {
    records_.push_back(LogRecord{Severity::Output, std::string(message)});
}

void MemoryLogSink::warning(std::string_view message) {
    records_.push_back(LogRecord{Severity::Warning, std::string(message)});
}

void MemoryLogSink::error(std::string_view message) {
    records_.push_back(LogRecord{Severity::Error, std::string(message)});
}

std::size_t MemoryLogSink::count(Severity severity) const {
    return static_cast<std::size_t>(std::count_if(records_.begin(), records_.end(),
        [severity](const LogRecord& record) { return record.severity == severity; }));
}

} // namespace ganttgen::io

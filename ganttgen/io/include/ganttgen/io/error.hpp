#pragma once

/// @file error.hpp
/// @brief Exception type for the ganttgen I/O library.
/// @ingroup io

#include <stdexcept>
#include <string>

namespace ganttgen::io {

/// @brief Exception for input and output failures.
///
/// Thrown by the chart loader when JSON input is malformed or does not
/// match the chart schema, and by the writers when a file cannot be
/// opened. Layout problems in a well-formed chart are reported through
/// core::ChartError instead.
///
/// @ingroup io
/// @see load_chart, write_svg_file
class LoaderError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;

    /// @brief Construct a LoaderError with a contextual prefix.
    ///
    /// The resulting message is formatted as `"context: message"`.
    ///
    /// @param message  Human-readable description of the error.
    /// @param context  Where it happened, e.g. a file path or `items[3]`.
    LoaderError(const std::string& message, const std::string& context)
        : std::runtime_error(context + ": " + message) {}
};

} // namespace ganttgen::io

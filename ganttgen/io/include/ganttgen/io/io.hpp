#pragma once

/// @defgroup io I/O Library
/// @brief JSON chart loading, SVG output, and log sinks.
///
/// The I/O library handles all external formats: reading chart
/// descriptions from JSON and writing the layout library's Document as
/// SVG. It also provides the concrete core::LogSink implementations.
/// Depends on core and layout.

/// @defgroup io_loaders Loaders
/// @ingroup io
/// @brief Chart JSON loader.

/// @defgroup io_writers Writers
/// @ingroup io
/// @brief SVG serialization.

/// @defgroup io_logging Log Sinks
/// @ingroup io
/// @brief Null, stream, and memory log sinks.

// Convenience header for the I/O library

#include <ganttgen/io/error.hpp>
#include <ganttgen/io/chart_loader.hpp>
#include <ganttgen/io/svg_writer.hpp>
#include <ganttgen/io/log_sinks.hpp>

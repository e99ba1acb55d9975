#pragma once

/// @defgroup core Core Library
/// @brief Calendar arithmetic, chart model, errors, and diagnostics.
///
/// The core library provides the foundations shared by the layout and
/// I/O libraries: date utilities, the input chart model, the exception
/// taxonomy, and the LogSink interface. It has no dependencies on the
/// layout algorithm or on any file format.

/// @defgroup core_calendar Calendar
/// @ingroup core
/// @brief Date types and weekend-aware date arithmetic.

/// @defgroup core_model Chart Model
/// @ingroup core
/// @brief Input description of a schedule.

// Convenience header for the core library
#include <ganttgen/core/calendar.hpp>
#include <ganttgen/core/chart.hpp>
#include <ganttgen/core/error.hpp>
#include <ganttgen/core/log_sink.hpp>

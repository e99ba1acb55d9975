#pragma once

#include <stdexcept>
#include <string>

namespace ganttgen::core {

/// @brief Base exception for all chart layout errors.
///
/// All exceptions thrown while validating or laying out a chart derive
/// from this class, allowing callers to catch layout-specific errors
/// separately from loader and other `std::runtime_error` exceptions.
///
/// @see InsufficientInputError, MissingAnchorError, InvalidReferenceError, DateRangeError
/// @ingroup core
class ChartError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// @brief Thrown when a chart holds fewer than two schedule items.
///
/// @see ChartError
/// @ingroup core
class InsufficientInputError : public ChartError {
public:
    using ChartError::ChartError;
};

/// @brief Thrown when the first schedule item cannot seed the layout cursor.
///
/// The first item must carry both an explicit start date and a resource
/// index; every later item inherits whichever of the two it omits.
///
/// @see ChartError
/// @ingroup core
class MissingAnchorError : public ChartError {
public:
    using ChartError::ChartError;
};

/// @brief Thrown when a schedule item references a resource that does not exist.
///
/// @see ChartError
/// @ingroup core
class InvalidReferenceError : public ChartError {
public:
    using ChartError::ChartError;
};

/// @brief Thrown when a layout option is outside its valid range.
///
/// For example, a negative title-column width.
///
/// @see ChartError, layout::LayoutOptions
/// @ingroup core
class InvalidOptionError : public ChartError {
public:
    using ChartError::ChartError;
};

/// @brief Thrown when a schedule reaches outside the supported calendar.
///
/// Raised for a start date before MIN_DATE, or a duration that carries
/// the cursor past MAX_DATE.
///
/// @see ChartError, in_calendar_range
/// @ingroup core
class DateRangeError : public ChartError {
public:
    using ChartError::ChartError;
};

} // namespace ganttgen::core

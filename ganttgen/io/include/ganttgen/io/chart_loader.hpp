#pragma once

/// @file chart_loader.hpp
/// @brief Loading chart descriptions from JSON.
/// @ingroup io_loaders

#include <ganttgen/core/chart.hpp>

#include <filesystem>
#include <istream>
#include <string_view>

namespace ganttgen::io {

/// @brief Load a chart from a JSON file.
///
/// @param path  Filesystem path to the chart file.
/// @return Parsed chart, not yet validated for layout.
///
/// @throws LoaderError  If the file cannot be read or does not match the schema.
///
/// @see load_chart_from_string
core::Chart load_chart(const std::filesystem::path& path);

/// @brief Load a chart from an input stream (e.g. stdin).
///
/// Reads @p in to exhaustion before parsing.
///
/// @throws LoaderError  If the content does not match the schema.
core::Chart load_chart_from_stream(std::istream& in);

/// @brief Load a chart from a JSON string.
///
/// The document root is an object with `title`, `resources` and `items`,
/// and optionally `markedDate` (`YYYY-MM-DD`). Each item has a `title` and
/// may carry `duration` (whole days), `startDate` (`YYYY-MM-DDTHH:MM:SS`),
/// `resource` (index into `resources`) and `open`. A `null` optional field
/// counts as absent, and unknown fields are ignored.
///
/// The input is strict JSON with two relaxations: comments and trailing
/// commas. Other JSON5 syntax, such as unquoted keys or single-quoted
/// strings, is a parse error. Strings must be valid UTF-8.
///
/// A `duration` longer than core::MAX_SPAN_DAYS is rejected here; whether
/// a schedule fits the calendar is checked during layout.
///
/// Only the schema is checked here; structural rules such as "the first
/// item has a start date" are left to layout::validate_chart().
///
/// @param json  JSON content describing the chart.
/// @return Parsed chart.
///
/// @throws LoaderError  If the JSON is malformed or a field has the wrong
///                      type or an invalid value.
core::Chart load_chart_from_string(std::string_view json);

} // namespace ganttgen::io

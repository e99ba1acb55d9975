#pragma once

/// @file scene_builder.hpp
/// @brief Turns a Geometry into a Document of drawing primitives.
/// @ingroup layout_scene

#include <ganttgen/layout/geometry.hpp>
#include <ganttgen/layout/scene.hpp>

#include <string_view>

namespace ganttgen::layout {

/// @brief Baseline of the chart title.
/// @ingroup layout_scene
inline constexpr double TITLE_BASELINE = 25.0;

/// @brief Horizontal distance between legend entries.
/// @ingroup layout_scene
inline constexpr double LEGEND_PITCH = 100.0;

/// @brief How far the marker line extends above and below the chart body.
/// @ingroup layout_scene
inline constexpr double MARKER_OVERHANG = 5.0;

/// @brief Heading of the title column.
/// @ingroup layout_scene
inline constexpr std::string_view TASKS_HEADING = "Tasks";

/// @ingroup layout_scene
struct SceneOptions {
    bool resource_legend{false};  ///< Draw a swatch and label per resource below the chart.
};

/// @brief Canvas width: gutters, title column, and all month columns.
/// @ingroup layout_scene
[[nodiscard]] double canvas_width(const Geometry& geometry);

/// @brief Canvas height: gutters, all rows, and the legend block if drawn.
/// @ingroup layout_scene
[[nodiscard]] double canvas_height(const Geometry& geometry, bool resource_legend);

/// @brief Build the drawing for @p geometry.
///
/// Elements appear in this order: chart title, column group (vertical grid
/// lines and month labels), "Tasks" heading, row group (horizontal grid
/// lines, titles, bars and milestones), marker line, legend group. An
/// absent marker is an empty Group, and the legend group is empty unless
/// requested, so element positions do not depend on the input.
///
/// @ingroup layout_scene
/// @see io::write_svg
[[nodiscard]] Document build_scene(const Geometry& geometry, const SceneOptions& options = {});

} // namespace ganttgen::layout

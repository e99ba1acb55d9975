#pragma once

/// @file geometry.hpp
/// @brief The resolved pixel geometry of a chart.
/// @ingroup layout_engine

#include <ganttgen/core/calendar.hpp>
#include <ganttgen/layout/color.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ganttgen::layout {

/// @brief Margins around a layout region.
/// @ingroup layout_engine
struct Gutter {
    double left{0.0};
    double top{0.0};
    double right{0.0};
    double bottom{0.0};

    /// @brief Combined horizontal margin.
    [[nodiscard]] constexpr double width() const noexcept { return left + right; }

    /// @brief Combined vertical margin.
    [[nodiscard]] constexpr double height() const noexcept { return top + bottom; }
};

/// @brief Margins around the whole chart body.
/// @ingroup layout_engine
inline constexpr Gutter CHART_GUTTER{10.0, 80.0, 10.0, 10.0};

/// @brief Margins inside each row around its bar or milestone.
/// @ingroup layout_engine
inline constexpr Gutter ROW_GUTTER{5.0, 5.0, 5.0, 5.0};

/// @brief Margins inside the resource legend block.
/// @ingroup layout_engine
inline constexpr Gutter RESOURCE_GUTTER{10.0, 10.0, 10.0, 10.0};

/// @brief Height of a bar, and of a legend swatch, excluding gutters.
/// @ingroup layout_engine
inline constexpr double CONTENT_HEIGHT = 20.0;

/// @brief Corner radius of task bars and legend swatches.
/// @ingroup layout_engine
inline constexpr double CORNER_RADIUS = 3.0;

/// @brief One month column.
/// @ingroup layout_engine
struct Column {
    double width{0.0};  ///< Proportional to the month's day count.
    std::string label;  ///< Three-letter month name.
};

/// @brief One schedule item placed on the horizontal axis.
/// @ingroup layout_engine
struct Row {
    std::string title;
    std::size_t resource{0};
    double offset{0.0};           ///< X coordinate of the start (or milestone centre).
    std::optional<double> length; ///< Bar width; absent for milestones.
    bool open{false};

    [[nodiscard]] bool is_milestone() const noexcept { return !length.has_value(); }
};

/// @brief Everything the scene builder needs to draw a chart.
///
/// Built once by LayoutEngine::compute() and only read afterwards.
///
/// @ingroup layout_engine
/// @see LayoutEngine, build_scene
struct Geometry {
    std::string title;

    Gutter gutter{CHART_GUTTER};
    Gutter row_gutter{ROW_GUTTER};
    double row_height{ROW_GUTTER.height() + CONTENT_HEIGHT};
    Gutter resource_gutter{RESOURCE_GUTTER};
    double resource_height{RESOURCE_GUTTER.height() + CONTENT_HEIGHT};
    double corner_radius{CORNER_RADIUS};

    double title_width{0.0};
    double max_month_width{0.0};

    core::Date start_date{};   ///< First day of the first column.
    core::Date end_date{};     ///< Last day of the last column.
    int64_t total_days{0};     ///< Days covered by all columns.
    double total_width{0.0};   ///< Sum of all column widths.

    std::vector<Column> columns;
    std::vector<Row> rows;
    std::optional<double> marked_date_offset;

    std::vector<std::string> resources;
    std::vector<ResourceStyle> styles; ///< Indexed by resource.
};

} // namespace ganttgen::layout

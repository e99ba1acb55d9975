#pragma once

#include <ganttgen/core/calendar.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ganttgen::core {

/// @brief One task or milestone of a schedule.
///
/// An item without a duration is a milestone. Items without a start date
/// begin where the previous task ended; items without a resource inherit
/// the previous item's resource.
///
/// @ingroup core_model
/// @see Chart
struct ScheduleItem {
    std::string title;                  ///< Label shown in the title column.
    std::optional<int64_t> duration;    ///< Length in days; absent for milestones.
    std::optional<DateTime> start;      ///< Explicit absolute start.
    std::optional<std::size_t> resource; ///< Index into Chart::resources.
    std::optional<bool> open;           ///< In-progress flag; absent means closed.
};

/// @brief Complete input description of a chart.
///
/// @ingroup core_model
/// @see ScheduleItem, io::load_chart
struct Chart {
    std::string title;                  ///< Chart heading.
    std::optional<Date> marked_date;    ///< Optional date drawn as a dashed marker.
    std::vector<std::string> resources; ///< Legend labels; the index is the resource id.
    std::vector<ScheduleItem> items;    ///< Tasks and milestones in display order.
};

} // namespace ganttgen::core

#pragma once

/// @file layout_engine.hpp
/// @brief Validation and geometry derivation for a chart.
/// @ingroup layout_engine

#include <ganttgen/core/calendar.hpp>
#include <ganttgen/core/chart.hpp>
#include <ganttgen/core/log_sink.hpp>
#include <ganttgen/layout/geometry.hpp>

#include <cstdint>
#include <optional>
#include <random>
#include <vector>

namespace ganttgen::layout {

/// @brief User-tunable layout parameters.
/// @ingroup layout_engine
struct LayoutOptions {
    double title_width{210.0};     ///< Width of the task title column.
    double max_month_width{80.0};  ///< Width of a 31-day month column.

    /// @brief Reject negative widths.
    /// @throws core::InvalidOptionError  If either width is negative.
    void validate() const;
};

/// @brief Where one item sits on the calendar after the cursor fold.
/// @ingroup layout_engine
struct ScheduleStep {
    core::DateTime start{};              ///< Cursor when the item begins.
    std::optional<int64_t> shadow_days;  ///< Weekend-extended duration; absent for milestones.
};

/// @brief Result of folding the cursor over all schedule items.
///
/// @ingroup layout_engine
/// @see scan_schedule
struct ScheduleScan {
    std::vector<ScheduleStep> steps;  ///< One per item, in input order.
    core::DateTime earliest_start{};  ///< Earliest explicit start, moved off any weekend.
    core::DateTime latest_end{};      ///< Furthest the cursor advanced.
};

/// @brief Column layout for a date range.
/// @ingroup layout_engine
struct ColumnSpan {
    std::vector<Column> columns;
    int64_t total_days{0};
    double total_width{0.0};
};

/// @brief Maps calendar positions to horizontal pixel coordinates.
///
/// The whole column span is linear in days: a point @c d days after the
/// first column starts sits at `origin + d / total_days * total_width`.
///
/// @ingroup layout_engine
class DateScale {
public:
    DateScale(core::Date start, int64_t total_days, double total_width, double origin) noexcept
        : start_(start)
        , total_days_(total_days)
        , total_width_(total_width)
        , origin_(origin) {}

    /// @brief X coordinate of @p instant.
    [[nodiscard]] double offset(core::DateTime instant) const noexcept;

    /// @brief Width of a span of @p days days.
    [[nodiscard]] double length(int64_t days) const noexcept;

private:
    core::Date start_;
    int64_t total_days_;
    double total_width_;
    double origin_;
};

/// @brief Check the structural invariants a chart must satisfy before layout.
///
/// @throws core::InsufficientInputError  Fewer than two items.
/// @throws core::MissingAnchorError      First item lacks a start date or a resource.
/// @throws core::InvalidReferenceError   A resource index is out of range.
/// @ingroup layout_engine
void validate_chart(const core::Chart& chart);

/// @brief Duration of a task extended so that it does not end on a weekend.
///
/// @param cursor    Start of the task.
/// @param duration  Nominal length in days.
/// @return @p duration plus weekend_shift(cursor + duration).
/// @pre `cursor + duration` days is representable; scan_schedule() checks
///      this against core::MAX_DATE before calling.
/// @ingroup layout_engine
[[nodiscard]] int64_t shadow_duration(core::DateTime cursor, int64_t duration);

/// @brief First pass: fold the running cursor over @p items.
///
/// An explicit start moves the cursor there. A duration advances the
/// cursor by its shadow duration. A milestone leaves the cursor unchanged.
///
/// @throws core::MissingAnchorError  If @p items is empty or the first item
///                                   has no start date.
/// @throws core::DateRangeError      If a start date lies outside the
///                                   supported calendar, a duration is
///                                   negative, or the cursor would pass
///                                   core::MAX_DATE.
/// @ingroup layout_engine
[[nodiscard]] ScheduleScan scan_schedule(const std::vector<core::ScheduleItem>& items);

/// @brief One column per calendar month from @p start to @p end inclusive.
/// @ingroup layout_engine
[[nodiscard]] ColumnSpan compute_columns(core::Date start, core::Date end, double max_month_width);

/// @brief Second pass: place every item on @p scale.
///
/// Restarts the cursor at the first column and re-walks the items using
/// the shadow durations recorded by scan_schedule(). Items without a
/// resource inherit the previous row's.
///
/// @pre @p scan was produced from @p items and the chart passed validate_chart().
/// @ingroup layout_engine
[[nodiscard]] std::vector<Row> place_rows(const std::vector<core::ScheduleItem>& items,
                                          const ScheduleScan& scan,
                                          core::Date start_date,
                                          const DateScale& scale);

/// @brief Turns a validated chart into its Geometry.
///
/// The engine is stateless apart from its options and an optional
/// diagnostics sink, so one instance can lay out any number of charts.
///
/// @code
/// layout::LayoutEngine engine{options};
/// engine.set_log_sink(&sink);
/// std::mt19937 rng{seed};
/// auto geometry = engine.compute(chart, rng);
/// @endcode
///
/// @ingroup layout_engine
/// @see build_scene
class LayoutEngine {
public:
    /// @throws core::InvalidOptionError  If @p options fails LayoutOptions::validate().
    explicit LayoutEngine(LayoutOptions options = {});

    [[nodiscard]] const LayoutOptions& options() const noexcept { return options_; }

    /// @brief Install a diagnostics sink (nullptr to disable).
    /// @param sink Non-owning; must outlive the engine's use of it.
    void set_log_sink(core::LogSink* sink) noexcept { log_sink_ = sink; }

    /// @brief Lay out @p chart with resource colors seeded from @p rng.
    ///
    /// Validation happens before anything is drawn from @p rng.
    ///
    /// @throws core::ChartError  If the chart fails validation.
    [[nodiscard]] Geometry compute(const core::Chart& chart, std::mt19937& rng) const;

    /// @brief Lay out @p chart with resource colors starting at @p initial_hue.
    /// @throws core::ChartError  If the chart fails validation.
    [[nodiscard]] Geometry compute(const core::Chart& chart, double initial_hue) const;

private:
    [[nodiscard]] Geometry compute_geometry(const core::Chart& chart) const;

    LayoutOptions options_;
    core::LogSink* log_sink_{nullptr};
};

} // namespace ganttgen::layout

#include <ganttgen/layout/layout_engine.hpp>
#include <ganttgen/core/error.hpp>

#include <algorithm>
#include <sstream>
#include <string>
#include <utility>

namespace ganttgen::layout {

namespace {

using core::Date;
using core::DateTime;
using core::ScheduleItem;

// Running state of the first pass
struct SpanState {
    DateTime cursor;
    DateTime earliest;
    DateTime latest;
};

// Running state of the second pass
struct RowState {
    DateTime cursor;
    std::size_t resource;
};

std::string item_context(std::size_t index) {
    return "items[" + std::to_string(index) + "]";
}

std::pair<SpanState, ScheduleStep> scan_step(const SpanState& state, const ScheduleItem& item, std::size_t index) {
    SpanState next = state;

    if (item.start) {
        if (!core::in_calendar_range(*item.start)) {
            throw core::DateRangeError(item_context(index) + ": start date " + core::format_date_time(*item.start) +
                                       " is outside " + core::format_date(core::MIN_DATE) + " to " +
                                       core::format_date(core::MAX_DATE));
        }
        next.cursor = *item.start;
        if (*item.start < next.earliest) {
            // Move the project start if it falls on a weekend
            next.earliest = *item.start + core::weekend_shift(*item.start);
        }
    }

    ScheduleStep step{next.cursor, std::nullopt};
    if (item.duration) {
        // Bound the duration before it becomes a chrono duration
        const DateTime limit{core::MAX_DATE + std::chrono::days{1}};
        if (*item.duration < 0) {
            throw core::DateRangeError(item_context(index) + ": duration must be non-negative");
        }
        if (*item.duration > core::days_between(limit, next.cursor)) {
            throw core::DateRangeError(item_context(index) + ": duration of " + std::to_string(*item.duration) +
                                       " days runs past " + core::format_date(core::MAX_DATE));
        }
        const int64_t shadow = shadow_duration(next.cursor, *item.duration);
        if (next.cursor + std::chrono::days{shadow} >= limit) {
            throw core::DateRangeError(item_context(index) + ": duration of " + std::to_string(*item.duration) +
                                       " days runs past " + core::format_date(core::MAX_DATE));
        }
        next.cursor += std::chrono::days{shadow};
        step.shadow_days = shadow;
    }

    next.latest = std::max(next.latest, next.cursor);
    return {next, step};
}

std::pair<RowState, Row> place_step(const RowState& state,
                                    const ScheduleItem& item,
                                    const ScheduleStep& step,
                                    const DateScale& scale) {
    RowState next = state;

    if (item.start) {
        next.cursor = *item.start;
    }

    Row row;
    row.title = item.title;
    row.offset = scale.offset(next.cursor);
    row.open = item.open.value_or(false);

    // The shadow duration accounts for weekends, the nominal one does not
    if (step.shadow_days) {
        next.cursor += std::chrono::days{*step.shadow_days};
        row.length = scale.length(*step.shadow_days);
    }

    if (item.resource) {
        next.resource = *item.resource;
    }
    row.resource = next.resource;

    return {next, row};
}

} // anonymous namespace

// =============================================================================
// LayoutOptions / DateScale
// =============================================================================

void LayoutOptions::validate() const {
    if (title_width < 0.0) {
        throw core::InvalidOptionError("title width must be non-negative");
    }
    if (max_month_width < 0.0) {
        throw core::InvalidOptionError("maximum month width must be non-negative");
    }
}

double DateScale::offset(core::DateTime instant) const noexcept {
    return origin_ + length(core::days_between(instant, start_));
}

double DateScale::length(int64_t days) const noexcept {
    return static_cast<double>(days) / static_cast<double>(total_days_) * total_width_;
}

// =============================================================================
// Passes
// =============================================================================

void validate_chart(const core::Chart& chart) {
    if (chart.items.size() < 2) {
        throw core::InsufficientInputError("You must provide more than one task");
    }

    const auto& first = chart.items.front();
    if (!first.start) {
        throw core::MissingAnchorError("First item must contain a start date");
    }
    if (!first.resource) {
        throw core::MissingAnchorError("First item must contain a resource index");
    }

    for (std::size_t i = 0; i < chart.items.size(); ++i) {
        const auto& resource = chart.items[i].resource;
        if (resource && *resource >= chart.resources.size()) {
            throw core::InvalidReferenceError(
                item_context(i) + ": resource index " + std::to_string(*resource) +
                " is out of range (" + std::to_string(chart.resources.size()) + " resources)");
        }
    }
}

int64_t shadow_duration(core::DateTime cursor, int64_t duration) {
    const auto end = cursor + std::chrono::days{duration};
    return duration + core::weekend_shift(end).count();
}

ScheduleScan scan_schedule(const std::vector<core::ScheduleItem>& items) {
    if (items.empty() || !items.front().start) {
        throw core::MissingAnchorError("First item must contain a start date");
    }

    ScheduleScan scan;
    scan.steps.reserve(items.size());

    SpanState state{*items.front().start, DateTime::max(), DateTime::min()};
    for (std::size_t i = 0; i < items.size(); ++i) {
        auto [next, step] = scan_step(state, items[i], i);
        scan.steps.push_back(step);
        state = next;
    }

    scan.earliest_start = state.earliest;
    scan.latest_end = state.latest;
    return scan;
}

ColumnSpan compute_columns(core::Date start, core::Date end, double max_month_width) {
    ColumnSpan span;

    for (Date date = core::first_of_month(start); date <= end; date = core::next_month(date)) {
        const std::chrono::year_month_day ymd{date};
        const unsigned days = core::days_in_month(static_cast<int>(ymd.year()),
                                                  static_cast<unsigned>(ymd.month()));
        const double width = max_month_width * static_cast<double>(days) / 31.0;

        span.total_days += days;
        span.total_width += width;
        span.columns.push_back(Column{width, std::string(core::month_abbreviation(
                                                 static_cast<unsigned>(ymd.month())))});
    }
    return span;
}

std::vector<Row> place_rows(const std::vector<core::ScheduleItem>& items,
                            const ScheduleScan& scan,
                            core::Date start_date,
                            const DateScale& scale) {
    std::vector<Row> rows;
    rows.reserve(items.size());

    RowState state{DateTime{start_date}, items.empty() ? 0 : items.front().resource.value_or(0)};
    for (std::size_t i = 0; i < items.size(); ++i) {
        auto [next, row] = place_step(state, items[i], scan.steps.at(i), scale);
        rows.push_back(std::move(row));
        state = next;
    }
    return rows;
}

// =============================================================================
// LayoutEngine
// =============================================================================

LayoutEngine::LayoutEngine(LayoutOptions options)
    : options_(options) {
    options_.validate();
}

Geometry LayoutEngine::compute(const core::Chart& chart, std::mt19937& rng) const {
    Geometry geometry = compute_geometry(chart);
    geometry.styles = assign_resource_styles(chart.resources.size(), rng);
    return geometry;
}

Geometry LayoutEngine::compute(const core::Chart& chart, double initial_hue) const {
    Geometry geometry = compute_geometry(chart);
    geometry.styles = make_resource_styles(chart.resources.size(), initial_hue);
    return geometry;
}

Geometry LayoutEngine::compute_geometry(const core::Chart& chart) const {
    validate_chart(chart);

    const ScheduleScan scan = scan_schedule(chart.items);
    const Date start_date = core::first_of_month(scan.earliest_start);
    const Date end_date = core::last_of_month(scan.latest_end);

    ColumnSpan span = compute_columns(start_date, end_date, options_.max_month_width);
    if (span.total_days <= 0) {
        throw core::DateRangeError("no calendar days between " + core::format_date(start_date) + " and " +
                                   core::format_date(end_date));
    }

    Geometry geometry;
    geometry.title = chart.title;
    geometry.title_width = options_.title_width;
    geometry.max_month_width = options_.max_month_width;
    geometry.start_date = start_date;
    geometry.end_date = end_date;
    geometry.total_days = span.total_days;
    geometry.total_width = span.total_width;
    geometry.columns = std::move(span.columns);
    geometry.resources = chart.resources;

    const DateScale scale{start_date, geometry.total_days, geometry.total_width,
                          options_.title_width + geometry.gutter.left};
    geometry.rows = place_rows(chart.items, scan, start_date, scale);

    if (chart.marked_date) {
        geometry.marked_date_offset = scale.offset(*chart.marked_date);
        if (log_sink_ && (*chart.marked_date < start_date || *chart.marked_date > end_date)) {
            log_sink_->warning("marked date " + core::format_date(*chart.marked_date) +
                               " lies outside the chart (" + core::format_date(start_date) +
                               " to " + core::format_date(end_date) + ")");
        }
    }

    if (log_sink_) {
        std::ostringstream oss;
        oss << "'" << chart.title << "': " << chart.items.size() << " items over "
            << geometry.columns.size() << " months (" << geometry.total_days << " days, "
            << core::format_date(start_date) << " to " << core::format_date(end_date) << ")";
        log_sink_->output(oss.str());
    }

    return geometry;
}

} // namespace ganttgen::layout

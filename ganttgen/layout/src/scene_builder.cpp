#include <ganttgen/layout/scene_builder.hpp>

#include <numeric>
#include <string>

namespace ganttgen::layout {

namespace {

double body_bottom(const Geometry& g) {
    return g.gutter.top + static_cast<double>(g.rows.size()) * g.row_height;
}

double heading_baseline(const Geometry& g) {
    return g.gutter.top - g.row_gutter.bottom - g.row_height / 2.0;
}

Group build_columns(const Geometry& g) {
    Group group;
    const double bottom = body_bottom(g);

    double preceding = 0.0;
    for (std::size_t i = 0; i <= g.columns.size(); ++i) {
        const double x = g.gutter.left + g.title_width + preceding;
        group.children.emplace_back(Line{{BaseClass::InnerLines}, x, g.gutter.top, x, bottom});

        if (i < g.columns.size()) {
            group.children.emplace_back(
                Text{{BaseClass::Heading}, x + g.max_month_width / 2.0, heading_baseline(g), g.columns[i].label});
            preceding += g.columns[i].width;
        }
    }
    return group;
}

Primitive milestone_diamond(const Geometry& g, const Row& row, double y) {
    const double n = (g.row_height - g.row_gutter.height()) / 2.0;
    return Path{{BaseClass::Milestone},
                {MoveTo{row.offset - n, y + g.row_gutter.top + n},
                 LineBy{n, -n},
                 LineBy{n, n},
                 LineBy{-n, n},
                 LineBy{-n, -n}}};
}

Group build_rows(const Geometry& g, double width) {
    Group group;
    const std::size_t count = g.rows.size();

    for (std::size_t i = 0; i <= count; ++i) {
        const double y = g.gutter.top + static_cast<double>(i) * g.row_height;
        const BaseClass line_class = (i == 0 || i == count) ? BaseClass::OuterLines : BaseClass::InnerLines;
        group.children.emplace_back(Line{{line_class}, g.gutter.left, y, width - g.gutter.right, y});

        if (i == count) {
            break;
        }

        const Row& row = g.rows[i];
        group.children.emplace_back(Text{{BaseClass::Item},
                                         g.gutter.left + g.row_gutter.left,
                                         y + g.row_gutter.top + g.row_height / 2.0,
                                         row.title});

        if (row.length) {
            const StyleVariant variant = row.open ? StyleVariant::Open : StyleVariant::Closed;
            group.children.emplace_back(Rect{{ResourceClass{row.resource, variant}},
                                             row.offset,
                                             y + g.row_gutter.top,
                                             *row.length,
                                             g.row_height - g.row_gutter.height(),
                                             g.corner_radius});
        } else {
            group.children.push_back(milestone_diamond(g, row, y));
        }
    }
    return group;
}

Element build_marker(const Geometry& g) {
    if (!g.marked_date_offset) {
        return Group{};
    }
    const double x = *g.marked_date_offset;
    return Line{{BaseClass::Marker}, x, g.gutter.top - MARKER_OVERHANG, x, body_bottom(g) + MARKER_OVERHANG};
}

Group build_legend(const Geometry& g) {
    Group group;
    const double y = body_bottom(g);
    const double block = g.resource_height - g.resource_gutter.height();

    for (std::size_t i = 0; i < g.resources.size(); ++i) {
        const double column_x = g.resource_gutter.left + static_cast<double>(i + 1) * LEGEND_PITCH;
        group.children.emplace_back(
            Text{{BaseClass::Resource}, column_x - 5.0, y + g.resource_height / 2.0, g.resources[i]});
        group.children.emplace_back(Rect{{ResourceClass{i, StyleVariant::Closed}},
                                         column_x + 5.0,
                                         y + g.resource_gutter.top,
                                         block,
                                         block,
                                         g.corner_radius});
    }
    return group;
}

} // anonymous namespace

double canvas_width(const Geometry& geometry) {
    const double columns = std::accumulate(
        geometry.columns.begin(), geometry.columns.end(), 0.0,
        [](double sum, const Column& col) { return sum + col.width; });
    return geometry.gutter.left + geometry.title_width + columns + geometry.gutter.right;
}

double canvas_height(const Geometry& geometry, bool resource_legend) {
    const double legend =
        resource_legend ? geometry.resource_gutter.height() + geometry.resource_height : 0.0;
    return body_bottom(geometry) + legend + geometry.gutter.bottom;
}

Document build_scene(const Geometry& geometry, const SceneOptions& options) {
    Document doc;
    doc.width = canvas_width(geometry);
    doc.height = canvas_height(geometry, options.resource_legend);

    doc.stylesheet.base = {BaseClass::OuterLines, BaseClass::InnerLines, BaseClass::Item,
                           BaseClass::Resource,   BaseClass::Title,      BaseClass::Heading,
                           BaseClass::TaskHeading, BaseClass::Milestone, BaseClass::Marker};
    doc.stylesheet.resources = geometry.styles;

    doc.elements.emplace_back(Text{{BaseClass::Title}, geometry.gutter.left, TITLE_BASELINE, geometry.title});
    doc.elements.emplace_back(build_columns(geometry));
    doc.elements.emplace_back(Text{{BaseClass::Heading, BaseClass::TaskHeading},
                                   geometry.gutter.left + geometry.row_gutter.left,
                                   heading_baseline(geometry),
                                   std::string(TASKS_HEADING)});
    doc.elements.emplace_back(build_rows(geometry, doc.width));
    doc.elements.push_back(build_marker(geometry));
    doc.elements.emplace_back(options.resource_legend ? build_legend(geometry) : Group{});

    return doc;
}

} // namespace ganttgen::layout

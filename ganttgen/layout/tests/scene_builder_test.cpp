#include <ganttgen/layout/layout_engine.hpp>
#include <ganttgen/layout/scene_builder.hpp>

#include <gtest/gtest.h>

#include <variant>

using namespace ganttgen::layout;
using namespace ganttgen::core;

namespace {

DateTime at(int y, unsigned m, unsigned d) {
    return DateTime{Date{std::chrono::year{y} / std::chrono::month{m} / std::chrono::day{d}}};
}

} // namespace

class SceneBuilderTest : public ::testing::Test {
protected:
    void SetUp() override {
        chart.title = "Plan";
        chart.resources = {"Alice", "Bob"};

        ScheduleItem a;
        a.title = "A";
        a.duration = 5;
        a.start = at(2024, 1, 1);
        a.resource = 0;

        ScheduleItem b;
        b.title = "B";
        b.duration = 3;
        b.resource = 1;
        b.open = true;

        chart.items = {a, b};
    }

    Geometry layout() const { return LayoutEngine{}.compute(chart, 0.25); }

    static const Group& group_at(const Document& doc, std::size_t index) {
        return std::get<Group>(doc.elements.at(index));
    }

    Chart chart;
};

// =============================================================================
// Canvas
// =============================================================================

TEST_F(SceneBuilderTest, CanvasSize) {
    auto g = layout();
    EXPECT_DOUBLE_EQ(canvas_width(g), 10.0 + 210.0 + 80.0 + 10.0);
    EXPECT_DOUBLE_EQ(canvas_height(g, false), 80.0 + 2 * 30.0 + 10.0);
    EXPECT_DOUBLE_EQ(canvas_height(g, true), 80.0 + 2 * 30.0 + 20.0 + 40.0 + 10.0);

    auto doc = build_scene(g);
    EXPECT_DOUBLE_EQ(doc.width, 310.0);
    EXPECT_DOUBLE_EQ(doc.height, 150.0);

    auto with_legend = build_scene(g, SceneOptions{true});
    EXPECT_DOUBLE_EQ(with_legend.height, 210.0);
}

TEST_F(SceneBuilderTest, StylesheetListsEveryClass) {
    auto g = layout();
    auto doc = build_scene(g);

    EXPECT_EQ(doc.stylesheet.base.size(), 9u);
    EXPECT_EQ(doc.stylesheet.base.front(), BaseClass::OuterLines);
    EXPECT_EQ(doc.stylesheet.base.back(), BaseClass::Marker);
    ASSERT_EQ(doc.stylesheet.resources.size(), 2u);
    EXPECT_EQ(doc.stylesheet.resources[1].color, g.styles[1].color);
}

// =============================================================================
// Element order
// =============================================================================

TEST_F(SceneBuilderTest, FixedElementOrder) {
    auto doc = build_scene(layout());
    ASSERT_EQ(doc.elements.size(), 6u);

    const auto& title = std::get<Text>(doc.elements[0]);
    EXPECT_EQ(title.content, "Plan");
    EXPECT_DOUBLE_EQ(title.x, 10.0);
    EXPECT_DOUBLE_EQ(title.y, TITLE_BASELINE);
    EXPECT_EQ(title.classes, (ClassList{BaseClass::Title}));

    EXPECT_TRUE(std::holds_alternative<Group>(doc.elements[1]));

    const auto& heading = std::get<Text>(doc.elements[2]);
    EXPECT_EQ(heading.content, "Tasks");
    EXPECT_EQ(heading.classes, (ClassList{BaseClass::Heading, BaseClass::TaskHeading}));
    EXPECT_DOUBLE_EQ(heading.x, 15.0);
    EXPECT_DOUBLE_EQ(heading.y, 60.0);

    EXPECT_TRUE(std::holds_alternative<Group>(doc.elements[3]));

    // No marked date: empty placeholder
    EXPECT_TRUE(group_at(doc, 4).children.empty());
    // No legend requested
    EXPECT_TRUE(group_at(doc, 5).children.empty());
}

TEST_F(SceneBuilderTest, ColumnGroup) {
    auto doc = build_scene(layout());
    const auto& columns = group_at(doc, 1).children;

    // Left edge, month label, right edge
    ASSERT_EQ(columns.size(), 3u);

    const auto& left = std::get<Line>(columns[0]);
    EXPECT_DOUBLE_EQ(left.x1, 220.0);
    EXPECT_DOUBLE_EQ(left.x2, 220.0);
    EXPECT_DOUBLE_EQ(left.y1, 80.0);
    EXPECT_DOUBLE_EQ(left.y2, 140.0);
    EXPECT_EQ(left.classes, (ClassList{BaseClass::InnerLines}));

    const auto& label = std::get<Text>(columns[1]);
    EXPECT_EQ(label.content, "Jan");
    EXPECT_DOUBLE_EQ(label.x, 260.0);
    EXPECT_DOUBLE_EQ(label.y, 60.0);

    const auto& right = std::get<Line>(columns[2]);
    EXPECT_DOUBLE_EQ(right.x1, 300.0);
}

TEST_F(SceneBuilderTest, RowGroup) {
    auto doc = build_scene(layout());
    const auto& rows = group_at(doc, 3).children;

    // Per row: grid line, title, bar; plus the closing grid line
    ASSERT_EQ(rows.size(), 7u);

    const auto& top = std::get<Line>(rows[0]);
    EXPECT_EQ(top.classes, (ClassList{BaseClass::OuterLines}));
    EXPECT_DOUBLE_EQ(top.x1, 10.0);
    EXPECT_DOUBLE_EQ(top.x2, 300.0);
    EXPECT_DOUBLE_EQ(top.y1, 80.0);

    const auto& title = std::get<Text>(rows[1]);
    EXPECT_EQ(title.content, "A");
    EXPECT_DOUBLE_EQ(title.x, 15.0);
    EXPECT_DOUBLE_EQ(title.y, 100.0);
    EXPECT_EQ(title.classes, (ClassList{BaseClass::Item}));

    const auto& bar = std::get<Rect>(rows[2]);
    EXPECT_DOUBLE_EQ(bar.x, 220.0);
    EXPECT_DOUBLE_EQ(bar.y, 85.0);
    EXPECT_DOUBLE_EQ(bar.width, 7.0 / 31.0 * 80.0);
    EXPECT_DOUBLE_EQ(bar.height, 20.0);
    EXPECT_DOUBLE_EQ(bar.corner_radius, 3.0);
    EXPECT_EQ(bar.classes, (ClassList{ResourceClass{0, StyleVariant::Closed}}));

    const auto& middle = std::get<Line>(rows[3]);
    EXPECT_EQ(middle.classes, (ClassList{BaseClass::InnerLines}));
    EXPECT_DOUBLE_EQ(middle.y1, 110.0);

    const auto& open_bar = std::get<Rect>(rows[5]);
    EXPECT_EQ(open_bar.classes, (ClassList{ResourceClass{1, StyleVariant::Open}}));
    EXPECT_DOUBLE_EQ(open_bar.y, 115.0);

    const auto& bottom = std::get<Line>(rows[6]);
    EXPECT_EQ(bottom.classes, (ClassList{BaseClass::OuterLines}));
    EXPECT_DOUBLE_EQ(bottom.y1, 140.0);
}

TEST_F(SceneBuilderTest, MilestoneDiamond) {
    ScheduleItem done;
    done.title = "Done";
    chart.items.push_back(done);

    auto g = layout();
    auto doc = build_scene(g);
    const auto& rows = group_at(doc, 3).children;
    ASSERT_EQ(rows.size(), 10u);

    const auto& diamond = std::get<Path>(rows[8]);
    EXPECT_EQ(diamond.classes, (ClassList{BaseClass::Milestone}));
    ASSERT_EQ(diamond.commands.size(), 5u);

    const double x = g.rows[2].offset;
    const auto& move = std::get<MoveTo>(diamond.commands[0]);
    EXPECT_DOUBLE_EQ(move.x, x - 10.0);
    EXPECT_DOUBLE_EQ(move.y, 140.0 + 5.0 + 10.0);

    const auto& first = std::get<LineBy>(diamond.commands[1]);
    EXPECT_DOUBLE_EQ(first.dx, 10.0);
    EXPECT_DOUBLE_EQ(first.dy, -10.0);

    // Closed outline: relative steps sum to zero
    double dx = 0.0;
    double dy = 0.0;
    for (std::size_t i = 1; i < diamond.commands.size(); ++i) {
        const auto& step = std::get<LineBy>(diamond.commands[i]);
        dx += step.dx;
        dy += step.dy;
    }
    EXPECT_DOUBLE_EQ(dx, 0.0);
    EXPECT_DOUBLE_EQ(dy, 0.0);
}

// =============================================================================
// Marker and legend
// =============================================================================

TEST_F(SceneBuilderTest, MarkerLine) {
    chart.marked_date = Date{std::chrono::year{2024} / std::chrono::January / std::chrono::day{15}};
    auto g = layout();
    auto doc = build_scene(g);

    const auto& marker = std::get<Line>(doc.elements.at(4));
    EXPECT_EQ(marker.classes, (ClassList{BaseClass::Marker}));
    EXPECT_DOUBLE_EQ(marker.x1, *g.marked_date_offset);
    EXPECT_DOUBLE_EQ(marker.x2, *g.marked_date_offset);
    EXPECT_DOUBLE_EQ(marker.y1, 75.0);
    EXPECT_DOUBLE_EQ(marker.y2, 145.0);
}

TEST_F(SceneBuilderTest, Legend) {
    auto doc = build_scene(layout(), SceneOptions{true});
    const auto& legend = group_at(doc, 5).children;

    // Label and swatch per resource
    ASSERT_EQ(legend.size(), 4u);

    const auto& label = std::get<Text>(legend[0]);
    EXPECT_EQ(label.content, "Alice");
    EXPECT_EQ(label.classes, (ClassList{BaseClass::Resource}));
    EXPECT_DOUBLE_EQ(label.x, 105.0);
    EXPECT_DOUBLE_EQ(label.y, 160.0);

    const auto& swatch = std::get<Rect>(legend[1]);
    EXPECT_EQ(swatch.classes, (ClassList{ResourceClass{0, StyleVariant::Closed}}));
    EXPECT_DOUBLE_EQ(swatch.x, 115.0);
    EXPECT_DOUBLE_EQ(swatch.y, 150.0);
    EXPECT_DOUBLE_EQ(swatch.width, 20.0);
    EXPECT_DOUBLE_EQ(swatch.height, 20.0);

    EXPECT_EQ(std::get<Text>(legend[2]).content, "Bob");
    EXPECT_DOUBLE_EQ(std::get<Rect>(legend[3]).x, 215.0);
}

// =============================================================================
// Class names
// =============================================================================

TEST(ClassNameTest, BaseClasses) {
    EXPECT_EQ(class_name(BaseClass::OuterLines), "outer-lines");
    EXPECT_EQ(class_name(BaseClass::TaskHeading), "task-heading");
    EXPECT_EQ(class_name(BaseClass::Marker), "marker");
}

TEST(ClassNameTest, ResourceClasses) {
    EXPECT_EQ(class_name(ClassRef{ResourceClass{0, StyleVariant::Closed}}), "resource-0-closed");
    EXPECT_EQ(class_name(ClassRef{ResourceClass{12, StyleVariant::Open}}), "resource-12-open");
    EXPECT_EQ(class_name(ClassRef{BaseClass::Item}), "item");
}

#pragma once

/// @file scene.hpp
/// @brief Abstract drawing primitives produced by the scene builder.
///
/// A Document is a flat list of elements, some of which are groups of
/// primitives. Primitives never carry inline paint attributes; they refer
/// to stylesheet classes through ClassRef values.
///
/// @ingroup layout_scene

#include <ganttgen/layout/color.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace ganttgen::layout {

/// @brief Fixed stylesheet classes shared by every chart.
/// @ingroup layout_scene
enum class BaseClass {
    OuterLines,   ///< First and last horizontal grid line.
    InnerLines,   ///< Other grid lines.
    Item,         ///< Task title labels.
    Resource,     ///< Legend labels.
    Title,        ///< Chart title.
    Heading,      ///< Month labels and the "Tasks" heading.
    TaskHeading,  ///< Left alignment override for the "Tasks" heading.
    Milestone,    ///< Milestone diamonds.
    Marker        ///< Marked-date line.
};

/// @brief Reference to one of the two styles generated for a resource.
/// @ingroup layout_scene
struct ResourceClass {
    std::size_t resource{0};
    StyleVariant variant{StyleVariant::Closed};

    bool operator==(const ResourceClass& rhs) const noexcept = default;
};

/// @brief A stylesheet class, either fixed or per resource.
/// @ingroup layout_scene
using ClassRef = std::variant<BaseClass, ResourceClass>;

/// @brief Classes applied to one primitive, in attribute order.
/// @ingroup layout_scene
using ClassList = std::vector<ClassRef>;

/// @brief Stylesheet class name, e.g. `inner-lines`.
/// @ingroup layout_scene
[[nodiscard]] std::string_view class_name(BaseClass cls);

/// @brief Stylesheet class name, e.g. `resource-2-open`.
/// @ingroup layout_scene
[[nodiscard]] std::string class_name(const ClassRef& cls);

/// @brief Straight line between two absolute points.
/// @ingroup layout_scene
struct Line {
    ClassList classes;
    double x1{0.0};
    double y1{0.0};
    double x2{0.0};
    double y2{0.0};
};

/// @brief Rectangle with equal horizontal and vertical corner radii.
/// @ingroup layout_scene
struct Rect {
    ClassList classes;
    double x{0.0};
    double y{0.0};
    double width{0.0};
    double height{0.0};
    double corner_radius{0.0};
};

/// @brief Absolute move of the pen.
/// @ingroup layout_scene
struct MoveTo {
    double x{0.0};
    double y{0.0};
};

/// @brief Straight segment relative to the pen.
/// @ingroup layout_scene
struct LineBy {
    double dx{0.0};
    double dy{0.0};
};

/// @brief One step of a Path outline.
/// @ingroup layout_scene
using PathCommand = std::variant<MoveTo, LineBy>;

/// @brief Outline built from pen commands, used for milestone diamonds.
/// @ingroup layout_scene
struct Path {
    ClassList classes;
    std::vector<PathCommand> commands;
};

/// @brief Text anchored at a point; alignment comes from its classes.
/// @ingroup layout_scene
struct Text {
    ClassList classes;
    double x{0.0};
    double y{0.0};
    std::string content;
};

/// @brief Any drawable shape that may appear inside a Group.
/// @ingroup layout_scene
using Primitive = std::variant<Line, Rect, Path, Text>;

/// @brief Unstyled container of primitives.
///
/// Groups do not nest.
///
/// @ingroup layout_scene
struct Group {
    std::vector<Primitive> children;
};

/// @brief Top-level document entry: a primitive or a Group.
/// @ingroup layout_scene
using Element = std::variant<Line, Rect, Path, Text, Group>;

/// @brief Classes a document declares.
///
/// Resource styles are kept as descriptors and only turned into text by
/// the serializer.
///
/// @ingroup layout_scene
struct Stylesheet {
    std::vector<BaseClass> base;
    std::vector<ResourceStyle> resources;
};

/// @brief A complete drawing, ready for serialization.
///
/// @ingroup layout_scene
/// @see build_scene, io::write_svg
struct Document {
    double width{0.0};
    double height{0.0};
    Stylesheet stylesheet;
    std::vector<Element> elements;  ///< In paint order.
};

} // namespace ganttgen::layout

#include <ganttgen/io/svg_writer.hpp>
#include <ganttgen/io/error.hpp>

#include <fstream>
#include <sstream>
#include <variant>

namespace ganttgen::io {

namespace {

using namespace ganttgen::layout;

template <class... Ts> struct overload : Ts... {
    using Ts::operator()...;
};
template <class... Ts> overload(Ts...) -> overload<Ts...>;

// Space-separated class attribute value
std::string class_attribute(const ClassList& classes) {
    std::string result;
    for (const auto& cls : classes) {
        if (!result.empty()) {
            result += ' ';
        }
        result += class_name(cls);
    }
    return result;
}

std::ostream& operator<<(std::ostream& out, const Line& line) {
    out << "<line class='" << class_attribute(line.classes) << "' x1='" << line.x1 << "' y1='" << line.y1
        << "' x2='" << line.x2 << "' y2='" << line.y2 << "'/>";
    return out;
}

std::ostream& operator<<(std::ostream& out, const Rect& rect) {
    out << "<rect class='" << class_attribute(rect.classes) << "' x='" << rect.x << "' y='" << rect.y
        << "' rx='" << rect.corner_radius << "' ry='" << rect.corner_radius << "' width='" << rect.width
        << "' height='" << rect.height << "'/>";
    return out;
}

std::ostream& operator<<(std::ostream& out, const Path& path) {
    out << "<path class='" << class_attribute(path.classes) << "' d='";
    const char* separator = "";
    for (const auto& command : path.commands) {
        out << separator;
        std::visit(overload{[&](const MoveTo& move) { out << "M " << move.x << ',' << move.y; },
                            [&](const LineBy& step) { out << "l " << step.dx << ',' << step.dy; }},
                   command);
        separator = " ";
    }
    out << "'/>";
    return out;
}

std::ostream& operator<<(std::ostream& out, const Text& text) {
    out << "<text class='" << class_attribute(text.classes) << "' x='" << text.x << "' y='" << text.y << "'>"
        << escape_xml(text.content) << "</text>";
    return out;
}

std::ostream& operator<<(std::ostream& out, const Group& group) {
    out << "<g>";
    for (const auto& child : group.children) {
        out << '\n';
        std::visit([&](const auto& primitive) { out << primitive; }, child);
    }
    if (!group.children.empty()) {
        out << '\n';
    }
    out << "</g>";
    return out;
}

std::string_view base_rule_body(BaseClass cls) {
    switch (cls) {
        case BaseClass::OuterLines: return "stroke-width:3;stroke:#aaaaaa;";
        case BaseClass::InnerLines: return "stroke-width:2;stroke:#dddddd;";
        case BaseClass::Item: return "font-family:Arial;font-size:12pt;dominant-baseline:middle;";
        case BaseClass::Resource: return "font-family:Arial;font-size:12pt;text-anchor:end;dominant-baseline:middle;";
        case BaseClass::Title: return "font-family:Arial;font-size:18pt;";
        case BaseClass::Heading:
            return "font-family:Arial;font-size:16pt;dominant-baseline:middle;text-anchor:middle;";
        case BaseClass::TaskHeading: return "dominant-baseline:middle;text-anchor:start;";
        case BaseClass::Milestone: return "fill:black;stroke-width:1;stroke:black;";
        case BaseClass::Marker: return "stroke-width:2;stroke:#888888;stroke-dasharray:7;";
    }
    return "";
}

} // anonymous namespace

std::string escape_xml(std::string_view text) {
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&':  result += "&amp;"; break;
            case '<':  result += "&lt;"; break;
            case '>':  result += "&gt;"; break;
            case '"':  result += "&quot;"; break;
            case '\'': result += "&apos;"; break;
            default:   result += c;
        }
    }
    return result;
}

std::string css_rule(layout::BaseClass cls) {
    return "." + std::string(class_name(cls)) + "{" + std::string(base_rule_body(cls)) + "}";
}

std::string css_rule(const layout::ResourceStyle& style, layout::StyleVariant variant) {
    const auto& descriptor = style.descriptor(variant);

    std::ostringstream oss;
    oss << '.' << class_name(ResourceClass{style.resource, variant}) << '{';
    oss << "fill:" << (descriptor.fill ? descriptor.fill->hex() : std::string("none")) << ';';
    oss << "stroke-width:" << descriptor.stroke_width << ';';
    oss << "stroke:" << descriptor.stroke.hex() << ";}";
    return oss.str();
}

void write_svg(const layout::Document& document, std::ostream& out) {
    out << "<svg xmlns='" << SVG_NAMESPACE << "' viewBox='0 0 " << document.width << ' ' << document.height
        << "' width='" << document.width << "' height='" << document.height
        << "' style='background-color: white;'>\n";

    out << "<style>\n";
    for (auto cls : document.stylesheet.base) {
        out << css_rule(cls) << '\n';
    }
    for (const auto& style : document.stylesheet.resources) {
        out << css_rule(style, StyleVariant::Closed) << '\n';
        out << css_rule(style, StyleVariant::Open) << '\n';
    }
    out << "</style>\n";

    for (const auto& element : document.elements) {
        std::visit([&](const auto& node) { out << node << '\n'; }, element);
    }

    out << "</svg>\n";
}

std::string to_svg(const layout::Document& document) {
    std::ostringstream oss;
    write_svg(document, oss);
    return oss.str();
}

void write_svg_file(const layout::Document& document, const std::filesystem::path& path) {
    std::ofstream file(path);
    if (!file) {
        throw LoaderError("cannot open file for writing", path.string());
    }
    write_svg(document, file);
    if (!file) {
        throw LoaderError("write failed", path.string());
    }
}

} // namespace ganttgen::io

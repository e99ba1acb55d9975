#pragma once

/// @file svg_writer.hpp
/// @brief SVG serialization of a layout::Document.
/// @ingroup io_writers

#include <ganttgen/layout/scene.hpp>

#include <filesystem>
#include <ostream>
#include <string>
#include <string_view>

namespace ganttgen::io {

/// @brief SVG namespace written on the root element.
/// @ingroup io_writers
inline constexpr std::string_view SVG_NAMESPACE = "http://www.w3.org/2000/svg";

/// @brief Replace XML special characters with entity references.
/// @ingroup io_writers
[[nodiscard]] std::string escape_xml(std::string_view text);

/// @brief CSS rule for a fixed class, e.g. `.marker{...}`.
/// @ingroup io_writers
[[nodiscard]] std::string css_rule(layout::BaseClass cls);

/// @brief CSS rule for one variant of a resource style.
/// @ingroup io_writers
[[nodiscard]] std::string css_rule(const layout::ResourceStyle& style, layout::StyleVariant variant);

/// @brief Serialize @p document as a standalone SVG document.
///
/// The root carries `viewBox`, `width`, `height` and a white background.
/// The stylesheet follows as one `<style>` element with one rule per
/// line, then every element in paint order. Groups become `<g>`
/// elements, including empty ones.
///
/// @ingroup io_writers
/// @see layout::build_scene
void write_svg(const layout::Document& document, std::ostream& out);

/// @brief Serialize @p document to a string.
/// @ingroup io_writers
[[nodiscard]] std::string to_svg(const layout::Document& document);

/// @brief Serialize @p document to a file, replacing its contents.
///
/// @throws LoaderError  If @p path cannot be opened for writing.
/// @ingroup io_writers
void write_svg_file(const layout::Document& document, const std::filesystem::path& path);

} // namespace ganttgen::io

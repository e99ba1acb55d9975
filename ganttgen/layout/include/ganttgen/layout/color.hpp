#pragma once

/// @file color.hpp
/// @brief Per-resource colors and the style descriptors derived from them.
/// @ingroup layout_color

#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace ganttgen::layout {

/// @brief Hue increment between consecutive resources.
///
/// Stepping by the golden-ratio conjugate modulo 1 spreads any number of
/// hues around the color wheel with no two neighbours close together.
///
/// @ingroup layout_color
inline constexpr double GOLDEN_RATIO_CONJUGATE = 0.618033988749895;

/// @brief Saturation shared by all resource colors.
/// @ingroup layout_color
inline constexpr double RESOURCE_SATURATION = 0.5;

/// @brief Value (brightness) shared by all resource colors.
/// @ingroup layout_color
inline constexpr double RESOURCE_VALUE = 0.5;

/// @brief An 8-bit-per-channel RGB color.
/// @ingroup layout_color
struct Rgb {
    uint8_t red{0};
    uint8_t green{0};
    uint8_t blue{0};

    /// @brief CSS hex notation, e.g. `#804040`.
    [[nodiscard]] std::string hex() const;

    bool operator==(const Rgb& rhs) const noexcept = default;
};

/// @brief Convert an HSV triple to RGB.
///
/// Uses the six-sector piecewise formula. Each channel is quantized as
/// `trunc(c * 256)`, clamped to 255.
///
/// @param hue         Hue in [0, 1).
/// @param saturation  Saturation in [0, 1].
/// @param value       Value in [0, 1].
/// @return The quantized color.
/// @ingroup layout_color
[[nodiscard]] Rgb hsv_to_rgb(double hue, double saturation, double value);

/// @brief Which of the two per-resource styles a task uses.
/// @ingroup layout_color
enum class StyleVariant {
    Closed, ///< Finished or planned work: filled bar.
    Open    ///< In-progress work: outlined bar.
};

/// @brief Resolved paint attributes for one resource style.
/// @ingroup layout_color
struct StyleDescriptor {
    StyleVariant variant{StyleVariant::Closed};
    std::optional<Rgb> fill;  ///< Absent means no fill.
    Rgb stroke;
    int stroke_width{1};
};

/// @brief The closed/open style pair assigned to one resource.
///
/// @ingroup layout_color
/// @see assign_resource_styles
struct ResourceStyle {
    std::size_t resource{0};  ///< Index into the chart's resource list.
    double hue{0.0};          ///< Hue the color was derived from.
    Rgb color;
    StyleDescriptor closed;
    StyleDescriptor open;

    /// @brief Select the descriptor for @p variant.
    [[nodiscard]] const StyleDescriptor& descriptor(StyleVariant variant) const noexcept {
        return variant == StyleVariant::Open ? open : closed;
    }
};

/// @brief Hues for @p count resources, starting at @p initial_hue.
///
/// Each hue is the previous one plus GOLDEN_RATIO_CONJUGATE, modulo 1.
/// @ingroup layout_color
[[nodiscard]] std::vector<double> resource_hues(std::size_t count, double initial_hue);

/// @brief Build the style pairs for @p count resources from a fixed start hue.
///
/// Deterministic counterpart of assign_resource_styles(), used when the
/// caller wants exact colors (tests, reproducible output).
///
/// @ingroup layout_color
[[nodiscard]] std::vector<ResourceStyle> make_resource_styles(std::size_t count, double initial_hue);

/// @brief Build the style pairs for @p count resources from a random start hue.
///
/// Draws exactly one value uniformly from [0, 1) out of @p rng and
/// forwards it to make_resource_styles().
///
/// @param count  Number of resources.
/// @param rng    Mersenne Twister PRNG instance.
/// @ingroup layout_color
[[nodiscard]] std::vector<ResourceStyle> assign_resource_styles(std::size_t count, std::mt19937& rng);

} // namespace ganttgen::layout

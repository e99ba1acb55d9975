#include <ganttgen/layout/color.hpp>

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace ganttgen::layout {

namespace {

uint8_t quantize(double channel) {
    return static_cast<uint8_t>(std::clamp(std::floor(channel * 256.0), 0.0, 255.0));
}

Rgb rgb(double red, double green, double blue) {
    return Rgb{quantize(red), quantize(green), quantize(blue)};
}

} // anonymous namespace

std::string Rgb::hex() const {
    std::ostringstream oss;
    oss << '#' << std::hex << std::setfill('0')
        << std::setw(2) << static_cast<int>(red)
        << std::setw(2) << static_cast<int>(green)
        << std::setw(2) << static_cast<int>(blue);
    return oss.str();
}

Rgb hsv_to_rgb(double hue, double saturation, double value) {
    const auto sector = static_cast<int>(hue * 6.0);
    const double f = hue * 6.0 - sector;
    const double p = value * (1.0 - saturation);
    const double q = value * (1.0 - f * saturation);
    const double t = value * (1.0 - (1.0 - f) * saturation);

    switch (sector) {
        case 0: return rgb(value, t, p);
        case 1: return rgb(q, value, p);
        case 2: return rgb(p, value, t);
        case 3: return rgb(p, q, value);
        case 4: return rgb(t, p, value);
        default: return rgb(value, p, q);
    }
}

std::vector<double> resource_hues(std::size_t count, double initial_hue) {
    std::vector<double> hues;
    hues.reserve(count);

    double hue = initial_hue;
    for (std::size_t i = 0; i < count; ++i) {
        hues.push_back(hue);
        hue = std::fmod(hue + GOLDEN_RATIO_CONJUGATE, 1.0);
    }
    return hues;
}

std::vector<ResourceStyle> make_resource_styles(std::size_t count, double initial_hue) {
    std::vector<ResourceStyle> styles;
    styles.reserve(count);

    const auto hues = resource_hues(count, initial_hue);
    for (std::size_t i = 0; i < hues.size(); ++i) {
        const Rgb color = hsv_to_rgb(hues[i], RESOURCE_SATURATION, RESOURCE_VALUE);
        styles.push_back(ResourceStyle{
            i,
            hues[i],
            color,
            StyleDescriptor{StyleVariant::Closed, color, color, 1},
            StyleDescriptor{StyleVariant::Open, std::nullopt, color, 2}});
    }
    return styles;
}

std::vector<ResourceStyle> assign_resource_styles(std::size_t count, std::mt19937& rng) {
    // Generate random resource colors based on
    // https://martin.ankerl.com/2009/12/09/how-to-create-random-colors-programmatically/
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return make_resource_styles(count, dist(rng));
}

} // namespace ganttgen::layout

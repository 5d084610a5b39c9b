#include "palette.hpp"
#include "renderer.hpp"

#include <algorithm>
#include <cmath>

std::string color_fractal(const HsbColor& base, const std::vector<double>& values,
                          PixelBuffer& buf)
{
    if (values.size() != buf.size())
        return "Cannot color fractal: " + std::to_string(values.size()) +
               " values for " + std::to_string(buf.size()) + " pixels";

    for (size_t i = 0; i < values.size(); ++i) {
        const HsbColor c = normalize_hsb(base, values[i]);
        buf.pixels[i] = {c.hue, c.saturation, c.brightness, PIXEL_ALPHA};
    }
    return {};
}

// ---------------------------------------------------------------------------
// HSB -> RGBA
// ---------------------------------------------------------------------------
static uint8_t to_byte(double v)
{
    const double c = std::max(0.0, std::min(1.0, v));
    return static_cast<uint8_t>(std::lround(c * 255.0));
}

uint32_t hsb_to_rgba(double hue, double saturation, double brightness, double alpha)
{
    double h = std::fmod(hue, HUE_MAX);
    if (h < 0.0) h += HUE_MAX;
    if (!std::isfinite(h)) h = 0.0;
    const double s = std::max(0.0, std::min(PERCENT_MAX, saturation)) / PERCENT_MAX;
    const double v = std::max(0.0, std::min(PERCENT_MAX, brightness)) / PERCENT_MAX;

    const double sector = h / 60.0;
    const int    k      = static_cast<int>(sector) % 6;
    const double f      = sector - std::floor(sector);
    const double p      = v * (1.0 - s);
    const double q      = v * (1.0 - s * f);
    const double t      = v * (1.0 - s * (1.0 - f));

    double r, g, b;
    switch (k) {
        case 0:  r = v; g = t; b = p; break;
        case 1:  r = q; g = v; b = p; break;
        case 2:  r = p; g = v; b = t; break;
        case 3:  r = p; g = q; b = v; break;
        case 4:  r = t; g = p; b = v; break;
        default: r = v; g = p; b = q; break;
    }

    const uint8_t a = static_cast<uint8_t>(
        std::lround(std::max(0.0, std::min(255.0, alpha))));
    return (static_cast<uint32_t>(a) << 24)
         | (static_cast<uint32_t>(to_byte(b)) << 16)
         | (static_cast<uint32_t>(to_byte(g)) <<  8)
         |  static_cast<uint32_t>(to_byte(r));
}

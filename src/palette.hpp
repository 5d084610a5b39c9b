#pragma once

#include "fractal.hpp"
#include "render_config.hpp"

#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

struct PixelBuffer;

static constexpr double HUE_MAX     = 360.0;
static constexpr double PERCENT_MAX = 100.0;
static constexpr double PIXEL_ALPHA = 250.0;

// Continuous (renormalized) escape count: iter - log2(log|z|).
// Non-escaping points get 0.0 when escape_coloring is on. If log|z| is not a
// finite positive number (|z| <= 1, or |z|^2 overflowed) the log-log term is
// undefined and the value falls back to 0.0 as well.
inline double color_value(const EscapeResult& r, int max_iter, bool escape_coloring)
{
    if (escape_coloring && r.iterations == max_iter)
        return 0.0;

    const double log_zn = std::log(modulus(r.final_z));
    if (!(log_zn > 0.0) || !std::isfinite(log_zn))
        return 0.0;
    return static_cast<double>(r.iterations) - std::log(log_zn) / std::log(2.0);
}

// Values above `max` are normalized onto the unit scale (v / max); values at
// or below `max` pass through unchanged, negative ones included.
inline double wrap_channel(double v, double max)
{
    return v <= max ? v : v / max;
}

inline HsbColor normalize_hsb(const HsbColor& base, double value)
{
    return {wrap_channel(base.hue        + value, HUE_MAX),
            wrap_channel(base.saturation + value, PERCENT_MAX),
            wrap_channel(base.brightness + value, PERCENT_MAX)};
}

// Writes one (h, s, b, PIXEL_ALPHA) pixel per value into `buf`.
// Returns empty string on success, or an error message when `values` does not
// match the buffer size (the buffer is left untouched in that case).
std::string color_fractal(const HsbColor& base, const std::vector<double>& values,
                          PixelBuffer& buf);

// Convert to 8-bit RGBA packed as 0xAABBGGRR. Hue wraps into [0, 360),
// saturation and brightness are clamped to [0, 100], alpha to [0, 255].
uint32_t hsb_to_rgba(double hue, double saturation, double brightness, double alpha);

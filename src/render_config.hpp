#pragma once

#include "complex.hpp"

#include <optional>
#include <string>

enum class VariantKind {
    Standard      = 0,  // z^2 + z0   (C is the sample itself)
    Parameterized = 1,  // z^2 + k    (C is a fixed constant, Julia style)
};

// Tagged variant: `constant` is only read when kind == Parameterized.
struct FractalVariant {
    VariantKind kind     = VariantKind::Standard;
    Complex     constant = {0.285, 0.285};

    static FractalVariant standard() { return {}; }
    static FractalVariant parameterized(Complex k)
    {
        return {VariantKind::Parameterized, k};
    }
};

// Base color offsets. Hue in degrees, saturation/brightness in percent.
struct HsbColor {
    double hue        = 0.0;
    double saturation = 0.0;
    double brightness = 0.0;
};

// Rectangle of the complex plane being sampled, in complex-plane units.
struct PlaneWindow {
    double x_min = -2.5;
    double x_max =  2.5;
    double y_min = -2.5;
    double y_max =  2.5;
};

inline bool operator==(const PlaneWindow& a, const PlaneWindow& b)
{
    return a.x_min == b.x_min && a.x_max == b.x_max &&
           a.y_min == b.y_min && a.y_max == b.y_max;
}
inline bool operator!=(const PlaneWindow& a, const PlaneWindow& b) { return !(a == b); }

// escape_radius must stay >= MIN_ESCAPE_RADIUS for log(log|z|) to be
// defined on escaped points; smaller positive radii are clamped up to it.
static constexpr double MIN_ESCAPE_RADIUS = 2.0;

struct RenderConfig {
    int            max_iter        = 400;
    double         escape_radius   = 20.0;
    bool           escape_coloring = false;  // flat color for non-escaping points
    FractalVariant variant         = {};
    HsbColor       base_color      = {};
    PlaneWindow    window          = {};
};

inline RenderConfig default_config()
{
    return RenderConfig{};
}

// Partial update. Unset fields keep their current value.
struct ConfigPatch {
    bool                        reset = false;
    std::optional<int>          max_iter;
    std::optional<double>       escape_radius;
    std::optional<VariantKind>  variant;
    std::optional<Complex>      parameter_constant;
    std::optional<PlaneWindow>  window;
    std::optional<HsbColor>     base_color;
    std::optional<bool>         escape_coloring;
};

// Returns empty string when `cfg` is usable for rendering, or an error message.
std::string validate_config(const RenderConfig& cfg);

// Builds the configuration that results from applying `patch` to `current`.
// `current` is not modified. The result is validated and, when the escape
// radius is positive but below MIN_ESCAPE_RADIUS, clamped (a warning is
// printed to stderr). Returns empty string on success, or an error message,
// in which case `out` is left untouched.
std::string apply_patch(const RenderConfig& current, const ConfigPatch& patch,
                        RenderConfig& out);

inline const char* variant_name(VariantKind kind)
{
    switch (kind) {
        case VariantKind::Standard:      return "Mandelbrot";
        case VariantKind::Parameterized: return "Julia";
    }
    return "Unknown";
}

#include "render_config.hpp"

#include <cmath>
#include <cstdio>

static bool finite_window(const PlaneWindow& w)
{
    return std::isfinite(w.x_min) && std::isfinite(w.x_max) &&
           std::isfinite(w.y_min) && std::isfinite(w.y_max);
}

std::string validate_config(const RenderConfig& cfg)
{
    if (cfg.max_iter <= 0)
        return "max_iter must be positive, got " + std::to_string(cfg.max_iter);
    if (!std::isfinite(cfg.escape_radius) || cfg.escape_radius <= 0.0)
        return "escape_radius must be a positive finite number, got " +
               std::to_string(cfg.escape_radius);
    // The evaluator compares against radius^2.
    if (!std::isfinite(cfg.escape_radius * cfg.escape_radius))
        return "escape_radius is too large, its square overflows: " +
               std::to_string(cfg.escape_radius);
    if (!finite_window(cfg.window))
        return "plane window bounds must be finite";
    if (cfg.variant.kind == VariantKind::Parameterized &&
        (!std::isfinite(cfg.variant.constant.re) ||
         !std::isfinite(cfg.variant.constant.im)))
        return "parameter constant must be finite";
    if (!std::isfinite(cfg.base_color.hue) ||
        !std::isfinite(cfg.base_color.saturation) ||
        !std::isfinite(cfg.base_color.brightness))
        return "base color offsets must be finite";
    return {};
}

std::string apply_patch(const RenderConfig& current, const ConfigPatch& patch,
                        RenderConfig& out)
{
    if (patch.reset) {
        out = default_config();
        return {};
    }

    RenderConfig next = current;
    if (patch.max_iter)           next.max_iter         = *patch.max_iter;
    if (patch.escape_radius)      next.escape_radius    = *patch.escape_radius;
    if (patch.variant)            next.variant.kind     = *patch.variant;
    if (patch.parameter_constant) next.variant.constant = *patch.parameter_constant;
    if (patch.window)             next.window           = *patch.window;
    if (patch.base_color)         next.base_color       = *patch.base_color;
    if (patch.escape_coloring)    next.escape_coloring  = *patch.escape_coloring;

    std::string err = validate_config(next);
    if (!err.empty())
        return err;

    if (next.escape_radius < MIN_ESCAPE_RADIUS) {
        fprintf(stderr, "warning: escape radius %g clamped to %g\n",
                next.escape_radius, MIN_ESCAPE_RADIUS);
        next.escape_radius = MIN_ESCAPE_RADIUS;
    }

    out = next;
    return {};
}

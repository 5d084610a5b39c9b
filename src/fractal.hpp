#pragma once

#include "complex.hpp"
#include "render_config.hpp"

// Outcome of iterating one sample.
struct EscapeResult {
    int     iterations = 0;
    Complex final_z    = {};
    bool    escaped    = false;  // stopped on |z| >= radius rather than max_iter
};

// Per-render constants, derived once from a RenderConfig.
struct EscapeParams {
    int         max_iter  = 0;
    double      radius_sq = 0.0;
    VariantKind kind      = VariantKind::Standard;
    Complex     constant  = {};

    static EscapeParams from(const RenderConfig& cfg)
    {
        EscapeParams p;
        p.max_iter  = cfg.max_iter;
        p.radius_sq = cfg.escape_radius * cfg.escape_radius;
        p.kind      = cfg.variant.kind;
        p.constant  = cfg.variant.constant;
        return p;
    }
};

// z starts at the sample. Standard: c = sample. Parameterized: c = k.
// The modulus is tested before each step, so a sample already outside the
// radius escapes with zero iterations.
template<bool IsParameterized>
inline EscapeResult escape_kernel(Complex sample, Complex k, int max_iter, double radius_sq)
{
    const Complex c = IsParameterized ? k : sample;
    Complex z = sample;
    int     i = 0;
    while (i < max_iter && modulus_squared(z) < radius_sq) {
        z = add(multiply(z, z), c);
        ++i;
    }
    return {i, z, modulus_squared(z) >= radius_sq};
}

inline EscapeResult evaluate(Complex sample, const EscapeParams& p)
{
    switch (p.kind) {
        case VariantKind::Parameterized:
            return escape_kernel<true>(sample, p.constant, p.max_iter, p.radius_sq);
        case VariantKind::Standard:
            break;
    }
    return escape_kernel<false>(sample, p.constant, p.max_iter, p.radius_sq);
}

inline EscapeResult evaluate(Complex sample, const RenderConfig& cfg)
{
    return evaluate(sample, EscapeParams::from(cfg));
}

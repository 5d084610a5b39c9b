#pragma once

#include "complex.hpp"
#include "render_config.hpp"

#include <cstddef>
#include <vector>

// Grid of complex samples, row-major: points[j * width + i] is column i, row j.
// Remembers the parameters it was generated from so the owner can tell
// whether it is still current.
struct SampledField {
    std::vector<Complex> points;
    int                  width  = 0;
    int                  height = 0;
    PlaneWindow          window = {};
    VariantKind          kind   = VariantKind::Standard;

    const Complex& at(int i, int j) const
    {
        return points[static_cast<size_t>(j) * width + i];
    }

    bool empty() const { return points.empty(); }

    bool generated_from(const PlaneWindow& w, VariantKind k) const
    {
        return window == w && kind == k;
    }
};

// Linear map of v from [lo1, hi1] onto [lo2, hi2]; v == lo1 yields lo2 exactly.
inline double map_range(double v, double lo1, double hi1, double lo2, double hi2)
{
    return (v - lo1) / (hi1 - lo1) * (hi2 - lo2) + lo2;
}

// Samples `window` on a width x height grid. Column i maps [0, width) onto
// [x_min, x_max], row j maps [0, height) onto [y_min, y_max].
// A non-positive dimension yields an empty field.
SampledField build_field(int width, int height, const PlaneWindow& window,
                         VariantKind kind);

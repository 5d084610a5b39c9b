#include "plane.hpp"

SampledField build_field(int width, int height, const PlaneWindow& window,
                         VariantKind kind)
{
    SampledField field;
    field.window = window;
    field.kind   = kind;
    if (width <= 0 || height <= 0)
        return field;

    field.width  = width;
    field.height = height;

    // Each column shares its real part and each row its imaginary part, so
    // the interpolation is done once per axis.
    std::vector<double> re(static_cast<size_t>(width));
    std::vector<double> im(static_cast<size_t>(height));
    for (int i = 0; i < width; ++i)
        re[i] = map_range(i, 0.0, width, window.x_min, window.x_max);
    for (int j = 0; j < height; ++j)
        im[j] = map_range(j, 0.0, height, window.y_min, window.y_max);

    field.points.reserve(static_cast<size_t>(width) * height);
    for (int j = 0; j < height; ++j)
        for (int i = 0; i < width; ++i)
            field.points.push_back({re[i], im[j]});
    return field;
}

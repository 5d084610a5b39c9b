#pragma once

#include <cstddef>
#include <string>
#include <vector>

struct SampledField;
struct RenderConfig;

// One output pixel in abstract HSB space plus alpha.
struct HsbaPixel {
    double hue        = 0.0;
    double saturation = 0.0;
    double brightness = 0.0;
    double alpha      = 0.0;
};

inline bool operator==(const HsbaPixel& a, const HsbaPixel& b)
{
    return a.hue == b.hue && a.saturation == b.saturation &&
           a.brightness == b.brightness && a.alpha == b.alpha;
}

// Row-major, same order as the sampled field.
struct PixelBuffer {
    std::vector<HsbaPixel> pixels;
    int width  = 0;
    int height = 0;

    void resize(int w, int h)
    {
        width  = w;
        height = h;
        pixels.assign(static_cast<size_t>(w) * h, HsbaPixel{});
    }

    size_t size() const { return pixels.size(); }
};

class IFractalRenderer {
public:
    virtual ~IFractalRenderer() = default;

    // Fills `buf` for every point of `field`. Returns empty string on
    // success, or an error message; `buf` is not modified on error.
    virtual std::string render(const SampledField& field, const RenderConfig& cfg,
                               PixelBuffer& buf) = 0;
};

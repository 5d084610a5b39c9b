#pragma once

#include "cpu_renderer.hpp"
#include "plane.hpp"
#include "render_config.hpp"
#include "renderer.hpp"

#include <string>

// Owns the current configuration, the sampled field and the output buffer.
// update() and render_frame() must not run concurrently; the pixel sweep
// itself is parallel inside render_frame().
class RenderSession {
public:
    RenderSession(int width, int height);

    // Returns empty string on success, or an error message. On error the
    // configuration and field are left as they were.
    std::string update(const ConfigPatch& patch);

    // Full recompute of the buffer from the current field and configuration.
    // Returns empty string on success, or an error message; on error the
    // previous buffer is kept.
    std::string render_frame();

    const RenderConfig& config() const { return cfg; }
    const SampledField& field()  const { return fld; }
    const PixelBuffer&  buffer() const { return pbuf; }
    int width()  const { return grid_w; }
    int height() const { return grid_h; }

    CpuRenderer& renderer() { return cpu; }

    // Counts field (re)generations, including the initial one.
    int field_builds() const { return n_field_builds; }

private:
    void ensure_field();

    int          grid_w = 0;
    int          grid_h = 0;
    RenderConfig cfg;
    SampledField fld;
    PixelBuffer  pbuf;
    CpuRenderer  cpu;
    int          n_field_builds = 0;
};

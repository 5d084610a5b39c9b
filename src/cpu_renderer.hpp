#pragma once

#include "renderer.hpp"
#include "render_config.hpp"
#include "thread_pool.hpp"

#include <atomic>
#include <memory>
#include <vector>

struct EscapeParams;

class CpuRenderer : public IFractalRenderer {
public:
    CpuRenderer();
    std::string render(const SampledField& field, const RenderConfig& cfg,
                       PixelBuffer& buf) override;

    double last_render_ms = 0.0;
    bool   avx_active     = false;   // true if the AVX path is in use
    int    thread_count   = 0;
    int    hw_concurrency = 0;       // logical CPU count detected at startup

    // n=0 restores hw_concurrency
    void set_thread_count(int n);

    // Only takes effect when the AVX kernel was compiled in and the CPU has AVX.
    void set_avx(bool b) { avx_active = b && avx_supported; }
    bool avx_available() const { return avx_supported; }

    // Safe to call from any thread while render() runs. Tiles not yet started
    // are skipped and render() reports the cancellation. A request made while
    // no render is in flight is discarded by the next render().
    void request_cancel() { cancel_requested.store(true); }

    // True between the start of render() and its return.
    bool rendering() const { return in_render.load(); }

private:
    void render_tile(const SampledField& field, const EscapeParams& ep,
                     bool escape_coloring, int tx, int ty, int tw, int th);

    std::unique_ptr<ThreadPool> pool;
    std::vector<double>         values;   // one color value per field point
    std::atomic<bool>           cancel_requested{false};
    std::atomic<bool>           in_render{false};
    bool                        avx_supported = false;
};

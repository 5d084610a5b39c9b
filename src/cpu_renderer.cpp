#include "cpu_renderer.hpp"
#include "fractal.hpp"
#include "palette.hpp"
#include "plane.hpp"

#ifdef HAVE_SLEEF
#include "cpu_renderer_avx.hpp"
#endif

#include <algorithm>
#include <chrono>
#include <thread>

// -----------------------------------------------------------------------
// Constructor — detect AVX, build thread pool
// -----------------------------------------------------------------------
CpuRenderer::CpuRenderer()
{
#ifdef HAVE_SLEEF
    avx_supported = __builtin_cpu_supports("avx");
#endif
    avx_active = avx_supported;

    int n = static_cast<int>(std::thread::hardware_concurrency());
    if (n < 1) n = 4;
    hw_concurrency = n;
    thread_count   = n;
    pool = std::make_unique<ThreadPool>(n);
}

void CpuRenderer::set_thread_count(int n)
{
    if (n < 1) n = hw_concurrency;
    pool = std::make_unique<ThreadPool>(n);
    thread_count = n;
}

// -----------------------------------------------------------------------
// Tile renderer — called from thread pool workers. Each tile owns a
// disjoint rectangle of `values`.
// -----------------------------------------------------------------------
void CpuRenderer::render_tile(const SampledField& field, const EscapeParams& ep,
                              bool escape_coloring, int tx, int ty, int tw, int th)
{
    const int W = field.width;
    const int H = field.height;

    for (int py = ty; py < ty + th && py < H; ++py) {
        const Complex* row = field.points.data() + static_cast<size_t>(py) * W;
        double*        out = values.data() + static_cast<size_t>(py) * W;
        int            px  = tx;
        const int      end = std::min(tx + tw, W);

#ifdef HAVE_SLEEF
        // --- AVX path: 4 points per call ---
        if (avx_active) {
            for (; px + 4 <= end; px += 4)
                avx_color_values_4(row + px, ep, escape_coloring, out + px);
        }
#endif

        // --- Scalar path: remainder points (or full row without AVX) ---
        for (; px < end; ++px)
            out[px] = color_value(evaluate(row[px], ep), ep.max_iter, escape_coloring);
    }
}

// -----------------------------------------------------------------------
// Top-level render — splits the field into tiles, partitions them across the
// thread pool, then colors the whole buffer once every band has finished.
// -----------------------------------------------------------------------
std::string CpuRenderer::render(const SampledField& field, const RenderConfig& cfg,
                                PixelBuffer& buf)
{
    using clock = std::chrono::steady_clock;
    const auto t0 = clock::now();

    const int W = field.width, H = field.height;
    if (field.points.size() != static_cast<size_t>(W) * static_cast<size_t>(H) ||
        W < 0 || H < 0)
        return "sampled field is inconsistent with its dimensions";

    // Drop any request left over from before this render.
    cancel_requested.store(false);
    in_render.store(true);

    values.assign(field.points.size(), 0.0);
    const EscapeParams ep = EscapeParams::from(cfg);
    const bool escape_coloring = cfg.escape_coloring;

    constexpr int TILE_W = 64;
    constexpr int TILE_H = 64;
    const int tiles_x = (W + TILE_W - 1) / TILE_W;
    const int tiles_y = (H + TILE_H - 1) / TILE_H;

    // Static partition: each worker gets a contiguous run of tiles in
    // row-major tile order and checks for cancellation between tiles.
    pool->parallel_for(tiles_x * tiles_y, [&](int first, int last) {
        for (int t = first; t < last; ++t) {
            if (cancel_requested.load(std::memory_order_relaxed)) return;
            const int tx = (t % tiles_x) * TILE_W;
            const int ty = (t / tiles_x) * TILE_H;
            render_tile(field, ep, escape_coloring, tx, ty,
                        std::min(TILE_W, W - tx), std::min(TILE_H, H - ty));
        }
    });

    const bool cancelled = cancel_requested.exchange(false);
    in_render.store(false);
    if (cancelled)
        return "render cancelled";

    PixelBuffer next;
    next.resize(W, H);
    std::string err = color_fractal(cfg.base_color, values, next);
    if (!err.empty())
        return err;
    buf = std::move(next);

    last_render_ms = std::chrono::duration<double, std::milli>(
                         clock::now() - t0).count();
    return {};
}

#include "cpu_renderer.hpp"
#include "fractal.hpp"
#include "palette.hpp"
#include "plane.hpp"

#ifdef HAVE_SLEEF
#include "cpu_renderer_avx.hpp"
#endif

#include <gtest/gtest.h>

#include <cmath>
#include <string>
#include <thread>

namespace {

RenderConfig julia_config()
{
    RenderConfig cfg = default_config();
    cfg.max_iter   = 150;
    cfg.variant    = FractalVariant::parameterized({-0.7, 0.27015});
    cfg.base_color = {30.0, 40.0, 20.0};
    cfg.window     = {-1.6, 1.6, -1.0, 1.0};
    return cfg;
}

}  // namespace

TEST(CpuRenderer, MatchesPerPixelEvaluation)
{
    const RenderConfig cfg = julia_config();
    const SampledField field = build_field(70, 45, cfg.window, cfg.variant.kind);

    CpuRenderer renderer;
    renderer.set_avx(false);
    PixelBuffer buf;
    ASSERT_EQ(renderer.render(field, cfg, buf), "");
    ASSERT_EQ(buf.width, 70);
    ASSERT_EQ(buf.height, 45);

    const EscapeParams ep = EscapeParams::from(cfg);
    for (int j = 0; j < field.height; ++j) {
        for (int i = 0; i < field.width; ++i) {
            const double v = color_value(evaluate(field.at(i, j), ep), cfg.max_iter, false);
            const HsbColor c = normalize_hsb(cfg.base_color, v);
            const HsbaPixel& p = buf.pixels[static_cast<size_t>(j) * 70 + i];
            EXPECT_EQ(p.hue, c.hue);
            EXPECT_EQ(p.saturation, c.saturation);
            EXPECT_EQ(p.brightness, c.brightness);
            EXPECT_EQ(p.alpha, PIXEL_ALPHA);
        }
    }
}

TEST(CpuRenderer, OutputIndependentOfThreadCount)
{
    RenderConfig cfg = default_config();
    cfg.max_iter = 200;
    cfg.window   = {-2.0, 0.6, -1.2, 1.2};
    // Larger than one tile in both directions, with ragged edges.
    const SampledField field = build_field(150, 131, cfg.window, cfg.variant.kind);

    CpuRenderer renderer;
    PixelBuffer one, many;
    renderer.set_thread_count(1);
    ASSERT_EQ(renderer.render(field, cfg, one), "");
    renderer.set_thread_count(5);
    ASSERT_EQ(renderer.thread_count, 5);
    ASSERT_EQ(renderer.render(field, cfg, many), "");

    ASSERT_EQ(one.size(), many.size());
    for (size_t k = 0; k < one.size(); ++k)
        ASSERT_TRUE(one.pixels[k] == many.pixels[k]) << "pixel " << k;
}

TEST(CpuRenderer, ZeroThreadsRestoresHardwareConcurrency)
{
    CpuRenderer renderer;
    renderer.set_thread_count(2);
    renderer.set_thread_count(0);
    EXPECT_EQ(renderer.thread_count, renderer.hw_concurrency);
}

TEST(CpuRenderer, CancelWithoutRenderInFlightIsDiscarded)
{
    const RenderConfig cfg = julia_config();
    const SampledField field = build_field(32, 32, cfg.window, cfg.variant.kind);

    CpuRenderer renderer;
    EXPECT_FALSE(renderer.rendering());
    renderer.request_cancel();

    PixelBuffer buf;
    ASSERT_EQ(renderer.render(field, cfg, buf), "");
    ASSERT_EQ(buf.size(), 32u * 32u);
    EXPECT_EQ(buf.pixels[0].alpha, PIXEL_ALPHA);
    EXPECT_FALSE(renderer.rendering());
}

TEST(CpuRenderer, CancelDuringRenderKeepsPreviousBuffer)
{
    // Every sample lies in the main cardioid, so each point costs max_iter.
    RenderConfig cfg = default_config();
    cfg.window = {-0.2, 0.2, -0.2, 0.2};
    const SampledField field = build_field(256, 256, cfg.window, cfg.variant.kind);

    CpuRenderer renderer;
    renderer.set_thread_count(1);

    PixelBuffer buf;
    cfg.max_iter = 10;
    ASSERT_EQ(renderer.render(field, cfg, buf), "");
    const PixelBuffer before = buf;

    cfg.max_iter   = 20000;
    cfg.base_color = {200.0, 0.0, 0.0};
    std::string result = "not run";
    std::thread worker([&] { result = renderer.render(field, cfg, buf); });
    while (!renderer.rendering())
        std::this_thread::yield();
    renderer.request_cancel();
    worker.join();

    EXPECT_EQ(result, "render cancelled");
    ASSERT_EQ(buf.size(), before.size());
    for (size_t k = 0; k < buf.size(); ++k)
        ASSERT_TRUE(buf.pixels[k] == before.pixels[k]);

    // A late request after the render returned does not hit the next frame.
    renderer.request_cancel();
    cfg.max_iter = 10;
    EXPECT_EQ(renderer.render(field, cfg, buf), "");
    EXPECT_FALSE(buf.pixels[0] == before.pixels[0]);
}

TEST(CpuRenderer, RejectsInconsistentField)
{
    SampledField field = build_field(4, 4, PlaneWindow{}, VariantKind::Standard);
    field.points.pop_back();

    CpuRenderer renderer;
    PixelBuffer buf;
    EXPECT_NE(renderer.render(field, default_config(), buf), "");
    EXPECT_EQ(buf.size(), 0u);
}

TEST(CpuRenderer, EmptyFieldRendersEmptyBuffer)
{
    const SampledField field = build_field(0, 0, PlaneWindow{}, VariantKind::Standard);
    CpuRenderer renderer;
    PixelBuffer buf;
    EXPECT_EQ(renderer.render(field, default_config(), buf), "");
    EXPECT_EQ(buf.size(), 0u);
}

#ifdef HAVE_SLEEF
TEST(CpuRendererAvx, KernelMatchesScalarPath)
{
    CpuRenderer renderer_check;
    if (!renderer_check.avx_available())
        GTEST_SKIP() << "CPU lacks AVX";

    for (bool escape_coloring : {false, true}) {
        for (bool julia : {false, true}) {
            RenderConfig cfg = julia ? julia_config() : default_config();
            cfg.max_iter        = 300;
            cfg.escape_coloring = escape_coloring;
            const SampledField field = build_field(64, 48, cfg.window, cfg.variant.kind);
            const EscapeParams ep = EscapeParams::from(cfg);

            for (size_t k = 0; k + 4 <= field.points.size(); k += 4) {
                double out4[4];
                avx_color_values_4(field.points.data() + k, ep, escape_coloring, out4);
                for (int lane = 0; lane < 4; ++lane) {
                    const double ref = color_value(evaluate(field.points[k + lane], ep),
                                                   cfg.max_iter, escape_coloring);
                    ASSERT_NEAR(out4[lane], ref, 1e-9) << "point " << k + lane;
                }
            }
        }
    }
}
#endif

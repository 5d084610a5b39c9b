#pragma once

#include "render_session.hpp"
#include <cstdio>
#include <algorithm>
#include <vector>

inline int run_cli_benchmark()
{
    constexpr int W = 1920, H = 1080, RUNS = 4, BEST_N = 2;
    RenderSession session(W, H);
    CpuRenderer& renderer = session.renderer();
    renderer.set_thread_count(1);

    struct TestCase {
        const char* label;
        VariantKind kind;
        bool        escape_coloring;
        bool        force_scalar;
    };

    const TestCase tests[] = {
        // AVX path
        {"Mandelbrot",                   VariantKind::Standard,      false, false},
        {"Mandelbrot (escape coloring)", VariantKind::Standard,      true,  false},
        {"Julia",                        VariantKind::Parameterized, false, false},
        // Scalar path
        {"Mandelbrot",                   VariantKind::Standard,      false, true },
        {"Mandelbrot (escape coloring)", VariantKind::Standard,      true,  true },
        {"Julia",                        VariantKind::Parameterized, false, true },
    };

    printf("fractal-sketch CLI Benchmark\n");
    printf("%dx%d, 256 iter, 1 thread, %d runs (avg best %d)\n", W, H, RUNS, BEST_N);
    printf("AVX supported: %s\n\n", renderer.avx_available() ? "yes" : "no");
    printf("%-30s %-10s %s\n", "Label", "Path", "Mpix/s");
    printf("------------------------------------------------\n");

    const bool has_avx = renderer.avx_available();

    for (const auto& t : tests) {
        ConfigPatch patch;
        patch.max_iter           = 256;
        patch.window             = PlaneWindow{-2.25, 1.25, -1.0, 1.0};
        patch.variant            = t.kind;
        patch.parameter_constant = Complex{-0.7, 0.27015};
        patch.escape_coloring    = t.escape_coloring;
        std::string err = session.update(patch);
        if (!err.empty()) {
            fprintf(stderr, "benchmark setup failed: %s\n", err.c_str());
            return 1;
        }

        renderer.set_avx(!t.force_scalar && has_avx);

        // Warm-up
        err = session.render_frame();
        if (!err.empty()) {
            fprintf(stderr, "benchmark render failed: %s\n", err.c_str());
            return 1;
        }

        std::vector<double> times(RUNS);
        for (int r = 0; r < RUNS; ++r) {
            err = session.render_frame();
            if (!err.empty()) {
                fprintf(stderr, "benchmark render failed: %s\n", err.c_str());
                return 1;
            }
            times[r] = renderer.last_render_ms;
        }
        std::sort(times.begin(), times.end());
        double avg_ms = 0.0;
        for (int i = 0; i < BEST_N; ++i) avg_ms += times[i];
        avg_ms /= BEST_N;
        double mpixs = (W * H) / (avg_ms * 1000.0);

        const char* path_label = "scalar";
        if (!t.force_scalar && has_avx)
            path_label = "AVX";

        printf("%-30s %-10s %6.2f\n", t.label, path_label, mpixs);
    }

    renderer.set_avx(has_avx);  // restore
    return 0;
}

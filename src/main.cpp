#include "render_session.hpp"
#include "export.hpp"
#include "cli_benchmark.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

static const int DEFAULT_WIDTH  = 512;
static const int DEFAULT_HEIGHT = 512;

static void print_usage(const char* prog)
{
    printf("Usage: %s [options]\n"
           "  -o, --output FILE        output image (.png%s)\n"
           "  -W, --width N            grid width  (default %d)\n"
           "  -H, --height N           grid height (default %d)\n"
           "  -i, --iterations N       max iterations (default 400)\n"
           "  -r, --radius R           escape radius (default 20)\n"
           "  -j, --julia RE IM        Julia variant with constant RE+IM\n"
           "      --window XMIN XMAX YMIN YMAX\n"
           "                           complex-plane window (default -2.5 2.5 -2.5 2.5)\n"
           "      --hsb H S B          base color offsets (default 0 0 0)\n"
           "  -e, --escape-coloring    flat color for points that never escape\n"
           "  -t, --threads N          worker threads (0 = all cores)\n"
           "      --scalar             disable the AVX path\n"
           "      --benchmark          run the throughput benchmark and exit\n"
           "  -h, --help               show this help\n",
           prog, jxl_available() ? " or .jxl" : "", DEFAULT_WIDTH, DEFAULT_HEIGHT);
}

// ---------------------------------------------------------------------------
// Argument helpers — each consumes the values following argv[i]
// ---------------------------------------------------------------------------
static bool parse_int(const char* s, int& out)
{
    char* end = nullptr;
    errno = 0;
    const long v = std::strtol(s, &end, 10);
    if (errno != 0 || end == s || *end != '\0' || v < -2147483647L || v > 2147483647L)
        return false;
    out = static_cast<int>(v);
    return true;
}

static bool parse_double(const char* s, double& out)
{
    char* end = nullptr;
    errno = 0;
    const double v = std::strtod(s, &end);
    if (errno != 0 || end == s || *end != '\0')
        return false;
    out = v;
    return true;
}

struct CliOptions {
    ConfigPatch patch;
    std::string output     = "fractal.png";
    int         width      = DEFAULT_WIDTH;
    int         height     = DEFAULT_HEIGHT;
    int         threads    = 0;
    bool        scalar     = false;
    bool        benchmark  = false;
    bool        help       = false;
};

// Returns empty string on success, or an error message.
static std::string parse_args(int argc, char* argv[], CliOptions& opt)
{
    auto need = [&](int i, int n, const char* name) -> std::string {
        if (i + n >= argc)
            return std::string(name) + " expects " + std::to_string(n) +
                   (n == 1 ? " value" : " values");
        return {};
    };
    auto bad = [](const char* name, const char* value) {
        return std::string("invalid value for ") + name + ": '" + value + "'";
    };

    for (int i = 1; i < argc; ++i) {
        const char* a = argv[i];
        std::string err;

        if (!std::strcmp(a, "-h") || !std::strcmp(a, "--help")) {
            opt.help = true;
        } else if (!std::strcmp(a, "--benchmark")) {
            opt.benchmark = true;
        } else if (!std::strcmp(a, "--scalar")) {
            opt.scalar = true;
        } else if (!std::strcmp(a, "-e") || !std::strcmp(a, "--escape-coloring")) {
            opt.patch.escape_coloring = true;
        } else if (!std::strcmp(a, "-o") || !std::strcmp(a, "--output")) {
            if (!(err = need(i, 1, a)).empty()) return err;
            opt.output = argv[++i];
        } else if (!std::strcmp(a, "-W") || !std::strcmp(a, "--width")) {
            if (!(err = need(i, 1, a)).empty()) return err;
            if (!parse_int(argv[++i], opt.width) || opt.width <= 0) return bad(a, argv[i]);
        } else if (!std::strcmp(a, "-H") || !std::strcmp(a, "--height")) {
            if (!(err = need(i, 1, a)).empty()) return err;
            if (!parse_int(argv[++i], opt.height) || opt.height <= 0) return bad(a, argv[i]);
        } else if (!std::strcmp(a, "-t") || !std::strcmp(a, "--threads")) {
            if (!(err = need(i, 1, a)).empty()) return err;
            if (!parse_int(argv[++i], opt.threads) || opt.threads < 0) return bad(a, argv[i]);
        } else if (!std::strcmp(a, "-i") || !std::strcmp(a, "--iterations")) {
            if (!(err = need(i, 1, a)).empty()) return err;
            int v = 0;
            if (!parse_int(argv[++i], v)) return bad(a, argv[i]);
            opt.patch.max_iter = v;
        } else if (!std::strcmp(a, "-r") || !std::strcmp(a, "--radius")) {
            if (!(err = need(i, 1, a)).empty()) return err;
            double v = 0.0;
            if (!parse_double(argv[++i], v)) return bad(a, argv[i]);
            opt.patch.escape_radius = v;
        } else if (!std::strcmp(a, "-j") || !std::strcmp(a, "--julia")) {
            if (!(err = need(i, 2, a)).empty()) return err;
            Complex k;
            if (!parse_double(argv[++i], k.re)) return bad(a, argv[i]);
            if (!parse_double(argv[++i], k.im)) return bad(a, argv[i]);
            opt.patch.variant            = VariantKind::Parameterized;
            opt.patch.parameter_constant = k;
        } else if (!std::strcmp(a, "--window")) {
            if (!(err = need(i, 4, a)).empty()) return err;
            PlaneWindow w;
            if (!parse_double(argv[++i], w.x_min)) return bad(a, argv[i]);
            if (!parse_double(argv[++i], w.x_max)) return bad(a, argv[i]);
            if (!parse_double(argv[++i], w.y_min)) return bad(a, argv[i]);
            if (!parse_double(argv[++i], w.y_max)) return bad(a, argv[i]);
            opt.patch.window = w;
        } else if (!std::strcmp(a, "--hsb")) {
            if (!(err = need(i, 3, a)).empty()) return err;
            HsbColor c;
            if (!parse_double(argv[++i], c.hue))        return bad(a, argv[i]);
            if (!parse_double(argv[++i], c.saturation)) return bad(a, argv[i]);
            if (!parse_double(argv[++i], c.brightness)) return bad(a, argv[i]);
            opt.patch.base_color = c;
        } else {
            return std::string("unknown option: ") + a;
        }
    }
    return {};
}

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int argc, char* argv[])
{
    CliOptions opt;
    std::string err = parse_args(argc, argv, opt);
    if (!err.empty()) {
        fprintf(stderr, "%s\n", err.c_str());
        print_usage(argv[0]);
        return 1;
    }
    if (opt.help) {
        print_usage(argv[0]);
        return 0;
    }
    if (opt.benchmark)
        return run_cli_benchmark();

    RenderSession session(opt.width, opt.height);
    CpuRenderer& renderer = session.renderer();
    renderer.set_thread_count(opt.threads);
    if (opt.scalar)
        renderer.set_avx(false);

    err = session.update(opt.patch);
    if (!err.empty()) {
        fprintf(stderr, "Invalid configuration: %s\n", err.c_str());
        return 1;
    }

    err = session.render_frame();
    if (!err.empty()) {
        fprintf(stderr, "Render failed: %s\n", err.c_str());
        return 1;
    }

    const RenderConfig& cfg = session.config();
    printf("%s  %dx%d  %d iter  radius %g  %d threads (%s)  %.1f ms\n",
           variant_name(cfg.variant.kind), session.width(), session.height(),
           cfg.max_iter, cfg.escape_radius, renderer.thread_count,
           renderer.avx_active ? "AVX" : "scalar", renderer.last_render_ms);

    err = export_image(opt.output, session.buffer());
    if (!err.empty()) {
        fprintf(stderr, "Export failed: %s\n", err.c_str());
        return 1;
    }
    printf("Saved %s\n", opt.output.c_str());
    return 0;
}

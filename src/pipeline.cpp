#include "pipeline.hpp"
#include "background_task.hpp"
#include "canvas.hpp"
#include "export.hpp"
#include "window.hpp"

#include <charconv>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <system_error>

namespace fs = std::filesystem;

std::string format_scale(double scale)
{
    char buf[64];
    const auto res = std::to_chars(buf, buf + sizeof(buf), scale);
    std::string s(buf, res.ptr);
    if (s.find_first_of(".e") == std::string::npos) s += ".0";
    return s;
}

OutputPaths output_paths(const Options& opts, uint64_t seed)
{
    OutputPaths p;
    p.dir          = opts.output_root + "/" + opts.name;
    p.progress_dir = p.dir + "/progress";
    p.image        = p.dir + "/" + std::to_string(seed) + "-" + format_scale(opts.scale)
                   + opts.metadata.value_or("") + ".png";
    p.latest       = p.dir + "/latest.png";
    return p;
}

std::string ensure_output_dirs(const OutputPaths& paths)
{
    std::error_code ec;
    fs::create_directories(paths.progress_dir, ec);
    if (ec)
        return "Cannot create directory " + paths.progress_dir + ": " + ec.message();
    return {};
}

namespace {

// Global scale, user drawing, then the before-save hook. Reports any error
// cairo latched while drawing.
std::string render_scaled(RenderContext& ctx, Rng& rng, const RenderFn& render)
{
    ctx.canvas.scale(ctx.scale, ctx.scale);
    if (render) render(ctx, rng);
    run_before_save_hook(ctx);
    return ctx.canvas.status();
}

std::string persist(const RenderContext& ctx)
{
    std::printf("Generating art...\n");
    std::printf("Writing %s\n", ctx.paths.image.c_str());
    std::printf("Writing %s\n", ctx.paths.latest.c_str());
    std::fflush(stdout);

    std::string err = export_png(ctx.paths.image, ctx.canvas.pixels());
    if (!err.empty()) return err;
    return export_png(ctx.paths.latest, ctx.canvas.pixels());
}

} // namespace

// ---------------------------------------------------------------------------
// Static mode
// ---------------------------------------------------------------------------
std::string run_trial(const Options& opts, const RenderFn& render, uint64_t* seed_out)
{
    std::string err = validate_options(opts);
    if (!err.empty()) return err;

    const uint64_t seed = resolve_seed(opts.seed);
    Rng rng(seed);

    const OutputPaths paths = output_paths(opts, seed);
    err = ensure_output_dirs(paths);
    if (!err.empty()) return err;

    Canvas canvas(device_width(opts), device_height(opts));
    err = canvas.status();
    if (!err.empty()) return err;

    RenderContext ctx(opts, seed, canvas, nullptr, paths);
    err = render_scaled(ctx, rng, render);
    if (!err.empty()) return err;

    err = persist(ctx);
    if (!err.empty()) return err;

    if (seed_out) *seed_out = seed;
    return {};
}

std::string run_sketch(const Options& opts, const RenderFn& render)
{
    for (int i = 0; i < opts.times; ++i) {
        std::string err = run_trial(opts, render);
        if (!err.empty()) return err;
    }
    return {};
}

// ---------------------------------------------------------------------------
// Live mode
// ---------------------------------------------------------------------------
namespace {

// Window, surface binding, drawing, saving and the idle loop. Runs entirely
// on one thread so SDL only ever sees the thread that initialised it.
std::string run_window_session(const Options& opts, uint64_t seed,
                               const OutputPaths& paths, const RenderFn& render)
{
    std::string err;
    std::unique_ptr<LiveWindow> window =
        LiveWindow::open("sketchbox", device_width(opts), device_height(opts), err);
    if (!window) return err;

    err = window->fill_white();
    if (!err.empty()) return err;

    Rng rng(seed);
    Canvas canvas(window->pixels());
    err = canvas.status();
    if (!err.empty()) return err;

    RenderContext ctx(opts, seed, canvas, window.get(), paths);
    err = render_scaled(ctx, rng, render);
    if (!err.empty()) return err;

    err = present(ctx);
    if (!err.empty()) return err;

    err = persist(ctx);
    if (!err.empty()) return err;

    // The window stays open, and owned by this trial, until it is closed.
    window->idle_until_quit();
    return {};
}

} // namespace

std::string run_live_trial(const Options& opts, const RenderFn& render)
{
    std::string err = validate_options(opts);
    if (!err.empty()) return err;

    const uint64_t seed = resolve_seed(opts.seed);
    const OutputPaths paths = output_paths(opts, seed);
    err = ensure_output_dirs(paths);
    if (!err.empty()) return err;

    BackgroundTask session([&] { err = run_window_session(opts, seed, paths, render); });
    session.wait();
    return err;
}

std::string run_sketch_live(const Options& opts, const RenderFn& render)
{
    for (int i = 0; i < opts.times; ++i) {
        std::string err = run_live_trial(opts, render);
        if (!err.empty()) return err;
    }
    return {};
}

// ---------------------------------------------------------------------------
// Command line entry point
// ---------------------------------------------------------------------------
int run_sketch_cli(int argc, char** argv, const RenderFn& render,
                   const std::function<void(Options&)>& modify)
{
    const char* prog = argc > 0 ? argv[0] : "sketchbox";

    Options opts;
    std::string err = parse_options(argc, argv, opts);
    if (!err.empty()) {
        std::fprintf(stderr, "%s\n\n", err.c_str());
        print_usage(stderr, prog);
        return 2;
    }
    if (opts.help) {
        print_usage(stdout, prog);
        return 0;
    }

    if (modify) {
        modify(opts);
        err = validate_options(opts);
        if (!err.empty()) {
            std::fprintf(stderr, "%s\n", err.c_str());
            return 2;
        }
    }

    err = opts.live ? run_sketch_live(opts, render) : run_sketch(opts, render);
    if (!err.empty()) {
        std::fprintf(stderr, "Error: %s\n", err.c_str());
        return 1;
    }
    return 0;
}

#include "render_context.hpp"
#include "export.hpp"
#include "window.hpp"

#include <algorithm>
#include <cstdio>
#include <thread>
#include <utility>

RenderContext::RenderContext(const Options& opts, uint64_t s, Canvas& c,
                             LiveWindow* win, OutputPaths p)
    : width(opts.width)
    , height(opts.height)
    , seed(s)
    , scale(opts.scale)
    , name(opts.name)
    , canvas(c)
    , window(win)
    , paths(std::move(p))
{
    video.fps = opts.fps;
}

uint64_t time_seed()
{
    using namespace std::chrono;
    const auto ms = duration_cast<milliseconds>(system_clock::now().time_since_epoch());
    return static_cast<uint64_t>(ms.count());
}

uint64_t resolve_seed(const std::optional<uint64_t>& seed)
{
    return seed ? *seed : time_seed();
}

void set_progress(RenderContext& ctx, double value)
{
    ctx.progress = std::max(0.0, std::min(1.0, value));
}

void on_before_save(RenderContext& ctx, std::function<void()> hook)
{
    ctx.before_save_hook = std::move(hook);
}

void run_before_save_hook(RenderContext& ctx)
{
    if (!ctx.before_save_hook) return;
    std::function<void()> hook = std::move(ctx.before_save_hook);
    ctx.before_save_hook = nullptr;
    hook();
}

// ---------------------------------------------------------------------------
// Video pacing
// ---------------------------------------------------------------------------
Clock::duration frame_interval(const VideoState& video)
{
    const int fps = std::max(1, video.fps);
    return std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(1.0 / fps));
}

bool frame_due(const VideoState& video, Clock::time_point now)
{
    return now - video.last_frame >= frame_interval(video);
}

bool next_frame(RenderContext& ctx)
{
    const auto now = Clock::now();
    if (!frame_due(ctx.video, now)) return false;
    ctx.video.last_frame = now;
    return true;
}

void wait_for_next_frame(RenderContext& ctx)
{
    const auto due = ctx.video.last_frame + frame_interval(ctx.video);
    const auto now = Clock::now();
    if (due > now) std::this_thread::sleep_until(due);
    ctx.video.last_frame = Clock::now();
}

std::string present(RenderContext& ctx)
{
    if (!ctx.window) return {};
    ctx.canvas.flush();
    return ctx.window->present();
}

std::string save_progress_frame(RenderContext& ctx)
{
    char file[32];
    std::snprintf(file, sizeof(file), "/%05d.png", ctx.progress_frame);
    const std::string path = ctx.paths.progress_dir + file;

    std::string err = export_png(path, ctx.canvas.pixels());
    if (!err.empty()) return err;
    ++ctx.progress_frame;
    return {};
}

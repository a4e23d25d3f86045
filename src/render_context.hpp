#pragma once

#include "canvas.hpp"
#include "options.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

class LiveWindow;

using Clock = std::chrono::steady_clock;

// Frame pacing for continuous drawing. The pipeline never enforces it;
// drawing code checks and stamps last_frame through the helpers below.
struct VideoState {
    int               fps        = 30;
    Clock::time_point last_frame = {};   // epoch: the first frame is always due
};

// Where one trial writes its files.
struct OutputPaths {
    std::string dir;            // images/<name>
    std::string progress_dir;   // images/<name>/progress
    std::string image;          // images/<name>/<seed>-<scale><metadata>.png
    std::string latest;         // images/<name>/latest.png
};

// ---------------------------------------------------------------------------
// Per-trial render state, handed to the drawing code by reference. Created
// fresh for every trial and never shared between trials.
// ---------------------------------------------------------------------------
struct RenderContext {
    RenderContext(const Options& opts, uint64_t seed, Canvas& canvas,
                  LiveWindow* window, OutputPaths paths);

    RenderContext(const RenderContext&) = delete;
    RenderContext& operator=(const RenderContext&) = delete;

    int         width;    // user-space units
    int         height;
    uint64_t    seed;
    double      scale;
    std::string name;

    double                progress = 0.0;      // [0, 1], read by progress reporters
    std::function<void()> before_save_hook;    // run once, right before saving

    Canvas&     canvas;
    LiveWindow* window = nullptr;              // set in live mode only
    VideoState  video;

    OutputPaths paths;
    int         progress_frame = 0;            // next file in paths.progress_dir
};

// Caller's seed if given, otherwise the current time in milliseconds.
uint64_t resolve_seed(const std::optional<uint64_t>& seed);
uint64_t time_seed();

void set_progress(RenderContext& ctx, double value);

// Registers the before-save hook; a later call in the same trial replaces
// the earlier hook.
void on_before_save(RenderContext& ctx, std::function<void()> hook);

// Runs the hook if one is set and clears it.
void run_before_save_hook(RenderContext& ctx);

// --- video pacing ---
Clock::duration frame_interval(const VideoState& video);
bool            frame_due(const VideoState& video, Clock::time_point now);

// Stamps last_frame and returns true when a frame is due, false otherwise.
bool next_frame(RenderContext& ctx);

// Sleeps until the next frame is due, then stamps last_frame.
void wait_for_next_frame(RenderContext& ctx);

// Pushes the canvas to the window; does nothing without one.
std::string present(RenderContext& ctx);

// Writes the canvas as progress/<NNNNN>.png and advances progress_frame.
std::string save_progress_frame(RenderContext& ctx);

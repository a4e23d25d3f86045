#pragma once

#include "options.hpp"
#include "render_context.hpp"
#include "rng.hpp"

#include <cstdint>
#include <functional>
#include <string>

// The user's drawing logic. rng is the trial's only source of randomness.
using RenderFn = std::function<void(RenderContext& ctx, Rng& rng)>;

// Shortest decimal that reads back as the same double, always with a
// fractional part: 1 -> "1.0", 0.5 -> "0.5".
std::string format_scale(double scale);

OutputPaths output_paths(const Options& opts, uint64_t seed);

// Creates images/, images/<name>/ and images/<name>/progress/.
std::string ensure_output_dirs(const OutputPaths& paths);

// Static mode: one trial into an off-screen surface. On success the
// resolved seed is stored in seed_out if given.
std::string run_trial(const Options& opts, const RenderFn& render, uint64_t* seed_out = nullptr);

// Runs opts.times trials one after another; stops at the first error.
std::string run_sketch(const Options& opts, const RenderFn& render);

// Live mode: renders straight into a window, saves, then keeps the window
// responsive until it is closed. The window and its event loop live on a
// task thread of their own; the caller blocks until the trial is over.
std::string run_live_trial(const Options& opts, const RenderFn& render);
std::string run_sketch_live(const Options& opts, const RenderFn& render);

// Parses the command line, applies modify (if any) on top of it and runs
// the sketch. Returns the process exit code.
int run_sketch_cli(int argc, char** argv, const RenderFn& render,
                   const std::function<void(Options&)>& modify = {});

#pragma once

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>

struct Options {
    std::optional<uint64_t>    seed;                   // unset: derived from wall clock per trial
    double                     scale       = 1.0;      // user space -> device space
    int                        width       = 100;      // user-space units
    int                        height      = 100;
    int                        times       = 1;        // trials to run, one after another
    std::string                name        = "sketch"; // images/<name>/...
    std::optional<std::string> metadata;               // appended to the image file name
    int                        fps         = 30;       // pacing for continuous drawing
    bool                       live        = false;    // show a window and idle until quit
    std::string                output_root = "images";
    bool                       help        = false;
};

// Physical raster size: round(width * scale), round(height * scale).
inline int device_width(const Options& o)  { return static_cast<int>(std::lround(o.width  * o.scale)); }
inline int device_height(const Options& o) { return static_cast<int>(std::lround(o.height * o.scale)); }

// Parses argv into out, starting from out's current values. Accepts
// "--flag value" and "--flag=value". Returns empty string on success, or an
// error message; out is only meaningful on success.
std::string parse_options(int argc, char** argv, Options& out);

// Checks ranges on an already filled Options (also run by parse_options).
std::string validate_options(const Options& o);

void print_usage(FILE* f, const char* prog);

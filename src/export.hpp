#pragma once

#include "pixel_view.hpp"

#include <string>

// Writes view as an 8-bit RGBA PNG. The image is encoded into "<path>.tmp"
// and renamed over path only once complete, so path never holds a partial
// file. Returns empty string on success, or an error message on failure.
std::string export_png(const std::string& path, const PixelView& view);

#include "export.hpp"

#include <png.h>
#include <csetjmp>
#include <cstdio>
#include <vector>

namespace {

// Encodes view into an already opened file. Returns empty string on success.
std::string write_png_stream(FILE* fp, const PixelView& view)
{
    png_structp png = png_create_write_struct(
        PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (!png)
        return "png_create_write_struct failed";

    png_infop info = png_create_info_struct(png);
    if (!info) {
        png_destroy_write_struct(&png, nullptr);
        return "png_create_info_struct failed";
    }

    // Declared before setjmp so a longjmp does not skip its destructor.
    std::vector<png_byte> row(static_cast<size_t>(view.width) * 4);

    if (setjmp(png_jmpbuf(png))) {
        png_destroy_write_struct(&png, &info);
        return "PNG write error (libpng longjmp)";
    }

    png_init_io(png, fp);
    png_set_IHDR(png, info,
                 static_cast<png_uint_32>(view.width),
                 static_cast<png_uint_32>(view.height),
                 8, PNG_COLOR_TYPE_RGBA,
                 PNG_INTERLACE_NONE,
                 PNG_COMPRESSION_TYPE_DEFAULT,
                 PNG_FILTER_TYPE_DEFAULT);
    png_write_info(png, info);

    // Unpack through the view's format: premultiplied surfaces are written
    // as straight alpha, window surfaces as opaque.
    for (int y = 0; y < view.height; ++y) {
        const uint32_t* src = view.row(y);
        for (int x = 0; x < view.width; ++x) {
            const Rgba8 c = unpack_pixel(view.format, src[x]);
            png_byte* dst = row.data() + static_cast<size_t>(x) * 4;
            dst[0] = c.r;
            dst[1] = c.g;
            dst[2] = c.b;
            dst[3] = c.a;
        }
        png_write_row(png, row.data());
    }

    png_write_end(png, nullptr);
    png_destroy_write_struct(&png, &info);
    return {};
}

} // namespace

// ---------------------------------------------------------------------------
// PNG export
// ---------------------------------------------------------------------------
std::string export_png(const std::string& path, const PixelView& view)
{
    if (!view.pixels || view.width <= 0 || view.height <= 0)
        return "Cannot encode an empty surface: " + path;

    const std::string tmp = path + ".tmp";
    FILE* fp = std::fopen(tmp.c_str(), "wb");
    if (!fp)
        return "Cannot open file for writing: " + tmp;

    std::string err = write_png_stream(fp, view);
    if (std::fflush(fp) != 0 && err.empty())
        err = "Cannot flush " + tmp;
    if (std::fclose(fp) != 0 && err.empty())
        err = "Cannot close " + tmp;

    if (err.empty() && std::rename(tmp.c_str(), path.c_str()) != 0)
        err = "Cannot rename " + tmp + " to " + path;

    if (!err.empty()) {
        std::remove(tmp.c_str());
        return err;
    }
    return {};
}

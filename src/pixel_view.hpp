#pragma once

#include <cstddef>
#include <cstdint>

// 32-bit pixel layouts shared by cairo image surfaces and SDL window
// surfaces, read as native-endian words.
//   ARGB32 : 0xAARRGGBB, colour premultiplied by alpha.
//   RGB24  : 0xXXRRGGBB, top byte unused; always opaque.
enum class PixelFormat {
    ARGB32,
    RGB24,
};

// Straight-alpha 8-bit colour.
struct Rgba8 {
    uint8_t r = 0, g = 0, b = 0, a = 0;
};

inline Rgba8 unpack_pixel(PixelFormat fmt, uint32_t p)
{
    Rgba8 c;
    c.r = static_cast<uint8_t>(p >> 16);
    c.g = static_cast<uint8_t>(p >> 8);
    c.b = static_cast<uint8_t>(p);
    if (fmt == PixelFormat::RGB24) {
        c.a = 255;
        return c;
    }

    c.a = static_cast<uint8_t>(p >> 24);
    if (c.a == 0) return Rgba8{};
    if (c.a < 255) {
        auto unpremul = [a = c.a](uint8_t v) {
            const unsigned s = (static_cast<unsigned>(v) * 255u + a / 2u) / a;
            return static_cast<uint8_t>(s > 255u ? 255u : s);
        };
        c.r = unpremul(c.r);
        c.g = unpremul(c.g);
        c.b = unpremul(c.b);
    }
    return c;
}

// Non-owning view onto 32-bit pixels. stride is in pixels, not bytes.
struct PixelView {
    uint32_t*   pixels = nullptr;
    int         width  = 0;
    int         height = 0;
    int         stride = 0;
    PixelFormat format = PixelFormat::ARGB32;

    uint32_t*       row(int y)       { return pixels + static_cast<size_t>(y) * stride; }
    const uint32_t* row(int y) const { return pixels + static_cast<size_t>(y) * stride; }
};

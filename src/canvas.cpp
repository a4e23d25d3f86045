#include "canvas.hpp"

#include <cmath>

namespace {

constexpr double TAU = 6.283185307179586;

cairo_format_t cairo_format(PixelFormat fmt)
{
    return fmt == PixelFormat::RGB24 ? CAIRO_FORMAT_RGB24 : CAIRO_FORMAT_ARGB32;
}

} // namespace

Canvas::Canvas(int width, int height)
    : surface(cairo_image_surface_create(CAIRO_FORMAT_ARGB32, width, height))
    , cr(cairo_create(surface))
    , w(width)
    , h(height)
{
}

Canvas::Canvas(const PixelView& target)
    : surface(cairo_image_surface_create_for_data(
          reinterpret_cast<unsigned char*>(target.pixels), cairo_format(target.format),
          target.width, target.height, target.stride * 4))
    , cr(cairo_create(surface))
    , w(target.width)
    , h(target.height)
{
}

Canvas::~Canvas()
{
    // cairo hands out inert error objects instead of nullptr, so both are
    // always safe to release.
    cairo_destroy(cr);
    cairo_surface_destroy(surface);
}

std::string Canvas::status() const
{
    cairo_status_t st = cairo_surface_status(surface);
    if (st == CAIRO_STATUS_SUCCESS) st = cairo_status(cr);
    if (st == CAIRO_STATUS_SUCCESS) return {};
    return std::string("cairo: ") + cairo_status_to_string(st);
}

PixelView Canvas::pixels() const
{
    PixelView v;
    if (cairo_surface_status(surface) != CAIRO_STATUS_SUCCESS) return v;

    flush();
    v.pixels = reinterpret_cast<uint32_t*>(cairo_image_surface_get_data(surface));
    v.width  = cairo_image_surface_get_width(surface);
    v.height = cairo_image_surface_get_height(surface);
    v.stride = cairo_image_surface_get_stride(surface) / 4;
    v.format = cairo_image_surface_get_format(surface) == CAIRO_FORMAT_RGB24
             ? PixelFormat::RGB24 : PixelFormat::ARGB32;
    return v;
}

// ---------------------------------------------------------------------------
// Transform state
// ---------------------------------------------------------------------------
// cairo_matrix_t maps x' = xx x + xy y + x0, y' = yx x + yy y + y0.
Transform Canvas::matrix() const
{
    cairo_matrix_t m;
    cairo_get_matrix(cr, &m);
    return Transform{m.xx, m.xy, m.x0,
                     m.yx, m.yy, m.y0};
}

void Canvas::set_matrix(const Transform& t)
{
    cairo_matrix_t m;
    cairo_matrix_init(&m, t.a, t.d, t.b, t.e, t.c, t.f);
    cairo_set_matrix(cr, &m);
}

void Canvas::transform(const Transform& t)
{
    cairo_matrix_t m;
    cairo_matrix_init(&m, t.a, t.d, t.b, t.e, t.c, t.f);
    cairo_transform(cr, &m);
}

Color Canvas::color() const
{
    Color c;
    if (cairo_pattern_get_rgba(cairo_get_source(cr), &c.r, &c.g, &c.b, &c.a) != CAIRO_STATUS_SUCCESS)
        return Color{};
    return c;
}

void Canvas::save()
{
    cairo_save(cr);
    ++depth;
}

void Canvas::restore()
{
    // An unbalanced cairo_restore() would put the context in an error state.
    if (depth == 0) return;
    cairo_restore(cr);
    --depth;
}

// ---------------------------------------------------------------------------
// Path building
// ---------------------------------------------------------------------------
void Canvas::arc(double cx, double cy, double radius, double a0, double a1)
{
    if (!(radius >= 0.0) || !std::isfinite(a0) || !std::isfinite(a1)) return;

    // Same wrap rule as cairo for a1 < a0, but done here in one step and
    // capped at a full turn so huge angles stay cheap and precise.
    double sweep = a1 - a0;
    if (sweep < 0.0) {
        sweep = std::fmod(sweep, TAU);
        if (sweep < 0.0) sweep += TAU;
    }
    if (sweep > TAU) sweep = TAU;

    const double start = std::fmod(a0, TAU);
    cairo_arc(cr, cx, cy, radius, start, start + sweep);
}

// ---------------------------------------------------------------------------
// Painting
// ---------------------------------------------------------------------------
void Canvas::clear(Color c)
{
    cairo_save(cr);
    cairo_set_operator(cr, CAIRO_OPERATOR_SOURCE);
    cairo_set_source_rgba(cr, c.r, c.g, c.b, c.a);
    cairo_paint(cr);
    cairo_restore(cr);
}

Rgba8 Canvas::pixel(int x, int y) const
{
    if (x < 0 || y < 0 || x >= w || y >= h) return Rgba8{};
    const PixelView v = pixels();
    if (!v.pixels) return Rgba8{};
    return unpack_pixel(v.format, v.row(y)[x]);
}

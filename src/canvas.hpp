#pragma once

#include "pixel_view.hpp"
#include "transform.hpp"

#include <cairo.h>

#include <string>

// Straight (non-premultiplied) colour, components in [0, 1].
struct Color {
    double r = 0.0;
    double g = 0.0;
    double b = 0.0;
    double a = 1.0;
};

// ---------------------------------------------------------------------------
// Vector canvas: a cairo context bound to one image surface.
//
// Path coordinates are in user space and go through the current transform
// matrix (CTM), so a non-uniform CTM turns circles into ellipses. fill() and
// stroke() consume the current path. Drawing errors latch inside cairo and
// are reported by status().
// ---------------------------------------------------------------------------
class Canvas {
public:
    // Off-screen ARGB32 surface owned by the canvas, fully transparent.
    Canvas(int width, int height);

    // Draws into caller-owned pixels (a window surface, for instance). The
    // memory must outlive the canvas.
    explicit Canvas(const PixelView& target);

    ~Canvas();
    Canvas(const Canvas&) = delete;
    Canvas& operator=(const Canvas&) = delete;

    // Empty string while cairo reports success.
    std::string status() const;

    int width()  const { return w; }
    int height() const { return h; }

    // Completes pending drawing so the pixel memory can be read directly.
    void flush() const { cairo_surface_flush(surface); }

    // Flushes and exposes the surface pixels.
    PixelView pixels() const;

    // --- transform state ---
    Transform matrix() const;
    void set_matrix(const Transform& m);
    void transform(const Transform& m);   // CTM = CTM . m
    void scale(double sx, double sy)     { cairo_scale(cr, sx, sy); }
    void translate(double tx, double ty) { cairo_translate(cr, tx, ty); }
    void rotate(double theta)            { cairo_rotate(cr, theta); }

    void set_color(Color c) { cairo_set_source_rgba(cr, c.r, c.g, c.b, c.a); }
    void set_color(double r, double g, double b, double a = 1.0) { cairo_set_source_rgba(cr, r, g, b, a); }
    Color color() const;

    // Line width in user-space units.
    void   set_line_width(double lw) { cairo_set_line_width(cr, lw < 0.0 ? 0.0 : lw); }
    double line_width() const { return cairo_get_line_width(cr); }

    void save();
    void restore();   // no-op when nothing was saved

    // --- path building ---
    void new_path()                 { cairo_new_path(cr); }
    void move_to(double x, double y) { cairo_move_to(cr, x, y); }
    void line_to(double x, double y) { cairo_line_to(cr, x, y); }
    // Circular arc from angle a0 to a1 (radians, increasing angle). Adds a
    // line from the current point to the arc start, if there is one. The
    // sweep is reduced to at most one turn; a negative radius adds nothing.
    void arc(double cx, double cy, double radius, double a0, double a1);
    void rectangle(double x, double y, double rw, double rh) { cairo_rectangle(cr, x, y, rw, rh); }
    void close_path()              { cairo_close_path(cr); }
    bool has_current_point() const { return cairo_has_current_point(cr) != 0; }

    // --- painting ---
    void fill()   { cairo_fill(cr); }     // non-zero winding
    void stroke() { cairo_stroke(cr); }   // butt caps, miter joins
    void paint()  { cairo_paint(cr); }
    void clear(Color c);                  // overwrite, no blending

    // Straight-alpha pixel at (x, y); transparent black outside the surface.
    Rgba8 pixel(int x, int y) const;

private:
    cairo_surface_t* surface = nullptr;
    cairo_t*         cr      = nullptr;
    int              w       = 0;
    int              h       = 0;
    int              depth   = 0;   // open save() calls
};

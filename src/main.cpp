#include "pipeline.hpp"
#include "shape.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

static const double PI = 3.141592653589793;

// ---------------------------------------------------------------------------
// Demo sketch: concentric arcs, some of them sheared into paths, scattered
// dots, and a border added by the before-save hook.
// ---------------------------------------------------------------------------
static void sketch(RenderContext& ctx, Rng& rng)
{
    Canvas& cv = ctx.canvas;
    const double w = ctx.width;
    const double h = ctx.height;
    const Vec2   centre{w * 0.5, h * 0.5};

    cv.set_color(0.96, 0.94, 0.90);
    cv.paint();

    static const std::vector<Color> inks = {
        {0.10, 0.12, 0.18, 0.9},
        {0.80, 0.25, 0.20, 0.8},
        {0.15, 0.45, 0.55, 0.8},
        {0.85, 0.65, 0.20, 0.8},
    };

    std::vector<Shape> shapes;
    const int rings = 24;
    for (int i = 0; i < rings; ++i) {
        const double r     = rng.uniform(0.05, 0.45) * std::min(w, h);
        const double start = rng.uniform(0.0, 2.0 * PI);
        const double sweep = rng.uniform(0.3, 1.5) * PI;
        Arc a = make_arc(centre, r, start, start + sweep);

        if (rng.chance(0.3)) {
            const Transform m = translation(centre)
                              * shear({rng.uniform(-0.4, 0.4), 0.0})
                              * translation(Vec2{} - centre);
            if (std::optional<Shape> s = transform(m, Shape{a})) shapes.push_back(*s);
        } else {
            shapes.push_back(a);
        }
        set_progress(ctx, 0.5 * (i + 1) / rings);
    }

    for (const Shape& s : shapes) {
        cv.set_color(rng.pick(inks));
        cv.set_line_width(rng.uniform(0.3, 2.0));
        draw(cv, s);
        cv.stroke();
    }

    const int dots = 60;
    for (int i = 0; i < dots; ++i) {
        const double theta = rng.uniform(0.0, 2.0 * PI);
        const double dist  = std::abs(rng.normal(0.0, 0.2)) * std::min(w, h);
        Dot d{centre + unit(theta) * dist, rng.uniform(0.5, 1.5)};
        cv.set_color(rng.pick(inks));
        draw(cv, d);
        cv.fill();
        set_progress(ctx, 0.5 + 0.5 * (i + 1) / dots);
    }

    on_before_save(ctx, [&ctx] {
        Canvas& c = ctx.canvas;
        c.set_color(0.1, 0.1, 0.1);
        c.set_line_width(1.0);
        c.rectangle(2.0, 2.0, ctx.width - 4.0, ctx.height - 4.0);
        c.stroke();
    });
}

int main(int argc, char* argv[])
{
    return run_sketch_cli(argc, argv, sketch);
}

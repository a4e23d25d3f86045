#pragma once

#include "canvas.hpp"
#include "transform.hpp"
#include "vec2.hpp"

// ---------------------------------------------------------------------------
// Affine<S> says how a shape maps through a Transform and what it becomes.
//
// The default covers every shape whose geometry is carried by its points:
// the result has the same type, with each point replaced by its image. A
// shape opts in by providing
//
//     template<typename F> S map_points(F f) const;
//
// Shapes that are not closed under general affine maps (arcs) specialize
// Affine and name a different Transformed type.
// ---------------------------------------------------------------------------
template<typename S>
struct Affine {
    using Transformed = S;

    static S transform(const Transform& m, const S& s)
    {
        return s.map_points([&m](const auto& p) { return set_v2(p, apply(m, get_v2(p))); });
    }
};

template<>
struct Affine<Vec2> {
    using Transformed = Vec2;
    static Vec2 transform(const Transform& m, const Vec2& p) { return apply(m, p); }
};

template<typename S>
using Transformed = typename Affine<S>::Transformed;

template<typename S>
Transformed<S> transform(const Transform& m, const S& s)
{
    return Affine<S>::transform(m, s);
}

template<typename S>
void draw(Canvas& canvas, const S& s)
{
    s.draw(canvas);
}

// ---------------------------------------------------------------------------
// Applied transforms
// ---------------------------------------------------------------------------
template<typename S>
Transformed<S> rotated(double theta, const S& s) { return transform(rotation(theta), s); }

template<typename S>
Transformed<S> translated(Vec2 v, const S& s) { return transform(translation(v), s); }

template<typename S>
Transformed<S> scaled(Vec2 v, const S& s) { return transform(scalar(v), s); }

template<typename S>
Transformed<S> sheared_x(double k, const S& s) { return transform(shear_x(k), s); }

template<typename S>
Transformed<S> sheared_y(double k, const S& s) { return transform(shear_y(k), s); }

template<typename S>
Transformed<S> sheared(Vec2 v, const S& s) { return transform(shear(v), s); }

template<typename S>
Transformed<S> reflected_origin(const S& s) { return transform(reflect_origin(), s); }

template<typename S>
Transformed<S> reflected_x(const S& s) { return transform(reflect_x(), s); }

template<typename S>
Transformed<S> reflected_y(const S& s) { return transform(reflect_y(), s); }

// Run fn with m applied on top of the canvas matrix, then put the previous
// matrix back.
template<typename Fn>
void with_affine(Canvas& canvas, const Transform& m, Fn&& fn)
{
    const Transform old = canvas.matrix();
    canvas.transform(m);
    fn();
    canvas.set_matrix(old);
}

#pragma once

#include "vec2.hpp"

// 3x3 affine matrix, row-major. The bottom row is always [0 0 1]:
//
//   | a  b  c |
//   | d  e  f |
//   | 0  0  1 |
//
// so only the six affine coefficients are stored.
struct Transform {
    double a = 1.0, b = 0.0, c = 0.0;
    double d = 0.0, e = 1.0, f = 0.0;

    static Transform identity() { return Transform{}; }

    // Row r (0-2), column k (0-2) of the full homogeneous matrix.
    double at(int r, int k) const;

    double determinant() const { return a * e - b * d; }
};

// compose(A, B) = A . B, i.e. B is applied first.
Transform compose(const Transform& A, const Transform& B);
inline Transform operator*(const Transform& A, const Transform& B) { return compose(A, B); }

// Homogeneous multiply of (p.x, p.y, 1); the third component stays 1.
inline Vec2 apply(const Transform& m, Vec2 p)
{
    return {m.a * p.x + m.b * p.y + m.c,
            m.d * p.x + m.e * p.y + m.f};
}

// Linear part only (no translation), for direction vectors.
inline Vec2 apply_linear(const Transform& m, Vec2 v)
{
    return {m.a * v.x + m.b * v.y, m.d * v.x + m.e * v.y};
}

bool approx_equal(const Transform& A, const Transform& B, double eps = 1e-9);

// ---------------------------------------------------------------------------
// Named transforms
// ---------------------------------------------------------------------------
Transform rotation(double theta);
Transform translation(Vec2 v);
Transform scalar(Vec2 v);
Transform shear_x(double k);
Transform shear_y(double k);
Transform shear(Vec2 v);
Transform reflect_origin();
Transform reflect_x();
Transform reflect_y();

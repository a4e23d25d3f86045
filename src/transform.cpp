#include "transform.hpp"

#include <cmath>

double Transform::at(int r, int k) const
{
    switch (r) {
        case 0: return k == 0 ? a : k == 1 ? b : c;
        case 1: return k == 0 ? d : k == 1 ? e : f;
        default: return k == 2 ? 1.0 : 0.0;
    }
}

Transform compose(const Transform& A, const Transform& B)
{
    Transform m;
    m.a = A.a * B.a + A.b * B.d;
    m.b = A.a * B.b + A.b * B.e;
    m.c = A.a * B.c + A.b * B.f + A.c;
    m.d = A.d * B.a + A.e * B.d;
    m.e = A.d * B.b + A.e * B.e;
    m.f = A.d * B.c + A.e * B.f + A.f;
    return m;
}

bool approx_equal(const Transform& A, const Transform& B, double eps)
{
    return std::abs(A.a - B.a) <= eps && std::abs(A.b - B.b) <= eps
        && std::abs(A.c - B.c) <= eps && std::abs(A.d - B.d) <= eps
        && std::abs(A.e - B.e) <= eps && std::abs(A.f - B.f) <= eps;
}

Transform rotation(double theta)
{
    const double cs = std::cos(theta);
    const double sn = std::sin(theta);
    Transform m;
    m.a = cs; m.b = -sn;
    m.d = sn; m.e =  cs;
    return m;
}

Transform translation(Vec2 v)
{
    Transform m;
    m.c = v.x;
    m.f = v.y;
    return m;
}

Transform scalar(Vec2 v)
{
    Transform m;
    m.a = v.x;
    m.e = v.y;
    return m;
}

Transform shear_x(double k) { return shear({k, 0.0}); }
Transform shear_y(double k) { return shear({0.0, k}); }

// x' = x + kx*y, y' = ky*x + y
Transform shear(Vec2 v)
{
    Transform m;
    m.b = v.x;
    m.d = v.y;
    return m;
}

Transform reflect_origin() { return scalar({-1.0, -1.0}); }
Transform reflect_x()      { return scalar({ 1.0, -1.0}); }
Transform reflect_y()      { return scalar({-1.0,  1.0}); }

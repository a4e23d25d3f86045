#pragma once

#include <cmath>
#include <utility>
#include <vector>

// Raw 2D point / vector in user-space units.
struct Vec2 {
    double x = 0.0;
    double y = 0.0;
};

inline Vec2 operator+(Vec2 a, Vec2 b) { return {a.x + b.x, a.y + b.y}; }
inline Vec2 operator-(Vec2 a, Vec2 b) { return {a.x - b.x, a.y - b.y}; }
inline Vec2 operator*(Vec2 a, double k) { return {a.x * k, a.y * k}; }
inline Vec2 operator*(double k, Vec2 a) { return {a.x * k, a.y * k}; }
inline bool operator==(Vec2 a, Vec2 b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(Vec2 a, Vec2 b) { return !(a == b); }

// Unit vector at angle theta (radians).
inline Vec2 unit(double theta) { return {std::cos(theta), std::sin(theta)}; }

inline double lerp(double a, double b, double t) { return a + (b - a) * t; }

// n evenly spaced values from a to b, both ends included.
inline std::vector<double> lerp_many(int n, double a, double b)
{
    std::vector<double> out;
    if (n <= 0) return out;
    if (n == 1) { out.push_back(a); return out; }
    out.reserve(static_cast<size_t>(n));
    for (int i = 0; i < n; ++i) {
        const double t = static_cast<double>(i) / static_cast<double>(n - 1);
        out.push_back(lerp(a, b, t));
    }
    // Pin the last sample so it matches b exactly.
    out.back() = b;
    return out;
}

// ---------------------------------------------------------------------------
// Point-like access. Shapes are generic over their point type P; anything
// that carries a Vec2 can be used by specializing PointTraits.
// ---------------------------------------------------------------------------
template<typename P>
struct PointTraits;

template<>
struct PointTraits<Vec2> {
    static Vec2 get(const Vec2& p) { return p; }
    static Vec2 set(Vec2, Vec2 v) { return v; }
};

template<typename P>
inline Vec2 get_v2(const P& p) { return PointTraits<P>::get(p); }

template<typename P>
inline P set_v2(P p, Vec2 v) { return PointTraits<P>::set(std::move(p), v); }

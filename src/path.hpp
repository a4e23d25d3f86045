#pragma once

#include "affine.hpp"

#include <optional>
#include <utility>
#include <vector>

// Open polyline through two or more points.
template<typename P>
struct PathOf {
    std::vector<P> points;

    template<typename F>
    PathOf map_points(F f) const
    {
        PathOf out;
        out.points.reserve(points.size());
        for (const P& p : points) out.points.push_back(f(p));
        return out;
    }

    void draw(Canvas& canvas) const
    {
        if (points.empty()) return;
        const Vec2 first = get_v2(points.front());
        canvas.move_to(first.x, first.y);
        for (size_t i = 1; i < points.size(); ++i) {
            const Vec2 p = get_v2(points[i]);
            canvas.line_to(p.x, p.y);
        }
    }
};

using Path = PathOf<Vec2>;

// A path needs at least two points.
template<typename P>
std::optional<PathOf<P>> make_path(std::vector<P> points)
{
    if (points.size() < 2) return std::nullopt;
    PathOf<P> p;
    p.points = std::move(points);
    return p;
}

#pragma once

#include "affine.hpp"
#include "path.hpp"

#include <optional>
#include <vector>

constexpr int DEFAULT_ARC_DETAIL = 100;

// Part of a circle. radius >= 0 (a negative radius makes an empty arc);
// angles in radians; detail is the number of points the arc is sampled into
// when it has to become a path.
template<typename P>
struct ArcOf {
    P      center{};
    double radius = 0.0;
    double start  = 0.0;
    double end    = 0.0;
    int    detail = DEFAULT_ARC_DETAIL;

    void draw(Canvas& canvas) const
    {
        const Vec2 c = get_v2(center);
        canvas.arc(c.x, c.y, radius, start, end);
    }
};

using Arc = ArcOf<Vec2>;

template<typename P>
ArcOf<P> make_arc(P center, double radius, double start, double end)
{
    return ArcOf<P>{center, radius, start, end, DEFAULT_ARC_DETAIL};
}

// detail points from start to end inclusive; each keeps whatever else the
// centre point carries. An arc with a negative radius has no points, just as
// Canvas::arc draws nothing for it.
template<typename P>
std::vector<P> arc_points(const ArcOf<P>& arc)
{
    std::vector<P> out;
    if (!(arc.radius >= 0.0)) return out;
    const Vec2 c = get_v2(arc.center);
    for (double theta : lerp_many(arc.detail, arc.start, arc.end))
        out.push_back(set_v2(arc.center, c + unit(theta) * arc.radius));
    return out;
}

// An arc under shear or non-uniform scale is no longer circular, so a
// transformed arc is its sampled path, or nothing when detail < 2 or the
// radius is negative.
template<typename P>
struct Affine<ArcOf<P>> {
    using Transformed = std::optional<PathOf<P>>;

    static Transformed transform(const Transform& m, const ArcOf<P>& arc)
    {
        std::optional<PathOf<P>> path = make_path(arc_points(arc));
        if (!path) return std::nullopt;
        return ::transform(m, *path);
    }
};

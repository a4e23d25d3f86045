#pragma once

#include "affine.hpp"

// A single point, drawn as a filled square of side size centred on it.
template<typename P>
struct DotOf {
    P      at{};
    double size = 1.0;

    template<typename F>
    DotOf map_points(F f) const { return DotOf{f(at), size}; }

    void draw(Canvas& canvas) const
    {
        const Vec2 c = get_v2(at);
        canvas.rectangle(c.x - 0.5 * size, c.y - 0.5 * size, size, size);
    }
};

using Dot = DotOf<Vec2>;

#include "shape.hpp"

void draw(Canvas& canvas, const Shape& shape)
{
    std::visit([&canvas](const auto& s) { s.draw(canvas); }, shape);
}

std::optional<Shape> transform(const Transform& m, const Shape& shape)
{
    if (const Arc* a = std::get_if<Arc>(&shape)) {
        std::optional<Path> path = transform(m, *a);
        if (!path) return std::nullopt;
        return Shape{std::move(*path)};
    }
    if (const Path* p = std::get_if<Path>(&shape)) return Shape{transform(m, *p)};
    return Shape{transform(m, std::get<Dot>(shape))};
}

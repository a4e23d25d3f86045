#pragma once

#include "arc.hpp"
#include "dot.hpp"
#include "path.hpp"

#include <optional>
#include <variant>

// Closed set of concrete shapes over raw points.
using Shape = std::variant<Arc, Path, Dot>;

void draw(Canvas& canvas, const Shape& shape);

// Arcs become paths (or nothing, below two samples); the other kinds keep
// their kind.
std::optional<Shape> transform(const Transform& m, const Shape& shape);

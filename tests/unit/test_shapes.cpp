/**
 * @file test_shapes.cpp
 * @brief Unit tests for the parametric shape model
 *
 * Tests cover:
 * - Sampling: lerp_many, arc_points cardinality and positions
 * - Arc transform: degrades to a path, empty below two samples
 * - Same-type transforms for paths, dots and user point wrappers
 * - The Shape variant and the applied transform helpers
 */

#include "shape.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <string>
#include <type_traits>

namespace {

constexpr double PI  = 3.141592653589793;
constexpr double EPS = 1e-9;

bool PointNear(Vec2 a, Vec2 b, double tol = EPS)
{
    return std::abs(a.x - b.x) < tol && std::abs(a.y - b.y) < tol;
}

} // namespace

// A point wrapper carrying a label, to check that transforms keep the
// non-geometric payload.
struct LabelledPoint {
    Vec2        pos;
    std::string label;
};

template<>
struct PointTraits<LabelledPoint> {
    static Vec2 get(const LabelledPoint& p) { return p.pos; }
    static LabelledPoint set(LabelledPoint p, Vec2 v) { p.pos = v; return p; }
};

// A user shape with a single reference point.
struct Marker {
    Vec2 at;
    int  id = 0;

    template<typename F>
    Marker map_points(F f) const { return Marker{f(at), id}; }
};

namespace {

// =============================================================================
// Sampling
// =============================================================================

TEST(LerpMany, IncludesBothEnds)
{
    const std::vector<double> v = lerp_many(5, 0.0, 1.0);
    ASSERT_EQ(v.size(), 5u);
    EXPECT_EQ(v.front(), 0.0);
    EXPECT_EQ(v.back(), 1.0);
    EXPECT_NEAR(v[2], 0.5, EPS);
}

TEST(LerpMany, DegenerateCounts)
{
    EXPECT_TRUE(lerp_many(0, 0.0, 1.0).empty());
    EXPECT_TRUE(lerp_many(-3, 0.0, 1.0).empty());
    ASSERT_EQ(lerp_many(1, 2.0, 9.0).size(), 1u);
    EXPECT_EQ(lerp_many(1, 2.0, 9.0)[0], 2.0);
}

TEST(ArcPoints, HalfCircleWithThreeSamples)
{
    const Arc a{{0.0, 0.0}, 10.0, 0.0, PI, 3};
    const std::vector<Vec2> pts = arc_points(a);
    ASSERT_EQ(pts.size(), 3u);
    EXPECT_TRUE(PointNear(pts[0], {10.0, 0.0}));
    EXPECT_TRUE(PointNear(pts[1], {0.0, 10.0}));
    EXPECT_TRUE(PointNear(pts[2], {-10.0, 0.0}));
}

TEST(ArcPoints, CardinalityMatchesDetail)
{
    for (int n : {2, 3, 10, 100, 257}) {
        const Arc a{{5.0, -5.0}, 3.0, 0.25, 2.5, n};
        const std::vector<Vec2> pts = arc_points(a);
        ASSERT_EQ(static_cast<int>(pts.size()), n);
        EXPECT_TRUE(PointNear(pts.front(), Vec2{5.0, -5.0} + unit(0.25) * 3.0));
        EXPECT_TRUE(PointNear(pts.back(), Vec2{5.0, -5.0} + unit(2.5) * 3.0));
    }
}

TEST(ArcPoints, IsAPureFunctionOfTheArc)
{
    const Arc a = make_arc(Vec2{1.0, 2.0}, 4.0, -1.0, 1.0);
    EXPECT_EQ(a.detail, DEFAULT_ARC_DETAIL);
    const std::vector<Vec2> first  = arc_points(a);
    const std::vector<Vec2> second = arc_points(a);
    ASSERT_EQ(first.size(), second.size());
    for (size_t i = 0; i < first.size(); ++i) EXPECT_EQ(first[i], second[i]);
}

TEST(ArcPoints, KeepsPointPayload)
{
    const ArcOf<LabelledPoint> a{{{0.0, 0.0}, "centre"}, 1.0, 0.0, PI / 2, 4};
    for (const LabelledPoint& p : arc_points(a)) {
        EXPECT_EQ(p.label, "centre");
        EXPECT_NEAR(std::hypot(p.pos.x, p.pos.y), 1.0, EPS);
    }
}

// =============================================================================
// Arc transform
// =============================================================================

TEST(ArcTransform, ResultIsAPathNotAnArc)
{
    static_assert(std::is_same<Transformed<Arc>, std::optional<Path>>::value,
                  "a transformed arc is an optional path");
    static_assert(std::is_same<Transformed<ArcOf<LabelledPoint>>,
                               std::optional<PathOf<LabelledPoint>>>::value,
                  "the path keeps the arc's point type");

    const Arc a{{0.0, 0.0}, 10.0, 0.0, PI, 3};
    const std::optional<Path> p = transform(rotation(PI / 2), a);
    ASSERT_TRUE(p.has_value());
    ASSERT_EQ(p->points.size(), 3u);
    EXPECT_TRUE(PointNear(p->points[0], {0.0, 10.0}));
    EXPECT_TRUE(PointNear(p->points[1], {-10.0, 0.0}));
    EXPECT_TRUE(PointNear(p->points[2], {0.0, -10.0}));
}

TEST(ArcTransform, NonUniformScaleGivesEllipticalSamples)
{
    const Arc a{{0.0, 0.0}, 1.0, 0.0, PI / 2, 2};
    const std::optional<Path> p = scaled(Vec2{3.0, 0.5}, a);
    ASSERT_TRUE(p.has_value());
    EXPECT_TRUE(PointNear(p->points[0], {3.0, 0.0}));
    EXPECT_TRUE(PointNear(p->points[1], {0.0, 0.5}));
}

TEST(ArcTransform, FewerThanTwoSamplesIsEmpty)
{
    EXPECT_FALSE(transform(Transform::identity(), Arc{{0.0, 0.0}, 5.0, 0.0, 1.0, 1}).has_value());
    EXPECT_FALSE(transform(rotation(1.0), Arc{{0.0, 0.0}, 5.0, 0.0, 1.0, 0}).has_value());
    EXPECT_FALSE(translated(Vec2{1.0, 1.0}, Arc{{0.0, 0.0}, 5.0, 0.0, 1.0, -4}).has_value());
}

TEST(ArcTransform, NegativeRadiusIsEmpty)
{
    const Arc a{{4.0, 4.0}, -2.0, 0.0, PI, 10};
    EXPECT_TRUE(arc_points(a).empty());
    EXPECT_FALSE(transform(Transform::identity(), a).has_value());
    EXPECT_FALSE(transform(Transform::identity(), Shape{a}).has_value());
}

TEST(ArcTransform, LabelsSurvive)
{
    const ArcOf<LabelledPoint> a{{{1.0, 1.0}, "arc"}, 2.0, 0.0, PI, 5};
    const std::optional<PathOf<LabelledPoint>> p = translated(Vec2{10.0, 0.0}, a);
    ASSERT_TRUE(p.has_value());
    ASSERT_EQ(p->points.size(), 5u);
    EXPECT_EQ(p->points[0].label, "arc");
    EXPECT_TRUE(PointNear(p->points[0].pos, {13.0, 1.0}));
}

// =============================================================================
// Same-type transforms
// =============================================================================

TEST(PathShape, NeedsTwoPoints)
{
    EXPECT_FALSE(make_path(std::vector<Vec2>{}).has_value());
    EXPECT_FALSE(make_path(std::vector<Vec2>{{1.0, 1.0}}).has_value());
    EXPECT_TRUE(make_path(std::vector<Vec2>{{1.0, 1.0}, {2.0, 2.0}}).has_value());
}

TEST(PathShape, TransformMapsEveryPoint)
{
    static_assert(std::is_same<Transformed<Path>, Path>::value, "paths stay paths");
    const Path p = *make_path(std::vector<Vec2>{{1.0, 0.0}, {2.0, 0.0}, {3.0, 1.0}});
    const Path q = reflected_x(p);
    ASSERT_EQ(q.points.size(), 3u);
    EXPECT_TRUE(PointNear(q.points[2], {3.0, -1.0}));
}

TEST(DotShape, KeepsTypeAndSize)
{
    static_assert(std::is_same<Transformed<Dot>, Dot>::value, "dots stay dots");
    const Dot d{{2.0, 3.0}, 1.5};
    const Dot e = sheared_x(1.0, d);
    EXPECT_TRUE(PointNear(e.at, {5.0, 3.0}));
    EXPECT_EQ(e.size, 1.5);
}

TEST(UserShape, SingleReferencePointShapesKeepTheirType)
{
    static_assert(std::is_same<Transformed<Marker>, Marker>::value, "markers stay markers");
    const Marker m{{1.0, 2.0}, 7};
    const Marker r = rotated(PI, m);
    EXPECT_TRUE(PointNear(r.at, {-1.0, -2.0}));
    EXPECT_EQ(r.id, 7);
}

TEST(AppliedTransforms, MatchNamedMatrices)
{
    const Vec2 p{1.5, -2.0};
    EXPECT_TRUE(PointNear(rotated(0.3, p), apply(rotation(0.3), p)));
    EXPECT_TRUE(PointNear(translated(Vec2{1.0, 1.0}, p), apply(translation({1.0, 1.0}), p)));
    EXPECT_TRUE(PointNear(sheared_y(0.5, p), apply(shear_y(0.5), p)));
    EXPECT_TRUE(PointNear(sheared(Vec2{0.1, 0.2}, p), apply(shear({0.1, 0.2}), p)));
    EXPECT_TRUE(PointNear(reflected_origin(p), {-1.5, 2.0}));
    EXPECT_TRUE(PointNear(reflected_y(p), {-1.5, -2.0}));
}

// =============================================================================
// Shape variant
// =============================================================================

TEST(ShapeVariant, ArcBecomesPath)
{
    const Shape s = Arc{{0.0, 0.0}, 1.0, 0.0, PI, 8};
    const std::optional<Shape> t = transform(scalar({2.0, 1.0}), s);
    ASSERT_TRUE(t.has_value());
    ASSERT_TRUE(std::holds_alternative<Path>(*t));
    EXPECT_EQ(std::get<Path>(*t).points.size(), 8u);
}

TEST(ShapeVariant, DegenerateArcIsEmpty)
{
    const Shape s = Arc{{0.0, 0.0}, 1.0, 0.0, PI, 1};
    EXPECT_FALSE(transform(rotation(0.5), s).has_value());
}

TEST(ShapeVariant, OtherKindsKeepTheirKind)
{
    const Shape dot = Dot{{1.0, 1.0}, 2.0};
    const std::optional<Shape> t = transform(translation({1.0, 0.0}), dot);
    ASSERT_TRUE(t.has_value());
    ASSERT_TRUE(std::holds_alternative<Dot>(*t));
    EXPECT_TRUE(PointNear(std::get<Dot>(*t).at, {2.0, 1.0}));

    const Shape path = *make_path(std::vector<Vec2>{{0.0, 0.0}, {1.0, 1.0}});
    const std::optional<Shape> u = transform(scalar({3.0, 3.0}), path);
    ASSERT_TRUE(u.has_value());
    ASSERT_TRUE(std::holds_alternative<Path>(*u));
    EXPECT_TRUE(PointNear(std::get<Path>(*u).points[1], {3.0, 3.0}));
}

} // namespace

#include <svg_geometry/affine.hpp>
#include <svg_geometry/measure.hpp>
#include <svg_geometry/shapes.hpp>
#include <gtest/gtest.h>
#include <cmath>
#include <limits>

using namespace svg_geometry;

namespace {

constexpr double pi = 3.14159265358979323846;

} // namespace

TEST(Geometry, CircleDefaults) {
    CircleGeometry g;
    EXPECT_EQ(bounding_box(g), (BoundingBox{ 0, 0, 100, 100 }));
    EXPECT_EQ(central_point(g), (Point{ 50, 50 }));
    EXPECT_EQ(to_attributes(g).to_string(), "cx=\"50\" cy=\"50\" r=\"50\"");
}

TEST(Geometry, RectangleBoxAndCenter) {
    RectangleGeometry g;
    g.x = 10;
    g.y = 20;
    g.width = 100;
    g.height = 50;
    EXPECT_EQ(bounding_box(g), (BoundingBox{ 10, 20, 110, 70 }));
    EXPECT_EQ(central_point(g), (Point{ 60, 45 }));
    EXPECT_EQ(to_attributes(g).to_string(), "x=\"10\" y=\"20\" width=\"100\" height=\"50\"");

    g.rx = 15;
    EXPECT_EQ(to_attributes(g).to_string(), "x=\"10\" y=\"20\" width=\"100\" height=\"50\" rx=\"15\"");
}

TEST(Geometry, PolylineBoxAndMeanCenter) {
    PolylineGeometry g;
    g.points = { {0, 0}, {10, 0}, {10, 30} };
    EXPECT_EQ(bounding_box(g), (BoundingBox{ 0, 0, 10, 30 }));
    // Mean of the vertices, not the triangle centroid weighted by area.
    const Point c = central_point(g);
    EXPECT_DOUBLE_EQ(c.x, 20.0 / 3.0);
    EXPECT_DOUBLE_EQ(c.y, 10.0);
    EXPECT_EQ(format_points(g.points), "0,0 10,0 10,30");
}

TEST(Geometry, EmptyPolylineRejected) {
    PolylineGeometry g;
    EXPECT_THROW(validate(g), GeometryError);
    EXPECT_THROW(bounding_box(g), GeometryError);
    EXPECT_THROW(central_point(g), GeometryError);
}

TEST(Geometry, TextExtentIsIndeterminate) {
    TextGeometry g;
    g.x = 5;
    g.y = 7;
    EXPECT_FALSE(bounding_box(g).has_value());
    ASSERT_TRUE(central_point(g).has_value());
    EXPECT_EQ(*central_point(g), (Point{ 5, 7 }));

    g.text_anchor = TextAnchor::Start;
    EXPECT_FALSE(central_point(g).has_value());
    g.text_anchor = TextAnchor::Middle;
    g.dominant_baseline = DominantBaseline::Hanging;
    EXPECT_FALSE(central_point(g).has_value());
}

TEST(Geometry, TextEnumNames) {
    EXPECT_STREQ(to_string(TextAnchor::End), "end");
    EXPECT_STREQ(to_string(DominantBaseline::Central), "central");
    EXPECT_EQ(text_anchor_from_string("start"), TextAnchor::Start);
    EXPECT_EQ(dominant_baseline_from_string("hanging"), DominantBaseline::Hanging);
    EXPECT_FALSE(text_anchor_from_string("left").has_value());
    EXPECT_FALSE(dominant_baseline_from_string("Central").has_value());
}

TEST(Geometry, NestedViewBoxMatchesSize) {
    NestedDocumentGeometry g;
    g.x = 10;
    g.width = 120;
    g.height = 60;
    EXPECT_EQ(to_attributes(g).to_string(),
        "x=\"10\" y=\"0\" width=\"120\" height=\"60\" viewBox=\"0 0 120 60\"");
}

TEST(Geometry, ValidationRejectsBadValues) {
    CircleGeometry circle;
    circle.r = -1;
    EXPECT_THROW(validate(circle), GeometryError);
    circle.r = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(validate(circle), GeometryError);

    RectangleGeometry rect;
    rect.width = std::numeric_limits<double>::infinity();
    EXPECT_THROW(validate(rect), GeometryError);
    rect.width = 10;
    rect.ry = -2;
    EXPECT_THROW(validate(rect), GeometryError);

    ImageGeometry image;
    EXPECT_THROW(validate(image), GeometryError);
    image.href = "a.png";
    EXPECT_NO_THROW(validate(image));

    TextGeometry text;
    text.font_size = -3;
    EXPECT_THROW(validate(text), GeometryError);
}

TEST(Measure, CircleAreaAndCircumference) {
    CircleGeometry g;
    g.r = 2;
    EXPECT_DOUBLE_EQ(area(g), 4 * pi);
    EXPECT_DOUBLE_EQ(circumference(g), 4 * pi);
}

TEST(Measure, PolylineLengths) {
    PolylineGeometry g;
    g.points = { {0, 0}, {3, 4}, {3, 10} };
    EXPECT_DOUBLE_EQ(total_length(g), 11.0);
    const auto segments = segment_lengths(g);
    ASSERT_EQ(segments.size(), 2u);
    EXPECT_DOUBLE_EQ(segments[0], 5.0);
    EXPECT_DOUBLE_EQ(segments[1], 6.0);

    g.points = { {1, 1} };
    EXPECT_DOUBLE_EQ(total_length(g), 0.0);
    EXPECT_TRUE(segment_lengths(g).empty());
}

TEST(Affine, ComposesRightToLeft) {
    const Affine m = Affine::translation(10, 0) * Affine::scaling(2, 2);
    const Point p = m.apply(Point{ 1, 0 });
    EXPECT_DOUBLE_EQ(p.x, 12);
    EXPECT_DOUBLE_EQ(p.y, 0);
    EXPECT_TRUE(Affine::identity().is_identity());
    EXPECT_FALSE(m.is_identity());
}

TEST(Affine, RotationAboutPivot) {
    const Point p = Affine::rotation(90).apply(Point{ 1, 0 });
    EXPECT_NEAR(p.x, 0, 1e-12);
    EXPECT_NEAR(p.y, 1, 1e-12);

    const Point q = Affine::rotation(180, Point{ 5, 5 }).apply(Point{ 10, 5 });
    EXPECT_NEAR(q.x, 0, 1e-12);
    EXPECT_NEAR(q.y, 5, 1e-12);
}

TEST(Affine, TransformBoxEnclosesCorners) {
    const BoundingBox box{ 0, 0, 10, 10 };
    const BoundingBox rotated = transform_box(Affine::rotation(45), box);
    EXPECT_NEAR(rotated.width(), 10 * std::sqrt(2.0), 1e-9);
    EXPECT_NEAR(rotated.height(), 10 * std::sqrt(2.0), 1e-9);

    const BoundingBox moved = transform_box(Affine::translation(5, -5), box);
    EXPECT_EQ(moved, (BoundingBox{ 5, -5, 15, 5 }));
}

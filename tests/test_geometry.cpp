// Unit tests for the pure geometry helpers behind seat mapping.

#include "TestVenues.h"
#include "core/Geometry.h"
#include "core/VenueData.h"

#include <gtest/gtest.h>

#include <cmath>

namespace {

const Polygon kUnitSquare = {{0.2, 0.2}, {0.6, 0.2}, {0.6, 0.6}, {0.2, 0.6}};

// L-shaped: the notch around (0.5, 0.5) is outside.
const Polygon kLShape = {{0.1, 0.1}, {0.7, 0.1}, {0.7, 0.4},
                         {0.4, 0.4}, {0.4, 0.7}, {0.1, 0.7}};

} // namespace

// ---------------------------------------------------------------------------
// Point in polygon
// ---------------------------------------------------------------------------

TEST(Geometry, PointInsideAndOutsideSquare) {
  EXPECT_TRUE(Geometry::pointInPolygon({0.4, 0.4}, kUnitSquare));
  EXPECT_FALSE(Geometry::pointInPolygon({0.7, 0.4}, kUnitSquare));
  EXPECT_FALSE(Geometry::pointInPolygon({0.1, 0.1}, kUnitSquare));
}

TEST(Geometry, BoundaryPointsCountAsInside) {
  EXPECT_TRUE(Geometry::pointInPolygon({0.2, 0.4}, kUnitSquare)); // left edge
  EXPECT_TRUE(Geometry::pointInPolygon({0.6, 0.6}, kUnitSquare)); // vertex
  EXPECT_TRUE(Geometry::pointInPolygon({0.4, 0.2}, kUnitSquare)); // top edge
}

TEST(Geometry, ConcaveNotchIsOutside) {
  EXPECT_TRUE(Geometry::pointInPolygon({0.2, 0.6}, kLShape));
  EXPECT_TRUE(Geometry::pointInPolygon({0.6, 0.2}, kLShape));
  EXPECT_FALSE(Geometry::pointInPolygon({0.55, 0.55}, kLShape));
}

TEST(Geometry, DegeneratePolygonContainsNothing) {
  EXPECT_FALSE(Geometry::pointInPolygon({0.5, 0.5}, {{0.5, 0.5}, {0.6, 0.6}}));
}

// ---------------------------------------------------------------------------
// Area, centroid, simplicity
// ---------------------------------------------------------------------------

TEST(Geometry, AreaAndCentroidOfRectangle) {
  EXPECT_NEAR(Geometry::polygonArea(kUnitSquare), 0.16, 1e-12);
  Vec2 c = Geometry::polygonCentroid(kUnitSquare);
  EXPECT_NEAR(c.x, 0.4, 1e-12);
  EXPECT_NEAR(c.y, 0.4, 1e-12);
}

TEST(Geometry, CentroidIsWindingIndependent) {
  Polygon reversed(kLShape.rbegin(), kLShape.rend());
  Vec2 a = Geometry::polygonCentroid(kLShape);
  Vec2 b = Geometry::polygonCentroid(reversed);
  EXPECT_NEAR(a.x, b.x, 1e-12);
  EXPECT_NEAR(a.y, b.y, 1e-12);
}

TEST(Geometry, ZeroAreaCentroidFallsBackToVertexMean) {
  Polygon line = {{0.0, 0.0}, {0.5, 0.5}, {1.0, 1.0}};
  Vec2 c = Geometry::polygonCentroid(line);
  EXPECT_NEAR(c.x, 0.5, 1e-12);
  EXPECT_NEAR(c.y, 0.5, 1e-12);
}

TEST(Geometry, SimplePolygonDetection) {
  EXPECT_TRUE(Geometry::isSimplePolygon(kUnitSquare));
  EXPECT_TRUE(Geometry::isSimplePolygon(kLShape));

  Polygon bowtie = {{0.0, 0.0}, {1.0, 1.0}, {1.0, 0.0}, {0.0, 1.0}};
  EXPECT_FALSE(Geometry::isSimplePolygon(bowtie));

  Polygon repeated = {{0.0, 0.0}, {0.5, 0.0}, {0.5, 0.0}, {0.5, 0.5}};
  EXPECT_FALSE(Geometry::isSimplePolygon(repeated));

  EXPECT_FALSE(Geometry::isSimplePolygon({{0.0, 0.0}, {1.0, 0.0}}));
}

// ---------------------------------------------------------------------------
// Section ordering and nearest section
// ---------------------------------------------------------------------------

TEST(Geometry, SectionIdOrdering) {
  EXPECT_TRUE(Geometry::sectionIdLess("99", "101"));
  EXPECT_FALSE(Geometry::sectionIdLess("101", "99"));
  EXPECT_TRUE(Geometry::sectionIdLess("A", "B"));
  EXPECT_TRUE(Geometry::sectionIdLess("101", "101A"));
  EXPECT_FALSE(Geometry::sectionIdLess("7", "7"));
}

TEST(Geometry, NearestSectionByCentroid) {
  std::vector<Section> sections = {
      TestVenues::makeRect("A", 100, 0.0, 0.0, 0.0, 0.2, 0.2),  // (0.1, 0.1)
      TestVenues::makeRect("B", 100, 0.0, 0.7, 0.7, 0.9, 0.9),  // (0.8, 0.8)
  };
  auto nearest = Geometry::nearestSection({0.6, 0.6}, sections);
  ASSERT_TRUE(nearest.has_value());
  EXPECT_EQ(nearest->sectionId, "B");
  EXPECT_NEAR(nearest->distance, std::hypot(0.2, 0.2), 1e-12);
}

TEST(Geometry, NearestSectionTieGoesToLowestId) {
  // Centroids at (0.25, 0.5) and (0.75, 0.5); the click is equidistant.
  std::vector<Section> sections = {
      TestVenues::makeRect("10", 100, 0.0, 0.625, 0.375, 0.875, 0.625),
      TestVenues::makeRect("9", 100, 0.0, 0.125, 0.375, 0.375, 0.625),
  };
  auto nearest = Geometry::nearestSection({0.5, 0.5}, sections);
  ASSERT_TRUE(nearest.has_value());
  EXPECT_EQ(nearest->sectionId, "9");
}

TEST(Geometry, NearestSectionOfNothing) {
  EXPECT_FALSE(Geometry::nearestSection({0.5, 0.5}, {}).has_value());
}

// ---------------------------------------------------------------------------
// Depth and lateral interpolation
// ---------------------------------------------------------------------------

TEST(Geometry, DepthFollowsLongestDimensionTowardField) {
  // Wide section; the field sits to its right, so the right edge is row 1.
  Polygon wide = {{0.2, 0.4}, {0.8, 0.4}, {0.8, 0.5}, {0.2, 0.5}};
  DepthAxis axis = Geometry::principalAxis(wide, {0.9, 0.45});

  EXPECT_NEAR(Geometry::interpolateDepth({0.8, 0.45}, axis), 0.0, 1e-12);
  EXPECT_NEAR(Geometry::interpolateDepth({0.2, 0.45}, axis), 1.0, 1e-12);
  EXPECT_NEAR(Geometry::interpolateDepth({0.35, 0.45}, axis), 0.75, 1e-12);
}

TEST(Geometry, DepthUsesVerticalAxisForTallSections) {
  Polygon tall = {{0.4, 0.1}, {0.5, 0.1}, {0.5, 0.5}, {0.4, 0.5}};
  // Field above the section: top edge is the front
  EXPECT_NEAR(Geometry::interpolateDepth({0.45, 0.1}, tall, {0.45, 0.0}), 0.0, 1e-12);
  EXPECT_NEAR(Geometry::interpolateDepth({0.45, 0.4}, tall, {0.45, 0.0}), 0.75, 1e-12);
  // Field below: flipped
  EXPECT_NEAR(Geometry::interpolateDepth({0.45, 0.4}, tall, {0.45, 0.9}), 0.25, 1e-12);
}

TEST(Geometry, ExplicitAxisOverridesBoundingBox) {
  DepthAxis axis = Geometry::explicitAxis({0.5, 0.2}, {0.5, 0.6});
  EXPECT_NEAR(Geometry::interpolateDepth({0.5, 0.4}, axis), 0.5, 1e-12);
  EXPECT_NEAR(Geometry::interpolateDepth({0.3, 0.3}, axis), 0.25, 1e-12);
  EXPECT_DOUBLE_EQ(Geometry::interpolateDepth({0.5, 0.9}, axis), 1.0);
  EXPECT_DOUBLE_EQ(Geometry::interpolateDepth({0.5, 0.0}, axis), 0.0);
}

TEST(Geometry, DegenerateAxisGivesMiddleRow) {
  DepthAxis axis = Geometry::explicitAxis({0.5, 0.5}, {0.5, 0.5});
  EXPECT_DOUBLE_EQ(Geometry::interpolateDepth({0.1, 0.9}, axis), 0.5);
}

TEST(Geometry, LateralIsCenteredAtCentroid) {
  // Field to the right of the square: lateral runs along +y
  const Vec2 field{0.9, 0.4};
  DepthAxis axis = Geometry::principalAxis(kUnitSquare, field);
  Vec2 c = Geometry::polygonCentroid(kUnitSquare);
  EXPECT_NEAR(Geometry::interpolateLateral(c, kUnitSquare, field, axis), 0.5,
              1e-12);

  double top = Geometry::interpolateLateral({0.4, 0.2}, kUnitSquare, field, axis);
  double bottom =
      Geometry::interpolateLateral({0.4, 0.6}, kUnitSquare, field, axis);
  EXPECT_NEAR(top, 0.0, 1e-12);
  EXPECT_NEAR(bottom, 1.0, 1e-12);
}

TEST(Geometry, LateralFollowsIncreasingAngleAroundField) {
  const Vec2 field{0.5, 0.5};
  Polygon below = {{0.4, 0.8}, {0.6, 0.8}, {0.6, 0.9}, {0.4, 0.9}};
  Polygon right = {{0.8, 0.4}, {0.9, 0.4}, {0.9, 0.6}, {0.8, 0.6}};
  Polygon above = {{0.4, 0.1}, {0.6, 0.1}, {0.6, 0.2}, {0.4, 0.2}};

  // Below the field +x, right of it -y, above it -x
  DepthAxis a = Geometry::principalAxis(below, field);
  EXPECT_NEAR(Geometry::interpolateLateral({0.4, 0.85}, below, field, a), 0.0, 1e-12);
  EXPECT_NEAR(Geometry::interpolateLateral({0.6, 0.85}, below, field, a), 1.0, 1e-12);

  DepthAxis b = Geometry::principalAxis(right, field);
  EXPECT_NEAR(Geometry::interpolateLateral({0.85, 0.6}, right, field, b), 0.0, 1e-12);
  EXPECT_NEAR(Geometry::interpolateLateral({0.85, 0.4}, right, field, b), 1.0, 1e-12);

  DepthAxis c = Geometry::principalAxis(above, field);
  EXPECT_NEAR(Geometry::interpolateLateral({0.6, 0.15}, above, field, c), 0.0, 1e-12);
  EXPECT_NEAR(Geometry::interpolateLateral({0.4, 0.15}, above, field, c), 1.0, 1e-12);
}

// ---------------------------------------------------------------------------
// Cylindrical placement
// ---------------------------------------------------------------------------

TEST(Geometry, CylindricalToCartesian) {
  Vec3 behind = Geometry::cylindricalToCartesian({0, 0, 0}, 30.0, 0.0, 5.0);
  EXPECT_DOUBLE_EQ(behind.x, 0.0);
  EXPECT_DOUBLE_EQ(behind.y, -30.0);
  EXPECT_DOUBLE_EQ(behind.z, 5.0);

  Vec3 side = Geometry::cylindricalToCartesian({1, 2, 3}, 10.0, 90.0, 4.0);
  EXPECT_NEAR(side.x, 11.0, 1e-9);
  EXPECT_NEAR(side.y, 2.0, 1e-9);
  EXPECT_DOUBLE_EQ(side.z, 7.0);
}

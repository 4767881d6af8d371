#pragma once

#include <optional>
#include <string>
#include <vector>

struct Section;

struct Vec2 {
  double x = 0.0;
  double y = 0.0;
};

struct Vec3 {
  double x = 0.0;
  double y = 0.0;
  double z = 0.0;
};

// Seatmap polygons live in normalized image space: x right, y down, [0,1].
using Polygon = std::vector<Vec2>;

// Axis used to measure how far "back" a point sits inside a section.
// t = dot(p - origin, dir) / length, clamped to [0,1].
struct DepthAxis {
  Vec2 origin;
  Vec2 dir{1.0, 0.0}; // unit vector pointing from the front row to the back
  double length = 0.0;
};

struct NearestSection {
  std::string sectionId;
  double distance = 0.0;
};

// Pure, allocation-light helpers shared by the mapper and venue validation.
// Nothing in here keeps state.
namespace Geometry {

static constexpr double EPSILON = 1e-9;

double lerp(double a, double b, double t);
double degToRad(double deg);
double distance(const Vec2 &a, const Vec2 &b);

// Closed semantics: points on an edge or vertex count as inside.
bool pointInPolygon(const Vec2 &p, const Polygon &poly);

// Distance from p to the segment [a, b].
double distanceToSegment(const Vec2 &p, const Vec2 &a, const Vec2 &b);

double signedArea(const Polygon &poly);
double polygonArea(const Polygon &poly);

// Area-weighted centroid; falls back to the vertex mean for zero-area input.
Vec2 polygonCentroid(const Polygon &poly);

// True when no two non-adjacent edges touch and no edge has zero length.
bool isSimplePolygon(const Polygon &poly);

// Section whose centroid is closest to p. Equal distances resolve to the
// lowest section id. Empty when sections is empty.
std::optional<NearestSection> nearestSection(const Vec2 &p,
                                             const std::vector<Section> &sections);

// Longest bounding-box dimension of poly, oriented so that the end nearer
// fieldCenter (the field's position on the seatmap) is the front row.
DepthAxis principalAxis(const Polygon &poly, const Vec2 &fieldCenter);

// Explicit front/back pair supplied by venue data.
DepthAxis explicitAxis(const Vec2 &front, const Vec2 &back);

// Front row = 0, back row = 1. Degenerate axes give 0.5.
double interpolateDepth(const Vec2 &p, const DepthAxis &axis);
double interpolateDepth(const Vec2 &p, const Polygon &poly,
                        const Vec2 &fieldCenter = {0.5, 0.5});

// Position across the section, measured along the tangent of the circle
// around fieldCenter through the section centroid and scaled by the polygon's
// extent in that direction. 0 is the low-angle side, 1 the high-angle side,
// so lateral grows with seat angle in every section. A section centered on
// the field falls back to the perpendicular of axis.
double interpolateLateral(const Vec2 &p, const Polygon &poly,
                          const Vec2 &fieldCenter, const DepthAxis &axis);

// Angle 0 places the point on -y of center; positive angles swing toward +x.
Vec3 cylindricalToCartesian(const Vec3 &center, double radius, double angleDeg,
                            double height);

// Purely numeric ids compare as numbers ("99" < "101"); anything else
// compares lexicographically.
bool sectionIdLess(const std::string &a, const std::string &b);

} // namespace Geometry

#include "Geometry.h"
#include "VenueData.h"

#include <algorithm>
#include <cmath>
#include <limits>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace Geometry {

namespace {

double cross(const Vec2 &o, const Vec2 &a, const Vec2 &b) {
  return (a.x - o.x) * (b.y - o.y) - (a.y - o.y) * (b.x - o.x);
}

double dot(const Vec2 &a, const Vec2 &b) { return a.x * b.x + a.y * b.y; }

int orientation(const Vec2 &o, const Vec2 &a, const Vec2 &b) {
  double c = cross(o, a, b);
  if (std::fabs(c) <= EPSILON)
    return 0;
  return c > 0 ? 1 : -1;
}

// b is collinear with [a, c]; is it within the segment's bounds?
bool onSegment(const Vec2 &a, const Vec2 &b, const Vec2 &c) {
  return b.x <= std::max(a.x, c.x) + EPSILON &&
         b.x >= std::min(a.x, c.x) - EPSILON &&
         b.y <= std::max(a.y, c.y) + EPSILON &&
         b.y >= std::min(a.y, c.y) - EPSILON;
}

bool segmentsIntersect(const Vec2 &p1, const Vec2 &p2, const Vec2 &q1,
                       const Vec2 &q2) {
  int o1 = orientation(p1, p2, q1);
  int o2 = orientation(p1, p2, q2);
  int o3 = orientation(q1, q2, p1);
  int o4 = orientation(q1, q2, p2);

  if (o1 != o2 && o3 != o4)
    return true;
  if (o1 == 0 && onSegment(p1, q1, p2))
    return true;
  if (o2 == 0 && onSegment(p1, q2, p2))
    return true;
  if (o3 == 0 && onSegment(q1, p1, q2))
    return true;
  if (o4 == 0 && onSegment(q1, p2, q2))
    return true;
  return false;
}

bool isAllDigits(const std::string &s) {
  return !s.empty() && s.size() <= 18 &&
         std::all_of(s.begin(), s.end(),
                     [](unsigned char c) { return c >= '0' && c <= '9'; });
}

void projectExtent(const Polygon &poly, const Vec2 &dir, double &lo,
                   double &hi) {
  lo = std::numeric_limits<double>::max();
  hi = std::numeric_limits<double>::lowest();
  for (const auto &v : poly) {
    double d = dot(v, dir);
    lo = std::min(lo, d);
    hi = std::max(hi, d);
  }
}

} // namespace

double lerp(double a, double b, double t) { return a + (b - a) * t; }

double degToRad(double deg) { return deg * M_PI / 180.0; }

double distance(const Vec2 &a, const Vec2 &b) {
  return std::hypot(a.x - b.x, a.y - b.y);
}

double distanceToSegment(const Vec2 &p, const Vec2 &a, const Vec2 &b) {
  const double dx = b.x - a.x;
  const double dy = b.y - a.y;
  const double lenSq = dx * dx + dy * dy;
  if (lenSq == 0.0)
    return distance(p, a);

  double t = ((p.x - a.x) * dx + (p.y - a.y) * dy) / lenSq;
  t = std::clamp(t, 0.0, 1.0);
  return distance(p, {a.x + t * dx, a.y + t * dy});
}

bool pointInPolygon(const Vec2 &p, const Polygon &poly) {
  const std::size_t n = poly.size();
  if (n < 3)
    return false;

  // Boundary first, so clicks on a shared edge never fall through both
  // neighbours.
  for (std::size_t i = 0, j = n - 1; i < n; j = i++) {
    if (distanceToSegment(p, poly[j], poly[i]) <= EPSILON)
      return true;
  }

  bool inside = false;
  for (std::size_t i = 0, j = n - 1; i < n; j = i++) {
    const Vec2 &a = poly[i];
    const Vec2 &b = poly[j];
    if (((a.y > p.y) != (b.y > p.y)) &&
        (p.x < (b.x - a.x) * (p.y - a.y) / (b.y - a.y) + a.x)) {
      inside = !inside;
    }
  }
  return inside;
}

double signedArea(const Polygon &poly) {
  const std::size_t n = poly.size();
  if (n < 3)
    return 0.0;
  double acc = 0.0;
  for (std::size_t i = 0, j = n - 1; i < n; j = i++) {
    acc += poly[j].x * poly[i].y - poly[i].x * poly[j].y;
  }
  return acc * 0.5;
}

double polygonArea(const Polygon &poly) { return std::fabs(signedArea(poly)); }

Vec2 polygonCentroid(const Polygon &poly) {
  if (poly.empty())
    return {};

  const double a = signedArea(poly);
  if (std::fabs(a) <= EPSILON * EPSILON) {
    Vec2 mean;
    for (const auto &v : poly) {
      mean.x += v.x;
      mean.y += v.y;
    }
    mean.x /= static_cast<double>(poly.size());
    mean.y /= static_cast<double>(poly.size());
    return mean;
  }

  double cx = 0.0;
  double cy = 0.0;
  const std::size_t n = poly.size();
  for (std::size_t i = 0, j = n - 1; i < n; j = i++) {
    const double f = poly[j].x * poly[i].y - poly[i].x * poly[j].y;
    cx += (poly[j].x + poly[i].x) * f;
    cy += (poly[j].y + poly[i].y) * f;
  }
  return {cx / (6.0 * a), cy / (6.0 * a)};
}

bool isSimplePolygon(const Polygon &poly) {
  const std::size_t n = poly.size();
  if (n < 3)
    return false;

  for (std::size_t i = 0; i < n; ++i) {
    if (distance(poly[i], poly[(i + 1) % n]) <= EPSILON)
      return false;
  }

  for (std::size_t i = 0; i < n; ++i) {
    const Vec2 &a1 = poly[i];
    const Vec2 &a2 = poly[(i + 1) % n];
    for (std::size_t j = i + 1; j < n; ++j) {
      // Skip edges sharing a vertex with edge i
      if (j == i + 1 || (i == 0 && j == n - 1))
        continue;
      if (segmentsIntersect(a1, a2, poly[j], poly[(j + 1) % n]))
        return false;
    }
  }
  return true;
}

std::optional<NearestSection> nearestSection(const Vec2 &p,
                                             const std::vector<Section> &sections) {
  std::optional<NearestSection> best;
  for (const auto &s : sections) {
    const double d = distance(p, polygonCentroid(s.polygon));
    if (!best || d < best->distance - EPSILON ||
        (std::fabs(d - best->distance) <= EPSILON &&
         sectionIdLess(s.id, best->sectionId))) {
      best = NearestSection{s.id, d};
    }
  }
  return best;
}

DepthAxis principalAxis(const Polygon &poly, const Vec2 &fieldCenter) {
  DepthAxis axis;
  if (poly.empty())
    return axis;

  double minX = poly[0].x, maxX = poly[0].x;
  double minY = poly[0].y, maxY = poly[0].y;
  for (const auto &v : poly) {
    minX = std::min(minX, v.x);
    maxX = std::max(maxX, v.x);
    minY = std::min(minY, v.y);
    maxY = std::max(maxY, v.y);
  }

  const double width = maxX - minX;
  const double height = maxY - minY;
  if (width >= height) {
    const bool frontIsMin =
        std::fabs(fieldCenter.x - minX) <= std::fabs(fieldCenter.x - maxX);
    axis.origin = frontIsMin ? Vec2{minX, minY} : Vec2{maxX, minY};
    axis.dir = frontIsMin ? Vec2{1.0, 0.0} : Vec2{-1.0, 0.0};
    axis.length = width;
  } else {
    const bool frontIsMin =
        std::fabs(fieldCenter.y - minY) <= std::fabs(fieldCenter.y - maxY);
    axis.origin = frontIsMin ? Vec2{minX, minY} : Vec2{minX, maxY};
    axis.dir = frontIsMin ? Vec2{0.0, 1.0} : Vec2{0.0, -1.0};
    axis.length = height;
  }
  return axis;
}

DepthAxis explicitAxis(const Vec2 &front, const Vec2 &back) {
  DepthAxis axis;
  axis.origin = front;
  axis.length = distance(front, back);
  if (axis.length > EPSILON) {
    axis.dir = {(back.x - front.x) / axis.length,
                (back.y - front.y) / axis.length};
  }
  return axis;
}

double interpolateDepth(const Vec2 &p, const DepthAxis &axis) {
  if (axis.length <= EPSILON)
    return 0.5;
  const Vec2 rel{p.x - axis.origin.x, p.y - axis.origin.y};
  return std::clamp(dot(rel, axis.dir) / axis.length, 0.0, 1.0);
}

double interpolateDepth(const Vec2 &p, const Polygon &poly,
                        const Vec2 &fieldCenter) {
  return interpolateDepth(p, principalAxis(poly, fieldCenter));
}

double interpolateLateral(const Vec2 &p, const Polygon &poly,
                          const Vec2 &fieldCenter, const DepthAxis &axis) {
  if (poly.empty())
    return 0.5;

  // Tangent to the circle around the field through the section centroid,
  // pointing toward increasing seat angle (bottom of the seatmap -> +x).
  const Vec2 c = polygonCentroid(poly);
  const Vec2 r{c.x - fieldCenter.x, c.y - fieldCenter.y};
  const double len = std::sqrt(dot(r, r));
  const Vec2 tangent = len > EPSILON ? Vec2{r.y / len, -r.x / len}
                                     : Vec2{axis.dir.y, -axis.dir.x};

  double lo = 0.0;
  double hi = 0.0;
  projectExtent(poly, tangent, lo, hi);
  if (hi - lo <= EPSILON)
    return 0.5;
  return std::clamp((dot(p, tangent) - lo) / (hi - lo), 0.0, 1.0);
}

Vec3 cylindricalToCartesian(const Vec3 &center, double radius, double angleDeg,
                            double height) {
  const double a = degToRad(angleDeg);
  return {center.x + radius * std::sin(a), center.y - radius * std::cos(a),
          center.z + height};
}

bool sectionIdLess(const std::string &a, const std::string &b) {
  if (isAllDigits(a) && isAllDigits(b)) {
    const unsigned long long na = std::stoull(a);
    const unsigned long long nb = std::stoull(b);
    if (na != nb)
      return na < nb;
  }
  return a < b;
}

} // namespace Geometry

#include "CoordinateMapper.h"
#include "../core/Errors.h"
#include "../core/Logger.h"

#include <algorithm>
#include <cmath>
#include <utility>

std::optional<ClickPoint> ClickPoint::fromPixels(double px, double py,
                                                 const SeatmapInfo &seatmap) {
  if (seatmap.width <= 0 || seatmap.height <= 0)
    return std::nullopt;
  return ClickPoint{px / seatmap.width, py / seatmap.height};
}

const CameraProfile &CameraProfiles::forType(VenueType type) {
  switch (type) {
  case VenueType::BASEBALL:   return BASEBALL;
  case VenueType::HOCKEY:     return HOCKEY;
  case VenueType::BASKETBALL: return BASKETBALL;
  case VenueType::FOOTBALL:   return FOOTBALL;
  }
  return BASEBALL;
}

static Vec2 normalizedClick(const ClickPoint &click) {
  auto fix = [](double v) {
    if (!std::isfinite(v))
      return 0.5;
    return std::clamp(v, 0.0, 1.0);
  };
  return {fix(click.x), fix(click.y)};
}

CoordinateMapper::CoordinateMapper(MapperConfig config) : config_(config) {
  if (config_.fovMinDeg > config_.fovMaxDeg)
    std::swap(config_.fovMinDeg, config_.fovMaxDeg);
}

const Section *CoordinateMapper::sectionAt(const ClickPoint &click,
                                           const Venue &venue) const {
  const Vec2 p = normalizedClick(click);
  const Section *found = nullptr;
  for (const auto &s : venue.sections) {
    if (Geometry::pointInPolygon(p, s.polygon) &&
        (!found || Geometry::sectionIdLess(s.id, found->id))) {
      found = &s;
    }
  }
  return found;
}

double CoordinateMapper::fovForDistance(double distanceM,
                                        const CameraProfile &profile) const {
  const double span = profile.farDistanceM - profile.nearDistanceM;
  double t = span > 0.0 ? (distanceM - profile.nearDistanceM) / span : 0.0;
  t = std::clamp(t, 0.0, 1.0);
  return Geometry::lerp(config_.fovMaxDeg, config_.fovMinDeg, t);
}

SeatMapping CoordinateMapper::map(const ClickPoint &click,
                                  const Venue &venue) const {
  if (venue.sections.empty())
    throw SectionResolutionError(venue.id);

  const Vec2 p = normalizedClick(click);
  SeatMapping out;

  const Section *section = nullptr;
  for (const auto &s : venue.sections) {
    if (!Geometry::pointInPolygon(p, s.polygon))
      continue;
    ++out.matches;
    if (!section || Geometry::sectionIdLess(s.id, section->id))
      section = &s;
  }

  if (out.matches == 1) {
    out.resolution = SectionResolution::IN_POLYGON;
    inPolygon_.fetch_add(1, std::memory_order_relaxed);
  } else if (out.matches > 1) {
    out.resolution = SectionResolution::OVERLAP;
    overlaps_.fetch_add(1, std::memory_order_relaxed);
    LOG_W("Mapper", "Venue '{}': click ({:.4f}, {:.4f}) inside {} overlapping "
                    "sections, using '{}'",
          venue.id, p.x, p.y, out.matches, section->id);
  } else {
    auto nearest = Geometry::nearestSection(p, venue.sections);
    section = venue.findSection(nearest->sectionId);
    out.resolution = SectionResolution::NEAREST;
    outOfBounds_.fetch_add(1, std::memory_order_relaxed);
    LOG_I("Mapper", "Venue '{}': out-of-bounds click ({:.4f}, {:.4f}), "
                    "nearest section '{}' at {:.4f}",
          venue.id, p.x, p.y, nearest->sectionId, nearest->distance);
  }

  const Tier *tier = venue.findTier(section->tier);
  if (!tier) {
    // Only reachable with a venue that skipped VenueLoader::validate
    throw InvalidVenueConfig(venue.id, "section '" + section->id +
                                           "' references unknown tier " +
                                           std::to_string(section->tier));
  }

  const DepthAxis axis =
      section->depthAxis
          ? Geometry::explicitAxis(section->depthAxis->front,
                                   section->depthAxis->back)
          : Geometry::principalAxis(section->polygon, venue.seatmapCenter);
  const CameraProfile &profile = CameraProfiles::forType(venue.type);

  out.sectionId = section->id;
  out.tier = tier->id;
  out.depth = Geometry::interpolateDepth(p, axis);
  out.lateral = Geometry::interpolateLateral(p, section->polygon,
                                             venue.seatmapCenter, axis);
  out.distanceM =
      Geometry::lerp(tier->distance.min, tier->distance.max, out.depth);
  out.angleDeg = section->angle + (out.lateral - 0.5) * profile.lateralSpreadDeg;

  const Vec3 &center = venue.fieldCenter;
  const Vec3 position = Geometry::cylindricalToCartesian(
      center, out.distanceM, out.angleDeg, tier->elevation);

  const double lead = Geometry::degToRad(section->angle);
  const Vec3 target{center.x + profile.targetLeadM * std::sin(lead),
                    center.y - profile.targetLeadM * std::cos(lead),
                    center.z + profile.targetHeightM};

  out.pose = CameraPose::lookingAt(position, target,
                                   fovForDistance(out.distanceM, profile));

  LOG_D("Mapper", "Venue '{}' section '{}' ({}): depth {:.3f} lateral {:.3f} "
                  "-> pos ({:.2f}, {:.2f}, {:.2f}) fov {:.1f}",
        venue.id, out.sectionId, sectionResolutionToString(out.resolution),
        out.depth, out.lateral, position.x, position.y, position.z,
        out.pose.fovDeg);
  return out;
}

MappingStats CoordinateMapper::stats() const {
  MappingStats s;
  s.inPolygon = inPolygon_.load(std::memory_order_relaxed);
  s.overlaps = overlaps_.load(std::memory_order_relaxed);
  s.outOfBounds = outOfBounds_.load(std::memory_order_relaxed);
  return s;
}

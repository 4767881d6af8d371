#pragma once

#include "../core/CameraPose.h"
#include "../core/Constants.h"
#include "../core/VenueData.h"

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>

// Normalized seatmap click, (0,0) top-left, (1,1) bottom-right.
struct ClickPoint {
  double x = 0.0;
  double y = 0.0;

  // Empty when the venue has no seatmap dimensions.
  static std::optional<ClickPoint> fromPixels(double px, double py,
                                              const SeatmapInfo &seatmap);
};

enum class SectionResolution {
  IN_POLYGON, // exactly one section contains the click
  OVERLAP,    // several sections contain it; lowest id won
  NEAREST,    // outside every polygon; nearest centroid used
};

inline const char *sectionResolutionToString(SectionResolution r) {
  switch (r) {
  case SectionResolution::IN_POLYGON: return "in_polygon";
  case SectionResolution::OVERLAP:    return "overlap";
  case SectionResolution::NEAREST:    return "nearest";
  }
  return "nearest";
}

struct SeatMapping {
  CameraPose pose;
  std::string sectionId;
  int tier = 0;
  SectionResolution resolution = SectionResolution::IN_POLYGON;
  double depth = 0.0;       // 0 = front row, 1 = back row
  double lateral = 0.5;     // across the section, 0.5 = middle
  double distanceM = 0.0;   // horizontal distance from field center
  double angleDeg = 0.0;    // section angle plus in-section offset
  std::size_t matches = 0;  // polygons containing the click
};

// Per-venue-type camera heuristics. Not user-configurable.
struct CameraProfile {
  double lateralSpreadDeg; // angle swept from one side of a section to the other
  double targetLeadM;      // look-at shift from field center toward the seat
  double targetHeightM;    // look-at height above the field plane
  double nearDistanceM;    // at or inside this distance FOV is widest
  double farDistanceM;     // at or beyond this distance FOV is narrowest
};

namespace CameraProfiles {
// Field center is the pitcher's mound; look straight at it.
static constexpr CameraProfile BASEBALL{8.0, 0.0, 0.0, 15.0, 120.0};
static constexpr CameraProfile HOCKEY{6.0, 1.5, 0.5, 5.0, 45.0};
static constexpr CameraProfile BASKETBALL{6.0, 1.0, 1.5, 4.0, 40.0};
static constexpr CameraProfile FOOTBALL{8.0, 4.0, 1.0, 15.0, 100.0};

const CameraProfile &forType(VenueType type);
} // namespace CameraProfiles

struct MapperConfig {
  double fovMinDeg = SeatView::DEFAULT_FOV_MIN_DEG;
  double fovMaxDeg = SeatView::DEFAULT_FOV_MAX_DEG;
};

struct MappingStats {
  std::uint64_t inPolygon = 0;
  std::uint64_t overlaps = 0;
  std::uint64_t outOfBounds = 0;
};

// Click -> camera pose. Safe to call concurrently; the only shared state is
// the resolution counters.
class CoordinateMapper {
public:
  explicit CoordinateMapper(MapperConfig config = {});

  // Throws SectionResolutionError when venue has no sections. Every click
  // yields a pose; clicks outside all sections snap to the nearest one.
  SeatMapping map(const ClickPoint &click, const Venue &venue) const;

  // Section under the click (lowest id on overlap), or nullptr.
  const Section *sectionAt(const ClickPoint &click, const Venue &venue) const;

  // Closer seats get a wider lens; result is within [fovMin, fovMax].
  double fovForDistance(double distanceM, const CameraProfile &profile) const;

  MappingStats stats() const;

  const MapperConfig &config() const { return config_; }

private:
  MapperConfig config_;
  mutable std::atomic<std::uint64_t> inPolygon_{0};
  mutable std::atomic<std::uint64_t> overlaps_{0};
  mutable std::atomic<std::uint64_t> outOfBounds_{0};
};

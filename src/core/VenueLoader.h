#pragma once

#include "VenueData.h"

#include <nlohmann/json_fwd.hpp>

#include <filesystem>
#include <memory>
#include <string>

// Turns venue JSON into a validated, immutable Venue. Every failure is an
// InvalidVenueConfig; nothing half-parsed escapes.
//
// Layout (one venue per file, top-level "venue" object):
//   id, name, type, template, seatmap {file, width, height},
//   field_center {x, y, z}, seatmap_center [x, y],
//   tiers {"100": {elevation, distance_range: [min, max]}},
//   sections [{id, tier, polygon: [[x, y], ...], angle,
//              depth_axis {front: [x, y], back: [x, y]}, row_count}]
class VenueLoader {
public:
  static std::shared_ptr<const Venue> fromJson(const nlohmann::json &doc);
  static std::shared_ptr<const Venue> fromString(const std::string &text);
  static std::shared_ptr<const Venue> fromFile(const std::filesystem::path &path);

  // <dir>/<id>.json, or <dir>/<id>/config.json when that exists instead.
  // Ids containing a path separator or ".." throw InvalidVenueConfig.
  static std::filesystem::path pathFor(const std::filesystem::path &dir,
                                       const std::string &venueId);

  // Structural checks shared by every entry point. Throws InvalidVenueConfig.
  static void validate(const Venue &venue);
};

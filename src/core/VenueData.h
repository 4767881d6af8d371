#pragma once

#include "Geometry.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

enum class VenueType {
  BASEBALL,
  HOCKEY,
  BASKETBALL,
  FOOTBALL,
};

inline const char *venueTypeToString(VenueType t) {
  switch (t) {
  case VenueType::BASEBALL:   return "baseball";
  case VenueType::HOCKEY:     return "hockey";
  case VenueType::BASKETBALL: return "basketball";
  case VenueType::FOOTBALL:   return "football";
  }
  return "baseball";
}

// No fallback: an unknown type must not reach the camera heuristics.
inline std::optional<VenueType> venueTypeFromString(const std::string &s) {
  if (s == "baseball")   return VenueType::BASEBALL;
  if (s == "hockey")     return VenueType::HOCKEY;
  if (s == "basketball") return VenueType::BASKETBALL;
  if (s == "football")   return VenueType::FOOTBALL;
  return std::nullopt;
}

struct DistanceRange {
  double min = 0.0; // meters from field center
  double max = 0.0;
};

struct Tier {
  int id = 0;             // e.g. 100, 200, 300
  double elevation = 0.0; // meters above the field plane
  DistanceRange distance;
};

struct SectionDepthAxis {
  Vec2 front;
  Vec2 back;
};

struct Section {
  std::string id;
  int tier = 0;
  Polygon polygon;    // normalized seatmap coordinates
  double angle = 0.0; // degrees around the field center, 0 = behind home
  std::optional<SectionDepthAxis> depthAxis;
  std::optional<int> rowCount;
};

struct SeatmapInfo {
  std::string file;
  int width = 0; // pixels
  int height = 0;
};

// A venue as the mapper sees it. Built and validated once by VenueLoader and
// then shared as std::shared_ptr<const Venue>; a reload replaces the whole
// object.
struct Venue {
  std::string id;
  std::string name;
  VenueType type = VenueType::BASEBALL;
  std::string templateId; // 3D scene the render backend loads
  SeatmapInfo seatmap;
  Vec3 fieldCenter;                 // meters, render space
  Vec2 seatmapCenter{0.5, 0.5};     // field position on the seatmap
  std::map<int, Tier> tiers;        // ordered by tier id
  std::vector<Section> sections;

  const Tier *findTier(int id) const {
    auto it = tiers.find(id);
    return it == tiers.end() ? nullptr : &it->second;
  }

  const Section *findSection(const std::string &sectionId) const {
    for (const auto &s : sections) {
      if (s.id == sectionId)
        return &s;
    }
    return nullptr;
  }
};

#pragma once

#include "core/VenueData.h"

#include <memory>
#include <string>
#include <vector>

namespace TestVenues {

inline Section makeRect(const std::string &id, int tier, double angle,
                        double x0, double y0, double x1, double y1) {
  Section s;
  s.id = id;
  s.tier = tier;
  s.angle = angle;
  s.polygon = {{x0, y0}, {x1, y0}, {x1, y1}, {x0, y1}};
  return s;
}

// Section 101 spans [0.25, 0.75] x [0.75, 1.0]; every corner is a dyadic
// fraction so its centroid and depth come out exact.
inline Venue scenario() {
  Venue v;
  v.id = "yankee_stadium";
  v.name = "Yankee Stadium";
  v.type = VenueType::BASEBALL;
  v.templateId = "yankee_stadium.blend";
  v.seatmap = {"seatmap.png", 1280, 960};
  v.tiers[100] = Tier{100, 5.0, {20.0, 40.0}};
  v.tiers[200] = Tier{200, 18.0, {50.0, 80.0}};
  v.sections.push_back(makeRect("101", 100, 0.0, 0.25, 0.75, 0.75, 1.0));
  v.sections.push_back(makeRect("114", 100, -60.0, 0.0, 0.5, 0.125, 0.625));
  v.sections.push_back(makeRect("118", 100, 60.0, 0.875, 0.5, 1.0, 0.625));
  v.sections.push_back(makeRect("205", 200, -35.0, 0.0, 0.0, 0.25, 0.125));
  return v;
}

inline std::shared_ptr<const Venue> scenarioPtr() {
  return std::make_shared<const Venue>(scenario());
}

} // namespace TestVenues

#pragma once

#include "CameraPose.h"
#include "Constants.h"
#include "RenderTypes.h"

#include <cstdint>
#include <string>

struct FingerprintPrecision {
  double positionM = SeatView::DEFAULT_POSITION_PRECISION_M;
  double fovDeg = SeatView::DEFAULT_FOV_PRECISION_DEG;
};

// Render cache key for a pose. Positions, targets and FOV are snapped to a
// grid first so clicks a few centimeters apart share one render.
class Fingerprint {
public:
  // Human-readable key: venue|template|s=section|preset|p=..|t=..|f=.. with
  // each value expressed as an integer number of grid steps. The section id
  // keeps neighbouring sections apart even where their edge seats snap to
  // the same pose.
  static std::string canonical(const std::string &venueId,
                               const std::string &templateId,
                               const std::string &sectionId,
                               RenderPreset preset, const CameraPose &pose,
                               const FingerprintPrecision &precision = {});

  // 16 hex digits of hash(canonical(...)).
  static std::string make(const std::string &venueId,
                          const std::string &templateId,
                          const std::string &sectionId, RenderPreset preset,
                          const CameraPose &pose,
                          const FingerprintPrecision &precision = {});

  static std::uint64_t hash(const std::string &key);
};

#include "Fingerprint.h"

#include <fmt/format.h>

#include <cmath>

static long long snap(double value, double step, double fallbackStep) {
  if (!(step > 0.0))
    step = fallbackStep;
  return std::llround(value / step);
}

std::string Fingerprint::canonical(const std::string &venueId,
                                   const std::string &templateId,
                                   const std::string &sectionId,
                                   RenderPreset preset, const CameraPose &pose,
                                   const FingerprintPrecision &precision) {
  const double pos = precision.positionM;
  const double defPos = SeatView::DEFAULT_POSITION_PRECISION_M;

  return fmt::format(
      "{}|{}|s={}|{}|p={},{},{}|t={},{},{}|f={}", venueId, templateId,
      sectionId, renderPresetToString(preset), snap(pose.position.x, pos, defPos),
      snap(pose.position.y, pos, defPos), snap(pose.position.z, pos, defPos),
      snap(pose.target.x, pos, defPos), snap(pose.target.y, pos, defPos),
      snap(pose.target.z, pos, defPos),
      snap(pose.fovDeg, precision.fovDeg, SeatView::DEFAULT_FOV_PRECISION_DEG));
}

std::string Fingerprint::make(const std::string &venueId,
                              const std::string &templateId,
                              const std::string &sectionId,
                              RenderPreset preset, const CameraPose &pose,
                              const FingerprintPrecision &precision) {
  return fmt::format("{:016x}",
                     hash(canonical(venueId, templateId, sectionId, preset,
                                    pose, precision)));
}

std::uint64_t Fingerprint::hash(const std::string &key) {
  // djb2 over 64 bits; stable across runs and platforms
  std::uint64_t h = 5381;
  for (unsigned char c : key)
    h = ((h << 5) + h) + c;
  return h;
}

#include "CameraPose.h"

#include <cmath>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

CameraPose CameraPose::lookingAt(const Vec3 &position, const Vec3 &target,
                                 double fovDeg) {
  CameraPose pose;
  pose.position = position;
  pose.target = target;
  pose.fovDeg = fovDeg;

  const double dx = target.x - position.x;
  const double dy = target.y - position.y;
  const double dz = target.z - position.z;
  const double horizontal = std::sqrt(dx * dx + dy * dy);
  const double total = std::sqrt(dx * dx + dy * dy + dz * dz);

  constexpr double halfPi = M_PI / 2.0;
  if (total == 0.0) {
    pose.rotation = {halfPi, 0.0, 0.0};
    return pose;
  }

  double pitch = 0.0;
  if (horizontal > 0.0) {
    pitch = std::atan2(dz, horizontal);
  } else {
    pitch = dz > 0.0 ? halfPi : -halfPi;
  }

  // A Blender camera with zero rotation looks straight down -Z
  pose.rotation.x = halfPi - pitch;
  pose.rotation.y = 0.0;
  pose.rotation.z = std::atan2(dx, dy);
  return pose;
}

#pragma once

#include "Geometry.h"

// Blender Euler rotation (radians). x = pitch from straight down, y = roll,
// z = yaw measured from +y.
struct CameraRotation {
  double x = 0.0;
  double y = 0.0;
  double z = 0.0;
};

struct CameraPose {
  Vec3 position; // meters
  Vec3 target;   // look-at point
  double fovDeg = 60.0;
  CameraRotation rotation; // derived from position and target

  static CameraPose lookingAt(const Vec3 &position, const Vec3 &target,
                              double fovDeg);
};

#pragma once
#include "kintree/core/math/types.hpp"

namespace kintree::core {

double deg2rad(double deg);
Vec3 deg2rad(const Vec3& deg);

// Intrinsic x-y-z Euler angles (radians) -> unit quaternion:
//   q = qx(a0) * qy(a1) * qz(a2)
Quat quatFromEuler(const Vec3& angles);

// Quaternion chordal distance min(||q1 - q2||, ||q1 + q2||).
// Zero for q and -q; useful for comparisons, not an angle.
double rotationDistance(const Quat& q1, const Quat& q2);

}  // namespace kintree::core

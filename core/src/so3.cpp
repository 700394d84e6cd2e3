// Rotation helpers used when normalizing body orientations.
// - `quatFromEuler` composes elementary rotations about the moving axes x, then y, then z.
// - `rotationDistance` is the quaternion chordal distance, insensitive to the q / -q ambiguity.
#include "kintree/core/math/so3.hpp"

#include <algorithm>
#include <cmath>

namespace kintree::core {

double deg2rad(double deg) {
  return deg * M_PI / 180.0;
}

Vec3 deg2rad(const Vec3& deg) {
  return deg * (M_PI / 180.0);
}

Quat quatFromEuler(const Vec3& angles) {
  const Quat qx(Eigen::AngleAxisd(angles.x(), Vec3::UnitX()));
  const Quat qy(Eigen::AngleAxisd(angles.y(), Vec3::UnitY()));
  const Quat qz(Eigen::AngleAxisd(angles.z(), Vec3::UnitZ()));
  Quat q = qx * qy * qz;
  q.normalize();
  return q;
}

double rotationDistance(const Quat& q1, const Quat& q2) {
  const Vec4 a = wxyzFromQuat(q1.normalized());
  const Vec4 b = wxyzFromQuat(q2.normalized());
  return std::min((a - b).norm(), (a + b).norm());
}

}  // namespace kintree::core

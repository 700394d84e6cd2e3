#pragma once
#include <Eigen/Core>
#include <Eigen/Geometry>

namespace kintree::core {

// Fundamental math types used across the library.
// - Quaternions are stored as Eigen::Quaterniond; in documents and printed output they are
//   written scalar-first `[w x y z]`.
// - `Transform` is a rigid transform child -> parent, composed by left-multiplication
//   (A * B applies B, then A).
// - Units are whatever the document uses; angles inside the library are radians.
using Vec3 = Eigen::Vector3d;
using Vec4 = Eigen::Vector4d;
using VecX = Eigen::VectorXd;
using Quat = Eigen::Quaterniond;

struct Transform {
  Vec3 pos{Vec3::Zero()};      // translation
  Quat rot{Quat::Identity()};  // rotation

  Transform() = default;
  Transform(const Vec3& pos_in, const Quat& rot_in) : pos(pos_in), rot(rot_in) {}

  Transform inverse() const {
    const Quat ri = rot.conjugate();
    return Transform(-(ri * pos), ri);
  }

  Transform operator*(const Transform& other) const {
    return Transform(pos + rot * other.pos, rot * other.rot);
  }
};

// Scalar-first coefficient helpers.
inline Quat quatFromWxyz(const Vec4& wxyz) {
  return Quat(wxyz(0), wxyz(1), wxyz(2), wxyz(3));
}

inline Vec4 wxyzFromQuat(const Quat& q) {
  return Vec4(q.w(), q.x(), q.y(), q.z());
}

}  // namespace kintree::core

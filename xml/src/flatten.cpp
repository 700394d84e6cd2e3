#include "kintree/xml/flatten.hpp"

#include "kintree/core/common/logger.hpp"

#include <sstream>

namespace kintree::xml {

using namespace kintree::core;

Status flattenTree(std::vector<BodyNode> bodies, KinematicTree* out, std::string* message) {
  if (!out || !message) {
    log(LogLevel::Error, "flattenTree: null output");
    return Status::InvalidParameter;
  }

  Eigen::Index qd = 0;
  for (std::size_t i = 0; i < bodies.size(); ++i) {
    if (bodies[i].id != static_cast<int>(i)) {
      std::ostringstream oss;
      oss << "link ids are not contiguous: position " << i << " holds id " << bodies[i].id;
      *message = oss.str();
      return Status::NonContiguousIds;
    }
    qd += bodies[i].damping.size();
  }

  const std::size_t n = bodies.size();
  out->parents.clear();
  out->joint_types.clear();
  out->names.clear();
  out->transforms.clear();
  out->geoms.clear();
  out->parents.reserve(n);
  out->joint_types.reserve(n);
  out->names.reserve(n);
  out->transforms.reserve(n);
  out->geoms.reserve(n);
  out->dampings.resize(qd);
  out->armatures.resize(qd);

  Eigen::Index offset = 0;
  for (auto& b : bodies) {
    out->parents.push_back(b.parent);
    out->joint_types.push_back(b.joint);
    out->names.push_back(std::move(b.name));
    out->transforms.push_back(b.transform);
    out->geoms.push_back(std::move(b.geoms));

    const Eigen::Index w = b.damping.size();
    out->dampings.segment(offset, w) = b.damping;
    out->armatures.segment(offset, w) = b.armature;
    offset += w;
  }
  return Status::Success;
}

}  // namespace kintree::xml

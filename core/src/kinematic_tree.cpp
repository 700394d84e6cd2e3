#include "kintree/core/model/kinematic_tree.hpp"

#include "kintree/core/common/logger.hpp"

#include <cmath>

namespace kintree::core {

namespace {

struct JointTableEntry {
  std::string_view key;
  JointType type;
  int qd_width;
  int q_width;
};

// Order matches the JointType enumerators.
constexpr JointTableEntry kJointTable[] = {
  {"free", JointType::Free, 6, 7},
  {"frozen", JointType::Frozen, 0, 0},
  {"spherical", JointType::Spherical, 3, 4},
  {"p3d", JointType::P3d, 3, 3},
  {"cor", JointType::Cor, 9, 10},
  {"rx", JointType::Rx, 1, 1},
  {"ry", JointType::Ry, 1, 1},
  {"rz", JointType::Rz, 1, 1},
  {"px", JointType::Px, 1, 1},
  {"py", JointType::Py, 1, 1},
  {"pz", JointType::Pz, 1, 1},
  {"saddle", JointType::Saddle, 2, 2},
  {"hinge", JointType::Hinge, 1, 1},
};

const JointTableEntry& jointEntry(JointType type) {
  return kJointTable[static_cast<std::size_t>(type)];
}

struct ShapeVisitor {
  GeomType operator()(const Box&) const { return GeomType::Box; }
  GeomType operator()(const Sphere&) const { return GeomType::Sphere; }
  GeomType operator()(const Cylinder&) const { return GeomType::Cylinder; }
};

}  // namespace

std::optional<JointType> jointTypeFromString(std::string_view key) {
  for (const auto& e : kJointTable) {
    if (e.key == key) return e.type;
  }
  return std::nullopt;
}

const char* jointTypeName(JointType type) {
  return jointEntry(type).key.data();
}

int qdWidth(JointType type) { return jointEntry(type).qd_width; }
int qWidth(JointType type) { return jointEntry(type).q_width; }

std::optional<GeomType> geomTypeFromString(std::string_view key) {
  if (key == "box") return GeomType::Box;
  if (key == "sphere") return GeomType::Sphere;
  if (key == "cylinder") return GeomType::Cylinder;
  return std::nullopt;
}

const char* geomTypeName(GeomType type) {
  switch (type) {
    case GeomType::Box: return "box";
    case GeomType::Sphere: return "sphere";
    case GeomType::Cylinder: return "cylinder";
  }
  return "unknown";
}

int geomDimCount(GeomType type) {
  switch (type) {
    case GeomType::Box: return 3;
    case GeomType::Sphere: return 1;
    case GeomType::Cylinder: return 2;
  }
  return 0;
}

GeomType geomTypeOf(const GeomShape& shape) {
  return std::visit(ShapeVisitor{}, shape);
}

Status makeGeomShape(GeomType type, const VecX& dim, GeomShape* out) {
  if (!out) {
    log(LogLevel::Error, "makeGeomShape: null output");
    return Status::InvalidParameter;
  }
  if (dim.size() != geomDimCount(type)) {
    return Status::InvalidAttribute;
  }

  switch (type) {
    case GeomType::Box:
      *out = Box{dim(0), dim(1), dim(2)};
      break;
    case GeomType::Sphere:
      *out = Sphere{dim(0)};
      break;
    case GeomType::Cylinder:
      *out = Cylinder{dim(0), dim(1)};
      break;
  }
  return Status::Success;
}

int KinematicTree::qdSize() const {
  int n = 0;
  for (JointType t : joint_types) n += qdWidth(t);
  return n;
}

int KinematicTree::qSize() const {
  int n = 0;
  for (JointType t : joint_types) n += qWidth(t);
  return n;
}

std::optional<int> KinematicTree::linkIndex(const std::string& name) const {
  for (std::size_t i = 0; i < names.size(); ++i) {
    if (names[i] == name) return static_cast<int>(i);
  }
  return std::nullopt;
}

int KinematicTree::qdOffset(int link) const {
  int offset = 0;
  for (int i = 0; i < link && i < static_cast<int>(joint_types.size()); ++i) {
    offset += qdWidth(joint_types[static_cast<std::size_t>(i)]);
  }
  return offset;
}

std::vector<Transform> KinematicTree::worldTransforms() const {
  // parents[i] < i, so every parent is resolved before its children.
  std::vector<Transform> world(transforms.size());
  for (std::size_t i = 0; i < transforms.size(); ++i) {
    const int p = parents[i];
    world[i] = (p < 0) ? transforms[i] : world[static_cast<std::size_t>(p)] * transforms[i];
  }
  return world;
}

Status KinematicTree::validate() const {
  const std::size_t n = parents.size();
  if (joint_types.size() != n || names.size() != n || transforms.size() != n || geoms.size() != n) {
    log(LogLevel::Error, "KinematicTree: per-link sequences differ in length");
    return Status::InvalidParameter;
  }

  for (std::size_t i = 0; i < n; ++i) {
    const int p = parents[i];
    if (p < -1 || p >= static_cast<int>(i)) {
      LogLine(LogLevel::Error) << "KinematicTree: link " << i << " has parent " << p
                               << ", expected -1 or an index below " << i;
      return Status::InvalidParameter;
    }
  }

  const int qd = qdSize();
  if (dampings.size() != qd || armatures.size() != qd) {
    LogLine(LogLevel::Error) << "KinematicTree: dampings/armatures have " << dampings.size()
                             << "/" << armatures.size() << " entries, expected " << qd;
    return Status::InvalidParameter;
  }

  if (!(options.dt > 0.0) || !std::isfinite(options.dt)) {
    log(LogLevel::Error, "KinematicTree: dt must be positive");
    return Status::InvalidParameter;
  }
  return Status::Success;
}

}  // namespace kintree::core

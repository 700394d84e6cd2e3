#pragma once
#include "kintree/core/common/status.hpp"
#include "kintree/core/math/types.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace kintree::core {

// Flattened multibody tree consumed by the simulation engine.
//
// Conventions:
// - Links are indexed 0..N-1 in pre-order of the body hierarchy; `parents[i] < i`, roots use -1.
// - `transforms[i]` is the link frame relative to its parent frame (world for roots).
// - `dampings` / `armatures` concatenate the per-link vectors in link order; link i contributes
//   `qdWidth(joint_types[i])` entries.
enum class JointType : std::uint8_t {
  Free = 0,
  Frozen = 1,
  Spherical = 2,
  P3d = 3,
  Cor = 4,
  Rx = 5,
  Ry = 6,
  Rz = 7,
  Px = 8,
  Py = 9,
  Pz = 10,
  Saddle = 11,
  Hinge = 12
};

std::optional<JointType> jointTypeFromString(std::string_view key);
const char* jointTypeName(JointType type);

// Velocity (DOF) and position coordinate counts of a joint.
int qdWidth(JointType type);
int qWidth(JointType type);

// Attribute value as written in a document: raw text plus its numeric reading, if it has one.
struct AttributeValue {
  std::string text;
  std::optional<VecX> numbers;

  AttributeValue() = default;
  explicit AttributeValue(std::string text_in) : text(std::move(text_in)) {}

  bool isNumeric() const { return numbers.has_value(); }
};

using AttributeMap = std::map<std::string, AttributeValue>;

enum class GeomType : std::uint8_t {
  Box = 0,
  Sphere = 1,
  Cylinder = 2
};

std::optional<GeomType> geomTypeFromString(std::string_view key);
const char* geomTypeName(GeomType type);

// Number of entries expected in a geom's `dim` attribute.
int geomDimCount(GeomType type);

struct Box {
  double dim_x = 0.0;
  double dim_y = 0.0;
  double dim_z = 0.0;
};

struct Sphere {
  double radius = 0.0;
};

struct Cylinder {
  double radius = 0.0;
  double length = 0.0;
};

using GeomShape = std::variant<Box, Sphere, Cylinder>;

GeomType geomTypeOf(const GeomShape& shape);

// Builds the shape for `type` from its dimension vector; InvalidAttribute on arity mismatch.
Status makeGeomShape(GeomType type, const VecX& dim, GeomShape* out);

struct GeomSpec {
  GeomShape shape{Sphere{}};
  double mass = 0.0;
  Vec3 local_position{Vec3::Zero()};

  // `vispy_*` attributes with the prefix removed; opaque to the loader.
  AttributeMap visual_metadata;
};

struct SimOptions {
  Vec3 gravity{0.0, 0.0, -9.81};
  double dt = 0.01;
};

struct KinematicTree {
  std::string model_name;

  std::vector<int> parents;
  std::vector<JointType> joint_types;
  std::vector<std::string> names;
  std::vector<Transform> transforms;
  std::vector<std::vector<GeomSpec>> geoms;

  VecX dampings;
  VecX armatures;

  SimOptions options;

  int numLinks() const { return static_cast<int>(parents.size()); }
  int qdSize() const;
  int qSize() const;

  std::optional<int> linkIndex(const std::string& name) const;

  // Offset of link i's block in `dampings` / `armatures`.
  int qdOffset(int link) const;

  // Link frames in world coordinates with every joint at its zero configuration.
  std::vector<Transform> worldTransforms() const;

  // Re-checks the ordering and width invariants; InvalidParameter on violation.
  Status validate() const;
};

}  // namespace kintree::core

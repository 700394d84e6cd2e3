#pragma once

#include <string>
#include <vector>

#include "kintree/core/model/kinematic_tree.hpp"
#include "kintree/xml/document.hpp"
#include "kintree/xml/load_options.hpp"

namespace kintree::xml {

// One visited <body>, before flattening.
struct BodyNode {
  int id = -1;
  int parent = -1;
  kintree::core::JointType joint{kintree::core::JointType::Frozen};
  std::string name;
  kintree::core::Transform transform;
  kintree::core::VecX damping;   // qdWidth(joint) entries
  kintree::core::VecX armature;  // qdWidth(joint) entries
  std::vector<kintree::core::GeomSpec> geoms;  // document order
};

// State of one traversal. A fresh context is used for every load; nothing is shared between
// loads. Bodies are appended in visiting order, so `bodies[i].id == i` when the walk is sound.
struct TraversalContext {
  int next_id = 0;
  std::vector<BodyNode> bodies;
};

// Visits every <body> below `worldbody` depth-first in pre-order (an explicit work stack, so
// deep hierarchies do not grow the call stack), assigning ids from `ctx->next_id`.
// Expects numeric coercion and defaults to have been applied.
Status walkBodies(const Element& worldbody, const LoadOptions& opt, TraversalContext* ctx,
                  std::string* message);

// Orientation of a body: `quat` as written ([w x y z]), else `euler` in degrees (intrinsic
// x-y-z), else identity. ConflictingOrientation if both are given.
Status resolveOrientation(const Element& body, const LoadOptions& opt, kintree::core::Quat* out,
                          std::string* message);

// Builds a GeomSpec from a <geom>; `type` selects the shape.
Status parseGeom(const Element& geom, kintree::core::GeomSpec* out, std::string* message);

}  // namespace kintree::xml

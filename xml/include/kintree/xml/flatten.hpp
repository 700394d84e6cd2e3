#pragma once

#include <string>
#include <vector>

#include "kintree/core/model/kinematic_tree.hpp"
#include "kintree/xml/tree_walker.hpp"

namespace kintree::xml {

// Turns walker output into the array-indexed tree. `bodies[i].id` must equal i for every i
// (NonContiguousIds otherwise). Damping and armature vectors are concatenated in link order.
// `out->options` and `out->model_name` are left for the caller.
Status flattenTree(std::vector<BodyNode> bodies, kintree::core::KinematicTree* out,
                   std::string* message);

}  // namespace kintree::xml

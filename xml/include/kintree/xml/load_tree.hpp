#pragma once

#include <string>

#include "kintree/core/common/status.hpp"
#include "kintree/core/model/kinematic_tree.hpp"
#include "kintree/xml/load_options.hpp"

namespace kintree::xml {

// XML -> `core::KinematicTree` loader.
//
// Stages, in order; the first failure aborts the load and no partial tree is returned:
// - libxml2 parse (ParseError)
// - schema: known tags, whitelisted attributes (SchemaViolation)
// - structure: root tag, singletons, nesting (StructuralViolation)
// - numeric coercion of every attribute value
// - <options> (MissingAttribute / InvalidAttribute)
// - <defaults> merged into every body and geom
// - pre-order walk of the bodies, then flattening into arrays
struct LoadResult {
  kintree::core::Status status{kintree::core::Status::Failure};
  kintree::core::KinematicTree tree;
  std::string message;  // what failed and where; "OK" on success
};

LoadResult loadTreeFromString(const std::string& xml, const LoadOptions& opt = {});

LoadResult loadTreeFromFile(const std::string& path, const LoadOptions& opt = {});

}  // namespace kintree::xml

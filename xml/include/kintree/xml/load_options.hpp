#pragma once

#include "kintree/core/common/constants.hpp"

namespace kintree::xml {

struct LoadOptions {
  // If true (default), two bodies sharing a `name` fail the load with DuplicateName.
  bool require_unique_names = true;

  // If true, `quat` attributes are normalized; a quaternion with (near) zero norm fails with
  // InvalidAttribute. If false (default) they are stored as written.
  bool normalize_quat = false;

  kintree::core::Thresholds thresholds = kintree::core::kDefaultThresholds;
};

}  // namespace kintree::xml

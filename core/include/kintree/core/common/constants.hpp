#pragma once

namespace kintree::core {

struct Thresholds {
  // quaternions at or below this norm cannot be normalized
  double quat_norm_eps = 1.0e-12;
};

inline constexpr Thresholds kDefaultThresholds{};

}  // namespace kintree::core

#include "kintree/xml/visual.hpp"

namespace kintree::xml {

bool isVisualAttribute(std::string_view attribute) {
  const std::size_t n = kVisualPrefix.size();
  return attribute.size() > n &&
         attribute.compare(0, n, kVisualPrefix) == 0 &&
         attribute[n] == kVisualSeparator;
}

AttributeMap extractVisualMetadata(const AttributeMap& attributes) {
  AttributeMap bag;
  const std::size_t strip = kVisualPrefix.size() + 1;
  for (const auto& kv : attributes) {
    if (!isVisualAttribute(kv.first)) continue;
    bag.emplace(kv.first.substr(strip), kv.second);
  }
  return bag;
}

}  // namespace kintree::xml

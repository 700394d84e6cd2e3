#pragma once

#include <string_view>

#include "kintree/xml/document.hpp"
#include "kintree/xml/schema.hpp"

namespace kintree::xml {

// True for `vispy_<key>`; the key may be empty.
bool isVisualAttribute(std::string_view attribute);

// Collects the `vispy_*` attributes of a geom with the prefix and separator removed.
// Values are passed through untouched for the rendering side.
AttributeMap extractVisualMetadata(const AttributeMap& attributes);

}  // namespace kintree::xml

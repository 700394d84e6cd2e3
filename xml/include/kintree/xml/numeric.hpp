#pragma once

#include <string_view>

#include "kintree/xml/document.hpp"

namespace kintree::xml {

// Parses one or more whitespace-separated floating-point literals ("0 0 1", "9.81", "1e-3").
// Returns false, leaving `*out` untouched, if any token is not a complete literal or the text
// holds no token at all.
bool parseNumbers(std::string_view text, kintree::core::VecX* out);

// Fills `numbers` on every attribute of `root` and its descendants whose text parses.
// Textual values (joint kinds, names, shape keys) are left as they are.
void coerceNumericAttributes(Element* root);

}  // namespace kintree::xml

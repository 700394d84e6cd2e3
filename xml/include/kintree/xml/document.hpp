#pragma once

#include <string>
#include <vector>

#include "kintree/core/common/status.hpp"
#include "kintree/core/model/kinematic_tree.hpp"

namespace kintree::xml {

using kintree::core::AttributeMap;
using kintree::core::AttributeValue;
using kintree::core::Status;

// Owned element tree built from the libxml2 document. Only element nodes are kept;
// text, comments and processing instructions are dropped.
struct Element {
  std::string tag;
  AttributeMap attributes;
  std::vector<Element> children;
  int line = 0;  // source line reported by libxml2, 0 if unknown

  bool has(const std::string& name) const { return attributes.count(name) != 0; }

  // nullptr when absent.
  const AttributeValue* attribute(const std::string& name) const;

  // Direct children with the given tag, in document order.
  std::vector<const Element*> childrenWithTag(const std::string& child_tag) const;
  std::vector<Element*> childrenWithTag(const std::string& child_tag);
};

// Parses `text` into `*root`. ParseError with libxml2's diagnostic on malformed input.
Status parseDocument(const std::string& text, Element* root, std::string* message);

// "tag (line N)" for diagnostics.
std::string describe(const Element& e);

}  // namespace kintree::xml

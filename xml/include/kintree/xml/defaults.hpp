#pragma once

#include <string>

#include "kintree/xml/document.hpp"

namespace kintree::xml {

// Per-tag default attributes declared once under <defaults>.
struct DefaultsTable {
  AttributeMap geom;
  AttributeMap body;

  // Empty map for tags without defaults.
  const AttributeMap& forTag(const std::string& tag) const;
};

// Reads <defaults><geom/><body/></defaults> from the root. A missing <defaults> or a missing
// child means no defaults for that tag. StructuralViolation on duplicated entries.
Status extractDefaults(const Element& root, DefaultsTable* out, std::string* message);

// Adds every default attribute that a <body>/<geom> in `worldbody` does not set itself.
// Explicit values are never replaced, so merging twice equals merging once.
void mixInDefaults(Element* worldbody, const DefaultsTable& defaults);

}  // namespace kintree::xml

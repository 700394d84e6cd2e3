#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "kintree/xml/document.hpp"

namespace kintree::xml {

// Document schema:
//
//   <x_xy model="...">
//     <options gravity="0 0 -9.81" dt="0.01"/>
//     <defaults>                      (optional)
//       <geom .../>  <body .../>      (each optional)
//     </defaults>
//     <worldbody>
//       <body name=".." joint=".." pos quat|euler damping armature>
//         <geom type=".." mass=".." pos=".." dim=".." vispy_*=".."/>
//         <body ...> ... </body>
//       </body>
//     </worldbody>
//   </x_xy>
enum class Tag : std::uint8_t {
  Root = 0,
  Options = 1,
  Defaults = 2,
  Worldbody = 3,
  Body = 4,
  Geom = 5
};

inline constexpr std::string_view kRootTag = "x_xy";
inline constexpr std::string_view kVisualPrefix = "vispy";
inline constexpr char kVisualSeparator = '_';

std::optional<Tag> tagFromString(std::string_view name);
const char* tagName(Tag tag);

const std::vector<std::string_view>& allowedAttributes(Tag tag);

// True for whitelisted attributes and, on geoms, for `vispy_*` attributes.
bool isAttributeAllowed(Tag tag, std::string_view attribute);

// Every tag must be known and every attribute whitelisted for its tag.
// SchemaViolation names the element path and offending tag or attribute.
Status validateSchema(const Element& root, std::string* message);

// Root tag, singleton cardinalities and nesting. StructuralViolation on failure.
Status validateStructure(const Element& root, std::string* message);

}  // namespace kintree::xml

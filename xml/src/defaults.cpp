#include "kintree/xml/defaults.hpp"

#include "kintree/core/common/logger.hpp"

namespace kintree::xml {
namespace {

using kintree::core::LogLevel;
using kintree::core::LogLine;
using kintree::core::log;

std::size_t mixInRecursive(Element* e, const DefaultsTable& defaults) {
  std::size_t filled = 0;
  if (e->tag == "body" || e->tag == "geom") {
    for (const auto& kv : defaults.forTag(e->tag)) {
      // emplace keeps an existing explicit value
      if (e->attributes.emplace(kv.first, kv.second).second) ++filled;
    }
  }
  for (auto& c : e->children) filled += mixInRecursive(&c, defaults);
  return filled;
}

}  // namespace

const AttributeMap& DefaultsTable::forTag(const std::string& tag) const {
  static const AttributeMap kEmpty;
  if (tag == "geom") return geom;
  if (tag == "body") return body;
  return kEmpty;
}

Status extractDefaults(const Element& root, DefaultsTable* out, std::string* message) {
  if (!out || !message) {
    log(LogLevel::Error, "extractDefaults: null output");
    return Status::InvalidParameter;
  }
  *out = DefaultsTable{};

  const auto sections = root.childrenWithTag("defaults");
  if (sections.empty()) return Status::Success;
  if (sections.size() > 1) {
    *message = "<" + root.tag + "> must contain at most 1 <defaults>";
    return Status::StructuralViolation;
  }

  const Element& section = *sections.front();
  for (const char* tag : {"geom", "body"}) {
    const auto entries = section.childrenWithTag(tag);
    if (entries.size() > 1) {
      *message = std::string("<defaults> must contain at most 1 <") + tag + ">";
      return Status::StructuralViolation;
    }
    if (entries.empty()) continue;

    AttributeMap& target = (std::string(tag) == "geom") ? out->geom : out->body;
    target = entries.front()->attributes;
  }

  LogLine(LogLevel::Debug) << "defaults: " << out->geom.size() << " geom, "
                           << out->body.size() << " body attributes";
  return Status::Success;
}

void mixInDefaults(Element* worldbody, const DefaultsTable& defaults) {
  if (!worldbody) return;
  const std::size_t n = mixInRecursive(worldbody, defaults);
  LogLine(LogLevel::Debug) << "defaults filled " << n << " attributes";
}

}  // namespace kintree::xml

#include "kintree/xml/schema.hpp"

#include "kintree/xml/visual.hpp"

#include <algorithm>
#include <sstream>

namespace kintree::xml {
namespace {

struct TagEntry {
  std::string_view name;
  Tag tag;
};

constexpr TagEntry kTags[] = {
  {kRootTag, Tag::Root},
  {"options", Tag::Options},
  {"defaults", Tag::Defaults},
  {"worldbody", Tag::Worldbody},
  {"body", Tag::Body},
  {"geom", Tag::Geom},
};

std::string childPath(const std::string& parent_path, const Element& e) {
  std::string path = parent_path.empty() ? e.tag : parent_path + "/" + e.tag;
  if (const AttributeValue* name = e.attribute("name")) {
    path += "[" + name->text + "]";
  }
  return path;
}

std::string where(const std::string& path, const Element& e) {
  std::ostringstream oss;
  oss << path;
  if (e.line > 0) oss << " (line " << e.line << ")";
  return oss.str();
}

Status checkSchemaRecursive(const Element& e, const std::string& path, std::string* message) {
  const std::optional<Tag> tag = tagFromString(e.tag);
  if (!tag) {
    *message = "unknown tag <" + e.tag + "> at " + where(path, e);
    return Status::SchemaViolation;
  }

  for (const auto& kv : e.attributes) {
    if (!isAttributeAllowed(*tag, kv.first)) {
      *message = "attribute '" + kv.first + "' is not allowed on <" + e.tag + "> at " + where(path, e);
      return Status::SchemaViolation;
    }
  }

  for (const auto& c : e.children) {
    const Status st = checkSchemaRecursive(c, childPath(path, c), message);
    if (!ok(st)) return st;
  }
  return Status::Success;
}

Status misplaced(const Element& child, const std::string& path, std::string* message) {
  *message = "<" + child.tag + "> is not allowed at " + where(path, child);
  return Status::StructuralViolation;
}

Status requireCount(const Element& parent, const char* child_tag, std::size_t lo, std::size_t hi,
                    std::string* message) {
  const std::size_t n = parent.childrenWithTag(child_tag).size();
  if (n >= lo && n <= hi) return Status::Success;

  std::ostringstream oss;
  oss << "<" << parent.tag << "> must contain ";
  if (lo == hi) {
    oss << "exactly " << lo;
  } else {
    oss << "at most " << hi;
  }
  oss << " <" << child_tag << ">, found " << n;
  *message = oss.str();
  return Status::StructuralViolation;
}

// Nesting below <worldbody>: bodies hold bodies and geoms, geoms hold nothing.
Status checkBodyTree(const Element& e, const std::string& path, std::string* message) {
  for (const auto& c : e.children) {
    const std::string cpath = childPath(path, c);
    const bool allowed = (e.tag == "worldbody" && c.tag == "body") ||
                         (e.tag == "body" && (c.tag == "body" || c.tag == "geom"));
    if (!allowed) return misplaced(c, cpath, message);

    const Status st = checkBodyTree(c, cpath, message);
    if (!ok(st)) return st;
  }
  return Status::Success;
}

}  // namespace

std::optional<Tag> tagFromString(std::string_view name) {
  for (const auto& e : kTags) {
    if (e.name == name) return e.tag;
  }
  return std::nullopt;
}

const char* tagName(Tag tag) {
  for (const auto& e : kTags) {
    if (e.tag == tag) return e.name.data();
  }
  return "unknown";
}

const std::vector<std::string_view>& allowedAttributes(Tag tag) {
  static const std::vector<std::string_view> kRoot{"model"};
  static const std::vector<std::string_view> kOptions{"gravity", "dt"};
  static const std::vector<std::string_view> kNone{};
  static const std::vector<std::string_view> kBody{"name", "pos", "quat", "euler",
                                                   "joint", "armature", "damping"};
  static const std::vector<std::string_view> kGeom{"type", "mass", "pos", "dim"};

  switch (tag) {
    case Tag::Root: return kRoot;
    case Tag::Options: return kOptions;
    case Tag::Defaults: return kNone;
    case Tag::Worldbody: return kNone;
    case Tag::Body: return kBody;
    case Tag::Geom: return kGeom;
  }
  return kNone;
}

bool isAttributeAllowed(Tag tag, std::string_view attribute) {
  if (tag == Tag::Geom && isVisualAttribute(attribute)) return true;
  const auto& allowed = allowedAttributes(tag);
  return std::find(allowed.begin(), allowed.end(), attribute) != allowed.end();
}

Status validateSchema(const Element& root, std::string* message) {
  if (!message) return Status::InvalidParameter;
  return checkSchemaRecursive(root, childPath({}, root), message);
}

Status validateStructure(const Element& root, std::string* message) {
  if (!message) return Status::InvalidParameter;

  if (root.tag != kRootTag) {
    *message = "root element must be <" + std::string(kRootTag) + ">, found <" + root.tag + ">";
    return Status::StructuralViolation;
  }

  Status st = requireCount(root, "options", 1, 1, message);
  if (!ok(st)) return st;
  st = requireCount(root, "worldbody", 1, 1, message);
  if (!ok(st)) return st;
  st = requireCount(root, "defaults", 0, 1, message);
  if (!ok(st)) return st;

  const std::string root_path = childPath({}, root);
  for (const auto& c : root.children) {
    const std::string cpath = childPath(root_path, c);

    if (c.tag == "options") {
      if (!c.children.empty()) return misplaced(c.children.front(), cpath, message);
    } else if (c.tag == "defaults") {
      st = requireCount(c, "geom", 0, 1, message);
      if (!ok(st)) return st;
      st = requireCount(c, "body", 0, 1, message);
      if (!ok(st)) return st;
      for (const auto& d : c.children) {
        const std::string dpath = childPath(cpath, d);
        if (d.tag != "geom" && d.tag != "body") return misplaced(d, dpath, message);
        if (!d.children.empty()) return misplaced(d.children.front(), dpath, message);
      }
    } else if (c.tag == "worldbody") {
      st = checkBodyTree(c, cpath, message);
      if (!ok(st)) return st;
    } else {
      return misplaced(c, cpath, message);
    }
  }
  return Status::Success;
}

}  // namespace kintree::xml

#include "kintree/xml/tree_walker.hpp"

#include "kintree/core/common/logger.hpp"
#include "kintree/core/math/so3.hpp"
#include "kintree/xml/visual.hpp"

#include <sstream>

namespace kintree::xml {

using namespace kintree::core;

namespace {

struct PendingBody {
  const Element* body;
  int parent;
};

std::string elementLabel(const Element& e) {
  std::ostringstream oss;
  oss << "<" << e.tag;
  if (const AttributeValue* name = e.attribute("name")) oss << " name=\"" << name->text << "\"";
  oss << ">";
  if (e.line > 0) oss << " (line " << e.line << ")";
  return oss.str();
}

std::string attrPath(const Element& e, const std::string& attr) {
  return "attribute '" + attr + "' of " + elementLabel(e);
}

Status missing(const Element& e, const std::string& attr, std::string* message) {
  *message = "missing required " + attrPath(e, attr);
  return Status::MissingAttribute;
}

Status requireText(const Element& e, const std::string& attr, std::string* out,
                   std::string* message) {
  const AttributeValue* v = e.attribute(attr);
  if (!v) return missing(e, attr, message);
  *out = v->text;
  return Status::Success;
}

// Numeric attribute with an exact entry count (`expected` < 0 accepts any count).
Status readNumbers(const AttributeValue& v, const Element& e, const std::string& attr,
                   int expected, VecX* out, std::string* message) {
  if (!v.isNumeric()) {
    *message = attrPath(e, attr) + " is not numeric: \"" + v.text + "\"";
    return Status::InvalidAttribute;
  }
  if (expected >= 0 && v.numbers->size() != expected) {
    std::ostringstream oss;
    oss << attrPath(e, attr) << " needs " << expected << " value(s), got "
        << v.numbers->size() << ": \"" << v.text << "\"";
    *message = oss.str();
    return Status::InvalidAttribute;
  }
  *out = *v.numbers;
  return Status::Success;
}

Status requireNumbers(const Element& e, const std::string& attr, int expected, VecX* out,
                      std::string* message) {
  const AttributeValue* v = e.attribute(attr);
  if (!v) return missing(e, attr, message);
  return readNumbers(*v, e, attr, expected, out, message);
}

// damping / armature: zeros when absent, a scalar is broadcast to the joint width.
Status readJointVector(const Element& body, const std::string& attr, int width, VecX* out,
                       std::string* message) {
  const AttributeValue* v = body.attribute(attr);
  if (!v) {
    *out = VecX::Zero(width);
    return Status::Success;
  }

  VecX values;
  const Status st = readNumbers(*v, body, attr, -1, &values, message);
  if (!ok(st)) return st;

  if (values.size() == width) {
    *out = values;
    return Status::Success;
  }
  if (values.size() == 1) {
    *out = VecX::Constant(width, values(0));
    return Status::Success;
  }

  std::ostringstream oss;
  oss << attrPath(body, attr) << " has " << values.size() << " values, joint needs "
      << width << " (or a single value)";
  *message = oss.str();
  return Status::InvalidAttribute;
}

Status visitBody(const Element& body, int parent, const LoadOptions& opt, TraversalContext* ctx,
                 std::string* message) {
  BodyNode node;
  node.id = ctx->next_id++;
  node.parent = parent;

  Status st = requireText(body, "name", &node.name, message);
  if (!ok(st)) return st;

  std::string joint_key;
  st = requireText(body, "joint", &joint_key, message);
  if (!ok(st)) return st;

  const std::optional<JointType> joint = jointTypeFromString(joint_key);
  if (!joint) {
    *message = "unknown joint type \"" + joint_key + "\" in " + attrPath(body, "joint");
    return Status::UnknownJointType;
  }
  node.joint = *joint;

  if (const AttributeValue* pos = body.attribute("pos")) {
    VecX p;
    st = readNumbers(*pos, body, "pos", 3, &p, message);
    if (!ok(st)) return st;
    node.transform.pos = p;
  }

  st = resolveOrientation(body, opt, &node.transform.rot, message);
  if (!ok(st)) return st;

  const int width = qdWidth(node.joint);
  st = readJointVector(body, "damping", width, &node.damping, message);
  if (!ok(st)) return st;
  st = readJointVector(body, "armature", width, &node.armature, message);
  if (!ok(st)) return st;

  for (const Element* g : body.childrenWithTag("geom")) {
    GeomSpec geom;
    st = parseGeom(*g, &geom, message);
    if (!ok(st)) return st;
    node.geoms.push_back(std::move(geom));
  }

  LogLine(LogLevel::Debug) << "link " << node.id << " \"" << node.name << "\" parent "
                           << node.parent << " joint " << jointTypeName(node.joint) << " geoms "
                           << node.geoms.size();
  ctx->bodies.push_back(std::move(node));
  return Status::Success;
}

}  // namespace

Status resolveOrientation(const Element& body, const LoadOptions& opt, Quat* out,
                          std::string* message) {
  if (!out || !message) {
    log(LogLevel::Error, "resolveOrientation: null output");
    return Status::InvalidParameter;
  }

  const AttributeValue* quat = body.attribute("quat");
  const AttributeValue* euler = body.attribute("euler");

  if (quat && euler) {
    *message = "both 'quat' and 'euler' given on " + elementLabel(body);
    return Status::ConflictingOrientation;
  }

  if (quat) {
    VecX wxyz;
    const Status st = readNumbers(*quat, body, "quat", 4, &wxyz, message);
    if (!ok(st)) return st;
    Quat q = quatFromWxyz(Vec4(wxyz));
    if (opt.normalize_quat) {
      if (!(q.norm() > opt.thresholds.quat_norm_eps)) {
        *message = attrPath(body, "quat") + " has zero norm";
        return Status::InvalidAttribute;
      }
      q.normalize();
    }
    *out = q;
    return Status::Success;
  }

  if (euler) {
    VecX deg;
    const Status st = readNumbers(*euler, body, "euler", 3, &deg, message);
    if (!ok(st)) return st;
    *out = quatFromEuler(deg2rad(Vec3(deg)));
    return Status::Success;
  }

  *out = Quat::Identity();
  return Status::Success;
}

Status parseGeom(const Element& geom, GeomSpec* out, std::string* message) {
  if (!out || !message) {
    log(LogLevel::Error, "parseGeom: null output");
    return Status::InvalidParameter;
  }

  std::string type_key;
  Status st = requireText(geom, "type", &type_key, message);
  if (!ok(st)) return st;

  const std::optional<GeomType> type = geomTypeFromString(type_key);
  if (!type) {
    *message = "unknown geom shape \"" + type_key + "\" in " + attrPath(geom, "type");
    return Status::UnknownGeomShape;
  }

  VecX mass;
  st = requireNumbers(geom, "mass", 1, &mass, message);
  if (!ok(st)) return st;

  VecX pos;
  st = requireNumbers(geom, "pos", 3, &pos, message);
  if (!ok(st)) return st;

  VecX dim;
  st = requireNumbers(geom, "dim", geomDimCount(*type), &dim, message);
  if (!ok(st)) return st;

  GeomSpec g;
  st = makeGeomShape(*type, dim, &g.shape);
  if (!ok(st)) {
    *message = attrPath(geom, "dim") + " does not fit a " + geomTypeName(*type);
    return st;
  }
  g.mass = mass(0);
  g.local_position = pos;
  g.visual_metadata = extractVisualMetadata(geom.attributes);

  *out = std::move(g);
  return Status::Success;
}

Status walkBodies(const Element& worldbody, const LoadOptions& opt, TraversalContext* ctx,
                  std::string* message) {
  if (!ctx || !message) {
    log(LogLevel::Error, "walkBodies: null context");
    return Status::InvalidParameter;
  }

  // Children are pushed in reverse so the first child is visited next, giving pre-order ids.
  std::vector<PendingBody> stack;
  const auto roots = worldbody.childrenWithTag("body");
  for (auto it = roots.rbegin(); it != roots.rend(); ++it) stack.push_back({*it, -1});

  while (!stack.empty()) {
    const PendingBody cur = stack.back();
    stack.pop_back();

    const Status st = visitBody(*cur.body, cur.parent, opt, ctx, message);
    if (!ok(st)) return st;

    const int id = ctx->bodies.back().id;
    const auto children = cur.body->childrenWithTag("body");
    for (auto it = children.rbegin(); it != children.rend(); ++it) stack.push_back({*it, id});
  }
  return Status::Success;
}

}  // namespace kintree::xml

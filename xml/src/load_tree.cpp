#include "kintree/xml/load_tree.hpp"

#include "kintree/core/common/logger.hpp"
#include "kintree/xml/defaults.hpp"
#include "kintree/xml/document.hpp"
#include "kintree/xml/flatten.hpp"
#include "kintree/xml/numeric.hpp"
#include "kintree/xml/schema.hpp"
#include "kintree/xml/tree_walker.hpp"

#include <cmath>
#include <fstream>
#include <sstream>
#include <unordered_map>

namespace kintree::xml {

using namespace kintree::core;

static LoadResult fail(Status st, std::string msg) {
  LoadResult r;
  r.status = st;
  r.message = std::move(msg);
  LogLine(LogLevel::Error) << statusToString(st) << ": " << r.message;
  return r;
}

static Status readFileToString(const std::string& path, std::string* out) {
  if (!out) return Status::InvalidParameter;
  std::ifstream ifs(path);
  if (!ifs) return Status::Failure;
  std::ostringstream oss;
  oss << ifs.rdbuf();
  *out = oss.str();
  return Status::Success;
}

static Status parseSimOptions(const Element& options, SimOptions* out, std::string* message) {
  const AttributeValue* gravity = options.attribute("gravity");
  const AttributeValue* dt = options.attribute("dt");
  if (!gravity || !dt) {
    *message = std::string("missing required attribute '") + (gravity ? "dt" : "gravity") +
               "' of " + describe(options);
    return Status::MissingAttribute;
  }

  if (!gravity->isNumeric() || gravity->numbers->size() != 3) {
    *message = "'gravity' of " + describe(options) + " must be 3 numbers, got \"" +
               gravity->text + "\"";
    return Status::InvalidAttribute;
  }
  if (!dt->isNumeric() || dt->numbers->size() != 1 || !((*dt->numbers)(0) > 0.0) ||
      !std::isfinite((*dt->numbers)(0))) {
    *message = "'dt' of " + describe(options) + " must be a positive number, got \"" +
               dt->text + "\"";
    return Status::InvalidAttribute;
  }

  out->gravity = *gravity->numbers;
  out->dt = (*dt->numbers)(0);
  return Status::Success;
}

static Status checkUniqueNames(const std::vector<BodyNode>& bodies, std::string* message) {
  std::unordered_map<std::string, int> seen;
  for (const auto& b : bodies) {
    const auto ins = seen.emplace(b.name, b.id);
    if (!ins.second) {
      std::ostringstream oss;
      oss << "body name \"" << b.name << "\" used by links " << ins.first->second << " and "
          << b.id;
      *message = oss.str();
      return Status::DuplicateName;
    }
  }
  return Status::Success;
}

LoadResult loadTreeFromString(const std::string& xml, const LoadOptions& opt) {
  std::string msg;

  Element root;
  Status st = parseDocument(xml, &root, &msg);
  if (!ok(st)) return fail(st, msg);

  // Schema first: nothing is interpreted before every tag and attribute is known.
  st = validateSchema(root, &msg);
  if (!ok(st)) return fail(st, msg);

  st = validateStructure(root, &msg);
  if (!ok(st)) return fail(st, msg);

  coerceNumericAttributes(&root);

  SimOptions sim;
  st = parseSimOptions(*root.childrenWithTag("options").front(), &sim, &msg);
  if (!ok(st)) return fail(st, msg);

  DefaultsTable defaults;
  st = extractDefaults(root, &defaults, &msg);
  if (!ok(st)) return fail(st, msg);

  Element& worldbody = *root.childrenWithTag("worldbody").front();
  mixInDefaults(&worldbody, defaults);

  TraversalContext ctx;
  st = walkBodies(worldbody, opt, &ctx, &msg);
  if (!ok(st)) return fail(st, msg);

  if (opt.require_unique_names) {
    st = checkUniqueNames(ctx.bodies, &msg);
    if (!ok(st)) return fail(st, msg);
  }

  LoadResult res;
  st = flattenTree(std::move(ctx.bodies), &res.tree, &msg);
  if (!ok(st)) return fail(st, msg);

  res.tree.options = sim;
  if (const AttributeValue* model = root.attribute("model")) {
    res.tree.model_name = model->text;
  }

  res.status = Status::Success;
  res.message = "OK";
  LogLine(LogLevel::Info) << "loaded model \"" << res.tree.model_name << "\": "
                          << res.tree.numLinks() << " links, " << res.tree.qdSize() << " dofs";
  return res;
}

LoadResult loadTreeFromFile(const std::string& path, const LoadOptions& opt) {
  std::string xml;
  const Status st = readFileToString(path, &xml);
  if (!ok(st)) {
    return fail(st, "failed to open model file: " + path);
  }
  return loadTreeFromString(xml, opt);
}

}  // namespace kintree::xml

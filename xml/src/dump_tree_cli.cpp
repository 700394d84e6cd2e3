#include <cstring>
#include <iomanip>
#include <iostream>
#include <string>
#include <variant>

#include "kintree/core/common/logger.hpp"
#include "kintree/core/common/status.hpp"
#include "kintree/core/math/types.hpp"
#include "kintree/xml/load_tree.hpp"

using kintree::core::GeomSpec;
using kintree::core::KinematicTree;
using kintree::core::LogLevel;
using kintree::core::ok;
using kintree::core::parseLogLevel;
using kintree::core::setLogLevel;
using kintree::core::statusToString;
using kintree::core::wxyzFromQuat;
using kintree::xml::LoadOptions;
using kintree::xml::LoadResult;

static bool parseFlag(int argc, char** argv, const char* key) {
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], key) == 0) {
      return true;
    }
  }
  return false;
}

static std::string parseStringArg(int argc, char** argv, const char* key, std::string def = {}) {
  const std::string prefix = std::string(key) + "=";
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], key) == 0 && i + 1 < argc) {
      return std::string(argv[i + 1]);
    }
    if (std::strncmp(argv[i], prefix.c_str(), prefix.size()) == 0) {
      return std::string(argv[i] + prefix.size());
    }
  }
  return def;
}

// First argument that is neither an option nor the value of `--log-level`.
static std::string parseModelPath(int argc, char** argv) {
  for (int i = 1; i < argc; ++i) {
    if (std::strncmp(argv[i], "--", 2) == 0) {
      if (std::strcmp(argv[i], "--log-level") == 0) ++i;
      continue;
    }
    return std::string(argv[i]);
  }
  return {};
}

static void printHelp() {
  std::cout << "Usage: kintree_dump <model.xml> [options]\n\n";
  std::cout << "Options:\n";
  std::cout << "  --allow-duplicate-names           Do not reject bodies sharing a name\n";
  std::cout << "  --normalize-quat                  Normalize body quaternions\n";
  std::cout << "  --log-level <error|warn|info|debug>\n";
  std::cout << "  --verbose                         Same as --log-level info\n";
}

static void printGeom(const GeomSpec& g) {
  std::cout << "      geom " << kintree::core::geomTypeName(kintree::core::geomTypeOf(g.shape))
            << " mass=" << g.mass << " pos=[" << g.local_position.transpose() << "]";
  if (const auto* box = std::get_if<kintree::core::Box>(&g.shape)) {
    std::cout << " dim=[" << box->dim_x << " " << box->dim_y << " " << box->dim_z << "]";
  } else if (const auto* sphere = std::get_if<kintree::core::Sphere>(&g.shape)) {
    std::cout << " radius=" << sphere->radius;
  } else if (const auto* cyl = std::get_if<kintree::core::Cylinder>(&g.shape)) {
    std::cout << " radius=" << cyl->radius << " length=" << cyl->length;
  }
  for (const auto& kv : g.visual_metadata) {
    std::cout << " vispy:" << kv.first << "=\"" << kv.second.text << "\"";
  }
  std::cout << "\n";
}

static void printTree(const KinematicTree& tree) {
  std::cout << "model: " << tree.model_name << "\n";
  std::cout << "links: " << tree.numLinks() << "  q: " << tree.qSize()
            << "  qd: " << tree.qdSize() << "\n";
  std::cout << "dt: " << tree.options.dt << "  gravity: [" << tree.options.gravity.transpose()
            << "]\n";

  for (int i = 0; i < tree.numLinks(); ++i) {
    const auto idx = static_cast<std::size_t>(i);
    const auto& T = tree.transforms[idx];
    std::cout << std::setw(4) << i << " " << tree.names[idx]
              << "  parent=" << tree.parents[idx]
              << "  joint=" << kintree::core::jointTypeName(tree.joint_types[idx])
              << "  pos=[" << T.pos.transpose() << "]"
              << "  quat=[" << wxyzFromQuat(T.rot).transpose() << "]\n";

    const int w = kintree::core::qdWidth(tree.joint_types[idx]);
    if (w > 0) {
      const int off = tree.qdOffset(i);
      std::cout << "      damping=[" << tree.dampings.segment(off, w).transpose() << "]"
                << "  armature=[" << tree.armatures.segment(off, w).transpose() << "]\n";
    }
    for (const auto& g : tree.geoms[idx]) printGeom(g);
  }
}

int main(int argc, char** argv) {
  if (parseFlag(argc, argv, "--help") || parseFlag(argc, argv, "-h")) {
    printHelp();
    return 0;
  }
  const std::string path = parseModelPath(argc, argv);
  if (path.empty()) {
    printHelp();
    return 2;
  }

  if (parseFlag(argc, argv, "--verbose")) {
    setLogLevel(LogLevel::Info);
  }
  const std::string level_arg = parseStringArg(argc, argv, "--log-level");
  if (!level_arg.empty()) {
    LogLevel level = LogLevel::Warn;
    if (!parseLogLevel(level_arg, &level)) {
      std::cerr << "Unknown log level: " << level_arg << "\n";
      return 2;
    }
    setLogLevel(level);
  }

  LoadOptions opt;
  opt.require_unique_names = !parseFlag(argc, argv, "--allow-duplicate-names");
  opt.normalize_quat = parseFlag(argc, argv, "--normalize-quat");

  const LoadResult lr = kintree::xml::loadTreeFromFile(path, opt);
  if (!ok(lr.status)) {
    std::cerr << "Failed to load " << path << " (" << statusToString(lr.status) << "): "
              << lr.message << "\n";
    return 1;
  }

  printTree(lr.tree);
  return 0;
}

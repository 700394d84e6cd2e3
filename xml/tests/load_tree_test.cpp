#include <cassert>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include <Eigen/Core>

#include "kintree/core/common/logger.hpp"
#include "kintree/core/math/so3.hpp"
#include "kintree/core/model/kinematic_tree.hpp"
#include "kintree/xml/load_tree.hpp"

using kintree::core::JointType;
using kintree::core::KinematicTree;
using kintree::core::LogLevel;
using kintree::core::Quat;
using kintree::core::Sphere;
using kintree::core::Status;
using kintree::core::Vec3;
using kintree::core::ok;
using kintree::xml::LoadOptions;
using kintree::xml::LoadResult;
using kintree::xml::loadTreeFromFile;
using kintree::xml::loadTreeFromString;

static bool near(double a, double b, double tol) {
  return std::abs(a - b) <= tol;
}

static void silentSink(LogLevel, const std::string&) {}

static std::string wrap(const std::string& worldbody, const std::string& defaults = {}) {
  std::ostringstream oss;
  oss << "<x_xy model=\"test\">\n"
      << "  <options gravity=\"0 0 -9.81\" dt=\"0.01\"/>\n"
      << defaults
      << "  <worldbody>\n" << worldbody << "  </worldbody>\n"
      << "</x_xy>\n";
  return oss.str();
}

static bool sameTree(const KinematicTree& a, const KinematicTree& b) {
  if (a.parents != b.parents || a.joint_types != b.joint_types || a.names != b.names) return false;
  if (a.dampings.size() != b.dampings.size() || a.armatures.size() != b.armatures.size()) {
    return false;
  }
  if (a.dampings != b.dampings || a.armatures != b.armatures) return false;
  if (a.transforms.size() != b.transforms.size() || a.geoms.size() != b.geoms.size()) return false;
  for (std::size_t i = 0; i < a.transforms.size(); ++i) {
    if (a.transforms[i].pos != b.transforms[i].pos) return false;
    if (a.transforms[i].rot.coeffs() != b.transforms[i].rot.coeffs()) return false;
    if (a.geoms[i].size() != b.geoms[i].size()) return false;
    for (std::size_t k = 0; k < a.geoms[i].size(); ++k) {
      const auto& ga = a.geoms[i][k];
      const auto& gb = b.geoms[i][k];
      if (ga.mass != gb.mass || ga.local_position != gb.local_position) return false;
      if (kintree::core::geomTypeOf(ga.shape) != kintree::core::geomTypeOf(gb.shape)) return false;
      if (ga.visual_metadata.size() != gb.visual_metadata.size()) return false;
    }
  }
  return true;
}

static void test_two_link_scenario() {
  const std::string xml = wrap(R"(
    <body name="a" joint="free" pos="0 0 1">
      <body name="b" joint="hinge">
        <geom type="sphere" mass="1.0" pos="0 0 0" dim="0.1"/>
      </body>
    </body>
)");

  const LoadResult lr = loadTreeFromString(xml);
  assert(ok(lr.status));
  assert(lr.message == "OK");

  const KinematicTree& t = lr.tree;
  assert(ok(t.validate()));
  assert(t.model_name == "test");
  assert(t.numLinks() == 2);
  assert(t.parents[0] == -1 && t.parents[1] == 0);
  assert(t.names[0] == "a" && t.names[1] == "b");
  assert(t.joint_types[0] == JointType::Free);
  assert(t.joint_types[1] == JointType::Hinge);

  assert(t.geoms[0].empty());
  assert(t.geoms[1].size() == 1);
  const auto& g = t.geoms[1][0];
  assert(near(std::get<Sphere>(g.shape).radius, 0.1, 1e-15));
  assert(near(g.mass, 1.0, 1e-15));

  assert(t.transforms[0].pos == Vec3(0, 0, 1));
  assert(t.transforms[1].pos == Vec3::Zero());
  assert(kintree::core::rotationDistance(t.transforms[0].rot, Quat::Identity()) == 0.0);

  assert(t.dampings.size() == 7 && t.armatures.size() == 7);
  assert(t.dampings.isZero() && t.armatures.isZero());

  assert(near(t.options.dt, 0.01, 1e-15));
  assert(near(t.options.gravity.z(), -9.81, 1e-15));
}

static void test_parent_ordering_and_widths() {
  const std::string xml = wrap(R"(
    <body name="torso" joint="free">
      <body name="l_hip" joint="saddle">
        <body name="l_knee" joint="ry"/>
      </body>
      <body name="r_hip" joint="spherical">
        <body name="r_knee" joint="ry">
          <body name="r_foot" joint="frozen"/>
        </body>
      </body>
    </body>
    <body name="ball" joint="p3d"/>
    <body name="marker" joint="cor"/>
)");

  const LoadResult lr = loadTreeFromString(xml);
  assert(ok(lr.status));
  const KinematicTree& t = lr.tree;

  assert(t.numLinks() == 8);
  assert(t.parents[0] == -1);
  int qd = 0;
  for (int i = 0; i < t.numLinks(); ++i) {
    const int p = t.parents[static_cast<std::size_t>(i)];
    assert(p == -1 || p < i);
    qd += kintree::core::qdWidth(t.joint_types[static_cast<std::size_t>(i)]);
  }
  assert(qd == 6 + 2 + 1 + 3 + 1 + 0 + 3 + 9);
  assert(t.dampings.size() == qd && t.armatures.size() == qd);
  assert(t.qdSize() == qd);

  assert(t.names[2] == "l_knee" && t.parents[2] == 1);
  assert(t.names[5] == "r_foot" && t.parents[5] == 4);
  assert(t.names[6] == "ball" && t.parents[6] == -1);
  assert(t.linkIndex("marker") == 7);
}

static void test_damping_defaults() {
  const std::string defaults = R"(  <defaults>
    <body damping="0.1"/>
  </defaults>
)";
  const std::string xml = wrap(R"(
    <body name="floating" joint="free"/>
    <body name="pin" joint="hinge" damping="0.5"/>
    <body name="slider" joint="px" armature="2"/>
    <body name="fixed" joint="frozen"/>
)", defaults);

  const LoadResult lr = loadTreeFromString(xml);
  assert(ok(lr.status));
  const KinematicTree& t = lr.tree;

  assert(t.dampings.size() == 8);
  for (int i = 0; i < 6; ++i) assert(near(t.dampings(i), 0.1, 1e-15));
  assert(near(t.dampings(6), 0.5, 1e-15));
  assert(near(t.dampings(7), 0.1, 1e-15));

  assert(t.armatures.size() == 8);
  assert(t.armatures.head(7).isZero());
  assert(t.armatures(7) == 2.0);
}

static void test_explicit_vectors() {
  const LoadResult lr = loadTreeFromString(wrap(R"(
    <body name="ball" joint="spherical" damping="1 2 3" armature="0.1 0.2 0.3"/>
)"));
  assert(ok(lr.status));
  assert(lr.tree.dampings(1) == 2.0);
  assert(near(lr.tree.armatures(2), 0.3, 1e-15));

  const LoadResult bad = loadTreeFromString(wrap(R"(
    <body name="ball" joint="spherical" damping="1 2"/>
)"));
  assert(bad.status == Status::InvalidAttribute);
  assert(bad.message.find("damping") != std::string::npos);
}

static void test_visual_metadata() {
  const LoadResult lr = loadTreeFromString(wrap(R"(
    <body name="a" joint="free">
      <geom type="box" mass="1" pos="0 0 0" dim="1 2 3" vispy_color="1 0 0" vispy_edge_color="black"/>
    </body>
)"));
  assert(ok(lr.status));

  const auto& g = lr.tree.geoms[0][0];
  assert(g.visual_metadata.size() == 2);
  const auto& color = g.visual_metadata.at("color");
  assert(color.isNumeric());
  assert(color.numbers->size() == 3);
  assert((*color.numbers)(0) == 1.0 && (*color.numbers)(1) == 0.0 && (*color.numbers)(2) == 0.0);
  assert(g.visual_metadata.at("edge_color").text == "black");
  assert(!g.visual_metadata.at("edge_color").isNumeric());

  const auto& box = std::get<kintree::core::Box>(g.shape);
  assert(box.dim_x == 1.0 && box.dim_y == 2.0 && box.dim_z == 3.0);

  // the separator alone still marks a visual attribute, stored under the empty key
  const LoadResult bare = loadTreeFromString(wrap(R"(
    <body name="a" joint="free">
      <geom type="sphere" mass="1" pos="0 0 0" dim="0.5" vispy_="1"/>
    </body>
)"));
  assert(ok(bare.status));
  const auto& meta = bare.tree.geoms[0][0].visual_metadata;
  assert(meta.size() == 1);
  assert(meta.at("").text == "1");
}

static void test_geom_defaults() {
  const std::string defaults = R"(  <defaults>
    <geom mass="0.5" pos="0 0 0" vispy_color="0 1 0"/>
  </defaults>
)";
  const LoadResult lr = loadTreeFromString(wrap(R"(
    <body name="a" joint="free">
      <geom type="sphere" dim="0.2"/>
      <geom type="cylinder" mass="3" dim="0.1 0.5" vispy_color="1 1 1"/>
    </body>
)", defaults));
  assert(ok(lr.status));

  const auto& geoms = lr.tree.geoms[0];
  assert(geoms.size() == 2);
  assert(geoms[0].mass == 0.5);
  assert(geoms[0].visual_metadata.at("color").text == "0 1 0");
  assert(geoms[1].mass == 3.0);
  assert(geoms[1].visual_metadata.at("color").text == "1 1 1");
  assert(kintree::core::geomTypeOf(geoms[1].shape) == kintree::core::GeomType::Cylinder);
}

static void test_empty_defaults_round_trip() {
  const std::string body = R"(
    <body name="a" joint="free" pos="0 0 1" euler="10 20 30" damping="1 1 1 1 1 1" armature="0">
      <geom type="box" mass="1" pos="0 0 0" dim="1 1 1" vispy_color="1 0 0"/>
      <body name="b" joint="rx" quat="0 1 0 0" damping="0.3" armature="0.4">
        <geom type="sphere" mass="2" pos="0 0 1" dim="0.5"/>
      </body>
    </body>
)";

  const LoadResult without = loadTreeFromString(wrap(body));
  const LoadResult with_empty = loadTreeFromString(wrap(body, "  <defaults/>\n"));
  const LoadResult with_empty_tags =
      loadTreeFromString(wrap(body, "  <defaults><geom/><body/></defaults>\n"));
  assert(ok(without.status) && ok(with_empty.status) && ok(with_empty_tags.status));
  assert(sameTree(without.tree, with_empty.tree));
  assert(sameTree(without.tree, with_empty_tags.tree));
}

static void test_orientation_rules() {
  const LoadResult lr = loadTreeFromString(wrap(R"(
    <body name="plain" joint="free"/>
    <body name="turned" joint="free" euler="0 0 90"/>
    <body name="given" joint="free" quat="0 0 1 0"/>
)"));
  assert(ok(lr.status));
  const auto& T = lr.tree.transforms;

  assert(T[0].rot.w() == 1.0 && T[0].rot.vec().isZero());

  const Vec3 x_rot = T[1].rot * Vec3::UnitX();
  assert(near(x_rot.y(), 1.0, 1e-12));
  assert(near(T[1].rot.w(), std::sqrt(0.5), 1e-12));

  assert(T[2].rot.w() == 0.0 && T[2].rot.y() == 1.0);

  const LoadResult both = loadTreeFromString(wrap(R"(
    <body name="a" joint="free">
      <body name="b" joint="rx" quat="1 0 0 0" euler="0 0 0"/>
    </body>
)"));
  assert(both.status == Status::ConflictingOrientation);
  assert(both.message.find("\"b\"") != std::string::npos);
  assert(both.tree.numLinks() == 0);
}

static void test_failures() {
  // unknown tag is rejected before anything else, even with other problems present
  const LoadResult motor = loadTreeFromString(R"(<x_xy>
  <worldbody><body name="a" joint="warp"><motor/></body></worldbody>
</x_xy>)");
  assert(motor.status == Status::SchemaViolation);
  assert(motor.message.find("motor") != std::string::npos);

  const LoadResult attr = loadTreeFromString(wrap(R"(
    <body name="a" joint="free" mass="1"/>
)"));
  assert(attr.status == Status::SchemaViolation);

  const LoadResult vispy_on_body = loadTreeFromString(wrap(R"(
    <body name="a" joint="free" vispy_color="1 0 0"/>
)"));
  assert(vispy_on_body.status == Status::SchemaViolation);

  const LoadResult no_options = loadTreeFromString(R"(<x_xy><worldbody/></x_xy>)");
  assert(no_options.status == Status::StructuralViolation);

  const LoadResult two_options = loadTreeFromString(R"(<x_xy>
  <options gravity="0 0 0" dt="1"/><options gravity="0 0 0" dt="1"/><worldbody/>
</x_xy>)");
  assert(two_options.status == Status::StructuralViolation);

  const LoadResult no_dt = loadTreeFromString(R"(<x_xy>
  <options gravity="0 0 -9.81"/><worldbody/>
</x_xy>)");
  assert(no_dt.status == Status::MissingAttribute);

  const LoadResult bad_dt = loadTreeFromString(R"(<x_xy>
  <options gravity="0 0 -9.81" dt="-1"/><worldbody/>
</x_xy>)");
  assert(bad_dt.status == Status::InvalidAttribute);

  const LoadResult short_gravity = loadTreeFromString(R"(<x_xy>
  <options gravity="0 -9.81" dt="0.01"/><worldbody/>
</x_xy>)");
  assert(short_gravity.status == Status::InvalidAttribute);
  assert(short_gravity.message.find("gravity") != std::string::npos);

  const LoadResult text_gravity = loadTreeFromString(R"(<x_xy>
  <options gravity="down" dt="0.01"/><worldbody/>
</x_xy>)");
  assert(text_gravity.status == Status::InvalidAttribute);

  const LoadResult options_child = loadTreeFromString(R"(<x_xy>
  <options gravity="0 0 -9.81" dt="0.01"><geom/></options><worldbody/>
</x_xy>)");
  assert(options_child.status == Status::StructuralViolation);

  const LoadResult defaults_child = loadTreeFromString(R"(<x_xy>
  <options gravity="0 0 -9.81" dt="0.01"/><defaults><options/></defaults><worldbody/>
</x_xy>)");
  assert(defaults_child.status == Status::StructuralViolation);

  const LoadResult joint = loadTreeFromString(wrap(R"(
    <body name="a" joint="ball"/>
)"));
  assert(joint.status == Status::UnknownJointType);
  assert(joint.message.find("ball") != std::string::npos);

  const LoadResult shape = loadTreeFromString(wrap(R"(
    <body name="a" joint="free">
      <geom type="capsule" mass="1" pos="0 0 0" dim="0.1 1"/>
    </body>
)"));
  assert(shape.status == Status::UnknownGeomShape);

  const LoadResult no_joint = loadTreeFromString(wrap(R"(
    <body name="a"/>
)"));
  assert(no_joint.status == Status::MissingAttribute);

  const LoadResult malformed = loadTreeFromString("<x_xy><options>");
  assert(malformed.status == Status::ParseError);

  const LoadResult missing_file = loadTreeFromFile("/nonexistent/kintree/model.xml");
  assert(missing_file.status == Status::Failure);
}

static void test_duplicate_names() {
  const std::string xml = wrap(R"(
    <body name="link" joint="free">
      <body name="link" joint="rx"/>
    </body>
)");

  const LoadResult strict = loadTreeFromString(xml);
  assert(strict.status == Status::DuplicateName);
  assert(strict.message.find("\"link\"") != std::string::npos);

  LoadOptions opt;
  opt.require_unique_names = false;
  const LoadResult relaxed = loadTreeFromString(xml, opt);
  assert(ok(relaxed.status));
  assert(relaxed.tree.numLinks() == 2);
  assert(relaxed.tree.linkIndex("link") == 0);
}

static void test_normalize_quat() {
  const std::string scaled = wrap(R"(
    <body name="a" joint="free" quat="2 0 0 0"/>
)");
  LoadOptions opt;
  opt.normalize_quat = true;

  const LoadResult as_written = loadTreeFromString(scaled);
  assert(ok(as_written.status));
  assert(near(as_written.tree.transforms[0].rot.w(), 2.0, 1e-15));

  const LoadResult normalized = loadTreeFromString(scaled, opt);
  assert(ok(normalized.status));
  assert(near(normalized.tree.transforms[0].rot.w(), 1.0, 1e-15));

  const LoadResult zero = loadTreeFromString(wrap(R"(
    <body name="a" joint="free" quat="0 0 0 0"/>
)"), opt);
  assert(zero.status == Status::InvalidAttribute);
  assert(zero.message.find("quat") != std::string::npos);

  // without normalization the zero quaternion is kept as written
  const LoadResult kept = loadTreeFromString(wrap(R"(
    <body name="a" joint="free" quat="0 0 0 0"/>
)"));
  assert(ok(kept.status));
}

static void test_numeric_like_names() {
  const LoadResult lr = loadTreeFromString(wrap(R"(
    <body name="1" joint="free"/>
)"));
  assert(ok(lr.status));
  assert(lr.tree.names[0] == "1");
}

static void test_load_from_file() {
  const std::string path = "kintree_load_tree_test_model.xml";
  {
    std::ofstream out(path);
    assert(out && "failed to create model file");
    out << wrap(R"(
    <body name="pendulum" joint="ry" pos="0 0 2">
      <geom type="cylinder" mass="1" pos="0 0 -0.5" dim="0.05 1"/>
    </body>
)");
  }

  const LoadResult lr = loadTreeFromFile(path);
  assert(ok(lr.status));
  assert(lr.tree.numLinks() == 1);
  assert(lr.tree.names[0] == "pendulum");

  const auto world = lr.tree.worldTransforms();
  assert(near(world[0].pos.z(), 2.0, 1e-15));

  std::remove(path.c_str());
}

int main() {
  kintree::core::setLogSink(&silentSink);

  test_two_link_scenario();
  test_parent_ordering_and_widths();
  test_damping_defaults();
  test_explicit_vectors();
  test_visual_metadata();
  test_geom_defaults();
  test_empty_defaults_round_trip();
  test_orientation_rules();
  test_failures();
  test_duplicate_names();
  test_normalize_quat();
  test_numeric_like_names();
  test_load_from_file();

  kintree::core::setLogSink(nullptr);
  std::cout << "kintree_xml_load_tree_test: PASS\n";
  return 0;
}

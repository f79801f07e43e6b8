//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <glm/gtc/quaternion.hpp>
#include <loguru.hpp>

#include <Argon/Base/VariantHelpers.h>
#include <Argon/Scene/GraphJson.h>

using nlohmann::json;

using argon::Overloads;
using argon::scene::Camera;
using argon::scene::Collider;
using argon::scene::ColliderShape;
using argon::scene::Emitter;
using argon::scene::GeometrySource;
using argon::scene::Graph;
using argon::scene::HeightfieldShape;
using argon::scene::Joint;
using argon::scene::Light;
using argon::scene::LightKind;
using argon::scene::LodControlledObjects;
using argon::scene::LodGroup;
using argon::scene::Mesh;
using argon::scene::Model;
using argon::scene::ModelResolver;
using argon::scene::Node;
using argon::scene::NodeHandle;
using argon::scene::NodeKind;
using argon::scene::ParticleSystem;
using argon::scene::Pivot;
using argon::scene::Property;
using argon::scene::PropertyValue;
using argon::scene::RigidBody;
using argon::scene::SkyBox;
using argon::scene::SkyBoxFace;
using argon::scene::Surface;
using argon::scene::SurfaceData;
using argon::scene::Terrain;
using argon::scene::TrimeshShape;
using argon::scene::Viewport;

namespace shape = argon::physics::shape;
namespace joint = argon::physics::joint;

namespace {

//=== Values ===--------------------------------------------------------------//

auto ToJson(const glm::vec3& v) -> json { return json::array({ v.x, v.y, v.z }); }

auto ToJson(const glm::quat& q) -> json
{
  return json::array({ q.w, q.x, q.y, q.z });
}

auto ToJson(const glm::mat4& m) -> json
{
  auto values = json::array();
  for (int column = 0; column < 4; ++column) {
    for (int row = 0; row < 4; ++row) {
      values.push_back(m[column][row]);
    }
  }
  return values;
}

auto ToJson(const NodeHandle handle) -> json
{
  if (handle.IsNone()) {
    return nullptr;
  }
  return json::array({ handle.Index(), handle.Generation() });
}

auto ToJson(const argon::physics::Isometry& isometry) -> json
{
  return { { "translation", ToJson(isometry.translation) },
    { "rotation", ToJson(isometry.rotation) } };
}

auto ToJson(const argon::physics::InteractionGroups& groups) -> json
{
  return { { "memberships", groups.memberships }, { "filter", groups.filter } };
}

auto ReadVec3(const json& j) -> glm::vec3
{
  return { j.at(0).get<float>(), j.at(1).get<float>(), j.at(2).get<float>() };
}

auto ReadQuat(const json& j) -> glm::quat
{
  return { j.at(0).get<float>(), j.at(1).get<float>(), j.at(2).get<float>(),
    j.at(3).get<float>() };
}

auto ReadMat4(const json& j) -> glm::mat4
{
  glm::mat4 m { 1.0F };
  for (int column = 0; column < 4; ++column) {
    for (int row = 0; row < 4; ++row) {
      m[column][row] = j.at(static_cast<std::size_t>(column * 4 + row)).get<float>();
    }
  }
  return m;
}

auto ReadHandle(const json& j) -> NodeHandle
{
  if (j.is_null()) {
    return NodeHandle::None();
  }
  return { j.at(0).get<uint32_t>(), j.at(1).get<uint32_t>() };
}

auto ReadHandles(const json& j) -> std::vector<NodeHandle>
{
  std::vector<NodeHandle> handles;
  handles.reserve(j.size());
  for (const auto& entry : j) {
    handles.push_back(ReadHandle(entry));
  }
  return handles;
}

auto ReadIsometry(const json& j) -> argon::physics::Isometry
{
  return { .translation = ReadVec3(j.at("translation")),
    .rotation = ReadQuat(j.at("rotation")) };
}

auto ReadGroups(const json& j) -> argon::physics::InteractionGroups
{
  return { .memberships = j.at("memberships").get<uint32_t>(),
    .filter = j.at("filter").get<uint32_t>() };
}

//! Finds the enumerator whose to_string() is `name`, among `values`.
template <typename E, std::size_t N>
auto ReadEnum(const json& j, const std::array<E, N>& values) -> E
{
  const auto name = j.get<std::string>();
  for (const auto value : values) {
    if (name == to_string(value)) {
      return value;
    }
  }
  throw std::invalid_argument(fmt::format("unknown enumerator '{}'", name));
}

constexpr std::array kBodyTypes {
  argon::physics::BodyType::kDynamic,
  argon::physics::BodyType::kStatic,
  argon::physics::BodyType::kKinematicPositionBased,
  argon::physics::BodyType::kKinematicVelocityBased,
};

constexpr std::array kLightKinds {
  LightKind::kPoint,
  LightKind::kSpot,
  LightKind::kDirectional,
};

//=== Properties ===----------------------------------------------------------//

auto ToJson(const Property& property) -> json
{
  return std::visit(
    Overloads {
      [&](const bool value) -> json {
        return { { "name", property.name }, { "type", "bool" },
          { "value", value } };
      },
      [&](const int64_t value) -> json {
        return { { "name", property.name }, { "type", "int" },
          { "value", value } };
      },
      [&](const double value) -> json {
        return { { "name", property.name }, { "type", "float" },
          { "value", value } };
      },
      [&](const std::string& value) -> json {
        return { { "name", property.name }, { "type", "string" },
          { "value", value } };
      },
      [&](const NodeHandle value) -> json {
        return { { "name", property.name }, { "type", "node" },
          { "value", ToJson(value) } };
      },
    },
    property.value);
}

auto ReadProperty(const json& j) -> Property
{
  const auto type = j.at("type").get<std::string>();
  const auto& value = j.at("value");
  PropertyValue result;
  if (type == "bool") {
    result = value.get<bool>();
  } else if (type == "int") {
    result = value.get<int64_t>();
  } else if (type == "float") {
    result = value.get<double>();
  } else if (type == "string") {
    result = value.get<std::string>();
  } else if (type == "node") {
    result = ReadHandle(value);
  } else {
    throw std::invalid_argument(
      fmt::format("unknown property type '{}'", type));
  }
  return { .name = j.at("name").get<std::string>(), .value = std::move(result) };
}

//=== Shapes and joints ===---------------------------------------------------//

auto ToJson(const ColliderShape& collider_shape) -> json
{
  return std::visit(
    Overloads {
      [](const shape::Ball& s) -> json {
        return { { "type", "ball" }, { "radius", s.radius } };
      },
      [](const shape::Cylinder& s) -> json {
        return { { "type", "cylinder" }, { "half_height", s.half_height },
          { "radius", s.radius } };
      },
      [](const shape::RoundCylinder& s) -> json {
        return { { "type", "round_cylinder" }, { "half_height", s.half_height },
          { "radius", s.radius }, { "border_radius", s.border_radius } };
      },
      [](const shape::Cone& s) -> json {
        return { { "type", "cone" }, { "half_height", s.half_height },
          { "radius", s.radius } };
      },
      [](const shape::Cuboid& s) -> json {
        return { { "type", "cuboid" },
          { "half_extents", ToJson(s.half_extents) } };
      },
      [](const shape::Capsule& s) -> json {
        return { { "type", "capsule" }, { "begin", ToJson(s.begin) },
          { "end", ToJson(s.end) }, { "radius", s.radius } };
      },
      [](const shape::Segment& s) -> json {
        return { { "type", "segment" }, { "begin", ToJson(s.begin) },
          { "end", ToJson(s.end) } };
      },
      [](const shape::Triangle& s) -> json {
        return { { "type", "triangle" }, { "a", ToJson(s.a) },
          { "b", ToJson(s.b) }, { "c", ToJson(s.c) } };
      },
      [](const TrimeshShape& s) -> json {
        auto sources = json::array();
        for (const auto& source : s.sources) {
          sources.push_back(ToJson(source.node));
        }
        return { { "type", "trimesh" }, { "sources", std::move(sources) } };
      },
      [](const HeightfieldShape& s) -> json {
        return { { "type", "heightfield" },
          { "source", ToJson(s.geometry_source.node) } };
      },
    },
    collider_shape);
}

auto ReadShape(const json& j) -> ColliderShape
{
  const auto type = j.at("type").get<std::string>();
  if (type == "ball") {
    return shape::Ball { .radius = j.at("radius").get<float>() };
  }
  if (type == "cylinder") {
    return shape::Cylinder { .half_height = j.at("half_height").get<float>(),
      .radius = j.at("radius").get<float>() };
  }
  if (type == "round_cylinder") {
    return shape::RoundCylinder {
      .half_height = j.at("half_height").get<float>(),
      .radius = j.at("radius").get<float>(),
      .border_radius = j.at("border_radius").get<float>(),
    };
  }
  if (type == "cone") {
    return shape::Cone { .half_height = j.at("half_height").get<float>(),
      .radius = j.at("radius").get<float>() };
  }
  if (type == "cuboid") {
    return shape::Cuboid { .half_extents = ReadVec3(j.at("half_extents")) };
  }
  if (type == "capsule") {
    return shape::Capsule { .begin = ReadVec3(j.at("begin")),
      .end = ReadVec3(j.at("end")),
      .radius = j.at("radius").get<float>() };
  }
  if (type == "segment") {
    return shape::Segment { .begin = ReadVec3(j.at("begin")),
      .end = ReadVec3(j.at("end")) };
  }
  if (type == "triangle") {
    return shape::Triangle { .a = ReadVec3(j.at("a")),
      .b = ReadVec3(j.at("b")),
      .c = ReadVec3(j.at("c")) };
  }
  if (type == "trimesh") {
    TrimeshShape trimesh;
    for (const auto& source : j.at("sources")) {
      trimesh.sources.push_back(GeometrySource { .node = ReadHandle(source) });
    }
    return trimesh;
  }
  if (type == "heightfield") {
    return HeightfieldShape { .geometry_source
      = GeometrySource { .node = ReadHandle(j.at("source")) } };
  }
  throw std::invalid_argument(fmt::format("unknown collider shape '{}'", type));
}

auto ToJson(const argon::physics::JointParams& params) -> json
{
  return std::visit(
    Overloads {
      [](const joint::Ball& p) -> json {
        return { { "type", "ball" }, { "local_anchor1", ToJson(p.local_anchor1) },
          { "local_anchor2", ToJson(p.local_anchor2) } };
      },
      [](const joint::Fixed& p) -> json {
        return { { "type", "fixed" }, { "local_frame1", ToJson(p.local_frame1) },
          { "local_frame2", ToJson(p.local_frame2) } };
      },
      [](const joint::Prismatic& p) -> json {
        return { { "type", "prismatic" },
          { "local_anchor1", ToJson(p.local_anchor1) },
          { "local_axis1", ToJson(p.local_axis1) },
          { "local_anchor2", ToJson(p.local_anchor2) },
          { "local_axis2", ToJson(p.local_axis2) } };
      },
      [](const joint::Revolute& p) -> json {
        return { { "type", "revolute" },
          { "local_anchor1", ToJson(p.local_anchor1) },
          { "local_axis1", ToJson(p.local_axis1) },
          { "local_anchor2", ToJson(p.local_anchor2) },
          { "local_axis2", ToJson(p.local_axis2) } };
      },
    },
    params);
}

auto ReadJointParams(const json& j) -> argon::physics::JointParams
{
  const auto type = j.at("type").get<std::string>();
  if (type == "ball") {
    return joint::Ball { .local_anchor1 = ReadVec3(j.at("local_anchor1")),
      .local_anchor2 = ReadVec3(j.at("local_anchor2")) };
  }
  if (type == "fixed") {
    return joint::Fixed { .local_frame1 = ReadIsometry(j.at("local_frame1")),
      .local_frame2 = ReadIsometry(j.at("local_frame2")) };
  }
  if (type == "prismatic") {
    return joint::Prismatic {
      .local_anchor1 = ReadVec3(j.at("local_anchor1")),
      .local_axis1 = ReadVec3(j.at("local_axis1")),
      .local_anchor2 = ReadVec3(j.at("local_anchor2")),
      .local_axis2 = ReadVec3(j.at("local_axis2")),
    };
  }
  if (type == "revolute") {
    return joint::Revolute {
      .local_anchor1 = ReadVec3(j.at("local_anchor1")),
      .local_axis1 = ReadVec3(j.at("local_axis1")),
      .local_anchor2 = ReadVec3(j.at("local_anchor2")),
      .local_axis2 = ReadVec3(j.at("local_axis2")),
    };
  }
  throw std::invalid_argument(fmt::format("unknown joint type '{}'", type));
}

//=== Node kinds ===----------------------------------------------------------//

auto KindToJson(const NodeKind& kind) -> json
{
  return std::visit(
    Overloads {
      [](const Pivot&) -> json { return json::object(); },
      [](const Mesh& mesh) -> json {
        auto surfaces = json::array();
        for (const auto& surface : mesh.GetSurfaces()) {
          auto positions = json::array();
          auto triangles = json::array();
          if (surface.data) {
            for (const auto& position : surface.data->positions) {
              positions.push_back(ToJson(position));
            }
            for (const auto& triangle : surface.data->triangles) {
              triangles.push_back(triangle);
            }
          }
          auto bones = json::array();
          for (const auto bone : surface.bones) {
            bones.push_back(ToJson(bone));
          }
          surfaces.push_back({ { "positions", std::move(positions) },
            { "triangles", std::move(triangles) }, { "bones", std::move(bones) } });
        }
        return { { "surfaces", std::move(surfaces) } };
      },
      [](const Camera& camera) -> json {
        const auto& viewport = camera.GetViewport();
        json data {
          { "fov", camera.GetFov() },
          { "z_near", camera.GetZNear() },
          { "z_far", camera.GetZFar() },
          { "viewport",
            { { "x", viewport.x }, { "y", viewport.y },
              { "width", viewport.width }, { "height", viewport.height } } },
          { "enabled", camera.IsEnabled() },
          { "sky_box", nullptr },
        };
        if (const auto* sky_box = camera.GetSkyBox()) {
          auto faces = json::array();
          for (std::size_t i = 0; i < static_cast<std::size_t>(SkyBoxFace::kCount);
            ++i) {
            const auto& face = sky_box->GetFace(static_cast<SkyBoxFace>(i));
            faces.push_back(face ? json(*face) : json(nullptr));
          }
          data["sky_box"] = std::move(faces);
        }
        return data;
      },
      [](const Light& light) -> json {
        return {
          { "kind", to_string(light.GetKind()) },
          { "color", ToJson(light.GetColor()) },
          { "intensity", light.GetIntensity() },
          { "radius", light.GetRadius() },
          { "hotspot_cone_angle", light.GetHotspotConeAngle() },
          { "falloff_angle_delta", light.GetFalloffAngleDelta() },
          { "cast_shadows", light.CastsShadows() },
        };
      },
      [](const ParticleSystem& particle_system) -> json {
        auto emitters = json::array();
        for (const auto& emitter : particle_system.GetEmitters()) {
          emitters.push_back({
            { "position", ToJson(emitter.position) },
            { "spawn_rate", emitter.spawn_rate },
            { "max_particles", emitter.max_particles },
            { "particle_lifetime", emitter.particle_lifetime },
            { "initial_velocity", ToJson(emitter.initial_velocity) },
          });
        }
        return { { "emitters", std::move(emitters) },
          { "acceleration", ToJson(particle_system.GetAcceleration()) },
          { "enabled", particle_system.IsEnabled() } };
      },
      [](const Terrain& terrain) -> json {
        return { { "rows", terrain.GetRows() },
          { "columns", terrain.GetColumns() },
          { "cell_size", terrain.GetCellSize() },
          { "heights", terrain.GetHeights() } };
      },
      [](const RigidBody& body) -> json {
        return {
          { "body_type", to_string(body.GetBodyType()) },
          { "lin_vel", ToJson(body.GetLinVel()) },
          { "ang_vel", ToJson(body.GetAngVel()) },
          { "mass", body.GetMass() },
          { "lin_damping", body.GetLinDamping() },
          { "ang_damping", body.GetAngDamping() },
          { "rotation_locked",
            { body.IsXRotationLocked(), body.IsYRotationLocked(),
              body.IsZRotationLocked() } },
          { "translation_locked", body.IsTranslationLocked() },
        };
      },
      [](const Collider& collider) -> json {
        const auto density = collider.GetDensity();
        return {
          { "shape", ToJson(collider.GetShape()) },
          { "friction", collider.GetFriction() },
          { "density", density ? json(*density) : json(nullptr) },
          { "restitution", collider.GetRestitution() },
          { "collision_groups", ToJson(collider.GetCollisionGroups()) },
          { "solver_groups", ToJson(collider.GetSolverGroups()) },
          { "is_sensor", collider.IsSensor() },
        };
      },
      [](const Joint& joint) -> json {
        return { { "params", ToJson(joint.GetParams()) },
          { "body1", ToJson(joint.GetBody1()) },
          { "body2", ToJson(joint.GetBody2()) } };
      },
    },
    kind);
}

auto ReadMesh(const json& j) -> Mesh
{
  Mesh mesh;
  for (const auto& entry : j.at("surfaces")) {
    auto data = std::make_shared<SurfaceData>();
    for (const auto& position : entry.at("positions")) {
      data->positions.push_back(ReadVec3(position));
    }
    for (const auto& triangle : entry.at("triangles")) {
      data->triangles.push_back(triangle.get<std::array<uint32_t, 3>>());
    }
    mesh.AddSurface(
      Surface { .data = std::move(data), .bones = ReadHandles(entry.at("bones")) });
  }
  return mesh;
}

auto ReadCamera(const json& j) -> Camera
{
  Camera camera;
  camera.SetFov(j.at("fov").get<float>());
  camera.SetZNear(j.at("z_near").get<float>());
  camera.SetZFar(j.at("z_far").get<float>());
  const auto& viewport = j.at("viewport");
  camera.SetViewport(Viewport {
    .x = viewport.at("x").get<float>(),
    .y = viewport.at("y").get<float>(),
    .width = viewport.at("width").get<float>(),
    .height = viewport.at("height").get<float>(),
  });
  camera.SetEnabled(j.at("enabled").get<bool>());
  if (const auto& faces = j.at("sky_box"); !faces.is_null()) {
    SkyBox sky_box;
    for (std::size_t i = 0;
      i < static_cast<std::size_t>(SkyBoxFace::kCount) && i < faces.size(); ++i) {
      if (!faces[i].is_null()) {
        sky_box.SetFace(static_cast<SkyBoxFace>(i), faces[i].get<std::string>());
      }
    }
    camera.SetSkyBox(std::move(sky_box));
  }
  return camera;
}

auto ReadLight(const json& j) -> Light
{
  Light light(ReadEnum(j.at("kind"), kLightKinds));
  light.SetColor(ReadVec3(j.at("color")));
  light.SetIntensity(j.at("intensity").get<float>());
  light.SetRadius(j.at("radius").get<float>());
  light.SetHotspotConeAngle(j.at("hotspot_cone_angle").get<float>());
  light.SetFalloffAngleDelta(j.at("falloff_angle_delta").get<float>());
  light.SetCastShadows(j.at("cast_shadows").get<bool>());
  return light;
}

auto ReadParticleSystem(const json& j) -> ParticleSystem
{
  std::vector<Emitter> emitters;
  for (const auto& entry : j.at("emitters")) {
    emitters.push_back(Emitter {
      .position = ReadVec3(entry.at("position")),
      .spawn_rate = entry.at("spawn_rate").get<float>(),
      .max_particles = entry.at("max_particles").get<uint32_t>(),
      .particle_lifetime = entry.at("particle_lifetime").get<float>(),
      .initial_velocity = ReadVec3(entry.at("initial_velocity")),
    });
  }
  ParticleSystem particle_system(std::move(emitters));
  particle_system.SetAcceleration(ReadVec3(j.at("acceleration")));
  particle_system.SetEnabled(j.at("enabled").get<bool>());
  return particle_system;
}

auto ReadTerrain(const json& j) -> Terrain
{
  const auto rows = j.at("rows").get<uint32_t>();
  const auto columns = j.at("columns").get<uint32_t>();
  const auto heights = j.at("heights").get<std::vector<float>>();
  if (heights.size() != static_cast<std::size_t>(rows) * columns) {
    throw std::invalid_argument(fmt::format(
      "terrain has {} heights for a {}x{} grid", heights.size(), rows, columns));
  }

  Terrain terrain(rows, columns, j.at("cell_size").get<float>());
  for (uint32_t row = 0; row < rows; ++row) {
    for (uint32_t column = 0; column < columns; ++column) {
      terrain.SetHeight(row, column,
        heights[static_cast<std::size_t>(row) * columns + column]);
    }
  }
  return terrain;
}

auto ReadRigidBody(const json& j) -> RigidBody
{
  RigidBody body(ReadEnum(j.at("body_type"), kBodyTypes));
  body.SetLinVel(ReadVec3(j.at("lin_vel")));
  body.SetAngVel(ReadVec3(j.at("ang_vel")));
  body.SetMass(j.at("mass").get<float>());
  body.SetLinDamping(j.at("lin_damping").get<float>());
  body.SetAngDamping(j.at("ang_damping").get<float>());
  const auto& locks = j.at("rotation_locked");
  body.LockRotations(
    locks.at(0).get<bool>(), locks.at(1).get<bool>(), locks.at(2).get<bool>());
  body.SetTranslationLocked(j.at("translation_locked").get<bool>());
  body.ResetNative();
  return body;
}

auto ReadCollider(const json& j) -> Collider
{
  Collider collider(ReadShape(j.at("shape")));
  collider.SetFriction(j.at("friction").get<float>());
  if (const auto& density = j.at("density"); !density.is_null()) {
    collider.SetDensity(density.get<float>());
  }
  collider.SetRestitution(j.at("restitution").get<float>());
  collider.SetCollisionGroups(ReadGroups(j.at("collision_groups")));
  collider.SetSolverGroups(ReadGroups(j.at("solver_groups")));
  collider.SetIsSensor(j.at("is_sensor").get<bool>());
  collider.ResetNative();
  return collider;
}

auto ReadKind(const std::string& name, const json& j) -> NodeKind
{
  if (name == "Pivot") {
    return Pivot {};
  }
  if (name == "Mesh") {
    return ReadMesh(j);
  }
  if (name == "Camera") {
    return ReadCamera(j);
  }
  if (name == "Light") {
    return ReadLight(j);
  }
  if (name == "ParticleSystem") {
    return ReadParticleSystem(j);
  }
  if (name == "Terrain") {
    return ReadTerrain(j);
  }
  if (name == "RigidBody") {
    return ReadRigidBody(j);
  }
  if (name == "Collider") {
    return ReadCollider(j);
  }
  if (name == "Joint") {
    Joint joint(ReadJointParams(j.at("params")), ReadHandle(j.at("body1")),
      ReadHandle(j.at("body2")));
    joint.ResetNative();
    return joint;
  }
  throw std::invalid_argument(fmt::format("unknown node kind '{}'", name));
}

} // namespace

//=== Graph access ===--------------------------------------------------------//

namespace argon::scene::detail {

struct GraphJsonAccess {
  using NodePool = Pool<Node>;
  using ModelCache = std::unordered_map<std::string, std::shared_ptr<Model>>;

  static auto WriteNode(const Node& node) -> json
  {
    auto transform = json::object();
    node.local_transform_.ForEachComponent(
      [&transform](const char* name, const auto& variable) {
        transform[name]
          = { { "value", ToJson(*variable) }, { "custom", variable.IsCustom() } };
      });

    auto children = json::array();
    for (const auto child : node.children_) {
      children.push_back(ToJson(child));
    }

    auto properties = json::array();
    for (const auto& property : node.properties_) {
      properties.push_back(ToJson(property));
    }

    json lod_group = nullptr;
    if (node.lod_group_) {
      auto levels = json::array();
      for (const auto& level : node.lod_group_->levels) {
        auto objects = json::array();
        for (const auto object : level.objects) {
          objects.push_back(ToJson(object));
        }
        levels.push_back({ { "begin", level.begin }, { "end", level.end },
          { "objects", std::move(objects) } });
      }
      lod_group = { { "levels", std::move(levels) } };
    }

    return {
      { "name", node.name_ },
      { "tag", node.tag_ },
      { "parent", ToJson(node.parent_) },
      { "children", std::move(children) },
      { "transform", std::move(transform) },
      { "visibility", node.visibility_ },
      { "lifetime",
        node.lifetime_ ? json(*node.lifetime_) : json(nullptr) },
      { "resource", node.resource_ ? json(node.resource_->path) : json(nullptr) },
      { "original_handle", ToJson(node.original_handle_in_resource_) },
      { "instance_root", node.is_resource_instance_root_ },
      { "inv_bind_pose", ToJson(node.inv_bind_pose_transform_) },
      { "properties", std::move(properties) },
      { "lod_group", std::move(lod_group) },
      { "kind", to_string(node.kind_) },
      { "data", KindToJson(node.kind_) },
    };
  }

  static auto ReadNode(const json& j, const ModelResolver& resolver,
    ModelCache& models) -> Node
  {
    Node node(ReadKind(j.at("kind").get<std::string>(), j.at("data")),
      j.at("name").get<std::string>());
    node.tag_ = j.at("tag").get<std::string>();
    node.parent_ = ReadHandle(j.at("parent"));
    node.children_ = ReadHandles(j.at("children"));

    const auto& transform = j.at("transform");
    node.local_transform_.ForEachComponent(
      [&transform](const char* name, auto& variable) {
        const auto& entry = transform.at(name);
        const auto custom = entry.at("custom").get<bool>();
        if constexpr (std::is_same_v<std::remove_cvref_t<decltype(*variable)>,
                        glm::quat>) {
          variable.Restore(ReadQuat(entry.at("value")), custom);
        } else {
          variable.Restore(ReadVec3(entry.at("value")), custom);
        }
      });

    node.visibility_ = j.at("visibility").get<bool>();
    if (const auto& lifetime = j.at("lifetime"); !lifetime.is_null()) {
      node.lifetime_ = lifetime.get<float>();
    }
    if (const auto& resource = j.at("resource"); !resource.is_null()) {
      node.resource_ = ResolveModel(resource.get<std::string>(), resolver, models);
    }
    node.original_handle_in_resource_ = ReadHandle(j.at("original_handle"));
    node.is_resource_instance_root_ = j.at("instance_root").get<bool>();
    node.inv_bind_pose_transform_ = ReadMat4(j.at("inv_bind_pose"));

    for (const auto& property : j.at("properties")) {
      node.properties_.push_back(ReadProperty(property));
    }

    if (const auto& lod_group = j.at("lod_group"); !lod_group.is_null()) {
      LodGroup group;
      for (const auto& level : lod_group.at("levels")) {
        group.levels.push_back(LodControlledObjects {
          .begin = level.at("begin").get<float>(),
          .end = level.at("end").get<float>(),
          .objects = ReadHandles(level.at("objects")),
        });
      }
      node.lod_group_ = std::move(group);
    }
    return node;
  }

  static auto ResolveModel(const std::string& path,
    const ModelResolver& resolver, ModelCache& models) -> std::shared_ptr<Model>
  {
    if (const auto it = models.find(path); it != models.end()) {
      return it->second;
    }
    std::shared_ptr<Model> model;
    if (resolver) {
      model = resolver(path);
    }
    if (!model) {
      DLOG_F(1, "model '{}' not resolved, using a pending placeholder", path);
      model = std::make_shared<Model>(path, Graph::MakeEmpty());
    }
    models.emplace(path, model);
    return model;
  }

  static auto Save(const Graph& graph) -> json
  {
    auto slots = json::array();
    for (uint32_t i = 0; i < graph.pool_.Capacity(); ++i) {
      const auto& slot = graph.pool_.SlotAt(i);
      switch (slot.state) {
      case NodePool::SlotState::kOccupied:
        slots.push_back({ { "generation", slot.generation },
          { "node", WriteNode(graph.pool_.ItemAt(NodeHandle { i, slot.generation })) } });
        break;
      case NodePool::SlotState::kReserved:
        // The taken out node still owns this generation, so the slot is
        // persisted as if its ticket had been forgotten.
        slots.push_back(
          { { "generation", NodePool::NextGeneration(slot.generation) } });
        break;
      case NodePool::SlotState::kVacant:
        slots.push_back({ { "generation", slot.generation } });
        break;
      }
    }
    return { { "version", kGraphFormatVersion }, { "root", ToJson(graph.root_) },
      { "slots", std::move(slots) } };
  }

  //! Checks that every handle stored in the nodes refers to a restored node
  //! and that parent and children links form a forest, so that the rebuilt
  //! hierarchy can be walked safely.
  static auto Validate(const std::vector<NodePool::RestoredSlot>& slots,
    const NodeHandle root) -> std::optional<std::string>
  {
    const auto is_live = [&slots](const NodeHandle handle) {
      return handle.Index() < slots.size() && slots[handle.Index()].item
        && slots[handle.Index()].generation == handle.Generation();
    };

    if (!root.IsNone() && !is_live(root)) {
      return fmt::format("root {} is not a node of the graph", to_string(root));
    }
    for (std::size_t i = 0; i < slots.size(); ++i) {
      if (slots[i].generation == 0) {
        return fmt::format("slot {} has an invalid generation", i);
      }
      if (!slots[i].item) {
        continue;
      }
      if (slots[i].generation == NodePool::kRetiredGeneration) {
        return fmt::format("slot {} is occupied but retired", i);
      }
      const auto& node = *slots[i].item;
      if (!node.parent_.IsNone() && !is_live(node.parent_)) {
        return fmt::format("node '{}' has a dangling parent", node.name_);
      }
      for (const auto child : node.children_) {
        if (!is_live(child)) {
          return fmt::format("node '{}' has a dangling child", node.name_);
        }
      }
    }

    // Parent and children links must mirror each other, with each node listed
    // by its parent exactly once.
    std::vector<uint32_t> listings(slots.size(), 0);
    for (std::size_t i = 0; i < slots.size(); ++i) {
      if (!slots[i].item) {
        continue;
      }
      const auto& node = *slots[i].item;
      const NodeHandle handle { static_cast<uint32_t>(i), slots[i].generation };
      for (const auto child : node.children_) {
        const auto& child_node = *slots[child.Index()].item;
        if (child_node.parent_ != handle) {
          return fmt::format("node '{}' lists '{}' as a child but is not its "
                             "parent",
            node.name_, child_node.name_);
        }
        if (++listings[child.Index()] > 1) {
          return fmt::format(
            "node '{}' is listed more than once as a child", child_node.name_);
        }
      }
    }
    for (std::size_t i = 0; i < slots.size(); ++i) {
      if (slots[i].item && !slots[i].item->parent_.IsNone()
        && listings[i] == 0) {
        return fmt::format("node '{}' is not a child of its parent",
          slots[i].item->name_);
      }
    }

    std::vector<bool> visited(slots.size(), false);
    const auto cycle_at = [&slots](const std::size_t index) {
      return fmt::format(
        "node '{}' is part of a parent cycle", slots[index].item->name_);
    };
    std::vector<NodeHandle> pending;
    if (!root.IsNone()) {
      pending.push_back(root);
    }
    while (!pending.empty()) {
      const auto handle = pending.back();
      pending.pop_back();
      if (visited[handle.Index()]) {
        return cycle_at(handle.Index());
      }
      visited[handle.Index()] = true;
      const auto& children = slots[handle.Index()].item->children_;
      pending.insert(pending.end(), children.begin(), children.end());
    }
    // Detached subtrees must end at a node without a parent.
    for (std::size_t i = 0; i < slots.size(); ++i) {
      if (!slots[i].item || visited[i]) {
        continue;
      }
      auto current = i;
      for (std::size_t depth = 0; !slots[current].item->parent_.IsNone();
        ++depth) {
        if (depth == slots.size()) {
          return cycle_at(i);
        }
        current = slots[current].item->parent_.Index();
      }
    }
    return std::nullopt;
  }

  static auto Load(const json& data, Graph& graph, const ModelResolver& resolver)
    -> std::expected<void, std::string>
  {
    CHECK_F(graph.pool_.Capacity() == 0,
      "a graph can only be loaded into a graph without any node");

    std::vector<NodePool::RestoredSlot> slots;
    NodeHandle root;
    try {
      if (const auto version = data.at("version").get<int>();
        version != kGraphFormatVersion) {
        return std::unexpected(
          fmt::format("unsupported graph format version {}", version));
      }

      ModelCache models;
      for (const auto& entry : data.at("slots")) {
        NodePool::RestoredSlot slot {
          .generation = entry.at("generation").get<uint32_t>(),
          .item = std::nullopt,
        };
        if (const auto it = entry.find("node"); it != entry.end()) {
          slot.item = ReadNode(*it, resolver, models);
        }
        slots.push_back(std::move(slot));
      }
      root = ReadHandle(data.at("root"));
    } catch (const json::exception& ex) {
      return std::unexpected(fmt::format("malformed graph data: {}", ex.what()));
    } catch (const std::invalid_argument& ex) {
      return std::unexpected(fmt::format("invalid graph data: {}", ex.what()));
    }

    if (auto error = Validate(slots, root)) {
      return std::unexpected(std::move(*error));
    }

    graph.pool_.Rebuild(std::move(slots));
    graph.root_ = root;
    graph.collider_map_.clear();
    LOG_F(INFO, "graph loaded with {} nodes", graph.NodeCount());
    return {};
  }
};

} // namespace argon::scene::detail

auto argon::scene::SaveGraph(const Graph& graph) -> json
{
  return detail::GraphJsonAccess::Save(graph);
}

auto argon::scene::LoadGraph(const json& data, Graph& graph,
  const ModelResolver& resolver) -> std::expected<void, std::string>
{
  return detail::GraphJsonAccess::Load(data, graph, resolver);
}

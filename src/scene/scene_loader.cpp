// hikari - CPU path tracer
// Copyright (c) 2025 hikari Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "hikari/scene/scene_loader.h"

#include <fstream>
#include <string>
#include <unordered_map>
#include <utility>

#include <nlohmann/json.hpp>

#include "hikari/core/error.hpp"
#include "hikari/core/log.h"
#include "hikari/material/material.h"

namespace hikari::scene {

namespace {

using nlohmann::json;
using material::Material;
using material::MaterialPtr;
using math::Color;
using math::Vec3;

using MaterialTable = std::unordered_map<std::string, MaterialPtr>;

const json& Require(const json& object, const char* key, const std::string& where) {
    auto it = object.find(key);
    if (it == object.end()) {
        throw SceneError(where + ": missing '" + key + "'");
    }
    return *it;
}

Vec3 ToVec3(const json& value, const std::string& where) {
    if (!value.is_array() || value.size() != 3) {
        throw SceneError(where + ": expected an array of three numbers");
    }
    return Vec3(value[0].get<float>(), value[1].get<float>(), value[2].get<float>());
}

Vec3 ReadVec3(const json& object, const char* key, const Vec3& fallback, const std::string& where) {
    auto it = object.find(key);
    return it == object.end() ? fallback : ToVec3(*it, where + "." + key);
}

float ReadFloat(const json& object, const char* key, float fallback) {
    return object.value(key, fallback);
}

material::Texture ParseTexture(const json& value, const std::string& where) {
    if (value.is_array()) {
        return ToVec3(value, where);
    }
    if (!value.is_object()) {
        throw SceneError(where + ": expected a color or a texture object");
    }
    const auto type = value.value("type", std::string("solid"));
    if (type == "solid") {
        return ToVec3(Require(value, "color", where), where + ".color");
    }
    if (type == "checker") {
        return material::Texture::Checker(ToVec3(Require(value, "even", where), where + ".even"),
                                          ToVec3(Require(value, "odd", where), where + ".odd"),
                                          ReadFloat(value, "scale", 10.0f));
    }
    throw SceneError(where + ": unknown texture type '" + type + "'");
}

MaterialPtr ParseMaterial(const json& value, const std::string& where) {
    const auto type = Require(value, "type", where).get<std::string>();
    if (type == "lambertian") {
        return Material::MakeLambertian(ParseTexture(Require(value, "albedo", where), where + ".albedo"));
    }
    if (type == "metal") {
        return Material::MakeMetal(ToVec3(Require(value, "albedo", where), where + ".albedo"),
                                   ReadFloat(value, "fuzz", 0.0f));
    }
    if (type == "dielectric") {
        return Material::MakeDielectric(ReadFloat(value, "ior", 1.5f));
    }
    if (type == "diffuse_light") {
        return Material::MakeDiffuseLight(ParseTexture(Require(value, "emit", where), where + ".emit"));
    }
    throw SceneError(where + ": unknown material type '" + type + "'");
}

MaterialTable ParseMaterials(const json& root) {
    MaterialTable table;
    auto it = root.find("materials");
    if (it == root.end()) {
        return table;
    }
    if (!it->is_object()) {
        throw SceneError("materials: expected an object of named materials");
    }
    for (const auto& item : it->items()) {
        table.emplace(item.key(), ParseMaterial(item.value(), "materials." + item.key()));
    }
    return table;
}

MaterialPtr LookupMaterial(const json& object, const MaterialTable& table, const std::string& where) {
    const auto name = Require(object, "material", where).get<std::string>();
    auto it = table.find(name);
    if (it == table.end()) {
        throw SceneError(where + ": unknown material '" + name + "'");
    }
    return it->second;
}

geometry::RectPlane ParsePlane(const std::string& plane, const std::string& where) {
    if (plane == "xy") {
        return geometry::RectPlane::XY;
    }
    if (plane == "xz") {
        return geometry::RectPlane::XZ;
    }
    if (plane == "yz") {
        return geometry::RectPlane::YZ;
    }
    throw SceneError(where + ": plane must be xy, xz or yz, got '" + plane + "'");
}

std::pair<float, float> ParseRange(const json& object, const char* key, const std::string& where) {
    const auto& range = Require(object, key, where);
    if (!range.is_array() || range.size() != 2) {
        throw SceneError(where + "." + key + ": expected [min, max]");
    }
    return {range[0].get<float>(), range[1].get<float>()};
}

geometry::Hittable ParseObject(const json& value, const MaterialTable& table, const std::string& where) {
    const auto type = Require(value, "type", where).get<std::string>();
    auto mat = LookupMaterial(value, table, where);

    if (type == "sphere") {
        return geometry::Sphere(ToVec3(Require(value, "center", where), where + ".center"),
                                Require(value, "radius", where).get<float>(), std::move(mat));
    }
    if (type == "moving_sphere") {
        return geometry::MovingSphere(ToVec3(Require(value, "center0", where), where + ".center0"),
                                      ToVec3(Require(value, "center1", where), where + ".center1"),
                                      ReadFloat(value, "time0", 0.0f), ReadFloat(value, "time1", 1.0f),
                                      Require(value, "radius", where).get<float>(), std::move(mat));
    }
    if (type == "rect") {
        const auto plane = ParsePlane(Require(value, "plane", where).get<std::string>(), where);
        const auto [a0, a1] = ParseRange(value, "a", where);
        const auto [b0, b1] = ParseRange(value, "b", where);
        return geometry::AxisRect(plane, a0, a1, b0, b1, Require(value, "k", where).get<float>(),
                                  std::move(mat), value.value("flip", false));
    }
    if (type == "box") {
        return geometry::Box(ToVec3(Require(value, "min", where), where + ".min"),
                             ToVec3(Require(value, "max", where), where + ".max"), std::move(mat));
    }
    throw SceneError(where + ": unknown object type '" + type + "'");
}

camera::CameraDesc ParseCamera(const json& root) {
    camera::CameraDesc desc;
    auto it = root.find("camera");
    if (it == root.end()) {
        return desc;
    }
    const json& cam = *it;
    desc.Body.LookFrom = ReadVec3(cam, "look_from", desc.Body.LookFrom, "camera");
    desc.Body.LookAt = ReadVec3(cam, "look_at", desc.Body.LookAt, "camera");
    desc.Body.Vup = ReadVec3(cam, "vup", desc.Body.Vup, "camera");
    desc.Lens.VerticalFov = ReadFloat(cam, "vfov", desc.Lens.VerticalFov);
    desc.Lens.AspectRatio = ReadFloat(cam, "aspect_ratio", desc.Lens.AspectRatio);
    desc.Lens.Aperture = ReadFloat(cam, "aperture", desc.Lens.Aperture);
    desc.Lens.FocusDistance = ReadFloat(cam, "focus_distance", desc.Lens.FocusDistance);
    desc.Exposure.Time0 = ReadFloat(cam, "time0", desc.Exposure.Time0);
    desc.Exposure.Time1 = ReadFloat(cam, "time1", desc.Exposure.Time1);
    return desc;
}

renderer::Background ParseBackground(const json& root) {
    auto it = root.find("background");
    if (it == root.end()) {
        return renderer::Background::Sky();
    }
    const auto type = it->value("type", std::string("sky"));
    if (type == "sky") {
        renderer::SkyGradient sky;
        sky.Bottom = ReadVec3(*it, "bottom", sky.Bottom, "background");
        sky.Top = ReadVec3(*it, "top", sky.Top, "background");
        return sky;
    }
    if (type == "solid") {
        return renderer::Background::Solid(ToVec3(Require(*it, "color", "background"), "background.color"));
    }
    throw SceneError("background: unknown type '" + type + "'");
}

Scene BuildScene(const json& root, math::Rng& rng) {
    if (!root.is_object()) {
        throw SceneError("top level value must be an object");
    }

    Scene scene;
    scene.Name = root.value("name", std::string("scene"));
    scene.Camera = ParseCamera(root);
    scene.Background = ParseBackground(root);

    // Rejects degenerate camera parameters before any rendering starts
    const camera::Camera validated(scene.Camera);
    (void)validated;

    const auto materials = ParseMaterials(root);

    geometry::HittableList objects;
    const auto& list = Require(root, "objects", "scene");
    if (!list.is_array()) {
        throw SceneError("objects: expected an array");
    }
    for (size_t i = 0; i < list.size(); ++i) {
        objects.Add(ParseObject(list[i], materials, "objects[" + std::to_string(i) + "]"));
    }

    if (root.value("use_bvh", true) && !objects.Empty()) {
        scene.World = BuildBvh(objects, scene.Camera.Exposure, rng);
    } else {
        scene.World = std::move(objects);
    }

    HIKARI_LOG_DEBUG("Parsed scene '{}': {} materials, {} objects", scene.Name, materials.size(),
                     list.size());
    return scene;
}

} // namespace

core::Result<Scene> ParseScene(const nlohmann::json& document, math::Rng& rng) {
    try {
        return BuildScene(document, rng);
    } catch (const HikariError& err) {
        return core::Result<Scene>::Err(err.what());
    } catch (const nlohmann::json::exception& err) {
        return core::Result<Scene>::Err(std::string("invalid scene value: ") + err.what());
    }
}

core::Result<Scene> LoadSceneFile(const std::filesystem::path& path, math::Rng& rng) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return core::Result<Scene>::Err("failed to open scene file '" + path.string() + "'");
    }

    nlohmann::json document;
    try {
        file >> document;
    } catch (const nlohmann::json::parse_error& err) {
        return core::Result<Scene>::Err(path.string() + ": " + err.what());
    }

    HIKARI_LOG_INFO("Loading scene from {}", path.string());
    return ParseScene(document, rng).WithContext(path.string());
}

renderer::RenderSettings MakeRenderSettings(const config::AppConfig& config) {
    renderer::RenderSettings settings;
    settings.Width = config.width;
    settings.Height = config.height;
    settings.SamplesPerPixel = config.samples_per_pixel;
    settings.MaxDepth = config.max_depth;
    settings.Seed = config.seed;
    settings.ThreadCount = config.threads;
    settings.Validate();
    return settings;
}

core::Result<Scene> LoadConfiguredScene(const config::AppConfig& config, float aspectRatio,
                                        math::Rng& rng) {
    if (!config.scene_file.empty()) {
        return LoadSceneFile(config.scene_file, rng);
    }
    try {
        return MakePreset(config.scene_preset, aspectRatio, rng);
    } catch (const SceneError& err) {
        return core::Result<Scene>::Err(err.what());
    }
}

} // namespace hikari::scene

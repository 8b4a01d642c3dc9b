// hikari - CPU path tracer
// Copyright (c) 2025 hikari Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "hikari/scene/scene.h"

#include <glm/geometric.hpp>

#include "hikari/core/error.hpp"
#include "hikari/core/log.h"
#include "hikari/material/material.h"

namespace hikari::scene {

using geometry::AxisRect;
using geometry::Box;
using geometry::HittableList;
using geometry::MovingSphere;
using geometry::RectPlane;
using geometry::Sphere;
using material::Material;
using math::Color;
using math::Point3;

Scene MakeThreeSpheres(float aspectRatio) {
    auto ground = Material::MakeLambertian(Color(0.8f, 0.8f, 0.0f));
    auto glass = Material::MakeDielectric(1.5f);
    auto metal = Material::MakeMetal(Color(0.8f, 0.6f, 0.2f), 1.0f);

    HittableList world;
    world.Add(Sphere(Point3(0.0f, -100.5f, -1.0f), 100.0f, ground));
    world.Add(Sphere(Point3(0.0f, 0.0f, -1.0f), 0.5f, glass));
    world.Add(Sphere(Point3(-1.0f, 0.0f, -1.0f), 0.5f, glass));
    world.Add(Sphere(Point3(1.0f, 0.0f, -1.0f), 0.5f, metal));

    Scene scene;
    scene.Name = "three_spheres";
    scene.World = std::move(world);
    scene.Camera.Body = {Point3(0.0f), Point3(0.0f, 0.0f, -1.0f), math::Vec3(0.0f, 1.0f, 0.0f)};
    scene.Camera.Lens.VerticalFov = 90.0f;
    scene.Camera.Lens.AspectRatio = aspectRatio;
    scene.Background = renderer::Background::Sky();
    return scene;
}

Scene MakeRandomSpheres(float aspectRatio, math::Rng& rng, bool movingSpheres) {
    camera::Shutter shutter;
    if (movingSpheres) {
        shutter.Time1 = 1.0f;
    }

    HittableList world;
    auto checker = material::Texture::Checker(Color(0.2f, 0.3f, 0.1f), Color(0.9f, 0.9f, 0.9f));
    world.Add(Sphere(Point3(0.0f, -1000.0f, 0.0f), 1000.0f, Material::MakeLambertian(checker)));

    const Point3 clearing(4.0f, 0.2f, 0.0f);
    for (int a = -11; a < 11; ++a) {
        for (int b = -11; b < 11; ++b) {
            const float chooseMat = rng.Uniform();
            const Point3 center(static_cast<float>(a) + 0.9f * rng.Uniform(), 0.2f,
                                static_cast<float>(b) + 0.9f * rng.Uniform());
            if (glm::length(center - clearing) <= 0.9f) {
                continue;
            }

            if (chooseMat < 0.8f) {
                const Color albedo = rng.RandomVector() * rng.RandomVector();
                auto diffuse = Material::MakeLambertian(albedo);
                if (movingSpheres) {
                    const Point3 center1 = center + math::Vec3(0.0f, rng.Uniform(0.0f, 0.5f), 0.0f);
                    world.Add(MovingSphere(center, center1, shutter.Time0, shutter.Time1, 0.2f,
                                           std::move(diffuse)));
                } else {
                    world.Add(Sphere(center, 0.2f, std::move(diffuse)));
                }
            } else if (chooseMat < 0.95f) {
                const Color albedo = rng.RandomVector(0.5f, 1.0f);
                const float fuzz = rng.Uniform(0.0f, 0.5f);
                world.Add(Sphere(center, 0.2f, Material::MakeMetal(albedo, fuzz)));
            } else {
                world.Add(Sphere(center, 0.2f, Material::MakeDielectric(1.5f)));
            }
        }
    }

    world.Add(Sphere(Point3(0.0f, 1.0f, 0.0f), 1.0f, Material::MakeDielectric(1.5f)));
    world.Add(Sphere(Point3(-4.0f, 1.0f, 0.0f), 1.0f,
                     Material::MakeLambertian(Color(0.4f, 0.2f, 0.1f))));
    world.Add(Sphere(Point3(4.0f, 1.0f, 0.0f), 1.0f,
                     Material::MakeMetal(Color(0.7f, 0.6f, 0.5f), 0.0f)));

    HIKARI_LOG_DEBUG("random_spheres: {} primitives", world.Size());

    Scene scene;
    scene.Name = movingSpheres ? "random_spheres" : "random_spheres_static";
    scene.World = BuildBvh(world, shutter, rng);
    scene.Camera.Body = {Point3(13.0f, 2.0f, 3.0f), Point3(0.0f), math::Vec3(0.0f, 1.0f, 0.0f)};
    scene.Camera.Lens.VerticalFov = 20.0f;
    scene.Camera.Lens.AspectRatio = aspectRatio;
    scene.Camera.Lens.Aperture = 0.1f;
    scene.Camera.Lens.FocusDistance = 10.0f;
    scene.Camera.Exposure = shutter;
    scene.Background = renderer::Background::Sky();
    return scene;
}

Scene MakeCornellBox(float aspectRatio) {
    auto red = Material::MakeLambertian(Color(0.65f, 0.05f, 0.05f));
    auto white = Material::MakeLambertian(Color(0.73f, 0.73f, 0.73f));
    auto green = Material::MakeLambertian(Color(0.12f, 0.45f, 0.15f));
    auto light = Material::MakeDiffuseLight(Color(15.0f, 15.0f, 15.0f));

    HittableList world;
    world.Add(AxisRect(RectPlane::YZ, 0.0f, 555.0f, 0.0f, 555.0f, 555.0f, green, true));
    world.Add(AxisRect(RectPlane::YZ, 0.0f, 555.0f, 0.0f, 555.0f, 0.0f, red));
    world.Add(AxisRect(RectPlane::XZ, 213.0f, 343.0f, 227.0f, 332.0f, 554.0f, light, true));
    world.Add(AxisRect(RectPlane::XZ, 0.0f, 555.0f, 0.0f, 555.0f, 0.0f, white));
    world.Add(AxisRect(RectPlane::XZ, 0.0f, 555.0f, 0.0f, 555.0f, 555.0f, white, true));
    world.Add(AxisRect(RectPlane::XY, 0.0f, 555.0f, 0.0f, 555.0f, 555.0f, white, true));
    world.Add(Box(Point3(130.0f, 0.0f, 65.0f), Point3(295.0f, 165.0f, 230.0f), white));
    world.Add(Box(Point3(265.0f, 0.0f, 295.0f), Point3(430.0f, 330.0f, 460.0f), white));

    Scene scene;
    scene.Name = "cornell_box";
    scene.World = std::move(world);
    scene.Camera.Body = {Point3(278.0f, 278.0f, -800.0f), Point3(278.0f, 278.0f, 0.0f),
                         math::Vec3(0.0f, 1.0f, 0.0f)};
    scene.Camera.Lens.VerticalFov = 40.0f;
    scene.Camera.Lens.AspectRatio = aspectRatio;
    scene.Background = renderer::Background::Solid(math::colors::kBlack);
    return scene;
}

const std::vector<std::string_view>& PresetNames() {
    static const std::vector<std::string_view> names = {
        "three_spheres",
        "random_spheres",
        "random_spheres_static",
        "cornell_box",
    };
    return names;
}

Scene MakePreset(std::string_view name, float aspectRatio, math::Rng& rng) {
    if (name == "three_spheres") {
        return MakeThreeSpheres(aspectRatio);
    }
    if (name == "random_spheres") {
        return MakeRandomSpheres(aspectRatio, rng, true);
    }
    if (name == "random_spheres_static") {
        return MakeRandomSpheres(aspectRatio, rng, false);
    }
    if (name == "cornell_box") {
        return MakeCornellBox(aspectRatio);
    }
    throw SceneError("unknown preset '" + std::string(name) + "'");
}

geometry::Hittable BuildBvh(const HittableList& list, const camera::Shutter& shutter, math::Rng& rng) {
    return geometry::BvhNode::Build(list, shutter.Time0, shutter.Time1, rng);
}

renderer::PixelBuffer RenderScene(const Scene& scene, const renderer::RenderSettings& settings) {
    settings.Validate();

    camera::CameraDesc desc = scene.Camera;
    desc.Lens.AspectRatio = settings.AspectRatio();
    const camera::Camera camera(desc);

    HIKARI_LOG_INFO("Rendering '{}' at {}x{}, {} spp, depth {}", scene.Name, settings.Width,
                    settings.Height, settings.SamplesPerPixel, settings.MaxDepth);

    const renderer::Renderer driver(settings, renderer::PathTracer(scene.Background));
    return driver.Render(scene.World, camera);
}

} // namespace hikari::scene

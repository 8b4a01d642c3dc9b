#include <hikari/core/log.h>
#include <hikari/geometry/hittable.h>
#include <hikari/image/image.h>
#include <hikari/image/ppm.h>
#include <hikari/material/material.h>
#include <hikari/renderer/renderer.h>
#include <hikari/scene/scene.h>
#include <exception>

using namespace hikari;
using math::Color;
using math::Point3;

int main() {
    try {
        log::init(spdlog::level::info);

        // Checkered ground, one glass and one red diffuse sphere
        auto ground = material::Material::MakeLambertian(
            material::Texture::Checker(math::colors::kWhite, Color(0.1f), 4.0f));
        auto glass = material::Material::MakeDielectric(1.5f);
        auto red = material::Material::MakeLambertian(math::colors::kRed);

        geometry::HittableList world;
        world.Add(geometry::Sphere(Point3(0.0f, -100.5f, -1.0f), 100.0f, ground));
        world.Add(geometry::Sphere(Point3(-0.6f, 0.0f, -1.2f), 0.5f, glass));
        world.Add(geometry::Sphere(Point3(0.6f, 0.0f, -1.2f), 0.5f, red));

        renderer::RenderSettings settings;
        settings.Width = 320;
        settings.Height = 180;
        settings.SamplesPerPixel = 16;
        settings.MaxDepth = 10;

        scene::Scene hello;
        hello.Name = "hello";
        hello.World = std::move(world);
        hello.Camera.Body.LookFrom = Point3(0.0f, 0.3f, 0.8f);
        hello.Camera.Body.LookAt = Point3(0.0f, 0.0f, -1.2f);
        hello.Camera.Lens.VerticalFov = 60.0f;

        const auto pixels = scene::RenderScene(hello, settings);
        auto written = image::WritePpm("out/hello.ppm", image::Quantize(pixels));
        if (!written) {
            HIKARI_LOG_CRITICAL("{}", written.GetError().Describe());
            return 1;
        }
        return 0;

    } catch (const std::exception& e) {
        HIKARI_LOG_CRITICAL("{}", e.what());
        return 1;
    }
}

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <hikari/core/error.hpp>
#include <hikari/geometry/hit_record.h>
#include <hikari/material/material.h>
#include <hikari/math/random.h>
#include <glm/glm.hpp>
#include <cmath>
#include <limits>

using namespace hikari;
using namespace hikari::material;
using Catch::Approx;

namespace {

// Hit on a surface whose outward normal is +y
geometry::HitRecord MakeUpFacingHit(const Ray& ray, const Material& mat) {
    geometry::HitRecord rec;
    rec.Point = math::Point3(0.0f);
    rec.T = 1.0f;
    rec.Mat = &mat;
    rec.SetFaceNormal(ray, math::Vec3(0.0f, 1.0f, 0.0f));
    return rec;
}

} // namespace

TEST_CASE("Lambertian scattering", "[material][lambertian]") {
    const auto mat = Material::MakeLambertian(Color(0.2f, 0.4f, 0.6f));
    REQUIRE(mat->Name() == "lambertian");

    math::Rng rng(5);
    const Ray rayIn(math::Point3(1.0f, 1.0f, 0.0f), math::Vec3(-1.0f, -1.0f, 0.0f), 0.75f);
    const auto rec = MakeUpFacingHit(rayIn, *mat);

    for (int i = 0; i < 1000; ++i) {
        const auto scatter = mat->Scatter(rayIn, rec, rng);
        REQUIRE(scatter);
        REQUIRE(scatter->Attenuation == Color(0.2f, 0.4f, 0.6f));
        REQUIRE(scatter->Scattered.Origin == rec.Point);
        REQUIRE(scatter->Scattered.Time == 0.75f);
        REQUIRE_FALSE(math::NearZero(scatter->Scattered.Direction));
        REQUIRE(glm::dot(scatter->Scattered.Direction, rec.Normal) >= 0.0f);
    }

    REQUIRE(mat->Emitted(0.0f, 0.0f, rec.Point) == math::colors::kBlack);
}

TEST_CASE("Metal scattering", "[material][metal]") {
    math::Rng rng(11);

    SECTION("Polished metal mirrors the incoming ray") {
        const auto mat = Material::MakeMetal(Color(0.9f), 0.0f);
        const Ray rayIn(math::Point3(-1.0f, 1.0f, 0.0f), math::Vec3(1.0f, -1.0f, 0.0f));
        const auto rec = MakeUpFacingHit(rayIn, *mat);

        const auto scatter = mat->Scatter(rayIn, rec, rng);
        REQUIRE(scatter);
        const math::Vec3 expected = glm::normalize(math::Vec3(1.0f, 1.0f, 0.0f));
        REQUIRE(scatter->Scattered.Direction.x == Approx(expected.x));
        REQUIRE(scatter->Scattered.Direction.y == Approx(expected.y));
        REQUIRE(scatter->Attenuation == Color(0.9f));
    }

    SECTION("Absorbed exactly when the fuzzed reflection points into the surface") {
        const auto mat = Material::MakeMetal(Color(0.9f), 1.0f);
        // Grazing incidence so fuzz often pushes the reflection below the surface
        const Ray rayIn(math::Point3(-1.0f, 0.1f, 0.0f), math::Vec3(1.0f, -0.1f, 0.0f));
        const auto rec = MakeUpFacingHit(rayIn, *mat);

        int absorbed = 0;
        int scattered = 0;
        for (int i = 0; i < 1000; ++i) {
            // Replay the draw on a copy to recover the direction the material computed
            math::Rng replay = rng;
            const math::Vec3 reflected = math::Reflect(glm::normalize(rayIn.Direction), rec.Normal);
            const math::Vec3 direction = reflected + 1.0f * replay.RandomInUnitSphere();

            const auto scatter = mat->Scatter(rayIn, rec, rng);
            REQUIRE(scatter.has_value() == (glm::dot(direction, rec.Normal) > 0.0f));
            if (scatter) {
                ++scattered;
                REQUIRE(scatter->Scattered.Direction == direction);
            } else {
                ++absorbed;
            }
        }
        REQUIRE(absorbed > 0);
        REQUIRE(scattered > 0);
    }

    SECTION("Fuzz is clamped and validated") {
        const auto clamped = Material::MakeMetal(Color(1.0f), 3.0f);
        REQUIRE(std::get<Metal>(clamped->Kind()).Fuzz == 1.0f);
        REQUIRE_THROWS_AS(Material::MakeMetal(Color(1.0f), -0.1f), SceneError);
        REQUIRE_THROWS_AS(Material::MakeMetal(Color(1.0f), std::numeric_limits<float>::quiet_NaN()),
                          SceneError);
    }
}

TEST_CASE("Dielectric scattering", "[material][dielectric]") {
    math::Rng rng(23);

    SECTION("Index of refraction must be positive") {
        REQUIRE_THROWS_AS(Material::MakeDielectric(0.0f), SceneError);
        REQUIRE_THROWS_AS(Material::MakeDielectric(-1.5f), SceneError);
        REQUIRE_THROWS_AS(Material::MakeDielectric(std::numeric_limits<float>::infinity()), SceneError);
    }

    SECTION("Always scatters with white attenuation") {
        const auto mat = Material::MakeDielectric(1.5f);
        REQUIRE(mat->Name() == "dielectric");
        const Ray rayIn(math::Point3(-1.0f, 1.0f, 0.0f), math::Vec3(1.0f, -1.0f, 0.0f));
        const auto rec = MakeUpFacingHit(rayIn, *mat);

        for (int i = 0; i < 200; ++i) {
            const auto scatter = mat->Scatter(rayIn, rec, rng);
            REQUIRE(scatter);
            REQUIRE(scatter->Attenuation == math::colors::kWhite);
            REQUIRE(glm::length(scatter->Scattered.Direction) == Approx(1.0f));
        }
    }

    SECTION("Total internal reflection from inside at a grazing angle") {
        const auto mat = Material::MakeDielectric(1.5f);
        // Leaving the medium upwards at a shallow angle: 1.5 * sin > 1
        const Ray rayIn(math::Point3(-1.0f, -0.2f, 0.0f), math::Vec3(1.0f, 0.2f, 0.0f));
        const auto rec = MakeUpFacingHit(rayIn, *mat);
        REQUIRE_FALSE(rec.FrontFace);

        for (int i = 0; i < 100; ++i) {
            const auto scatter = mat->Scatter(rayIn, rec, rng);
            REQUIRE(scatter);
            REQUIRE(scatter->Scattered.Direction.y < 0.0f);
        }
    }

    SECTION("Head-on rays mostly pass straight through") {
        const auto mat = Material::MakeDielectric(1.5f);
        const Ray rayIn(math::Point3(0.0f, 1.0f, 0.0f), math::Vec3(0.0f, -1.0f, 0.0f));
        const auto rec = MakeUpFacingHit(rayIn, *mat);

        int transmitted = 0;
        for (int i = 0; i < 1000; ++i) {
            const auto scatter = mat->Scatter(rayIn, rec, rng);
            REQUIRE(scatter);
            if (scatter->Scattered.Direction.y < 0.0f) {
                ++transmitted;
            }
        }
        // Schlick reflectance at normal incidence is 4%
        REQUIRE(transmitted > 900);
        REQUIRE(transmitted < 1000);
    }
}

TEST_CASE("Diffuse light", "[material][light]") {
    const auto mat = Material::MakeDiffuseLight(Color(4.0f, 3.0f, 2.0f));
    math::Rng rng(1);
    const Ray rayIn(math::Point3(0.0f, 1.0f, 0.0f), math::Vec3(0.0f, -1.0f, 0.0f));
    const auto rec = MakeUpFacingHit(rayIn, *mat);

    REQUIRE_FALSE(mat->Scatter(rayIn, rec, rng));
    REQUIRE(mat->Emitted(0.3f, 0.7f, rec.Point) == Color(4.0f, 3.0f, 2.0f));
    REQUIRE(mat->Name() == "diffuse_light");
}

TEST_CASE("Textures", "[material][texture]") {
    SECTION("Solid color ignores coordinates") {
        const Texture solid(Color(0.1f, 0.2f, 0.3f));
        REQUIRE(solid.Value(0.0f, 0.0f, math::Point3(5.0f)) == Color(0.1f, 0.2f, 0.3f));
        REQUIRE(solid.Value(1.0f, 1.0f, math::Point3(-5.0f)) == Color(0.1f, 0.2f, 0.3f));
    }

    SECTION("Checker alternates with the sign of the sine product") {
        const auto checker = Texture::Checker(Color(1.0f), Color(0.0f), 1.0f);
        const float quarter = math::kPi / 2.0f;
        // sin > 0 on all axes
        REQUIRE(checker.Value(0.0f, 0.0f, math::Point3(quarter)) == Color(1.0f));
        // one negative factor
        REQUIRE(checker.Value(0.0f, 0.0f, math::Point3(-quarter, quarter, quarter)) == Color(0.0f));
        // two negative factors
        REQUIRE(checker.Value(0.0f, 0.0f, math::Point3(-quarter, -quarter, quarter)) == Color(1.0f));
    }

    SECTION("Lambertian uses its texture") {
        const auto mat = Material::MakeLambertian(Texture::Checker(Color(1.0f), Color(0.0f), 1.0f));
        math::Rng rng(3);
        const float quarter = math::kPi / 2.0f;
        geometry::HitRecord rec;
        rec.Point = math::Point3(-quarter, quarter, quarter);
        rec.Normal = math::Vec3(0.0f, 1.0f, 0.0f);
        rec.Mat = mat.get();
        const auto scatter = mat->Scatter(Ray(math::Point3(0.0f, 5.0f, 0.0f), math::Vec3(0.0f, -1.0f, 0.0f)), rec, rng);
        REQUIRE(scatter);
        REQUIRE(scatter->Attenuation == Color(0.0f));
    }
}

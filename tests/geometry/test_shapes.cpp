#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <hikari/core/error.hpp>
#include <hikari/geometry/hittable.h>
#include <hikari/geometry/shapes.h>
#include <hikari/material/material.h>
#include <hikari/math/random.h>
#include <glm/glm.hpp>
#include <cmath>
#include <limits>

using namespace hikari;
using namespace hikari::geometry;
using Catch::Approx;

namespace {

constexpr float kInfinity = std::numeric_limits<float>::infinity();

material::MaterialPtr Gray() {
    return material::Material::MakeLambertian(math::Color(0.5f));
}

} // namespace

TEST_CASE("Sphere intersection", "[geometry][sphere]") {
    const auto mat = Gray();
    const Sphere sphere(Point3(0.0f, 0.0f, -1.0f), 0.5f, mat);

    SECTION("Head-on ray takes the nearer root") {
        const Ray ray(Point3(0.0f), Vec3(0.0f, 0.0f, -1.0f));
        const auto rec = sphere.Hit(ray, 0.001f, kInfinity);
        REQUIRE(rec);
        REQUIRE(rec->T == Approx(0.5f));
        REQUIRE(rec->Point.z == Approx(-0.5f));
        REQUIRE(rec->Normal.z == Approx(1.0f));
        REQUIRE(rec->FrontFace);
        REQUIRE(rec->Mat == mat.get());
    }

    SECTION("Ray from inside hits the far side with a flipped normal") {
        const Ray ray(Point3(0.0f, 0.0f, -1.0f), Vec3(1.0f, 0.0f, 0.0f));
        const auto rec = sphere.Hit(ray, 0.001f, kInfinity);
        REQUIRE(rec);
        REQUIRE(rec->T == Approx(0.5f));
        REQUIRE_FALSE(rec->FrontFace);
        REQUIRE(rec->Normal.x == Approx(-1.0f));
    }

    SECTION("Interval bounds are respected") {
        const Ray ray(Point3(0.0f), Vec3(0.0f, 0.0f, -1.0f));
        // Near root excluded, far root accepted
        const auto farHit = sphere.Hit(ray, 0.6f, kInfinity);
        REQUIRE(farHit);
        REQUIRE(farHit->T == Approx(1.5f));
        // Both roots beyond tMax
        REQUIRE_FALSE(sphere.Hit(ray, 0.001f, 0.4f));
    }

    SECTION("Miss") {
        const Ray ray(Point3(0.0f), Vec3(0.0f, 1.0f, 0.0f));
        REQUIRE_FALSE(sphere.Hit(ray, 0.001f, kInfinity));
    }

    SECTION("Hit iff the closest approach is within the radius") {
        math::Rng rng(2024);
        for (int i = 0; i < 500; ++i) {
            const Point3 origin = rng.RandomVector(-3.0f, 3.0f) + Vec3(0.0f, 0.0f, 4.0f);
            const Vec3 direction = glm::normalize(Point3(0.0f, 0.0f, -1.0f) +
                                                  rng.RandomVector(-1.0f, 1.0f) - origin);
            const Ray ray(origin, direction);

            const Vec3 toCenter = sphere.Center() - origin;
            const float along = glm::dot(toCenter, direction);
            const float distance = glm::length(toCenter - along * direction);
            // Skip grazing rays where float rounding decides
            if (std::fabs(distance - sphere.Radius()) < 1e-3f) {
                continue;
            }

            const auto rec = sphere.Hit(ray, 0.001f, kInfinity);
            const bool expectHit = distance < sphere.Radius() && along > 0.0f;
            REQUIRE(rec.has_value() == expectHit);
            if (rec) {
                const float halfChord = std::sqrt(sphere.Radius() * sphere.Radius() - distance * distance);
                REQUIRE(rec->T == Approx(along - halfChord).margin(1e-3));
                REQUIRE(glm::length(rec->Normal) == Approx(1.0f));
                REQUIRE(glm::dot(rec->Normal, ray.Direction) <= 0.0f);
            }
        }
    }

    SECTION("Texture coordinates") {
        const Ray ray(Point3(0.0f), Vec3(0.0f, 0.0f, -1.0f));
        const auto rec = sphere.Hit(ray, 0.001f, kInfinity);
        REQUIRE(rec);
        REQUIRE(rec->U >= 0.0f);
        REQUIRE(rec->U <= 1.0f);
        REQUIRE(rec->V == Approx(0.5f));
    }

    SECTION("Bounding box") {
        const auto box = sphere.BoundingBox(0.0f, 1.0f);
        REQUIRE(box);
        REQUIRE(box->Min == Point3(-0.5f, -0.5f, -1.5f));
        REQUIRE(box->Max == Point3(0.5f, 0.5f, -0.5f));
    }
}

TEST_CASE("Shape validation", "[geometry]") {
    const auto mat = Gray();
    REQUIRE_THROWS_AS(Sphere(Point3(0.0f), 0.0f, mat), SceneError);
    REQUIRE_THROWS_AS(Sphere(Point3(0.0f), -1.0f, mat), SceneError);
    REQUIRE_THROWS_AS(Sphere(Point3(0.0f), 1.0f, nullptr), SceneError);
    REQUIRE_THROWS_AS(MovingSphere(Point3(0.0f), Point3(1.0f), 1.0f, 0.0f, 0.5f, mat), SceneError);
    REQUIRE_THROWS_AS(AxisRect(RectPlane::XY, 1.0f, 0.0f, 0.0f, 1.0f, 0.0f, mat), SceneError);
}

TEST_CASE("Moving sphere", "[geometry][sphere]") {
    const auto mat = Gray();
    const MovingSphere sphere(Point3(0.0f, 0.0f, -2.0f), Point3(2.0f, 0.0f, -2.0f), 0.0f, 1.0f, 0.5f, mat);

    REQUIRE(sphere.CenterAt(0.5f).x == Approx(1.0f));

    const Vec3 down(0.0f, 0.0f, -1.0f);
    REQUIRE(sphere.Hit(Ray(Point3(0.0f), down, 0.0f), 0.001f, kInfinity));
    REQUIRE_FALSE(sphere.Hit(Ray(Point3(0.0f), down, 1.0f), 0.001f, kInfinity));
    REQUIRE(sphere.Hit(Ray(Point3(2.0f, 0.0f, 0.0f), down, 1.0f), 0.001f, kInfinity));

    const auto box = sphere.BoundingBox(0.0f, 1.0f);
    REQUIRE(box);
    REQUIRE(box->Min.x == Approx(-0.5f));
    REQUIRE(box->Max.x == Approx(2.5f));
}

TEST_CASE("Axis aligned rectangles and boxes", "[geometry][rect]") {
    const auto mat = Gray();

    SECTION("XZ floor hit from above") {
        const AxisRect floor(RectPlane::XZ, -1.0f, 1.0f, -1.0f, 1.0f, 0.0f, mat);
        const auto rec = floor.Hit(Ray(Point3(0.2f, 2.0f, 0.3f), Vec3(0.0f, -1.0f, 0.0f)), 0.001f, kInfinity);
        REQUIRE(rec);
        REQUIRE(rec->T == Approx(2.0f));
        REQUIRE(rec->Normal.y == Approx(1.0f));
        REQUIRE(rec->FrontFace);
        REQUIRE(rec->U == Approx(0.6f));
        REQUIRE(rec->V == Approx(0.65f));

        REQUIRE_FALSE(floor.Hit(Ray(Point3(3.0f, 2.0f, 0.0f), Vec3(0.0f, -1.0f, 0.0f)), 0.001f, kInfinity));
        REQUIRE_FALSE(floor.Hit(Ray(Point3(0.0f, 2.0f, 0.0f), Vec3(1.0f, 0.0f, 0.0f)), 0.001f, kInfinity));
    }

    SECTION("Flat rectangles still have a volume") {
        const AxisRect wall(RectPlane::XY, 0.0f, 1.0f, 0.0f, 1.0f, 5.0f, mat);
        const auto box = wall.BoundingBox(0.0f, 1.0f);
        REQUIRE(box);
        REQUIRE(box->Max.z > box->Min.z);
    }

    SECTION("Box returns the nearest face") {
        const Box box(Point3(-1.0f), Point3(1.0f), mat);
        const auto rec = box.Hit(Ray(Point3(0.0f, 0.0f, 5.0f), Vec3(0.0f, 0.0f, -1.0f)), 0.001f, kInfinity);
        REQUIRE(rec);
        REQUIRE(rec->T == Approx(4.0f));
        REQUIRE(rec->Normal.z == Approx(1.0f));

        const auto inside = box.Hit(Ray(Point3(0.0f), Vec3(1.0f, 0.0f, 0.0f)), 0.001f, kInfinity);
        REQUIRE(inside);
        REQUIRE(inside->T == Approx(1.0f));
        REQUIRE(glm::dot(inside->Normal, Vec3(1.0f, 0.0f, 0.0f)) < 0.0f);
    }
}

TEST_CASE("Hittable list", "[geometry][list]") {
    const auto nearMat = Gray();
    const auto farMat = Gray();

    HittableList list;
    REQUIRE(list.Empty());
    REQUIRE_FALSE(list.BoundingBox(0.0f, 1.0f));

    list.Add(Sphere(Point3(0.0f, 0.0f, -5.0f), 0.5f, farMat));
    list.Add(Sphere(Point3(0.0f, 0.0f, -2.0f), 0.5f, nearMat));
    REQUIRE(list.Size() == 2);

    const auto rec = list.Hit(Ray(Point3(0.0f), Vec3(0.0f, 0.0f, -1.0f)), 0.001f, kInfinity);
    REQUIRE(rec);
    REQUIRE(rec->Mat == nearMat.get());
    REQUIRE(rec->T == Approx(1.5f));

    const auto box = list.BoundingBox(0.0f, 1.0f);
    REQUIRE(box);
    REQUIRE(box->Min.z == Approx(-5.5f));
    REQUIRE(box->Max.z == Approx(-1.5f));

    const Hittable wrapped(list);
    REQUIRE(std::holds_alternative<HittableList>(wrapped.Kind()));
    REQUIRE(wrapped.Hit(Ray(Point3(0.0f), Vec3(0.0f, 0.0f, -1.0f)), 0.001f, kInfinity)->Mat == nearMat.get());

    list.Clear();
    REQUIRE(list.Empty());
}

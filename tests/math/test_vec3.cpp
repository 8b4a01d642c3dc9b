#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <hikari/math/ray.h>
#include <hikari/math/vec3.h>
#include <glm/glm.hpp>
#include <limits>

using namespace hikari::math;
using Catch::Approx;

namespace {

const Vec3 kUnitX(1.0f, 0.0f, 0.0f);
const Vec3 kUnitY(0.0f, 1.0f, 0.0f);

} // namespace

TEST_CASE("Angle conversion", "[math][vec3]") {
    REQUIRE(DegreesToRadians(180.0f) == Approx(kPi));
    REQUIRE(DegreesToRadians(90.0f) == Approx(kPi / 2.0f));
    REQUIRE(RadiansToDegrees(kPi) == Approx(180.0f));
    REQUIRE(RadiansToDegrees(DegreesToRadians(37.5f)) == Approx(37.5f));
}

TEST_CASE("Vector helpers", "[math][vec3]") {
    SECTION("Near zero") {
        REQUIRE(NearZero(Vec3(0.0f)));
        REQUIRE(NearZero(Vec3(1e-9f, -1e-9f, 0.0f)));
        REQUIRE_FALSE(NearZero(Vec3(1e-3f, 0.0f, 0.0f)));
        REQUIRE_FALSE(NearZero(Vec3(0.0f, 0.0f, -1e-7f)));
    }

    SECTION("Finite check") {
        REQUIRE(IsFinite(Vec3(1.0f, 2.0f, 3.0f)));
        REQUIRE_FALSE(IsFinite(Vec3(std::numeric_limits<float>::quiet_NaN(), 0.0f, 0.0f)));
        REQUIRE_FALSE(IsFinite(Vec3(0.0f, std::numeric_limits<float>::infinity(), 0.0f)));
    }

    SECTION("Lerp end points and midpoint") {
        const Vec3 a(0.0f, 2.0f, 4.0f);
        const Vec3 b(2.0f, 4.0f, 8.0f);
        REQUIRE(Lerp(a, b, 0.0f) == a);
        REQUIRE(Lerp(a, b, 1.0f) == b);
        const Vec3 mid = Lerp(a, b, 0.5f);
        REQUIRE(mid.x == Approx(1.0f));
        REQUIRE(mid.y == Approx(3.0f));
        REQUIRE(mid.z == Approx(6.0f));
    }

    SECTION("Color from bytes") {
        const Color c = ColorFromU8(255, 0, 51);
        REQUIRE(c.r == Approx(1.0f));
        REQUIRE(c.g == 0.0f);
        REQUIRE(c.b == Approx(0.2f));
        REQUIRE(colors::kCyan == ColorFromU8(34, 166, 153));
        REQUIRE(colors::kYellow == ColorFromU8(242, 190, 34));
    }
}

TEST_CASE("Reflection and refraction", "[math][vec3]") {
    SECTION("Reflect about the up axis") {
        const Vec3 reflected = Reflect(glm::normalize(Vec3(1.0f, -1.0f, 0.0f)), kUnitY);
        const Vec3 expected = glm::normalize(Vec3(1.0f, 1.0f, 0.0f));
        REQUIRE(reflected.x == Approx(expected.x));
        REQUIRE(reflected.y == Approx(expected.y));
        REQUIRE(reflected.z == Approx(0.0f).margin(1e-6));
    }

    SECTION("Refraction with equal indices keeps the direction") {
        const Vec3 refracted = Refract(Vec3(1.0f, 1.0f, 0.0f), -kUnitX, 1.0f);
        REQUIRE(refracted.x == Approx(0.0f).margin(1e-6));
        REQUIRE(refracted.y == Approx(1.0f));
        REQUIRE(refracted.z == Approx(0.0f).margin(1e-6));
    }

    SECTION("Refraction into a denser medium") {
        const Vec3 refracted = Refract(glm::normalize(Vec3(1.0f, -1.0f, 0.0f)), kUnitY, 1.3f);
        REQUIRE(refracted.x == Approx(0.91923875f));
        REQUIRE(refracted.y == Approx(-0.39370057f));
        REQUIRE(refracted.z == Approx(0.0f).margin(1e-6));
    }

    SECTION("Schlick reflectance") {
        // Head-on incidence gives r0
        REQUIRE(Schlick(1.0f, 1.0f / 1.5f) == Approx(0.04f));
        // Grazing incidence reflects everything
        REQUIRE(Schlick(0.0f, 1.0f / 1.5f) == Approx(1.0f));
        REQUIRE(Schlick(1.0f, 1.0f) == Approx(0.0f).margin(1e-7));
    }
}

TEST_CASE("Ray evaluation", "[math][ray]") {
    const Ray ray(Point3(1.0f, 2.0f, 3.0f), Vec3(0.0f, 0.0f, -2.0f), 0.25f);
    REQUIRE(ray.At(0.0f) == ray.Origin);
    REQUIRE(ray.At(1.5f) == Point3(1.0f, 2.0f, 0.0f));
    REQUIRE(ray.Time == 0.25f);
}

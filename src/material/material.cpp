// hikari - CPU path tracer
// Copyright (c) 2025 hikari Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "hikari/material/material.h"

#include <cmath>
#include <string>

#include "hikari/core/common.hpp"
#include "hikari/core/error.hpp"

namespace hikari::material {

MaterialPtr Material::MakeLambertian(const Texture& albedo) {
    return std::make_shared<const Material>(Lambertian{albedo});
}

MaterialPtr Material::MakeMetal(const Color& albedo, float fuzz) {
    if (!(fuzz >= 0.0f)) {
        throw SceneError("metal fuzz must be non-negative, got " + std::to_string(fuzz));
    }
    return std::make_shared<const Material>(Metal{albedo, fuzz < 1.0f ? fuzz : 1.0f});
}

MaterialPtr Material::MakeDielectric(float indexOfRefraction) {
    if (!(indexOfRefraction > 0.0f) || !std::isfinite(indexOfRefraction)) {
        throw SceneError("index of refraction must be positive, got " +
                         std::to_string(indexOfRefraction));
    }
    return std::make_shared<const Material>(Dielectric{indexOfRefraction});
}

MaterialPtr Material::MakeDiffuseLight(const Texture& emit) {
    return std::make_shared<const Material>(DiffuseLight{emit});
}

std::optional<ScatterRecord> Material::Scatter(const Ray& rayIn, const geometry::HitRecord& rec,
                                               math::Rng& rng) const {
    return std::visit(overloaded{
        [&](const Lambertian& lambertian) -> std::optional<ScatterRecord> {
            math::Vec3 direction = rec.Normal + rng.RandomUnitVector();
            // Catch degenerate scatter direction
            if (math::NearZero(direction)) {
                direction = rec.Normal;
            }
            return ScatterRecord{
                lambertian.Albedo.Value(rec.U, rec.V, rec.Point),
                Ray(rec.Point, direction, rayIn.Time)
            };
        },
        [&](const Metal& metal) -> std::optional<ScatterRecord> {
            const math::Vec3 reflected = math::Reflect(glm::normalize(rayIn.Direction), rec.Normal);
            const math::Vec3 direction = reflected + metal.Fuzz * rng.RandomInUnitSphere();
            if (glm::dot(direction, rec.Normal) <= 0.0f) {
                return std::nullopt;
            }
            return ScatterRecord{metal.Albedo, Ray(rec.Point, direction, rayIn.Time)};
        },
        [&](const Dielectric& dielectric) -> std::optional<ScatterRecord> {
            const float refractionRatio = rec.FrontFace ? (1.0f / dielectric.IndexOfRefraction)
                                                        : dielectric.IndexOfRefraction;
            const math::Vec3 unitDirection = glm::normalize(rayIn.Direction);
            const float cosTheta = std::fmin(glm::dot(-unitDirection, rec.Normal), 1.0f);
            const float sinTheta = std::sqrt(std::fmax(0.0f, 1.0f - cosTheta * cosTheta));

            const bool cannotRefract = refractionRatio * sinTheta > 1.0f;
            math::Vec3 direction;
            if (cannotRefract || math::Schlick(cosTheta, refractionRatio) > rng.Uniform()) {
                direction = math::Reflect(unitDirection, rec.Normal);
            } else {
                direction = math::Refract(unitDirection, rec.Normal, refractionRatio);
            }
            return ScatterRecord{math::colors::kWhite, Ray(rec.Point, direction, rayIn.Time)};
        },
        [](const DiffuseLight&) -> std::optional<ScatterRecord> {
            return std::nullopt;
        },
    }, kind_);
}

Color Material::Emitted(float u, float v, const Point3& p) const {
    if (const auto* light = std::get_if<DiffuseLight>(&kind_)) {
        return light->Emit.Value(u, v, p);
    }
    return math::colors::kBlack;
}

std::string_view Material::Name() const {
    return std::visit(overloaded{
        [](const Lambertian&) { return std::string_view("lambertian"); },
        [](const Metal&) { return std::string_view("metal"); },
        [](const Dielectric&) { return std::string_view("dielectric"); },
        [](const DiffuseLight&) { return std::string_view("diffuse_light"); },
    }, kind_);
}

} // namespace hikari::material

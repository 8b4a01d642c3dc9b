// hikari - CPU path tracer
// Copyright (c) 2025 hikari Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <memory>
#include <optional>
#include <string_view>
#include <variant>

#include "hikari/geometry/hit_record.h"
#include "hikari/material/texture.h"
#include "hikari/math/random.h"
#include "hikari/math/ray.h"

namespace hikari::material {

using math::Ray;

// Diffuse reflector
struct Lambertian {
    Texture Albedo;
};

// Specular reflector, Fuzz in [0, 1] perturbs the mirror direction
struct Metal {
    Color Albedo{1.0f};
    float Fuzz = 0.0f;
};

// Clear refractive material such as glass or water
struct Dielectric {
    float IndexOfRefraction = 1.5f;
};

// Emitter, never scatters
struct DiffuseLight {
    Texture Emit;
};

struct ScatterRecord {
    Color Attenuation{1.0f};
    Ray Scattered;
};

class Material;
using MaterialPtr = std::shared_ptr<const Material>;

/**
 * Closed set of scattering models.
 *
 * Instances are immutable and shared between primitives through MaterialPtr.
 * Construction goes through the Make* factories, which validate parameters
 * and throw SceneError.
 */
class Material {
public:
    using Variant = std::variant<Lambertian, Metal, Dielectric, DiffuseLight>;

    static MaterialPtr MakeLambertian(const Texture& albedo);
    static MaterialPtr MakeMetal(const Color& albedo, float fuzz);
    static MaterialPtr MakeDielectric(float indexOfRefraction);
    static MaterialPtr MakeDiffuseLight(const Texture& emit);

    /**
     * Scatter an incoming ray at a surface hit.
     *
     * @return Attenuation and outgoing ray, or nullopt when the ray is absorbed
     */
    std::optional<ScatterRecord> Scatter(const Ray& rayIn, const geometry::HitRecord& rec,
                                         math::Rng& rng) const;

    // Radiance emitted at the hit point, black for non emitters
    Color Emitted(float u, float v, const Point3& p) const;

    const Variant& Kind() const { return kind_; }
    std::string_view Name() const;

    explicit Material(Variant kind) : kind_(std::move(kind)) {}

private:
    Variant kind_;
};

} // namespace hikari::material

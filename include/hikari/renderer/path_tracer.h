// hikari - CPU path tracer
// Copyright (c) 2025 hikari Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <variant>

#include "hikari/geometry/hittable.h"
#include "hikari/math/random.h"
#include "hikari/math/ray.h"
#include "hikari/math/vec3.h"

namespace hikari::renderer {

using math::Color;
using math::Ray;

// Vertical blend from Bottom (looking down) to Top (looking up)
struct SkyGradient {
    Color Bottom = math::colors::kWhite;
    Color Top = math::colors::kSkyBlue;
};

struct SolidBackground {
    Color Value = math::colors::kBlack;
};

// Radiance of rays that leave the scene
class Background {
public:
    using Variant = std::variant<SkyGradient, SolidBackground>;

    Background() : kind_(SkyGradient{}) {}
    Background(SkyGradient sky) : kind_(sky) {}
    Background(SolidBackground solid) : kind_(solid) {}

    static Background Sky() { return Background(SkyGradient{}); }
    static Background Solid(const Color& color) { return Background(SolidBackground{color}); }

    Color Sample(const Ray& ray) const;

    const Variant& Kind() const { return kind_; }

private:
    Variant kind_;
};

/**
 * Unidirectional Monte-Carlo path tracer.
 *
 * Each call follows one random light path: at every hit the material either
 * absorbs the ray or scatters it, and the returned radiance is the emitted
 * light plus the attenuated radiance of the scattered ray. Recursion stops at
 * the depth budget, which bounds the cost of rays trapped between mirrors.
 */
class PathTracer {
public:
    // Lower bound of every intersection query, avoids shadow acne
    static constexpr float kShadowAcneEpsilon = 0.001f;

    explicit PathTracer(Background background = Background::Sky());

    /**
     * Radiance carried back along ray.
     *
     * @param depth Remaining bounces; depth <= 0 yields black
     */
    Color RayColor(const Ray& ray, const geometry::Hittable& world, int depth, math::Rng& rng) const;

    const Background& GetBackground() const { return background_; }

private:
    Background background_;
};

} // namespace hikari::renderer

// hikari - CPU path tracer
// Copyright (c) 2025 hikari Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "hikari/renderer/path_tracer.h"

#include <limits>
#include <utility>

#include "hikari/core/common.hpp"
#include "hikari/material/material.h"

namespace hikari::renderer {

Color Background::Sample(const Ray& ray) const {
    return std::visit(overloaded{
        [&ray](const SkyGradient& sky) -> Color {
            const math::Vec3 unitDirection = glm::normalize(ray.Direction);
            const float t = 0.5f * (unitDirection.y + 1.0f);
            return math::Lerp(sky.Bottom, sky.Top, t);
        },
        [](const SolidBackground& solid) -> Color {
            return solid.Value;
        },
    }, kind_);
}

PathTracer::PathTracer(Background background) : background_(std::move(background)) {}

Color PathTracer::RayColor(const Ray& ray, const geometry::Hittable& world, int depth,
                           math::Rng& rng) const {
    if (depth <= 0) {
        return math::colors::kBlack;
    }

    const auto rec = world.Hit(ray, kShadowAcneEpsilon, std::numeric_limits<float>::infinity());
    if (!rec) {
        return background_.Sample(ray);
    }

    const material::Material& mat = *rec->Mat;
    const Color emitted = mat.Emitted(rec->U, rec->V, rec->Point);

    const auto scatter = mat.Scatter(ray, *rec, rng);
    if (!scatter) {
        return emitted;
    }

    return emitted + scatter->Attenuation * RayColor(scatter->Scattered, world, depth - 1, rng);
}

} // namespace hikari::renderer

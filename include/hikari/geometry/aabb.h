// hikari - CPU path tracer
// Copyright (c) 2025 hikari Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "hikari/math/ray.h"
#include "hikari/math/vec3.h"

namespace hikari::geometry {

// Axis-aligned bounding box
class Aabb {
public:
    math::Point3 Min{0.0f};
    math::Point3 Max{0.0f};

    Aabb() = default;
    Aabb(const math::Point3& a, const math::Point3& b) : Min(glm::min(a, b)), Max(glm::max(a, b)) {}

    /**
     * Slab test against the open interval (tMin, tMax).
     */
    bool Hit(const math::Ray& ray, float tMin, float tMax) const;

    math::Point3 Centroid() const { return 0.5f * (Min + Max); }

    static Aabb Surrounding(const Aabb& a, const Aabb& b);
};

} // namespace hikari::geometry

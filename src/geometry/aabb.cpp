// hikari - CPU path tracer
// Copyright (c) 2025 hikari Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "hikari/geometry/aabb.h"

#include <utility>

namespace hikari::geometry {

bool Aabb::Hit(const math::Ray& ray, float tMin, float tMax) const {
    for (int axis = 0; axis < 3; ++axis) {
        // Division by a zero component gives +-inf, which the comparisons handle
        const float invD = 1.0f / ray.Direction[axis];
        float t0 = (Min[axis] - ray.Origin[axis]) * invD;
        float t1 = (Max[axis] - ray.Origin[axis]) * invD;
        if (invD < 0.0f) {
            std::swap(t0, t1);
        }
        tMin = t0 > tMin ? t0 : tMin;
        tMax = t1 < tMax ? t1 : tMax;
        if (tMax <= tMin) {
            return false;
        }
    }
    return true;
}

Aabb Aabb::Surrounding(const Aabb& a, const Aabb& b) {
    return Aabb(glm::min(a.Min, b.Min), glm::max(a.Max, b.Max));
}

} // namespace hikari::geometry

// hikari - CPU path tracer
// Copyright (c) 2025 hikari Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "hikari/math/vec3.h"

namespace hikari::math {

// origin + t * direction, t > 0. Direction is not normalized.
struct Ray {
    Point3 Origin{0.0f};
    Vec3 Direction{0.0f, 0.0f, -1.0f};
    float Time = 0.0f;

    Ray() = default;
    Ray(const Point3& origin, const Vec3& direction, float time = 0.0f)
        : Origin(origin), Direction(direction), Time(time) {}

    Point3 At(float t) const { return Origin + t * Direction; }
};

} // namespace hikari::math

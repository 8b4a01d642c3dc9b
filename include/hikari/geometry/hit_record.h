// hikari - CPU path tracer
// Copyright (c) 2025 hikari Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "hikari/math/ray.h"
#include "hikari/math/vec3.h"

namespace hikari::material {
class Material;
}

namespace hikari::geometry {

using math::Point3;
using math::Ray;
using math::Vec3;

struct HitRecord {
    Point3 Point{0.0f};
    Vec3 Normal{0.0f};                        // unit length, faces the incoming ray
    const material::Material* Mat = nullptr;  // owned by the scene
    float T = 0.0f;
    float U = 0.0f;
    float V = 0.0f;
    bool FrontFace = true;

    // outwardNormal must be unit length
    void SetFaceNormal(const Ray& ray, const Vec3& outwardNormal) {
        FrontFace = glm::dot(ray.Direction, outwardNormal) < 0.0f;
        Normal = FrontFace ? outwardNormal : -outwardNormal;
    }
};

} // namespace hikari::geometry

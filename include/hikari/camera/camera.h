// hikari - CPU path tracer
// Copyright (c) 2025 hikari Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "hikari/math/random.h"
#include "hikari/math/ray.h"
#include "hikari/math/vec3.h"

namespace hikari::camera {

using math::Point3;
using math::Ray;
using math::Vec3;

// Where the camera sits and where it looks
struct CameraBody {
    Point3 LookFrom{0.0f, 0.0f, 0.0f};
    Point3 LookAt{0.0f, 0.0f, -1.0f};
    Vec3 Vup{0.0f, 1.0f, 0.0f};
};

// Projection and depth of field
struct CameraLens {
    float VerticalFov = 90.0f; // degrees
    float AspectRatio = 16.0f / 9.0f;
    float Aperture = 0.0f;     // lens diameter, 0 for a pinhole
    float FocusDistance = 1.0f;
};

// Rays get a time uniformly drawn from [Time0, Time1]
struct Shutter {
    float Time0 = 0.0f;
    float Time1 = 0.0f;
};

struct CameraDesc {
    CameraBody Body;
    CameraLens Lens;
    Shutter Exposure;
};

/**
 * Thin lens camera mapping image plane coordinates to world space rays.
 *
 * Immutable after construction; GetRay only reads the camera and draws from
 * the caller's random stream.
 */
class Camera {
public:
    // Throws CameraError for degenerate parameters
    explicit Camera(const CameraDesc& desc);
    Camera(const CameraBody& body, const CameraLens& lens, const Shutter& shutter = {});

    /**
     * @param s Horizontal image plane coordinate, 0 at the left edge
     * @param t Vertical image plane coordinate, 0 at the bottom edge
     */
    Ray GetRay(float s, float t, math::Rng& rng) const;

    const Point3& Origin() const { return origin_; }
    const Point3& LowerLeftCorner() const { return lowerLeftCorner_; }
    const Vec3& Horizontal() const { return horizontal_; }
    const Vec3& Vertical() const { return vertical_; }
    float LensRadius() const { return lensRadius_; }
    const CameraDesc& Desc() const { return desc_; }

private:
    CameraDesc desc_;
    Point3 origin_;
    Point3 lowerLeftCorner_;
    Vec3 horizontal_;
    Vec3 vertical_;
    Vec3 u_, v_, w_;
    float lensRadius_;
    float time0_;
    float time1_;
};

} // namespace hikari::camera

// hikari - CPU path tracer
// Copyright (c) 2025 hikari Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "hikari/camera/camera.h"

#include <cmath>
#include <string>

#include "hikari/core/error.hpp"

namespace hikari::camera {
namespace {

void Validate(const CameraDesc& desc) {
    const Vec3 lookDirection = desc.Body.LookFrom - desc.Body.LookAt;
    if (glm::dot(lookDirection, lookDirection) <= 1e-12f) {
        throw CameraError("look-from and look-at points coincide");
    }
    if (math::NearZero(glm::cross(desc.Body.Vup, lookDirection))) {
        throw CameraError("up vector is zero or parallel to the view direction");
    }
    if (!(desc.Lens.VerticalFov > 0.0f && desc.Lens.VerticalFov < 180.0f)) {
        throw CameraError("vertical field of view must be in (0, 180) degrees, got " +
                          std::to_string(desc.Lens.VerticalFov));
    }
    if (!(desc.Lens.AspectRatio > 0.0f)) {
        throw CameraError("aspect ratio must be positive");
    }
    if (!(desc.Lens.Aperture >= 0.0f)) {
        throw CameraError("aperture must not be negative");
    }
    if (!(desc.Lens.FocusDistance > 0.0f)) {
        throw CameraError("focus distance must be positive");
    }
    if (desc.Exposure.Time1 < desc.Exposure.Time0) {
        throw CameraError("shutter closes before it opens");
    }
}

} // namespace

Camera::Camera(const CameraBody& body, const CameraLens& lens, const Shutter& shutter)
    : Camera(CameraDesc{body, lens, shutter}) {}

Camera::Camera(const CameraDesc& desc) : desc_(desc) {
    Validate(desc_);

    const float theta = math::DegreesToRadians(desc_.Lens.VerticalFov);
    const float h = std::tan(theta / 2.0f);
    const float viewportHeight = 2.0f * h;
    const float viewportWidth = desc_.Lens.AspectRatio * viewportHeight;

    w_ = glm::normalize(desc_.Body.LookFrom - desc_.Body.LookAt);
    u_ = glm::normalize(glm::cross(desc_.Body.Vup, w_));
    v_ = glm::cross(w_, u_);

    const float focus = desc_.Lens.FocusDistance;
    origin_ = desc_.Body.LookFrom;
    horizontal_ = focus * viewportWidth * u_;
    vertical_ = focus * viewportHeight * v_;
    lowerLeftCorner_ = origin_ - horizontal_ / 2.0f - vertical_ / 2.0f - focus * w_;

    lensRadius_ = desc_.Lens.Aperture / 2.0f;
    time0_ = desc_.Exposure.Time0;
    time1_ = desc_.Exposure.Time1;
}

Ray Camera::GetRay(float s, float t, math::Rng& rng) const {
    Vec3 offset(0.0f);
    if (lensRadius_ > 0.0f) {
        const Vec3 rd = lensRadius_ * rng.RandomInUnitDisk();
        offset = u_ * rd.x + v_ * rd.y;
    }

    const float time = time1_ > time0_ ? rng.Uniform(time0_, time1_) : time0_;
    return Ray(origin_ + offset,
               lowerLeftCorner_ + s * horizontal_ + t * vertical_ - origin_ - offset,
               time);
}

} // namespace hikari::camera

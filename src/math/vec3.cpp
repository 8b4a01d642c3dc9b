// hikari - CPU path tracer
// Copyright (c) 2025 hikari Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "hikari/math/vec3.h"

#include <cmath>

namespace hikari::math {

float DegreesToRadians(float degrees) {
    return degrees * kPi / 180.0f;
}

float RadiansToDegrees(float radians) {
    return radians * 180.0f / kPi;
}

bool NearZero(const Vec3& v) {
    const float s = 1e-8f;
    return std::fabs(v.x) < s && std::fabs(v.y) < s && std::fabs(v.z) < s;
}

bool IsFinite(const Vec3& v) {
    return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}

Vec3 Lerp(const Vec3& a, const Vec3& b, float t) {
    return (1.0f - t) * a + t * b;
}

Vec3 Reflect(const Vec3& v, const Vec3& n) {
    return v - 2.0f * glm::dot(v, n) * n;
}

Vec3 Refract(const Vec3& uv, const Vec3& n, float etaiOverEtat) {
    const float cosTheta = std::fmin(glm::dot(-uv, n), 1.0f);
    const Vec3 rOutPerp = etaiOverEtat * (uv + cosTheta * n);
    const Vec3 rOutParallel = -std::sqrt(std::fabs(1.0f - glm::dot(rOutPerp, rOutPerp))) * n;
    return rOutPerp + rOutParallel;
}

float Schlick(float cosine, float refractionRatio) {
    float r0 = (1.0f - refractionRatio) / (1.0f + refractionRatio);
    r0 = r0 * r0;
    return r0 + (1.0f - r0) * std::pow(1.0f - cosine, 5.0f);
}

Color ColorFromU8(uint8_t r, uint8_t g, uint8_t b) {
    return Color(r / 255.0f, g / 255.0f, b / 255.0f);
}

} // namespace hikari::math

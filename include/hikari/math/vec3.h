// hikari - CPU path tracer
// Copyright (c) 2025 hikari Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <cstdint>

#include <glm/glm.hpp>

namespace hikari::math {

using glm::vec3;

using Vec3 = glm::vec3;
using Point3 = glm::vec3;
using Color = glm::vec3;

constexpr float kPi = 3.14159265358979323846f;

namespace colors {
inline const Color kWhite{1.0f, 1.0f, 1.0f};
inline const Color kBlack{0.0f, 0.0f, 0.0f};
inline const Color kRed{200.0f / 255.0f, 0.0f, 0.0f};
inline const Color kGreen{0.0f, 200.0f / 255.0f, 0.0f};
inline const Color kBlue{0.0f, 0.0f, 200.0f / 255.0f};
inline const Color kCyan{34.0f / 255.0f, 166.0f / 255.0f, 153.0f / 255.0f};
inline const Color kYellow{242.0f / 255.0f, 190.0f / 255.0f, 34.0f / 255.0f};
inline const Color kSkyBlue{0.5f, 0.7f, 1.0f};
} // namespace colors

float DegreesToRadians(float degrees);
float RadiansToDegrees(float radians);

// True when every component is below 1e-8 in magnitude
bool NearZero(const Vec3& v);

// False if any component is NaN or infinite
bool IsFinite(const Vec3& v);

Vec3 Lerp(const Vec3& a, const Vec3& b, float t);

/**
 * Mirror v about the plane with normal n (n must be unit length).
 */
Vec3 Reflect(const Vec3& v, const Vec3& n);

/**
 * Snell refraction of the unit vector uv through the surface with unit normal n.
 *
 * @param etaiOverEtat Ratio of refractive indices (incident over transmitted)
 * @return Refracted direction. Callers check for total internal reflection first.
 */
Vec3 Refract(const Vec3& uv, const Vec3& n, float etaiOverEtat);

/**
 * Schlick's approximation of Fresnel reflectance.
 *
 * @param cosine Cosine of the incident angle
 * @param refractionRatio Ratio of refractive indices at the interface
 */
float Schlick(float cosine, float refractionRatio);

Color ColorFromU8(uint8_t r, uint8_t g, uint8_t b);

} // namespace hikari::math

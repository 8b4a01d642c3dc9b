// hikari - CPU path tracer
// Copyright (c) 2025 hikari Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <array>
#include <optional>

#include "hikari/geometry/aabb.h"
#include "hikari/geometry/hit_record.h"
#include "hikari/material/material.h"

namespace hikari::geometry {

using material::MaterialPtr;

class Sphere {
public:
    Sphere(const Point3& center, float radius, MaterialPtr material);

    std::optional<HitRecord> Hit(const Ray& ray, float tMin, float tMax) const;
    std::optional<Aabb> BoundingBox(float time0, float time1) const;

    const Point3& Center() const { return center_; }
    float Radius() const { return radius_; }
    const MaterialPtr& GetMaterial() const { return material_; }

private:
    Point3 center_;
    float radius_;
    MaterialPtr material_;
};

// Sphere whose center moves linearly between two shutter times
class MovingSphere {
public:
    MovingSphere(const Point3& center0, const Point3& center1, float time0, float time1,
                 float radius, MaterialPtr material);

    std::optional<HitRecord> Hit(const Ray& ray, float tMin, float tMax) const;
    std::optional<Aabb> BoundingBox(float time0, float time1) const;

    Point3 CenterAt(float time) const;
    float Radius() const { return radius_; }

private:
    Point3 center0_;
    Point3 center1_;
    float time0_;
    float time1_;
    float radius_;
    MaterialPtr material_;
};

enum class RectPlane {
    XY, // constant z
    XZ, // constant y
    YZ, // constant x
};

/**
 * Axis aligned rectangle [A0, A1] x [B0, B1] lying in the plane at
 * coordinate K along the remaining axis. The outward normal points along
 * the positive constant axis, or the negative one when facesNegative is set.
 */
class AxisRect {
public:
    AxisRect(RectPlane plane, float a0, float a1, float b0, float b1, float k, MaterialPtr material,
             bool facesNegative = false);

    std::optional<HitRecord> Hit(const Ray& ray, float tMin, float tMax) const;
    std::optional<Aabb> BoundingBox(float time0, float time1) const;

    RectPlane Plane() const { return plane_; }

private:
    RectPlane plane_;
    int axisA_ = 0;
    int axisB_ = 1;
    int axisK_ = 2;
    float a0_, a1_, b0_, b1_, k_;
    float normalSign_;
    MaterialPtr material_;
};

// Closed axis aligned box made of six rectangles
class Box {
public:
    Box(const Point3& p0, const Point3& p1, MaterialPtr material);

    std::optional<HitRecord> Hit(const Ray& ray, float tMin, float tMax) const;
    std::optional<Aabb> BoundingBox(float time0, float time1) const;

private:
    Point3 min_;
    Point3 max_;
    std::array<AxisRect, 6> sides_;
};

} // namespace hikari::geometry

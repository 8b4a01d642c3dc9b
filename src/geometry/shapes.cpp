// hikari - CPU path tracer
// Copyright (c) 2025 hikari Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "hikari/geometry/shapes.h"

#include <cmath>
#include <utility>

#include "hikari/core/error.hpp"

namespace hikari::geometry {
namespace {

void SphereUv(const Point3& p, float& u, float& v) {
    // p: point on the unit sphere centered at the origin
    const float theta = std::acos(glm::clamp(-p.y, -1.0f, 1.0f));
    const float phi = std::atan2(-p.z, p.x) + math::kPi;
    u = phi / (2.0f * math::kPi);
    v = theta / math::kPi;
}

// Nearest root of |o + t d - c|^2 = r^2 inside (tMin, tMax)
std::optional<float> NearestSphereRoot(const Ray& ray, const Point3& center, float radius,
                                       float tMin, float tMax) {
    const Vec3 oc = ray.Origin - center;
    const float a = glm::dot(ray.Direction, ray.Direction);
    if (a == 0.0f) {
        return std::nullopt;
    }
    const float halfB = glm::dot(oc, ray.Direction);
    const float c = glm::dot(oc, oc) - radius * radius;
    const float discriminant = halfB * halfB - a * c;
    if (discriminant < 0.0f) {
        return std::nullopt;
    }

    const float sqrtd = std::sqrt(discriminant);
    float root = (-halfB - sqrtd) / a;
    if (root <= tMin || root >= tMax) {
        root = (-halfB + sqrtd) / a;
        if (root <= tMin || root >= tMax) {
            return std::nullopt;
        }
    }
    return root;
}

HitRecord MakeSphereHit(const Ray& ray, float t, const Point3& center, float radius,
                        const material::Material* mat) {
    HitRecord rec;
    rec.T = t;
    rec.Point = ray.At(t);
    const Vec3 outwardNormal = (rec.Point - center) / radius;
    rec.SetFaceNormal(ray, outwardNormal);
    SphereUv(outwardNormal, rec.U, rec.V);
    rec.Mat = mat;
    return rec;
}

void RequireMaterial(const MaterialPtr& material, const char* shape) {
    if (!material) {
        throw SceneError(std::string(shape) + " requires a material");
    }
}

} // namespace

// Sphere

Sphere::Sphere(const Point3& center, float radius, MaterialPtr material)
    : center_(center), radius_(radius), material_(std::move(material)) {
    if (!(radius_ > 0.0f)) {
        throw SceneError("sphere radius must be positive");
    }
    RequireMaterial(material_, "sphere");
}

std::optional<HitRecord> Sphere::Hit(const Ray& ray, float tMin, float tMax) const {
    const auto root = NearestSphereRoot(ray, center_, radius_, tMin, tMax);
    if (!root) {
        return std::nullopt;
    }
    return MakeSphereHit(ray, *root, center_, radius_, material_.get());
}

std::optional<Aabb> Sphere::BoundingBox(float, float) const {
    const Vec3 extent(radius_);
    return Aabb(center_ - extent, center_ + extent);
}

// MovingSphere

MovingSphere::MovingSphere(const Point3& center0, const Point3& center1, float time0, float time1,
                           float radius, MaterialPtr material)
    : center0_(center0), center1_(center1), time0_(time0), time1_(time1), radius_(radius),
      material_(std::move(material)) {
    if (!(radius_ > 0.0f)) {
        throw SceneError("moving sphere radius must be positive");
    }
    if (time1_ < time0_) {
        throw SceneError("moving sphere time interval is reversed");
    }
    RequireMaterial(material_, "moving sphere");
}

Point3 MovingSphere::CenterAt(float time) const {
    if (time1_ == time0_) {
        return center0_;
    }
    return center0_ + ((time - time0_) / (time1_ - time0_)) * (center1_ - center0_);
}

std::optional<HitRecord> MovingSphere::Hit(const Ray& ray, float tMin, float tMax) const {
    const Point3 center = CenterAt(ray.Time);
    const auto root = NearestSphereRoot(ray, center, radius_, tMin, tMax);
    if (!root) {
        return std::nullopt;
    }
    return MakeSphereHit(ray, *root, center, radius_, material_.get());
}

std::optional<Aabb> MovingSphere::BoundingBox(float time0, float time1) const {
    const Vec3 extent(radius_);
    const Point3 c0 = CenterAt(time0);
    const Point3 c1 = CenterAt(time1);
    return Aabb::Surrounding(Aabb(c0 - extent, c0 + extent), Aabb(c1 - extent, c1 + extent));
}

// AxisRect

AxisRect::AxisRect(RectPlane plane, float a0, float a1, float b0, float b1, float k,
                   MaterialPtr material, bool facesNegative)
    : plane_(plane), a0_(a0), a1_(a1), b0_(b0), b1_(b1), k_(k),
      normalSign_(facesNegative ? -1.0f : 1.0f), material_(std::move(material)) {
    switch (plane_) {
        case RectPlane::XY: axisA_ = 0; axisB_ = 1; axisK_ = 2; break;
        case RectPlane::XZ: axisA_ = 0; axisB_ = 2; axisK_ = 1; break;
        case RectPlane::YZ: axisA_ = 1; axisB_ = 2; axisK_ = 0; break;
    }
    if (!(a0_ < a1_) || !(b0_ < b1_)) {
        throw SceneError("rectangle bounds must be increasing");
    }
    RequireMaterial(material_, "rectangle");
}

std::optional<HitRecord> AxisRect::Hit(const Ray& ray, float tMin, float tMax) const {
    const float dirK = ray.Direction[axisK_];
    if (dirK == 0.0f) {
        return std::nullopt;
    }
    const float t = (k_ - ray.Origin[axisK_]) / dirK;
    if (t <= tMin || t >= tMax) {
        return std::nullopt;
    }
    const float a = ray.Origin[axisA_] + t * ray.Direction[axisA_];
    const float b = ray.Origin[axisB_] + t * ray.Direction[axisB_];
    if (a < a0_ || a > a1_ || b < b0_ || b > b1_) {
        return std::nullopt;
    }

    HitRecord rec;
    rec.T = t;
    rec.Point = ray.At(t);
    rec.U = (a - a0_) / (a1_ - a0_);
    rec.V = (b - b0_) / (b1_ - b0_);
    Vec3 outwardNormal(0.0f);
    outwardNormal[axisK_] = normalSign_;
    rec.SetFaceNormal(ray, outwardNormal);
    rec.Mat = material_.get();
    return rec;
}

std::optional<Aabb> AxisRect::BoundingBox(float, float) const {
    // Pad the flat dimension so the box has non-zero width
    Point3 lo(0.0f);
    Point3 hi(0.0f);
    lo[axisA_] = a0_;
    hi[axisA_] = a1_;
    lo[axisB_] = b0_;
    hi[axisB_] = b1_;
    lo[axisK_] = k_ - 1e-4f;
    hi[axisK_] = k_ + 1e-4f;
    return Aabb(lo, hi);
}

// Box

namespace {

std::array<AxisRect, 6> MakeBoxSides(const Point3& lo, const Point3& hi, const MaterialPtr& mat) {
    return {
        AxisRect(RectPlane::XY, lo.x, hi.x, lo.y, hi.y, hi.z, mat),
        AxisRect(RectPlane::XY, lo.x, hi.x, lo.y, hi.y, lo.z, mat, true),
        AxisRect(RectPlane::XZ, lo.x, hi.x, lo.z, hi.z, hi.y, mat),
        AxisRect(RectPlane::XZ, lo.x, hi.x, lo.z, hi.z, lo.y, mat, true),
        AxisRect(RectPlane::YZ, lo.y, hi.y, lo.z, hi.z, hi.x, mat),
        AxisRect(RectPlane::YZ, lo.y, hi.y, lo.z, hi.z, lo.x, mat, true),
    };
}

} // namespace

Box::Box(const Point3& p0, const Point3& p1, MaterialPtr material)
    : min_(glm::min(p0, p1)), max_(glm::max(p0, p1)), sides_(MakeBoxSides(min_, max_, material)) {}

std::optional<HitRecord> Box::Hit(const Ray& ray, float tMin, float tMax) const {
    std::optional<HitRecord> closest;
    float closestSoFar = tMax;
    for (const auto& side : sides_) {
        if (auto rec = side.Hit(ray, tMin, closestSoFar)) {
            closestSoFar = rec->T;
            closest = rec;
        }
    }
    return closest;
}

std::optional<Aabb> Box::BoundingBox(float, float) const {
    return Aabb(min_, max_);
}

} // namespace hikari::geometry

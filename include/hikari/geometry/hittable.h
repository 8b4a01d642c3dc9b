// hikari - CPU path tracer
// Copyright (c) 2025 hikari Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <variant>
#include <vector>

#include "hikari/geometry/aabb.h"
#include "hikari/geometry/hit_record.h"
#include "hikari/geometry/shapes.h"
#include "hikari/math/random.h"

namespace hikari::geometry {

class Hittable;
using HittablePtr = std::shared_ptr<const Hittable>;

// Flat aggregate, answers with the nearest hit over all children
class HittableList {
public:
    HittableList() = default;

    void Add(Hittable object);
    void Clear();

    std::optional<HitRecord> Hit(const Ray& ray, float tMin, float tMax) const;
    // nullopt when empty or when any child is unbounded
    std::optional<Aabb> BoundingBox(float time0, float time1) const;

    const std::vector<Hittable>& Objects() const { return objects_; }
    size_t Size() const;
    bool Empty() const;

private:
    std::vector<Hittable> objects_;
};

/**
 * Bounding volume hierarchy node.
 *
 * Built once by splitting the primitives in half along a random axis after
 * sorting them by bounding box minimum. A query only descends into children
 * whose box the ray crosses, and always returns the same nearest hit as a
 * flat HittableList over the same primitives. Primitives remember their
 * position in the source list; when two of them are hit at exactly the same
 * distance the earlier one wins, as it does in the list.
 */
class BvhNode {
public:
    // Primitive and its index in the list the hierarchy was built from
    struct Primitive {
        HittablePtr Object;
        size_t Order = 0;
    };

    // Throws SceneError for an empty list or an unbounded primitive
    static BvhNode Build(const HittableList& list, float time0, float time1, math::Rng& rng);

    BvhNode(std::vector<Primitive>& primitives, size_t start, size_t end,
            float time0, float time1, math::Rng& rng);

    std::optional<HitRecord> Hit(const Ray& ray, float tMin, float tMax) const;
    std::optional<Aabb> BoundingBox(float time0, float time1) const;

    const HittablePtr& Left() const { return left_; }
    const HittablePtr& Right() const { return right_; }

private:
    struct OrderedHit {
        HitRecord Record;
        size_t Order;
    };

    std::optional<OrderedHit> NearestHit(const Ray& ray, float tMin, float tMax) const;

    // Children are primitives when their order is set, inner nodes otherwise
    static std::optional<OrderedHit> ChildHit(const HittablePtr& child, const std::optional<size_t>& order,
                                              const Ray& ray, float tMin, float tMax);

    HittablePtr left_;
    HittablePtr right_;
    std::optional<size_t> leftOrder_;
    std::optional<size_t> rightOrder_;
    Aabb box_;
};

/**
 * Anything a ray can be intersected with.
 *
 * A closed variant over the primitive shapes and the two aggregates,
 * dispatched with std::visit.
 */
class Hittable {
public:
    using Variant = std::variant<Sphere, MovingSphere, AxisRect, Box, HittableList, BvhNode>;

    Hittable(Sphere sphere) : kind_(std::move(sphere)) {}
    Hittable(MovingSphere sphere) : kind_(std::move(sphere)) {}
    Hittable(AxisRect rect) : kind_(std::move(rect)) {}
    Hittable(Box box) : kind_(std::move(box)) {}
    Hittable(HittableList list) : kind_(std::move(list)) {}
    Hittable(BvhNode node) : kind_(std::move(node)) {}

    /**
     * Nearest intersection with parametric distance in (tMin, tMax).
     */
    std::optional<HitRecord> Hit(const Ray& ray, float tMin, float tMax) const;

    /**
     * Box enclosing the object over the shutter interval [time0, time1].
     */
    std::optional<Aabb> BoundingBox(float time0, float time1) const;

    const Variant& Kind() const { return kind_; }

private:
    Variant kind_;
};

} // namespace hikari::geometry

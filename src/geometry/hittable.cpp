// hikari - CPU path tracer
// Copyright (c) 2025 hikari Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "hikari/geometry/hittable.h"

#include <algorithm>
#include <cmath>

#include "hikari/core/error.hpp"

namespace hikari::geometry {

// HittableList

void HittableList::Add(Hittable object) {
    objects_.push_back(std::move(object));
}

void HittableList::Clear() {
    objects_.clear();
}

size_t HittableList::Size() const {
    return objects_.size();
}

bool HittableList::Empty() const {
    return objects_.empty();
}

std::optional<HitRecord> HittableList::Hit(const Ray& ray, float tMin, float tMax) const {
    std::optional<HitRecord> closest;
    float closestSoFar = tMax;

    for (const auto& object : objects_) {
        if (auto rec = object.Hit(ray, tMin, closestSoFar)) {
            closestSoFar = rec->T;
            closest = rec;
        }
    }

    return closest;
}

std::optional<Aabb> HittableList::BoundingBox(float time0, float time1) const {
    std::optional<Aabb> result;
    for (const auto& object : objects_) {
        const auto box = object.BoundingBox(time0, time1);
        if (!box) {
            return std::nullopt;
        }
        result = result ? Aabb::Surrounding(*result, *box) : *box;
    }
    return result;
}

// BvhNode

namespace {

Aabb RequireBox(const Hittable& object, float time0, float time1) {
    auto box = object.BoundingBox(time0, time1);
    if (!box) {
        throw SceneError("BVH construction found a primitive without a bounding box");
    }
    return *box;
}

std::vector<BvhNode::Primitive> SharePrimitives(const HittableList& list) {
    std::vector<BvhNode::Primitive> shared;
    shared.reserve(list.Size());
    for (const auto& object : list.Objects()) {
        shared.push_back({std::make_shared<const Hittable>(object), shared.size()});
    }
    return shared;
}

} // namespace

BvhNode BvhNode::Build(const HittableList& list, float time0, float time1, math::Rng& rng) {
    auto primitives = SharePrimitives(list);
    return BvhNode(primitives, 0, primitives.size(), time0, time1, rng);
}

BvhNode::BvhNode(std::vector<Primitive>& primitives, size_t start, size_t end,
                 float time0, float time1, math::Rng& rng) {
    if (start >= end) {
        throw SceneError("cannot build a BVH over an empty primitive list");
    }

    const int axis = rng.RandomInt(0, 2);
    const auto compare = [axis, time0, time1](const Primitive& a, const Primitive& b) {
        return RequireBox(*a.Object, time0, time1).Min[axis] < RequireBox(*b.Object, time0, time1).Min[axis];
    };

    const size_t span = end - start;
    if (span == 1) {
        left_ = right_ = primitives[start].Object;
        leftOrder_ = rightOrder_ = primitives[start].Order;
    } else if (span == 2) {
        const bool inOrder = compare(primitives[start], primitives[start + 1]);
        const Primitive& first = primitives[inOrder ? start : start + 1];
        const Primitive& second = primitives[inOrder ? start + 1 : start];
        left_ = first.Object;
        leftOrder_ = first.Order;
        right_ = second.Object;
        rightOrder_ = second.Order;
    } else {
        std::sort(primitives.begin() + static_cast<std::ptrdiff_t>(start),
                  primitives.begin() + static_cast<std::ptrdiff_t>(end), compare);
        const size_t mid = start + span / 2;
        left_ = std::make_shared<const Hittable>(BvhNode(primitives, start, mid, time0, time1, rng));
        right_ = std::make_shared<const Hittable>(BvhNode(primitives, mid, end, time0, time1, rng));
    }

    box_ = Aabb::Surrounding(RequireBox(*left_, time0, time1), RequireBox(*right_, time0, time1));
}

std::optional<BvhNode::OrderedHit> BvhNode::ChildHit(const HittablePtr& child,
                                                      const std::optional<size_t>& order,
                                                      const Ray& ray, float tMin, float tMax) {
    if (!order) {
        return std::get<BvhNode>(child->Kind()).NearestHit(ray, tMin, tMax);
    }
    if (auto rec = child->Hit(ray, tMin, tMax)) {
        return OrderedHit{*rec, *order};
    }
    return std::nullopt;
}

std::optional<BvhNode::OrderedHit> BvhNode::NearestHit(const Ray& ray, float tMin, float tMax) const {
    if (!box_.Hit(ray, tMin, tMax)) {
        return std::nullopt;
    }

    auto hitLeft = ChildHit(left_, leftOrder_, ray, tMin, tMax);
    if (left_ == right_) {
        return hitLeft;
    }

    // Widen the bound by one ulp so a right hit at exactly the same distance is still seen
    const float rightMax = hitLeft ? std::nextafter(hitLeft->Record.T, tMax) : tMax;
    auto hitRight = ChildHit(right_, rightOrder_, ray, tMin, rightMax);
    if (!hitRight) {
        return hitLeft;
    }
    if (!hitLeft) {
        return hitRight;
    }
    if (hitRight->Record.T < hitLeft->Record.T ||
        (hitRight->Record.T == hitLeft->Record.T && hitRight->Order < hitLeft->Order)) {
        return hitRight;
    }
    return hitLeft;
}

std::optional<HitRecord> BvhNode::Hit(const Ray& ray, float tMin, float tMax) const {
    if (auto hit = NearestHit(ray, tMin, tMax)) {
        return hit->Record;
    }
    return std::nullopt;
}

std::optional<Aabb> BvhNode::BoundingBox(float, float) const {
    return box_;
}

// Hittable

std::optional<HitRecord> Hittable::Hit(const Ray& ray, float tMin, float tMax) const {
    return std::visit([&](const auto& object) { return object.Hit(ray, tMin, tMax); }, kind_);
}

std::optional<Aabb> Hittable::BoundingBox(float time0, float time1) const {
    return std::visit([&](const auto& object) { return object.BoundingBox(time0, time1); }, kind_);
}

} // namespace hikari::geometry

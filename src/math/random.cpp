// hikari - CPU path tracer
// Copyright (c) 2025 hikari Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "hikari/math/random.h"

#include <cmath>

namespace hikari::math {

uint64_t MixSeed(uint64_t value) {
    value += 0x9e3779b97f4a7c15ull;
    value = (value ^ (value >> 30)) * 0xbf58476d1ce4e5b9ull;
    value = (value ^ (value >> 27)) * 0x94d049bb133111ebull;
    return value ^ (value >> 31);
}

Rng::Rng(uint64_t seed) {
    std::seed_seq seq{static_cast<uint32_t>(seed), static_cast<uint32_t>(seed >> 32)};
    engine_.seed(seq);
}

Rng Rng::ForStream(uint64_t seed, uint64_t stream) {
    return Rng(MixSeed(MixSeed(seed) ^ (stream + 1)));
}

float Rng::Uniform() {
    // 24 random mantissa bits, never reaches 1.0f
    return static_cast<float>(engine_() >> 8) * (1.0f / 16777216.0f);
}

float Rng::Uniform(float lo, float hi) {
    return lo + (hi - lo) * Uniform();
}

int Rng::RandomInt(int lo, int hi) {
    const auto span = static_cast<uint32_t>(hi - lo) + 1u;
    return lo + static_cast<int>(engine_() % span);
}

Vec3 Rng::RandomVector() {
    const float x = Uniform();
    const float y = Uniform();
    const float z = Uniform();
    return Vec3(x, y, z);
}

Vec3 Rng::RandomVector(float lo, float hi) {
    const float x = Uniform(lo, hi);
    const float y = Uniform(lo, hi);
    const float z = Uniform(lo, hi);
    return Vec3(x, y, z);
}

Vec3 Rng::RandomInUnitSphere() {
    while (true) {
        const Vec3 p = RandomVector(-1.0f, 1.0f);
        if (glm::dot(p, p) < 1.0f) {
            return p;
        }
    }
}

Vec3 Rng::RandomUnitVector() {
    while (true) {
        const Vec3 p = RandomInUnitSphere();
        const float lengthSquared = glm::dot(p, p);
        if (lengthSquared > 1e-12f) {
            return p / std::sqrt(lengthSquared);
        }
    }
}

Vec3 Rng::RandomInHemisphere(const Vec3& normal) {
    const Vec3 inUnitSphere = RandomInUnitSphere();
    return glm::dot(inUnitSphere, normal) > 0.0f ? inUnitSphere : -inUnitSphere;
}

Vec3 Rng::RandomInUnitDisk() {
    while (true) {
        const float x = Uniform(-1.0f, 1.0f);
        const float y = Uniform(-1.0f, 1.0f);
        if (x * x + y * y < 1.0f) {
            return Vec3(x, y, 0.0f);
        }
    }
}

} // namespace hikari::math

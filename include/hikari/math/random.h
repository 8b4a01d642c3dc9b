// hikari - CPU path tracer
// Copyright (c) 2025 hikari Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <cstdint>
#include <random>

#include "hikari/math/vec3.h"

namespace hikari::math {

/**
 * Seedable pseudo-random stream.
 *
 * An Rng is owned by exactly one worker at a time; nothing here is
 * synchronized.
 */
class Rng {
public:
    explicit Rng(uint64_t seed = 0);

    // Independent stream for (seed, stream) pairs, e.g. one per image row
    static Rng ForStream(uint64_t seed, uint64_t stream);

    // Uniform in [0, 1)
    float Uniform();
    // Uniform in [lo, hi)
    float Uniform(float lo, float hi);
    // Uniform integer in [lo, hi]
    int RandomInt(int lo, int hi);

    Vec3 RandomVector();
    Vec3 RandomVector(float lo, float hi);

    Vec3 RandomInUnitSphere();
    Vec3 RandomUnitVector();
    Vec3 RandomInHemisphere(const Vec3& normal);
    // z is always 0
    Vec3 RandomInUnitDisk();

private:
    std::mt19937 engine_;
};

// splitmix64 finalizer
uint64_t MixSeed(uint64_t value);

} // namespace hikari::math

// hikari - CPU path tracer
// Copyright (c) 2025 hikari Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <cstdint>
#include <future>
#include <vector>

#include "hikari/camera/camera.h"
#include "hikari/geometry/hittable.h"
#include "hikari/renderer/path_tracer.h"
#include "hikari/renderer/pixel_buffer.h"

namespace hikari::renderer {

struct RenderSettings {
    int Width = 400;
    int Height = 225;
    int SamplesPerPixel = 32;
    int MaxDepth = 50;
    uint64_t Seed = 42;
    unsigned ThreadCount = 0; // 0: one worker per hardware thread

    // Throws RenderError
    void Validate() const;
    float AspectRatio() const { return static_cast<float>(Width) / static_cast<float>(Height); }
};

/**
 * Parallel render driver.
 *
 * Rows are dealt round-robin to a fixed set of workers. Every row draws from
 * its own random stream derived from (Seed, row), and every pixel is written
 * by exactly one worker, so the result depends only on the settings and the
 * scene, never on the worker count or scheduling. The scene and camera must
 * stay unchanged until Render returns.
 */
class Renderer {
public:
    Renderer(const RenderSettings& settings, PathTracer tracer);

    /**
     * Render the full image. An exception thrown by any worker fails the
     * whole render and is rethrown here after all workers finished.
     */
    PixelBuffer Render(const geometry::Hittable& world, const camera::Camera& camera) const;

    /**
     * Gamma corrected estimate of one pixel, using rng for every sample.
     */
    Color RenderPixel(const geometry::Hittable& world, const camera::Camera& camera,
                      int x, int y, math::Rng& rng) const;

    const RenderSettings& Settings() const { return settings_; }
    const PathTracer& Tracer() const { return tracer_; }

    // Worker count actually used for the configured height
    unsigned WorkerCount() const;

private:
    void RenderRow(const geometry::Hittable& world, const camera::Camera& camera, int y,
                   PixelBuffer& buffer) const;

    RenderSettings settings_;
    PathTracer tracer_;
};

// sqrt (gamma 2) then clamp to [0, 1]
Color GammaCorrect(const Color& linear);

/**
 * Wait for every task. Each failure is logged, then the first one in task
 * order is rethrown, whatever its type.
 */
void JoinAll(std::vector<std::future<void>>& tasks);

} // namespace hikari::renderer

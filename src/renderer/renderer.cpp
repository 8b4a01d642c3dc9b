// hikari - CPU path tracer
// Copyright (c) 2025 hikari Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "hikari/renderer/renderer.h"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <exception>
#include <future>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "hikari/core/error.hpp"
#include "hikari/core/log.h"
#include "hikari/core/time.h"

namespace hikari::renderer {

namespace {

std::string DescribeException(const std::exception_ptr& failure) {
    try {
        std::rethrow_exception(failure);
    } catch (const std::exception& err) {
        return err.what();
    } catch (...) {
        return "unknown exception";
    }
}

} // namespace

void RenderSettings::Validate() const {
    if (Width <= 0 || Height <= 0) {
        throw RenderError("image dimensions must be positive, got " +
                          std::to_string(Width) + "x" + std::to_string(Height));
    }
    if (SamplesPerPixel <= 0) {
        throw RenderError("samples per pixel must be positive, got " +
                          std::to_string(SamplesPerPixel));
    }
    if (MaxDepth < 0) {
        throw RenderError("max depth must not be negative, got " + std::to_string(MaxDepth));
    }
}

Color GammaCorrect(const Color& linear) {
    Color out;
    for (int c = 0; c < 3; ++c) {
        const float value = linear[c] > 0.0f ? std::sqrt(linear[c]) : 0.0f;
        out[c] = std::clamp(value, 0.0f, 1.0f);
    }
    return out;
}

Renderer::Renderer(const RenderSettings& settings, PathTracer tracer)
    : settings_(settings), tracer_(std::move(tracer)) {
    settings_.Validate();
}

unsigned Renderer::WorkerCount() const {
    unsigned count = settings_.ThreadCount;
    if (count == 0) {
        count = std::max(1u, std::thread::hardware_concurrency());
    }
    return std::min(count, static_cast<unsigned>(settings_.Height));
}

Color Renderer::RenderPixel(const geometry::Hittable& world, const camera::Camera& camera,
                            int x, int y, math::Rng& rng) const {
    const float sDenominator = static_cast<float>(std::max(settings_.Width - 1, 1));
    const float tDenominator = static_cast<float>(std::max(settings_.Height - 1, 1));
    // Row 0 is the top of the image, t grows upwards
    const int flippedY = settings_.Height - 1 - y;

    Color sum(0.0f);
    for (int sample = 0; sample < settings_.SamplesPerPixel; ++sample) {
        const float s = (static_cast<float>(x) + rng.Uniform()) / sDenominator;
        const float t = (static_cast<float>(flippedY) + rng.Uniform()) / tDenominator;

        const Ray ray = camera.GetRay(s, t, rng);
        const Color radiance = tracer_.RayColor(ray, world, settings_.MaxDepth, rng);
        // A NaN or Inf sample contributes black instead of poisoning the pixel
        if (math::IsFinite(radiance)) {
            sum += radiance;
        }
    }

    return GammaCorrect(sum / static_cast<float>(settings_.SamplesPerPixel));
}

void Renderer::RenderRow(const geometry::Hittable& world, const camera::Camera& camera, int y,
                         PixelBuffer& buffer) const {
    auto rng = math::Rng::ForStream(settings_.Seed, static_cast<uint64_t>(y));
    Color* row = buffer.Row(y);
    for (int x = 0; x < settings_.Width; ++x) {
        row[x] = RenderPixel(world, camera, x, y, rng);
    }
}

PixelBuffer Renderer::Render(const geometry::Hittable& world, const camera::Camera& camera) const {
    PixelBuffer buffer(settings_.Width, settings_.Height);

    const unsigned workers = WorkerCount();
    HIKARI_LOG_INFO("Rendering {}x{} at {} spp, depth {}, {} worker(s), seed {}",
                    settings_.Width, settings_.Height, settings_.SamplesPerPixel,
                    settings_.MaxDepth, workers, settings_.Seed);

    time::ScopedTimer timer("render");
    std::atomic<int> rowsDone{0};
    const int height = settings_.Height;
    const int progressStep = std::max(1, height / 10);

    std::vector<std::future<void>> tasks;
    tasks.reserve(workers);
    for (unsigned worker = 0; worker < workers; ++worker) {
        tasks.push_back(std::async(std::launch::async, [&, worker]() {
            for (int y = static_cast<int>(worker); y < height; y += static_cast<int>(workers)) {
                RenderRow(world, camera, y, buffer);

                const int done = rowsDone.fetch_add(1) + 1;
                if (done % progressStep == 0 || done == height) {
                    HIKARI_LOG_DEBUG("Scanlines done: {}/{}", done, height);
                }
            }
        }));
    }

    JoinAll(tasks);

    return buffer;
}

void JoinAll(std::vector<std::future<void>>& tasks) {
    // Every task is waited for before reporting, they share the output buffer
    std::exception_ptr failure;
    for (auto& task : tasks) {
        try {
            task.get();
        } catch (...) {
            auto current = std::current_exception();
            HIKARI_LOG_ERROR("Render worker failed: {}", DescribeException(current));
            if (!failure) {
                failure = current;
            }
        }
    }
    if (failure) {
        std::rethrow_exception(failure);
    }
}

} // namespace hikari::renderer

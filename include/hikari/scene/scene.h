// hikari - CPU path tracer
// Copyright (c) 2025 hikari Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "hikari/camera/camera.h"
#include "hikari/geometry/hittable.h"
#include "hikari/math/random.h"
#include "hikari/renderer/path_tracer.h"
#include "hikari/renderer/pixel_buffer.h"
#include "hikari/renderer/renderer.h"

namespace hikari::scene {

/**
 * Everything a render needs besides the render settings.
 *
 * Built once and only read while rendering.
 */
struct Scene {
    std::string Name;
    geometry::Hittable World = geometry::HittableList{};
    camera::CameraDesc Camera;
    renderer::Background Background;
};

// Glass, glass and metal spheres over a large diffuse ground sphere
Scene MakeThreeSpheres(float aspectRatio);

// Field of small random spheres around three large ones, organized in a BVH.
// With movingSpheres set the diffuse spheres bounce during the shutter interval.
Scene MakeRandomSpheres(float aspectRatio, math::Rng& rng, bool movingSpheres = true);

// Enclosed box lit by a ceiling light, on a black background
Scene MakeCornellBox(float aspectRatio);

/**
 * Build a named preset: three_spheres, random_spheres, random_spheres_static
 * or cornell_box.
 *
 * @throws SceneError for an unknown name
 */
Scene MakePreset(std::string_view name, float aspectRatio, math::Rng& rng);

const std::vector<std::string_view>& PresetNames();

// Wraps a flat list into a BVH over the shutter interval
geometry::Hittable BuildBvh(const geometry::HittableList& list, const camera::Shutter& shutter,
                            math::Rng& rng);

/**
 * Render the scene with its camera adjusted to the output aspect ratio.
 */
renderer::PixelBuffer RenderScene(const Scene& scene, const renderer::RenderSettings& settings);

} // namespace hikari::scene

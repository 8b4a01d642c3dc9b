// hikari - CPU path tracer
// Copyright (c) 2025 hikari Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <filesystem>

#include <nlohmann/json_fwd.hpp>

#include "hikari/core/config.h"
#include "hikari/core/result.h"
#include "hikari/math/random.h"
#include "hikari/scene/scene.h"

namespace hikari::scene {

/**
 * Build a scene from a JSON document.
 *
 * Layout:
 *   name        optional string
 *   camera      look_from, look_at, vup, vfov, aspect_ratio, aperture,
 *               focus_distance, time0, time1 (all optional)
 *   background  {"type": "sky"} or {"type": "solid", "color": [r, g, b]}
 *   materials   object of named materials, each with a "type" of
 *               lambertian, metal, dielectric or diffuse_light
 *   objects     array of sphere, moving_sphere, rect and box entries that
 *               name their material
 *   use_bvh     wrap the objects in a BVH, default true
 *
 * Colors are [r, g, b] arrays or {"type": "checker", ...} textures where a
 * texture is accepted. The rng is only used to build the BVH.
 */
core::Result<Scene> ParseScene(const nlohmann::json& json, math::Rng& rng);

core::Result<Scene> LoadSceneFile(const std::filesystem::path& path, math::Rng& rng);

// Render settings described by the config, validated (throws RenderError)
renderer::RenderSettings MakeRenderSettings(const config::AppConfig& config);

/**
 * The scene a config selects: its scene file when one is set, the named
 * preset otherwise. Unknown presets are reported as errors too.
 */
core::Result<Scene> LoadConfiguredScene(const config::AppConfig& config, float aspectRatio,
                                        math::Rng& rng);

} // namespace hikari::scene

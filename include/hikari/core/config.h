// hikari - CPU path tracer
// Copyright (c) 2025 hikari Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>
#include <spdlog/common.h>

namespace hikari::config {

struct AppConfig {
    int width = 400;
    int height = 225;
    int samples_per_pixel = 32;
    int max_depth = 50;
    uint64_t seed = 42;
    unsigned threads = 0; // 0: one worker per hardware thread

    std::string scene_preset = "three_spheres";
    std::filesystem::path scene_file; // takes precedence over the preset when set

    std::filesystem::path output_path = "out/latest.ppm";
    bool output_binary = false;

    spdlog::level::level_enum log_level = spdlog::level::info;
    std::filesystem::path config_path;
};

// Command line values, each set field replaces the configured one
struct Overrides {
    std::optional<int> width;
    std::optional<int> height;
    std::optional<int> samples_per_pixel;
    std::optional<int> max_depth;
    std::optional<uint64_t> seed;
    std::optional<unsigned> threads;
    std::optional<std::string> scene_preset; // clears a configured scene file
    std::optional<std::filesystem::path> scene_file;
    std::optional<std::filesystem::path> output_path;
    bool output_binary = false;
    std::optional<std::string> log_level;
};

/// Missing file yields the defaults; malformed content throws ConfigError
AppConfig load_from_file(const std::filesystem::path& path);

/// Applies the recognized sections of an already parsed document
void apply_json(AppConfig& config, const nlohmann::json& json);

/// Applies command line values on top of the loaded config, throws ConfigError
/// when the result is out of range
void apply_overrides(AppConfig& config, const Overrides& overrides);

} // namespace hikari::config

// hikari - CPU path tracer
// Copyright (c) 2025 hikari Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "hikari/core/config.h"

#include <fstream>

#include <nlohmann/json.hpp>

#include "hikari/core/error.hpp"
#include "hikari/core/log.h"

namespace hikari::config {
namespace {

template<typename T>
void read_field(const nlohmann::json& section, const char* section_name, const char* key, T& out) {
    auto it = section.find(key);
    if (it == section.end()) {
        return;
    }
    try {
        out = it->get<T>();
    } catch (const nlohmann::json::exception& err) {
        throw ConfigError(std::string(section_name) + "." + key + ": " + err.what());
    }
}

void require_positive(int value, const char* name) {
    if (value <= 0) {
        throw ConfigError(std::string(name) + " must be positive, got " + std::to_string(value));
    }
}

void validate(const AppConfig& config) {
    require_positive(config.width, "render.width");
    require_positive(config.height, "render.height");
    require_positive(config.samples_per_pixel, "render.samples_per_pixel");
    if (config.max_depth < 0) {
        throw ConfigError("render.max_depth must not be negative");
    }
}

} // namespace

void apply_json(AppConfig& config, const nlohmann::json& json) {
    if (!json.is_object()) {
        throw ConfigError("top level value must be an object");
    }

    if (auto render = json.find("render"); render != json.end()) {
        read_field(*render, "render", "width", config.width);
        read_field(*render, "render", "height", config.height);
        read_field(*render, "render", "samples_per_pixel", config.samples_per_pixel);
        read_field(*render, "render", "max_depth", config.max_depth);
        read_field(*render, "render", "seed", config.seed);
        read_field(*render, "render", "threads", config.threads);
    }

    if (auto scene = json.find("scene"); scene != json.end()) {
        read_field(*scene, "scene", "preset", config.scene_preset);
        std::string file;
        read_field(*scene, "scene", "file", file);
        if (!file.empty()) {
            config.scene_file = file;
        }
    }

    if (auto output = json.find("output"); output != json.end()) {
        std::string path;
        read_field(*output, "output", "path", path);
        if (!path.empty()) {
            config.output_path = path;
        }
        std::string format;
        read_field(*output, "output", "format", format);
        if (format == "binary") {
            config.output_binary = true;
        } else if (format == "plain") {
            config.output_binary = false;
        } else if (!format.empty()) {
            throw ConfigError("output.format must be 'plain' or 'binary', got '" + format + "'");
        }
    }

    if (auto logging = json.find("logging"); logging != json.end()) {
        std::string level;
        read_field(*logging, "logging", "level", level);
        if (!level.empty()) {
            config.log_level = log::parse_level(level);
        }
    }

    validate(config);
}

void apply_overrides(AppConfig& config, const Overrides& overrides) {
    if (overrides.width) config.width = *overrides.width;
    if (overrides.height) config.height = *overrides.height;
    if (overrides.samples_per_pixel) config.samples_per_pixel = *overrides.samples_per_pixel;
    if (overrides.max_depth) config.max_depth = *overrides.max_depth;
    if (overrides.seed) config.seed = *overrides.seed;
    if (overrides.threads) config.threads = *overrides.threads;
    if (overrides.output_binary) config.output_binary = true;
    if (overrides.output_path) config.output_path = *overrides.output_path;
    if (overrides.scene_preset) {
        config.scene_preset = *overrides.scene_preset;
        config.scene_file.clear();
    }
    if (overrides.scene_file) config.scene_file = *overrides.scene_file;
    if (overrides.log_level) config.log_level = log::parse_level(*overrides.log_level);

    validate(config);
}

AppConfig load_from_file(const std::filesystem::path& path) {
    AppConfig config{};
    config.config_path = path;

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        HIKARI_LOG_DEBUG("No config at {}, using defaults", path.string());
        return config;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("failed to open " + path.string());
    }

    nlohmann::json json;
    try {
        file >> json;
    } catch (const nlohmann::json::parse_error& err) {
        throw ConfigError(path.string() + ": " + err.what());
    }

    apply_json(config, json);
    return config;
}

} // namespace hikari::config

// hikari - CPU path tracer
// Copyright (c) 2025 hikari Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <stdexcept>
#include <string>

#include "hikari/core/common.hpp"

namespace hikari
{

/**
 * @brief Base exception class for hikari errors
 */
class HikariError : public std::runtime_error
{
public:
    explicit HikariError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Invalid primitive, material or scene description
 */
class SceneError : public HikariError
{
public:
    explicit SceneError(const std::string& message) : HikariError("Scene error: " + message) {}
};

/**
 * @brief Degenerate camera parameters
 */
class CameraError : public HikariError
{
public:
    explicit CameraError(const std::string& message) : HikariError("Camera error: " + message) {}
};

/**
 * @brief Invalid render settings or a failed render worker
 */
class RenderError : public HikariError
{
public:
    explicit RenderError(const std::string& message) : HikariError("Render error: " + message) {}
};

/**
 * @brief Image encoding/decoding errors
 */
class ImageError : public HikariError
{
public:
    explicit ImageError(const std::string& message) : HikariError("Image error: " + message) {}
};

/**
 * @brief Malformed configuration values
 */
class ConfigError : public HikariError
{
public:
    explicit ConfigError(const std::string& message) : HikariError("Config error: " + message) {}
};

} // namespace hikari

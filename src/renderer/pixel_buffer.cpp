// hikari - CPU path tracer
// Copyright (c) 2025 hikari Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "hikari/renderer/pixel_buffer.h"

#include <string>

#include "hikari/core/error.hpp"

namespace hikari::renderer {

PixelBuffer::PixelBuffer(int width, int height) : width_(width), height_(height) {
    if (width <= 0 || height <= 0) {
        throw RenderError("pixel buffer dimensions must be positive, got " +
                          std::to_string(width) + "x" + std::to_string(height));
    }
    pixels_.assign(static_cast<size_t>(width) * static_cast<size_t>(height), math::colors::kBlack);
}

} // namespace hikari::renderer

// hikari - CPU path tracer
// Copyright (c) 2025 hikari Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <cstddef>
#include <vector>

#include "hikari/core/common.hpp"
#include "hikari/math/vec3.h"

namespace hikari::renderer {

using math::Color;

/**
 * Row-major grid of linear RGB values, row 0 at the top of the image.
 */
class PixelBuffer {
public:
    // Throws RenderError for non-positive dimensions
    PixelBuffer(int width, int height);

    int Width() const { return width_; }
    int Height() const { return height_; }

    Color& At(int x, int y) { return pixels_[Index(x, y)]; }
    const Color& At(int x, int y) const { return pixels_[Index(x, y)]; }

    // First pixel of row y; rows are Width() pixels long
    Color* Row(int y) { return pixels_.data() + Index(0, y); }
    const Color* Row(int y) const { return pixels_.data() + Index(0, y); }

    const std::vector<Color>& Pixels() const { return pixels_; }

    bool operator==(const PixelBuffer& other) const {
        return width_ == other.width_ && height_ == other.height_ && pixels_ == other.pixels_;
    }

private:
    size_t Index(int x, int y) const {
        HIKARI_ASSERT_MSG(x >= 0 && x < width_ && y >= 0 && y < height_, "pixel out of range");
        return static_cast<size_t>(y) * static_cast<size_t>(width_) + static_cast<size_t>(x);
    }

    int width_;
    int height_;
    std::vector<Color> pixels_;
};

} // namespace hikari::renderer

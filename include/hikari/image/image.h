// hikari - CPU path tracer
// Copyright (c) 2025 hikari Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <array>
#include <cstdint>
#include <vector>

#include "hikari/renderer/pixel_buffer.h"

namespace hikari::image {

/**
 * 8-bit RGBA raster, row-major with row 0 at the top.
 */
class ImageRgba8 {
public:
    static constexpr uint8_t kFillValue = 10;

    // New images are dark gray and opaque; throws ImageError for bad dimensions
    ImageRgba8(int width, int height);

    int Width() const { return width_; }
    int Height() const { return height_; }

    std::array<uint8_t, 4> At(int x, int y) const;
    // Packed as 0xRRGGBBAA
    uint32_t AtU32(int x, int y) const;

    void Put(int x, int y, uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255);
    void PutU32(int x, int y, uint32_t rgba);

    const std::vector<uint8_t>& Data() const { return data_; }

    bool operator==(const ImageRgba8& other) const {
        return width_ == other.width_ && height_ == other.height_ && data_ == other.data_;
    }

private:
    size_t Offset(int x, int y) const;

    int width_;
    int height_;
    std::vector<uint8_t> data_;
};

// round(255 * c) per channel after clamping c to [0, 1]
uint8_t QuantizeChannel(float value);

// Opaque 8-bit image of a gamma corrected pixel buffer
ImageRgba8 Quantize(const renderer::PixelBuffer& buffer);

// Copy with the row order reversed
ImageRgba8 FlipVertical(const ImageRgba8& image);

} // namespace hikari::image

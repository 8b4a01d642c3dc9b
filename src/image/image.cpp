// hikari - CPU path tracer
// Copyright (c) 2025 hikari Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "hikari/image/image.h"

#include <algorithm>
#include <cmath>
#include <string>

#include "hikari/core/error.hpp"

namespace hikari::image {

ImageRgba8::ImageRgba8(int width, int height) : width_(width), height_(height) {
    if (width <= 0 || height <= 0) {
        throw ImageError("image dimensions must be positive, got " +
                         std::to_string(width) + "x" + std::to_string(height));
    }
    data_.resize(static_cast<size_t>(width) * static_cast<size_t>(height) * 4);
    for (size_t i = 0; i < data_.size(); i += 4) {
        data_[i] = kFillValue;
        data_[i + 1] = kFillValue;
        data_[i + 2] = kFillValue;
        data_[i + 3] = 255;
    }
}

size_t ImageRgba8::Offset(int x, int y) const {
    if (x < 0 || y < 0 || x >= width_ || y >= height_) {
        throw ImageError("pixel (" + std::to_string(x) + ", " + std::to_string(y) +
                         ") outside " + std::to_string(width_) + "x" + std::to_string(height_));
    }
    return (static_cast<size_t>(y) * static_cast<size_t>(width_) + static_cast<size_t>(x)) * 4;
}

std::array<uint8_t, 4> ImageRgba8::At(int x, int y) const {
    const size_t i = Offset(x, y);
    return {data_[i], data_[i + 1], data_[i + 2], data_[i + 3]};
}

uint32_t ImageRgba8::AtU32(int x, int y) const {
    const auto px = At(x, y);
    return (static_cast<uint32_t>(px[0]) << 24) | (static_cast<uint32_t>(px[1]) << 16) |
           (static_cast<uint32_t>(px[2]) << 8) | static_cast<uint32_t>(px[3]);
}

void ImageRgba8::Put(int x, int y, uint8_t r, uint8_t g, uint8_t b, uint8_t a) {
    const size_t i = Offset(x, y);
    data_[i] = r;
    data_[i + 1] = g;
    data_[i + 2] = b;
    data_[i + 3] = a;
}

void ImageRgba8::PutU32(int x, int y, uint32_t rgba) {
    Put(x, y,
        static_cast<uint8_t>(rgba >> 24),
        static_cast<uint8_t>(rgba >> 16),
        static_cast<uint8_t>(rgba >> 8),
        static_cast<uint8_t>(rgba & 0xFF));
}

uint8_t QuantizeChannel(float value) {
    if (!(value > 0.0f)) {
        return 0;
    }
    return static_cast<uint8_t>(std::lround(255.0f * std::min(value, 1.0f)));
}

ImageRgba8 Quantize(const renderer::PixelBuffer& buffer) {
    ImageRgba8 image(buffer.Width(), buffer.Height());
    for (int y = 0; y < buffer.Height(); ++y) {
        for (int x = 0; x < buffer.Width(); ++x) {
            const auto& c = buffer.At(x, y);
            image.Put(x, y, QuantizeChannel(c.r), QuantizeChannel(c.g), QuantizeChannel(c.b));
        }
    }
    return image;
}

ImageRgba8 FlipVertical(const ImageRgba8& image) {
    ImageRgba8 flipped(image.Width(), image.Height());
    for (int y = 0; y < image.Height(); ++y) {
        for (int x = 0; x < image.Width(); ++x) {
            flipped.PutU32(x, image.Height() - 1 - y, image.AtU32(x, y));
        }
    }
    return flipped;
}

} // namespace hikari::image

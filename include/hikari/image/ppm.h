// hikari - CPU path tracer
// Copyright (c) 2025 hikari Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <cstdint>
#include <filesystem>
#include <iosfwd>

#include "hikari/core/result.h"
#include "hikari/image/image.h"

namespace hikari::image {

// Netpbm portable pixel map flavours
enum class PpmFormat {
    Plain,  // P3, ASCII triples
    Binary, // P6, raw bytes
};

/**
 * Encode an image as PPM with maxval 255. The alpha channel is dropped.
 */
void EncodePpm(std::ostream& out, const ImageRgba8& image, PpmFormat format);

// Largest raster DecodePpm accepts, 16384 x 16384
inline constexpr uint64_t kMaxPpmPixels = uint64_t{1} << 28;

/**
 * Decode a P3 or P6 stream. Comments are skipped and samples with a maxval
 * below 255 are rescaled to 0..255. Decoded images are opaque. Headers
 * describing more than kMaxPpmPixels pixels are rejected before anything is
 * allocated.
 */
core::Result<ImageRgba8> DecodePpm(std::istream& in);

// Creates missing parent directories
core::Result<void> WritePpm(const std::filesystem::path& path, const ImageRgba8& image,
                            PpmFormat format = PpmFormat::Plain);

core::Result<ImageRgba8> ReadPpm(const std::filesystem::path& path);

} // namespace hikari::image

// hikari - CPU path tracer
// Copyright (c) 2025 hikari Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "hikari/image/ppm.h"

#include <cctype>
#include <fstream>
#include <istream>
#include <new>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>

#include "hikari/core/error.hpp"
#include "hikari/core/log.h"

namespace hikari::image {

namespace {

// Next whitespace separated token, skipping '#' comments up to end of line
bool ReadToken(std::istream& in, std::string& token) {
    token.clear();
    int c = in.get();
    while (c != EOF) {
        if (c == '#') {
            while (c != EOF && c != '\n') {
                c = in.get();
            }
        } else if (std::isspace(c)) {
            c = in.get();
        } else {
            break;
        }
    }
    while (c != EOF && !std::isspace(c) && c != '#') {
        token.push_back(static_cast<char>(c));
        c = in.get();
    }
    if (c == '#') {
        in.unget();
    }
    return !token.empty();
}

core::Result<int> ReadInt(std::istream& in, const char* what) {
    std::string token;
    if (!ReadToken(in, token)) {
        return core::Result<int>::Err(std::string("unexpected end of data reading ") + what);
    }
    for (char ch : token) {
        if (!std::isdigit(static_cast<unsigned char>(ch))) {
            return core::Result<int>::Err(std::string("invalid ") + what + " '" + token + "'");
        }
    }
    try {
        return std::stoi(token);
    } catch (const std::out_of_range&) {
        return core::Result<int>::Err(std::string(what) + " out of range '" + token + "'");
    }
}

uint8_t Rescale(int sample, int maxval) {
    if (maxval == 255) {
        return static_cast<uint8_t>(sample);
    }
    return static_cast<uint8_t>((sample * 255 + maxval / 2) / maxval);
}

core::Result<ImageRgba8> AllocateImage(int width, int height) {
    using R = core::Result<ImageRgba8>;
    const auto pixels = static_cast<uint64_t>(width) * static_cast<uint64_t>(height);
    if (pixels > kMaxPpmPixels) {
        return R::Err("ppm dimensions " + std::to_string(width) + "x" + std::to_string(height) +
                      " exceed the limit of " + std::to_string(kMaxPpmPixels) + " pixels");
    }
    try {
        return ImageRgba8(width, height);
    } catch (const std::bad_alloc&) {
        return R::Err("out of memory allocating " + std::to_string(width) + "x" +
                      std::to_string(height) + " ppm image");
    } catch (const std::length_error&) {
        return R::Err("ppm image " + std::to_string(width) + "x" + std::to_string(height) +
                      " is too large");
    }
}

} // namespace

void EncodePpm(std::ostream& out, const ImageRgba8& image, PpmFormat format) {
    out << (format == PpmFormat::Plain ? "P3" : "P6") << "\n"
        << image.Width() << " " << image.Height() << "\n255\n";
    for (int y = 0; y < image.Height(); ++y) {
        for (int x = 0; x < image.Width(); ++x) {
            const auto px = image.At(x, y);
            if (format == PpmFormat::Plain) {
                out << static_cast<int>(px[0]) << " " << static_cast<int>(px[1]) << " "
                    << static_cast<int>(px[2]) << "\n";
            } else {
                out.put(static_cast<char>(px[0]));
                out.put(static_cast<char>(px[1]));
                out.put(static_cast<char>(px[2]));
            }
        }
    }
}

core::Result<ImageRgba8> DecodePpm(std::istream& in) {
    using R = core::Result<ImageRgba8>;

    std::string magic;
    if (!ReadToken(in, magic)) {
        return R::Err("empty ppm data");
    }
    if (magic != "P3" && magic != "P6") {
        return R::Err("unsupported ppm magic '" + magic + "'");
    }
    const bool binary = magic == "P6";

    auto width = ReadInt(in, "width");
    if (!width) {
        return R::Err(width.GetError());
    }
    auto height = ReadInt(in, "height");
    if (!height) {
        return R::Err(height.GetError());
    }
    auto maxval = ReadInt(in, "maxval");
    if (!maxval) {
        return R::Err(maxval.GetError());
    }
    if (width.Value() <= 0 || height.Value() <= 0) {
        return R::Err("invalid ppm dimensions " + std::to_string(width.Value()) + "x" +
                      std::to_string(height.Value()));
    }
    if (maxval.Value() <= 0 || maxval.Value() > 255) {
        return R::Err("unsupported ppm maxval " + std::to_string(maxval.Value()));
    }

    const int max = maxval.Value();
    auto allocated = AllocateImage(width.Value(), height.Value());
    if (!allocated) {
        return allocated;
    }
    ImageRgba8 image = std::move(allocated).Unwrap();

    if (binary) {
        // Exactly one whitespace byte separates the header from the raster;
        // the token reader already consumed it.
        for (int y = 0; y < image.Height(); ++y) {
            for (int x = 0; x < image.Width(); ++x) {
                char rgb[3];
                if (!in.read(rgb, 3)) {
                    return R::Err("truncated ppm raster at pixel (" + std::to_string(x) + ", " +
                                  std::to_string(y) + ")");
                }
                uint8_t channels[3];
                for (int c = 0; c < 3; ++c) {
                    const int sample = static_cast<unsigned char>(rgb[c]);
                    if (sample > max) {
                        return R::Err("ppm sample " + std::to_string(sample) +
                                      " exceeds maxval " + std::to_string(max));
                    }
                    channels[c] = Rescale(sample, max);
                }
                image.Put(x, y, channels[0], channels[1], channels[2]);
            }
        }
        return image;
    }

    for (int y = 0; y < image.Height(); ++y) {
        for (int x = 0; x < image.Width(); ++x) {
            uint8_t channels[3];
            for (int c = 0; c < 3; ++c) {
                auto sample = ReadInt(in, "sample");
                if (!sample) {
                    return R::Err(sample.GetError());
                }
                if (sample.Value() > max) {
                    return R::Err("ppm sample " + std::to_string(sample.Value()) +
                                  " exceeds maxval " + std::to_string(max));
                }
                channels[c] = Rescale(sample.Value(), max);
            }
            image.Put(x, y, channels[0], channels[1], channels[2]);
        }
    }
    return image;
}

core::Result<void> WritePpm(const std::filesystem::path& path, const ImageRgba8& image,
                            PpmFormat format) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return core::Result<void>::Err("failed to create directory '" +
                                           path.parent_path().string() + "': " + ec.message());
        }
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return core::Result<void>::Err("failed to open '" + path.string() + "' for writing");
    }
    EncodePpm(file, image, format);
    file.flush();
    if (!file) {
        return core::Result<void>::Err("failed writing '" + path.string() + "'");
    }

    HIKARI_LOG_INFO("Wrote {}x{} {} image to {}", image.Width(), image.Height(),
                    format == PpmFormat::Plain ? "P3" : "P6", path.string());
    return core::Result<void>::Ok();
}

core::Result<ImageRgba8> ReadPpm(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return core::Result<ImageRgba8>::Err("failed to open '" + path.string() + "'");
    }
    return DecodePpm(file).WithContext(path.string());
}

} // namespace hikari::image

// hikari - CPU path tracer
// Copyright (c) 2025 hikari Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "hikari/material/texture.h"

#include <cmath>

#include "hikari/core/common.hpp"

namespace hikari::material {

Color Texture::Value(float u, float v, const Point3& p) const {
    HIKARI_UNUSED(u);
    HIKARI_UNUSED(v);
    return std::visit(overloaded{
        [](const SolidColor& solid) -> Color {
            return solid.Value;
        },
        [&p](const CheckerTexture& checker) -> Color {
            const float sines = std::sin(checker.Scale * p.x) * std::sin(checker.Scale * p.y) *
                                std::sin(checker.Scale * p.z);
            return sines < 0.0f ? checker.Odd : checker.Even;
        },
    }, kind_);
}

} // namespace hikari::material

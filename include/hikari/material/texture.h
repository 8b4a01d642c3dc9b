// hikari - CPU path tracer
// Copyright (c) 2025 hikari Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <variant>

#include "hikari/math/vec3.h"

namespace hikari::material {

using math::Color;
using math::Point3;

struct SolidColor {
    Color Value{0.0f};
};

// 3-D checker pattern alternating on sin(scale * p)
struct CheckerTexture {
    Color Even{1.0f};
    Color Odd{0.0f};
    float Scale = 10.0f;
};

class Texture {
public:
    using Variant = std::variant<SolidColor, CheckerTexture>;

    Texture(const Color& color) : kind_(SolidColor{color}) {}
    Texture(SolidColor solid) : kind_(solid) {}
    Texture(CheckerTexture checker) : kind_(checker) {}

    static Texture Checker(const Color& even, const Color& odd, float scale = 10.0f) {
        return Texture(CheckerTexture{even, odd, scale});
    }

    Color Value(float u, float v, const Point3& p) const;

    const Variant& Kind() const { return kind_; }

private:
    Variant kind_;
};

} // namespace hikari::material

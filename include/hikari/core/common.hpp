// hikari - CPU path tracer
// Copyright (c) 2025 hikari Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#if defined(HIKARI_DEBUG)
    #define HIKARI_ENABLE_ASSERTS
#endif

namespace hikari
{

// Visitor built from a set of lambdas, for std::visit over the closed variants
template<class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // namespace hikari

#ifdef HIKARI_ENABLE_ASSERTS
    #include <cassert>
    #define HIKARI_ASSERT(expr) assert(expr)
    #define HIKARI_ASSERT_MSG(expr, msg) assert((expr) && (msg))
#else
    #define HIKARI_ASSERT(expr) ((void)0)
    #define HIKARI_ASSERT_MSG(expr, msg) ((void)0)
#endif

#define HIKARI_UNUSED(x) ((void)(x))

// kestrel - engine post-processing and animation blending layer
// Copyright (c) 2025 kestrel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>

// Platform detection
#if defined(_WIN32)
    #define KESTREL_PLATFORM_WINDOWS
#elif defined(__linux__)
    #define KESTREL_PLATFORM_LINUX
#elif defined(__APPLE__)
    #define KESTREL_PLATFORM_MACOS
#endif

// Common types
namespace kestrel
{

using u8 = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;

using i32 = int32_t;
using i64 = int64_t;

using f32 = float;
using f64 = double;

using usize = size_t;

} // namespace kestrel

// Utility macros
#define KESTREL_UNUSED(x) ((void)(x))

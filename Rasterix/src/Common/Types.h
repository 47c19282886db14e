#pragma once

#include <cstdint>
#include <cstddef>

namespace Rasterix {

using u8  = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;

using i8  = int8_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;

using f32 = float;
using f64 = double;

static_assert(sizeof(u32) == 4, "u32 must be 4 bytes");
static_assert(sizeof(i32) == 4, "i32 must be 4 bytes");
static_assert(sizeof(f32) == 4, "f32 must be 4 bytes");

#ifdef RX_BUILD_DLL
    #ifdef _WIN32
        #define RX_API __declspec(dllexport)
    #else
        #define RX_API __attribute__((visibility("default")))
    #endif
#else
    #define RX_API
#endif

template<typename T>
constexpr T rx_max(T a, T b) { return a > b ? a : b; }

// ceil(value / 2) for non-negative values.
constexpr i32 half_ceil(i32 value) { return (value + 1) / 2; }

constexpr u32 div_up(u32 value, u32 divisor) {
    return (value + divisor - 1) / divisor;
}

}

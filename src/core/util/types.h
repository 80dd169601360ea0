#pragma once

#include <cstdint>

// force inline helper
#ifndef ALWAYS_INLINE
#if defined(_MSC_VER)
#define ALWAYS_INLINE __forceinline
#elif defined(__GNUC__) || defined(__clang__)
#define ALWAYS_INLINE __attribute__((always_inline)) inline
#else
#define ALWAYS_INLINE inline
#endif
#endif

// expect helper
#if defined(__GNUC__) || defined(__clang__)
#define likely(x) __builtin_expect(!!(x), 1)
#define unlikely(x) __builtin_expect(!!(x), 0)
#else
#define likely(x) (x)
#define unlikely(x) (x)
#endif

using s8 = int8_t;
using s16 = int16_t;
using s32 = int32_t;
using s64 = int64_t;

using u8 = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;

// the two processors of the machine, stepped in alternation
enum class Processor : u32 {
    ARM9 = 0,
    ARM7 = 1,
};

constexpr u32 PROCESSOR_COUNT = 2;

ALWAYS_INLINE constexpr u32 ProcessorIndex(Processor processor) {
    return static_cast<u32>(processor);
}

ALWAYS_INLINE constexpr const char* ProcessorName(Processor processor) {
    return processor == Processor::ARM9 ? "ARM9" : "ARM7";
}

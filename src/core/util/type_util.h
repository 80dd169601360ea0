#pragma once

#include <bit>
#include <type_traits>

#include "types.h"

template<typename ValueType, typename ReturnType>
ALWAYS_INLINE constexpr ReturnType SignExtend(ValueType value) {
    return static_cast<ReturnType>(
        static_cast<std::make_signed_t<ReturnType>>(static_cast<std::make_signed_t<ValueType>>(value)));
}

template<typename ValueType>
ALWAYS_INLINE constexpr u32 SignExtend32(ValueType value) {
    return SignExtend<ValueType, u32>(value);
}

template<typename ValueType>
ALWAYS_INLINE constexpr u64 SignExtend64(ValueType value) {
    return SignExtend<ValueType, u64>(value);
}

// sign extends the lowest Bits bits of value
template<u32 Bits>
ALWAYS_INLINE constexpr u32 SignExtendBits(u32 value) {
    static_assert(Bits > 0 && Bits < 32);
    constexpr u32 shift = 32 - Bits;
    return static_cast<u32>(static_cast<s32>(value << shift) >> shift);
}

ALWAYS_INLINE constexpr u32 RotateRight(u32 value, u32 amount) {
    return std::rotr(value, static_cast<int>(amount & 0x1F));
}

ALWAYS_INLINE constexpr bool Bit(u32 value, u32 index) {
    return ((value >> index) & 0x1) != 0;
}

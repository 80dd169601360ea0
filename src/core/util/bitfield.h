#pragma once

#include <cstddef>
#include <limits>
#include <type_traits>

#include "types.h"

// A view on Bits bits of a register value starting at Position.
// Meant to be used inside a union together with the raw register value, e.g.
//
//   union {
//       u32 value = 0;
//       BitField<u32, bool, 7, 1> start;
//       BitField<u32, u32, 0, 2> prescaler;
//   } control;
template<typename StorageType, typename ValueType, std::size_t Position, std::size_t Bits>
struct BitField {
    static_assert(std::is_integral_v<StorageType>, "BitField storage must be an integral type");
    static_assert(Bits > 0 && Position + Bits <= 8 * sizeof(StorageType), "BitField out of storage range");

    using UnsignedStorage = std::make_unsigned_t<StorageType>;

    ALWAYS_INLINE constexpr operator ValueType() const { return GetValue(); }

    ALWAYS_INLINE BitField& operator=(ValueType value) {
        SetValue(value);
        return *this;
    }

    ALWAYS_INLINE BitField& operator|=(ValueType value) {
        SetValue(GetValue() | value);
        return *this;
    }

    ALWAYS_INLINE BitField& operator&=(ValueType value) {
        SetValue(GetValue() & value);
        return *this;
    }

    ALWAYS_INLINE constexpr ValueType GetValue() const {
        const UnsignedStorage field = (static_cast<UnsignedStorage>(storage) & Mask()) >> Position;

        if constexpr (std::is_same_v<ValueType, bool>) {
            return field != 0;
        } else if constexpr (std::is_enum_v<ValueType>) {
            return static_cast<ValueType>(field);
        } else if constexpr (std::is_signed_v<ValueType>) {
            constexpr std::size_t shift = 8 * sizeof(ValueType) - Bits;
            return static_cast<ValueType>(static_cast<ValueType>(field << shift) >> shift);
        } else {
            return static_cast<ValueType>(field);
        }
    }

    ALWAYS_INLINE void SetValue(ValueType value) {
        const UnsignedStorage bits = (static_cast<UnsignedStorage>(value) << Position) & Mask();
        storage = static_cast<StorageType>((static_cast<UnsignedStorage>(storage) & ~Mask()) | bits);
    }

    static constexpr UnsignedStorage Mask() {
        return static_cast<UnsignedStorage>(
            (std::numeric_limits<UnsignedStorage>::max() >> (8 * sizeof(StorageType) - Bits)) << Position);
    }

    StorageType storage;
};

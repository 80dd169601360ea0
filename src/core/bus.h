#pragma once

#include <string>
#include <type_traits>
#include <vector>

#include "util/types.h"

class System;

// timing class of a memory access
enum class AccessType : u32 {
    N,    // non-sequential
    S,    // sequential
};

// Memory interface of one processor.
// Accesses are untimed here, the CPU charges AccessCycles() to the scheduler before performing them.
class BUS {
public:
    virtual ~BUS() = default;

    virtual u8 Load8(u32 address) = 0;
    virtual u16 Load16(u32 address) = 0;
    virtual u32 Load32(u32 address) = 0;
    virtual void Store8(u32 address, u8 value) = 0;
    virtual void Store16(u32 address, u16 value) = 0;
    virtual void Store32(u32 address, u32 value) = 0;

    // cycles taken by an access of size bytes
    virtual u32 AccessCycles(AccessType type, u32 address, u32 size) = 0;

    template<typename ValueType>
    ValueType Load(u32 address) {
        static_assert(std::is_same_v<ValueType, u32> || std::is_same_v<ValueType, u16> ||
                      std::is_same_v<ValueType, u8>);

        if constexpr (std::is_same_v<ValueType, u32>) return Load32(address);
        else if constexpr (std::is_same_v<ValueType, u16>) return Load16(address);
        else return Load8(address);
    }

    template<typename ValueType>
    void Store(u32 address, ValueType value) {
        static_assert(std::is_same_v<ValueType, u32> || std::is_same_v<ValueType, u16> ||
                      std::is_same_v<ValueType, u8>);

        if constexpr (std::is_same_v<ValueType, u32>) Store32(address, value);
        else if constexpr (std::is_same_v<ValueType, u16>) Store16(address, value);
        else Store8(address, value);
    }
};

// Bus of one processor: shared main memory, private work RAM and the I/O page
class MemoryBus : public BUS {
public:
    MemoryBus(System* system, Processor processor);

    // copies a raw binary into memory at address, false if the file can't be read or doesn't fit
    bool LoadBinary(const std::string& path, u32 address);
    bool LoadBinary(const std::vector<u8>& data, u32 address);

    u8 Load8(u32 address) override;
    u16 Load16(u32 address) override;
    u32 Load32(u32 address) override;
    void Store8(u32 address, u8 value) override;
    void Store16(u32 address, u16 value) override;
    void Store32(u32 address, u32 value) override;

    u32 AccessCycles(AccessType type, u32 address, u32 size) override;

    static constexpr u32 MAIN_MEMORY_START = 0x02000000;
    static constexpr u32 MAIN_MEMORY_SIZE = 4 * 1024 * 1024;
    static constexpr u32 WORK_RAM_START = 0x03000000;
    static constexpr u32 WORK_RAM_SIZE = 64 * 1024;
    static constexpr u32 IO_START = 0x04000000;

    // each region spans 16 MiB of the address space, smaller memories are mirrored inside it
    static constexpr u32 REGION_SIZE = 0x01000000;

private:
    template<typename ValueType>
    ValueType Read(u32 address);
    template<typename ValueType>
    void Write(u32 address, ValueType value);

    u8 LoadIO(u32 address);
    void StoreIO(u32 address, u8 value);

    std::vector<u8> work_ram;

    const Processor processor;
    System* sys = nullptr;
};

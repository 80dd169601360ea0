#include "bus.h"

#include <algorithm>
#include <cstring>
#include <fstream>

#include "common/asserts.h"
#include "common/log.h"
#include "interrupt.h"
#include "system.h"
#include "timer/timers.h"

LOG_CHANNEL(BUS);

MemoryBus::MemoryBus(System* system, Processor processor)
    : work_ram(WORK_RAM_SIZE), processor(processor), sys(system) {}

static constexpr bool InArea(u32 start, u32 length, u32 address) {
    return address >= start && address - start < length;
}

// offset into a mirrored memory of size bytes, the bus ignores the low address bits of wide accesses
template<typename ValueType>
static constexpr u32 MemoryOffset(u32 address, u32 size) {
    return address & (size - 1) & ~static_cast<u32>(sizeof(ValueType) - 1);
}

bool MemoryBus::LoadBinary(const std::string& path, u32 address) {
    LogInfo("Loading {} binary from file {} at 0x{:08X}", ProcessorName(processor), path, address);

    std::ifstream file(path, std::ifstream::binary);
    if (!file || !file.good()) {
        LogWarn("Failed to open binary file {}", path);
        return false;
    }
    file.seekg(0, std::ifstream::end);
    const long length = file.tellg();
    file.seekg(0, std::ifstream::beg);

    if (length <= 0) {
        LogWarn("Binary file {} is empty", path);
        return false;
    }

    std::vector<u8> buffer(length);
    file.read(reinterpret_cast<char*>(buffer.data()), length);

    return LoadBinary(buffer, address);
}

bool MemoryBus::LoadBinary(const std::vector<u8>& data, u32 address) {
    if (InArea(MAIN_MEMORY_START, MAIN_MEMORY_SIZE, address) &&
        data.size() <= MAIN_MEMORY_SIZE - (address - MAIN_MEMORY_START)) {
        std::copy(data.begin(), data.end(), sys->main_memory.begin() + (address - MAIN_MEMORY_START));
        return true;
    }

    if (InArea(WORK_RAM_START, WORK_RAM_SIZE, address) &&
        data.size() <= WORK_RAM_SIZE - (address - WORK_RAM_START)) {
        std::copy(data.begin(), data.end(), work_ram.begin() + (address - WORK_RAM_START));
        return true;
    }

    LogWarn("Binary of {} bytes does not fit in memory at 0x{:08X}", data.size(), address);
    return false;
}

u32 MemoryBus::AccessCycles(AccessType type, u32 address, u32 size) {
    if (InArea(MAIN_MEMORY_START, REGION_SIZE, address)) {
        const auto& timing = sys->main_memory_timing;
        // the main memory bus is 16 bits wide, a word access takes a second sequential access
        const u32 first = type == AccessType::N ? timing.nonseq_cycles : timing.seq_cycles;
        return size == 4 ? first + timing.seq_cycles : first;
    }

    return 1;
}

template<typename ValueType>
ValueType MemoryBus::Read(u32 address) {
    // MAIN MEMORY
    if (InArea(MAIN_MEMORY_START, REGION_SIZE, address)) {
        ValueType value;
        std::memcpy(&value, sys->main_memory.data() + MemoryOffset<ValueType>(address, MAIN_MEMORY_SIZE),
                    sizeof(ValueType));
        return value;
    }
    // WORK RAM
    if (InArea(WORK_RAM_START, REGION_SIZE, address)) {
        ValueType value;
        std::memcpy(&value, work_ram.data() + MemoryOffset<ValueType>(address, WORK_RAM_SIZE), sizeof(ValueType));
        return value;
    }
    // IO
    if (InArea(IO_START, REGION_SIZE, address)) {
        ValueType value = 0;
        for (u32 i = 0; i < sizeof(ValueType); i++) value |= static_cast<ValueType>(LoadIO(address + i)) << (8 * i);
        return value;
    }

    LogWarn("{} load{} from unmapped address [0x{:08X}]", ProcessorName(processor), sizeof(ValueType) * 8, address);
    return 0;
}

template<typename ValueType>
void MemoryBus::Write(u32 address, ValueType value) {
    // MAIN MEMORY
    if (InArea(MAIN_MEMORY_START, REGION_SIZE, address)) {
        std::memcpy(sys->main_memory.data() + MemoryOffset<ValueType>(address, MAIN_MEMORY_SIZE), &value,
                    sizeof(ValueType));
        return;
    }
    // WORK RAM
    if (InArea(WORK_RAM_START, REGION_SIZE, address)) {
        std::memcpy(work_ram.data() + MemoryOffset<ValueType>(address, WORK_RAM_SIZE), &value, sizeof(ValueType));
        return;
    }
    // IO
    if (InArea(IO_START, REGION_SIZE, address)) {
        for (u32 i = 0; i < sizeof(ValueType); i++) StoreIO(address + i, static_cast<u8>(value >> (8 * i)));
        return;
    }

    LogWarn("{} store{} to unmapped address [0x{:X} @ 0x{:08X}] - Ignored", ProcessorName(processor),
            sizeof(ValueType) * 8, value, address);
}

u8 MemoryBus::Load8(u32 address) {
    return Read<u8>(address);
}

u16 MemoryBus::Load16(u32 address) {
    return Read<u16>(address);
}

u32 MemoryBus::Load32(u32 address) {
    return Read<u32>(address);
}

void MemoryBus::Store8(u32 address, u8 value) {
    Write<u8>(address, value);
}

void MemoryBus::Store16(u32 address, u16 value) {
    Write<u16>(address, value);
}

void MemoryBus::Store32(u32 address, u32 value) {
    Write<u32>(address, value);
}

u8 MemoryBus::LoadIO(u32 address) {
    const u32 index = ProcessorIndex(processor);

    if (TimerController::InRange(address)) return sys->timers[index]->Read(address);
    if (InterruptController::InRange(address)) return sys->interrupts[index]->Read(address);

    LogWarn("{} load from unknown IO register [0x{:08X}]", ProcessorName(processor), address);
    return 0;
}

void MemoryBus::StoreIO(u32 address, u8 value) {
    const u32 index = ProcessorIndex(processor);

    if (TimerController::InRange(address)) {
        sys->timers[index]->Write(address, value);
        return;
    }
    if (InterruptController::InRange(address)) {
        sys->interrupts[index]->Write(address, value);
        return;
    }

    LogWarn("{} store to unknown IO register [0x{:02X} @ 0x{:08X}] - Ignored", ProcessorName(processor), value,
            address);
}

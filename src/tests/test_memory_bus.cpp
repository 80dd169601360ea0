#include <vector>

#include <catch2/catch.hpp>

#include "bus.h"
#include "interrupt.h"
#include "system.h"
#include "timer/timers.h"

namespace {

BUS& GetBus(System& sys, Processor processor) {
    return *sys.buses[ProcessorIndex(processor)];
}

}    // namespace

TEST_CASE("MemoryBus[MainMemoryIsShared]", "[bus]") {
    System sys;
    auto& arm9 = GetBus(sys, Processor::ARM9);
    auto& arm7 = GetBus(sys, Processor::ARM7);

    arm9.Store32(0x02000010, 0xDEADBEEF);

    REQUIRE(arm7.Load32(0x02000010) == 0xDEADBEEF);
    REQUIRE(arm7.Load16(0x02000012) == 0xDEAD);
    REQUIRE(arm7.Load8(0x02000010) == 0xEF);
    // 4 MiB mirrored through the region
    REQUIRE(arm9.Load32(0x02400010) == 0xDEADBEEF);
    REQUIRE(arm9.Load32(0x02C00010) == 0xDEADBEEF);
}

TEST_CASE("MemoryBus[WorkRamIsPrivate]", "[bus]") {
    System sys;
    auto& arm9 = GetBus(sys, Processor::ARM9);
    auto& arm7 = GetBus(sys, Processor::ARM7);

    arm9.Store16(0x03000020, 0x1234);

    REQUIRE(arm9.Load16(0x03000020) == 0x1234);
    REQUIRE(arm9.Load16(0x03010020) == 0x1234);
    REQUIRE(arm7.Load16(0x03000020) == 0);
}

TEST_CASE("MemoryBus[UnmappedReadsZero]", "[bus]") {
    System sys;
    auto& bus = GetBus(sys, Processor::ARM9);

    bus.Store32(0x08000000, 0xFFFFFFFF);

    REQUIRE(bus.Load32(0x08000000) == 0);
    REQUIRE(bus.Load8(0x00000000) == 0);
}

TEST_CASE("MemoryBus[AccessCycles]", "[bus]") {
    System sys;
    auto& bus = GetBus(sys, Processor::ARM9);

    sys.main_memory_timing.nonseq_cycles = 4;
    sys.main_memory_timing.seq_cycles = 2;

    // the second halfword of a word access is sequential
    REQUIRE(bus.AccessCycles(AccessType::N, 0x02000000, 4) == 6);
    REQUIRE(bus.AccessCycles(AccessType::S, 0x02000000, 4) == 4);
    REQUIRE(bus.AccessCycles(AccessType::N, 0x02000000, 2) == 4);
    REQUIRE(bus.AccessCycles(AccessType::S, 0x02000000, 1) == 2);

    REQUIRE(bus.AccessCycles(AccessType::N, 0x03000000, 4) == 1);
    REQUIRE(bus.AccessCycles(AccessType::N, 0x04000100, 2) == 1);
}

TEST_CASE("MemoryBus[LoadBinary]", "[bus]") {
    System sys;
    auto& bus = static_cast<MemoryBus&>(GetBus(sys, Processor::ARM7));
    const std::vector<u8> binary = {0x05, 0x00, 0xA0, 0xE3};

    REQUIRE(bus.LoadBinary(binary, 0x02000100));
    REQUIRE(bus.Load32(0x02000100) == 0xE3A00005);

    REQUIRE(bus.LoadBinary(binary, 0x03000000));
    REQUIRE(bus.Load32(0x03000000) == 0xE3A00005);

    // doesn't fit at the end of work RAM
    REQUIRE_FALSE(bus.LoadBinary(binary, 0x0300FFFE));
    REQUIRE_FALSE(bus.LoadBinary(binary, 0x08000000));
    REQUIRE_FALSE(bus.LoadBinary("this/file/does/not/exist.bin", 0x02000000));
}

TEST_CASE("MemoryBus[TimerRegisters]", "[bus]") {
    System sys;
    auto& bus = GetBus(sys, Processor::ARM9);

    // TM1CNT_L and TM1CNT_H in one access
    bus.Store32(0x04000104, 0x00C0ABCD);

    const auto& timer = sys.timers[ProcessorIndex(Processor::ARM9)]->GetTimer(1);
    REQUIRE(timer.GetReload() == 0xABCD);
    REQUIRE(timer.IsRunning());
    REQUIRE(timer.IrqEnabled());

    REQUIRE(bus.Load16(0x04000104) == 0xABCD);
    REQUIRE(bus.Load16(0x04000106) == 0x00C0);
    REQUIRE(sys.scheduler.IsScheduled(Event::TimerOverflow(Processor::ARM9, 1)));
}

TEST_CASE("MemoryBus[InterruptRegisters]", "[bus]") {
    System sys;
    auto& bus = GetBus(sys, Processor::ARM7);
    auto& interrupts = *sys.interrupts[ProcessorIndex(Processor::ARM7)];

    bus.Store32(0x04000208, 0xFFFFFFFF);
    bus.Store32(0x04000210, 0x00000018);

    // only bit 0 of IME exists
    REQUIRE(bus.Load32(0x04000208) == 1);
    REQUIRE(interrupts.enable == 0x18);
    REQUIRE_FALSE(interrupts.Pending());

    interrupts.Request(IRQ::TIMER0);
    interrupts.Request(IRQ::TIMER1);
    REQUIRE(interrupts.Pending());
    REQUIRE(bus.Load32(0x04000214) == 0x18);

    // writing 1 acknowledges
    bus.Store16(0x04000214, 0x0008);
    REQUIRE(interrupts.request == 0x10);
    REQUIRE(interrupts.Pending());

    bus.Store8(0x04000214, 0x10);
    REQUIRE(interrupts.request == 0);
    REQUIRE_FALSE(interrupts.Pending());

    // the other processor's controller is untouched
    REQUIRE(sys.interrupts[ProcessorIndex(Processor::ARM9)]->enable == 0);
}

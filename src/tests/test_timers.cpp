#include <catch2/catch.hpp>

#include "interrupt.h"
#include "system.h"
#include "timer/timers.h"

namespace {

constexpr u32 TM0CNT_L = 0x04000100;
constexpr u32 TM0CNT_H = 0x04000102;
constexpr u32 TM1CNT_L = 0x04000104;
constexpr u32 TM1CNT_H = 0x04000106;

constexpr u8 CONTROL_START = 0x80;
constexpr u8 CONTROL_IRQ = 0x40;
constexpr u8 CONTROL_COUNT_UP = 0x04;

void WriteReload(TimerController& timers, u32 address, u16 reload) {
    timers.Write(address, static_cast<u8>(reload));
    timers.Write(address + 1, static_cast<u8>(reload >> 8));
}

u16 ReadCounter(const TimerController& timers, u32 address) {
    return timers.Read(address) | (timers.Read(address + 1) << 8);
}

}    // namespace

TEST_CASE("Timers[RegularOverflow]", "[timer]") {
    System sys;
    auto& timers = *sys.timers[ProcessorIndex(Processor::ARM9)];
    auto& interrupts = *sys.interrupts[ProcessorIndex(Processor::ARM9)];
    const auto event = Event::TimerOverflow(Processor::ARM9, 0);

    WriteReload(timers, TM0CNT_L, 0xFF00);
    timers.Write(TM0CNT_H, CONTROL_START | CONTROL_IRQ);

    // 1 cycle start latency, then 256 ticks
    REQUIRE(sys.scheduler.GetTriggerCycle(event) == 257);

    // the reload value is visible until the first tick
    REQUIRE(ReadCounter(timers, TM0CNT_L) == 0xFF00);
    sys.scheduler.AddCycles(1);
    REQUIRE(ReadCounter(timers, TM0CNT_L) == 0xFF00);
    sys.scheduler.AddCycles(1);
    REQUIRE(ReadCounter(timers, TM0CNT_L) == 0xFF01);
    sys.scheduler.AddCycles(254);
    REQUIRE(ReadCounter(timers, TM0CNT_L) == 0xFFFF);
    REQUIRE((interrupts.request & static_cast<u32>(IRQ::TIMER0)) == 0);

    sys.scheduler.AddCycles(1);

    REQUIRE((interrupts.request & static_cast<u32>(IRQ::TIMER0)) != 0);
    REQUIRE(ReadCounter(timers, TM0CNT_L) == 0xFF00);
    // reloaded without a start latency
    REQUIRE(sys.scheduler.GetTriggerCycle(event) == 257 + 256);
}

TEST_CASE("Timers[Prescaler]", "[timer]") {
    System sys;
    auto& timers = *sys.timers[ProcessorIndex(Processor::ARM9)];

    WriteReload(timers, TM0CNT_L, 0xFF00);
    timers.Write(TM0CNT_H, CONTROL_START | 0x1);

    REQUIRE(timers.GetTimer(0).GetPrescaler() == 64);
    // ticks are aligned to the global cycle counter
    REQUIRE(sys.scheduler.GetTriggerCycle(Event::TimerOverflow(Processor::ARM9, 0)) == 1 + 62 + 64 * 255);

    sys.scheduler.AddCycles(62);
    REQUIRE(ReadCounter(timers, TM0CNT_L) == 0xFF00);
    sys.scheduler.AddCycles(1);
    REQUIRE(ReadCounter(timers, TM0CNT_L) == 0xFF01);
    sys.scheduler.AddCycles(64);
    REQUIRE(ReadCounter(timers, TM0CNT_L) == 0xFF02);
}

TEST_CASE("Timers[CountUpCascade]", "[timer]") {
    System sys;
    auto& timers = *sys.timers[ProcessorIndex(Processor::ARM9)];
    auto& interrupts = *sys.interrupts[ProcessorIndex(Processor::ARM9)];

    WriteReload(timers, TM1CNT_L, 0xFFFE);
    timers.Write(TM1CNT_H, CONTROL_START | CONTROL_IRQ | CONTROL_COUNT_UP);

    // count-up timers never schedule an event of their own
    REQUIRE_FALSE(sys.scheduler.IsScheduled(Event::TimerOverflow(Processor::ARM9, 1)));
    REQUIRE(ReadCounter(timers, TM1CNT_L) == 0xFFFE);

    WriteReload(timers, TM0CNT_L, 0xFFFF);
    timers.Write(TM0CNT_H, CONTROL_START);

    sys.scheduler.AddCycles(2);
    REQUIRE(ReadCounter(timers, TM1CNT_L) == 0xFFFF);
    REQUIRE((interrupts.request & static_cast<u32>(IRQ::TIMER1)) == 0);

    sys.scheduler.AddCycles(1);
    REQUIRE(ReadCounter(timers, TM1CNT_L) == 0xFFFE);
    REQUIRE((interrupts.request & static_cast<u32>(IRQ::TIMER1)) != 0);
    // timer 0 has no irq enabled
    REQUIRE((interrupts.request & static_cast<u32>(IRQ::TIMER0)) == 0);
}

TEST_CASE("Timers[CountUpCascadeFullPeriod]", "[timer]") {
    constexpr u16 reload = 0x1234;
    constexpr u32 period = TIMER_OVERFLOW - reload;

    System sys;
    auto& timers = *sys.timers[ProcessorIndex(Processor::ARM9)];
    auto& interrupts = *sys.interrupts[ProcessorIndex(Processor::ARM9)];
    const auto timer1_irq = static_cast<u32>(IRQ::TIMER1);

    WriteReload(timers, TM1CNT_L, reload);
    timers.Write(TM1CNT_H, CONTROL_START | CONTROL_IRQ | CONTROL_COUNT_UP);

    // timer 0 overflows on every cycle after its first tick, overflow n happens at cycle n + 1
    WriteReload(timers, TM0CNT_L, 0xFFFF);
    timers.Write(TM0CNT_H, CONTROL_START);

    u64 overflows = 0;
    const auto run_overflows = [&](u64 count) {
        sys.scheduler.AddCycles(count + (overflows == 0 ? 1 : 0));
        overflows += count;
    };

    run_overflows(1);
    REQUIRE(ReadCounter(timers, TM1CNT_L) == reload + 1);

    run_overflows(0x1000 - 1);
    REQUIRE(ReadCounter(timers, TM1CNT_L) == reload + 0x1000);

    // one cascade tick short of the overflow
    run_overflows(period - 1 - overflows);
    REQUIRE(ReadCounter(timers, TM1CNT_L) == 0xFFFF);
    REQUIRE((interrupts.request & timer1_irq) == 0);
    REQUIRE_FALSE(sys.scheduler.IsScheduled(Event::TimerOverflow(Processor::ARM9, 1)));

    run_overflows(1);
    REQUIRE(overflows == period);
    REQUIRE(ReadCounter(timers, TM1CNT_L) == reload);
    REQUIRE((interrupts.request & timer1_irq) != 0);

    // the next period starts from the reload value again
    interrupts.request = 0;
    run_overflows(5);
    REQUIRE(ReadCounter(timers, TM1CNT_L) == reload + 5);
    REQUIRE((interrupts.request & timer1_irq) == 0);
}

TEST_CASE("Timers[Timer0IgnoresCountUp]", "[timer]") {
    System sys;
    auto& timers = *sys.timers[ProcessorIndex(Processor::ARM9)];

    timers.Write(TM0CNT_H, CONTROL_START | CONTROL_COUNT_UP);

    REQUIRE_FALSE(timers.GetTimer(0).IsCountUp());
    REQUIRE(sys.scheduler.IsScheduled(Event::TimerOverflow(Processor::ARM9, 0)));
}

TEST_CASE("Timers[StopLatchesCounter]", "[timer]") {
    System sys;
    auto& timers = *sys.timers[ProcessorIndex(Processor::ARM9)];
    const auto event = Event::TimerOverflow(Processor::ARM9, 0);

    timers.Write(TM0CNT_H, CONTROL_START);
    sys.scheduler.AddCycles(11);
    REQUIRE(ReadCounter(timers, TM0CNT_L) == 10);

    timers.Write(TM0CNT_H, 0);

    REQUIRE_FALSE(sys.scheduler.IsScheduled(event));
    sys.scheduler.AddCycles(100);
    REQUIRE(ReadCounter(timers, TM0CNT_L) == 10);
}

TEST_CASE("Timers[ControlWriteWhileRunning]", "[timer]") {
    System sys;
    auto& timers = *sys.timers[ProcessorIndex(Processor::ARM9)];

    timers.Write(TM0CNT_H, CONTROL_START);
    sys.scheduler.AddCycles(11);

    // switching the prescaler continues from the current counter, not from the reload value
    timers.Write(TM0CNT_H, CONTROL_START | 0x1);

    REQUIRE(ReadCounter(timers, TM0CNT_L) == 10);
    REQUIRE(sys.scheduler.GetTriggerCycle(Event::TimerOverflow(Processor::ARM9, 0)) ==
            11 + 52 + 64 * (0x10000 - 10 - 1));
}

TEST_CASE("Timers[ControlRegister]", "[timer]") {
    System sys;
    auto& timers = *sys.timers[ProcessorIndex(Processor::ARM9)];

    // TM2CNT_H, unused bits read back as zero
    timers.Write(0x0400010A, 0x7F);
    REQUIRE(timers.Read(0x0400010A) == 0x47);
    REQUIRE(timers.Read(0x0400010B) == 0);

    // the reload value is write only, the counter reads back
    WriteReload(timers, 0x04000108, 0x1234);
    REQUIRE(timers.GetTimer(2).GetReload() == 0x1234);
    REQUIRE(ReadCounter(timers, 0x04000108) == 0);
}

TEST_CASE("Timers[ProcessorsAreIndependent]", "[timer]") {
    System sys;

    sys.timers[ProcessorIndex(Processor::ARM7)]->Write(TM0CNT_H, CONTROL_START);

    REQUIRE(sys.scheduler.IsScheduled(Event::TimerOverflow(Processor::ARM7, 0)));
    REQUIRE_FALSE(sys.scheduler.IsScheduled(Event::TimerOverflow(Processor::ARM9, 0)));
    REQUIRE_FALSE(sys.timers[ProcessorIndex(Processor::ARM9)]->GetTimer(0).IsRunning());
}

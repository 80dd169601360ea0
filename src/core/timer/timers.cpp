#include "timers.h"

#include "common/asserts.h"
#include "common/log.h"
#include "interrupt.h"
#include "system.h"

LOG_CHANNEL(Timer);

TimerController::TimerController(System* system, Processor processor)
    : timers{Timer(0, processor, system), Timer(1, processor, system), Timer(2, processor, system),
             Timer(3, processor, system)},
      processor(processor), sys(system) {}

void TimerController::Reset() {
    for (auto& timer : timers) timer.Reset();
}

u8 TimerController::Read(u32 address) const {
    Assert(InRange(address));

    const u32 offset = address - TIMERS_START;
    return timers[offset >> 2].Read(offset & 0x3);
}

void TimerController::Write(u32 address, u8 value) {
    Assert(InRange(address));

    const u32 offset = address - TIMERS_START;
    LogTrace("{} write to Timer{} [0x{:02X} @ byte {}]", ProcessorName(processor), offset >> 2, value, offset & 0x3);

    timers[offset >> 2].Write(offset & 0x3, value);
}

void TimerController::OnOverflow(u32 index) {
    Assert(index < TIMER_COUNT);
    auto& timer = timers[index];

    if (timer.IrqEnabled()) {
        sys->interrupts[ProcessorIndex(processor)]->Request(static_cast<IRQ>(static_cast<u32>(IRQ::TIMER0) << index));
    }

    // cascade into the next timer
    if (index + 1 < TIMER_COUNT && timers[index + 1].IsCountUp()) {
        if (timers[index + 1].Clock()) OnOverflow(index + 1);
    }

    if (!timer.IsCountUp()) {
        timer.Reload();
        timer.ScheduleOverflow(0);
    }
}

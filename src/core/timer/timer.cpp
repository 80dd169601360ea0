#include "timer.h"

#include "common/asserts.h"
#include "common/log.h"
#include "scheduler.h"
#include "system.h"
#include "timers.h"

LOG_CHANNEL(Timer);

Timer::Timer(u32 index, Processor processor, System* system) : index(index), processor(processor), sys(system) {}

void Timer::Reset() {
    sys->scheduler.Remove(Event::TimerOverflow(processor, index));

    reload = 0;
    control.value = 0;
    counter = 0;
    start_cycle = 0;
    cycles_until_first_tick = 0;
    cycles_until_overflow = 0;
}

bool Timer::IsCountUp() const {
    // timer 0 has no previous timer to cascade from
    return index != 0 && control.count_up;
}

bool Timer::Clock() {
    DebugAssert(IsCountUp());

    if (!control.start) return false;

    if (counter == 0xFFFF) {
        counter = reload;
        return true;
    }

    counter++;
    return false;
}

u16 Timer::CalcCounter(u64 global_cycle) const {
    // still inside the start latency
    if (global_cycle < start_cycle) return counter;

    const u64 cycles_passed = global_cycle - start_cycle;
    if (cycles_passed < cycles_until_first_tick) return counter;

    const u64 ticks = 1 + (cycles_passed - cycles_until_first_tick) / GetPrescaler();
    DebugAssert(ticks <= TIMER_OVERFLOW);

    return static_cast<u16>(counter + ticks);
}

u16 Timer::GetCounter() const {
    if (IsCountUp() || !control.start) return counter;

    return CalcCounter(sys->scheduler.GetCycle());
}

void Timer::ScheduleOverflow(u64 delay) {
    auto& scheduler = sys->scheduler;

    const u64 prescaler = GetPrescaler();

    start_cycle = scheduler.GetCycle() + delay;
    // syncs the prescaler to the global cycle, the extra cycle is the start latency of the first tick
    cycles_until_first_tick = prescaler - (start_cycle + 1) % prescaler;
    cycles_until_overflow = prescaler * (TIMER_OVERFLOW - counter - 1);

    LogTrace("Starting {} {} Timer{}: {} * 0x{:04X}", ProcessorName(processor), IsCountUp() ? "Count-Up" : "Regular",
             index, prescaler, counter);

    const u32 timer_index = index;
    const u32 processor_index = ProcessorIndex(processor);
    System* system = sys;
    scheduler.Schedule(Event::TimerOverflow(processor, index), delay + cycles_until_first_tick + cycles_until_overflow,
                       [system, processor_index, timer_index](Event) {
                           system->timers[processor_index]->OnOverflow(timer_index);
                       });
}

u8 Timer::Read(u32 byte) const {
    switch (byte) {
        case 0: return static_cast<u8>(GetCounter() >> 0);
        case 1: return static_cast<u8>(GetCounter() >> 8);
        case 2: return control.value;
        case 3: return 0;
    }

    Panic("Invalid timer register byte {}", byte);
}

void Timer::Write(u32 byte, u8 value) {
    switch (byte) {
        case 0:
            reload = (reload & 0xFF00) | value;
            break;
        case 1:
            reload = (reload & 0x00FF) | (static_cast<u16>(value) << 8);
            break;
        case 2: {
            auto& scheduler = sys->scheduler;

            const bool was_running = control.start;
            scheduler.Remove(Event::TimerOverflow(processor, index));

            // freeze the derived value with the old prescaler before it can change
            if (!IsCountUp() && was_running) counter = CalcCounter(scheduler.GetCycle());

            control.value = value & CONTROL_WRITE_MASK;

            if (was_running && !control.start) LogTrace("Stopping {} Timer{}", ProcessorName(processor), index);

            if (!IsCountUp()) {
                if (!was_running && control.start) {
                    Reload();
                    ScheduleOverflow(1);
                } else if (control.start) {
                    ScheduleOverflow(0);
                }
            } else if (!was_running && control.start) {
                Reload();
            }
            break;
        }
        case 3:
            // upper control byte has no writable bits
            break;
        default:
            Panic("Invalid timer register byte {}", byte);
    }
}

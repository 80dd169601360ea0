#pragma once

#include "util/bitfield.h"
#include "util/types.h"

constexpr u32 TIMER_COUNT = 4;
constexpr u32 TIMER_OVERFLOW = 0x10000;

class System;

// low byte of the timer control register
union TimerControl {
    u8 value = 0;

    BitField<u8, u32, 0, 2> prescaler;
    BitField<u8, bool, 2, 1> count_up;
    BitField<u8, bool, 6, 1> irq_enable;
    BitField<u8, bool, 7, 1> start;
};

// timer.cpp
//
// A running regular timer does not tick its counter every cycle. It remembers the cycle it was
// (re)started at and derives the live counter value from the elapsed cycles when it is read.
// Count-up timers only change on cascade ticks from the previous timer.
class Timer {
public:
    Timer(u32 index, Processor processor, System* system);
    void Reset();

    // byte lanes: 0 = reload/counter low, 1 = reload/counter high, 2 = control low, 3 = control high
    u8 Read(u32 byte) const;
    void Write(u32 byte, u8 value);

    // cascade tick, returns true if the counter overflowed
    bool Clock();
    void Reload() { counter = reload; }
    void ScheduleOverflow(u64 delay);

    bool IsCountUp() const;
    bool IsRunning() const { return control.start; }
    bool IrqEnabled() const { return control.irq_enable; }

    u16 GetCounter() const;
    u16 GetReload() const { return reload; }
    u32 GetPrescaler() const { return PRESCALERS[control.prescaler]; }

    const u32 index;

private:
    u16 CalcCounter(u64 global_cycle) const;

    static constexpr u32 PRESCALERS[4] = {1, 64, 256, 1024};
    static constexpr u8 CONTROL_WRITE_MASK = 0xC7;

    u16 reload = 0;
    TimerControl control;

    // regular timers: counter value at start_cycle
    // count-up timers: live counter value
    u16 counter = 0;

    u64 start_cycle = 0;
    u64 cycles_until_first_tick = 0;
    u64 cycles_until_overflow = 0;

    const Processor processor;
    System* sys = nullptr;
};

#pragma once

#include <array>

#include "timer.h"
#include "util/types.h"

class System;

// TM0CNT..TM3CNT of one processor
class TimerController {
public:
    TimerController(System* system, Processor processor);
    void Reset();

    u8 Read(u32 address) const;
    void Write(u32 address, u8 value);

    // called from the scheduler when a regular timer overflows, or recursively for cascaded count-up timers
    void OnOverflow(u32 index);

    Timer& GetTimer(u32 index) { return timers[index]; }
    const Timer& GetTimer(u32 index) const { return timers[index]; }

    static constexpr u32 TIMERS_START = 0x04000100;
    static constexpr u32 TIMERS_SIZE = 0x10;

    static bool InRange(u32 address) { return address >= TIMERS_START && address < TIMERS_START + TIMERS_SIZE; }

private:
    std::array<Timer, TIMER_COUNT> timers;

    const Processor processor;
    System* sys = nullptr;
};

#pragma once

#include <array>
#include <memory>
#include <vector>

#include "scheduler.h"
#include "util/types.h"

namespace CPU {
class CPU;
}

class BUS;
class InterruptController;
class TimerController;

class System {
public:
    System();
    ~System();

    // Resets every component and restarts both processors at their entry points.
    // Memory contents survive a reset so binaries can be loaded beforehand.
    void Reset(u32 arm9_entry_point = 0, u32 arm7_entry_point = 0);
    // one instruction on each processor, ARM9 first
    void Step();

    void SetTraceInstructions(bool enabled);

    CPU::CPU& GetCPU(Processor processor) { return *cpus[ProcessorIndex(processor)]; }

    Scheduler scheduler;

    // shared by both processors
    std::vector<u8> main_memory;

    // wait states of the main memory
    struct {
        u32 nonseq_cycles = 3;
        u32 seq_cycles = 1;
    } main_memory_timing;

    std::array<std::unique_ptr<CPU::CPU>, PROCESSOR_COUNT> cpus;
    std::array<std::unique_ptr<BUS>, PROCESSOR_COUNT> buses;
    std::array<std::unique_ptr<InterruptController>, PROCESSOR_COUNT> interrupts;
    std::array<std::unique_ptr<TimerController>, PROCESSOR_COUNT> timers;
};

#include "system.h"

#include "bus.h"
#include "common/log.h"
#include "cpu/cpu.h"
#include "interrupt.h"
#include "timer/timers.h"

LOG_CHANNEL(System);

System::System() : main_memory(MemoryBus::MAIN_MEMORY_SIZE, 0) {
    for (auto processor : {Processor::ARM9, Processor::ARM7}) {
        const u32 index = ProcessorIndex(processor);

        cpus[index] = std::make_unique<CPU::CPU>(this, processor);
        buses[index] = std::make_unique<MemoryBus>(this, processor);
        interrupts[index] = std::make_unique<InterruptController>(processor);
        timers[index] = std::make_unique<TimerController>(this, processor);
    }

    LogInfo("Initialized dual ARM core");
}

// required to allow forward declaration with unique_ptr
System::~System() = default;

void System::Reset(u32 arm9_entry_point, u32 arm7_entry_point) {
    scheduler.Reset();

    for (u32 i = 0; i < PROCESSOR_COUNT; i++) {
        interrupts[i]->Reset();
        timers[i]->Reset();
    }

    // the initial refills are charged to the fresh cycle counter
    cpus[ProcessorIndex(Processor::ARM9)]->Reset(arm9_entry_point);
    cpus[ProcessorIndex(Processor::ARM7)]->Reset(arm7_entry_point);

    LogInfo("System reset");
}

void System::Step() {
    cpus[ProcessorIndex(Processor::ARM9)]->Step();
    cpus[ProcessorIndex(Processor::ARM7)]->Step();
}

void System::SetTraceInstructions(bool enabled) {
    for (auto& cpu : cpus) cpu->trace_instructions = enabled;
}

#include "emulator.h"

#include "bus.h"
#include "common/asserts.h"
#include "common/log.h"
#include "cpu/cpu.h"

LOG_CHANNEL(Emulator);

bool Emulator::LoadBinary(Processor processor, const std::string& path, u32 address) {
    auto* bus = dynamic_cast<MemoryBus*>(sys.buses[ProcessorIndex(processor)].get());
    Assert(bus);

    return bus->LoadBinary(path, address);
}

void Emulator::SetMainMemoryTiming(u32 nonseq_cycles, u32 seq_cycles) {
    sys.main_memory_timing.nonseq_cycles = nonseq_cycles;
    sys.main_memory_timing.seq_cycles = seq_cycles;
}

void Emulator::SetTraceInstructions(bool enabled) {
    sys.SetTraceInstructions(enabled);
}

void Emulator::Reset(u32 arm9_entry_point, u32 arm7_entry_point) {
    sys.Reset(arm9_entry_point, arm7_entry_point);
}

void Emulator::Run(u64 steps) {
    LogInfo("Running {} steps", steps);

    for (u64 step = 0; step < steps; step++) sys.Step();

    LogInfo("Stopped after {} steps at cycle {}", steps, sys.scheduler.GetCycle());
}

void Emulator::LogRegisters() const {
    for (const auto& cpu : sys.cpus) {
        const auto& regs = cpu->regs;
        LogInfo("{} [{}] pc: {:08X} cpsr: {:08X}", ProcessorName(cpu->processor), CPU::Registers::GetModeName(regs.GetMode()),
                cpu->GetNextInstructionAddress(), regs.cpsr.value);

        for (u32 i = 0; i < CPU::GP_REG_COUNT; i += 4) {
            LogInfo("  r{:<2} {:08X}  r{:<2} {:08X}  r{:<2} {:08X}  r{:<2} {:08X}", i, regs.r[i], i + 1, regs.r[i + 1],
                    i + 2, regs.r[i + 2], i + 3, regs.r[i + 3]);
        }
    }
}

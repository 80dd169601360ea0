#pragma once

#include <string>

#include "system.h"
#include "util/types.h"

class Emulator {
public:
    bool LoadBinary(Processor processor, const std::string& path, u32 address);

    void SetMainMemoryTiming(u32 nonseq_cycles, u32 seq_cycles);
    void SetTraceInstructions(bool enabled);

    void Reset(u32 arm9_entry_point, u32 arm7_entry_point);
    void Run(u64 steps);

    void LogRegisters() const;
    u64 GetCycle() const { return sys.scheduler.GetCycle(); }

private:
    System sys;
};

#pragma once

#include <array>

#include "bus.h"
#include "cpu_common.h"
#include "decoder.h"

class System;

namespace CPU {

class CPU;

using ArmHandler = void (CPU::*)(u32 instr);
using ThumbHandler = void (CPU::*)(u16 instr);

template<typename Handler, typename InstructionType>
struct DecodeEntry {
    Handler handler = nullptr;
    InstructionType type;
};

using ArmTable = std::array<DecodeEntry<ArmHandler, ArmInstruction>, ARM_TABLE_SIZE>;
using ThumbTable = std::array<DecodeEntry<ThumbHandler, ThumbInstruction>, THUMB_TABLE_SIZE>;

// ARMv4T interpreter with a two stage prefetch pipeline.
// Every memory access and internal cycle is charged to the global scheduler the moment it happens.
class CPU {
public:
    CPU(System* system, Processor processor);

    // SVC mode with interrupts disabled, execution starts at entry_point
    void Reset(u32 entry_point = VECTOR_RESET);
    void Step();

    u32 GetPC() const { return regs.r[PC]; }
    bool InThumbMode() const { return regs.cpsr.thumb; }
    // address of the instruction that executes on the next step
    u32 GetNextInstructionAddress() const { return regs.r[PC] - (InThumbMode() ? 2 : 4); }

    // decode tables are built on first use and shared by every CPU instance
    static const ArmTable& GetArmTable();
    static const ThumbTable& GetThumbTable();

    Registers regs;
    bool trace_instructions = false;

    const Processor processor;

private:
    BUS& Bus();

    template<typename ValueType>
    ValueType Read(AccessType type, u32 address);
    template<typename ValueType>
    void Write(AccessType type, u32 address, ValueType value);
    void Internal(u32 cycles = 1);

    // pipeline
    void FillArmBuffer();
    void FillThumbBuffer();
    void FillBuffer();
    void InstructionPrefetch(AccessType type);

    void ExecuteArm();
    void ExecuteThumb();
    void EnterInterrupt();
    void EnterSoftwareInterrupt(u32 return_address);
    void TraceState(u32 instr) const;

    bool ShouldExecute(u32 condition) const;

    // alu
    u32 Shift(ShiftType type, u32 operand, u32 amount, bool immediate, bool change_status);
    u32 Add(u32 op1, u32 op2, bool change_status);
    u32 Sub(u32 op1, u32 op2, bool change_status);
    u32 Adc(u32 op1, u32 op2, bool change_status);
    u32 Sbc(u32 op1, u32 op2, bool change_status);
    void SetNZ(u32 result);
    void IncMulClocks(u32 operand, bool is_signed);

    // cpu_arm.cpp
    void ArmBranchExchange(u32 instr);
    template<bool Link>
    void ArmBranch(u32 instr);
    template<bool Immediate, bool SetFlags>
    void ArmDataProcessing(u32 instr);
    template<bool Immediate, bool UseSPSR, bool ToPSR>
    void ArmPSRTransfer(u32 instr);
    template<bool Accumulate, bool SetFlags>
    void ArmMultiply(u32 instr);
    template<bool Signed, bool Accumulate, bool SetFlags>
    void ArmMultiplyLong(u32 instr);
    template<bool Byte>
    void ArmSingleDataSwap(u32 instr);
    template<bool PreIndex, bool Up, bool ImmediateOffset, bool WriteBack, bool Load, bool Signed, bool Halfword>
    void ArmHalfwordTransfer(u32 instr);
    template<bool RegisterOffset, bool PreIndex, bool Up, bool Byte, bool WriteBack, bool Load>
    void ArmSingleDataTransfer(u32 instr);
    template<bool PreIndex, bool Up, bool UserBank, bool WriteBack, bool Load>
    void ArmBlockDataTransfer(u32 instr);
    void ArmSoftwareInterrupt(u32 instr);
    void ArmCoprocessor(u32 instr);
    void ArmUndefined(u32 instr);

    template<u32 Key>
    static constexpr DecodeEntry<ArmHandler, ArmInstruction> GetArmEntry();
    static ArmTable BuildArmTable();

    // cpu_thumb.cpp
    template<u32 Op>
    void ThumbMoveShiftedRegister(u16 instr);
    template<bool Immediate, bool Subtract>
    void ThumbAddSubtract(u16 instr);
    template<u32 Op>
    void ThumbImmediate(u16 instr);
    template<u32 Op>
    void ThumbALU(u16 instr);
    template<u32 Op>
    void ThumbHighRegisterBX(u16 instr);
    void ThumbPCRelativeLoad(u16 instr);
    template<bool Load, bool Byte>
    void ThumbLoadStoreRegisterOffset(u16 instr);
    template<bool Halfword, bool SignExtend>
    void ThumbLoadStoreSignExtended(u16 instr);
    template<bool Byte, bool Load>
    void ThumbLoadStoreImmediateOffset(u16 instr);
    template<bool Load>
    void ThumbLoadStoreHalfword(u16 instr);
    template<bool Load>
    void ThumbSPRelativeLoadStore(u16 instr);
    template<bool UseSP>
    void ThumbLoadAddress(u16 instr);
    template<bool Subtract>
    void ThumbAddOffsetToSP(u16 instr);
    template<bool Load, bool StoreLRLoadPC>
    void ThumbPushPop(u16 instr);
    template<bool Load>
    void ThumbMultipleLoadStore(u16 instr);
    template<u32 Cond>
    void ThumbConditionalBranch(u16 instr);
    void ThumbSoftwareInterrupt(u16 instr);
    void ThumbUnconditionalBranch(u16 instr);
    template<bool SecondHalf>
    void ThumbLongBranchWithLink(u16 instr);
    void ThumbUndefined(u16 instr);

    template<u32 Key>
    static constexpr DecodeEntry<ThumbHandler, ThumbInstruction> GetThumbEntry();
    static ThumbTable BuildThumbTable();

    // [0] executes next, [1] was prefetched after it
    std::array<u32, 2> instr_buffer = {};
    AccessType next_access_type = AccessType::N;

    const ArmTable& arm_table;
    const ThumbTable& thumb_table;

    System* sys = nullptr;
};

}    // namespace CPU

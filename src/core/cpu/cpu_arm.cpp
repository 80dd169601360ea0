#include <bit>
#include <utility>

#include "common/asserts.h"
#include "common/log.h"
#include "cpu.h"
#include "util/type_util.h"

LOG_CHANNEL(CPU);

namespace CPU {

// BX
void CPU::ArmBranchExchange(u32 instr) {
    InstructionPrefetch(AccessType::N);

    const u32 target = regs.r[instr & 0xF];
    if (target & 0x1) {
        regs.cpsr.thumb = true;
        regs.r[PC] = target & ~0x1;
        FillThumbBuffer();
    } else {
        regs.r[PC] = target;
        FillArmBuffer();
    }
}

// B, BL
template<bool Link>
void CPU::ArmBranch(u32 instr) {
    const u32 offset = SignExtendBits<24>(instr & 0xFFFFFF) << 2;

    InstructionPrefetch(AccessType::N);

    if constexpr (Link) regs.r[LR] = regs.r[PC] - 4;
    regs.r[PC] += offset;
    FillArmBuffer();
}

// AND, EOR, SUB, RSB, ADD, ADC, SBC, RSC, TST, TEQ, CMP, CMN, ORR, MOV, BIC, MVN
template<bool Immediate, bool SetFlags>
void CPU::ArmDataProcessing(u32 instr) {
    const u32 opcode = (instr >> 21) & 0xF;
    const u32 rn = (instr >> 16) & 0xF;
    const u32 rd = (instr >> 12) & 0xF;

    // S with Rd = PC returns from an exception, CPSR is restored instead of setting flags
    const bool change_status = SetFlags && rd != PC;
    const bool restore_cpsr = SetFlags && rd == PC;
    // logical operations take C from the barrel shifter, ADC/SBC/RSC must see the old C
    const bool shifter_carry = opcode < 0x5 || opcode > 0x7;

    bool temp_inc_pc = false;
    u32 op2;

    if constexpr (Immediate) {
        const u32 rotate = ((instr >> 8) & 0xF) * 2;
        const u32 imm = instr & 0xFF;

        if (shifter_carry && rotate != 0) {
            op2 = Shift(ShiftType::ROR, imm, rotate, true, change_status);
        } else {
            op2 = RotateRight(imm, rotate);
        }
    } else {
        const bool shift_by_register = Bit(instr, 4);
        u32 amount;

        if (shift_by_register) {
            DebugAssert(!Bit(instr, 7));
            // the shift amount is fetched one cycle late, PC is 12 bytes ahead for the operands
            regs.r[PC] += 4;
            temp_inc_pc = true;
            amount = regs.r[(instr >> 8) & 0xF] & 0xFF;
        } else {
            amount = (instr >> 7) & 0x1F;
        }

        const auto type = static_cast<ShiftType>((instr >> 5) & 0x3);
        op2 = Shift(type, regs.r[instr & 0xF], amount, !shift_by_register, change_status && shifter_carry);
    }

    const u32 op1 = regs.r[rn];
    u32 result = 0;

    switch (opcode) {
        case 0x0:
        case 0x8: result = op1 & op2; break;
        case 0x1:
        case 0x9: result = op1 ^ op2; break;
        case 0x2:
        case 0xA: result = Sub(op1, op2, change_status); break;
        case 0x3: result = Sub(op2, op1, change_status); break;
        case 0x4:
        case 0xB: result = Add(op1, op2, change_status); break;
        case 0x5: result = Adc(op1, op2, change_status); break;
        case 0x6: result = Sbc(op1, op2, change_status); break;
        case 0x7: result = Sbc(op2, op1, change_status); break;
        case 0xC: result = op1 | op2; break;
        case 0xD: result = op2; break;
        case 0xE: result = op1 & ~op2; break;
        case 0xF: result = ~op2; break;
    }

    if (temp_inc_pc) regs.r[PC] -= 4;

    // TST, TEQ, CMP and CMN only set flags
    const bool writes_result = (opcode & 0xC) != 0x8;

    if (change_status) {
        SetNZ(result);
    } else if (!restore_cpsr) {
        DebugAssert(writes_result);
    }

    if (writes_result && rd == PC) {
        // the prefetch still belongs to this ARM instruction, the restored T flag only picks the refill width
        InstructionPrefetch(AccessType::N);
        if (restore_cpsr) regs.RestoreCPSR();
        regs.r[PC] = result;
        FillBuffer();
        return;
    }

    InstructionPrefetch(AccessType::S);
    if (restore_cpsr) regs.RestoreCPSR();
    if (writes_result) regs.r[rd] = result;
}

// MRS, MSR
template<bool Immediate, bool UseSPSR, bool ToPSR>
void CPU::ArmPSRTransfer(u32 instr) {
    DebugAssert(!Bit(instr, 20));

    InstructionPrefetch(AccessType::S);

    if constexpr (ToPSR) {
        AssertMsg(((instr >> 12) & 0xF) == 0xF, "MSR with Rd != 0xF [0x{:08X}]", instr);

        u32 mask = 0;
        if (Bit(instr, 19)) mask |= 0xFF000000;    // flags
        if (Bit(instr, 18)) mask |= 0x00FF0000;    // status
        if (Bit(instr, 17)) mask |= 0x0000FF00;    // extension
        // control byte is privileged
        if (Bit(instr, 16) && regs.GetMode() != Mode::USR) mask |= 0x000000FF;

        u32 operand;
        if constexpr (Immediate) {
            operand = RotateRight(instr & 0xFF, ((instr >> 8) & 0xF) * 2);
        } else {
            AssertMsg(((instr >> 4) & 0xFF) == 0, "MSR with reserved bits set [0x{:08X}]", instr);
            operand = regs.r[instr & 0xF];
        }

        if constexpr (UseSPSR) {
            regs.SetSPSR((regs.GetSPSR() & ~mask) | (operand & mask));
        } else {
            regs.SetCPSR((regs.GetCPSR() & ~mask) | (operand & mask));
        }
    } else {
        AssertMsg(!Immediate && (instr & 0xFFF) == 0, "MRS with reserved bits set [0x{:08X}]", instr);

        regs.r[(instr >> 12) & 0xF] = UseSPSR ? regs.GetSPSR() : regs.GetCPSR();
    }
}

// MUL, MLA
template<bool Accumulate, bool SetFlags>
void CPU::ArmMultiply(u32 instr) {
    const u32 rd = (instr >> 16) & 0xF;
    const u32 rn = (instr >> 12) & 0xF;
    const u32 rs = regs.r[(instr >> 8) & 0xF];
    const u32 rm = regs.r[instr & 0xF];

    AssertMsg(Accumulate || rn == 0, "MUL with Rn != 0 [0x{:08X}]", instr);

    InstructionPrefetch(AccessType::S);
    IncMulClocks(rs, true);

    u32 result = rm * rs;
    if constexpr (Accumulate) {
        Internal();
        result += regs.r[rn];
    }

    if constexpr (SetFlags) SetNZ(result);
    regs.r[rd] = result;
}

// UMULL, UMLAL, SMULL, SMLAL
template<bool Signed, bool Accumulate, bool SetFlags>
void CPU::ArmMultiplyLong(u32 instr) {
    const u32 rd_hi = (instr >> 16) & 0xF;
    const u32 rd_lo = (instr >> 12) & 0xF;
    const u32 rs = regs.r[(instr >> 8) & 0xF];
    const u32 rm = regs.r[instr & 0xF];

    InstructionPrefetch(AccessType::S);
    Internal();
    IncMulClocks(rs, Signed);

    u64 result;
    if constexpr (Signed) {
        result = static_cast<u64>(static_cast<s64>(static_cast<s32>(rs)) * static_cast<s64>(static_cast<s32>(rm)));
    } else {
        result = static_cast<u64>(rs) * static_cast<u64>(rm);
    }

    if constexpr (Accumulate) {
        Internal();
        result += (static_cast<u64>(regs.r[rd_hi]) << 32) | regs.r[rd_lo];
    }

    if constexpr (SetFlags) {
        regs.cpsr.N = (result >> 63) != 0;
        regs.cpsr.Z = result == 0;
    }

    regs.r[rd_lo] = static_cast<u32>(result);
    regs.r[rd_hi] = static_cast<u32>(result >> 32);
}

// SWP, SWPB
template<bool Byte>
void CPU::ArmSingleDataSwap(u32 instr) {
    const u32 address = regs.r[(instr >> 16) & 0xF];
    const u32 rd = (instr >> 12) & 0xF;
    const u32 source = regs.r[instr & 0xF];

    InstructionPrefetch(AccessType::N);

    u32 value;
    if constexpr (Byte) {
        value = Read<u8>(AccessType::N, address);
        Write<u8>(AccessType::S, address, static_cast<u8>(source));
    } else {
        value = RotateRight(Read<u32>(AccessType::N, address & ~0x3), (address & 0x3) * 8);
        Write<u32>(AccessType::S, address & ~0x3, source);
    }

    regs.r[rd] = value;
    Internal();
}

// LDRH, STRH, LDRSB, LDRSH
template<bool PreIndex, bool Up, bool ImmediateOffset, bool WriteBack, bool Load, bool Signed, bool Halfword>
void CPU::ArmHalfwordTransfer(u32 instr) {
    constexpr u32 opcode = (static_cast<u32>(Signed) << 1) | static_cast<u32>(Halfword);

    const u32 rn = (instr >> 16) & 0xF;
    const u32 rd = (instr >> 12) & 0xF;
    const u32 base = regs.r[rn];
    // post-indexed transfers always write back
    bool write_back = WriteBack || !PreIndex;

    InstructionPrefetch(AccessType::N);

    u32 offset;
    if constexpr (ImmediateOffset) {
        offset = ((instr >> 4) & 0xF0) | (instr & 0xF);
    } else {
        AssertMsg(((instr >> 8) & 0xF) == 0, "Halfword transfer with reserved bits set [0x{:08X}]", instr);
        offset = regs.r[instr & 0xF];
    }

    const u32 offset_address = Up ? base + offset : base - offset;
    const u32 address = PreIndex ? offset_address : base;

    if constexpr (Load) {
        const AccessType type = rd == PC ? AccessType::N : AccessType::S;
        u32 value = 0;

        if constexpr (opcode == 1) {
            value = RotateRight(Read<u16>(type, address & ~0x1), (address & 0x1) * 8);
        } else if constexpr (opcode == 2) {
            value = SignExtend32(Read<u8>(type, address));
        } else if constexpr (opcode == 3) {
            // misaligned LDRSH loads the sign extended byte
            if (address & 0x1) {
                value = SignExtend32(Read<u8>(type, address));
            } else {
                value = SignExtend32(Read<u16>(type, address));
            }
        } else {
            Panic("Invalid halfword transfer [0x{:08X} @ 0x{:08X}]", instr, regs.r[PC] - 8);
        }

        Internal();

        // the loaded value wins over the write back
        if (rd == rn) write_back = false;
        regs.r[rd] = value;
        if (rd == PC) FillArmBuffer();
    } else {
        if constexpr (opcode == 1) {
            // unlike STR, a stored PC is only 8 bytes ahead
            Write<u16>(AccessType::N, address & ~0x1, static_cast<u16>(regs.r[rd]));
        } else {
            Panic("Unimplemented doubleword transfer [0x{:08X} @ 0x{:08X}]", instr, regs.r[PC] - 8);
        }
    }

    if (write_back) regs.r[rn] = offset_address;
}

// LDR, STR, LDRB, STRB
// TODO: LDRT/STRT with W set on post-indexed transfers should force a user mode access
template<bool RegisterOffset, bool PreIndex, bool Up, bool Byte, bool WriteBack, bool Load>
void CPU::ArmSingleDataTransfer(u32 instr) {
    const u32 rn = (instr >> 16) & 0xF;
    const u32 rd = (instr >> 12) & 0xF;
    const u32 base = regs.r[rn];
    // post-indexed transfers always write back
    bool write_back = WriteBack || !PreIndex;

    InstructionPrefetch(AccessType::N);

    u32 offset;
    if constexpr (RegisterOffset) {
        DebugAssert(!Bit(instr, 4));
        AssertMsg((instr & 0xF) != PC, "Single data transfer with PC as offset register [0x{:08X}]", instr);
        const auto type = static_cast<ShiftType>((instr >> 5) & 0x3);
        offset = Shift(type, regs.r[instr & 0xF], (instr >> 7) & 0x1F, true, false);
    } else {
        offset = instr & 0xFFF;
    }

    const u32 offset_address = Up ? base + offset : base - offset;
    const u32 address = PreIndex ? offset_address : base;

    if constexpr (Load) {
        const AccessType type = rd == PC ? AccessType::N : AccessType::S;
        u32 value;

        if constexpr (Byte) {
            value = Read<u8>(type, address);
        } else {
            // misaligned word loads rotate the aligned word
            value = RotateRight(Read<u32>(type, address & ~0x3), (address & 0x3) * 8);
        }

        Internal();

        if (rd == rn) write_back = false;
        regs.r[rd] = value;
        if (rd == PC) FillArmBuffer();
    } else {
        // PC is stored 12 bytes ahead of the instruction
        const u32 value = rd == PC ? regs.r[PC] + 4 : regs.r[rd];

        if constexpr (Byte) {
            Write<u8>(AccessType::N, address, static_cast<u8>(value));
        } else {
            Write<u32>(AccessType::N, address & ~0x3, value);
        }
    }

    if (write_back) regs.r[rn] = offset_address;
}

// LDM, STM
template<bool PreIndex, bool Up, bool UserBank, bool WriteBack, bool Load>
void CPU::ArmBlockDataTransfer(u32 instr) {
    // registers are always transferred in ascending order from the lowest address
    constexpr bool pre_increment = PreIndex ^ !Up;

    const u32 rn = (instr >> 16) & 0xF;
    AssertMsg(rn != PC, "Block transfer with PC as base [0x{:08X}]", instr);

    const u16 rlist = instr & 0xFFFF;
    const u32 count = std::popcount(rlist);

    const u32 base_offset = regs.r[rn] & 0x3;
    const u32 base = regs.r[rn] - base_offset;

    const bool loads_pc = Load && Bit(rlist, PC);
    // the loaded base wins over the write back
    const bool write_back = WriteBack && !(Load && Bit(rlist, rn));

    // an empty list transfers PC and moves the base by 16 words
    const u32 transfer_size = count == 0 ? 0x40 : count * 4;
    const u32 final_address = (Up ? base + transfer_size : base - transfer_size) + base_offset;

    const Mode actual_mode = regs.GetMode();
    const bool use_user_bank = UserBank && !loads_pc;
    if (use_user_bank) regs.SetMode(Mode::USR);

    InstructionPrefetch(AccessType::N);

    const auto transfer = [&](u32 reg, u32 address, bool last) {
        if constexpr (Load) {
            regs.r[reg] = Read<u32>(AccessType::S, address);
            if (write_back) regs.r[rn] = final_address;
            if (last) Internal();

            if (reg == PC) {
                // mode return happens after the load, the refill width follows the restored T flag
                if constexpr (UserBank) regs.RestoreCPSR();
                next_access_type = AccessType::N;
                FillBuffer();
            }
        } else {
            const u32 value = reg == PC ? regs.r[PC] + 4 : regs.r[reg];
            Write<u32>(last ? AccessType::N : AccessType::S, address, value);
            if (write_back) regs.r[rn] = final_address;
        }
    };

    if (count == 0) {
        transfer(PC, Up ? base + 0x40 : base - 0x40, true);
    } else {
        u32 address = Up ? base : base - transfer_size;
        u32 remaining = count;

        for (u32 reg = 0; reg < GP_REG_COUNT; reg++) {
            if (!Bit(rlist, reg)) continue;

            if (pre_increment) address += 4;
            transfer(reg, address, --remaining == 0);
            if (!pre_increment) address += 4;
        }
    }

    if (use_user_bank) regs.SetMode(actual_mode);
}

// THUMB multiple load/store and push/pop run through these
template void CPU::ArmBlockDataTransfer<false, true, false, true, true>(u32 instr);
template void CPU::ArmBlockDataTransfer<false, true, false, true, false>(u32 instr);
template void CPU::ArmBlockDataTransfer<true, false, false, true, false>(u32 instr);

// SWI
void CPU::ArmSoftwareInterrupt(u32 instr) {
    LogTrace("{} SWI 0x{:06X}", ProcessorName(processor), instr & 0xFFFFFF);
    EnterSoftwareInterrupt(regs.r[PC] - 4);
}

// CDP, LDC, STC, MRC, MCR
void CPU::ArmCoprocessor(u32 instr) {
    Panic("Unimplemented coprocessor instruction [0x{:08X} @ 0x{:08X}]", instr, regs.r[PC] - 8);
}

void CPU::ArmUndefined(u32 instr) {
    Panic("Undefined instruction [0x{:08X} @ 0x{:08X}]", instr, regs.r[PC] - 8);
}

template<u32 Key>
constexpr DecodeEntry<ArmHandler, ArmInstruction> CPU::GetArmEntry() {
    constexpr u32 i = ArmSkeleton(Key);
    constexpr ArmInstruction type = Decode(ARM_DECODE_RULES, i, ArmInstruction::Undefined);

    if constexpr (type == ArmInstruction::BranchExchange) {
        return {&CPU::ArmBranchExchange, type};
    } else if constexpr (type == ArmInstruction::Multiply) {
        return {&CPU::ArmMultiply<Bit(i, 21), Bit(i, 20)>, type};
    } else if constexpr (type == ArmInstruction::MultiplyLong) {
        return {&CPU::ArmMultiplyLong<Bit(i, 22), Bit(i, 21), Bit(i, 20)>, type};
    } else if constexpr (type == ArmInstruction::SingleDataSwap) {
        return {&CPU::ArmSingleDataSwap<Bit(i, 22)>, type};
    } else if constexpr (type == ArmInstruction::HalfwordTransfer) {
        return {&CPU::ArmHalfwordTransfer<Bit(i, 24), Bit(i, 23), Bit(i, 22), Bit(i, 21), Bit(i, 20), Bit(i, 6),
                                          Bit(i, 5)>,
                type};
    } else if constexpr (type == ArmInstruction::PSRTransfer) {
        return {&CPU::ArmPSRTransfer<Bit(i, 25), Bit(i, 22), Bit(i, 21)>, type};
    } else if constexpr (type == ArmInstruction::DataProcessing) {
        return {&CPU::ArmDataProcessing<Bit(i, 25), Bit(i, 20)>, type};
    } else if constexpr (type == ArmInstruction::SingleDataTransfer) {
        return {&CPU::ArmSingleDataTransfer<Bit(i, 25), Bit(i, 24), Bit(i, 23), Bit(i, 22), Bit(i, 21), Bit(i, 20)>,
                type};
    } else if constexpr (type == ArmInstruction::BlockDataTransfer) {
        return {&CPU::ArmBlockDataTransfer<Bit(i, 24), Bit(i, 23), Bit(i, 22), Bit(i, 21), Bit(i, 20)>, type};
    } else if constexpr (type == ArmInstruction::Branch) {
        return {&CPU::ArmBranch<Bit(i, 24)>, type};
    } else if constexpr (type == ArmInstruction::SoftwareInterrupt) {
        return {&CPU::ArmSoftwareInterrupt, type};
    } else if constexpr (type == ArmInstruction::Coprocessor) {
        return {&CPU::ArmCoprocessor, type};
    } else {
        static_assert((i & ARM_UNDEFINED_MASK) == ARM_UNDEFINED_PATTERN,
                      "ARM decode rules leave a gap outside of the undefined instruction space");
        return {&CPU::ArmUndefined, type};
    }
}

ArmTable CPU::BuildArmTable() {
    return []<u32... Keys>(std::integer_sequence<u32, Keys...>) {
        return ArmTable {GetArmEntry<Keys>()...};
    }(std::make_integer_sequence<u32, ARM_TABLE_SIZE> {});
}

const ArmTable& CPU::GetArmTable() {
    static const ArmTable table = BuildArmTable();
    return table;
}

}    // namespace CPU

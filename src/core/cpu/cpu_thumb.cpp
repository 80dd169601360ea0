#include <utility>

#include "common/asserts.h"
#include "common/log.h"
#include "cpu.h"
#include "util/type_util.h"

LOG_CHANNEL(CPU);

namespace CPU {

// THUMB.1: LSL, LSR, ASR by immediate
template<u32 Op>
void CPU::ThumbMoveShiftedRegister(u16 instr) {
    const u32 rd = instr & 0x7;
    const u32 rs = (instr >> 3) & 0x7;
    const u32 offset = (instr >> 6) & 0x1F;

    InstructionPrefetch(AccessType::S);

    const u32 result = Shift(static_cast<ShiftType>(Op), regs.r[rs], offset, true, true);
    SetNZ(result);
    regs.r[rd] = result;
}

// THUMB.2: ADD, SUB with register or 3 bit immediate
template<bool Immediate, bool Subtract>
void CPU::ThumbAddSubtract(u16 instr) {
    const u32 rd = instr & 0x7;
    const u32 op1 = regs.r[(instr >> 3) & 0x7];
    const u32 rn_offset = (instr >> 6) & 0x7;
    const u32 op2 = Immediate ? rn_offset : regs.r[rn_offset];

    InstructionPrefetch(AccessType::S);

    const u32 result = Subtract ? Sub(op1, op2, true) : Add(op1, op2, true);
    SetNZ(result);
    regs.r[rd] = result;
}

// THUMB.3: MOV, CMP, ADD, SUB with 8 bit immediate
template<u32 Op>
void CPU::ThumbImmediate(u16 instr) {
    const u32 rd = (instr >> 8) & 0x7;
    const u32 imm = instr & 0xFF;

    InstructionPrefetch(AccessType::S);

    u32 result = 0;
    switch (Op) {
        case 0x0: result = imm; break;
        case 0x1: result = Sub(regs.r[rd], imm, true); break;
        case 0x2: result = Add(regs.r[rd], imm, true); break;
        case 0x3: result = Sub(regs.r[rd], imm, true); break;
    }

    SetNZ(result);
    // CMP
    if (Op != 0x1) regs.r[rd] = result;
}

// THUMB.4: register ALU operations
template<u32 Op>
void CPU::ThumbALU(u16 instr) {
    const u32 rd = instr & 0x7;
    const u32 rd_value = regs.r[rd];
    const u32 rs_value = regs.r[(instr >> 3) & 0x7];

    InstructionPrefetch(AccessType::S);

    u32 result = 0;
    switch (Op) {
        case 0x0: result = rd_value & rs_value; break;                                         // AND
        case 0x1: result = rd_value ^ rs_value; break;                                         // EOR
        case 0x2: result = Shift(ShiftType::LSL, rd_value, rs_value & 0xFF, false, true); break;    // LSL
        case 0x3: result = Shift(ShiftType::LSR, rd_value, rs_value & 0xFF, false, true); break;    // LSR
        case 0x4: result = Shift(ShiftType::ASR, rd_value, rs_value & 0xFF, false, true); break;    // ASR
        case 0x5: result = Adc(rd_value, rs_value, true); break;                               // ADC
        case 0x6: result = Sbc(rd_value, rs_value, true); break;                               // SBC
        case 0x7: result = Shift(ShiftType::ROR, rd_value, rs_value & 0xFF, false, true); break;    // ROR
        case 0x8: result = rd_value & rs_value; break;                                         // TST
        case 0x9: result = Sub(0, rs_value, true); break;                                      // NEG
        case 0xA: result = Sub(rd_value, rs_value, true); break;                               // CMP
        case 0xB: result = Add(rd_value, rs_value, true); break;                               // CMN
        case 0xC: result = rd_value | rs_value; break;                                         // ORR
        case 0xD:                                                                              // MUL
            IncMulClocks(rd_value, true);
            result = rd_value * rs_value;
            break;
        case 0xE: result = rd_value & ~rs_value; break;    // BIC
        case 0xF: result = ~rs_value; break;               // MVN
    }

    SetNZ(result);
    if (Op != 0x8 && Op != 0xA && Op != 0xB) regs.r[rd] = result;
}

// THUMB.5: ADD, CMP, MOV on high registers, BX
template<u32 Op>
void CPU::ThumbHighRegisterBX(u16 instr) {
    const u32 rd = (instr & 0x7) | ((instr >> 4) & 0x8);
    const u32 rs = (instr >> 3) & 0xF;
    const u32 rs_value = regs.r[rs];

    if constexpr (Op == 0x3) {
        InstructionPrefetch(AccessType::N);

        if (rs_value & 0x1) {
            regs.r[PC] = rs_value & ~0x1;
            FillThumbBuffer();
        } else {
            regs.cpsr.thumb = false;
            regs.r[PC] = rs_value & ~0x3;
            FillArmBuffer();
        }
        return;
    }

    if constexpr (Op == 0x1) {
        InstructionPrefetch(AccessType::S);
        SetNZ(Sub(regs.r[rd], rs_value, true));
        return;
    }

    const u32 result = Op == 0x0 ? regs.r[rd] + rs_value : rs_value;

    if (rd == PC) {
        InstructionPrefetch(AccessType::N);
        regs.r[PC] = result & ~0x1;
        FillThumbBuffer();
        return;
    }

    InstructionPrefetch(AccessType::S);
    regs.r[rd] = result;
}

// THUMB.6: LDR Rd, [PC, #imm]
void CPU::ThumbPCRelativeLoad(u16 instr) {
    const u32 rd = (instr >> 8) & 0x7;
    const u32 address = (regs.r[PC] & ~0x2) + ((instr & 0xFF) << 2);

    InstructionPrefetch(AccessType::N);

    regs.r[rd] = Read<u32>(AccessType::S, address);
    Internal();
}

// THUMB.7: LDR, STR, LDRB, STRB with register offset
template<bool Load, bool Byte>
void CPU::ThumbLoadStoreRegisterOffset(u16 instr) {
    const u32 rd = instr & 0x7;
    const u32 address = regs.r[(instr >> 3) & 0x7] + regs.r[(instr >> 6) & 0x7];

    InstructionPrefetch(AccessType::N);

    if constexpr (Load) {
        if constexpr (Byte) {
            regs.r[rd] = Read<u8>(AccessType::S, address);
        } else {
            regs.r[rd] = RotateRight(Read<u32>(AccessType::S, address & ~0x3), (address & 0x3) * 8);
        }
        Internal();
    } else {
        if constexpr (Byte) {
            Write<u8>(AccessType::N, address, static_cast<u8>(regs.r[rd]));
        } else {
            Write<u32>(AccessType::N, address & ~0x3, regs.r[rd]);
        }
    }
}

// THUMB.8: STRH, LDSB, LDRH, LDSH with register offset
template<bool Halfword, bool SignExtend>
void CPU::ThumbLoadStoreSignExtended(u16 instr) {
    const u32 rd = instr & 0x7;
    const u32 address = regs.r[(instr >> 3) & 0x7] + regs.r[(instr >> 6) & 0x7];

    InstructionPrefetch(AccessType::N);

    if constexpr (!SignExtend && !Halfword) {
        Write<u16>(AccessType::N, address & ~0x1, static_cast<u16>(regs.r[rd]));
        return;
    }

    u32 value;
    if constexpr (!SignExtend) {
        value = RotateRight(Read<u16>(AccessType::S, address & ~0x1), (address & 0x1) * 8);
    } else if constexpr (!Halfword) {
        value = SignExtend32(Read<u8>(AccessType::S, address));
    } else {
        // misaligned LDSH loads the sign extended byte
        if (address & 0x1) {
            value = SignExtend32(Read<u8>(AccessType::S, address));
        } else {
            value = SignExtend32(Read<u16>(AccessType::S, address));
        }
    }

    Internal();
    regs.r[rd] = value;
}

// THUMB.9: LDR, STR, LDRB, STRB with 5 bit immediate offset
template<bool Byte, bool Load>
void CPU::ThumbLoadStoreImmediateOffset(u16 instr) {
    const u32 rd = instr & 0x7;
    const u32 offset = (instr >> 6) & 0x1F;
    const u32 address = regs.r[(instr >> 3) & 0x7] + (Byte ? offset : offset << 2);

    InstructionPrefetch(AccessType::N);

    if constexpr (Load) {
        if constexpr (Byte) {
            regs.r[rd] = Read<u8>(AccessType::S, address);
        } else {
            regs.r[rd] = RotateRight(Read<u32>(AccessType::S, address & ~0x3), (address & 0x3) * 8);
        }
        Internal();
    } else {
        if constexpr (Byte) {
            Write<u8>(AccessType::N, address, static_cast<u8>(regs.r[rd]));
        } else {
            Write<u32>(AccessType::N, address & ~0x3, regs.r[rd]);
        }
    }
}

// THUMB.10: LDRH, STRH with 5 bit immediate offset
template<bool Load>
void CPU::ThumbLoadStoreHalfword(u16 instr) {
    const u32 rd = instr & 0x7;
    const u32 address = regs.r[(instr >> 3) & 0x7] + (((instr >> 6) & 0x1F) << 1);

    InstructionPrefetch(AccessType::N);

    if constexpr (Load) {
        regs.r[rd] = RotateRight(Read<u16>(AccessType::S, address & ~0x1), (address & 0x1) * 8);
        Internal();
    } else {
        Write<u16>(AccessType::N, address & ~0x1, static_cast<u16>(regs.r[rd]));
    }
}

// THUMB.11: LDR, STR relative to SP
template<bool Load>
void CPU::ThumbSPRelativeLoadStore(u16 instr) {
    const u32 rd = (instr >> 8) & 0x7;
    const u32 address = regs.r[SP] + ((instr & 0xFF) << 2);

    InstructionPrefetch(AccessType::N);

    if constexpr (Load) {
        regs.r[rd] = RotateRight(Read<u32>(AccessType::S, address & ~0x3), (address & 0x3) * 8);
        Internal();
    } else {
        Write<u32>(AccessType::N, address & ~0x3, regs.r[rd]);
    }
}

// THUMB.12: ADD Rd, PC/SP, #imm
template<bool UseSP>
void CPU::ThumbLoadAddress(u16 instr) {
    const u32 rd = (instr >> 8) & 0x7;
    const u32 base = UseSP ? regs.r[SP] : regs.r[PC] & ~0x2;

    InstructionPrefetch(AccessType::S);
    regs.r[rd] = base + ((instr & 0xFF) << 2);
}

// THUMB.13: ADD SP, #+-imm
template<bool Subtract>
void CPU::ThumbAddOffsetToSP(u16 instr) {
    const u32 offset = (instr & 0x7F) << 2;

    InstructionPrefetch(AccessType::S);
    regs.r[SP] = Subtract ? regs.r[SP] - offset : regs.r[SP] + offset;
}

// THUMB.14: PUSH, POP
// runs as STMDB SP!, {rlist, LR} and LDMIA SP!, {rlist, PC}
template<bool Load, bool StoreLRLoadPC>
void CPU::ThumbPushPop(u16 instr) {
    u32 rlist = instr & 0xFF;
    if constexpr (StoreLRLoadPC) rlist |= Load ? (1u << PC) : (1u << LR);

    if constexpr (Load) {
        ArmBlockDataTransfer<false, true, false, true, true>((SP << 16) | rlist);
    } else {
        ArmBlockDataTransfer<true, false, false, true, false>((SP << 16) | rlist);
    }
}

// THUMB.15: LDMIA, STMIA
template<bool Load>
void CPU::ThumbMultipleLoadStore(u16 instr) {
    const u32 rb = (instr >> 8) & 0x7;
    ArmBlockDataTransfer<false, true, false, true, Load>((rb << 16) | (instr & 0xFF));
}

// THUMB.16: B{cond}
template<u32 Cond>
void CPU::ThumbConditionalBranch(u16 instr) {
    if (!ShouldExecute(Cond)) {
        InstructionPrefetch(AccessType::S);
        return;
    }

    const u32 offset = SignExtendBits<8>(instr & 0xFF) << 1;

    InstructionPrefetch(AccessType::N);
    regs.r[PC] += offset;
    FillThumbBuffer();
}

// THUMB.17: SWI
void CPU::ThumbSoftwareInterrupt(u16 instr) {
    LogTrace("{} SWI 0x{:02X}", ProcessorName(processor), instr & 0xFF);
    EnterSoftwareInterrupt(regs.r[PC] - 2);
}

// THUMB.18: B
void CPU::ThumbUnconditionalBranch(u16 instr) {
    const u32 offset = SignExtendBits<11>(instr & 0x7FF) << 1;

    InstructionPrefetch(AccessType::N);
    regs.r[PC] += offset;
    FillThumbBuffer();
}

// THUMB.19: BL, split into two halfword instructions
template<bool SecondHalf>
void CPU::ThumbLongBranchWithLink(u16 instr) {
    const u32 offset = instr & 0x7FF;

    if constexpr (!SecondHalf) {
        InstructionPrefetch(AccessType::S);
        regs.r[LR] = regs.r[PC] + (SignExtendBits<11>(offset) << 12);
    } else {
        InstructionPrefetch(AccessType::N);

        const u32 return_address = (regs.r[PC] - 2) | 0x1;
        regs.r[PC] = regs.r[LR] + (offset << 1);
        regs.r[LR] = return_address;
        FillThumbBuffer();
    }
}

void CPU::ThumbUndefined(u16 instr) {
    Panic("Undefined THUMB instruction [0x{:04X} @ 0x{:08X}]", instr, regs.r[PC] - 4);
}

template<u32 Key>
constexpr DecodeEntry<ThumbHandler, ThumbInstruction> CPU::GetThumbEntry() {
    constexpr u16 i = ThumbSkeleton(Key);
    constexpr ThumbInstruction type = Decode(THUMB_DECODE_RULES, i, ThumbInstruction::Undefined);

    if constexpr (type == ThumbInstruction::MoveShiftedRegister) {
        return {&CPU::ThumbMoveShiftedRegister<(i >> 11) & 0x3>, type};
    } else if constexpr (type == ThumbInstruction::AddSubtract) {
        return {&CPU::ThumbAddSubtract<Bit(i, 10), Bit(i, 9)>, type};
    } else if constexpr (type == ThumbInstruction::Immediate) {
        return {&CPU::ThumbImmediate<(i >> 11) & 0x3>, type};
    } else if constexpr (type == ThumbInstruction::ALU) {
        return {&CPU::ThumbALU<(i >> 6) & 0xF>, type};
    } else if constexpr (type == ThumbInstruction::HighRegisterBX) {
        return {&CPU::ThumbHighRegisterBX<(i >> 8) & 0x3>, type};
    } else if constexpr (type == ThumbInstruction::PCRelativeLoad) {
        return {&CPU::ThumbPCRelativeLoad, type};
    } else if constexpr (type == ThumbInstruction::LoadStoreRegisterOffset) {
        return {&CPU::ThumbLoadStoreRegisterOffset<Bit(i, 11), Bit(i, 10)>, type};
    } else if constexpr (type == ThumbInstruction::LoadStoreSignExtended) {
        return {&CPU::ThumbLoadStoreSignExtended<Bit(i, 11), Bit(i, 10)>, type};
    } else if constexpr (type == ThumbInstruction::LoadStoreImmediateOffset) {
        return {&CPU::ThumbLoadStoreImmediateOffset<Bit(i, 12), Bit(i, 11)>, type};
    } else if constexpr (type == ThumbInstruction::LoadStoreHalfword) {
        return {&CPU::ThumbLoadStoreHalfword<Bit(i, 11)>, type};
    } else if constexpr (type == ThumbInstruction::SPRelativeLoadStore) {
        return {&CPU::ThumbSPRelativeLoadStore<Bit(i, 11)>, type};
    } else if constexpr (type == ThumbInstruction::LoadAddress) {
        return {&CPU::ThumbLoadAddress<Bit(i, 11)>, type};
    } else if constexpr (type == ThumbInstruction::AddOffsetToSP) {
        return {&CPU::ThumbAddOffsetToSP<Bit(i, 7)>, type};
    } else if constexpr (type == ThumbInstruction::PushPop) {
        return {&CPU::ThumbPushPop<Bit(i, 11), Bit(i, 8)>, type};
    } else if constexpr (type == ThumbInstruction::MultipleLoadStore) {
        return {&CPU::ThumbMultipleLoadStore<Bit(i, 11)>, type};
    } else if constexpr (type == ThumbInstruction::SoftwareInterrupt) {
        return {&CPU::ThumbSoftwareInterrupt, type};
    } else if constexpr (type == ThumbInstruction::ConditionalBranch) {
        return {&CPU::ThumbConditionalBranch<(i >> 8) & 0xF>, type};
    } else if constexpr (type == ThumbInstruction::UnconditionalBranch) {
        return {&CPU::ThumbUnconditionalBranch, type};
    } else if constexpr (type == ThumbInstruction::LongBranchWithLink) {
        return {&CPU::ThumbLongBranchWithLink<Bit(i, 11)>, type};
    } else {
        return {&CPU::ThumbUndefined, type};
    }
}

ThumbTable CPU::BuildThumbTable() {
    return []<u32... Keys>(std::integer_sequence<u32, Keys...>) {
        return ThumbTable {GetThumbEntry<Keys>()...};
    }(std::make_integer_sequence<u32, THUMB_TABLE_SIZE> {});
}

const ThumbTable& CPU::GetThumbTable() {
    static const ThumbTable table = BuildThumbTable();
    return table;
}

}    // namespace CPU

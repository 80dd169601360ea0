#include "cpu.h"

#include "fmt/format.h"
#include "fmt/ranges.h"

#include "common/asserts.h"
#include "common/log.h"
#include "interrupt.h"
#include "scheduler.h"
#include "system.h"
#include "util/type_util.h"

LOG_CHANNEL(CPU);

namespace CPU {

CPU::CPU(System* system, Processor processor)
    : processor(processor), arm_table(GetArmTable()), thumb_table(GetThumbTable()), sys(system) {}

void CPU::Reset(u32 entry_point) {
    regs.Reset();
    regs.r[PC] = entry_point;
    instr_buffer.fill(0);

    LogInfo("{} reset, entry point 0x{:08X}", ProcessorName(processor), entry_point);

    next_access_type = AccessType::N;
    FillArmBuffer();
}

void CPU::Step() {
    if (sys->interrupts[ProcessorIndex(processor)]->Pending() && !regs.cpsr.irq_disable) EnterInterrupt();

    if (InThumbMode()) {
        ExecuteThumb();
    } else {
        ExecuteArm();
    }
}

void CPU::ExecuteArm() {
    const u32 instr = instr_buffer[0];
    if (trace_instructions) TraceState(instr);

    instr_buffer[0] = instr_buffer[1];
    regs.r[PC] += 4;

    if (ShouldExecute(instr >> 28)) {
        (this->*arm_table[ArmDecodeKey(instr)].handler)(instr);
    } else {
        InstructionPrefetch(AccessType::S);
    }
}

void CPU::ExecuteThumb() {
    const u16 instr = static_cast<u16>(instr_buffer[0]);
    if (trace_instructions) TraceState(instr);

    instr_buffer[0] = instr_buffer[1];
    regs.r[PC] += 2;

    (this->*thumb_table[ThumbDecodeKey(instr)].handler)(instr);
}

void CPU::EnterInterrupt() {
    // IRQ handlers return with SUBS PC, LR, #4
    const u32 return_address = InThumbMode() ? regs.r[PC] + 2 : regs.r[PC];
    LogTrace("{} IRQ entry, return address 0x{:08X}", ProcessorName(processor), return_address);

    regs.ChangeMode(Mode::IRQ);
    regs.r[LR] = return_address;
    regs.cpsr.irq_disable = true;
    regs.cpsr.thumb = false;
    regs.r[PC] = VECTOR_IRQ;

    next_access_type = AccessType::N;
    FillArmBuffer();
}

void CPU::EnterSoftwareInterrupt(u32 return_address) {
    InstructionPrefetch(AccessType::N);

    regs.ChangeMode(Mode::SVC);
    regs.r[LR] = return_address;
    regs.cpsr.irq_disable = true;
    regs.cpsr.thumb = false;
    regs.r[PC] = VECTOR_SWI;

    FillArmBuffer();
}

void CPU::TraceState(u32 instr) const {
    LogTrace("{} {:08X} cpsr: {:08X} | {:0{}X}", ProcessorName(processor), fmt::join(regs.r, " "), regs.cpsr.value,
             instr, InThumbMode() ? 4 : 8);
}

BUS& CPU::Bus() {
    return *sys->buses[ProcessorIndex(processor)];
}

template<typename ValueType>
ValueType CPU::Read(AccessType type, u32 address) {
    sys->scheduler.AddCycles(Bus().AccessCycles(type, address, sizeof(ValueType)));
    return Bus().Load<ValueType>(address);
}

template<typename ValueType>
void CPU::Write(AccessType type, u32 address, ValueType value) {
    sys->scheduler.AddCycles(Bus().AccessCycles(type, address, sizeof(ValueType)));
    Bus().Store<ValueType>(address, value);
}

template u8 CPU::Read<u8>(AccessType type, u32 address);
template u16 CPU::Read<u16>(AccessType type, u32 address);
template u32 CPU::Read<u32>(AccessType type, u32 address);
template void CPU::Write<u8>(AccessType type, u32 address, u8 value);
template void CPU::Write<u16>(AccessType type, u32 address, u16 value);
template void CPU::Write<u32>(AccessType type, u32 address, u32 value);

void CPU::Internal(u32 cycles) {
    sys->scheduler.AddCycles(cycles);
}

void CPU::FillArmBuffer() {
    regs.r[PC] &= ~0x3;
    instr_buffer[0] = Read<u32>(AccessType::N, regs.r[PC]);
    regs.r[PC] += 4;
    instr_buffer[1] = Read<u32>(AccessType::S, regs.r[PC]);
    next_access_type = AccessType::S;
}

void CPU::FillThumbBuffer() {
    regs.r[PC] &= ~0x1;
    instr_buffer[0] = Read<u16>(AccessType::N, regs.r[PC]);
    regs.r[PC] += 2;
    instr_buffer[1] = Read<u16>(AccessType::S, regs.r[PC]);
    next_access_type = AccessType::S;
}

void CPU::FillBuffer() {
    if (InThumbMode()) {
        FillThumbBuffer();
    } else {
        FillArmBuffer();
    }
}

// fetches the instruction after the next one, type is the timing class of the fetch that follows
void CPU::InstructionPrefetch(AccessType type) {
    if (InThumbMode()) {
        instr_buffer[1] = Read<u16>(next_access_type, regs.r[PC]);
    } else {
        instr_buffer[1] = Read<u32>(next_access_type, regs.r[PC]);
    }

    next_access_type = type;
}

bool CPU::ShouldExecute(u32 condition) const {
    const bool n = regs.cpsr.N;
    const bool z = regs.cpsr.Z;
    const bool c = regs.cpsr.C;
    const bool v = regs.cpsr.V;

    switch (static_cast<Condition>(condition & 0xF)) {
        case Condition::EQ: return z;
        case Condition::NE: return !z;
        case Condition::CS: return c;
        case Condition::CC: return !c;
        case Condition::MI: return n;
        case Condition::PL: return !n;
        case Condition::VS: return v;
        case Condition::VC: return !v;
        case Condition::HI: return c && !z;
        case Condition::LS: return !c || z;
        case Condition::GE: return n == v;
        case Condition::LT: return n != v;
        case Condition::GT: return !z && n == v;
        case Condition::LE: return z || n != v;
        case Condition::AL: return true;
        case Condition::NV: return false;
    }

    Panic("Invalid condition 0x{:X}", condition);
}

u32 CPU::Shift(ShiftType type, u32 operand, u32 amount, bool immediate, bool change_status) {
    if (!immediate) {
        Internal();
        // only the low byte of the register counts, a zero shift leaves operand and carry untouched
        if (amount == 0) return operand;
    }

    bool carry = regs.cpsr.C;
    u32 result = 0;

    switch (type) {
        case ShiftType::LSL:
            if (amount == 0) {
                result = operand;
            } else if (amount < 32) {
                carry = Bit(operand, 32 - amount);
                result = operand << amount;
            } else {
                carry = amount == 32 && Bit(operand, 0);
                result = 0;
            }
            break;
        case ShiftType::LSR:
            // LSR #0 encodes LSR #32
            if (amount == 0) amount = 32;

            if (amount < 32) {
                carry = Bit(operand, amount - 1);
                result = operand >> amount;
            } else {
                carry = amount == 32 && Bit(operand, 31);
                result = 0;
            }
            break;
        case ShiftType::ASR:
            // ASR #0 encodes ASR #32
            if (amount == 0) amount = 32;

            if (amount < 32) {
                carry = Bit(operand, amount - 1);
                result = static_cast<u32>(static_cast<s32>(operand) >> amount);
            } else {
                carry = Bit(operand, 31);
                result = carry ? 0xFFFFFFFF : 0;
            }
            break;
        case ShiftType::ROR:
            if (amount == 0) {
                // ROR #0 encodes RRX
                carry = Bit(operand, 0);
                result = (static_cast<u32>(regs.cpsr.C) << 31) | (operand >> 1);
            } else {
                result = RotateRight(operand, amount);
                carry = Bit(result, 31);
            }
            break;
    }

    if (change_status) regs.cpsr.C = carry;
    return result;
}

u32 CPU::Add(u32 op1, u32 op2, bool change_status) {
    const u32 result = op1 + op2;

    if (change_status) {
        regs.cpsr.C = result < op1;
        regs.cpsr.V = Bit(~(op1 ^ op2) & (op1 ^ result), 31);
    }

    return result;
}

u32 CPU::Sub(u32 op1, u32 op2, bool change_status) {
    const u32 result = op1 - op2;

    if (change_status) {
        regs.cpsr.C = op1 >= op2;
        regs.cpsr.V = Bit((op1 ^ op2) & (op1 ^ result), 31);
    }

    return result;
}

u32 CPU::Adc(u32 op1, u32 op2, bool change_status) {
    const u64 carry_in = regs.cpsr.C ? 1 : 0;
    const u64 wide_result = static_cast<u64>(op1) + op2 + carry_in;
    const u32 result = static_cast<u32>(wide_result);

    if (change_status) {
        regs.cpsr.C = (wide_result >> 32) != 0;
        regs.cpsr.V = Bit(~(op1 ^ op2) & (op1 ^ result), 31);
    }

    return result;
}

u32 CPU::Sbc(u32 op1, u32 op2, bool change_status) {
    const u64 borrow = regs.cpsr.C ? 0 : 1;
    const u32 result = static_cast<u32>(static_cast<u64>(op1) - op2 - borrow);

    if (change_status) {
        regs.cpsr.C = static_cast<u64>(op1) >= static_cast<u64>(op2) + borrow;
        regs.cpsr.V = Bit((op1 ^ op2) & (op1 ^ result), 31);
    }

    return result;
}

void CPU::SetNZ(u32 result) {
    regs.cpsr.N = Bit(result, 31);
    regs.cpsr.Z = result == 0;
}

// multiplier early termination: one internal cycle per significant byte of the operand
void CPU::IncMulClocks(u32 operand, bool is_signed) {
    u32 mask = 0xFFFFFF00;

    while (true) {
        Internal();

        const u32 masked = operand & mask;
        if (masked == 0 || (is_signed && masked == mask)) break;

        mask <<= 8;
        if (mask == 0) break;
    }
}

}    // namespace CPU

#pragma once

#include <array>

#include "util/bitfield.h"
#include "util/types.h"

namespace CPU {

enum class Mode : u32 {
    USR = 0x10,
    FIQ = 0x11,
    IRQ = 0x12,
    SVC = 0x13,
    ABT = 0x17,
    UND = 0x1B,
    SYS = 0x1F,
};

enum class ShiftType : u32 {
    LSL = 0,
    LSR = 1,
    ASR = 2,
    ROR = 3,
};

enum class Condition : u32 {
    EQ = 0x0,
    NE = 0x1,
    CS = 0x2,
    CC = 0x3,
    MI = 0x4,
    PL = 0x5,
    VS = 0x6,
    VC = 0x7,
    HI = 0x8,
    LS = 0x9,
    GE = 0xA,
    LT = 0xB,
    GT = 0xC,
    LE = 0xD,
    AL = 0xE,
    NV = 0xF,
};

constexpr u32 SP = 13;
constexpr u32 LR = 14;
constexpr u32 PC = 15;

constexpr u32 GP_REG_COUNT = 16;

// exception vectors
constexpr u32 VECTOR_RESET = 0x00;
constexpr u32 VECTOR_UNDEFINED = 0x04;
constexpr u32 VECTOR_SWI = 0x08;
constexpr u32 VECTOR_IRQ = 0x18;

union PSR {
    u32 value = 0;

    BitField<u32, Mode, 0, 5> mode;
    BitField<u32, bool, 5, 1> thumb;
    BitField<u32, bool, 6, 1> fiq_disable;
    BitField<u32, bool, 7, 1> irq_disable;
    BitField<u32, bool, 28, 1> V;
    BitField<u32, bool, 29, 1> C;
    BitField<u32, bool, 30, 1> Z;
    BitField<u32, bool, 31, 1> N;
};

// registers.cpp
//
// R0-R15 hold the registers visible in the current mode. Switching modes swaps the banked registers
// of the old mode out and the ones of the new mode in.
class Registers {
public:
    void Reset();

    u32 Get(u32 index) const { return r[index]; }
    void Set(u32 index, u32 value) { r[index] = value; }

    Mode GetMode() const { return cpsr.mode; }
    // swaps register banks without touching the saved status
    void SetMode(Mode mode);
    // exception entry: the new mode's SPSR receives the current CPSR
    void ChangeMode(Mode mode);
    void RestoreCPSR();

    u32 GetCPSR() const { return cpsr.value; }
    void SetCPSR(u32 value);

    // modes without a SPSR read the CPSR and ignore writes
    bool HasSPSR() const;
    u32 GetSPSR() const;
    void SetSPSR(u32 value);

    static bool IsValidMode(u32 mode);
    static const char* GetModeName(Mode mode);

    std::array<u32, GP_REG_COUNT> r = {};
    PSR cpsr;

private:
    enum Bank : u32 {
        BANK_USR = 0,
        BANK_FIQ = 1,
        BANK_SVC = 2,
        BANK_ABT = 3,
        BANK_IRQ = 4,
        BANK_UND = 5,
        BANK_COUNT = 6,
    };

    static Bank GetBank(Mode mode);

    // [0] shared by every mode except FIQ, [1] FIQ
    std::array<std::array<u32, 5>, 2> banked_r8_r12 = {};
    std::array<std::array<u32, 2>, BANK_COUNT> banked_r13_r14 = {};
    // BANK_USR has no SPSR, its slot stays unused
    std::array<u32, BANK_COUNT> spsr = {};
};

}    // namespace CPU

#include "common/asserts.h"
#include "common/log.h"
#include "cpu_common.h"

LOG_CHANNEL(CPU);

namespace CPU {

void Registers::Reset() {
    r.fill(0);
    for (auto& bank : banked_r8_r12) bank.fill(0);
    for (auto& bank : banked_r13_r14) bank.fill(0);
    spsr.fill(0);

    cpsr.value = 0;
    cpsr.mode = Mode::SVC;
    cpsr.irq_disable = true;
    cpsr.fiq_disable = true;
}

bool Registers::IsValidMode(u32 mode) {
    switch (static_cast<Mode>(mode)) {
        case Mode::USR:
        case Mode::FIQ:
        case Mode::IRQ:
        case Mode::SVC:
        case Mode::ABT:
        case Mode::UND:
        case Mode::SYS: return true;
    }

    return false;
}

const char* Registers::GetModeName(Mode mode) {
    switch (mode) {
        case Mode::USR: return "USR";
        case Mode::FIQ: return "FIQ";
        case Mode::IRQ: return "IRQ";
        case Mode::SVC: return "SVC";
        case Mode::ABT: return "ABT";
        case Mode::UND: return "UND";
        case Mode::SYS: return "SYS";
    }

    return "INVALID";
}

Registers::Bank Registers::GetBank(Mode mode) {
    switch (mode) {
        case Mode::USR:
        case Mode::SYS: return BANK_USR;
        case Mode::FIQ: return BANK_FIQ;
        case Mode::SVC: return BANK_SVC;
        case Mode::ABT: return BANK_ABT;
        case Mode::IRQ: return BANK_IRQ;
        case Mode::UND: return BANK_UND;
    }

    Panic("Invalid processor mode 0x{:02X}", static_cast<u32>(mode));
}

void Registers::SetMode(Mode mode) {
    const Mode old_mode = cpsr.mode;
    if (old_mode == mode) return;

    const Bank old_bank = GetBank(old_mode);
    const Bank new_bank = GetBank(mode);

    if (old_bank != new_bank) {
        const u32 old_fiq = old_bank == BANK_FIQ ? 1 : 0;
        const u32 new_fiq = new_bank == BANK_FIQ ? 1 : 0;

        if (old_fiq != new_fiq) {
            for (u32 i = 0; i < 5; i++) {
                banked_r8_r12[old_fiq][i] = r[8 + i];
                r[8 + i] = banked_r8_r12[new_fiq][i];
            }
        }

        banked_r13_r14[old_bank][0] = r[SP];
        banked_r13_r14[old_bank][1] = r[LR];
        r[SP] = banked_r13_r14[new_bank][0];
        r[LR] = banked_r13_r14[new_bank][1];
    }

    cpsr.mode = mode;
}

void Registers::ChangeMode(Mode mode) {
    const u32 old_cpsr = cpsr.value;
    SetMode(mode);

    AssertMsg(HasSPSR(), "mode {} has no SPSR", GetModeName(mode));
    spsr[GetBank(mode)] = old_cpsr;
}

void Registers::RestoreCPSR() {
    SetCPSR(GetSPSR());
}

void Registers::SetCPSR(u32 value) {
    const u32 mode = value & 0x1F;
    AssertMsg(IsValidMode(mode), "invalid mode 0x{:02X} written to CPSR", mode);

    SetMode(static_cast<Mode>(mode));
    cpsr.value = value;
}

bool Registers::HasSPSR() const {
    return GetBank(cpsr.mode) != BANK_USR;
}

u32 Registers::GetSPSR() const {
    if (!HasSPSR()) return cpsr.value;

    return spsr[GetBank(cpsr.mode)];
}

void Registers::SetSPSR(u32 value) {
    if (!HasSPSR()) {
        LogWarn("Write to SPSR in mode {} without SPSR [0x{:08X}] - Ignored", GetModeName(cpsr.mode), value);
        return;
    }

    spsr[GetBank(cpsr.mode)] = value;
}

}    // namespace CPU

#pragma once

#include <array>

#include "util/types.h"

namespace CPU {

enum class ArmInstruction : u32 {
    BranchExchange,
    Multiply,
    MultiplyLong,
    SingleDataSwap,
    HalfwordTransfer,
    PSRTransfer,
    DataProcessing,
    SingleDataTransfer,
    BlockDataTransfer,
    Branch,
    SoftwareInterrupt,
    Coprocessor,
    Undefined,
};

enum class ThumbInstruction : u32 {
    AddSubtract,
    MoveShiftedRegister,
    Immediate,
    ALU,
    HighRegisterBX,
    PCRelativeLoad,
    LoadStoreRegisterOffset,
    LoadStoreSignExtended,
    LoadStoreImmediateOffset,
    LoadStoreHalfword,
    SPRelativeLoadStore,
    LoadAddress,
    AddOffsetToSP,
    PushPop,
    MultipleLoadStore,
    SoftwareInterrupt,
    ConditionalBranch,
    UnconditionalBranch,
    LongBranchWithLink,
    Undefined,
};

template<typename InstructionType>
struct DecodeRule {
    u32 mask;
    u32 pattern;
    InstructionType type;
};

constexpr u32 ARM_TABLE_SIZE = 4096;
constexpr u32 THUMB_TABLE_SIZE = 1024;

// bits 27..20 and 7..4 of the instruction word
ALWAYS_INLINE constexpr u32 ArmDecodeKey(u32 instr) {
    return ((instr >> 16) & 0xFF0) | ((instr >> 4) & 0xF);
}

// instruction word with only the bits of the decode key set
ALWAYS_INLINE constexpr u32 ArmSkeleton(u32 key) {
    return ((key & 0xFF0) << 16) | ((key & 0xF) << 4);
}

// bits 15..6 of the instruction
ALWAYS_INLINE constexpr u32 ThumbDecodeKey(u16 instr) {
    return instr >> 6;
}

ALWAYS_INLINE constexpr u16 ThumbSkeleton(u32 key) {
    return static_cast<u16>(key << 6);
}

// Classes sharing prefix bits overlap, the first matching rule wins
constexpr std::array ARM_DECODE_RULES = {
    DecodeRule<ArmInstruction> {0x0FF000F0, 0x01200010, ArmInstruction::BranchExchange},
    DecodeRule<ArmInstruction> {0x0FC000F0, 0x00000090, ArmInstruction::Multiply},
    DecodeRule<ArmInstruction> {0x0F8000F0, 0x00800090, ArmInstruction::MultiplyLong},
    DecodeRule<ArmInstruction> {0x0F8000F0, 0x01000090, ArmInstruction::SingleDataSwap},
    DecodeRule<ArmInstruction> {0x0E000090, 0x00000090, ArmInstruction::HalfwordTransfer},
    DecodeRule<ArmInstruction> {0x0D900000, 0x01000000, ArmInstruction::PSRTransfer},
    DecodeRule<ArmInstruction> {0x0C000000, 0x00000000, ArmInstruction::DataProcessing},
    DecodeRule<ArmInstruction> {0x0E000000, 0x04000000, ArmInstruction::SingleDataTransfer},
    // register offset form, bit 4 set is the undefined instruction space
    DecodeRule<ArmInstruction> {0x0E000010, 0x06000000, ArmInstruction::SingleDataTransfer},
    DecodeRule<ArmInstruction> {0x0E000000, 0x08000000, ArmInstruction::BlockDataTransfer},
    DecodeRule<ArmInstruction> {0x0E000000, 0x0A000000, ArmInstruction::Branch},
    DecodeRule<ArmInstruction> {0x0F000000, 0x0F000000, ArmInstruction::SoftwareInterrupt},
    DecodeRule<ArmInstruction> {0x0E000000, 0x0C000000, ArmInstruction::Coprocessor},
    DecodeRule<ArmInstruction> {0x0F000000, 0x0E000000, ArmInstruction::Coprocessor},
};

// the only encodings allowed to fall through every rule
constexpr u32 ARM_UNDEFINED_MASK = 0x0E000010;
constexpr u32 ARM_UNDEFINED_PATTERN = 0x06000010;

constexpr std::array THUMB_DECODE_RULES = {
    DecodeRule<ThumbInstruction> {0xF800, 0x1800, ThumbInstruction::AddSubtract},
    DecodeRule<ThumbInstruction> {0xE000, 0x0000, ThumbInstruction::MoveShiftedRegister},
    DecodeRule<ThumbInstruction> {0xE000, 0x2000, ThumbInstruction::Immediate},
    DecodeRule<ThumbInstruction> {0xFC00, 0x4000, ThumbInstruction::ALU},
    DecodeRule<ThumbInstruction> {0xFC00, 0x4400, ThumbInstruction::HighRegisterBX},
    DecodeRule<ThumbInstruction> {0xF800, 0x4800, ThumbInstruction::PCRelativeLoad},
    DecodeRule<ThumbInstruction> {0xF200, 0x5000, ThumbInstruction::LoadStoreRegisterOffset},
    DecodeRule<ThumbInstruction> {0xF200, 0x5200, ThumbInstruction::LoadStoreSignExtended},
    DecodeRule<ThumbInstruction> {0xE000, 0x6000, ThumbInstruction::LoadStoreImmediateOffset},
    DecodeRule<ThumbInstruction> {0xF000, 0x8000, ThumbInstruction::LoadStoreHalfword},
    DecodeRule<ThumbInstruction> {0xF000, 0x9000, ThumbInstruction::SPRelativeLoadStore},
    DecodeRule<ThumbInstruction> {0xF000, 0xA000, ThumbInstruction::LoadAddress},
    DecodeRule<ThumbInstruction> {0xFF00, 0xB000, ThumbInstruction::AddOffsetToSP},
    DecodeRule<ThumbInstruction> {0xF600, 0xB400, ThumbInstruction::PushPop},
    DecodeRule<ThumbInstruction> {0xF000, 0xC000, ThumbInstruction::MultipleLoadStore},
    DecodeRule<ThumbInstruction> {0xFF00, 0xDF00, ThumbInstruction::SoftwareInterrupt},
    DecodeRule<ThumbInstruction> {0xFF00, 0xDE00, ThumbInstruction::Undefined},
    DecodeRule<ThumbInstruction> {0xF000, 0xD000, ThumbInstruction::ConditionalBranch},
    DecodeRule<ThumbInstruction> {0xF800, 0xE000, ThumbInstruction::UnconditionalBranch},
    DecodeRule<ThumbInstruction> {0xF000, 0xF000, ThumbInstruction::LongBranchWithLink},
};

template<typename InstructionType, std::size_t RuleCount>
constexpr InstructionType Decode(const std::array<DecodeRule<InstructionType>, RuleCount>& rules, u32 instr,
                                 InstructionType fallback) {
    for (const auto& rule : rules) {
        if ((instr & rule.mask) == rule.pattern) return rule.type;
    }

    return fallback;
}

// only the decode key bits of instr are looked at
constexpr ArmInstruction DecodeArm(u32 instr) {
    return Decode(ARM_DECODE_RULES, ArmSkeleton(ArmDecodeKey(instr)), ArmInstruction::Undefined);
}

constexpr ThumbInstruction DecodeThumb(u16 instr) {
    return Decode(THUMB_DECODE_RULES, ThumbSkeleton(ThumbDecodeKey(instr)), ThumbInstruction::Undefined);
}

const char* GetInstructionName(ArmInstruction type);
const char* GetInstructionName(ThumbInstruction type);

}    // namespace CPU

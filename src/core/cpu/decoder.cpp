#include "decoder.h"

namespace CPU {

const char* GetInstructionName(ArmInstruction type) {
    switch (type) {
        case ArmInstruction::BranchExchange: return "Branch and Exchange";
        case ArmInstruction::Multiply: return "Multiply";
        case ArmInstruction::MultiplyLong: return "Multiply Long";
        case ArmInstruction::SingleDataSwap: return "Single Data Swap";
        case ArmInstruction::HalfwordTransfer: return "Halfword and Signed Data Transfer";
        case ArmInstruction::PSRTransfer: return "PSR Transfer";
        case ArmInstruction::DataProcessing: return "Data Processing";
        case ArmInstruction::SingleDataTransfer: return "Single Data Transfer";
        case ArmInstruction::BlockDataTransfer: return "Block Data Transfer";
        case ArmInstruction::Branch: return "Branch";
        case ArmInstruction::SoftwareInterrupt: return "Software Interrupt";
        case ArmInstruction::Coprocessor: return "Coprocessor";
        case ArmInstruction::Undefined: return "Undefined";
    }

    return "Invalid";
}

const char* GetInstructionName(ThumbInstruction type) {
    switch (type) {
        case ThumbInstruction::AddSubtract: return "Add/Subtract";
        case ThumbInstruction::MoveShiftedRegister: return "Move Shifted Register";
        case ThumbInstruction::Immediate: return "Move/Compare/Add/Subtract Immediate";
        case ThumbInstruction::ALU: return "ALU Operation";
        case ThumbInstruction::HighRegisterBX: return "Hi Register Operation/Branch Exchange";
        case ThumbInstruction::PCRelativeLoad: return "PC-relative Load";
        case ThumbInstruction::LoadStoreRegisterOffset: return "Load/Store with Register Offset";
        case ThumbInstruction::LoadStoreSignExtended: return "Load/Store Sign-extended Byte/Halfword";
        case ThumbInstruction::LoadStoreImmediateOffset: return "Load/Store with Immediate Offset";
        case ThumbInstruction::LoadStoreHalfword: return "Load/Store Halfword";
        case ThumbInstruction::SPRelativeLoadStore: return "SP-relative Load/Store";
        case ThumbInstruction::LoadAddress: return "Load Address";
        case ThumbInstruction::AddOffsetToSP: return "Add Offset to Stack Pointer";
        case ThumbInstruction::PushPop: return "Push/Pop Registers";
        case ThumbInstruction::MultipleLoadStore: return "Multiple Load/Store";
        case ThumbInstruction::SoftwareInterrupt: return "Software Interrupt";
        case ThumbInstruction::ConditionalBranch: return "Conditional Branch";
        case ThumbInstruction::UnconditionalBranch: return "Unconditional Branch";
        case ThumbInstruction::LongBranchWithLink: return "Long Branch with Link";
        case ThumbInstruction::Undefined: return "Undefined";
    }

    return "Invalid";
}

}    // namespace CPU

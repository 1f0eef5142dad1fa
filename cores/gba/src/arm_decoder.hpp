#pragma once

#include "types.hpp"
#include <cstdint>
#include <variant>

namespace gba {

// B / BL
struct ArmBranch {
    bool link;
    int32_t offset;         // Byte offset, relative to instruction address + 8
};

// AND, EOR, SUB, RSB, ADD, ..., MVN
struct ArmDataProcessing {
    uint8_t opcode;
    bool set_flags;
    bool immediate;
    uint8_t rn;
    uint8_t rd;
    uint32_t operand2;      // Raw bits 0-11 (rotated immediate or shifted register)
};

// LDR / STR / LDRB / STRB
struct ArmLoadStore {
    bool register_offset;
    bool pre;
    bool up;
    bool byte;
    bool writeback;
    bool load;
    uint8_t rn;
    uint8_t rd;
    uint32_t offset;        // Raw bits 0-11 (immediate or shifted register)
};

enum class HalfwordKind : uint8_t {
    UnsignedHalf = 1,       // LDRH / STRH
    SignedByte   = 2,       // LDRSB
    SignedHalf   = 3        // LDRSH
};

// LDRH / STRH / LDRSB / LDRSH
struct ArmLoadStoreHalfword {
    bool immediate;
    bool pre;
    bool up;
    bool writeback;
    bool load;
    HalfwordKind kind;
    uint8_t rn;
    uint8_t rd;
    uint32_t offset;        // 8-bit immediate, or Rm when !immediate
};

// LDM / STM
struct ArmBlockDataTransfer {
    bool pre;
    bool up;
    bool psr;
    bool writeback;
    bool load;
    uint8_t rn;
    uint16_t register_list;
};

// SWI
struct ArmSoftwareInterrupt {
    uint32_t comment;       // 24-bit comment field

    uint8_t function() const { return (comment >> 16) & 0xFF; }
};

// Everything outside the supported subset (multiply, swap, PSR transfer,
// BX, coprocessor, undefined space)
struct ArmUnsupported {
    uint32_t instruction;
};

using ArmInstruction = std::variant<
    ArmBranch,
    ArmDataProcessing,
    ArmLoadStore,
    ArmLoadStoreHalfword,
    ArmBlockDataTransfer,
    ArmSoftwareInterrupt,
    ArmUnsupported>;

inline Condition arm_condition(uint32_t instruction) {
    return static_cast<Condition>((instruction >> 28) & 0xF);
}

// Classify a 32-bit ARM instruction word
ArmInstruction decode_arm(uint32_t instruction);

} // namespace gba

#include "arm_decoder.hpp"

namespace gba {

static ArmInstruction decode_data_processing(uint32_t instruction) {
    ArmDataProcessing dp;
    dp.opcode = (instruction >> 21) & 0xF;
    dp.set_flags = (instruction >> 20) & 1;
    dp.immediate = (instruction >> 25) & 1;
    dp.rn = (instruction >> 16) & 0xF;
    dp.rd = (instruction >> 12) & 0xF;
    dp.operand2 = instruction & 0xFFF;
    return dp;
}

static ArmInstruction decode_halfword(uint32_t instruction) {
    ArmLoadStoreHalfword hw;
    hw.pre = (instruction >> 24) & 1;
    hw.up = (instruction >> 23) & 1;
    hw.immediate = (instruction >> 22) & 1;
    hw.writeback = (instruction >> 21) & 1;
    hw.load = (instruction >> 20) & 1;
    hw.rn = (instruction >> 16) & 0xF;
    hw.rd = (instruction >> 12) & 0xF;
    hw.kind = static_cast<HalfwordKind>((instruction >> 5) & 3);

    if (hw.immediate) {
        hw.offset = ((instruction >> 4) & 0xF0) | (instruction & 0xF);
    } else {
        hw.offset = instruction & 0xF;
    }

    // Signed forms only exist as loads
    if (!hw.load && hw.kind != HalfwordKind::UnsignedHalf) {
        return ArmUnsupported{instruction};
    }
    return hw;
}

ArmInstruction decode_arm(uint32_t instruction) {
    // Decode based on bits [27:25] and [7:4]
    uint32_t op = (instruction >> 25) & 0x7;
    uint32_t op2 = (instruction >> 4) & 0xF;

    switch (op) {
        case 0b000:
            if ((instruction & 0x0FFFFFF0) == 0x012FFF10) {
                return ArmUnsupported{instruction};     // BX
            }
            if ((op2 & 0x9) == 0x9) {
                // SH == 00 is multiply / multiply long / swap
                if (((instruction >> 5) & 3) == 0) {
                    return ArmUnsupported{instruction};
                }
                return decode_halfword(instruction);
            }
            if ((instruction & 0x0FBF0FFF) == 0x010F0000 ||
                (instruction & 0x0DB0F000) == 0x0120F000) {
                return ArmUnsupported{instruction};     // MRS / MSR
            }
            return decode_data_processing(instruction);

        case 0b001:
            if ((instruction & 0x0DB0F000) == 0x0120F000) {
                return ArmUnsupported{instruction};     // MSR immediate
            }
            return decode_data_processing(instruction);

        case 0b010:
        case 0b011: {
            if (op == 0b011 && (instruction & 0x10)) {
                return ArmUnsupported{instruction};     // Undefined space
            }
            ArmLoadStore ls;
            ls.register_offset = (instruction >> 25) & 1;
            ls.pre = (instruction >> 24) & 1;
            ls.up = (instruction >> 23) & 1;
            ls.byte = (instruction >> 22) & 1;
            ls.writeback = (instruction >> 21) & 1;
            ls.load = (instruction >> 20) & 1;
            ls.rn = (instruction >> 16) & 0xF;
            ls.rd = (instruction >> 12) & 0xF;
            ls.offset = instruction & 0xFFF;
            return ls;
        }

        case 0b100: {
            ArmBlockDataTransfer block;
            block.pre = (instruction >> 24) & 1;
            block.up = (instruction >> 23) & 1;
            block.psr = (instruction >> 22) & 1;
            block.writeback = (instruction >> 21) & 1;
            block.load = (instruction >> 20) & 1;
            block.rn = (instruction >> 16) & 0xF;
            block.register_list = instruction & 0xFFFF;
            return block;
        }

        case 0b101:
            return ArmBranch{
                ((instruction >> 24) & 1) != 0,
                sign_extend_24(instruction & 0x00FFFFFF) * 4
            };

        case 0b110:
            // Coprocessor data transfer - not used on GBA
            return ArmUnsupported{instruction};

        case 0b111:
            if (instruction & (1 << 24)) {
                return ArmSoftwareInterrupt{instruction & 0x00FFFFFF};
            }
            // Coprocessor operations - not used on GBA
            return ArmUnsupported{instruction};
    }

    return ArmUnsupported{instruction};
}

} // namespace gba

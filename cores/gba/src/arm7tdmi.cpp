#include "arm7tdmi.hpp"
#include "bus.hpp"
#include "debug.hpp"
#include <utility>
#include <variant>

namespace gba {

ARM7TDMI::ARM7TDMI(Bus& bus) : m_bus(bus) {
    reset();
}

ARM7TDMI::~ARM7TDMI() = default;

void ARM7TDMI::reset(bool boot_from_bios) {
    m_regs.fill(0);

    if (boot_from_bios) {
        // Hardware reset: Supervisor mode, IRQ and FIQ disabled, reset vector
        m_cpsr = FLAG_I | FLAG_F | static_cast<uint32_t>(ProcessorMode::Supervisor);
        jump_to(0x00000000);
    } else {
        // State the BIOS leaves behind: System mode, user stack, cartridge entry
        m_cpsr = static_cast<uint32_t>(ProcessorMode::System);
        m_regs[13] = 0x03007F00;
        jump_to(0x08000000);
    }
    m_branch_taken = false;

    SGBA_DEBUG_PRINT("CPU Reset: PC=0x%08X, CPSR=0x%08X (%s)\n",
                     get_execute_address(), m_cpsr, boot_from_bios ? "BIOS" : "direct boot");
}

void ARM7TDMI::jump_to(uint32_t address) {
    m_regs[15] = (address & ~3u) + 8;
}

uint32_t ARM7TDMI::get_register(int reg) const {
    return m_regs[reg & 0xF];
}

void ARM7TDMI::set_register(int reg, uint32_t value) {
    m_regs[reg & 0xF] = value;
}

int ARM7TDMI::step() {
    uint32_t address = m_regs[15] - 8;
    uint32_t instruction = m_bus.read32(address);

    m_branch_taken = false;
    int cycles = 1;  // 1 cycle for a skipped instruction

    if (check_condition(arm_condition(instruction))) {
        ArmInstruction decoded = decode_arm(instruction);
        cycles = std::visit([this, address](const auto& instr) {
            return execute(instr, address);
        }, decoded);
    }

    if (!m_branch_taken) {
        m_regs[15] += 4;
    }
    return cycles;
}

bool ARM7TDMI::check_condition(Condition cond) const {
    bool n = (m_cpsr & FLAG_N) != 0;
    bool z = (m_cpsr & FLAG_Z) != 0;
    bool c = (m_cpsr & FLAG_C) != 0;
    bool v = (m_cpsr & FLAG_V) != 0;

    switch (cond) {
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
        case Condition::GT: return !z && (n == v);
        case Condition::LE: return z || (n != v);
        case Condition::AL: return true;
        case Condition::NV: return false;
    }
    return false;
}

void ARM7TDMI::branch_to(uint32_t target) {
    jump_to(target);
    m_branch_taken = true;
}

uint32_t ARM7TDMI::arm_shift(uint32_t value, int shift_type, int amount, bool reg_shift) const {
    if (amount == 0 && !reg_shift) {
        // Special cases for immediate shift amount of 0
        switch (shift_type) {
            case 0:  // LSL #0 - no shift
                return value;
            case 1:  // LSR #0 means LSR #32
                return 0;
            case 2:  // ASR #0 means ASR #32
                return (value & 0x80000000) ? 0xFFFFFFFF : 0;
            case 3:  // ROR #0 means RRX
                return ((m_cpsr & FLAG_C) ? (1u << 31) : 0) | (value >> 1);
        }
    }

    if (amount == 0) {
        return value;
    }

    switch (shift_type) {
        case 0:  // LSL
            return (amount >= 32) ? 0 : value << amount;
        case 1:  // LSR
            return (amount >= 32) ? 0 : value >> amount;
        case 2:  // ASR
            if (amount >= 32) {
                return (value & 0x80000000) ? 0xFFFFFFFF : 0;
            }
            return static_cast<uint32_t>(static_cast<int32_t>(value) >> amount);
        case 3:  // ROR
            return ror(value, amount);
    }

    return value;
}

uint32_t ARM7TDMI::shift_operand(uint32_t operand2, bool allow_register_shift) {
    uint32_t rm = operand2 & 0xF;
    int shift_type = (operand2 >> 5) & 3;
    uint32_t value = m_regs[rm];

    if (allow_register_shift && (operand2 & 0x10)) {
        // Shift by register; PC reads one word further ahead
        uint32_t rs = (operand2 >> 8) & 0xF;
        if (rm == 15) value += 4;
        return arm_shift(value, shift_type, m_regs[rs] & 0xFF, true);
    }

    return arm_shift(value, shift_type, (operand2 >> 7) & 0x1F, false);
}

int ARM7TDMI::execute(const ArmBranch& instr, uint32_t address) {
    if (instr.link) {
        // Return address is the instruction after the branch
        m_regs[14] = address + 4;
    }

    branch_to(address + 8 + instr.offset);
    return 3;  // Branch takes 3 cycles
}

int ARM7TDMI::execute(const ArmDataProcessing& instr, uint32_t address) {
    uint32_t op2;
    bool reg_shift = false;

    if (instr.immediate) {
        // 8-bit immediate rotated right by twice the 4-bit rotate field
        op2 = ror(instr.operand2 & 0xFF, ((instr.operand2 >> 8) & 0xF) * 2);
    } else {
        reg_shift = (instr.operand2 & 0x10) != 0;
        op2 = shift_operand(instr.operand2, true);
    }

    uint32_t op1 = m_regs[instr.rn];
    if (instr.rn == 15 && reg_shift) {
        op1 += 4;
    }

    uint32_t result = 0;
    bool write_result = true;
    bool compare = false;

    switch (instr.opcode) {
        case 0x0:  // AND
            result = op1 & op2;
            break;
        case 0x1:  // EOR
            result = op1 ^ op2;
            break;
        case 0x2:  // SUB
            result = op1 - op2;
            break;
        case 0x3:  // RSB
            result = op2 - op1;
            break;
        case 0x4:  // ADD
            result = op1 + op2;
            break;
        case 0x5:  // ADC
        case 0x6:  // SBC
        case 0x7:  // RSC
            // Carry is not modelled
            SGBA_DEBUG_PRINT("Carry-dependent ALU op %X at 0x%08X ignored\n", instr.opcode, address);
            return 1;
        case 0x8:  // TST
            result = op1 & op2;
            write_result = false;
            break;
        case 0x9:  // TEQ
            result = op1 ^ op2;
            write_result = false;
            break;
        case 0xA:  // CMP
            result = op1 - op2;
            write_result = false;
            compare = true;
            break;
        case 0xB:  // CMN
            result = op1 + op2;
            write_result = false;
            compare = true;
            break;
        case 0xC:  // ORR
            result = op1 | op2;
            break;
        case 0xD:  // MOV
            result = op2;
            break;
        case 0xE:  // BIC
            result = op1 & ~op2;
            break;
        case 0xF:  // MVN
            result = ~op2;
            break;
    }

    if (write_result) {
        if (instr.rd == 15) {
            branch_to(result);
            return 3;
        }
        m_regs[instr.rd] = result;
    }

    if (instr.set_flags || compare) {
        set_nz_flags(result);
    }

    return 1;
}

int ARM7TDMI::execute(const ArmLoadStore& instr, uint32_t address) {
    (void)address;

    uint32_t offset = instr.register_offset ? shift_operand(instr.offset, false) : instr.offset;

    // Base R15 reads as instruction address + 8
    uint32_t base = m_regs[instr.rn];
    uint32_t offset_addr = instr.up ? base + offset : base - offset;
    uint32_t addr = instr.pre ? offset_addr : base;
    bool writeback = (!instr.pre || instr.writeback) && instr.rn != 15;

    if (instr.load) {
        uint32_t value;
        if (instr.byte) {
            value = m_bus.read8(addr);
        } else {
            value = m_bus.read32(addr);
            // Misaligned loads rotate the aligned word
            if (addr & 3) {
                value = ror(value, (addr & 3) * 8);
            }
        }

        // Writeback first so a load into the base register wins
        if (writeback) {
            m_regs[instr.rn] = offset_addr;
        }

        if (instr.rd == 15) {
            branch_to(value);
            return 5;
        }
        m_regs[instr.rd] = value;
        return 3;
    }

    uint32_t value = m_regs[instr.rd];
    if (instr.rd == 15) value += 4;  // STR PC stores instruction address + 12

    if (instr.byte) {
        m_bus.write8(addr, static_cast<uint8_t>(value));
    } else {
        m_bus.write32(addr, value);
    }

    if (writeback) {
        m_regs[instr.rn] = offset_addr;
    }
    return 2;
}

int ARM7TDMI::execute(const ArmLoadStoreHalfword& instr, uint32_t address) {
    (void)address;

    uint32_t offset = instr.immediate ? instr.offset : m_regs[instr.offset & 0xF];

    uint32_t base = m_regs[instr.rn];
    uint32_t offset_addr = instr.up ? base + offset : base - offset;
    uint32_t addr = instr.pre ? offset_addr : base;
    bool writeback = (!instr.pre || instr.writeback) && instr.rn != 15;

    if (instr.load) {
        uint32_t value = 0;
        switch (instr.kind) {
            case HalfwordKind::UnsignedHalf:
                value = m_bus.read16(addr);
                // Misaligned halfword load rotates the value by 8 bits
                if (addr & 1) {
                    value = ror(value, 8);
                }
                break;
            case HalfwordKind::SignedByte:
                value = static_cast<uint32_t>(sign_extend_8(m_bus.read8(addr)));
                break;
            case HalfwordKind::SignedHalf:
                // Misaligned LDRSH reads a byte and sign-extends it
                if (addr & 1) {
                    value = static_cast<uint32_t>(sign_extend_8(m_bus.read8(addr)));
                } else {
                    value = static_cast<uint32_t>(sign_extend_16(m_bus.read16(addr)));
                }
                break;
        }

        if (writeback) {
            m_regs[instr.rn] = offset_addr;
        }

        if (instr.rd == 15) {
            branch_to(value);
            return 5;
        }
        m_regs[instr.rd] = value;
        return 3;
    }

    // STRH
    uint32_t value = m_regs[instr.rd];
    if (instr.rd == 15) value += 4;
    m_bus.write16(addr, static_cast<uint16_t>(value));

    if (writeback) {
        m_regs[instr.rn] = offset_addr;
    }
    return 2;
}

int ARM7TDMI::execute(const ArmBlockDataTransfer& instr, uint32_t address) {
    uint16_t reg_list = instr.register_list;
    if (reg_list == 0) {
        SGBA_DEBUG_PRINT("Empty register list at 0x%08X ignored\n", address);
        return 1;
    }

    uint32_t base = m_regs[instr.rn];
    int reg_count = __builtin_popcount(reg_list);
    int lowest_reg = __builtin_ctz(reg_list);

    // Transfers always walk upwards from the lowest address
    uint32_t addr;
    if (instr.up) {
        addr = instr.pre ? base + 4 : base;
    } else {
        addr = instr.pre ? base - reg_count * 4 : base - reg_count * 4 + 4;
    }
    uint32_t new_base = instr.up ? base + reg_count * 4 : base - reg_count * 4;

    bool pc_loaded = false;
    uint32_t pc_value = 0;

    for (int i = 0; i < 16; i++) {
        if (!(reg_list & (1 << i))) continue;

        if (instr.load) {
            uint32_t value = m_bus.read32(addr);
            if (i == 15) {
                pc_loaded = true;
                pc_value = value;
            } else {
                m_regs[i] = value;
            }
        } else {
            uint32_t value = m_regs[i];
            // A written-back base that is not first in the list is stored updated
            if (i == instr.rn && instr.writeback && i != lowest_reg) {
                value = new_base;
            }
            m_bus.write32(addr, value);
        }
        addr += 4;
    }

    // A loaded base register wins over writeback
    bool base_in_list = (reg_list & (1 << instr.rn)) != 0;
    if (instr.writeback && instr.rn != 15 && !(instr.load && base_in_list)) {
        m_regs[instr.rn] = new_base;
    }

    if (pc_loaded) {
        branch_to(pc_value);
        return reg_count + 4;
    }

    return reg_count + (instr.load ? 2 : 1);
}

int ARM7TDMI::execute(const ArmSoftwareInterrupt& instr, uint32_t address) {
    // GBA uses the comment field bits [23:16] for the function number in ARM mode
    SGBA_DEBUG_PRINT("BIOS call: 0x%02X at PC=0x%08X\n", instr.function(), address);
    hle_bios_call(instr.function());
    return 3;
}

int ARM7TDMI::execute(const ArmUnsupported& instr, uint32_t address) {
    SGBA_DEBUG_PRINT("Unsupported instruction 0x%08X at 0x%08X\n", instr.instruction, address);
    return 1;
}

void ARM7TDMI::set_nz_flags(uint32_t result) {
    m_cpsr &= ~(FLAG_N | FLAG_Z);
    if (result == 0) m_cpsr |= FLAG_Z;
    if (result & 0x80000000) m_cpsr |= FLAG_N;
}

void ARM7TDMI::hle_bios_call(uint8_t function) {
    switch (function) {
        case 0x06:  // Div
            bios_div();
            break;

        case 0x07:  // DivArm - same as Div with swapped operands
            std::swap(m_regs[0], m_regs[1]);
            bios_div();
            break;

        case 0x08:  // Sqrt
            bios_sqrt();
            break;

        case 0x0B:  // CpuSet
            bios_cpu_set();
            break;

        case 0x0C:  // CpuFastSet
            bios_cpu_fast_set();
            break;

        default:
            SGBA_DEBUG_PRINT("Unimplemented BIOS call 0x%02X ignored\n", function);
            break;
    }
}

void ARM7TDMI::bios_div() {
    // R0 = numerator, R1 = denominator
    // Returns: R0 = quotient, R1 = remainder, R3 = abs(quotient)
    int32_t num = static_cast<int32_t>(m_regs[0]);
    int32_t den = static_cast<int32_t>(m_regs[1]);

    if (den == 0) {
        SGBA_DEBUG_PRINT("Div by zero (numerator %d)\n", num);
        m_regs[0] = (num < 0) ? 0xFFFFFFFF : 1;
        m_regs[1] = static_cast<uint32_t>(num);
        m_regs[3] = 1;
        return;
    }

    // INT32_MIN / -1 overflows; the BIOS yields INT32_MIN
    if (num == INT32_MIN && den == -1) {
        m_regs[0] = 0x80000000;
        m_regs[1] = 0;
        m_regs[3] = 0x80000000;
        return;
    }

    int32_t quot = num / den;
    int32_t rem = num % den;

    m_regs[0] = static_cast<uint32_t>(quot);
    m_regs[1] = static_cast<uint32_t>(rem);
    m_regs[3] = quot < 0 ? 0u - static_cast<uint32_t>(quot) : static_cast<uint32_t>(quot);
}

void ARM7TDMI::bios_sqrt() {
    // R0 = input value, returns floor(sqrt(R0)) in R0
    uint32_t val = m_regs[0];
    uint32_t result = 0;
    uint32_t bit = 1u << 30;

    while (bit > val) {
        bit >>= 2;
    }
    while (bit != 0) {
        if (val >= result + bit) {
            val -= result + bit;
            result = (result >> 1) + bit;
        } else {
            result >>= 1;
        }
        bit >>= 2;
    }

    m_regs[0] = result;
}

void ARM7TDMI::bios_cpu_set() {
    // R0 = source, R1 = destination, R2 = count (bits 0-20) | fill (bit 24) | 32-bit (bit 26)
    uint32_t src = m_regs[0];
    uint32_t dst = m_regs[1];
    uint32_t cnt = m_regs[2];

    bool fixed_src = (cnt & (1 << 24)) != 0;
    bool is_32bit = (cnt & (1 << 26)) != 0;
    uint32_t count = cnt & 0x1FFFFF;

    if (is_32bit) {
        src &= ~3u;
        dst &= ~3u;
        for (uint32_t i = 0; i < count; i++) {
            m_bus.write32(dst, m_bus.read32(src));
            if (!fixed_src) src += 4;
            dst += 4;
        }
    } else {
        src &= ~1u;
        dst &= ~1u;
        for (uint32_t i = 0; i < count; i++) {
            m_bus.write16(dst, m_bus.read16(src));
            if (!fixed_src) src += 2;
            dst += 2;
        }
    }
}

void ARM7TDMI::bios_cpu_fast_set() {
    // Like CpuSet but always 32-bit, in blocks of 8 words
    uint32_t src = m_regs[0] & ~3u;
    uint32_t dst = m_regs[1] & ~3u;
    uint32_t cnt = m_regs[2];

    bool fixed_src = (cnt & (1 << 24)) != 0;
    uint32_t count = (cnt & 0x1FFFFF);

    // Round up to multiple of 8
    count = (count + 7) & ~7u;

    for (uint32_t i = 0; i < count; i++) {
        m_bus.write32(dst, m_bus.read32(src));
        if (!fixed_src) src += 4;
        dst += 4;
    }
}

} // namespace gba

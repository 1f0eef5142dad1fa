#pragma once

#include "types.hpp"
#include "arm_decoder.hpp"
#include <cstdint>
#include <array>

namespace gba {

class Bus;

// ARM7TDMI CPU emulator (ARM state, representative instruction subset).
// R15 always holds the address of the instruction being executed + 8.
// Only the N and Z flags are computed.
class ARM7TDMI {
public:
    explicit ARM7TDMI(Bus& bus);
    ~ARM7TDMI();

    // Reset to the BIOS vector (Supervisor mode) or straight to the
    // cartridge entry point (System mode, BIOS stack already set up)
    void reset(bool boot_from_bios = false);

    // Execute one instruction, return cycles consumed
    int step();

    // Debug access
    uint32_t get_register(int reg) const;
    void set_register(int reg, uint32_t value);
    uint32_t get_cpsr() const { return m_cpsr; }
    void set_cpsr(uint32_t value) { m_cpsr = value; }
    uint32_t get_pc() const { return m_regs[15]; }
    uint32_t get_execute_address() const { return m_regs[15] - 8; }
    const std::array<uint32_t, 16>& get_registers() const { return m_regs; }

    // Point execution at `address` (next step() executes it)
    void jump_to(uint32_t address);

    // CPSR flag bits
    static constexpr uint32_t FLAG_N = 1u << 31;  // Negative
    static constexpr uint32_t FLAG_Z = 1u << 30;  // Zero
    static constexpr uint32_t FLAG_C = 1u << 29;  // Carry
    static constexpr uint32_t FLAG_V = 1u << 28;  // Overflow
    static constexpr uint32_t FLAG_I = 1u << 7;   // IRQ disable
    static constexpr uint32_t FLAG_F = 1u << 6;   // FIQ disable

private:
    bool check_condition(Condition cond) const;

    // Instruction handlers, one per decoded category
    int execute(const ArmBranch& instr, uint32_t address);
    int execute(const ArmDataProcessing& instr, uint32_t address);
    int execute(const ArmLoadStore& instr, uint32_t address);
    int execute(const ArmLoadStoreHalfword& instr, uint32_t address);
    int execute(const ArmBlockDataTransfer& instr, uint32_t address);
    int execute(const ArmSoftwareInterrupt& instr, uint32_t address);
    int execute(const ArmUnsupported& instr, uint32_t address);

    // Barrel shifter for register operands (no carry out)
    uint32_t shift_operand(uint32_t operand2, bool allow_register_shift);
    uint32_t arm_shift(uint32_t value, int shift_type, int amount, bool reg_shift) const;

    // Redirect control flow; step() will not advance R15 afterwards
    void branch_to(uint32_t target);

    // HLE BIOS functions
    void hle_bios_call(uint8_t function);
    void bios_div();
    void bios_sqrt();
    void bios_cpu_set();
    void bios_cpu_fast_set();

    void set_nz_flags(uint32_t result);

    // Bus reference
    Bus& m_bus;

    // General purpose registers (R0-R15)
    // R13 = SP, R14 = LR, R15 = PC
    std::array<uint32_t, 16> m_regs;

    // Current Program Status Register
    uint32_t m_cpsr = 0;

    // Set by any instruction that wrote R15
    bool m_branch_taken = false;
};

} // namespace gba

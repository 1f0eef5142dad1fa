#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <memory>

namespace sgba {

// Information about the emulator core
struct EmulatorInfo {
    const char* name;               // "GBA"
    const char* version;            // "0.1.0"
    const char* description;        // Brief description of the core
    const char** file_extensions;   // {".gba", nullptr}
    double native_fps;              // 59.7275 (280896 cycles per frame)
    uint64_t cycles_per_second;     // 16777216
    int screen_width;               // 240
    int screen_height;              // 160
};

// Framebuffer for video output, borrowed until the next run_frame()
struct FrameBuffer {
    const uint32_t* pixels;   // RGBA8888 (R in the low byte), alpha always 0xFF
    int width;
    int height;
};

// Button bits in KEYINPUT order
namespace Buttons {
    constexpr uint32_t A      = 1u << 0;
    constexpr uint32_t B      = 1u << 1;
    constexpr uint32_t Select = 1u << 2;
    constexpr uint32_t Start  = 1u << 3;
    constexpr uint32_t Right  = 1u << 4;
    constexpr uint32_t Left   = 1u << 5;
    constexpr uint32_t Up     = 1u << 6;
    constexpr uint32_t Down   = 1u << 7;
    constexpr uint32_t R      = 1u << 8;
    constexpr uint32_t L      = 1u << 9;
    constexpr uint32_t All    = 0x3FF;
}

// Input state for one frame
struct InputState {
    uint32_t buttons = 0;   // Bitmask of pressed buttons (see Buttons)
};

// CPU and display state exposed for overlays and tooling
struct DebugState {
    std::array<uint32_t, 16> regs{};   // R0-R15 as the CPU holds them (R15 = execute + 8)
    uint32_t cpsr = 0;
    uint32_t pc = 0;                   // Address of the next instruction to execute
    uint16_t vcount = 0;
};

// Core timing configuration, handed to the components at construction
struct CoreConfig {
    int scanline_cycles = 1232;
    int hblank_cycles = 272;
    int cycles_per_frame = 280896;               // 228 scanlines * 1232 cycles
    int max_instructions_per_frame = 1000000;    // Safety bound for run_frame()
};

// Emulator core interface used by the host application
class IEmulatorPlugin {
public:
    virtual ~IEmulatorPlugin() = default;

    // Core information
    virtual EmulatorInfo get_info() = 0;

    // ROM / BIOS loading
    // Both return false and leave the core untouched when the image is rejected
    virtual bool load_bios(const uint8_t* data, size_t size) = 0;
    virtual bool load_rom(const uint8_t* data, size_t size) = 0;
    virtual void unload_rom() = 0;
    virtual bool is_rom_loaded() const = 0;

    // Emulation control
    virtual void reset() = 0;
    virtual void run_frame(const InputState& input) = 0;
    virtual uint64_t get_cycle_count() const = 0;
    virtual uint64_t get_frame_count() const = 0;

    // Video output
    virtual FrameBuffer get_framebuffer() = 0;

    // Debug access
    virtual DebugState get_debug_state() const = 0;
    virtual uint8_t read_memory(uint32_t address) = 0;
    virtual void write_memory(uint32_t address, uint8_t value) = 0;
};

// Create the GBA core
std::unique_ptr<IEmulatorPlugin> create_emulator_plugin(const CoreConfig& config = CoreConfig{});

} // namespace sgba

#include "sgba/emulator_plugin.hpp"
#include "types.hpp"
#include "arm7tdmi.hpp"
#include "bus.hpp"
#include "ppu.hpp"
#include "dma.hpp"
#include "cartridge.hpp"
#include "debug.hpp"

#include <array>
#include <cstring>
#include <iostream>
#include <memory>

namespace gba {

class GBAPlugin : public sgba::IEmulatorPlugin {
public:
    explicit GBAPlugin(const sgba::CoreConfig& config);
    ~GBAPlugin() override;

    // Plugin info
    sgba::EmulatorInfo get_info() override;

    // ROM management
    bool load_bios(const uint8_t* data, size_t size) override;
    bool load_rom(const uint8_t* data, size_t size) override;
    void unload_rom() override;
    bool is_rom_loaded() const override;

    // Emulation
    void reset() override;
    void run_frame(const sgba::InputState& input) override;
    uint64_t get_cycle_count() const override;
    uint64_t get_frame_count() const override;

    // Video
    sgba::FrameBuffer get_framebuffer() override;

    // Debug access
    sgba::DebugState get_debug_state() const override;
    uint8_t read_memory(uint32_t address) override;
    void write_memory(uint32_t address, uint8_t value) override;

private:
    void run_gba_frame(const sgba::InputState& input);

    sgba::CoreConfig m_config;

    // GBA components; the bus outlives everything that references it
    std::unique_ptr<Cartridge> m_cartridge;
    std::unique_ptr<Bus> m_bus;
    std::unique_ptr<ARM7TDMI> m_cpu;
    std::unique_ptr<PPU> m_ppu;
    std::unique_ptr<DMAController> m_dma;

    bool m_rom_loaded = false;
    uint64_t m_total_cycles = 0;
    uint64_t m_frame_count = 0;

    // Framebuffer handed to the host - GBA is 240x160
    std::array<uint32_t, SCREEN_WIDTH * SCREEN_HEIGHT> m_framebuffer;

    // File extensions
    static const char* s_extensions[];
};

const char* GBAPlugin::s_extensions[] = { ".gba", ".GBA", ".bin", nullptr };

GBAPlugin::GBAPlugin(const sgba::CoreConfig& config) : m_config(config) {
    m_framebuffer.fill(0xFF000000);

    PPUConfig ppu_config;
    ppu_config.scanline_cycles = m_config.scanline_cycles;
    ppu_config.hblank_cycles = m_config.hblank_cycles;

    m_cartridge = std::make_unique<Cartridge>();
    m_bus = std::make_unique<Bus>();
    m_cpu = std::make_unique<ARM7TDMI>(*m_bus);
    m_ppu = std::make_unique<PPU>(*m_bus, ppu_config);
    m_dma = std::make_unique<DMAController>(*m_bus);

    m_bus->connect_cartridge(m_cartridge.get());
    m_bus->add_io_observer(m_ppu.get());
    m_bus->add_io_observer(m_dma.get());
}

GBAPlugin::~GBAPlugin() = default;

sgba::EmulatorInfo GBAPlugin::get_info() {
    sgba::EmulatorInfo info;

    info.name = "GBA";
    info.version = "0.1.0";
    info.description = "Game Boy Advance core: ARM7TDMI interpreter, tile and bitmap "
                       "PPU with deferred scanline rendering, immediate DMA.";
    info.file_extensions = s_extensions;
    info.native_fps = 59.7275;  // 280896 cycles per frame at 16.78 MHz
    info.cycles_per_second = 16777216;
    info.screen_width = SCREEN_WIDTH;
    info.screen_height = SCREEN_HEIGHT;

    return info;
}

bool GBAPlugin::load_bios(const uint8_t* data, size_t size) {
    if (!m_bus->load_bios(data, size)) {
        std::cerr << "Failed to load GBA BIOS" << std::endl;
        return false;
    }
    return true;
}

bool GBAPlugin::load_rom(const uint8_t* data, size_t size) {
    SGBA_DEBUG_PRINT("Loading ROM: %zu bytes\n", size);

    // Rejected images leave the running game untouched
    if (!m_cartridge->load(data, size)) {
        std::cerr << "Failed to load GBA ROM" << std::endl;
        return false;
    }

    m_rom_loaded = true;
    reset();

    std::cout << "GBA ROM loaded: " << size << " bytes";
    if (!m_cartridge->get_title().empty()) {
        std::cout << " (" << m_cartridge->get_title() << ")";
    }
    std::cout << std::endl;
    return true;
}

void GBAPlugin::unload_rom() {
    m_cartridge->unload();
    m_rom_loaded = false;
    reset();
}

bool GBAPlugin::is_rom_loaded() const {
    return m_rom_loaded;
}

void GBAPlugin::reset() {
    m_total_cycles = 0;
    m_frame_count = 0;
    m_framebuffer.fill(0xFF000000);

    m_bus->reset();
    m_ppu->reset();
    m_dma->reset();
    m_cpu->reset(m_bus->has_bios());
}

void GBAPlugin::run_frame(const sgba::InputState& input) {
    if (!m_rom_loaded) return;
    run_gba_frame(input);
    m_frame_count++;
}

void GBAPlugin::run_gba_frame(const sgba::InputState& input) {
    // KEYINPUT is active low
    m_bus->set_key_input(static_cast<uint16_t>(~input.buttons & sgba::Buttons::All));

    int cycles_run = 0;
    int instr_count = 0;
    while (cycles_run < m_config.cycles_per_frame &&
           instr_count < m_config.max_instructions_per_frame) {
        int cpu_cycles = m_cpu->step();
        instr_count++;
        m_total_cycles += cpu_cycles;
        cycles_run += cpu_cycles;

        // Step PPU
        m_ppu->step(cpu_cycles);
    }

    // Pick up lines scanned out since V-blank
    m_ppu->flush_render_queue();

    // Copy framebuffer
    const uint32_t* ppu_fb = m_ppu->get_framebuffer();
    std::memcpy(m_framebuffer.data(), ppu_fb, m_framebuffer.size() * sizeof(uint32_t));

    if (is_debug_mode() && (m_frame_count + 1) % 60 == 0) {
        fprintf(stderr, "[GBA] Frame %llu: %d instructions, %d cycles, PC: 0x%08X\n",
                static_cast<unsigned long long>(m_frame_count + 1),
                instr_count, cycles_run, m_cpu->get_execute_address());
    }
}

uint64_t GBAPlugin::get_cycle_count() const {
    return m_total_cycles;
}

uint64_t GBAPlugin::get_frame_count() const {
    return m_frame_count;
}

sgba::FrameBuffer GBAPlugin::get_framebuffer() {
    return {
        m_framebuffer.data(),
        SCREEN_WIDTH,
        SCREEN_HEIGHT
    };
}

sgba::DebugState GBAPlugin::get_debug_state() const {
    sgba::DebugState state;
    state.regs = m_cpu->get_registers();
    state.cpsr = m_cpu->get_cpsr();
    state.pc = m_cpu->get_execute_address();
    state.vcount = m_ppu->get_vcount();
    return state;
}

uint8_t GBAPlugin::read_memory(uint32_t address) {
    return m_bus->read8(address);
}

void GBAPlugin::write_memory(uint32_t address, uint8_t value) {
    m_bus->write8(address, value);
}

} // namespace gba

namespace sgba {

std::unique_ptr<IEmulatorPlugin> create_emulator_plugin(const CoreConfig& config) {
    return std::make_unique<gba::GBAPlugin>(config);
}

} // namespace sgba

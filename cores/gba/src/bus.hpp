#pragma once

#include "types.hpp"
#include "memory_region.hpp"
#include "io_registers.hpp"
#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>

namespace gba {

class Cartridge;

// GBA memory bus: owns every RAM region, the IO register block and the
// palette color cache. Never faults; invalid accesses read a sentinel.
class Bus {
public:
    Bus();
    ~Bus();

    // Connect components
    void connect_cartridge(Cartridge* cart) { m_cartridge = cart; }
    void add_io_observer(IoWriteObserver* observer);

    // Clear RAM, palette cache and IO registers. The BIOS image is kept.
    void reset();

    // BIOS image (1..16 KiB, zero padded)
    bool load_bios(const uint8_t* data, size_t size);
    bool has_bios() const { return m_has_bios; }

    // Memory access
    uint8_t read8(uint32_t address);
    uint16_t read16(uint32_t address);
    uint32_t read32(uint32_t address);
    void write8(uint32_t address, uint8_t value);
    void write16(uint32_t address, uint16_t value);
    void write32(uint32_t address, uint32_t value);

    // IO register access by offset. read_io returns the raw stored value;
    // set_io is the hardware-side update (no write masks, no observers).
    uint16_t read_io(uint32_t offset) const { return m_io[(offset & (io::BLOCK_SIZE - 1)) >> 1]; }
    void set_io(uint32_t offset, uint16_t value) { m_io[(offset & (io::BLOCK_SIZE - 1)) >> 1] = value; }

    // Active-low key state, bits 0-9
    void set_key_input(uint16_t keys) { set_io(io::KEYINPUT, keys & 0x03FF); }

    // Palette entry (0-511) as RGBA8888
    uint32_t palette_rgba(int index) const { return m_palette_cache[index & 0x1FF]; }

    const MemoryRegion& vram() const { return m_vram; }

    static RegionId get_region(uint32_t address);

    static constexpr size_t BIOS_SIZE = 0x4000;

private:
    // CPU-side register write: applies write masks, stores, notifies observers
    void write_io(uint32_t offset, uint16_t value);

    void update_palette_cache(uint32_t offset);

    MemoryRegion* region_for(RegionId id);

    Cartridge* m_cartridge = nullptr;
    std::vector<IoWriteObserver*> m_io_observers;

    MemoryRegion m_bios;
    MemoryRegion m_ewram;
    MemoryRegion m_iwram;
    MemoryRegion m_palette;
    MemoryRegion m_vram;
    MemoryRegion m_oam;
    bool m_has_bios = false;

    std::array<uint16_t, io::BLOCK_SIZE / 2> m_io;
    std::array<uint32_t, 512> m_palette_cache;
};

} // namespace gba

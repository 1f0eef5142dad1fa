#include "bus.hpp"
#include "cartridge.hpp"
#include "debug.hpp"
#include <iostream>

namespace gba {

Bus::Bus()
    : m_bios("BIOS", 0x00000000, BIOS_SIZE)
    , m_ewram("EWRAM", 0x02000000, 0x40000)
    , m_iwram("IWRAM", 0x03000000, 0x8000)
    , m_palette("Palette", 0x05000000, 0x400)
    , m_vram("VRAM", 0x06000000, 0x18000)
    , m_oam("OAM", 0x07000000, 0x400) {
    reset();
}

Bus::~Bus() = default;

void Bus::add_io_observer(IoWriteObserver* observer) {
    if (observer) {
        m_io_observers.push_back(observer);
    }
}

void Bus::reset() {
    m_ewram.clear();
    m_iwram.clear();
    m_palette.clear();
    m_vram.clear();
    m_oam.clear();

    m_io.fill(0);
    m_palette_cache.fill(bgr555_to_rgba(0));

    // No keys pressed
    set_io(io::KEYINPUT, 0x03FF);
}

bool Bus::load_bios(const uint8_t* data, size_t size) {
    if (data == nullptr || size == 0) {
        std::cerr << m_bios.name() << " image is empty" << std::endl;
        return false;
    }
    if (size > BIOS_SIZE) {
        std::cerr << m_bios.name() << " image too large: " << size << " bytes (max " << BIOS_SIZE << ")" << std::endl;
        return false;
    }

    m_bios.fill_from(data, size);
    m_has_bios = true;
    SGBA_DEBUG_PRINT("%s loaded: %zu bytes\n", m_bios.name(), size);
    return true;
}

RegionId Bus::get_region(uint32_t address) {
    switch (address >> 24) {
        case 0x00: return (address < BIOS_SIZE) ? RegionId::BIOS : RegionId::Unmapped;
        case 0x02: return RegionId::EWRAM;
        case 0x03: return RegionId::IWRAM;
        case 0x04: return ((address & 0x00FFFFFF) < io::BLOCK_SIZE) ? RegionId::IO : RegionId::Unmapped;
        case 0x05: return RegionId::Palette;
        case 0x06: return RegionId::VRAM;
        case 0x07: return RegionId::OAM;
        case 0x08:
        case 0x09: return RegionId::ROM;
        default:   return RegionId::Unmapped;
    }
}

MemoryRegion* Bus::region_for(RegionId id) {
    switch (id) {
        case RegionId::EWRAM:   return &m_ewram;
        case RegionId::IWRAM:   return &m_iwram;
        case RegionId::Palette: return &m_palette;
        case RegionId::VRAM:    return &m_vram;
        case RegionId::OAM:     return &m_oam;
        default:                return nullptr;
    }
}

uint8_t Bus::read8(uint32_t address) {
    RegionId region = get_region(address);

    switch (region) {
        case RegionId::BIOS:
            return m_has_bios ? m_bios.read8(address) : 0;
        case RegionId::IO: {
            uint16_t value = read_io(address & 0x3FE);
            return (address & 1) ? (value >> 8) : (value & 0xFF);
        }
        case RegionId::ROM:
            return m_cartridge ? m_cartridge->read8(address) : Cartridge::OPEN_BUS_8;
        case RegionId::Unmapped:
            return 0;
        default:
            return region_for(region)->read8(address);
    }
}

uint16_t Bus::read16(uint32_t address) {
    address &= ~1u;
    RegionId region = get_region(address);

    switch (region) {
        case RegionId::BIOS:
            return m_has_bios ? m_bios.read16(address) : 0;
        case RegionId::IO:
            return read_io(address & 0x3FE);
        case RegionId::ROM:
            return m_cartridge ? m_cartridge->read16(address) : Cartridge::OPEN_BUS_16;
        case RegionId::Unmapped:
            return 0;
        default:
            return region_for(region)->read16(address);
    }
}

uint32_t Bus::read32(uint32_t address) {
    address &= ~3u;

    // ROM reads keep their own 32-bit sentinel
    if (get_region(address) == RegionId::ROM) {
        return m_cartridge ? m_cartridge->read32(address) : Cartridge::OPEN_BUS_32;
    }

    return read16(address) | (static_cast<uint32_t>(read16(address + 2)) << 16);
}

void Bus::write8(uint32_t address, uint8_t value) {
    RegionId region = get_region(address);

    switch (region) {
        case RegionId::BIOS:
        case RegionId::ROM:
        case RegionId::Unmapped:
            return;
        case RegionId::IO: {
            uint32_t offset = address & 0x3FE;
            uint16_t current = read_io(offset);
            if (address & 1) {
                write_io(offset, (current & 0x00FF) | (value << 8));
            } else {
                write_io(offset, (current & 0xFF00) | value);
            }
            return;
        }
        case RegionId::Palette:
            m_palette.write8(address, value);
            update_palette_cache(m_palette.offset_of(address));
            return;
        default:
            region_for(region)->write8(address, value);
            return;
    }
}

void Bus::write16(uint32_t address, uint16_t value) {
    address &= ~1u;
    RegionId region = get_region(address);

    switch (region) {
        case RegionId::BIOS:
        case RegionId::ROM:
        case RegionId::Unmapped:
            return;
        case RegionId::IO:
            write_io(address & 0x3FE, value);
            return;
        case RegionId::Palette:
            m_palette.write16(address, value);
            update_palette_cache(m_palette.offset_of(address));
            return;
        default:
            region_for(region)->write16(address, value);
            return;
    }
}

void Bus::write32(uint32_t address, uint32_t value) {
    address &= ~3u;
    write16(address, value & 0xFFFF);
    write16(address + 2, (value >> 16) & 0xFFFF);
}

void Bus::write_io(uint32_t offset, uint16_t value) {
    switch (offset) {
        case io::DISPSTAT:
            // Status bits 0-2 are owned by the PPU
            value = (read_io(io::DISPSTAT) & DISPSTAT_STATUS_MASK) | (value & ~DISPSTAT_STATUS_MASK);
            break;
        case io::VCOUNT:
        case io::KEYINPUT:
            return;  // Read-only
        default:
            break;
    }

    set_io(offset, value);

    for (IoWriteObserver* observer : m_io_observers) {
        observer->on_io_write(offset, value);
    }
}

void Bus::update_palette_cache(uint32_t offset) {
    uint32_t entry = offset & ~1u;
    m_palette_cache[entry >> 1] = bgr555_to_rgba(m_palette.half_at(entry));
}

} // namespace gba

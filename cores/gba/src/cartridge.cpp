#include "cartridge.hpp"
#include "types.hpp"
#include "debug.hpp"
#include <iostream>

namespace gba {

Cartridge::Cartridge() = default;
Cartridge::~Cartridge() = default;

bool Cartridge::load(const uint8_t* data, size_t size) {
    if (data == nullptr || size == 0) {
        std::cerr << "GBA ROM image is empty" << std::endl;
        return false;
    }

    m_rom.assign(data, data + size);

    // Title lives in the header at 0xA0 (12 bytes); tiny homebrew images have none
    m_title.clear();
    if (size >= 0xC0) {
        for (int i = 0; i < 12; i++) {
            char c = static_cast<char>(data[0xA0 + i]);
            if (c == 0) break;
            m_title += c;
        }
    }

    SGBA_DEBUG_PRINT("Cartridge: %zu bytes, title \"%s\"\n", size, m_title.c_str());
    return true;
}

void Cartridge::unload() {
    m_rom.clear();
    m_title.clear();
}

bool Cartridge::map_offset(uint32_t address, size_t width, size_t& offset) const {
    if (m_rom.empty()) return false;

    offset = (address & 0x01FFFFFF) % m_rom.size();
    return offset + width <= m_rom.size();
}

uint8_t Cartridge::read8(uint32_t address) const {
    size_t offset;
    if (!map_offset(address, 1, offset)) return OPEN_BUS_8;
    return m_rom[offset];
}

uint16_t Cartridge::read16(uint32_t address) const {
    size_t offset;
    if (!map_offset(address, 2, offset)) return OPEN_BUS_16;
    return make_u16(m_rom[offset], m_rom[offset + 1]);
}

uint32_t Cartridge::read32(uint32_t address) const {
    size_t offset;
    if (!map_offset(address, 4, offset)) return OPEN_BUS_32;
    return make_u32(m_rom[offset], m_rom[offset + 1], m_rom[offset + 2], m_rom[offset + 3]);
}

} // namespace gba

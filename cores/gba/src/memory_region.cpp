#include "memory_region.hpp"
#include "types.hpp"
#include <algorithm>

namespace gba {

MemoryRegion::MemoryRegion(const char* name, uint32_t base, size_t capacity)
    : m_name(name), m_base(base), m_data(capacity, 0) {
}

uint8_t MemoryRegion::read8(uint32_t address) const {
    return m_data[offset_of(address)];
}

uint16_t MemoryRegion::read16(uint32_t address) const {
    return make_u16(read8(address), read8(address + 1));
}

uint32_t MemoryRegion::read32(uint32_t address) const {
    return make_u32(read8(address), read8(address + 1),
                    read8(address + 2), read8(address + 3));
}

void MemoryRegion::write8(uint32_t address, uint8_t value) {
    m_data[offset_of(address)] = value;
}

void MemoryRegion::write16(uint32_t address, uint16_t value) {
    write8(address, value & 0xFF);
    write8(address + 1, (value >> 8) & 0xFF);
}

void MemoryRegion::write32(uint32_t address, uint32_t value) {
    write16(address, value & 0xFFFF);
    write16(address + 2, (value >> 16) & 0xFFFF);
}

uint16_t MemoryRegion::half_at(uint32_t offset) const {
    return make_u16(byte_at(offset), byte_at(offset + 1));
}

void MemoryRegion::fill_from(const uint8_t* data, size_t size) {
    clear();
    size_t count = std::min(size, m_data.size());
    std::copy(data, data + count, m_data.begin());
}

void MemoryRegion::clear() {
    std::fill(m_data.begin(), m_data.end(), 0);
}

} // namespace gba

#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>

namespace gba {

// Fixed-capacity byte buffer mapped at a base address.
// Every byte access wraps: offset = (address - base) % capacity.
// Multi-byte accessors are little-endian and do not align the address.
class MemoryRegion {
public:
    MemoryRegion(const char* name, uint32_t base, size_t capacity);

    uint8_t read8(uint32_t address) const;
    uint16_t read16(uint32_t address) const;
    uint32_t read32(uint32_t address) const;
    void write8(uint32_t address, uint8_t value);
    void write16(uint32_t address, uint16_t value);
    void write32(uint32_t address, uint32_t value);

    // Offset-based access for components that already hold a region offset
    uint8_t byte_at(uint32_t offset) const { return m_data[offset % m_data.size()]; }
    uint16_t half_at(uint32_t offset) const;

    uint32_t offset_of(uint32_t address) const {
        return static_cast<uint32_t>((address - m_base) % m_data.size());
    }

    // Zero the buffer, then copy `size` bytes (clamped to capacity) to offset 0
    void fill_from(const uint8_t* data, size_t size);
    void clear();

    const char* name() const { return m_name; }
    size_t size() const { return m_data.size(); }

private:
    const char* m_name;
    uint32_t m_base;
    std::vector<uint8_t> m_data;
};

} // namespace gba

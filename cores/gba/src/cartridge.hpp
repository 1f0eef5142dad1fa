#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>
#include <string>

namespace gba {

// Game Pak ROM image, mirrored across 0x08000000-0x09FFFFFF
class Cartridge {
public:
    Cartridge();
    ~Cartridge();

    // Replace the ROM image. An empty image is rejected and the
    // previous image (if any) stays loaded.
    bool load(const uint8_t* data, size_t size);
    void unload();

    // ROM access by bus address. The offset wraps modulo the image length;
    // an access running past the end of the image, or any access with no
    // image loaded, returns the open-bus sentinel for its width.
    uint8_t read8(uint32_t address) const;
    uint16_t read16(uint32_t address) const;
    uint32_t read32(uint32_t address) const;

    bool is_loaded() const { return !m_rom.empty(); }
    const std::string& get_title() const { return m_title; }
    size_t get_rom_size() const { return m_rom.size(); }

    static constexpr uint8_t OPEN_BUS_8 = 0xFF;
    static constexpr uint16_t OPEN_BUS_16 = 0xFFFF;
    static constexpr uint32_t OPEN_BUS_32 = 0xDEADBEEF;

private:
    // Offset of `address` inside the image, or false when `width` bytes
    // starting there do not fit
    bool map_offset(uint32_t address, size_t width, size_t& offset) const;

    std::vector<uint8_t> m_rom;
    std::string m_title;
};

} // namespace gba

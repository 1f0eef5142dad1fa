#pragma once

#include <cstdint>

namespace gba {

// ARM processor modes
enum class ProcessorMode : uint8_t {
    User       = 0x10,
    FIQ        = 0x11,
    IRQ        = 0x12,
    Supervisor = 0x13,
    Abort      = 0x17,
    Undefined  = 0x1B,
    System     = 0x1F
};

// ARM condition codes
enum class Condition : uint8_t {
    EQ, NE, CS, CC, MI, PL, VS, VC,
    HI, LS, GE, LT, GT, LE, AL, NV
};

// Display modes selected by DISPCNT bits 0-2
enum class DisplayMode : uint8_t {
    Mode0 = 0,  // 4 text backgrounds
    Mode1 = 1,  // 2 text + 1 affine background
    Mode2 = 2,  // 2 affine backgrounds
    Mode3 = 3,  // 240x160 bitmap, 15-bit color
    Mode4 = 4,  // 240x160 bitmap, 8-bit palette, two pages
    Mode5 = 5   // 160x128 bitmap, 15-bit color, two pages
};

// Address space regions, selected by address bits 24-31
enum class RegionId : uint8_t {
    BIOS,
    EWRAM,
    IWRAM,
    IO,
    Palette,
    VRAM,
    OAM,
    ROM,
    Unmapped
};

constexpr inline uint16_t make_u16(uint8_t lo, uint8_t hi) {
    return static_cast<uint16_t>(lo) | (static_cast<uint16_t>(hi) << 8);
}

constexpr inline uint32_t make_u32(uint8_t b0, uint8_t b1, uint8_t b2, uint8_t b3) {
    return static_cast<uint32_t>(b0) |
           (static_cast<uint32_t>(b1) << 8) |
           (static_cast<uint32_t>(b2) << 16) |
           (static_cast<uint32_t>(b3) << 24);
}

// Sign extension helpers
constexpr inline int32_t sign_extend_8(uint32_t value) {
    return static_cast<int32_t>(static_cast<int8_t>(value & 0xFF));
}

constexpr inline int32_t sign_extend_16(uint32_t value) {
    return static_cast<int32_t>(static_cast<int16_t>(value & 0xFFFF));
}

constexpr inline int32_t sign_extend_24(uint32_t value) {
    if (value & 0x800000) {
        return static_cast<int32_t>(value | 0xFF000000);
    }
    return static_cast<int32_t>(value & 0x00FFFFFF);
}

constexpr inline uint32_t ror(uint32_t value, int amount) {
    amount &= 31;
    if (amount == 0) return value;
    return (value >> amount) | (value << (32 - amount));
}

// 15-bit BGR (xBBBBBGGGGGRRRRR) to RGBA8888 with R in the low byte.
// Each 5-bit channel is widened as (c << 3) | (c >> 2).
constexpr inline uint32_t bgr555_to_rgba(uint16_t color) {
    uint32_t r = color & 0x1F;
    uint32_t g = (color >> 5) & 0x1F;
    uint32_t b = (color >> 10) & 0x1F;

    r = (r << 3) | (r >> 2);
    g = (g << 3) | (g >> 2);
    b = (b << 3) | (b >> 2);

    return 0xFF000000 | (b << 16) | (g << 8) | r;
}

// Screen geometry and display timing
constexpr int SCREEN_WIDTH = 240;
constexpr int SCREEN_HEIGHT = 160;
constexpr int VDRAW_LINES = 160;
constexpr int TOTAL_LINES = 228;

} // namespace gba

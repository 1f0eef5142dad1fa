#pragma once

#include <cstdint>

namespace gba {

// IO register offsets within the 1 KiB block at 0x04000000
namespace io {
    constexpr uint32_t DISPCNT   = 0x000;
    constexpr uint32_t DISPSTAT  = 0x004;
    constexpr uint32_t VCOUNT    = 0x006;
    constexpr uint32_t BG0CNT    = 0x008;
    constexpr uint32_t BG1CNT    = 0x00A;
    constexpr uint32_t BG2CNT    = 0x00C;
    constexpr uint32_t BG3CNT    = 0x00E;
    constexpr uint32_t BG0HOFS   = 0x010;   // BGnHOFS = 0x010 + n*4, BGnVOFS = 0x012 + n*4
    constexpr uint32_t BG3VOFS   = 0x01E;
    constexpr uint32_t BLDY      = 0x054;   // Last register that affects pixel output

    constexpr uint32_t DMA0SAD   = 0x0B0;
    constexpr uint32_t DMA1SAD   = 0x0BC;
    constexpr uint32_t DMA2SAD   = 0x0C8;
    constexpr uint32_t DMA3SAD   = 0x0D4;
    constexpr uint32_t DMA3DAD   = 0x0D8;
    constexpr uint32_t DMA3CNT_L = 0x0DC;
    constexpr uint32_t DMA3CNT_H = 0x0DE;

    constexpr uint32_t KEYINPUT  = 0x130;
    constexpr uint32_t WAITCNT   = 0x204;
    constexpr uint32_t IME       = 0x208;

    constexpr uint32_t BLOCK_SIZE = 0x400;
}

// DISPSTAT bits
constexpr uint16_t DISPSTAT_VBLANK = 0x0001;
constexpr uint16_t DISPSTAT_HBLANK = 0x0002;
constexpr uint16_t DISPSTAT_VCOUNT_MATCH = 0x0004;
constexpr uint16_t DISPSTAT_STATUS_MASK = 0x0007;

// Notified by the Bus after every CPU-side (or DMA) write to the IO block.
// `offset` is the halfword-aligned register offset, `value` the stored value.
class IoWriteObserver {
public:
    virtual ~IoWriteObserver() = default;
    virtual void on_io_write(uint32_t offset, uint16_t value) = 0;
};

} // namespace gba

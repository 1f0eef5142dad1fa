#include "dma.hpp"
#include "bus.hpp"
#include "debug.hpp"

namespace gba {

namespace {
    constexpr uint32_t SAD_OFFSET = 0x0;
    constexpr uint32_t DAD_OFFSET = 0x4;
    constexpr uint32_t CNT_L_OFFSET = 0x8;
    constexpr uint32_t CNT_H_OFFSET = 0xA;

    constexpr uint16_t CONTROL_ENABLE = 0x8000;
    constexpr uint16_t CONTROL_32BIT = 0x0400;
}

DMAController::DMAController(Bus& bus) : m_bus(bus) {
}

DMAController::~DMAController() = default;

void DMAController::reset() {
    m_active.fill(false);
    m_last_transfer_units = 0;
}

void DMAController::on_io_write(uint32_t offset, uint16_t value) {
    for (int channel = 0; channel < NUM_CHANNELS; channel++) {
        if (offset != CHANNEL_BASE[channel] + CNT_H_OFFSET) continue;
        if (!(value & CONTROL_ENABLE)) return;
        if (m_active[channel]) {
            SGBA_DEBUG_PRINT("DMA%d: enable written during its own transfer, ignored\n", channel);
            return;
        }

        int timing = (value >> 12) & 3;
        if (timing != 0) {
            // V-blank, H-blank and special start timings are not driven
            SGBA_DEBUG_PRINT("DMA%d: start timing %d not supported, transfer left pending\n",
                             channel, timing);
            return;
        }

        run_channel(channel);
        return;
    }
}

void DMAController::run_channel(int channel) {
    uint32_t base = CHANNEL_BASE[channel];

    uint32_t src = m_bus.read_io(base + SAD_OFFSET) |
                   (static_cast<uint32_t>(m_bus.read_io(base + SAD_OFFSET + 2)) << 16);
    uint32_t dst = m_bus.read_io(base + DAD_OFFSET) |
                   (static_cast<uint32_t>(m_bus.read_io(base + DAD_OFFSET + 2)) << 16);
    uint32_t count = m_bus.read_io(base + CNT_L_OFFSET);
    uint16_t control = m_bus.read_io(base + CNT_H_OFFSET);

    src &= 0x0FFFFFFF;
    dst &= 0x0FFFFFFF;

    // Channels 0-2 have a 14-bit count; 0 selects the maximum
    if (channel != 3) count &= 0x3FFF;
    if (count == 0) count = 0x4000;

    bool is_32bit = control & CONTROL_32BIT;
    int src_adj = (control >> 7) & 3;
    int dst_adj = (control >> 5) & 3;
    int step = is_32bit ? 4 : 2;

    m_active[channel] = true;

    SGBA_DEBUG_PRINT("DMA%d: %u x %d bytes, 0x%08X -> 0x%08X\n", channel, count, step, src, dst);

    for (uint32_t i = 0; i < count; i++) {
        if (is_32bit) {
            m_bus.write32(dst, m_bus.read32(src));
        } else {
            m_bus.write16(dst, m_bus.read16(src));
        }

        // Adjust source
        switch (src_adj) {
            case 0: src += step; break;
            case 1: src -= step; break;
            case 2: break;  // Fixed
            case 3: src += step; break;  // Prohibited, behaves as increment
        }

        // Adjust destination
        switch (dst_adj) {
            case 0: dst += step; break;
            case 1: dst -= step; break;
            case 2: break;  // Fixed
            case 3: dst += step; break;  // Increment/Reload
        }
    }

    m_active[channel] = false;
    m_last_transfer_units = count;

    // Transfer complete
    m_bus.set_io(base + CNT_H_OFFSET, m_bus.read_io(base + CNT_H_OFFSET) & ~CONTROL_ENABLE);
}

} // namespace gba

#pragma once

#include "io_registers.hpp"
#include <cstdint>
#include <array>

namespace gba {

class Bus;

// GBA DMA controller - 4 channels, register windows at 0xB0/0xBC/0xC8/0xD4.
// Each window is SAD (32), DAD (32), CNT_L (count), CNT_H (control).
// Immediate transfers run synchronously inside the control register write.
class DMAController : public IoWriteObserver {
public:
    explicit DMAController(Bus& bus);
    ~DMAController() override;

    // IoWriteObserver
    void on_io_write(uint32_t offset, uint16_t value) override;

    void reset();

    // Perform channel `channel`'s transfer from its register window
    void run_channel(int channel);

    // Units moved by the most recent transfer (for tooling)
    uint32_t get_last_transfer_units() const { return m_last_transfer_units; }

    static constexpr int NUM_CHANNELS = 4;
    static constexpr std::array<uint32_t, NUM_CHANNELS> CHANNEL_BASE = {
        io::DMA0SAD, io::DMA1SAD, io::DMA2SAD, io::DMA3SAD
    };

private:
    Bus& m_bus;
    uint32_t m_last_transfer_units = 0;

    // Set while a channel's transfer is in progress; enable writes to a
    // running channel (a transfer into its own window) are ignored
    std::array<bool, NUM_CHANNELS> m_active{};
};

} // namespace gba

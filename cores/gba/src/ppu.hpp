#pragma once

#include "types.hpp"
#include "io_registers.hpp"
#include <cstdint>
#include <array>

namespace gba {

class Bus;

struct PPUConfig {
    int scanline_cycles = 1232;
    int hblank_cycles = 272;    // H-blank is the tail of each scanline
};

// GBA PPU - 240x160 display.
// Timing is advanced by step(); pixels are produced lazily by
// flush_render_queue(), which runs on entering V-blank and before any
// register write that changes what the screen would show.
class PPU : public IoWriteObserver {
public:
    PPU(Bus& bus, const PPUConfig& config);
    ~PPU() override;

    void reset();
    void step(int cycles);

    // Render every line passed since the previous flush
    void flush_render_queue();

    // Render one visible line from the current register mirrors
    void render_scanline(int line);

    // IoWriteObserver
    void on_io_write(uint32_t offset, uint16_t value) override;

    const uint32_t* get_framebuffer() const { return m_framebuffer.data(); }
    uint32_t get_pixel(int x, int y) const { return m_framebuffer[y * SCREEN_WIDTH + x]; }

    int get_scanline() const { return m_scanline; }
    uint16_t get_vcount() const { return m_vcount; }
    uint16_t get_dispstat() const { return m_dispstat; }
    int get_last_rendered_line() const { return m_last_rendered_line; }

private:
    void advance_scanline();
    void publish_status();

    void render_text_layers(uint32_t* line_buffer, int line, int layer_mask);
    void render_text_background(uint32_t* line_buffer, int layer, int line);
    void render_mode3(uint32_t* line_buffer, int line);
    void render_mode4(uint32_t* line_buffer, int line);
    void render_mode5(uint32_t* line_buffer, int line);

    Bus& m_bus;
    PPUConfig m_config;

    // Framebuffer (240x160 RGBA)
    std::array<uint32_t, SCREEN_WIDTH * SCREEN_HEIGHT> m_framebuffer;

    // Timing
    int m_scanline = 0;             // Current scanline (0-227)
    int m_cycles_to_line_end = 0;   // Cycles left in the current scanline
    int m_last_rendered_line = 0;
    int m_lines_pending = 0;        // Scanlines advanced since the last flush

    // Register mirrors
    uint16_t m_dispcnt = 0;
    uint16_t m_dispstat = 0;
    uint16_t m_vcount = 0;
    std::array<uint16_t, 4> m_bgcnt;
    std::array<uint16_t, 4> m_bghofs;
    std::array<uint16_t, 4> m_bgvofs;
};

} // namespace gba

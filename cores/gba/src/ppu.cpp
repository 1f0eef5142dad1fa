#include "ppu.hpp"
#include "bus.hpp"
#include "debug.hpp"
#include <algorithm>

namespace gba {

PPU::PPU(Bus& bus, const PPUConfig& config) : m_bus(bus), m_config(config) {
    if (m_config.scanline_cycles <= 0) {
        SGBA_DEBUG_PRINT("PPU: invalid scanline length %d, using 1232\n", m_config.scanline_cycles);
        m_config.scanline_cycles = 1232;
    }
    m_config.hblank_cycles = std::clamp(m_config.hblank_cycles, 0, m_config.scanline_cycles);
    reset();
}

PPU::~PPU() = default;

void PPU::reset() {
    m_framebuffer.fill(bgr555_to_rgba(0));

    m_scanline = 0;
    m_cycles_to_line_end = m_config.scanline_cycles;
    m_last_rendered_line = 0;
    m_lines_pending = 0;

    m_dispcnt = 0;
    m_dispstat = 0;
    m_vcount = 0;
    m_bgcnt.fill(0);
    m_bghofs.fill(0);
    m_bgvofs.fill(0);

    publish_status();
}

void PPU::step(int cycles) {
    m_cycles_to_line_end -= cycles;

    while (m_cycles_to_line_end <= 0) {
        m_cycles_to_line_end += m_config.scanline_cycles;
        advance_scanline();
    }

    publish_status();
}

void PPU::advance_scanline() {
    m_scanline = (m_scanline + 1) % TOTAL_LINES;
    m_lines_pending++;

    // Entering V-blank: everything visible this frame must be on screen
    if (m_scanline == VDRAW_LINES) {
        flush_render_queue();
    }
}

void PPU::publish_status() {
    uint16_t status = 0;
    if (m_scanline >= VDRAW_LINES) {
        status |= DISPSTAT_VBLANK;
    }
    if (m_cycles_to_line_end <= m_config.hblank_cycles) {
        status |= DISPSTAT_HBLANK;
    }
    if (m_scanline == ((m_dispstat >> 8) & 0xFF)) {
        status |= DISPSTAT_VCOUNT_MATCH;
    }

    m_dispstat = (m_dispstat & ~DISPSTAT_STATUS_MASK) | status;
    m_vcount = static_cast<uint16_t>(m_scanline);

    m_bus.set_io(io::DISPSTAT, m_dispstat);
    m_bus.set_io(io::VCOUNT, m_vcount);
}

void PPU::flush_render_queue() {
    // Lines (last rendered, current], wrapping at the end of the frame
    int count = std::min(m_lines_pending, TOTAL_LINES);
    int line = m_last_rendered_line;

    for (int i = 0; i < count; i++) {
        line = (line + 1) % TOTAL_LINES;
        if (line < VDRAW_LINES) {
            render_scanline(line);
        }
    }

    m_last_rendered_line = m_scanline;
    m_lines_pending = 0;
}

void PPU::on_io_write(uint32_t offset, uint16_t value) {
    switch (offset) {
        case io::DISPSTAT:
            // V-count target and IRQ enables; the status bits stay ours
            m_dispstat = (m_dispstat & DISPSTAT_STATUS_MASK) | (value & ~DISPSTAT_STATUS_MASK);
            return;
        case io::VCOUNT:
            return;
        default:
            break;
    }

    if (offset > io::BLDY) return;

    // Lines already scanned out keep the old register state
    flush_render_queue();

    if (offset == io::DISPCNT) {
        m_dispcnt = value;
    } else if (offset >= io::BG0CNT && offset <= io::BG3CNT) {
        m_bgcnt[(offset - io::BG0CNT) >> 1] = value;
    } else if (offset >= io::BG0HOFS && offset <= io::BG3VOFS) {
        int layer = (offset - io::BG0HOFS) >> 2;
        if (offset & 2) {
            m_bgvofs[layer] = value & 0x1FF;
        } else {
            m_bghofs[layer] = value & 0x1FF;
        }
    }
}

void PPU::render_scanline(int line) {
    if (line < 0 || line >= VDRAW_LINES) return;

    uint32_t* out = &m_framebuffer[line * SCREEN_WIDTH];
    std::fill(out, out + SCREEN_WIDTH, m_bus.palette_rgba(0));

    // Forced blank shows the backdrop only
    if (m_dispcnt & 0x0080) return;

    switch (static_cast<DisplayMode>(m_dispcnt & 7)) {
        case DisplayMode::Mode0: render_text_layers(out, line, 0xF); break;
        case DisplayMode::Mode1: render_text_layers(out, line, 0x3); break;
        case DisplayMode::Mode3: render_mode3(out, line); break;
        case DisplayMode::Mode4: render_mode4(out, line); break;
        case DisplayMode::Mode5: render_mode5(out, line); break;
        default:
            // Affine layers are not rendered
            break;
    }
}

void PPU::render_text_layers(uint32_t* line_buffer, int line, int layer_mask) {
    int enabled = (m_dispcnt >> 8) & layer_mask;

    // Lowest priority first; within a priority BG3 is below BG0
    for (int priority = 3; priority >= 0; priority--) {
        for (int layer = 3; layer >= 0; layer--) {
            if ((enabled & (1 << layer)) && (m_bgcnt[layer] & 3) == priority) {
                render_text_background(line_buffer, layer, line);
            }
        }
    }
}

void PPU::render_text_background(uint32_t* line_buffer, int layer, int line) {
    const MemoryRegion& vram = m_bus.vram();

    uint16_t control = m_bgcnt[layer];
    uint32_t char_base = ((control >> 2) & 3) * 0x4000;
    uint32_t screen_base = ((control >> 8) & 0x1F) * 0x800;
    bool palette_256 = control & 0x0080;
    int screen_size = (control >> 14) & 3;

    // Size 0: 256x256, 1: 512x256, 2: 256x512, 3: 512x512
    int screen_width = (screen_size & 1) ? 512 : 256;
    int screen_height = (screen_size & 2) ? 512 : 256;

    int y = (line + m_bgvofs[layer]) % screen_height;
    int scroll_x = m_bghofs[layer];

    int tile_row = (y % 256) / 8;
    int pixel_row = y & 7;

    int screen_x = 0;
    while (screen_x < SCREEN_WIDTH) {
        int x = (screen_x + scroll_x) % screen_width;

        // Screen blocks: [0] / [0][1] / [0] over [1] / [0][1] over [2][3]
        int screen_block = 0;
        switch (screen_size) {
            case 1: screen_block = x / 256; break;
            case 2: screen_block = y / 256; break;
            case 3: screen_block = x / 256 + (y / 256) * 2; break;
            default: break;
        }

        uint32_t map_offset = screen_base + screen_block * 0x800 + (tile_row * 32 + (x % 256) / 8) * 2;
        uint16_t tile_entry = vram.half_at(map_offset);
        uint32_t tile_id = tile_entry & 0x3FF;
        bool h_flip = tile_entry & 0x0400;
        bool v_flip = tile_entry & 0x0800;
        int palette_bank = (tile_entry >> 12) & 0xF;

        int row = v_flip ? 7 - pixel_row : pixel_row;

        // Remaining pixels of this tile that are on screen
        for (int px = x & 7; px < 8 && screen_x < SCREEN_WIDTH; px++, screen_x++) {
            int col = h_flip ? 7 - px : px;

            int color_index;
            if (palette_256) {
                color_index = vram.byte_at(char_base + tile_id * 64 + row * 8 + col);
            } else {
                uint8_t pair = vram.byte_at(char_base + tile_id * 32 + row * 4 + col / 2);
                color_index = (col & 1) ? (pair >> 4) : (pair & 0x0F);
                if (color_index != 0) {
                    color_index += palette_bank * 16;
                }
            }

            // Index 0 is transparent
            if (color_index != 0) {
                line_buffer[screen_x] = m_bus.palette_rgba(color_index);
            }
        }
    }
}

void PPU::render_mode3(uint32_t* line_buffer, int line) {
    // 240x160 bitmap, 15-bit color
    const MemoryRegion& vram = m_bus.vram();
    uint32_t base = line * SCREEN_WIDTH * 2;

    for (int x = 0; x < SCREEN_WIDTH; x++) {
        line_buffer[x] = bgr555_to_rgba(vram.half_at(base + x * 2));
    }
}

void PPU::render_mode4(uint32_t* line_buffer, int line) {
    // 240x160 bitmap, 8-bit palette index, page selected by DISPCNT bit 4
    const MemoryRegion& vram = m_bus.vram();
    uint32_t base = ((m_dispcnt & 0x0010) ? 0xA000 : 0) + line * SCREEN_WIDTH;

    for (int x = 0; x < SCREEN_WIDTH; x++) {
        line_buffer[x] = m_bus.palette_rgba(vram.byte_at(base + x));
    }
}

void PPU::render_mode5(uint32_t* line_buffer, int line) {
    // 160x128 bitmap, 15-bit color; the rest of the screen is backdrop
    if (line >= 128) return;

    const MemoryRegion& vram = m_bus.vram();
    uint32_t base = ((m_dispcnt & 0x0010) ? 0xA000 : 0) + line * 160 * 2;

    for (int x = 0; x < 160; x++) {
        line_buffer[x] = bgr555_to_rgba(vram.half_at(base + x * 2));
    }
}

} // namespace gba

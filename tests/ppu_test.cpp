#include "ppu.hpp"
#include "bus.hpp"
#include <gtest/gtest.h>

using namespace gba;

namespace {
constexpr int LINE_CYCLES = 1232;
constexpr int HBLANK_CYCLES = 272;

constexpr uint32_t DISPCNT = 0x04000000;
constexpr uint32_t BG0CNT = 0x04000008;
constexpr uint32_t BG0HOFS = 0x04000010;
constexpr uint32_t VRAM = 0x06000000;
constexpr uint32_t PALETTE = 0x05000000;
}

class PPUTest : public ::testing::Test {
protected:
    PPUTest() : ppu(bus, PPUConfig{}) {
        bus.add_io_observer(&ppu);
    }

    void step_lines(int lines) {
        for (int i = 0; i < lines; i++) {
            ppu.step(LINE_CYCLES);
        }
    }

    Bus bus;
    PPU ppu;
};

// ============================================================================
// Timing
// ============================================================================

TEST_F(PPUTest, ResetStartsAtLineZero) {
    EXPECT_EQ(ppu.get_scanline(), 0);
    EXPECT_EQ(ppu.get_vcount(), 0);
    EXPECT_EQ(ppu.get_last_rendered_line(), 0);
    EXPECT_EQ(ppu.get_pixel(0, 0), 0xFF000000u);
}

TEST_F(PPUTest, ScanlineCyclesThroughFrameAndWraps) {
    for (int frame = 0; frame < 2; frame++) {
        for (int line = 1; line <= 228; line++) {
            ppu.step(LINE_CYCLES);
            int expected = line % 228;
            ASSERT_EQ(ppu.get_scanline(), expected);
            ASSERT_EQ(bus.read16(0x04000006), expected);
        }
    }
}

TEST_F(PPUTest, PartialStepsAccumulate) {
    ppu.step(LINE_CYCLES - 1);
    EXPECT_EQ(ppu.get_scanline(), 0);

    ppu.step(1);
    EXPECT_EQ(ppu.get_scanline(), 1);

    // One large step crosses several lines
    ppu.step(LINE_CYCLES * 3 + 10);
    EXPECT_EQ(ppu.get_scanline(), 4);
}

TEST_F(PPUTest, VblankFlagSetOnlyDuringVblankLines) {
    for (int line = 1; line <= 228; line++) {
        ppu.step(LINE_CYCLES);
        int scanline = line % 228;
        bool vblank = (bus.read16(0x04000004) & 0x0001) != 0;
        ASSERT_EQ(vblank, scanline >= 160 && scanline <= 227) << "line " << scanline;
    }
}

TEST_F(PPUTest, HblankFlagCoversTailOfLine) {
    ppu.step(LINE_CYCLES - HBLANK_CYCLES - 1);
    EXPECT_EQ(bus.read16(0x04000004) & 0x0002, 0);

    ppu.step(1);
    EXPECT_EQ(bus.read16(0x04000004) & 0x0002, 0x0002);

    ppu.step(HBLANK_CYCLES);
    EXPECT_EQ(ppu.get_scanline(), 1);
    EXPECT_EQ(bus.read16(0x04000004) & 0x0002, 0);
}

TEST_F(PPUTest, VcountMatchFlagUsesDispstatTarget) {
    bus.write16(0x04000004, 5 << 8);

    step_lines(4);
    EXPECT_EQ(bus.read16(0x04000004) & 0x0004, 0);

    step_lines(1);
    EXPECT_EQ(bus.read16(0x04000004) & 0x0004, 0x0004);
    EXPECT_EQ(bus.read16(0x04000004) >> 8, 5);
}

// ============================================================================
// Bitmap modes
// ============================================================================

TEST_F(PPUTest, Mode3PixelIsExpandedColor) {
    const int x = 17, y = 42;
    const uint16_t color = 0x1234;

    bus.write16(DISPCNT, 0x0403);
    bus.write16(VRAM + (y * 240 + x) * 2, color);
    ppu.render_scanline(y);

    EXPECT_EQ(ppu.get_pixel(x, y), bgr555_to_rgba(color));
    EXPECT_EQ(ppu.get_pixel(x + 1, y), 0xFF000000u);
}

TEST_F(PPUTest, Mode4UsesPaletteAndPageSelect) {
    bus.write16(PALETTE + 3 * 2, 0x001F);
    bus.write16(PALETTE + 4 * 2, 0x7C00);
    bus.write8(VRAM + 10 * 240 + 5, 3);
    bus.write8(VRAM + 0xA000 + 10 * 240 + 5, 4);

    bus.write16(DISPCNT, 0x0404);
    ppu.render_scanline(10);
    EXPECT_EQ(ppu.get_pixel(5, 10), 0xFF0000FFu);

    bus.write16(DISPCNT, 0x0414);
    ppu.render_scanline(10);
    EXPECT_EQ(ppu.get_pixel(5, 10), 0xFFFF0000u);
}

TEST_F(PPUTest, Mode5Is160By128) {
    bus.write16(PALETTE, 0x03E0);
    bus.write16(VRAM + (2 * 160 + 159) * 2, 0x7FFF);

    bus.write16(DISPCNT, 0x0405);
    ppu.render_scanline(2);
    ppu.render_scanline(130);

    EXPECT_EQ(ppu.get_pixel(159, 2), 0xFFFFFFFFu);
    EXPECT_EQ(ppu.get_pixel(160, 2), 0xFF00FF00u);
    EXPECT_EQ(ppu.get_pixel(0, 130), 0xFF00FF00u);
}

TEST_F(PPUTest, ForcedBlankShowsBackdrop) {
    bus.write16(PALETTE, 0x7C00);
    bus.write16(VRAM, 0x001F);

    bus.write16(DISPCNT, 0x0483);
    ppu.render_scanline(0);

    EXPECT_EQ(ppu.get_pixel(0, 0), 0xFFFF0000u);
}

TEST_F(PPUTest, AffineOnlyModeShowsBackdrop) {
    bus.write16(PALETTE, 0x001F);

    bus.write16(DISPCNT, 0x0402);
    ppu.render_scanline(3);

    EXPECT_EQ(ppu.get_pixel(100, 3), 0xFF0000FFu);
}

// ============================================================================
// Tile mode
// ============================================================================

class PPUTileTest : public PPUTest {
protected:
    void SetUp() override {
        // Palette: 1 red, 2 green, 17 blue
        bus.write16(PALETTE + 1 * 2, 0x001F);
        bus.write16(PALETTE + 2 * 2, 0x03E0);
        bus.write16(PALETTE + 17 * 2, 0x7C00);

        // Tile 1, row 0: pixel 0 = index 1, pixel 1 = index 2, rest transparent
        bus.write16(VRAM + 32, 0x0021);

        // BG0: char base 0, screen base block 8 (0x4000), 4bpp, 256x256
        bus.write16(BG0CNT, 8 << 8);
        bus.write16(VRAM + 0x4000, 0x0001);

        bus.write16(DISPCNT, 0x0100);
    }
};

TEST_F(PPUTileTest, RendersFourBitTile) {
    ppu.render_scanline(0);

    EXPECT_EQ(ppu.get_pixel(0, 0), 0xFF0000FFu);
    EXPECT_EQ(ppu.get_pixel(1, 0), 0xFF00FF00u);
    EXPECT_EQ(ppu.get_pixel(2, 0), 0xFF000000u);   // Transparent -> backdrop
}

TEST_F(PPUTileTest, PaletteBankSelectsSixteenColorGroup) {
    bus.write16(VRAM + 0x4000, 0x1001);
    ppu.render_scanline(0);

    EXPECT_EQ(ppu.get_pixel(0, 0), 0xFFFF0000u);
}

TEST_F(PPUTileTest, HorizontalFlipMirrorsTile) {
    bus.write16(VRAM + 0x4000, 0x0401);
    ppu.render_scanline(0);

    EXPECT_EQ(ppu.get_pixel(7, 0), 0xFF0000FFu);
    EXPECT_EQ(ppu.get_pixel(6, 0), 0xFF00FF00u);
    EXPECT_EQ(ppu.get_pixel(0, 0), 0xFF000000u);
}

TEST_F(PPUTileTest, VerticalFlipMirrorsRows) {
    // Tile 1, row 7: pixel 0 = index 2
    bus.write16(VRAM + 32 + 7 * 4, 0x0002);
    bus.write16(VRAM + 0x4000, 0x0801);

    ppu.render_scanline(0);
    EXPECT_EQ(ppu.get_pixel(0, 0), 0xFF00FF00u);
    EXPECT_EQ(ppu.get_pixel(1, 0), 0xFF000000u);

    ppu.render_scanline(7);
    EXPECT_EQ(ppu.get_pixel(0, 7), 0xFF0000FFu);
    EXPECT_EQ(ppu.get_pixel(1, 7), 0xFF00FF00u);
}

TEST_F(PPUTileTest, RendersEightBitTile) {
    // 8bpp tile 1 starts at 64: raw palette indices 17 and 2, bank bits ignored
    bus.write16(VRAM + 64, 0x0211);
    bus.write16(BG0CNT, (8 << 8) | 0x80);
    bus.write16(VRAM + 0x4000, 0x1001);

    ppu.render_scanline(0);

    EXPECT_EQ(ppu.get_pixel(0, 0), 0xFFFF0000u);
    EXPECT_EQ(ppu.get_pixel(1, 0), 0xFF00FF00u);
    EXPECT_EQ(ppu.get_pixel(2, 0), 0xFF000000u);
}

TEST_F(PPUTileTest, HorizontalScrollShiftsLayer) {
    bus.write16(BG0HOFS, 1);
    ppu.render_scanline(0);

    EXPECT_EQ(ppu.get_pixel(0, 0), 0xFF00FF00u);
}

TEST_F(PPUTileTest, ScrollWrapsAtMapWidth) {
    bus.write16(BG0HOFS, 255);
    ppu.render_scanline(0);

    EXPECT_EQ(ppu.get_pixel(0, 0), 0xFF000000u);
    EXPECT_EQ(ppu.get_pixel(1, 0), 0xFF0000FFu);
    EXPECT_EQ(ppu.get_pixel(2, 0), 0xFF00FF00u);
}

TEST_F(PPUTileTest, DisabledLayerIsNotDrawn) {
    bus.write16(DISPCNT, 0x0000);
    ppu.render_scanline(0);

    EXPECT_EQ(ppu.get_pixel(0, 0), 0xFF000000u);
}

TEST_F(PPUTileTest, HigherPriorityLayerDrawsOnTop) {
    // BG1 uses the same map but a tile whose pixel 0 is blue (index 1 of bank 1)
    bus.write16(VRAM + 64, 0x0001);
    bus.write16(VRAM + 0x4800, 0x1002);
    bus.write16(BG0CNT, (8 << 8) | 1);          // BG0 priority 1
    bus.write16(BG0CNT + 2, (9 << 8) | 0);      // BG1 priority 0
    bus.write16(DISPCNT, 0x0300);

    ppu.render_scanline(0);

    EXPECT_EQ(ppu.get_pixel(0, 0), 0xFFFF0000u);
    // BG1 pixel 1 is transparent, BG0 shows through
    EXPECT_EQ(ppu.get_pixel(1, 0), 0xFF00FF00u);
}

// ============================================================================
// Deferred rendering
// ============================================================================

TEST_F(PPUTest, LinesAreRenderedOnEnteringVblank) {
    bus.write16(PALETTE, 0x001F);
    bus.write16(DISPCNT, 0x0080);

    step_lines(159);
    EXPECT_EQ(ppu.get_pixel(0, 100), 0xFF000000u);

    step_lines(1);
    EXPECT_EQ(ppu.get_last_rendered_line(), 160);
    EXPECT_EQ(ppu.get_pixel(0, 1), 0xFF0000FFu);
    EXPECT_EQ(ppu.get_pixel(0, 159), 0xFF0000FFu);
}

TEST_F(PPUTest, MidFrameDispcntWriteKeepsEarlierLines) {
    const uint16_t color = 0x03E0;
    for (int y = 0; y < 160; y++) {
        bus.write16(VRAM + y * 240 * 2, color);
    }
    bus.write16(DISPCNT, 0x0403);

    step_lines(80);
    bus.write16(DISPCNT, 0x0080);
    EXPECT_EQ(ppu.get_last_rendered_line(), 80);

    step_lines(80);

    for (int y = 1; y <= 80; y++) {
        ASSERT_EQ(ppu.get_pixel(0, y), bgr555_to_rgba(color)) << "line " << y;
    }
    for (int y = 81; y < 160; y++) {
        ASSERT_EQ(ppu.get_pixel(0, y), 0xFF000000u) << "line " << y;
    }
}

TEST_F(PPUTest, FlushAfterFullFrameCoversEveryLine) {
    bus.write16(PALETTE, 0x7C00);
    bus.write16(DISPCNT, 0x0080);

    step_lines(228);
    ppu.flush_render_queue();

    EXPECT_EQ(ppu.get_last_rendered_line(), 0);
    for (int y = 0; y < 160; y++) {
        ASSERT_EQ(ppu.get_pixel(0, y), 0xFFFF0000u) << "line " << y;
    }
}

TEST_F(PPUTest, StatusRegisterWritesDoNotFlush) {
    step_lines(10);
    bus.write16(0x04000004, 0x0800);

    EXPECT_EQ(ppu.get_last_rendered_line(), 0);
}

TEST_F(PPUTest, ResetClearsTimingAndFramebuffer) {
    bus.write16(PALETTE, 0x001F);
    bus.write16(DISPCNT, 0x0080);
    step_lines(170);

    ppu.reset();

    EXPECT_EQ(ppu.get_scanline(), 0);
    EXPECT_EQ(ppu.get_last_rendered_line(), 0);
    EXPECT_EQ(ppu.get_pixel(0, 50), 0xFF000000u);
    EXPECT_EQ(bus.read16(0x04000006), 0);
}

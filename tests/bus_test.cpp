#include "bus.hpp"
#include "cartridge.hpp"
#include <gtest/gtest.h>
#include <utility>
#include <vector>

using namespace gba;

namespace {

class RecordingObserver : public IoWriteObserver {
public:
    void on_io_write(uint32_t offset, uint16_t value) override {
        writes.emplace_back(offset, value);
    }

    std::vector<std::pair<uint32_t, uint16_t>> writes;
};

} // namespace

class BusTest : public ::testing::Test {
protected:
    void SetUp() override {
        bus.connect_cartridge(&cartridge);
    }

    void load_rom(const std::vector<uint8_t>& image) {
        ASSERT_TRUE(cartridge.load(image.data(), image.size()));
    }

    Cartridge cartridge;
    Bus bus;
};

// ============================================================================
// RAM regions
// ============================================================================

TEST_F(BusTest, HalfwordRoundTripInWritableRegions) {
    const uint32_t addresses[] = {0x02000000, 0x0203FFFE, 0x03000000, 0x03007FFE,
                                  0x06000000, 0x06017FFE, 0x05000000, 0x050003FE};

    uint16_t value = 0x1234;
    for (uint32_t address : addresses) {
        bus.write16(address, value);
        EXPECT_EQ(bus.read16(address), value) << std::hex << address;
        value += 0x1111;
    }
}

TEST_F(BusTest, WordAccessIsLittleEndian) {
    bus.write32(0x02000100, 0xDDCCBBAA);

    EXPECT_EQ(bus.read8(0x02000100), 0xAA);
    EXPECT_EQ(bus.read8(0x02000103), 0xDD);
    EXPECT_EQ(bus.read16(0x02000102), 0xDDCC);
}

TEST_F(BusTest, RegionsMirrorInsideTheirWindow) {
    bus.write16(0x03000010, 0xBEEF);
    EXPECT_EQ(bus.read16(0x03008010), 0xBEEF);

    bus.write8(0x02000000, 0x5A);
    EXPECT_EQ(bus.read8(0x02040000), 0x5A);
}

TEST_F(BusTest, UnmappedReadsZeroAndIgnoresWrites) {
    bus.write32(0x01000000, 0xFFFFFFFF);
    bus.write32(0x0A000000, 0xFFFFFFFF);

    EXPECT_EQ(bus.read32(0x01000000), 0u);
    EXPECT_EQ(bus.read16(0x0A000000), 0u);
    EXPECT_EQ(bus.read8(0xFF000000), 0u);
    EXPECT_EQ(Bus::get_region(0x04000400), RegionId::Unmapped);
}

TEST_F(BusTest, ResetClearsMemoryAndRestoresKeys) {
    bus.write32(0x02000000, 0x12345678);
    bus.write16(0x05000000, 0x7FFF);
    bus.set_key_input(0);

    bus.reset();

    EXPECT_EQ(bus.read32(0x02000000), 0u);
    EXPECT_EQ(bus.palette_rgba(0), 0xFF000000u);
    EXPECT_EQ(bus.read16(0x04000130), 0x03FF);
}

// ============================================================================
// Palette cache
// ============================================================================

TEST_F(BusTest, PaletteCacheFollowsHalfwordWrites) {
    bus.write16(0x05000002, 0x7FFF);
    EXPECT_EQ(bus.palette_rgba(1), 0xFFFFFFFFu);

    bus.write16(0x05000002, 0x001F);
    EXPECT_EQ(bus.palette_rgba(1), 0xFF0000FFu);
}

TEST_F(BusTest, PaletteCacheFollowsByteWrites) {
    bus.write8(0x05000004, 0xE0);
    bus.write8(0x05000005, 0x03);

    EXPECT_EQ(bus.read16(0x05000004), 0x03E0);
    EXPECT_EQ(bus.palette_rgba(2), 0xFF00FF00u);
}

TEST_F(BusTest, PaletteCacheFollowsWordWrites) {
    bus.write32(0x05000008, 0x03E07C00);

    EXPECT_EQ(bus.palette_rgba(4), 0xFFFF0000u);
    EXPECT_EQ(bus.palette_rgba(5), 0xFF00FF00u);
    EXPECT_EQ(bus.palette_rgba(4), bgr555_to_rgba(bus.read16(0x05000008)));
}

TEST_F(BusTest, PaletteCacheCoversObjectPalette) {
    bus.write16(0x050003FE, 0x0421);
    EXPECT_EQ(bus.palette_rgba(511), bgr555_to_rgba(0x0421));
}

// ============================================================================
// Cartridge ROM
// ============================================================================

TEST_F(BusTest, RomReadsMirrorModuloImageLength) {
    load_rom({0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08});

    EXPECT_EQ(bus.read32(0x08000000), 0x04030201u);
    EXPECT_EQ(bus.read32(0x08000008), 0x04030201u);
    EXPECT_EQ(bus.read16(0x08000106), 0x0807);
    EXPECT_EQ(bus.read8(0x09000001), 0x02);
}

TEST_F(BusTest, RomReadsPastImageReturnSentinels) {
    load_rom({0x11, 0x22, 0x33, 0x44, 0x55, 0x66});

    EXPECT_EQ(bus.read32(0x08000004), 0xDEADBEEFu);
    EXPECT_EQ(bus.read16(0x08000004), 0x6655);
    EXPECT_EQ(bus.read8(0x08000005), 0x66);
}

TEST_F(BusTest, RomWithoutImageReturnsSentinels) {
    EXPECT_EQ(bus.read32(0x08000000), 0xDEADBEEFu);
    EXPECT_EQ(bus.read16(0x08000000), 0xFFFF);
    EXPECT_EQ(bus.read8(0x08000000), 0xFF);
}

TEST_F(BusTest, RomIgnoresWrites) {
    load_rom({0x01, 0x02, 0x03, 0x04});

    bus.write32(0x08000000, 0);
    bus.write8(0x08000001, 0);

    EXPECT_EQ(bus.read32(0x08000000), 0x04030201u);
}

TEST_F(BusTest, EmptyRomIsRejectedAndKeepsPreviousImage) {
    load_rom({0xAA, 0xBB, 0xCC, 0xDD});

    EXPECT_FALSE(cartridge.load(nullptr, 0));
    EXPECT_EQ(bus.read32(0x08000000), 0xDDCCBBAAu);
}

// ============================================================================
// BIOS
// ============================================================================

TEST_F(BusTest, BiosReadsZeroWithoutImage) {
    EXPECT_FALSE(bus.has_bios());
    EXPECT_EQ(bus.read32(0x00000000), 0u);
}

TEST_F(BusTest, BiosImageIsReadOnly) {
    const uint8_t image[] = {0x12, 0x34, 0x56, 0x78};
    ASSERT_TRUE(bus.load_bios(image, sizeof(image)));

    bus.write32(0x00000000, 0);

    EXPECT_TRUE(bus.has_bios());
    EXPECT_EQ(bus.read32(0x00000000), 0x78563412u);
    EXPECT_EQ(bus.read32(0x00000004), 0u);
}

TEST_F(BusTest, BiosRejectsEmptyAndOversizeImages) {
    std::vector<uint8_t> oversize(Bus::BIOS_SIZE + 1, 0xFF);

    EXPECT_FALSE(bus.load_bios(nullptr, 0));
    EXPECT_FALSE(bus.load_bios(oversize.data(), oversize.size()));
    EXPECT_FALSE(bus.has_bios());
}

TEST_F(BusTest, BiosSurvivesReset) {
    const uint8_t image[] = {0xAA};
    ASSERT_TRUE(bus.load_bios(image, sizeof(image)));

    bus.reset();

    EXPECT_EQ(bus.read8(0x00000000), 0xAA);
}

// ============================================================================
// IO registers
// ============================================================================

TEST_F(BusTest, DispstatStatusBitsAreReadOnly) {
    bus.set_io(0x004, 0x0001);

    bus.write16(0x04000004, 0xFF06);

    EXPECT_EQ(bus.read16(0x04000004), 0xFF01);
}

TEST_F(BusTest, VcountAndKeyinputIgnoreCpuWrites) {
    bus.set_io(0x006, 42);

    bus.write16(0x04000006, 7);
    bus.write16(0x04000130, 0);

    EXPECT_EQ(bus.read16(0x04000006), 42);
    EXPECT_EQ(bus.read16(0x04000130), 0x03FF);
}

TEST_F(BusTest, KeyInputIsMaskedToTenBits) {
    bus.set_key_input(0xFFFE);
    EXPECT_EQ(bus.read16(0x04000130), 0x03FE);
}

TEST_F(BusTest, ObserversSeeHalfwordWrites) {
    RecordingObserver observer;
    bus.add_io_observer(&observer);

    bus.write16(0x04000008, 0x1234);
    bus.write8(0x04000009, 0xAB);
    bus.write32(0x040000D4, 0x02000000);

    ASSERT_EQ(observer.writes.size(), 4u);
    EXPECT_EQ(observer.writes[0], std::make_pair(0x008u, uint16_t(0x1234)));
    EXPECT_EQ(observer.writes[1], std::make_pair(0x008u, uint16_t(0xAB34)));
    EXPECT_EQ(observer.writes[2], std::make_pair(0x0D4u, uint16_t(0x0000)));
    EXPECT_EQ(observer.writes[3], std::make_pair(0x0D6u, uint16_t(0x0200)));
}

TEST_F(BusTest, ReadOnlyRegistersDoNotNotify) {
    RecordingObserver observer;
    bus.add_io_observer(&observer);

    bus.write16(0x04000006, 1);
    bus.write16(0x04000130, 1);

    EXPECT_TRUE(observer.writes.empty());
}

TEST_F(BusTest, IoByteReadsSelectHalf) {
    bus.write16(0x04000208, 0x0201);

    EXPECT_EQ(bus.read8(0x04000208), 0x01);
    EXPECT_EQ(bus.read8(0x04000209), 0x02);
    EXPECT_EQ(bus.read32(0x04000208), 0x00000201u);
}

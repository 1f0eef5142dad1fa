#include "memory_region.hpp"
#include <gtest/gtest.h>

using namespace gba;

TEST(MemoryRegionTest, StoresLittleEndian) {
    MemoryRegion region("test", 0x02000000, 0x100);

    region.write32(0x02000010, 0x11223344);

    EXPECT_EQ(region.read8(0x02000010), 0x44);
    EXPECT_EQ(region.read8(0x02000013), 0x11);
    EXPECT_EQ(region.read16(0x02000012), 0x1122);
    EXPECT_EQ(region.read32(0x02000010), 0x11223344u);
}

TEST(MemoryRegionTest, AddressesWrapAtCapacity) {
    MemoryRegion region("test", 0x03000000, 0x100);

    region.write8(0x03000100, 0xAB);
    EXPECT_EQ(region.read8(0x03000000), 0xAB);

    // A word straddling the end continues at offset 0
    region.write32(0x030000FE, 0xCAFEBABE);
    EXPECT_EQ(region.byte_at(0xFE), 0xBE);
    EXPECT_EQ(region.byte_at(0xFF), 0xBA);
    EXPECT_EQ(region.byte_at(0x00), 0xFE);
    EXPECT_EQ(region.byte_at(0x01), 0xCA);
    EXPECT_EQ(region.read32(0x030000FE), 0xCAFEBABEu);
}

TEST(MemoryRegionTest, FillFromZeroesThenCopies) {
    MemoryRegion region("bios", 0, 8);
    region.write32(4, 0xFFFFFFFF);

    const uint8_t image[] = {1, 2, 3};
    region.fill_from(image, sizeof(image));

    EXPECT_EQ(region.read32(0), 0x00030201u);
    EXPECT_EQ(region.read32(4), 0u);
}

TEST(MemoryRegionTest, FillFromClampsToCapacity) {
    MemoryRegion region("small", 0, 4);
    const uint8_t image[] = {1, 2, 3, 4, 5, 6};

    region.fill_from(image, sizeof(image));

    EXPECT_STREQ(region.name(), "small");
    EXPECT_EQ(region.size(), 4u);
    EXPECT_EQ(region.read32(0), 0x04030201u);
}

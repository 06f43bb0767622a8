#include <gtest/gtest.h>

#include <array>

#include "Hardware/DescriptorLayout.hpp"

using namespace PCIA::HW;

//==============================================================================
// Wire layout
//==============================================================================

TEST(DescriptorLayoutTests, EncodesLittleEndianAtFixedOffsets) {
    DescriptorRecord record{};
    record.bufferAddress = 0x1122'3344'5566'7788ULL;
    record.length = 0x0000'0200u;
    record.flags = DescriptorFlags::kInterrupt | DescriptorFlags::kHardwareOwned;
    record.nextAddress = 0x0000'0001'0000'0018ULL;

    std::array<uint8_t, kDescriptorRecordSize> raw{};
    EncodeDescriptor(record, RecordBytes(raw));

    const std::array<uint8_t, kDescriptorRecordSize> expected = {
        0x88, 0x77, 0x66, 0x55, 0x44, 0x33, 0x22, 0x11,   // buffer address
        0x00, 0x02, 0x00, 0x00,                           // length
        0x01, 0x00, 0x00, 0x80,                           // flags
        0x18, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00,   // next
    };
    EXPECT_EQ(raw, expected);
}

TEST(DescriptorLayoutTests, DecodesEveryField) {
    const std::array<uint8_t, kDescriptorRecordSize> raw = {
        0x00, 0x10, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00,
        0x00, 0x01, 0x00, 0x00,
        0x06, 0x00, 0x00, 0x00,
        0x30, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00,
    };

    const DescriptorRecord record = DecodeDescriptor(ConstRecordBytes(raw));
    EXPECT_EQ(record.bufferAddress, 0x1'0000'1000ULL);
    EXPECT_EQ(record.length, 256u);
    EXPECT_EQ(record.flags, DescriptorFlags::kLastInChain | DescriptorFlags::kWrap);
    EXPECT_EQ(record.nextAddress, 0x1'0000'0030ULL);
}

TEST(DescriptorLayoutTests, FlagBitsMatchRegisterMap) {
    EXPECT_EQ(DescriptorFlags::kInterrupt, 0x1u);
    EXPECT_EQ(DescriptorFlags::kLastInChain, 0x2u);
    EXPECT_EQ(DescriptorFlags::kWrap, 0x4u);
    EXPECT_EQ(DescriptorFlags::kHardwareOwned, 0x8000'0000u);
}

TEST(DescriptorLayoutTests, RecordAddressIsBasePlusIndexTimes24) {
    EXPECT_EQ(DescriptorAddress(0x1000, 0), 0x1000u);
    EXPECT_EQ(DescriptorAddress(0x1000, 1), 0x1018u);
    EXPECT_EQ(DescriptorAddress(0x1000, 10), 0x1000u + 240u);
}

// ======================================================================
// \title  ChecksumTests.cpp
// \author campuzan
// \brief  Unit tests for the CFDP modular checksum
// ======================================================================

#include <Cfdpd/Ccsds/Cfdp/Types/Checksum.hpp>
#include <gtest/gtest.h>

using namespace Cfdpd;
using namespace Cfdpd::Ccsds::Cfdp;

class ChecksumTest : public ::testing::Test {
  protected:
    void SetUp() override {
        for (U32 i = 0; i < sizeof(this->m_data); ++i) {
            this->m_data[i] = static_cast<U8>((i * 31U) + 7U);
        }
    }

    U8 m_data[1000];
};

TEST_F(ChecksumTest, EmptyIsZero) {
    Checksum checksum;
    checksum.update(nullptr, 0, 0);
    EXPECT_EQ(0U, checksum.getValue());
}

TEST_F(ChecksumTest, AlignedWord) {
    const U8 data[] = {0x01, 0x02, 0x03, 0x04, 0x10, 0x20, 0x30, 0x40};
    Checksum checksum;
    checksum.update(data, 0, sizeof(data));
    EXPECT_EQ(0x01020304U + 0x10203040U, checksum.getValue());
}

TEST_F(ChecksumTest, TrailingBytesArePaddedWithZeros) {
    const U8 data[] = {0x01, 0x02, 0x03, 0x04, 0xAA, 0xBB};
    Checksum checksum;
    checksum.update(data, 0, sizeof(data));
    EXPECT_EQ(0x01020304U + 0xAABB0000U, checksum.getValue());
}

TEST_F(ChecksumTest, UnalignedOffsetUsesFilePosition) {
    // A single byte at file offset 5 lands in the second byte of word 1
    const U8 data[] = {0x7F};
    Checksum checksum;
    checksum.update(data, 5, sizeof(data));
    EXPECT_EQ(0x007F0000U, checksum.getValue());
}

TEST_F(ChecksumTest, WrapsModulo32Bits) {
    const U8 data[] = {0xFF, 0xFF, 0xFF, 0xFF, 0x00, 0x00, 0x00, 0x02};
    Checksum checksum;
    checksum.update(data, 0, sizeof(data));
    EXPECT_EQ(1U, checksum.getValue());
}

// Segments arriving in any order and split anywhere sum to the same value
TEST_F(ChecksumTest, SegmentOrderDoesNotMatter) {
    Checksum whole;
    whole.update(this->m_data, 0, sizeof(this->m_data));

    Checksum pieces;
    pieces.update(this->m_data + 501, 501, 499);
    pieces.update(this->m_data + 3, 3, 250);
    pieces.update(this->m_data, 0, 3);
    pieces.update(this->m_data + 253, 253, 248);

    EXPECT_EQ(whole, pieces);
    EXPECT_EQ(whole.getValue(), pieces.getValue());
}

TEST_F(ChecksumTest, DifferentDataDiffers) {
    Checksum first;
    first.update(this->m_data, 0, sizeof(this->m_data));

    this->m_data[500] ^= 0x01;
    Checksum second;
    second.update(this->m_data, 0, sizeof(this->m_data));

    EXPECT_NE(first, second);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

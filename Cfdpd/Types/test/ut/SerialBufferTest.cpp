// ======================================================================
// \title  SerialBufferTest.cpp
// \author campuzan
// \brief  cpp file for SerialBuffer unit tests
// ======================================================================

#include <gtest/gtest.h>

#include <Cfdpd/Types/Assert.hpp>
#include <Cfdpd/Types/SerialBuffer.hpp>

using namespace Cfdpd;

class SerialBufferTest : public ::testing::Test {
  protected:
    U8 m_storage[16];
};

// Values go out most significant byte first
TEST_F(SerialBufferTest, NetworkByteOrder) {
    SerialBuffer buffer(this->m_storage, sizeof(this->m_storage));

    ASSERT_EQ(FW_SERIALIZE_OK, buffer.serializeFrom(static_cast<U8>(0xA1)));
    ASSERT_EQ(FW_SERIALIZE_OK, buffer.serializeFrom(static_cast<U16>(0xB2C3)));
    ASSERT_EQ(FW_SERIALIZE_OK, buffer.serializeFrom(static_cast<U32>(0x01020304)));
    EXPECT_EQ(7U, buffer.getSize());

    const U8 expected[] = {0xA1, 0xB2, 0xC3, 0x01, 0x02, 0x03, 0x04};
    for (U32 i = 0; i < sizeof(expected); ++i) {
        EXPECT_EQ(expected[i], this->m_storage[i]) << "byte " << i;
    }

    U8 u8 = 0;
    U16 u16 = 0;
    U32 u32 = 0;
    ASSERT_EQ(FW_SERIALIZE_OK, buffer.deserializeTo(u8));
    ASSERT_EQ(FW_SERIALIZE_OK, buffer.deserializeTo(u16));
    ASSERT_EQ(FW_SERIALIZE_OK, buffer.deserializeTo(u32));
    EXPECT_EQ(0xA1, u8);
    EXPECT_EQ(0xB2C3, u16);
    EXPECT_EQ(0x01020304U, u32);
    EXPECT_EQ(0U, buffer.getDeserializeSizeLeft());
}

// Variable width integers as used for entity IDs and sequence numbers
TEST_F(SerialBufferTest, VariableWidth) {
    SerialBuffer buffer(this->m_storage, sizeof(this->m_storage));

    ASSERT_EQ(FW_SERIALIZE_OK, buffer.serializeUint(0x123456, 3));
    ASSERT_EQ(FW_SERIALIZE_OK, buffer.serializeUint(0x0102030405060708ULL, 8));
    EXPECT_EQ(11U, buffer.getSize());
    EXPECT_EQ(0x12, this->m_storage[0]);
    EXPECT_EQ(0x56, this->m_storage[2]);

    U64 value = 0;
    ASSERT_EQ(FW_SERIALIZE_OK, buffer.deserializeUint(value, 3));
    EXPECT_EQ(0x123456U, value);
    ASSERT_EQ(FW_SERIALIZE_OK, buffer.deserializeUint(value, 8));
    EXPECT_EQ(0x0102030405060708ULL, value);

    EXPECT_EQ(FW_DESERIALIZE_FORMAT_ERROR, buffer.deserializeUint(value, 9));
}

TEST_F(SerialBufferTest, NoRoomLeft) {
    SerialBuffer buffer(this->m_storage, 3);

    ASSERT_EQ(FW_SERIALIZE_OK, buffer.serializeFrom(static_cast<U16>(1)));
    EXPECT_EQ(FW_SERIALIZE_NO_ROOM_LEFT, buffer.serializeFrom(static_cast<U32>(2)));
    EXPECT_EQ(2U, buffer.getSize());

    const U8 bytes[] = {1, 2};
    EXPECT_EQ(FW_SERIALIZE_NO_ROOM_LEFT, buffer.pushBytes(bytes, sizeof(bytes)));
    EXPECT_EQ(FW_SERIALIZE_OK, buffer.pushBytes(bytes, 1));
}

TEST_F(SerialBufferTest, ReadPastEnd) {
    SerialBuffer buffer(this->m_storage, sizeof(this->m_storage));
    buffer.setBuffLen(3);

    U32 value = 0;
    EXPECT_EQ(FW_DESERIALIZE_BUFFER_EMPTY, buffer.deserializeTo(value));
    EXPECT_EQ(0U, buffer.getDeserializeLocation());

    U8 out[4];
    EXPECT_EQ(FW_DESERIALIZE_BUFFER_EMPTY, buffer.popBytes(out, 4));
    EXPECT_EQ(FW_SERIALIZE_OK, buffer.skipBytes(2));
    EXPECT_EQ(1U, buffer.getDeserializeSizeLeft());
    EXPECT_EQ(FW_DESERIALIZE_BUFFER_EMPTY, buffer.skipBytes(2));
}

TEST_F(SerialBufferTest, RawBytes) {
    SerialBuffer buffer(this->m_storage, sizeof(this->m_storage));
    const U8 in[] = {9, 8, 7, 6, 5};
    ASSERT_EQ(FW_SERIALIZE_OK, buffer.pushBytes(in, sizeof(in)));

    U8 out[5] = {0};
    ASSERT_EQ(FW_SERIALIZE_OK, buffer.popBytes(out, sizeof(out)));
    for (U32 i = 0; i < sizeof(in); ++i) {
        EXPECT_EQ(in[i], out[i]);
    }
    EXPECT_EQ(this->m_storage + 5, buffer.getDeserializePointer());

    buffer.resetDeser();
    EXPECT_EQ(5U, buffer.getDeserializeSizeLeft());
    buffer.resetSer();
    EXPECT_EQ(0U, buffer.getSize());
}

TEST_F(SerialBufferTest, FillExposesWholeCapacity) {
    SerialBuffer buffer(this->m_storage, sizeof(this->m_storage));
    EXPECT_EQ(sizeof(this->m_storage), buffer.getCapacity());
    EXPECT_TRUE(buffer.getBuffAddr() == this->m_storage);
    buffer.fill();
    EXPECT_EQ(sizeof(this->m_storage), buffer.getDeserializeSizeLeft());
}

TEST_F(SerialBufferTest, StatusNames) {
    EXPECT_STREQ("NO_ROOM_LEFT", serializeStatusName(FW_SERIALIZE_NO_ROOM_LEFT));
}

TEST(SerialBufferDeathTest, LengthBeyondCapacityAsserts) {
    U8 storage[4];
    SerialBuffer buffer(storage, sizeof(storage));
    EXPECT_DEATH(buffer.setBuffLen(5), "length <= this->m_capacity");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

// ======================================================================
// \title  SerialBuffer.cpp
// \author campuzan
// \brief  cpp file for big-endian serialization
// ======================================================================

#include <Cfdpd/Types/SerialBuffer.hpp>
#include <Cfdpd/Types/Assert.hpp>

#include <cstring>

namespace Cfdpd {

const char* serializeStatusName(SerializeStatus status) {
    switch (status) {
        case FW_SERIALIZE_OK:
            return "OK";
        case FW_SERIALIZE_NO_ROOM_LEFT:
            return "NO_ROOM_LEFT";
        case FW_DESERIALIZE_BUFFER_EMPTY:
            return "BUFFER_EMPTY";
        case FW_DESERIALIZE_FORMAT_ERROR:
            return "FORMAT_ERROR";
        case FW_DESERIALIZE_SIZE_MISMATCH:
            return "SIZE_MISMATCH";
        case FW_DESERIALIZE_TYPE_MISMATCH:
            return "TYPE_MISMATCH";
        default:
            return "UNKNOWN";
    }
}

SerialBuffer::SerialBuffer(U8* data, FwSizeType capacity)
    : m_data(data), m_capacity(capacity), m_serLoc(0), m_deserLoc(0) {
    CFDPD_ASSERT(data != nullptr || capacity == 0);
}

SerializeStatus SerialBuffer::serializeFrom(U8 value) {
    return this->serializeUint(value, sizeof(value));
}

SerializeStatus SerialBuffer::serializeFrom(U16 value) {
    return this->serializeUint(value, sizeof(value));
}

SerializeStatus SerialBuffer::serializeFrom(U32 value) {
    return this->serializeUint(value, sizeof(value));
}

SerializeStatus SerialBuffer::serializeFrom(U64 value) {
    return this->serializeUint(value, sizeof(value));
}

SerializeStatus SerialBuffer::serializeUint(U64 value, U8 width) {
    CFDPD_ASSERT(width >= 1 && width <= 8, width);
    if (this->m_serLoc + width > this->m_capacity) {
        return FW_SERIALIZE_NO_ROOM_LEFT;
    }
    for (U8 i = 0; i < width; ++i) {
        const U8 shift = static_cast<U8>((width - 1 - i) * 8);
        this->m_data[this->m_serLoc++] = static_cast<U8>((value >> shift) & 0xFF);
    }
    return FW_SERIALIZE_OK;
}

SerializeStatus SerialBuffer::pushBytes(const U8* data, FwSizeType length) {
    if (length == 0) {
        return FW_SERIALIZE_OK;
    }
    CFDPD_ASSERT(data != nullptr);
    if (this->m_serLoc + length > this->m_capacity) {
        return FW_SERIALIZE_NO_ROOM_LEFT;
    }
    memcpy(this->m_data + this->m_serLoc, data, length);
    this->m_serLoc += length;
    return FW_SERIALIZE_OK;
}

SerializeStatus SerialBuffer::deserializeTo(U8& value) {
    U64 raw = 0;
    SerializeStatus status = this->deserializeUint(raw, sizeof(value));
    value = static_cast<U8>(raw);
    return status;
}

SerializeStatus SerialBuffer::deserializeTo(U16& value) {
    U64 raw = 0;
    SerializeStatus status = this->deserializeUint(raw, sizeof(value));
    value = static_cast<U16>(raw);
    return status;
}

SerializeStatus SerialBuffer::deserializeTo(U32& value) {
    U64 raw = 0;
    SerializeStatus status = this->deserializeUint(raw, sizeof(value));
    value = static_cast<U32>(raw);
    return status;
}

SerializeStatus SerialBuffer::deserializeTo(U64& value) {
    return this->deserializeUint(value, sizeof(value));
}

SerializeStatus SerialBuffer::deserializeUint(U64& value, U8 width) {
    if (width < 1 || width > 8) {
        return FW_DESERIALIZE_FORMAT_ERROR;
    }
    if (this->getDeserializeSizeLeft() < width) {
        return FW_DESERIALIZE_BUFFER_EMPTY;
    }
    value = 0;
    for (U8 i = 0; i < width; ++i) {
        value = (value << 8) | this->m_data[this->m_deserLoc++];
    }
    return FW_SERIALIZE_OK;
}

SerializeStatus SerialBuffer::popBytes(U8* data, FwSizeType length) {
    if (this->getDeserializeSizeLeft() < length) {
        return FW_DESERIALIZE_BUFFER_EMPTY;
    }
    if (length > 0) {
        CFDPD_ASSERT(data != nullptr);
        memcpy(data, this->m_data + this->m_deserLoc, length);
        this->m_deserLoc += length;
    }
    return FW_SERIALIZE_OK;
}

SerializeStatus SerialBuffer::skipBytes(FwSizeType length) {
    if (this->getDeserializeSizeLeft() < length) {
        return FW_DESERIALIZE_BUFFER_EMPTY;
    }
    this->m_deserLoc += length;
    return FW_SERIALIZE_OK;
}

void SerialBuffer::resetSer() {
    this->m_serLoc = 0;
    this->m_deserLoc = 0;
}

void SerialBuffer::resetDeser() {
    this->m_deserLoc = 0;
}

void SerialBuffer::fill() {
    this->m_serLoc = this->m_capacity;
}

void SerialBuffer::setBuffLen(FwSizeType length) {
    CFDPD_ASSERT(length <= this->m_capacity, static_cast<FwAssertArgType>(length),
                 static_cast<FwAssertArgType>(this->m_capacity));
    this->m_serLoc = length;
    this->m_deserLoc = 0;
}

}  // namespace Cfdpd

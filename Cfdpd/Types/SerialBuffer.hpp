// ======================================================================
// \title  SerialBuffer.hpp
// \author campuzan
// \brief  Big-endian serialization over a caller-owned byte region
// ======================================================================

#ifndef Cfdpd_Types_SerialBuffer_HPP
#define Cfdpd_Types_SerialBuffer_HPP

#include <Cfdpd/Types/BasicTypes.hpp>

namespace Cfdpd {

//! Result of a serialize or deserialize operation
enum SerializeStatus {
    FW_SERIALIZE_OK,                 //!< Operation succeeded
    FW_SERIALIZE_NO_ROOM_LEFT,       //!< No room left in the buffer to serialize
    FW_DESERIALIZE_BUFFER_EMPTY,     //!< Deserialization ran past the end of the data
    FW_DESERIALIZE_FORMAT_ERROR,     //!< Deserialization found an invalid encoding
    FW_DESERIALIZE_SIZE_MISMATCH,    //!< A length field was out of range
    FW_DESERIALIZE_TYPE_MISMATCH     //!< Data was not of the expected type
};

//! Human readable name of a SerializeStatus
const char* serializeStatusName(SerializeStatus status);

//! \class SerialBuffer
//! \brief Reads and writes network-order integers in a fixed region
//!
//! The buffer does not own its storage. Serialization appends at the
//! serialize location; deserialization consumes from the deserialize
//! location up to the serialized length.
class SerialBuffer {
  public:
    //! Construct over the given storage
    SerialBuffer(U8* data, FwSizeType capacity);

    SerializeStatus serializeFrom(U8 value);
    SerializeStatus serializeFrom(U16 value);
    SerializeStatus serializeFrom(U32 value);
    SerializeStatus serializeFrom(U64 value);

    //! Serialize the low `width` bytes of value, most significant first
    SerializeStatus serializeUint(U64 value, U8 width);

    //! Append raw bytes
    SerializeStatus pushBytes(const U8* data, FwSizeType length);

    SerializeStatus deserializeTo(U8& value);
    SerializeStatus deserializeTo(U16& value);
    SerializeStatus deserializeTo(U32& value);
    SerializeStatus deserializeTo(U64& value);

    //! Deserialize a `width` byte big-endian unsigned integer
    SerializeStatus deserializeUint(U64& value, U8 width);

    //! Copy raw bytes out of the buffer
    SerializeStatus popBytes(U8* data, FwSizeType length);

    //! Skip bytes without copying them
    SerializeStatus skipBytes(FwSizeType length);

    //! Reset the serialize location to the start (empties the buffer)
    void resetSer();

    //! Reset the deserialize location to the start
    void resetDeser();

    //! Mark the whole capacity as serialized data
    void fill();

    //! Mark the first `length` bytes as serialized data
    void setBuffLen(FwSizeType length);

    //! Number of bytes serialized
    FwSizeType getSize() const { return this->m_serLoc; }

    //! Size of the underlying storage
    FwSizeType getCapacity() const { return this->m_capacity; }

    //! Bytes remaining to be deserialized
    FwSizeType getDeserializeSizeLeft() const { return this->m_serLoc - this->m_deserLoc; }

    //! Bytes already deserialized
    FwSizeType getDeserializeLocation() const { return this->m_deserLoc; }

    //! Pointer to the next byte to be deserialized
    const U8* getDeserializePointer() const { return this->m_data + this->m_deserLoc; }

    U8* getBuffAddr() { return this->m_data; }
    const U8* getBuffAddr() const { return this->m_data; }

  private:
    U8* m_data;
    FwSizeType m_capacity;
    FwSizeType m_serLoc;
    FwSizeType m_deserLoc;
};

}  // namespace Cfdpd

#endif  // Cfdpd_Types_SerialBuffer_HPP

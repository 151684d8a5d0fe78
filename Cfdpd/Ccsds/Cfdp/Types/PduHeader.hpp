// ======================================================================
// \title  PduHeader.hpp
// \author campuzan
// \brief  hpp file for CFDP PDU Header
// ======================================================================

#ifndef Cfdpd_Ccsds_Cfdp_PduHeader_HPP
#define Cfdpd_Ccsds_Cfdp_PduHeader_HPP

#include <Cfdpd/Types/BasicTypes.hpp>
#include <Cfdpd/Types/SerialBuffer.hpp>
#include <Cfdpd/Ccsds/Cfdp/Types/Types.hpp>

namespace Cfdpd {
namespace Ccsds {
namespace Cfdp {

// CFDP PDU Type
enum PduType : U8 {
    PDU_TYPE_DIRECTIVE = 0,  // File directive PDU
    PDU_TYPE_FILE_DATA = 1   // File data PDU
};

// CFDP Direction
enum PduDirection : U8 {
    DIRECTION_TOWARD_RECEIVER = 0,  // Toward file receiver
    DIRECTION_TOWARD_SENDER = 1     // Toward file sender
};

// CFDP CRC Flag
enum CrcFlag : U8 {
    CRC_NOT_PRESENT = 0,  // CRC not present
    CRC_PRESENT = 1       // CRC present
};

// CFDP Large File Flag
enum LargeFileFlag : U8 {
    LARGE_FILE_32_BIT = 0,  // 32-bit file size
    LARGE_FILE_64_BIT = 1   // 64-bit file size
};

// PDU type enum (discriminator for the union and for type identification)
enum PduTypeEnum : U8 {
    T_METADATA = 0,
    T_EOF = 1,
    T_FIN = 2,
    T_ACK = 3,
    T_NAK = 4,
    T_FILE_DATA = 5,
    T_NONE = 255
};

//! The type of a PDU header (common to all PDUs)
class PduHeader {
  private:
    //! PDU type (derived from directive code or file data flag)
    PduTypeEnum m_type;

    //! CFDP version (should be 1)
    U8 m_version;

    //! PDU type
    PduType m_pduType;

    //! Direction
    PduDirection m_direction;

    //! Transmission mode
    Class::T m_class;

    //! CRC flag
    CrcFlag m_crcFlag;

    //! Large file flag
    LargeFileFlag m_largeFileFlag;

    //! Segmentation control
    U8 m_segmentationControl;

    //! Segment metadata flag
    U8 m_segmentMetadataFlag;

    //! PDU data length (excluding header)
    U16 m_pduDataLength;

    //! Source entity ID
    EntityId m_sourceEid;

    //! Transaction sequence number
    TransactionSeq m_transactionSeq;

    //! Destination entity ID
    EntityId m_destEid;

  public:
    //! Fixed leading portion: flags, data length, eid/tsn lengths
    enum { FIXED_PREFIX_SIZE = 4 };

    //! Smallest possible header: the prefix plus one byte per variable field
    enum { MIN_HEADERSIZE = 7 };

    PduHeader();

    //! Initialize a PDU header
    void initialize(PduTypeEnum type,
                    PduDirection direction,
                    Class::T txmMode,
                    EntityId sourceEid,
                    TransactionSeq transactionSeq,
                    EntityId destEid);

    //! Compute the buffer size needed to hold this Header
    U32 getBufferSize() const;

    //! Calculate the number of bytes needed to encode a value
    //! @param value The value to encode
    //! @return Number of bytes needed, 1 through 8
    static U8 getValueEncodedSize(U64 value);

    //! Compute the full encoded PDU length from the fixed header prefix
    //! @param prefix At least FIXED_PREFIX_SIZE bytes of an encoded PDU
    //! @param totalLength Set to header size plus data length on success
    //! @return FW_DESERIALIZE_FORMAT_ERROR if the version is not 1
    static SerializeStatus getTotalLength(const U8* prefix, FwSizeType& totalLength);

    //! Initialize this Header from a SerialBuffer
    SerializeStatus fromSerialBuffer(SerialBuffer& serialBuffer);

    //! Write this Header to a SerialBuffer
    SerializeStatus toSerialBuffer(SerialBuffer& serialBuffer) const;

    //! Get the PDU type
    PduTypeEnum getType() const { return this->m_type; }

    //! Set the PDU type once the directive code is known
    void setType(PduTypeEnum type) { this->m_type = type; }

    //! Get the wire PDU type
    PduType getPduType() const { return this->m_pduType; }

    //! Get the direction
    PduDirection getDirection() const { return this->m_direction; }

    //! Get the transmission mode
    Class::T getTxmMode() const { return this->m_class; }

    //! Get the source entity ID
    EntityId getSourceEid() const { return this->m_sourceEid; }

    //! Get the transaction sequence number
    TransactionSeq getTransactionSeq() const { return this->m_transactionSeq; }

    //! Get the destination entity ID
    EntityId getDestEid() const { return this->m_destEid; }

    //! Get the transaction this PDU belongs to
    TransactionId getTransactionId() const { return TransactionId(this->m_sourceEid, this->m_transactionSeq); }

    //! Get PDU data length
    U16 getPduDataLength() const { return this->m_pduDataLength; }

    //! Set PDU data length (used during encoding)
    void setPduDataLength(U16 length) { this->m_pduDataLength = length; }

    //! Get the CRC flag
    CrcFlag getCrcFlag() const { return this->m_crcFlag; }

    //! Get the large file flag
    LargeFileFlag getLargeFileFlag() const { return this->m_largeFileFlag; }

    //! Check if segment metadata is present
    bool hasSegmentMetadata() const { return this->m_segmentMetadataFlag != 0; }

    //! Set the large file flag (used for testing)
    void setLargeFileFlag(LargeFileFlag flag) { this->m_largeFileFlag = flag; }
};

}  // namespace Cfdp
}  // namespace Ccsds
}  // namespace Cfdpd

#endif  // Cfdpd_Ccsds_Cfdp_PduHeader_HPP

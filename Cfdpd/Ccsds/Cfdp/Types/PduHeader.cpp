// ======================================================================
// \title  PduHeader.cpp
// \author campuzan
// \brief  cpp file for CFDP PDU Header
// ======================================================================

#include <Cfdpd/Ccsds/Cfdp/Types/PduHeader.hpp>
#include <Cfdpd/Types/Assert.hpp>

namespace Cfdpd {
namespace Ccsds {
namespace Cfdp {

namespace {

// Transmission mode bit: 0 = acknowledged, 1 = unacknowledged
U8 classToModeBit(Class::T txmMode) {
    return (txmMode == Class::CLASS_1) ? 1 : 0;
}

Class::T modeBitToClass(U8 bit) {
    return (bit != 0) ? Class::CLASS_1 : Class::CLASS_2;
}

}  // namespace

PduHeader::PduHeader()
    : m_type(T_NONE),
      m_version(1),
      m_pduType(PDU_TYPE_DIRECTIVE),
      m_direction(DIRECTION_TOWARD_RECEIVER),
      m_class(Class::CLASS_2),
      m_crcFlag(CRC_NOT_PRESENT),
      m_largeFileFlag(LARGE_FILE_32_BIT),
      m_segmentationControl(0),
      m_segmentMetadataFlag(0),
      m_pduDataLength(0),
      m_sourceEid(0),
      m_transactionSeq(0),
      m_destEid(0) {}

void PduHeader::initialize(PduTypeEnum type,
                           PduDirection direction,
                           Class::T txmMode,
                           EntityId sourceEid,
                           TransactionSeq transactionSeq,
                           EntityId destEid) {
    this->m_type = type;
    this->m_version = 1;  // CFDP version is always 1
    this->m_pduType = (type == T_FILE_DATA) ? PDU_TYPE_FILE_DATA : PDU_TYPE_DIRECTIVE;
    this->m_direction = direction;
    this->m_class = txmMode;
    this->m_crcFlag = CRC_NOT_PRESENT;          // CRC not supported
    this->m_largeFileFlag = LARGE_FILE_32_BIT;  // 32-bit file sizes
    this->m_segmentationControl = 0;
    this->m_segmentMetadataFlag = 0;
    this->m_pduDataLength = 0;  // Set when encoding
    this->m_sourceEid = sourceEid;
    this->m_transactionSeq = transactionSeq;
    this->m_destEid = destEid;
}

U8 PduHeader::getValueEncodedSize(U64 value) {
    U8 minSize;
    U64 limit = 0x100;

    for (minSize = 1; minSize < 8 && value >= limit; ++minSize) {
        limit <<= 8;
    }

    return minSize;
}

SerializeStatus PduHeader::getTotalLength(const U8* prefix, FwSizeType& totalLength) {
    CFDPD_ASSERT(prefix != nullptr);
    const U8 version = static_cast<U8>((prefix[0] >> 5) & 0x07);
    if (version != 1) {
        return FW_DESERIALIZE_FORMAT_ERROR;
    }
    const U16 dataLength = static_cast<U16>((static_cast<U16>(prefix[1]) << 8) | prefix[2]);
    const U8 eidSize = static_cast<U8>(((prefix[3] >> 4) & 0x07) + 1);
    const U8 tsnSize = static_cast<U8>((prefix[3] & 0x07) + 1);
    totalLength = FIXED_PREFIX_SIZE + 2U * eidSize + tsnSize + dataLength;
    return FW_SERIALIZE_OK;
}

U32 PduHeader::getBufferSize() const {
    // Fixed portion: flags(1) + length(2) + eidTsnLengths(1) = 4 bytes
    U32 size = FIXED_PREFIX_SIZE;

    // Variable-size entity IDs and transaction sequence number based on actual values
    U8 eidSize = getValueEncodedSize(this->m_sourceEid > this->m_destEid ? this->m_sourceEid : this->m_destEid);
    U8 tsnSize = getValueEncodedSize(this->m_transactionSeq);

    size += eidSize;  // source EID
    size += tsnSize;  // transaction sequence number
    size += eidSize;  // destination EID

    return size;
}

SerializeStatus PduHeader::toSerialBuffer(SerialBuffer& serialBuffer) const {
    SerializeStatus status;

    U8 eidSize = getValueEncodedSize(this->m_sourceEid > this->m_destEid ? this->m_sourceEid : this->m_destEid);
    U8 tsnSize = getValueEncodedSize(this->m_transactionSeq);

    // Byte 0: flags
    // bits 7-5: version (001b = 1)
    // bit 4: pdu_type (0=directive, 1=file data)
    // bit 3: direction (0=toward receiver, 1=toward sender)
    // bit 2: txm_mode (0=ack, 1=unack)
    // bit 1: crc_flag (0=not present, 1=present)
    // bit 0: large_file_flag (0=32-bit, 1=64-bit)
    U8 flags = 0;
    flags |= static_cast<U8>((this->m_version & 0x07) << 5);
    flags |= static_cast<U8>((this->m_pduType & 0x01) << 4);
    flags |= static_cast<U8>((this->m_direction & 0x01) << 3);
    flags |= static_cast<U8>((classToModeBit(this->m_class) & 0x01) << 2);
    flags |= static_cast<U8>((this->m_crcFlag & 0x01) << 1);
    flags |= static_cast<U8>(this->m_largeFileFlag & 0x01);

    status = serialBuffer.serializeFrom(flags);
    if (status != FW_SERIALIZE_OK) {
        return status;
    }

    // Bytes 1-2: PDU data length (big-endian)
    status = serialBuffer.serializeFrom(this->m_pduDataLength);
    if (status != FW_SERIALIZE_OK) {
        return status;
    }

    // Byte 3: eidTsnLengths
    // bit 7: segmentation_control
    // bits 6-4: eid_length - 1 (3 bits)
    // bit 3: segment_metadata_flag
    // bits 2-0: tsn_length - 1 (3 bits)
    U8 eidTsnLengths = 0;
    eidTsnLengths |= static_cast<U8>((this->m_segmentationControl & 0x01) << 7);
    eidTsnLengths |= static_cast<U8>(((eidSize - 1) & 0x07) << 4);
    eidTsnLengths |= static_cast<U8>((this->m_segmentMetadataFlag & 0x01) << 3);
    eidTsnLengths |= static_cast<U8>((tsnSize - 1) & 0x07);

    status = serialBuffer.serializeFrom(eidTsnLengths);
    if (status != FW_SERIALIZE_OK) {
        return status;
    }

    status = serialBuffer.serializeUint(this->m_sourceEid, eidSize);
    if (status != FW_SERIALIZE_OK) {
        return status;
    }

    status = serialBuffer.serializeUint(this->m_transactionSeq, tsnSize);
    if (status != FW_SERIALIZE_OK) {
        return status;
    }

    return serialBuffer.serializeUint(this->m_destEid, eidSize);
}

SerializeStatus PduHeader::fromSerialBuffer(SerialBuffer& serialBuffer) {
    SerializeStatus status;

    U8 flags;
    status = serialBuffer.deserializeTo(flags);
    if (status != FW_SERIALIZE_OK) {
        return status;
    }

    this->m_version = static_cast<U8>((flags >> 5) & 0x07);
    this->m_pduType = static_cast<PduType>((flags >> 4) & 0x01);
    this->m_direction = static_cast<PduDirection>((flags >> 3) & 0x01);
    this->m_class = modeBitToClass(static_cast<U8>((flags >> 2) & 0x01));
    this->m_crcFlag = static_cast<CrcFlag>((flags >> 1) & 0x01);
    this->m_largeFileFlag = static_cast<LargeFileFlag>(flags & 0x01);

    if (this->m_version != 1) {
        return FW_DESERIALIZE_FORMAT_ERROR;
    }

    // 64-bit file sizes and CRC trailers are not supported
    if (this->m_largeFileFlag != LARGE_FILE_32_BIT || this->m_crcFlag != CRC_NOT_PRESENT) {
        return FW_DESERIALIZE_FORMAT_ERROR;
    }

    status = serialBuffer.deserializeTo(this->m_pduDataLength);
    if (status != FW_SERIALIZE_OK) {
        return status;
    }

    U8 eidTsnLengths;
    status = serialBuffer.deserializeTo(eidTsnLengths);
    if (status != FW_SERIALIZE_OK) {
        return status;
    }

    this->m_segmentationControl = static_cast<U8>((eidTsnLengths >> 7) & 0x01);
    const U8 eidSize = static_cast<U8>(((eidTsnLengths >> 4) & 0x07) + 1);
    this->m_segmentMetadataFlag = static_cast<U8>((eidTsnLengths >> 3) & 0x01);
    const U8 tsnSize = static_cast<U8>((eidTsnLengths & 0x07) + 1);

    // Entity IDs and sequence numbers are 32 bits locally
    if (eidSize > sizeof(EntityId) || tsnSize > sizeof(TransactionSeq)) {
        return FW_DESERIALIZE_SIZE_MISMATCH;
    }

    U64 value = 0;
    status = serialBuffer.deserializeUint(value, eidSize);
    if (status != FW_SERIALIZE_OK) {
        return status;
    }
    this->m_sourceEid = static_cast<EntityId>(value);

    status = serialBuffer.deserializeUint(value, tsnSize);
    if (status != FW_SERIALIZE_OK) {
        return status;
    }
    this->m_transactionSeq = static_cast<TransactionSeq>(value);

    status = serialBuffer.deserializeUint(value, eidSize);
    if (status != FW_SERIALIZE_OK) {
        return status;
    }
    this->m_destEid = static_cast<EntityId>(value);

    // The data length must account for exactly the bytes that follow
    if (serialBuffer.getDeserializeSizeLeft() != this->m_pduDataLength) {
        return FW_DESERIALIZE_SIZE_MISMATCH;
    }

    // For directive PDUs, type is set once the directive code is read
    this->m_type = (this->m_pduType == PDU_TYPE_FILE_DATA) ? T_FILE_DATA : T_NONE;

    return FW_SERIALIZE_OK;
}

}  // namespace Cfdp
}  // namespace Ccsds
}  // namespace Cfdpd

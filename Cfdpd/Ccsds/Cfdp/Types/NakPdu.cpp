// ======================================================================
// \title  NakPdu.cpp
// \author campuzan
// \brief  cpp file for CFDP NAK (Negative Acknowledge) PDU
// ======================================================================

#include <Cfdpd/Ccsds/Cfdp/Types/NakPdu.hpp>

namespace Cfdpd {
namespace Ccsds {
namespace Cfdp {

void NakPdu::initialize(PduDirection direction,
                        Class::T txmMode,
                        EntityId sourceEid,
                        TransactionSeq transactionSeq,
                        EntityId destEid,
                        FileSize scopeStart,
                        FileSize scopeEnd) {
    this->m_header.initialize(T_NAK, direction, txmMode, sourceEid, transactionSeq, destEid);

    this->m_scopeStart = scopeStart;
    this->m_scopeEnd = scopeEnd;
    this->m_numSegments = 0;
}

bool NakPdu::addSegment(FileSize offsetStart, FileSize offsetEnd) {
    if (this->m_numSegments >= CFDP_NAK_MAX_SEGMENTS) {
        return false;
    }
    this->m_segments[this->m_numSegments].offsetStart = offsetStart;
    this->m_segments[this->m_numSegments].offsetEnd = offsetEnd;
    this->m_numSegments++;
    return true;
}

U32 NakPdu::getBufferSize() const {
    U32 size = this->m_header.getBufferSize();

    // Directive code, scope start, scope end, then the segment pairs
    size += static_cast<U32>(sizeof(U8) + sizeof(FileSize) + sizeof(FileSize));
    size += static_cast<U32>(this->m_numSegments * (sizeof(FileSize) + sizeof(FileSize)));

    return size;
}

SerializeStatus NakPdu::serializeBody(SerialBuffer& serialBuffer) const {
    SerializeStatus status = serialBuffer.serializeFrom(this->m_scopeStart);
    if (status != FW_SERIALIZE_OK) {
        return status;
    }

    status = serialBuffer.serializeFrom(this->m_scopeEnd);
    if (status != FW_SERIALIZE_OK) {
        return status;
    }

    for (U8 i = 0; i < this->m_numSegments; i++) {
        status = serialBuffer.serializeFrom(this->m_segments[i].offsetStart);
        if (status != FW_SERIALIZE_OK) {
            return status;
        }

        status = serialBuffer.serializeFrom(this->m_segments[i].offsetEnd);
        if (status != FW_SERIALIZE_OK) {
            return status;
        }
    }

    return FW_SERIALIZE_OK;
}

SerializeStatus NakPdu::deserializeBody(SerialBuffer& serialBuffer) {
    SerializeStatus status = serialBuffer.deserializeTo(this->m_scopeStart);
    if (status != FW_SERIALIZE_OK) {
        return status;
    }

    status = serialBuffer.deserializeTo(this->m_scopeEnd);
    if (status != FW_SERIALIZE_OK) {
        return status;
    }

    // Number of segment requests follows from the remaining bytes
    const FwSizeType remainingBytes = serialBuffer.getDeserializeSizeLeft();
    const U32 segmentSize = sizeof(FileSize) + sizeof(FileSize);
    if ((remainingBytes % segmentSize) != 0) {
        return FW_DESERIALIZE_SIZE_MISMATCH;
    }
    FwSizeType numSegments = remainingBytes / segmentSize;

    // Limit to max segments; the rest is ignored
    if (numSegments > CFDP_NAK_MAX_SEGMENTS) {
        numSegments = CFDP_NAK_MAX_SEGMENTS;
    }
    this->m_numSegments = static_cast<U8>(numSegments);

    for (U8 i = 0; i < this->m_numSegments; i++) {
        status = serialBuffer.deserializeTo(this->m_segments[i].offsetStart);
        if (status != FW_SERIALIZE_OK) {
            return status;
        }

        status = serialBuffer.deserializeTo(this->m_segments[i].offsetEnd);
        if (status != FW_SERIALIZE_OK) {
            return status;
        }
    }

    return serialBuffer.skipBytes(serialBuffer.getDeserializeSizeLeft());
}

}  // namespace Cfdp
}  // namespace Ccsds
}  // namespace Cfdpd

// ======================================================================
// \title  EofPdu.cpp
// \author campuzan
// \brief  cpp file for CFDP EOF PDU
// ======================================================================

#include <Cfdpd/Ccsds/Cfdp/Types/EofPdu.hpp>

namespace Cfdpd {
namespace Ccsds {
namespace Cfdp {

void EofPdu::initialize(PduDirection direction,
                        Class::T txmMode,
                        EntityId sourceEid,
                        TransactionSeq transactionSeq,
                        EntityId destEid,
                        ConditionCode conditionCode,
                        U32 checksum,
                        FileSize fileSize) {
    this->m_header.initialize(T_EOF, direction, txmMode, sourceEid, transactionSeq, destEid);
    this->m_conditionCode = conditionCode;
    this->m_checksum = checksum;
    this->m_fileSize = fileSize;
    this->m_tlvList.clear();
}

U32 EofPdu::getBufferSize() const {
    U32 size = this->m_header.getBufferSize();

    // Directive code, condition code byte, checksum, file size
    size += sizeof(U8) + sizeof(U8) + sizeof(U32) + sizeof(FileSize);
    size += this->m_tlvList.getEncodedSize();

    return size;
}

SerializeStatus EofPdu::serializeBody(SerialBuffer& serialBuffer) const {
    // Condition code in the upper nibble, spare bits zero
    U8 conditionByte = static_cast<U8>((this->m_conditionCode & 0x0F) << 4);
    SerializeStatus status = serialBuffer.serializeFrom(conditionByte);
    if (status != FW_SERIALIZE_OK) {
        return status;
    }

    status = serialBuffer.serializeFrom(this->m_checksum);
    if (status != FW_SERIALIZE_OK) {
        return status;
    }

    status = serialBuffer.serializeFrom(this->m_fileSize);
    if (status != FW_SERIALIZE_OK) {
        return status;
    }

    return this->m_tlvList.toSerialBuffer(serialBuffer);
}

SerializeStatus EofPdu::deserializeBody(SerialBuffer& serialBuffer) {
    U8 conditionByte;
    SerializeStatus status = serialBuffer.deserializeTo(conditionByte);
    if (status != FW_SERIALIZE_OK) {
        return status;
    }
    this->m_conditionCode = static_cast<ConditionCode>((conditionByte >> 4) & 0x0F);

    status = serialBuffer.deserializeTo(this->m_checksum);
    if (status != FW_SERIALIZE_OK) {
        return status;
    }

    status = serialBuffer.deserializeTo(this->m_fileSize);
    if (status != FW_SERIALIZE_OK) {
        return status;
    }

    return this->m_tlvList.fromSerialBuffer(serialBuffer);
}

}  // namespace Cfdp
}  // namespace Ccsds
}  // namespace Cfdpd

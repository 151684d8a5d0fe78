// ======================================================================
// \title  FinPdu.cpp
// \author campuzan
// \brief  cpp file for CFDP Finished PDU
// ======================================================================

#include <Cfdpd/Ccsds/Cfdp/Types/FinPdu.hpp>

namespace Cfdpd {
namespace Ccsds {
namespace Cfdp {

void FinPdu::initialize(PduDirection direction,
                        Class::T txmMode,
                        EntityId sourceEid,
                        TransactionSeq transactionSeq,
                        EntityId destEid,
                        ConditionCode conditionCode,
                        FinDeliveryCode deliveryCode,
                        FinFileStatus fileStatus) {
    this->m_header.initialize(T_FIN, direction, txmMode, sourceEid, transactionSeq, destEid);
    this->m_conditionCode = conditionCode;
    this->m_deliveryCode = deliveryCode;
    this->m_fileStatus = fileStatus;
    this->m_tlvList.clear();
}

U32 FinPdu::getBufferSize() const {
    U32 size = this->m_header.getBufferSize();

    // Directive code, flags byte
    size += sizeof(U8) + sizeof(U8);
    size += this->m_tlvList.getEncodedSize();

    return size;
}

SerializeStatus FinPdu::serializeBody(SerialBuffer& serialBuffer) const {
    // bits 7-4: condition code
    // bit 3: spare
    // bit 2: delivery code
    // bits 1-0: file status
    U8 flags = 0;
    flags |= static_cast<U8>((this->m_conditionCode & 0x0F) << 4);
    flags |= static_cast<U8>((this->m_deliveryCode & 0x01) << 2);
    flags |= static_cast<U8>(this->m_fileStatus & 0x03);

    SerializeStatus status = serialBuffer.serializeFrom(flags);
    if (status != FW_SERIALIZE_OK) {
        return status;
    }

    return this->m_tlvList.toSerialBuffer(serialBuffer);
}

SerializeStatus FinPdu::deserializeBody(SerialBuffer& serialBuffer) {
    U8 flags;
    SerializeStatus status = serialBuffer.deserializeTo(flags);
    if (status != FW_SERIALIZE_OK) {
        return status;
    }

    this->m_conditionCode = static_cast<ConditionCode>((flags >> 4) & 0x0F);
    this->m_deliveryCode = static_cast<FinDeliveryCode>((flags >> 2) & 0x01);
    this->m_fileStatus = static_cast<FinFileStatus>(flags & 0x03);

    return this->m_tlvList.fromSerialBuffer(serialBuffer);
}

}  // namespace Cfdp
}  // namespace Ccsds
}  // namespace Cfdpd

// ======================================================================
// \title  AckPdu.cpp
// \author campuzan
// \brief  cpp file for CFDP ACK PDU
// ======================================================================

#include <Cfdpd/Ccsds/Cfdp/Types/AckPdu.hpp>

namespace Cfdpd {
namespace Ccsds {
namespace Cfdp {

void AckPdu::initialize(PduDirection direction,
                        Class::T txmMode,
                        EntityId sourceEid,
                        TransactionSeq transactionSeq,
                        EntityId destEid,
                        FileDirective directiveCode,
                        U8 directiveSubtypeCode,
                        ConditionCode conditionCode,
                        AckTxnStatus transactionStatus) {
    this->m_header.initialize(T_ACK, direction, txmMode, sourceEid, transactionSeq, destEid);
    this->m_directiveCode = directiveCode;
    this->m_directiveSubtypeCode = directiveSubtypeCode;
    this->m_conditionCode = conditionCode;
    this->m_transactionStatus = transactionStatus;
}

U32 AckPdu::getBufferSize() const {
    // Header, directive code, directive/subtype byte, condition/status byte
    return this->m_header.getBufferSize() + 3U;
}

SerializeStatus AckPdu::serializeBody(SerialBuffer& serialBuffer) const {
    // bits 7-4: acknowledged directive code
    // bits 3-0: directive subtype code
    U8 directiveByte = static_cast<U8>(((this->m_directiveCode & 0x0F) << 4) |
                                       (this->m_directiveSubtypeCode & 0x0F));
    SerializeStatus status = serialBuffer.serializeFrom(directiveByte);
    if (status != FW_SERIALIZE_OK) {
        return status;
    }

    // bits 7-4: condition code
    // bits 1-0: transaction status
    U8 statusByte = static_cast<U8>(((this->m_conditionCode & 0x0F) << 4) |
                                    (this->m_transactionStatus & 0x03));
    return serialBuffer.serializeFrom(statusByte);
}

SerializeStatus AckPdu::deserializeBody(SerialBuffer& serialBuffer) {
    U8 directiveByte;
    SerializeStatus status = serialBuffer.deserializeTo(directiveByte);
    if (status != FW_SERIALIZE_OK) {
        return status;
    }

    U8 statusByte;
    status = serialBuffer.deserializeTo(statusByte);
    if (status != FW_SERIALIZE_OK) {
        return status;
    }

    this->m_directiveCode = static_cast<FileDirective>((directiveByte >> 4) & 0x0F);
    this->m_directiveSubtypeCode = static_cast<U8>(directiveByte & 0x0F);
    this->m_conditionCode = static_cast<ConditionCode>((statusByte >> 4) & 0x0F);
    this->m_transactionStatus = static_cast<AckTxnStatus>(statusByte & 0x03);

    // Only EOF and FIN are ever acknowledged
    if (this->m_directiveCode != FILE_DIRECTIVE_END_OF_FILE && this->m_directiveCode != FILE_DIRECTIVE_FIN) {
        return FW_DESERIALIZE_FORMAT_ERROR;
    }

    // No trailing bytes
    if (serialBuffer.getDeserializeSizeLeft() != 0) {
        return FW_DESERIALIZE_SIZE_MISMATCH;
    }
    return FW_SERIALIZE_OK;
}

}  // namespace Cfdp
}  // namespace Ccsds
}  // namespace Cfdpd

// ======================================================================
// \title  Pdu.cpp
// \author campuzan
// \brief  cpp file for the CFDP PDU tagged value
// ======================================================================

#include <Cfdpd/Ccsds/Cfdp/Types/Pdu.hpp>
#include <Cfdpd/Types/Assert.hpp>

namespace Cfdpd {
namespace Ccsds {
namespace Cfdp {

SerializeStatus Pdu::fromBuffer(const U8* data, FwSizeType length) {
    if (data == nullptr || length < PduHeader::MIN_HEADERSIZE) {
        return FW_DESERIALIZE_BUFFER_EMPTY;
    }

    SerialBuffer serialBuffer(const_cast<U8*>(data), length);
    serialBuffer.fill();

    // Deserialize header first to determine PDU type
    PduHeader header;
    SerializeStatus status = header.fromSerialBuffer(serialBuffer);
    if (status != FW_SERIALIZE_OK) {
        return status;
    }

    // For directive PDUs the type follows from the directive code
    if (header.getType() == T_NONE) {
        U8 directiveCode;
        status = serialBuffer.deserializeTo(directiveCode);
        if (status != FW_SERIALIZE_OK) {
            return status;
        }

        switch (static_cast<FileDirective>(directiveCode)) {
            case FILE_DIRECTIVE_METADATA:
                header.setType(T_METADATA);
                break;
            case FILE_DIRECTIVE_END_OF_FILE:
                header.setType(T_EOF);
                break;
            case FILE_DIRECTIVE_FIN:
                header.setType(T_FIN);
                break;
            case FILE_DIRECTIVE_ACK:
                header.setType(T_ACK);
                break;
            case FILE_DIRECTIVE_NAK:
                header.setType(T_NAK);
                break;
            default:
                // Prompt, keep alive and unknown directives are not supported
                return FW_DESERIALIZE_TYPE_MISMATCH;
        }
    }

    this->m_type = header.getType();
    status = this->asBase().fromSerialBuffer(header, serialBuffer);
    if (status != FW_SERIALIZE_OK) {
        this->m_type = T_NONE;
        return status;
    }
    return FW_SERIALIZE_OK;
}

SerializeStatus Pdu::toBuffer(U8* data, FwSizeType capacity, FwSizeType& length) const {
    // This is on the send side, so we should know what we are sending
    CFDPD_ASSERT(this->m_type != T_NONE, this->m_type);

    SerialBuffer serialBuffer(data, capacity);
    SerializeStatus status = this->asBase().toSerialBuffer(serialBuffer);
    if (status == FW_SERIALIZE_OK) {
        length = serialBuffer.getSize();
    }
    return status;
}

SerializeStatus Pdu::getPduLength(const U8* prefix, FwSizeType& totalLength) {
    return PduHeader::getTotalLength(prefix, totalLength);
}

const PduHeader& Pdu::asHeader() const {
    return this->asBase().asHeader();
}

FileDirective Pdu::getDirectiveCode() const {
    return this->asBase().getDirectiveCode();
}

U32 Pdu::getBufferSize() const {
    return this->asBase().getBufferSize();
}

const PduBase& Pdu::asBase() const {
    switch (this->m_type) {
        case T_METADATA:
            return this->m_metadataPdu;
        case T_FILE_DATA:
            return this->m_fileDataPdu;
        case T_EOF:
            return this->m_eofPdu;
        case T_FIN:
            return this->m_finPdu;
        case T_ACK:
            return this->m_ackPdu;
        case T_NAK:
            return this->m_nakPdu;
        default:
            CFDPD_ASSERT(false, this->m_type);
            return this->m_metadataPdu;
    }
}

PduBase& Pdu::asBase() {
    return const_cast<PduBase&>(static_cast<const Pdu*>(this)->asBase());
}

const MetadataPdu& Pdu::asMetadataPdu() const {
    CFDPD_ASSERT(this->m_type == T_METADATA, this->m_type);
    return this->m_metadataPdu;
}

const FileDataPdu& Pdu::asFileDataPdu() const {
    CFDPD_ASSERT(this->m_type == T_FILE_DATA, this->m_type);
    return this->m_fileDataPdu;
}

const EofPdu& Pdu::asEofPdu() const {
    CFDPD_ASSERT(this->m_type == T_EOF, this->m_type);
    return this->m_eofPdu;
}

const FinPdu& Pdu::asFinPdu() const {
    CFDPD_ASSERT(this->m_type == T_FIN, this->m_type);
    return this->m_finPdu;
}

const AckPdu& Pdu::asAckPdu() const {
    CFDPD_ASSERT(this->m_type == T_ACK, this->m_type);
    return this->m_ackPdu;
}

const NakPdu& Pdu::asNakPdu() const {
    CFDPD_ASSERT(this->m_type == T_NAK, this->m_type);
    return this->m_nakPdu;
}

MetadataPdu& Pdu::asMetadataPdu() {
    this->m_type = T_METADATA;
    return this->m_metadataPdu;
}

FileDataPdu& Pdu::asFileDataPdu() {
    this->m_type = T_FILE_DATA;
    return this->m_fileDataPdu;
}

EofPdu& Pdu::asEofPdu() {
    this->m_type = T_EOF;
    return this->m_eofPdu;
}

FinPdu& Pdu::asFinPdu() {
    this->m_type = T_FIN;
    return this->m_finPdu;
}

AckPdu& Pdu::asAckPdu() {
    this->m_type = T_ACK;
    return this->m_ackPdu;
}

NakPdu& Pdu::asNakPdu() {
    this->m_type = T_NAK;
    return this->m_nakPdu;
}

const char* pduTypeName(PduTypeEnum type) {
    switch (type) {
        case T_METADATA:
            return "Metadata";
        case T_EOF:
            return "EOF";
        case T_FIN:
            return "FIN";
        case T_ACK:
            return "ACK";
        case T_NAK:
            return "NAK";
        case T_FILE_DATA:
            return "FileData";
        default:
            return "None";
    }
}

}  // namespace Cfdp
}  // namespace Ccsds
}  // namespace Cfdpd

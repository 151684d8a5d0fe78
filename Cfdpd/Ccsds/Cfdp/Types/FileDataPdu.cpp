// ======================================================================
// \title  FileDataPdu.cpp
// \author campuzan
// \brief  cpp file for CFDP File Data PDU
// ======================================================================

#include <Cfdpd/Ccsds/Cfdp/Types/FileDataPdu.hpp>
#include <Cfdpd/Types/Assert.hpp>
#include <config/CfdpCfg.hpp>

namespace Cfdpd {
namespace Ccsds {
namespace Cfdp {

void FileDataPdu::initialize(PduDirection direction,
                             Class::T txmMode,
                             EntityId sourceEid,
                             TransactionSeq transactionSeq,
                             EntityId destEid,
                             FileSize offset,
                             U16 dataSize,
                             const U8* data) {
    CFDPD_ASSERT(data != nullptr || dataSize == 0);
    this->m_header.initialize(T_FILE_DATA, direction, txmMode, sourceEid, transactionSeq, destEid);
    this->m_offset = offset;
    this->m_data.assign(data, data + dataSize);
}

U32 FileDataPdu::getBufferSize() const {
    // Header, offset, then data
    return this->m_header.getBufferSize() + static_cast<U32>(sizeof(FileSize)) +
           static_cast<U32>(this->m_data.size());
}

U32 FileDataPdu::getMaxFileDataSize(const PduHeader& header) {
    const U32 overhead = header.getBufferSize() + static_cast<U32>(sizeof(FileSize));
    CFDPD_ASSERT(overhead < CFDP_MAX_PDU_SIZE, overhead, CFDP_MAX_PDU_SIZE);
    return CFDP_MAX_PDU_SIZE - overhead;
}

SerializeStatus FileDataPdu::serializeBody(SerialBuffer& serialBuffer) const {
    SerializeStatus status = serialBuffer.serializeFrom(this->m_offset);
    if (status != FW_SERIALIZE_OK) {
        return status;
    }
    return serialBuffer.pushBytes(this->m_data.data(), this->m_data.size());
}

SerializeStatus FileDataPdu::deserializeBody(SerialBuffer& serialBuffer) {
    if (this->m_header.hasSegmentMetadata()) {
        // Record continuation state and segment metadata are not supported
        return FW_DESERIALIZE_FORMAT_ERROR;
    }

    SerializeStatus status = serialBuffer.deserializeTo(this->m_offset);
    if (status != FW_SERIALIZE_OK) {
        return status;
    }

    // Data runs to the end of the PDU
    const FwSizeType dataSize = serialBuffer.getDeserializeSizeLeft();
    const U8* data = serialBuffer.getDeserializePointer();
    this->m_data.assign(data, data + dataSize);
    return serialBuffer.skipBytes(dataSize);
}

}  // namespace Cfdp
}  // namespace Ccsds
}  // namespace Cfdpd

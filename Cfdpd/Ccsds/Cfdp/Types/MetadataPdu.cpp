// ======================================================================
// \title  MetadataPdu.cpp
// \author campuzan
// \brief  cpp file for CFDP Metadata PDU
// ======================================================================

#include <Cfdpd/Ccsds/Cfdp/Types/MetadataPdu.hpp>
#include <Cfdpd/Types/Assert.hpp>

namespace Cfdpd {
namespace Ccsds {
namespace Cfdp {

namespace {

SerializeStatus serializeLv(SerialBuffer& serialBuffer, const std::string& value) {
    const U8 length = static_cast<U8>(value.size());
    SerializeStatus status = serialBuffer.serializeFrom(length);
    if (status != FW_SERIALIZE_OK) {
        return status;
    }
    return serialBuffer.pushBytes(reinterpret_cast<const U8*>(value.data()), length);
}

// Filenames must be non-empty and no longer than CFDP_FILENAME_MAX_LEN
SerializeStatus deserializeFilename(SerialBuffer& serialBuffer, std::string& value) {
    U8 length;
    SerializeStatus status = serialBuffer.deserializeTo(length);
    if (status != FW_SERIALIZE_OK) {
        return status;
    }
    if (length == 0 || length > CFDP_FILENAME_MAX_LEN) {
        return FW_DESERIALIZE_SIZE_MISMATCH;
    }
    char buffer[CFDP_FILENAME_MAX_LEN];
    status = serialBuffer.popBytes(reinterpret_cast<U8*>(buffer), length);
    if (status != FW_SERIALIZE_OK) {
        return status;
    }
    value.assign(buffer, length);
    return FW_SERIALIZE_OK;
}

}  // namespace

void MetadataPdu::initialize(PduDirection direction,
                             Class::T txmMode,
                             EntityId sourceEid,
                             TransactionSeq transactionSeq,
                             EntityId destEid,
                             FileSize fileSize,
                             const std::string& sourceFilename,
                             const std::string& destFilename,
                             ChecksumType checksumType,
                             U8 closureRequested) {
    this->m_header.initialize(T_METADATA, direction, txmMode, sourceEid, transactionSeq, destEid);

    this->m_fileSize = fileSize;

    FwSizeType srcLen = sourceFilename.size();
    CFDPD_ASSERT(srcLen <= CFDP_FILENAME_MAX_LEN, static_cast<FwAssertArgType>(srcLen), CFDP_FILENAME_MAX_LEN);
    this->m_sourceFilename = sourceFilename;

    FwSizeType dstLen = destFilename.size();
    CFDPD_ASSERT(dstLen <= CFDP_FILENAME_MAX_LEN, static_cast<FwAssertArgType>(dstLen), CFDP_FILENAME_MAX_LEN);
    this->m_destFilename = destFilename;

    this->m_checksumType = checksumType;
    this->m_closureRequested = closureRequested;
    this->m_tlvList.clear();
}

U32 MetadataPdu::getBufferSize() const {
    U32 size = this->m_header.getBufferSize();

    // Directive code, closure/checksum byte, file size
    size += sizeof(U8) + sizeof(U8) + sizeof(FileSize);

    // Source and dest filename LVs
    size += 1 + static_cast<U32>(this->m_sourceFilename.size());
    size += 1 + static_cast<U32>(this->m_destFilename.size());

    size += this->m_tlvList.getEncodedSize();

    return size;
}

SerializeStatus MetadataPdu::serializeBody(SerialBuffer& serialBuffer) const {
    // bit 7: closure_requested
    // bits 6-4: reserved (000b)
    // bits 3-0: checksum_type
    U8 segmentationControl = 0;
    segmentationControl |= static_cast<U8>((this->m_closureRequested & 0x01) << 7);
    segmentationControl |= static_cast<U8>(static_cast<U8>(this->m_checksumType) & 0x0F);

    SerializeStatus status = serialBuffer.serializeFrom(segmentationControl);
    if (status != FW_SERIALIZE_OK) {
        return status;
    }

    status = serialBuffer.serializeFrom(this->m_fileSize);
    if (status != FW_SERIALIZE_OK) {
        return status;
    }

    status = serializeLv(serialBuffer, this->m_sourceFilename);
    if (status != FW_SERIALIZE_OK) {
        return status;
    }

    status = serializeLv(serialBuffer, this->m_destFilename);
    if (status != FW_SERIALIZE_OK) {
        return status;
    }

    return this->m_tlvList.toSerialBuffer(serialBuffer);
}

SerializeStatus MetadataPdu::deserializeBody(SerialBuffer& serialBuffer) {
    U8 segmentationControl;
    SerializeStatus status = serialBuffer.deserializeTo(segmentationControl);
    if (status != FW_SERIALIZE_OK) {
        return status;
    }

    this->m_closureRequested = static_cast<U8>((segmentationControl >> 7) & 0x01);
    this->m_checksumType = static_cast<ChecksumType>(segmentationControl & 0x0F);

    status = serialBuffer.deserializeTo(this->m_fileSize);
    if (status != FW_SERIALIZE_OK) {
        return status;
    }

    status = deserializeFilename(serialBuffer, this->m_sourceFilename);
    if (status != FW_SERIALIZE_OK) {
        return status;
    }

    status = deserializeFilename(serialBuffer, this->m_destFilename);
    if (status != FW_SERIALIZE_OK) {
        return status;
    }

    return this->m_tlvList.fromSerialBuffer(serialBuffer);
}

}  // namespace Cfdp
}  // namespace Ccsds
}  // namespace Cfdpd

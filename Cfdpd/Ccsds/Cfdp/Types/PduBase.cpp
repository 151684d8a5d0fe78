// ======================================================================
// \title  PduBase.cpp
// \author campuzan
// \brief  cpp file for the CFDP PDU base class
// ======================================================================

#include <Cfdpd/Ccsds/Cfdp/Types/PduBase.hpp>
#include <Cfdpd/Types/Assert.hpp>

namespace Cfdpd {
namespace Ccsds {
namespace Cfdp {

SerializeStatus PduBase::toSerialBuffer(SerialBuffer& serialBuffer) const {
    CFDPD_ASSERT(this->m_header.getType() != T_NONE);

    // Calculate PDU data length (everything after header)
    const U32 headerSize = this->m_header.getBufferSize();
    const U32 totalSize = this->getBufferSize();
    CFDPD_ASSERT(totalSize >= headerSize, totalSize, headerSize);
    const U32 dataLength = totalSize - headerSize;
    if (dataLength > 0xFFFF) {
        return FW_SERIALIZE_NO_ROOM_LEFT;
    }

    PduHeader headerCopy = this->m_header;
    headerCopy.setPduDataLength(static_cast<U16>(dataLength));

    SerializeStatus status = headerCopy.toSerialBuffer(serialBuffer);
    if (status != FW_SERIALIZE_OK) {
        return status;
    }

    if (this->m_header.getPduType() == PDU_TYPE_DIRECTIVE) {
        status = serialBuffer.serializeFrom(static_cast<U8>(this->getDirectiveCode()));
        if (status != FW_SERIALIZE_OK) {
            return status;
        }
    }

    return this->serializeBody(serialBuffer);
}

SerializeStatus PduBase::fromSerialBuffer(const PduHeader& header, SerialBuffer& serialBuffer) {
    this->m_header = header;
    return this->deserializeBody(serialBuffer);
}

}  // namespace Cfdp
}  // namespace Ccsds
}  // namespace Cfdpd

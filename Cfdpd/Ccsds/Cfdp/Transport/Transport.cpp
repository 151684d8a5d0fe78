// ======================================================================
// \title  Transport.cpp
// \author campuzan
// \brief  cpp file for the loop steps shared by every transport
// ======================================================================

#include <Cfdpd/Ccsds/Cfdp/Transport/Transport.hpp>

namespace Cfdpd {
namespace Ccsds {
namespace Cfdp {

Transport::Status Transport::drainOutbound(OutboundQueue& outbound) {
    OutboundPdu pending;
    const Utils::QueueStatus status = outbound.tryDequeue(pending);
    if (status == Utils::QUEUE_CLOSED) {
        return QUEUE_DISCONNECTED;
    }
    if (status != Utils::QUEUE_OK) {
        return SUCCESS;
    }

    // The reliability layer recovers anything lost here
    const Status sendStatus = this->request(pending.destEid, pending.pdu);
    if (sendStatus == NO_ROUTE) {
        this->m_events.log_WARNING_LO_TransportNoRoute(pending.destEid);
    }
    return SUCCESS;
}

bool Transport::encode(const Pdu& pdu, U8* buffer, FwSizeType capacity, FwSizeType& length) const {
    const SerializeStatus status = pdu.toBuffer(buffer, capacity, length);
    if (status != FW_SERIALIZE_OK) {
        this->m_events.log_WARNING_LO_PduEncodeFailed(pduTypeName(pdu.getType()), status);
        return false;
    }
    return true;
}

bool Transport::forwardInbound(const U8* data, FwSizeType length, PduSink& inbound) const {
    Pdu pdu;
    const SerializeStatus status = pdu.fromBuffer(data, length);
    if (status != FW_SERIALIZE_OK) {
        this->m_events.log_WARNING_LO_PduDecodeFailed(static_cast<U32>(length), status);
        return true;
    }
    return inbound.deliverInbound(pdu);
}

Transport::Status Transport::stopped(Status status) const {
    this->m_events.log_ACTIVITY_LO_TransportStopped(transportStatusName(status));
    return status;
}

const char* transportStatusName(Transport::Status status) {
    switch (status) {
        case Transport::SUCCESS:
            return "SUCCESS";
        case Transport::NO_ROUTE:
            return "NO_ROUTE";
        case Transport::SEND_ERROR:
            return "SEND_ERROR";
        case Transport::RECV_ERROR:
            return "RECV_ERROR";
        case Transport::QUEUE_DISCONNECTED:
            return "QUEUE_DISCONNECTED";
        default:
            return "UNKNOWN";
    }
}

}  // namespace Cfdp
}  // namespace Ccsds
}  // namespace Cfdpd

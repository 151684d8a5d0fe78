// ======================================================================
// \title  Transport.hpp
// \author campuzan
// \brief  hpp file for the medium-independent PDU transport interface
// ======================================================================

#ifndef Cfdpd_Ccsds_Cfdp_Transport_HPP
#define Cfdpd_Ccsds_Cfdp_Transport_HPP

#include <atomic>
#include <vector>

#include <Cfdpd/Ccsds/Cfdp/Events.hpp>
#include <Cfdpd/Ccsds/Cfdp/Types/Pdu.hpp>
#include <Cfdpd/Ccsds/Cfdp/Types/Types.hpp>
#include <Cfdpd/Utils/Queue.hpp>

namespace Cfdpd {
namespace Ccsds {
namespace Cfdp {

//! A PDU waiting for a transport, with the entity it is addressed to
struct OutboundPdu {
    EntityId destEid;
    Pdu pdu;

    OutboundPdu() : destEid(0) {}
    OutboundPdu(EntityId eid, const Pdu& p) : destEid(eid), pdu(p) {}
};

typedef Utils::Queue<OutboundPdu> OutboundQueue;

//! Consumer of the PDUs a transport decodes
class PduSink {
  public:
    virtual ~PduSink() {}

    //! Take ownership of one inbound PDU
    //! \return false once the consumer is gone for good
    virtual bool deliverInbound(const Pdu& pdu) = 0;
};

//! \class Transport
//! \brief One physical medium carrying PDUs to and from remote entities
//!
//! A transport owns its medium handle and a routing table from entity ID
//! to medium address. All traffic goes through pduHandler(), which runs on
//! a thread of its own until the shutdown flag is raised.
class Transport {
  public:
    enum Status {
        SUCCESS,            //!< Operation completed, or the handler saw shutdown
        NO_ROUTE,           //!< The destination has no address on this medium
        SEND_ERROR,         //!< The medium refused the data
        RECV_ERROR,         //!< The medium failed while reading
        QUEUE_DISCONNECTED  //!< The outbound queue was closed or the inbound sink is gone
    };

    explicit Transport(const char* component) : m_events(component) {}
    virtual ~Transport() {}

    //! Non-blocking liveness check of the medium
    virtual bool isReady() const = 0;

    //! Encode pdu and transmit it to destEid
    //!
    //! \return NO_ROUTE if destEid is not in the routing table, SEND_ERROR
    //!         if the medium failed, SUCCESS otherwise
    virtual Status request(EntityId destEid, const Pdu& pdu) = 0;

    //! Move PDUs between the medium and the daemon until shutdown is raised
    //!
    //! Each iteration waits a bounded time for one inbound unit, decodes it
    //! and hands it to inbound, then sends at most one PDU from outbound.
    //! Undecodable input and failed sends are logged and dropped.
    //!
    //! \return SUCCESS on shutdown, RECV_ERROR on a hard medium failure,
    //!         QUEUE_DISCONNECTED if either side of the daemon went away
    virtual Status pduHandler(const std::atomic<bool>& shutdown,
                              PduSink& inbound,
                              OutboundQueue& outbound,
                              FwSizeType bufferSize) = 0;

    //! Entity IDs this transport can reach
    virtual std::vector<EntityId> getDestinations() const = 0;

  protected:
    //! Send at most one queued PDU
    //! \return QUEUE_DISCONNECTED if outbound was closed, SUCCESS otherwise
    Status drainOutbound(OutboundQueue& outbound);

    //! Encode pdu into buffer
    //! \return false if the PDU does not fit, after logging
    bool encode(const Pdu& pdu, U8* buffer, FwSizeType capacity, FwSizeType& length) const;

    //! Decode one unit and forward it
    //! \return false if the sink refused delivery
    bool forwardInbound(const U8* data, FwSizeType length, PduSink& inbound) const;

    //! Log the reason the handler loop is returning and pass it through
    Status stopped(Status status) const;

    Events m_events;
};

//! Name of a transport status
const char* transportStatusName(Transport::Status status);

}  // namespace Cfdp
}  // namespace Ccsds
}  // namespace Cfdpd

#endif  // Cfdpd_Ccsds_Cfdp_Transport_HPP

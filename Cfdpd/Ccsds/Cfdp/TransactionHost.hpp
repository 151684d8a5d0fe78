// ======================================================================
// \title  TransactionHost.hpp
// \author campuzan
// \brief  hpp file for the services a transaction needs from its owner
// ======================================================================

#ifndef Cfdpd_Ccsds_Cfdp_TransactionHost_HPP
#define Cfdpd_Ccsds_Cfdp_TransactionHost_HPP

#include <Cfdpd/Ccsds/Cfdp/Types/Pdu.hpp>
#include <Cfdpd/Ccsds/Cfdp/Types/Types.hpp>

namespace Cfdpd {
namespace Ccsds {
namespace Cfdp {

//! Interface a transaction worker calls back into
//!
//! Both functions are called from the worker thread of the transaction
//! and must be safe to call concurrently from many workers.
class TransactionHost {
  public:
    virtual ~TransactionHost() {}

    //! Hand an outbound PDU to the transport that owns destEid
    //!
    //! \return SUCCESS when queued, NO_ROUTE when no transport serves destEid,
    //!         SEND_PDU_ERROR when the outbound queue is full (retry later)
    virtual Status::T routeOutbound(const TransactionId& id, EntityId destEid, const Pdu& pdu) = 0;

    //! The worker of id has reached CLOSED and is about to return
    virtual void transactionFinished(const TransactionId& id) = 0;
};

}  // namespace Cfdp
}  // namespace Ccsds
}  // namespace Cfdpd

#endif  // Cfdpd_Ccsds_Cfdp_TransactionHost_HPP

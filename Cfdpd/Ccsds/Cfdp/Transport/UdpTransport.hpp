// ======================================================================
// \title  UdpTransport.hpp
// \author campuzan
// \brief  hpp file for the datagram socket transport
// ======================================================================

#ifndef Cfdpd_Ccsds_Cfdp_UdpTransport_HPP
#define Cfdpd_Ccsds_Cfdp_UdpTransport_HPP

#include <netinet/in.h>

#include <map>

#include <Cfdpd/Ccsds/Cfdp/Transport/Transport.hpp>

namespace Cfdpd {
namespace Ccsds {
namespace Cfdp {

//! \class UdpTransport
//! \brief One PDU per datagram over a single IPv4 UDP socket
//!
//! Any number of entities may share the socket; each is mapped to its own
//! host and port with addRoute(). Routes are added before the transport is
//! handed to a daemon.
class UdpTransport : public Transport {
  public:
    UdpTransport();
    ~UdpTransport();

    //! Bind the socket to host:port; port 0 picks an ephemeral port
    //! \return false if the address does not resolve or the bind fails
    bool open(const char* host, U16 port);

    //! Close the socket
    void close();

    //! Map entity eid to host:port
    //! \return false if host does not resolve
    bool addRoute(EntityId eid, const char* host, U16 port);

    //! Port the socket is bound to, 0 if it is not open
    U16 getLocalPort() const;

    bool isReady() const override;
    Status request(EntityId destEid, const Pdu& pdu) override;
    Status pduHandler(const std::atomic<bool>& shutdown,
                      PduSink& inbound,
                      OutboundQueue& outbound,
                      FwSizeType bufferSize) override;
    std::vector<EntityId> getDestinations() const override;

  private:
    UdpTransport(const UdpTransport&) = delete;
    UdpTransport& operator=(const UdpTransport&) = delete;

    static bool resolve(const char* host, U16 port, sockaddr_in& address);

    int m_fd;
    std::map<EntityId, sockaddr_in> m_routes;
};

}  // namespace Cfdp
}  // namespace Ccsds
}  // namespace Cfdpd

#endif  // Cfdpd_Ccsds_Cfdp_UdpTransport_HPP

// ======================================================================
// \title  UdpTransport.cpp
// \author campuzan
// \brief  cpp file for the datagram socket transport
// ======================================================================

#include <Cfdpd/Ccsds/Cfdp/Transport/UdpTransport.hpp>

#include <arpa/inet.h>
#include <errno.h>
#include <netdb.h>
#include <string.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace Cfdpd {
namespace Ccsds {
namespace Cfdp {

UdpTransport::UdpTransport() : Transport("UdpTransport"), m_fd(-1), m_routes() {}

UdpTransport::~UdpTransport() {
    this->close();
}

bool UdpTransport::open(const char* host, U16 port) {
    sockaddr_in local;
    if (!resolve(host, port, local)) {
        return false;
    }

    this->close();
    this->m_fd = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (this->m_fd < 0) {
        return false;
    }

    // The receive timeout sets how often the handler loop checks for shutdown
    struct timeval timeout;
    timeout.tv_sec = CFDP_TRANSPORT_RECV_TIMEOUT_MS / 1000;
    timeout.tv_usec = (CFDP_TRANSPORT_RECV_TIMEOUT_MS % 1000) * 1000;
    if ((::setsockopt(this->m_fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout)) < 0) ||
        (::bind(this->m_fd, reinterpret_cast<const sockaddr*>(&local), sizeof(local)) < 0)) {
        this->close();
        return false;
    }
    return true;
}

void UdpTransport::close() {
    if (this->m_fd >= 0) {
        static_cast<void>(::close(this->m_fd));
        this->m_fd = -1;
    }
}

bool UdpTransport::addRoute(EntityId eid, const char* host, U16 port) {
    sockaddr_in address;
    if (!resolve(host, port, address)) {
        return false;
    }
    this->m_routes[eid] = address;
    return true;
}

U16 UdpTransport::getLocalPort() const {
    sockaddr_in local;
    socklen_t length = sizeof(local);
    if ((this->m_fd < 0) ||
        (::getsockname(this->m_fd, reinterpret_cast<sockaddr*>(&local), &length) < 0)) {
        return 0;
    }
    return ntohs(local.sin_port);
}

bool UdpTransport::isReady() const {
    return this->getLocalPort() != 0;
}

Transport::Status UdpTransport::request(EntityId destEid, const Pdu& pdu) {
    std::map<EntityId, sockaddr_in>::const_iterator route = this->m_routes.find(destEid);
    if (route == this->m_routes.end()) {
        return NO_ROUTE;
    }

    U8 buffer[CFDP_MAX_PDU_SIZE];
    FwSizeType length = 0;
    if (!this->encode(pdu, buffer, sizeof(buffer), length)) {
        return SEND_ERROR;
    }

    const ssize_t sent = ::sendto(this->m_fd, buffer, length, 0, reinterpret_cast<const sockaddr*>(&route->second),
                                  sizeof(route->second));
    if (sent < 0) {
        this->m_events.log_WARNING_LO_TransportSendFailed(destEid, transportStatusName(SEND_ERROR), errno);
        return SEND_ERROR;
    }
    return SUCCESS;
}

Transport::Status UdpTransport::pduHandler(const std::atomic<bool>& shutdown,
                                           PduSink& inbound,
                                           OutboundQueue& outbound,
                                           FwSizeType bufferSize) {
    std::vector<U8> buffer(bufferSize);

    while (!shutdown.load()) {
        // Don't sit on the receive timeout while there is something to send
        const int flags = (outbound.getQueueSize() > 0) ? MSG_DONTWAIT : 0;
        const ssize_t received = ::recvfrom(this->m_fd, buffer.data(), buffer.size(), flags, nullptr, nullptr);
        if (received >= 0) {
            if (!this->forwardInbound(buffer.data(), static_cast<FwSizeType>(received), inbound)) {
                return this->stopped(QUEUE_DISCONNECTED);
            }
        } else if ((errno != EAGAIN) && (errno != EWOULDBLOCK) && (errno != EINTR)) {
            this->m_events.log_WARNING_HI_TransportReceiveFailed(errno);
            return this->stopped(RECV_ERROR);
        }

        if (this->drainOutbound(outbound) == QUEUE_DISCONNECTED) {
            return this->stopped(QUEUE_DISCONNECTED);
        }
    }

    return this->stopped(SUCCESS);
}

std::vector<EntityId> UdpTransport::getDestinations() const {
    std::vector<EntityId> destinations;
    for (std::map<EntityId, sockaddr_in>::const_iterator it = this->m_routes.begin(); it != this->m_routes.end();
         ++it) {
        destinations.push_back(it->first);
    }
    return destinations;
}

bool UdpTransport::resolve(const char* host, U16 port, sockaddr_in& address) {
    struct addrinfo hints;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_DGRAM;

    struct addrinfo* result = nullptr;
    if ((::getaddrinfo(host, nullptr, &hints, &result) != 0) || (result == nullptr)) {
        return false;
    }

    memcpy(&address, result->ai_addr, sizeof(address));
    address.sin_port = htons(port);
    ::freeaddrinfo(result);
    return true;
}

}  // namespace Cfdp
}  // namespace Ccsds
}  // namespace Cfdpd

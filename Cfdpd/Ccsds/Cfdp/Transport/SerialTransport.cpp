// ======================================================================
// \title  SerialTransport.cpp
// \author campuzan
// \brief  cpp file for the byte-stream transport
// ======================================================================

#include <Cfdpd/Ccsds/Cfdp/Transport/SerialTransport.hpp>

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <thread>

namespace Cfdpd {
namespace Ccsds {
namespace Cfdp {

SerialTransport::SerialTransport(const std::vector<EntityId>& destinations)
    : Transport("SerialTransport"), m_readFd(-1), m_writeFd(-1), m_destinations(destinations) {}

SerialTransport::~SerialTransport() {
    this->close();
}

bool SerialTransport::openDevice(const char* path) {
    const int fd = ::open(path, O_RDWR | O_NOCTTY);
    if (fd < 0) {
        return false;
    }

    struct termios options;
    if (::tcgetattr(fd, &options) < 0) {
        static_cast<void>(::close(fd));
        return false;
    }
    ::cfmakeraw(&options);
    if (::tcsetattr(fd, TCSANOW, &options) < 0) {
        static_cast<void>(::close(fd));
        return false;
    }

    this->attach(fd, fd);
    return true;
}

void SerialTransport::attach(int readFd, int writeFd) {
    this->close();
    this->m_readFd = readFd;
    this->m_writeFd = writeFd;
}

void SerialTransport::close() {
    if (this->m_writeFd >= 0 && this->m_writeFd != this->m_readFd) {
        static_cast<void>(::close(this->m_writeFd));
    }
    if (this->m_readFd >= 0) {
        static_cast<void>(::close(this->m_readFd));
    }
    this->m_readFd = -1;
    this->m_writeFd = -1;
}

bool SerialTransport::isReady() const {
    return (this->m_readFd >= 0) && (this->m_writeFd >= 0) && (::fcntl(this->m_readFd, F_GETFL) != -1) &&
           (::fcntl(this->m_writeFd, F_GETFL) != -1);
}

Transport::Status SerialTransport::request(EntityId destEid, const Pdu& pdu) {
    if (std::find(this->m_destinations.begin(), this->m_destinations.end(), destEid) == this->m_destinations.end()) {
        return NO_ROUTE;
    }

    U8 buffer[CFDP_MAX_PDU_SIZE];
    FwSizeType length = 0;
    if (!this->encode(pdu, buffer, sizeof(buffer), length)) {
        return SEND_ERROR;
    }

    FwSizeType written = 0;
    while (written < length) {
        const ssize_t result = ::write(this->m_writeFd, buffer + written, length - written);
        if (result < 0) {
            if (errno == EINTR) {
                continue;
            }
            this->m_events.log_WARNING_LO_TransportSendFailed(destEid, transportStatusName(SEND_ERROR), errno);
            return SEND_ERROR;
        }
        written += static_cast<FwSizeType>(result);
    }
    return SUCCESS;
}

Transport::Status SerialTransport::pduHandler(const std::atomic<bool>& shutdown,
                                              PduSink& inbound,
                                              OutboundQueue& outbound,
                                              FwSizeType bufferSize) {
    std::vector<U8> buffer(std::max<FwSizeType>(bufferSize, PduHeader::FIXED_PREFIX_SIZE));

    while (!shutdown.load()) {
        int available = 0;
        if (::ioctl(this->m_readFd, FIONREAD, &available) < 0) {
            this->m_events.log_WARNING_HI_TransportReceiveFailed(errno);
            return this->stopped(RECV_ERROR);
        }

        if (available > 0) {
            // One PDU per iteration so sending is not starved by a busy line
            const Status status = this->receivePdu(shutdown, buffer, inbound);
            if (status != SUCCESS) {
                return this->stopped(status);
            }
        } else if (outbound.getQueueSize() == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(CFDP_TRANSPORT_IDLE_SLEEP_MS));
        }

        if (this->drainOutbound(outbound) == QUEUE_DISCONNECTED) {
            return this->stopped(QUEUE_DISCONNECTED);
        }
    }

    return this->stopped(SUCCESS);
}

std::vector<EntityId> SerialTransport::getDestinations() const {
    return this->m_destinations;
}

SerialTransport::ReadStatus SerialTransport::readExact(const std::atomic<bool>& shutdown,
                                                       U8* data,
                                                       FwSizeType size,
                                                       FwSizeType& received) {
    received = 0;
    std::chrono::steady_clock::time_point lastByte = std::chrono::steady_clock::now();
    while (received < size) {
        if (shutdown.load()) {
            return READ_SHUTDOWN;
        }

        struct pollfd pending;
        pending.fd = this->m_readFd;
        pending.events = POLLIN;
        pending.revents = 0;
        const int ready = ::poll(&pending, 1, CFDP_TRANSPORT_RECV_TIMEOUT_MS);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            return READ_FAILED;
        }
        if (ready == 0) {
            if (std::chrono::steady_clock::now() - lastByte >
                std::chrono::milliseconds(CFDP_SERIAL_FRAME_TIMEOUT_MS)) {
                return READ_STALLED;
            }
            continue;
        }
        if ((pending.revents & POLLNVAL) != 0) {
            errno = EBADF;
            return READ_FAILED;
        }

        const ssize_t result = ::read(this->m_readFd, data + received, size - received);
        if (result > 0) {
            received += static_cast<FwSizeType>(result);
            lastByte = std::chrono::steady_clock::now();
        } else if (result == 0) {
            // end of stream
            errno = EPIPE;
            return READ_FAILED;
        } else if (errno != EINTR && errno != EAGAIN && errno != EWOULDBLOCK) {
            return READ_FAILED;
        }
    }
    return READ_OK;
}

Transport::Status SerialTransport::readFailed(ReadStatus status, FwSizeType received, FwSizeType expected) {
    switch (status) {
        case READ_STALLED:
            // The partial frame is dropped; the next read looks for a header again
            this->m_events.log_WARNING_LO_TransportFrameStalled(static_cast<U32>(received),
                                                                 static_cast<U32>(expected));
            return SUCCESS;
        case READ_SHUTDOWN:
            return SUCCESS;
        default:
            this->m_events.log_WARNING_HI_TransportReceiveFailed(errno);
            return RECV_ERROR;
    }
}

Transport::Status SerialTransport::receivePdu(const std::atomic<bool>& shutdown,
                                              std::vector<U8>& buffer,
                                              PduSink& inbound) {
    FwSizeType received = 0;
    ReadStatus read = this->readExact(shutdown, buffer.data(), PduHeader::FIXED_PREFIX_SIZE, received);
    if (read != READ_OK) {
        return this->readFailed(read, received, PduHeader::FIXED_PREFIX_SIZE);
    }

    FwSizeType total = 0;
    const SerializeStatus status = Pdu::getPduLength(buffer.data(), total);
    if (status != FW_SERIALIZE_OK) {
        // Only the prefix is dropped; the next read looks for a header again
        this->m_events.log_WARNING_LO_PduDecodeFailed(PduHeader::FIXED_PREFIX_SIZE, status);
        return SUCCESS;
    }

    if (total > buffer.size()) {
        // Consume the oversized PDU so the stream stays aligned
        this->m_events.log_WARNING_LO_PduDecodeFailed(static_cast<U32>(total), FW_DESERIALIZE_SIZE_MISMATCH);
        FwSizeType remaining = total - PduHeader::FIXED_PREFIX_SIZE;
        while (remaining > 0) {
            const FwSizeType piece = std::min<FwSizeType>(remaining, buffer.size());
            read = this->readExact(shutdown, buffer.data(), piece, received);
            if (read != READ_OK) {
                return this->readFailed(read, total - remaining + received, total);
            }
            remaining -= piece;
        }
        return SUCCESS;
    }

    read = this->readExact(shutdown, buffer.data() + PduHeader::FIXED_PREFIX_SIZE,
                           total - PduHeader::FIXED_PREFIX_SIZE, received);
    if (read != READ_OK) {
        return this->readFailed(read, PduHeader::FIXED_PREFIX_SIZE + received, total);
    }

    if (!this->forwardInbound(buffer.data(), total, inbound)) {
        return QUEUE_DISCONNECTED;
    }
    return SUCCESS;
}

}  // namespace Cfdp
}  // namespace Ccsds
}  // namespace Cfdpd

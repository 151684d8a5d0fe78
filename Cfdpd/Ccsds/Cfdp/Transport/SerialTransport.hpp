// ======================================================================
// \title  SerialTransport.hpp
// \author campuzan
// \brief  hpp file for the byte-stream transport
// ======================================================================

#ifndef Cfdpd_Ccsds_Cfdp_SerialTransport_HPP
#define Cfdpd_Ccsds_Cfdp_SerialTransport_HPP

#include <Cfdpd/Ccsds/Cfdp/Transport/Transport.hpp>

namespace Cfdpd {
namespace Ccsds {
namespace Cfdp {

//! \class SerialTransport
//! \brief Back-to-back PDUs over a byte stream
//!
//! The stream carries no framing of its own: the PDU header gives the
//! length of each PDU. The descriptor may be a tty, a socket or a pipe;
//! reads and writes may use different descriptors. Every entity in the
//! destination list is reached over the same stream.
class SerialTransport : public Transport {
  public:
    //! Construct a closed transport serving the given entities
    explicit SerialTransport(const std::vector<EntityId>& destinations);
    ~SerialTransport();

    //! Open a tty in raw mode
    //! \return false if the device cannot be opened or configured
    bool openDevice(const char* path);

    //! Take ownership of readFd and writeFd, which may be the same descriptor
    void attach(int readFd, int writeFd);

    //! Close the descriptors
    void close();

    bool isReady() const override;
    Status request(EntityId destEid, const Pdu& pdu) override;
    Status pduHandler(const std::atomic<bool>& shutdown,
                      PduSink& inbound,
                      OutboundQueue& outbound,
                      FwSizeType bufferSize) override;
    std::vector<EntityId> getDestinations() const override;

  private:
    SerialTransport(const SerialTransport&) = delete;
    SerialTransport& operator=(const SerialTransport&) = delete;

    enum ReadStatus {
        READ_OK,
        READ_STALLED,   //!< no byte arrived within CFDP_SERIAL_FRAME_TIMEOUT_MS
        READ_SHUTDOWN,
        READ_FAILED,    //!< end of stream or a read error, errno is set
    };

    //! Read exactly size bytes, waiting at most CFDP_TRANSPORT_RECV_TIMEOUT_MS
    //! between checks of shutdown
    ReadStatus readExact(const std::atomic<bool>& shutdown, U8* data, FwSizeType size, FwSizeType& received);

    //! Log a short read and map it to the loop status
    Status readFailed(ReadStatus status, FwSizeType received, FwSizeType expected);

    //! Read one PDU off the stream and forward it
    Status receivePdu(const std::atomic<bool>& shutdown, std::vector<U8>& buffer, PduSink& inbound);

    int m_readFd;
    int m_writeFd;
    std::vector<EntityId> m_destinations;
};

}  // namespace Cfdp
}  // namespace Ccsds
}  // namespace Cfdpd

#endif  // Cfdpd_Ccsds_Cfdp_SerialTransport_HPP

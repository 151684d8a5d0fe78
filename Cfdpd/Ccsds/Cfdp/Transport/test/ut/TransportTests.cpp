// ======================================================================
// \title  TransportTests.cpp
// \author campuzan
// \brief  Unit tests for the UDP and serial transports
// ======================================================================

#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <future>
#include <memory>
#include <mutex>
#include <thread>

#include <Cfdpd/Ccsds/Cfdp/Transport/SerialTransport.hpp>
#include <Cfdpd/Ccsds/Cfdp/Transport/UdpTransport.hpp>

using namespace Cfdpd;
using namespace Cfdpd::Ccsds::Cfdp;

namespace {

//! Collects what a handler loop delivers
class CollectingSink : public PduSink {
  public:
    CollectingSink() : m_accept(true) {}

    bool deliverInbound(const Pdu& pdu) override {
        std::lock_guard<std::mutex> lock(this->m_mutex);
        if (!this->m_accept) {
            return false;
        }
        this->m_pdus.push_back(pdu);
        this->m_cv.notify_all();
        return true;
    }

    //! Wait until count PDUs have arrived
    bool waitFor(FwSizeType count, U32 timeoutMs = 5000) {
        std::unique_lock<std::mutex> lock(this->m_mutex);
        return this->m_cv.wait_for(lock, std::chrono::milliseconds(timeoutMs),
                                   [this, count] { return this->m_pdus.size() >= count; });
    }

    std::vector<Pdu> pdus() {
        std::lock_guard<std::mutex> lock(this->m_mutex);
        return this->m_pdus;
    }

    void refuse() {
        std::lock_guard<std::mutex> lock(this->m_mutex);
        this->m_accept = false;
    }

  private:
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::vector<Pdu> m_pdus;
    bool m_accept;
};

//! Runs a handler loop on its own thread
class HandlerThread {
  public:
    HandlerThread(Transport& transport, PduSink& sink, FwSizeType bufferSize = CFDP_DEFAULT_TRANSPORT_BUFFER_SIZE)
        : m_outbound(CFDP_TRANSPORT_QUEUE_DEPTH), m_shutdown(false), m_status(Transport::SEND_ERROR) {
        this->m_thread = std::thread([this, &transport, &sink, bufferSize] {
            this->m_status = transport.pduHandler(this->m_shutdown, sink, this->m_outbound, bufferSize);
        });
    }

    ~HandlerThread() { this->stop(); }

    Transport::Status stop() {
        this->m_shutdown = true;
        if (this->m_thread.joinable()) {
            this->m_thread.join();
        }
        return this->m_status;
    }

    //! Wait for the loop to return on its own
    Transport::Status join() {
        if (this->m_thread.joinable()) {
            this->m_thread.join();
        }
        return this->m_status;
    }

    OutboundQueue m_outbound;

  private:
    std::atomic<bool> m_shutdown;
    Transport::Status m_status;
    std::thread m_thread;
};

Pdu makeEof(EntityId source, TransactionSeq seq, EntityId dest) {
    Pdu pdu;
    pdu.asEofPdu().initialize(DIRECTION_TOWARD_RECEIVER, Class::CLASS_2, source, seq, dest, CONDITION_CODE_NO_ERROR,
                              0x01020304, 1234);
    return pdu;
}

Pdu makeMetadata(EntityId source, TransactionSeq seq, EntityId dest) {
    Pdu pdu;
    pdu.asMetadataPdu().initialize(DIRECTION_TOWARD_RECEIVER, Class::CLASS_2, source, seq, dest, 1234,
                                   "a/long/source/file/name.bin", "a/long/destination/file/name.bin",
                                   CHECKSUM_TYPE_MODULAR, 1);
    return pdu;
}

Pdu makeAck(EntityId source, TransactionSeq seq, EntityId dest) {
    Pdu pdu;
    pdu.asAckPdu().initialize(DIRECTION_TOWARD_SENDER, Class::CLASS_2, source, seq, dest,
                              FILE_DIRECTIVE_END_OF_FILE, 1, CONDITION_CODE_NO_ERROR, ACK_TXN_STATUS_ACTIVE);
    return pdu;
}

std::vector<U8> encodePdu(const Pdu& pdu) {
    std::vector<U8> bytes(CFDP_MAX_PDU_SIZE);
    FwSizeType length = 0;
    EXPECT_EQ(FW_SERIALIZE_OK, pdu.toBuffer(bytes.data(), bytes.size(), length));
    bytes.resize(length);
    return bytes;
}

void writeAll(int fd, const std::vector<U8>& bytes) {
    ASSERT_EQ(static_cast<ssize_t>(bytes.size()), ::write(fd, bytes.data(), bytes.size()));
}

}  // namespace

// ======================================================================
// UDP Tests
// ======================================================================

class UdpTransportTest : public ::testing::Test {
  protected:
    void SetUp() override {
        ASSERT_TRUE(this->m_local.open("127.0.0.1", 0));
        ASSERT_TRUE(this->m_remote.open("127.0.0.1", 0));
        ASSERT_TRUE(this->m_local.addRoute(2, "127.0.0.1", this->m_remote.getLocalPort()));
        ASSERT_TRUE(this->m_remote.addRoute(1, "127.0.0.1", this->m_local.getLocalPort()));
    }

    UdpTransport m_local;
    UdpTransport m_remote;
};

TEST_F(UdpTransportTest, ReadyOnlyWhenBound) {
    UdpTransport closed;
    EXPECT_FALSE(closed.isReady());
    EXPECT_EQ(0, closed.getLocalPort());

    EXPECT_TRUE(this->m_local.isReady());
    EXPECT_NE(0, this->m_local.getLocalPort());
    EXPECT_FALSE(closed.open("no.such.host.invalid", 0));
}

TEST_F(UdpTransportTest, Destinations) {
    ASSERT_TRUE(this->m_local.addRoute(7, "localhost", 4000));
    const std::vector<EntityId> destinations = this->m_local.getDestinations();
    ASSERT_EQ(2U, destinations.size());
    EXPECT_EQ(2U, destinations[0]);
    EXPECT_EQ(7U, destinations[1]);
}

TEST_F(UdpTransportTest, UnknownDestinationHasNoRoute) {
    EXPECT_EQ(Transport::NO_ROUTE, this->m_local.request(99, makeEof(1, 1, 99)));
}

TEST_F(UdpTransportTest, DirectRequestArrives) {
    CollectingSink sink;
    HandlerThread remote(this->m_remote, sink);

    ASSERT_EQ(Transport::SUCCESS, this->m_local.request(2, makeEof(1, 17, 2)));
    ASSERT_TRUE(sink.waitFor(1));

    const std::vector<Pdu> pdus = sink.pdus();
    ASSERT_EQ(T_EOF, pdus[0].getType());
    EXPECT_EQ(TransactionId(1, 17), pdus[0].getTransactionId());
    EXPECT_EQ(1234U, pdus[0].asEofPdu().getFileSize());
    EXPECT_EQ(Transport::SUCCESS, remote.stop());
}

TEST_F(UdpTransportTest, BothLoopsExchangeQueuedPdus) {
    CollectingSink localSink;
    CollectingSink remoteSink;
    HandlerThread local(this->m_local, localSink);
    HandlerThread remote(this->m_remote, remoteSink);

    for (TransactionSeq seq = 1; seq <= 5; ++seq) {
        ASSERT_EQ(Utils::QUEUE_OK, local.m_outbound.enqueue(OutboundPdu(2, makeMetadata(1, seq, 2))));
    }
    ASSERT_EQ(Utils::QUEUE_OK, remote.m_outbound.enqueue(OutboundPdu(1, makeAck(1, 1, 2))));
    // Nowhere to go; logged and dropped
    ASSERT_EQ(Utils::QUEUE_OK, remote.m_outbound.enqueue(OutboundPdu(42, makeAck(1, 1, 42))));

    ASSERT_TRUE(remoteSink.waitFor(5));
    ASSERT_TRUE(localSink.waitFor(1));
    EXPECT_EQ(T_ACK, localSink.pdus()[0].getType());

    const std::vector<Pdu> pdus = remoteSink.pdus();
    for (FwSizeType i = 0; i < pdus.size(); ++i) {
        EXPECT_EQ(T_METADATA, pdus[i].getType());
        EXPECT_EQ("a/long/destination/file/name.bin", pdus[i].asMetadataPdu().getDestFilename());
    }

    EXPECT_EQ(Transport::SUCCESS, local.stop());
    EXPECT_EQ(Transport::SUCCESS, remote.stop());
}

TEST_F(UdpTransportTest, UndecodableDatagramIsDropped) {
    CollectingSink sink;
    HandlerThread remote(this->m_remote, sink);

    const int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
    ASSERT_GE(fd, 0);
    sockaddr_in address;
    memset(&address, 0, sizeof(address));
    address.sin_family = AF_INET;
    address.sin_port = htons(this->m_remote.getLocalPort());
    address.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    const U8 garbage[] = {0xFF, 0x00, 0x03, 0x11, 0x01, 0x02, 0x03, 0x04};
    ASSERT_EQ(static_cast<ssize_t>(sizeof(garbage)),
              ::sendto(fd, garbage, sizeof(garbage), 0, reinterpret_cast<const sockaddr*>(&address),
                       sizeof(address)));
    static_cast<void>(::close(fd));

    ASSERT_EQ(Transport::SUCCESS, this->m_local.request(2, makeEof(1, 3, 2)));
    ASSERT_TRUE(sink.waitFor(1));
    EXPECT_EQ(1U, sink.pdus().size());
    EXPECT_EQ(T_EOF, sink.pdus()[0].getType());
}

TEST_F(UdpTransportTest, RefusingSinkStopsLoop) {
    CollectingSink sink;
    sink.refuse();
    HandlerThread remote(this->m_remote, sink);

    ASSERT_EQ(Transport::SUCCESS, this->m_local.request(2, makeEof(1, 3, 2)));
    EXPECT_EQ(Transport::QUEUE_DISCONNECTED, remote.join());
}

TEST_F(UdpTransportTest, ClosedOutboundQueueStopsLoop) {
    CollectingSink sink;
    HandlerThread local(this->m_local, sink);
    local.m_outbound.close();
    EXPECT_EQ(Transport::QUEUE_DISCONNECTED, local.join());
}

// ======================================================================
// Serial Tests
// ======================================================================

class SerialTransportTest : public ::testing::Test {
  protected:
    void SetUp() override {
        int fds[2];
        ASSERT_EQ(0, ::socketpair(AF_UNIX, SOCK_STREAM, 0, fds));
        this->m_localFd = fds[0];
        this->m_remoteFd = fds[1];
        this->m_remote.reset(new SerialTransport(std::vector<EntityId>(1, 1)));
        this->m_remote->attach(this->m_remoteFd, this->m_remoteFd);
    }

    void TearDown() override {
        if (this->m_localFd >= 0) {
            static_cast<void>(::close(this->m_localFd));
        }
    }

    int m_localFd;
    int m_remoteFd;
    std::unique_ptr<SerialTransport> m_remote;
};

TEST_F(SerialTransportTest, Readiness) {
    SerialTransport detached(std::vector<EntityId>(1, 3));
    EXPECT_FALSE(detached.isReady());
    EXPECT_FALSE(detached.openDevice("/nonexistent/tty"));
    EXPECT_TRUE(this->m_remote->isReady());
    EXPECT_EQ(std::vector<EntityId>(1, 1), this->m_remote->getDestinations());
}

TEST_F(SerialTransportTest, BackToBackPdusAreSplitByHeaderLength) {
    CollectingSink sink;
    HandlerThread remote(*this->m_remote, sink);

    std::vector<U8> stream = encodePdu(makeMetadata(1, 1, 2));
    const std::vector<U8> eof = encodePdu(makeEof(1, 1, 2));
    stream.insert(stream.end(), eof.begin(), eof.end());
    writeAll(this->m_localFd, stream);

    ASSERT_TRUE(sink.waitFor(2));
    const std::vector<Pdu> pdus = sink.pdus();
    EXPECT_EQ(T_METADATA, pdus[0].getType());
    EXPECT_EQ(T_EOF, pdus[1].getType());
    EXPECT_EQ(Transport::SUCCESS, remote.stop());
}

TEST_F(SerialTransportTest, QueuedPdusAreWritten) {
    CollectingSink sink;
    HandlerThread remote(*this->m_remote, sink);
    ASSERT_EQ(Utils::QUEUE_OK, remote.m_outbound.enqueue(OutboundPdu(1, makeAck(1, 9, 2))));

    U8 buffer[64];
    const std::vector<U8> expected = encodePdu(makeAck(1, 9, 2));
    FwSizeType received = 0;
    while (received < expected.size()) {
        const ssize_t got = ::read(this->m_localFd, buffer + received, sizeof(buffer) - received);
        ASSERT_GT(got, 0);
        received += static_cast<FwSizeType>(got);
    }
    EXPECT_EQ(expected, std::vector<U8>(buffer, buffer + received));
    EXPECT_EQ(Transport::NO_ROUTE, this->m_remote->request(5, makeAck(1, 9, 5)));
}

// A prefix with a bad version is skipped and the stream resynchronizes
TEST_F(SerialTransportTest, RecoversFromBadPrefix) {
    CollectingSink sink;
    HandlerThread remote(*this->m_remote, sink);

    std::vector<U8> stream = {0xE0, 0x00, 0x00, 0x00};
    const std::vector<U8> eof = encodePdu(makeEof(1, 2, 2));
    stream.insert(stream.end(), eof.begin(), eof.end());
    writeAll(this->m_localFd, stream);

    ASSERT_TRUE(sink.waitFor(1));
    EXPECT_EQ(TransactionId(1, 2), sink.pdus()[0].getTransactionId());
}

TEST_F(SerialTransportTest, OversizedPduIsConsumed) {
    CollectingSink sink;
    HandlerThread remote(*this->m_remote, sink, 16);

    std::vector<U8> stream = encodePdu(makeMetadata(1, 1, 2));
    ASSERT_GT(stream.size(), 16U);
    const std::vector<U8> ack = encodePdu(makeAck(1, 4, 2));
    ASSERT_LE(ack.size(), 16U);
    stream.insert(stream.end(), ack.begin(), ack.end());
    writeAll(this->m_localFd, stream);

    ASSERT_TRUE(sink.waitFor(1));
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    const std::vector<Pdu> pdus = sink.pdus();
    ASSERT_EQ(1U, pdus.size());
    EXPECT_EQ(T_ACK, pdus[0].getType());
}

TEST_F(SerialTransportTest, EndOfStreamIsReceiveError) {
    CollectingSink sink;
    HandlerThread remote(*this->m_remote, sink);

    // Half a header, then the peer goes away
    const std::vector<U8> partial = {0x24, 0x00};
    writeAll(this->m_localFd, partial);
    static_cast<void>(::close(this->m_localFd));
    this->m_localFd = -1;

    EXPECT_EQ(Transport::RECV_ERROR, remote.join());
}

TEST_F(SerialTransportTest, PartialFrameDoesNotBlockShutdown) {
    CollectingSink sink;
    const std::vector<U8> eof = encodePdu(makeEof(1, 1, 2));
    ASSERT_GT(eof.size(), 6U);
    writeAll(this->m_localFd, std::vector<U8>(eof.begin(), eof.begin() + 6));

    HandlerThread remote(*this->m_remote, sink);
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    std::future<Transport::Status> stopped = std::async(std::launch::async, [&remote] { return remote.stop(); });
    const bool joined = (stopped.wait_for(std::chrono::seconds(3)) == std::future_status::ready);
    if (!joined) {
        // Unblock the loop so the suite can go on
        static_cast<void>(::close(this->m_localFd));
        this->m_localFd = -1;
    }
    EXPECT_TRUE(joined);
    EXPECT_EQ(Transport::SUCCESS, stopped.get());
    EXPECT_TRUE(sink.pdus().empty());
}

// A frame that goes quiet mid-way is dropped and the next header is found
TEST_F(SerialTransportTest, StalledFrameIsDropped) {
    CollectingSink sink;
    HandlerThread remote(*this->m_remote, sink);

    const std::vector<U8> first = encodePdu(makeEof(1, 1, 2));
    writeAll(this->m_localFd, std::vector<U8>(first.begin(), first.begin() + 6));
    std::this_thread::sleep_for(std::chrono::milliseconds(CFDP_SERIAL_FRAME_TIMEOUT_MS + 300));
    writeAll(this->m_localFd, encodePdu(makeEof(1, 3, 2)));

    ASSERT_TRUE(sink.waitFor(1));
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    const std::vector<Pdu> pdus = sink.pdus();
    ASSERT_EQ(1U, pdus.size());
    EXPECT_EQ(TransactionId(1, 3), pdus[0].getTransactionId());
    EXPECT_EQ(Transport::SUCCESS, remote.stop());
}

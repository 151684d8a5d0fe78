// ======================================================================
// \title  DaemonTests.cpp
// \author campuzan
// \brief  Integration tests running two daemons over UDP loopback
// ======================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

#include <Cfdpd/Ccsds/Cfdp/Daemon.hpp>
#include <Cfdpd/Ccsds/Cfdp/Types/Checksum.hpp>
#include <Cfdpd/Ccsds/Cfdp/Transport/UdpTransport.hpp>
#include <Cfdpd/Filestore/NativeFilestore.hpp>
#include <Cfdpd/Filestore/test/ut/TempDirectory.hpp>

using namespace Cfdpd;
using namespace Cfdpd::Ccsds::Cfdp;

namespace {

const EntityId SENDER_EID = 1;
const EntityId RECEIVER_EID = 2;

//! Drops the first inbound PDU of one kind
class DropOnce {
  public:
    DropOnce(PduTypeEnum type, FileDirective acked = FILE_DIRECTIVE_INVALID_MAX)
        : m_type(type), m_acked(acked), m_dropped(false) {}

    bool operator()(const Pdu& pdu) {
        if (this->m_dropped || (pdu.getType() != this->m_type)) {
            return false;
        }
        if ((this->m_type == T_ACK) && (pdu.asAckPdu().getAckedDirectiveCode() != this->m_acked)) {
            return false;
        }
        this->m_dropped = true;
        return true;
    }

  private:
    PduTypeEnum m_type;
    FileDirective m_acked;
    bool m_dropped;
};

//! A transport that loses, repeats or cuts off inbound PDUs before the daemon sees them
class LossyTransport : public Transport, private PduSink {
  public:
    explicit LossyTransport(std::unique_ptr<Transport> inner)
        : Transport("LossyTransport"),
          m_inner(std::move(inner)),
          m_sink(nullptr),
          m_duplicate(false),
          m_failAt(0),
          m_seen(0),
          m_failed(false),
          m_dropped(0) {}

    //! Lose the first PDU matching each rule; only before the daemon starts
    void dropOnce(const DropOnce& rule) { this->m_once.push_back(rule); }

    //! Lose every PDU of one kind
    void dropAlways(PduTypeEnum type) { this->m_always.push_back(type); }

    //! Deliver every PDU that is not lost twice
    void duplicateAll() { this->m_duplicate = true; }

    //! Lose the count-th inbound PDU and end the loop with RECV_ERROR
    void failAt(U32 count) { this->m_failAt = count; }

    U32 getDropped() const { return this->m_dropped.load(); }
    bool hasFailed() const { return this->m_failed.load(); }

    bool isReady() const override { return this->m_inner->isReady(); }

    Status request(EntityId destEid, const Pdu& pdu) override { return this->m_inner->request(destEid, pdu); }

    Status pduHandler(const std::atomic<bool>& shutdown,
                      PduSink& inbound,
                      OutboundQueue& outbound,
                      FwSizeType bufferSize) override {
        this->m_sink = &inbound;
        if (this->m_failAt == 0) {
            return this->m_inner->pduHandler(shutdown, *this, outbound, bufferSize);
        }

        // The inner loop stops on shutdown or once the link is cut
        std::atomic<bool> innerShutdown(false);
        std::thread relay([this, &shutdown, &innerShutdown] {
            while (!shutdown.load() && !this->m_failed.load() && !innerShutdown.load()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(2));
            }
            innerShutdown = true;
        });
        const Status status = this->m_inner->pduHandler(innerShutdown, *this, outbound, bufferSize);
        innerShutdown = true;
        relay.join();
        return this->m_failed.load() ? RECV_ERROR : status;
    }

    std::vector<EntityId> getDestinations() const override { return this->m_inner->getDestinations(); }

  private:
    bool deliverInbound(const Pdu& pdu) override {
        if ((this->m_failAt > 0) && (this->m_failed.load() || (++this->m_seen >= this->m_failAt))) {
            this->m_failed = true;
            ++this->m_dropped;
            return true;
        }
        if (this->lose(pdu)) {
            ++this->m_dropped;
            return true;
        }
        if (!this->m_sink->deliverInbound(pdu)) {
            return false;
        }
        return !this->m_duplicate || this->m_sink->deliverInbound(pdu);
    }

    bool lose(const Pdu& pdu) {
        for (std::vector<PduTypeEnum>::const_iterator it = this->m_always.begin(); it != this->m_always.end(); ++it) {
            if (pdu.getType() == *it) {
                return true;
            }
        }
        for (std::vector<DropOnce>::iterator it = this->m_once.begin(); it != this->m_once.end(); ++it) {
            if ((*it)(pdu)) {
                return true;
            }
        }
        return false;
    }

    std::unique_ptr<Transport> m_inner;
    PduSink* m_sink;
    std::vector<DropOnce> m_once;
    std::vector<PduTypeEnum> m_always;
    bool m_duplicate;
    U32 m_failAt;
    U32 m_seen;
    std::atomic<bool> m_failed;
    std::atomic<U32> m_dropped;
};

}  // namespace

class DaemonTest : public ::testing::Test {
  protected:
    DaemonTest() : m_senderShutdown(false), m_receiverShutdown(false), m_toSender(nullptr), m_toReceiver(nullptr) {}

    void SetUp() override {
        ASSERT_TRUE(this->m_dir.isValid());
        this->m_sendRoot = this->m_dir.makeDirectory("send");
        this->m_recvRoot = this->m_dir.makeDirectory("recv");
        this->m_sendStore.reset(new NativeFilestore(this->m_sendRoot));
        this->m_recvStore.reset(new NativeFilestore(this->m_recvRoot));

        this->m_config.ackTimerMs = 100;
        this->m_config.inactivityTimerMs = 1000;
        this->m_config.ackLimit = 8;
        this->m_config.nakLimit = 8;
        this->m_config.outgoingFileChunkSize = 200;

        std::unique_ptr<UdpTransport> senderUdp(new UdpTransport());
        std::unique_ptr<UdpTransport> receiverUdp(new UdpTransport());
        ASSERT_TRUE(senderUdp->open("127.0.0.1", 0));
        ASSERT_TRUE(receiverUdp->open("127.0.0.1", 0));
        ASSERT_TRUE(senderUdp->addRoute(RECEIVER_EID, "127.0.0.1", receiverUdp->getLocalPort()));
        ASSERT_TRUE(receiverUdp->addRoute(SENDER_EID, "127.0.0.1", senderUdp->getLocalPort()));

        this->m_toSender = new LossyTransport(std::move(senderUdp));
        this->m_toReceiver = new LossyTransport(std::move(receiverUdp));
        this->m_senderLink.reset(this->m_toSender);
        this->m_receiverLink.reset(this->m_toReceiver);
    }

    void TearDown() override {
        this->m_sender.reset();
        this->m_receiver.reset();
    }

    //! Build both daemons with the current configuration and start them
    void startDaemons() {
        EntityConfig senderConfig = this->m_config;
        senderConfig.localEid = SENDER_EID;
        EntityConfig receiverConfig = this->m_config;
        receiverConfig.localEid = RECEIVER_EID;

        this->m_sender.reset(new Daemon(senderConfig, *this->m_sendStore, this->m_senderShutdown));
        this->m_receiver.reset(new Daemon(receiverConfig, *this->m_recvStore, this->m_receiverShutdown));
        this->m_sender->addTransport(std::move(this->m_senderLink));
        this->m_receiver->addTransport(std::move(this->m_receiverLink));
        ASSERT_EQ(Status::SUCCESS, this->m_sender->start());
        ASSERT_EQ(Status::SUCCESS, this->m_receiver->start());
    }

    std::vector<U8> makeSource(const std::string& name, FwSizeType size) {
        const std::vector<U8> contents = TempDirectory::pattern(size, static_cast<U32>(size));
        EXPECT_TRUE(TempDirectory::writeFile(this->m_sendRoot + "/" + name, contents));
        return contents;
    }

    std::vector<U8> received(const std::string& name) const {
        return TempDirectory::readFile(this->m_recvRoot + "/" + name);
    }

    PutRequest putRequest(const std::string& name, Class::T mode) const {
        PutRequest request;
        request.sourceFilename = name;
        request.destFilename = "out/" + name;
        request.destEid = RECEIVER_EID;
        request.transmissionMode = mode;
        return request;
    }

    //! Poll a daemon until the transaction has finished its protocol exchange
    static bool waitFinished(Daemon& daemon, const TransactionId& id, Report& report, U32 timeoutMs = 15000) {
        const std::chrono::steady_clock::time_point deadline =
            std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
        while (std::chrono::steady_clock::now() < deadline) {
            if (daemon.report(id, report) && report.finished) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        return false;
    }

    //! Hand the receiver a complete class 1 transfer of ten bytes from entity 9
    void injectSmallFile(TransactionSeq seq) {
        const EntityId source = 9;
        const std::vector<U8> contents = TempDirectory::pattern(10, seq);
        const std::string name = "late/" + std::to_string(seq) + ".bin";

        Pdu metadata;
        metadata.asMetadataPdu().initialize(DIRECTION_TOWARD_RECEIVER, Class::CLASS_1, source, seq, RECEIVER_EID, 10,
                                            name, name, CHECKSUM_TYPE_MODULAR, 0);
        Pdu fileData;
        fileData.asFileDataPdu().initialize(DIRECTION_TOWARD_RECEIVER, Class::CLASS_1, source, seq, RECEIVER_EID, 0,
                                            10, contents.data());
        Checksum checksum;
        checksum.update(contents.data(), 0, static_cast<U32>(contents.size()));
        Pdu eof;
        eof.asEofPdu().initialize(DIRECTION_TOWARD_RECEIVER, Class::CLASS_1, source, seq, RECEIVER_EID,
                                  CONDITION_CODE_NO_ERROR, checksum.getValue(), 10);

        EXPECT_TRUE(this->m_receiver->deliverInbound(metadata));
        EXPECT_TRUE(this->m_receiver->deliverInbound(fileData));
        EXPECT_TRUE(this->m_receiver->deliverInbound(eof));
    }

    //! Send one file and expect both ends to finish cleanly with identical contents
    void expectDelivered(FwSizeType size, Class::T mode) {
        const std::vector<U8> contents = this->makeSource("src.bin", size);
        this->startDaemons();

        const TransactionId id = this->m_sender->put(this->putRequest("src.bin", mode));
        EXPECT_EQ(SENDER_EID, id.sourceEid);

        Report sender;
        Report receiver;
        ASSERT_TRUE(waitFinished(*this->m_sender, id, sender));
        ASSERT_TRUE(waitFinished(*this->m_receiver, id, receiver));

        EXPECT_EQ(TXN_STATUS_NO_ERROR, sender.status);
        EXPECT_EQ(TXN_STATUS_NO_ERROR, receiver.status);
        EXPECT_EQ(FIN_FILE_STATUS_RETAINED, receiver.fileStatus);
        EXPECT_EQ(DIRECTION_RX, receiver.role);
        EXPECT_EQ(mode, receiver.mode);
        EXPECT_EQ(static_cast<FileSize>(size), receiver.fileSize);
        EXPECT_EQ(contents, this->received("out/src.bin"));
    }

    TempDirectory m_dir;
    std::string m_sendRoot;
    std::string m_recvRoot;
    std::unique_ptr<NativeFilestore> m_sendStore;
    std::unique_ptr<NativeFilestore> m_recvStore;
    EntityConfig m_config;

    std::atomic<bool> m_senderShutdown;
    std::atomic<bool> m_receiverShutdown;

    // Owned by the daemons once they start
    LossyTransport* m_toSender;
    LossyTransport* m_toReceiver;
    std::unique_ptr<Transport> m_senderLink;
    std::unique_ptr<Transport> m_receiverLink;

    std::unique_ptr<Daemon> m_sender;
    std::unique_ptr<Daemon> m_receiver;
};

TEST_F(DaemonTest, StartTwiceFails) {
    this->startDaemons();
    EXPECT_EQ(Status::ERROR, this->m_sender->start());
}

TEST_F(DaemonTest, StartRequiresReadyTransports) {
    std::atomic<bool> shutdown(false);
    Daemon daemon(this->m_config, *this->m_sendStore, shutdown);
    daemon.addTransport(std::unique_ptr<Transport>(new UdpTransport()));
    EXPECT_EQ(Status::ERROR, daemon.start());
}

TEST_F(DaemonTest, CleanTransfer) {
    this->expectDelivered(3000, Class::CLASS_2);
    EXPECT_EQ(0U, this->m_toReceiver->getDropped());
}

TEST_F(DaemonTest, UnacknowledgedTransfer) {
    this->expectDelivered(3000, Class::CLASS_1);
}

TEST_F(DaemonTest, LostMetadataIsResent) {
    this->m_toReceiver->dropOnce(DropOnce(T_METADATA));
    this->expectDelivered(2500, Class::CLASS_2);
    EXPECT_EQ(1U, this->m_toReceiver->getDropped());
}

TEST_F(DaemonTest, LostEofIsResent) {
    this->m_toReceiver->dropOnce(DropOnce(T_EOF));
    this->expectDelivered(2500, Class::CLASS_2);
    EXPECT_EQ(1U, this->m_toReceiver->getDropped());
}

TEST_F(DaemonTest, LostFinIsResent) {
    this->m_toSender->dropOnce(DropOnce(T_FIN));
    this->expectDelivered(2500, Class::CLASS_2);
    EXPECT_EQ(1U, this->m_toSender->getDropped());
}

TEST_F(DaemonTest, LostEofAckIsResent) {
    this->m_toSender->dropOnce(DropOnce(T_ACK, FILE_DIRECTIVE_END_OF_FILE));
    this->expectDelivered(2500, Class::CLASS_2);
    EXPECT_EQ(1U, this->m_toSender->getDropped());
}

TEST_F(DaemonTest, LostFinAckIsResent) {
    this->m_toReceiver->dropOnce(DropOnce(T_ACK, FILE_DIRECTIVE_FIN));
    this->expectDelivered(2500, Class::CLASS_2);
    EXPECT_EQ(1U, this->m_toReceiver->getDropped());
}

// One loss of every kind in each direction
TEST_F(DaemonTest, NoisyLinkStillDelivers) {
    this->m_toReceiver->dropOnce(DropOnce(T_METADATA));
    this->m_toReceiver->dropOnce(DropOnce(T_FILE_DATA));
    this->m_toReceiver->dropOnce(DropOnce(T_EOF));
    this->m_toReceiver->dropOnce(DropOnce(T_ACK, FILE_DIRECTIVE_FIN));
    this->m_toSender->dropOnce(DropOnce(T_NAK));
    this->m_toSender->dropOnce(DropOnce(T_ACK, FILE_DIRECTIVE_END_OF_FILE));
    this->m_toSender->dropOnce(DropOnce(T_FIN));
    this->expectDelivered(6000, Class::CLASS_2);
}

// Every PDU arrives twice in both directions
TEST_F(DaemonTest, DuplicatedPdusAreHarmless) {
    this->m_toReceiver->duplicateAll();
    this->m_toSender->duplicateAll();
    this->expectDelivered(6000, Class::CLASS_2);
}

TEST_F(DaemonTest, DuplicatedPdusWithLostMetadata) {
    this->m_toReceiver->dropOnce(DropOnce(T_METADATA));
    this->m_toReceiver->duplicateAll();
    this->m_toSender->duplicateAll();
    this->expectDelivered(2500, Class::CLASS_2);
    EXPECT_EQ(1U, this->m_toReceiver->getDropped());
}

TEST_F(DaemonTest, DuplicatedUnacknowledgedTransfer) {
    this->m_toReceiver->duplicateAll();
    this->expectDelivered(3000, Class::CLASS_1);
}

TEST_F(DaemonTest, SilentReceiverReachesAckLimit) {
    this->m_config.ackLimit = 3;
    this->m_toSender->dropAlways(T_ACK);
    this->m_toSender->dropAlways(T_FIN);
    this->makeSource("src.bin", 1000);
    this->startDaemons();

    const TransactionId id = this->m_sender->put(this->putRequest("src.bin", Class::CLASS_2));
    Report sender;
    ASSERT_TRUE(waitFinished(*this->m_sender, id, sender));
    EXPECT_EQ(TXN_STATUS_POS_ACK_LIMIT_REACHED, sender.status);
    EXPECT_EQ(CONDITION_CODE_POS_ACK_LIMIT_REACHED, sender.condition);
    EXPECT_GT(this->m_toSender->getDropped(), 0U);
}

TEST_F(DaemonTest, MissingSourceIsRecorded) {
    this->startDaemons();
    const TransactionId first = this->m_sender->put(this->putRequest("absent.bin", Class::CLASS_2));
    const TransactionId second = this->m_sender->put(this->putRequest("absent.bin", Class::CLASS_1));
    EXPECT_EQ(first.seq + 1, second.seq);

    Report report;
    ASSERT_TRUE(this->m_sender->report(first, report));
    EXPECT_TRUE(report.finished);
    EXPECT_EQ(TXN_STATUS_FILESTORE_REJECTION, report.status);
    EXPECT_EQ(CONDITION_CODE_FILESTORE_REJECTION, report.condition);

    DaemonError spawnError;
    ASSERT_TRUE(this->m_sender->report(second, report, spawnError));
    EXPECT_EQ(DaemonError::SPAWN_SEND, spawnError.getKind());
    EXPECT_EQ(Filestore::DOESNT_EXIST, spawnError.getFilestoreStatus());
    EXPECT_EQ(second, spawnError.getTransactionId());

    EXPECT_EQ(DaemonError::TRANSACTION_COMMUNICATION, this->m_sender->cancel(first).getKind());
}

TEST_F(DaemonTest, DeliveredTransferHasNoSpawnError) {
    this->makeSource("src.bin", 500);
    this->startDaemons();
    const TransactionId id = this->m_sender->put(this->putRequest("src.bin", Class::CLASS_1));

    Report report;
    ASSERT_TRUE(waitFinished(*this->m_sender, id, report));
    DaemonError spawnError = DaemonError::unknownTransaction(id);
    ASSERT_TRUE(this->m_sender->report(id, report, spawnError));
    EXPECT_FALSE(spawnError.isError());
}

// A late Metadata for a transaction that has aged out of the history must
// not start it again over the delivered file
TEST_F(DaemonTest, EvictedTransactionStaysClosed) {
    this->startDaemons();
    const TransactionId first(9, 1);

    this->injectSmallFile(first.seq);
    Report report;
    ASSERT_TRUE(waitFinished(*this->m_receiver, first, report));
    ASSERT_EQ(TXN_STATUS_NO_ERROR, report.status);
    const std::vector<U8> delivered = this->received("late/1.bin");
    ASSERT_EQ(10U, delivered.size());

    for (TransactionSeq seq = 2; seq <= CFDP_NUM_HISTORIES + 1; seq++) {
        this->injectSmallFile(seq);
    }

    // The oldest entry goes once every later transfer is in the history
    const std::chrono::steady_clock::time_point deadline =
        std::chrono::steady_clock::now() + std::chrono::seconds(30);
    bool evicted = false;
    while (!evicted && (std::chrono::steady_clock::now() < deadline)) {
        evicted = !this->m_receiver->report(first, report);
        if (!evicted) {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
    }
    ASSERT_TRUE(evicted);

    Pdu late;
    late.asMetadataPdu().initialize(DIRECTION_TOWARD_RECEIVER, Class::CLASS_1, first.sourceEid, first.seq,
                                    RECEIVER_EID, 10, "late/1.bin", "late/1.bin", CHECKSUM_TYPE_MODULAR, 0);
    EXPECT_TRUE(this->m_receiver->deliverInbound(late));
    EXPECT_FALSE(this->m_receiver->report(first, report));
    EXPECT_EQ(delivered, this->received("late/1.bin"));

    // Newer transactions from the same source still start
    const TransactionSeq next = CFDP_NUM_HISTORIES + 10;
    this->injectSmallFile(next);
    ASSERT_TRUE(waitFinished(*this->m_receiver, TransactionId(9, next), report));
    EXPECT_EQ(TXN_STATUS_NO_ERROR, report.status);
}

// Stray PDUs are dropped without disturbing a transfer in progress
TEST_F(DaemonTest, UnroutablePduIsDropped) {
    this->startDaemons();

    Pdu stray;
    stray.asEofPdu().initialize(DIRECTION_TOWARD_RECEIVER, Class::CLASS_2, 9, 77, RECEIVER_EID,
                                CONDITION_CODE_NO_ERROR, 0, 10);
    EXPECT_TRUE(this->m_receiver->deliverInbound(stray));

    Report report;
    EXPECT_FALSE(this->m_receiver->report(TransactionId(9, 77), report));

    const std::vector<U8> contents = this->makeSource("src.bin", 800);
    const TransactionId id = this->m_sender->put(this->putRequest("src.bin", Class::CLASS_2));
    ASSERT_TRUE(waitFinished(*this->m_receiver, id, report));
    EXPECT_EQ(TXN_STATUS_NO_ERROR, report.status);
    EXPECT_EQ(contents, this->received("out/src.bin"));
}

TEST_F(DaemonTest, UnknownTransaction) {
    this->startDaemons();
    const TransactionId id(SENDER_EID, 999);

    Report report;
    EXPECT_FALSE(this->m_sender->report(id, report));
    EXPECT_EQ(DaemonError::UNKNOWN_TRANSACTION, this->m_sender->cancel(id).getKind());
    EXPECT_EQ(DaemonError::UNKNOWN_TRANSACTION, this->m_sender->suspend(id).getKind());
    EXPECT_EQ(DaemonError::UNKNOWN_TRANSACTION, this->m_sender->resume(id).getKind());
}

TEST_F(DaemonTest, NoRouteEndsTransfer) {
    this->makeSource("src.bin", 100);
    this->startDaemons();

    PutRequest request = this->putRequest("src.bin", Class::CLASS_2);
    request.destEid = 55;
    const TransactionId id = this->m_sender->put(request);

    Report report;
    ASSERT_TRUE(waitFinished(*this->m_sender, id, report));
    EXPECT_EQ(TXN_STATUS_PROTOCOL_ERROR, report.status);
}

// Commands reach a live transaction until the daemon stops
TEST_F(DaemonTest, CommandsAfterStopAreRefused) {
    this->m_config.ackTimerMs = 60000;
    this->m_config.inactivityTimerMs = 60000;
    this->m_toReceiver->dropAlways(T_EOF);
    this->makeSource("src.bin", 500);
    this->startDaemons();

    const TransactionId id = this->m_sender->put(this->putRequest("src.bin", Class::CLASS_2));
    Report report;
    ASSERT_TRUE(this->m_sender->report(id, report));
    EXPECT_FALSE(report.finished);

    EXPECT_FALSE(this->m_sender->suspend(id).isError());
    EXPECT_FALSE(this->m_sender->resume(id).isError());
    EXPECT_FALSE(this->m_sender->cancel(id).isError());

    this->m_sender->stop();
    EXPECT_TRUE(this->m_senderShutdown.load());

    const DaemonError error = this->m_sender->cancel(id);
    EXPECT_EQ(DaemonError::TRANSACTION_COMMUNICATION, error.getKind());
    EXPECT_FALSE(error.describe().empty());
    EXPECT_FALSE(this->m_sender->report(id, report));
}

// The sender's link fails mid-transfer; the daemon stays up and the transfer ends
TEST_F(DaemonTest, TransportFailureEndsTransfers) {
    this->m_config.ackLimit = 3;
    this->m_toSender->failAt(1);
    this->makeSource("src.bin", 3000);
    this->startDaemons();

    const TransactionId id = this->m_sender->put(this->putRequest("src.bin", Class::CLASS_2));
    Report report;
    ASSERT_TRUE(waitFinished(*this->m_sender, id, report));
    EXPECT_TRUE(this->m_toSender->hasFailed());
    EXPECT_NE(TXN_STATUS_NO_ERROR, report.status);

    // Still answering, and later transfers over the dead link end too
    Report again;
    ASSERT_TRUE(this->m_sender->report(id, again));
    EXPECT_EQ(report.status, again.status);
    EXPECT_FALSE(this->m_sender->report(TransactionId(SENDER_EID, 999), again));

    const TransactionId next = this->m_sender->put(this->putRequest("src.bin", Class::CLASS_2));
    ASSERT_TRUE(waitFinished(*this->m_sender, next, report));
    EXPECT_EQ(TXN_STATUS_PROTOCOL_ERROR, report.status);
    EXPECT_FALSE(this->m_senderShutdown.load());
}

// ======================================================================
// \title  Daemon.hpp
// \author campuzan
// \brief  hpp file for the daemon that routes PDUs between transports
//         and transactions
// ======================================================================

#ifndef Cfdpd_Ccsds_Cfdp_Daemon_HPP
#define Cfdpd_Ccsds_Cfdp_Daemon_HPP

#include <atomic>
#include <deque>
#include <future>
#include <map>
#include <memory>
#include <thread>
#include <vector>

#include <Cfdpd/Ccsds/Cfdp/Command.hpp>
#include <Cfdpd/Ccsds/Cfdp/DaemonError.hpp>
#include <Cfdpd/Ccsds/Cfdp/EntityConfig.hpp>
#include <Cfdpd/Ccsds/Cfdp/Events.hpp>
#include <Cfdpd/Ccsds/Cfdp/Transaction.hpp>
#include <Cfdpd/Ccsds/Cfdp/TransactionHost.hpp>
#include <Cfdpd/Ccsds/Cfdp/Transport/Transport.hpp>
#include <Cfdpd/Filestore/Filestore.hpp>
#include <Cfdpd/Utils/Queue.hpp>

namespace Cfdpd {
namespace Ccsds {
namespace Cfdp {

//! \class Daemon
//! \brief One CFDP entity: its transports and its transactions
//!
//! Every transport runs its handler loop on its own thread and feeds one
//! merged inbox. A single daemon thread reads the inbox and owns the table
//! of live transactions; nothing else touches it. The user API posts
//! requests to the same inbox and waits for the answer where there is one.
//!
//! Transactions reach their transport directly through routeOutbound(),
//! using a routing table that is fixed once start() returns.
class Daemon : public TransactionHost, public PduSink {
  public:
    //! @param config     Protocol parameters shared by all transactions
    //! @param filestore  Where files are read and written
    //! @param shutdown   Raised by the owner, or by stop(), to end every loop
    //! @param bufferSize Receive buffer size handed to each transport
    Daemon(const EntityConfig& config,
           Filestore& filestore,
           std::atomic<bool>& shutdown,
           FwSizeType bufferSize = CFDP_DEFAULT_TRANSPORT_BUFFER_SIZE);

    ~Daemon();

    Daemon(const Daemon&) = delete;
    Daemon& operator=(const Daemon&) = delete;

    //! Hand over a transport; only before start()
    void addTransport(std::unique_ptr<Transport> transport);

    //! Build the routing table and launch the transport and daemon loops
    //!
    //! \return ERROR if the daemon was started before or a transport is not
    //!         ready, SUCCESS otherwise
    Status::T start();

    //! Raise shutdown, abandon live transactions and join every thread
    void stop();

    // ----------------------------------------------------------------------
    // User API
    // ----------------------------------------------------------------------

    //! Queue a file transfer
    //!
    //! Returns at once. Failure to open the source is logged and recorded in
    //! the history with status FILESTORE_REJECTION and a SPAWN_SEND error.
    TransactionId put(const PutRequest& request);

    //! Snapshot of a live or finished transaction
    //! \return false if the transaction is unknown
    bool report(const TransactionId& id, Report& report);

    //! As above; spawnError is the SPAWN_SEND error of a put whose source
    //! could not be opened, NONE for every other transaction
    bool report(const TransactionId& id, Report& report, DaemonError& spawnError);

    DaemonError cancel(const TransactionId& id);
    DaemonError suspend(const TransactionId& id);
    DaemonError resume(const TransactionId& id);

    // ----------------------------------------------------------------------
    // TransactionHost
    // ----------------------------------------------------------------------

    Status::T routeOutbound(const TransactionId& id, EntityId destEid, const Pdu& pdu) override;
    void transactionFinished(const TransactionId& id) override;

    // ----------------------------------------------------------------------
    // PduSink
    // ----------------------------------------------------------------------

    bool deliverInbound(const Pdu& pdu) override;

  private:
    typedef std::shared_ptr<std::promise<bool> > FoundPromise;
    typedef std::shared_ptr<std::promise<DaemonError> > ErrorPromise;

    //! An entry of the merged inbox
    struct Message {
        enum Kind : U8 {
            INBOUND_PDU,           //!< A transport decoded a PDU
            PUT,                   //!< The user asked for a transfer
            USER_COMMAND,          //!< The user asked to cancel, suspend or resume
            REPORT,                //!< The user asked for a report
            TRANSACTION_FINISHED,  //!< A worker is returning
            TRANSPORT_DOWN         //!< A transport loop ended on its own
        };

        Kind kind;
        TransactionId id;
        Pdu pdu;
        PutRequest request;
        Command::Kind command;
        U32 link;
        Transport::Status transportStatus;
        FoundPromise found;
        Command::ReportPromise reply;
        ErrorPromise error;

        Message() : kind(INBOUND_PDU), command(Command::ABANDON), link(0), transportStatus(Transport::SUCCESS) {}
        explicit Message(Kind k)
            : kind(k), command(Command::ABANDON), link(0), transportStatus(Transport::SUCCESS) {}
    };

    //! A transport with its outbound queue and handler thread
    struct Link {
        std::unique_ptr<Transport> transport;
        OutboundQueue outbound;
        std::thread thread;
        std::atomic<bool> overflowed;

        explicit Link(std::unique_ptr<Transport> medium)
            : transport(std::move(medium)), outbound(CFDP_TRANSPORT_QUEUE_DEPTH), overflowed(false) {}
    };

    typedef std::map<TransactionId, std::unique_ptr<Transaction> > TransactionMap;

    //! Daemon thread body
    void run();

    //! Transport thread body
    void runLink(U32 index);

    void handleMessage(Message& message);

    //! Forward a PDU to its transaction, spawning a receiver for new Metadata
    void dispatchInbound(const Pdu& pdu);

    //! Create and start the sender of a put
    void spawnSender(const TransactionId& id, const PutRequest& request);

    //! Create and start a receiver for the Metadata in pdu
    void spawnReceiver(const Pdu& pdu);

    DaemonError deliverCommand(const TransactionId& id, Command::Kind kind);
    void answerReport(Message& message);

    //! Post a user command and wait for the outcome
    DaemonError userCommand(const TransactionId& id, Command::Kind kind);

    //! Join the worker of a live transaction and move it to the history
    void reap(TransactionMap::iterator it);

    //! A closed transaction
    struct HistoryEntry {
        Report report;
        DaemonError spawnError;
    };

    void recordHistory(const Report& report, const DaemonError& spawnError = DaemonError());
    const HistoryEntry* findHistory(const TransactionId& id) const;

    //! True for a transaction in the history or evicted from it
    bool isClosed(const TransactionId& id) const;

    //! Abandon and reap every live transaction
    void abandonAll();

    //! Answer what is left in the inbox once the daemon loop has ended
    void drainInbox();

    const EntityConfig m_config;
    Filestore& m_filestore;
    std::atomic<bool>& m_shutdown;
    const FwSizeType m_bufferSize;
    Events m_events;

    std::vector<std::unique_ptr<Link> > m_links;
    std::map<EntityId, Link*> m_routes;  //!< Fixed once start() returns

    Utils::Queue<Message> m_inbox;
    std::thread m_thread;
    std::atomic<bool> m_running;
    bool m_started;
    std::atomic<TransactionSeq> m_nextSeq;

    // Daemon thread only
    TransactionMap m_transactions;
    std::map<TransactionId, HistoryEntry> m_history;
    std::deque<TransactionId> m_historyOrder;
    std::map<EntityId, TransactionSeq> m_evictedHighWater;  //!< Highest evicted sequence number per source
};

}  // namespace Cfdp
}  // namespace Ccsds
}  // namespace Cfdpd

#endif  // Cfdpd_Ccsds_Cfdp_Daemon_HPP

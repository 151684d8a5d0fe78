// ======================================================================
// \title  Daemon.cpp
// \author campuzan
// \brief  cpp file for the daemon that routes PDUs between transports
//         and transactions
// ======================================================================

#include <Cfdpd/Ccsds/Cfdp/Daemon.hpp>

#include <chrono>

#include <Cfdpd/Types/Assert.hpp>

namespace Cfdpd {
namespace Ccsds {
namespace Cfdp {

namespace {

//! How often the daemon loop checks the shutdown flag while idle
const U32 DAEMON_POLL_MS = 100;

}  // namespace

// ----------------------------------------------------------------------
// Construction and lifecycle
// ----------------------------------------------------------------------

Daemon::Daemon(const EntityConfig& config, Filestore& filestore, std::atomic<bool>& shutdown, FwSizeType bufferSize)
    : m_config(config),
      m_filestore(filestore),
      m_shutdown(shutdown),
      m_bufferSize(bufferSize),
      m_events("Daemon"),
      m_links(),
      m_routes(),
      m_inbox(),
      m_thread(),
      m_running(false),
      m_started(false),
      m_nextSeq(1),
      m_transactions(),
      m_history(),
      m_historyOrder() {}

Daemon::~Daemon() {
    this->stop();
}

void Daemon::addTransport(std::unique_ptr<Transport> transport) {
    CFDPD_ASSERT(!this->m_started);
    CFDPD_ASSERT(transport);
    this->m_links.push_back(std::unique_ptr<Link>(new Link(std::move(transport))));
}

Status::T Daemon::start() {
    if (this->m_started) {
        return Status::ERROR;
    }
    for (U32 i = 0; i < this->m_links.size(); i++) {
        if (!this->m_links[i]->transport->isReady()) {
            this->m_events.log_WARNING_HI_TransportDown(i, "NOT_READY");
            return Status::ERROR;
        }
    }
    this->m_started = true;

    // The first transport to claim an entity serves it
    for (U32 i = 0; i < this->m_links.size(); i++) {
        const std::vector<EntityId> destinations = this->m_links[i]->transport->getDestinations();
        for (std::vector<EntityId>::const_iterator it = destinations.begin(); it != destinations.end(); ++it) {
            this->m_routes.insert(std::make_pair(*it, this->m_links[i].get()));
        }
    }

    this->m_running = true;
    for (U32 i = 0; i < this->m_links.size(); i++) {
        this->m_links[i]->thread = std::thread(&Daemon::runLink, this, i);
    }
    this->m_thread = std::thread(&Daemon::run, this);

    this->m_events.log_ACTIVITY_HI_DaemonStarted(this->m_config.localEid, static_cast<U32>(this->m_links.size()));
    return Status::SUCCESS;
}

void Daemon::stop() {
    if (!this->m_running) {
        return;
    }

    this->m_shutdown.store(true);
    if (this->m_thread.joinable()) {
        this->m_thread.join();
    }
    for (U32 i = 0; i < this->m_links.size(); i++) {
        Link& link = *this->m_links[i];
        if (link.thread.joinable()) {
            link.thread.join();
        }
        link.outbound.close();
    }
    this->m_running = false;

    this->m_events.log_ACTIVITY_HI_DaemonStopped(this->m_config.localEid);
}

// ----------------------------------------------------------------------
// User API
// ----------------------------------------------------------------------

TransactionId Daemon::put(const PutRequest& request) {
    const TransactionId id(this->m_config.localEid, this->m_nextSeq.fetch_add(1));

    Message message(Message::PUT);
    message.id = id;
    message.request = request;
    if (this->m_inbox.enqueue(std::move(message)) != Utils::QUEUE_OK) {
        this->m_events.log_WARNING_LO_CommandDeliveryFailed("daemon is stopped, put " + id.toString() +
                                                            " discarded");
    }
    return id;
}

bool Daemon::report(const TransactionId& id, Report& report) {
    DaemonError spawnError;
    return this->report(id, report, spawnError);
}

bool Daemon::report(const TransactionId& id, Report& report, DaemonError& spawnError) {
    if (!this->m_running) {
        return false;
    }

    Message message(Message::REPORT);
    message.id = id;
    message.found = std::make_shared<std::promise<bool> >();
    message.reply = std::make_shared<std::promise<Report> >();
    message.error = std::make_shared<std::promise<DaemonError> >();
    std::future<bool> found = message.found->get_future();
    std::future<Report> reply = message.reply->get_future();
    std::future<DaemonError> error = message.error->get_future();

    if (this->m_inbox.enqueue(std::move(message)) != Utils::QUEUE_OK) {
        return false;
    }
    if (!found.get()) {
        return false;
    }
    report = reply.get();
    spawnError = error.get();
    return true;
}

DaemonError Daemon::cancel(const TransactionId& id) {
    return this->userCommand(id, Command::CANCEL);
}

DaemonError Daemon::suspend(const TransactionId& id) {
    return this->userCommand(id, Command::SUSPEND);
}

DaemonError Daemon::resume(const TransactionId& id) {
    return this->userCommand(id, Command::RESUME);
}

DaemonError Daemon::userCommand(const TransactionId& id, Command::Kind kind) {
    if (!this->m_running) {
        return DaemonError::transactionCommunication(id, kind);
    }

    Message message(Message::USER_COMMAND);
    message.id = id;
    message.command = kind;
    message.error = std::make_shared<std::promise<DaemonError> >();
    std::future<DaemonError> error = message.error->get_future();

    if (this->m_inbox.enqueue(std::move(message)) != Utils::QUEUE_OK) {
        return DaemonError::transactionCommunication(id, kind);
    }
    return error.get();
}

// ----------------------------------------------------------------------
// TransactionHost and PduSink
// ----------------------------------------------------------------------

Status::T Daemon::routeOutbound(const TransactionId& id, EntityId destEid, const Pdu& pdu) {
    std::map<EntityId, Link*>::const_iterator route = this->m_routes.find(destEid);
    if (route == this->m_routes.end()) {
        this->m_events.log_WARNING_LO_NoRoute(id, destEid);
        return Status::NO_ROUTE;
    }

    Link& link = *route->second;
    switch (link.outbound.enqueue(OutboundPdu(destEid, pdu))) {
        case Utils::QUEUE_OK:
        case Utils::QUEUE_DISCARDED_OLDEST:
            link.overflowed.store(false);
            return Status::SUCCESS;
        case Utils::QUEUE_FULL:
            // Once per episode; the sender retries until there is room
            if (!link.overflowed.exchange(true)) {
                this->m_events.log_WARNING_LO_OutboundQueueOverflow(destEid);
            }
            return Status::SEND_PDU_ERROR;
        default:
            // the transport is down
            this->m_events.log_WARNING_LO_NoRoute(id, destEid);
            return Status::NO_ROUTE;
    }
}

void Daemon::transactionFinished(const TransactionId& id) {
    Message message(Message::TRANSACTION_FINISHED);
    message.id = id;
    // QUEUE_CLOSED means the daemon is shutting down and reaps every worker itself
    static_cast<void>(this->m_inbox.enqueue(std::move(message)));
}

bool Daemon::deliverInbound(const Pdu& pdu) {
    Message message(Message::INBOUND_PDU);
    message.pdu = pdu;
    return this->m_inbox.enqueue(std::move(message)) != Utils::QUEUE_CLOSED;
}

// ----------------------------------------------------------------------
// Loops
// ----------------------------------------------------------------------

void Daemon::run() {
    while (!this->m_shutdown.load()) {
        Message message;
        const Utils::QueueStatus status =
            this->m_inbox.dequeueFor(message, std::chrono::milliseconds(DAEMON_POLL_MS));
        if (status == Utils::QUEUE_OK) {
            this->handleMessage(message);
        }
    }

    this->abandonAll();
    this->drainInbox();
}

void Daemon::runLink(U32 index) {
    Link& link = *this->m_links[index];
    const Transport::Status status =
        link.transport->pduHandler(this->m_shutdown, *this, link.outbound, this->m_bufferSize);

    if (!this->m_shutdown.load()) {
        Message message(Message::TRANSPORT_DOWN);
        message.link = index;
        message.transportStatus = status;
        static_cast<void>(this->m_inbox.enqueue(std::move(message)));
    }
}

void Daemon::handleMessage(Message& message) {
    switch (message.kind) {
        case Message::INBOUND_PDU:
            this->dispatchInbound(message.pdu);
            break;
        case Message::PUT:
            this->spawnSender(message.id, message.request);
            break;
        case Message::USER_COMMAND:
            message.error->set_value(this->deliverCommand(message.id, message.command));
            break;
        case Message::REPORT:
            this->answerReport(message);
            break;
        case Message::TRANSACTION_FINISHED: {
            TransactionMap::iterator it = this->m_transactions.find(message.id);
            if (it != this->m_transactions.end()) {
                this->reap(it);
            }
            break;
        }
        case Message::TRANSPORT_DOWN:
            this->m_events.log_WARNING_HI_TransportDown(message.link, transportStatusName(message.transportStatus));
            // routeOutbound now reports NO_ROUTE for the entities it served
            this->m_links[message.link]->outbound.close();
            break;
        default:
            CFDPD_ASSERT(0, message.kind);
            break;
    }
}

// ----------------------------------------------------------------------
// Daemon thread helpers
// ----------------------------------------------------------------------

void Daemon::dispatchInbound(const Pdu& pdu) {
    const TransactionId id = pdu.getTransactionId();

    TransactionMap::iterator it = this->m_transactions.find(id);
    if (it != this->m_transactions.end()) {
        // QUEUE_CLOSED makes this a straggler for a worker on its way out
        static_cast<void>(it->second->sendCommand(Command::deliverPdu(pdu)));
        return;
    }

    // Already closed and reaped
    if (this->isClosed(id)) {
        return;
    }

    const PduHeader& header = pdu.asHeader();
    if ((pdu.getType() == T_METADATA) && (header.getDestEid() == this->m_config.localEid) &&
        (id.sourceEid != this->m_config.localEid)) {
        this->spawnReceiver(pdu);
        return;
    }

    this->m_events.log_WARNING_LO_UnroutablePdu(id, pduTypeName(pdu.getType()), header.getDestEid());
}

void Daemon::spawnSender(const TransactionId& id, const PutRequest& request) {
    std::unique_ptr<Transaction> txn(new Transaction(*this, this->m_filestore, this->m_config, id, DIRECTION_TX,
                                                     request.destEid, request.transmissionMode));

    const Filestore::Status status = txn->openSource(request);
    if (status != Filestore::OP_OK) {
        const DaemonError error = DaemonError::spawnSend(id, status);
        this->m_events.log_WARNING_HI_SpawnSendFailed(id, error.describe());
        this->recordHistory(txn->getReport(), error);
        return;
    }

    txn->start();
    this->m_transactions[id] = std::move(txn);
}

void Daemon::spawnReceiver(const Pdu& pdu) {
    const TransactionId id = pdu.getTransactionId();
    const Class::T cfdpClass = pdu.asHeader().getTxmMode();

    std::unique_ptr<Transaction> txn(
        new Transaction(*this, this->m_filestore, this->m_config, id, DIRECTION_RX, id.sourceEid, cfdpClass));
    this->m_events.log_ACTIVITY_LO_ReceiverSpawned(id, cfdpClass);

    // The mailbox of a worker that has not started is open and unbounded
    const Utils::QueueStatus status = txn->sendCommand(Command::deliverPdu(pdu));
    CFDPD_ASSERT(status == Utils::QUEUE_OK, status);

    txn->start();
    this->m_transactions[id] = std::move(txn);
}

DaemonError Daemon::deliverCommand(const TransactionId& id, Command::Kind kind) {
    TransactionMap::iterator it = this->m_transactions.find(id);
    if (it == this->m_transactions.end()) {
        if (!this->isClosed(id)) {
            return DaemonError::unknownTransaction(id);
        }
        const DaemonError error = DaemonError::transactionCommunication(id, kind);
        this->m_events.log_WARNING_LO_CommandDeliveryFailed(error.describe());
        return error;
    }

    if (it->second->sendCommand(Command(kind)) != Utils::QUEUE_OK) {
        const DaemonError error = DaemonError::transactionCommunication(id, kind);
        this->m_events.log_WARNING_LO_CommandDeliveryFailed(error.describe());
        return error;
    }
    return DaemonError();
}

void Daemon::answerReport(Message& message) {
    TransactionMap::iterator it = this->m_transactions.find(message.id);
    if (it != this->m_transactions.end()) {
        if (it->second->sendCommand(Command::reportRequest(message.reply)) == Utils::QUEUE_OK) {
            message.found->set_value(true);
            message.error->set_value(DaemonError());
            return;
        }
        // The worker stopped reading; its final report is ready once it is joined
        this->reap(it);
    }

    const HistoryEntry* entry = this->findHistory(message.id);
    if (entry == nullptr) {
        message.found->set_value(false);
        return;
    }
    message.found->set_value(true);
    message.reply->set_value(entry->report);
    message.error->set_value(entry->spawnError);
}

void Daemon::reap(TransactionMap::iterator it) {
    it->second->join();
    this->recordHistory(it->second->getReport());
    this->m_transactions.erase(it);
}

void Daemon::recordHistory(const Report& report, const DaemonError& spawnError) {
    if (this->m_history.find(report.id) == this->m_history.end()) {
        this->m_historyOrder.push_back(report.id);
    }
    HistoryEntry& entry = this->m_history[report.id];
    entry.report = report;
    entry.report.finished = true;
    entry.spawnError = spawnError;

    while (this->m_historyOrder.size() > CFDP_NUM_HISTORIES) {
        // Sequence numbers only grow, so anything at or below an evicted one is stale
        const TransactionId& evicted = this->m_historyOrder.front();
        std::map<EntityId, TransactionSeq>::iterator mark = this->m_evictedHighWater.find(evicted.sourceEid);
        if (mark == this->m_evictedHighWater.end()) {
            this->m_evictedHighWater.insert(std::make_pair(evicted.sourceEid, evicted.seq));
        } else if (evicted.seq > mark->second) {
            mark->second = evicted.seq;
        }
        this->m_history.erase(evicted);
        this->m_historyOrder.pop_front();
    }
}

const Daemon::HistoryEntry* Daemon::findHistory(const TransactionId& id) const {
    std::map<TransactionId, HistoryEntry>::const_iterator it = this->m_history.find(id);
    return (it == this->m_history.end()) ? nullptr : &it->second;
}

bool Daemon::isClosed(const TransactionId& id) const {
    if (this->findHistory(id) != nullptr) {
        return true;
    }
    std::map<EntityId, TransactionSeq>::const_iterator mark = this->m_evictedHighWater.find(id.sourceEid);
    return (mark != this->m_evictedHighWater.end()) && (id.seq <= mark->second);
}

void Daemon::abandonAll() {
    for (TransactionMap::iterator it = this->m_transactions.begin(); it != this->m_transactions.end(); ++it) {
        // QUEUE_CLOSED means the worker is already returning
        static_cast<void>(it->second->sendCommand(Command(Command::ABANDON)));
    }
    while (!this->m_transactions.empty()) {
        this->reap(this->m_transactions.begin());
    }
}

void Daemon::drainInbox() {
    this->m_inbox.close();

    Message message;
    while (this->m_inbox.tryDequeue(message) == Utils::QUEUE_OK) {
        if (message.kind == Message::REPORT) {
            this->answerReport(message);
        } else if (message.kind == Message::USER_COMMAND) {
            message.error->set_value(this->deliverCommand(message.id, message.command));
        }
    }
}

}  // namespace Cfdp
}  // namespace Ccsds
}  // namespace Cfdpd

// ======================================================================
// \title  Transaction.cpp
// \brief  CFDP transaction worker and engine operations
//
// This file is a port of CFDP engine operations from the following files
// from the NASA Core Flight System (cFS) CFDP (CF) Application, version 3.0.0,
// adapted for use within cfdpd:
// - cf_cfdp.c (CFDP PDU processing and engine operations)
//
// This file contains the worker loop that owns one transaction, the
// handling of the commands sent to it, and the operations shared by the
// R (rx) and S (tx) state machines: building and routing outgoing PDUs,
// dispatching incoming PDUs, timers and completion.
//
// ======================================================================
//
// NASA Docket No. GSC-18,447-1
//
// Copyright (c) 2019 United States Government as represented by the
// Administrator of the National Aeronautics and Space Administration.
// All Rights Reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License"); you may
// not use this file except in compliance with the License. You may obtain
// a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
//
// ======================================================================

#include <string.h>

#include <limits>

#include <Cfdpd/Types/Assert.hpp>
#include <Cfdpd/Ccsds/Cfdp/Transaction.hpp>
#include <Cfdpd/Ccsds/Cfdp/Utils.hpp>

namespace Cfdpd {
namespace Ccsds {
namespace Cfdp {

// ======================================================================
// Construction and Destruction
// ======================================================================

Transaction::Transaction(TransactionHost& host,
                         Filestore& filestore,
                         const EntityConfig& config,
                         const TransactionId& id,
                         Direction role,
                         EntityId peerEid,
                         Class::T cfdpClass) :
    m_host(host),
    m_filestore(filestore),
    m_config(config),
    m_events("Transaction"),
    m_id(id),
    m_role(role),
    m_peerEid(peerEid),
    m_destEid((role == DIRECTION_TX) ? peerEid : config.localEid),
    m_state((role == DIRECTION_TX) ? TXN_STATE_UNDEF : TXN_STATE_INIT),
    m_txn_class(cfdpClass),
    m_txn_stat(TXN_STATUS_UNDEFINED),
    m_fileStatus(FIN_FILE_STATUS_UNREPORTED),
    m_chunks((role == DIRECTION_TX) ? CFDP_NUM_TX_CHUNKS_PER_TRANSACTION : CFDP_NUM_RX_CHUNKS_PER_TRANSACTION),
    m_inactivity_timer(),
    m_ack_timer(),
    m_fsize(0),
    m_foffs(0),
    m_file(),
    m_crc(0),
    m_sendBlocked(false),
    m_pdusSent(0),
    m_mailbox()
{
    CFDPD_ASSERT(role < DIRECTION_NUM, role);

    memset(&this->m_state_data, 0, sizeof(this->m_state_data));
    memset(&this->m_flags, 0, sizeof(this->m_flags));

    // a receiver that never hears from its sender again must still go away
    this->m_inactivity_timer.setTimer(this->m_config.inactivityTimerMs);
}

Transaction::~Transaction()
{
    if (this->m_thread.joinable())
    {
        // QUEUE_CLOSED only means the worker is already on its way out
        static_cast<void>(this->m_mailbox.enqueue(Command(Command::ABANDON)));
        this->m_thread.join();
    }
}

Filestore::Status Transaction::openSource(const PutRequest& request)
{
    CFDPD_ASSERT(this->m_role == DIRECTION_TX, this->m_role);
    CFDPD_ASSERT(this->m_state == TXN_STATE_UNDEF, this->m_state);

    this->m_srcFilename = request.sourceFilename;
    this->m_dstFilename = request.destFilename;
    this->m_txn_class = request.transmissionMode;

    U64 size = 0;
    Filestore::Status status = this->m_filestore.openRead(request.sourceFilename, this->m_file, size);
    if ((status == Filestore::OP_OK) && (size > std::numeric_limits<FileSize>::max()))
    {
        // sizes and offsets are 32 bits on the wire
        this->m_file.reset();
        status = Filestore::BAD_SIZE;
    }

    if (status != Filestore::OP_OK)
    {
        this->m_events.log_WARNING_HI_TxFileOpenFailed(this->m_txn_class, this->m_id.sourceEid, this->m_id.seq,
                                                       request.sourceFilename, status);
        this->setTxnStatus(TXN_STATUS_FILESTORE_REJECTION);
        return status;
    }

    this->m_fsize = static_cast<FileSize>(size);

    // Options beyond what one Metadata PDU can carry are dropped
    U32 dropped = 0;
    Tlv tlv;
    for (std::vector<FilestoreRequest>::const_iterator it = request.filestoreRequests.begin();
         it != request.filestoreRequests.end(); ++it)
    {
        if ((this->m_filestoreRequests.size() < CFDP_MAX_TLV) && FilestoreRequestToTlv(*it, tlv))
        {
            this->m_filestoreRequests.push_back(*it);
        }
        else
        {
            ++dropped;
        }
    }
    for (std::vector<std::string>::const_iterator it = request.messagesToUser.begin();
         it != request.messagesToUser.end(); ++it)
    {
        if (((this->m_filestoreRequests.size() + this->m_messagesToUser.size()) < CFDP_MAX_TLV) &&
            MessageToUserToTlv(*it, tlv))
        {
            this->m_messagesToUser.push_back(*it);
        }
        else
        {
            ++dropped;
        }
    }
    if (dropped > 0)
    {
        this->m_events.log_WARNING_LO_TxTooManyOptions(this->m_txn_class, this->m_id.sourceEid, this->m_id.seq,
                                                       dropped);
    }

    this->m_state = (this->m_txn_class == Class::CLASS_2) ? TXN_STATE_S2 : TXN_STATE_S1;
    this->m_state_data.send.sub_state = TX_SUB_STATE_METADATA;

    this->m_events.log_ACTIVITY_HI_TxFileStarted(this->m_txn_class, this->m_id.sourceEid, this->m_id.seq,
                                                 this->m_srcFilename, this->m_dstFilename, this->m_peerEid,
                                                 this->m_fsize);
    return Filestore::OP_OK;
}

void Transaction::start()
{
    CFDPD_ASSERT(!this->m_thread.joinable());
    CFDPD_ASSERT((this->m_role == DIRECTION_RX) || (this->m_state != TXN_STATE_UNDEF), this->m_state);

    this->m_thread = std::thread(&Transaction::run, this);
}

void Transaction::join()
{
    if (this->m_thread.joinable())
    {
        this->m_thread.join();
    }
}

Utils::QueueStatus Transaction::sendCommand(Command&& command)
{
    return this->m_mailbox.enqueue(std::move(command));
}

Report Transaction::getReport() const
{
    Report report;

    report.id = this->m_id;
    report.role = this->m_role;
    report.mode = this->m_txn_class;
    report.state = this->m_state;
    report.status = this->m_txn_stat;
    report.condition = TxnStatusToConditionCode(this->m_txn_stat);
    report.fileSize = this->m_fsize;
    report.bytesProgressed = (this->m_role == DIRECTION_TX) ? this->m_foffs : this->m_chunks.getCoveredSize();
    report.sourceFilename = this->m_srcFilename;
    report.destFilename = this->m_dstFilename;
    report.fileStatus = this->m_fileStatus;
    report.filestoreRequests = this->m_filestoreRequests;
    report.messagesToUser = this->m_messagesToUser;
    report.finished = (this->m_state == TXN_STATE_HOLD) || (this->m_state == TXN_STATE_CLOSED);

    return report;
}

// ======================================================================
// Worker
// ======================================================================

void Transaction::run()
{
    while (this->m_state != TXN_STATE_CLOSED)
    {
        this->cycleTx();

        Command command;
        const Utils::QueueStatus status = this->m_mailbox.dequeueUntil(command, this->nextDeadline());
        if (status == Utils::QUEUE_OK)
        {
            this->handleCommand(command);
        }
        else if (status == Utils::QUEUE_CLOSED)
        {
            // nobody is left to talk to
            this->abandonTransaction();
        }

        if (this->m_state != TXN_STATE_CLOSED)
        {
            this->tick();
        }
    }

    // Answer whatever raced in before the close, drop the rest
    this->m_mailbox.close();
    Command command;
    while (this->m_mailbox.tryDequeue(command) == Utils::QUEUE_OK)
    {
        if ((command.kind == Command::REPORT_REQUEST) && command.reply)
        {
            command.reply->set_value(this->getReport());
        }
    }

    this->m_host.transactionFinished(this->m_id);
}

void Transaction::handleCommand(Command& command)
{
    if ((command.kind != Command::DELIVER_PDU) && (command.kind != Command::REPORT_REQUEST))
    {
        this->m_events.log_COMMAND_TransactionCommand(this->m_id.sourceEid, this->m_id.seq,
                                                      commandKindName(command.kind));
    }

    switch (command.kind)
    {
        case Command::DELIVER_PDU:
            this->dispatchRecv(command.pdu);
            break;
        case Command::CANCEL:
            this->cancelTransaction();
            break;
        case Command::SUSPEND:
            this->suspendTransaction();
            break;
        case Command::RESUME:
            this->resumeTransaction();
            break;
        case Command::REPORT_REQUEST:
            if (command.reply)
            {
                command.reply->set_value(this->getReport());
            }
            break;
        case Command::ABANDON:
            this->abandonTransaction();
            break;
        default:
            CFDPD_ASSERT(0, command.kind);
            break;
    }
}

void Transaction::cycleTx()
{
    static const TxnSendDispatchTable state_fns = {
        {
            nullptr, // TXN_STATE_UNDEF
            nullptr, // TXN_STATE_INIT
            nullptr, // TXN_STATE_R1
            &Transaction::s1Tx, // TXN_STATE_S1
            nullptr, // TXN_STATE_R2
            &Transaction::s2Tx, // TXN_STATE_S2
            nullptr, // TXN_STATE_DROP
            nullptr, // TXN_STATE_HOLD
            nullptr  // TXN_STATE_CLOSED
        }
    };

    if ((this->m_role != DIRECTION_TX) || this->m_flags.com.suspended)
    {
        return;
    }

    U32 budget = this->m_config.maxPdusPerCycle;
    while (budget > 0)
    {
        const TxnState state = this->m_state;
        const TxSubState sub_state = this->m_state_data.send.sub_state;
        const U32 sent = this->m_pdusSent;
        bool nakProcessed = false;

        if ((state == TXN_STATE_S2) && (sub_state == TX_SUB_STATE_CLOSEOUT_SYNC))
        {
            nakProcessed = this->sTickNak();
        }
        else
        {
            this->txStateDispatch(&state_fns);
        }

        if (this->m_sendBlocked)
        {
            break;
        }

        if (this->m_pdusSent != sent)
        {
            --budget;
        }
        else if ((state == this->m_state) && (sub_state == this->m_state_data.send.sub_state) && !nakProcessed)
        {
            // nothing left to do until something arrives or a timer fires
            break;
        }
    }
}

void Transaction::tick()
{
    if (this->m_flags.com.suspended)
    {
        return;
    }

    if (this->m_role == DIRECTION_TX)
    {
        this->sTick();
    }
    else
    {
        this->rTick();
    }
}

bool Transaction::hasPendingSend() const
{
    if (this->m_flags.com.suspended || (this->m_state == TXN_STATE_CLOSED))
    {
        return false;
    }

    if (this->m_role == DIRECTION_TX)
    {
        if (this->m_flags.tx.send_eof || this->m_flags.tx.send_fin_ack)
        {
            return true;
        }
        if ((this->m_state == TXN_STATE_S1) || (this->m_state == TXN_STATE_S2))
        {
            if (this->m_state_data.send.sub_state < TX_SUB_STATE_CLOSEOUT_SYNC)
            {
                return true;
            }
            return (this->m_state == TXN_STATE_S2) &&
                   (this->m_flags.tx.md_need_send || (this->m_chunks.getFirstChunk() != nullptr));
        }
        return false;
    }

    return this->m_flags.rx.send_eof_ack || this->m_flags.rx.send_nak || this->m_flags.rx.send_fin;
}

Timer::Clock::time_point Transaction::nextDeadline() const
{
    const Timer::Clock::time_point now = Timer::Clock::now();

    if (this->hasPendingSend())
    {
        if (this->m_sendBlocked)
        {
            return now + std::chrono::milliseconds(CFDP_SEND_RETRY_BACKOFF_MS);
        }
        return now;
    }

    Timer::Clock::time_point deadline = now + std::chrono::hours(1);
    if (this->m_flags.com.suspended)
    {
        return deadline;
    }

    const bool ackTimerUsed = (this->m_state == TXN_STATE_S2) || (this->m_state == TXN_STATE_R2);
    if (ackTimerUsed && this->m_flags.com.ack_timer_armed && this->m_ack_timer.isRunning() &&
        (this->m_ack_timer.getDeadline() < deadline))
    {
        deadline = this->m_ack_timer.getDeadline();
    }
    if (!this->m_flags.com.inactivity_fired && this->m_inactivity_timer.isRunning() &&
        (this->m_inactivity_timer.getDeadline() < deadline))
    {
        deadline = this->m_inactivity_timer.getDeadline();
    }

    return deadline;
}

// ======================================================================
// Timers
// ======================================================================

void Transaction::armAckTimer()
{
    this->m_ack_timer.setTimer(this->m_config.ackTimerMs);
    this->m_flags.com.ack_timer_armed = true;

    if (this->m_flags.com.suspended)
    {
        this->m_ack_timer.pause();
    }
}

void Transaction::armInactTimer()
{
    U32 timerDuration = 0;

    /* select timeout based on the state */
    if (this->getAckTxnStatus() == ACK_TXN_STATUS_ACTIVE)
    {
        /* in an active transaction, we expect traffic so use the normal inactivity timer */
        timerDuration = this->m_config.inactivityTimerMs;
    }
    else
    {
        /* in an inactive transaction, we do NOT expect traffic, and this timer is now used
         * just in case any late straggler PDUs do get delivered.  In this case the
         * time should be longer than the retransmit time (ack timer) but less than the full
         * inactivity timer.  Using double the ack timer should ensure that if the remote
         * retransmitted anything, we will see it. */
        timerDuration = this->m_config.ackTimerMs * 2;
    }

    this->m_inactivity_timer.setTimer(timerDuration);

    if (this->m_flags.com.suspended)
    {
        this->m_inactivity_timer.pause();
    }
}

// ======================================================================
// Receive
// ======================================================================

void Transaction::dispatchRecv(const Pdu& pdu)
{
    this->m_events.log_DIAGNOSTIC_PduReceived(this->m_id, pduTypeName(pdu.getType()));
    this->m_flags.com.peer_heard = true;

    // Dispatch based on transaction state
    switch (this->m_state)
    {
        case TXN_STATE_INIT:
            this->recvInit(pdu);
            break;
        case TXN_STATE_R1:
            this->r1Recv(pdu);
            break;
        case TXN_STATE_S1:
            this->s1Recv(pdu);
            break;
        case TXN_STATE_R2:
            this->r2Recv(pdu);
            break;
        case TXN_STATE_S2:
            this->s2Recv(pdu);
            break;
        case TXN_STATE_HOLD:
            this->recvHold(pdu);
            break;
        default:
            // DROP and CLOSED take nothing
            break;
    }

    /* whenever a packet was received by the other side, always arm its inactivity timer */
    if (this->m_state != TXN_STATE_CLOSED)
    {
        this->armInactTimer();
    }
}

void Transaction::recvInit(const Pdu& pdu)
{
    CFDPD_ASSERT(this->m_role == DIRECTION_RX, this->m_role);

    if (pdu.getType() != T_METADATA)
    {
        // only Metadata starts a receiver
        this->setTxnStatus(TXN_STATUS_PROTOCOL_ERROR);
        this->finishTransaction();
        return;
    }

    const MetadataPdu& md = pdu.asMetadataPdu();
    const Class::T txmMode = md.getTxmMode();

    this->m_txn_class = txmMode;
    this->recvMd(md);

    this->m_state = (txmMode == Class::CLASS_1) ? TXN_STATE_R1 : TXN_STATE_R2;
    this->m_flags.rx.md_recv = true;
    this->rInit();

    if ((this->m_state != TXN_STATE_HOLD) && (md.getChecksumType() != CHECKSUM_TYPE_MODULAR))
    {
        if (this->m_state == TXN_STATE_R2)
        {
            this->r2SetFinTxnStatus(TXN_STATUS_UNSUPPORTED_CHECKSUM_TYPE);
        }
        else
        {
            this->setTxnStatus(TXN_STATUS_UNSUPPORTED_CHECKSUM_TYPE);
            this->r1Reset();
        }
    }
}

void Transaction::recvMd(const MetadataPdu& md)
{
    /* store the expected file size in transaction */
    this->m_fsize = md.getFileSize();

    /* store the filenames in transaction - validation already done during decode */
    this->m_srcFilename = md.getSourceFilename();
    this->m_dstFilename = md.getDestFilename();

    const TlvList& tlvList = md.getTlvList();
    for (U8 i = 0; i < tlvList.getNumTlv(); i++)
    {
        const Tlv& tlv = tlvList.getTlv(i);
        FilestoreRequest request;

        if ((tlv.getType() == TLV_TYPE_FILESTORE_REQUEST) && TlvToFilestoreRequest(tlv, request))
        {
            this->m_filestoreRequests.push_back(request);
        }
        else if (tlv.getType() == TLV_TYPE_MESSAGE_TO_USER)
        {
            this->m_messagesToUser.push_back(
                std::string(reinterpret_cast<const char*>(tlv.getData()), tlv.getLength()));
        }
        else
        {
            this->m_events.log_WARNING_LO_RxInvalidOption(this->m_txn_class, this->m_id.sourceEid, this->m_id.seq,
                                                          static_cast<U8>(tlv.getType()));
        }
    }

    this->m_events.log_ACTIVITY_HI_RxFileStarted(this->m_txn_class, this->m_id.sourceEid, this->m_id.seq,
                                                 this->m_srcFilename, this->m_dstFilename, this->m_fsize);
}

void Transaction::recvHold(const Pdu& pdu)
{
    /*
     * Normally we do not expect PDUs for a transaction in holdover, because
     * from the local point of view it is completed and done.  But the reason
     * for the holdover is because the remote side might not have gotten all
     * the acks and could still be [re-]sending us PDUs for anything it does
     * not know we got already.
     *
     * A sender re-acks a FIN whose ACK the receiver missed, and a receiver
     * re-acks an EOF.
     */
    if (this->m_txn_class != Class::CLASS_2)
    {
        return;
    }

    Status::T status = Status::SUCCESS;
    if ((this->m_role == DIRECTION_TX) && (pdu.getType() == T_FIN))
    {
        status = this->sendAck(this->getAckTxnStatus(), FILE_DIRECTIVE_FIN, pdu.asFinPdu().getConditionCode());
    }
    else if ((this->m_role == DIRECTION_RX) && (pdu.getType() == T_EOF))
    {
        status = this->sendAck(this->getAckTxnStatus(), FILE_DIRECTIVE_END_OF_FILE,
                               pdu.asEofPdu().getConditionCode());
    }

    if (status == Status::SEND_PDU_ERROR)
    {
        // the peer repeats itself until the ACK gets through
        this->m_events.log_WARNING_LO_PduSendFailed(this->m_id, pduTypeName(T_ACK), status);
    }
}

// ======================================================================
// Completion
// ======================================================================

void Transaction::finishTransaction()
{
    if ((this->m_state == TXN_STATE_HOLD) || (this->m_state == TXN_STATE_CLOSED))
    {
        return;
    }

    if (this->m_txn_stat == TXN_STATUS_UNDEFINED)
    {
        this->m_txn_stat = TXN_STATUS_NO_ERROR;
    }

    if (this->m_role == DIRECTION_RX)
    {
        if (!this->m_file)
        {
            this->m_fileStatus = FIN_FILE_STATUS_DISCARDED_FILESTORE;
        }
        else
        {
            const Filestore::Status status = this->m_file->flush();
            if (status != Filestore::OP_OK)
            {
                this->m_events.log_WARNING_HI_RxWriteFailed(this->m_txn_class, this->m_id.sourceEid,
                                                            this->m_id.seq, this->m_fsize, 0, status);
                this->setTxnStatus(TXN_STATUS_FILESTORE_REJECTION);
            }

            // an unsuccessful file is left in place but reported as discarded
            this->m_fileStatus = (this->m_txn_stat == TXN_STATUS_NO_ERROR) ? FIN_FILE_STATUS_RETAINED
                                                                          : FIN_FILE_STATUS_DISCARDED;
        }

        // a finished receiver only answers duplicates
        this->m_flags.rx.send_nak = false;
        this->m_flags.rx.send_fin = false;
    }
    this->m_file.reset();

    this->m_events.log_ACTIVITY_HI_TransactionFinished(this->m_role, this->m_txn_class, this->m_id.sourceEid,
                                                       this->m_id.seq, this->m_txn_stat);

    /* Put this transaction into the holdover state, inactivity timer will close it */
    this->m_flags.com.ack_timer_armed = false;
    this->m_ack_timer.disableTimer();
    this->m_state = TXN_STATE_HOLD;
    this->armInactTimer();
}

void Transaction::closeTransaction()
{
    this->finishTransaction();

    this->m_state = TXN_STATE_CLOSED;
    this->m_events.log_ACTIVITY_LO_TransactionClosed(this->m_id.sourceEid, this->m_id.seq);
}

void Transaction::setTxnStatus(TxnStatus txn_stat)
{
    if (!TxnStatusIsError(this->m_txn_stat))
    {
        this->m_txn_stat = txn_stat;
    }
}

AckTxnStatus Transaction::getAckTxnStatus() const
{
    AckTxnStatus ack_txn_status;

    switch (this->m_state)
    {
        case TXN_STATE_INIT:
        case TXN_STATE_R1:
        case TXN_STATE_S1:
        case TXN_STATE_R2:
        case TXN_STATE_S2:
            ack_txn_status = ACK_TXN_STATUS_ACTIVE;
            break;

        case TXN_STATE_DROP:
        case TXN_STATE_HOLD:
        case TXN_STATE_CLOSED:
            ack_txn_status = ACK_TXN_STATUS_TERMINATED;
            break;

        default:
            ack_txn_status = ACK_TXN_STATUS_UNRECOGNIZED;
            break;
    }

    return ack_txn_status;
}

// ======================================================================
// Commands
// ======================================================================

void Transaction::cancelTransaction()
{
    void (Transaction::*fns[DIRECTION_NUM])() = {nullptr};

    fns[DIRECTION_RX] = &Transaction::rCancel;
    fns[DIRECTION_TX] = &Transaction::sCancel;

    // once finished, the outcome stands
    if ((this->m_state == TXN_STATE_HOLD) || (this->m_state == TXN_STATE_CLOSED))
    {
        return;
    }

    if (!this->m_flags.com.canceled)
    {
        this->m_flags.com.canceled = true;
        this->setTxnStatus(TXN_STATUS_CANCEL_REQUEST_RECEIVED);

        (this->*fns[this->m_role])();
    }
}

void Transaction::suspendTransaction()
{
    if ((this->m_state == TXN_STATE_HOLD) || (this->m_state == TXN_STATE_CLOSED) ||
        this->m_flags.com.suspended)
    {
        return;
    }

    this->m_flags.com.suspended = true;
    this->m_ack_timer.pause();
    this->m_inactivity_timer.pause();
}

void Transaction::resumeTransaction()
{
    if (!this->m_flags.com.suspended)
    {
        return;
    }

    this->m_flags.com.suspended = false;
    this->m_ack_timer.resume();
    this->m_inactivity_timer.resume();
}

void Transaction::abandonTransaction()
{
    this->m_flags.com.canceled = true;
    this->setTxnStatus(TXN_STATUS_CANCEL_REQUEST_RECEIVED);
    this->closeTransaction();
}

// ======================================================================
// Send
// ======================================================================

Status::T Transaction::sendPdu(const Pdu& pdu)
{
    const char* type = pduTypeName(pdu.getType());
    const Status::T status = this->m_host.routeOutbound(this->m_id, this->m_peerEid, pdu);

    switch (status)
    {
        case Status::SUCCESS:
            this->m_sendBlocked = false;
            ++this->m_pdusSent;
            this->m_events.log_DIAGNOSTIC_PduSent(this->m_id, type, this->m_peerEid);
            break;
        case Status::NO_ROUTE:
            // sent and lost: the reliability procedures treat it like any other loss
            this->m_sendBlocked = false;
            ++this->m_pdusSent;
            this->m_events.log_WARNING_LO_PduSendFailed(this->m_id, type, status);
            break;
        default:
            // outbound queue full, retried after CFDP_SEND_RETRY_BACKOFF_MS
            this->m_sendBlocked = true;
            break;
    }

    return status;
}

Status::T Transaction::sendMd()
{
    CFDPD_ASSERT((this->m_state == TXN_STATE_S1) || (this->m_state == TXN_STATE_S2), this->m_state);

    Pdu pdu;
    MetadataPdu& md = pdu.asMetadataPdu();

    // Class 1: closure not requested (0), Class 2: closure requested (1)
    U8 closureRequested = (this->m_state == TXN_STATE_S2) ? 1 : 0;

    md.initialize(
        DIRECTION_TOWARD_RECEIVER,
        this->m_txn_class,  // transmission mode (Class 1 or 2)
        this->m_id.sourceEid,  // source EID
        this->m_id.seq,  // transaction sequence number
        this->m_destEid,  // destination EID
        this->m_fsize,  // file size
        this->m_srcFilename,  // source filename
        this->m_dstFilename,  // destination filename
        CHECKSUM_TYPE_MODULAR,  // checksum type
        closureRequested  // closure requested flag
    );

    // openSource() already kept only what encodes and fits
    Tlv tlv;
    for (std::vector<FilestoreRequest>::const_iterator it = this->m_filestoreRequests.begin();
         it != this->m_filestoreRequests.end(); ++it)
    {
        const bool added = FilestoreRequestToTlv(*it, tlv) && md.appendTlv(tlv);
        CFDPD_ASSERT(added);
    }
    for (std::vector<std::string>::const_iterator it = this->m_messagesToUser.begin();
         it != this->m_messagesToUser.end(); ++it)
    {
        const bool added = MessageToUserToTlv(*it, tlv) && md.appendTlv(tlv);
        CFDPD_ASSERT(added);
    }

    return this->sendPdu(pdu);
}

Status::T Transaction::sendEof()
{
    Pdu pdu;
    EofPdu& eof = pdu.asEofPdu();

    const ConditionCode conditionCode = TxnStatusToConditionCode(this->m_txn_stat);

    eof.initialize(
        DIRECTION_TOWARD_RECEIVER,
        this->m_txn_class,  // transmission mode
        this->m_id.sourceEid,  // source EID
        this->m_id.seq,  // transaction sequence number
        this->m_destEid,  // destination EID
        conditionCode,  // condition code
        this->m_crc.getValue(),  // checksum
        this->m_fsize  // file size
    );

    // Add entity ID TLV on error conditions
    if (conditionCode != CONDITION_CODE_NO_ERROR)
    {
        Tlv tlv;
        tlv.initialize(this->m_config.localEid);
        const bool added = eof.appendTlv(tlv);
        CFDPD_ASSERT(added);
    }

    return this->sendPdu(pdu);
}

Status::T Transaction::sendAck(AckTxnStatus ts, FileDirective dir_code, ConditionCode cc)
{
    CFDPD_ASSERT((dir_code == FILE_DIRECTIVE_END_OF_FILE) || (dir_code == FILE_DIRECTIVE_FIN), dir_code);

    Pdu pdu;

    // Direction: toward sender for EOF ACK, toward receiver for FIN ACK
    const PduDirection direction = (dir_code == FILE_DIRECTIVE_END_OF_FILE) ? DIRECTION_TOWARD_SENDER
                                                                            : DIRECTION_TOWARD_RECEIVER;

    pdu.asAckPdu().initialize(
        direction,
        this->m_txn_class,  // transmission mode
        this->m_id.sourceEid,  // source EID
        this->m_id.seq,  // transaction sequence number
        this->m_destEid,  // destination EID
        dir_code,  // directive being acknowledged
        1,  // directive subtype code (always 1)
        cc,  // condition code
        ts  // transaction status
    );

    return this->sendPdu(pdu);
}

Status::T Transaction::sendFin(FinDeliveryCode dc, FinFileStatus fs, ConditionCode cc)
{
    Pdu pdu;
    FinPdu& fin = pdu.asFinPdu();

    fin.initialize(
        DIRECTION_TOWARD_SENDER,
        this->m_txn_class,  // transmission mode
        this->m_id.sourceEid,  // source EID (sender)
        this->m_id.seq,  // transaction sequence number
        this->m_destEid,  // destination EID (receiver)
        cc,  // condition code
        dc,  // delivery code
        fs  // file status
    );

    // Add entity ID TLV on error conditions
    if (cc != CONDITION_CODE_NO_ERROR)
    {
        Tlv tlv;
        tlv.initialize(this->m_config.localEid);
        const bool added = fin.appendTlv(tlv);
        CFDPD_ASSERT(added);
    }

    return this->sendPdu(pdu);
}

}  // namespace Cfdp
}  // namespace Ccsds
}  // namespace Cfdpd

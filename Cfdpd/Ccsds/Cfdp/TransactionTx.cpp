// ======================================================================
// \title  TransactionTx.cpp
// \brief  cpp file for CFDP TX Transaction state machine
//
// This file is a port of TX transaction state machine operations from the following files
// from the NASA Core Flight System (cFS) CFDP (CF) Application, version 3.0.0,
// adapted for use within cfdpd:
// - cf_cfdp_s.c (send-file transaction state handling routines)
// - cf_cfdp_dispatch.c (TX state machine dispatch functions)
//
// This file contains various state handling routines for
// transactions which are sending a file, as well as dispatch
// functions for TX state machines and top-level transaction dispatch.
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

#include <Cfdpd/Types/Assert.hpp>
#include <Cfdpd/Ccsds/Cfdp/Transaction.hpp>
#include <Cfdpd/Ccsds/Cfdp/Utils.hpp>

namespace Cfdpd {
namespace Ccsds {
namespace Cfdp {

// ======================================================================
// TX State Machine - Private Helper (anonymous namespace)
// ======================================================================

namespace {

// Helper to build dispatch tables
FileDirectiveDispatchTable makeFileDirectiveTable(
    StateRecvFunc fin,
    StateRecvFunc ack,
    StateRecvFunc nak
)
{
    FileDirectiveDispatchTable table = {};

    table.fdirective[FILE_DIRECTIVE_FIN] = fin;
    table.fdirective[FILE_DIRECTIVE_ACK] = ack;
    table.fdirective[FILE_DIRECTIVE_NAK] = nak;

    return table;
}

}  // anonymous namespace

// ======================================================================
// TX State Machine - Public Methods
// ======================================================================

void Transaction::s1Recv(const Pdu& pdu) {
    // s1 doesn't need to receive anything
    static const SSubstateRecvDispatchTable substate_fns = {{nullptr}};
    this->sDispatchRecv(pdu, &substate_fns);
}

void Transaction::s2Recv(const Pdu& pdu) {
    static const FileDirectiveDispatchTable s2_meta =
        makeFileDirectiveTable(
            &Transaction::s2EarlyFin,
            nullptr,
            nullptr
        );

    static const FileDirectiveDispatchTable s2_fd_or_eof =
        makeFileDirectiveTable(
            &Transaction::s2EarlyFin,
            nullptr,
            &Transaction::s2Nak
        );

    static const FileDirectiveDispatchTable s2_wait_ack =
        makeFileDirectiveTable(
            &Transaction::s2Fin,
            &Transaction::s2EofAck,
            &Transaction::s2NakArm
        );

    static const SSubstateRecvDispatchTable substate_fns = {
        {
            &s2_meta,      /* TX_SUB_STATE_METADATA */
            &s2_fd_or_eof, /* TX_SUB_STATE_FILEDATA */
            &s2_fd_or_eof, /* TX_SUB_STATE_EOF */
            &s2_wait_ack   /* TX_SUB_STATE_CLOSEOUT_SYNC */
        }
    };

    this->sDispatchRecv(pdu, &substate_fns);
}

void Transaction::s1Tx() {
    static const SSubstateSendDispatchTable substate_fns = {{
        &Transaction::sSubstateSendMetadata, // TX_SUB_STATE_METADATA
        &Transaction::sSubstateSendFileData, // TX_SUB_STATE_FILEDATA
        &Transaction::s1SubstateSendEof, // TX_SUB_STATE_EOF
        nullptr // TX_SUB_STATE_CLOSEOUT_SYNC
    }};

    this->sDispatchTransmit(&substate_fns);
}

void Transaction::s2Tx() {
    static const SSubstateSendDispatchTable substate_fns = {{
        &Transaction::sSubstateSendMetadata, // TX_SUB_STATE_METADATA
        &Transaction::s2SubstateSendFileData, // TX_SUB_STATE_FILEDATA
        &Transaction::s2SubstateSendEof, // TX_SUB_STATE_EOF
        nullptr // TX_SUB_STATE_CLOSEOUT_SYNC
    }};

    this->sDispatchTransmit(&substate_fns);
}

void Transaction::sAckTimerTick() {
    // note: the ack timer is only ever relevant on class 2
    if (this->m_state != TXN_STATE_S2 || !this->m_flags.com.ack_timer_armed)
    {
        // nothing to do
        return;
    }

    if (this->m_ack_timer.getStatus() == Timer::RUNNING)
    {
        return;
    }

    if (this->m_state_data.send.sub_state == TX_SUB_STATE_CLOSEOUT_SYNC)
    {
        // Check limit and handle if needed
        if (this->m_state_data.send.s2.acknak_count >= this->m_config.ackLimit)
        {
            this->m_events.log_WARNING_HI_TxAckLimitReached(
                this->m_txn_class,
                this->m_id.sourceEid,
                this->m_id.seq);
            this->setTxnStatus(TXN_STATUS_POS_ACK_LIMIT_REACHED);

            // give up on this
            this->m_flags.com.ack_timer_armed = false;
            this->finishTransaction();
        }
        else
        {
            // Increment acknak counter
            ++this->m_state_data.send.s2.acknak_count;

            // If the peer sent FIN that is an implicit EOF ack, it is not supposed
            // to send it before EOF unless an error occurs, and either way we do not
            // re-transmit anything after FIN unless we get another FIN
            if (!this->m_flags.tx.eof_ack_recv && !this->m_flags.tx.fin_recv)
            {
                this->m_flags.tx.send_eof = true;

                // Silence from the peer may mean the Metadata never arrived
                if (!this->m_flags.com.peer_heard)
                {
                    this->m_flags.tx.md_need_send = true;
                    this->m_events.log_ACTIVITY_LO_TxMetadataResent(
                        this->m_txn_class,
                        this->m_id.sourceEid,
                        this->m_id.seq);
                }
            }
            else
            {
                // no response is pending
                this->m_flags.com.ack_timer_armed = false;
            }
        }

        // reset the ack timer if still waiting on something
        if (this->m_flags.com.ack_timer_armed)
        {
            this->armAckTimer();
        }
    }
    else
    {
        // if we are not waiting for anything, why is the ack timer armed?
        this->m_flags.com.ack_timer_armed = false;
    }
}

void Transaction::sTick() {
    bool pending_send;

    pending_send = true; // maybe; tbd, will be reset if not

    // at each tick, various timers used by S are checked
    // first, check inactivity timer
    if (!this->m_flags.com.inactivity_fired &&
        (this->m_inactivity_timer.getStatus() != Timer::RUNNING))
    {
        this->m_flags.com.inactivity_fired = true;

        // HOLD state is the normal path to retire a transaction, not an error
        // inactivity is abnormal in any other state
        if (this->m_state == TXN_STATE_S1 || this->m_state == TXN_STATE_S2)
        {
            this->m_events.log_WARNING_HI_TxInactivityTimeout(
                this->m_txn_class,
                this->m_id.sourceEid,
                this->m_id.seq);
            this->setTxnStatus(TXN_STATUS_INACTIVITY_DETECTED);
        }
    }

    // tx maintenance: possibly process send_eof, or send_fin_ack
    if (this->m_flags.tx.send_eof)
    {
        if (this->sSendEof() != Status::SEND_PDU_ERROR)
        {
            this->m_flags.tx.send_eof = false;
        }
    }
    else if (this->m_flags.tx.send_fin_ack)
    {
        if (this->sSendFinAck() != Status::SEND_PDU_ERROR)
        {
            this->m_flags.tx.send_fin_ack = false;
        }
    }
    else
    {
        pending_send = false;
    }

    // if the inactivity timer ran out, then there is no sense
    // pending for responses for anything.  Send out anything
    // that we need to send (i.e. the EOF) just in case the sender
    // is still listening to us but do not expect any future ACKs
    if (this->m_flags.com.inactivity_fired && !pending_send)
    {
        // Late PDUs for this transaction will be seen as spurious from here on
        this->closeTransaction();
    }
    else
    {
        // transaction still valid so process the ACK timer, if relevant
        this->sAckTimerTick();
    }
}

bool Transaction::sTickNak() {
    bool nakProcessed = false;

    const Status::T status = this->sCheckAndRespondNak(&nakProcessed);
    if (status == Status::ERROR)
    {
        // the data asked for cannot be produced
        this->setTxnStatus(TXN_STATUS_NAK_RESPONSE_ERROR);
        this->m_flags.tx.send_eof = true; /* do not leave the remote hanging */
        this->finishTransaction();
        return false;
    }

    return (status == Status::SUCCESS) && nakProcessed;
}

void Transaction::sCancel() {
    if (this->m_state_data.send.sub_state < TX_SUB_STATE_EOF)
    {
        // if state has not reached TX_SUB_STATE_EOF, then set it to TX_SUB_STATE_EOF now.
        this->m_state_data.send.sub_state = TX_SUB_STATE_EOF;
    }
}

// ======================================================================
// TX State Machine - Private Helper Methods
// ======================================================================

Status::T Transaction::sSendEof() {
    // note the crc is "finalized" regardless of success or failure of the txn
    // this is OK as we still need to put some value into the EOF
    this->m_flags.com.crc_calc = true;
    return this->sendEof();
}

void Transaction::s1SubstateSendEof() {
    // set the flag, the EOF is sent by the tick handler
    this->m_flags.tx.send_eof = true;

    // In class 1 this is the end of normal operation
    this->finishTransaction();
}

void Transaction::s2SubstateSendEof() {
    // set the flag, the EOF is sent by the tick handler
    this->m_flags.tx.send_eof = true;

    // wait for remaining responses to close out the state machine
    this->m_state_data.send.sub_state = TX_SUB_STATE_CLOSEOUT_SYNC;

    // the ack timer is armed in class 2 only
    this->armAckTimer();
}

Status::T Transaction::sSendFileData(FileSize foffs, FileSize bytes_to_read, bool calc_crc, FileSize* bytes_processed) {
    CFDPD_ASSERT(bytes_processed != nullptr);
    CFDPD_ASSERT(this->m_file);
    *bytes_processed = 0;

    // Local buffer for file data
    U8 fileDataBuffer[CFDP_MAX_PDU_SIZE];

    // Calculate maximum data size we can send, accounting for PDU overhead
    PduHeader header;
    header.initialize(T_FILE_DATA, DIRECTION_TOWARD_RECEIVER, this->m_txn_class,
                      this->m_id.sourceEid, this->m_id.seq, this->m_destEid);
    const U32 maxDataCapacity = FileDataPdu::getMaxFileDataSize(header);

    // Limited by: bytes_to_read, outgoing_file_chunk_size, and maxDataCapacity
    FileSize max_data_bytes = bytes_to_read;
    if (max_data_bytes > this->m_config.outgoingFileChunkSize) {
        max_data_bytes = this->m_config.outgoingFileChunkSize;
    }
    if (max_data_bytes > maxDataCapacity) {
        max_data_bytes = maxDataCapacity;
    }
    if (max_data_bytes > sizeof(fileDataBuffer)) {
        max_data_bytes = sizeof(fileDataBuffer);
    }

    // Read file data
    FwSizeType actual_bytes = max_data_bytes;
    Filestore::Status fileStatus = this->m_file->readAt(foffs, fileDataBuffer, actual_bytes);
    if ((fileStatus == Filestore::OP_OK) && (actual_bytes != max_data_bytes)) {
        // the file shrank underneath us
        fileStatus = Filestore::BAD_SIZE;
    }
    if (fileStatus != Filestore::OP_OK) {
        this->m_events.log_WARNING_HI_TxFileReadFailed(
            this->m_txn_class,
            this->m_id.sourceEid,
            this->m_id.seq,
            foffs,
            fileStatus);
        return Status::ERROR;
    }

    // Initialize and send PDU
    Pdu pdu;
    pdu.asFileDataPdu().initialize(
        DIRECTION_TOWARD_RECEIVER,
        this->m_txn_class,  // transmission mode
        this->m_id.sourceEid,  // source EID
        this->m_id.seq,  // transaction sequence number
        this->m_destEid,  // destination EID
        foffs,  // file offset
        static_cast<U16>(actual_bytes),  // data size
        fileDataBuffer  // data pointer
    );

    Status::T status = this->sendPdu(pdu);
    if (status == Status::NO_ROUTE) {
        // lost in transit as far as the state machine is concerned
        status = Status::SUCCESS;
    }

    // Update state and CRC
    if (status == Status::SUCCESS) {
        CFDPD_ASSERT((foffs + actual_bytes) <= this->m_fsize, foffs, actual_bytes, this->m_fsize);

        if (calc_crc) {
            this->m_crc.update(fileDataBuffer, foffs, static_cast<U32>(actual_bytes));
        }

        *bytes_processed = static_cast<FileSize>(actual_bytes);

        // a long transfer is traffic too
        this->armInactTimer();
    }

    return status;
}

void Transaction::sSubstateSendFileData() {
    FileSize bytes_processed = 0;
    Status::T status = this->sSendFileData(this->m_foffs, (this->m_fsize - this->m_foffs), true, &bytes_processed);

    if (status == Status::SEND_PDU_ERROR)
    {
        // outbound queue full, try again next cycle
        return;
    }

    if (status != Status::SUCCESS)
    {
        // IO error -- change state and send EOF
        this->setTxnStatus(TXN_STATUS_FILESTORE_REJECTION);
        this->m_state_data.send.sub_state = TX_SUB_STATE_EOF;
    }
    else if (bytes_processed > 0)
    {
        this->m_foffs += bytes_processed;
        if (this->m_foffs == this->m_fsize)
        {
            // file is done
            this->m_state_data.send.sub_state = TX_SUB_STATE_EOF;
        }
    }
}

Status::T Transaction::sCheckAndRespondNak(bool* nakProcessed) {
    const Chunk *chunk;
    Status::T ret = Status::SUCCESS;
    FileSize bytes_processed = 0;

    CFDPD_ASSERT(nakProcessed != nullptr);
    *nakProcessed = false;

    if (this->m_flags.tx.md_need_send)
    {
        ret = this->sendMd();
        if (ret != Status::SEND_PDU_ERROR)
        {
            this->m_flags.tx.md_need_send = false;

            // unless SEND_PDU_ERROR, keep caller from sending file data
            *nakProcessed = true;
            ret = Status::SUCCESS;
        }
    }
    else
    {
        // Get first chunk and process if available
        chunk = this->m_chunks.getFirstChunk();
        if (chunk != nullptr)
        {
            ret = this->sSendFileData(chunk->offset, chunk->size, false, &bytes_processed);
            if ((ret == Status::SUCCESS) && (bytes_processed > 0))
            {
                this->m_chunks.removeFromFirst(bytes_processed);
                *nakProcessed = true; // nak processed, so caller doesn't send file data
            }
        }
    }

    return ret;
}

void Transaction::s2SubstateSendFileData() {
    Status::T status;
    bool nakProcessed = false;

    status = this->sCheckAndRespondNak(&nakProcessed);
    if (status == Status::SEND_PDU_ERROR)
    {
        return;
    }
    if (status != Status::SUCCESS)
    {
        this->setTxnStatus(TXN_STATUS_NAK_RESPONSE_ERROR);
        this->m_flags.tx.send_eof = true; /* do not leave the remote hanging */
        this->finishTransaction();
        return;
    }

    if (!nakProcessed)
    {
        this->sSubstateSendFileData();
    }
}

void Transaction::sSubstateSendMetadata() {
    const Status::T status = this->sendMd();

    if (status == Status::NO_ROUTE)
    {
        // nobody can ever hear this transaction
        this->m_events.log_WARNING_HI_TxSendMetadataFailed(
            this->m_txn_class,
            this->m_id.sourceEid,
            this->m_id.seq,
            status);
        this->setTxnStatus(TXN_STATUS_PROTOCOL_ERROR);
        this->finishTransaction();
    }
    else if (status == Status::SUCCESS)
    {
        /* once metadata is sent, switch to filedata mode */
        this->m_state_data.send.sub_state =
            (this->m_fsize == 0) ? TX_SUB_STATE_EOF : TX_SUB_STATE_FILEDATA;
        this->armInactTimer();
    }
    /* if status==SEND_PDU_ERROR, then try to send md again next cycle */
}

Status::T Transaction::sSendFinAck() {
    return this->sendAck(this->getAckTxnStatus(),
                         FILE_DIRECTIVE_FIN,
                         static_cast<ConditionCode>(this->m_state_data.send.s2.fin_cc));
}

void Transaction::s2EarlyFin(const Pdu& pdu) {
    // received early fin, so just cancel
    this->m_events.log_WARNING_HI_TxEarlyFinReceived(
        this->m_txn_class,
        this->m_id.sourceEid,
        this->m_id.seq);
    this->setTxnStatus(TXN_STATUS_EARLY_FIN);

    this->m_state_data.send.sub_state = TX_SUB_STATE_CLOSEOUT_SYNC;

    // otherwise do normal fin processing
    this->s2Fin(pdu);
}

void Transaction::s2Fin(const Pdu& pdu) {
    const FinPdu& fin = pdu.asFinPdu();

    // set the CC only on the first time we get the FIN.  If this is a dupe
    // then re-ack but otherwise ignore it
    if (!this->m_flags.tx.fin_recv)
    {
        this->m_flags.tx.fin_recv               = true;
        this->m_state_data.send.s2.fin_cc       = static_cast<U8>(fin.getConditionCode());
        this->m_state_data.send.s2.acknak_count = 0; // in case retransmits had occurred
        this->m_fileStatus                      = fin.getFileStatus();

        // note this is a no-op unless the status was unset previously
        this->setTxnStatus(static_cast<TxnStatus>(this->m_state_data.send.s2.fin_cc));

        // Generally FIN is the last exchange in an S2 transaction, the remote is not supposed
        // to send it until after the EOF+ACK.  So at this point we stop trying to send anything
        // to the peer, regardless of whether we got every ACK we expected.
        this->finishTransaction();
    }
    this->m_flags.tx.send_fin_ack = true;
}

void Transaction::s2Nak(const Pdu& pdu) {
    const NakPdu& nak = pdu.asNakPdu();
    U32 bad_sr = 0;

    for (U8 counter = 0; counter < nak.getNumSegments(); ++counter)
    {
        const SegmentRequest& sr = nak.getSegment(counter);

        if (sr.offsetStart == 0 && sr.offsetEnd == 0)
        {
            // need to re-send metadata PDU
            this->m_flags.tx.md_need_send = true;
            continue;
        }

        if ((sr.offsetEnd < sr.offsetStart) || (sr.offsetEnd > this->m_fsize))
        {
            ++bad_sr;
            continue;
        }

        // insert gap data in chunks
        if (sr.offsetEnd > sr.offsetStart)
        {
            this->m_chunks.add(sr.offsetStart, sr.offsetEnd - sr.offsetStart);
        }
    }

    if (bad_sr)
    {
        this->m_events.log_WARNING_LO_TxInvalidSegmentRequests(
            this->m_txn_class,
            this->m_id.sourceEid,
            this->m_id.seq,
            bad_sr);
    }
}

void Transaction::s2NakArm(const Pdu& pdu) {
    this->armAckTimer();
    this->s2Nak(pdu);
}

void Transaction::s2EofAck(const Pdu& pdu) {
    const AckPdu& ack = pdu.asAckPdu();

    // Check if this is an EOF acknowledgment
    if (ack.getAckedDirectiveCode() == FILE_DIRECTIVE_END_OF_FILE)
    {
        this->m_flags.tx.eof_ack_recv           = true;
        this->m_flags.com.ack_timer_armed       = false; // just wait for FIN now, nothing to re-send
        this->m_state_data.send.s2.acknak_count = 0;     // in case EOF retransmits had occurred

        // if FIN was also received then we are done (these can come out of order)
        // a canceled sender does not wait for a FIN
        if (this->m_flags.tx.fin_recv || TxnStatusIsError(this->m_txn_stat))
        {
            this->finishTransaction();
        }
    }
}

// ======================================================================
// Dispatch Methods (ported from cf_cfdp_dispatch.c)
// ======================================================================

void Transaction::sDispatchRecv(const Pdu& pdu,
                                const SSubstateRecvDispatchTable *dispatch)
{
    const FileDirectiveDispatchTable *substate_tbl;
    StateRecvFunc                     selected_handler;

    CFDPD_ASSERT(this->m_state_data.send.sub_state < TX_SUB_STATE_NUM_STATES,
                 this->m_state_data.send.sub_state, TX_SUB_STATE_NUM_STATES);

    // send state, so we only care about file directive PDU
    selected_handler = nullptr;

    if (pdu.getType() == T_FILE_DATA)
    {
        this->m_events.log_WARNING_LO_TxNonFileDirectivePduReceived(
            this->m_txn_class,
            this->m_id.sourceEid,
            this->m_id.seq);
    }
    else if (pdu.getType() != T_NONE)
    {
        // Directive codes were range-checked when the PDU was decoded
        const FileDirective directiveCode = pdu.getDirectiveCode();

        // This should be silent (no event) if no handler is defined in the table
        substate_tbl = dispatch->substate[this->m_state_data.send.sub_state];
        if (substate_tbl != nullptr)
        {
            selected_handler = substate_tbl->fdirective[directiveCode];
        }
    }

    // A PDU that makes no sense in this state (for example, class 1
    // receiving a NAK PDU) is silently ignored.
    if (selected_handler)
    {
        (this->*selected_handler)(pdu);
    }
}

void Transaction::sDispatchTransmit(const SSubstateSendDispatchTable *dispatch)
{
    StateSendFunc selected_handler;

    selected_handler = dispatch->substate[this->m_state_data.send.sub_state];
    if (selected_handler != nullptr)
    {
        (this->*selected_handler)();
    }
}

void Transaction::txStateDispatch(const TxnSendDispatchTable *dispatch)
{
    StateSendFunc selected_handler;

    CFDPD_ASSERT(this->m_state < TXN_STATE_INVALID, this->m_state, TXN_STATE_INVALID);

    selected_handler = dispatch->tx[this->m_state];
    if (selected_handler != nullptr)
    {
        (this->*selected_handler)();
    }
}

}  // namespace Cfdp
}  // namespace Ccsds
}  // namespace Cfdpd

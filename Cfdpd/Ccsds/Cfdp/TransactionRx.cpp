// ======================================================================
// \title  TransactionRx.cpp
// \brief  cpp file for CFDP RX Transaction state machine
//
// This file is a port of RX transaction state machine operations from the following files
// from the NASA Core Flight System (cFS) CFDP (CF) Application, version 3.0.0,
// adapted for use within cfdpd:
// - cf_cfdp_r.c (receive-file transaction state handling routines)
// - cf_cfdp_dispatch.c (RX state machine dispatch functions)
//
// This file contains various state handling routines for
// transactions which are receiving a file, as well as dispatch
// functions for RX state machines.
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
// RX State Machine - Public Methods
// ======================================================================

void Transaction::r1Recv(const Pdu& pdu) {
    static const FileDirectiveDispatchTable r1_fdir_handlers = {
        {
            nullptr, /* FILE_DIRECTIVE_INVALID_MIN */
            nullptr, /* 1 is unused in the FileDirective enum */
            nullptr, /* 2 is unused in the FileDirective enum */
            nullptr, /* 3 is unused in the FileDirective enum */
            &Transaction::r1SubstateRecvEof, /* FILE_DIRECTIVE_END_OF_FILE */
            nullptr, /* FILE_DIRECTIVE_FIN */
            nullptr, /* FILE_DIRECTIVE_ACK */
            nullptr, /* FILE_DIRECTIVE_METADATA */
            nullptr, /* FILE_DIRECTIVE_NAK */
            nullptr, /* FILE_DIRECTIVE_PROMPT */
            nullptr, /* 10 is unused in the FileDirective enum */
            nullptr, /* 11 is unused in the FileDirective enum */
            nullptr, /* FILE_DIRECTIVE_KEEP_ALIVE */
        }
    };

    static const RSubstateDispatchTable substate_fns = {
        {
            &r1_fdir_handlers, /* RX_SUB_STATE_FILEDATA */
            &r1_fdir_handlers, /* RX_SUB_STATE_EOF */
            &r1_fdir_handlers, /* RX_SUB_STATE_CLOSEOUT_SYNC */
        }
    };

    this->rDispatchRecv(pdu, &substate_fns, &Transaction::r1SubstateRecvFileData);
}

void Transaction::r2Recv(const Pdu& pdu) {
    // a repeated Metadata changes nothing once the receiver exists
    static const FileDirectiveDispatchTable r2_fdir_handlers_normal = {
        {
            nullptr, /* FILE_DIRECTIVE_INVALID_MIN */
            nullptr, /* 1 is unused in the FileDirective enum */
            nullptr, /* 2 is unused in the FileDirective enum */
            nullptr, /* 3 is unused in the FileDirective enum */
            &Transaction::r2SubstateRecvEof, /* FILE_DIRECTIVE_END_OF_FILE */
            nullptr, /* FILE_DIRECTIVE_FIN */
            nullptr, /* FILE_DIRECTIVE_ACK */
            nullptr, /* FILE_DIRECTIVE_METADATA */
            nullptr, /* FILE_DIRECTIVE_NAK */
            nullptr, /* FILE_DIRECTIVE_PROMPT */
            nullptr, /* 10 is unused in the FileDirective enum */
            nullptr, /* 11 is unused in the FileDirective enum */
            nullptr, /* FILE_DIRECTIVE_KEEP_ALIVE */
        }
    };
    static const FileDirectiveDispatchTable r2_fdir_handlers_finack = {
        {
            nullptr, /* FILE_DIRECTIVE_INVALID_MIN */
            nullptr, /* 1 is unused in the FileDirective enum */
            nullptr, /* 2 is unused in the FileDirective enum */
            nullptr, /* 3 is unused in the FileDirective enum */
            &Transaction::r2SubstateRecvEof, /* FILE_DIRECTIVE_END_OF_FILE */
            nullptr, /* FILE_DIRECTIVE_FIN */
            &Transaction::r2RecvFinAck, /* FILE_DIRECTIVE_ACK */
            nullptr, /* FILE_DIRECTIVE_METADATA */
            nullptr, /* FILE_DIRECTIVE_NAK */
            nullptr, /* FILE_DIRECTIVE_PROMPT */
            nullptr, /* 10 is unused in the FileDirective enum */
            nullptr, /* 11 is unused in the FileDirective enum */
            nullptr, /* FILE_DIRECTIVE_KEEP_ALIVE */
        }
    };

    static const RSubstateDispatchTable substate_fns = {
        {
            &r2_fdir_handlers_normal, /* RX_SUB_STATE_FILEDATA */
            &r2_fdir_handlers_normal, /* RX_SUB_STATE_EOF */
            &r2_fdir_handlers_finack, /* RX_SUB_STATE_CLOSEOUT_SYNC */
        }
    };

    this->rDispatchRecv(pdu, &substate_fns, &Transaction::r2SubstateRecvFileData);
}

void Transaction::rAckTimerTick() {
    /* note: the ack timer is only ever armed on class 2 */
    if (this->m_state != TXN_STATE_R2 || !this->m_flags.com.ack_timer_armed)
    {
        /* nothing to do */
        return;
    }

    if (this->m_ack_timer.getStatus() == Timer::RUNNING)
    {
        return;
    }

    /* ACK timer expired */
    if (this->m_state_data.receive.sub_state == RX_SUB_STATE_CLOSEOUT_SYNC)
    {
        /* FIN went out and no ACK came back */
        ++this->m_state_data.receive.r2.acknak_count;

        /* Check limit and handle if needed */
        if (this->m_state_data.receive.r2.acknak_count >= this->m_config.ackLimit)
        {
            this->m_events.log_WARNING_HI_RxAckLimitReached(
                this->m_txn_class,
                this->m_id.sourceEid,
                this->m_id.seq);
            this->setTxnStatus(TXN_STATUS_ACK_LIMIT_NO_FIN);

            /* give up on this */
            this->m_flags.com.ack_timer_armed = false;
            this->finishTransaction();
        }
        else
        {
            this->m_flags.rx.send_fin = true;
        }
    }
    else if (!this->m_flags.rx.complete)
    {
        /* check for completion, which NAKs whatever is still missing */
        this->r2Complete(true);
    }

    /* re-arm the timer if it is still pending */
    if (this->m_flags.com.ack_timer_armed)
    {
        /* whether sending FIN or waiting for more filedata, need ACK timer armed */
        this->armAckTimer();
    }
}

void Transaction::rTick() {
    Status::T sret;
    bool      pending_send;

    if (!this->m_flags.com.inactivity_fired &&
        (this->m_inactivity_timer.getStatus() != Timer::RUNNING))
    {
        this->m_flags.com.inactivity_fired = true;

        /* HOLD state is the normal path to retire a transaction, not an error */
        /* inactivity is abnormal in any other state */
        if (this->m_state != TXN_STATE_HOLD)
        {
            this->rSendInactivityEvent();

            /* in class 2 this also triggers sending an early FIN response */
            if (this->m_state == TXN_STATE_R2)
            {
                this->r2SetFinTxnStatus(TXN_STATUS_INACTIVITY_DETECTED);
            }
            else
            {
                this->setTxnStatus(TXN_STATUS_INACTIVITY_DETECTED);
            }
        }
    }

    pending_send = true; /* maybe; tbd */

    /* rx maintenance: possibly process send_eof_ack, send_nak or send_fin */
    if (this->m_flags.rx.send_eof_ack)
    {
        sret = this->sendAck(this->getAckTxnStatus(), FILE_DIRECTIVE_END_OF_FILE,
                             static_cast<ConditionCode>(this->m_state_data.receive.r2.eof_cc));

        /* unless the outbound queue was full, move on in the state machine */
        if (sret != Status::SEND_PDU_ERROR)
        {
            this->m_flags.rx.send_eof_ack = false;
        }
    }
    else if (this->m_flags.rx.send_nak)
    {
        if (this->rSubstateSendNak() != Status::SEND_PDU_ERROR)
        {
            this->m_flags.rx.send_nak = false; /* will re-enter on error */
        }
    }
    else if (this->m_flags.rx.send_fin)
    {
        if (this->r2SubstateSendFin() != Status::SEND_PDU_ERROR)
        {
            this->m_flags.rx.send_fin = false; /* will re-enter on error */
        }
    }
    else
    {
        /* no pending responses to the sender */
        pending_send = false;
    }

    /* if the inactivity timer ran out, then there is no sense
     * pending for responses for anything.  Send out anything
     * that we need to send (i.e. the FIN) just in case the sender
     * is still listening to us but do not expect any future ACKs */
    if (this->m_flags.com.inactivity_fired && !pending_send)
    {
        /* Late PDUs for this transaction will be seen as spurious from here on */
        this->closeTransaction();
    }
    else
    {
        /* transaction still valid so process the ACK timer, if relevant */
        this->rAckTimerTick();
    }
}

void Transaction::rCancel() {
    /* for cancel, only need to send FIN if R2 */
    if ((this->m_state == TXN_STATE_R2) && (this->m_state_data.receive.sub_state < RX_SUB_STATE_CLOSEOUT_SYNC))
    {
        this->m_flags.rx.send_fin = true;
    }
    else
    {
        this->r1Reset(); /* if R1, just call it quits */
    }
}

void Transaction::rInit() {
    if (this->m_state == TXN_STATE_R2)
    {
        /* nothing is delivered until the checksum says so */
        this->m_state_data.receive.r2.dc = FIN_DELIVERY_CODE_INCOMPLETE;
        this->m_state_data.receive.r2.fs = FIN_FILE_STATUS_DISCARDED;

        this->armAckTimer();
    }

    const Filestore::Status status = this->m_filestore.createWrite(this->m_dstFilename, this->m_file);
    if (status != Filestore::OP_OK)
    {
        this->m_events.log_WARNING_HI_RxFileCreateFailed(
            this->m_txn_class,
            this->m_id.sourceEid,
            this->m_id.seq,
            this->m_dstFilename,
            status);
        this->m_file.reset(); /* just in case */
        if (this->m_state == TXN_STATE_R2)
        {
            this->m_state_data.receive.r2.fs = FIN_FILE_STATUS_DISCARDED_FILESTORE;
            this->r2SetFinTxnStatus(TXN_STATUS_FILESTORE_REJECTION);
        }
        else
        {
            this->setTxnStatus(TXN_STATUS_FILESTORE_REJECTION);
            this->r1Reset();
        }
    }
    else
    {
        this->m_state_data.receive.sub_state = RX_SUB_STATE_FILEDATA;
    }
}

void Transaction::r2SetFinTxnStatus(TxnStatus txn_stat) {
    this->setTxnStatus(txn_stat);
    this->m_flags.rx.send_fin = true;
}

void Transaction::r1Reset() {
    this->finishTransaction();
}

void Transaction::r2Reset() {
    if ((this->m_state_data.receive.sub_state == RX_SUB_STATE_CLOSEOUT_SYNC) ||
        (this->m_state_data.receive.r2.eof_cc != CONDITION_CODE_NO_ERROR) ||
        TxnStatusIsError(this->m_txn_stat) || this->m_flags.com.canceled)
    {
        this->r1Reset(); /* it's done */
    }
    else
    {
        /* not waiting for FIN ACK, so trigger send FIN */
        this->m_flags.rx.send_fin = true;
    }
}

Status::T Transaction::rCheckCrc(U32 expected_crc) {
    Status::T ret = Status::SUCCESS;
    const U32 crc_result = this->m_crc.getValue();

    if (crc_result != expected_crc)
    {
        this->m_events.log_WARNING_HI_RxCrcMismatch(
            this->m_txn_class,
            this->m_id.sourceEid,
            this->m_id.seq,
            expected_crc,
            crc_result);
        ret = Status::ERROR;
    }

    return ret;
}

void Transaction::r2Complete(bool ok_to_send_nak) {
    bool send_nak = false;
    bool send_fin = false;

    /* checking if r2 is complete. Check NAK list, and send NAK if appropriate */
    /* if all data is present, then there will be no gaps in the chunk */
    if (TxnStatusIsError(this->m_txn_stat))
    {
        return;
    }

    /* first, check if md is received. If not, send specialized NAK */
    if (!this->m_flags.rx.md_recv)
    {
        send_nak = true;
    }
    else
    {
        /* only look for 1 gap, since the goal here is just to know that there are gaps */
        U32 gaps = 0;
        if (this->m_fsize > 0)
        {
            gaps = this->m_chunks.computeGaps(1, this->m_fsize, 0, GapComputeCallback());
        }

        if (gaps > 0)
        {
            /* there is at least 1 gap, so send a NAK */
            send_nak = true;
        }
        else if (this->m_flags.rx.eof_recv)
        {
            /* the EOF was received, and there are no NAKs -- process completion in send FIN state */
            send_fin = true;
        }
    }

    if (send_nak && ok_to_send_nak)
    {
        /* Increment the acknak counter */
        ++this->m_state_data.receive.r2.acknak_count;

        /* Check limit and handle if needed */
        if (this->m_state_data.receive.r2.acknak_count >= this->m_config.nakLimit)
        {
            this->m_events.log_WARNING_HI_RxNakLimitReached(
                this->m_txn_class,
                this->m_id.sourceEid,
                this->m_id.seq);
            send_fin = true;
            /* don't use r2SetFinTxnStatus because many places in this function set send_fin */
            this->setTxnStatus(TXN_STATUS_NAK_LIMIT_REACHED);
            this->m_state_data.receive.r2.acknak_count = 0; /* reset for fin/ack */
        }
        else
        {
            this->m_flags.rx.send_nak = true;
        }
    }

    if (send_fin)
    {
        this->m_flags.rx.complete = true; /* latch completeness, since send_fin is cleared later */

        /* the transaction is now considered complete, but this will not overwrite an
         * error status code if there was one set */
        this->r2SetFinTxnStatus(TXN_STATUS_NO_ERROR);
    }

    /* always go to RX_SUB_STATE_FILEDATA, and let tick change state */
    this->m_state_data.receive.sub_state = RX_SUB_STATE_FILEDATA;
}

// ======================================================================
// RX State Machine - Private Helper Methods
// ======================================================================

Status::T Transaction::rProcessFd(const FileDataPdu& fd) {
    const FileSize offset = fd.getOffset();
    const U16 dataSize = fd.getDataSize();

    /* the sender promised m_fsize bytes in its Metadata */
    if ((static_cast<U64>(offset) + dataSize) > this->m_fsize)
    {
        this->m_events.log_WARNING_LO_RxInvalidFileData(
            this->m_txn_class,
            this->m_id.sourceEid,
            this->m_id.seq,
            offset);
        this->setTxnStatus(TXN_STATUS_FILE_SIZE_ERROR);
        return Status::ERROR;
    }

    CFDPD_ASSERT(this->m_file);

    /* positioned write, so a duplicate or reordered segment lands where it belongs */
    const Filestore::Status status = this->m_file->writeAt(offset, fd.getData(), dataSize);
    if (status != Filestore::OP_OK)
    {
        this->m_events.log_WARNING_HI_RxWriteFailed(
            this->m_txn_class,
            this->m_id.sourceEid,
            this->m_id.seq,
            offset,
            dataSize,
            status);
        this->setTxnStatus(TXN_STATUS_FILESTORE_REJECTION);
        return Status::ERROR;
    }

    return Status::SUCCESS;
}

Status::T Transaction::rSubstateRecvEof(const EofPdu& eof) {
    /* only check size if MD received, otherwise it's still OK */
    if (this->m_flags.rx.md_recv && (eof.getFileSize() != this->m_fsize))
    {
        this->m_events.log_WARNING_HI_RxFileSizeMismatch(
            this->m_txn_class,
            this->m_id.sourceEid,
            this->m_id.seq,
            this->m_fsize,
            eof.getFileSize());
        return Status::REC_PDU_FSIZE_MISMATCH_ERROR;
    }

    return Status::SUCCESS;
}

void Transaction::r1SubstateRecvEof(const Pdu& pdu) {
    const EofPdu& eof = pdu.asEofPdu();
    const Status::T ret = this->rSubstateRecvEof(eof);

    if (ret == Status::SUCCESS)
    {
        if (eof.getConditionCode() != CONDITION_CODE_NO_ERROR)
        {
            /* the sender gave up; all CFDP CC values map onto a TxnStatus of the same value */
            this->setTxnStatus(static_cast<TxnStatus>(eof.getConditionCode()));
        }
        else if ((this->rCalcCrc() == Status::SUCCESS) &&
                 (this->rCheckCrc(eof.getChecksum()) != Status::SUCCESS))
        {
            this->setTxnStatus(TXN_STATUS_FILE_CHECKSUM_FAILURE);
        }
    }
    else
    {
        this->setTxnStatus(TXN_STATUS_FILE_SIZE_ERROR);
    }

    /* after exit, always reset since we are done */
    /* reset even if the EOF failed -- class 1, so it won't come again! */
    this->r1Reset();
}

void Transaction::r2SubstateRecvEof(const Pdu& pdu) {
    const EofPdu& eof = pdu.asEofPdu();

    if (this->m_flags.rx.eof_recv)
    {
        /* a repeated EOF means our ACK was lost */
        this->m_flags.rx.send_eof_ack = true;
        return;
    }

    const Status::T ret = this->rSubstateRecvEof(eof);

    this->m_flags.rx.eof_recv = true;

    /* always ACK the EOF, even if we're not done */
    this->m_state_data.receive.r2.eof_cc = static_cast<U8>(eof.getConditionCode());
    this->m_flags.rx.send_eof_ack        = true; /* defer sending ACK to tick handling */

    /* did receiving EOF succeed? */
    if (ret == Status::SUCCESS)
    {
        /* need to remember the EOF CRC for later */
        this->m_state_data.receive.r2.eof_crc  = eof.getChecksum();
        this->m_state_data.receive.r2.eof_size = eof.getFileSize();

        /* only check for complete if EOF with no errors */
        if (this->m_state_data.receive.r2.eof_cc == CONDITION_CODE_NO_ERROR)
        {
            this->r2Complete(true); /* r2Complete() will change state */
        }
        else
        {
            /* All CFDP CC values directly correspond to a Transaction Status of the same numeric value */
            this->setTxnStatus(static_cast<TxnStatus>(static_cast<I32>(this->m_state_data.receive.r2.eof_cc)));
            this->r2Reset();
        }
    }
    else
    {
        /* bad EOF sent */
        this->r2SetFinTxnStatus(TXN_STATUS_FILE_SIZE_ERROR);
    }
}

void Transaction::r1SubstateRecvFileData(const Pdu& pdu) {
    const FileDataPdu& fd = pdu.asFileDataPdu();

    if (this->rProcessFd(fd) == Status::SUCCESS)
    {
        /* class 1 reads the file back for its checksum at EOF; the gap list only tracks progress */
        if (fd.getDataSize() > 0)
        {
            this->m_chunks.add(fd.getOffset(), static_cast<FileSize>(fd.getDataSize()));
        }
    }
    else
    {
        /* Reset transaction on failure */
        this->r1Reset();
    }
}

void Transaction::r2SubstateRecvFileData(const Pdu& pdu) {
    // Once the checksum read-back has started the file is complete, so late
    // retransmits carry nothing new.
    if (this->m_state_data.receive.r2.rx_crc_calc_bytes > 0)
    {
        return;
    }

    const FileDataPdu& fd = pdu.asFileDataPdu();

    if (this->rProcessFd(fd) == Status::SUCCESS)
    {
        /* class 2 does CRC at FIN, but track gaps */
        if (fd.getDataSize() > 0)
        {
            this->m_chunks.add(fd.getOffset(), static_cast<FileSize>(fd.getDataSize()));
        }

        if (this->m_flags.rx.fd_nak_sent)
        {
            this->r2Complete(false); /* once nak-retransmit received, start checking for completion at each fd */
        }

        if (!this->m_flags.rx.complete)
        {
            this->armAckTimer(); /* re-arm ACK timer, since we got data */
        }

        this->m_state_data.receive.r2.acknak_count = 0;
    }
    else
    {
        /* tell the sender why, rather than going quiet */
        this->r2SetFinTxnStatus(this->m_txn_stat);
    }
}

void Transaction::r2GapCompute(const Chunk& chunk, NakPdu& nak) {
    CFDPD_ASSERT(chunk.size > 0, chunk.size);

    // Calculate segment offsets relative to scope start
    const FileSize offsetStart = chunk.offset - nak.getScopeStart();
    const FileSize offsetEnd = offsetStart + chunk.size;

    // the gap limit never exceeds the segment capacity of a NAK
    const bool added = nak.addSegment(offsetStart, offsetEnd);
    CFDPD_ASSERT(added, offsetStart, offsetEnd);
}

Status::T Transaction::rSubstateSendNak() {
    Status::T status = Status::SUCCESS;

    // Create and initialize NAK PDU
    Pdu pdu;
    NakPdu& nak = pdu.asNakPdu();

    if (this->m_flags.rx.md_recv) {
        // We have metadata, so send NAK with file data gaps
        nak.initialize(
            DIRECTION_TOWARD_SENDER,
            this->m_txn_class,  // transmission mode
            this->m_id.sourceEid,  // source EID (sender)
            this->m_id.seq,  // transaction sequence number
            this->m_destEid,  // destination EID (receiver)
            0,  // scope start
            this->m_fsize  // scope end
        );

        // Compute gaps and add segments to NAK PDU
        const U32 chunkCount = this->m_chunks.getCount();
        const U32 maxChunks = this->m_chunks.getMaxChunks();
        U32 gapLimit = (chunkCount < maxChunks) ? maxChunks : (maxChunks - 1);
        if (gapLimit > CFDP_NAK_MAX_SEGMENTS) {
            gapLimit = CFDP_NAK_MAX_SEGMENTS;
        }

        // For each gap found, add it as a segment to the NAK PDU via callback
        U32 gapCount = 0;
        if (this->m_fsize > 0) {
            gapCount = this->m_chunks.computeGaps(
                static_cast<ChunkIdx>(gapLimit),
                this->m_fsize,
                0,
                [this, &nak](const Chunk& chunk) {
                    this->r2GapCompute(chunk, nak);
                });
        }

        if (!gapCount) {
            // No gaps left, file reception is complete
            this->r2Complete(false);
            status = Status::SUCCESS;
        } else {
            // Gaps are present, send the NAK PDU
            status = this->sendPdu(pdu);
            if (status != Status::SEND_PDU_ERROR) {
                this->m_flags.rx.fd_nak_sent = true;
            }
        }
    } else {
        // Need to send NAK to request metadata PDU again
        // Special case: scope start/end and segment[0] all zeros requests metadata
        nak.initialize(
            DIRECTION_TOWARD_SENDER,
            this->m_txn_class,  // transmission mode
            this->m_id.sourceEid,  // source EID (sender)
            this->m_id.seq,  // transaction sequence number
            this->m_destEid,  // destination EID (receiver)
            0,  // scope start (special value)
            0   // scope end (special value)
        );

        // Add special segment [0,0] to request metadata
        const bool added = nak.addSegment(0, 0);
        CFDPD_ASSERT(added);

        status = this->sendPdu(pdu);
    }

    return status;
}

Status::T Transaction::rCalcCrc() {
    U8 buf[CFDP_R2_CRC_CHUNK_SIZE];

    CFDPD_ASSERT(this->m_file);

    // The file was written through the same handle; read it back from the start
    this->m_crc = Checksum(0);
    this->m_state_data.receive.r2.rx_crc_calc_bytes = 0;

    while (this->m_state_data.receive.r2.rx_crc_calc_bytes < this->m_fsize)
    {
        const FileSize offset = this->m_state_data.receive.r2.rx_crc_calc_bytes;
        const FileSize remaining = this->m_fsize - offset;
        const FwSizeType want = (remaining > sizeof(buf)) ? sizeof(buf) : remaining;

        FwSizeType read_size = want;
        Filestore::Status fileStatus = this->m_file->readAt(offset, buf, read_size);
        if ((fileStatus == Filestore::OP_OK) && (read_size != want))
        {
            // a hole at the end of the file that nothing was ever written to
            fileStatus = Filestore::BAD_SIZE;
        }
        if (fileStatus != Filestore::OP_OK)
        {
            this->m_events.log_WARNING_HI_RxReadCrcFailed(
                this->m_txn_class,
                this->m_id.sourceEid,
                this->m_id.seq,
                offset,
                fileStatus);
            this->setTxnStatus(TXN_STATUS_FILE_SIZE_ERROR);
            return Status::ERROR;
        }

        this->m_crc.update(buf, offset, static_cast<U32>(read_size));
        this->m_state_data.receive.r2.rx_crc_calc_bytes += static_cast<FileSize>(read_size);
    }

    this->m_flags.com.crc_calc = true;
    return Status::SUCCESS;
}

Status::T Transaction::r2SubstateSendFin() {
    if (!TxnStatusIsError(this->m_txn_stat) && !this->m_flags.com.crc_calc)
    {
        /* no error, and haven't checked CRC -- so check it now */
        if (this->rCalcCrc() == Status::SUCCESS)
        {
            if (this->rCheckCrc(this->m_state_data.receive.r2.eof_crc) == Status::SUCCESS)
            {
                /* CRC matched! We are happy */
                this->m_state_data.receive.r2.dc = FIN_DELIVERY_CODE_COMPLETE;
                this->m_state_data.receive.r2.fs = FIN_FILE_STATUS_RETAINED;
            }
            else
            {
                this->setTxnStatus(TXN_STATUS_FILE_CHECKSUM_FAILURE);
            }
        }
    }

    const Status::T sret = this->sendFin(this->m_state_data.receive.r2.dc, this->m_state_data.receive.r2.fs,
                                         TxnStatusToConditionCode(this->m_txn_stat));
    if (sret == Status::SEND_PDU_ERROR)
    {
        /* outbound queue full, try again next time */
        return sret;
    }

    /* whether or not FIN reached the peer, ok to transition state */
    this->m_state_data.receive.sub_state = RX_SUB_STATE_CLOSEOUT_SYNC;
    this->armAckTimer();
    return Status::SUCCESS;
}

void Transaction::r2RecvFinAck(const Pdu& pdu) {
    if (pdu.asAckPdu().getAckedDirectiveCode() == FILE_DIRECTIVE_FIN)
    {
        /* got fin-ack, so time to close the state */
        this->r2Reset();
    }
}

void Transaction::rSendInactivityEvent() {
    this->m_events.log_WARNING_HI_RxInactivityTimeout(
        this->m_txn_class,
        this->m_id.sourceEid,
        this->m_id.seq);
}

// ======================================================================
// Dispatch Methods
// ======================================================================

void Transaction::rDispatchRecv(const Pdu& pdu,
                                const RSubstateDispatchTable *dispatch,
                                StateRecvFunc fd_fn)
{
    StateRecvFunc selected_handler;

    CFDPD_ASSERT(this->m_state_data.receive.sub_state < RX_SUB_STATE_NUM_STATES,
                 this->m_state_data.receive.sub_state, RX_SUB_STATE_NUM_STATES);

    selected_handler = nullptr;

    // Special handling for file data PDU
    if (pdu.getType() == T_FILE_DATA)
    {
        /* For file data PDU, use the provided fd_fn; after an error the data goes nowhere */
        if (!TxnStatusIsError(this->m_txn_stat))
        {
            selected_handler = fd_fn;
        }
    }
    else if (pdu.getType() != T_NONE)
    {
        const FileDirective directiveCode = pdu.getDirectiveCode();

        if (directiveCode < FILE_DIRECTIVE_INVALID_MAX)
        {
            /* the RSubstateDispatchTable is only used with file directive PDU */
            if (dispatch->state[this->m_state_data.receive.sub_state] != nullptr)
            {
                selected_handler = dispatch->state[this->m_state_data.receive.sub_state]->fdirective[directiveCode];
            }
        }
        else
        {
            this->m_events.log_WARNING_LO_RxInvalidDirectiveCode(
                this->m_txn_class,
                this->m_id.sourceEid,
                this->m_id.seq,
                static_cast<U8>(directiveCode));
        }
    }

    /*
     * NOTE: if no handler is selected, this will drop packets on the floor here.
     */
    if (selected_handler != nullptr)
    {
        (this->*selected_handler)(pdu);
    }
}

}  // namespace Cfdp
}  // namespace Ccsds
}  // namespace Cfdpd

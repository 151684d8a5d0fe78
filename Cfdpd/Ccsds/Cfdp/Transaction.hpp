// ======================================================================
// \title  Transaction.hpp
// \brief  CFDP Transaction state machine class for TX and RX operations
//
// This file is a port of the cf_cfdp_r.h and cf_cfdp_s.h files from the
// NASA Core Flight System (cFS) CFDP (CF) Application,
// version 3.0.0, adapted for use within cfdpd.
//
// This file contains the unified interface for CFDP transaction state
// machines, encompassing both TX (send) and RX (receive) operations.
// The implementation is split across Transaction.cpp, TransactionTx.cpp
// and TransactionRx.cpp for maintainability.
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

#ifndef Cfdpd_Ccsds_Cfdp_Transaction_HPP
#define Cfdpd_Ccsds_Cfdp_Transaction_HPP

#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <Cfdpd/Types/BasicTypes.hpp>
#include <Cfdpd/Filestore/Filestore.hpp>
#include <Cfdpd/Utils/Queue.hpp>

#include <Cfdpd/Ccsds/Cfdp/Chunk.hpp>
#include <Cfdpd/Ccsds/Cfdp/Command.hpp>
#include <Cfdpd/Ccsds/Cfdp/EntityConfig.hpp>
#include <Cfdpd/Ccsds/Cfdp/Events.hpp>
#include <Cfdpd/Ccsds/Cfdp/Timer.hpp>
#include <Cfdpd/Ccsds/Cfdp/TransactionHost.hpp>
#include <Cfdpd/Ccsds/Cfdp/Types/Checksum.hpp>
#include <Cfdpd/Ccsds/Cfdp/Types/Pdu.hpp>
#include <Cfdpd/Ccsds/Cfdp/Types/Types.hpp>
#include <Cfdpd/Ccsds/Cfdp/Types/UserTypes.hpp>

namespace Cfdpd {
namespace Ccsds {
namespace Cfdp {

// Forward declarations
class Transaction;
class TransactionTester;

// ======================================================================
// Dispatch Table Type Definitions
// ======================================================================

/**
 * @brief A member function pointer for dispatching actions to a handler, without existing PDU data
 *
 * This allows quick delegation to handler functions using dispatch tables.  This version is
 * used on the transmit side, where a PDU will likely be generated/sent by the handler being
 * invoked.
 *
 * @note This is a member function pointer - invoke with: (txn->*fn)()
 */
using StateSendFunc = void (Transaction::*)();

/**
 * @brief A member function pointer for dispatching actions to a handler, with existing PDU data
 *
 * This allows quick delegation of PDUs to handler functions using dispatch tables.  This version is
 * used on the receive side where a decoded PDU is associated with the activity, which is then
 * interpreted by the handler being invoked.
 *
 * @param[in] pdu The PDU currently being received/processed
 * @note This is a member function pointer - invoke with: (txn->*fn)(pdu)
 */
using StateRecvFunc = void (Transaction::*)(const Pdu& pdu);

/**
 * @brief A table of transmit handler functions based on transaction state
 */
struct TxnSendDispatchTable
{
    StateSendFunc tx[TXN_STATE_INVALID]; /**< \brief Transmit handler function */
};

/**
 * @brief A table of receive handler functions based on file directive code
 *
 * For PDUs identified as a "file directive" type - generally anything other
 * than file data - this provides a table to branch to a different handler
 * function depending on the value of the file directive code.
 */
struct FileDirectiveDispatchTable
{
    /** \brief a separate recv handler for each possible file directive PDU in this state */
    StateRecvFunc fdirective[FILE_DIRECTIVE_INVALID_MAX];
};

/**
 * @brief A dispatch table for receive file transactions, receive side
 *
 * Depending on the sub-state of the transaction, a different action may be taken.
 */
struct RSubstateDispatchTable
{
    const FileDirectiveDispatchTable *state[RX_SUB_STATE_NUM_STATES];
};

/**
 * @brief A dispatch table for send file transactions, receive side
 */
struct SSubstateRecvDispatchTable
{
    const FileDirectiveDispatchTable *substate[TX_SUB_STATE_NUM_STATES];
};

/**
 * @brief A dispatch table for send file transactions, transmit side
 *
 * This is used for "send file" transactions to generate the next PDU to be sent.
 */
struct SSubstateSendDispatchTable
{
    StateSendFunc substate[TX_SUB_STATE_NUM_STATES];
};

/**
 * @brief CFDP Transaction state machine class
 *
 * One instance drives exactly one file transfer, as sender or receiver, on
 * its own worker thread. The owner talks to it only through its command
 * mailbox; the worker talks back only through the TransactionHost.
 *
 * Implementation is split across multiple files for maintainability:
 * - Transaction.cpp: worker loop, commands and the shared engine helpers
 * - TransactionTx.cpp: TX (send) state machine implementation
 * - TransactionRx.cpp: RX (receive) state machine implementation
 */
class Transaction {
  friend class TransactionTester;

  public:
    // ----------------------------------------------------------------------
    // Construction and Destruction
    // ----------------------------------------------------------------------

    //! @param host      Owner that routes outbound PDUs and reaps the worker
    //! @param filestore Where source files are read and destination files are written
    //! @param config    Protocol parameters of the local entity
    //! @param id        Transaction identity
    //! @param role      DIRECTION_TX for a sender, DIRECTION_RX for a receiver
    //! @param peerEid   The remote entity of this transfer
    //! @param cfdpClass Transmission mode; a receiver takes the final value from Metadata
    Transaction(TransactionHost& host,
                Filestore& filestore,
                const EntityConfig& config,
                const TransactionId& id,
                Direction role,
                EntityId peerEid,
                Class::T cfdpClass);

    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    /**
     * @brief Prepare a sender from a put request
     *
     * Opens the source file and reads its size. Must be called before
     * start() on a DIRECTION_TX transaction.
     *
     * @return Filestore::OP_OK, or the reason the source cannot be read
     */
    Filestore::Status openSource(const PutRequest& request);

    //! Launch the worker thread
    void start();

    //! Wait for the worker thread to return
    void join();

    //! Post a command to the worker
    //! @return Utils::QUEUE_CLOSED once the worker has stopped reading
    Utils::QueueStatus sendCommand(Command&& command);

    //! Snapshot of the transaction; only valid from the worker or after join()
    Report getReport() const;

    // ----------------------------------------------------------------------
    // Accessors
    // ----------------------------------------------------------------------

    const TransactionId& getId() const { return this->m_id; }

    Direction getRole() const { return this->m_role; }

    /**
     * @brief Get transaction class (CLASS_1 or CLASS_2)
     * @return Transaction class
     */
    Class::T getClass() const { return this->m_txn_class; }

    /**
     * @brief Get transaction state
     * @return Transaction state
     */
    TxnState getState() const { return this->m_state; }

  private:
    // ----------------------------------------------------------------------
    // Worker - Implemented in Transaction.cpp
    // ----------------------------------------------------------------------

    //! Worker thread body; returns once the state is CLOSED
    void run();

    //! Apply one mailbox command
    void handleCommand(Command& command);

    //! Send up to maxPdusPerCycle PDUs of file data, Metadata or retransmits
    void cycleTx();

    //! Timer and flag processing, run after every mailbox wake-up
    void tick();

    //! Whether the worker has something to send without waiting for a timer
    bool hasPendingSend() const;

    //! Time the worker may sleep until
    Timer::Clock::time_point nextDeadline() const;

    // ----------------------------------------------------------------------
    // Engine helpers - Implemented in Transaction.cpp
    // ----------------------------------------------------------------------

    void armAckTimer();
    void armInactTimer();

    //! Dispatch a received PDU based on the transaction state
    void dispatchRecv(const Pdu& pdu);

    //! First PDU of a receiver: Metadata selects R1 or R2
    void recvInit(const Pdu& pdu);

    //! Record the fields of a received Metadata PDU
    void recvMd(const MetadataPdu& md);

    //! Answer stragglers from the peer after the transaction finished
    void recvHold(const Pdu& pdu);

    /**
     * @brief Put the transaction into HOLD
     *
     * Closes out the file and reports the outcome. The inactivity timer
     * then decides when the worker finally stops.
     */
    void finishTransaction();

    //! Finish if needed, then move to CLOSED so the worker exits
    void closeTransaction();

    //! Latch a status; the first error is never overwritten
    void setTxnStatus(TxnStatus txn_stat);

    void cancelTransaction();
    void suspendTransaction();
    void resumeTransaction();
    void abandonTransaction();

    //! ACK transaction status to report to the peer
    AckTxnStatus getAckTxnStatus() const;

    //! Route an encoded PDU to the peer
    Status::T sendPdu(const Pdu& pdu);

    Status::T sendMd();
    Status::T sendEof();
    Status::T sendAck(AckTxnStatus ts, FileDirective dir_code, ConditionCode cc);
    Status::T sendFin(FinDeliveryCode dc, FinFileStatus fs, ConditionCode cc);

    // ----------------------------------------------------------------------
    // TX State Machine - Implemented in TransactionTx.cpp
    // ----------------------------------------------------------------------

    /************************************************************************/
    /** @brief S1 receive PDU processing.
     *
     * @param pdu The PDU to process
     */
    void s1Recv(const Pdu& pdu);

    /************************************************************************/
    /** @brief S2 receive PDU processing.
     *
     * @param pdu The PDU to process
     */
    void s2Recv(const Pdu& pdu);

    /************************************************************************/
    /** @brief S1 dispatch function.
     */
    void s1Tx();

    /************************************************************************/
    /** @brief S2 dispatch function.
     */
    void s2Tx();

    /************************************************************************/
    /** @brief Perform acknowledgement timer tick (time-based) processing for S transactions.
     *
     * This is invoked as part of overall timer tick processing if the transaction
     * has some sort of acknowledgement pending from the remote.
     */
    void sAckTimerTick();

    /************************************************************************/
    /** @brief Perform tick (time-based) processing for S transactions.
     *
     * This is where flags are checked to send EOF or FIN-ACK. It also
     * checks the inactivity timer and processes the ACK timer.
     */
    void sTick();

    /************************************************************************/
    /** @brief Perform NAK response for TX transactions in closeout
     *
     * @return true if a PDU was generated
     */
    bool sTickNak();

    /************************************************************************/
    /** @brief Cancel an S transaction.
     */
    void sCancel();

    /************************************************************************/
    /** @brief Sends an EOF for S1.
     */
    void s1SubstateSendEof();

    /************************************************************************/
    /** @brief Triggers tick processing to send an EOF and wait for EOF-ACK for S2
     */
    void s2SubstateSendEof();

    /************************************************************************/
    /** @brief Standard state function to send the next file data PDU for active transaction.
     *
     * This function sends the next chunk of data. If the file offset
     * equals the file size, then transition to the EOF state.
     */
    void sSubstateSendFileData();

    /************************************************************************/
    /** @brief Send filedata handling for S2.
     *
     * S2 will either respond to a NAK by sending retransmits, or in
     * absence of a NAK, it will send more of the original file data.
     */
    void s2SubstateSendFileData();

    /************************************************************************/
    /** @brief Send metadata PDU.
     */
    void sSubstateSendMetadata();

    /************************************************************************/
    /** @brief A FIN was received before file complete, so abandon the transaction.
     *
     * @param pdu The PDU to process
     */
    void s2EarlyFin(const Pdu& pdu);

    /************************************************************************/
    /** @brief S2 received FIN, so set flag to send FIN-ACK.
     *
     * @param pdu The FIN PDU to process
     */
    void s2Fin(const Pdu& pdu);

    /************************************************************************/
    /** @brief S2 NAK PDU received handling.
     *
     * Stores the segment requests from the NAK packet in the chunks
     * structure. These can be used to generate re-transmit filedata
     * PDUs.
     *
     * @param pdu The NAK PDU to process
     */
    void s2Nak(const Pdu& pdu);

    /************************************************************************/
    /** @brief S2 NAK handling but with arming the NAK timer.
     *
     * @param pdu The NAK PDU to process
     */
    void s2NakArm(const Pdu& pdu);

    /************************************************************************/
    /** @brief S2 received ACK PDU.
     *
     * @param pdu The ACK PDU to process
     */
    void s2EofAck(const Pdu& pdu);

    /************************************************************************/
    /** @brief Send an EOF PDU.
     *
     * @retval Status::SUCCESS on success.
     * @retval Status::SEND_PDU_ERROR if the outbound queue is full.
     */
    Status::T sSendEof();

    Status::T sSendFileData(FileSize foffs, FileSize bytes_to_read, bool calc_crc, FileSize* bytes_processed);

    Status::T sCheckAndRespondNak(bool* nakProcessed);

    Status::T sSendFinAck();

    // ----------------------------------------------------------------------
    // RX State Machine - Implemented in TransactionRx.cpp
    // ----------------------------------------------------------------------

    /************************************************************************/
    /** @brief R1 receive PDU processing.
     *
     * @param pdu The PDU to process
     */
    void r1Recv(const Pdu& pdu);

    /************************************************************************/
    /** @brief R2 receive PDU processing.
     *
     * @param pdu The PDU to process
     */
    void r2Recv(const Pdu& pdu);

    /************************************************************************/
    /** @brief Perform acknowledgement timer tick (time-based) processing for R transactions.
     */
    void rAckTimerTick();

    /************************************************************************/
    /** @brief Perform tick (time-based) processing for R transactions.
     *
     * This is where flags are checked to send ACK, NAK, and FIN. It
     * checks for inactivity timer and processes the ACK timer. The ACK
     * timer is what triggers re-sends of PDUs that require acknowledgment.
     */
    void rTick();

    /************************************************************************/
    /** @brief Cancel an R transaction.
     */
    void rCancel();

    /************************************************************************/
    /** @brief Initialize a transaction structure for R.
     */
    void rInit();

    /************************************************************************/
    /** @brief Helper function to store transaction status code and set send_fin flag.
     *
     * @param txn_stat Status Code value to set within transaction
     */
    void r2SetFinTxnStatus(TxnStatus txn_stat);

    /************************************************************************/
    /** @brief CFDP R1 transaction reset function.
     */
    void r1Reset();

    /************************************************************************/
    /** @brief CFDP R2 transaction reset function.
     *
     * Handles reset logic for R2, then calls R1 reset logic.
     */
    void r2Reset();

    /************************************************************************/
    /** @brief Checks that the transaction file's CRC matches expected.
     *
     * @retval Status::SUCCESS on CRC match, otherwise Status::ERROR.
     *
     * @param expected_crc Expected CRC
     */
    Status::T rCheckCrc(U32 expected_crc);

    /************************************************************************/
    /** @brief Checks R2 transaction state for transaction completion status.
     *
     * In order for a transaction to be complete, it must have had its
     * meta-data PDU received, the EOF must have been received, and there
     * must be no gaps in the file.
     *
     * @param ok_to_send_nak If false, suppress sending of a NAK packet
     */
    void r2Complete(bool ok_to_send_nak);

    /************************************************************************/
    /** @brief Process a filedata PDU on a transaction.
     *
     * @retval Status::SUCCESS on success. Status::ERROR on error.
     */
    Status::T rProcessFd(const FileDataPdu& fd);

    /************************************************************************/
    /** @brief Processing receive EOF common functionality for R1/R2.
     *
     * @retval Status::SUCCESS on success. Returns anything else on error.
     */
    Status::T rSubstateRecvEof(const EofPdu& eof);

    /************************************************************************/
    /** @brief Process receive EOF for R1.
     *
     * @param pdu The EOF PDU to process
     */
    void r1SubstateRecvEof(const Pdu& pdu);

    /************************************************************************/
    /** @brief Process receive EOF for R2.
     *
     * For R2, need to trigger the send of EOF-ACK and then call the
     * check complete function which will either send NAK or FIN.
     *
     * @param pdu The EOF PDU to process
     */
    void r2SubstateRecvEof(const Pdu& pdu);

    /************************************************************************/
    /** @brief Process received file data for R1.
     *
     * @param pdu The file data PDU to process
     */
    void r1SubstateRecvFileData(const Pdu& pdu);

    /************************************************************************/
    /** @brief Process received file data for R2.
     *
     * Inserts the received range into chunks. Once a NAK has been sent,
     * this function always checks for completion. This function also
     * re-arms the ACK timer.
     *
     * @param pdu The file data PDU to process
     */
    void r2SubstateRecvFileData(const Pdu& pdu);

    /************************************************************************/
    /** @brief Loads a single NAK segment request.
     *
     * @param chunk The gap chunk information
     * @param nak   The NAK PDU being constructed
     */
    void r2GapCompute(const Chunk& chunk, NakPdu& nak);

    /************************************************************************/
    /** @brief Send a NAK PDU for R2.
     *
     * There is a special case where if a metadata PDU has not been
     * received, then a NAK packet will be sent to request another.
     *
     * @retval Status::SUCCESS on success.
     */
    Status::T rSubstateSendNak();

    /************************************************************************/
    /** @brief Calculate the checksum of the received file.
     *
     * Reads the file back in CFDP_R2_CRC_CHUNK_SIZE pieces.
     *
     * @retval Status::SUCCESS once every byte has been read back.
     * @retval Status::ERROR if the file could not be read.
     */
    Status::T rCalcCrc();

    /************************************************************************/
    /** @brief Send a FIN PDU.
     *
     * @retval Status::SUCCESS on success.
     */
    Status::T r2SubstateSendFin();

    /************************************************************************/
    /** @brief Process receive FIN-ACK PDU.
     *
     * This is the end of an R2 transaction.
     *
     * @param pdu The ACK PDU to process
     */
    void r2RecvFinAck(const Pdu& pdu);

    /************************************************************************/
    /** @brief Sends an inactivity timer expired event.
     */
    void rSendInactivityEvent();

    // ----------------------------------------------------------------------
    // Dispatch Methods
    // ----------------------------------------------------------------------

    void rDispatchRecv(const Pdu& pdu, const RSubstateDispatchTable *dispatch, StateRecvFunc fd_fn);

    void sDispatchRecv(const Pdu& pdu, const SSubstateRecvDispatchTable *dispatch);

    void sDispatchTransmit(const SSubstateSendDispatchTable *dispatch);

    void txStateDispatch(const TxnSendDispatchTable *dispatch);

  private:
    // ----------------------------------------------------------------------
    // Member Variables
    // ----------------------------------------------------------------------

    TransactionHost& m_host;
    Filestore& m_filestore;
    const EntityConfig m_config;
    const Events m_events;

    //! Transaction identity; the source entity allocated the sequence number
    const TransactionId m_id;

    //! Sender or receiver
    const Direction m_role;

    //! The remote partner; outbound PDUs are routed here
    const EntityId m_peerEid;

    //! Destination entity written into every PDU header
    const EntityId m_destEid;

    /**
     * @brief High-level transaction state
     */
    TxnState m_state;

    /**
     * @brief Transaction class (CLASS_1 or CLASS_2)
     */
    Class::T m_txn_class;

    //! Latched outcome; a superset of the condition code
    TxnStatus m_txn_stat;

    std::string m_srcFilename;
    std::string m_dstFilename;
    std::vector<FilestoreRequest> m_filestoreRequests;
    std::vector<std::string> m_messagesToUser;

    //! Disposition of the destination file
    FinFileStatus m_fileStatus;

    /**
     * @brief Gap tracking
     *
     * Received ranges on a receiver, NAK-requested ranges on a sender.
     */
    ChunkList m_chunks;

    /**
     * @brief Inactivity timer
     *
     * Set to the overall inactivity timer of a remote.
     */
    Timer m_inactivity_timer;

    /**
     * @brief ACK/NAK timer
     *
     * Called ack_timer, but is also nak_timer.
     */
    Timer m_ack_timer;

    /**
     * @brief File size
     */
    FileSize m_fsize;

    /**
     * @brief File offset for next read
     */
    FileSize m_foffs;

    /**
     * @brief Open source or destination file
     */
    std::unique_ptr<Filestore::File> m_file;

    /**
     * @brief CRC checksum object
     */
    Checksum m_crc;

    /**
     * @brief State-specific data (TX or RX)
     */
    CfdpStateData m_state_data;

    /**
     * @brief State flags (TX or RX)
     */
    CfdpStateFlags m_flags;

    //! Last send attempt hit a full outbound queue
    bool m_sendBlocked;

    //! PDUs handed to the host so far, including those with no route
    U32 m_pdusSent;

    Utils::Queue<Command> m_mailbox;
    std::thread m_thread;
};

}  // namespace Cfdp
}  // namespace Ccsds
}  // namespace Cfdpd

#endif  // Cfdpd_Ccsds_Cfdp_Transaction_HPP

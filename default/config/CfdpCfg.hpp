// ======================================================================
// \title  CfdpCfg.hpp
// \author campuzan
// \brief  cfdpd configuration constants
// ======================================================================

#ifndef Cfdpd_Config_CfdpCfg_HPP
#define Cfdpd_Config_CfdpCfg_HPP

#include <cinttypes>

namespace Cfdpd {
namespace Ccsds {
namespace Cfdp {

// ==================================================================
// Protocol Configuration
// ==================================================================

/**
 *  @brief Max NAK segments supported in a NAK PDU
 *
 *  @par Description:
 *       When a NAK PDU is sent or received, this is the max number of
 *       segment requests supported. Segments beyond this number in a
 *       received NAK are ignored.
 *
 *  @par Limits:
 *       Must be > 0. A NAK carrying this many segments must still fit in
 *       CFDP_MAX_PDU_SIZE.
 */
#define CFDP_NAK_MAX_SEGMENTS (58)

/**
 *  @brief Maximum TLVs (Type-Length-Value) per PDU
 *
 *  @par Description:
 *       Maximum number of TLV tuples carried by a single Metadata, EOF or
 *       FIN PDU. Metadata uses them for filestore requests and messages to
 *       the user; EOF and FIN use the entity ID TLV on error conditions.
 *
 *  @par Limits:
 *       Must be > 0.
 *
 *  @reference
 *       CCSDS 727.0-B-5, section 5.4, table 5-3
 */
#define CFDP_MAX_TLV (4)

/**
 *  @brief R2 checksum calc chunk size
 *
 *  @par Description
 *       R2 recomputes the file checksum upon file completion by reading the
 *       file back in chunks. This is the size of that read buffer.
 */
#define CFDP_R2_CRC_CHUNK_SIZE (1024)

/**
 *  @brief RX chunks per transaction
 *
 *  @par Description:
 *       Number of (offset, size) ranges a class 2 receiver tracks to find
 *       gaps in received file data. When the list is full the smallest
 *       range is dropped, which at worst causes data to be re-requested.
 */
#define CFDP_NUM_RX_CHUNKS_PER_TRANSACTION (CFDP_NAK_MAX_SEGMENTS)

/**
 *  @brief TX chunks per transaction
 *
 *  @par Description:
 *       Number of NAK-requested ranges a class 2 sender can queue for
 *       retransmission.
 */
#define CFDP_NUM_TX_CHUNKS_PER_TRANSACTION (CFDP_NAK_MAX_SEGMENTS)

/**
 *  @brief Maximum filename length carried in a Metadata PDU
 *
 *  @par Limits:
 *       255 is the most an LV length byte can express.
 */
#define CFDP_FILENAME_MAX_LEN (255)

/**
 *  @brief Maximum encoded PDU size
 *
 *  @par Description:
 *       Upper bound on the size of any PDU built by this entity. File data
 *       segments are clamped so header, offset and data fit.
 */
#define CFDP_MAX_PDU_SIZE (1024)

// ==================================================================
// Resource Configuration
// ==================================================================

/**
 *  @brief Number of histories
 *
 *  @par Description:
 *       The daemon keeps the final report of every reaped transaction in a
 *       circular history. This is the maximum number of entries kept; the
 *       oldest entry is evicted first.
 */
#define CFDP_NUM_HISTORIES (256)

/**
 *  @brief Depth of each transport's outbound queue
 *
 *  @par Description:
 *       A transaction whose PDU finds the queue full keeps it pending and
 *       retries on a later cycle, which throttles file data to the pace of
 *       the medium.
 */
#define CFDP_TRANSPORT_QUEUE_DEPTH (256)

/**
 *  @brief Backoff after an outbound queue was found full, in milliseconds
 */
#define CFDP_SEND_RETRY_BACKOFF_MS (2)

/**
 *  @brief Longest wait for inbound data in one transport loop iteration, in milliseconds
 *
 *  @par Description:
 *       Bounds how long a pending outbound PDU or a shutdown request can go
 *       unnoticed. Must not exceed 1000.
 */
#define CFDP_TRANSPORT_RECV_TIMEOUT_MS (10)

/**
 *  @brief Sleep between empty polls of a byte-stream transport, in milliseconds
 */
#define CFDP_TRANSPORT_IDLE_SLEEP_MS (1)

/**
 *  @brief Longest gap between bytes of one frame on a byte-stream transport, in milliseconds
 *
 *  @par Description:
 *       A frame that stalls longer than this is dropped and the transport
 *       looks for a new header.
 */
#define CFDP_SERIAL_FRAME_TIMEOUT_MS (500)

// ==================================================================
// Parameter Defaults
// ==================================================================

//! Default ACK timer in milliseconds
#define CFDP_DEFAULT_ACK_TIMER_MS (1000)

//! Default inactivity timer in milliseconds
#define CFDP_DEFAULT_INACTIVITY_TIMER_MS (30000)

//! Default number of ACK timer expirations before POS_ACK_LIMIT_REACHED
#define CFDP_DEFAULT_ACK_LIMIT (4)

//! Default number of NAKs sent without progress before NAK_LIMIT_REACHED
#define CFDP_DEFAULT_NAK_LIMIT (4)

//! Default file data segment size in bytes
#define CFDP_DEFAULT_OUTGOING_FILE_CHUNK_SIZE (512)

//! Default number of PDUs a transaction sends before checking its mailbox
#define CFDP_DEFAULT_MAX_PDUS_PER_CYCLE (32)

//! Default transport receive buffer size
#define CFDP_DEFAULT_TRANSPORT_BUFFER_SIZE (CFDP_MAX_PDU_SIZE * 4)

// ==================================================================
// Miscellaneous
// ==================================================================

/**
 * @brief Macro type for Entity id that is used in printf style formatting
 *
 * @note This must match the size of EntityId
 */
#define CFDP_PRI_ENTITY_ID PRIu32

/**
 * @brief Macro type for transaction sequences that is used in printf style formatting
 *
 * @note This must match the size of TransactionSeq
 */
#define CFDP_PRI_TRANSACTION_SEQ PRIu32

/**
 * @brief Macro type for file sizes and offsets that is used in printf style formatting
 */
#define CFDP_PRI_FILE_SIZE PRIu32

}  // namespace Cfdp
}  // namespace Ccsds
}  // namespace Cfdpd

#endif  // Cfdpd_Config_CfdpCfg_HPP

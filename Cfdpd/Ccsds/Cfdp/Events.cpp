// ======================================================================
// \title  Events.cpp
// \author campuzan
// \brief  cpp file for the cfdpd event catalogue
// ======================================================================

#include <Cfdpd/Ccsds/Cfdp/Events.hpp>
#include <Cfdpd/Ccsds/Cfdp/Utils.hpp>

namespace Cfdpd {
namespace Ccsds {
namespace Cfdp {

namespace {

// Class number as written in events (1 or 2)
U32 classNum(Class::T cls) {
    return (cls == Class::CLASS_1) ? 1U : 2U;
}

const char* statusName(Status::T status) {
    switch (status) {
        case Status::SUCCESS:
            return "SUCCESS";
        case Status::SEND_PDU_ERROR:
            return "SEND_PDU_ERROR";
        case Status::NO_ROUTE:
            return "NO_ROUTE";
        case Status::REC_PDU_FSIZE_MISMATCH_ERROR:
            return "REC_PDU_FSIZE_MISMATCH_ERROR";
        case Status::REC_PDU_BAD_EOF_ERROR:
            return "REC_PDU_BAD_EOF_ERROR";
        default:
            return "ERROR";
    }
}

}  // namespace

// ----------------------------------------------------------------------
// Transaction lifecycle
// ----------------------------------------------------------------------

void Events::log_ACTIVITY_HI_TxFileStarted(Class::T cls, EntityId srcEid, TransactionSeq seq,
                                           const std::string& srcFile, const std::string& dstFile,
                                           EntityId destEid, FileSize size) const {
    Log::Logger::log(Log::ACTIVITY_HI, this->m_component,
                     "CF S%" PRIu32 "(%" CFDP_PRI_ENTITY_ID ":%" CFDP_PRI_TRANSACTION_SEQ
                     "): sending %s (%" CFDP_PRI_FILE_SIZE " bytes) to %" CFDP_PRI_ENTITY_ID ":%s",
                     classNum(cls), srcEid, seq, srcFile.c_str(), size, destEid, dstFile.c_str());
}

void Events::log_ACTIVITY_HI_RxFileStarted(Class::T cls, EntityId srcEid, TransactionSeq seq,
                                           const std::string& srcFile, const std::string& dstFile,
                                           FileSize size) const {
    Log::Logger::log(Log::ACTIVITY_HI, this->m_component,
                     "CF R%" PRIu32 "(%" CFDP_PRI_ENTITY_ID ":%" CFDP_PRI_TRANSACTION_SEQ
                     "): receiving %s as %s (%" CFDP_PRI_FILE_SIZE " bytes)",
                     classNum(cls), srcEid, seq, srcFile.c_str(), dstFile.c_str(), size);
}

void Events::log_ACTIVITY_HI_TransactionFinished(Direction role, Class::T cls, EntityId srcEid,
                                                 TransactionSeq seq, TxnStatus status) const {
    Log::Logger::log(Log::ACTIVITY_HI, this->m_component,
                     "CF %c%" PRIu32 "(%" CFDP_PRI_ENTITY_ID ":%" CFDP_PRI_TRANSACTION_SEQ
                     "): finished, status %s, condition %s",
                     (role == DIRECTION_TX) ? 'S' : 'R', classNum(cls), srcEid, seq, TxnStatusName(status),
                     ConditionCodeName(TxnStatusToConditionCode(status)));
}

void Events::log_ACTIVITY_LO_TransactionClosed(EntityId srcEid, TransactionSeq seq) const {
    Log::Logger::log(Log::ACTIVITY_LO, this->m_component,
                     "CF (%" CFDP_PRI_ENTITY_ID ":%" CFDP_PRI_TRANSACTION_SEQ "): closed", srcEid, seq);
}

void Events::log_COMMAND_TransactionCommand(EntityId srcEid, TransactionSeq seq, const char* command) const {
    Log::Logger::log(Log::COMMAND, this->m_component,
                     "CF (%" CFDP_PRI_ENTITY_ID ":%" CFDP_PRI_TRANSACTION_SEQ "): %s command accepted", srcEid,
                     seq, command);
}

// ----------------------------------------------------------------------
// Sender faults
// ----------------------------------------------------------------------

void Events::log_WARNING_HI_TxFileOpenFailed(Class::T cls, EntityId srcEid, TransactionSeq seq,
                                             const std::string& file, Filestore::Status status) const {
    Log::Logger::log(Log::WARNING_HI, this->m_component,
                     "CF S%" PRIu32 "(%" CFDP_PRI_ENTITY_ID ":%" CFDP_PRI_TRANSACTION_SEQ
                     "): failed to open file %s, status %s",
                     classNum(cls), srcEid, seq, file.c_str(), Filestore::statusName(status));
}

void Events::log_WARNING_HI_TxFileReadFailed(Class::T cls, EntityId srcEid, TransactionSeq seq,
                                             FileSize offset, Filestore::Status status) const {
    Log::Logger::log(Log::WARNING_HI, this->m_component,
                     "CF S%" PRIu32 "(%" CFDP_PRI_ENTITY_ID ":%" CFDP_PRI_TRANSACTION_SEQ
                     "): error reading at offset %" CFDP_PRI_FILE_SIZE ", status %s",
                     classNum(cls), srcEid, seq, offset, Filestore::statusName(status));
}

void Events::log_WARNING_HI_TxSendMetadataFailed(Class::T cls, EntityId srcEid, TransactionSeq seq,
                                                 Status::T status) const {
    Log::Logger::log(Log::WARNING_HI, this->m_component,
                     "CF S%" PRIu32 "(%" CFDP_PRI_ENTITY_ID ":%" CFDP_PRI_TRANSACTION_SEQ
                     "): failed to send md, status %s",
                     classNum(cls), srcEid, seq, statusName(status));
}

void Events::log_WARNING_HI_TxAckLimitReached(Class::T cls, EntityId srcEid, TransactionSeq seq) const {
    Log::Logger::log(Log::WARNING_HI, this->m_component,
                     "CF S%" PRIu32 "(%" CFDP_PRI_ENTITY_ID ":%" CFDP_PRI_TRANSACTION_SEQ "): ack limit reached, no eof-ack",
                     classNum(cls), srcEid, seq);
}

void Events::log_WARNING_HI_TxInactivityTimeout(Class::T cls, EntityId srcEid, TransactionSeq seq) const {
    Log::Logger::log(Log::WARNING_HI, this->m_component,
                     "CF S%" PRIu32 "(%" CFDP_PRI_ENTITY_ID ":%" CFDP_PRI_TRANSACTION_SEQ "): inactivity timer expired",
                     classNum(cls), srcEid, seq);
}

void Events::log_WARNING_HI_TxEarlyFinReceived(Class::T cls, EntityId srcEid, TransactionSeq seq) const {
    Log::Logger::log(Log::WARNING_HI, this->m_component,
                     "CF S%" PRIu32 "(%" CFDP_PRI_ENTITY_ID ":%" CFDP_PRI_TRANSACTION_SEQ "): got early FIN, cancelling",
                     classNum(cls), srcEid, seq);
}

void Events::log_WARNING_LO_TxInvalidSegmentRequests(Class::T cls, EntityId srcEid, TransactionSeq seq,
                                                     U32 count) const {
    Log::Logger::log(Log::WARNING_LO, this->m_component,
                     "CF S%" PRIu32 "(%" CFDP_PRI_ENTITY_ID ":%" CFDP_PRI_TRANSACTION_SEQ
                     "): received %" PRIu32 " invalid NAK segment requests",
                     classNum(cls), srcEid, seq, count);
}

void Events::log_WARNING_LO_TxNonFileDirectivePduReceived(Class::T cls, EntityId srcEid,
                                                          TransactionSeq seq) const {
    Log::Logger::log(Log::WARNING_LO, this->m_component,
                     "CF S%" PRIu32 "(%" CFDP_PRI_ENTITY_ID ":%" CFDP_PRI_TRANSACTION_SEQ
                     "): received non-file directive pdu",
                     classNum(cls), srcEid, seq);
}

void Events::log_ACTIVITY_LO_TxMetadataResent(Class::T cls, EntityId srcEid, TransactionSeq seq) const {
    Log::Logger::log(Log::ACTIVITY_LO, this->m_component,
                     "CF S%" PRIu32 "(%" CFDP_PRI_ENTITY_ID ":%" CFDP_PRI_TRANSACTION_SEQ "): resending md",
                     classNum(cls), srcEid, seq);
}

void Events::log_WARNING_LO_TxTooManyOptions(Class::T cls, EntityId srcEid, TransactionSeq seq,
                                             U32 dropped) const {
    Log::Logger::log(Log::WARNING_LO, this->m_component,
                     "CF S%" PRIu32 "(%" CFDP_PRI_ENTITY_ID ":%" CFDP_PRI_TRANSACTION_SEQ
                     "): %" PRIu32 " md options did not fit and were dropped",
                     classNum(cls), srcEid, seq, dropped);
}

// ----------------------------------------------------------------------
// Receiver faults
// ----------------------------------------------------------------------

void Events::log_WARNING_HI_RxFileCreateFailed(Class::T cls, EntityId srcEid, TransactionSeq seq,
                                               const std::string& file, Filestore::Status status) const {
    Log::Logger::log(Log::WARNING_HI, this->m_component,
                     "CF R%" PRIu32 "(%" CFDP_PRI_ENTITY_ID ":%" CFDP_PRI_TRANSACTION_SEQ
                     "): failed to create file %s, status %s",
                     classNum(cls), srcEid, seq, file.c_str(), Filestore::statusName(status));
}

void Events::log_WARNING_HI_RxWriteFailed(Class::T cls, EntityId srcEid, TransactionSeq seq, FileSize offset,
                                          U32 size, Filestore::Status status) const {
    Log::Logger::log(Log::WARNING_HI, this->m_component,
                     "CF R%" PRIu32 "(%" CFDP_PRI_ENTITY_ID ":%" CFDP_PRI_TRANSACTION_SEQ
                     "): failed to write %" PRIu32 " bytes at offset %" CFDP_PRI_FILE_SIZE ", status %s",
                     classNum(cls), srcEid, seq, size, offset, Filestore::statusName(status));
}

void Events::log_WARNING_HI_RxReadCrcFailed(Class::T cls, EntityId srcEid, TransactionSeq seq, FileSize offset,
                                            Filestore::Status status) const {
    Log::Logger::log(Log::WARNING_HI, this->m_component,
                     "CF R%" PRIu32 "(%" CFDP_PRI_ENTITY_ID ":%" CFDP_PRI_TRANSACTION_SEQ
                     "): failed to read file at offset %" CFDP_PRI_FILE_SIZE " for crc, status %s",
                     classNum(cls), srcEid, seq, offset, Filestore::statusName(status));
}

void Events::log_WARNING_HI_RxCrcMismatch(Class::T cls, EntityId srcEid, TransactionSeq seq, U32 expected,
                                          U32 computed) const {
    Log::Logger::log(Log::WARNING_HI, this->m_component,
                     "CF R%" PRIu32 "(%" CFDP_PRI_ENTITY_ID ":%" CFDP_PRI_TRANSACTION_SEQ
                     "): crc mismatch for R trans. got 0x%08" PRIx32 " expected 0x%08" PRIx32,
                     classNum(cls), srcEid, seq, computed, expected);
}

void Events::log_WARNING_HI_RxFileSizeMismatch(Class::T cls, EntityId srcEid, TransactionSeq seq,
                                               FileSize expected, FileSize received) const {
    Log::Logger::log(Log::WARNING_HI, this->m_component,
                     "CF R%" PRIu32 "(%" CFDP_PRI_ENTITY_ID ":%" CFDP_PRI_TRANSACTION_SEQ
                     "): eof file size %" CFDP_PRI_FILE_SIZE " does not match md size %" CFDP_PRI_FILE_SIZE,
                     classNum(cls), srcEid, seq, received, expected);
}

void Events::log_WARNING_HI_RxNakLimitReached(Class::T cls, EntityId srcEid, TransactionSeq seq) const {
    Log::Logger::log(Log::WARNING_HI, this->m_component,
                     "CF R%" PRIu32 "(%" CFDP_PRI_ENTITY_ID ":%" CFDP_PRI_TRANSACTION_SEQ "): nak limit reached",
                     classNum(cls), srcEid, seq);
}

void Events::log_WARNING_HI_RxAckLimitReached(Class::T cls, EntityId srcEid, TransactionSeq seq) const {
    Log::Logger::log(Log::WARNING_HI, this->m_component,
                     "CF R%" PRIu32 "(%" CFDP_PRI_ENTITY_ID ":%" CFDP_PRI_TRANSACTION_SEQ "): ack limit reached, no fin-ack",
                     classNum(cls), srcEid, seq);
}

void Events::log_WARNING_HI_RxInactivityTimeout(Class::T cls, EntityId srcEid, TransactionSeq seq) const {
    Log::Logger::log(Log::WARNING_HI, this->m_component,
                     "CF R%" PRIu32 "(%" CFDP_PRI_ENTITY_ID ":%" CFDP_PRI_TRANSACTION_SEQ "): inactivity timer expired",
                     classNum(cls), srcEid, seq);
}

void Events::log_WARNING_LO_RxInvalidFileData(Class::T cls, EntityId srcEid, TransactionSeq seq,
                                              FileSize offset) const {
    Log::Logger::log(Log::WARNING_LO, this->m_component,
                     "CF R%" PRIu32 "(%" CFDP_PRI_ENTITY_ID ":%" CFDP_PRI_TRANSACTION_SEQ
                     "): rejected file data at offset %" CFDP_PRI_FILE_SIZE,
                     classNum(cls), srcEid, seq, offset);
}

void Events::log_WARNING_LO_RxInvalidOption(Class::T cls, EntityId srcEid, TransactionSeq seq, U8 tlvType) const {
    Log::Logger::log(Log::WARNING_LO, this->m_component,
                     "CF R%" PRIu32 "(%" CFDP_PRI_ENTITY_ID ":%" CFDP_PRI_TRANSACTION_SEQ
                     "): ignoring malformed md option of type %u",
                     classNum(cls), srcEid, seq, static_cast<unsigned>(tlvType));
}

void Events::log_WARNING_LO_RxInvalidDirectiveCode(Class::T cls, EntityId srcEid, TransactionSeq seq,
                                                   U8 directive) const {
    Log::Logger::log(Log::WARNING_LO, this->m_component,
                     "CF R%" PRIu32 "(%" CFDP_PRI_ENTITY_ID ":%" CFDP_PRI_TRANSACTION_SEQ
                     "): received pdu with invalid directive code %u",
                     classNum(cls), srcEid, seq, static_cast<unsigned>(directive));
}

// ----------------------------------------------------------------------
// PDU traffic
// ----------------------------------------------------------------------

void Events::log_DIAGNOSTIC_PduSent(const TransactionId& id, const char* type, EntityId destEid) const {
    Log::Logger::log(Log::DIAGNOSTIC, this->m_component, "CF (%s): sent %s to %" CFDP_PRI_ENTITY_ID,
                     id.toString().c_str(), type, destEid);
}

void Events::log_DIAGNOSTIC_PduReceived(const TransactionId& id, const char* type) const {
    Log::Logger::log(Log::DIAGNOSTIC, this->m_component, "CF (%s): received %s", id.toString().c_str(), type);
}

void Events::log_WARNING_LO_PduSendFailed(const TransactionId& id, const char* type, Status::T status) const {
    Log::Logger::log(Log::WARNING_LO, this->m_component, "CF (%s): could not send %s, status %s",
                     id.toString().c_str(), type, statusName(status));
}

// ----------------------------------------------------------------------
// Daemon
// ----------------------------------------------------------------------

void Events::log_ACTIVITY_HI_DaemonStarted(EntityId localEid, U32 transports) const {
    Log::Logger::log(Log::ACTIVITY_HI, this->m_component,
                     "entity %" CFDP_PRI_ENTITY_ID " started with %" PRIu32 " transport(s)", localEid, transports);
}

void Events::log_ACTIVITY_HI_DaemonStopped(EntityId localEid) const {
    Log::Logger::log(Log::ACTIVITY_HI, this->m_component, "entity %" CFDP_PRI_ENTITY_ID " stopped", localEid);
}

void Events::log_ACTIVITY_LO_ReceiverSpawned(const TransactionId& id, Class::T cls) const {
    Log::Logger::log(Log::ACTIVITY_LO, this->m_component, "spawned class %" PRIu32 " receiver for %s",
                     classNum(cls), id.toString().c_str());
}

void Events::log_WARNING_LO_UnroutablePdu(const TransactionId& id, const char* type, EntityId destEid) const {
    Log::Logger::log(Log::WARNING_LO, this->m_component,
                     "dropping unroutable %s for transaction %s, destination %" CFDP_PRI_ENTITY_ID, type,
                     id.toString().c_str(), destEid);
}

void Events::log_WARNING_LO_NoRoute(const TransactionId& id, EntityId destEid) const {
    Log::Logger::log(Log::WARNING_LO, this->m_component,
                     "no transport serves entity %" CFDP_PRI_ENTITY_ID " for transaction %s", destEid,
                     id.toString().c_str());
}

void Events::log_WARNING_HI_SpawnSendFailed(const TransactionId& id, const std::string& description) const {
    Log::Logger::log(Log::WARNING_HI, this->m_component, "could not start transaction %s: %s",
                     id.toString().c_str(), description.c_str());
}

void Events::log_WARNING_LO_CommandDeliveryFailed(const std::string& description) const {
    Log::Logger::log(Log::WARNING_LO, this->m_component, "%s", description.c_str());
}

void Events::log_WARNING_HI_TransportDown(U32 index, const char* status) const {
    Log::Logger::log(Log::WARNING_HI, this->m_component, "transport %" PRIu32 " stopped with status %s", index,
                     status);
}

void Events::log_WARNING_LO_OutboundQueueOverflow(EntityId destEid) const {
    Log::Logger::log(Log::WARNING_LO, this->m_component,
                     "outbound queue toward entity %" CFDP_PRI_ENTITY_ID " is full", destEid);
}

// ----------------------------------------------------------------------
// Transports
// ----------------------------------------------------------------------

void Events::log_WARNING_LO_PduDecodeFailed(U32 length, SerializeStatus status) const {
    Log::Logger::log(Log::WARNING_LO, this->m_component, "dropping %" PRIu32 " bytes that failed to decode (%d)",
                     length, static_cast<int>(status));
}

void Events::log_WARNING_LO_PduEncodeFailed(const char* type, SerializeStatus status) const {
    Log::Logger::log(Log::WARNING_LO, this->m_component, "failed to encode %s (%d)", type,
                     static_cast<int>(status));
}

void Events::log_WARNING_LO_TransportSendFailed(EntityId destEid, const char* status, int error) const {
    Log::Logger::log(Log::WARNING_LO, this->m_component,
                     "send to entity %" CFDP_PRI_ENTITY_ID " failed with %s (errno %d)", destEid, status, error);
}

void Events::log_WARNING_HI_TransportReceiveFailed(int error) const {
    Log::Logger::log(Log::WARNING_HI, this->m_component, "receive failed (errno %d)", error);
}

void Events::log_WARNING_LO_TransportFrameStalled(U32 received, U32 expected) const {
    Log::Logger::log(Log::WARNING_LO, this->m_component,
                     "dropping partial frame of %" PRIu32 " of %" PRIu32 " bytes after the line went quiet", received,
                     expected);
}

void Events::log_WARNING_LO_TransportNoRoute(EntityId destEid) const {
    Log::Logger::log(Log::WARNING_LO, this->m_component, "no address for entity %" CFDP_PRI_ENTITY_ID, destEid);
}

void Events::log_ACTIVITY_LO_TransportStopped(const char* status) const {
    Log::Logger::log(Log::ACTIVITY_LO, this->m_component, "pdu handler exiting with %s", status);
}

// ----------------------------------------------------------------------
// Configuration
// ----------------------------------------------------------------------

void Events::log_WARNING_HI_ConfigOpenFailed(const std::string& path) const {
    Log::Logger::log(Log::WARNING_HI, this->m_component, "cannot open configuration file %s", path.c_str());
}

void Events::log_WARNING_HI_ConfigParseError(const std::string& path, U32 line, const std::string& text) const {
    Log::Logger::log(Log::WARNING_HI, this->m_component, "%s:%" PRIu32 ": cannot parse \"%s\"", path.c_str(), line,
                     text.c_str());
}

}  // namespace Cfdp
}  // namespace Ccsds
}  // namespace Cfdpd

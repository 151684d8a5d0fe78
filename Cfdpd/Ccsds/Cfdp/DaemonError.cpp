// ======================================================================
// \title  DaemonError.cpp
// \author campuzan
// \brief  cpp file for the errors the daemon reports to its user
// ======================================================================

#include <Cfdpd/Ccsds/Cfdp/DaemonError.hpp>

namespace Cfdpd {
namespace Ccsds {
namespace Cfdp {

DaemonError::DaemonError()
    : m_kind(NONE), m_id(), m_filestoreStatus(Filestore::OP_OK), m_command(Command::ABANDON) {}

DaemonError DaemonError::spawnSend(const TransactionId& id, Filestore::Status status) {
    DaemonError error;
    error.m_kind = SPAWN_SEND;
    error.m_id = id;
    error.m_filestoreStatus = status;
    return error;
}

DaemonError DaemonError::transactionCommunication(const TransactionId& id, Command::Kind command) {
    DaemonError error;
    error.m_kind = TRANSACTION_COMMUNICATION;
    error.m_id = id;
    error.m_command = command;
    return error;
}

DaemonError DaemonError::unknownTransaction(const TransactionId& id) {
    DaemonError error;
    error.m_kind = UNKNOWN_TRANSACTION;
    error.m_id = id;
    return error;
}

std::string DaemonError::describe() const {
    switch (this->m_kind) {
        case NONE:
            return "no error";
        case SPAWN_SEND:
            return "cannot spawn sender " + this->m_id.toString() + ": filestore returned " +
                   Filestore::statusName(this->m_filestoreStatus);
        case TRANSACTION_COMMUNICATION:
            return std::string("cannot deliver ") + commandKindName(this->m_command) + " to transaction " +
                   this->m_id.toString();
        case UNKNOWN_TRANSACTION:
            return "unknown transaction " + this->m_id.toString();
        default:
            return "invalid daemon error";
    }
}

}  // namespace Cfdp
}  // namespace Ccsds
}  // namespace Cfdpd

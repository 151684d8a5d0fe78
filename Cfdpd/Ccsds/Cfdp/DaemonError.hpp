// ======================================================================
// \title  DaemonError.hpp
// \author campuzan
// \brief  hpp file for the errors the daemon reports to its user
// ======================================================================

#ifndef Cfdpd_Ccsds_Cfdp_DaemonError_HPP
#define Cfdpd_Ccsds_Cfdp_DaemonError_HPP

#include <string>

#include <Cfdpd/Ccsds/Cfdp/Command.hpp>
#include <Cfdpd/Ccsds/Cfdp/Types/Types.hpp>
#include <Cfdpd/Filestore/Filestore.hpp>

namespace Cfdpd {
namespace Ccsds {
namespace Cfdp {

//! Outcome of a daemon operation on behalf of the user
class DaemonError {
  public:
    enum Kind : U8 {
        NONE,                       //!< No error
        SPAWN_SEND,                 //!< The source of a put could not be opened
        TRANSACTION_COMMUNICATION,  //!< The transaction no longer reads commands
        UNKNOWN_TRANSACTION         //!< The daemon never saw this transaction
    };

    DaemonError();

    static DaemonError spawnSend(const TransactionId& id, Filestore::Status status);
    static DaemonError transactionCommunication(const TransactionId& id, Command::Kind command);
    static DaemonError unknownTransaction(const TransactionId& id);

    Kind getKind() const { return this->m_kind; }
    bool isError() const { return this->m_kind != NONE; }
    const TransactionId& getTransactionId() const { return this->m_id; }

    //! SPAWN_SEND only
    Filestore::Status getFilestoreStatus() const { return this->m_filestoreStatus; }

    //! TRANSACTION_COMMUNICATION only
    Command::Kind getCommand() const { return this->m_command; }

    //! One line describing the error
    std::string describe() const;

  private:
    Kind m_kind;
    TransactionId m_id;
    Filestore::Status m_filestoreStatus;
    Command::Kind m_command;
};

}  // namespace Cfdp
}  // namespace Ccsds
}  // namespace Cfdpd

#endif  // Cfdpd_Ccsds_Cfdp_DaemonError_HPP

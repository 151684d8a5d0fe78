// ======================================================================
// \title  UserTypes.hpp
// \author campuzan
// \brief  hpp file for the types exchanged with the CFDP user
// ======================================================================

#ifndef Cfdpd_Ccsds_Cfdp_UserTypes_HPP
#define Cfdpd_Ccsds_Cfdp_UserTypes_HPP

#include <string>
#include <vector>

#include <Cfdpd/Ccsds/Cfdp/Types/Types.hpp>

namespace Cfdpd {
namespace Ccsds {
namespace Cfdp {

// CFDP Filestore Request action codes
// Blue Book section 5.4.1.1, table 5-16
enum FilestoreAction : U8 {
    FILESTORE_ACTION_CREATE_FILE = 0,
    FILESTORE_ACTION_DELETE_FILE = 1,
    FILESTORE_ACTION_RENAME_FILE = 2,
    FILESTORE_ACTION_APPEND_FILE = 3,
    FILESTORE_ACTION_REPLACE_FILE = 4,
    FILESTORE_ACTION_CREATE_DIRECTORY = 5,
    FILESTORE_ACTION_REMOVE_DIRECTORY = 6,
    FILESTORE_ACTION_DENY_FILE = 7,
    FILESTORE_ACTION_DENY_DIRECTORY = 8
};

//! A filestore request carried to the receiving entity in Metadata
struct FilestoreRequest
{
    FilestoreAction action;
    std::string firstFileName;
    std::string secondFileName;  //!< Only for rename, append and replace

    FilestoreRequest() : action(FILESTORE_ACTION_CREATE_FILE) {}
    FilestoreRequest(FilestoreAction act, const std::string& first, const std::string& second = std::string())
        : action(act), firstFileName(first), secondFileName(second) {}

    bool operator==(const FilestoreRequest& other) const {
        return this->action == other.action && this->firstFileName == other.firstFileName &&
               this->secondFileName == other.secondFileName;
    }
};

//! A request to send one file
struct PutRequest
{
    std::string sourceFilename;  //!< Virtual path in the local filestore
    std::string destFilename;    //!< Virtual path in the remote filestore
    EntityId destEid;
    Class::T transmissionMode;
    std::vector<FilestoreRequest> filestoreRequests;
    std::vector<std::string> messagesToUser;

    PutRequest() : destEid(0), transmissionMode(Class::CLASS_2) {}
};

//! A point-in-time snapshot of one transaction
struct Report
{
    TransactionId id;
    Direction role;
    Class::T mode;
    TxnState state;
    ConditionCode condition;
    TxnStatus status;           //!< Raw status, a superset of the condition
    FileSize fileSize;
    FileSize bytesProgressed;   //!< Bytes sent or received so far
    std::string sourceFilename;
    std::string destFilename;
    FinFileStatus fileStatus;   //!< Disposition of the destination file (receiver)
    std::vector<FilestoreRequest> filestoreRequests;  //!< As carried in Metadata
    std::vector<std::string> messagesToUser;          //!< As carried in Metadata
    bool finished;              //!< No further protocol exchange will happen

    Report()
        : role(DIRECTION_TX),
          mode(Class::CLASS_2),
          state(TXN_STATE_UNDEF),
          condition(CONDITION_CODE_NO_ERROR),
          status(TXN_STATUS_UNDEFINED),
          fileSize(0),
          bytesProgressed(0),
          fileStatus(FIN_FILE_STATUS_UNREPORTED),
          finished(false) {}
};

}  // namespace Cfdp
}  // namespace Ccsds
}  // namespace Cfdpd

#endif  // Cfdpd_Ccsds_Cfdp_UserTypes_HPP

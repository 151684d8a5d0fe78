// ======================================================================
// \title  Command.cpp
// \author campuzan
// \brief  cpp file for the messages the daemon sends to a transaction
// ======================================================================

#include <Cfdpd/Ccsds/Cfdp/Command.hpp>

namespace Cfdpd {
namespace Ccsds {
namespace Cfdp {

const char* commandKindName(Command::Kind kind) {
    switch (kind) {
        case Command::DELIVER_PDU:
            return "DeliverPdu";
        case Command::CANCEL:
            return "Cancel";
        case Command::SUSPEND:
            return "Suspend";
        case Command::RESUME:
            return "Resume";
        case Command::REPORT_REQUEST:
            return "ReportRequest";
        case Command::ABANDON:
            return "Abandon";
        default:
            return "Unknown";
    }
}

}  // namespace Cfdp
}  // namespace Ccsds
}  // namespace Cfdpd

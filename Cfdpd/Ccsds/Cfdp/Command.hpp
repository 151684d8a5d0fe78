// ======================================================================
// \title  Command.hpp
// \author campuzan
// \brief  hpp file for the messages the daemon sends to a transaction
// ======================================================================

#ifndef Cfdpd_Ccsds_Cfdp_Command_HPP
#define Cfdpd_Ccsds_Cfdp_Command_HPP

#include <future>
#include <memory>

#include <Cfdpd/Ccsds/Cfdp/Types/Pdu.hpp>
#include <Cfdpd/Ccsds/Cfdp/Types/UserTypes.hpp>

namespace Cfdpd {
namespace Ccsds {
namespace Cfdp {

//! A message in a transaction's mailbox
struct Command {
    enum Kind : U8 {
        DELIVER_PDU,     //!< Apply an inbound PDU
        CANCEL,          //!< Cancel the transfer
        SUSPEND,         //!< Freeze timers and sending
        RESUME,          //!< Undo a suspend
        REPORT_REQUEST,  //!< Reply with a Report through the promise
        ABANDON          //!< Stop now, without any protocol exchange
    };

    typedef std::shared_ptr<std::promise<Report> > ReportPromise;

    Kind kind;
    Pdu pdu;              //!< DELIVER_PDU only
    ReportPromise reply;  //!< REPORT_REQUEST only

    Command() : kind(ABANDON) {}
    explicit Command(Kind k) : kind(k) {}

    static Command deliverPdu(const Pdu& pdu) {
        Command cmd(DELIVER_PDU);
        cmd.pdu = pdu;
        return cmd;
    }

    static Command reportRequest(const ReportPromise& promise) {
        Command cmd(REPORT_REQUEST);
        cmd.reply = promise;
        return cmd;
    }
};

//! Name of a command kind
const char* commandKindName(Command::Kind kind);

}  // namespace Cfdp
}  // namespace Ccsds
}  // namespace Cfdpd

#endif  // Cfdpd_Ccsds_Cfdp_Command_HPP

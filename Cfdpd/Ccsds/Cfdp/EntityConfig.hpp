// ======================================================================
// \title  EntityConfig.hpp
// \author campuzan
// \brief  hpp file for the runtime parameters of a CFDP entity
// ======================================================================

#ifndef Cfdpd_Ccsds_Cfdp_EntityConfig_HPP
#define Cfdpd_Ccsds_Cfdp_EntityConfig_HPP

#include <Cfdpd/Types/BasicTypes.hpp>
#include <Cfdpd/Ccsds/Cfdp/Types/Types.hpp>
#include <config/CfdpCfg.hpp>

namespace Cfdpd {
namespace Ccsds {
namespace Cfdp {

//! Protocol parameters shared by every transaction of one entity
struct EntityConfig {
    EntityId localEid;          //!< Entity ID of this endpoint
    U32 ackTimerMs;             //!< ACK timer duration
    U32 inactivityTimerMs;      //!< Inactivity timer duration
    U8 ackLimit;                //!< ACK timer expirations before giving up
    U8 nakLimit;                //!< NAKs without progress before giving up
    U16 outgoingFileChunkSize;  //!< Largest file data segment this entity sends
    U32 maxPdusPerCycle;        //!< PDUs a transaction sends between mailbox checks

    EntityConfig()
        : localEid(0),
          ackTimerMs(CFDP_DEFAULT_ACK_TIMER_MS),
          inactivityTimerMs(CFDP_DEFAULT_INACTIVITY_TIMER_MS),
          ackLimit(CFDP_DEFAULT_ACK_LIMIT),
          nakLimit(CFDP_DEFAULT_NAK_LIMIT),
          outgoingFileChunkSize(CFDP_DEFAULT_OUTGOING_FILE_CHUNK_SIZE),
          maxPdusPerCycle(CFDP_DEFAULT_MAX_PDUS_PER_CYCLE) {}
};

}  // namespace Cfdp
}  // namespace Ccsds
}  // namespace Cfdpd

#endif  // Cfdpd_Ccsds_Cfdp_EntityConfig_HPP

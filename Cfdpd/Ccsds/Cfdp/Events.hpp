// ======================================================================
// \title  Events.hpp
// \author campuzan
// \brief  hpp file for the cfdpd event catalogue
//
// Every event the daemon, its transactions and its transports emit is a
// named function here. Each one formats its arguments and hands the line
// to Log::Logger under the name of the emitting component.
// ======================================================================

#ifndef Cfdpd_Ccsds_Cfdp_Events_HPP
#define Cfdpd_Ccsds_Cfdp_Events_HPP

#include <Cfdpd/Types/BasicTypes.hpp>
#include <Cfdpd/Types/SerialBuffer.hpp>
#include <Cfdpd/Filestore/Filestore.hpp>
#include <Cfdpd/Log/Log.hpp>
#include <Cfdpd/Ccsds/Cfdp/Types/Types.hpp>

namespace Cfdpd {
namespace Ccsds {
namespace Cfdp {

class Events {
  public:
    //! \param component name printed with every event
    explicit Events(const char* component) : m_component(component) {}

    const char* getComponentName() const { return this->m_component; }

    // ----------------------------------------------------------------------
    // Transaction lifecycle
    // ----------------------------------------------------------------------

    void log_ACTIVITY_HI_TxFileStarted(Class::T cls, EntityId srcEid, TransactionSeq seq,
                                       const std::string& srcFile, const std::string& dstFile,
                                       EntityId destEid, FileSize size) const;
    void log_ACTIVITY_HI_RxFileStarted(Class::T cls, EntityId srcEid, TransactionSeq seq,
                                       const std::string& srcFile, const std::string& dstFile,
                                       FileSize size) const;
    void log_ACTIVITY_HI_TransactionFinished(Direction role, Class::T cls, EntityId srcEid,
                                             TransactionSeq seq, TxnStatus status) const;
    void log_ACTIVITY_LO_TransactionClosed(EntityId srcEid, TransactionSeq seq) const;
    void log_COMMAND_TransactionCommand(EntityId srcEid, TransactionSeq seq, const char* command) const;

    // ----------------------------------------------------------------------
    // Sender faults
    // ----------------------------------------------------------------------

    void log_WARNING_HI_TxFileOpenFailed(Class::T cls, EntityId srcEid, TransactionSeq seq,
                                         const std::string& file, Filestore::Status status) const;
    void log_WARNING_HI_TxFileReadFailed(Class::T cls, EntityId srcEid, TransactionSeq seq,
                                         FileSize offset, Filestore::Status status) const;
    void log_WARNING_HI_TxSendMetadataFailed(Class::T cls, EntityId srcEid, TransactionSeq seq,
                                             Status::T status) const;
    void log_WARNING_HI_TxAckLimitReached(Class::T cls, EntityId srcEid, TransactionSeq seq) const;
    void log_WARNING_HI_TxInactivityTimeout(Class::T cls, EntityId srcEid, TransactionSeq seq) const;
    void log_WARNING_HI_TxEarlyFinReceived(Class::T cls, EntityId srcEid, TransactionSeq seq) const;
    void log_WARNING_LO_TxInvalidSegmentRequests(Class::T cls, EntityId srcEid, TransactionSeq seq,
                                                 U32 count) const;
    void log_WARNING_LO_TxNonFileDirectivePduReceived(Class::T cls, EntityId srcEid, TransactionSeq seq) const;
    void log_ACTIVITY_LO_TxMetadataResent(Class::T cls, EntityId srcEid, TransactionSeq seq) const;
    void log_WARNING_LO_TxTooManyOptions(Class::T cls, EntityId srcEid, TransactionSeq seq, U32 dropped) const;

    // ----------------------------------------------------------------------
    // Receiver faults
    // ----------------------------------------------------------------------

    void log_WARNING_HI_RxFileCreateFailed(Class::T cls, EntityId srcEid, TransactionSeq seq,
                                           const std::string& file, Filestore::Status status) const;
    void log_WARNING_HI_RxWriteFailed(Class::T cls, EntityId srcEid, TransactionSeq seq, FileSize offset,
                                      U32 size, Filestore::Status status) const;
    void log_WARNING_HI_RxReadCrcFailed(Class::T cls, EntityId srcEid, TransactionSeq seq, FileSize offset,
                                        Filestore::Status status) const;
    void log_WARNING_HI_RxCrcMismatch(Class::T cls, EntityId srcEid, TransactionSeq seq, U32 expected,
                                      U32 computed) const;
    void log_WARNING_HI_RxFileSizeMismatch(Class::T cls, EntityId srcEid, TransactionSeq seq,
                                           FileSize expected, FileSize received) const;
    void log_WARNING_HI_RxNakLimitReached(Class::T cls, EntityId srcEid, TransactionSeq seq) const;
    void log_WARNING_HI_RxAckLimitReached(Class::T cls, EntityId srcEid, TransactionSeq seq) const;
    void log_WARNING_HI_RxInactivityTimeout(Class::T cls, EntityId srcEid, TransactionSeq seq) const;
    void log_WARNING_LO_RxInvalidFileData(Class::T cls, EntityId srcEid, TransactionSeq seq,
                                          FileSize offset) const;
    void log_WARNING_LO_RxInvalidOption(Class::T cls, EntityId srcEid, TransactionSeq seq, U8 tlvType) const;
    void log_WARNING_LO_RxInvalidDirectiveCode(Class::T cls, EntityId srcEid, TransactionSeq seq,
                                               U8 directive) const;

    // ----------------------------------------------------------------------
    // PDU traffic
    // ----------------------------------------------------------------------

    void log_DIAGNOSTIC_PduSent(const TransactionId& id, const char* type, EntityId destEid) const;
    void log_DIAGNOSTIC_PduReceived(const TransactionId& id, const char* type) const;
    void log_WARNING_LO_PduSendFailed(const TransactionId& id, const char* type, Status::T status) const;

    // ----------------------------------------------------------------------
    // Daemon
    // ----------------------------------------------------------------------

    void log_ACTIVITY_HI_DaemonStarted(EntityId localEid, U32 transports) const;
    void log_ACTIVITY_HI_DaemonStopped(EntityId localEid) const;
    void log_ACTIVITY_LO_ReceiverSpawned(const TransactionId& id, Class::T cls) const;
    void log_WARNING_LO_UnroutablePdu(const TransactionId& id, const char* type, EntityId destEid) const;
    void log_WARNING_LO_NoRoute(const TransactionId& id, EntityId destEid) const;
    void log_WARNING_HI_SpawnSendFailed(const TransactionId& id, const std::string& description) const;
    void log_WARNING_LO_CommandDeliveryFailed(const std::string& description) const;
    void log_WARNING_HI_TransportDown(U32 index, const char* status) const;
    void log_WARNING_LO_OutboundQueueOverflow(EntityId destEid) const;

    // ----------------------------------------------------------------------
    // Transports
    // ----------------------------------------------------------------------

    void log_WARNING_LO_PduDecodeFailed(U32 length, SerializeStatus status) const;
    void log_WARNING_LO_PduEncodeFailed(const char* type, SerializeStatus status) const;
    void log_WARNING_LO_TransportSendFailed(EntityId destEid, const char* status, int error) const;
    void log_WARNING_HI_TransportReceiveFailed(int error) const;
    void log_WARNING_LO_TransportFrameStalled(U32 received, U32 expected) const;
    void log_WARNING_LO_TransportNoRoute(EntityId destEid) const;
    void log_ACTIVITY_LO_TransportStopped(const char* status) const;

    // ----------------------------------------------------------------------
    // Configuration
    // ----------------------------------------------------------------------

    void log_WARNING_HI_ConfigOpenFailed(const std::string& path) const;
    void log_WARNING_HI_ConfigParseError(const std::string& path, U32 line, const std::string& text) const;

  private:
    const char* m_component;
};

}  // namespace Cfdp
}  // namespace Ccsds
}  // namespace Cfdpd

#endif  // Cfdpd_Ccsds_Cfdp_Events_HPP

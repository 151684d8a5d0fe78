// ======================================================================
// \title  Pdu.hpp
// \author campuzan
// \brief  hpp file for the CFDP PDU tagged value
//
// A Pdu holds exactly one decoded PDU of any kind. It is the unit that
// flows between transports, the daemon and transactions.
// ======================================================================

#ifndef Cfdpd_Ccsds_Cfdp_Pdu_HPP
#define Cfdpd_Ccsds_Cfdp_Pdu_HPP

#include <Cfdpd/Types/BasicTypes.hpp>
#include <Cfdpd/Types/SerialBuffer.hpp>
#include <Cfdpd/Ccsds/Cfdp/Types/PduHeader.hpp>
#include <Cfdpd/Ccsds/Cfdp/Types/PduBase.hpp>
#include <Cfdpd/Ccsds/Cfdp/Types/MetadataPdu.hpp>
#include <Cfdpd/Ccsds/Cfdp/Types/FileDataPdu.hpp>
#include <Cfdpd/Ccsds/Cfdp/Types/EofPdu.hpp>
#include <Cfdpd/Ccsds/Cfdp/Types/FinPdu.hpp>
#include <Cfdpd/Ccsds/Cfdp/Types/AckPdu.hpp>
#include <Cfdpd/Ccsds/Cfdp/Types/NakPdu.hpp>

namespace Cfdpd {
namespace Ccsds {
namespace Cfdp {

//! The type of a PDU of any kind
class Pdu {
  public:
    //! Construct an empty PDU (type T_NONE)
    Pdu() : m_type(T_NONE) {}

    //! Decode a complete encoded PDU
    //! Fails if the data is truncated, carries trailing bytes, or names an
    //! unsupported directive.
    SerializeStatus fromBuffer(const U8* data, FwSizeType length);

    //! Encode this PDU, filling in the header data length
    //! @param data Destination storage
    //! @param capacity Size of the destination storage
    //! @param length Set to the number of bytes written on success
    SerializeStatus toBuffer(U8* data, FwSizeType capacity, FwSizeType& length) const;

    //! Full encoded length of the PDU that starts with the given header prefix
    //! @param prefix At least PduHeader::FIXED_PREFIX_SIZE bytes
    static SerializeStatus getPduLength(const U8* prefix, FwSizeType& totalLength);

    //! Get the PDU type
    PduTypeEnum getType() const { return this->m_type; }

    //! Get the header of the held PDU
    const PduHeader& asHeader() const;

    //! Get the directive code, FILE_DIRECTIVE_INVALID_MAX for file data
    FileDirective getDirectiveCode() const;

    //! Get the transaction this PDU belongs to
    TransactionId getTransactionId() const { return this->asHeader().getTransactionId(); }

    //! Compute the encoded size
    U32 getBufferSize() const;

    const MetadataPdu& asMetadataPdu() const;
    const FileDataPdu& asFileDataPdu() const;
    const EofPdu& asEofPdu() const;
    const FinPdu& asFinPdu() const;
    const AckPdu& asAckPdu() const;
    const NakPdu& asNakPdu() const;

    //! Mutable accessors select the held kind
    MetadataPdu& asMetadataPdu();
    FileDataPdu& asFileDataPdu();
    EofPdu& asEofPdu();
    FinPdu& asFinPdu();
    AckPdu& asAckPdu();
    NakPdu& asNakPdu();

  private:
    //! The held PDU as its base class
    const PduBase& asBase() const;
    PduBase& asBase();

    PduTypeEnum m_type;
    MetadataPdu m_metadataPdu;
    FileDataPdu m_fileDataPdu;
    EofPdu m_eofPdu;
    FinPdu m_finPdu;
    AckPdu m_ackPdu;
    NakPdu m_nakPdu;
};

//! Human readable name of a PDU kind
const char* pduTypeName(PduTypeEnum type);

}  // namespace Cfdp
}  // namespace Ccsds
}  // namespace Cfdpd

#endif  // Cfdpd_Ccsds_Cfdp_Pdu_HPP

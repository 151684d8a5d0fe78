// ======================================================================
// \title  PduBase.hpp
// \author campuzan
// \brief  Base class for all CFDP PDU types
//
// The base class writes and reads the header and the directive code.
// Each concrete PDU encodes only its body.
// ======================================================================

#ifndef Cfdpd_Ccsds_Cfdp_PduBase_HPP
#define Cfdpd_Ccsds_Cfdp_PduBase_HPP

#include <Cfdpd/Types/BasicTypes.hpp>
#include <Cfdpd/Types/SerialBuffer.hpp>
#include <Cfdpd/Ccsds/Cfdp/Types/PduHeader.hpp>
#include <Cfdpd/Ccsds/Cfdp/Types/Types.hpp>

namespace Cfdpd {
namespace Ccsds {
namespace Cfdp {

//! Base class for all CFDP PDUs
class PduBase {
  protected:
    //! The PDU header (common to all PDUs)
    PduHeader m_header;

  public:
    //! Constructor
    PduBase() {}

    //! Virtual destructor for proper cleanup
    virtual ~PduBase() = default;

    //! Get the buffer size needed to hold this PDU
    //! @return Buffer size in bytes
    virtual U32 getBufferSize() const = 0;

    //! Get the directive code, FILE_DIRECTIVE_INVALID_MAX for file data
    virtual FileDirective getDirectiveCode() const = 0;

    //! Encode header, directive code and body
    //! The header's data length is computed here.
    SerializeStatus toSerialBuffer(SerialBuffer& serialBuffer) const;

    //! Decode the body of a PDU whose header and directive code were consumed
    //! @param header The already decoded header
    //! @param serialBuffer Positioned at the first body byte
    SerializeStatus fromSerialBuffer(const PduHeader& header, SerialBuffer& serialBuffer);

    //! Get the PDU type
    //! @return PDU type
    PduTypeEnum getType() const { return this->m_header.getType(); }

    //! Get the direction
    //! @return PduDirection (toward receiver or sender)
    PduDirection getDirection() const { return this->m_header.getDirection(); }

    //! Get the transmission mode
    //! @return Transmission mode (Class 1 or Class 2)
    Class::T getTxmMode() const { return this->m_header.getTxmMode(); }

    //! Get the source entity ID
    EntityId getSourceEid() const { return this->m_header.getSourceEid(); }

    //! Get the transaction sequence number
    TransactionSeq getTransactionSeq() const { return this->m_header.getTransactionSeq(); }

    //! Get the destination entity ID
    EntityId getDestEid() const { return this->m_header.getDestEid(); }

    //! Get the header
    const PduHeader& asHeader() const { return this->m_header; }

  protected:
    //! Encode the body that follows the directive code
    virtual SerializeStatus serializeBody(SerialBuffer& serialBuffer) const = 0;

    //! Decode the body that follows the directive code
    virtual SerializeStatus deserializeBody(SerialBuffer& serialBuffer) = 0;
};

}  // namespace Cfdp
}  // namespace Ccsds
}  // namespace Cfdpd

#endif  // Cfdpd_Ccsds_Cfdp_PduBase_HPP

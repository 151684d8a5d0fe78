// ======================================================================
// \title  MetadataPdu.hpp
// \author campuzan
// \brief  hpp file for CFDP Metadata PDU
// ======================================================================

#ifndef Cfdpd_Ccsds_Cfdp_MetadataPdu_HPP
#define Cfdpd_Ccsds_Cfdp_MetadataPdu_HPP

#include <string>

#include <Cfdpd/Ccsds/Cfdp/Types/PduBase.hpp>
#include <Cfdpd/Ccsds/Cfdp/Types/Tlv.hpp>
#include <config/CfdpCfg.hpp>

namespace Cfdpd {
namespace Ccsds {
namespace Cfdp {

//! The type of a Metadata PDU
class MetadataPdu : public PduBase {
  private:
    //! Closure requested flag
    U8 m_closureRequested;

    //! Checksum type
    ChecksumType m_checksumType;

    //! File size
    FileSize m_fileSize;

    //! Source filename
    std::string m_sourceFilename;

    //! Destination filename
    std::string m_destFilename;

    //! Options: filestore requests and messages to user
    TlvList m_tlvList;

  public:
    //! Constructor
    MetadataPdu() : m_closureRequested(0), m_checksumType(CHECKSUM_TYPE_MODULAR), m_fileSize(0) {}

    //! Initialize a Metadata PDU
    void initialize(PduDirection direction,
                    Class::T txmMode,
                    EntityId sourceEid,
                    TransactionSeq transactionSeq,
                    EntityId destEid,
                    FileSize fileSize,
                    const std::string& sourceFilename,
                    const std::string& destFilename,
                    ChecksumType checksumType,
                    U8 closureRequested);

    //! Compute the buffer size needed
    U32 getBufferSize() const override;

    //! Get directive code
    FileDirective getDirectiveCode() const override { return FILE_DIRECTIVE_METADATA; }

    //! Get the file size
    FileSize getFileSize() const { return this->m_fileSize; }

    //! Get the source filename
    const std::string& getSourceFilename() const { return this->m_sourceFilename; }

    //! Get the destination filename
    const std::string& getDestFilename() const { return this->m_destFilename; }

    //! Get checksum type
    ChecksumType getChecksumType() const { return this->m_checksumType; }

    //! Get closure requested flag
    U8 getClosureRequested() const { return this->m_closureRequested; }

    //! Add an option TLV
    //! @return true if added successfully, false if list is full
    bool appendTlv(const Tlv& tlv) { return this->m_tlvList.appendTlv(tlv); }

    //! Get option TLVs
    const TlvList& getTlvList() const { return this->m_tlvList; }

  protected:
    SerializeStatus serializeBody(SerialBuffer& serialBuffer) const override;
    SerializeStatus deserializeBody(SerialBuffer& serialBuffer) override;
};

}  // namespace Cfdp
}  // namespace Ccsds
}  // namespace Cfdpd

#endif  // Cfdpd_Ccsds_Cfdp_MetadataPdu_HPP

// ======================================================================
// \title  EofPdu.hpp
// \author campuzan
// \brief  hpp file for CFDP EOF PDU
// ======================================================================

#ifndef Cfdpd_Ccsds_Cfdp_EofPdu_HPP
#define Cfdpd_Ccsds_Cfdp_EofPdu_HPP

#include <Cfdpd/Ccsds/Cfdp/Types/PduBase.hpp>
#include <Cfdpd/Ccsds/Cfdp/Types/Tlv.hpp>

namespace Cfdpd {
namespace Ccsds {
namespace Cfdp {

//! The type of an EOF PDU
class EofPdu : public PduBase {
  private:
    //! Condition code
    ConditionCode m_conditionCode;

    //! File checksum
    U32 m_checksum;

    //! File size
    FileSize m_fileSize;

    //! TLV list (optional)
    TlvList m_tlvList;

  public:
    //! Constructor
    EofPdu() : m_conditionCode(CONDITION_CODE_NO_ERROR), m_checksum(0), m_fileSize(0) {}

    //! Initialize an EOF PDU
    void initialize(PduDirection direction,
                    Class::T txmMode,
                    EntityId sourceEid,
                    TransactionSeq transactionSeq,
                    EntityId destEid,
                    ConditionCode conditionCode,
                    U32 checksum,
                    FileSize fileSize);

    //! Compute the buffer size needed
    U32 getBufferSize() const override;

    //! Get directive code
    FileDirective getDirectiveCode() const override { return FILE_DIRECTIVE_END_OF_FILE; }

    //! Get condition code
    ConditionCode getConditionCode() const { return this->m_conditionCode; }

    //! Get checksum
    U32 getChecksum() const { return this->m_checksum; }

    //! Get file size
    FileSize getFileSize() const { return this->m_fileSize; }

    //! Add a TLV to this EOF PDU
    //! @return true if added successfully, false if list is full
    bool appendTlv(const Tlv& tlv) { return this->m_tlvList.appendTlv(tlv); }

    //! Get TLV list
    const TlvList& getTlvList() const { return this->m_tlvList; }

    //! Get number of TLVs
    U8 getNumTlv() const { return this->m_tlvList.getNumTlv(); }

  protected:
    SerializeStatus serializeBody(SerialBuffer& serialBuffer) const override;
    SerializeStatus deserializeBody(SerialBuffer& serialBuffer) override;
};

}  // namespace Cfdp
}  // namespace Ccsds
}  // namespace Cfdpd

#endif  // Cfdpd_Ccsds_Cfdp_EofPdu_HPP

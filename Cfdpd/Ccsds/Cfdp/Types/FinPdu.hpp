// ======================================================================
// \title  FinPdu.hpp
// \author campuzan
// \brief  hpp file for CFDP Finished PDU
// ======================================================================

#ifndef Cfdpd_Ccsds_Cfdp_FinPdu_HPP
#define Cfdpd_Ccsds_Cfdp_FinPdu_HPP

#include <Cfdpd/Ccsds/Cfdp/Types/PduBase.hpp>
#include <Cfdpd/Ccsds/Cfdp/Types/Tlv.hpp>

namespace Cfdpd {
namespace Ccsds {
namespace Cfdp {

//! The type of a Finished PDU
class FinPdu : public PduBase {
  private:
    //! Condition code
    ConditionCode m_conditionCode;

    //! Delivery code
    FinDeliveryCode m_deliveryCode;

    //! File status
    FinFileStatus m_fileStatus;

    //! TLV list (optional)
    TlvList m_tlvList;

  public:
    //! Constructor
    FinPdu()
        : m_conditionCode(CONDITION_CODE_NO_ERROR),
          m_deliveryCode(FIN_DELIVERY_CODE_COMPLETE),
          m_fileStatus(FIN_FILE_STATUS_RETAINED) {}

    //! Initialize a Finished PDU
    void initialize(PduDirection direction,
                    Class::T txmMode,
                    EntityId sourceEid,
                    TransactionSeq transactionSeq,
                    EntityId destEid,
                    ConditionCode conditionCode,
                    FinDeliveryCode deliveryCode,
                    FinFileStatus fileStatus);

    //! Compute the buffer size needed
    U32 getBufferSize() const override;

    //! Get directive code
    FileDirective getDirectiveCode() const override { return FILE_DIRECTIVE_FIN; }

    //! Get condition code
    ConditionCode getConditionCode() const { return this->m_conditionCode; }

    //! Get delivery code
    FinDeliveryCode getDeliveryCode() const { return this->m_deliveryCode; }

    //! Get file status
    FinFileStatus getFileStatus() const { return this->m_fileStatus; }

    //! Add a TLV to this FIN PDU
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

#endif  // Cfdpd_Ccsds_Cfdp_FinPdu_HPP

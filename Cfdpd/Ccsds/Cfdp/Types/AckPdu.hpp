// ======================================================================
// \title  AckPdu.hpp
// \author campuzan
// \brief  hpp file for CFDP ACK PDU
// ======================================================================

#ifndef Cfdpd_Ccsds_Cfdp_AckPdu_HPP
#define Cfdpd_Ccsds_Cfdp_AckPdu_HPP

#include <Cfdpd/Ccsds/Cfdp/Types/PduBase.hpp>

namespace Cfdpd {
namespace Ccsds {
namespace Cfdp {

//! The type of an ACK PDU
class AckPdu : public PduBase {
  private:
    //! Directive being acknowledged
    FileDirective m_directiveCode;

    //! Directive subtype code
    U8 m_directiveSubtypeCode;

    //! Condition code
    ConditionCode m_conditionCode;

    //! Transaction status
    AckTxnStatus m_transactionStatus;

  public:
    //! Constructor
    AckPdu()
        : m_directiveCode(FILE_DIRECTIVE_INVALID_MIN),
          m_directiveSubtypeCode(0),
          m_conditionCode(CONDITION_CODE_NO_ERROR),
          m_transactionStatus(ACK_TXN_STATUS_UNDEFINED) {}

    //! Initialize an ACK PDU
    void initialize(PduDirection direction,
                    Class::T txmMode,
                    EntityId sourceEid,
                    TransactionSeq transactionSeq,
                    EntityId destEid,
                    FileDirective directiveCode,
                    U8 directiveSubtypeCode,
                    ConditionCode conditionCode,
                    AckTxnStatus transactionStatus);

    //! Compute the buffer size needed
    U32 getBufferSize() const override;

    //! ACK is itself a directive
    FileDirective getDirectiveCode() const override { return FILE_DIRECTIVE_ACK; }

    //! Get the directive being acknowledged
    FileDirective getAckedDirectiveCode() const { return this->m_directiveCode; }

    //! Get directive subtype code
    U8 getDirectiveSubtypeCode() const { return this->m_directiveSubtypeCode; }

    //! Get condition code
    ConditionCode getConditionCode() const { return this->m_conditionCode; }

    //! Get transaction status
    AckTxnStatus getTransactionStatus() const { return this->m_transactionStatus; }

  protected:
    SerializeStatus serializeBody(SerialBuffer& serialBuffer) const override;
    SerializeStatus deserializeBody(SerialBuffer& serialBuffer) override;
};

}  // namespace Cfdp
}  // namespace Ccsds
}  // namespace Cfdpd

#endif  // Cfdpd_Ccsds_Cfdp_AckPdu_HPP

// ======================================================================
// \title  NakPdu.hpp
// \author campuzan
// \brief  hpp file for CFDP NAK (Negative Acknowledge) PDU
// ======================================================================

#ifndef Cfdpd_Ccsds_Cfdp_NakPdu_HPP
#define Cfdpd_Ccsds_Cfdp_NakPdu_HPP

#include <Cfdpd/Ccsds/Cfdp/Types/PduBase.hpp>
#include <config/CfdpCfg.hpp>

namespace Cfdpd {
namespace Ccsds {
namespace Cfdp {

//! Segment request structure for NAK PDU
struct SegmentRequest {
    FileSize offsetStart;  //!< Start offset of missing data
    FileSize offsetEnd;    //!< End offset of missing data
};

//! The type of a NAK PDU
class NakPdu : public PduBase {
  private:
    //! Scope start offset
    FileSize m_scopeStart;

    //! Scope end offset
    FileSize m_scopeEnd;

    //! Number of segment requests
    U8 m_numSegments;

    //! Segment requests
    SegmentRequest m_segments[CFDP_NAK_MAX_SEGMENTS];

  public:
    //! Constructor
    NakPdu() : m_scopeStart(0), m_scopeEnd(0), m_numSegments(0) {}

    //! Initialize a NAK PDU
    void initialize(PduDirection direction,
                    Class::T txmMode,
                    EntityId sourceEid,
                    TransactionSeq transactionSeq,
                    EntityId destEid,
                    FileSize scopeStart,
                    FileSize scopeEnd);

    //! Compute the buffer size needed
    U32 getBufferSize() const override;

    //! Get directive code
    FileDirective getDirectiveCode() const override { return FILE_DIRECTIVE_NAK; }

    //! Get scope start
    FileSize getScopeStart() const { return this->m_scopeStart; }

    //! Get scope end
    FileSize getScopeEnd() const { return this->m_scopeEnd; }

    //! Set scope end once the segments are known
    void setScopeEnd(FileSize scopeEnd) { this->m_scopeEnd = scopeEnd; }

    //! Get number of segments
    U8 getNumSegments() const { return this->m_numSegments; }

    //! Get segment at index (caller must verify index < getNumSegments())
    const SegmentRequest& getSegment(U8 index) const { return this->m_segments[index]; }

    //! Add a segment request
    //! @return True if segment was added, false if segment array is full
    bool addSegment(FileSize offsetStart, FileSize offsetEnd);

    //! Clear all segment requests
    void clearSegments() { this->m_numSegments = 0; }

  protected:
    SerializeStatus serializeBody(SerialBuffer& serialBuffer) const override;
    SerializeStatus deserializeBody(SerialBuffer& serialBuffer) override;
};

}  // namespace Cfdp
}  // namespace Ccsds
}  // namespace Cfdpd

#endif  // Cfdpd_Ccsds_Cfdp_NakPdu_HPP

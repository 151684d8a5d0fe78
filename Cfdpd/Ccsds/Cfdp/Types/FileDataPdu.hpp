// ======================================================================
// \title  FileDataPdu.hpp
// \author campuzan
// \brief  hpp file for CFDP File Data PDU
// ======================================================================

#ifndef Cfdpd_Ccsds_Cfdp_FileDataPdu_HPP
#define Cfdpd_Ccsds_Cfdp_FileDataPdu_HPP

#include <vector>

#include <Cfdpd/Ccsds/Cfdp/Types/PduBase.hpp>

namespace Cfdpd {
namespace Ccsds {
namespace Cfdp {

//! The type of a File Data PDU
//!
//! The PDU owns a copy of its segment so it can cross thread boundaries.
class FileDataPdu : public PduBase {
  private:
    //! File offset
    FileSize m_offset;

    //! Segment data
    std::vector<U8> m_data;

  public:
    //! Constructor
    FileDataPdu() : m_offset(0) {}

    //! Initialize a File Data PDU
    void initialize(PduDirection direction,
                    Class::T txmMode,
                    EntityId sourceEid,
                    TransactionSeq transactionSeq,
                    EntityId destEid,
                    FileSize offset,
                    U16 dataSize,
                    const U8* data);

    //! Compute the buffer size needed
    U32 getBufferSize() const override;

    //! File data carries no directive code
    FileDirective getDirectiveCode() const override { return FILE_DIRECTIVE_INVALID_MAX; }

    //! Get the file offset
    FileSize getOffset() const { return this->m_offset; }

    //! Get the data size
    U16 getDataSize() const { return static_cast<U16>(this->m_data.size()); }

    //! Get the data pointer
    const U8* getData() const { return this->m_data.data(); }

    //! Calculate maximum file data payload size for a header
    //! @return Maximum number of data bytes that fit in a CFDP_MAX_PDU_SIZE PDU
    static U32 getMaxFileDataSize(const PduHeader& header);

  protected:
    SerializeStatus serializeBody(SerialBuffer& serialBuffer) const override;
    SerializeStatus deserializeBody(SerialBuffer& serialBuffer) override;
};

}  // namespace Cfdp
}  // namespace Ccsds
}  // namespace Cfdpd

#endif  // Cfdpd_Ccsds_Cfdp_FileDataPdu_HPP

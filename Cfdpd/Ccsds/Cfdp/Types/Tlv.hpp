// ======================================================================
// \title  Tlv.hpp
// \author campuzan
// \brief  hpp file for CFDP TLV types
// ======================================================================

#ifndef Cfdpd_Ccsds_Cfdp_Tlv_HPP
#define Cfdpd_Ccsds_Cfdp_Tlv_HPP

#include <Cfdpd/Types/BasicTypes.hpp>
#include <Cfdpd/Types/SerialBuffer.hpp>
#include <Cfdpd/Ccsds/Cfdp/Types/Types.hpp>
#include <config/CfdpCfg.hpp>

namespace Cfdpd {
namespace Ccsds {
namespace Cfdp {

// CFDP TLV Types
// Blue Book section 5.4, table 5-3
enum TlvType : U8 {
    TLV_TYPE_FILESTORE_REQUEST = 0,       // Filestore request
    TLV_TYPE_FILESTORE_RESPONSE = 1,      // Filestore response
    TLV_TYPE_MESSAGE_TO_USER = 2,         // Message to user
    TLV_TYPE_FAULT_HANDLER_OVERRIDE = 4,  // Fault handler override
    TLV_TYPE_FLOW_LABEL = 5,              // Flow label
    TLV_TYPE_ENTITY_ID = 6                // Entity ID
};

//! Single TLV entry
class Tlv {
  public:
    //! Largest value an LV length byte can carry
    enum { MAX_VALUE_LENGTH = 255 };

    Tlv();

    // Initialize as an entity ID TLV, value encoded in its minimum width
    void initialize(EntityId eid);

    // Initialize with raw data
    void initialize(TlvType type, const U8* data, U8 length);

    TlvType getType() const { return this->m_type; }
    const U8* getData() const { return this->m_data; }
    U8 getLength() const { return this->m_length; }

    // Decode the value of an entity ID TLV
    EntityId getEntityId() const;

    // Compute encoded size
    U32 getEncodedSize() const;

    // Encode to SerialBuffer
    SerializeStatus toSerialBuffer(SerialBuffer& serialBuffer) const;

    // Decode from SerialBuffer
    SerializeStatus fromSerialBuffer(SerialBuffer& serialBuffer);

  private:
    TlvType m_type;
    U8 m_length;
    U8 m_data[MAX_VALUE_LENGTH];
};

//! Bounded list of TLVs
class TlvList {
  public:
    TlvList();

    // Add a TLV (returns false if list is full)
    bool appendTlv(const Tlv& tlv);

    // Clear all TLVs
    void clear();

    // Get number of TLVs
    U8 getNumTlv() const { return this->m_numTlv; }

    // Get TLV at index
    const Tlv& getTlv(U8 index) const;

    // Compute total encoded size of all TLVs
    U32 getEncodedSize() const;

    // Encode all TLVs to SerialBuffer
    SerializeStatus toSerialBuffer(SerialBuffer& serialBuffer) const;

    // Decode all TLVs from SerialBuffer (reads until buffer exhausted)
    //! TLVs beyond CFDP_MAX_TLV are skipped
    SerializeStatus fromSerialBuffer(SerialBuffer& serialBuffer);

  private:
    U8 m_numTlv;
    Tlv m_tlvs[CFDP_MAX_TLV];
};

}  // namespace Cfdp
}  // namespace Ccsds
}  // namespace Cfdpd

#endif  // Cfdpd_Ccsds_Cfdp_Tlv_HPP

// ======================================================================
// \title  Tlv.cpp
// \author campuzan
// \brief  cpp file for CFDP TLV (Type-Length-Value) classes
// ======================================================================

#include <Cfdpd/Ccsds/Cfdp/Types/Tlv.hpp>
#include <Cfdpd/Ccsds/Cfdp/Types/PduHeader.hpp>
#include <Cfdpd/Types/Assert.hpp>

#include <cstring>

namespace Cfdpd {
namespace Ccsds {
namespace Cfdp {

// ======================================================================
// Tlv
// ======================================================================

Tlv::Tlv() : m_type(TLV_TYPE_ENTITY_ID), m_length(0) {
    memset(this->m_data, 0, sizeof(this->m_data));
}

void Tlv::initialize(EntityId eid) {
    this->m_type = TLV_TYPE_ENTITY_ID;
    this->m_length = PduHeader::getValueEncodedSize(eid);
    for (U8 i = 0; i < this->m_length; ++i) {
        const U8 shift = static_cast<U8>((this->m_length - 1 - i) * 8);
        this->m_data[i] = static_cast<U8>((eid >> shift) & 0xFF);
    }
}

void Tlv::initialize(TlvType type, const U8* data, U8 length) {
    CFDPD_ASSERT(data != nullptr || length == 0);
    this->m_type = type;
    this->m_length = length;
    if (length > 0) {
        memcpy(this->m_data, data, length);
    }
}

EntityId Tlv::getEntityId() const {
    EntityId eid = 0;
    for (U8 i = 0; i < this->m_length && i < sizeof(EntityId); ++i) {
        eid = (eid << 8) | this->m_data[i];
    }
    return eid;
}

U32 Tlv::getEncodedSize() const {
    // Type (1 byte) + Length (1 byte) + Data (variable)
    return 2U + this->m_length;
}

SerializeStatus Tlv::toSerialBuffer(SerialBuffer& serialBuffer) const {
    SerializeStatus status = serialBuffer.serializeFrom(static_cast<U8>(this->m_type));
    if (status != FW_SERIALIZE_OK) {
        return status;
    }

    status = serialBuffer.serializeFrom(this->m_length);
    if (status != FW_SERIALIZE_OK) {
        return status;
    }

    return serialBuffer.pushBytes(this->m_data, this->m_length);
}

SerializeStatus Tlv::fromSerialBuffer(SerialBuffer& serialBuffer) {
    U8 type;
    SerializeStatus status = serialBuffer.deserializeTo(type);
    if (status != FW_SERIALIZE_OK) {
        return status;
    }

    U8 length;
    status = serialBuffer.deserializeTo(length);
    if (status != FW_SERIALIZE_OK) {
        return status;
    }

    status = serialBuffer.popBytes(this->m_data, length);
    if (status != FW_SERIALIZE_OK) {
        return status;
    }

    this->m_type = static_cast<TlvType>(type);
    this->m_length = length;
    return FW_SERIALIZE_OK;
}

// ======================================================================
// TlvList
// ======================================================================

TlvList::TlvList() : m_numTlv(0) {}

bool TlvList::appendTlv(const Tlv& tlv) {
    if (this->m_numTlv >= CFDP_MAX_TLV) {
        return false;
    }
    this->m_tlvs[this->m_numTlv++] = tlv;
    return true;
}

void TlvList::clear() {
    this->m_numTlv = 0;
}

const Tlv& TlvList::getTlv(U8 index) const {
    CFDPD_ASSERT(index < this->m_numTlv, index, this->m_numTlv);
    return this->m_tlvs[index];
}

U32 TlvList::getEncodedSize() const {
    U32 size = 0;
    for (U8 i = 0; i < this->m_numTlv; ++i) {
        size += this->m_tlvs[i].getEncodedSize();
    }
    return size;
}

SerializeStatus TlvList::toSerialBuffer(SerialBuffer& serialBuffer) const {
    for (U8 i = 0; i < this->m_numTlv; ++i) {
        SerializeStatus status = this->m_tlvs[i].toSerialBuffer(serialBuffer);
        if (status != FW_SERIALIZE_OK) {
            return status;
        }
    }
    return FW_SERIALIZE_OK;
}

SerializeStatus TlvList::fromSerialBuffer(SerialBuffer& serialBuffer) {
    this->m_numTlv = 0;
    while (serialBuffer.getDeserializeSizeLeft() > 0) {
        Tlv tlv;
        SerializeStatus status = tlv.fromSerialBuffer(serialBuffer);
        if (status != FW_SERIALIZE_OK) {
            return status;
        }
        // Extra TLVs are consumed but not kept
        (void)this->appendTlv(tlv);
    }
    return FW_SERIALIZE_OK;
}

}  // namespace Cfdp
}  // namespace Ccsds
}  // namespace Cfdpd

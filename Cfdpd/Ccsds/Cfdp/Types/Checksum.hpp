// ======================================================================
// \title  Checksum.hpp
// \author campuzan
// \brief  hpp file for the CFDP modular checksum
// ======================================================================

#ifndef Cfdpd_Ccsds_Cfdp_Checksum_HPP
#define Cfdpd_Ccsds_Cfdp_Checksum_HPP

#include <Cfdpd/Types/BasicTypes.hpp>

namespace Cfdpd {
namespace Ccsds {
namespace Cfdp {

//! \class Checksum
//! \brief The CFDP modular checksum (CCSDS 727.0-B-5 annex F)
//!
//! The checksum is the sum, modulo 2^32, of the file taken as big-endian
//! 32-bit words aligned to absolute file offsets. A partial word at the
//! head or tail of a segment is padded with zeros. Because each byte adds
//! a fixed contribution determined by its offset, segments may be added in
//! any order.
class Checksum {
  public:
    //! Construct with an initial value
    explicit Checksum(U32 value = 0) : m_value(value) {}

    //! Add the contribution of a file segment
    //! \param data segment bytes
    //! \param offset absolute file offset of data[0]
    //! \param length number of bytes
    void update(const U8* data, U32 offset, U32 length);

    //! Get the current checksum value
    U32 getValue() const { return this->m_value; }

    bool operator==(const Checksum& other) const { return this->m_value == other.m_value; }
    bool operator!=(const Checksum& other) const { return this->m_value != other.m_value; }

  private:
    U32 m_value;
};

}  // namespace Cfdp
}  // namespace Ccsds
}  // namespace Cfdpd

#endif  // Cfdpd_Ccsds_Cfdp_Checksum_HPP

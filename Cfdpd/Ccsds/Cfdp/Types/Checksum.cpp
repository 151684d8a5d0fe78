// ======================================================================
// \title  Checksum.cpp
// \author campuzan
// \brief  cpp file for the CFDP modular checksum
// ======================================================================

#include <Cfdpd/Ccsds/Cfdp/Types/Checksum.hpp>
#include <Cfdpd/Types/Assert.hpp>

namespace Cfdpd {
namespace Ccsds {
namespace Cfdp {

void Checksum::update(const U8* data, U32 offset, U32 length) {
    CFDPD_ASSERT(data != nullptr || length == 0);

    U32 index = 0;

    // Leading bytes up to the next word boundary
    while (index < length && ((offset + index) & 0x3U) != 0) {
        const U32 shift = 8U * (3U - ((offset + index) & 0x3U));
        this->m_value += static_cast<U32>(data[index]) << shift;
        ++index;
    }

    // Whole words
    while (index + 4 <= length) {
        const U32 word = (static_cast<U32>(data[index]) << 24) | (static_cast<U32>(data[index + 1]) << 16) |
                         (static_cast<U32>(data[index + 2]) << 8) | static_cast<U32>(data[index + 3]);
        this->m_value += word;
        index += 4;
    }

    // Trailing bytes
    while (index < length) {
        const U32 shift = 8U * (3U - ((offset + index) & 0x3U));
        this->m_value += static_cast<U32>(data[index]) << shift;
        ++index;
    }
}

}  // namespace Cfdp
}  // namespace Ccsds
}  // namespace Cfdpd

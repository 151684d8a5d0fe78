// ======================================================================
// \title  BasicTypes.hpp
// \author campuzan
// \brief  Fixed-width type aliases used throughout cfdpd
// ======================================================================

#ifndef Cfdpd_Types_BasicTypes_HPP
#define Cfdpd_Types_BasicTypes_HPP

#include <cinttypes>
#include <cstddef>
#include <cstdint>

typedef uint8_t U8;
typedef uint16_t U16;
typedef uint32_t U32;
typedef uint64_t U64;

typedef int8_t I8;
typedef int16_t I16;
typedef int32_t I32;
typedef int64_t I64;

typedef float F32;
typedef double F64;

//! Size of a memory region or a count of elements
typedef U64 FwSizeType;
#define PRI_FwSizeType PRIu64

//! Type of the optional arguments carried by an assertion
typedef I64 FwAssertArgType;
#define PRI_FwAssertArgType PRId64

#endif  // Cfdpd_Types_BasicTypes_HPP

// ======================================================================
// \title  Assert.hpp
// \author campuzan
// \brief  Invariant checking for cfdpd
//
// CFDPD_ASSERT is for programming errors only. Anything that can be
// triggered by data arriving from a peer or the filestore must be
// reported through a status return instead.
// ======================================================================

#ifndef Cfdpd_Types_Assert_HPP
#define Cfdpd_Types_Assert_HPP

#include <Cfdpd/Types/BasicTypes.hpp>

namespace Cfdpd {

//! Maximum number of arguments reported with a failed assertion
static const U32 ASSERT_MAX_ARGS = 6;

//! Report a failed assertion and terminate the process
[[noreturn]] void assertFailedImpl(const char* file,
                                   U32 line,
                                   const char* condition,
                                   U32 numArgs,
                                   const FwAssertArgType* args);

template <typename... Args>
[[noreturn]] void assertFailed(const char* file, U32 line, const char* condition, Args... args) {
    static_assert(sizeof...(Args) <= ASSERT_MAX_ARGS, "too many assert arguments");
    const FwAssertArgType argList[] = {static_cast<FwAssertArgType>(args)..., 0};
    assertFailedImpl(file, line, condition, static_cast<U32>(sizeof...(Args)), argList);
}

}  // namespace Cfdpd

#define CFDPD_ASSERT(cond, ...) \
    ((cond) ? static_cast<void>(0) : ::Cfdpd::assertFailed(__FILE__, __LINE__, #cond, ##__VA_ARGS__))

#endif  // Cfdpd_Types_Assert_HPP

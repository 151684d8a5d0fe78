// ======================================================================
// \title  Assert.cpp
// \author campuzan
// \brief  cpp file for cfdpd invariant checking
// ======================================================================

#include <Cfdpd/Types/Assert.hpp>
#include <Cfdpd/Log/Log.hpp>

#include <cstdio>
#include <cstdlib>

namespace Cfdpd {

void assertFailedImpl(const char* file,
                      U32 line,
                      const char* condition,
                      U32 numArgs,
                      const FwAssertArgType* args) {
    char argText[ASSERT_MAX_ARGS * 24 + 1] = {0};
    size_t used = 0;
    for (U32 i = 0; i < numArgs && i < ASSERT_MAX_ARGS; i++) {
        int written = snprintf(argText + used, sizeof(argText) - used, " %" PRI_FwAssertArgType, args[i]);
        if (written < 0 || static_cast<size_t>(written) >= sizeof(argText) - used) {
            break;
        }
        used += static_cast<size_t>(written);
    }

    Log::Logger::log(Log::FATAL, "Assert", "%s:%" PRIu32 " (%s)%s", file, line, condition, argText);
    Log::Logger::flush();
    std::abort();
}

}  // namespace Cfdpd

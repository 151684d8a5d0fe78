// ======================================================================
// \title  Log.hpp
// \author campuzan
// \brief  Thread-safe event log with fprime event severities
// ======================================================================

#ifndef Cfdpd_Log_Log_HPP
#define Cfdpd_Log_Log_HPP

#include <Cfdpd/Types/BasicTypes.hpp>

#include <cstdio>
#include <mutex>
#include <string>

namespace Cfdpd {
namespace Log {

//! Event severity, most severe first
enum Severity : U8 {
    FATAL = 0,        //!< An unrecoverable error; the process is about to stop
    WARNING_HI = 1,   //!< A fault that ended an operation
    WARNING_LO = 2,   //!< A fault that was recovered from
    COMMAND = 3,      //!< A user command was accepted
    ACTIVITY_HI = 4,  //!< Important progress, such as a transfer completing
    ACTIVITY_LO = 5,  //!< Routine progress
    DIAGNOSTIC = 6    //!< Per-PDU detail
};

//! Parse a severity name such as "WARNING_HI"
//! \return true if the name was recognized
bool severityFromString(const char* name, Severity& severity);

//! Name of a severity
const char* severityName(Severity severity);

//! \class Logger
//! \brief Process-wide event sink
//!
//! Every event is written as a single line carrying a timestamp, the
//! severity, the emitting component and the formatted message. Events
//! less severe than the configured filter are discarded.
class Logger {
  public:
    //! Set the least severe severity that is still written
    static void setSeverityFilter(Severity severity);

    //! Get the severity filter
    static Severity getSeverityFilter();

    //! Write events to the given file in addition to stderr
    //! \return false if the file could not be opened
    static bool setOutputFile(const std::string& path);

    //! Stop writing events to stderr
    static void setConsoleOutput(bool enabled);

    //! Check whether an event of this severity would be written
    static bool isEnabled(Severity severity);

    //! Emit an event
    static void log(Severity severity, const char* component, const char* format, ...)
        __attribute__((format(printf, 3, 4)));

    //! Flush any buffered output
    static void flush();

  private:
    static std::mutex s_mutex;
    static Severity s_filter;
    static bool s_console;
    static FILE* s_file;
};

}  // namespace Log
}  // namespace Cfdpd

#endif  // Cfdpd_Log_Log_HPP

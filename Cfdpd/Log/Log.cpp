// ======================================================================
// \title  Log.cpp
// \author campuzan
// \brief  cpp file for the cfdpd event log
// ======================================================================

#include <Cfdpd/Log/Log.hpp>

#include <chrono>
#include <cstdarg>
#include <cstring>
#include <ctime>

namespace Cfdpd {
namespace Log {

namespace {

const char* const SEVERITY_NAMES[] = {
    "FATAL", "WARNING_HI", "WARNING_LO", "COMMAND", "ACTIVITY_HI", "ACTIVITY_LO", "DIAGNOSTIC",
};

const U32 NUM_SEVERITIES = sizeof(SEVERITY_NAMES) / sizeof(SEVERITY_NAMES[0]);

}  // namespace

std::mutex Logger::s_mutex;
Severity Logger::s_filter = ACTIVITY_HI;
bool Logger::s_console = true;
FILE* Logger::s_file = nullptr;

bool severityFromString(const char* name, Severity& severity) {
    for (U32 i = 0; i < NUM_SEVERITIES; i++) {
        if (strcmp(name, SEVERITY_NAMES[i]) == 0) {
            severity = static_cast<Severity>(i);
            return true;
        }
    }
    return false;
}

const char* severityName(Severity severity) {
    return (severity < NUM_SEVERITIES) ? SEVERITY_NAMES[severity] : "UNKNOWN";
}

void Logger::setSeverityFilter(Severity severity) {
    std::lock_guard<std::mutex> lock(s_mutex);
    s_filter = severity;
}

Severity Logger::getSeverityFilter() {
    std::lock_guard<std::mutex> lock(s_mutex);
    return s_filter;
}

bool Logger::setOutputFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(s_mutex);
    if (s_file != nullptr) {
        fclose(s_file);
        s_file = nullptr;
    }
    s_file = fopen(path.c_str(), "a");
    return s_file != nullptr;
}

void Logger::setConsoleOutput(bool enabled) {
    std::lock_guard<std::mutex> lock(s_mutex);
    s_console = enabled;
}

bool Logger::isEnabled(Severity severity) {
    std::lock_guard<std::mutex> lock(s_mutex);
    return severity <= s_filter;
}

void Logger::log(Severity severity, const char* component, const char* format, ...) {
    char message[512];
    va_list args;
    va_start(args, format);
    vsnprintf(message, sizeof(message), format, args);
    va_end(args);

    const auto now = std::chrono::system_clock::now();
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    const long millis = static_cast<long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000);
    struct tm parts;
    gmtime_r(&seconds, &parts);
    char stamp[32];
    strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%S", &parts);

    std::lock_guard<std::mutex> lock(s_mutex);
    if (severity > s_filter) {
        return;
    }
    if (s_console) {
        fprintf(stderr, "%s.%03ldZ %-11s %s: %s\n", stamp, millis, severityName(severity), component, message);
    }
    if (s_file != nullptr) {
        fprintf(s_file, "%s.%03ldZ %-11s %s: %s\n", stamp, millis, severityName(severity), component, message);
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(s_mutex);
    fflush(stderr);
    if (s_file != nullptr) {
        fflush(s_file);
    }
}

}  // namespace Log
}  // namespace Cfdpd

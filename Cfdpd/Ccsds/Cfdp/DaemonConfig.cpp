// ======================================================================
// \title  DaemonConfig.cpp
// \author campuzan
// \brief  cpp file for the runtime configuration of a daemon
// ======================================================================

#include <Cfdpd/Ccsds/Cfdp/DaemonConfig.hpp>

#include <errno.h>
#include <stdlib.h>

#include <fstream>
#include <limits>

#include <Cfdpd/Ccsds/Cfdp/Events.hpp>

namespace Cfdpd {
namespace Ccsds {
namespace Cfdp {

namespace {

std::string trim(const std::string& text) {
    const char* const whitespace = " \t\r\n";
    const std::string::size_type first = text.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return std::string();
    }
    const std::string::size_type last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

//! Parse an unsigned decimal no larger than max
bool parseUnsigned(const std::string& text, U64 max, U64& value) {
    if (text.empty() || text[0] == '-') {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    const unsigned long long parsed = strtoull(text.c_str(), &end, 10);
    if ((errno != 0) || (end == nullptr) || (*end != '\0') || (parsed > max)) {
        return false;
    }
    value = static_cast<U64>(parsed);
    return true;
}

template <typename T>
bool parseField(const std::string& text, T& field, U64 min = 0) {
    U64 value = 0;
    if (!parseUnsigned(text, std::numeric_limits<T>::max(), value) || (value < min)) {
        return false;
    }
    field = static_cast<T>(value);
    return true;
}

}  // namespace

DaemonConfig::DaemonConfig()
    : entity(),
      filestoreRoot("."),
      transportBufferSize(CFDP_DEFAULT_TRANSPORT_BUFFER_SIZE),
      logSeverity(Log::ACTIVITY_HI),
      logFile() {}

Status::T DaemonConfig::loadFile(const std::string& path) {
    const Events events("DaemonConfig");

    std::ifstream file(path.c_str());
    if (!file.is_open()) {
        events.log_WARNING_HI_ConfigOpenFailed(path);
        return Status::ERROR;
    }

    std::string line;
    U32 lineNumber = 0;
    while (std::getline(file, line)) {
        ++lineNumber;
        const std::string text = trim(line);
        if (text.empty() || text[0] == '#') {
            continue;
        }

        const std::string::size_type equals = text.find('=');
        if ((equals == std::string::npos) ||
            !this->applySetting(trim(text.substr(0, equals)), trim(text.substr(equals + 1)))) {
            events.log_WARNING_HI_ConfigParseError(path, lineNumber, text);
            return Status::ERROR;
        }
    }

    return Status::SUCCESS;
}

bool DaemonConfig::applyLogging() const {
    Log::Logger::setSeverityFilter(this->logSeverity);
    if (!this->logFile.empty()) {
        return Log::Logger::setOutputFile(this->logFile);
    }
    return true;
}

bool DaemonConfig::applySetting(const std::string& key, const std::string& value) {
    if (key == "local_eid") {
        return parseField(value, this->entity.localEid);
    }
    if (key == "ack_timer_ms") {
        return parseField(value, this->entity.ackTimerMs, 1);
    }
    if (key == "inactivity_timer_ms") {
        return parseField(value, this->entity.inactivityTimerMs, 1);
    }
    if (key == "ack_limit") {
        return parseField(value, this->entity.ackLimit, 1);
    }
    if (key == "nak_limit") {
        return parseField(value, this->entity.nakLimit, 1);
    }
    if (key == "outgoing_file_chunk_size") {
        return parseField(value, this->entity.outgoingFileChunkSize, 1);
    }
    if (key == "max_pdus_per_cycle") {
        return parseField(value, this->entity.maxPdusPerCycle, 1);
    }
    if (key == "transport_buffer_size") {
        return parseField(value, this->transportBufferSize, CFDP_MAX_PDU_SIZE);
    }
    if (key == "filestore_root") {
        if (value.empty()) {
            return false;
        }
        this->filestoreRoot = value;
        return true;
    }
    if (key == "log_severity") {
        return Log::severityFromString(value.c_str(), this->logSeverity);
    }
    if (key == "log_file") {
        this->logFile = value;
        return true;
    }
    return false;
}

}  // namespace Cfdp
}  // namespace Ccsds
}  // namespace Cfdpd

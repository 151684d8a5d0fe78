// ======================================================================
// \title  DaemonConfig.hpp
// \author campuzan
// \brief  hpp file for the runtime configuration of a daemon
// ======================================================================

#ifndef Cfdpd_Ccsds_Cfdp_DaemonConfig_HPP
#define Cfdpd_Ccsds_Cfdp_DaemonConfig_HPP

#include <string>

#include <Cfdpd/Ccsds/Cfdp/EntityConfig.hpp>
#include <Cfdpd/Log/Log.hpp>

namespace Cfdpd {
namespace Ccsds {
namespace Cfdp {

//! Everything a daemon process is configured with at startup
//!
//! A configuration file holds one `key = value` pair per line. Blank lines
//! and lines starting with '#' are skipped. Recognized keys:
//!
//!     local_eid, ack_timer_ms, inactivity_timer_ms, ack_limit, nak_limit,
//!     outgoing_file_chunk_size, max_pdus_per_cycle, filestore_root,
//!     transport_buffer_size, log_severity, log_file
struct DaemonConfig {
    EntityConfig entity;
    std::string filestoreRoot;
    FwSizeType transportBufferSize;
    Log::Severity logSeverity;
    std::string logFile;  //!< Empty to log to stderr only

    DaemonConfig();

    //! Read settings from a file over the current values
    //!
    //! \return SUCCESS, or ERROR if the file cannot be opened or a line does
    //!         not parse. Lines before the bad one stay applied.
    Status::T loadFile(const std::string& path);

    //! Apply the logging settings to the process-wide logger
    //! \return false if the log file cannot be opened
    bool applyLogging() const;

  private:
    bool applySetting(const std::string& key, const std::string& value);
};

}  // namespace Cfdp
}  // namespace Ccsds
}  // namespace Cfdpd

#endif  // Cfdpd_Ccsds_Cfdp_DaemonConfig_HPP

// ======================================================================
// \title  DaemonConfigTests.cpp
// \author campuzan
// \brief  Unit tests for reading the daemon configuration file
// ======================================================================

#include <gtest/gtest.h>

#include <fstream>

#include <Cfdpd/Ccsds/Cfdp/DaemonConfig.hpp>
#include <Cfdpd/Filestore/test/ut/TempDirectory.hpp>

using namespace Cfdpd;
using namespace Cfdpd::Ccsds::Cfdp;

class DaemonConfigTest : public ::testing::Test {
  protected:
    void SetUp() override { ASSERT_TRUE(this->m_dir.isValid()); }

    std::string writeConfig(const std::string& text) {
        const std::string path = this->m_dir.join("cfdpd.conf");
        std::ofstream out(path.c_str(), std::ios::trunc);
        out << text;
        return path;
    }

    TempDirectory m_dir;
};

TEST_F(DaemonConfigTest, Defaults) {
    const DaemonConfig config;
    EXPECT_EQ(static_cast<U32>(CFDP_DEFAULT_ACK_TIMER_MS), config.entity.ackTimerMs);
    EXPECT_EQ(static_cast<U32>(CFDP_DEFAULT_INACTIVITY_TIMER_MS), config.entity.inactivityTimerMs);
    EXPECT_EQ(static_cast<FwSizeType>(CFDP_DEFAULT_TRANSPORT_BUFFER_SIZE), config.transportBufferSize);
    EXPECT_EQ(".", config.filestoreRoot);
    EXPECT_EQ(Log::ACTIVITY_HI, config.logSeverity);
    EXPECT_TRUE(config.logFile.empty());
}

TEST_F(DaemonConfigTest, LoadsEveryKey) {
    const std::string path = this->writeConfig(
        "# entity 5\n"
        "\n"
        "local_eid = 5\n"
        "ack_timer_ms=250\n"
        "  inactivity_timer_ms =  4000  \n"
        "ack_limit = 7\n"
        "nak_limit = 9\n"
        "outgoing_file_chunk_size = 512\n"
        "max_pdus_per_cycle = 16\n"
        "transport_buffer_size = 4096\n"
        "filestore_root = /var/cfdp\n"
        "log_severity = WARNING_LO\n"
        "log_file = /tmp/cfdpd.log\n");

    DaemonConfig config;
    ASSERT_EQ(Status::SUCCESS, config.loadFile(path));
    EXPECT_EQ(5U, config.entity.localEid);
    EXPECT_EQ(250U, config.entity.ackTimerMs);
    EXPECT_EQ(4000U, config.entity.inactivityTimerMs);
    EXPECT_EQ(7, config.entity.ackLimit);
    EXPECT_EQ(9, config.entity.nakLimit);
    EXPECT_EQ(512, config.entity.outgoingFileChunkSize);
    EXPECT_EQ(16U, config.entity.maxPdusPerCycle);
    EXPECT_EQ(4096U, config.transportBufferSize);
    EXPECT_EQ("/var/cfdp", config.filestoreRoot);
    EXPECT_EQ(Log::WARNING_LO, config.logSeverity);
    EXPECT_EQ("/tmp/cfdpd.log", config.logFile);
}

TEST_F(DaemonConfigTest, MissingFile) {
    DaemonConfig config;
    EXPECT_EQ(Status::ERROR, config.loadFile(this->m_dir.join("absent.conf")));
}

// Lines before the bad one stay applied, lines after are not read
TEST_F(DaemonConfigTest, StopsAtFirstBadLine) {
    const std::string path = this->writeConfig(
        "local_eid = 3\n"
        "ack_timer_ms = 0\n"
        "nak_limit = 2\n");

    DaemonConfig config;
    EXPECT_EQ(Status::ERROR, config.loadFile(path));
    EXPECT_EQ(3U, config.entity.localEid);
    EXPECT_EQ(static_cast<U32>(CFDP_DEFAULT_ACK_TIMER_MS), config.entity.ackTimerMs);
    EXPECT_EQ(static_cast<U8>(CFDP_DEFAULT_NAK_LIMIT), config.entity.nakLimit);
}

TEST_F(DaemonConfigTest, RejectsBadValues) {
    const char* const lines[] = {
        "unknown_key = 1\n",
        "local_eid\n",
        "local_eid = -1\n",
        "local_eid = 12abc\n",
        "ack_limit = 256\n",
        "inactivity_timer_ms = 0\n",
        "outgoing_file_chunk_size = 70000\n",
        "transport_buffer_size = 16\n",
        "filestore_root =\n",
        "log_severity = LOUD\n",
    };
    for (U32 i = 0; i < sizeof(lines) / sizeof(lines[0]); ++i) {
        DaemonConfig config;
        EXPECT_EQ(Status::ERROR, config.loadFile(this->writeConfig(lines[i]))) << lines[i];
    }
}

TEST_F(DaemonConfigTest, ApplyLogging) {
    DaemonConfig config;
    config.logSeverity = Log::DIAGNOSTIC;
    EXPECT_TRUE(config.applyLogging());
    EXPECT_EQ(Log::DIAGNOSTIC, Log::Logger::getSeverityFilter());
    EXPECT_TRUE(Log::Logger::isEnabled(Log::DIAGNOSTIC));

    config.logSeverity = Log::WARNING_HI;
    config.logFile = this->m_dir.join("missing_dir/cfdpd.log");
    EXPECT_FALSE(config.applyLogging());
    EXPECT_FALSE(Log::Logger::isEnabled(Log::ACTIVITY_LO));

    Log::Logger::setSeverityFilter(Log::ACTIVITY_HI);
}

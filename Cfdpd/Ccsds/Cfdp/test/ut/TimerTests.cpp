// ======================================================================
// \title  TimerTests.cpp
// \author campuzan
// \brief  Unit tests for the deadline timer
// ======================================================================

#include <Cfdpd/Ccsds/Cfdp/Timer.hpp>
#include <gtest/gtest.h>

using namespace Cfdpd;
using namespace Cfdpd::Ccsds::Cfdp;

class TimerTest : public ::testing::Test {
  protected:
    void SetUp() override { this->m_start = Timer::Clock::now(); }

    Timer::Clock::time_point at(U32 ms) const { return this->m_start + std::chrono::milliseconds(ms); }

    Timer::Clock::time_point m_start;
};

TEST_F(TimerTest, StartsUninitialized) {
    Timer timer;
    EXPECT_EQ(Timer::UNINITIALIZED, timer.getStatus());
    EXPECT_FALSE(timer.isRunning());
}

TEST_F(TimerTest, ExpiresAtDeadline) {
    Timer timer;
    timer.setTimer(100, this->m_start);

    EXPECT_TRUE(timer.isRunning());
    EXPECT_EQ(100U, timer.getDurationMs());
    EXPECT_EQ(at(100), timer.getDeadline());
    EXPECT_EQ(Timer::RUNNING, timer.getStatus(at(99)));
    EXPECT_EQ(Timer::EXPIRED, timer.getStatus(at(100)));

    // Stays expired until set again
    EXPECT_EQ(Timer::EXPIRED, timer.getStatus(at(0)));
    EXPECT_FALSE(timer.isRunning());

    timer.setTimer(50, at(100));
    EXPECT_EQ(Timer::RUNNING, timer.getStatus(at(120)));
}

TEST_F(TimerTest, Disable) {
    Timer timer;
    timer.setTimer(10, this->m_start);
    timer.disableTimer();
    EXPECT_EQ(Timer::UNINITIALIZED, timer.getStatus(at(1000)));
}

TEST_F(TimerTest, PausedTimerDoesNotExpire) {
    Timer timer;
    timer.setTimer(10, this->m_start);
    timer.pause();

    EXPECT_EQ(Timer::PAUSED, timer.getStatus(at(1000)));
    EXPECT_FALSE(timer.isRunning());
}

// Resuming restarts the full duration from the current time
TEST_F(TimerTest, ResumeRestartsDuration) {
    Timer timer;
    timer.setTimer(60000, this->m_start);
    timer.pause();

    const Timer::Clock::time_point beforeResume = Timer::Clock::now();
    timer.resume();

    EXPECT_TRUE(timer.isRunning());
    EXPECT_GE(timer.getDeadline(), beforeResume + std::chrono::milliseconds(60000));
    EXPECT_EQ(Timer::RUNNING, timer.getStatus());
}

TEST_F(TimerTest, PauseAndResumeOnlyAffectMatchingStates) {
    Timer timer;
    timer.pause();
    EXPECT_EQ(Timer::UNINITIALIZED, timer.getStatus());

    timer.resume();
    EXPECT_EQ(Timer::UNINITIALIZED, timer.getStatus());

    timer.setTimer(10, this->m_start);
    EXPECT_EQ(Timer::EXPIRED, timer.getStatus(at(10)));
    timer.pause();
    EXPECT_EQ(Timer::EXPIRED, timer.getStatus(at(10)));
}

// ======================================================================
// \title  Timer.cpp
// \author campuzan
// \brief  cpp file for CFDP timer that is driven by a monotonic deadline
// ======================================================================

#include <Cfdpd/Ccsds/Cfdp/Timer.hpp>

namespace Cfdpd {
namespace Ccsds {
namespace Cfdp {

// ----------------------------------------------------------------------
// Class construction and destruction
// ----------------------------------------------------------------------

Timer ::
    Timer() : m_status(UNINITIALIZED), m_durationMs(0)
{

}

Timer ::
    ~Timer()
{

}

// ----------------------------------------------------------------------
// Class interfaces
// ----------------------------------------------------------------------

void Timer ::
    setTimer(U32 timerDurationMs)
{
    this->setTimer(timerDurationMs, Clock::now());
}

void Timer ::
    setTimer(U32 timerDurationMs, const Clock::time_point& now)
{
    this->m_durationMs = timerDurationMs;
    this->m_deadline = now + std::chrono::milliseconds(timerDurationMs);
    this->m_status = RUNNING;
}

void Timer ::
    disableTimer()
{
    this->m_status = UNINITIALIZED;
}

void Timer ::
    pause()
{
    if(this->m_status == RUNNING)
    {
        this->m_status = PAUSED;
    }
}

void Timer ::
    resume()
{
    if(this->m_status == PAUSED)
    {
        this->setTimer(this->m_durationMs);
    }
}

Timer::Status Timer ::
    getStatus()
{
    return this->getStatus(Clock::now());
}

Timer::Status Timer ::
    getStatus(const Clock::time_point& now)
{
    if((this->m_status == RUNNING) && (now >= this->m_deadline))
    {
        this->m_status = EXPIRED;
    }
    return this->m_status;
}

}  // namespace Cfdp
}  // namespace Ccsds
}  // namespace Cfdpd

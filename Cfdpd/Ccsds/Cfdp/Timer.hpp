// ======================================================================
// \title  Timer.hpp
// \author campuzan
// \brief  hpp file for CFDP timer that is driven by a monotonic deadline
// ======================================================================

#ifndef Cfdpd_Ccsds_Cfdp_Timer_HPP
#define Cfdpd_Ccsds_Cfdp_Timer_HPP

#include <chrono>

#include <Cfdpd/Types/BasicTypes.hpp>

namespace Cfdpd {
namespace Ccsds {
namespace Cfdp {

class Timer  {

  // ----------------------------------------------------------------------
  // Class types
  // ----------------------------------------------------------------------

  public:
    typedef std::chrono::steady_clock Clock;

    enum Status {
      UNINITIALIZED,
      RUNNING,
      PAUSED,
      EXPIRED
    };

  public:

    // ----------------------------------------------------------------------
    // Class construction and destruction
    // ----------------------------------------------------------------------

    //! Construct Timer object
    Timer();

    //! Destroy Timer object
    ~Timer();

  public:

    // ----------------------------------------------------------------------
    // Class interfaces
    // ----------------------------------------------------------------------

    //! Start the timer, expiring timerDurationMs from now
    void setTimer(U32 timerDurationMs //!< The duration of the timer in milliseconds
    );

    //! Start the timer, expiring timerDurationMs from the given time
    void setTimer(U32 timerDurationMs, const Clock::time_point& now);

    //! Disables a CFDP timer
    void disableTimer();

    //! Stop a running timer so that it can be resumed later
    void pause();

    //! Restart a paused timer from its full duration
    void resume();

    //! Get the status of the timer as of now
    Status getStatus();

    //! Get the status of the timer as of the given time
    Status getStatus(const Clock::time_point& now);

    //! Whether the timer is running
    bool isRunning() const { return this->m_status == RUNNING; }

    //! Deadline of a running timer
    Clock::time_point getDeadline() const { return this->m_deadline; }

    //! Duration of the last setTimer call
    U32 getDurationMs() const { return this->m_durationMs; }

  private:

    // ----------------------------------------------------------------------
    // Class member variables
    // ----------------------------------------------------------------------

    Status m_status;
    U32 m_durationMs;
    Clock::time_point m_deadline;
};

}  // namespace Cfdp
}  // namespace Ccsds
}  // namespace Cfdpd

#endif // Cfdpd_Ccsds_Cfdp_Timer_HPP

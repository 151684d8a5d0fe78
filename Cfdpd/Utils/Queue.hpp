/*
 * Queue.hpp:
 *
 * FIFO queue of owned messages shared between threads. Producers enqueue from any thread; a single consumer
 * dequeues, optionally waiting until a deadline. Closing the queue wakes every waiter and causes all later
 * enqueue calls to fail, which is how a consumer learns that its producers are gone and vice versa.
 *
 * The queue may be bounded. When a bounded queue is full the overflow mode decides whether the incoming message or
 * the oldest queued message is dropped.
 */
#ifndef Cfdpd_Utils_Queue_HPP
#define Cfdpd_Utils_Queue_HPP

#include <Cfdpd/Types/BasicTypes.hpp>

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>

namespace Cfdpd {
namespace Utils {

/**
 * \brief Result of a queue operation
 */
enum QueueStatus {
    QUEUE_OK,                //!< Message transferred
    QUEUE_EMPTY,             //!< Nothing to dequeue
    QUEUE_FULL,              //!< Bounded queue full, incoming message dropped
    QUEUE_DISCARDED_OLDEST,  //!< Bounded queue full, oldest message dropped to make room
    QUEUE_TIMEOUT,           //!< Deadline passed while waiting
    QUEUE_CLOSED             //!< Queue closed; no further messages will flow
};

/**
 * \brief Queue overflow behavior mode
 */
enum QueueOverflowMode {
    QUEUE_DROP_NEWEST,  //!< Drop the newest (incoming) message on overflow
    QUEUE_DROP_OLDEST   //!< Drop the oldest (front) message on overflow
};

template <typename T>
class Queue {
  public:
    typedef std::chrono::steady_clock Clock;

    /**
     * \brief constructs an open queue
     *
     * \param depth: maximum number of queued messages, 0 for unbounded
     * \param overflow_mode: overflow handling mode, defaults to DROP_NEWEST
     */
    explicit Queue(FwSizeType depth = 0, QueueOverflowMode overflow_mode = QUEUE_DROP_NEWEST)
        : m_depth(depth), m_overflow_mode(overflow_mode), m_closed(false), m_high_water_mark(0) {}

    Queue(const Queue&) = delete;
    Queue& operator=(const Queue&) = delete;

    /**
     * \brief moves a message onto the back of the queue
     *
     * \return QUEUE_OK, QUEUE_FULL or QUEUE_DISCARDED_OLDEST for a full bounded queue, QUEUE_CLOSED once the
     * queue has been closed. The message is left untouched unless it was accepted.
     */
    QueueStatus enqueue(T&& message) {
        QueueStatus status = QUEUE_OK;
        {
            std::lock_guard<std::mutex> lock(this->m_mutex);
            if (this->m_closed) {
                return QUEUE_CLOSED;
            }
            if (this->m_depth != 0 && this->m_messages.size() >= this->m_depth) {
                if (this->m_overflow_mode == QUEUE_DROP_NEWEST) {
                    return QUEUE_FULL;
                }
                this->m_messages.pop_front();
                status = QUEUE_DISCARDED_OLDEST;
            }
            this->m_messages.push_back(std::move(message));
            if (this->m_messages.size() > this->m_high_water_mark) {
                this->m_high_water_mark = this->m_messages.size();
            }
        }
        this->m_cond.notify_one();
        return status;
    }

    QueueStatus enqueue(const T& message) {
        T copy(message);
        return this->enqueue(std::move(copy));
    }

    /**
     * \brief pops the front message without waiting
     *
     * \return QUEUE_OK, QUEUE_EMPTY, or QUEUE_CLOSED when the queue is closed and drained
     */
    QueueStatus tryDequeue(T& message) {
        std::lock_guard<std::mutex> lock(this->m_mutex);
        return this->popLocked(message);
    }

    /**
     * \brief pops the front message, waiting as long as it takes
     */
    QueueStatus dequeue(T& message) {
        std::unique_lock<std::mutex> lock(this->m_mutex);
        this->m_cond.wait(lock, [this] { return this->m_closed || !this->m_messages.empty(); });
        return this->popLocked(message);
    }

    /**
     * \brief pops the front message, waiting no later than deadline
     *
     * Messages queued before close() are still delivered; QUEUE_CLOSED is returned only once they are drained.
     */
    QueueStatus dequeueUntil(T& message, const Clock::time_point& deadline) {
        std::unique_lock<std::mutex> lock(this->m_mutex);
        if (!this->m_cond.wait_until(lock, deadline,
                                     [this] { return this->m_closed || !this->m_messages.empty(); })) {
            return QUEUE_TIMEOUT;
        }
        return this->popLocked(message);
    }

    /**
     * \brief pops the front message, waiting at most timeout
     */
    template <typename Rep, typename Period>
    QueueStatus dequeueFor(T& message, const std::chrono::duration<Rep, Period>& timeout) {
        return this->dequeueUntil(message, Clock::now() + timeout);
    }

    /**
     * \brief closes the queue and wakes all waiters
     */
    void close() {
        {
            std::lock_guard<std::mutex> lock(this->m_mutex);
            this->m_closed = true;
        }
        this->m_cond.notify_all();
    }

    bool isClosed() const {
        std::lock_guard<std::mutex> lock(this->m_mutex);
        return this->m_closed;
    }

    FwSizeType getQueueSize() const {
        std::lock_guard<std::mutex> lock(this->m_mutex);
        return this->m_messages.size();
    }

    /**
     * Return the largest number of messages queued at once
     */
    FwSizeType get_high_water_mark() const {
        std::lock_guard<std::mutex> lock(this->m_mutex);
        return this->m_high_water_mark;
    }

    /**
     * Clear tracking of the largest queue size
     */
    void clear_high_water_mark() {
        std::lock_guard<std::mutex> lock(this->m_mutex);
        this->m_high_water_mark = 0;
    }

  private:
    QueueStatus popLocked(T& message) {
        if (this->m_messages.empty()) {
            return this->m_closed ? QUEUE_CLOSED : QUEUE_EMPTY;
        }
        message = std::move(this->m_messages.front());
        this->m_messages.pop_front();
        return QUEUE_OK;
    }

    mutable std::mutex m_mutex;
    std::condition_variable m_cond;
    std::deque<T> m_messages;
    FwSizeType m_depth;
    QueueOverflowMode m_overflow_mode;
    bool m_closed;
    FwSizeType m_high_water_mark;
};

}  // namespace Utils
}  // namespace Cfdpd

#endif  // Cfdpd_Utils_Queue_HPP

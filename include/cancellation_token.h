#ifndef CANCELLATION_TOKEN_H
#define CANCELLATION_TOKEN_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

/**
 * @brief Cooperative cancellation flag shared between a worker and its owner
 *
 * cancel() wakes any waiter immediately. requestCancel() only sets the flag
 * and is safe to call from a signal handler; a waiter then notices it when
 * its current wait times out.
 */
class CancellationToken {
public:
    CancellationToken();

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    /**
     * @brief Request cancellation and wake all waiters
     */
    void cancel();

    /**
     * @brief Request cancellation without waking waiters (async-signal-safe)
     */
    void requestCancel();

    /**
     * @brief Check whether cancellation was requested
     */
    bool isCancelled() const;

    /**
     * @brief Sleep until cancelled or until the timeout elapses
     * @param timeout Maximum time to wait
     * @return True if cancellation was requested
     */
    bool waitFor(std::chrono::milliseconds timeout) const;

private:
    std::atomic<bool> m_cancelled;
    mutable std::mutex m_mutex;
    mutable std::condition_variable m_condition;
};

#endif // CANCELLATION_TOKEN_H

#include "cancellation_token.h"

CancellationToken::CancellationToken() : m_cancelled(false) {}

void CancellationToken::cancel() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_cancelled.store(true);
    }
    m_condition.notify_all();
}

void CancellationToken::requestCancel() {
    m_cancelled.store(true);
}

bool CancellationToken::isCancelled() const {
    return m_cancelled.load();
}

bool CancellationToken::waitFor(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_condition.wait_for(lock, timeout, [this] { return m_cancelled.load(); });
}

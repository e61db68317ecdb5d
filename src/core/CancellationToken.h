#pragma once

#include <atomic>

// Cooperative cancellation flag owned by whoever starts a scan or migration.
// Long-running operations poll it; nothing is interrupted mid-item.
class CancellationToken {
public:
    CancellationToken() = default;
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() { m_canceled.store(true, std::memory_order_relaxed); }
    void reset() { m_canceled.store(false, std::memory_order_relaxed); }
    bool isCanceled() const { return m_canceled.load(std::memory_order_relaxed); }

    // Null-safe poll for optional tokens
    static bool canceled(const CancellationToken* token)
    {
        return token && token->isCanceled();
    }

private:
    std::atomic<bool> m_canceled{false};
};

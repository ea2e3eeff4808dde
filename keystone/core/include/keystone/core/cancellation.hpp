#pragma once

#include <atomic>
#include <memory>

namespace keystone::core {

class CancellationSource;

// Observed at every suspension point of a cooperative operation.
// A default-constructed token can never be cancelled.
class CancellationToken {
public:
    CancellationToken() = default;

    bool is_cancellation_requested() const {
        return m_flag && m_flag->load(std::memory_order_acquire);
    }

    bool can_be_cancelled() const { return m_flag != nullptr; }

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<const std::atomic<bool>> flag)
        : m_flag(std::move(flag)) {}

    std::shared_ptr<const std::atomic<bool>> m_flag;
};

class CancellationSource {
public:
    CancellationSource() : m_flag(std::make_shared<std::atomic<bool>>(false)) {}

    CancellationToken token() const { return CancellationToken(m_flag); }

    // Safe to call from any thread
    void cancel() { m_flag->store(true, std::memory_order_release); }

    bool is_cancelled() const { return m_flag->load(std::memory_order_acquire); }

private:
    std::shared_ptr<std::atomic<bool>> m_flag;
};

} // namespace keystone::core

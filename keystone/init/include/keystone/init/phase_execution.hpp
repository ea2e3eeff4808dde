#pragma once

#include <keystone/core/event_dispatcher.hpp>
#include <keystone/core/runtime_settings.hpp>
#include <keystone/init/init_types.hpp>
#include <chrono>
#include <vector>

namespace keystone::init {

struct PhaseStatistics {
    size_t phases_completed = 0;
    size_t managers_initialized = 0;
    size_t managers_failed = 0;
    size_t total_attempts = 0;
    size_t retries = 0;
};

// ============================================================================
// PhaseExecutionService - brings one phase's managers up, one step at a time
// ============================================================================
//
// step() is a single suspension point: it either waits out the retry backoff
// or makes one initialization attempt. A manager gets up to
// max_recovery_attempts attempts (one when recovery is disabled); after the
// last failure it is reported once and the phase moves on.
class PhaseExecutionService {
public:
    PhaseExecutionService(core::EventDispatcher& events, const core::InitializerSettings& settings);

    // Emits PhaseStartedEvent. Managers are attempted in the given order.
    void begin_phase(InitializationPhase phase, std::vector<ManagerDescriptor*> managers = {});

    // Returns true once every manager of the phase has succeeded or failed
    bool step(float dt);

    // Emits PhaseCompletedEvent
    void complete_phase();

    // One initialization attempt; exceptions from the manager count as failure
    bool attempt(ManagerDescriptor& descriptor);

    bool phase_active() const { return m_active; }
    InitializationPhase current_phase() const { return m_phase; }
    uint32_t allowed_attempts() const;

    const PhaseStatistics& statistics() const { return m_stats; }

    // Successfully initialized managers in the order they came up
    const std::vector<ManagerDescriptor*>& initialization_order() const { return m_initialized_order; }

    void reset();

private:
    void finish_manager(ManagerDescriptor& descriptor, bool success);

    core::EventDispatcher& m_events;
    core::InitializerSettings m_settings;

    InitializationPhase m_phase = InitializationPhase::Discovery;
    std::vector<ManagerDescriptor*> m_queue;
    size_t m_index = 0;
    float m_backoff_remaining = 0.0f;
    bool m_active = false;
    size_t m_phase_succeeded = 0;
    size_t m_phase_failed = 0;
    std::chrono::steady_clock::time_point m_phase_start;

    PhaseStatistics m_stats;
    std::vector<ManagerDescriptor*> m_initialized_order;
};

} // namespace keystone::init

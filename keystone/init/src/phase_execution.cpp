#include <keystone/init/phase_execution.hpp>
#include <keystone/init/errors.hpp>
#include <keystone/init/init_events.hpp>
#include <keystone/core/log.hpp>
#include <algorithm>

namespace keystone::init {

PhaseExecutionService::PhaseExecutionService(core::EventDispatcher& events,
                                             const core::InitializerSettings& settings)
    : m_events(events)
    , m_settings(settings) {}

uint32_t PhaseExecutionService::allowed_attempts() const {
    if (!m_settings.enable_error_recovery) return 1;
    return std::max<uint32_t>(1, m_settings.max_recovery_attempts);
}

void PhaseExecutionService::begin_phase(InitializationPhase phase, std::vector<ManagerDescriptor*> managers) {
    if (m_active) {
        core::log(core::LogLevel::Warn, "[Init] Phase {} still active while starting {}",
                  to_string(m_phase), to_string(phase));
        complete_phase();
    }

    m_phase = phase;
    m_queue = std::move(managers);
    m_index = 0;
    m_backoff_remaining = 0.0f;
    m_phase_succeeded = 0;
    m_phase_failed = 0;
    m_phase_start = std::chrono::steady_clock::now();
    m_active = true;

    if (m_settings.enable_phase_logging) {
        core::log(core::LogLevel::Info, "[Init] Phase {} started ({} managers)", to_string(phase), m_queue.size());
    }
    m_events.dispatch(PhaseStartedEvent{phase, m_queue.size()});
}

bool PhaseExecutionService::step(float dt) {
    if (!m_active) return true;

    if (m_backoff_remaining > 0.0f) {
        m_backoff_remaining -= dt;
        if (m_backoff_remaining > 0.0f) {
            return false;
        }
        m_backoff_remaining = 0.0f;
    }

    if (m_index >= m_queue.size()) {
        return true;
    }

    ManagerDescriptor& descriptor = *m_queue[m_index];

    if (descriptor.initialized || descriptor.manager->is_initialized()) {
        // Brought up outside this run
        descriptor.initialized = true;
        finish_manager(descriptor, true);
        return m_index >= m_queue.size();
    }

    if (attempt(descriptor)) {
        finish_manager(descriptor, true);
        return m_index >= m_queue.size();
    }

    if (descriptor.attempts < allowed_attempts()) {
        ++m_stats.retries;
        m_backoff_remaining = m_settings.retry_backoff_seconds;
        core::log(core::LogLevel::Warn, "[Init] {} failed attempt {}/{}: {}", descriptor.name,
                  descriptor.attempts, allowed_attempts(), descriptor.last_error);
        return false;
    }

    finish_manager(descriptor, false);
    return m_index >= m_queue.size();
}

bool PhaseExecutionService::attempt(ManagerDescriptor& descriptor) {
    ++descriptor.attempts;
    ++m_stats.total_attempts;

    bool success = false;
    try {
        success = descriptor.manager->initialize();
        if (!success) {
            descriptor.last_error = "initialize() returned false";
        }
    } catch (const std::exception& e) {
        descriptor.last_error = e.what();
    }

    if (success) {
        descriptor.initialized = true;
        descriptor.last_error.clear();
    }
    return success;
}

void PhaseExecutionService::finish_manager(ManagerDescriptor& descriptor, bool success) {
    ++m_index;

    if (success) {
        ++m_phase_succeeded;
        ++m_stats.managers_initialized;
        m_initialized_order.push_back(&descriptor);
        if (m_settings.enable_phase_logging) {
            core::log(core::LogLevel::Info, "[Init] {} initialized ({} attempts)", descriptor.name, descriptor.attempts);
        }
        m_events.dispatch(ManagerInitializedEvent{
            descriptor.name, descriptor.type_name, descriptor.category, true, descriptor.attempts, {}
        });
        return;
    }

    ++m_phase_failed;
    ++m_stats.managers_failed;
    ManagerInitializationError error(descriptor.name, descriptor.attempts, descriptor.last_error);
    core::log(core::LogLevel::Error, "[Init] {}", error.what());

    m_events.dispatch(ManagerInitializedEvent{
        descriptor.name, descriptor.type_name, descriptor.category, false, descriptor.attempts, descriptor.last_error
    });
    m_events.dispatch(InitializationErrorEvent{error.what(), state_for(m_phase), false});
}

void PhaseExecutionService::complete_phase() {
    if (!m_active) return;
    m_active = false;
    ++m_stats.phases_completed;

    double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - m_phase_start).count();
    if (m_settings.enable_phase_logging) {
        core::log(core::LogLevel::Info, "[Init] Phase {} completed: {} ok, {} failed",
                  to_string(m_phase), m_phase_succeeded, m_phase_failed);
    }
    m_events.dispatch(PhaseCompletedEvent{m_phase, m_phase_succeeded, m_phase_failed, elapsed});
}

void PhaseExecutionService::reset() {
    m_active = false;
    m_queue.clear();
    m_index = 0;
    m_backoff_remaining = 0.0f;
    m_stats = PhaseStatistics{};
    m_initialized_order.clear();
}

} // namespace keystone::init

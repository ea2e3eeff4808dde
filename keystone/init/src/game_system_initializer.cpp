#include <keystone/init/game_system_initializer.hpp>
#include <keystone/init/errors.hpp>
#include <keystone/init/init_events.hpp>
#include <keystone/core/log.hpp>
#include <algorithm>

namespace keystone::init {

GameSystemInitializer::GameSystemInitializer(const core::InitializerSettings& settings,
                                             di::ServiceContainer* container)
    : m_settings(settings)
    , m_discovery(m_events, settings.enable_phase_logging)
    , m_phases(m_events, settings)
    , m_validation(m_events, settings.enable_phase_logging,
                   settings.validate_dependencies_after_init, settings.attempt_service_recovery) {
    m_discovery.set_auto_discover(settings.auto_discover_managers);
    m_validation.set_container(container);
}

bool GameSystemInitializer::begin(core::CancellationToken token) {
    if (m_in_progress) {
        core::log(core::LogLevel::Warn, "[Init] Bring-up already in progress ({}), request ignored",
                  to_string(m_state));
        return false;
    }

    m_token = std::move(token);
    m_result = InitializationResult{};
    m_phases.reset();
    m_delay_remaining = 0.0f;
    m_start = std::chrono::steady_clock::now();
    m_in_progress = true;

    core::log(core::LogLevel::Info, "[Init] Starting system initialization");
    set_state(InitializationState::Discovering);
    return true;
}

void GameSystemInitializer::update(float dt) {
    if (!m_in_progress) return;

    if (m_token.is_cancellation_requested()) {
        fail("Initialization cancelled");
        return;
    }

    if (m_delay_remaining > 0.0f) {
        m_delay_remaining -= dt;
        return;
    }

    try {
        advance(dt);
    } catch (const std::exception& e) {
        fail(e.what());
    }
}

InitializationResult GameSystemInitializer::run_to_completion(float dt, core::CancellationToken token) {
    if (dt <= 0.0f) dt = 1.0f / 60.0f;

    if (!m_in_progress && !begin(std::move(token))) {
        return m_result;
    }
    while (m_in_progress) {
        update(dt);
    }
    return m_result;
}

// ============================================================================
// State machine
// ============================================================================

void GameSystemInitializer::advance(float dt) {
    switch (m_state) {
        case InitializationState::Discovering: {
            m_phases.begin_phase(InitializationPhase::Discovery);
            DiscoveryResult discovery = m_discovery.discover_all();
            m_phases.complete_phase();
            if (!m_in_progress) break;

            if (!discovery.success) {
                throw InitializationError("Manager discovery failed: " + discovery.error_message);
            }
            if (discovery.discovered == 0) {
                throw NoManagersDiscoveredError();
            }
            start_phase(InitializationPhase::CoreSystems);
            break;
        }

        case InitializationState::InitializingCore:
        case InitializationState::InitializingDomain:
        case InitializationState::InitializingProgression:
        case InitializationState::InitializingUI: {
            if (!m_phases.step(dt)) break;
            // A handler may have shut the run down mid-step
            if (!m_in_progress) break;
            m_phases.complete_phase();

            switch (m_phase) {
                case InitializationPhase::CoreSystems:        start_phase(InitializationPhase::DomainSystems); break;
                case InitializationPhase::DomainSystems:      start_phase(InitializationPhase::ProgressionSystems); break;
                case InitializationPhase::ProgressionSystems: start_phase(InitializationPhase::UISystems); break;
                default:                                      start_phase(InitializationPhase::Validation); break;
            }
            break;
        }

        case InitializationState::Validating:
            run_validation();
            break;

        default:
            break;
    }
}

void GameSystemInitializer::start_phase(InitializationPhase phase) {
    m_phase = phase;
    set_state(state_for(phase));
    m_delay_remaining = m_settings.phase_delay_seconds;

    if (phase == InitializationPhase::Validation) return;

    std::vector<ManagerDescriptor*> managers;
    for (auto& descriptor : m_discovery.descriptors()) {
        if (phase_for(descriptor.category) == phase) {
            managers.push_back(&descriptor);
        }
    }
    m_phases.begin_phase(phase, std::move(managers));
}

void GameSystemInitializer::run_validation() {
    m_phases.begin_phase(InitializationPhase::Validation);

    if (m_settings.validate_dependencies_after_init || m_settings.attempt_service_recovery) {
        ValidationSummary summary = m_validation.validate_all(m_discovery.descriptors());
        m_result.validation = summary;
        if (!m_in_progress) return;
        m_phases.complete_phase();

        if (m_settings.fail_on_validation_errors && !summary.overall_valid) {
            if (!summary.cycles.empty()) {
                throw DependencyCycleError(summary.cycles.front());
            }
            if (!summary.missing_dependencies.empty()) {
                const auto& [manager, dependency] = summary.missing_dependencies.front();
                throw MissingDependencyError(manager, dependency);
            }
            throw InitializationError("System validation failed: " +
                                      (summary.all_errors.empty() ? std::string("unknown error")
                                                                  : summary.all_errors.front()));
        }
    } else {
        size_t initialized = SystemValidationService::refresh_status(m_discovery.descriptors());
        if (m_settings.enable_phase_logging) {
            core::log(core::LogLevel::Info, "[Init] Validation checks disabled; {}/{} managers initialized",
                      initialized, m_discovery.count());
        }
        m_phases.complete_phase();
    }

    complete();
}

void GameSystemInitializer::complete() {
    m_in_progress = false;

    size_t initialized = 0;
    for (const auto& descriptor : m_discovery.descriptors()) {
        if (descriptor.initialized) ++initialized;
    }

    m_result.success = true;
    m_result.initialized_manager_count = initialized;
    m_result.failed_manager_count = m_discovery.count() - initialized;
    m_result.elapsed_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - m_start).count();
    set_state(InitializationState::Running);
    m_result.final_state = m_state;

    core::log(core::LogLevel::Info, "[Init] System initialization complete: {} initialized, {} failed ({:.2f}s)",
              m_result.initialized_manager_count, m_result.failed_manager_count, m_result.elapsed_seconds);

    m_events.dispatch(InitializationCompletedEvent{
        true, m_result.initialized_manager_count, m_result.failed_manager_count, m_result.elapsed_seconds, {}
    });
}

void GameSystemInitializer::fail(const std::string& message) {
    InitializationState failed_in = m_state;
    m_in_progress = false;
    m_phases.complete_phase();

    size_t initialized = 0;
    for (const auto& descriptor : m_discovery.descriptors()) {
        if (descriptor.initialized) ++initialized;
    }

    m_result.success = false;
    m_result.error_message = message;
    m_result.initialized_manager_count = initialized;
    m_result.failed_manager_count = m_discovery.count() - initialized;
    m_result.elapsed_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - m_start).count();
    set_state(InitializationState::Error);
    m_result.final_state = m_state;

    core::log(core::LogLevel::Error, "[Init] Initialization failed during {}: {}", to_string(failed_in), message);

    m_events.dispatch(InitializationErrorEvent{message, failed_in, true});
    m_events.dispatch(InitializationCompletedEvent{
        false, m_result.initialized_manager_count, m_result.failed_manager_count,
        m_result.elapsed_seconds, message
    });
}

void GameSystemInitializer::set_state(InitializationState state) {
    if (m_state == state) return;
    if (m_settings.enable_phase_logging) {
        core::log(core::LogLevel::Debug, "[Init] {} -> {}", to_string(m_state), to_string(state));
    }
    m_state = state;
}

// ============================================================================
// Shutdown & queries
// ============================================================================

void GameSystemInitializer::shutdown() {
    if (m_in_progress) {
        core::log(core::LogLevel::Warn, "[Init] Shutdown requested during bring-up; aborting");
        fail("Initialization aborted by shutdown");
    }

    std::vector<ManagerDescriptor*> order = m_phases.initialization_order();
    for (auto& descriptor : m_discovery.descriptors()) {
        // Managers recovered during validation come up last
        if (descriptor.initialized && std::find(order.begin(), order.end(), &descriptor) == order.end()) {
            order.push_back(&descriptor);
        }
    }

    for (auto it = order.rbegin(); it != order.rend(); ++it) {
        ManagerDescriptor& descriptor = **it;
        try {
            descriptor.manager->shutdown();
        } catch (const std::exception& e) {
            core::log(core::LogLevel::Error, "[Init] {} failed to shut down: {}", descriptor.name, e.what());
        }
        descriptor.initialized = false;
    }

    if (!order.empty()) {
        core::log(core::LogLevel::Info, "[Init] Shut down {} managers", order.size());
    }

    m_phases.reset();
    m_state = InitializationState::NotStarted;
}

bool GameSystemInitializer::is_system_ready() const {
    if (m_state != InitializationState::Running) return false;
    const auto& descriptors = m_discovery.descriptors();
    return !descriptors.empty() &&
           std::all_of(descriptors.begin(), descriptors.end(), [](const ManagerDescriptor& d) {
               return d.manager && d.manager->is_initialized();
           });
}

InitializerStatistics GameSystemInitializer::statistics() const {
    InitializerStatistics stats;
    stats.discovered = m_discovery.count();
    for (const auto& descriptor : m_discovery.descriptors()) {
        if (descriptor.initialized) ++stats.initialized;
    }
    stats.failed = stats.discovered - stats.initialized;
    stats.total_attempts = m_phases.statistics().total_attempts;
    stats.retries = m_phases.statistics().retries;
    stats.system_initialized = is_initialized();
    return stats;
}

} // namespace keystone::init

#pragma once

#include <keystone/core/cancellation.hpp>
#include <keystone/core/event_dispatcher.hpp>
#include <keystone/core/runtime_settings.hpp>
#include <keystone/init/init_types.hpp>
#include <keystone/init/manager_discovery.hpp>
#include <keystone/init/manager_source.hpp>
#include <keystone/init/phase_execution.hpp>
#include <keystone/init/system_validation.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace keystone::di {
class ServiceContainer;
}

namespace keystone::init {

struct InitializationResult {
    bool success = false;
    size_t initialized_manager_count = 0;
    size_t failed_manager_count = 0;
    double elapsed_seconds = 0.0;
    std::string error_message;
    InitializationState final_state = InitializationState::NotStarted;
    std::optional<ValidationSummary> validation;
};

struct InitializerStatistics {
    size_t discovered = 0;
    size_t initialized = 0;
    size_t failed = 0;
    size_t total_attempts = 0;
    size_t retries = 0;
    bool system_initialized = false;
};

// ============================================================================
// GameSystemInitializer - phased bring-up of every discovered manager
// ============================================================================
//
// Cooperative and single-threaded. begin() starts a bring-up; the host calls
// update(dt) once per frame. Each update performs at most one step: a phase
// transition, one manager attempt, or a validation pass. The run always ends
// in Running or Error.
//
// Usage:
//   GameSystemInitializer init(settings.initializer, &container);
//   init.add_source(registry);
//   init.begin();
//   while (init.is_initializing()) init.update(dt);
class GameSystemInitializer {
public:
    explicit GameSystemInitializer(const core::InitializerSettings& settings = {},
                                   di::ServiceContainer* container = nullptr);

    GameSystemInitializer(const GameSystemInitializer&) = delete;
    GameSystemInitializer& operator=(const GameSystemInitializer&) = delete;

    // ========================================================================
    // Setup
    // ========================================================================

    void add_source(const IManagerSource& source) { m_discovery.add_source(source); }
    void add_manager(IManager& manager) { m_discovery.add_manager(manager); }

    // ========================================================================
    // Bring-up
    // ========================================================================

    // Rejected while a bring-up is in progress
    bool begin(core::CancellationToken token = {});

    // One step. No-op unless a bring-up is in progress.
    void update(float dt);

    // Drives update(dt) until the run ends; starts one if needed
    InitializationResult run_to_completion(float dt = 1.0f / 60.0f, core::CancellationToken token = {});

    // Shuts managers down in reverse initialization order. A bring-up still
    // in progress ends in Error first.
    void shutdown();

    // ========================================================================
    // Queries
    // ========================================================================

    InitializationState state() const { return m_state; }
    bool is_initializing() const { return m_in_progress; }
    bool is_initialized() const { return m_state == InitializationState::Running; }

    // Running, and every discovered manager reports initialized
    bool is_system_ready() const;

    const InitializationResult& result() const { return m_result; }
    InitializerStatistics statistics() const;

    const std::vector<ManagerDescriptor>& managers() const { return m_discovery.descriptors(); }

    template<typename T>
    T* get_manager() { return m_discovery.get_manager<T>(); }

    core::EventDispatcher& events() { return m_events; }
    const core::InitializerSettings& settings() const { return m_settings; }

private:
    void advance(float dt);
    void start_phase(InitializationPhase phase);
    void run_validation();
    void complete();
    void fail(const std::string& message);
    void set_state(InitializationState state);

    core::InitializerSettings m_settings;
    core::EventDispatcher m_events;
    ManagerDiscoveryService m_discovery;
    PhaseExecutionService m_phases;
    SystemValidationService m_validation;

    InitializationState m_state = InitializationState::NotStarted;
    InitializationPhase m_phase = InitializationPhase::Discovery;
    bool m_in_progress = false;
    float m_delay_remaining = 0.0f;
    core::CancellationToken m_token;
    std::chrono::steady_clock::time_point m_start;
    InitializationResult m_result;
};

} // namespace keystone::init

#pragma once

#include <keystone/init/init_types.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace keystone::init {

// Dispatched synchronously through GameSystemInitializer::events()

struct ManagerDiscoveredEvent {
    std::string name;
    std::string type_name;
    ManagerPriority priority;
    ManagerCategory category;
};

struct PhaseStartedEvent {
    InitializationPhase phase;
    size_t manager_count;
};

struct PhaseCompletedEvent {
    InitializationPhase phase;
    size_t succeeded;
    size_t failed;
    double elapsed_seconds;
};

// Exactly one per manager per phase: success, or failure once retries are exhausted
struct ManagerInitializedEvent {
    std::string name;
    std::string type_name;
    ManagerCategory category;
    bool success;
    uint32_t attempts;
    std::string error;
};

struct ManagerValidatedEvent {
    std::string name;
    bool valid;
    std::vector<std::string> errors;
};

struct ValidationCompletedEvent {
    bool overall_valid;
    size_t valid_systems;
    size_t invalid_systems;
};

struct InitializationErrorEvent {
    std::string message;
    InitializationState state;
    bool fatal;
};

struct InitializationCompletedEvent {
    bool success;
    size_t initialized_managers;
    size_t failed_managers;
    double elapsed_seconds;
    std::string error_message;
};

} // namespace keystone::init

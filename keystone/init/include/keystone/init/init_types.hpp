#pragma once

#include <keystone/init/manager.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <typeindex>
#include <typeinfo>

namespace keystone::init {

// Phases run strictly in this order
enum class InitializationPhase : uint8_t {
    Discovery,
    CoreSystems,
    DomainSystems,
    ProgressionSystems,
    UISystems,
    Validation
};

enum class InitializationState : uint8_t {
    NotStarted,
    Discovering,
    InitializingCore,
    InitializingDomain,
    InitializingProgression,
    InitializingUI,
    Validating,
    Running,
    Error
};

const char* to_string(InitializationPhase phase);
const char* to_string(InitializationState state);

// Phase that brings up a category's managers
InitializationPhase phase_for(ManagerCategory category);

InitializationState state_for(InitializationPhase phase);

// One discovered manager. Descriptors live in the discovery service for the
// duration of a bring-up; the manager itself is owned by the host.
struct ManagerDescriptor {
    IManager* manager = nullptr;
    std::type_index type = typeid(void);
    std::string type_name;          // qualified concrete type
    std::string name;
    ManagerPriority priority = ManagerPriority::Normal;
    ManagerCategory category = ManagerCategory::Domain;
    bool initialized = false;
    uint32_t attempts = 0;
    std::string last_error;
    size_t discovery_index = 0;
};

} // namespace keystone::init

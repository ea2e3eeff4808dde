#include <keystone/init/init_types.hpp>

namespace keystone::init {

const char* to_string(ManagerPriority priority) {
    switch (priority) {
        case ManagerPriority::Critical: return "Critical";
        case ManagerPriority::High:     return "High";
        case ManagerPriority::Normal:   return "Normal";
        case ManagerPriority::Low:      return "Low";
    }
    return "Unknown";
}

const char* to_string(ManagerCategory category) {
    switch (category) {
        case ManagerCategory::Core:        return "Core";
        case ManagerCategory::Domain:      return "Domain";
        case ManagerCategory::Progression: return "Progression";
        case ManagerCategory::UI:          return "UI";
    }
    return "Unknown";
}

ManagerCategory default_category(ManagerPriority priority) {
    switch (priority) {
        case ManagerPriority::Critical:
        case ManagerPriority::High:
            return ManagerCategory::Core;
        case ManagerPriority::Normal:
            return ManagerCategory::Domain;
        case ManagerPriority::Low:
            return ManagerCategory::UI;
    }
    return ManagerCategory::Domain;
}

const char* to_string(InitializationPhase phase) {
    switch (phase) {
        case InitializationPhase::Discovery:          return "Discovery";
        case InitializationPhase::CoreSystems:        return "CoreSystems";
        case InitializationPhase::DomainSystems:      return "DomainSystems";
        case InitializationPhase::ProgressionSystems: return "ProgressionSystems";
        case InitializationPhase::UISystems:          return "UISystems";
        case InitializationPhase::Validation:         return "Validation";
    }
    return "Unknown";
}

const char* to_string(InitializationState state) {
    switch (state) {
        case InitializationState::NotStarted:              return "NotStarted";
        case InitializationState::Discovering:             return "Discovering";
        case InitializationState::InitializingCore:        return "InitializingCore";
        case InitializationState::InitializingDomain:      return "InitializingDomain";
        case InitializationState::InitializingProgression: return "InitializingProgression";
        case InitializationState::InitializingUI:          return "InitializingUI";
        case InitializationState::Validating:              return "Validating";
        case InitializationState::Running:                 return "Running";
        case InitializationState::Error:                   return "Error";
    }
    return "Unknown";
}

InitializationPhase phase_for(ManagerCategory category) {
    switch (category) {
        case ManagerCategory::Core:        return InitializationPhase::CoreSystems;
        case ManagerCategory::Domain:      return InitializationPhase::DomainSystems;
        case ManagerCategory::Progression: return InitializationPhase::ProgressionSystems;
        case ManagerCategory::UI:          return InitializationPhase::UISystems;
    }
    return InitializationPhase::DomainSystems;
}

InitializationState state_for(InitializationPhase phase) {
    switch (phase) {
        case InitializationPhase::Discovery:          return InitializationState::Discovering;
        case InitializationPhase::CoreSystems:        return InitializationState::InitializingCore;
        case InitializationPhase::DomainSystems:      return InitializationState::InitializingDomain;
        case InitializationPhase::ProgressionSystems: return InitializationState::InitializingProgression;
        case InitializationPhase::UISystems:          return InitializationState::InitializingUI;
        case InitializationPhase::Validation:         return InitializationState::Validating;
    }
    return InitializationState::Error;
}

// ============================================================================
// ManagerBase
// ============================================================================

ManagerBase::ManagerBase(std::string name, ManagerPriority priority, std::vector<std::string> dependencies)
    : m_name(std::move(name))
    , m_priority(priority)
    , m_dependencies(std::move(dependencies)) {}

bool ManagerBase::initialize() {
    if (m_initialized) return true;
    m_initialized = on_initialize();
    return m_initialized;
}

void ManagerBase::shutdown() {
    if (!m_initialized) return;
    on_shutdown();
    m_initialized = false;
}

} // namespace keystone::init

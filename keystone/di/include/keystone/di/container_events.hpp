#pragma once

#include <keystone/di/service_registration.hpp>
#include <string>
#include <typeindex>

namespace keystone::di {

// Dispatched synchronously through ServiceContainer::events()

struct ServiceRegisteredEvent {
    std::type_index capability;
    std::string capability_name;
    std::string implementation_name;
    std::string name;
    ServiceLifetime lifetime;
};

struct ServiceResolvedEvent {
    std::type_index capability;
    std::string capability_name;
    std::string name;
    bool from_cache;
};

struct ResolutionFailedEvent {
    std::type_index capability;
    std::string capability_name;
    std::string name;
    std::string reason;
};

} // namespace keystone::di

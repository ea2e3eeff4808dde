#pragma once

#include <keystone/di/service_registration.hpp>
#include <memory>
#include <string>

namespace keystone::di {

// Resolution surface shared by the container, the locator and locator scopes.
// Factories receive the resolver that is materializing them.
class IServiceResolver {
public:
    virtual ~IServiceResolver() = default;

    // Throws UnresolvedServiceError (or a subclass) when nothing is bound
    template<typename T>
    std::shared_ptr<T> resolve() {
        return std::static_pointer_cast<T>(resolve_key(ServiceKey::of<T>(), true));
    }

    // Empty pointer when nothing is bound
    template<typename T>
    std::shared_ptr<T> try_resolve() {
        return std::static_pointer_cast<T>(resolve_key(ServiceKey::of<T>(), false));
    }

    template<typename T>
    std::shared_ptr<T> resolve_named(const std::string& name) {
        return std::static_pointer_cast<T>(resolve_key(ServiceKey::of<T>(name), true));
    }

    template<typename T>
    std::shared_ptr<T> try_resolve_named(const std::string& name) {
        return std::static_pointer_cast<T>(resolve_key(ServiceKey::of<T>(name), false));
    }

    template<typename T>
    bool is_registered() const {
        return contains(ServiceKey::of<T>());
    }

    template<typename T>
    bool is_registered_named(const std::string& name) const {
        return contains(ServiceKey::of<T>(name));
    }

    // With required == false a missing binding yields nullptr; service errors
    // raised while materializing are reported through events and logging.
    virtual std::shared_ptr<void> resolve_key(const ServiceKey& key, bool required) = 0;
    virtual bool contains(const ServiceKey& key) const = 0;
};

} // namespace keystone::di

#pragma once

#include <keystone/core/type_name.hpp>
#include <keystone/di/disposable.hpp>
#include <keystone/di/health_check.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <typeindex>
#include <utility>

namespace keystone::di {

class IServiceResolver;

enum class ServiceLifetime : uint8_t {
    Singleton,
    Transient,
    Scoped      // Singleton within the owning container or locator scope
};

const char* to_string(ServiceLifetime lifetime);

// What happens when a capability that already has a binding is registered again
enum class DuplicatePolicy : uint8_t {
    Strict,     // throw DuplicateRegistrationError
    LastWins    // overwrite and log a warning
};

const char* to_string(DuplicatePolicy policy);

// Accepts "strict" and "last_wins"; anything else falls back to Strict with a warning
DuplicatePolicy parse_duplicate_policy(const std::string& text);

struct ServiceKey {
    std::type_index type;
    std::string name;   // empty for the default binding

    bool operator==(const ServiceKey& other) const = default;

    template<typename T>
    static ServiceKey of(std::string name = {}) {
        return ServiceKey{std::type_index(typeid(T)), std::move(name)};
    }
};

struct ServiceKeyHash {
    size_t operator()(const ServiceKey& key) const {
        size_t h = std::hash<std::type_index>{}(key.type);
        return h ^ (std::hash<std::string>{}(key.name) + 0x9e3779b9 + (h << 6) + (h >> 2));
    }
};

std::string describe(const ServiceKey& key);

template<typename T>
using Factory = std::function<std::shared_ptr<T>(IServiceResolver&)>;

using ErasedFactory = std::function<std::shared_ptr<void>(IServiceResolver&)>;

// Type-erased binding of one capability. Instances are stored as a pointer to
// the capability type, so a static_pointer_cast back to it is always valid.
struct ServiceRegistration {
    explicit ServiceRegistration(ServiceKey service_key)
        : key(std::move(service_key)) {}

    ServiceKey key;
    std::string capability_name;
    std::string implementation_name;
    ServiceLifetime lifetime = ServiceLifetime::Singleton;

    std::shared_ptr<void> instance;     // pre-built or cached
    ErasedFactory factory;
    ErasedFactory constructor;          // direct default construction

    std::function<IDisposable*(const std::shared_ptr<void>&)> as_disposable;
    std::function<const IHealthCheckable*(const std::shared_ptr<void>&)> as_health_checkable;
    std::function<std::string(const std::shared_ptr<void>&)> runtime_type_name;

    // Binding this one decorates; kept for disposal
    std::shared_ptr<ServiceRegistration> inner;

    uint64_t sequence = 0;
    bool collection_member = false;

    bool has_construction_strategy() const {
        return instance != nullptr || factory != nullptr || constructor != nullptr;
    }
};

namespace detail {

template<typename T>
IDisposable* disposable_of(const std::shared_ptr<void>& instance) {
    if (!instance) return nullptr;
    T* typed = static_cast<T*>(instance.get());
    if constexpr (std::is_base_of_v<IDisposable, T>) {
        return static_cast<IDisposable*>(typed);
    } else if constexpr (std::is_polymorphic_v<T>) {
        return dynamic_cast<IDisposable*>(typed);
    } else {
        return nullptr;
    }
}

template<typename T>
const IHealthCheckable* health_checkable_of(const std::shared_ptr<void>& instance) {
    if (!instance) return nullptr;
    const T* typed = static_cast<const T*>(instance.get());
    if constexpr (std::is_base_of_v<IHealthCheckable, T>) {
        return static_cast<const IHealthCheckable*>(typed);
    } else if constexpr (std::is_polymorphic_v<T>) {
        return dynamic_cast<const IHealthCheckable*>(typed);
    } else {
        return nullptr;
    }
}

template<typename T>
std::string runtime_type_name_of(const std::shared_ptr<void>& instance) {
    if constexpr (std::is_polymorphic_v<T>) {
        if (instance) {
            return core::demangle(typeid(*static_cast<T*>(instance.get())).name());
        }
    }
    return core::type_name<T>();
}

} // namespace detail

template<typename T>
std::shared_ptr<ServiceRegistration> make_registration(ServiceLifetime lifetime, std::string name = {}) {
    auto reg = std::make_shared<ServiceRegistration>(ServiceKey::of<T>(std::move(name)));
    reg->capability_name = core::type_name<T>();
    reg->implementation_name = reg->capability_name;
    reg->lifetime = lifetime;
    reg->as_disposable = &detail::disposable_of<T>;
    reg->as_health_checkable = &detail::health_checkable_of<T>;
    reg->runtime_type_name = &detail::runtime_type_name_of<T>;
    return reg;
}

template<typename T>
void bind_instance(ServiceRegistration& reg, std::shared_ptr<T> instance) {
    reg.implementation_name = detail::runtime_type_name_of<T>(instance);
    reg.instance = std::move(instance);
}

template<typename T>
void bind_factory(ServiceRegistration& reg, Factory<T> factory) {
    reg.factory = [factory = std::move(factory)](IServiceResolver& resolver) -> std::shared_ptr<void> {
        std::shared_ptr<T> created = factory(resolver);
        return created;
    };
}

template<typename T, typename Impl>
void bind_constructor(ServiceRegistration& reg) {
    static_assert(std::is_base_of_v<T, Impl> || std::is_same_v<T, Impl>,
                  "Implementation must derive from the capability");
    static_assert(std::is_default_constructible_v<Impl>,
                  "Implementation needs a default constructor or a factory");
    reg.implementation_name = core::type_name<Impl>();
    reg.constructor = [](IServiceResolver&) -> std::shared_ptr<void> {
        std::shared_ptr<T> created = std::make_shared<Impl>();
        return created;
    };
}

// Read-only view of a binding, returned by registrations()
struct RegistrationInfo {
    std::string capability_name;
    std::string implementation_name;
    std::string name;
    ServiceLifetime lifetime = ServiceLifetime::Singleton;
    bool materialized = false;
    bool decorated = false;
    bool collection_member = false;
};

} // namespace keystone::di

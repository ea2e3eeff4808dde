#pragma once

#include <keystone/core/event_dispatcher.hpp>
#include <keystone/di/container_events.hpp>
#include <keystone/di/errors.hpp>
#include <keystone/di/registration_store.hpp>
#include <keystone/di/service_resolver.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <typeindex>
#include <vector>

namespace keystone::di {

struct ContainerValidationResult {
    bool is_valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    size_t services_validated = 0;
};

struct ContainerStatistics {
    size_t total_registrations = 0;
    size_t singleton_services = 0;
    size_t transient_services = 0;
    size_t scoped_services = 0;
    uint64_t resolutions = 0;
    uint64_t failed_resolutions = 0;
};

// ============================================================================
// ServiceContainer - owns registrations and the singletons it materializes
// ============================================================================
//
// Lookup order on resolve: registration map, cached instance, factory, direct
// default construction. A child container resolves locally first and then
// falls back to its parent, which must outlive it.
//
// Not thread-safe; every call is expected on the thread that drives start-up.
class ServiceContainer : public IServiceResolver {
public:
    explicit ServiceContainer(DuplicatePolicy policy = DuplicatePolicy::Strict);
    ~ServiceContainer() override;

    ServiceContainer(const ServiceContainer&) = delete;
    ServiceContainer& operator=(const ServiceContainer&) = delete;

    // ========================================================================
    // Registration
    // ========================================================================

    template<typename T>
    void register_singleton(std::shared_ptr<T> instance) {
        if (!instance) {
            throw ServiceError("Null instance registered for " + core::type_name<T>());
        }
        auto reg = make_registration<T>(ServiceLifetime::Singleton);
        bind_instance<T>(*reg, std::move(instance));
        add(std::move(reg));
    }

    template<typename T>
    void register_singleton(Factory<T> factory) {
        auto reg = make_registration<T>(ServiceLifetime::Singleton);
        bind_factory<T>(*reg, std::move(factory));
        add(std::move(reg));
    }

    template<typename T, typename Impl = T>
    void register_singleton() {
        auto reg = make_registration<T>(ServiceLifetime::Singleton);
        bind_constructor<T, Impl>(*reg);
        add(std::move(reg));
    }

    template<typename T, typename Impl = T>
    void register_transient() {
        auto reg = make_registration<T>(ServiceLifetime::Transient);
        bind_constructor<T, Impl>(*reg);
        add(std::move(reg));
    }

    template<typename T>
    void register_transient(Factory<T> factory) {
        register_factory<T>(std::move(factory));
    }

    // New instance per resolution
    template<typename T>
    void register_factory(Factory<T> factory) {
        auto reg = make_registration<T>(ServiceLifetime::Transient);
        bind_factory<T>(*reg, std::move(factory));
        add(std::move(reg));
    }

    // Scoped behaves as Singleton within a container
    template<typename T, typename Impl = T>
    void register_scoped() {
        auto reg = make_registration<T>(ServiceLifetime::Scoped);
        bind_constructor<T, Impl>(*reg);
        add(std::move(reg));
    }

    template<typename T>
    void register_scoped(Factory<T> factory) {
        auto reg = make_registration<T>(ServiceLifetime::Scoped);
        bind_factory<T>(*reg, std::move(factory));
        add(std::move(reg));
    }

    template<typename T, typename Impl = T>
    void register_named(std::string name, ServiceLifetime lifetime = ServiceLifetime::Singleton) {
        auto reg = make_registration<T>(lifetime, std::move(name));
        bind_constructor<T, Impl>(*reg);
        add(std::move(reg));
    }

    template<typename T>
    void register_named(std::string name, std::shared_ptr<T> instance) {
        if (!instance) {
            throw ServiceError("Null instance registered for " + core::type_name<T>());
        }
        auto reg = make_registration<T>(ServiceLifetime::Singleton, std::move(name));
        bind_instance<T>(*reg, std::move(instance));
        add(std::move(reg));
    }

    template<typename T>
    void register_named(std::string name, Factory<T> factory, ServiceLifetime lifetime = ServiceLifetime::Singleton) {
        auto reg = make_registration<T>(lifetime, std::move(name));
        bind_factory<T>(*reg, std::move(factory));
        add(std::move(reg));
    }

    // Predicate runs once, now. Returns whether the binding was made.
    template<typename T, typename Impl = T>
    bool register_conditional(const std::function<bool(IServiceResolver&)>& predicate,
                              ServiceLifetime lifetime = ServiceLifetime::Singleton) {
        if (!predicate(*this)) {
            return false;
        }
        auto reg = make_registration<T>(lifetime);
        bind_constructor<T, Impl>(*reg);
        add(std::move(reg));
        return true;
    }

    // Wraps the current binding of T, keeping its lifetime.
    // Throws UnresolvedServiceError when T has no binding in this container.
    template<typename T>
    void register_decorator(std::function<std::shared_ptr<T>(std::shared_ptr<T>, IServiceResolver&)> wrap) {
        ensure_not_disposed();
        auto current = m_store.find(ServiceKey::of<T>());
        if (!current) {
            throw UnresolvedServiceError(core::type_name<T>(), "cannot decorate a capability with no binding");
        }

        auto reg = make_registration<T>(current->lifetime);
        reg->implementation_name = current->implementation_name;
        reg->inner = current;
        reg->factory = [inner = current, wrap = std::move(wrap)](IServiceResolver& resolver) -> std::shared_ptr<void> {
            auto base = std::static_pointer_cast<T>(RegistrationStore::materialize(*inner, resolver));
            std::shared_ptr<T> decorated = wrap(std::move(base), resolver);
            return decorated;
        };
        m_store.replace(reg);
        notify_registered(*reg);
    }

    // Every Impl becomes a member; resolve<T>() returns the last one
    template<typename T, typename... Impls>
    void register_collection(ServiceLifetime lifetime = ServiceLifetime::Singleton) {
        static_assert(sizeof...(Impls) > 0, "Collection needs at least one implementation");
        ensure_not_disposed();
        (add_collection_member<T, Impls>(lifetime), ...);
    }

    // Registers instance only when T has no binding yet (locally or in a parent)
    template<typename T>
    bool register_if_absent(std::shared_ptr<T> instance) {
        if (is_registered<T>()) {
            return false;
        }
        register_singleton<T>(std::move(instance));
        return true;
    }

    // Type-erased registration, used by discovery catalogs and the bootstrapper
    void add(std::shared_ptr<ServiceRegistration> reg);

    template<typename T>
    bool unregister() {
        return unregister(ServiceKey::of<T>());
    }

    bool unregister(const ServiceKey& key);

    // Disposes materialized singletons and forgets every registration
    void clear();

    // ========================================================================
    // Resolution
    // ========================================================================

    template<typename T>
    std::vector<std::shared_ptr<T>> resolve_all() {
        std::vector<std::shared_ptr<T>> result;
        for (auto& instance : resolve_all_erased(std::type_index(typeid(T)))) {
            result.push_back(std::static_pointer_cast<T>(instance));
        }
        return result;
    }

    // Resolves T, or registers factory as a singleton and resolves through it
    template<typename T>
    std::shared_ptr<T> resolve_or_create(Factory<T> factory) {
        if (!is_registered<T>()) {
            register_singleton<T>(std::move(factory));
        }
        return resolve<T>();
    }

    std::shared_ptr<void> resolve_key(const ServiceKey& key, bool required) override;
    bool contains(const ServiceKey& key) const override;

    // ========================================================================
    // Introspection
    // ========================================================================

    std::vector<std::type_index> registered_types() const;
    // Active bindings, named ones included, in registration order
    std::vector<ServiceKey> registered_keys() const;
    std::vector<RegistrationInfo> registrations() const;

    // Binding that would serve key here or in a parent; nullptr when unbound
    std::shared_ptr<ServiceRegistration> find_registration(const ServiceKey& key) const;

    // Builds every binding that has no instance yet, plus collection members,
    // on a scratch resolver that caches nothing. A binding is an error when
    // construction throws, yields null, needs an unbound service or loops back
    // on itself. Decorated bindings are checked through their inner binding.
    // A singleton built from a transient is a warning.
    ContainerValidationResult verify() const;
    ContainerStatistics statistics() const;

    std::unique_ptr<ServiceContainer> create_child_container();
    ServiceContainer* parent() const { return m_parent; }

    DuplicatePolicy duplicate_policy() const { return m_store.policy(); }
    void set_duplicate_policy(DuplicatePolicy policy) { m_store.set_policy(policy); }

    core::EventDispatcher& events() { return m_events; }

    // ========================================================================
    // Disposal
    // ========================================================================

    // Disposes every materialized IDisposable singleton once. Afterwards
    // registration throws and resolve throws ContainerDisposedError.
    void dispose();
    bool is_disposed() const { return m_disposed; }

private:
    template<typename T, typename Impl>
    void add_collection_member(ServiceLifetime lifetime) {
        auto reg = make_registration<T>(lifetime);
        bind_constructor<T, Impl>(*reg);
        m_store.add_collection_member(reg);
        notify_registered(*reg);
    }

    std::vector<std::shared_ptr<void>> resolve_all_erased(std::type_index type);
    void ensure_not_disposed() const;
    void notify_registered(const ServiceRegistration& reg);
    void report_failure(const ServiceKey& key, const std::string& reason);
    void dispose_instances();

    RegistrationStore m_store;
    ServiceContainer* m_parent = nullptr;
    core::EventDispatcher m_events;
    uint64_t m_resolutions = 0;
    uint64_t m_failed_resolutions = 0;
    bool m_disposed = false;
};

} // namespace keystone::di

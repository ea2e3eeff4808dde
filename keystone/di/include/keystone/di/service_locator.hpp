#pragma once

#include <keystone/core/runtime_settings.hpp>
#include <keystone/di/errors.hpp>
#include <keystone/di/registration_store.hpp>
#include <keystone/di/service_catalog.hpp>
#include <keystone/di/service_resolver.hpp>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace keystone::di {

class ServiceLocator;

struct LocatorMetrics {
    uint64_t total_resolutions = 0;
    uint64_t cache_hits = 0;
    double cache_hit_rate = 0.0;
    uint64_t failed_resolutions = 0;
    uint64_t discovery_attempts = 0;
    uint64_t discovered_services = 0;
    size_t registered_services = 0;
    size_t cached_services = 0;
    size_t active_scopes = 0;
    std::unordered_map<std::string, uint64_t> resolutions_by_type;
    std::unordered_map<std::string, uint64_t> cache_hits_by_service;   // keyed by describe(key)
};

// ============================================================================
// ServiceScope - per-scope instances of Scoped registrations
// ============================================================================
//
// Everything that is not Scoped resolves through the owning locator.
// Destroying the scope detaches it from the locator's active-scope list.
class ServiceScope : public IServiceResolver {
public:
    ~ServiceScope() override;

    ServiceScope(const ServiceScope&) = delete;
    ServiceScope& operator=(const ServiceScope&) = delete;

    std::shared_ptr<void> resolve_key(const ServiceKey& key, bool required) override;
    bool contains(const ServiceKey& key) const override;

    uint64_t id() const { return m_id; }
    size_t instance_count() const { return m_instances.size(); }

private:
    friend class ServiceLocator;
    ServiceScope(ServiceLocator& locator, uint64_t id);

    ServiceLocator& m_locator;
    uint64_t m_id;
    std::unordered_map<ServiceKey, std::shared_ptr<void>, ServiceKeyHash> m_instances;
};

// ============================================================================
// ServiceLocator - process-wide lookup facade
// ============================================================================
//
// Lookup strategies, in order: resolution cache, registration, auto-discovery
// through the attached IDiscoverySources (a discovered instance is registered
// and cached). Every public call holds one recursive lock, so factories may
// call back into the locator.
class ServiceLocator : public IServiceResolver {
public:
    static ServiceLocator& instance();

    explicit ServiceLocator(const core::LocatorSettings& settings = {});
    ~ServiceLocator() override;

    ServiceLocator(const ServiceLocator&) = delete;
    ServiceLocator& operator=(const ServiceLocator&) = delete;

    // ========================================================================
    // Registration
    // ========================================================================

    template<typename T>
    void register_service(std::shared_ptr<T> instance) {
        if (!instance) {
            throw ServiceError("Null instance registered for " + core::type_name<T>());
        }
        auto reg = make_registration<T>(ServiceLifetime::Singleton);
        bind_instance<T>(*reg, std::move(instance));
        add(std::move(reg));
    }

    template<typename T, typename Impl = T>
    void register_service(ServiceLifetime lifetime = ServiceLifetime::Singleton) {
        auto reg = make_registration<T>(lifetime);
        bind_constructor<T, Impl>(*reg);
        add(std::move(reg));
    }

    template<typename T>
    void register_factory(Factory<T> factory, ServiceLifetime lifetime = ServiceLifetime::Transient) {
        auto reg = make_registration<T>(lifetime);
        bind_factory<T>(*reg, std::move(factory));
        add(std::move(reg));
    }

    void add(std::shared_ptr<ServiceRegistration> reg);

    template<typename T>
    bool unregister() {
        return unregister(ServiceKey::of<T>());
    }

    bool unregister(const ServiceKey& key);

    // ========================================================================
    // Resolution
    // ========================================================================

    // Throws ServiceNotFoundError when every strategy fails
    std::shared_ptr<void> resolve_key(const ServiceKey& key, bool required) override;
    bool contains(const ServiceKey& key) const override;

    std::unique_ptr<ServiceScope> create_scope();

    // ========================================================================
    // Configuration
    // ========================================================================

    void add_discovery_source(IDiscoverySource* source);
    void remove_discovery_source(IDiscoverySource* source);

    void set_auto_discovery(bool enabled);
    void set_caching(bool enabled);
    void set_duplicate_policy(DuplicatePolicy policy);
    bool auto_discovery_enabled() const;
    bool caching_enabled() const;

    LocatorMetrics metrics() const;
    void clear_cache();

    // Drops registrations, cache, sources and counters, then registers itself again
    void reset();

private:
    friend class ServiceScope;

    struct CacheEntry {
        std::shared_ptr<void> instance;
        uint64_t hits = 0;
    };

    std::shared_ptr<ServiceRegistration> find_registration(const ServiceKey& key) const;
    std::shared_ptr<void> discover(const ServiceKey& key);
    void register_self();
    void detach_scope(ServiceScope* scope);

    mutable std::recursive_mutex m_mutex;
    RegistrationStore m_store;
    std::unordered_map<ServiceKey, CacheEntry, ServiceKeyHash> m_cache;
    std::vector<IDiscoverySource*> m_sources;
    std::vector<ServiceScope*> m_scopes;

    bool m_auto_discovery;
    bool m_caching;

    uint64_t m_total_resolutions = 0;
    uint64_t m_cache_hits = 0;
    uint64_t m_failed_resolutions = 0;
    uint64_t m_discovery_attempts = 0;
    uint64_t m_discovered_services = 0;
    uint64_t m_next_scope_id = 1;
    std::unordered_map<std::type_index, uint64_t> m_resolution_counts;
};

} // namespace keystone::di

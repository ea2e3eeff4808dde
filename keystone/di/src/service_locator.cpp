#include <keystone/di/service_locator.hpp>
#include <keystone/core/log.hpp>
#include <algorithm>

namespace keystone::di {

// ============================================================================
// ServiceScope
// ============================================================================

ServiceScope::ServiceScope(ServiceLocator& locator, uint64_t id)
    : m_locator(locator)
    , m_id(id) {}

ServiceScope::~ServiceScope() {
    m_locator.detach_scope(this);
}

std::shared_ptr<void> ServiceScope::resolve_key(const ServiceKey& key, bool required) {
    std::lock_guard<std::recursive_mutex> lock(m_locator.m_mutex);

    auto reg = m_locator.find_registration(key);
    if (!reg || reg->lifetime != ServiceLifetime::Scoped) {
        return m_locator.resolve_key(key, required);
    }

    auto it = m_instances.find(key);
    if (it != m_instances.end()) {
        return it->second;
    }

    // Materialize without touching the locator-wide cached instance
    std::shared_ptr<void> created;
    try {
        if (reg->factory) {
            created = reg->factory(*this);
        } else if (reg->constructor) {
            created = reg->constructor(*this);
        } else {
            created = reg->instance;
        }
        if (!created) {
            throw UnresolvedServiceError(reg->capability_name, "factory returned null");
        }
    } catch (const ServiceError& e) {
        if (required) throw;
        core::log(core::LogLevel::Debug, "[Locator] Scoped resolve of {} failed: {}", describe(key), e.what());
        return nullptr;
    }

    m_instances.emplace(key, created);
    return created;
}

bool ServiceScope::contains(const ServiceKey& key) const {
    return m_locator.contains(key);
}

// ============================================================================
// ServiceLocator
// ============================================================================

ServiceLocator& ServiceLocator::instance() {
    static ServiceLocator s_instance;
    return s_instance;
}

ServiceLocator::ServiceLocator(const core::LocatorSettings& settings)
    : m_store(parse_duplicate_policy(settings.duplicate_policy), "[Locator]")
    , m_auto_discovery(settings.auto_discovery)
    , m_caching(settings.caching) {
    register_self();
}

ServiceLocator::~ServiceLocator() = default;

void ServiceLocator::register_self() {
    // Non-owning: aliasing constructor with an empty owner
    std::shared_ptr<ServiceLocator> self(std::shared_ptr<ServiceLocator>{}, this);
    auto reg = make_registration<ServiceLocator>(ServiceLifetime::Singleton);
    bind_instance<ServiceLocator>(*reg, self);
    m_store.replace(reg);
}

void ServiceLocator::add(std::shared_ptr<ServiceRegistration> reg) {
    if (!reg || !reg->has_construction_strategy()) {
        throw ServiceError("Locator registration has no instance, factory or constructor");
    }

    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    ServiceKey key = reg->key;
    std::string implementation = reg->implementation_name;
    m_store.add(std::move(reg));
    m_cache.erase(key);
    core::log(core::LogLevel::Debug, "[Locator] Registered {} -> {}", describe(key), implementation);
}

bool ServiceLocator::unregister(const ServiceKey& key) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    m_cache.erase(key);
    return m_store.remove(key);
}

std::shared_ptr<ServiceRegistration> ServiceLocator::find_registration(const ServiceKey& key) const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_store.find(key);
}

std::shared_ptr<void> ServiceLocator::resolve_key(const ServiceKey& key, bool required) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);

    ++m_total_resolutions;
    ++m_resolution_counts[key.type];

    // 1. Cache
    if (m_caching) {
        auto it = m_cache.find(key);
        if (it != m_cache.end()) {
            ++it->second.hits;
            ++m_cache_hits;
            return it->second.instance;
        }
    }

    // 2. Registration
    if (auto reg = m_store.find(key)) {
        try {
            auto instance = RegistrationStore::materialize(*reg, *this);
            if (m_caching && reg->lifetime != ServiceLifetime::Transient) {
                m_cache[key] = CacheEntry{instance, 0};
            }
            return instance;
        } catch (const ServiceError& e) {
            ++m_failed_resolutions;
            if (required) throw;
            core::log(core::LogLevel::Debug, "[Locator] try_resolve of {} failed: {}", describe(key), e.what());
            return nullptr;
        }
    }

    // 3. Discovery
    if (m_auto_discovery && key.name.empty()) {
        if (auto instance = discover(key)) {
            return instance;
        }
    }

    ++m_failed_resolutions;
    if (required) {
        core::log(core::LogLevel::Warn, "[Locator] Service not found: {}", describe(key));
        throw ServiceNotFoundError(describe(key));
    }
    return nullptr;
}

std::shared_ptr<void> ServiceLocator::discover(const ServiceKey& key) {
    ++m_discovery_attempts;

    for (IDiscoverySource* source : m_sources) {
        auto reg = source->discover(key.type);
        if (!reg || !reg->instance) {
            continue;
        }

        auto instance = reg->instance;
        m_store.add(reg);
        if (m_caching) {
            m_cache[key] = CacheEntry{instance, 0};
        }
        ++m_discovered_services;
        core::log(core::LogLevel::Info, "[Locator] Auto-discovered {} ({})",
                  describe(key), reg->implementation_name);
        return instance;
    }

    return nullptr;
}

bool ServiceLocator::contains(const ServiceKey& key) const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_store.contains(key) || m_cache.find(key) != m_cache.end();
}

std::unique_ptr<ServiceScope> ServiceLocator::create_scope() {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    std::unique_ptr<ServiceScope> scope(new ServiceScope(*this, m_next_scope_id++));
    m_scopes.push_back(scope.get());
    core::log(core::LogLevel::Trace, "[Locator] Scope {} created", scope->id());
    return scope;
}

void ServiceLocator::detach_scope(ServiceScope* scope) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    m_scopes.erase(std::remove(m_scopes.begin(), m_scopes.end(), scope), m_scopes.end());
}

// ============================================================================
// Configuration
// ============================================================================

void ServiceLocator::add_discovery_source(IDiscoverySource* source) {
    if (!source) return;
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    if (std::find(m_sources.begin(), m_sources.end(), source) == m_sources.end()) {
        m_sources.push_back(source);
    }
}

void ServiceLocator::remove_discovery_source(IDiscoverySource* source) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    m_sources.erase(std::remove(m_sources.begin(), m_sources.end(), source), m_sources.end());
}

void ServiceLocator::set_auto_discovery(bool enabled) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    m_auto_discovery = enabled;
}

void ServiceLocator::set_caching(bool enabled) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    m_caching = enabled;
    if (!enabled) {
        m_cache.clear();
    }
}

void ServiceLocator::set_duplicate_policy(DuplicatePolicy policy) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    m_store.set_policy(policy);
}

bool ServiceLocator::auto_discovery_enabled() const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_auto_discovery;
}

bool ServiceLocator::caching_enabled() const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_caching;
}

LocatorMetrics ServiceLocator::metrics() const {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);

    LocatorMetrics metrics;
    metrics.total_resolutions = m_total_resolutions;
    metrics.cache_hits = m_cache_hits;
    metrics.cache_hit_rate = m_total_resolutions > 0
        ? static_cast<double>(m_cache_hits) / static_cast<double>(m_total_resolutions)
        : 0.0;
    metrics.failed_resolutions = m_failed_resolutions;
    metrics.discovery_attempts = m_discovery_attempts;
    metrics.discovered_services = m_discovered_services;
    metrics.registered_services = m_store.size();
    metrics.cached_services = m_cache.size();
    metrics.active_scopes = m_scopes.size();
    for (const auto& [type, count] : m_resolution_counts) {
        metrics.resolutions_by_type[core::type_name(type)] = count;
    }
    for (const auto& [key, entry] : m_cache) {
        metrics.cache_hits_by_service[describe(key)] = entry.hits;
    }
    return metrics;
}

void ServiceLocator::clear_cache() {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    m_cache.clear();
}

void ServiceLocator::reset() {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    m_store.clear();
    m_cache.clear();
    m_sources.clear();
    m_total_resolutions = 0;
    m_cache_hits = 0;
    m_failed_resolutions = 0;
    m_discovery_attempts = 0;
    m_discovered_services = 0;
    m_resolution_counts.clear();
    register_self();
    core::log(core::LogLevel::Debug, "[Locator] Reset");
}

} // namespace keystone::di

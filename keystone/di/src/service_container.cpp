#include <keystone/di/service_container.hpp>
#include <keystone/core/log.hpp>
#include <algorithm>
#include <set>

namespace keystone::di {

namespace {

constexpr size_t k_singleton_warning_threshold = 50;

// Resolves through the container's bindings without touching their caches.
// Instances it creates are dropped when verify() returns.
class TrialResolver : public IServiceResolver {
public:
    explicit TrialResolver(const ServiceContainer& container)
        : m_container(container) {}

    std::shared_ptr<void> build(const ServiceRegistration& reg) {
        if (reg.instance && reg.lifetime != ServiceLifetime::Transient) {
            return reg.instance;
        }

        auto loop = std::find(m_building.begin(), m_building.end(), &reg);
        if (loop != m_building.end()) {
            std::string path;
            for (auto it = loop; it != m_building.end(); ++it) {
                path += (*it)->capability_name + " -> ";
            }
            throw ServiceError("circular dependency: " + path + reg.capability_name);
        }

        if (!m_building.empty() && m_building.back()->lifetime == ServiceLifetime::Singleton &&
            reg.lifetime == ServiceLifetime::Transient) {
            m_warnings.insert("Singleton " + m_building.back()->capability_name +
                              " depends on Transient " + reg.capability_name);
        }

        Frame frame(m_building, &reg);
        if (reg.inner) {
            return build(*reg.inner);
        }

        std::shared_ptr<void> created;
        if (reg.factory) {
            created = reg.factory(*this);
        } else if (reg.constructor) {
            created = reg.constructor(*this);
        } else if (reg.instance) {
            created = reg.instance;
        } else {
            throw UnresolvedServiceError(reg.capability_name, "no instance, factory or constructor");
        }

        if (!created) {
            throw UnresolvedServiceError(reg.capability_name, "factory returned null");
        }
        return created;
    }

    std::shared_ptr<void> resolve_key(const ServiceKey& key, bool required) override {
        auto reg = m_container.find_registration(key);
        if (!reg) {
            if (required) {
                throw UnresolvedServiceError(describe(key));
            }
            return nullptr;
        }
        if (required) {
            return build(*reg);
        }
        try {
            return build(*reg);
        } catch (const UnresolvedServiceError&) {
            return nullptr;
        }
    }

    bool contains(const ServiceKey& key) const override {
        return m_container.contains(key);
    }

    const std::set<std::string>& warnings() const { return m_warnings; }

private:
    struct Frame {
        Frame(std::vector<const ServiceRegistration*>& stack, const ServiceRegistration* reg)
            : m_stack(stack) { m_stack.push_back(reg); }
        ~Frame() { m_stack.pop_back(); }

        std::vector<const ServiceRegistration*>& m_stack;
    };

    const ServiceContainer& m_container;
    std::vector<const ServiceRegistration*> m_building;
    std::set<std::string> m_warnings;
};

} // namespace

ServiceContainer::ServiceContainer(DuplicatePolicy policy)
    : m_store(policy, "[DI]") {}

ServiceContainer::~ServiceContainer() {
    if (!m_disposed) {
        dispose_instances();
    }
}

// ============================================================================
// Registration
// ============================================================================

void ServiceContainer::add(std::shared_ptr<ServiceRegistration> reg) {
    ensure_not_disposed();
    if (!reg) {
        throw ServiceError("Null registration");
    }
    if (!reg->has_construction_strategy()) {
        throw ServiceError("Registration for " + describe(reg->key) + " has no instance, factory or constructor");
    }

    m_store.add(reg);
    notify_registered(*reg);
}

bool ServiceContainer::unregister(const ServiceKey& key) {
    if (m_disposed) return false;

    bool removed = m_store.remove(key);
    if (removed) {
        core::log(core::LogLevel::Debug, "[DI] Unregistered {}", describe(key));
    }
    return removed;
}

void ServiceContainer::clear() {
    dispose_instances();
    m_store.clear();
    core::log(core::LogLevel::Debug, "[DI] Container cleared");
}

void ServiceContainer::notify_registered(const ServiceRegistration& reg) {
    core::log(core::LogLevel::Debug, "[DI] Registered {} -> {} ({})",
              describe(reg.key), reg.implementation_name, to_string(reg.lifetime));

    m_events.dispatch(ServiceRegisteredEvent{
        reg.key.type, reg.capability_name, reg.implementation_name, reg.key.name, reg.lifetime
    });
}

void ServiceContainer::ensure_not_disposed() const {
    if (m_disposed) {
        throw ContainerDisposedError();
    }
}

// ============================================================================
// Resolution
// ============================================================================

std::shared_ptr<void> ServiceContainer::resolve_key(const ServiceKey& key, bool required) {
    if (m_disposed) {
        if (!required) return nullptr;
        throw ContainerDisposedError();
    }

    auto reg = m_store.find(key);
    if (!reg) {
        if (m_parent) {
            return m_parent->resolve_key(key, required);
        }
        report_failure(key, "no registration");
        if (required) {
            throw UnresolvedServiceError(describe(key));
        }
        return nullptr;
    }

    try {
        bool from_cache = false;
        auto instance = RegistrationStore::materialize(*reg, *this, &from_cache);
        ++m_resolutions;
        m_events.dispatch(ServiceResolvedEvent{key.type, reg->capability_name, key.name, from_cache});
        return instance;
    } catch (const ServiceError& e) {
        report_failure(key, e.what());
        if (required) {
            throw;
        }
        core::log(core::LogLevel::Debug, "[DI] try_resolve of {} failed: {}", describe(key), e.what());
        return nullptr;
    }
}

bool ServiceContainer::contains(const ServiceKey& key) const {
    if (m_disposed) return false;
    if (m_store.contains(key)) return true;
    return m_parent && m_parent->contains(key);
}

std::vector<std::shared_ptr<void>> ServiceContainer::resolve_all_erased(std::type_index type) {
    ensure_not_disposed();

    auto members = m_store.collection(type);
    if (members.empty()) {
        ServiceKey key{type, {}};
        if (m_store.contains(key)) {
            return {resolve_key(key, true)};
        }
        if (m_parent) {
            return m_parent->resolve_all_erased(type);
        }
        return {};
    }

    std::vector<std::shared_ptr<void>> result;
    result.reserve(members.size());
    for (auto& member : members) {
        result.push_back(RegistrationStore::materialize(*member, *this));
        ++m_resolutions;
    }
    return result;
}

void ServiceContainer::report_failure(const ServiceKey& key, const std::string& reason) {
    ++m_failed_resolutions;
    m_events.dispatch(ResolutionFailedEvent{key.type, core::type_name(key.type), key.name, reason});
}

// ============================================================================
// Introspection
// ============================================================================

std::vector<std::type_index> ServiceContainer::registered_types() const {
    return m_store.types();
}

std::vector<ServiceKey> ServiceContainer::registered_keys() const {
    std::vector<ServiceKey> keys;
    for (const auto& reg : m_store.all()) {
        keys.push_back(reg->key);
    }
    return keys;
}

std::vector<RegistrationInfo> ServiceContainer::registrations() const {
    std::vector<RegistrationInfo> result;
    for (const auto& reg : m_store.all()) {
        RegistrationInfo info;
        info.capability_name = reg->capability_name;
        info.implementation_name = reg->instance && reg->runtime_type_name
            ? reg->runtime_type_name(reg->instance)
            : reg->implementation_name;
        info.name = reg->key.name;
        info.lifetime = reg->lifetime;
        info.materialized = reg->instance != nullptr;
        info.decorated = reg->inner != nullptr;
        info.collection_member = reg->collection_member;
        result.push_back(std::move(info));
    }
    return result;
}

std::shared_ptr<ServiceRegistration> ServiceContainer::find_registration(const ServiceKey& key) const {
    if (m_disposed) return nullptr;
    if (auto reg = m_store.find(key)) return reg;
    return m_parent ? m_parent->find_registration(key) : nullptr;
}

ContainerValidationResult ServiceContainer::verify() const {
    ContainerValidationResult result;

    if (m_disposed) {
        result.is_valid = false;
        result.errors.push_back("Container has been disposed");
        return result;
    }

    TrialResolver trial(*this);
    auto check = [&](const ServiceRegistration& reg) {
        ++result.services_validated;
        try {
            trial.build(reg);
        } catch (const std::exception& e) {
            result.errors.push_back(describe(reg.key) + ": " + e.what());
        }
    };

    size_t singletons = 0;
    std::vector<std::shared_ptr<ServiceRegistration>> active = m_store.all();
    for (const auto& reg : active) {
        if (reg->lifetime == ServiceLifetime::Singleton) ++singletons;
        check(*reg);
    }

    // Members other than the active one are only reachable through resolve_all
    for (std::type_index type : m_store.types()) {
        auto current = m_store.find(ServiceKey{type, {}});
        for (const auto& member : m_store.collection(type)) {
            bool is_active = current && (member == current || member == current->inner);
            if (!is_active) check(*member);
        }
    }

    result.warnings.assign(trial.warnings().begin(), trial.warnings().end());
    if (m_store.empty()) {
        result.warnings.push_back("Container has no registrations");
    }
    if (singletons > k_singleton_warning_threshold) {
        result.warnings.push_back(std::to_string(singletons) + " singleton registrations; consider scoped lifetimes");
    }

    result.is_valid = result.errors.empty();
    if (!result.is_valid) {
        core::log(core::LogLevel::Warn, "[DI] Verification found {} errors in {} bindings",
                  result.errors.size(), result.services_validated);
    }
    return result;
}

ContainerStatistics ServiceContainer::statistics() const {
    ContainerStatistics stats;
    for (const auto& reg : m_store.all()) {
        ++stats.total_registrations;
        switch (reg->lifetime) {
            case ServiceLifetime::Singleton: ++stats.singleton_services; break;
            case ServiceLifetime::Transient: ++stats.transient_services; break;
            case ServiceLifetime::Scoped:    ++stats.scoped_services; break;
        }
    }
    stats.resolutions = m_resolutions;
    stats.failed_resolutions = m_failed_resolutions;
    return stats;
}

std::unique_ptr<ServiceContainer> ServiceContainer::create_child_container() {
    ensure_not_disposed();
    auto child = std::make_unique<ServiceContainer>(m_store.policy());
    child->m_parent = this;
    return child;
}

// ============================================================================
// Disposal
// ============================================================================

void ServiceContainer::dispose() {
    if (m_disposed) return;

    dispose_instances();
    m_store.clear();
    m_disposed = true;
    core::log(core::LogLevel::Debug, "[DI] Container disposed");
}

void ServiceContainer::dispose_instances() {
    // Collect first; dispose() implementations may touch the container
    auto disposables = m_store.disposables();
    for (IDisposable* disposable : disposables) {
        try {
            disposable->dispose();
        } catch (const std::exception& e) {
            core::log(core::LogLevel::Error, "[DI] dispose() threw: {}", e.what());
        }
    }
}

} // namespace keystone::di

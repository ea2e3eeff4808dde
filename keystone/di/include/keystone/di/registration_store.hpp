#pragma once

#include <keystone/di/service_registration.hpp>
#include <memory>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace keystone::di {

class IServiceResolver;

// Keyed table of active bindings plus per-capability collections.
// Shared by ServiceContainer and ServiceLocator; not synchronized.
class RegistrationStore {
public:
    RegistrationStore(DuplicatePolicy policy, std::string log_tag);

    // Applies the duplicate policy. Returns the binding that was replaced, if any.
    std::shared_ptr<ServiceRegistration> add(std::shared_ptr<ServiceRegistration> reg);

    // Makes reg the active binding and appends it to the capability's collection.
    // The policy applies only against a non-collection binding.
    void add_collection_member(std::shared_ptr<ServiceRegistration> reg);

    // Swaps the active binding without a policy check (decorators)
    void replace(std::shared_ptr<ServiceRegistration> reg);

    std::shared_ptr<ServiceRegistration> find(const ServiceKey& key) const;
    bool contains(const ServiceKey& key) const;
    bool remove(const ServiceKey& key);

    // Collection members in registration order; empty if none
    std::vector<std::shared_ptr<ServiceRegistration>> collection(std::type_index type) const;

    // Active bindings ordered by registration sequence
    std::vector<std::shared_ptr<ServiceRegistration>> all() const;
    std::vector<std::type_index> types() const;

    // Each materialized IDisposable once, most recent registration first
    std::vector<IDisposable*> disposables() const;

    size_t size() const { return m_bindings.size(); }
    bool empty() const { return m_bindings.empty(); }
    void clear();

    DuplicatePolicy policy() const { return m_policy; }
    void set_policy(DuplicatePolicy policy) { m_policy = policy; }

    // Returns the cached instance for non-transient bindings, otherwise runs
    // factory then constructor. Throws UnresolvedServiceError when neither
    // exists or the factory yields null.
    static std::shared_ptr<void> materialize(ServiceRegistration& reg, IServiceResolver& resolver,
                                             bool* from_cache = nullptr);

private:
    uint64_t next_sequence() { return m_next_sequence++; }

    std::unordered_map<ServiceKey, std::shared_ptr<ServiceRegistration>, ServiceKeyHash> m_bindings;
    std::unordered_map<std::type_index, std::vector<std::shared_ptr<ServiceRegistration>>> m_collections;
    DuplicatePolicy m_policy;
    std::string m_log_tag;
    uint64_t m_next_sequence = 1;
};

} // namespace keystone::di

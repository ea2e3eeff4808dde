#include <keystone/di/registration_store.hpp>
#include <keystone/di/errors.hpp>
#include <keystone/di/service_resolver.hpp>
#include <keystone/core/log.hpp>
#include <algorithm>
#include <unordered_set>

namespace keystone::di {

const char* to_string(ServiceLifetime lifetime) {
    switch (lifetime) {
        case ServiceLifetime::Singleton: return "Singleton";
        case ServiceLifetime::Transient: return "Transient";
        case ServiceLifetime::Scoped:    return "Scoped";
    }
    return "Unknown";
}

const char* to_string(DuplicatePolicy policy) {
    switch (policy) {
        case DuplicatePolicy::Strict:   return "strict";
        case DuplicatePolicy::LastWins: return "last_wins";
    }
    return "unknown";
}

DuplicatePolicy parse_duplicate_policy(const std::string& text) {
    if (text == "strict") return DuplicatePolicy::Strict;
    if (text == "last_wins") return DuplicatePolicy::LastWins;
    core::log(core::LogLevel::Warn, "[DI] Unknown duplicate policy '{}', using strict", text);
    return DuplicatePolicy::Strict;
}

std::string describe(const ServiceKey& key) {
    std::string name = core::type_name(key.type);
    if (!key.name.empty()) {
        name += " ('" + key.name + "')";
    }
    return name;
}

RegistrationStore::RegistrationStore(DuplicatePolicy policy, std::string log_tag)
    : m_policy(policy)
    , m_log_tag(std::move(log_tag)) {}

std::shared_ptr<ServiceRegistration> RegistrationStore::add(std::shared_ptr<ServiceRegistration> reg) {
    std::shared_ptr<ServiceRegistration> replaced;
    auto it = m_bindings.find(reg->key);
    if (it != m_bindings.end()) {
        if (m_policy == DuplicatePolicy::Strict) {
            throw DuplicateRegistrationError(describe(reg->key));
        }
        core::log(core::LogLevel::Warn, "{} Overwriting registration for {} ({} -> {})",
                  m_log_tag, describe(reg->key), it->second->implementation_name, reg->implementation_name);
        replaced = it->second;
        if (replaced->collection_member && reg->key.name.empty()) {
            m_collections.erase(reg->key.type);
        }
    }

    reg->sequence = next_sequence();
    m_bindings[reg->key] = std::move(reg);
    return replaced;
}

void RegistrationStore::add_collection_member(std::shared_ptr<ServiceRegistration> reg) {
    auto it = m_bindings.find(reg->key);
    if (it != m_bindings.end() && !it->second->collection_member) {
        if (m_policy == DuplicatePolicy::Strict) {
            throw DuplicateRegistrationError(describe(reg->key));
        }
        core::log(core::LogLevel::Warn, "{} Replacing registration for {} with a collection",
                  m_log_tag, describe(reg->key));
    }

    reg->collection_member = true;
    reg->sequence = next_sequence();
    m_collections[reg->key.type].push_back(reg);
    m_bindings[reg->key] = std::move(reg);
}

void RegistrationStore::replace(std::shared_ptr<ServiceRegistration> reg) {
    reg->sequence = next_sequence();
    m_bindings[reg->key] = std::move(reg);
}

std::shared_ptr<ServiceRegistration> RegistrationStore::find(const ServiceKey& key) const {
    auto it = m_bindings.find(key);
    return it != m_bindings.end() ? it->second : nullptr;
}

bool RegistrationStore::contains(const ServiceKey& key) const {
    return m_bindings.find(key) != m_bindings.end();
}

bool RegistrationStore::remove(const ServiceKey& key) {
    if (m_bindings.erase(key) == 0) {
        return false;
    }
    if (key.name.empty()) {
        m_collections.erase(key.type);
    }
    return true;
}

std::vector<std::shared_ptr<ServiceRegistration>> RegistrationStore::collection(std::type_index type) const {
    auto it = m_collections.find(type);
    if (it == m_collections.end()) return {};
    return it->second;
}

std::vector<std::shared_ptr<ServiceRegistration>> RegistrationStore::all() const {
    std::vector<std::shared_ptr<ServiceRegistration>> result;
    result.reserve(m_bindings.size());
    for (const auto& [key, reg] : m_bindings) {
        result.push_back(reg);
    }
    std::sort(result.begin(), result.end(), [](const auto& a, const auto& b) {
        return a->sequence < b->sequence;
    });
    return result;
}

std::vector<std::type_index> RegistrationStore::types() const {
    std::vector<std::type_index> result;
    for (const auto& reg : all()) {
        if (std::find(result.begin(), result.end(), reg->key.type) == result.end()) {
            result.push_back(reg->key.type);
        }
    }
    return result;
}

std::vector<IDisposable*> RegistrationStore::disposables() const {
    std::vector<std::shared_ptr<ServiceRegistration>> regs = all();
    for (const auto& [type, members] : m_collections) {
        regs.insert(regs.end(), members.begin(), members.end());
    }
    for (size_t i = 0; i < regs.size(); ++i) {
        if (regs[i]->inner) {
            regs.push_back(regs[i]->inner);
        }
    }
    std::stable_sort(regs.begin(), regs.end(), [](const auto& a, const auto& b) {
        return a->sequence > b->sequence;
    });

    std::vector<IDisposable*> result;
    std::unordered_set<IDisposable*> seen;
    for (const auto& reg : regs) {
        if (!reg->instance || !reg->as_disposable) continue;
        IDisposable* disposable = reg->as_disposable(reg->instance);
        if (disposable && seen.insert(disposable).second) {
            result.push_back(disposable);
        }
    }
    return result;
}

void RegistrationStore::clear() {
    m_bindings.clear();
    m_collections.clear();
}

std::shared_ptr<void> RegistrationStore::materialize(ServiceRegistration& reg, IServiceResolver& resolver,
                                                     bool* from_cache) {
    if (from_cache) *from_cache = false;

    if (reg.lifetime != ServiceLifetime::Transient && reg.instance) {
        if (from_cache) *from_cache = true;
        return reg.instance;
    }

    std::shared_ptr<void> created;
    if (reg.factory) {
        created = reg.factory(resolver);
    } else if (reg.constructor) {
        created = reg.constructor(resolver);
    } else if (reg.instance) {
        // Transient over a pre-built instance
        return reg.instance;
    } else {
        throw UnresolvedServiceError(reg.capability_name, "no instance, factory or constructor");
    }

    if (!created) {
        throw UnresolvedServiceError(reg.capability_name, "factory returned null");
    }

    if (reg.lifetime != ServiceLifetime::Transient) {
        reg.instance = created;
    }
    return created;
}

} // namespace keystone::di

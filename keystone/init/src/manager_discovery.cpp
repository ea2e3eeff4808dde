#include <keystone/init/manager_discovery.hpp>
#include <keystone/init/init_events.hpp>
#include <keystone/core/log.hpp>
#include <keystone/core/type_name.hpp>
#include <algorithm>
#include <unordered_set>

namespace keystone::init {

// ============================================================================
// ManagerRegistry
// ============================================================================

void ManagerRegistry::add(IManager& manager) {
    if (std::find(m_managers.begin(), m_managers.end(), &manager) == m_managers.end()) {
        m_managers.push_back(&manager);
    }
}

bool ManagerRegistry::remove(const IManager& manager) {
    auto it = std::find(m_managers.begin(), m_managers.end(), &manager);
    if (it == m_managers.end()) return false;
    m_managers.erase(it);
    return true;
}

// ============================================================================
// ManagerDiscoveryService
// ============================================================================

ManagerDiscoveryService::ManagerDiscoveryService(core::EventDispatcher& events, bool enable_logging)
    : m_events(events)
    , m_enable_logging(enable_logging) {}

void ManagerDiscoveryService::add_source(const IManagerSource& source) {
    if (std::find(m_sources.begin(), m_sources.end(), &source) == m_sources.end()) {
        m_sources.push_back(&source);
    }
}

void ManagerDiscoveryService::add_manager(IManager& manager) {
    if (std::find(m_explicit.begin(), m_explicit.end(), &manager) == m_explicit.end()) {
        m_explicit.push_back(&manager);
    }
}

DiscoveryResult ManagerDiscoveryService::discover_all() {
    auto start = std::chrono::steady_clock::now();
    DiscoveryResult result;
    m_descriptors.clear();

    std::vector<IManager*> found = m_explicit;
    if (m_auto_discover) {
        try {
            for (const IManagerSource* source : m_sources) {
                auto managers = source->managers();
                found.insert(found.end(), managers.begin(), managers.end());
            }
        } catch (const std::exception& e) {
            result.error_message = std::string("Manager source failed: ") + e.what();
            core::log(core::LogLevel::Error, "[Discovery] {}", result.error_message);
            return result;
        }
    }

    result.total_found = found.size();
    std::unordered_set<std::type_index> seen_types;

    for (IManager* manager : found) {
        if (!manager) {
            ++result.null_entries;
            continue;
        }

        std::type_index type = typeid(*manager);
        if (!seen_types.insert(type).second) {
            ++result.duplicates;
            if (m_enable_logging) {
                core::log(core::LogLevel::Warn, "[Discovery] Duplicate manager of type {} ignored",
                          core::type_name(type));
            }
            continue;
        }

        ManagerDescriptor descriptor;
        descriptor.manager = manager;
        descriptor.type = type;
        descriptor.type_name = core::type_name(type);
        descriptor.name = manager->name();
        descriptor.priority = manager->priority();
        descriptor.category = manager->category();
        descriptor.initialized = manager->is_initialized();
        descriptor.discovery_index = m_descriptors.size();
        m_descriptors.push_back(std::move(descriptor));
    }

    std::stable_sort(m_descriptors.begin(), m_descriptors.end(),
        [](const ManagerDescriptor& a, const ManagerDescriptor& b) {
            return static_cast<int>(a.priority) < static_cast<int>(b.priority);
        });

    for (const auto& descriptor : m_descriptors) {
        if (m_enable_logging) {
            core::log(core::LogLevel::Debug, "[Discovery] Found {} ({}, {})", descriptor.name,
                      to_string(descriptor.priority), to_string(descriptor.category));
        }
        m_events.dispatch(ManagerDiscoveredEvent{
            descriptor.name, descriptor.type_name, descriptor.priority, descriptor.category
        });
    }

    result.discovered = m_descriptors.size();
    result.success = true;
    result.elapsed_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    if (m_enable_logging) {
        core::log(core::LogLevel::Info, "[Discovery] Discovered {} managers ({} duplicates ignored)",
                  result.discovered, result.duplicates);
    }
    return result;
}

std::vector<ManagerDescriptor*> ManagerDiscoveryService::by_category(ManagerCategory category) {
    std::vector<ManagerDescriptor*> result;
    for (auto& descriptor : m_descriptors) {
        if (descriptor.category == category) {
            result.push_back(&descriptor);
        }
    }
    return result;
}

ManagerDescriptor* ManagerDiscoveryService::find(std::type_index type) {
    for (auto& descriptor : m_descriptors) {
        if (descriptor.type == type) return &descriptor;
    }
    return nullptr;
}

ManagerDescriptor* ManagerDiscoveryService::find_by_name(const std::string& name) {
    for (auto& descriptor : m_descriptors) {
        if (descriptor.name == name) return &descriptor;
    }
    return nullptr;
}

DiscoveryStatistics ManagerDiscoveryService::statistics() const {
    DiscoveryStatistics stats;
    stats.total_discovered = m_descriptors.size();
    for (const auto& descriptor : m_descriptors) {
        ++stats.by_category[static_cast<size_t>(descriptor.category)];
        if (descriptor.manager && descriptor.manager->is_initialized()) {
            ++stats.initialized;
        }
    }
    return stats;
}

void ManagerDiscoveryService::clear() {
    m_descriptors.clear();
}

} // namespace keystone::init

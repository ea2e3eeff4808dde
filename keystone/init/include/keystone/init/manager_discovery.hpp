#pragma once

#include <keystone/core/event_dispatcher.hpp>
#include <keystone/init/init_types.hpp>
#include <keystone/init/manager_source.hpp>
#include <array>
#include <chrono>
#include <string>
#include <typeindex>
#include <vector>

namespace keystone::init {

struct DiscoveryResult {
    bool success = false;
    size_t total_found = 0;         // every pointer the sources returned
    size_t discovered = 0;          // unique managers kept
    size_t duplicates = 0;
    size_t null_entries = 0;
    double elapsed_seconds = 0.0;
    std::string error_message;
};

struct DiscoveryStatistics {
    size_t total_discovered = 0;
    size_t initialized = 0;
    std::array<size_t, 4> by_category{};    // indexed by ManagerCategory
};

// ============================================================================
// ManagerDiscoveryService - finds managers and orders them for bring-up
// ============================================================================
//
// One descriptor per concrete type; later instances of a type are dropped.
// Descriptors are kept stably sorted by priority.
class ManagerDiscoveryService {
public:
    explicit ManagerDiscoveryService(core::EventDispatcher& events, bool enable_logging = true);

    // Sources are scanned only while auto-discovery is on
    void add_source(const IManagerSource& source);
    void set_auto_discover(bool enabled) { m_auto_discover = enabled; }
    bool auto_discover() const { return m_auto_discover; }

    // Explicitly listed managers are always included, ahead of source results
    void add_manager(IManager& manager);

    // Replaces the descriptor list
    DiscoveryResult discover_all();

    std::vector<ManagerDescriptor>& descriptors() { return m_descriptors; }
    const std::vector<ManagerDescriptor>& descriptors() const { return m_descriptors; }

    // Priority order within the category
    std::vector<ManagerDescriptor*> by_category(ManagerCategory category);

    ManagerDescriptor* find(std::type_index type);
    ManagerDescriptor* find_by_name(const std::string& name);

    template<typename T>
    T* get_manager() {
        auto* descriptor = find(std::type_index(typeid(T)));
        return descriptor ? dynamic_cast<T*>(descriptor->manager) : nullptr;
    }

    size_t count() const { return m_descriptors.size(); }
    DiscoveryStatistics statistics() const;

    void clear();

private:
    core::EventDispatcher& m_events;
    std::vector<const IManagerSource*> m_sources;
    std::vector<IManager*> m_explicit;
    std::vector<ManagerDescriptor> m_descriptors;
    bool m_enable_logging;
    bool m_auto_discover = true;
};

} // namespace keystone::init

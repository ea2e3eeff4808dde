#pragma once

#include <keystone/core/event_dispatcher.hpp>
#include <keystone/init/init_types.hpp>
#include <string>
#include <utility>
#include <vector>

namespace keystone::di {
class ServiceContainer;
}

namespace keystone::init {

struct ValidationSummary {
    size_t total = 0;
    size_t valid = 0;
    size_t invalid = 0;
    bool dependency_validation_passed = true;
    bool service_container_valid = true;
    bool overall_valid = true;
    std::vector<std::string> all_errors;
    std::vector<std::string> warnings;
    std::vector<std::vector<std::string>> cycles;                       // each closes on its first entry
    std::vector<std::pair<std::string, std::string>> missing_dependencies; // (manager, dependency)
    double validation_seconds = 0.0;
};

// ============================================================================
// SystemValidationService - post bring-up checks
// ============================================================================
//
// Findings are collected, never thrown. Whether they are fatal is decided
// by the caller.
class SystemValidationService {
public:
    SystemValidationService(core::EventDispatcher& events,
                            bool enable_logging = true,
                            bool validate_dependencies = true,
                            bool attempt_recovery = true);

    // Optional; without a container the health check passes with a warning
    void set_container(const di::ServiceContainer* container) { m_container = container; }

    // Re-reads each manager's initialized flag; returns how many are up
    static size_t refresh_status(std::vector<ManagerDescriptor>& descriptors);

    // May initialize managers again when recovery is enabled
    ValidationSummary validate_all(std::vector<ManagerDescriptor>& descriptors);

    // Cycles over declared dependencies, each rotated to start at its
    // smallest name. Unknown dependencies are ignored here.
    static std::vector<std::vector<std::string>> detect_cycles(const std::vector<ManagerDescriptor>& descriptors);

    static std::vector<std::pair<std::string, std::string>> find_missing(const std::vector<ManagerDescriptor>& descriptors);

    // Index of the descriptor a dependency name refers to, or -1
    static int resolve_dependency(const std::vector<ManagerDescriptor>& descriptors, const std::string& dependency);

private:
    void try_recover(ManagerDescriptor& descriptor, ValidationSummary& summary);

    core::EventDispatcher& m_events;
    const di::ServiceContainer* m_container = nullptr;
    bool m_enable_logging;
    bool m_validate_dependencies;
    bool m_attempt_recovery;
};

} // namespace keystone::init

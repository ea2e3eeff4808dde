#include <keystone/init/system_validation.hpp>
#include <keystone/init/errors.hpp>
#include <keystone/init/init_events.hpp>
#include <keystone/di/service_container.hpp>
#include <keystone/core/log.hpp>
#include <keystone/core/type_name.hpp>
#include <algorithm>
#include <chrono>
#include <set>

namespace keystone::init {

SystemValidationService::SystemValidationService(core::EventDispatcher& events,
                                                 bool enable_logging,
                                                 bool validate_dependencies,
                                                 bool attempt_recovery)
    : m_events(events)
    , m_enable_logging(enable_logging)
    , m_validate_dependencies(validate_dependencies)
    , m_attempt_recovery(attempt_recovery) {}

int SystemValidationService::resolve_dependency(const std::vector<ManagerDescriptor>& descriptors,
                                                const std::string& dependency) {
    for (size_t i = 0; i < descriptors.size(); ++i) {
        const auto& d = descriptors[i];
        if (d.name == dependency || d.type_name == dependency ||
            core::short_type_name(d.type_name) == dependency) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

// ============================================================================
// Dependency graph
// ============================================================================

namespace {

enum class Mark : uint8_t { Unvisited, InStack, Done };

struct CycleSearch {
    const std::vector<std::vector<int>>& edges;
    const std::vector<ManagerDescriptor>& descriptors;
    std::vector<Mark> marks;
    std::vector<int> stack;
    std::set<std::vector<std::string>> seen;
    std::vector<std::vector<std::string>> cycles;

    void visit(int node) {
        marks[node] = Mark::InStack;
        stack.push_back(node);

        for (int next : edges[node]) {
            if (marks[next] == Mark::InStack) {
                record(next);
            } else if (marks[next] == Mark::Unvisited) {
                visit(next);
            }
        }

        stack.pop_back();
        marks[node] = Mark::Done;
    }

    void record(int back_edge_target) {
        auto begin = std::find(stack.begin(), stack.end(), back_edge_target);
        std::vector<std::string> cycle;
        for (auto it = begin; it != stack.end(); ++it) {
            cycle.push_back(descriptors[*it].name);
        }

        auto smallest = std::min_element(cycle.begin(), cycle.end());
        std::rotate(cycle.begin(), smallest, cycle.end());
        if (!seen.insert(cycle).second) return;

        cycle.push_back(cycle.front());
        cycles.push_back(std::move(cycle));
    }
};

} // namespace

std::vector<std::vector<std::string>> SystemValidationService::detect_cycles(
    const std::vector<ManagerDescriptor>& descriptors) {
    std::vector<std::vector<int>> edges(descriptors.size());
    for (size_t i = 0; i < descriptors.size(); ++i) {
        if (!descriptors[i].manager) continue;
        for (const auto& dependency : descriptors[i].manager->dependencies()) {
            int target = resolve_dependency(descriptors, dependency);
            if (target >= 0) {
                edges[i].push_back(target);
            }
        }
    }

    CycleSearch search{edges, descriptors, std::vector<Mark>(descriptors.size(), Mark::Unvisited), {}, {}, {}};
    for (size_t i = 0; i < descriptors.size(); ++i) {
        if (search.marks[i] == Mark::Unvisited) {
            search.visit(static_cast<int>(i));
        }
    }
    return std::move(search.cycles);
}

std::vector<std::pair<std::string, std::string>> SystemValidationService::find_missing(
    const std::vector<ManagerDescriptor>& descriptors) {
    std::vector<std::pair<std::string, std::string>> missing;
    for (const auto& descriptor : descriptors) {
        if (!descriptor.manager) continue;
        for (const auto& dependency : descriptor.manager->dependencies()) {
            if (resolve_dependency(descriptors, dependency) < 0) {
                missing.emplace_back(descriptor.name, dependency);
            }
        }
    }
    return missing;
}

// ============================================================================
// Validation pass
// ============================================================================

void SystemValidationService::try_recover(ManagerDescriptor& descriptor, ValidationSummary& summary) {
    ++descriptor.attempts;
    try {
        if (descriptor.manager->initialize()) {
            descriptor.initialized = true;
            descriptor.last_error.clear();
            summary.warnings.push_back(descriptor.name + " recovered during validation");
            if (m_enable_logging) {
                core::log(core::LogLevel::Info, "[Validation] Recovered {}", descriptor.name);
            }
            return;
        }
        descriptor.last_error = "initialize() returned false";
    } catch (const std::exception& e) {
        descriptor.last_error = e.what();
    }
    if (m_enable_logging) {
        core::log(core::LogLevel::Warn, "[Validation] Recovery of {} failed: {}", descriptor.name, descriptor.last_error);
    }
}

size_t SystemValidationService::refresh_status(std::vector<ManagerDescriptor>& descriptors) {
    size_t initialized = 0;
    for (auto& descriptor : descriptors) {
        descriptor.initialized = descriptor.manager && descriptor.manager->is_initialized();
        if (descriptor.initialized) ++initialized;
    }
    return initialized;
}

ValidationSummary SystemValidationService::validate_all(std::vector<ManagerDescriptor>& descriptors) {
    auto start = std::chrono::steady_clock::now();
    ValidationSummary summary;
    summary.total = descriptors.size();
    refresh_status(descriptors);

    std::vector<std::pair<std::string, std::string>> missing;
    if (m_validate_dependencies) {
        summary.cycles = detect_cycles(descriptors);
        missing = find_missing(descriptors);
        summary.missing_dependencies = missing;

        for (const auto& cycle : summary.cycles) {
            summary.all_errors.push_back(DependencyCycleError(cycle).what());
        }
        for (const auto& [manager, dependency] : missing) {
            summary.all_errors.push_back(MissingDependencyError(manager, dependency).what());
        }
        summary.dependency_validation_passed = summary.cycles.empty() && missing.empty();
    }

    for (auto& descriptor : descriptors) {
        if (!descriptor.manager) continue;

        if (!descriptor.initialized && m_attempt_recovery) {
            try_recover(descriptor, summary);
        }

        std::vector<std::string> errors;
        if (!descriptor.initialized) {
            errors.push_back(descriptor.name + " is not initialized");
        }

        if (const auto* validatable = dynamic_cast<const IValidatable*>(descriptor.manager)) {
            ValidationResult result = validatable->validate();
            if (!result.valid && result.errors.empty()) {
                errors.push_back(descriptor.name + " reported invalid state");
            }
            for (const auto& error : result.errors) {
                errors.push_back(descriptor.name + ": " + error);
            }
            for (const auto& warning : result.warnings) {
                summary.warnings.push_back(descriptor.name + ": " + warning);
            }
        }

        // Already in all_errors from the graph check; reported only to this manager's listeners
        std::vector<std::string> dependency_errors;
        for (const auto& [manager, dependency] : missing) {
            if (manager == descriptor.name) {
                dependency_errors.push_back(descriptor.name + " is missing dependency " + dependency);
            }
        }

        if (m_container && !m_container->contains(di::ServiceKey{descriptor.type, {}})) {
            summary.warnings.push_back(descriptor.name + " is not registered in the service container");
        }

        bool valid = errors.empty() && dependency_errors.empty();
        if (valid) {
            ++summary.valid;
        } else {
            ++summary.invalid;
            summary.all_errors.insert(summary.all_errors.end(), errors.begin(), errors.end());
            errors.insert(errors.end(), dependency_errors.begin(), dependency_errors.end());
        }

        if (m_enable_logging && !valid) {
            core::log(core::LogLevel::Warn, "[Validation] {} invalid ({} errors)", descriptor.name, errors.size());
        }
        m_events.dispatch(ManagerValidatedEvent{descriptor.name, valid, std::move(errors)});
    }

    if (m_container) {
        di::ContainerValidationResult container_result = m_container->verify();
        summary.service_container_valid = container_result.is_valid;
        for (const auto& error : container_result.errors) {
            summary.all_errors.push_back("Service container: " + error);
        }
        for (const auto& warning : container_result.warnings) {
            summary.warnings.push_back("Service container: " + warning);
        }
    } else {
        summary.warnings.push_back("No service container attached; container health not checked");
    }

    summary.overall_valid = summary.invalid == 0 &&
                            summary.dependency_validation_passed &&
                            summary.service_container_valid;
    summary.validation_seconds =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    if (m_enable_logging) {
        core::log(summary.overall_valid ? core::LogLevel::Info : core::LogLevel::Warn,
                  "[Validation] {}/{} managers valid, {} errors, {} warnings",
                  summary.valid, summary.total, summary.all_errors.size(), summary.warnings.size());
    }
    m_events.dispatch(ValidationCompletedEvent{summary.overall_valid, summary.valid, summary.invalid});
    return summary;
}

} // namespace keystone::init

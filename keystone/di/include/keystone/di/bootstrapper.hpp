#pragma once

#include <keystone/core/runtime_settings.hpp>
#include <keystone/di/core_services.hpp>
#include <keystone/di/health_report.hpp>
#include <keystone/di/service_catalog.hpp>
#include <keystone/di/service_container.hpp>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace keystone::di {

// One checklist entry of the validation sweep
struct ServiceCheck {
    struct Finding {
        bool registered = false;
        std::string implementation_name;
        std::string error_message;
    };

    std::string service_name;
    bool critical = false;
    std::function<Finding(ServiceContainer&)> inspect;

    template<typename T>
    static ServiceCheck of(bool critical) {
        ServiceCheck check;
        check.service_name = core::short_type_name(core::type_name<T>());
        check.critical = critical;
        check.inspect = [](ServiceContainer& container) {
            Finding result;
            try {
                auto instance = container.try_resolve<T>();
                if (instance) {
                    result.registered = true;
                    result.implementation_name =
                        core::short_type_name(detail::runtime_type_name_of<T>(instance));
                }
            } catch (const std::exception& e) {
                result.error_message = e.what();
            }
            return result;
        };
        return check;
    }
};

// Instances the application supplies for the core capabilities.
// Empty members fall back to the default (or Null) implementations.
struct CoreServices {
    std::shared_ptr<ITimeService> time;
    std::shared_ptr<IPersistenceService> persistence;
    std::shared_ptr<IEventService> events;
    std::shared_ptr<ISettingsService> settings;
};

// ============================================================================
// Bootstrapper - the composition root
// ============================================================================
//
// run() performs, once:
//   1. registers the container as a service of itself
//   2. registers core services that are not already bound
//   3. optionally auto-wires catalog candidates named *Manager / *Service
//   4. runs the checklist and builds the health report
// Missing critical services are logged as errors; bring-up never aborts here.
class Bootstrapper {
public:
    // A null container selects global_container()
    explicit Bootstrapper(const core::BootstrapSettings& settings = {},
                          ServiceContainer* container = nullptr);

    // Process-wide default container; only the bootstrapper reaches for it
    static ServiceContainer& global_container();

    void set_core_services(CoreServices services) { m_core_services = std::move(services); }
    void set_catalog(const ServiceCatalog* catalog) { m_catalog = catalog; }
    void set_checklist(std::vector<ServiceCheck> checklist) { m_checklist = std::move(checklist); }

    // ServiceContainer, the four core services, ServiceLocator (optional)
    static std::vector<ServiceCheck> default_checklist();

    const HealthReport& run();

    // Re-runs the checklist without registering anything
    HealthReport generate_report() const;

    bool is_bootstrapped() const { return m_bootstrapped; }
    const HealthReport& report() const { return m_report; }
    ServiceContainer& container() { return *m_container; }
    size_t auto_wired_count() const { return m_auto_wired; }

private:
    void register_container_self();
    void register_core_services();
    void auto_wire_candidates();

    core::BootstrapSettings m_settings;
    ServiceContainer* m_container;
    CoreServices m_core_services;
    const ServiceCatalog* m_catalog = nullptr;
    std::vector<ServiceCheck> m_checklist;
    HealthReport m_report;
    std::vector<std::string> m_step_errors;
    size_t m_auto_wired = 0;
    bool m_bootstrapped = false;
};

} // namespace keystone::di

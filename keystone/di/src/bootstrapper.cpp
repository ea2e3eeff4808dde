#include <keystone/di/bootstrapper.hpp>
#include <keystone/di/service_locator.hpp>
#include <keystone/core/log.hpp>
#include <cctype>
#include <chrono>
#include <format>

namespace keystone::di {

namespace {

bool ends_with(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool is_capability_name(const std::string& name) {
    return name.size() > 1 && name[0] == 'I' && std::isupper(static_cast<unsigned char>(name[1]));
}

std::string utc_timestamp() {
    auto now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
    return std::format("{:%Y-%m-%dT%H:%M:%SZ}", now);
}

// Earlier registrations of T always win over the supplied or built-in one
template<typename T, typename Default, typename Null>
void register_core(ServiceContainer& container, std::shared_ptr<T> supplied, bool use_null) {
    if (!supplied) {
        if (use_null) {
            supplied = std::make_shared<Null>();
        } else {
            supplied = std::make_shared<Default>();
        }
    }
    if (!container.register_if_absent<T>(std::move(supplied))) {
        core::log(core::LogLevel::Debug, "[Bootstrap] Keeping existing {} registration", core::type_name<T>());
    }
}

} // namespace

Bootstrapper::Bootstrapper(const core::BootstrapSettings& settings, ServiceContainer* container)
    : m_settings(settings)
    , m_container(container ? container : &global_container())
    , m_checklist(default_checklist()) {}

ServiceContainer& Bootstrapper::global_container() {
    static ServiceContainer s_container;
    return s_container;
}

std::vector<ServiceCheck> Bootstrapper::default_checklist() {
    return {
        ServiceCheck::of<ServiceContainer>(true),
        ServiceCheck::of<ITimeService>(true),
        ServiceCheck::of<IEventService>(true),
        ServiceCheck::of<IPersistenceService>(true),
        ServiceCheck::of<ISettingsService>(true),
        ServiceCheck::of<ServiceLocator>(false),
    };
}

const HealthReport& Bootstrapper::run() {
    if (m_bootstrapped) {
        core::log(core::LogLevel::Warn, "[Bootstrap] Already bootstrapped, returning existing report");
        return m_report;
    }

    auto start = std::chrono::steady_clock::now();
    m_step_errors.clear();
    core::log(core::LogLevel::Info, "[Bootstrap] Starting service bootstrap");

    struct Step {
        const char* name;
        bool enabled;
        void (Bootstrapper::*run)();
    };
    const Step steps[] = {
        {"register container", true, &Bootstrapper::register_container_self},
        {"register core services", m_settings.register_core_services, &Bootstrapper::register_core_services},
        {"auto-wire candidates", m_settings.auto_wire_candidates, &Bootstrapper::auto_wire_candidates},
    };

    for (const auto& step : steps) {
        if (!step.enabled) continue;
        try {
            (this->*step.run)();
        } catch (const std::exception& e) {
            // Recorded in the report; the remaining steps still run
            std::string message = std::format("Bootstrap step '{}' failed: {}", step.name, e.what());
            core::log(core::LogLevel::Error, "[Bootstrap] {}", message);
            m_step_errors.push_back(std::move(message));
        }
    }

    m_bootstrapped = true;
    m_report = generate_report();

    auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start);
    core::log(core::LogLevel::Info, "[Bootstrap] Completed in {:.1f}ms", elapsed.count());
    if (m_settings.verbose) {
        m_report.print();
    }
    return m_report;
}

void Bootstrapper::register_container_self() {
    // Non-owning: the container does not keep itself alive
    std::shared_ptr<ServiceContainer> self(std::shared_ptr<ServiceContainer>{}, m_container);
    m_container->register_if_absent<ServiceContainer>(std::move(self));
}

void Bootstrapper::register_core_services() {
    bool use_null = m_settings.use_null_fallbacks;
    register_core<ITimeService, SteadyTimeService, NullTimeService>(
        *m_container, m_core_services.time, use_null);
    register_core<IPersistenceService, MemoryPersistenceService, NullPersistenceService>(
        *m_container, m_core_services.persistence, use_null);
    register_core<IEventService, DispatcherEventService, NullEventService>(
        *m_container, m_core_services.events, use_null);
    register_core<ISettingsService, RuntimeSettingsService, NullSettingsService>(
        *m_container, m_core_services.settings, use_null);
    core::log(core::LogLevel::Debug, "[Bootstrap] Core services registered");
}

void Bootstrapper::auto_wire_candidates() {
    if (!m_catalog) {
        core::log(core::LogLevel::Warn, "[Bootstrap] Auto-wiring enabled but no catalog attached");
        return;
    }

    for (const auto& candidate : m_catalog->candidates()) {
        if (!ends_with(candidate.type_name, "Manager") && !ends_with(candidate.type_name, "Service")) {
            continue;
        }

        for (size_t i = 0; i < candidate.bindings.size(); ++i) {
            const auto& binding = candidate.bindings[i];
            bool concrete = i == 0;
            if (!concrete && !is_capability_name(binding.capability_name)) {
                continue;
            }
            if (m_container->contains(ServiceKey{binding.type, {}})) {
                continue;
            }
            m_container->add(binding.make_registration());
            ++m_auto_wired;
            core::log(core::LogLevel::Debug, "[Bootstrap] Auto-wired {} as {}",
                      candidate.type_name, binding.capability_name);
        }
    }

    core::log(core::LogLevel::Info, "[Bootstrap] Auto-wired {} registrations from {} candidates",
              m_auto_wired, m_catalog->size());
}

HealthReport Bootstrapper::generate_report() const {
    HealthReport report;
    report.generated_at = utc_timestamp();
    report.bootstrapped = m_bootstrapped;
    report.errors = m_step_errors;

    if (!m_settings.validate_registrations) {
        report.overall_health = ServiceHealth::Healthy;
        return report;
    }

    for (const auto& check : m_checklist) {
        ServiceStatus status;
        status.service_name = check.service_name;
        status.critical = check.critical;

        auto finding = check.inspect(*m_container);
        status.registered = finding.registered;
        status.implementation_name = finding.implementation_name;
        status.error_message = finding.error_message;
        status.null_implementation = finding.registered && finding.implementation_name.rfind("Null", 0) == 0;

        ++report.total_services;
        if (status.critical) ++report.critical_services;

        if (status.registered) {
            ++report.registered_services;
            if (status.null_implementation) {
                ++report.null_implementations;
                ++report.warnings;
            }
        } else if (status.critical) {
            ++report.critical_failures;
            std::string reason = status.error_message.empty() ? "not registered" : status.error_message;
            report.errors.push_back(status.service_name + ": " + reason);
            core::log(core::LogLevel::Error, "[Bootstrap] Critical service missing: {}", status.service_name);
        } else {
            ++report.warnings;
            core::log(core::LogLevel::Warn, "[Bootstrap] Optional service missing: {}", status.service_name);
        }

        report.services.push_back(std::move(status));
    }

    auto missing = [&report](const std::string& name) {
        for (const auto& s : report.services) {
            if (s.service_name == name) return !s.registered;
        }
        return false;
    };
    if (report.critical_failures > 0) {
        report.dependency_issues.push_back("Critical service failures may cascade into dependent systems");
    }
    if (missing("ServiceContainer")) {
        report.dependency_issues.push_back("ServiceContainer missing: dependency injection is unavailable");
    }
    if (missing("IEventService")) {
        report.dependency_issues.push_back("IEventService missing: systems cannot exchange events");
    }

    report.overall_health = health_from_critical_failures(report.critical_failures);
    return report;
}

} // namespace keystone::di

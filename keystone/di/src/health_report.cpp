#include <keystone/di/health_report.hpp>
#include <keystone/core/filesystem.hpp>
#include <keystone/core/log.hpp>
#include <nlohmann/json.hpp>

namespace keystone::di {

using json = nlohmann::json;

const char* to_string(ServiceHealth health) {
    switch (health) {
        case ServiceHealth::Healthy:  return "Healthy";
        case ServiceHealth::Warning:  return "Warning";
        case ServiceHealth::Critical: return "Critical";
    }
    return "Unknown";
}

ServiceHealth health_from_critical_failures(size_t critical_failures) {
    if (critical_failures == 0) return ServiceHealth::Healthy;
    if (critical_failures <= 2) return ServiceHealth::Warning;
    return ServiceHealth::Critical;
}

std::string HealthReport::to_json_string() const {
    json j;
    j["generated_at"] = generated_at;
    j["bootstrapped"] = bootstrapped;
    j["overall_health"] = to_string(overall_health);

    j["summary"] = {
        {"total_services", total_services},
        {"registered_services", registered_services},
        {"critical_services", critical_services},
        {"critical_failures", critical_failures},
        {"null_implementations", null_implementations},
        {"warnings", warnings}
    };

    json service_list = json::array();
    for (const auto& status : services) {
        json s = {
            {"service", status.service_name},
            {"critical", status.critical},
            {"registered", status.registered},
            {"null_implementation", status.null_implementation}
        };
        if (!status.implementation_name.empty()) {
            s["implementation"] = status.implementation_name;
        }
        if (!status.error_message.empty()) {
            s["error"] = status.error_message;
        }
        service_list.push_back(std::move(s));
    }
    j["services"] = std::move(service_list);
    j["dependency_issues"] = dependency_issues;
    j["errors"] = errors;

    return j.dump(4);
}

bool HealthReport::save(const std::string& path) const {
    if (!core::FileSystem::write_text(path, to_json_string())) {
        core::log(core::LogLevel::Error, "[Bootstrap] Failed to write health report to {}", path);
        return false;
    }
    core::log(core::LogLevel::Info, "[Bootstrap] Health report written to {}", path);
    return true;
}

void HealthReport::print() const {
    using core::LogLevel;
    LogLevel summary_level = overall_health == ServiceHealth::Healthy ? LogLevel::Info
                           : overall_health == ServiceHealth::Warning ? LogLevel::Warn
                           : LogLevel::Error;

    core::log(summary_level, "[Bootstrap] Service health: {} ({} of {} registered, {} critical failures, {} null)",
              to_string(overall_health), registered_services, total_services,
              critical_failures, null_implementations);

    for (const auto& status : services) {
        if (status.registered) {
            core::log(LogLevel::Info, "[Bootstrap]   {:<24} {}{}", status.service_name, status.implementation_name,
                      status.null_implementation ? " (null)" : "");
        } else {
            core::log(status.critical ? LogLevel::Error : LogLevel::Warn, "[Bootstrap]   {:<24} MISSING{}",
                      status.service_name, status.critical ? " (critical)" : "");
        }
    }

    for (const auto& issue : dependency_issues) {
        core::log(LogLevel::Warn, "[Bootstrap] Dependency issue: {}", issue);
    }
    for (const auto& error : errors) {
        core::log(LogLevel::Error, "[Bootstrap] {}", error);
    }
}

} // namespace keystone::di

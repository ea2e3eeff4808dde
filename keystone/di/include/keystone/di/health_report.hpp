#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace keystone::di {

enum class ServiceHealth : uint8_t {
    Healthy,    // no critical failures
    Warning,    // one or two critical failures
    Critical    // more than two
};

const char* to_string(ServiceHealth health);
ServiceHealth health_from_critical_failures(size_t critical_failures);

struct ServiceStatus {
    std::string service_name;
    std::string implementation_name;
    bool critical = false;
    bool registered = false;
    bool null_implementation = false;
    std::string error_message;
};

struct HealthReport {
    std::string generated_at;       // UTC, ISO-8601
    bool bootstrapped = false;

    size_t total_services = 0;
    size_t registered_services = 0;
    size_t critical_services = 0;
    size_t critical_failures = 0;
    size_t null_implementations = 0;
    size_t warnings = 0;
    ServiceHealth overall_health = ServiceHealth::Healthy;

    std::vector<ServiceStatus> services;
    std::vector<std::string> dependency_issues;
    std::vector<std::string> errors;

    std::string to_json_string() const;
    bool save(const std::string& path) const;

    // Dumps the report through core::log
    void print() const;
};

} // namespace keystone::di

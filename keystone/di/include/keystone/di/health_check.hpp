#pragma once

#include <cstdint>
#include <string>

namespace keystone::di {

enum class ServiceHealthStatus : uint8_t {
    Unknown,    // never checked
    Healthy,
    Degraded,   // resolves, but slow, failing intermittently or self-reported
    Unhealthy   // does not resolve, or reports itself broken
};

const char* to_string(ServiceHealthStatus status);

struct HealthReading {
    ServiceHealthStatus status = ServiceHealthStatus::Healthy;
    std::string message;
};

// Services that can judge their own health. ServiceHealthMonitor asks after
// every successful resolution.
class IHealthCheckable {
public:
    virtual ~IHealthCheckable() = default;
    virtual HealthReading check_health() const = 0;
};

} // namespace keystone::di

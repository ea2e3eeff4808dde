#pragma once

#include <keystone/di/health_check.hpp>
#include <keystone/di/service_registration.hpp>
#include <chrono>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace keystone::di {

class ServiceContainer;

struct ServiceHealthCheck {
    std::string service_name;           // describe(key)
    ServiceHealthStatus status = ServiceHealthStatus::Unknown;
    std::string message;
    std::string instance_type;
    ServiceLifetime lifetime = ServiceLifetime::Singleton;
    double response_ms = 0.0;
    double average_response_ms = 0.0;
    uint32_t failure_count = 0;
    bool self_reported = false;
};

struct ServiceHealthSnapshot {
    ServiceHealthStatus overall = ServiceHealthStatus::Healthy;
    size_t total = 0;
    size_t healthy = 0;
    size_t degraded = 0;
    size_t unhealthy = 0;
    std::vector<ServiceHealthCheck> checks;
};

// ============================================================================
// ServiceHealthMonitor - periodic resolve checks over a container
// ============================================================================
//
// Each check resolves the binding for real, so singletons get materialized.
// A check is Unhealthy when resolution throws or the service reports itself
// broken. A healthy result is downgraded to Degraded when it took longer than
// the slow threshold or the service has failed more than three times.
//
// Usage:
//   ServiceHealthMonitor monitor(container, 30.0f);
//   // per frame
//   monitor.update(dt);
//   for (const auto& check : monitor.unhealthy_services()) { ... }
class ServiceHealthMonitor {
public:
    static constexpr size_t k_history_size = 20;
    static constexpr uint32_t k_failure_tolerance = 3;

    explicit ServiceHealthMonitor(ServiceContainer& container,
                                  float check_interval_seconds = 30.0f,
                                  bool enable_logging = true);

    ServiceHealthMonitor(const ServiceHealthMonitor&) = delete;
    ServiceHealthMonitor& operator=(const ServiceHealthMonitor&) = delete;

    // Checks every active binding of the container
    ServiceHealthSnapshot check_all();

    ServiceHealthCheck check_service(const ServiceKey& key);

    template<typename T>
    ServiceHealthCheck check_service() { return check_service(ServiceKey::of<T>()); }

    // Runs check_all() once check_interval seconds have accumulated.
    // Returns whether a check ran.
    bool update(float dt);

    // Last result for key; Unknown when it was never checked
    ServiceHealthCheck service_health(const ServiceKey& key) const;

    std::vector<ServiceHealthCheck> unhealthy_services() const;
    std::vector<ServiceHealthCheck> degraded_services() const;

    const std::optional<ServiceHealthSnapshot>& last_snapshot() const { return m_last_snapshot; }

    void reset_failure_count(const ServiceKey& key);
    void clear_history();

    float check_interval() const { return m_check_interval; }
    void set_slow_threshold(std::chrono::duration<double, std::milli> threshold) { m_slow_threshold = threshold; }

private:
    struct History {
        ServiceHealthCheck last;
        std::deque<double> response_ms;
        uint32_t failures = 0;
    };

    std::vector<ServiceHealthCheck> with_status(ServiceHealthStatus status) const;
    void log_snapshot(const ServiceHealthSnapshot& snapshot) const;

    ServiceContainer& m_container;
    float m_check_interval;
    bool m_enable_logging;
    float m_since_last_check = 0.0f;
    std::chrono::duration<double, std::milli> m_slow_threshold{100.0};

    std::unordered_map<ServiceKey, History, ServiceKeyHash> m_history;
    std::optional<ServiceHealthSnapshot> m_last_snapshot;
};

} // namespace keystone::di

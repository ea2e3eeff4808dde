#include <keystone/di/service_health_monitor.hpp>
#include <keystone/di/service_container.hpp>
#include <keystone/core/log.hpp>
#include <algorithm>
#include <format>
#include <numeric>

namespace keystone::di {

const char* to_string(ServiceHealthStatus status) {
    switch (status) {
        case ServiceHealthStatus::Unknown:   return "Unknown";
        case ServiceHealthStatus::Healthy:   return "Healthy";
        case ServiceHealthStatus::Degraded:  return "Degraded";
        case ServiceHealthStatus::Unhealthy: return "Unhealthy";
    }
    return "Unknown";
}

ServiceHealthMonitor::ServiceHealthMonitor(ServiceContainer& container,
                                           float check_interval_seconds,
                                           bool enable_logging)
    : m_container(container)
    , m_check_interval(check_interval_seconds)
    , m_enable_logging(enable_logging) {}

// ============================================================================
// Checks
// ============================================================================

ServiceHealthCheck ServiceHealthMonitor::check_service(const ServiceKey& key) {
    ServiceHealthCheck check;
    check.service_name = describe(key);
    History& history = m_history[key];

    auto reg = m_container.find_registration(key);
    if (!reg) {
        check.status = ServiceHealthStatus::Unhealthy;
        check.message = "Service not registered";
        check.failure_count = ++history.failures;
        history.last = check;
        return check;
    }
    check.lifetime = reg->lifetime;

    auto start = std::chrono::steady_clock::now();
    std::shared_ptr<void> instance;
    try {
        instance = m_container.resolve_key(key, true);
    } catch (const std::exception& e) {
        check.status = ServiceHealthStatus::Unhealthy;
        check.message = std::string("Failed to resolve: ") + e.what();
        ++history.failures;
    }

    if (instance) {
        check.instance_type = reg->runtime_type_name ? reg->runtime_type_name(instance) : reg->implementation_name;
        const IHealthCheckable* checkable = reg->as_health_checkable ? reg->as_health_checkable(instance) : nullptr;
        if (checkable) {
            check.self_reported = true;
            try {
                HealthReading reading = checkable->check_health();
                check.status = reading.status;
                check.message = reading.message;
            } catch (const std::exception& e) {
                check.status = ServiceHealthStatus::Unhealthy;
                check.message = std::string("Health check threw: ") + e.what();
                ++history.failures;
            }
        } else {
            check.status = ServiceHealthStatus::Healthy;
            check.message = "Service resolved successfully";
        }
    }

    check.response_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    history.response_ms.push_back(check.response_ms);
    if (history.response_ms.size() > k_history_size) {
        history.response_ms.pop_front();
    }
    check.average_response_ms = std::accumulate(history.response_ms.begin(), history.response_ms.end(), 0.0) /
                                static_cast<double>(history.response_ms.size());
    check.failure_count = history.failures;

    if (check.status == ServiceHealthStatus::Healthy && check.response_ms > m_slow_threshold.count()) {
        check.status = ServiceHealthStatus::Degraded;
        check.message = std::format("Slow response time: {:.2f}ms", check.response_ms);
    }
    if (check.status == ServiceHealthStatus::Healthy && history.failures > k_failure_tolerance) {
        check.status = ServiceHealthStatus::Degraded;
        check.message = std::format("Recent failures detected ({} in history)", history.failures);
    }

    history.last = check;
    return check;
}

ServiceHealthSnapshot ServiceHealthMonitor::check_all() {
    ServiceHealthSnapshot snapshot;

    for (const ServiceKey& key : m_container.registered_keys()) {
        ServiceHealthCheck check = check_service(key);
        ++snapshot.total;
        switch (check.status) {
            case ServiceHealthStatus::Healthy:
                ++snapshot.healthy;
                break;
            case ServiceHealthStatus::Degraded:
                ++snapshot.degraded;
                if (snapshot.overall == ServiceHealthStatus::Healthy) {
                    snapshot.overall = ServiceHealthStatus::Degraded;
                }
                break;
            case ServiceHealthStatus::Unhealthy:
                ++snapshot.unhealthy;
                snapshot.overall = ServiceHealthStatus::Unhealthy;
                break;
            case ServiceHealthStatus::Unknown:
                break;
        }
        snapshot.checks.push_back(std::move(check));
    }

    if (m_enable_logging) {
        log_snapshot(snapshot);
    }
    m_last_snapshot = snapshot;
    return snapshot;
}

bool ServiceHealthMonitor::update(float dt) {
    m_since_last_check += dt;
    if (m_since_last_check < m_check_interval) {
        return false;
    }
    m_since_last_check = 0.0f;
    check_all();
    return true;
}

// ============================================================================
// History
// ============================================================================

ServiceHealthCheck ServiceHealthMonitor::service_health(const ServiceKey& key) const {
    auto it = m_history.find(key);
    if (it != m_history.end()) {
        return it->second.last;
    }

    ServiceHealthCheck check;
    check.service_name = describe(key);
    check.message = "No health check performed yet";
    return check;
}

std::vector<ServiceHealthCheck> ServiceHealthMonitor::with_status(ServiceHealthStatus status) const {
    std::vector<ServiceHealthCheck> result;
    for (const auto& [key, history] : m_history) {
        if (history.last.status == status) {
            result.push_back(history.last);
        }
    }
    std::sort(result.begin(), result.end(), [](const auto& a, const auto& b) {
        return a.service_name < b.service_name;
    });
    return result;
}

std::vector<ServiceHealthCheck> ServiceHealthMonitor::unhealthy_services() const {
    return with_status(ServiceHealthStatus::Unhealthy);
}

std::vector<ServiceHealthCheck> ServiceHealthMonitor::degraded_services() const {
    return with_status(ServiceHealthStatus::Degraded);
}

void ServiceHealthMonitor::reset_failure_count(const ServiceKey& key) {
    auto it = m_history.find(key);
    if (it != m_history.end()) {
        it->second.failures = 0;
    }
}

void ServiceHealthMonitor::clear_history() {
    m_history.clear();
    m_last_snapshot.reset();
    m_since_last_check = 0.0f;
}

void ServiceHealthMonitor::log_snapshot(const ServiceHealthSnapshot& snapshot) const {
    core::log(snapshot.overall == ServiceHealthStatus::Healthy ? core::LogLevel::Info : core::LogLevel::Warn,
              "[Health] {}: {} services, {} healthy, {} degraded, {} unhealthy",
              to_string(snapshot.overall), snapshot.total, snapshot.healthy, snapshot.degraded, snapshot.unhealthy);

    for (const auto& check : snapshot.checks) {
        if (check.status == ServiceHealthStatus::Unhealthy) {
            core::log(core::LogLevel::Error, "[Health]   {}: {}", check.service_name, check.message);
        } else if (check.status == ServiceHealthStatus::Degraded) {
            core::log(core::LogLevel::Warn, "[Health]   {}: {}", check.service_name, check.message);
        }
    }
}

} // namespace keystone::di

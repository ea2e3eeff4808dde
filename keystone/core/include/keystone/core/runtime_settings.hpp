#pragma once

#include <cstdint>
#include <string>

namespace keystone::core {

// "strict" or "last_wins"; parsed by keystone::di
struct ContainerSettings {
    std::string duplicate_policy = "strict";
    float health_check_interval_seconds = 30.0f;
};

struct LocatorSettings {
    bool auto_discovery = true;
    bool caching = true;
    std::string duplicate_policy = "last_wins";
};

struct BootstrapSettings {
    bool register_core_services = true;
    bool auto_wire_candidates = false;     // Convention scan of *Manager / *Service candidates
    bool validate_registrations = true;
    bool use_null_fallbacks = false;       // Fill missing core services with Null implementations
    bool verbose = true;
};

struct InitializerSettings {
    bool enable_phase_logging = true;
    float phase_delay_seconds = 0.1f;
    bool enable_error_recovery = true;
    uint32_t max_recovery_attempts = 3;
    float retry_backoff_seconds = 0.05f;
    bool auto_discover_managers = true;
    bool validate_dependencies_after_init = true;
    bool attempt_service_recovery = true;
    bool fail_on_validation_errors = false;
};

struct BuilderSettings {
    float module_initialization_timeout_seconds = 30.0f;
};

struct RuntimeSettings {
    ContainerSettings container;
    LocatorSettings locator;
    BootstrapSettings bootstrap;
    InitializerSettings initializer;
    BuilderSettings builder;

    // Missing keys keep their current values; parse errors leave everything untouched
    bool load(const std::string& path);
    bool load_from_string(const std::string& text);

    bool save(const std::string& path) const;
    std::string to_json_string() const;

    void reset();
};

} // namespace keystone::core

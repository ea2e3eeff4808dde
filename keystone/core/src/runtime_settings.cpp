#include <keystone/core/runtime_settings.hpp>
#include <keystone/core/filesystem.hpp>
#include <keystone/core/log.hpp>
#include <nlohmann/json.hpp>

namespace keystone::core {

using json = nlohmann::json;

bool RuntimeSettings::load(const std::string& path) {
    if (!FileSystem::exists(path)) {
        log(LogLevel::Warn, "[Settings] {} not found", path);
        return false;
    }

    std::string content = FileSystem::read_text(path);
    if (content.empty()) {
        log(LogLevel::Warn, "[Settings] {} is empty or unreadable", path);
        return false;
    }

    if (!load_from_string(content)) {
        log(LogLevel::Error, "[Settings] Failed to parse {}", path);
        return false;
    }

    log(LogLevel::Info, "[Settings] Loaded {}", path);
    return true;
}

bool RuntimeSettings::load_from_string(const std::string& text) {
    try {
        json j = json::parse(text);
        if (!j.is_object()) {
            return false;
        }

        // Parse into a copy so a type error halfway through leaves *this untouched
        RuntimeSettings parsed = *this;

        if (j.contains("container")) {
            auto& c = j["container"];
            parsed.container.duplicate_policy = c.value("duplicate_policy", parsed.container.duplicate_policy);
            parsed.container.health_check_interval_seconds =
                c.value("health_check_interval_seconds", parsed.container.health_check_interval_seconds);
        }

        if (j.contains("locator")) {
            auto& l = j["locator"];
            parsed.locator.auto_discovery = l.value("auto_discovery", parsed.locator.auto_discovery);
            parsed.locator.caching = l.value("caching", parsed.locator.caching);
            parsed.locator.duplicate_policy = l.value("duplicate_policy", parsed.locator.duplicate_policy);
        }

        if (j.contains("bootstrap")) {
            auto& b = j["bootstrap"];
            parsed.bootstrap.register_core_services = b.value("register_core_services", parsed.bootstrap.register_core_services);
            parsed.bootstrap.auto_wire_candidates = b.value("auto_wire_candidates", parsed.bootstrap.auto_wire_candidates);
            parsed.bootstrap.validate_registrations = b.value("validate_registrations", parsed.bootstrap.validate_registrations);
            parsed.bootstrap.use_null_fallbacks = b.value("use_null_fallbacks", parsed.bootstrap.use_null_fallbacks);
            parsed.bootstrap.verbose = b.value("verbose", parsed.bootstrap.verbose);
        }

        if (j.contains("initializer")) {
            auto& i = j["initializer"];
            auto& s = parsed.initializer;
            s.enable_phase_logging = i.value("enable_phase_logging", s.enable_phase_logging);
            s.phase_delay_seconds = i.value("phase_delay_seconds", s.phase_delay_seconds);
            s.enable_error_recovery = i.value("enable_error_recovery", s.enable_error_recovery);
            s.max_recovery_attempts = i.value("max_recovery_attempts", s.max_recovery_attempts);
            s.retry_backoff_seconds = i.value("retry_backoff_seconds", s.retry_backoff_seconds);
            s.auto_discover_managers = i.value("auto_discover_managers", s.auto_discover_managers);
            s.validate_dependencies_after_init = i.value("validate_dependencies_after_init", s.validate_dependencies_after_init);
            s.attempt_service_recovery = i.value("attempt_service_recovery", s.attempt_service_recovery);
            s.fail_on_validation_errors = i.value("fail_on_validation_errors", s.fail_on_validation_errors);
        }

        if (j.contains("builder")) {
            auto& b = j["builder"];
            parsed.builder.module_initialization_timeout_seconds =
                b.value("module_initialization_timeout_seconds", parsed.builder.module_initialization_timeout_seconds);
        }

        *this = parsed;
        return true;
    } catch (const json::exception& e) {
        log(LogLevel::Error, "[Settings] JSON error: {}", e.what());
        return false;
    }
}

std::string RuntimeSettings::to_json_string() const {
    json j;

    j["container"] = {
        {"duplicate_policy", container.duplicate_policy},
        {"health_check_interval_seconds", container.health_check_interval_seconds}
    };

    j["locator"] = {
        {"auto_discovery", locator.auto_discovery},
        {"caching", locator.caching},
        {"duplicate_policy", locator.duplicate_policy}
    };

    j["bootstrap"] = {
        {"register_core_services", bootstrap.register_core_services},
        {"auto_wire_candidates", bootstrap.auto_wire_candidates},
        {"validate_registrations", bootstrap.validate_registrations},
        {"use_null_fallbacks", bootstrap.use_null_fallbacks},
        {"verbose", bootstrap.verbose}
    };

    j["initializer"] = {
        {"enable_phase_logging", initializer.enable_phase_logging},
        {"phase_delay_seconds", initializer.phase_delay_seconds},
        {"enable_error_recovery", initializer.enable_error_recovery},
        {"max_recovery_attempts", initializer.max_recovery_attempts},
        {"retry_backoff_seconds", initializer.retry_backoff_seconds},
        {"auto_discover_managers", initializer.auto_discover_managers},
        {"validate_dependencies_after_init", initializer.validate_dependencies_after_init},
        {"attempt_service_recovery", initializer.attempt_service_recovery},
        {"fail_on_validation_errors", initializer.fail_on_validation_errors}
    };

    j["builder"] = {
        {"module_initialization_timeout_seconds", builder.module_initialization_timeout_seconds}
    };

    return j.dump(4);
}

bool RuntimeSettings::save(const std::string& path) const {
    if (!FileSystem::write_text(path, to_json_string())) {
        log(LogLevel::Error, "[Settings] Failed to write {}", path);
        return false;
    }
    return true;
}

void RuntimeSettings::reset() {
    *this = RuntimeSettings{};
}

} // namespace keystone::core

#include "commands.hpp"
#include <keystone/core/log.hpp>
#include <keystone/core/runtime_settings.hpp>
#include <keystone/di/bootstrapper.hpp>
#include <keystone/di/service_container.hpp>
#include <keystone/di/service_health_monitor.hpp>
#include <keystone/init/game_system_initializer.hpp>
#include <keystone/init/init_events.hpp>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <vector>

namespace keystone::cli {

namespace {

// ============================================================================
// Demo session
// ============================================================================

class SessionManager : public init::ManagerBase {
public:
    SessionManager(std::string name, init::ManagerPriority priority,
                   std::vector<std::string> deps, di::ServiceContainer& services)
        : ManagerBase(std::move(name), priority, std::move(deps))
        , m_services(services) {}

    void set_broken(bool broken) { m_broken = broken; }

protected:
    bool on_initialize() override {
        if (m_broken) {
            throw std::runtime_error("forced failure");
        }
        return start();
    }

    virtual bool start() = 0;

    di::ServiceContainer& m_services;

private:
    bool m_broken = false;
};

class ClockManager : public SessionManager {
public:
    explicit ClockManager(di::ServiceContainer& services)
        : SessionManager("Clock", init::ManagerPriority::Critical, {}, services) {}

protected:
    bool start() override {
        auto time = m_services.try_resolve<di::ITimeService>();
        if (!time) return false;
        time->set_time_scale(1.0f);
        return true;
    }
};

class SaveManager : public SessionManager {
public:
    explicit SaveManager(di::ServiceContainer& services)
        : SessionManager("Saves", init::ManagerPriority::High, {}, services) {}

protected:
    bool start() override {
        auto persistence = m_services.try_resolve<di::IPersistenceService>();
        if (!persistence) return false;
        return persistence->has_slot("autosave") || persistence->save("autosave", "{}");
    }
};

class MarketManager : public SessionManager {
public:
    explicit MarketManager(di::ServiceContainer& services)
        : SessionManager("Market", init::ManagerPriority::Normal, {"Clock"}, services) {}

protected:
    bool start() override {
        return m_services.is_registered<di::IEventService>();
    }
};

class ResearchManager : public SessionManager {
public:
    explicit ResearchManager(di::ServiceContainer& services)
        : SessionManager("Research", init::ManagerPriority::Normal, {"Market"}, services) {}

    init::ManagerCategory category() const override { return init::ManagerCategory::Progression; }

protected:
    bool start() override { return true; }
};

class HudManager : public SessionManager {
public:
    explicit HudManager(di::ServiceContainer& services)
        : SessionManager("Hud", init::ManagerPriority::Low, {"Market", "Research"}, services) {}

protected:
    bool start() override {
        return m_services.is_registered<di::ISettingsService>();
    }
};

bool load_settings(const std::string& path, core::RuntimeSettings& settings) {
    if (path.empty()) return true;
    if (!settings.load(path)) {
        std::cerr << "Error: could not load settings from " << path << "\n";
        return false;
    }
    return true;
}

void bootstrap(di::Bootstrapper& bootstrapper, const core::RuntimeSettings& settings) {
    di::CoreServices services;
    services.settings = std::make_shared<di::RuntimeSettingsService>(settings);
    bootstrapper.set_core_services(std::move(services));
    bootstrapper.run();
}

} // namespace

// ============================================================================
// Commands
// ============================================================================

Result cmd_bringup(const std::string& settings_path, const std::string& failing_manager) {
    core::RuntimeSettings settings;
    if (!load_settings(settings_path, settings)) {
        return Result::FileError;
    }

    try {
        di::ServiceContainer container(di::parse_duplicate_policy(settings.container.duplicate_policy));
        di::Bootstrapper bootstrapper(settings.bootstrap, &container);
        bootstrap(bootstrapper, settings);

        auto clock = std::make_shared<ClockManager>(container);
        auto saves = std::make_shared<SaveManager>(container);
        auto market = std::make_shared<MarketManager>(container);
        auto research = std::make_shared<ResearchManager>(container);
        auto hud = std::make_shared<HudManager>(container);

        container.register_singleton<ClockManager>(clock);
        container.register_singleton<SaveManager>(saves);
        container.register_singleton<MarketManager>(market);
        container.register_singleton<ResearchManager>(research);
        container.register_singleton<HudManager>(hud);

        std::vector<SessionManager*> session{clock.get(), saves.get(), market.get(), research.get(), hud.get()};
        init::ManagerRegistry registry;
        bool fail_matched = failing_manager.empty();
        for (SessionManager* manager : session) {
            if (manager->name() == failing_manager) {
                manager->set_broken(true);
                fail_matched = true;
            }
            registry.add(*manager);
        }
        if (!fail_matched) {
            std::cerr << "Error: no manager named '" << failing_manager << "'\n";
            return Result::InvalidArgs;
        }

        init::GameSystemInitializer initializer(settings.initializer, &container);
        initializer.add_source(registry);

        auto on_manager = initializer.events().subscribe<init::ManagerInitializedEvent>(
            [](const init::ManagerInitializedEvent& e) {
                std::cout << "  " << (e.success ? "[ok]   " : "[fail] ") << e.name
                          << " (" << init::to_string(e.category) << ", " << e.attempts << " attempts)";
                if (!e.success) std::cout << ": " << e.error;
                std::cout << "\n";
            });

        std::cout << "Bringing up " << session.size() << " managers...\n";
        init::InitializationResult result = initializer.run_to_completion();

        std::cout << "\nState:       " << init::to_string(result.final_state) << "\n";
        std::cout << "Initialized: " << result.initialized_manager_count << "\n";
        std::cout << "Failed:      " << result.failed_manager_count << "\n";
        std::cout << "Elapsed:     " << result.elapsed_seconds << "s\n";
        if (result.validation) {
            for (const auto& error : result.validation->all_errors) {
                std::cout << "  validation: " << error << "\n";
            }
        }
        if (!result.success) {
            std::cerr << "Initialization failed: " << result.error_message << "\n";
        }

        di::ServiceHealthMonitor monitor(container, settings.container.health_check_interval_seconds, false);
        di::ServiceHealthSnapshot health = monitor.check_all();
        std::cout << "Services:    " << health.healthy << " healthy, " << health.degraded << " degraded, "
                  << health.unhealthy << " unhealthy\n";
        for (const auto& check : health.checks) {
            if (check.status != di::ServiceHealthStatus::Healthy) {
                std::cout << "  health: " << check.service_name << " (" << di::to_string(check.status)
                          << "): " << check.message << "\n";
            }
        }

        initializer.shutdown();
        return result.success ? Result::Success : Result::InitializationError;
    } catch (const std::exception& e) {
        core::log(core::LogLevel::Fatal, "[CLI] {}", e.what());
        return Result::RuntimeError;
    }
}

Result cmd_report(const std::string& settings_path, const std::string& out_path) {
    core::RuntimeSettings settings;
    if (!load_settings(settings_path, settings)) {
        return Result::FileError;
    }

    try {
        di::ServiceContainer container(di::parse_duplicate_policy(settings.container.duplicate_policy));
        di::Bootstrapper bootstrapper(settings.bootstrap, &container);
        bootstrap(bootstrapper, settings);

        const di::HealthReport& report = bootstrapper.report();
        if (out_path.empty()) {
            std::cout << report.to_json_string() << "\n";
            return Result::Success;
        }

        if (!report.save(out_path)) {
            std::cerr << "Error: could not write report to " << out_path << "\n";
            return Result::FileError;
        }
        std::cout << "Health report written to " << out_path << " ("
                  << di::to_string(report.overall_health) << ")\n";
        return Result::Success;
    } catch (const std::exception& e) {
        core::log(core::LogLevel::Fatal, "[CLI] {}", e.what());
        return Result::RuntimeError;
    }
}

Result cmd_settings(const std::string& out_path) {
    core::RuntimeSettings settings;
    if (!settings.save(out_path)) {
        std::cerr << "Error: could not write settings to " << out_path << "\n";
        return Result::FileError;
    }
    std::cout << "Default settings written to " << out_path << "\n";
    return Result::Success;
}

void cmd_help() {
    std::cout << R"(Keystone CLI - service container and bring-up tool

Usage: keystone <command> [options]

Commands:
  bringup         Bootstrap core services, bring up the demo session and
                  run one service health check
                    --settings <file>  Load runtime settings (JSON)
                    --fail <manager>   Force a manager to fail (Clock, Saves, Market, Research, Hud)

  report          Print the service health report as JSON
                    --settings <file>  Load runtime settings (JSON)
                    --out <file>       Write the report to a file instead

  settings        Write the default runtime settings
                    --write <file>     Destination file

  help            Show this help message

Examples:
  keystone bringup                    Bring up with default settings
  keystone bringup --fail Market      Observe retries and a non-fatal failure
  keystone report --out health.json   Save the health report
  keystone settings --write keystone.json
)";
}

} // namespace keystone::cli

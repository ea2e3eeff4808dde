#include <keystone/di/container_builder.hpp>
#include <keystone/core/log.hpp>
#include <unordered_map>
#include <unordered_set>

namespace keystone::di {

ContainerBuilder::ContainerBuilder(ServiceContainer& container, const core::BuilderSettings& settings)
    : m_container(container)
    , m_module_timeout(std::chrono::milliseconds(
          static_cast<int64_t>(settings.module_initialization_timeout_seconds * 1000.0f))) {}

ContainerBuilder& ContainerBuilder::configure(Action action) {
    if (action) {
        m_actions.push_back(std::move(action));
    }
    return *this;
}

ContainerBuilder& ContainerBuilder::configure_if(bool condition, const std::function<void(ContainerBuilder&)>& fn) {
    if (condition && fn) {
        fn(*this);
    }
    return *this;
}

ContainerBuilder& ContainerBuilder::add_module(std::shared_ptr<IServiceModule> module) {
    if (!module) {
        throw ServiceError("Null service module");
    }
    m_modules.push_back(std::move(module));
    return *this;
}

ContainerBuilder& ContainerBuilder::add_modules(const std::vector<std::shared_ptr<IServiceModule>>& modules) {
    for (const auto& module : modules) {
        add_module(module);
    }
    return *this;
}

ContainerBuilder& ContainerBuilder::set_module_timeout(std::chrono::milliseconds timeout) {
    m_module_timeout = timeout;
    return *this;
}

ContainerBuilder& ContainerBuilder::validate() {
    m_validations.push_back([this](ServiceContainer& container) {
        std::string missing;
        for (const auto& required : m_required) {
            if (!container.contains(required.key)) {
                if (!missing.empty()) missing += ", ";
                missing += required.name;
            }
        }
        if (!missing.empty()) {
            throw ContainerValidationError("missing required services: " + missing);
        }

        auto result = container.verify();
        if (!result.is_valid) {
            std::string details;
            for (const auto& error : result.errors) {
                if (!details.empty()) details += "; ";
                details += error;
            }
            throw ContainerValidationError(details);
        }
        for (const auto& warning : result.warnings) {
            core::log(core::LogLevel::Warn, "[Builder] {}", warning);
        }
    });
    return *this;
}

ServiceContainer& ContainerBuilder::build() {
    if (m_built) {
        core::log(core::LogLevel::Warn, "[Builder] build() called twice, ignoring");
        return m_container;
    }

    // Resolve module order up front so a bad graph fails before anything is applied
    auto modules = sorted_modules();

    for (auto& action : m_actions) {
        action(m_container);
    }

    run_module_passes(modules);

    for (auto& validation : m_validations) {
        validation(m_container);
    }

    m_built = true;
    core::log(core::LogLevel::Info, "[Builder] Container built: {} actions, {} modules, {} registrations",
              m_actions.size(), modules.size(), m_container.statistics().total_registrations);
    return m_container;
}

std::vector<std::string> ContainerBuilder::module_order() const {
    std::vector<std::string> names;
    for (const auto& module : sorted_modules()) {
        names.push_back(module->name());
    }
    return names;
}

// ============================================================================
// Module ordering
// ============================================================================

std::vector<std::shared_ptr<IServiceModule>> ContainerBuilder::sorted_modules() const {
    std::unordered_map<std::string, std::shared_ptr<IServiceModule>> by_name;
    for (const auto& module : m_modules) {
        if (!by_name.emplace(module->name(), module).second) {
            throw ModuleConfigurationError(module->name(), "registered twice");
        }
    }

    enum class Mark { None, Visiting, Done };
    std::unordered_map<std::string, Mark> marks;
    std::vector<std::shared_ptr<IServiceModule>> order;

    std::function<void(const std::shared_ptr<IServiceModule>&)> visit =
        [&](const std::shared_ptr<IServiceModule>& module) {
            std::string name = module->name();
            Mark& mark = marks[name];
            if (mark == Mark::Done) return;
            if (mark == Mark::Visiting) {
                throw ModuleConfigurationError(name, "dependency cycle");
            }
            mark = Mark::Visiting;

            for (const auto& dependency : module->dependencies()) {
                auto it = by_name.find(dependency);
                if (it == by_name.end()) {
                    throw ModuleConfigurationError(name, "unknown dependency '" + dependency + "'");
                }
                visit(it->second);
            }

            marks[name] = Mark::Done;
            order.push_back(module);
        };

    for (const auto& module : m_modules) {
        visit(module);
    }
    return order;
}

void ContainerBuilder::run_module_passes(const std::vector<std::shared_ptr<IServiceModule>>& modules) {
    for (const auto& module : modules) {
        try {
            module->configure_services(m_container);
            core::log(core::LogLevel::Debug, "[Builder] Configured module {} v{}", module->name(), module->version());
        } catch (const ModuleConfigurationError&) {
            throw;
        } catch (const std::exception& e) {
            core::log(core::LogLevel::Error, "[Builder] Module {} failed to configure: {}", module->name(), e.what());
            throw ModuleConfigurationError(module->name(), e.what());
        }
    }

    for (const auto& module : modules) {
        auto timeout = module->initialization_timeout();
        if (timeout <= std::chrono::milliseconds::zero()) {
            timeout = m_module_timeout;
        }

        auto start = std::chrono::steady_clock::now();
        try {
            module->initialize(m_container);
        } catch (const ModuleConfigurationError&) {
            throw;
        } catch (const std::exception& e) {
            core::log(core::LogLevel::Error, "[Builder] Module {} failed to initialize: {}", module->name(), e.what());
            throw ModuleConfigurationError(module->name(), e.what());
        }

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        if (elapsed > timeout) {
            core::log(core::LogLevel::Error, "[Builder] Module {} initialization took {}ms (limit {}ms)",
                      module->name(), elapsed.count(), timeout.count());
            throw ModuleConfigurationError(module->name(),
                "initialization exceeded timeout of " + std::to_string(timeout.count()) + "ms");
        }
    }
}

} // namespace keystone::di

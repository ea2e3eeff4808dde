#pragma once

#include <keystone/core/runtime_settings.hpp>
#include <keystone/di/service_container.hpp>
#include <keystone/di/service_module.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace keystone::di {

// ============================================================================
// ContainerBuilder - deferred, ordered container configuration
// ============================================================================
//
// Every add_* call only records an action. build() applies the actions in
// order, runs the module passes, then the validation actions. The first
// failure aborts the build and propagates; module failures surface as
// ModuleConfigurationError.
class ContainerBuilder {
public:
    using Action = std::function<void(ServiceContainer&)>;

    explicit ContainerBuilder(ServiceContainer& container,
                              const core::BuilderSettings& settings = {});

    // ========================================================================
    // Registrations
    // ========================================================================

    template<typename T, typename Impl = T>
    ContainerBuilder& add_singleton() {
        return configure([](ServiceContainer& c) { c.register_singleton<T, Impl>(); });
    }

    template<typename T>
    ContainerBuilder& add_singleton(std::shared_ptr<T> instance) {
        return configure([instance](ServiceContainer& c) { c.register_singleton<T>(instance); });
    }

    template<typename T>
    ContainerBuilder& add_singleton(Factory<T> factory) {
        return configure([factory](ServiceContainer& c) { c.register_singleton<T>(factory); });
    }

    template<typename T, typename Impl = T>
    ContainerBuilder& add_transient() {
        return configure([](ServiceContainer& c) { c.register_transient<T, Impl>(); });
    }

    template<typename T>
    ContainerBuilder& add_factory(Factory<T> factory) {
        return configure([factory](ServiceContainer& c) { c.register_factory<T>(factory); });
    }

    template<typename T, typename Impl = T>
    ContainerBuilder& add_scoped() {
        return configure([](ServiceContainer& c) { c.register_scoped<T, Impl>(); });
    }

    template<typename T, typename Impl = T>
    ContainerBuilder& add_named(std::string name, ServiceLifetime lifetime = ServiceLifetime::Singleton) {
        return configure([name, lifetime](ServiceContainer& c) { c.register_named<T, Impl>(name, lifetime); });
    }

    template<typename T, typename Impl = T>
    ContainerBuilder& add_conditional(std::function<bool(IServiceResolver&)> predicate,
                                      ServiceLifetime lifetime = ServiceLifetime::Singleton) {
        return configure([predicate, lifetime](ServiceContainer& c) {
            c.register_conditional<T, Impl>(predicate, lifetime);
        });
    }

    template<typename T>
    ContainerBuilder& add_decorator(std::function<std::shared_ptr<T>(std::shared_ptr<T>, IServiceResolver&)> wrap) {
        return configure([wrap](ServiceContainer& c) { c.register_decorator<T>(wrap); });
    }

    template<typename T, typename... Impls>
    ContainerBuilder& add_collection(ServiceLifetime lifetime = ServiceLifetime::Singleton) {
        return configure([lifetime](ServiceContainer& c) { c.register_collection<T, Impls...>(lifetime); });
    }

    ContainerBuilder& configure(Action action);
    ContainerBuilder& configure_if(bool condition, const std::function<void(ContainerBuilder&)>& fn);

    // ========================================================================
    // Modules
    // ========================================================================

    ContainerBuilder& add_module(std::shared_ptr<IServiceModule> module);
    ContainerBuilder& add_modules(const std::vector<std::shared_ptr<IServiceModule>>& modules);

    template<typename M>
    ContainerBuilder& add_module() {
        return add_module(std::make_shared<M>());
    }

    // Default for modules that do not declare their own timeout
    ContainerBuilder& set_module_timeout(std::chrono::milliseconds timeout);

    // ========================================================================
    // Validation
    // ========================================================================

    template<typename T>
    ContainerBuilder& require() {
        m_required.push_back(RequiredService{ServiceKey::of<T>(), core::type_name<T>()});
        return *this;
    }

    // Appends a final check: required services present and verify() clean.
    // Failure throws ContainerValidationError.
    ContainerBuilder& validate();

    // Applies everything once; later calls return the container unchanged
    ServiceContainer& build();

    bool is_built() const { return m_built; }

    // Module names in the order their passes ran (or will run)
    std::vector<std::string> module_order() const;

private:
    struct RequiredService {
        ServiceKey key;
        std::string name;
    };

    std::vector<std::shared_ptr<IServiceModule>> sorted_modules() const;
    void run_module_passes(const std::vector<std::shared_ptr<IServiceModule>>& modules);

    ServiceContainer& m_container;
    std::vector<Action> m_actions;
    std::vector<Action> m_validations;
    std::vector<std::shared_ptr<IServiceModule>> m_modules;
    std::vector<RequiredService> m_required;
    std::chrono::milliseconds m_module_timeout;
    bool m_built = false;
};

} // namespace keystone::di

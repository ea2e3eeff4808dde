#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace keystone::di {

class ServiceContainer;

// A named bundle of registrations. The builder runs configure_services on
// every module, then initialize on every module, both in dependency order.
class IServiceModule {
public:
    virtual ~IServiceModule() = default;

    virtual std::string name() const = 0;
    virtual std::string version() const { return "1.0.0"; }

    // Names of modules that must be configured and initialized first
    virtual std::vector<std::string> dependencies() const { return {}; }

    // Zero means "use the builder's default"
    virtual std::chrono::milliseconds initialization_timeout() const {
        return std::chrono::milliseconds::zero();
    }

    virtual void configure_services(ServiceContainer& container) = 0;
    virtual void initialize(ServiceContainer& container) { (void)container; }
};

} // namespace keystone::di

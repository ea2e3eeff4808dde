#pragma once

#include <keystone/di/service_registration.hpp>
#include <functional>
#include <memory>
#include <string>
#include <typeindex>
#include <vector>

namespace keystone::di {

// Something the locator can ask for an instance it has no registration for.
// Returns a ready registration holding the instance, or nullptr.
class IDiscoverySource {
public:
    virtual ~IDiscoverySource() = default;
    virtual std::shared_ptr<ServiceRegistration> discover(std::type_index capability) = 0;
};

// One capability a live object can be registered under
struct CapabilityBinding {
    std::type_index type;
    std::string capability_name;    // unqualified, e.g. "ITimeService"
    std::function<std::shared_ptr<ServiceRegistration>()> make_registration;
};

// A live object of the running session together with the capabilities it
// declares. The first binding is always the concrete type.
struct ServiceCandidate {
    std::string type_name;          // unqualified concrete type name
    std::vector<CapabilityBinding> bindings;

    template<typename Concrete, typename... Interfaces>
    static ServiceCandidate of(std::shared_ptr<Concrete> instance) {
        static_assert((std::is_base_of_v<Interfaces, Concrete> && ...),
                      "Declared interfaces must be bases of the concrete type");
        ServiceCandidate candidate;
        candidate.type_name = core::short_type_name(core::type_name<Concrete>());
        candidate.bindings.push_back(binding_for<Concrete>(instance));
        (candidate.bindings.push_back(binding_for<Interfaces>(instance)), ...);
        return candidate;
    }

private:
    template<typename Capability, typename Concrete>
    static CapabilityBinding binding_for(const std::shared_ptr<Concrete>& instance) {
        std::shared_ptr<Capability> as_capability = instance;
        return CapabilityBinding{
            std::type_index(typeid(Capability)),
            core::short_type_name(core::type_name<Capability>()),
            [as_capability]() {
                auto reg = make_registration<Capability>(ServiceLifetime::Singleton);
                bind_instance<Capability>(*reg, as_capability);
                return reg;
            }
        };
    }
};

// ============================================================================
// ServiceCatalog - the objects a hosting session exposes for discovery
// ============================================================================
//
// Feeds the locator's auto-discovery and the bootstrapper's auto-wiring.
class ServiceCatalog : public IDiscoverySource {
public:
    template<typename Concrete, typename... Interfaces>
    void add(std::shared_ptr<Concrete> instance) {
        add(ServiceCandidate::of<Concrete, Interfaces...>(std::move(instance)));
    }

    void add(ServiceCandidate candidate);

    // First candidate declaring the capability wins
    std::shared_ptr<ServiceRegistration> discover(std::type_index capability) override;

    const std::vector<ServiceCandidate>& candidates() const { return m_candidates; }
    size_t size() const { return m_candidates.size(); }
    void clear() { m_candidates.clear(); }

private:
    std::vector<ServiceCandidate> m_candidates;
};

} // namespace keystone::di

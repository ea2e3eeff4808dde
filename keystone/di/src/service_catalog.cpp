#include <keystone/di/service_catalog.hpp>
#include <keystone/core/log.hpp>

namespace keystone::di {

void ServiceCatalog::add(ServiceCandidate candidate) {
    core::log(core::LogLevel::Trace, "[Catalog] Added {} ({} capabilities)",
              candidate.type_name, candidate.bindings.size());
    m_candidates.push_back(std::move(candidate));
}

std::shared_ptr<ServiceRegistration> ServiceCatalog::discover(std::type_index capability) {
    for (const auto& candidate : m_candidates) {
        for (const auto& binding : candidate.bindings) {
            if (binding.type == capability) {
                return binding.make_registration();
            }
        }
    }
    return nullptr;
}

} // namespace keystone::di

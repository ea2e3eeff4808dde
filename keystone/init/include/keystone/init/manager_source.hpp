#pragma once

#include <keystone/init/manager.hpp>
#include <vector>

namespace keystone::init {

// The live session the discovery service scans
class IManagerSource {
public:
    virtual ~IManagerSource() = default;
    virtual std::vector<IManager*> managers() const = 0;
};

// Explicit list of live managers kept by the host. Non-owning.
class ManagerRegistry : public IManagerSource {
public:
    void add(IManager& manager);
    bool remove(const IManager& manager);
    void clear() { m_managers.clear(); }

    size_t size() const { return m_managers.size(); }
    std::vector<IManager*> managers() const override { return m_managers; }

private:
    std::vector<IManager*> m_managers;
};

} // namespace keystone::init

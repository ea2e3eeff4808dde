#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace keystone::init {

enum class ManagerPriority : uint8_t {
    Critical,
    High,
    Normal,
    Low
};

enum class ManagerCategory : uint8_t {
    Core,
    Domain,
    Progression,
    UI
};

const char* to_string(ManagerPriority priority);
const char* to_string(ManagerCategory category);

// Critical/High -> Core, Normal -> Domain, Low -> UI
ManagerCategory default_category(ManagerPriority priority);

// A long-lived subsystem brought up by GameSystemInitializer.
// The hosting application owns managers; the initializer only references them.
class IManager {
public:
    virtual ~IManager() = default;

    virtual std::string name() const = 0;
    virtual ManagerPriority priority() const { return ManagerPriority::Normal; }
    virtual ManagerCategory category() const { return default_category(priority()); }

    virtual bool is_initialized() const = 0;

    // false or an exception marks the attempt as failed
    virtual bool initialize() = 0;
    virtual void shutdown() = 0;

    // Names (display or type name) of managers this one needs
    virtual std::vector<std::string> dependencies() const { return {}; }
};

struct ValidationResult {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

// Managers that can check their own post-initialization state
class IValidatable {
public:
    virtual ~IValidatable() = default;
    virtual ValidationResult validate() const = 0;
};

// Convenience base tracking the initialized flag
class ManagerBase : public IManager {
public:
    explicit ManagerBase(std::string name,
                         ManagerPriority priority = ManagerPriority::Normal,
                         std::vector<std::string> dependencies = {});

    std::string name() const override { return m_name; }
    ManagerPriority priority() const override { return m_priority; }
    bool is_initialized() const override { return m_initialized; }
    std::vector<std::string> dependencies() const override { return m_dependencies; }

    bool initialize() final;
    void shutdown() final;

protected:
    virtual bool on_initialize() = 0;
    virtual void on_shutdown() {}

private:
    std::string m_name;
    ManagerPriority m_priority;
    std::vector<std::string> m_dependencies;
    bool m_initialized = false;
};

} // namespace keystone::init

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace keystone::init {

// Base of every failure raised while bringing managers up
class InitializationError : public std::runtime_error {
public:
    explicit InitializationError(const std::string& message)
        : std::runtime_error(message) {}
};

class NoManagersDiscoveredError : public InitializationError {
public:
    NoManagersDiscoveredError()
        : InitializationError("No managers discovered") {}
};

class ManagerInitializationError : public InitializationError {
public:
    ManagerInitializationError(const std::string& manager, uint32_t attempts, const std::string& reason)
        : InitializationError("Manager '" + manager + "' failed to initialize after " +
                              std::to_string(attempts) + (attempts == 1 ? " attempt: " : " attempts: ") + reason)
        , m_manager(manager)
        , m_attempts(attempts) {}

    const std::string& manager() const { return m_manager; }
    uint32_t attempts() const { return m_attempts; }

private:
    std::string m_manager;
    uint32_t m_attempts;
};

class DependencyCycleError : public InitializationError {
public:
    // cycle lists the managers in order, closing back on the first
    explicit DependencyCycleError(const std::vector<std::string>& cycle)
        : InitializationError("Circular dependency detected: " + join(cycle))
        , m_cycle(cycle) {}

    const std::vector<std::string>& cycle() const { return m_cycle; }

private:
    static std::string join(const std::vector<std::string>& cycle) {
        std::string text;
        for (const auto& node : cycle) {
            if (!text.empty()) text += " -> ";
            text += node;
        }
        return text;
    }

    std::vector<std::string> m_cycle;
};

class MissingDependencyError : public InitializationError {
public:
    MissingDependencyError(const std::string& manager, const std::string& dependency)
        : InitializationError("Manager '" + manager + "' depends on missing manager '" + dependency + "'")
        , m_manager(manager)
        , m_dependency(dependency) {}

    const std::string& manager() const { return m_manager; }
    const std::string& dependency() const { return m_dependency; }

private:
    std::string m_manager;
    std::string m_dependency;
};

} // namespace keystone::init

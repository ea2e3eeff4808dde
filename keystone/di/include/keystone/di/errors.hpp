#pragma once

#include <stdexcept>
#include <string>

namespace keystone::di {

// Base of every failure raised by the container, locator and builder
class ServiceError : public std::runtime_error {
public:
    explicit ServiceError(const std::string& message)
        : std::runtime_error(message) {}
};

class DuplicateRegistrationError : public ServiceError {
public:
    explicit DuplicateRegistrationError(const std::string& service)
        : ServiceError("Service already registered: " + service)
        , m_service(service) {}

    const std::string& service() const { return m_service; }

private:
    std::string m_service;
};

class UnresolvedServiceError : public ServiceError {
public:
    explicit UnresolvedServiceError(const std::string& service, const std::string& reason = "no registration")
        : ServiceError("Cannot resolve " + service + ": " + reason)
        , m_service(service) {}

    const std::string& service() const { return m_service; }

private:
    std::string m_service;
};

// Raised by the process-wide locator once every lookup strategy has failed
class ServiceNotFoundError : public UnresolvedServiceError {
public:
    explicit ServiceNotFoundError(const std::string& service)
        : UnresolvedServiceError(service, "not registered, cached or discoverable") {}
};

class ContainerDisposedError : public ServiceError {
public:
    ContainerDisposedError()
        : ServiceError("Service container has been disposed") {}
};

class ContainerValidationError : public ServiceError {
public:
    explicit ContainerValidationError(const std::string& details)
        : ServiceError("Container validation failed: " + details) {}
};

class ModuleConfigurationError : public ServiceError {
public:
    ModuleConfigurationError(const std::string& module, const std::string& reason)
        : ServiceError("Module '" + module + "' failed: " + reason)
        , m_module(module) {}

    const std::string& module() const { return m_module; }

private:
    std::string m_module;
};

} // namespace keystone::di

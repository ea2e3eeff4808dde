#pragma once

#include <keystone/core/event_dispatcher.hpp>
#include <keystone/core/runtime_settings.hpp>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace keystone::di {

// ============================================================================
// Core infrastructure capabilities registered by the bootstrapper
// ============================================================================

class ITimeService {
public:
    virtual ~ITimeService() = default;
    virtual double elapsed_seconds() const = 0;
    virtual float time_scale() const = 0;
    virtual void set_time_scale(float scale) = 0;
};

class IPersistenceService {
public:
    virtual ~IPersistenceService() = default;
    virtual bool save(const std::string& slot, const std::string& payload) = 0;
    virtual std::optional<std::string> load(const std::string& slot) const = 0;
    virtual bool has_slot(const std::string& slot) const = 0;
};

class IEventService {
public:
    virtual ~IEventService() = default;
    virtual core::EventDispatcher& dispatcher() = 0;
};

class ISettingsService {
public:
    virtual ~ISettingsService() = default;
    virtual const core::RuntimeSettings& settings() const = 0;
};

// ============================================================================
// Default implementations
// ============================================================================

class SteadyTimeService : public ITimeService {
public:
    SteadyTimeService();
    double elapsed_seconds() const override;
    float time_scale() const override { return m_time_scale; }
    void set_time_scale(float scale) override { m_time_scale = scale; }

private:
    std::chrono::steady_clock::time_point m_start;
    float m_time_scale = 1.0f;
};

class MemoryPersistenceService : public IPersistenceService {
public:
    bool save(const std::string& slot, const std::string& payload) override;
    std::optional<std::string> load(const std::string& slot) const override;
    bool has_slot(const std::string& slot) const override;

private:
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, std::string> m_slots;
};

class DispatcherEventService : public IEventService {
public:
    core::EventDispatcher& dispatcher() override { return m_dispatcher; }

private:
    core::EventDispatcher m_dispatcher;
};

class RuntimeSettingsService : public ISettingsService {
public:
    explicit RuntimeSettingsService(core::RuntimeSettings settings = {})
        : m_settings(std::move(settings)) {}
    const core::RuntimeSettings& settings() const override { return m_settings; }

private:
    core::RuntimeSettings m_settings;
};

// ============================================================================
// Null implementations
// ============================================================================
//
// Stand-ins that keep dependents running when a real service is unavailable.
// The health report counts any implementation whose name starts with "Null".

class NullTimeService : public ITimeService {
public:
    double elapsed_seconds() const override { return 0.0; }
    float time_scale() const override { return 1.0f; }
    void set_time_scale(float) override {}
};

class NullPersistenceService : public IPersistenceService {
public:
    bool save(const std::string&, const std::string&) override { return false; }
    std::optional<std::string> load(const std::string&) const override { return std::nullopt; }
    bool has_slot(const std::string&) const override { return false; }
};

class NullEventService : public IEventService {
public:
    core::EventDispatcher& dispatcher() override { return m_dispatcher; }

private:
    core::EventDispatcher m_dispatcher;
};

class NullSettingsService : public ISettingsService {
public:
    const core::RuntimeSettings& settings() const override { return m_defaults; }

private:
    core::RuntimeSettings m_defaults;
};

} // namespace keystone::di

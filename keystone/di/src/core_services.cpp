#include <keystone/di/core_services.hpp>

namespace keystone::di {

SteadyTimeService::SteadyTimeService()
    : m_start(std::chrono::steady_clock::now()) {}

double SteadyTimeService::elapsed_seconds() const {
    auto elapsed = std::chrono::steady_clock::now() - m_start;
    return std::chrono::duration<double>(elapsed).count();
}

bool MemoryPersistenceService::save(const std::string& slot, const std::string& payload) {
    if (slot.empty()) return false;
    std::lock_guard<std::mutex> lock(m_mutex);
    m_slots[slot] = payload;
    return true;
}

std::optional<std::string> MemoryPersistenceService::load(const std::string& slot) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_slots.find(slot);
    if (it == m_slots.end()) return std::nullopt;
    return it->second;
}

bool MemoryPersistenceService::has_slot(const std::string& slot) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_slots.find(slot) != m_slots.end();
}

} // namespace keystone::di

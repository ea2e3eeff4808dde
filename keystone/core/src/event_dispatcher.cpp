#include <keystone/core/event_dispatcher.hpp>
#include <algorithm>
#include <utility>

namespace keystone::core {

// ============================================================================
// ScopedConnection
// ============================================================================

ScopedConnection::ScopedConnection(std::function<void()> disconnect_fn)
    : m_disconnect(std::move(disconnect_fn)) {}

ScopedConnection::~ScopedConnection() {
    disconnect();
}

ScopedConnection::ScopedConnection(ScopedConnection&& other) noexcept
    : m_disconnect(std::exchange(other.m_disconnect, nullptr)) {}

ScopedConnection& ScopedConnection::operator=(ScopedConnection&& other) noexcept {
    if (this != &other) {
        disconnect();
        m_disconnect = std::exchange(other.m_disconnect, nullptr);
    }
    return *this;
}

void ScopedConnection::disconnect() {
    auto fn = std::exchange(m_disconnect, nullptr);
    if (fn) fn();
}

// ============================================================================
// HandlerTable
// ============================================================================

namespace detail {

uint64_t HandlerTable::add(std::type_index type, ErasedHandler handler) {
    uint64_t id = m_next_id++;
    std::lock_guard<std::mutex> lock(m_mutex);
    m_handlers[type].push_back(Entry{id, std::move(handler)});
    return id;
}

void HandlerTable::remove(std::type_index type, uint64_t id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_handlers.find(type);
    if (it == m_handlers.end()) return;
    std::erase_if(it->second, [id](const Entry& entry) { return entry.id == id; });
}

std::vector<ErasedHandler> HandlerTable::snapshot(std::type_index type) const {
    std::vector<ErasedHandler> result;
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_handlers.find(type);
    if (it == m_handlers.end()) return result;
    result.reserve(it->second.size());
    for (const auto& entry : it->second) {
        result.push_back(entry.handler);
    }
    return result;
}

void HandlerTable::clear(std::type_index type) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_handlers.erase(type);
}

void HandlerTable::clear_all() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_handlers.clear();
}

size_t HandlerTable::count(std::type_index type) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_handlers.find(type);
    return it != m_handlers.end() ? it->second.size() : 0;
}

} // namespace detail

// ============================================================================
// EventDispatcher
// ============================================================================

EventDispatcher::EventDispatcher()
    : m_table(std::make_shared<detail::HandlerTable>()) {}

void EventDispatcher::enqueue(std::function<void()> delivery) {
    std::lock_guard<std::mutex> lock(m_queue_mutex);
    m_pending.push_back(std::move(delivery));
}

void EventDispatcher::flush() {
    std::vector<std::function<void()>> batch;
    {
        std::lock_guard<std::mutex> lock(m_queue_mutex);
        batch.swap(m_pending);
    }

    for (const auto& deliver : batch) {
        deliver();
    }
}

bool EventDispatcher::has_queued_events() const {
    std::lock_guard<std::mutex> lock(m_queue_mutex);
    return !m_pending.empty();
}

size_t EventDispatcher::queued_event_count() const {
    std::lock_guard<std::mutex> lock(m_queue_mutex);
    return m_pending.size();
}

void EventDispatcher::clear_queue() {
    std::lock_guard<std::mutex> lock(m_queue_mutex);
    m_pending.clear();
}

} // namespace keystone::core

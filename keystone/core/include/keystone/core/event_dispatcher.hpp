#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <type_traits>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace keystone::core {

// ============================================================================
// ScopedConnection - RAII handle for event subscriptions
// ============================================================================

class ScopedConnection {
public:
    ScopedConnection() = default;
    explicit ScopedConnection(std::function<void()> disconnect_fn);
    ~ScopedConnection();

    ScopedConnection(const ScopedConnection&) = delete;
    ScopedConnection& operator=(const ScopedConnection&) = delete;
    ScopedConnection(ScopedConnection&& other) noexcept;
    ScopedConnection& operator=(ScopedConnection&& other) noexcept;

    void disconnect();
    bool connected() const { return static_cast<bool>(m_disconnect); }

private:
    std::function<void()> m_disconnect;
};

namespace detail {

using ErasedHandler = std::function<void(const void*)>;

// Handler lists keyed by event type. Shared between a dispatcher and the
// connections it hands out, which keep only a weak reference.
class HandlerTable {
public:
    uint64_t add(std::type_index type, ErasedHandler handler);
    void remove(std::type_index type, uint64_t id);

    // Copy taken under the lock; handlers may subscribe or disconnect while running
    std::vector<ErasedHandler> snapshot(std::type_index type) const;

    void clear(std::type_index type);
    void clear_all();
    size_t count(std::type_index type) const;

private:
    struct Entry {
        uint64_t id;
        ErasedHandler handler;
    };

    mutable std::mutex m_mutex;
    std::unordered_map<std::type_index, std::vector<Entry>> m_handlers;
    std::atomic<uint64_t> m_next_id{1};
};

} // namespace detail

// ============================================================================
// EventDispatcher - Type-safe event pub/sub
// ============================================================================

// Every container, locator and initializer owns one of these and hands it
// out through events(). A connection may outlive its dispatcher.
class EventDispatcher {
public:
    EventDispatcher();
    ~EventDispatcher() = default;

    EventDispatcher(const EventDispatcher&) = delete;
    EventDispatcher& operator=(const EventDispatcher&) = delete;
    EventDispatcher(EventDispatcher&&) = delete;
    EventDispatcher& operator=(EventDispatcher&&) = delete;

    template<typename T>
    [[nodiscard]] ScopedConnection subscribe(std::function<void(const T&)> callback) {
        static_assert(std::is_class_v<T>, "Event type must be a class/struct");

        std::type_index type = typeid(T);
        uint64_t id = m_table->add(type, [callback = std::move(callback)](const void* event) {
            callback(*static_cast<const T*>(event));
        });

        std::weak_ptr<detail::HandlerTable> table = m_table;
        return ScopedConnection([table, type, id]() {
            if (auto alive = table.lock()) {
                alive->remove(type, id);
            }
        });
    }

    // Synchronous, in subscription order
    template<typename T>
    void dispatch(const T& event) {
        static_assert(std::is_class_v<T>, "Event type must be a class/struct");
        for (const auto& handler : m_table->snapshot(typeid(T))) {
            handler(&event);
        }
    }

    // Thread-safe; delivered on the next flush()
    template<typename T>
    void queue(T event) {
        static_assert(std::is_class_v<T>, "Event type must be a class/struct");
        enqueue([this, event = std::move(event)]() { dispatch(event); });
    }

    // Events queued by handlers during a flush wait for the next one
    void flush();

    bool has_queued_events() const;
    size_t queued_event_count() const;
    void clear_queue();

    template<typename T>
    void clear_handlers() { m_table->clear(typeid(T)); }

    void clear_all_handlers() { m_table->clear_all(); }

    template<typename T>
    size_t handler_count() const { return m_table->count(typeid(T)); }

private:
    void enqueue(std::function<void()> delivery);

    std::shared_ptr<detail::HandlerTable> m_table;

    mutable std::mutex m_queue_mutex;
    std::vector<std::function<void()>> m_pending;
};

} // namespace keystone::core

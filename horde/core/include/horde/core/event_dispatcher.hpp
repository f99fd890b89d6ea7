#pragma once

#include <algorithm>
#include <cstdint>
#include <functional>
#include <memory>
#include <type_traits>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace horde::core {

namespace detail {

class ChannelBase {
public:
    virtual ~ChannelBase() = default;
    virtual void remove(uint64_t id) = 0;
};

// Subscribers of one event type. Subscribing or unsubscribing from inside a
// callback is allowed; the change applies once the outermost emit returns.
template<typename T>
class Channel : public ChannelBase {
public:
    uint64_t add(std::function<void(const T&)> callback) {
        uint64_t id = m_next_id++;
        Slot slot{id, std::move(callback), true};
        if (m_depth > 0) {
            m_pending.push_back(std::move(slot));
        } else {
            m_slots.push_back(std::move(slot));
        }
        return id;
    }

    void remove(uint64_t id) override {
        for (auto& slot : m_pending) {
            if (slot.id == id) slot.active = false;
        }
        for (auto& slot : m_slots) {
            if (slot.id == id) slot.active = false;
        }
        if (m_depth == 0) compact();
    }

    void emit(const T& event) {
        ++m_depth;
        for (auto& slot : m_slots) {
            if (slot.active) slot.callback(event);
        }
        if (--m_depth == 0) compact();
    }

    size_t size() const {
        return static_cast<size_t>(std::count_if(m_slots.begin(), m_slots.end(),
            [](const Slot& s) { return s.active; }));
    }

private:
    struct Slot {
        uint64_t id;
        std::function<void(const T&)> callback;
        bool active;
    };

    void compact() {
        for (auto& slot : m_pending) m_slots.push_back(std::move(slot));
        m_pending.clear();
        m_slots.erase(std::remove_if(m_slots.begin(), m_slots.end(),
                                     [](const Slot& s) { return !s.active; }),
                      m_slots.end());
    }

    std::vector<Slot> m_slots;
    std::vector<Slot> m_pending;
    uint64_t m_next_id = 1;
    int m_depth = 0;
};

} // namespace detail

// ============================================================================
// ScopedConnection
// Unsubscribes on destruction. Safe to outlive the dispatcher.
// ============================================================================

class ScopedConnection {
public:
    ScopedConnection() = default;

    ScopedConnection(std::weak_ptr<detail::ChannelBase> channel, uint64_t id)
        : m_channel(std::move(channel)), m_id(id) {}

    ~ScopedConnection() { disconnect(); }

    ScopedConnection(const ScopedConnection&) = delete;
    ScopedConnection& operator=(const ScopedConnection&) = delete;

    ScopedConnection(ScopedConnection&& other) noexcept
        : m_channel(std::exchange(other.m_channel, {})), m_id(other.m_id) {}

    ScopedConnection& operator=(ScopedConnection&& other) noexcept {
        if (this != &other) {
            disconnect();
            m_channel = std::exchange(other.m_channel, {});
            m_id = other.m_id;
        }
        return *this;
    }

    void disconnect() {
        if (auto channel = m_channel.lock()) {
            channel->remove(m_id);
        }
        m_channel.reset();
    }

    bool connected() const { return !m_channel.expired(); }

private:
    std::weak_ptr<detail::ChannelBase> m_channel;
    uint64_t m_id = 0;
};

// ============================================================================
// EventDispatcher
// Typed, synchronous pub/sub for the tick thread. Handlers run in
// subscription order inside dispatch().
// ============================================================================

class EventDispatcher {
public:
    EventDispatcher() = default;

    EventDispatcher(const EventDispatcher&) = delete;
    EventDispatcher& operator=(const EventDispatcher&) = delete;

    template<typename T>
    [[nodiscard]] ScopedConnection subscribe(std::function<void(const T&)> callback) {
        static_assert(std::is_class_v<T>, "Event type must be a class/struct");

        auto channel = channel_for<T>();
        uint64_t id = channel->add(std::move(callback));
        return ScopedConnection(channel, id);
    }

    template<typename T>
    void dispatch(const T& event) {
        auto it = m_channels.find(std::type_index(typeid(T)));
        if (it == m_channels.end()) return;

        // Keep the channel alive even if a handler clears the dispatcher
        std::shared_ptr<detail::ChannelBase> keep = it->second;
        static_cast<detail::Channel<T>&>(*keep).emit(event);
    }

    template<typename T>
    size_t handler_count() const {
        auto it = m_channels.find(std::type_index(typeid(T)));
        if (it == m_channels.end()) return 0;
        return static_cast<const detail::Channel<T>&>(*it->second).size();
    }

    void clear_all_handlers() { m_channels.clear(); }

private:
    template<typename T>
    std::shared_ptr<detail::Channel<T>> channel_for() {
        auto& slot = m_channels[std::type_index(typeid(T))];
        if (!slot) {
            slot = std::make_shared<detail::Channel<T>>();
        }
        return std::static_pointer_cast<detail::Channel<T>>(slot);
    }

    std::unordered_map<std::type_index, std::shared_ptr<detail::ChannelBase>> m_channels;
};

} // namespace horde::core

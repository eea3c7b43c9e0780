#pragma once

#include "lumen/core/LightSourceTypes.hpp"

#include <array>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace lumen::core {

using EventListener = std::function<void(const LightSourceEvent&)>;

/**
 * @brief Ordered, synchronous publish/subscribe for controller events.
 *
 * Dispatch contract:
 * - Listeners for an event type run in registration order on the thread that
 *   calls publish().
 * - A listener that throws (a std::exception or anything else) is logged and
 *   reported as an Error event (source "event_bus"); the remaining listeners
 *   still run and publish() never throws.
 * - A failure inside an Error listener is only logged, so error dispatch
 *   cannot recurse.
 *
 * The listener list is copied before dispatch, so listeners may subscribe
 * further listeners; those take effect from the next publish().
 */
class EventBus {
public:
    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    void subscribe(EventType type, EventListener listener);

    /**
     * @brief Subscribe by name ("state_change", "power_update", "error").
     * @return false if the name is not a known event; nothing is registered.
     */
    bool subscribe(const std::string& eventName, EventListener listener);

    void publish(const LightSourceEvent& event);

    std::size_t listenerCount(EventType type) const;

private:
    static constexpr std::size_t EVENT_TYPE_COUNT = 3;

    std::vector<EventListener> snapshot(EventType type) const;
    void reportListenerFailure(EventType type, std::size_t index, const char* what);

    mutable std::mutex listenersMutex;
    std::array<std::vector<EventListener>, EVENT_TYPE_COUNT> listeners{};
};

} // namespace lumen::core

#include "lumen/core/EventBus.hpp"
#include "lumen/core/ControllerError.hpp"
#include "lumen/log/Log.hpp"

#include <exception>
#include <utility>

namespace lumen::core {

namespace {
std::size_t slotOf(EventType type) {
    return static_cast<std::size_t>(type);
}
} // namespace

void EventBus::subscribe(EventType type, EventListener listener) {
    if (!listener) {
        return;
    }
    std::lock_guard lock(listenersMutex);
    listeners[slotOf(type)].push_back(std::move(listener));
}

bool EventBus::subscribe(const std::string& eventName, EventListener listener) {
    const auto type = eventTypeFromName(eventName);
    if (!type) {
        logInfo("[EventBus] ignoring listener for unknown event '", eventName, "'\n");
        return false;
    }
    subscribe(*type, std::move(listener));
    return true;
}

void EventBus::publish(const LightSourceEvent& event) {
    const EventType type = typeOf(event);
    const auto targets = snapshot(type);

    for (std::size_t idx = 0; idx < targets.size(); ++idx) {
        try {
            targets[idx](event);
        } catch (const std::exception& ex) {
            reportListenerFailure(type, idx, ex.what());
        } catch (...) {
            reportListenerFailure(type, idx, "unknown exception");
        }
    }
}

std::size_t EventBus::listenerCount(EventType type) const {
    std::lock_guard lock(listenersMutex);
    return listeners[slotOf(type)].size();
}

std::vector<EventListener> EventBus::snapshot(EventType type) const {
    std::lock_guard lock(listenersMutex);
    return listeners[slotOf(type)];
}

void EventBus::reportListenerFailure(EventType type, std::size_t index, const char* what) {
    logError("[EventBus] ", toString(type), " listener #", index, " failed: ", what, "\n");

    if (type == EventType::Error) {
        return;
    }

    ErrorEvent failure;
    failure.code = make_error_code(ControllerErrc::ListenerFailure);
    failure.source = "event_bus";
    failure.message = std::string(toString(type)) + " listener #" + std::to_string(index)
                    + " failed: " + what;
    failure.timestamp = EventClock::now();
    publish(failure);
}

} // namespace lumen::core

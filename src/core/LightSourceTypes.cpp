#include "lumen/core/LightSourceTypes.hpp"

namespace lumen::core {

const char* toString(LightSourceState state) {
    switch (state) {
        case LightSourceState::Off:         return "off";
        case LightSourceState::Standby:     return "standby";
        case LightSourceState::Calibrating: return "calibrating";
        case LightSourceState::Ready:       return "ready";
        case LightSourceState::Emitting:    return "emitting";
        case LightSourceState::Error:       return "error";
    }
    return "unknown";
}

const char* toString(OutputMode mode) {
    switch (mode) {
        case OutputMode::Continuous: return "continuous";
        case OutputMode::Pulsed:     return "pulsed";
        case OutputMode::Burst:      return "burst";
        case OutputMode::Modulated:  return "modulated";
    }
    return "unknown";
}

const char* toString(EventType type) {
    switch (type) {
        case EventType::StateChange: return "state_change";
        case EventType::PowerUpdate: return "power_update";
        case EventType::Error:       return "error";
    }
    return "unknown";
}

std::optional<EventType> eventTypeFromName(const std::string& name) {
    if (name == "state_change") return EventType::StateChange;
    if (name == "power_update") return EventType::PowerUpdate;
    if (name == "error")        return EventType::Error;
    return std::nullopt;
}

EventType typeOf(const LightSourceEvent& event) {
    return static_cast<EventType>(event.index());
}

} // namespace lumen::core

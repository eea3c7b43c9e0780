#pragma once

#include "lumen/core/ControllerConfig.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <system_error>
#include <variant>

namespace lumen::core {

enum class LightSourceState : std::uint8_t {
    Off = 0,
    Standby = 1,
    Calibrating = 2,
    Ready = 3,
    Emitting = 4,
    Error = 5
};

const char* toString(LightSourceState state);

/// Derived from EmissionParameters, see outputModeFor().
enum class OutputMode : std::uint8_t {
    Continuous = 0,
    Pulsed = 1,
    Burst = 2,
    Modulated = 3
};

const char* toString(OutputMode mode);

/**
 * @brief Immutable description of the source, supplied at construction.
 *
 * Units: metres, watts, seconds. A calibrationInterval of 0 disables
 * calibration-due tracking.
 */
struct LightSourceConfig {
    double wavelength = config::DEFAULT_WAVELENGTH_M;
    double maxPower = config::DEFAULT_MAX_POWER_W;
    double stabilityTarget = config::DEFAULT_STABILITY_TARGET;
    double warmupTime = config::DEFAULT_WARMUP_TIME_S;
    double calibrationInterval = config::DEFAULT_CALIBRATION_INTERVAL_S;
};

/**
 * @brief One emission request.
 *
 * duration == 0 means continuous until stopEmission(); frequency == 0 means
 * unmodulated output.
 */
struct EmissionParameters {
    double power = 0.0;
    double duration = 0.0;
    double frequency = 0.0;
    double dutyCycle = config::DEFAULT_DUTY_CYCLE;
};

using PerformanceMetrics = std::map<std::string, double>;
using SubsystemStatus = std::map<std::string, std::string>;

/// Snapshot returned by LightSourceController::status().
struct LightSourceStatus {
    LightSourceState state = LightSourceState::Off;
    double currentPower = 0.0;
    double operatingTime = 0.0;   // seconds spent emitting
    double wavelength = 0.0;
    double maxPower = 0.0;
    std::optional<OutputMode> activeMode{};
    bool calibrationDue = false;
    PerformanceMetrics performanceMetrics{};
    std::map<std::string, SubsystemStatus> subsystemStatus{};
};

// Events ----------------------------------------------------------------------

enum class EventType : std::uint8_t {
    StateChange = 0,
    PowerUpdate = 1,
    Error = 2
};

const char* toString(EventType type);

/// Maps "state_change", "power_update" and "error"; anything else is empty.
std::optional<EventType> eventTypeFromName(const std::string& name);

using EventClock = std::chrono::system_clock;

struct StateChangeEvent {
    LightSourceState oldState = LightSourceState::Off;
    LightSourceState newState = LightSourceState::Off;
    EventClock::time_point timestamp{};
};

struct PowerUpdateEvent {
    double power = 0.0;
    EventClock::time_point timestamp{};
};

struct ErrorEvent {
    std::error_code code{};
    std::string source;     // e.g. "power_on", "calibrate", "event_bus"
    std::string message;
    EventClock::time_point timestamp{};
};

// Alternative order must match EventType.
using LightSourceEvent = std::variant<StateChangeEvent, PowerUpdateEvent, ErrorEvent>;

EventType typeOf(const LightSourceEvent& event);

} // namespace lumen::core

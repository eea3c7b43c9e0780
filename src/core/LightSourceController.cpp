/**
 * @brief Implements the light source state machine: power sequencing,
 * calibration, emission control and the timed auto-stop.
 */
#include "lumen/core/LightSourceController.hpp"

#include "lumen/core/ControllerConfig.hpp"
#include "lumen/core/ParameterValidator.hpp"
#include "lumen/log/Log.hpp"

#include <algorithm>
#include <array>
#include <exception>
#include <type_traits>
#include <utility>

namespace lumen::core {

namespace asio = sched::asio;

namespace {

struct Edge {
    LightSourceState from;
    LightSourceState to;
};

// Every edge the controller may take. Anything not listed is refused by
// transitionTo(). The X -> Off edges are handled separately (powerOff is
// always allowed from a powered state).
constexpr std::array<Edge, 8> TRANSITIONS{{
    {LightSourceState::Off,         LightSourceState::Standby},
    {LightSourceState::Standby,     LightSourceState::Ready},
    {LightSourceState::Standby,     LightSourceState::Error},
    {LightSourceState::Ready,       LightSourceState::Calibrating},
    {LightSourceState::Calibrating, LightSourceState::Ready},
    {LightSourceState::Calibrating, LightSourceState::Error},
    {LightSourceState::Ready,       LightSourceState::Emitting},
    {LightSourceState::Emitting,    LightSourceState::Ready},
}};

// Longer timed emissions are clamped so the deadline cannot overflow the clock.
constexpr std::chrono::hours MAX_TIMED_EMISSION{24 * 365};

/// Run one collaborator call. A false / error return and any thrown value
/// are all reported as SubsystemFailure.
template <typename Call>
expected<void> callSubsystem(const char* what, Call&& call) {
    try {
        auto result = call();
        if constexpr (std::is_same_v<decltype(result), bool>) {
            if (!result) {
                logError("[LightSourceController] ", what, " reported failure\n");
                return unexpected(make_error_code(ControllerErrc::SubsystemFailure));
            }
        } else {
            if (!result) {
                logError("[LightSourceController] ", what, " failed: ",
                         result.error().message(), "\n");
                return unexpected(make_error_code(ControllerErrc::SubsystemFailure));
            }
        }
    } catch (const std::exception& ex) {
        logError("[LightSourceController] ", what, " threw: ", ex.what(), "\n");
        return unexpected(make_error_code(ControllerErrc::SubsystemFailure));
    } catch (...) {
        logError("[LightSourceController] ", what, " threw an unknown exception\n");
        return unexpected(make_error_code(ControllerErrc::SubsystemFailure));
    }
    return {};
}

/// Best-effort variant for shutdown paths: failures are logged only.
template <typename Call>
void callSubsystemLogged(const char* what, Call&& call) {
    if (auto result = callSubsystem(what, std::forward<Call>(call)); !result) {
        logWarning("[LightSourceController] continuing after ", what, " failure\n");
    }
}

template <typename Subsystem>
SubsystemStatus queryStatus(const char* name, const Subsystem& subsystem) {
    try {
        return subsystem.status();
    } catch (const std::exception& ex) {
        logError("[LightSourceController] ", name, " status query threw: ", ex.what(), "\n");
        return {};
    } catch (...) {
        logError("[LightSourceController] ", name, " status query threw an unknown exception\n");
        return {};
    }
}

double secondsBetween(std::chrono::steady_clock::time_point from,
                      std::chrono::steady_clock::time_point to) {
    return std::chrono::duration<double>(to - from).count();
}

} // namespace

// Construction ----------------------------------------------------------------

expected<std::unique_ptr<LightSourceController>>
LightSourceController::create(const LightSourceConfig& config, Subsystems subsystems) {
    if (auto valid = validateConfig(config); !valid) {
        logError("[LightSourceController] configuration rejected: ",
                 valid.error().message(), "\n");
        return unexpected(valid.error());
    }
    if (!subsystems.jet || !subsystems.optimizer || !subsystems.monitor) {
        logError("[LightSourceController] jet, optimizer and monitor are all required\n");
        return unexpected(make_error_code(ControllerErrc::InvalidConfiguration));
    }
    return std::unique_ptr<LightSourceController>(
        new LightSourceController(config, std::move(subsystems)));
}

LightSourceController::LightSourceController(const LightSourceConfig& config,
                                             Subsystems subsystemBundle)
: configuration(config)
, subsystems(std::move(subsystemBundle))
, autoStopTimer(std::make_unique<asio::steady_timer>(timers.context()))
{
    logInfo("[LightSourceController] ready for power-on, wavelength ",
            configuration.wavelength * 1e9, " nm, max power ",
            configuration.maxPower, " W\n");
}

LightSourceController::~LightSourceController() {
    // Orderly shutdown: power off while every member is alive, then join the
    // timer worker so no handler can run against a half-destroyed object.
    powerOff();
    timers.shutdown();
}

// Power sequencing ------------------------------------------------------------

expected<void> LightSourceController::powerOn() {
    std::lock_guard lock(operationMutex);

    if (lightState.load() != LightSourceState::Off) {
        return rejectPrecondition("power_on");
    }

    logInfo("[LightSourceController] powering on\n");

    // A failure only parks the source in Error if nothing else (a listener
    // calling powerOff, say) has moved it out of Standby in the meantime.
    auto failPowerOn = [this](std::error_code code, const char* message) -> expected<void> {
        if (auto live = ensureStillIn(LightSourceState::Standby, "power_on"); !live) {
            return live;
        }
        return failOperation("power_on", code, message, true);
    };

    if (auto moved = transitionTo(LightSourceState::Standby); !moved) {
        return moved;
    }
    if (auto live = ensureStillIn(LightSourceState::Standby, "power_on"); !live) {
        return live;
    }

    if (auto init = callSubsystem("jet.initialize",
            [&]{ return subsystems.jet->initialize(); }); !init) {
        return failPowerOn(init.error(), "jet initialisation failed");
    }
    if (auto live = ensureStillIn(LightSourceState::Standby, "power_on"); !live) {
        return live;
    }

    if (auto warm = callSubsystem("optimizer.warmUp",
            [&]{ return subsystems.optimizer->warmUp(); }); !warm) {
        return failPowerOn(warm.error(), "optimizer warm-up failed");
    }
    if (auto live = ensureStillIn(LightSourceState::Standby, "power_on"); !live) {
        return live;
    }

    if (auto ramp = runWarmupSequence(); !ramp) {
        return failPowerOn(ramp.error(), "warmup sequence did not complete");
    }

    if (auto moved = transitionTo(LightSourceState::Ready); !moved) {
        return moved;
    }

    resetCalibrationClock();
    logInfo("[LightSourceController] power-on complete\n");
    return {};
}

expected<void> LightSourceController::runWarmupSequence() {
    logInfo("[LightSourceController] warmup over ", configuration.warmupTime, " s\n");

    for (const auto& step : config::WARMUP_STEPS) {
        const double target = configuration.maxPower * step.powerRatio;
        if (auto prepared = callSubsystem("optimizer.prepareForPower",
                [&]{ return subsystems.optimizer->prepareForPower(target); }); !prepared) {
            return prepared;
        }
        if (auto live = ensureStillIn(LightSourceState::Standby, "warmup"); !live) {
            return live;
        }

        const std::chrono::duration<double> hold(
            configuration.warmupTime * step.holdWeight / config::WARMUP_TOTAL_WEIGHT);
        logInfo("[LightSourceController] warmup ", step.powerRatio * 100.0,
                "% holding ", hold.count(), " s\n");

        if (!warmupWait.waitFor(hold)) {
            logWarning("[LightSourceController] warmup interrupted\n");
            return unexpected(make_error_code(ControllerErrc::OperationAborted));
        }
    }
    return {};
}

void LightSourceController::powerOff() {
    // Raised before locking so a warmup holding the lock gives it up promptly,
    // and held until this power-off has completed.
    sched::StopRequest stop(warmupWait);
    std::lock_guard lock(operationMutex);

    if (lightState.load() == LightSourceState::Off) {
        outputPower = 0.0;
        return;
    }

    logInfo("[LightSourceController] powering off\n");

    cancelAutoStop();
    stopEmissionLocked();

    callSubsystemLogged("optimizer.shutdown", [&]{ return subsystems.optimizer->shutdown(); });
    callSubsystemLogged("jet.shutdown", [&]{ return subsystems.jet->shutdown(); });

    outputPower = 0.0;
    if (auto moved = transitionTo(LightSourceState::Off); !moved) {
        logError("[LightSourceController] could not enter Off: ", moved.error().message(), "\n");
    }

    {
        std::lock_guard telemetry(telemetryMutex);
        lastCalibrationAt.reset();
    }
    logInfo("[LightSourceController] source is off\n");
}

void LightSourceController::emergencyStop() {
    sched::StopRequest stop(warmupWait);
    std::lock_guard lock(operationMutex);
    logWarning("[LightSourceController] emergency stop\n");
    stopEmissionLocked();
}

// Calibration -----------------------------------------------------------------

expected<void> LightSourceController::calibrate() {
    std::lock_guard lock(operationMutex);

    if (lightState.load() != LightSourceState::Ready) {
        return rejectPrecondition("calibrate");
    }

    logInfo("[LightSourceController] calibrating\n");
    if (auto moved = transitionTo(LightSourceState::Calibrating); !moved) {
        return moved;
    }
    if (auto live = ensureStillIn(LightSourceState::Calibrating, "calibrate"); !live) {
        return live;
    }

    // All three always run; only a clean sweep returns to Ready.
    const bool jetOk = callSubsystem("jet.calibrate",
        [&]{ return subsystems.jet->calibrate(); }).has_value();
    const bool optimizerOk = callSubsystem("optimizer.calibrate",
        [&]{ return subsystems.optimizer->calibrate(); }).has_value();
    const bool sensorsOk = callSubsystem("monitor.calibrateSensors",
        [&]{ return subsystems.monitor->calibrateSensors(); }).has_value();

    if (auto live = ensureStillIn(LightSourceState::Calibrating, "calibrate"); !live) {
        return live;
    }

    if (!(jetOk && optimizerOk && sensorsOk)) {
        std::string detail = "calibration failed (jet=";
        detail += jetOk ? "ok" : "fail";
        detail += ", optimizer=";
        detail += optimizerOk ? "ok" : "fail";
        detail += ", sensors=";
        detail += sensorsOk ? "ok" : "fail";
        detail += ")";
        return failOperation("calibrate",
                             make_error_code(ControllerErrc::SubsystemFailure),
                             detail, true);
    }

    if (auto moved = transitionTo(LightSourceState::Ready); !moved) {
        return moved;
    }

    resetCalibrationClock();
    logInfo("[LightSourceController] calibration complete\n");
    return {};
}

// Emission --------------------------------------------------------------------

expected<void> LightSourceController::startEmission(const EmissionParameters& params) {
    std::lock_guard lock(operationMutex);

    if (lightState.load() != LightSourceState::Ready) {
        return rejectPrecondition("start_emission");
    }

    if (auto valid = validateEmissionParameters(params, configuration); !valid) {
        logWarning("[LightSourceController] emission rejected: power=", params.power,
                   " duration=", params.duration, " frequency=", params.frequency,
                   " dutyCycle=", params.dutyCycle, " (max power ",
                   configuration.maxPower, ")\n");
        return valid;
    }

    if (auto applied = callSubsystem("jet.configureEmission",
            [&]{ return subsystems.jet->configureEmission(params); }); !applied) {
        return failOperation("start_emission", applied.error(), "jet rejected emission parameters", false);
    }
    if (auto applied = callSubsystem("optimizer.configureOptimization",
            [&]{ return subsystems.optimizer->configureOptimization(params); }); !applied) {
        return failOperation("start_emission", applied.error(), "optimizer rejected emission parameters", false);
    }
    if (auto applied = callSubsystem("monitor.configureMonitoring",
            [&]{ return subsystems.monitor->configureMonitoring(params); }); !applied) {
        return failOperation("start_emission", applied.error(), "monitor rejected emission parameters", false);
    }

    if (auto started = callSubsystem("optimizer.startRealTimeOptimization",
            [&]{ return subsystems.optimizer->startRealTimeOptimization(); }); !started) {
        return failOperation("start_emission", started.error(), "real-time optimization did not start", false);
    }
    if (auto started = callSubsystem("monitor.startPowerMonitoring",
            [&]{ return subsystems.monitor->startPowerMonitoring(); }); !started) {
        callSubsystemLogged("optimizer.stopRealTimeOptimization",
            [&]{ return subsystems.optimizer->stopRealTimeOptimization(); });
        return failOperation("start_emission", started.error(), "power monitoring did not start", false);
    }

    // Power and telemetry are committed before the state edge so state_change
    // listeners see them.
    outputPower = params.power;
    beginOperatingSpan(outputModeFor(params));
    if (auto moved = transitionTo(LightSourceState::Emitting); !moved) {
        outputPower = 0.0;
        endOperatingSpan();
        return moved;
    }

    // A state_change listener may already have stopped the emission.
    if (lightState.load() != LightSourceState::Emitting) {
        return {};
    }

    logInfo("[LightSourceController] emitting ", params.power, " W, ",
            (params.duration > 0.0 ? "timed " : "continuous"),
            (params.duration > 0.0 ? std::to_string(params.duration) + " s" : std::string{}),
            "\n");
    publishPowerUpdate(params.power);

    if (params.duration > 0.0) {
        scheduleAutoStop(params.duration);
    }
    return {};
}

void LightSourceController::stopEmission() {
    std::lock_guard lock(operationMutex);
    stopEmissionLocked();
}

void LightSourceController::stopEmissionLocked() {
    if (lightState.load() != LightSourceState::Emitting) {
        return;
    }

    logInfo("[LightSourceController] stopping emission\n");
    cancelAutoStop();

    callSubsystemLogged("optimizer.stopRealTimeOptimization",
        [&]{ return subsystems.optimizer->stopRealTimeOptimization(); });
    callSubsystemLogged("monitor.stopPowerMonitoring",
        [&]{ return subsystems.monitor->stopPowerMonitoring(); });

    outputPower = 0.0;
    endOperatingSpan();
    if (auto moved = transitionTo(LightSourceState::Ready); !moved) {
        logError("[LightSourceController] could not leave Emitting: ", moved.error().message(), "\n");
    }
}

expected<void> LightSourceController::setPower(double power) {
    std::lock_guard lock(operationMutex);

    if (lightState.load() != LightSourceState::Emitting) {
        return rejectPrecondition("set_power");
    }

    if (auto valid = validatePower(power, configuration); !valid) {
        logWarning("[LightSourceController] power out of range: ", power,
                   " W (max ", configuration.maxPower, " W)\n");
        return valid;
    }

    if (auto adjusted = callSubsystem("optimizer.adjustPower",
            [&]{ return subsystems.optimizer->adjustPower(power); }); !adjusted) {
        return failOperation("set_power", adjusted.error(), "optimizer could not reach requested power", false);
    }

    outputPower = power;
    publishPowerUpdate(power);
    logInfo("[LightSourceController] power adjusted to ", power, " W\n");
    return {};
}

// Auto-stop -------------------------------------------------------------------

void LightSourceController::scheduleAutoStop(double seconds) {
    using Duration = SteadyClock::duration;

    const std::chrono::duration<double> requested(seconds);
    const Duration delay = requested < MAX_TIMED_EMISSION
        ? std::chrono::duration_cast<Duration>(requested)
        : std::chrono::duration_cast<Duration>(MAX_TIMED_EMISSION);

    const std::uint64_t generation = ++emissionGeneration;
    autoStopTimer->expires_after(delay);
    autoStopTimer->async_wait([this, generation](const std::error_code& ec) {
        onAutoStop(ec, generation);
    });
}

void LightSourceController::cancelAutoStop() {
    ++emissionGeneration;
    autoStopTimer->cancel();
}

void LightSourceController::onAutoStop(const std::error_code& ec, std::uint64_t generation) {
    if (ec == asio::error::operation_aborted) {
        return;
    }

    std::lock_guard lock(operationMutex);
    // A cancel can race with expiry, so the generation decides, not the error code.
    if (generation != emissionGeneration || lightState.load() != LightSourceState::Emitting) {
        logInfo("[LightSourceController] stale auto-stop ignored\n");
        return;
    }

    logInfo("[LightSourceController] timed emission complete\n");
    stopEmissionLocked();
}

// State machine ---------------------------------------------------------------

bool LightSourceController::isTransitionAllowed(LightSourceState from, LightSourceState to) {
    if (to == LightSourceState::Off) {
        return from != LightSourceState::Off;
    }
    return std::any_of(TRANSITIONS.begin(), TRANSITIONS.end(), [&](const Edge& edge) {
        return edge.from == from && edge.to == to;
    });
}

expected<void> LightSourceController::transitionTo(LightSourceState next) {
    const LightSourceState previous = lightState.load();
    if (!isTransitionAllowed(previous, next)) {
        logError("[LightSourceController] refusing undeclared transition ",
                 toString(previous), " -> ", toString(next), "\n");
        return unexpected(make_error_code(ControllerErrc::PreconditionViolation));
    }

    lightState.store(next);
    logInfo("[LightSourceController] state ", toString(previous), " -> ", toString(next), "\n");

    events.publish(StateChangeEvent{previous, next, EventClock::now()});
    return {};
}

expected<void> LightSourceController::ensureStillIn(LightSourceState expectedState,
                                                    const char* operation) {
    const LightSourceState current = lightState.load();
    if (current == expectedState) {
        return {};
    }
    logWarning("[LightSourceController] ", operation, " abandoned: source moved to ",
               toString(current), "\n");
    return unexpected(make_error_code(ControllerErrc::OperationAborted));
}

unexpected_t<std::error_code> LightSourceController::rejectPrecondition(const char* operation) {
    logWarning("[LightSourceController] ", operation, " not allowed while ",
               toString(lightState.load()), "\n");
    return unexpected(make_error_code(ControllerErrc::PreconditionViolation));
}

unexpected_t<std::error_code> LightSourceController::failOperation(const char* source,
                                                                   std::error_code code,
                                                                   const std::string& message,
                                                                   bool enterError) {
    logError("[LightSourceController] ", source, ": ", message, " (", code.message(), ")\n");

    if (enterError) {
        outputPower = 0.0;
        if (auto moved = transitionTo(LightSourceState::Error); !moved) {
            logError("[LightSourceController] could not enter Error from ",
                     toString(lightState.load()), "\n");
        }
    }

    ErrorEvent event;
    event.code = code;
    event.source = source;
    event.message = message;
    event.timestamp = EventClock::now();
    events.publish(event);

    return unexpected(code);
}

void LightSourceController::publishPowerUpdate(double power) {
    events.publish(PowerUpdateEvent{power, EventClock::now()});
}

// Telemetry -------------------------------------------------------------------

void LightSourceController::resetCalibrationClock() {
    std::lock_guard telemetry(telemetryMutex);
    lastCalibrationAt = SteadyClock::now();
}

void LightSourceController::beginOperatingSpan(OutputMode mode) {
    std::lock_guard telemetry(telemetryMutex);
    emissionStartedAt = SteadyClock::now();
    activeMode = mode;
}

void LightSourceController::endOperatingSpan() {
    std::lock_guard telemetry(telemetryMutex);
    if (emissionStartedAt) {
        accumulatedEmissionSeconds += secondsBetween(*emissionStartedAt, SteadyClock::now());
    }
    emissionStartedAt.reset();
    activeMode.reset();
}

LightSourceStatus LightSourceController::status() const {
    LightSourceStatus snapshot;
    snapshot.state = lightState.load();
    snapshot.currentPower = outputPower.load();
    snapshot.wavelength = configuration.wavelength;
    snapshot.maxPower = configuration.maxPower;

    {
        std::lock_guard telemetry(telemetryMutex);
        const auto now = SteadyClock::now();
        snapshot.operatingTime = accumulatedEmissionSeconds;
        if (emissionStartedAt) {
            snapshot.operatingTime += secondsBetween(*emissionStartedAt, now);
        }
        snapshot.activeMode = activeMode;
        snapshot.calibrationDue = configuration.calibrationInterval > 0.0
            && lastCalibrationAt
            && secondsBetween(*lastCalibrationAt, now) >= configuration.calibrationInterval;
    }

    try {
        snapshot.performanceMetrics = subsystems.monitor->currentMetrics();
    } catch (const std::exception& ex) {
        logError("[LightSourceController] metrics query threw: ", ex.what(), "\n");
    } catch (...) {
        logError("[LightSourceController] metrics query threw an unknown exception\n");
    }

    snapshot.subsystemStatus["jet"] = queryStatus("jet", *subsystems.jet);
    snapshot.subsystemStatus["optimizer"] = queryStatus("optimizer", *subsystems.optimizer);
    snapshot.subsystemStatus["monitor"] = queryStatus("monitor", *subsystems.monitor);
    return snapshot;
}

LightSourceState LightSourceController::state() const {
    return lightState.load();
}

double LightSourceController::currentPower() const {
    return outputPower.load();
}

const LightSourceConfig& LightSourceController::config() const {
    return configuration;
}

bool LightSourceController::registerCallback(const std::string& eventName, EventListener listener) {
    return events.subscribe(eventName, std::move(listener));
}

void LightSourceController::subscribe(EventType type, EventListener listener) {
    events.subscribe(type, std::move(listener));
}

} // namespace lumen::core

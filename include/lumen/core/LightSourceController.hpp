#pragma once
#include "lumen/core/ControllerError.hpp"
#include "lumen/core/EventBus.hpp"
#include "lumen/core/Expected.hpp"
#include "lumen/core/LightSourceTypes.hpp"
#include "lumen/core/Subsystems.hpp"
#include "lumen/sched/InterruptibleWait.hpp"
#include "lumen/sched/TimerService.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace lumen::core {

/**
 * @brief Supervisory controller for one light source.
 *
 * Owns the source's logical state and drives the jet, optimiser and monitor
 * collaborators through power-on/warmup, calibration and emission. State
 * only changes through a single transition function that checks every edge
 * against a fixed table, and every committed transition is published as a
 * StateChange event.
 *
 * Error reporting:
 * - Mutating operations return `expected<void>`; failures carry a
 *   ControllerErrc and never throw.
 * - Collaborator failures during powerOn() or calibrate() move the source to
 *   Error, which is only left through powerOff().
 *
 * Threading model:
 * - Mutating operations are serialised internally (recursive mutex), also
 *   against the auto-stop timer, which runs on the controller's own
 *   TimerService worker.
 * - Event listeners run synchronously on whichever thread triggered the
 *   event while the operation lock is held; they may call back into the
 *   controller.
 * - state(), currentPower() and status() never take the operation lock and
 *   may observe intermediate states such as Standby during warmup.
 * - powerOff() and emergencyStop() interrupt a warmup in progress before
 *   waiting for the lock, and keep it interrupted until they complete.
 * - If a listener moves the source elsewhere during powerOn() or calibrate(),
 *   the outer operation stops issuing collaborator calls and returns
 *   OperationAborted.
 */
class LightSourceController {
public:
    /**
     * @brief Validate the configuration and collaborators and build a controller.
     * @return InvalidConfiguration if the config is rejected or a collaborator is missing.
     */
    static expected<std::unique_ptr<LightSourceController>>
    create(const LightSourceConfig& config, Subsystems subsystems);

    ~LightSourceController();

    // non-copyable / non-movable
    LightSourceController(const LightSourceController&) = delete;
    LightSourceController& operator=(const LightSourceController&) = delete;
    LightSourceController(LightSourceController&&) = delete;
    LightSourceController& operator=(LightSourceController&&) = delete;

    /**
     * @brief Off -> Standby -> (warmup) -> Ready.
     *
     * Blocks for the configured warmup time. Rejected with
     * PreconditionViolation unless the source is Off.
     */
    expected<void> powerOn();

    /// Stop everything and return to Off. Idempotent, never fails.
    void powerOff();

    /// Ready -> Calibrating -> Ready, or -> Error if any calibration fails.
    expected<void> calibrate();

    /**
     * @brief Ready -> Emitting with the given parameters.
     *
     * A positive duration arms an auto-stop that returns the source to Ready
     * once it elapses; the call itself does not block.
     */
    expected<void> startEmission(const EmissionParameters& params);

    /// Emitting -> Ready. No-op in any other state.
    void stopEmission();

    /// Adjust the live output power. Only valid while Emitting.
    expected<void> setPower(double power);

    /// Abort a warmup in progress and stop any emission.
    void emergencyStop();

    LightSourceStatus status() const;
    LightSourceState state() const;
    double currentPower() const;
    const LightSourceConfig& config() const;

    /// Register by event name. Unknown names are ignored and return false.
    bool registerCallback(const std::string& eventName, EventListener listener);
    void subscribe(EventType type, EventListener listener);

    /// True if @p from -> @p to is a declared edge of the state machine.
    static bool isTransitionAllowed(LightSourceState from, LightSourceState to);

private:
    using SteadyClock = std::chrono::steady_clock;

    LightSourceController(const LightSourceConfig& config, Subsystems subsystems);

    expected<void> transitionTo(LightSourceState next);
    expected<void> runWarmupSequence();
    void stopEmissionLocked();

    /// OperationAborted if a nested call (typically from a listener) has
    /// moved the source away from @p expectedState.
    expected<void> ensureStillIn(LightSourceState expectedState, const char* operation);
    unexpected_t<std::error_code> rejectPrecondition(const char* operation);
    unexpected_t<std::error_code> failOperation(const char* source,
                                                std::error_code code,
                                                const std::string& message,
                                                bool enterError);

    void publishPowerUpdate(double power);

    void scheduleAutoStop(double seconds);
    void cancelAutoStop();
    void onAutoStop(const std::error_code& ec, std::uint64_t generation);

    void resetCalibrationClock();
    void beginOperatingSpan(OutputMode mode);
    void endOperatingSpan();

    const LightSourceConfig configuration;
    Subsystems subsystems;
    EventBus events;

    std::atomic<LightSourceState> lightState{LightSourceState::Off};
    std::atomic<double> outputPower{0.0};

    std::recursive_mutex operationMutex;
    sched::InterruptibleWait warmupWait;

    // Telemetry read by status() without the operation lock.
    mutable std::mutex telemetryMutex;
    double accumulatedEmissionSeconds = 0.0;
    std::optional<SteadyClock::time_point> emissionStartedAt{};
    std::optional<SteadyClock::time_point> lastCalibrationAt{};
    std::optional<OutputMode> activeMode{};

    // Guarded by operationMutex. Bumped whenever a pending auto-stop must be ignored.
    std::uint64_t emissionGeneration = 0;

    // Declared last: the timer must be destroyed before the service that runs it.
    sched::TimerService timers;
    std::unique_ptr<sched::asio::steady_timer> autoStopTimer;
};

} // namespace lumen::core

#pragma once

#include "lumen/core/Expected.hpp"
#include "lumen/core/LightSourceTypes.hpp"

#include <memory>

namespace lumen::core {

/**
 * @brief Capability contracts for the collaborators driven by the controller.
 *
 * The controller only ever sees these interfaces, so simulated and hardware
 * variants are interchangeable. Each call may fail either by returning an
 * error / false or by throwing a std::exception; the controller treats both
 * the same way.
 */

/// Emission head (the jet that produces the light).
class JetSubsystem {
public:
    virtual ~JetSubsystem() = default;

    virtual expected<void> initialize() = 0;
    virtual expected<void> shutdown() = 0;
    virtual bool calibrate() = 0;
    virtual expected<void> configureEmission(const EmissionParameters& params) = 0;
    virtual SubsystemStatus status() const = 0;
};

/// Closed-loop output optimiser; owns power ramping and adjustment.
class OptimizerSubsystem {
public:
    virtual ~OptimizerSubsystem() = default;

    virtual expected<void> warmUp() = 0;
    virtual expected<void> shutdown() = 0;
    virtual bool calibrate() = 0;
    virtual expected<void> startRealTimeOptimization() = 0;
    virtual expected<void> stopRealTimeOptimization() = 0;

    /// Move the live output to @p power. Returns false if the optimiser refused.
    virtual bool adjustPower(double power) = 0;

    /// Pre-condition the source for @p targetPower during warmup.
    virtual expected<void> prepareForPower(double targetPower) = 0;

    virtual expected<void> configureOptimization(const EmissionParameters& params) = 0;
    virtual SubsystemStatus status() const = 0;
};

/// Output sensors and performance telemetry.
class Monitor {
public:
    virtual ~Monitor() = default;

    virtual bool calibrateSensors() = 0;
    virtual expected<void> startPowerMonitoring() = 0;
    virtual expected<void> stopPowerMonitoring() = 0;
    virtual expected<void> configureMonitoring(const EmissionParameters& params) = 0;
    virtual PerformanceMetrics currentMetrics() const = 0;
    virtual SubsystemStatus status() const = 0;
};

/// The three collaborators handed to a controller. All must be non-null.
struct Subsystems {
    std::shared_ptr<JetSubsystem> jet;
    std::shared_ptr<OptimizerSubsystem> optimizer;
    std::shared_ptr<Monitor> monitor;
};

} // namespace lumen::core

#pragma once
#include "lumen/core/Subsystems.hpp"

#include <atomic>
#include <mutex>

namespace lumen::core::sim {

/**
 * @brief In-process stand-ins for the jet, optimiser and monitor.
 *
 * They accept every request and keep just enough state to produce believable
 * status descriptors. Calibration outcomes can be forced to exercise the
 * controller's failure paths without hardware.
 */
class SimulatedJet : public JetSubsystem {
public:
    expected<void> initialize() override;
    expected<void> shutdown() override;
    bool calibrate() override;
    expected<void> configureEmission(const EmissionParameters& params) override;
    SubsystemStatus status() const override;

    void setCalibrationResult(bool result) { calibrationResult = result; }

private:
    std::atomic<bool> initialized{false};
    std::atomic<bool> calibrationResult{true};
    std::atomic<double> configuredPower{0.0};
};

class SimulatedOptimizer : public OptimizerSubsystem {
public:
    expected<void> warmUp() override;
    expected<void> shutdown() override;
    bool calibrate() override;
    expected<void> startRealTimeOptimization() override;
    expected<void> stopRealTimeOptimization() override;
    bool adjustPower(double power) override;
    expected<void> prepareForPower(double targetPower) override;
    expected<void> configureOptimization(const EmissionParameters& params) override;
    SubsystemStatus status() const override;

    void setCalibrationResult(bool result) { calibrationResult = result; }

private:
    std::atomic<bool> optimizing{false};
    std::atomic<bool> calibrationResult{true};
    std::atomic<double> targetPower{0.0};
};

class SimulatedMonitor : public Monitor {
public:
    bool calibrateSensors() override;
    expected<void> startPowerMonitoring() override;
    expected<void> stopPowerMonitoring() override;
    expected<void> configureMonitoring(const EmissionParameters& params) override;
    PerformanceMetrics currentMetrics() const override;
    SubsystemStatus status() const override;

    void setCalibrationResult(bool result) { calibrationResult = result; }

private:
    std::atomic<bool> monitoring{false};
    std::atomic<bool> calibrationResult{true};
    mutable std::mutex metricsMutex;
    PerformanceMetrics metrics{{"stability", 0.99}};
};

/// Bundle of freshly constructed simulated collaborators.
Subsystems makeSimulatedSubsystems();

} // namespace lumen::core::sim

#include "lumen/core/Simulated/SimulatedSubsystems.hpp"
#include "lumen/log/Log.hpp"

#include <sstream>

namespace lumen::core::sim {

namespace {
std::string formatPower(double watts) {
    std::ostringstream oss;
    oss.precision(3);
    oss << std::scientific << watts;
    return oss.str();
}
} // namespace

// Jet -------------------------------------------------------------------------

expected<void> SimulatedJet::initialize() {
    initialized = true;
    logInfo("[SimulatedJet] initialize()\n");
    return {};
}

expected<void> SimulatedJet::shutdown() {
    initialized = false;
    configuredPower = 0.0;
    logInfo("[SimulatedJet] shutdown()\n");
    return {};
}

bool SimulatedJet::calibrate() {
    return calibrationResult.load();
}

expected<void> SimulatedJet::configureEmission(const EmissionParameters& params) {
    configuredPower = params.power;
    return {};
}

SubsystemStatus SimulatedJet::status() const {
    return {
        {"status", initialized ? "normal" : "offline"},
        {"configured_power", formatPower(configuredPower.load())},
    };
}

// Optimizer -------------------------------------------------------------------

expected<void> SimulatedOptimizer::warmUp() {
    logInfo("[SimulatedOptimizer] warmUp()\n");
    return {};
}

expected<void> SimulatedOptimizer::shutdown() {
    optimizing = false;
    targetPower = 0.0;
    logInfo("[SimulatedOptimizer] shutdown()\n");
    return {};
}

bool SimulatedOptimizer::calibrate() {
    return calibrationResult.load();
}

expected<void> SimulatedOptimizer::startRealTimeOptimization() {
    optimizing = true;
    return {};
}

expected<void> SimulatedOptimizer::stopRealTimeOptimization() {
    optimizing = false;
    return {};
}

bool SimulatedOptimizer::adjustPower(double power) {
    targetPower = power;
    return true;
}

expected<void> SimulatedOptimizer::prepareForPower(double power) {
    logInfo("[SimulatedOptimizer] prepareForPower(", formatPower(power), " W)\n");
    targetPower = power;
    return {};
}

expected<void> SimulatedOptimizer::configureOptimization(const EmissionParameters& params) {
    targetPower = params.power;
    return {};
}

SubsystemStatus SimulatedOptimizer::status() const {
    return {
        {"status", optimizing ? "optimizing" : "idle"},
        {"target_power", formatPower(targetPower.load())},
    };
}

// Monitor ---------------------------------------------------------------------

bool SimulatedMonitor::calibrateSensors() {
    return calibrationResult.load();
}

expected<void> SimulatedMonitor::startPowerMonitoring() {
    monitoring = true;
    return {};
}

expected<void> SimulatedMonitor::stopPowerMonitoring() {
    monitoring = false;
    return {};
}

expected<void> SimulatedMonitor::configureMonitoring(const EmissionParameters& params) {
    std::lock_guard lock(metricsMutex);
    metrics["duty_cycle"] = params.dutyCycle;
    return {};
}

PerformanceMetrics SimulatedMonitor::currentMetrics() const {
    std::lock_guard lock(metricsMutex);
    return metrics;
}

SubsystemStatus SimulatedMonitor::status() const {
    return {{"status", monitoring ? "monitoring" : "idle"}};
}

Subsystems makeSimulatedSubsystems() {
    return Subsystems{
        std::make_shared<SimulatedJet>(),
        std::make_shared<SimulatedOptimizer>(),
        std::make_shared<SimulatedMonitor>(),
    };
}

} // namespace lumen::core::sim

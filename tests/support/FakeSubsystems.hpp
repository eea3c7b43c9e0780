#pragma once

#include "lumen/core/Subsystems.hpp"

#include <algorithm>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace lumen::test {

/**
 * @brief Shared, thread-safe record of every collaborator call, in order.
 *
 * The auto-stop runs on the controller's timer thread, so fakes may be
 * called concurrently with the test body reading the log.
 */
class CallLog {
public:
    void record(const std::string& call) {
        std::lock_guard lock(m);
        entries.push_back(call);
    }

    std::vector<std::string> calls() const {
        std::lock_guard lock(m);
        return entries;
    }

    std::size_t count(const std::string& call) const {
        std::lock_guard lock(m);
        return static_cast<std::size_t>(std::count(entries.begin(), entries.end(), call));
    }

    /// Position of the first occurrence, or -1.
    long indexOf(const std::string& call) const {
        std::lock_guard lock(m);
        auto it = std::find(entries.begin(), entries.end(), call);
        return it == entries.end() ? -1 : static_cast<long>(it - entries.begin());
    }

    void clear() {
        std::lock_guard lock(m);
        entries.clear();
    }

private:
    mutable std::mutex m;
    std::vector<std::string> entries;
};

/// Failure injection shared by the fakes. Calls are named "<subsystem>.<method>".
class FakeBehaviour {
public:
    explicit FakeBehaviour(std::shared_ptr<CallLog> log) : callLog(std::move(log)) {}

    void failOn(const std::string& call) {
        std::lock_guard lock(m);
        failing.insert(call);
    }

    void throwOn(const std::string& call) {
        std::lock_guard lock(m);
        throwing.insert(call);
    }

    /// Throw a value that is not a std::exception, as some vendor SDKs do.
    void throwUnknownOn(const std::string& call) {
        std::lock_guard lock(m);
        throwingUnknown.insert(call);
    }

    void succeedOn(const std::string& call) {
        std::lock_guard lock(m);
        failing.erase(call);
        throwing.erase(call);
        throwingUnknown.erase(call);
    }

protected:
    expected<void> step(const std::string& call) const {
        if (!check(call)) {
            return unexpected(std::make_error_code(std::errc::io_error));
        }
        return {};
    }

    bool check(const std::string& call) const {
        callLog->record(call);
        std::lock_guard lock(m);
        if (throwing.count(call)) {
            throw std::runtime_error(call + " exploded");
        }
        if (throwingUnknown.count(call)) {
            throw -1;
        }
        return failing.count(call) == 0;
    }

    std::shared_ptr<CallLog> callLog;

private:
    mutable std::mutex m;
    std::set<std::string> failing;
    std::set<std::string> throwing;
    std::set<std::string> throwingUnknown;
};

class FakeJet : public core::JetSubsystem, public FakeBehaviour {
public:
    using FakeBehaviour::FakeBehaviour;

    expected<void> initialize() override { return step("jet.initialize"); }
    expected<void> shutdown() override { return step("jet.shutdown"); }
    bool calibrate() override { return check("jet.calibrate"); }
    expected<void> configureEmission(const core::EmissionParameters&) override {
        return step("jet.configureEmission");
    }
    core::SubsystemStatus status() const override {
        check("jet.status");
        return {{"status", "normal"}};
    }
};

class FakeOptimizer : public core::OptimizerSubsystem, public FakeBehaviour {
public:
    using FakeBehaviour::FakeBehaviour;

    expected<void> warmUp() override { return step("optimizer.warmUp"); }
    expected<void> shutdown() override { return step("optimizer.shutdown"); }
    bool calibrate() override { return check("optimizer.calibrate"); }
    expected<void> startRealTimeOptimization() override {
        return step("optimizer.startRealTimeOptimization");
    }
    expected<void> stopRealTimeOptimization() override {
        return step("optimizer.stopRealTimeOptimization");
    }
    bool adjustPower(double power) override {
        const bool ok = check("optimizer.adjustPower");
        if (ok) {
            std::lock_guard lock(powersMutex);
            adjusted.push_back(power);
        }
        return ok;
    }
    expected<void> prepareForPower(double targetPower) override {
        {
            std::lock_guard lock(powersMutex);
            prepared.push_back(targetPower);
        }
        return step("optimizer.prepareForPower");
    }
    expected<void> configureOptimization(const core::EmissionParameters&) override {
        return step("optimizer.configureOptimization");
    }
    core::SubsystemStatus status() const override {
        check("optimizer.status");
        return {{"status", "optimizing"}};
    }

    std::vector<double> preparedPowers() const {
        std::lock_guard lock(powersMutex);
        return prepared;
    }

    std::vector<double> adjustedPowers() const {
        std::lock_guard lock(powersMutex);
        return adjusted;
    }

private:
    mutable std::mutex powersMutex;
    std::vector<double> prepared;
    std::vector<double> adjusted;
};

class FakeMonitor : public core::Monitor, public FakeBehaviour {
public:
    using FakeBehaviour::FakeBehaviour;

    bool calibrateSensors() override { return check("monitor.calibrateSensors"); }
    expected<void> startPowerMonitoring() override { return step("monitor.startPowerMonitoring"); }
    expected<void> stopPowerMonitoring() override { return step("monitor.stopPowerMonitoring"); }
    expected<void> configureMonitoring(const core::EmissionParameters&) override {
        return step("monitor.configureMonitoring");
    }
    core::PerformanceMetrics currentMetrics() const override {
        check("monitor.currentMetrics");
        return {{"stability", 0.99}};
    }
    core::SubsystemStatus status() const override {
        check("monitor.status");
        return {{"status", "monitoring"}};
    }
};

/// One set of fakes sharing a call log, plus the bundle handed to the controller.
struct FakeRig {
    std::shared_ptr<CallLog> log = std::make_shared<CallLog>();
    std::shared_ptr<FakeJet> jet = std::make_shared<FakeJet>(log);
    std::shared_ptr<FakeOptimizer> optimizer = std::make_shared<FakeOptimizer>(log);
    std::shared_ptr<FakeMonitor> monitor = std::make_shared<FakeMonitor>(log);

    core::Subsystems subsystems() const {
        return core::Subsystems{jet, optimizer, monitor};
    }
};

/// A config whose warmup finishes in a few milliseconds.
inline core::LightSourceConfig fastConfig(double maxPower = 5e-9) {
    core::LightSourceConfig config;
    config.maxPower = maxPower;
    config.warmupTime = 0.003;
    return config;
}

} // namespace lumen::test

#include "lumen/core/ParameterValidator.hpp"
#include "lumen/core/ControllerError.hpp"

namespace lumen::core {

namespace {

// Checks are phrased as "is in range" so that NaN fails them.
bool isPositive(double value) {
    return value > 0.0;
}

bool isNonNegative(double value) {
    return value >= 0.0;
}

unexpected_t<std::error_code> reject(ControllerErrc errc) {
    return unexpected(make_error_code(errc));
}

} // namespace

expected<void> validatePower(double power, const LightSourceConfig& config) {
    if (!isPositive(power) || power > config.maxPower) {
        return reject(ControllerErrc::InvalidParameter);
    }
    return {};
}

expected<void> validateEmissionParameters(const EmissionParameters& params,
                                          const LightSourceConfig& config) {
    if (auto power = validatePower(params.power, config); !power) {
        return power;
    }
    if (!isNonNegative(params.duration)) {
        return reject(ControllerErrc::InvalidParameter);
    }
    if (!isNonNegative(params.frequency)) {
        return reject(ControllerErrc::InvalidParameter);
    }
    if (!isPositive(params.dutyCycle) || params.dutyCycle > 1.0) {
        return reject(ControllerErrc::InvalidParameter);
    }
    return {};
}

expected<void> validateConfig(const LightSourceConfig& config) {
    if (!isPositive(config.wavelength)) {
        return reject(ControllerErrc::InvalidConfiguration);
    }
    if (!isPositive(config.maxPower)) {
        return reject(ControllerErrc::InvalidConfiguration);
    }
    if (!isPositive(config.stabilityTarget) || config.stabilityTarget > 1.0) {
        return reject(ControllerErrc::InvalidConfiguration);
    }
    if (!isNonNegative(config.warmupTime)) {
        return reject(ControllerErrc::InvalidConfiguration);
    }
    if (!isNonNegative(config.calibrationInterval)) {
        return reject(ControllerErrc::InvalidConfiguration);
    }
    return {};
}

OutputMode outputModeFor(const EmissionParameters& params) {
    if (!(params.frequency > 0.0)) {
        return OutputMode::Continuous;
    }
    if (params.duration > 0.0) {
        return OutputMode::Burst;
    }
    // Gated on and off below full duty; at full duty the carrier is only modulated.
    return params.dutyCycle < 1.0 ? OutputMode::Pulsed : OutputMode::Modulated;
}

} // namespace lumen::core

#pragma once

#include "lumen/core/Expected.hpp"
#include "lumen/core/LightSourceTypes.hpp"

namespace lumen::core {

/**
 * @brief Side-effect-free legality checks.
 *
 * All functions return an empty expected on success or an error code from
 * ControllerErrc. NaN never passes a range check.
 */

/// InvalidParameter unless 0 < power <= config.maxPower.
expected<void> validatePower(double power, const LightSourceConfig& config);

/// Power as above; duration and frequency >= 0; 0 < dutyCycle <= 1.
expected<void> validateEmissionParameters(const EmissionParameters& params,
                                          const LightSourceConfig& config);

/// InvalidConfiguration for non-positive wavelength or maxPower, a stability
/// target outside (0, 1], or a negative warmup time or calibration interval.
expected<void> validateConfig(const LightSourceConfig& config);

/// Continuous without a frequency; otherwise Burst when a duration is set,
/// Pulsed below full duty cycle, Modulated at full duty cycle.
OutputMode outputModeFor(const EmissionParameters& params);

} // namespace lumen::core

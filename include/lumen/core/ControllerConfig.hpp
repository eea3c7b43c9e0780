#pragma once

#include <array>

namespace lumen::core::config {

/**
 * @brief Defaults and fixed sequences for the light source controller.
 */

// Source defaults (EUV, nanowatt class) ---------------------------------------
constexpr double DEFAULT_WAVELENGTH_M = 5.8e-9;
constexpr double DEFAULT_MAX_POWER_W = 5.0e-9;
constexpr double DEFAULT_STABILITY_TARGET = 0.01;
constexpr double DEFAULT_WARMUP_TIME_S = 30.0;
constexpr double DEFAULT_CALIBRATION_INTERVAL_S = 3600.0;

// Warmup ramp -----------------------------------------------------------------
struct WarmupStep {
    double powerRatio;   // fraction of maxPower handed to prepareForPower()
    double holdWeight;   // share of the configured warmup time, out of WARMUP_TOTAL_WEIGHT
};

constexpr std::array<WarmupStep, 4> WARMUP_STEPS{{
    {0.1, 5.0},
    {0.3, 10.0},
    {0.6, 10.0},
    {0.8, 5.0},
}};

constexpr double WARMUP_TOTAL_WEIGHT = 30.0;

// Emission defaults -----------------------------------------------------------
constexpr double DEFAULT_DUTY_CYCLE = 1.0;

} // namespace lumen::core::config

#pragma once

#include <string>
#include <system_error>

namespace lumen::core {

/**
 * @brief Failure kinds reported by the light source controller.
 *
 * Values start at 1 so that a default-constructed std::error_code (value 0)
 * never compares equal to a controller error.
 */
enum class ControllerErrc {
    InvalidParameter = 1,      ///< Out-of-range power, duration, frequency or duty cycle.
    PreconditionViolation,     ///< Operation invoked from a state that does not allow it.
    SubsystemFailure,          ///< A collaborator reported failure or threw.
    OperationAborted,          ///< An interruptible hold was cut short (power off / e-stop).
    InvalidConfiguration,      ///< LightSourceConfig or collaborator bundle rejected.
    ListenerFailure            ///< An event listener threw during dispatch.
};

const std::error_category& controllerCategory() noexcept;

std::error_code make_error_code(ControllerErrc errc) noexcept;

} // namespace lumen::core

namespace std {
template <>
struct is_error_code_enum<lumen::core::ControllerErrc> : true_type {};
} // namespace std

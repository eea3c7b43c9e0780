#include "lumen/core/ControllerError.hpp"

namespace lumen::core {

namespace {

class ControllerCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "lumen.controller";
    }

    std::string message(int value) const override {
        switch (static_cast<ControllerErrc>(value)) {
            case ControllerErrc::InvalidParameter:      return "invalid parameter";
            case ControllerErrc::PreconditionViolation: return "operation not allowed in current state";
            case ControllerErrc::SubsystemFailure:      return "subsystem failure";
            case ControllerErrc::OperationAborted:      return "operation aborted";
            case ControllerErrc::InvalidConfiguration:  return "invalid configuration";
            case ControllerErrc::ListenerFailure:       return "event listener failed";
        }
        return "unknown controller error";
    }
};

} // namespace

const std::error_category& controllerCategory() noexcept {
    static const ControllerCategory category;
    return category;
}

std::error_code make_error_code(ControllerErrc errc) noexcept {
    return {static_cast<int>(errc), controllerCategory()};
}

} // namespace lumen::core

// Expected.hpp
// -----------------------------------------------------------------------------
// Result type for the light source stack. The Jet, Optimizer and Monitor
// interfaces return lumen::expected<void> for each command they accept, and
// every mutating LightSourceController operation does the same, so a false
// result carries a ControllerErrc code (category "lumen.controller") that
// callers can compare directly. LightSourceController::create() is the only
// call that yields a value: the controller itself.

#pragma once

#include <system_error>
#include <type_traits>
#include <utility>

#include <tl/expected.hpp>

namespace lumen {

template <typename T, typename E = std::error_code>
using expected = tl::expected<T, E>;

template <typename E>
using unexpected_t = tl::unexpected<E>;

template <typename E>
[[nodiscard]] constexpr unexpected_t<std::decay_t<E>> unexpected(E&& error) {
    return unexpected_t<std::decay_t<E>>(std::forward<E>(error));
}

} // namespace lumen

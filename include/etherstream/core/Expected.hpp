// Expected.hpp
// -----------------------------------------------------------------------------
// Success/error return type shared by the session, device and network layers.
// Errors default to std::error_code so Asio failures and the library's own
// session codes travel through the same channel and compare against the same
// error conditions.

#pragma once

#include <system_error>
#include <type_traits>
#include <utility>

#include <tl/expected.hpp>

namespace etherstream {

template <typename T, typename E = std::error_code>
using expected = tl::expected<T, E>;

template <typename E>
using unexpected_t = tl::unexpected<E>;

template <typename E>
[[nodiscard]] constexpr unexpected_t<std::decay_t<E>> unexpected(E&& error) {
    return unexpected_t<std::decay_t<E>>(std::forward<E>(error));
}

/// Convenience for error enums that convert to std::error_code.
template <typename Enum,
          typename = std::enable_if_t<std::is_error_code_enum<Enum>::value>>
[[nodiscard]] unexpected_t<std::error_code> unexpected_code(Enum code) {
    return unexpected_t<std::error_code>(make_error_code(code));
}

} // namespace etherstream

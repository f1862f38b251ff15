#pragma once

#include <system_error>

namespace etherstream::etherdream {

/// Failures raised by EtherDreamSession itself (transport errors keep their Asio codes).
enum class SessionErrc {
    NoPointRate = 1,        // begin/update with a zero rate
    NoRememberedAddress,    // reconnect() before any connect()
    BatchTooLarge,          // more samples than a data command can carry
    NotConnected,           // command issued on a closed session
    InvalidResponse,        // device answered with a NAK
    UnexpectedCommand,      // reply echoes a different opcode
    MalformedResponse,      // reply could not be decoded
    Disconnected,           // connection dropped while waiting for a reply
    ResponseTimeout         // reply did not arrive within the session timeout
};

/// Coarse classes callers branch on; compare with `ec == SessionErrorKind::Usage`.
enum class SessionErrorKind {
    Usage = 1,
    Protocol,
    DeviceInvalidResponse,
    Transport
};

const std::error_category& session_category() noexcept;
const std::error_category& session_kind_category() noexcept;

std::error_code make_error_code(SessionErrc code) noexcept;
std::error_condition make_error_condition(SessionErrorKind kind) noexcept;

} // namespace etherstream::etherdream

namespace std {
template <>
struct is_error_code_enum<etherstream::etherdream::SessionErrc> : true_type {};

template <>
struct is_error_condition_enum<etherstream::etherdream::SessionErrorKind> : true_type {};
} // namespace std

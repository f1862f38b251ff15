#include "etherstream/etherdream/EtherDreamError.hpp"

#include <string>

namespace etherstream::etherdream {
namespace {

SessionErrorKind kindOf(SessionErrc code) {
    switch (code) {
        case SessionErrc::NoPointRate:
        case SessionErrc::NoRememberedAddress:
        case SessionErrc::BatchTooLarge:
        case SessionErrc::NotConnected:
            return SessionErrorKind::Usage;
        case SessionErrc::UnexpectedCommand:
        case SessionErrc::MalformedResponse:
            return SessionErrorKind::Protocol;
        case SessionErrc::InvalidResponse:
            return SessionErrorKind::DeviceInvalidResponse;
        case SessionErrc::Disconnected:
        case SessionErrc::ResponseTimeout:
            return SessionErrorKind::Transport;
    }
    return SessionErrorKind::Protocol;
}

class SessionCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "etherdream.session"; }

    std::string message(int value) const override {
        switch (static_cast<SessionErrc>(value)) {
            case SessionErrc::NoPointRate:         return "point rate not configured";
            case SessionErrc::NoRememberedAddress: return "connect before attempting a reconnect";
            case SessionErrc::BatchTooLarge:       return "sample batch exceeds 65535 points";
            case SessionErrc::NotConnected:        return "session is not connected";
            case SessionErrc::InvalidResponse:     return "device rejected the command";
            case SessionErrc::UnexpectedCommand:   return "response answers a different command";
            case SessionErrc::MalformedResponse:   return "malformed status response";
            case SessionErrc::Disconnected:        return "connection closed while awaiting response";
            case SessionErrc::ResponseTimeout:     return "timed out awaiting response";
        }
        return "unknown session error";
    }

    std::error_condition default_error_condition(int value) const noexcept override {
        return make_error_condition(kindOf(static_cast<SessionErrc>(value)));
    }
};

class SessionKindCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "etherdream.kind"; }

    std::string message(int value) const override {
        switch (static_cast<SessionErrorKind>(value)) {
            case SessionErrorKind::Usage:                 return "usage error";
            case SessionErrorKind::Protocol:              return "protocol error";
            case SessionErrorKind::DeviceInvalidResponse: return "device returned an invalid response";
            case SessionErrorKind::Transport:             return "transport error";
        }
        return "unknown error kind";
    }

    bool equivalent(const std::error_code& code, int condition) const noexcept override {
        if (code.category() == session_category()) {
            return static_cast<int>(kindOf(static_cast<SessionErrc>(code.value()))) == condition;
        }
        // Anything from the socket layer is a transport failure.
        return code && condition == static_cast<int>(SessionErrorKind::Transport);
    }
};

} // namespace

const std::error_category& session_category() noexcept {
    static const SessionCategory category;
    return category;
}

const std::error_category& session_kind_category() noexcept {
    static const SessionKindCategory category;
    return category;
}

std::error_code make_error_code(SessionErrc code) noexcept {
    return {static_cast<int>(code), session_category()};
}

std::error_condition make_error_condition(SessionErrorKind kind) noexcept {
    return {static_cast<int>(kind), session_kind_category()};
}

} // namespace etherstream::etherdream

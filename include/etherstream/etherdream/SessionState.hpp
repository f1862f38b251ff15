#pragma once

#include "etherstream/etherdream/EtherDreamResponse.hpp"

#include <cstdint>

namespace etherstream::etherdream {

/// Host-side view of the playback handshake.
enum class SessionPhase : std::uint8_t {
    Disconnected = 0,
    Idle,       // connected, nothing prepared by us
    Prepared,   // prepare acknowledged; begin outstanding
    Playing     // begin/update acknowledged
};

const char* toString(SessionPhase phase);

/**
 * @brief Immutable snapshot of an EtherDream session.
 *
 * Every transition returns a new value. The phase only advances on
 * acknowledged replies:
 *
 *   Disconnected --connected()--> Idle
 *   any --ACK 'p'--> Prepared
 *   any --ACK 'b' / 'u'--> Playing
 *   any --ACK 's' / 0xFF / 'c'--> Idle
 *   Playing --status with underflow flag--> Prepared (begin must be re-sent),
 *     unless the reply acknowledges 'b' / 'u'
 *   any --disconnected()--> Disconnected (default state)
 *
 * A NAK leaves the phase alone but clears `valid`.
 */
class SessionState {
public:
    SessionState() = default;

    SessionPhase phase() const { return currentPhase; }
    const EtherDreamStatus& lastStatus() const { return status; }
    std::uint8_t lastResponseCode() const { return responseCode; }

    /// False if the last reply was a NAK, or after a timeout or link loss.
    bool valid() const { return isValid; }
    bool connected() const { return currentPhase != SessionPhase::Disconnected; }
    bool prepareSent() const {
        return currentPhase == SessionPhase::Prepared || currentPhase == SessionPhase::Playing;
    }
    bool beginSent() const { return currentPhase == SessionPhase::Playing; }

    std::uint16_t bufferFullness() const { return status.bufferFullness; }
    PlaybackState playbackState() const { return status.playbackState; }

    [[nodiscard]] SessionState onConnected() const;
    [[nodiscard]] SessionState onResponse(char command, const EtherDreamResponse& response) const;
    [[nodiscard]] SessionState onInvalidated() const;
    [[nodiscard]] SessionState onDisconnected() const { return SessionState{}; }

    bool operator==(const SessionState& other) const;
    bool operator!=(const SessionState& other) const { return !(*this == other); }

private:
    SessionPhase currentPhase = SessionPhase::Disconnected;
    EtherDreamStatus status{};
    std::uint8_t responseCode = 0;
    bool isValid = true;
};

} // namespace etherstream::etherdream

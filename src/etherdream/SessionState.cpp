#include "etherstream/etherdream/SessionState.hpp"
#include "etherstream/etherdream/EtherDreamCommand.hpp"

namespace etherstream::etherdream {

const char* toString(SessionPhase phase) {
    switch (phase) {
        case SessionPhase::Disconnected: return "disconnected";
        case SessionPhase::Idle:         return "idle";
        case SessionPhase::Prepared:     return "prepared";
        case SessionPhase::Playing:      return "playing";
    }
    return "unknown";
}

SessionState SessionState::onConnected() const {
    SessionState next;
    next.currentPhase = SessionPhase::Idle;
    return next;
}

SessionState SessionState::onResponse(char command, const EtherDreamResponse& response) const {
    SessionState next = *this;
    next.status = response.status;
    next.responseCode = response.response;
    next.isValid = response.isAck();

    // An acknowledged begin/update overrides an underflow flag still set in its status.
    if (response.status.underflow() && next.currentPhase == SessionPhase::Playing) {
        next.currentPhase = SessionPhase::Prepared;
    }

    if (next.isValid) {
        switch (command) {
            case opcode::Prepare:
                next.currentPhase = SessionPhase::Prepared;
                break;
            case opcode::Begin:
            case opcode::Update:
                next.currentPhase = SessionPhase::Playing;
                break;
            case opcode::Stop:
            case opcode::EmergencyStop:
            case opcode::ClearEmergencyStop:
                next.currentPhase = SessionPhase::Idle;
                break;
            default:
                break;
        }
    }
    return next;
}

SessionState SessionState::onInvalidated() const {
    SessionState next = *this;
    next.isValid = false;
    return next;
}

bool SessionState::operator==(const SessionState& other) const {
    return currentPhase == other.currentPhase
        && status == other.status
        && responseCode == other.responseCode
        && isValid == other.isValid;
}

} // namespace etherstream::etherdream

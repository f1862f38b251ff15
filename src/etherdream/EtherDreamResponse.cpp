#include "etherstream/etherdream/EtherDreamResponse.hpp"
#include "etherstream/etherdream/EtherDreamConfig.hpp"
#include "etherstream/core/ByteBuffer.hpp"

#include <iomanip>
#include <sstream>

namespace etherstream::etherdream {

bool EtherDreamResponse::decode(const std::uint8_t* data, std::size_t size) {
    if (!data || size < config::ETHERDREAM_RESPONSE_SIZE) {
        return false;
    }

    core::ByteReader reader(data, config::ETHERDREAM_RESPONSE_SIZE);
    EtherDreamResponse decoded;
    std::uint8_t lightEngine = 0;
    std::uint8_t playback = 0;

    const bool ok = reader.readUInt8(decoded.response)
        && reader.readUInt8(decoded.command)
        && reader.readUInt8(decoded.status.protocol)
        && reader.readUInt8(lightEngine)
        && reader.readUInt8(playback)
        && reader.readUInt8(decoded.status.source)
        && reader.readUInt16(decoded.status.lightEngineFlags)
        && reader.readUInt16(decoded.status.playbackFlags)
        && reader.readUInt16(decoded.status.sourceFlags)
        && reader.readUInt16(decoded.status.bufferFullness)
        && reader.readUInt32(decoded.status.pointRate)
        && reader.readUInt32(decoded.status.pointCount);
    if (!ok) {
        return false;
    }

    decoded.status.lightEngineState = static_cast<LightEngineState>(lightEngine);
    decoded.status.playbackState = static_cast<PlaybackState>(playback);
    *this = decoded;
    return true;
}

std::string EtherDreamResponse::describeResponseCode(std::uint8_t code) {
    switch (code) {
        case response_code::Ack:        return "ACK";
        case response_code::NakFull:    return "NAK (buffer full)";
        case response_code::NakInvalid: return "NAK (invalid command)";
        case response_code::NakStop:    return "NAK (stop condition)";
        default: break;
    }
    std::ostringstream os;
    os << "unknown (0x" << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(code) << ")";
    return os.str();
}

bool EtherDreamStatus::operator==(const EtherDreamStatus& other) const {
    return protocol == other.protocol
        && lightEngineState == other.lightEngineState
        && playbackState == other.playbackState
        && source == other.source
        && lightEngineFlags == other.lightEngineFlags
        && playbackFlags == other.playbackFlags
        && sourceFlags == other.sourceFlags
        && bufferFullness == other.bufferFullness
        && pointRate == other.pointRate
        && pointCount == other.pointCount;
}

const char* EtherDreamStatus::toString(LightEngineState state) {
    switch (state) {
        case LightEngineState::Ready:   return "ready";
        case LightEngineState::Warmup:  return "warmup";
        case LightEngineState::Cooldown:return "cooldown";
        case LightEngineState::Estop:   return "estop";
    }
    return "unknown";
}

const char* EtherDreamStatus::toString(PlaybackState state) {
    switch (state) {
        case PlaybackState::Idle:     return "idle";
        case PlaybackState::Prepared: return "prepared";
        case PlaybackState::Playing:  return "playing";
    }
    return "unknown";
}

std::string EtherDreamStatus::describe() const {
    std::ostringstream os;
    os << "light=" << toString(lightEngineState)
       << " playback=" << toString(playbackState)
       << " buffer=" << bufferFullness
       << " rate=" << pointRate
       << " count=" << pointCount
       << " flags{L=0x" << std::hex << std::uppercase << lightEngineFlags
       << " P=0x" << playbackFlags
       << " S=0x" << sourceFlags << std::dec << std::nouppercase << "}";
    return os.str();
}

std::string EtherDreamStatus::toHexLine(const std::uint8_t* data, std::size_t size) {
    if (!data || size == 0) {
        return {};
    }

    std::ostringstream os;
    os << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < size; ++i) {
        if (i) os << ' ';
        os << std::setw(2) << static_cast<int>(data[i]);
    }
    return os.str();
}

} // namespace etherstream::etherdream

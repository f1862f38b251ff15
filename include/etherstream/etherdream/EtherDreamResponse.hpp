#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace etherstream::etherdream {

enum class LightEngineState : std::uint8_t {
    Ready = 0,
    Warmup = 1,
    Cooldown = 2,
    Estop = 3
};

enum class PlaybackState : std::uint8_t {
    Idle = 0,
    Prepared = 1,
    Playing = 2
};

namespace response_code {
constexpr std::uint8_t Ack = 'a';
constexpr std::uint8_t NakFull = 'F';
constexpr std::uint8_t NakInvalid = 'I';
constexpr std::uint8_t NakStop = '!';
} // namespace response_code

namespace playback_flags {
constexpr std::uint16_t ShutterOpen = 1u << 0;
constexpr std::uint16_t Underflow = 1u << 1;   // bit value 2
constexpr std::uint16_t EmergencyStop = 1u << 2;
} // namespace playback_flags

struct EtherDreamStatus {
    std::uint8_t protocol = 0;
    LightEngineState lightEngineState = LightEngineState::Ready;
    PlaybackState playbackState = PlaybackState::Idle;
    std::uint8_t source = 0;
    std::uint16_t lightEngineFlags = 0;
    std::uint16_t playbackFlags = 0;
    std::uint16_t sourceFlags = 0;
    std::uint16_t bufferFullness = 0;
    std::uint32_t pointRate = 0;
    std::uint32_t pointCount = 0;

    bool underflow() const { return (playbackFlags & playback_flags::Underflow) != 0; }

    bool operator==(const EtherDreamStatus& other) const;
    bool operator!=(const EtherDreamStatus& other) const { return !(*this == other); }

    static const char* toString(LightEngineState state);
    static const char* toString(PlaybackState state);
    std::string describe() const;
    static std::string toHexLine(const std::uint8_t* data, std::size_t size);
};

/// Decoded 22-byte standard response.
struct EtherDreamResponse {
    std::uint8_t response = 0;
    std::uint8_t command = 0;
    EtherDreamStatus status{};

    bool isAck() const { return response == response_code::Ack; }

    /// Returns false (framing error) when fewer than 22 bytes are supplied.
    bool decode(const std::uint8_t* data, std::size_t size);

    /// "ACK", "NAK (buffer full)", ... for log lines.
    static std::string describeResponseCode(std::uint8_t code);
};

} // namespace etherstream::etherdream

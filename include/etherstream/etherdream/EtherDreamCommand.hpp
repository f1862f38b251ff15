#pragma once

#include "etherstream/core/ByteBuffer.hpp"
#include "etherstream/core/Sample.hpp"

#include <cstddef>
#include <cstdint>

namespace etherstream::etherdream {

namespace opcode {
constexpr char Ping = '?';
constexpr char Prepare = 'p';
constexpr char Begin = 'b';
constexpr char Update = 'u';
constexpr char Stop = 's';
constexpr char EmergencyStop = static_cast<char>(0xFF);
constexpr char ClearEmergencyStop = 'c';
constexpr char Data = 'd';
} // namespace opcode

// Per sample on the wire: control, x, y, r, g, b, i, u1, u2.
constexpr std::size_t ETHERDREAM_SAMPLE_FIELD_COUNT = 9;
constexpr std::size_t ETHERDREAM_SAMPLE_SIZE = ETHERDREAM_SAMPLE_FIELD_COUNT * sizeof(std::uint16_t);
constexpr std::size_t ETHERDREAM_DATA_HEADER_SIZE = 1 + sizeof(std::uint16_t);   // opcode + count
constexpr std::size_t ETHERDREAM_BEGIN_SIZE = 1 + sizeof(std::uint16_t) + sizeof(std::uint32_t);

/**
 * @brief Reusable encoder for one outgoing command.
 *
 * Each `set*` call discards the previous contents. A data command is built
 * with setDataCommand(count) followed by exactly `count` addSample() calls.
 */
class EtherDreamCommand {
public:
    void setSingleByteCommand(char opcode);
    void setBeginCommand(std::uint32_t pointRate);
    void setUpdateCommand(std::uint32_t pointRate);
    void setDataCommand(std::uint16_t sampleCount);
    void addSample(const core::Sample& sample);

    /// Encode a whole batch; the caller guarantees count <= 65535.
    void setDataCommand(const core::Sample* samples, std::size_t count);

    const std::uint8_t* data() const { return buffer.data(); }
    std::size_t size() const { return buffer.size(); }
    bool isReady() const { return commandOpcode != 0 && !buffer.empty(); }
    char opcode() const { return commandOpcode; }
    void reset();

private:
    void setRateCommand(char opcode, std::uint32_t pointRate);

    core::ByteBuffer buffer;
    char commandOpcode = 0;
};

} // namespace etherstream::etherdream

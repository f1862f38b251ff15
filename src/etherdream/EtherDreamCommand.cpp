#include "etherstream/etherdream/EtherDreamCommand.hpp"
#include "etherstream/etherdream/EtherDreamConfig.hpp"

namespace etherstream::etherdream {

void EtherDreamCommand::reset() {
    buffer.clear();
    commandOpcode = 0;
}

void EtherDreamCommand::setSingleByteCommand(char opcode) {
    buffer.clear();
    buffer.appendChar(opcode);
    commandOpcode = opcode;
}

void EtherDreamCommand::setRateCommand(char opcode, std::uint32_t pointRate) {
    buffer.clear();
    buffer.appendChar(opcode);
    buffer.appendUInt16(config::ETHERDREAM_LOW_WATER_MARK);
    buffer.appendUInt32(pointRate);
    commandOpcode = opcode;
}

void EtherDreamCommand::setBeginCommand(std::uint32_t pointRate) {
    setRateCommand(opcode::Begin, pointRate);
}

void EtherDreamCommand::setUpdateCommand(std::uint32_t pointRate) {
    setRateCommand(opcode::Update, pointRate);
}

void EtherDreamCommand::setDataCommand(std::uint16_t sampleCount) {
    buffer.clear();
    buffer.reserve(ETHERDREAM_DATA_HEADER_SIZE + sampleCount * ETHERDREAM_SAMPLE_SIZE);
    buffer.appendChar(opcode::Data);
    buffer.appendUInt16(sampleCount);
    commandOpcode = opcode::Data;
}

void EtherDreamCommand::addSample(const core::Sample& sample) {
    buffer.appendUInt16(sample.control);
    buffer.appendInt16(sample.x);
    buffer.appendInt16(sample.y);
    buffer.appendUInt16(sample.r);
    buffer.appendUInt16(sample.g);
    buffer.appendUInt16(sample.b);
    buffer.appendUInt16(sample.i);
    buffer.appendUInt16(sample.u1);
    buffer.appendUInt16(sample.u2);
}

void EtherDreamCommand::setDataCommand(const core::Sample* samples, std::size_t count) {
    setDataCommand(static_cast<std::uint16_t>(count));
    for (std::size_t idx = 0; idx < count; ++idx) {
        addSample(samples[idx]);
    }
}

} // namespace etherstream::etherdream

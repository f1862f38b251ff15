#include "etherstream/core/ByteBuffer.hpp"

namespace etherstream::core {

ByteBuffer::ByteBuffer() {
    // A full device buffer of samples is ~32 KB on the wire.
    buffer.reserve(1024 * 32);
}

void ByteBuffer::clear() {
    buffer.clear();
}

void ByteBuffer::reserve(std::size_t bytes) {
    buffer.reserve(bytes);
}

void ByteBuffer::appendChar(char value) {
    buffer.push_back(static_cast<std::uint8_t>(value));
}

void ByteBuffer::appendUInt8(std::uint8_t value) {
    buffer.push_back(value);
}

void ByteBuffer::appendUInt16(std::uint16_t value) {
    buffer.push_back(static_cast<std::uint8_t>(value & 0xFFu));
    buffer.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFFu));
}

void ByteBuffer::appendInt16(std::int16_t value) {
    appendUInt16(static_cast<std::uint16_t>(value));
}

void ByteBuffer::appendUInt32(std::uint32_t value) {
    buffer.push_back(static_cast<std::uint8_t>(value & 0xFFu));
    buffer.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFFu));
    buffer.push_back(static_cast<std::uint8_t>((value >> 16) & 0xFFu));
    buffer.push_back(static_cast<std::uint8_t>((value >> 24) & 0xFFu));
}

ByteReader::ByteReader(const std::uint8_t* data, std::size_t size)
: data(data)
, size(data ? size : 0)
{}

bool ByteReader::readUInt8(std::uint8_t& out) {
    if (remaining() < 1) {
        return false;
    }
    out = data[offset++];
    return true;
}

bool ByteReader::readUInt16(std::uint16_t& out) {
    if (remaining() < 2) {
        return false;
    }
    out = static_cast<std::uint16_t>(data[offset])
        | static_cast<std::uint16_t>(static_cast<std::uint16_t>(data[offset + 1]) << 8);
    offset += 2;
    return true;
}

bool ByteReader::readInt16(std::int16_t& out) {
    std::uint16_t raw = 0;
    if (!readUInt16(raw)) {
        return false;
    }
    out = static_cast<std::int16_t>(raw);
    return true;
}

bool ByteReader::readUInt32(std::uint32_t& out) {
    if (remaining() < 4) {
        return false;
    }
    out = static_cast<std::uint32_t>(data[offset])
        | (static_cast<std::uint32_t>(data[offset + 1]) << 8)
        | (static_cast<std::uint32_t>(data[offset + 2]) << 16)
        | (static_cast<std::uint32_t>(data[offset + 3]) << 24);
    offset += 4;
    return true;
}

bool ByteReader::skip(std::size_t count) {
    if (remaining() < count) {
        return false;
    }
    offset += count;
    return true;
}

} // namespace etherstream::core

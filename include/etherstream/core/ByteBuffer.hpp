#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace etherstream::core {

/// Growable little-endian writer used to assemble command packets.
class ByteBuffer {
public:
    ByteBuffer();

    void clear();
    void reserve(std::size_t bytes);
    void appendChar(char value);
    void appendUInt8(std::uint8_t value);
    void appendUInt16(std::uint16_t value);
    void appendInt16(std::int16_t value);
    void appendUInt32(std::uint32_t value);

    const std::uint8_t* data() const { return buffer.data(); }
    std::uint8_t* data() { return buffer.data(); }
    std::size_t size() const { return buffer.size(); }
    bool empty() const { return buffer.empty(); }

private:
    std::vector<std::uint8_t> buffer;
};

/**
 * @brief Bounds-checked little-endian cursor over a byte range.
 *
 * Each read returns false (and leaves the output untouched) when fewer bytes
 * remain than the field needs; the cursor only advances on success.
 */
class ByteReader {
public:
    ByteReader(const std::uint8_t* data, std::size_t size);

    bool readUInt8(std::uint8_t& out);
    bool readUInt16(std::uint16_t& out);
    bool readInt16(std::int16_t& out);
    bool readUInt32(std::uint32_t& out);
    bool skip(std::size_t count);

    std::size_t remaining() const { return size - offset; }
    std::size_t position() const { return offset; }

private:
    const std::uint8_t* data = nullptr;
    std::size_t size = 0;
    std::size_t offset = 0;
};

} // namespace etherstream::core

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace dmxbridge::core {

class ByteBuffer {
public:
    explicit ByteBuffer(std::size_t reserveBytes = 0);

    void appendUInt8(std::uint8_t value);
    void appendUInt16LE(std::uint16_t value);   // lo byte, then hi byte
    void appendUInt16BE(std::uint16_t value);   // hi byte, then lo byte
    void appendBytes(const std::uint8_t* bytes, std::size_t count);

    /// Hand the accumulated bytes to the caller, leaving the buffer empty.
    std::vector<std::uint8_t> release();

private:
    std::vector<std::uint8_t> buffer;
};

} // namespace dmxbridge::core

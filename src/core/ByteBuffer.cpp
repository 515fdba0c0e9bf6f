#include "dmxbridge/core/ByteBuffer.hpp"

#include <utility>

namespace dmxbridge::core {

ByteBuffer::ByteBuffer(std::size_t reserveBytes) {
    buffer.reserve(reserveBytes);
}

void ByteBuffer::appendUInt8(std::uint8_t value) {
    buffer.push_back(value);
}

void ByteBuffer::appendUInt16LE(std::uint16_t value) {
    buffer.push_back(static_cast<std::uint8_t>(value & 0xFFu));
    buffer.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFFu));
}

void ByteBuffer::appendUInt16BE(std::uint16_t value) {
    buffer.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFFu));
    buffer.push_back(static_cast<std::uint8_t>(value & 0xFFu));
}

void ByteBuffer::appendBytes(const std::uint8_t* bytes, std::size_t count) {
    if (!bytes || count == 0) {
        return;
    }
    buffer.insert(buffer.end(), bytes, bytes + count);
}

std::vector<std::uint8_t> ByteBuffer::release() {
    std::vector<std::uint8_t> out;
    out.swap(buffer);
    return out;
}

} // namespace dmxbridge::core

#include "galvo/core/ByteBuffer.hpp"

namespace galvo::core {

ByteBuffer::ByteBuffer(std::size_t reserveBytes) {
    buffer.reserve(reserveBytes);
}

void ByteBuffer::clear() {
    buffer.clear();
}

void ByteBuffer::appendUInt8(std::uint8_t value) {
    buffer.push_back(value);
}

void ByteBuffer::appendUInt16(std::uint16_t value) {
    buffer.push_back(static_cast<std::uint8_t>(value & 0xFFu));
    buffer.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFFu));
}

void ByteBuffer::appendBytes(const std::uint8_t* bytes, std::size_t count) {
    if (!bytes || count == 0) {
        return;
    }
    buffer.insert(buffer.end(), bytes, bytes + count);
}

} // namespace galvo::core

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace galvo::core {

/// Growable little-endian byte sink used to assemble wire frames.
class ByteBuffer {
public:
    explicit ByteBuffer(std::size_t reserveBytes = 0);

    void clear();
    void appendUInt8(std::uint8_t value);
    void appendUInt16(std::uint16_t value);
    void appendBytes(const std::uint8_t* bytes, std::size_t count);

    const std::uint8_t* data() const { return buffer.data(); }
    std::uint8_t* data() { return buffer.data(); }
    std::size_t size() const { return buffer.size(); }
    bool empty() const { return buffer.empty(); }

    static std::uint16_t readUInt16(const std::uint8_t* bytes) {
        return static_cast<std::uint16_t>(bytes[0])
             | static_cast<std::uint16_t>(static_cast<std::uint16_t>(bytes[1]) << 8);
    }

private:
    std::vector<std::uint8_t> buffer;
};

} // namespace galvo::core

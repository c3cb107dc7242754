#include "galvo/lmc/LmcReply.hpp"

#include "galvo/core/ByteBuffer.hpp"

#include <iomanip>
#include <sstream>

namespace galvo::lmc {

LmcReply LmcReply::decode(const ReplyBytes& raw) {
    LmcReply reply;
    for (std::size_t i = 0; i < reply.words.size(); ++i) {
        reply.words[i] = core::ByteBuffer::readUInt16(raw.data() + i * 2);
    }
    return reply;
}

ReplyBytes LmcReply::encode() const {
    ReplyBytes raw{};
    for (std::size_t i = 0; i < words.size(); ++i) {
        raw[i * 2] = static_cast<std::uint8_t>(words[i] & 0xFFu);
        raw[i * 2 + 1] = static_cast<std::uint8_t>((words[i] >> 8) & 0xFFu);
    }
    return raw;
}

std::string LmcReply::describe() const {
    std::ostringstream os;
    os << "words=" << words[0] << ',' << words[1] << ',' << words[2] << ',' << words[3]
       << " status=0x" << std::hex << std::uppercase << status() << std::dec << std::nouppercase
       << (isReady() ? " ready" : "")
       << (isBusy() ? " busy" : "");
    return os.str();
}

std::string LmcReply::toHexLine(const std::uint8_t* data, std::size_t size) {
    if (!data || size == 0) {
        return {};
    }

    std::ostringstream os;
    os << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < size; ++i) {
        if (i) os << ':';
        os << std::setw(2) << static_cast<int>(data[i]);
    }
    return os.str();
}

} // namespace galvo::lmc

#include "galvo/lmc/LmcCommand.hpp"

#include <iomanip>
#include <sstream>

namespace galvo::lmc {

Command decodeCommand(std::uint16_t opcode, const CommandParams& params) {
    if (isListOpcode(opcode)) {
        return ListCommand{opcode, params};
    }
    return ImmediateCommand{opcode, params, true};
}

void appendCommand(core::ByteBuffer& out, std::uint16_t opcode, const CommandParams& params) {
    out.appendUInt16(opcode);
    for (auto value : params) {
        out.appendUInt16(value);
    }
}

CommandFrame encodeFrame(std::uint16_t opcode, const CommandParams& params) {
    CommandFrame frame{};
    frame[0] = static_cast<std::uint8_t>(opcode & 0xFFu);
    frame[1] = static_cast<std::uint8_t>((opcode >> 8) & 0xFFu);
    for (std::size_t i = 0; i < params.size(); ++i) {
        frame[2 + i * 2] = static_cast<std::uint8_t>(params[i] & 0xFFu);
        frame[3 + i * 2] = static_cast<std::uint8_t>((params[i] >> 8) & 0xFFu);
    }
    return frame;
}

CommandEntry decodeEntry(const std::uint8_t* data) {
    CommandEntry entry;
    entry.opcode = core::ByteBuffer::readUInt16(data);
    for (std::size_t i = 0; i < entry.params.size(); ++i) {
        entry.params[i] = core::ByteBuffer::readUInt16(data + 2 + i * 2);
    }
    return entry;
}

std::string CommandEntry::describe() const {
    std::ostringstream os;
    os << std::hex << std::setfill('0') << std::setw(4) << opcode;
    for (auto value : params) {
        os << ':' << std::setw(4) << value;
    }
    os << ' ' << anyOpcodeName(opcode);
    return os.str();
}

std::string describeFrame(const std::uint8_t* data, std::size_t size) {
    if (!data || size < config::LMC_COMMAND_SIZE) {
        return {};
    }

    std::ostringstream os;
    std::size_t repeats = 0;
    bool first = true;
    CommandEntry last;

    auto flushRepeats = [&] {
        if (repeats) {
            os << "\n... repeated " << repeats << " times ...";
            repeats = 0;
        }
    };

    for (std::size_t offset = 0; offset + config::LMC_COMMAND_SIZE <= size;
         offset += config::LMC_COMMAND_SIZE) {
        const auto entry = decodeEntry(data + offset);
        if (!first && entry == last) {
            ++repeats;
            continue;
        }
        flushRepeats();
        if (!first) {
            os << '\n';
        }
        os << entry.describe();
        last = entry;
        first = false;
    }
    flushRepeats();
    return os.str();
}

} // namespace galvo::lmc

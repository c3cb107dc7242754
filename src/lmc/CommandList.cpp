#include "galvo/lmc/CommandList.hpp"

namespace galvo::lmc {

CommandList::CommandList()
: buffer(config::LMC_LIST_PACKET_SIZE) {}

const CommandFrame& CommandList::noOpEntry() {
    static const CommandFrame entry = encodeFrame(toWord(ListOpcode::EndOfList), {});
    return entry;
}

bool CommandList::append(std::uint16_t opcode, const CommandParams& params) {
    if (sealed || full()) {
        return false;
    }
    appendCommand(buffer, opcode, params);
    ++entries;
    return true;
}

void CommandList::finish() {
    if (sealed) {
        return;
    }
    const auto& pad = noOpEntry();
    while (buffer.size() < config::LMC_LIST_PACKET_SIZE) {
        buffer.appendBytes(pad.data(), pad.size());
    }
    sealed = true;
}

void CommandList::reset() {
    buffer.clear();
    entries = 0;
    sealed = false;
}

} // namespace galvo::lmc

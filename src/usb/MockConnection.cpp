#include "galvo/usb/MockConnection.hpp"

#include "galvo/core/ByteBuffer.hpp"
#include "galvo/core/GalvoError.hpp"

#include <algorithm>

namespace galvo::usb {

MockConnection::MockConnection(std::shared_ptr<log::LogChannel> channel,
                               core::RetryPolicy transferPolicy)
: Connection(std::move(channel), transferPolicy) {
    setTimeout(config::LMC_MOCK_TIMEOUT);
}

MockConnection::~MockConnection() = default;

expected<int> MockConnection::open(int index) {
    ++opens;
    channel()("Attempting connection to Mock.");
    if (pendingOpenFailures > 0) {
        --pendingOpenFailures;
        channel()("Mock refused connection (injected failure).");
        return unexpected(make_error_code(GalvoError::DeviceUnavailable));
    }
    openDevices.insert(index);
    channel()("Mock Connected.");
    return index;
}

void MockConnection::close(int index) {
    ++closes;
    channel()("Attempting disconnection from Mock.");
    if (openDevices.erase(index)) {
        channel()("Mock Disconnection Successful.");
    }
}

bool MockConnection::isOpen(int index) const {
    return openDevices.count(index) != 0;
}

expected<void> MockConnection::transmit(int index, const std::uint8_t* data, std::size_t size) {
    ++transmits;
    if (!isOpen(index)) {
        return unexpected(make_error_code(GalvoError::NotConnected));
    }
    if (pendingWriteFailures > 0) {
        --pendingWriteFailures;
        return unexpected(std::make_error_code(std::errc::io_error));
    }

    sentFrames.emplace_back(data, data + size);

    if (size == config::LMC_COMMAND_SIZE &&
        core::ByteBuffer::readUInt16(data) == lmc::toWord(lmc::Opcode::GetSerialNo)) {
        setImpliedResponse("GALVOSIM");
    }
    if (sendLog.hasHandler()) {
        sendLog.write(lmc::describeFrame(data, size));
    }
    return {};
}

expected<lmc::ReplyBytes> MockConnection::receive(int index) {
    if (!isOpen(index)) {
        return unexpected(make_error_code(GalvoError::NotConnected));
    }
    if (pendingReadFailures > 0) {
        --pendingReadFailures;
        return unexpected(std::make_error_code(std::errc::io_error));
    }

    lmc::ReplyBytes reply{};
    if (impliedResponse) {
        reply = *impliedResponse;
        impliedResponse.reset();
    } else if (!queuedReplies.empty()) {
        reply = queuedReplies.front();
        queuedReplies.pop_front();
    } else {
        lmc::LmcReply idle;
        idle.words[3] = idleStatus;
        reply = idle.encode();
    }

    if (recvLog.hasHandler()) {
        recvLog.write(lmc::LmcReply::toHexLine(reply.data(), reply.size()));
    }
    return reply;
}

std::size_t MockConnection::frameCount(std::size_t size) const {
    return static_cast<std::size_t>(std::count_if(sentFrames.begin(), sentFrames.end(),
        [size](const std::vector<std::uint8_t>& frame) { return frame.size() == size; }));
}

std::vector<lmc::CommandEntry> MockConnection::sentEntries() const {
    std::vector<lmc::CommandEntry> entries;
    for (const auto& frame : sentFrames) {
        for (std::size_t offset = 0; offset + config::LMC_COMMAND_SIZE <= frame.size();
             offset += config::LMC_COMMAND_SIZE) {
            entries.push_back(lmc::decodeEntry(frame.data() + offset));
        }
    }
    return entries;
}

std::vector<std::uint16_t> MockConnection::immediateOpcodes() const {
    std::vector<std::uint16_t> opcodes;
    for (const auto& frame : sentFrames) {
        if (frame.size() == config::LMC_COMMAND_SIZE) {
            opcodes.push_back(core::ByteBuffer::readUInt16(frame.data()));
        }
    }
    return opcodes;
}

void MockConnection::setImpliedResponse(std::string_view text) {
    lmc::ReplyBytes reply{};
    const auto count = std::min(text.size(), reply.size());
    for (std::size_t i = 0; i < count; ++i) {
        reply[i] = static_cast<std::uint8_t>(text[i]);
    }
    impliedResponse = reply;
}

void MockConnection::queueStatus(std::uint16_t status, std::size_t count) {
    lmc::LmcReply reply;
    reply.words[3] = status;
    for (std::size_t i = 0; i < count; ++i) {
        queuedReplies.push_back(reply.encode());
    }
}

} // namespace galvo::usb

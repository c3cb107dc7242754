#include "galvo/usb/Connection.hpp"

#include "galvo/core/GalvoError.hpp"

namespace galvo::usb {

using core::RetryStep;

Connection::Connection(std::shared_ptr<log::LogChannel> channel, core::RetryPolicy transferPolicy)
: channel_(channel ? std::move(channel) : std::make_shared<log::LogChannel>("usb"))
, transferPolicy_(transferPolicy) {}

Connection::~Connection() = default;

expected<void> Connection::write(int index, const std::uint8_t* data, std::size_t size) {
    if (!data || (size != config::LMC_COMMAND_SIZE && size != config::LMC_LIST_PACKET_SIZE)) {
        logError("[Connection] refusing frame of ", size, " bytes (expected ",
                 config::LMC_COMMAND_SIZE, " or ", config::LMC_LIST_PACKET_SIZE, ")\n");
        return unexpected(make_error_code(GalvoError::ProtocolViolation));
    }
    if (!isOpen(index)) {
        return unexpected(make_error_code(GalvoError::NotConnected));
    }

    return transferPolicy_.run(
        [&](int) { return transmit(index, data, size); },
        [&](const std::error_code& ec) {
            channel()("Write failed: ", ec.message(), ". Reopening device ", index, ".");
            return reopen(index) ? RetryStep::Retry : RetryStep::Backoff;
        },
        [&](const std::error_code& ec) -> expected<void> {
            channel()("Write aborted after ", transferPolicy_.maxAttempts,
                      " attempts: ", ec.message());
            return unexpected(make_error_code(GalvoError::TransportFailure));
        });
}

expected<lmc::ReplyBytes> Connection::read(int index) {
    if (!isOpen(index)) {
        return unexpected(make_error_code(GalvoError::NotConnected));
    }

    return transferPolicy_.run(
        [&](int) { return receive(index); },
        [&](const std::error_code& ec) {
            channel()("Read failed: ", ec.message(), ". Reopening device ", index, ".");
            return reopen(index) ? RetryStep::Retry : RetryStep::Backoff;
        },
        [&](const std::error_code& ec) -> expected<lmc::ReplyBytes> {
            channel()("Read aborted after ", transferPolicy_.maxAttempts,
                      " attempts: ", ec.message());
            return unexpected(make_error_code(GalvoError::TransportFailure));
        });
}

bool Connection::reopen(int index) {
    close(index);
    auto reopened = open(index);
    if (!reopened) {
        channel()("Reopen of device ", index, " failed: ", reopened.error().message());
        return false;
    }
    return true;
}

} // namespace galvo::usb

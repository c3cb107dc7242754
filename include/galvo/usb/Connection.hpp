#pragma once

#include "galvo/core/Expected.hpp"
#include "galvo/core/RetryPolicy.hpp"
#include "galvo/lmc/LmcCommand.hpp"
#include "galvo/lmc/LmcConfig.hpp"
#include "galvo/lmc/LmcReply.hpp"
#include "galvo/log/Log.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>

namespace galvo::usb {

using galvo::expected;
namespace config = lmc::config;

/**
 * @brief Transport to an LMC board addressed by device index.
 *
 * The base class owns the parts every transport shares:
 * - Frame validation. Only 12-byte commands and 3072-byte list packets are
 *   accepted; anything else fails with ProtocolViolation before any I/O.
 * - The transfer retry policy. A failed transfer closes and reopens the
 *   device and tries again, up to `transferPolicy().maxAttempts` attempts,
 *   sleeping the policy backoff whenever the reopen itself fails.
 *
 * Derived transports implement open/close/isOpen and the raw single-shot
 * `transmit()` / `receive()` calls.
 *
 * Threading: not thread-safe. One caller drives a connection.
 */
class Connection {
public:
    explicit Connection(std::shared_ptr<log::LogChannel> channel,
                        core::RetryPolicy transferPolicy = {config::LMC_TRANSFER_ATTEMPTS,
                                                            config::LMC_TRANSFER_BACKOFF});
    virtual ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    /// Open device @p index. Returns the index on success.
    virtual expected<int> open(int index) = 0;

    /// Best-effort teardown; never fails and may be called on a closed index.
    virtual void close(int index) = 0;

    virtual bool isOpen(int index) const = 0;

    expected<void> write(int index, const std::uint8_t* data, std::size_t size);
    expected<void> write(int index, const lmc::CommandFrame& frame) {
        return write(index, frame.data(), frame.size());
    }

    /// Read one 8-byte status frame.
    expected<lmc::ReplyBytes> read(int index);

    void setTransferPolicy(core::RetryPolicy policy) { transferPolicy_ = policy; }
    const core::RetryPolicy& transferPolicy() const { return transferPolicy_; }

    void setTimeout(std::chrono::milliseconds value) { timeout_ = value; }
    std::chrono::milliseconds timeout() const { return timeout_; }

    log::LogChannel& channel() { return *channel_; }

protected:
    virtual expected<void> transmit(int index, const std::uint8_t* data, std::size_t size) = 0;
    virtual expected<lmc::ReplyBytes> receive(int index) = 0;

    std::shared_ptr<log::LogChannel> channel_;

private:
    /// Close then open again. True when the device is usable afterwards.
    bool reopen(int index);

    core::RetryPolicy transferPolicy_;
    std::chrono::milliseconds timeout_{config::LMC_USB_TIMEOUT};
};

} // namespace galvo::usb

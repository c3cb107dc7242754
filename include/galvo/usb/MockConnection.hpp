#pragma once

#include "galvo/usb/Connection.hpp"

#include <deque>
#include <optional>
#include <set>
#include <string_view>
#include <vector>

namespace galvo::usb {

/**
 * @brief In-memory LMC board used for tests and for running without hardware.
 *
 * Behaviour:
 * - `open()` always succeeds unless failures were injected.
 * - Every frame written is recorded. When a send handler is installed the
 *   frame is also rendered one entry per line (see `lmc::describeFrame`).
 * - `read()` answers with, in order of preference: the implied response set
 *   by the last command (GetSerialNo answers "GALVOSIM"), a queued reply, or
 *   the idle status (ready bit set, busy bit clear).
 * - `injectWriteFailures(n)` / `injectReadFailures(n)` make the next n raw
 *   transfers fail so the base-class retry path can be exercised.
 */
class MockConnection : public Connection {
public:
    explicit MockConnection(std::shared_ptr<log::LogChannel> channel = nullptr,
                            core::RetryPolicy transferPolicy = {config::LMC_TRANSFER_ATTEMPTS,
                                                                config::LMC_TRANSFER_BACKOFF});
    ~MockConnection() override;

    expected<int> open(int index) override;
    void close(int index) override;
    bool isOpen(int index) const override;

    // Traffic inspection -------------------------------------------------------
    const std::vector<std::vector<std::uint8_t>>& frames() const { return sentFrames; }
    void clearFrames() { sentFrames.clear(); }

    /// Number of recorded frames of exactly @p size bytes.
    std::size_t frameCount(std::size_t size) const;

    /// Every 12-byte entry sent, list packets expanded to their 256 entries.
    std::vector<lmc::CommandEntry> sentEntries() const;

    /// Opcodes of the 12-byte frames, in send order.
    std::vector<std::uint16_t> immediateOpcodes() const;

    void setSendHandler(LogHandler handler) { sendLog.setHandler(std::move(handler)); }
    void setRecvHandler(LogHandler handler) { recvLog.setHandler(std::move(handler)); }

    // Reply control ------------------------------------------------------------
    /// Answer the next read with @p text, ASCII, zero padded to 8 bytes.
    void setImpliedResponse(std::string_view text);
    void clearImpliedResponse() { impliedResponse.reset(); }

    void queueReply(const lmc::ReplyBytes& reply) { queuedReplies.push_back(reply); }
    /// Queue @p count GetVersion-style replies whose status word is @p status.
    void queueStatus(std::uint16_t status, std::size_t count = 1);

    /// Status word used when nothing else is queued.
    void setIdleStatus(std::uint16_t status) { idleStatus = status; }

    // Failure injection --------------------------------------------------------
    void injectOpenFailures(int count) { pendingOpenFailures = count; }
    void injectWriteFailures(int count) { pendingWriteFailures = count; }
    void injectReadFailures(int count) { pendingReadFailures = count; }

    int openCalls() const { return opens; }
    int closeCalls() const { return closes; }
    int transmitCalls() const { return transmits; }

protected:
    expected<void> transmit(int index, const std::uint8_t* data, std::size_t size) override;
    expected<lmc::ReplyBytes> receive(int index) override;

private:
    std::set<int> openDevices;
    std::vector<std::vector<std::uint8_t>> sentFrames;
    std::deque<lmc::ReplyBytes> queuedReplies;
    std::optional<lmc::ReplyBytes> impliedResponse;
    std::uint16_t idleStatus = config::LMC_STATUS_READY;

    log::LogChannel sendLog{"send"};
    log::LogChannel recvLog{"recv"};

    int pendingOpenFailures = 0;
    int pendingWriteFailures = 0;
    int pendingReadFailures = 0;
    int opens = 0;
    int closes = 0;
    int transmits = 0;
};

} // namespace galvo::usb

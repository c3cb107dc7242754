#include "galvo/core/GalvoError.hpp"
#include "galvo/core/RetryPolicy.hpp"
#include "galvo/lmc/CommandList.hpp"
#include "galvo/lmc/LmcCommand.hpp"
#include "galvo/log/Log.hpp"
#include "galvo/usb/MockConnection.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

using namespace galvo;
using namespace std::chrono_literals;

static int g_failures = 0;

#define ASSERT_TRUE(cond, msg) \
    do { if (!(cond)) { galvo::logError("ASSERT TRUE FAILED: ", (msg), \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

#define ASSERT_EQ(a,b,msg) \
    do { auto _va=(a); auto _vb=(b); if (!((_va)==(_vb))) { galvo::logError("ASSERT EQ FAILED: ", (msg), \
        "  (", +_va, " != ", +_vb, ")" \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

namespace {

const core::RetryPolicy kFastTransfers{3, 1ms};

std::shared_ptr<LogChannel> quietChannel() {
    auto channel = std::make_shared<LogChannel>("usb");
    channel->setHandler([](std::string_view) {});
    return channel;
}

} // namespace

static void testOpenWriteClose() {
    usb::MockConnection mock(quietChannel(), kFastTransfers);
    auto opened = mock.open(0);
    ASSERT_TRUE(opened.has_value(), "open succeeds");
    ASSERT_EQ(*opened, 0, "open returns the index");
    ASSERT_TRUE(mock.isOpen(0), "index 0 open");

    const std::array<std::uint8_t, 12> zeros{};
    ASSERT_TRUE(mock.write(0, zeros.data(), zeros.size()).has_value(), "12-byte write");
    ASSERT_EQ(mock.frames().size(), static_cast<std::size_t>(1), "frame recorded");

    mock.close(0);
    ASSERT_TRUE(!mock.isOpen(0), "closed after close()");
}

static void testProtocolViolation() {
    usb::MockConnection mock(quietChannel(), kFastTransfers);
    mock.open(0);
    const std::vector<std::uint8_t> odd(11, 0);
    auto written = mock.write(0, odd.data(), odd.size());
    ASSERT_TRUE(!written, "11-byte write rejected");
    ASSERT_TRUE(written.error() == GalvoError::ProtocolViolation, "protocol violation");
    ASSERT_EQ(mock.transmitCalls(), 0, "no transport call for bad frame");

    const std::vector<std::uint8_t> big(3073, 0);
    ASSERT_TRUE(!mock.write(0, big.data(), big.size()), "3073-byte write rejected");
    const std::vector<std::uint8_t> packet(3072, 0);
    ASSERT_TRUE(mock.write(0, packet.data(), packet.size()).has_value(), "3072-byte write");
    ASSERT_EQ(mock.transmitCalls(), 1, "only the packet reached the transport");
}

static void testNotConnected() {
    usb::MockConnection mock(quietChannel(), kFastTransfers);
    auto frame = lmc::encodeFrame(lmc::toWord(lmc::Opcode::GetVersion), {});
    auto written = mock.write(3, frame);
    ASSERT_TRUE(!written, "write on closed index fails");
    ASSERT_TRUE(written.error() == GalvoError::NotConnected, "not connected");
    ASSERT_TRUE(isTransportFailure(written.error()), "not connected is a transport failure");
    auto read = mock.read(3);
    ASSERT_TRUE(!read && read.error() == GalvoError::NotConnected, "read on closed index");
}

static void testWriteRecoversAfterTwoFailures() {
    usb::MockConnection mock(quietChannel(), kFastTransfers);
    mock.open(0);
    mock.injectWriteFailures(2);
    auto frame = lmc::encodeFrame(lmc::toWord(lmc::Opcode::GetVersion), {});
    ASSERT_TRUE(mock.write(0, frame).has_value(), "third attempt succeeds");
    ASSERT_EQ(mock.transmitCalls(), 3, "three transfer attempts");
    ASSERT_EQ(mock.closeCalls(), 2, "two close/reopen cycles");
    ASSERT_EQ(mock.openCalls(), 3, "initial open plus two reopens");
    ASSERT_EQ(mock.frames().size(), static_cast<std::size_t>(1), "frame delivered once");
}

static void testWriteGivesUpAfterThreeFailures() {
    usb::MockConnection mock(quietChannel(), kFastTransfers);
    mock.open(0);
    mock.injectWriteFailures(3);
    auto frame = lmc::encodeFrame(lmc::toWord(lmc::Opcode::GetVersion), {});
    auto written = mock.write(0, frame);
    ASSERT_TRUE(!written, "write fails after three attempts");
    ASSERT_TRUE(written.error() == GalvoError::TransportFailure, "transport failure");
    ASSERT_EQ(mock.transmitCalls(), 3, "exactly three attempts");
    ASSERT_TRUE(mock.frames().empty(), "nothing delivered");
}

static void testFailedReopenBacksOff() {
    usb::MockConnection mock(quietChannel(), kFastTransfers);
    mock.open(0);
    mock.injectWriteFailures(1);
    mock.injectOpenFailures(1);
    auto frame = lmc::encodeFrame(lmc::toWord(lmc::Opcode::GetVersion), {});
    ASSERT_TRUE(mock.write(0, frame).has_value(), "write recovers once the device reopens");
    ASSERT_EQ(mock.transmitCalls(), 3, "failure, not-connected, success");
    ASSERT_TRUE(mock.isOpen(0), "device open afterwards");
}

static void testReadRetries() {
    usb::MockConnection mock(quietChannel(), kFastTransfers);
    mock.open(0);
    mock.injectReadFailures(2);
    auto reply = mock.read(0);
    ASSERT_TRUE(reply.has_value(), "read recovers");
    ASSERT_EQ(mock.closeCalls(), 2, "two reopen cycles for reads");

    mock.injectReadFailures(3);
    auto failed = mock.read(0);
    ASSERT_TRUE(!failed && failed.error() == GalvoError::TransportFailure, "read gives up");
}

static void testReplies() {
    usb::MockConnection mock(quietChannel(), kFastTransfers);
    mock.open(0);

    auto idle = mock.read(0);
    ASSERT_TRUE(idle.has_value(), "idle read");
    const auto decoded = lmc::LmcReply::decode(*idle);
    ASSERT_TRUE(decoded.isReady() && !decoded.isBusy(), "idle reply is ready, not busy");

    mock.write(0, lmc::encodeFrame(lmc::toWord(lmc::Opcode::GetSerialNo), {}));
    auto serial = mock.read(0);
    ASSERT_TRUE(serial.has_value(), "serial read");
    const std::string text(serial->begin(), serial->end());
    ASSERT_TRUE(text == "GALVOSIM", "serial number text");

    mock.queueStatus(lmc::config::LMC_STATUS_BUSY | lmc::config::LMC_STATUS_READY, 1);
    auto busy = mock.read(0);
    ASSERT_TRUE(busy && lmc::LmcReply::decode(*busy).isBusy(), "queued busy status");
    auto after = mock.read(0);
    ASSERT_TRUE(after && !lmc::LmcReply::decode(*after).isBusy(), "queue drained");

    const lmc::ReplyBytes custom{0x11, 0x22, 0, 0, 0, 0, 0x20, 0};
    mock.queueReply(custom);
    mock.setImpliedResponse("IGNORED");
    mock.clearImpliedResponse();
    auto queued = mock.read(0);
    ASSERT_TRUE(queued && *queued == custom, "queued reply returned verbatim");
}

static void testSendHandlerRendersFrames() {
    usb::MockConnection mock(quietChannel(), kFastTransfers);
    mock.open(0);
    std::vector<std::string> lines;
    mock.setSendHandler([&](std::string_view text) { lines.emplace_back(text); });

    lmc::CommandList list;
    list.append(lmc::toWord(lmc::ListOpcode::MarkTo), {0x1234, 0x5678, 0, 0, 0});
    list.finish();
    mock.write(0, list.data(), list.size());

    ASSERT_EQ(lines.size(), static_cast<std::size_t>(1), "one rendering per frame");
    ASSERT_TRUE(!lines.empty() && lines[0].find("8005:1234:5678") == 0, "first entry rendered");
    ASSERT_EQ(mock.sentEntries().size(), static_cast<std::size_t>(256), "entries expanded");
}

static void testRetryPolicy() {
    core::RetryPolicy policy{4, 0ms};
    int calls = 0;
    auto result = policy.run(
        [&](int attempt) -> expected<int> {
            ++calls;
            if (attempt < 3) {
                return unexpected(make_error_code(GalvoError::TransportFailure));
            }
            return attempt;
        },
        [](const std::error_code&) { return core::RetryStep::Retry; });
    ASSERT_TRUE(result && *result == 3, "succeeds on third attempt");
    ASSERT_EQ(calls, 3, "stops at first success");

    calls = 0;
    auto stopped = policy.run(
        [&](int) -> expected<int> {
            ++calls;
            return unexpected(make_error_code(GalvoError::DeviceUnavailable));
        },
        [](const std::error_code&) { return core::RetryStep::GiveUp; });
    ASSERT_TRUE(!stopped, "give up propagates the error");
    ASSERT_EQ(calls, 1, "give up stops immediately");

    core::RetryPolicy clamped{0, -5ms};
    ASSERT_EQ(clamped.maxAttempts, 1, "at least one attempt");
    ASSERT_TRUE(clamped.backoff.count() == 0, "negative backoff clamped");
}

int main() {
    testOpenWriteClose();
    testProtocolViolation();
    testNotConnected();
    testWriteRecoversAfterTwoFailures();
    testWriteGivesUpAfterThreeFailures();
    testFailedReopenBacksOff();
    testReadRetries();
    testReplies();
    testSendHandlerRendersFrames();
    testRetryPolicy();

    if (g_failures) {
        galvo::logError("Tests failed: ", g_failures, " failure(s)\n");
        return 1;
    }
    galvo::logInfo("MockConnection tests passed.\n");
    return 0;
}

#include "galvo/lmc/CommandList.hpp"
#include "galvo/lmc/LmcCommand.hpp"
#include "galvo/lmc/LmcReply.hpp"
#include "galvo/log/Log.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <variant>

using namespace galvo::lmc;

static int g_failures = 0;

#define ASSERT_TRUE(cond, msg) \
    do { if (!(cond)) { galvo::logError("ASSERT TRUE FAILED: ", (msg), \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

#define ASSERT_EQ(a,b,msg) \
    do { auto _va=(a); auto _vb=(b); if (!((_va)==(_vb))) { galvo::logError("ASSERT EQ FAILED: ", (msg), \
        "  (", +_va, " != ", +_vb, ")" \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

static void testEncodeFrame() {
    const auto frame = encodeFrame(toWord(ListOpcode::MarkTo), {0x1234, 0x5678, 0, 200, 0});
    const std::array<std::uint8_t, 12> expected{0x05, 0x80, 0x34, 0x12, 0x78, 0x56,
                                                0x00, 0x00, 0xC8, 0x00, 0x00, 0x00};
    ASSERT_EQ(frame.size(), static_cast<std::size_t>(12), "frame size");
    for (std::size_t i = 0; i < expected.size(); ++i) {
        ASSERT_EQ(frame[i], expected[i], "frame byte");
    }

    const auto entry = decodeEntry(frame.data());
    ASSERT_EQ(entry.opcode, toWord(ListOpcode::MarkTo), "decoded opcode");
    ASSERT_EQ(entry.params[3], static_cast<std::uint16_t>(200), "decoded distance");
    ASSERT_TRUE(entry.describe() == "8005:1234:5678:0000:00c8:0000 listMarkTo", "describe entry");
}

static void testDecodeCommandBoundary() {
    auto list = decodeCommand(0x8000);
    ASSERT_TRUE(std::holds_alternative<ListCommand>(list), "0x8000 is a list command");

    auto immediate = decodeCommand(0x7FFF, {1, 2, 3, 4, 5});
    ASSERT_TRUE(std::holds_alternative<ImmediateCommand>(immediate), "0x7FFF is immediate");
    const auto& cmd = std::get<ImmediateCommand>(immediate);
    ASSERT_TRUE(cmd.expectsReply, "immediate commands expect a reply");
    ASSERT_EQ(cmd.params[4], static_cast<std::uint16_t>(5), "params kept");

    ASSERT_TRUE(std::holds_alternative<ImmediateCommand>(decodeCommand(toWord(Opcode::GetVersion))),
                "GetVersion is immediate");
}

static void testCommandListCapacity() {
    CommandList list;
    ASSERT_TRUE(list.empty(), "new list is empty");
    for (int i = 0; i < 256; ++i) {
        ASSERT_TRUE(list.append(toWord(ListOpcode::JumpTo), {static_cast<std::uint16_t>(i)}),
                    "append within capacity");
    }
    ASSERT_TRUE(list.full(), "256 entries fill the packet");
    ASSERT_TRUE(!list.append(toWord(ListOpcode::JumpTo)), "append past capacity refused");
    ASSERT_EQ(list.entryCount(), static_cast<std::size_t>(256), "entry count capped");
    ASSERT_EQ(list.size(), static_cast<std::size_t>(3072), "full packet size");
}

static void testCommandListPadding() {
    CommandList list;
    list.append(toWord(ListOpcode::MarkTo), {10, 20, 0, 5, 0});
    list.finish();
    ASSERT_TRUE(list.finished(), "finished flag");
    ASSERT_EQ(list.size(), static_cast<std::size_t>(3072), "padded to packet size");
    ASSERT_EQ(list.entryCount(), static_cast<std::size_t>(1), "padding is not counted");
    ASSERT_TRUE(!list.append(toWord(ListOpcode::MarkTo)), "sealed list refuses appends");

    const auto tail = decodeEntry(list.data() + list.size() - 12);
    ASSERT_EQ(tail.opcode, static_cast<std::uint16_t>(0x8002), "NOP opcode");
    ASSERT_TRUE(tail.params == CommandParams{}, "NOP params are zero");

    const std::string text = describeFrame(list.data(), list.size());
    ASSERT_TRUE(text.find("listMarkTo") != std::string::npos, "mark entry rendered");
    ASSERT_TRUE(text.find("... repeated 254 times ...") != std::string::npos,
                "padding collapsed");

    list.reset();
    ASSERT_TRUE(list.empty() && !list.finished(), "reset clears state");
    ASSERT_EQ(list.size(), static_cast<std::size_t>(0), "reset clears bytes");
}

static void testReplyDecode() {
    ReplyBytes raw{0x01, 0x00, 0x02, 0x00, 0x03, 0x00, 0x24, 0x00};
    const auto reply = LmcReply::decode(raw);
    ASSERT_EQ(reply.words[0], static_cast<std::uint16_t>(1), "word 0");
    ASSERT_EQ(reply.status(), static_cast<std::uint16_t>(0x24), "status word");
    ASSERT_TRUE(reply.isReady(), "ready bit");
    ASSERT_TRUE(reply.isBusy(), "busy bit");

    LmcReply idle;
    idle.words[3] = 0x20;
    ASSERT_TRUE(idle.isReady() && !idle.isBusy(), "idle status");
    const auto encoded = idle.encode();
    ASSERT_EQ(encoded[6], static_cast<std::uint8_t>(0x20), "status encoded low byte");
    ASSERT_TRUE(LmcReply::toHexLine(encoded.data(), encoded.size()) ==
                    "00:00:00:00:00:00:20:00",
                "hex line");
}

int main() {
    testEncodeFrame();
    testDecodeCommandBoundary();
    testCommandListCapacity();
    testCommandListPadding();
    testReplyDecode();

    if (g_failures) {
        galvo::logError("Tests failed: ", g_failures, " failure(s)\n");
        return 1;
    }
    galvo::logInfo("LMC command tests passed.\n");
    return 0;
}

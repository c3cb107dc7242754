#pragma once

#include "galvo/core/ByteBuffer.hpp"
#include "galvo/lmc/LmcConfig.hpp"
#include "galvo/lmc/Opcodes.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>

namespace galvo::lmc {

using CommandParams = std::array<std::uint16_t, 5>;
using CommandFrame = std::array<std::uint8_t, config::LMC_COMMAND_SIZE>;

/// A command sent on its own and (normally) answered with an 8-byte reply.
struct ImmediateCommand {
    std::uint16_t opcode = 0;
    CommandParams params{};
    bool expectsReply = true;
};

/// A command appended to the list packet; never answered individually.
struct ListCommand {
    std::uint16_t opcode = 0;
    CommandParams params{};
};

using Command = std::variant<ImmediateCommand, ListCommand>;

/**
 * @brief Classify a raw opcode at the 0x8000 boundary.
 *
 * Opcodes >= 0x8000 become ListCommand, everything else ImmediateCommand.
 */
Command decodeCommand(std::uint16_t opcode, const CommandParams& params = {});

/// Append the 12-byte little-endian encoding of one command.
void appendCommand(core::ByteBuffer& out, std::uint16_t opcode, const CommandParams& params);

CommandFrame encodeFrame(std::uint16_t opcode, const CommandParams& params);

/// One 12-byte entry read back from a frame.
struct CommandEntry {
    std::uint16_t opcode = 0;
    CommandParams params{};

    bool operator==(const CommandEntry& other) const {
        return opcode == other.opcode && params == other.params;
    }
    bool operator!=(const CommandEntry& other) const { return !(*this == other); }

    /// "8005:1234:5678:0000:00c8:0000 listMarkTo"
    std::string describe() const;
};

CommandEntry decodeEntry(const std::uint8_t* data);

/**
 * @brief Render a 12-byte or 3072-byte frame one entry per line.
 *
 * Consecutive identical list entries collapse into
 * "... repeated N times ...".
 */
std::string describeFrame(const std::uint8_t* data, std::size_t size);

} // namespace galvo::lmc

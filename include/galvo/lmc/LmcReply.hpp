#pragma once

#include "galvo/lmc/LmcConfig.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace galvo::lmc {

using ReplyBytes = std::array<std::uint8_t, config::LMC_REPLY_SIZE>;

/**
 * @brief The 8-byte answer to an immediate command, read as four u16 words.
 *
 * For GetVersion the fourth word is the board status; bit 0x20 means the
 * list engine is ready for a packet and bit 0x04 that it is still executing.
 */
struct LmcReply {
    std::array<std::uint16_t, 4> words{};

    std::uint16_t status() const { return words[3]; }
    bool isReady() const { return (status() & config::LMC_STATUS_READY) != 0; }
    bool isBusy() const { return (status() & config::LMC_STATUS_BUSY) != 0; }

    static LmcReply decode(const ReplyBytes& raw);
    ReplyBytes encode() const;

    std::string describe() const;
    static std::string toHexLine(const std::uint8_t* data, std::size_t size);
};

} // namespace galvo::lmc

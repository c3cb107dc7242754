#pragma once

#include "galvo/core/ByteBuffer.hpp"
#include "galvo/lmc/LmcCommand.hpp"
#include "galvo/lmc/LmcConfig.hpp"

#include <cstddef>
#include <cstdint>

namespace galvo::lmc {

/**
 * @brief Accumulates list commands into one fixed-size list packet.
 *
 * The packet holds at most 256 entries. `finish()` pads the remaining slots
 * with the no-op entry (listEndOfList with zero parameters) so the frame
 * handed to the transport is always exactly 3072 bytes.
 */
class CommandList {
public:
    CommandList();

    /// Append one entry. Returns false (and appends nothing) when full.
    bool append(std::uint16_t opcode, const CommandParams& params = {});

    std::size_t entryCount() const { return entries; }
    bool empty() const { return entries == 0; }
    bool full() const { return entries >= config::LMC_LIST_ENTRIES; }

    /// Pad to 3072 bytes. Further appends are refused until reset().
    void finish();
    bool finished() const { return sealed; }

    void reset();

    const std::uint8_t* data() const { return buffer.data(); }
    std::size_t size() const { return buffer.size(); }

    static const CommandFrame& noOpEntry();

private:
    core::ByteBuffer buffer;
    std::size_t entries = 0;
    bool sealed = false;
};

} // namespace galvo::lmc

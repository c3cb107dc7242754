#pragma once

#include "galvo/core/Expected.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace galvo::lmc {

/// One grid point of the lens correction table, in wire encoding.
struct CorrectionEntry {
    std::uint16_t dx = 0;
    std::uint16_t dy = 0;

    bool operator==(const CorrectionEntry& other) const {
        return dx == other.dx && dy == other.dy;
    }
};

/// 65 x 65 entries, row major, ready for WriteCorLine.
using CorrectionTable = std::vector<CorrectionEntry>;

/**
 * @brief Reader for EzCad-style .cor lens correction files.
 *
 * Two layouts exist. Files starting with the UTF-16LE label "LMC1COR_1.0"
 * carry a 0x1FA-byte header followed by pairs of doubles; older files carry
 * a 0xE-byte header followed by pairs of signed 32-bit integers. Either way
 * each value is rounded half to even, negatives are stored as `-v + 0x8000`,
 * and the result is masked to 16 bits.
 */
namespace correction {

/// Encode one signed offset the way the board expects it.
std::uint16_t encodeOffset(long long value);

bool hasFloatLabel(const std::uint8_t* data, std::size_t size);

expected<CorrectionTable> parse(const std::vector<std::uint8_t>& bytes);
expected<double> parseScale(const std::vector<std::uint8_t>& bytes);

expected<CorrectionTable> readFile(const std::string& path);

/// Galvo scale stored in the file header.
expected<double> readScale(const std::string& path);

} // namespace correction

} // namespace galvo::lmc

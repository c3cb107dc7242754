#include "galvo/lmc/CorrectionTable.hpp"

#include "galvo/lmc/LmcConfig.hpp"

#include <cmath>
#include <cstring>
#include <fstream>
#include <iterator>

namespace galvo::lmc::correction {

namespace {

constexpr std::size_t kLabelSize = 0x16;
constexpr std::size_t kFloatHeaderSize = 0x1FA;
constexpr std::size_t kIntHeaderSize = 0xE;
// Offsets of the scale value inside each header.
constexpr std::size_t kFloatScaleOffset = kLabelSize + 2 + 43 * sizeof(double);
constexpr std::size_t kIntScaleOffset = kLabelSize + 6;

constexpr char kFloatLabel[] = "LMC1COR_1.0";

double readDouble(const std::uint8_t* p) {
    // Files are little-endian, as is every host the board driver runs on.
    double value = 0.0;
    std::memcpy(&value, p, sizeof(value));
    return value;
}

std::int32_t readInt32(const std::uint8_t* p) {
    const std::uint32_t raw = static_cast<std::uint32_t>(p[0])
                            | (static_cast<std::uint32_t>(p[1]) << 8)
                            | (static_cast<std::uint32_t>(p[2]) << 16)
                            | (static_cast<std::uint32_t>(p[3]) << 24);
    std::int32_t value = 0;
    std::memcpy(&value, &raw, sizeof(value));
    return value;
}

std::error_code truncated() {
    return std::make_error_code(std::errc::illegal_byte_sequence);
}

expected<std::vector<std::uint8_t>> slurp(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return unexpected(std::make_error_code(std::errc::no_such_file_or_directory));
    }
    std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(in)),
                                    std::istreambuf_iterator<char>());
    if (in.bad()) {
        return unexpected(std::make_error_code(std::errc::io_error));
    }
    return bytes;
}

} // namespace

std::uint16_t encodeOffset(long long value) {
    const long long encoded = value >= 0 ? value : -value + 0x8000;
    return static_cast<std::uint16_t>(encoded & 0xFFFF);
}

bool hasFloatLabel(const std::uint8_t* data, std::size_t size) {
    if (size < kLabelSize) {
        return false;
    }
    for (std::size_t i = 0; i < kLabelSize / 2; ++i) {
        if (data[2 * i] != static_cast<std::uint8_t>(kFloatLabel[i]) || data[2 * i + 1] != 0) {
            return false;
        }
    }
    return true;
}

expected<CorrectionTable> parse(const std::vector<std::uint8_t>& bytes) {
    const bool floats = hasFloatLabel(bytes.data(), bytes.size());
    const std::size_t start = kLabelSize + (floats ? kFloatHeaderSize : kIntHeaderSize);
    const std::size_t valueSize = floats ? sizeof(double) : sizeof(std::int32_t);
    const std::size_t needed = start + config::LMC_COR_ENTRIES * 2 * valueSize;
    if (bytes.size() < needed) {
        return unexpected(truncated());
    }

    CorrectionTable table;
    table.reserve(config::LMC_COR_ENTRIES);
    const std::uint8_t* p = bytes.data() + start;
    for (std::size_t i = 0; i < config::LMC_COR_ENTRIES; ++i) {
        CorrectionEntry entry;
        if (floats) {
            entry.dx = encodeOffset(std::llrint(readDouble(p)));
            entry.dy = encodeOffset(std::llrint(readDouble(p + valueSize)));
        } else {
            entry.dx = encodeOffset(readInt32(p));
            entry.dy = encodeOffset(readInt32(p + valueSize));
        }
        table.push_back(entry);
        p += 2 * valueSize;
    }
    return table;
}

expected<double> parseScale(const std::vector<std::uint8_t>& bytes) {
    const std::size_t offset = hasFloatLabel(bytes.data(), bytes.size()) ? kFloatScaleOffset
                                                                         : kIntScaleOffset;
    if (bytes.size() < offset + sizeof(double)) {
        return unexpected(truncated());
    }
    return readDouble(bytes.data() + offset);
}

expected<CorrectionTable> readFile(const std::string& path) {
    return slurp(path).and_then(
        [](const std::vector<std::uint8_t>& bytes) { return parse(bytes); });
}

expected<double> readScale(const std::string& path) {
    return slurp(path).and_then(
        [](const std::vector<std::uint8_t>& bytes) { return parseScale(bytes); });
}

} // namespace galvo::lmc::correction

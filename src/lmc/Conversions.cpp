#include "galvo/lmc/Conversions.hpp"

#include "galvo/lmc/LmcConfig.hpp"

#include <algorithm>
#include <cmath>

namespace galvo::lmc::convert {

namespace {

std::uint16_t clamp16(double value) {
    if (!(value > 0.0)) {
        return 0;
    }
    if (value >= static_cast<double>(config::LMC_FIELD_MAX)) {
        return config::LMC_FIELD_MAX;
    }
    return static_cast<std::uint16_t>(value);
}

} // namespace

std::uint16_t speed(double mmPerSecond, double unitsPerMm) {
    return clamp16(std::nearbyint(mmPerSecond * unitsPerMm / 1000.0));
}

std::uint16_t frequency(double kilohertz) {
    if (!(kilohertz > 0.0)) {
        return 0;
    }
    const double period = std::nearbyint(20000.0 / kilohertz);
    // Periods past 32 bits only occur for sub-Hz requests; keep the low word anyway.
    const auto wide = static_cast<std::uint64_t>(std::min(period, 1.8e19));
    return static_cast<std::uint16_t>(wide & 0xFFFFu);
}

std::uint16_t power(double percent) {
    const double value = std::nearbyint(percent * 0xFFF / 100.0);
    return static_cast<std::uint16_t>(std::clamp(value, 0.0, static_cast<double>(0xFFF)));
}

std::uint16_t distance(double x0, double y0, double x1, double y1) {
    return clamp16(std::trunc(std::hypot(x1 - x0, y1 - y0)));
}

std::pair<std::uint16_t, std::uint16_t> delay(double value) {
    const std::uint16_t magnitude = clamp16(std::trunc(std::fabs(value)));
    const std::uint16_t sign = value > 0.0 ? 0x0000 : 0x8000;
    return {magnitude, sign};
}

std::uint16_t clampToField(double value) {
    return clamp16(std::round(value));
}

bool inField(double x, double y) {
    const double max = static_cast<double>(config::LMC_FIELD_MAX);
    return x >= 0.0 && x <= max && y >= 0.0 && y <= max;
}

} // namespace galvo::lmc::convert

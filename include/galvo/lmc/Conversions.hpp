#pragma once

#include <cstdint>
#include <utility>

namespace galvo::lmc::convert {

// Halfway values round to even (std::nearbyint in the default rounding mode).

/// mm/s to device units per ms: round(speed * unitsPerMm / 1000), clamped to 16 bits.
std::uint16_t speed(double mmPerSecond, double unitsPerMm);

/// kHz to Q-switch period: round(20000 / kHz) & 0xFFFF. Non-positive input yields 0.
std::uint16_t frequency(double kilohertz);

/// Percent to the 12-bit mark current: round(percent * 0xFFF / 100).
std::uint16_t power(double percent);

/// Truncated straight-line distance between two field points, clamped to 0xFFFF.
std::uint16_t distance(double x0, double y0, double x1, double y1);

/// Magnitude and sign word of a signed delay (0x0000 when > 0, else 0x8000).
std::pair<std::uint16_t, std::uint16_t> delay(double value);

/// Round and clamp a coordinate into [0, 0xFFFF].
std::uint16_t clampToField(double value);

/// True when both axes lie in [0, 0xFFFF].
bool inField(double x, double y);

} // namespace galvo::lmc::convert

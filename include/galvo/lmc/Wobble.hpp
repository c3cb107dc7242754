#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace galvo::lmc {

struct WobblePoint {
    double x = 0.0;
    double y = 0.0;
};

/// Receives one wobble point; returning false stops the walk.
using PointSink = std::function<bool(const WobblePoint&)>;

enum class WobbleType {
    Circle,
    Sinewave,
    Sawtooth,
    Jigsaw,
    Gear,
    Slowtooth
};

/// Parse a wobble algorithm name. Unknown names yield std::nullopt.
std::optional<WobbleType> wobbleTypeFromName(std::string_view name);
const char* wobbleTypeName(WobbleType type);

/**
 * @brief Perturbs mark segments into a wobbling path.
 *
 * Each segment is walked in steps of `interval` device units. The
 * fractional step left at the end of a segment, the travelled distance and
 * the step count carry over into the next segment, so a polyline wobbles
 * continuously across its vertices.
 *
 * Radius and interval are in device units; `speed` is the dimensionless
 * rate the chosen algorithm uses.
 */
class Wobble {
public:
    Wobble(double radius, double speed, double interval, WobbleType type = WobbleType::Circle);

    /**
     * @brief Feed the points replacing (x0,y0)->(x1,y1) to @p sink, one at a time.
     *
     * Points are not clamped. A step whose offset is not finite yields the
     * unperturbed point on the segment. Returns false if the sink stopped
     * the walk early; the carried state then ends at the last emitted step.
     */
    bool forEachPoint(double x0, double y0, double x1, double y1, const PointSink& sink);
    /// Collected form of forEachPoint().
    std::vector<WobblePoint> segment(double x0, double y0, double x1, double y1);

    void setRadius(double value) { radius = value; }
    void setSpeed(double value) { speed = value; }
    void setInterval(double value);
    void setType(WobbleType value) { type = value; }

    double getRadius() const { return radius; }
    double getSpeed() const { return speed; }
    double getInterval() const { return interval; }
    WobbleType getType() const { return type; }

    double totalDistance() const { return travelled; }
    long totalCount() const { return count; }

private:
    template <typename Offset>
    bool walk(double x0, double y0, double x1, double y1,
              const PointSink& sink, Offset&& offset);

    double radius;
    double speed;
    double interval;
    WobbleType type;

    double remainder = 0.0;
    double travelled = 0.0;
    long count = 0;
    std::optional<double> previousAngle{};
};

} // namespace galvo::lmc

#include "galvo/lmc/Wobble.hpp"

#include <cmath>

namespace galvo::lmc {

namespace {
constexpr double kTau = 6.283185307179586;
} // namespace

std::optional<WobbleType> wobbleTypeFromName(std::string_view name) {
    if (name == "circle") return WobbleType::Circle;
    if (name == "sinewave") return WobbleType::Sinewave;
    if (name == "sawtooth") return WobbleType::Sawtooth;
    if (name == "jigsaw") return WobbleType::Jigsaw;
    if (name == "gear") return WobbleType::Gear;
    if (name == "slowtooth") return WobbleType::Slowtooth;
    return std::nullopt;
}

const char* wobbleTypeName(WobbleType type) {
    switch (type) {
        case WobbleType::Circle: return "circle";
        case WobbleType::Sinewave: return "sinewave";
        case WobbleType::Sawtooth: return "sawtooth";
        case WobbleType::Jigsaw: return "jigsaw";
        case WobbleType::Gear: return "gear";
        case WobbleType::Slowtooth: return "slowtooth";
    }
    return "circle";
}

Wobble::Wobble(double radius_, double speed_, double interval_, WobbleType type_)
: radius(radius_)
, speed(speed_)
, interval(1.0)
, type(type_) {
    setInterval(interval_);
}

void Wobble::setInterval(double value) {
    // A zero step would never advance along the segment.
    interval = value > 0.0 ? value : 1.0;
}

template <typename Offset>
bool Wobble::walk(double x0, double y0, double x1, double y1,
                  const PointSink& sink, Offset&& offset) {
    const double length = std::hypot(x1 - x0, y1 - y0);
    const double steps = length / interval;
    double position = 1.0 - remainder;
    while (position <= steps) {
        const double amount = position / steps;
        const double tx = amount * (x1 - x0) + x0;
        const double ty = amount * (y1 - y0) + y0;
        travelled += interval;
        ++count;
        const WobblePoint d = offset();
        const bool finite = std::isfinite(d.x) && std::isfinite(d.y);
        const WobblePoint point = finite ? WobblePoint{tx + d.x, ty + d.y} : WobblePoint{tx, ty};
        if (!sink(point)) {
            remainder = 0.0;
            return false;
        }
        position += 1.0;
    }
    remainder = std::fmod(remainder + steps, 1.0);
    return true;
}

std::vector<WobblePoint> Wobble::segment(double x0, double y0, double x1, double y1) {
    std::vector<WobblePoint> out;
    forEachPoint(x0, y0, x1, y1, [&out](const WobblePoint& p) {
        out.push_back(p);
        return true;
    });
    return out;
}

bool Wobble::forEachPoint(double x0, double y0, double x1, double y1, const PointSink& sink) {
    const double heading = std::atan2(y1 - y0, x1 - x0);
    const double normal = heading + kTau / 4.0;
    const double r = radius;

    // Alternating +1/-1 across the normal, one flip per step.
    auto alternate = [this]() { return (count % 2) ? -1.0 : 1.0; };

    switch (type) {
        case WobbleType::Circle:
            return walk(x0, y0, x1, y1, sink, [&]() {
                const double t = travelled / (kTau * r);
                return WobblePoint{r * std::cos(t * speed), r * std::sin(t * speed)};
            });
        case WobbleType::Sinewave:
            return walk(x0, y0, x1, y1, sink, [&]() {
                const double d = std::sin(travelled / speed);
                return WobblePoint{r * d * std::cos(normal), r * d * std::sin(normal)};
            });
        case WobbleType::Sawtooth:
            return walk(x0, y0, x1, y1, sink, [&]() {
                const double d = alternate();
                return WobblePoint{r * d * std::cos(normal), r * d * std::sin(normal)};
            });
        case WobbleType::Jigsaw:
            return walk(x0, y0, x1, y1, sink, [&]() {
                const double wave = std::sin(travelled / speed);
                const double d = alternate();
                return WobblePoint{r * wave * std::cos(normal) + r * d * std::cos(heading),
                                   r * wave * std::sin(normal) + r * d * std::sin(heading)};
            });
        case WobbleType::Gear:
            return walk(x0, y0, x1, y1, sink, [&]() {
                const double d = ((count / 2) % 2) ? -1.0 : 1.0;
                return WobblePoint{r * d * std::cos(normal), r * d * std::sin(normal)};
            });
        case WobbleType::Slowtooth:
            return walk(x0, y0, x1, y1, sink, [&]() {
                if (!previousAngle) {
                    previousAngle = normal;
                }
                // Turn towards the new normal at 1/speed of the difference per step.
                const double angle = (normal - *previousAngle) / speed + *previousAngle;
                if (std::isfinite(angle)) {
                    previousAngle = angle;
                }
                const double d = alternate();
                return WobblePoint{r * d * std::cos(angle), r * d * std::sin(angle)};
            });
    }
    return true;
}

} // namespace galvo::lmc

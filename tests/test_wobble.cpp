#include "ControllerRig.hpp"

#include "galvo/lmc/Wobble.hpp"
#include "galvo/log/Log.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

using namespace galvo;
using namespace galvo::lmc;
using galvo::test::ControllerRig;

static int g_failures = 0;

#define ASSERT_TRUE(cond, msg) \
    do { if (!(cond)) { galvo::logError("ASSERT TRUE FAILED: ", (msg), \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

#define ASSERT_EQ(a,b,msg) \
    do { auto _va=(a); auto _vb=(b); if (!((_va)==(_vb))) { galvo::logError("ASSERT EQ FAILED: ", (msg), \
        "  (", +_va, " != ", +_vb, ")" \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

namespace {

bool near(double a, double b, double tolerance = 1e-6) {
    return std::fabs(a - b) <= tolerance;
}

} // namespace

static void testStepCount() {
    Wobble wobble(2.0, 50.0, 5.0);
    const auto points = wobble.segment(0.0, 0.0, 100.0, 0.0);
    ASSERT_EQ(points.size(), static_cast<std::size_t>(20), "one point per interval");
    ASSERT_EQ(wobble.totalCount(), 20L, "count");
    ASSERT_TRUE(near(wobble.totalDistance(), 100.0), "distance");

    Wobble idle(2.0, 50.0, 0.0);
    ASSERT_TRUE(near(idle.getInterval(), 1.0), "zero interval replaced");
}

static void testRemainderCarries() {
    Wobble wobble(1.0, 50.0, 3.0, WobbleType::Sawtooth);
    const auto first = wobble.segment(0.0, 0.0, 10.0, 0.0);
    ASSERT_EQ(first.size(), static_cast<std::size_t>(3), "three whole steps");
    const auto second = wobble.segment(10.0, 0.0, 20.0, 0.0);
    ASSERT_EQ(second.size(), static_cast<std::size_t>(3), "carried fraction");
    if (!second.empty()) {
        ASSERT_TRUE(near(second.front().x, 12.0), "first step completes the carried one");
    }
    ASSERT_EQ(wobble.totalCount(), 6L, "count carries");
    ASSERT_TRUE(near(wobble.totalDistance(), 18.0), "distance carries");
}

static void testSawtooth() {
    Wobble wobble(1.5, 50.0, 1.0, WobbleType::Sawtooth);
    const auto points = wobble.segment(0.0, 0.0, 10.0, 0.0);
    ASSERT_EQ(points.size(), static_cast<std::size_t>(10), "ten points");
    for (std::size_t i = 0; i < points.size(); ++i) {
        const double expectedY = (i % 2 == 0) ? -1.5 : 1.5;
        ASSERT_TRUE(near(points[i].y, expectedY), "alternates across the line");
        ASSERT_TRUE(near(points[i].x, static_cast<double>(i + 1)), "advances along the line");
    }
}

static void testCircleRadius() {
    Wobble wobble(3.0, 50.0, 2.0, WobbleType::Circle);
    const auto points = wobble.segment(0.0, 0.0, 20.0, 0.0);
    for (std::size_t i = 0; i < points.size(); ++i) {
        const double baseX = 2.0 * static_cast<double>(i + 1);
        const double r = std::hypot(points[i].x - baseX, points[i].y);
        ASSERT_TRUE(near(r, 3.0), "on the circle");
    }
}

static void testGearHoldsSide() {
    Wobble wobble(1.0, 50.0, 1.0, WobbleType::Gear);
    const auto points = wobble.segment(0.0, 0.0, 8.0, 0.0);
    ASSERT_EQ(points.size(), static_cast<std::size_t>(8), "eight points");
    if (points.size() == 8) {
        ASSERT_TRUE(near(points[1].y, points[2].y), "pairs share a side");
        ASSERT_TRUE(near(points[3].y, -points[1].y), "then switch");
    }
}

static void testNames() {
    for (const char* name : {"circle", "sinewave", "sawtooth", "jigsaw", "gear", "slowtooth"}) {
        const auto type = wobbleTypeFromName(name);
        ASSERT_TRUE(type.has_value(), "known name");
        ASSERT_TRUE(type && std::string(wobbleTypeName(*type)) == name, "name round trip");
    }
    ASSERT_TRUE(!wobbleTypeFromName("zigzag").has_value(), "unknown name");
}

static void testControllerWobble() {
    ControllerRig rig;
    ASSERT_TRUE(rig.connect(), "connect");
    rig.controller->programMode();

    OperationSettings settings;
    settings.wobbleEnabled = true;
    settings.wobbleType = "sawtooth";
    rig.controller->setWobble(settings);
    ASSERT_TRUE(rig.controller->wobble() != nullptr, "wobble configured");

    const double upm = rig.controller->config().unitsPerMm();
    const double startX = config::LMC_FIELD_CENTER;
    const double endX = startX + 20.0 * upm;
    const auto before = rig.controller->pendingEntries();
    ASSERT_TRUE(rig.controller->mark(endX, startX).has_value(), "wobbled mark");
    ASSERT_EQ(rig.controller->pendingEntries() - before, static_cast<std::size_t>(66),
              "20 mm in 0.3 mm steps");
    ASSERT_EQ(rig.controller->lastXY().x, static_cast<int>(endX), "ends at the destination");
    ASSERT_EQ(rig.controller->lastXY().y, static_cast<int>(config::LMC_FIELD_CENTER), "y");

    // Along the bottom edge half the sawtooth falls outside and is clamped.
    rig.controller->gotoXY(startX, 5.0);
    ASSERT_TRUE(rig.controller->mark(endX, 5.0).has_value(), "mark along the edge");
    rig.controller->rapidMode();

    const auto steps = rig.controller->wobble()->totalCount();
    ASSERT_EQ(rig.countList(ListOpcode::MarkTo), static_cast<std::size_t>(steps),
              "one entry per wobble step");
    bool clamped = false;
    for (const auto& entry : rig.listEntries()) {
        if (entry.opcode == toWord(ListOpcode::MarkTo) && entry.params[1] == 0) {
            clamped = true;
        }
    }
    ASSERT_TRUE(clamped, "points below the field clamped to 0");

    settings.wobbleRadius = 3.0;
    settings.wobbleInterval = 1.0;
    settings.wobbleType = "zigzag";
    rig.controller->setWobble(settings);
    const auto* wobble = rig.controller->wobble();
    ASSERT_TRUE(wobble && wobble->getType() == WobbleType::Circle, "unknown type falls back");
    ASSERT_TRUE(wobble && near(wobble->getRadius(), 3.0 * upm), "radius updated");
    ASSERT_TRUE(wobble && near(wobble->getInterval(), 0.3 * upm), "interval kept");

    settings.wobbleEnabled = false;
    rig.controller->setWobble(settings);
    ASSERT_TRUE(rig.controller->wobble() == nullptr, "disabled");
    rig.controller->setWobble(std::nullopt);
    ASSERT_TRUE(rig.controller->wobble() == nullptr, "no settings");
}

static void testDegenerateParameters() {
    Wobble flat(0.0, 50.0, 10.0, WobbleType::Circle);
    const auto circle = flat.segment(0.0, 0.0, 100.0, 0.0);
    ASSERT_EQ(circle.size(), static_cast<std::size_t>(10), "zero radius still steps");
    for (std::size_t i = 0; i < circle.size(); ++i) {
        ASSERT_TRUE(std::isfinite(circle[i].x) && std::isfinite(circle[i].y), "finite circle point");
        ASSERT_TRUE(near(circle[i].x, 10.0 * (i + 1)) && near(circle[i].y, 0.0),
                    "zero radius stays on the line");
    }

    for (auto type : {WobbleType::Sinewave, WobbleType::Jigsaw, WobbleType::Slowtooth}) {
        Wobble still(2.0, 0.0, 10.0, type);
        const auto points = still.segment(0.0, 0.0, 50.0, 0.0);
        ASSERT_EQ(points.size(), static_cast<std::size_t>(5), "zero speed still steps");
        for (const auto& p : points) {
            ASSERT_TRUE(std::isfinite(p.x) && std::isfinite(p.y), "zero speed gives finite points");
        }
    }
}

static void testPointsOnDemand() {
    Wobble collected(2.0, 50.0, 5.0, WobbleType::Sawtooth);
    Wobble streamed(2.0, 50.0, 5.0, WobbleType::Sawtooth);
    const auto points = collected.segment(0.0, 0.0, 100.0, 0.0);
    std::vector<WobblePoint> seen;
    const bool finished = streamed.forEachPoint(0.0, 0.0, 100.0, 0.0, [&](const WobblePoint& p) {
        seen.push_back(p);
        return true;
    });
    ASSERT_TRUE(finished, "walk ran to the end");
    ASSERT_EQ(seen.size(), points.size(), "same number of points");
    bool same = seen.size() == points.size();
    for (std::size_t i = 0; same && i < seen.size(); ++i) {
        same = near(seen[i].x, points[i].x) && near(seen[i].y, points[i].y);
    }
    ASSERT_TRUE(same, "same points either way");

    Wobble stopping(2.0, 50.0, 5.0, WobbleType::Sawtooth);
    int visited = 0;
    const bool stopped = !stopping.forEachPoint(0.0, 0.0, 1.0e6, 0.0, [&](const WobblePoint&) {
        return ++visited < 3;
    });
    ASSERT_TRUE(stopped, "sink stopped the walk");
    ASSERT_EQ(visited, 3, "no points after the sink says stop");
    ASSERT_EQ(stopping.totalCount(), 3L, "only visited steps counted");
}

static void testRejectedSettings() {
    ControllerRig rig;
    ASSERT_TRUE(rig.connect(), "connect");

    OperationSettings settings;
    settings.wobbleEnabled = true;

    settings.wobbleRadius = 0.0;
    rig.controller->setWobble(settings);
    ASSERT_TRUE(rig.controller->wobble() == nullptr, "zero radius refused");

    settings.wobbleRadius = 1.5;
    settings.wobbleInterval = 0.0;
    rig.controller->setWobble(settings);
    ASSERT_TRUE(rig.controller->wobble() == nullptr, "zero interval refused");

    settings.wobbleInterval = 0.3;
    settings.wobbleSpeed = std::numeric_limits<double>::quiet_NaN();
    rig.controller->setWobble(settings);
    ASSERT_TRUE(rig.controller->wobble() == nullptr, "NaN speed refused");

    settings.wobbleSpeed = 50.0;
    rig.controller->setWobble(settings);
    ASSERT_TRUE(rig.controller->wobble() != nullptr, "valid settings accepted");
    settings.wobbleSpeed = 0.0;
    rig.controller->setWobble(settings);
    ASSERT_TRUE(rig.controller->wobble() == nullptr, "zero speed drops an existing wobble");

    rig.controller->programMode();
    const auto before = rig.controller->pendingEntries();
    const double x = config::LMC_FIELD_CENTER + 1000.0;
    ASSERT_TRUE(rig.controller->mark(x, config::LMC_FIELD_CENTER).has_value(), "plain mark");
    ASSERT_EQ(rig.controller->pendingEntries() - before, static_cast<std::size_t>(1),
              "one straight mark");
    rig.controller->rapidMode();
    ASSERT_EQ(rig.countList(ListOpcode::MarkTo), static_cast<std::size_t>(1), "single MarkTo");
    for (const auto& entry : rig.listEntries()) {
        if (entry.opcode == toWord(ListOpcode::MarkTo)) {
            ASSERT_TRUE(entry.params[0] != 0 || entry.params[1] != 0, "no mark to the origin");
        }
    }
}

int main() {
    testStepCount();
    testRemainderCarries();
    testSawtooth();
    testCircleRadius();
    testGearHoldsSide();
    testNames();
    testControllerWobble();
    testDegenerateParameters();
    testPointsOnDemand();
    testRejectedSettings();

    if (g_failures) {
        galvo::logError("Tests failed: ", g_failures, " failure(s)\n");
        return 1;
    }
    galvo::logInfo("Wobble tests passed.\n");
    return 0;
}

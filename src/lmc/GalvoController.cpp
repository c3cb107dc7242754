/**
 * @brief LMC board driver: mode changes, list packets, cached parameters and motion.
 */
#include "galvo/lmc/GalvoController.hpp"

#include "galvo/core/GalvoError.hpp"
#include "galvo/lmc/Conversions.hpp"
#include "galvo/usb/MockConnection.hpp"
#include "galvo/usb/UsbConnection.hpp"

#include <cmath>
#include <cstdlib>
#include <functional>
#include <thread>
#include <type_traits>
#include <variant>

namespace galvo::lmc {

using galvo::expected;
using galvo::unexpected;
using core::RetryStep;

namespace {

expected<void> toVoid(const expected<LmcReply>& reply) {
    if (!reply) {
        return unexpected(reply.error());
    }
    return {};
}

std::error_code canceled() {
    return std::make_error_code(std::errc::operation_canceled);
}

} // namespace

const char* modeName(DriverMode mode) {
    switch (mode) {
        case DriverMode::Rapid: return "idle";
        case DriverMode::Light: return "light";
        case DriverMode::Program: return "program";
        case DriverMode::Raw: return "raw";
    }
    return "unknown";
}

GalvoController::GalvoController(DeviceConfig config, MotionSpeeds speeds, FieldPosition start)
: deviceConfig(std::move(config))
, motionSpeeds(speeds)
, usbChannel(std::make_shared<log::LogChannel>("usb"))
, lastPosition(start)
, jumpSpeedSetting(deviceConfig.defaultRapidSpeed) {}

GalvoController::~GalvoController() = default;

// -----------------------------------------------------------------------------
// Connection

void GalvoController::setConnectionFactory(ConnectionFactory factory) {
    connectionFactory = std::move(factory);
}

std::shared_ptr<usb::Connection> GalvoController::makeConnection() {
    if (connectionFactory) {
        return connectionFactory(deviceConfig, usbChannel);
    }
    if (deviceConfig.mock) {
        return std::make_shared<usb::MockConnection>(usbChannel, deviceConfig.transferPolicy);
    }
    return std::make_shared<usb::UsbConnection>(usbChannel, deviceConfig.transferPolicy);
}

bool GalvoController::connected() const {
    return transport && transport->isOpen(deviceConfig.machineIndex);
}

void GalvoController::abortConnect() {
    abortOpen = true;
    usbLog()("Connect Attempts Aborted");
}

void GalvoController::disconnect() {
    if (transport) {
        transport->close(deviceConfig.machineIndex);
    }
    transport.reset();
    // Manual reset: allow automatic connects again.
    connectDisabled = false;
    resetBoardState();
    boardSession = false;
}

void GalvoController::resetBoardState() {
    listNew();
    clearCache();
    paused = false;
    executing = false;
    packetCount = 0;
    if (driverMode != DriverMode::Raw) {
        driverMode = DriverMode::Rapid;
    }
}

void GalvoController::waitWhilePaused() {
    while (paused && !shuttingDown) {
        std::this_thread::sleep_for(config::LMC_PAUSE_INTERVAL);
    }
}

void GalvoController::shutdown() {
    shuttingDown = true;
}

expected<void> GalvoController::openAndInit() {
    auto opened = transport->open(deviceConfig.machineIndex);
    if (!opened) {
        return unexpected(opened.error());
    }
    return initLaser();
}

expected<void> GalvoController::connectIfNeeded() {
    if (connectDisabled) {
        abortConnect();
        transport.reset();
        logError("[GalvoController] LMC was unreachable. Explicit connect required.\n");
        return unexpected(make_error_code(GalvoError::DeviceUnavailable));
    }
    if (!transport) {
        transport = makeConnection();
        if (!transport) {
            logError("[GalvoController] connection factory returned no transport\n");
            return unexpected(make_error_code(GalvoError::DeviceUnavailable));
        }
    }
    if (connected()) {
        return {};
    }

    connecting = true;
    abortOpen = false;
    const bool reconnecting = boardSession;
    const int index = deviceConfig.machineIndex;
    const auto& policy = deviceConfig.connectPolicy;

    auto result = policy.run(
        [&](int) { return openAndInit(); },
        [&](const std::error_code& ec) {
            usbLog()("Connect attempt failed: ", ec.message());
            policy.sleep();
            if (shuttingDown || abortOpen) {
                return RetryStep::GiveUp;
            }
            if (transport->isOpen(index)) {
                transport->close(index);
            }
            return RetryStep::Backoff;
        },
        [&](const std::error_code& ec) -> expected<void> {
            if (transport->isOpen(index)) {
                transport->close(index);
            }
            connectDisabled = true;
            usbLog()("Could not connect to the LMC controller.");
            usbLog()("Automatic connections disabled.");
            logError("[GalvoController] connect failed after ", policy.maxAttempts,
                     " attempts: ", ec.message(), "\n");
            return unexpected(make_error_code(GalvoError::DeviceUnavailable));
        });

    connecting = false;
    if (result) {
        if (reconnecting) {
            // The board was lost and reinitialised: no list, no parameters, Rapid.
            resetBoardState();
        }
        boardSession = true;
    }
    if (!result && (shuttingDown || abortOpen)) {
        abortOpen = false;
        return unexpected(canceled());
    }
    abortOpen = false;
    return result;
}

expected<LmcReply> GalvoController::send(const std::uint8_t* data, std::size_t size, bool read) {
    if (shuttingDown) {
        return unexpected(canceled());
    }
    if (auto ready = connectIfNeeded(); !ready) {
        return unexpected(ready.error());
    }
    const int index = deviceConfig.machineIndex;
    if (auto written = transport->write(index, data, size); !written) {
        return unexpected(written.error());
    }
    if (!read) {
        return LmcReply{};
    }
    auto raw = transport->read(index);
    if (!raw) {
        return unexpected(raw.error());
    }
    return LmcReply::decode(*raw);
}

expected<LmcReply> GalvoController::command(std::uint16_t opcode, const CommandParams& params,
                                            bool read) {
    const auto frame = encodeFrame(opcode, params);
    return send(frame.data(), frame.size(), read);
}

expected<LmcReply> GalvoController::command(Opcode opcode, std::uint16_t v1, std::uint16_t v2,
                                            std::uint16_t v3, std::uint16_t v4,
                                            std::uint16_t v5) {
    return command(toWord(opcode), CommandParams{v1, v2, v3, v4, v5}, true);
}

// -----------------------------------------------------------------------------
// Modes

DriverState GalvoController::state() const {
    if (driverMode == DriverMode::Rapid) {
        return {"idle", "idle"};
    }
    if (paused) {
        return {"hold", "paused"};
    }
    return {"busy", modeName(driverMode)};
}

void GalvoController::rawMode() {
    driverMode = DriverMode::Raw;
}

expected<void> GalvoController::rapidMode() {
    if (driverMode == DriverMode::Rapid) {
        return {};
    }
    // At least one end-of-list so the final packet is never empty.
    if (auto r = listEndOfList(); !r) return r;
    if (auto r = listEnd(); !r) return r;
    if (!executing && packetCount > 0) {
        // Packets were sent but the board was never told to run them.
        if (auto r = executeList(); !r) return unexpected(r.error());
    }
    executing = false;
    packetCount = 0;

    if (auto r = waitIdle(); !r) return r;
    if (auto r = setFiberMo(0); !r) return unexpected(r.error());
    portOff(0);
    if (auto r = writePort(); !r) return unexpected(r.error());

    auto markTime = getMarkTime();
    if (!markTime) {
        return unexpected(markTime.error());
    }
    usbLog()("Time taken for list execution: ", markTime->describe());
    driverMode = DriverMode::Rapid;
    return {};
}

expected<void> GalvoController::programMode() {
    if (driverMode == DriverMode::Program) {
        return {};
    }
    if (driverMode == DriverMode::Light) {
        driverMode = DriverMode::Program;
        lightOff();
        portOn(0);
        if (auto r = writePort(); !r) return unexpected(r.error());
        return toVoid(setFiberMo(1));
    }

    if (auto r = resetList(); !r) return unexpected(r.error());
    portOn(0);
    if (auto r = writePort(); !r) return unexpected(r.error());
    if (auto r = setFiberMo(1); !r) return unexpected(r.error());
    driverMode = DriverMode::Program;
    clearCache();
    if (auto r = listReady(); !r) return r;
    if (deviceConfig.delayOpenMo != 0.0) {
        const auto ticks = static_cast<int>(deviceConfig.delayOpenMo * 100.0);
        if (auto r = listDelayTime(ticks); !r) return r;
    }
    if (auto r = listWritePort(); !r) return r;
    return listJumpSpeed(jumpSpeedSetting);
}

expected<void> GalvoController::lightMode() {
    if (driverMode == DriverMode::Light) {
        return {};
    }
    if (driverMode == DriverMode::Program) {
        if (auto r = setFiberMo(0); !r) return unexpected(r.error());
        portOff(0);
        portOn(deviceConfig.lightPin);
        if (auto r = writePort(); !r) return unexpected(r.error());
    } else {
        clearCache();
        if (auto r = resetList(); !r) return unexpected(r.error());
        if (auto r = listReady(); !r) return r;
        portOff(0);
        portOn(deviceConfig.lightPin);
        if (auto r = listWritePort(); !r) return r;
    }
    driverMode = DriverMode::Light;
    return {};
}

// -----------------------------------------------------------------------------
// List packets

void GalvoController::listNew() {
    activeList.reset();
}

expected<void> GalvoController::listEnd() {
    if (activeList.empty()) {
        return {};
    }
    if (auto r = waitReady(); !r) return r;
    waitWhilePaused();
    if (activeList.empty()) {
        // Dropped by a reconnect while waiting.
        return {};
    }

    activeList.finish();
    auto sent = send(activeList.data(), activeList.size(), false);
    listNew();
    if (!sent) {
        logError("[GalvoController] list packet dropped: ", sent.error().message(), "\n");
        return unexpected(sent.error());
    }
    if (driverMode != DriverMode::Raw) {
        if (auto r = setEndOfList(0); !r) return unexpected(r.error());
    }
    ++packetCount;

    if (packetCount > 2 && !executing) {
        if (driverMode != DriverMode::Raw) {
            if (auto r = executeList(); !r) return unexpected(r.error());
        }
        executing = true;
    }
    return {};
}

expected<void> GalvoController::listWrite(std::uint16_t opcode, const CommandParams& params) {
    if (activeList.full() || activeList.finished()) {
        // A previous flush failed before sending; try again first.
        if (auto r = listEnd(); !r) return r;
    }
    activeList.append(opcode, params);
    if (activeList.full()) {
        return listEnd();
    }
    return {};
}

expected<void> GalvoController::listWrite(ListOpcode opcode, std::uint16_t v1, std::uint16_t v2,
                                          std::uint16_t v3, std::uint16_t v4,
                                          std::uint16_t v5) {
    return listWrite(toWord(opcode), CommandParams{v1, v2, v3, v4, v5});
}

expected<void> GalvoController::rawWrite(const Command& cmd) {
    return std::visit(
        [this](const auto& c) -> expected<void> {
            using T = std::decay_t<decltype(c)>;
            if constexpr (std::is_same_v<T, ListCommand>) {
                return listWrite(c.opcode, c.params);
            } else {
                return toVoid(command(c.opcode, c.params, c.expectsReply));
            }
        },
        cmd);
}

expected<void> GalvoController::rawWrite(std::uint16_t opcode, const CommandParams& params) {
    return rawWrite(decodeCommand(opcode, params));
}

void GalvoController::rawClear() {
    listNew();
}

// -----------------------------------------------------------------------------
// Job settings

expected<void> GalvoController::setSettings(const OperationSettings& settings) {
    if (deviceConfig.pulseWidthEnabled) {
        const int width = settings.pulseWidthEnabled
                              ? settings.pulseWidth.value_or(deviceConfig.defaultPulseWidth)
                              : deviceConfig.defaultPulseWidth;
        if (auto r = listFiberYlpmPulseWidth(width); !r) return r;
    }

    jumpSpeedSetting = settings.rapidEnabled
                           ? settings.rapidSpeed.value_or(deviceConfig.defaultRapidSpeed)
                           : deviceConfig.defaultRapidSpeed;
    if (auto r = listJumpSpeed(jumpSpeedSetting); !r) return r;

    if (auto r = power(settings.power.value_or(deviceConfig.defaultPowerPercent)); !r) return r;
    if (auto r = frequency(settings.frequency.value_or(deviceConfig.defaultFrequencyKhz)); !r) {
        return r;
    }
    if (auto r = listMarkSpeed(settings.speed.value_or(deviceConfig.defaultSpeed)); !r) return r;

    double on = deviceConfig.delayLaserOn;
    double off = deviceConfig.delayLaserOff;
    double polygon = deviceConfig.delayPolygon;
    if (settings.timingEnabled) {
        on = settings.delayLaserOn.value_or(on);
        off = settings.delayLaserOff.value_or(off);
        polygon = settings.delayPolygon.value_or(polygon);
    }
    if (auto r = listLaserOnDelay(on); !r) return r;
    if (auto r = listLaserOffDelay(off); !r) return r;
    return listPolygonDelay(polygon);
}

void GalvoController::setWobble(const std::optional<OperationSettings>& settings) {
    if (!settings || !settings->wobbleEnabled) {
        wobbler.reset();
        return;
    }
    const double unitsPerMm = deviceConfig.unitsPerMm();
    const double radius = settings->wobbleRadius * unitsPerMm;
    const double interval = settings->wobbleInterval * unitsPerMm;
    const double speed = settings->wobbleSpeed;

    auto usable = [](double v) { return std::isfinite(v) && v > 0.0; };
    if (!usable(radius) || !usable(interval) || !usable(speed)) {
        usbLog()("Wobble disabled: radius, speed and interval must be positive (radius ",
                 settings->wobbleRadius, ", speed ", speed, ", interval ",
                 settings->wobbleInterval, ").");
        wobbler.reset();
        return;
    }

    auto type = wobbleTypeFromName(settings->wobbleType);
    if (!type) {
        usbLog()("Unknown wobble type '", settings->wobbleType, "', using circle.");
        type = WobbleType::Circle;
    }

    if (!wobbler) {
        wobbler = std::make_unique<Wobble>(radius, speed, interval, *type);
        return;
    }
    wobbler->setType(*type);
    wobbler->setRadius(radius);
    wobbler->setSpeed(speed);
}

// -----------------------------------------------------------------------------
// Motion

expected<void> GalvoController::mark(double x, double y) {
    if (x == lastPosition.x && y == lastPosition.y) {
        return {};
    }
    if (!convert::inField(x, y)) {
        return {};
    }
    if (motionSpeeds.mark) {
        if (auto r = listMarkSpeed(*motionSpeeds.mark); !r) return r;
    }
    if (!wobbler) {
        return listMark(x, y);
    }

    expected<void> sent;
    wobbler->forEachPoint(lastPosition.x, lastPosition.y, x, y, [&](const WobblePoint& point) {
        if (!std::isfinite(point.x) || !std::isfinite(point.y)) {
            return true;
        }
        sent = listMark(convert::clampToField(point.x), convert::clampToField(point.y));
        return sent.has_value();
    });
    if (!sent) {
        return sent;
    }
    lastPosition = {static_cast<int>(x), static_cast<int>(y)};
    return {};
}

expected<void> GalvoController::gotoXY(double x, double y, const JumpDelays& delays) {
    if (x == lastPosition.x && y == lastPosition.y) {
        return {};
    }
    if (!convert::inField(x, y)) {
        return {};
    }
    if (motionSpeeds.gotoSpeed) {
        if (auto r = listJumpSpeed(*motionSpeeds.gotoSpeed); !r) return r;
    }
    return listJump(x, y, delays);
}

expected<void> GalvoController::light(double x, double y, const JumpDelays& delays) {
    if (x == lastPosition.x && y == lastPosition.y) {
        return {};
    }
    if (!convert::inField(x, y)) {
        return {};
    }
    if (lightOn()) {
        if (auto r = listWritePort(); !r) return r;
    }
    if (motionSpeeds.light) {
        if (auto r = listJumpSpeed(*motionSpeeds.light); !r) return r;
    }
    return listJump(x, y, delays);
}

expected<void> GalvoController::dark(double x, double y, const JumpDelays& delays) {
    if (x == lastPosition.x && y == lastPosition.y) {
        return {};
    }
    if (!convert::inField(x, y)) {
        return {};
    }
    if (lightOff()) {
        if (auto r = listWritePort(); !r) return r;
    }
    if (motionSpeeds.dark) {
        if (auto r = listJumpSpeed(*motionSpeeds.dark); !r) return r;
    }
    return listJump(x, y, delays);
}

expected<LmcReply> GalvoController::setXY(double x, double y) {
    const auto cx = convert::clampToField(x);
    const auto cy = convert::clampToField(y);
    const auto distance = convert::distance(lastPosition.x, lastPosition.y, cx, cy);
    return gotoXYImmediate(cx, cy, 0, distance);
}

// -----------------------------------------------------------------------------
// Status and waits

expected<std::uint16_t> GalvoController::status() {
    auto version = getVersion();
    if (!version) {
        return unexpected(version.error());
    }
    return version->status();
}

expected<bool> GalvoController::isBusy() {
    return status().map([](std::uint16_t s) { return (s & config::LMC_STATUS_BUSY) != 0; });
}

expected<bool> GalvoController::isReady() {
    return status().map([](std::uint16_t s) { return (s & config::LMC_STATUS_READY) != 0; });
}

expected<bool> GalvoController::isReadyAndNotBusy() {
    if (driverMode == DriverMode::Raw) {
        return true;
    }
    return status().map([](std::uint16_t s) {
        return (s & config::LMC_STATUS_READY) != 0 && (s & config::LMC_STATUS_BUSY) == 0;
    });
}

expected<void> GalvoController::waitFinished() {
    if (driverMode == DriverMode::Raw) {
        return {};
    }
    while (!shuttingDown) {
        waitWhilePaused();
        if (shuttingDown) break;
        auto done = isReadyAndNotBusy();
        if (!done) return unexpected(done.error());
        if (*done) return {};
        std::this_thread::sleep_for(config::LMC_POLL_INTERVAL);
    }
    return {};
}

expected<void> GalvoController::waitReady() {
    if (driverMode == DriverMode::Raw) {
        return {};
    }
    while (!shuttingDown) {
        waitWhilePaused();
        if (shuttingDown) break;
        auto ready = isReady();
        if (!ready) return unexpected(ready.error());
        if (*ready) return {};
        std::this_thread::sleep_for(config::LMC_POLL_INTERVAL);
    }
    return {};
}

expected<void> GalvoController::waitIdle() {
    if (driverMode == DriverMode::Raw) {
        return {};
    }
    while (!shuttingDown) {
        waitWhilePaused();
        if (shuttingDown) break;
        auto busy = isBusy();
        if (!busy) return unexpected(busy.error());
        if (!*busy) return {};
        std::this_thread::sleep_for(config::LMC_POLL_INTERVAL);
    }
    return {};
}

expected<void> GalvoController::pause() {
    if (driverMode == DriverMode::Raw) {
        return {};
    }
    paused = true;
    return toVoid(stopList());
}

expected<void> GalvoController::resume() {
    if (driverMode == DriverMode::Raw) {
        return {};
    }
    auto restarted = restartList();
    paused = false;
    return toVoid(restarted);
}

expected<void> GalvoController::abort(bool dummyPacket) {
    if (driverMode == DriverMode::Raw) {
        return {};
    }
    if (auto r = stopExecute(); !r) return unexpected(r.error());
    if (auto r = setFiberMo(0); !r) return unexpected(r.error());
    if (auto r = resetList(); !r) return unexpected(r.error());
    if (dummyPacket) {
        listNew();
        if (auto r = listEndOfList(); !r) return r;
        if (auto r = listEnd(); !r) return r;
        if (!executing) {
            if (auto r = executeList(); !r) return unexpected(r.error());
        }
    }
    executing = false;
    packetCount = 0;
    clearCache();
    if (auto r = setFiberMo(0); !r) return unexpected(r.error());
    portOff(0);
    if (auto r = writePort(); !r) return unexpected(r.error());
    driverMode = DriverMode::Rapid;
    return {};
}

// -----------------------------------------------------------------------------
// Board initialisation

expected<void> GalvoController::initLaser() {
    if (driverMode == DriverMode::Raw) {
        return {};
    }
    const auto& c = deviceConfig;
    auto u16 = [](int v) { return static_cast<std::uint16_t>(v); };

    usbLog()("Initializing Laser");
    auto serial = getSerialNumber();
    if (!serial) return unexpected(serial.error());
    const auto serialBytes = serial->encode();
    usbLog()("Serial Number: ", LmcReply::toHexLine(serialBytes.data(), serialBytes.size()));
    auto version = getVersion();
    if (!version) return unexpected(version.error());
    usbLog()("Version: ", version->describe());

    if (auto r = reset(); !r) return unexpected(r.error());
    usbLog()("Reset");
    const std::optional<std::string> corFile =
        c.correctionEnabled ? c.correctionFile : std::optional<std::string>{};
    if (auto r = writeCorrectionFile(corFile); !r) return r;
    usbLog()("Correction File Sent");

    // Each step is one immediate command; stop at the first transport error.
    struct Step {
        std::function<expected<LmcReply>()> run;
        const char* label;
    };
    const Step steps[] = {
        {[&] { return enableLaser(); }, "Laser Enabled"},
        {[&] { return setControlMode(u16(c.controlMode)); }, "Control Mode"},
        {[&] { return setLaserMode(u16(c.laserMode)); }, "Laser Mode"},
        {[&] { return setDelayMode(u16(c.delayMode)); }, "Delay Mode"},
        {[&] { return setTiming(u16(c.timingMode)); }, "Timing Mode"},
        {[&] { return setStandby(u16(c.standbyParam1), u16(c.standbyParam2)); }, "Setting Standby"},
        {[&] { return setFirstPulseKiller(u16(c.firstPulseKiller)); }, "Set First Pulse Killer"},
        {[&] { return setPwmHalfPeriod(u16(c.pwmHalfPeriod)); }, "Set PWM Half-Period"},
        {[&] { return setPwmPulseWidth(u16(c.pwmPulseWidth)); }, "Set PWM pulse width"},
        {[&] { return setFiberMo(0); }, "Set Fiber Mo (Closed)"},
        {[&] { return setFpkParam2(u16(c.fpk2P1), u16(c.fpk2P2), u16(c.fpk2P3), u16(c.fpk2P4)); },
         "First Pulse Killer Parameters"},
        {[&] { return setFlyRes(u16(c.flyResP1), u16(c.flyResP2), u16(c.flyResP3), u16(c.flyResP4)); },
         "On-The-Fly Res"},
        {[&] { return enableZ(); }, "Z-Enabled"},
        {[&] { return writeAnalogPort1(0x7FF); }, "Analog Port 1"},
        {[&] { return enableZ(); }, "Z-Enabled-part2"},
    };
    for (const auto& step : steps) {
        if (auto r = step.run(); !r) {
            logError("[GalvoController] init failed at '", step.label, "': ",
                     r.error().message(), "\n");
            return unexpected(r.error());
        }
        usbLog()(step.label);
    }
    std::this_thread::sleep_for(config::LMC_INIT_SETTLE);
    usbLog()("Ready");
    return {};
}

// -----------------------------------------------------------------------------
// Cached parameters and port bits

expected<void> GalvoController::power(double percent) {
    if (cache.power == percent) {
        return {};
    }
    cache.power = percent;
    return listMarkCurrent(convert::power(percent));
}

expected<void> GalvoController::frequency(double kilohertz) {
    if (cache.frequency == kilohertz) {
        return {};
    }
    if (!(kilohertz > 0.0)) {
        logError("[GalvoController] frequency must be positive, got ", kilohertz, " kHz\n");
        return unexpected(std::make_error_code(std::errc::invalid_argument));
    }
    cache.frequency = kilohertz;
    return listQSwitchPeriod(convert::frequency(kilohertz));
}

bool GalvoController::lightOn() {
    if (isPort(deviceConfig.lightPin)) {
        return false;
    }
    portOn(deviceConfig.lightPin);
    return true;
}

bool GalvoController::lightOff() {
    if (!isPort(deviceConfig.lightPin)) {
        return false;
    }
    portOff(deviceConfig.lightPin);
    return true;
}

bool GalvoController::isPort(int bit) const {
    return ((1u << bit) & port) != 0;
}

void GalvoController::portOn(int bit) {
    port |= (1u << bit);
}

void GalvoController::portOff(int bit) {
    port &= ~(1u << bit);
}

void GalvoController::portSet(std::uint32_t mask, std::uint32_t values) {
    port &= ~mask;
    port |= values & mask;
}

std::uint16_t GalvoController::convertSpeed(double mmPerSecond) const {
    return convert::speed(mmPerSecond, deviceConfig.unitsPerMm());
}

// -----------------------------------------------------------------------------
// Correction tables

expected<void> GalvoController::writeCorrectionFile(const std::optional<std::string>& path) {
    if (!path) {
        return writeBlankCorrection();
    }
    auto table = correction::readFile(*path);
    if (!table) {
        usbLog()("Correction file ", *path, " unusable (", table.error().message(),
                 "), sending blank table.");
        return writeBlankCorrection();
    }
    return writeCorrectionTable(*table);
}

expected<void> GalvoController::writeCorrectionTable(const CorrectionTable& table) {
    if (auto r = writeCorTable(true); !r) return unexpected(r.error());
    bool first = true;
    for (const auto& entry : table) {
        if (auto r = writeCorLine(entry.dx, entry.dy, first ? 0 : 1); !r) return r;
        first = false;
    }
    return {};
}

expected<void> GalvoController::writeBlankCorrection() {
    return toVoid(writeCorTable(false));
}

// -----------------------------------------------------------------------------
// List commands

expected<void> GalvoController::listJump(double x, double y, const JumpDelays& delays) {
    const double length = std::hypot(x - lastPosition.x, y - lastPosition.y);
    const auto distance = convert::distance(lastPosition.x, lastPosition.y, x, y);
    std::optional<double> delay = delays.shortDelay;
    if (delays.distanceLimit && *delays.distanceLimit != 0.0 &&
        std::trunc(length) > *delays.distanceLimit) {
        delay = delays.longDelay;
    }
    if (delay && *delay != 0.0) {
        if (auto r = listJumpDelay(*delay); !r) return r;
    }
    const int ix = static_cast<int>(x);
    const int iy = static_cast<int>(y);
    if (auto r = listWrite(ListOpcode::JumpTo, static_cast<std::uint16_t>(ix),
                           static_cast<std::uint16_t>(iy), 0, distance);
        !r) {
        return r;
    }
    lastPosition = {ix, iy};
    return {};
}

expected<void> GalvoController::listEndOfList() {
    return listWrite(ListOpcode::EndOfList);
}

expected<void> GalvoController::listLaserOnPoint(std::uint16_t dwellTime) {
    return listWrite(ListOpcode::LaserOnPoint, dwellTime);
}

expected<void> GalvoController::listDelayTime(int time) {
    return listWrite(ListOpcode::DelayTime, static_cast<std::uint16_t>(std::abs(time)));
}

expected<void> GalvoController::listMark(double x, double y, std::uint16_t angle) {
    const auto distance = convert::distance(lastPosition.x, lastPosition.y, x, y);
    const int ix = static_cast<int>(x);
    const int iy = static_cast<int>(y);
    if (auto r = listWrite(ListOpcode::MarkTo, static_cast<std::uint16_t>(ix),
                           static_cast<std::uint16_t>(iy), angle, distance);
        !r) {
        return r;
    }
    lastPosition = {ix, iy};
    return {};
}

expected<void> GalvoController::listJumpSpeed(double speed) {
    if (cache.jumpSpeed == speed) {
        return {};
    }
    cache.jumpSpeed = speed;
    return listWrite(ListOpcode::JumpSpeed, convertSpeed(speed));
}

expected<void> GalvoController::listLaserOnDelay(double delay) {
    if (cache.laserOnDelay == delay) {
        return {};
    }
    cache.laserOnDelay = delay;
    const auto [magnitude, sign] = convert::delay(delay);
    return listWrite(ListOpcode::LaserOnDelay, magnitude, sign);
}

expected<void> GalvoController::listLaserOffDelay(double delay) {
    if (cache.laserOffDelay == delay) {
        return {};
    }
    cache.laserOffDelay = delay;
    const auto [magnitude, sign] = convert::delay(delay);
    return listWrite(ListOpcode::LaserOffDelay, magnitude, sign);
}

expected<void> GalvoController::listMarkPowerRatio(std::uint16_t ratio) {
    return listWrite(ListOpcode::MarkPowerRatio, ratio);
}

expected<void> GalvoController::listMarkSpeed(double speed) {
    if (cache.markSpeed == speed) {
        return {};
    }
    cache.markSpeed = speed;
    return listWrite(ListOpcode::MarkSpeed, convertSpeed(speed));
}

expected<void> GalvoController::listJumpDelay(double delay) {
    if (cache.jumpDelay == delay) {
        return {};
    }
    cache.jumpDelay = delay;
    const auto [magnitude, sign] = convert::delay(delay);
    return listWrite(ListOpcode::JumpDelay, magnitude, sign);
}

expected<void> GalvoController::listPolygonDelay(double delay) {
    if (cache.polygonDelay == delay) {
        return {};
    }
    cache.polygonDelay = delay;
    const auto [magnitude, sign] = convert::delay(delay);
    return listWrite(ListOpcode::PolygonDelay, magnitude, sign);
}

expected<void> GalvoController::listWritePort() {
    return listWrite(ListOpcode::WritePort, static_cast<std::uint16_t>(port & 0xFFFFu));
}

expected<void> GalvoController::listMarkCurrent(std::uint16_t current) {
    return listWrite(ListOpcode::MarkCurrent, current);
}

expected<void> GalvoController::listFlyEnable(std::uint16_t enabled) {
    return listWrite(ListOpcode::FlyEnable, enabled);
}

expected<void> GalvoController::listQSwitchPeriod(std::uint16_t period) {
    return listWrite(ListOpcode::QSwitchPeriod, period);
}

expected<void> GalvoController::listFlyDelay(double delay) {
    const auto [magnitude, sign] = convert::delay(delay);
    return listWrite(ListOpcode::FlyDelay, magnitude, sign);
}

expected<void> GalvoController::listSetCo2Fpk() {
    return listWrite(ListOpcode::SetCo2FPK);
}

expected<void> GalvoController::listFlyWaitInput() {
    return listWrite(ListOpcode::FlyWaitInput);
}

expected<void> GalvoController::listFiberOpenMo(std::uint16_t open) {
    return listWrite(ListOpcode::FiberOpenMO, open);
}

expected<void> GalvoController::listWaitForInput(std::uint16_t mask, std::uint16_t level) {
    return listWrite(ListOpcode::WaitForInput, mask, level);
}

expected<void> GalvoController::listChangeMarkCount(std::uint16_t count) {
    return listWrite(ListOpcode::ChangeMarkCount, count);
}

expected<void> GalvoController::listSetWeldPowerWave(std::uint16_t wave) {
    return listWrite(ListOpcode::SetWeldPowerWave, wave);
}

expected<void> GalvoController::listEnableWeldPowerWave(std::uint16_t enabled) {
    return listWrite(ListOpcode::EnableWeldPowerWave, enabled);
}

expected<void> GalvoController::listFiberYlpmPulseWidth(int pulseWidth) {
    if (cache.pulseWidth == pulseWidth) {
        return {};
    }
    cache.pulseWidth = pulseWidth;
    return listWrite(ListOpcode::FiberYLPMPulseWidth, static_cast<std::uint16_t>(pulseWidth));
}

expected<void> GalvoController::listFlyEncoderCount(std::uint16_t count) {
    return listWrite(ListOpcode::FlyEncoderCount, count);
}

expected<void> GalvoController::listSetDaZWord(std::uint16_t word) {
    return listWrite(ListOpcode::SetDaZWord, word);
}

expected<void> GalvoController::listJptSetParam(std::uint16_t param) {
    return listWrite(ListOpcode::JptSetParam, param);
}

expected<void> GalvoController::listReady() {
    return listWrite(ListOpcode::ReadyMark);
}

// -----------------------------------------------------------------------------
// Immediate commands

expected<LmcReply> GalvoController::disableLaser() { return command(Opcode::DisableLaser); }
expected<LmcReply> GalvoController::enableLaser() { return command(Opcode::EnableLaser); }
expected<LmcReply> GalvoController::executeList() { return command(Opcode::ExecuteList); }

expected<LmcReply> GalvoController::setPwmPulseWidth(std::uint16_t width) {
    return command(Opcode::SetPwmPulseWidth, width);
}

expected<LmcReply> GalvoController::getVersion() { return command(Opcode::GetVersion); }
expected<LmcReply> GalvoController::getSerialNumber() { return command(Opcode::GetSerialNo); }
expected<LmcReply> GalvoController::getListStatus() { return command(Opcode::GetListStatus); }
expected<LmcReply> GalvoController::getPositionXY() { return command(Opcode::GetPositionXY); }

expected<LmcReply> GalvoController::gotoXYImmediate(double x, double y, std::uint16_t angle,
                                                    std::uint16_t distance) {
    lastPosition = {static_cast<int>(x), static_cast<int>(y)};
    return command(Opcode::GotoXY, static_cast<std::uint16_t>(lastPosition.x),
                   static_cast<std::uint16_t>(lastPosition.y), angle, distance);
}

expected<LmcReply> GalvoController::laserSignalOff() { return command(Opcode::LaserSignalOff); }
expected<LmcReply> GalvoController::laserSignalOn() { return command(Opcode::LaserSignalOn); }

expected<void> GalvoController::writeCorLine(std::uint16_t dx, std::uint16_t dy,
                                             std::uint16_t nonFirst) {
    return toVoid(command(toWord(Opcode::WriteCorLine), CommandParams{dx, dy, nonFirst, 0, 0},
                          false));
}

expected<LmcReply> GalvoController::resetList() { return command(Opcode::ResetList); }
expected<LmcReply> GalvoController::restartList() { return command(Opcode::RestartList); }

expected<LmcReply> GalvoController::writeCorTable(bool table) {
    return command(Opcode::WriteCorTable, table ? 1 : 0);
}

expected<LmcReply> GalvoController::setControlMode(std::uint16_t mode) {
    return command(Opcode::SetControlMode, mode);
}

expected<LmcReply> GalvoController::setDelayMode(std::uint16_t mode) {
    return command(Opcode::SetDelayMode, mode);
}

expected<LmcReply> GalvoController::setMaxPolyDelay(double delay) {
    const auto [magnitude, sign] = convert::delay(delay);
    return command(Opcode::SetMaxPolyDelay, magnitude, sign);
}

expected<LmcReply> GalvoController::setEndOfList(std::uint16_t end) {
    return command(Opcode::SetEndOfList, end);
}

expected<LmcReply> GalvoController::setFirstPulseKiller(std::uint16_t fpk) {
    return command(Opcode::SetFirstPulseKiller, fpk);
}

expected<LmcReply> GalvoController::setLaserMode(std::uint16_t mode) {
    return command(Opcode::SetLaserMode, mode);
}

expected<LmcReply> GalvoController::setTiming(std::uint16_t timing) {
    return command(Opcode::SetTiming, timing);
}

expected<LmcReply> GalvoController::setStandby(std::uint16_t standby1, std::uint16_t standby2) {
    return command(Opcode::SetStandby, standby1, standby2);
}

expected<LmcReply> GalvoController::setPwmHalfPeriod(std::uint16_t halfPeriod) {
    return command(Opcode::SetPwmHalfPeriod, halfPeriod);
}

expected<LmcReply> GalvoController::stopExecute() { return command(Opcode::StopExecute); }
expected<LmcReply> GalvoController::stopList() { return command(Opcode::StopList); }

expected<LmcReply> GalvoController::writePort() {
    return command(Opcode::WritePort, static_cast<std::uint16_t>(port & 0xFFFFu));
}

expected<LmcReply> GalvoController::writeAnalogPort1(std::uint16_t value) {
    return command(Opcode::WriteAnalogPort1, value);
}

expected<LmcReply> GalvoController::writeAnalogPort2(std::uint16_t value) {
    return command(Opcode::WriteAnalogPort2, value);
}

expected<LmcReply> GalvoController::writeAnalogPortX(std::uint16_t value) {
    return command(Opcode::WriteAnalogPortX, value);
}

expected<LmcReply> GalvoController::readPort() { return command(Opcode::ReadPort); }

expected<LmcReply> GalvoController::setAxisMotionParam(std::uint16_t param) {
    return command(Opcode::SetAxisMotionParam, param);
}

expected<LmcReply> GalvoController::setAxisOriginParam(std::uint16_t param) {
    return command(Opcode::SetAxisOriginParam, param);
}

expected<LmcReply> GalvoController::axisGoOrigin() { return command(Opcode::AxisGoOrigin); }

expected<LmcReply> GalvoController::moveAxisTo(int /*target*/) {
    return command(Opcode::MoveAxisTo);
}

expected<LmcReply> GalvoController::getAxisPos() { return command(Opcode::GetAxisPos); }
expected<LmcReply> GalvoController::getFlyWaitCount() { return command(Opcode::GetFlyWaitCount); }
expected<LmcReply> GalvoController::getMarkCount() { return command(Opcode::GetMarkCount); }

expected<LmcReply> GalvoController::setFpkParam2(std::uint16_t p1, std::uint16_t p2,
                                                 std::uint16_t p3, std::uint16_t p4) {
    return command(Opcode::SetFpkParam2, p1, p2, p3, p4);
}

expected<LmcReply> GalvoController::setFiberMo(std::uint16_t mo) {
    return command(Opcode::FiberSetMo, mo);
}

expected<LmcReply> GalvoController::getFiberStMoAp() { return command(Opcode::FiberGetStMO_AP); }
expected<LmcReply> GalvoController::enableZ() { return command(Opcode::EnableZ); }
expected<LmcReply> GalvoController::disableZ() { return command(Opcode::DisableZ); }

expected<LmcReply> GalvoController::setZData(std::uint16_t data) {
    return command(Opcode::SetZData, data);
}

expected<LmcReply> GalvoController::setSpiSimmerCurrent(std::uint16_t current) {
    return command(Opcode::SetSPISimmerCurrent, current);
}

expected<LmcReply> GalvoController::setFpkParam(std::uint16_t param) {
    return command(Opcode::SetFpkParam, param);
}

expected<LmcReply> GalvoController::reset() { return command(Opcode::Reset); }
expected<LmcReply> GalvoController::getFlySpeed() { return command(Opcode::GetFlySpeed); }
expected<LmcReply> GalvoController::fiberPulseWidth() { return command(Opcode::FiberPulseWidth); }

expected<LmcReply> GalvoController::getFiberConfigExtend() {
    return command(Opcode::FiberGetConfigExtend);
}

expected<LmcReply> GalvoController::inputPort(std::uint16_t value) {
    return command(Opcode::InputPort, value);
}

expected<LmcReply> GalvoController::clearLockInputPort() { return inputPort(0x04); }
expected<LmcReply> GalvoController::enableLockInputPort() { return inputPort(0x02); }
expected<LmcReply> GalvoController::disableLockInputPort() { return inputPort(0x01); }
expected<LmcReply> GalvoController::getInputPort() { return command(Opcode::InputPort); }
expected<LmcReply> GalvoController::getMarkTime() { return command(Opcode::GetMarkTime, 3); }
expected<LmcReply> GalvoController::getUserData() { return command(Opcode::GetUserData); }

expected<LmcReply> GalvoController::setFlyRes(std::uint16_t p1, std::uint16_t p2,
                                              std::uint16_t p3, std::uint16_t p4) {
    return command(Opcode::SetFlyRes, p1, p2, p3, p4);
}

} // namespace galvo::lmc

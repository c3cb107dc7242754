#pragma once

#include "galvo/core/Expected.hpp"
#include "galvo/lmc/CommandList.hpp"
#include "galvo/lmc/CorrectionTable.hpp"
#include "galvo/lmc/DeviceConfig.hpp"
#include "galvo/lmc/LmcCommand.hpp"
#include "galvo/lmc/LmcReply.hpp"
#include "galvo/lmc/Wobble.hpp"
#include "galvo/log/Log.hpp"
#include "galvo/usb/Connection.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace galvo::lmc {

enum class DriverMode {
    Rapid,      ///< idle, nothing queued, board free for polling
    Light,      ///< red pointer traces jumps
    Program,    ///< building a marking list
    Raw         ///< no gating, no waits; direct diagnostic access
};

const char* modeName(DriverMode mode);

/// Coarse state reported to a scheduler, e.g. {"busy", "program"}.
struct DriverState {
    std::string state;
    std::string detail;
};

struct FieldPosition {
    int x = config::LMC_FIELD_CENTER;
    int y = config::LMC_FIELD_CENTER;
};

using ConnectionFactory =
    std::function<std::shared_ptr<usb::Connection>(const DeviceConfig&,
                                                   std::shared_ptr<log::LogChannel>)>;

/**
 * @brief Drives one LMC board: modes, list packets, parameters and motion.
 *
 * List commands accumulate in a 256-entry packet that is sent, NOP padded,
 * once it fills or whenever the mode changes. Immediate commands go out as
 * single frames and are answered with an 8-byte reply.
 *
 * Parameter setters (speeds, power, frequency, delays, pulse width) only
 * emit an entry when the value differs from the last one written. The
 * cache is cleared whenever the board list is reset.
 *
 * Threading: one caller drives the controller. `pause()`, `resume()`,
 * `abortConnect()` and `shutdown()` only flip atomic flags that the flush
 * and wait loops observe, so they may be called from another thread.
 */
class GalvoController {
public:
    explicit GalvoController(DeviceConfig config = {}, MotionSpeeds speeds = {},
                             FieldPosition start = {});
    ~GalvoController();

    GalvoController(const GalvoController&) = delete;
    GalvoController& operator=(const GalvoController&) = delete;

    const DeviceConfig& config() const { return deviceConfig; }
    log::LogChannel& usbLog() { return *usbChannel; }

    // Connection ---------------------------------------------------------------
    /// Replace how the transport is created (defaults to mock or libusb per config).
    void setConnectionFactory(ConnectionFactory factory);

    /**
     * @brief Open and initialise the board unless it is already open.
     *
     * Up to `connectPolicy.maxAttempts` open+init attempts. After the last
     * failure automatic connection is disabled until `disconnect()`.
     */
    expected<void> connectIfNeeded();
    void disconnect();
    void abortConnect();
    void setDisableConnect(bool disabled) { connectDisabled = disabled; }
    bool isConnectDisabled() const { return connectDisabled; }
    bool connected() const;
    bool isConnecting() const { return connecting; }

    void shutdown();
    bool isShutdown() const { return shuttingDown; }

    usb::Connection* connection() { return transport.get(); }

    /// Send one frame; with @p read the 8-byte answer is returned decoded.
    expected<LmcReply> send(const std::uint8_t* data, std::size_t size, bool read = true);
    expected<LmcReply> command(std::uint16_t opcode, const CommandParams& params = {},
                               bool read = true);
    expected<LmcReply> command(Opcode opcode, std::uint16_t v1 = 0, std::uint16_t v2 = 0,
                               std::uint16_t v3 = 0, std::uint16_t v4 = 0,
                               std::uint16_t v5 = 0);

    // Modes --------------------------------------------------------------------
    DriverMode mode() const { return driverMode; }
    DriverState state() const;

    void rawMode();
    expected<void> rapidMode();
    expected<void> programMode();
    expected<void> lightMode();

    // Raw access ---------------------------------------------------------------
    /// Route by opcode: >= 0x8000 queues into the list, otherwise sent at once.
    expected<void> rawWrite(std::uint16_t opcode, const CommandParams& params = {});
    expected<void> rawWrite(const Command& command);
    /// Drop everything queued but not yet sent.
    void rawClear();

    std::size_t pendingEntries() const { return activeList.entryCount(); }
    int packetsSent() const { return packetCount; }
    bool listExecuting() const { return executing; }

    // Job settings -------------------------------------------------------------
    expected<void> setSettings(const OperationSettings& settings);
    /// Absent settings or wobbleEnabled == false drop the modulator.
    void setWobble(const std::optional<OperationSettings>& settings);
    const Wobble* wobble() const { return wobbler.get(); }

    // Motion -------------------------------------------------------------------
    expected<void> mark(double x, double y);
    expected<void> gotoXY(double x, double y, const JumpDelays& delays = {});
    expected<void> light(double x, double y, const JumpDelays& delays = {});
    expected<void> dark(double x, double y, const JumpDelays& delays = {});
    /// Immediate GotoXY; moves the galvo now, outside any list.
    expected<LmcReply> setXY(double x, double y);
    FieldPosition lastXY() const { return lastPosition; }

    // Status -------------------------------------------------------------------
    expected<std::uint16_t> status();
    expected<bool> isBusy();
    expected<bool> isReady();
    expected<bool> isReadyAndNotBusy();
    expected<void> waitFinished();
    expected<void> waitReady();
    expected<void> waitIdle();

    expected<void> pause();
    expected<void> resume();
    bool isPaused() const { return paused; }
    /// Stop execution, send a terminating packet, close MO and return to Rapid.
    expected<void> abort(bool dummyPacket = true);

    expected<void> initLaser();

    // Cached parameters --------------------------------------------------------
    expected<void> power(double percent);
    expected<void> frequency(double kilohertz);

    // Output port --------------------------------------------------------------
    /// Set the pointer bit. True when the bit changed.
    bool lightOn();
    bool lightOff();
    bool isPort(int bit) const;
    void portOn(int bit);
    void portOff(int bit);
    void portSet(std::uint32_t mask, std::uint32_t values);
    std::uint32_t portBits() const { return port; }

    std::uint16_t convertSpeed(double mmPerSecond) const;

    // Correction ---------------------------------------------------------------
    /// Upload @p path, or the blank table when absent or unreadable.
    expected<void> writeCorrectionFile(const std::optional<std::string>& path);
    expected<void> writeCorrectionTable(const CorrectionTable& table);
    expected<void> writeBlankCorrection();

    // List commands ------------------------------------------------------------
    expected<void> listJump(double x, double y, const JumpDelays& delays = {});
    expected<void> listEndOfList();
    expected<void> listLaserOnPoint(std::uint16_t dwellTime);
    /// Delay in 10 us units.
    expected<void> listDelayTime(int time);
    expected<void> listMark(double x, double y, std::uint16_t angle = 0);
    expected<void> listJumpSpeed(double speed);
    expected<void> listLaserOnDelay(double delay);
    expected<void> listLaserOffDelay(double delay);
    expected<void> listMarkPowerRatio(std::uint16_t ratio);
    expected<void> listMarkSpeed(double speed);
    expected<void> listJumpDelay(double delay);
    expected<void> listPolygonDelay(double delay);
    expected<void> listWritePort();
    expected<void> listMarkCurrent(std::uint16_t current);
    expected<void> listFlyEnable(std::uint16_t enabled = 1);
    expected<void> listQSwitchPeriod(std::uint16_t period);
    expected<void> listFlyDelay(double delay);
    expected<void> listSetCo2Fpk();
    expected<void> listFlyWaitInput();
    expected<void> listFiberOpenMo(std::uint16_t open);
    expected<void> listWaitForInput(std::uint16_t mask, std::uint16_t level);
    expected<void> listChangeMarkCount(std::uint16_t count);
    expected<void> listSetWeldPowerWave(std::uint16_t wave);
    expected<void> listEnableWeldPowerWave(std::uint16_t enabled);
    expected<void> listFiberYlpmPulseWidth(int pulseWidth);
    expected<void> listFlyEncoderCount(std::uint16_t count);
    expected<void> listSetDaZWord(std::uint16_t word);
    expected<void> listJptSetParam(std::uint16_t param);
    expected<void> listReady();

    // Immediate commands -------------------------------------------------------
    expected<LmcReply> disableLaser();
    expected<LmcReply> enableLaser();
    expected<LmcReply> executeList();
    expected<LmcReply> setPwmPulseWidth(std::uint16_t width);
    expected<LmcReply> getVersion();
    expected<LmcReply> getSerialNumber();
    expected<LmcReply> getListStatus();
    expected<LmcReply> getPositionXY();
    expected<LmcReply> gotoXYImmediate(double x, double y, std::uint16_t angle = 0,
                                       std::uint16_t distance = 0);
    expected<LmcReply> laserSignalOff();
    expected<LmcReply> laserSignalOn();
    /// Not answered by the firmware; nothing is read back.
    expected<void> writeCorLine(std::uint16_t dx, std::uint16_t dy, std::uint16_t nonFirst);
    expected<LmcReply> resetList();
    expected<LmcReply> restartList();
    expected<LmcReply> writeCorTable(bool table = true);
    expected<LmcReply> setControlMode(std::uint16_t mode);
    expected<LmcReply> setDelayMode(std::uint16_t mode);
    expected<LmcReply> setMaxPolyDelay(double delay);
    expected<LmcReply> setEndOfList(std::uint16_t end);
    expected<LmcReply> setFirstPulseKiller(std::uint16_t fpk);
    expected<LmcReply> setLaserMode(std::uint16_t mode);
    expected<LmcReply> setTiming(std::uint16_t timing);
    expected<LmcReply> setStandby(std::uint16_t standby1, std::uint16_t standby2);
    expected<LmcReply> setPwmHalfPeriod(std::uint16_t halfPeriod);
    expected<LmcReply> stopExecute();
    expected<LmcReply> stopList();
    expected<LmcReply> writePort();
    expected<LmcReply> writeAnalogPort1(std::uint16_t value);
    expected<LmcReply> writeAnalogPort2(std::uint16_t value);
    expected<LmcReply> writeAnalogPortX(std::uint16_t value);
    expected<LmcReply> readPort();
    expected<LmcReply> setAxisMotionParam(std::uint16_t param);
    expected<LmcReply> setAxisOriginParam(std::uint16_t param);
    expected<LmcReply> axisGoOrigin();
    /// The target is not transmitted; the board is only told to move.
    expected<LmcReply> moveAxisTo(int target);
    expected<LmcReply> getAxisPos();
    expected<LmcReply> getFlyWaitCount();
    expected<LmcReply> getMarkCount();
    expected<LmcReply> setFpkParam2(std::uint16_t p1, std::uint16_t p2, std::uint16_t p3,
                                    std::uint16_t p4);
    /// 0 closes the fiber master oscillator, 1 opens it.
    expected<LmcReply> setFiberMo(std::uint16_t mo);
    expected<LmcReply> getFiberStMoAp();
    expected<LmcReply> enableZ();
    expected<LmcReply> disableZ();
    expected<LmcReply> setZData(std::uint16_t data);
    expected<LmcReply> setSpiSimmerCurrent(std::uint16_t current);
    expected<LmcReply> setFpkParam(std::uint16_t param);
    expected<LmcReply> reset();
    expected<LmcReply> getFlySpeed();
    expected<LmcReply> fiberPulseWidth();
    expected<LmcReply> getFiberConfigExtend();
    expected<LmcReply> inputPort(std::uint16_t port);
    expected<LmcReply> clearLockInputPort();
    expected<LmcReply> enableLockInputPort();
    expected<LmcReply> disableLockInputPort();
    expected<LmcReply> getInputPort();
    /// Always queried with argument 3; 0 makes the board answer 0.
    expected<LmcReply> getMarkTime();
    expected<LmcReply> getUserData();
    expected<LmcReply> setFlyRes(std::uint16_t p1, std::uint16_t p2, std::uint16_t p3,
                                 std::uint16_t p4);

private:
    struct ParameterCache {
        std::optional<double> markSpeed;
        std::optional<double> jumpSpeed;
        std::optional<double> frequency;
        std::optional<double> power;
        std::optional<double> laserOnDelay;
        std::optional<double> laserOffDelay;
        std::optional<double> polygonDelay;
        std::optional<double> jumpDelay;
        std::optional<int> pulseWidth;
    };

    std::shared_ptr<usb::Connection> makeConnection();
    expected<void> openAndInit();

    expected<void> listWrite(ListOpcode opcode, std::uint16_t v1 = 0, std::uint16_t v2 = 0,
                             std::uint16_t v3 = 0, std::uint16_t v4 = 0,
                             std::uint16_t v5 = 0);
    expected<void> listWrite(std::uint16_t opcode, const CommandParams& params);
    /// Send the pending packet, NOP padded, and start execution once enough are queued.
    expected<void> listEnd();
    void listNew();
    void clearCache() { cache = ParameterCache{}; }
    /// Drop the pending list, cached parameters, pause and execution state.
    /// Returns to Rapid unless in Raw mode.
    void resetBoardState();
    /// Sleep in LMC_PAUSE_INTERVAL steps while paused, until resume or shutdown.
    void waitWhilePaused();

    DeviceConfig deviceConfig;
    MotionSpeeds motionSpeeds;
    std::shared_ptr<log::LogChannel> usbChannel;
    ConnectionFactory connectionFactory;
    std::shared_ptr<usb::Connection> transport;

    std::atomic<bool> shuttingDown{false};
    std::atomic<bool> abortOpen{false};
    std::atomic<bool> paused{false};
    bool connecting = false;
    bool connectDisabled = false;
    bool boardSession = false;

    DriverMode driverMode = DriverMode::Rapid;
    CommandList activeList;
    int packetCount = 0;
    bool executing = false;

    FieldPosition lastPosition;
    ParameterCache cache;
    double jumpSpeedSetting;
    std::uint32_t port = 0;
    std::unique_ptr<Wobble> wobbler;
};

} // namespace galvo::lmc

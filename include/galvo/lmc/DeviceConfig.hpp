#pragma once

#include "galvo/core/RetryPolicy.hpp"
#include "galvo/lmc/LmcConfig.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace galvo::lmc {

/**
 * @brief Device-level configuration of one LMC board.
 *
 * Loading and persisting these values is the host application's business;
 * the driver only reads them. Defaults match a stock fiber source on a
 * 110 mm lens.
 */
struct DeviceConfig {
    /// Use the in-memory simulator instead of libusb.
    bool mock = false;
    /// Which matching board to open when several are attached.
    int machineIndex = 0;

    /// Edge length of the scan field in mm; 65536 device units span it.
    double lensSizeMm = 110.0;

    /// Output port bit that drives the red pointer beam.
    int lightPin = 8;
    int footPedalPin = 15;

    /// `correction_file`. Ignored unless correctionEnabled.
    std::optional<std::string> correctionFile{};
    bool correctionEnabled = false;

    // Job defaults, used whenever OperationSettings leave a value unset.
    double defaultPowerPercent = 50.0;
    double defaultSpeed = 100.0;         ///< mm/s
    double defaultFrequencyKhz = 30.0;
    double defaultRapidSpeed = 2000.0;   ///< mm/s
    bool pulseWidthEnabled = false;
    int defaultPulseWidth = 4;

    // Timing defaults in microseconds.
    double delayLaserOn = 100.0;
    double delayLaserOff = 100.0;
    double delayPolygon = 100.0;
    /// Delay after opening MO in ms; sent as 10 us units. 0 disables it.
    double delayOpenMo = 8.0;

    // Board initialisation parameters.
    int firstPulseKiller = 200;
    int pwmHalfPeriod = 125;
    int pwmPulseWidth = 125;
    int standbyParam1 = 2000;
    int standbyParam2 = 20;
    int timingMode = 1;
    int delayMode = 1;
    int laserMode = 1;
    int controlMode = 0;
    int fpk2P1 = 0xFFB;
    int fpk2P2 = 1;
    int fpk2P3 = 409;
    int fpk2P4 = 100;
    int flyResP1 = 0;
    int flyResP2 = 99;
    int flyResP3 = 1000;
    int flyResP4 = 25;

    core::RetryPolicy transferPolicy{config::LMC_TRANSFER_ATTEMPTS, config::LMC_TRANSFER_BACKOFF};
    core::RetryPolicy connectPolicy{config::LMC_CONNECT_ATTEMPTS, config::LMC_CONNECT_BACKOFF};

    /// Device units per millimetre of the current lens.
    double unitsPerMm() const { return config::LMC_FIELD_UNITS / lensSizeMm; }
};

/**
 * @brief Per-operation laser settings (`setSettings` / `setWobble` input).
 *
 * Every value left unset falls back to the matching DeviceConfig default.
 * Local rapid speed, pulse width and delays only apply when their enable
 * flag is set.
 */
struct OperationSettings {
    std::optional<double> speed{};             ///< mark speed, mm/s
    std::optional<double> power{};             ///< percent, 0..100
    std::optional<double> frequency{};         ///< kHz

    bool rapidEnabled = false;
    std::optional<double> rapidSpeed{};        ///< mm/s

    bool pulseWidthEnabled = false;
    std::optional<int> pulseWidth{};

    bool timingEnabled = false;
    std::optional<double> delayLaserOn{};      ///< us
    std::optional<double> delayLaserOff{};     ///< us
    std::optional<double> delayPolygon{};      ///< us

    bool wobbleEnabled = false;
    double wobbleRadius = 1.5;                 ///< mm
    double wobbleInterval = 0.3;               ///< mm
    double wobbleSpeed = 50.0;
    std::string wobbleType = "circle";
};

/**
 * @brief Optional per-primitive speed overrides (mm/s).
 *
 * When set, each primitive first routes its speed through the deduplicating
 * setter, so a run of marks at one speed emits the speed entry once.
 */
struct MotionSpeeds {
    std::optional<double> mark{};
    std::optional<double> gotoSpeed{};
    std::optional<double> light{};
    std::optional<double> dark{};
};

/// Jump settle delays chosen by jump length.
struct JumpDelays {
    std::optional<double> shortDelay{};
    std::optional<double> longDelay{};
    /// Jumps longer than this (device units) use longDelay.
    std::optional<double> distanceLimit{};
};

} // namespace galvo::lmc

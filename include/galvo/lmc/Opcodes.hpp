#pragma once

#include <cstdint>

namespace galvo::lmc {

/// Commands queued into a list packet and executed by the board in order.
enum class ListOpcode : std::uint16_t {
    JumpTo = 0x8001,
    EndOfList = 0x8002,
    LaserOnPoint = 0x8003,
    DelayTime = 0x8004,
    MarkTo = 0x8005,
    JumpSpeed = 0x8006,
    LaserOnDelay = 0x8007,
    LaserOffDelay = 0x8008,
    MarkFreq = 0x800A,
    MarkPowerRatio = 0x800B,
    MarkSpeed = 0x800C,
    JumpDelay = 0x800D,
    PolygonDelay = 0x800F,
    WritePort = 0x8011,
    MarkCurrent = 0x8012,
    MarkFreq2 = 0x8013,
    FlyEnable = 0x801A,
    QSwitchPeriod = 0x801B,
    DirectLaserSwitch = 0x801C,
    FlyDelay = 0x801D,
    SetCo2FPK = 0x801E,
    FlyWaitInput = 0x801F,
    FiberOpenMO = 0x8021,
    WaitForInput = 0x8022,
    ChangeMarkCount = 0x8023,
    SetWeldPowerWave = 0x8024,
    EnableWeldPowerWave = 0x8025,
    FiberYLPMPulseWidth = 0x8026,
    FlyEncoderCount = 0x8028,
    SetDaZWord = 0x8029,
    JptSetParam = 0x8050,
    ReadyMark = 0x8051
};

/// Commands sent alone and answered with an 8-byte reply.
enum class Opcode : std::uint16_t {
    DisableLaser = 0x0002,
    EnableLaser = 0x0004,
    ExecuteList = 0x0005,
    SetPwmPulseWidth = 0x0006,
    GetVersion = 0x0007,
    GetSerialNo = 0x0009,
    GetListStatus = 0x000A,
    GetPositionXY = 0x000C,
    GotoXY = 0x000D,
    LaserSignalOff = 0x000E,
    LaserSignalOn = 0x000F,
    WriteCorLine = 0x0010,
    ResetList = 0x0012,
    RestartList = 0x0013,
    WriteCorTable = 0x0015,
    SetControlMode = 0x0016,
    SetDelayMode = 0x0017,
    SetMaxPolyDelay = 0x0018,
    SetEndOfList = 0x0019,
    SetFirstPulseKiller = 0x001A,
    SetLaserMode = 0x001B,
    SetTiming = 0x001C,
    SetStandby = 0x001D,
    SetPwmHalfPeriod = 0x001E,
    StopExecute = 0x001F,
    StopList = 0x0020,
    WritePort = 0x0021,
    WriteAnalogPort1 = 0x0022,
    WriteAnalogPort2 = 0x0023,
    WriteAnalogPortX = 0x0024,
    ReadPort = 0x0025,
    SetAxisMotionParam = 0x0026,
    SetAxisOriginParam = 0x0027,
    AxisGoOrigin = 0x0028,
    MoveAxisTo = 0x0029,
    GetAxisPos = 0x002A,
    GetFlyWaitCount = 0x002B,
    GetMarkCount = 0x002D,
    SetFpkParam2 = 0x002E,
    FiberPulseWidth = 0x002F,
    FiberGetConfigExtend = 0x0030,
    InputPort = 0x0031,
    SetFlyRes = 0x0032,
    FiberSetMo = 0x0033,
    FiberGetStMO_AP = 0x0034,
    GetUserData = 0x0036,
    GetFlySpeed = 0x0038,
    DisableZ = 0x0039,
    EnableZ = 0x003A,
    SetZData = 0x003B,
    SetSPISimmerCurrent = 0x003C,
    Reset = 0x0040,
    GetMarkTime = 0x0041,
    SetFpkParam = 0x0062
};

constexpr std::uint16_t toWord(ListOpcode op) { return static_cast<std::uint16_t>(op); }
constexpr std::uint16_t toWord(Opcode op) { return static_cast<std::uint16_t>(op); }

/// True when @p opcode belongs to the list range (>= 0x8000).
constexpr bool isListOpcode(std::uint16_t opcode) { return opcode >= 0x8000u; }

/// Name of a list opcode ("listMarkTo"), or "Unknown".
const char* listOpcodeName(std::uint16_t opcode);

/// Name of an immediate opcode ("GetVersion"), or "Unknown".
const char* opcodeName(std::uint16_t opcode);

/// Looks the opcode up in the table of its own range.
const char* anyOpcodeName(std::uint16_t opcode);

} // namespace galvo::lmc

#include "galvo/lmc/Opcodes.hpp"

namespace galvo::lmc {

const char* listOpcodeName(std::uint16_t opcode) {
    switch (static_cast<ListOpcode>(opcode)) {
        case ListOpcode::JumpTo: return "listJumpTo";
        case ListOpcode::EndOfList: return "listEndOfList";
        case ListOpcode::LaserOnPoint: return "listLaserOnPoint";
        case ListOpcode::DelayTime: return "listDelayTime";
        case ListOpcode::MarkTo: return "listMarkTo";
        case ListOpcode::JumpSpeed: return "listJumpSpeed";
        case ListOpcode::LaserOnDelay: return "listLaserOnDelay";
        case ListOpcode::LaserOffDelay: return "listLaserOffDelay";
        case ListOpcode::MarkFreq: return "listMarkFreq";
        case ListOpcode::MarkPowerRatio: return "listMarkPowerRatio";
        case ListOpcode::MarkSpeed: return "listMarkSpeed";
        case ListOpcode::JumpDelay: return "listJumpDelay";
        case ListOpcode::PolygonDelay: return "listPolygonDelay";
        case ListOpcode::WritePort: return "listWritePort";
        case ListOpcode::MarkCurrent: return "listMarkCurrent";
        case ListOpcode::MarkFreq2: return "listMarkFreq2";
        case ListOpcode::FlyEnable: return "listFlyEnable";
        case ListOpcode::QSwitchPeriod: return "listQSwitchPeriod";
        case ListOpcode::DirectLaserSwitch: return "listDirectLaserSwitch";
        case ListOpcode::FlyDelay: return "listFlyDelay";
        case ListOpcode::SetCo2FPK: return "listSetCo2FPK";
        case ListOpcode::FlyWaitInput: return "listFlyWaitInput";
        case ListOpcode::FiberOpenMO: return "listFiberOpenMO";
        case ListOpcode::WaitForInput: return "listWaitForInput";
        case ListOpcode::ChangeMarkCount: return "listChangeMarkCount";
        case ListOpcode::SetWeldPowerWave: return "listSetWeldPowerWave";
        case ListOpcode::EnableWeldPowerWave: return "listEnableWeldPowerWave";
        case ListOpcode::FiberYLPMPulseWidth: return "listFiberYLPMPulseWidth";
        case ListOpcode::FlyEncoderCount: return "listFlyEncoderCount";
        case ListOpcode::SetDaZWord: return "listSetDaZWord";
        case ListOpcode::JptSetParam: return "listJptSetParam";
        case ListOpcode::ReadyMark: return "listReadyMark";
    }
    return "Unknown";
}

const char* opcodeName(std::uint16_t opcode) {
    switch (static_cast<Opcode>(opcode)) {
        case Opcode::DisableLaser: return "DisableLaser";
        case Opcode::EnableLaser: return "EnableLaser";
        case Opcode::ExecuteList: return "ExecuteList";
        case Opcode::SetPwmPulseWidth: return "SetPwmPulseWidth";
        case Opcode::GetVersion: return "GetVersion";
        case Opcode::GetSerialNo: return "GetSerialNo";
        case Opcode::GetListStatus: return "GetListStatus";
        case Opcode::GetPositionXY: return "GetPositionXY";
        case Opcode::GotoXY: return "GotoXY";
        case Opcode::LaserSignalOff: return "LaserSignalOff";
        case Opcode::LaserSignalOn: return "LaserSignalOn";
        case Opcode::WriteCorLine: return "WriteCorLine";
        case Opcode::ResetList: return "ResetList";
        case Opcode::RestartList: return "RestartList";
        case Opcode::WriteCorTable: return "WriteCorTable";
        case Opcode::SetControlMode: return "SetControlMode";
        case Opcode::SetDelayMode: return "SetDelayMode";
        case Opcode::SetMaxPolyDelay: return "SetMaxPolyDelay";
        case Opcode::SetEndOfList: return "SetEndOfList";
        case Opcode::SetFirstPulseKiller: return "SetFirstPulseKiller";
        case Opcode::SetLaserMode: return "SetLaserMode";
        case Opcode::SetTiming: return "SetTiming";
        case Opcode::SetStandby: return "SetStandby";
        case Opcode::SetPwmHalfPeriod: return "SetPwmHalfPeriod";
        case Opcode::StopExecute: return "StopExecute";
        case Opcode::StopList: return "StopList";
        case Opcode::WritePort: return "WritePort";
        case Opcode::WriteAnalogPort1: return "WriteAnalogPort1";
        case Opcode::WriteAnalogPort2: return "WriteAnalogPort2";
        case Opcode::WriteAnalogPortX: return "WriteAnalogPortX";
        case Opcode::ReadPort: return "ReadPort";
        case Opcode::SetAxisMotionParam: return "SetAxisMotionParam";
        case Opcode::SetAxisOriginParam: return "SetAxisOriginParam";
        case Opcode::AxisGoOrigin: return "AxisGoOrigin";
        case Opcode::MoveAxisTo: return "MoveAxisTo";
        case Opcode::GetAxisPos: return "GetAxisPos";
        case Opcode::GetFlyWaitCount: return "GetFlyWaitCount";
        case Opcode::GetMarkCount: return "GetMarkCount";
        case Opcode::SetFpkParam2: return "SetFpkParam2";
        case Opcode::FiberPulseWidth: return "FiberPulseWidth";
        case Opcode::FiberGetConfigExtend: return "FiberGetConfigExtend";
        case Opcode::InputPort: return "InputPort";
        case Opcode::SetFlyRes: return "SetFlyRes";
        case Opcode::FiberSetMo: return "Fiber_SetMo";
        case Opcode::FiberGetStMO_AP: return "Fiber_GetStMO_AP";
        case Opcode::GetUserData: return "GetUserData";
        case Opcode::GetFlySpeed: return "GetFlySpeed";
        case Opcode::DisableZ: return "DisableZ";
        case Opcode::EnableZ: return "EnableZ";
        case Opcode::SetZData: return "SetZData";
        case Opcode::SetSPISimmerCurrent: return "SetSPISimmerCurrent";
        case Opcode::Reset: return "Reset";
        case Opcode::GetMarkTime: return "GetMarkTime";
        case Opcode::SetFpkParam: return "SetFpkParam";
    }
    return "Unknown";
}

const char* anyOpcodeName(std::uint16_t opcode) {
    return isListOpcode(opcode) ? listOpcodeName(opcode) : opcodeName(opcode);
}

} // namespace galvo::lmc

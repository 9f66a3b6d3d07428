// MIT License
#include "mycobot_driver/command.hpp"

namespace mycobot_driver {
namespace command {

namespace {
struct CommandInfo {
  uint8_t opcode;
  const char* name;
};

const CommandInfo kCommandTable[] = {
    {kVersion, "VERSION"},
    {kPowerOn, "POWER_ON"},
    {kPowerOff, "POWER_OFF"},
    {kIsPowerOn, "IS_POWER_ON"},
    {kReleaseAllServos, "RELEASE_ALL_SERVOS"},
    {kIsControllerConnected, "IS_CONTROLLER_CONNECTED"},
    {kGetAngles, "GET_ANGLES"},
    {kSendAngle, "SEND_ANGLE"},
    {kSendAngles, "SEND_ANGLES"},
    {kGetCoords, "GET_COORDS"},
    {kSendCoord, "SEND_COORD"},
    {kSendCoords, "SEND_COORDS"},
    {kPause, "PAUSE"},
    {kIsPaused, "IS_PAUSED"},
    {kResume, "RESUME"},
    {kStop, "STOP"},
    {kIsInPosition, "IS_IN_POSITION"},
    {kIsMoving, "IS_MOVING"},
    {kJogAngle, "JOG_ANGLE"},
    {kJogCoord, "JOG_COORD"},
    {kJogStop, "JOG_STOP"},
    {kSetEncoder, "SET_ENCODER"},
    {kGetEncoder, "GET_ENCODER"},
    {kGetSpeed, "GET_SPEED"},
    {kSetSpeed, "SET_SPEED"},
    {kIsServoEnable, "IS_SERVO_ENABLE"},
    {kIsAllServoEnable, "IS_ALL_SERVO_ENABLE"},
    {kReleaseServo, "RELEASE_SERVO"},
    {kFocusServo, "FOCUS_SERVO"},
    {kSetColor, "SET_COLOR"},
};
}  // namespace

const char* commandName(uint8_t opcode) {
  for (const auto& c : kCommandTable)
    if (c.opcode == opcode) return c.name;
  return "UNKNOWN";
}

}  // namespace command
}  // namespace mycobot_driver

// MIT License
#pragma once
#include <cstdint>

namespace mycobot_driver {

// Opcodes understood by the arm controller firmware. Values are fixed by the
// vendor and must not be changed.
namespace command {
static constexpr uint8_t kSentinel = 0xFE;
static constexpr uint8_t kFrameHeader = kSentinel;
static constexpr uint8_t kFrameFooter = kSentinel;

static constexpr uint8_t kVersion = 0x00;
static constexpr uint8_t kPowerOn = 0x10;
static constexpr uint8_t kPowerOff = 0x11;
static constexpr uint8_t kIsPowerOn = 0x12;
static constexpr uint8_t kReleaseAllServos = 0x13;
static constexpr uint8_t kIsControllerConnected = 0x14;
static constexpr uint8_t kGetAngles = 0x20;
static constexpr uint8_t kSendAngle = 0x21;
static constexpr uint8_t kSendAngles = 0x22;
static constexpr uint8_t kGetCoords = 0x23;
static constexpr uint8_t kSendCoord = 0x24;
static constexpr uint8_t kSendCoords = 0x25;
static constexpr uint8_t kPause = 0x26;
static constexpr uint8_t kIsPaused = 0x27;
static constexpr uint8_t kResume = 0x28;
static constexpr uint8_t kStop = 0x29;
static constexpr uint8_t kIsInPosition = 0x2A;
static constexpr uint8_t kIsMoving = 0x2B;
static constexpr uint8_t kJogAngle = 0x30;
static constexpr uint8_t kJogCoord = 0x32;
static constexpr uint8_t kJogStop = 0x34;
static constexpr uint8_t kSetEncoder = 0x3A;
static constexpr uint8_t kGetEncoder = 0x3B;
static constexpr uint8_t kGetSpeed = 0x40;
static constexpr uint8_t kSetSpeed = 0x41;
static constexpr uint8_t kIsServoEnable = 0x50;
static constexpr uint8_t kIsAllServoEnable = 0x51;
static constexpr uint8_t kReleaseServo = 0x56;
static constexpr uint8_t kFocusServo = 0x57;
static constexpr uint8_t kSetColor = 0x6A;

// Table name for an opcode, "UNKNOWN" if the catalog has no entry.
const char* commandName(uint8_t opcode);
}  // namespace command

enum class Joint : uint8_t { kJ1 = 1, kJ2 = 2, kJ3 = 3, kJ4 = 4, kJ5 = 5, kJ6 = 6 };

enum class Axis : uint8_t { kX = 1, kY = 2, kZ = 3, kRx = 4, kRy = 5, kRz = 6 };

enum class Direction : uint8_t { kDecrease = 0, kIncrease = 1 };

// In-position query selector appended to the target vector.
enum class PositionMode : uint8_t { kAngles = 0, kCoords = 1 };

}  // namespace mycobot_driver

// MIT License
#include <gtest/gtest.h>

#include "mycobot_driver/command.hpp"
#include "mycobot_driver/frame.hpp"

using namespace mycobot_driver;

namespace {
std::vector<uint8_t> concat(std::vector<uint8_t> a, const std::vector<uint8_t>& b) {
  a.insert(a.end(), b.begin(), b.end());
  return a;
}
}  // namespace

TEST(Frame, BuildLayout) {
  std::vector<uint8_t> f = buildFrame(command::kSendAngle, { 0x01, 0x11, 0x94, 0x32 });
  std::vector<uint8_t> expected{ 0xFE, 0xFE, 0x06, 0x21, 0x01, 0x11, 0x94, 0x32, 0xFE };
  EXPECT_EQ(f, expected);
}

TEST(Frame, BuildEmptyPayload) {
  std::vector<uint8_t> expected{ 0xFE, 0xFE, 0x02, 0x10, 0xFE };
  EXPECT_EQ(buildFrame(command::kPowerOn, {}), expected);
}

TEST(Frame, ParseReturnsPayloadOfAnySize) {
  for (size_t len : { 0u, 1u, 2u, 12u, 100u, 252u }) {
    std::vector<uint8_t> payload(len);
    for (size_t i = 0; i < len; ++i) payload[i] = static_cast<uint8_t>(i % 200);
    EXPECT_EQ(parseFrame(buildFrame(command::kGetAngles, payload), command::kGetAngles), payload)
      << "len " << len;
  }
}

TEST(Frame, ParseRejectsOtherOpcode) {
  std::vector<uint8_t> f = buildFrame(command::kGetAngles, { 1, 2 });
  EXPECT_TRUE(parseFrame(f, command::kGetCoords).empty());
}

TEST(Frame, ParseSkipsLeadingNoise) {
  std::vector<uint8_t> payload{ 0x00, 0x01 };
  std::vector<uint8_t> noise{ 0x12, 0xFE, 0x00, 0xFF, 0x7F };
  std::vector<uint8_t> raw = concat(noise, buildFrame(command::kIsPowerOn, payload));
  EXPECT_EQ(parseFrame(raw, command::kIsPowerOn), payload);
}

TEST(Frame, ParseWithoutHeaderIsEmpty) {
  EXPECT_TRUE(parseFrame({}, command::kIsPowerOn).empty());
  EXPECT_TRUE(parseFrame({ 0xFE }, command::kIsPowerOn).empty());
  EXPECT_TRUE(parseFrame({ 0x01, 0xFE, 0x02, 0xFE, 0x12 }, command::kIsPowerOn).empty());
}

TEST(Frame, ParseUndersizedIsEmpty) {
  // header only
  EXPECT_TRUE(parseFrame({ 0xFE, 0xFE }, command::kIsPowerOn).empty());
  // no opcode byte
  EXPECT_TRUE(parseFrame({ 0xFE, 0xFE, 0x03 }, command::kIsPowerOn).empty());
  // declared 12 payload bytes, only 3 present
  EXPECT_TRUE(parseFrame({ 0xFE, 0xFE, 0x0E, 0x20, 0x01, 0x02, 0x03 }, command::kGetAngles).empty());
  // length below the opcode-only minimum
  EXPECT_TRUE(parseFrame({ 0xFE, 0xFE, 0x01, 0x12, 0x01 }, command::kIsPowerOn).empty());
}

TEST(Frame, ParseToleratesMissingFooter) {
  std::vector<uint8_t> raw{ 0xFE, 0xFE, 0x03, 0x12, 0x01 };
  std::vector<uint8_t> expected{ 0x01 };
  EXPECT_EQ(parseFrame(raw, command::kIsPowerOn), expected);
}

TEST(Frame, DecodeTwelveBytesAsSixShorts) {
  std::vector<uint8_t> payload;
  for (int16_t v : { 0, -1, 4500, -4500, 5000, 32767 }) appendInt16(payload, v);
  std::vector<int16_t> expected{ 0, -1, 4500, -4500, 5000, 32767 };
  EXPECT_EQ(decodePayload(payload, command::kGetAngles), expected);
}

TEST(Frame, DecodeTwoBytesAsShort) {
  std::vector<int16_t> expected{ -2 };
  EXPECT_EQ(decodePayload({ 0xFF, 0xFE }, command::kGetEncoder), expected);
  std::vector<int16_t> big{ 2048 };
  EXPECT_EQ(decodePayload({ 0x08, 0x00 }, command::kGetEncoder), big);
}

TEST(Frame, DecodeServoEnableUsesSecondByte) {
  std::vector<int16_t> enabled{ 1 };
  EXPECT_EQ(decodePayload({ 0x03, 0x01 }, command::kIsServoEnable), enabled);
  std::vector<int16_t> negative{ -1 };
  EXPECT_EQ(decodePayload({ 0x03, 0xFF }, command::kIsServoEnable), negative);
}

TEST(Frame, DecodeOtherLengthsAsSignedByte) {
  std::vector<int16_t> one{ 1 };
  EXPECT_EQ(decodePayload({ 0x01 }, command::kIsPowerOn), one);
  std::vector<int16_t> neg{ -128 };
  EXPECT_EQ(decodePayload({ 0x80, 0x05, 0x06 }, command::kIsMoving), neg);
  EXPECT_TRUE(decodePayload({}, command::kIsMoving).empty());
}

TEST(Frame, HexDump) {
  EXPECT_EQ(toHex({ 0xFE, 0x0A, 0x00 }), "FE 0A 00");
  EXPECT_EQ(toHex({}), "");
}

TEST(Command, NamesFromCatalog) {
  EXPECT_STREQ(command::commandName(command::kGetAngles), "GET_ANGLES");
  EXPECT_STREQ(command::commandName(command::kSetColor), "SET_COLOR");
  EXPECT_STREQ(command::commandName(0xEE), "UNKNOWN");
}

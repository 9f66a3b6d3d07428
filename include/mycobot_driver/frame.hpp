// MIT License
#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace mycobot_driver {

// Wire envelope: [FE, FE, len, opcode, payload..., FE] where len = payload + 2.
std::vector<uint8_t> buildFrame(uint8_t opcode, const std::vector<uint8_t>& payload);

// Locate the first header pair in raw (leading noise allowed) and return its
// payload. Returns empty if no header is found, the opcode differs from
// expected_opcode, or the frame is truncated.
std::vector<uint8_t> parseFrame(const std::vector<uint8_t>& raw, uint8_t expected_opcode);

// Decode a reply payload by its length:
//   12 bytes -> six big-endian int16
//    2 bytes -> one big-endian int16 (IS_SERVO_ENABLE: byte [1] as int8)
//   other    -> byte [0] as int8
std::vector<int16_t> decodePayload(const std::vector<uint8_t>& payload, uint8_t opcode);

void appendInt16(std::vector<uint8_t>& out, int16_t v);
int16_t readInt16(const uint8_t* p);

std::string toHex(const std::vector<uint8_t>& data);

}  // namespace mycobot_driver

// MIT License
#include "mycobot_driver/frame.hpp"

#include <sstream>

#include "mycobot_driver/command.hpp"

namespace mycobot_driver {

namespace {
constexpr size_t kPoseReplyLen = 12;
constexpr size_t kShortReplyLen = 2;
}  // namespace

void appendInt16(std::vector<uint8_t>& out, int16_t v) {
  uint16_t u = static_cast<uint16_t>(v);
  out.push_back(static_cast<uint8_t>((u >> 8) & 0xFF));
  out.push_back(static_cast<uint8_t>(u & 0xFF));
}

int16_t readInt16(const uint8_t* p) {
  return static_cast<int16_t>((uint16_t(p[0]) << 8) | p[1]);
}

std::vector<uint8_t> buildFrame(uint8_t opcode, const std::vector<uint8_t>& payload) {
  // Frame: header, header, len, opcode, payload..., footer
  std::vector<uint8_t> buf;
  buf.reserve(4 + payload.size() + 1);
  buf.push_back(command::kFrameHeader);
  buf.push_back(command::kFrameHeader);
  buf.push_back(static_cast<uint8_t>(payload.size() + 2));
  buf.push_back(opcode);
  buf.insert(buf.end(), payload.begin(), payload.end());
  buf.push_back(command::kFrameFooter);
  return buf;
}

std::vector<uint8_t> parseFrame(const std::vector<uint8_t>& raw, uint8_t expected_opcode) {
  size_t idx = 0;
  bool found = false;
  for (; idx + 1 < raw.size(); ++idx) {
    if (raw[idx] == command::kFrameHeader && raw[idx + 1] == command::kFrameHeader) {
      found = true;
      break;
    }
  }
  if (!found) return {};
  // Need the length and opcode bytes after the header pair.
  if (idx + 3 >= raw.size()) return {};
  if (raw[idx + 2] < 2) return {};
  size_t data_len = size_t(raw[idx + 2]) - 2;
  if (raw[idx + 3] != expected_opcode) return {};
  size_t data_pos = idx + 4;
  if (data_pos + data_len > raw.size()) return {};
  return std::vector<uint8_t>(raw.begin() + data_pos, raw.begin() + data_pos + data_len);
}

std::vector<int16_t> decodePayload(const std::vector<uint8_t>& payload, uint8_t opcode) {
  std::vector<int16_t> out;
  if (payload.empty()) return out;
  switch (payload.size()) {
  case kPoseReplyLen:
    for (size_t i = 0; i < kPoseReplyLen; i += 2) out.push_back(readInt16(&payload[i]));
    break;
  case kShortReplyLen:
    if (opcode == command::kIsServoEnable)
      out.push_back(static_cast<int8_t>(payload[1]));
    else
      out.push_back(readInt16(payload.data()));
    break;
  default:
    out.push_back(static_cast<int8_t>(payload[0]));
    break;
  }
  return out;
}

std::string toHex(const std::vector<uint8_t>& data) {
  std::ostringstream oss;
  for (size_t i = 0; i < data.size(); ++i) {
    if (i) oss << ' ';
    oss << std::hex << std::uppercase;
    oss.width(2);
    oss.fill('0');
    oss << int(data[i]);
  }
  return oss.str();
}

}  // namespace mycobot_driver

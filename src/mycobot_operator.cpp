// MIT License
#include "mycobot_driver/mycobot_operator.hpp"

#include <chrono>
#include <cmath>
#include <thread>
#include <utility>

#include <rcutils/logging_macros.h>

#include "mycobot_driver/frame.hpp"
#include "mycobot_driver/unit_codec.hpp"

namespace mycobot_driver {

  namespace {
    template <typename Container>
    std::vector<uint8_t> encodeAngles(const Container& degrees) {
      std::vector<uint8_t> out;
      out.reserve(degrees.size() * 2 + 1);
      for (double d : degrees) appendInt16(out, angleToInt(d));
      return out;
    }

    std::vector<uint8_t> encodeCoords(const std::vector<double>& coords) {
      std::vector<uint8_t> out;
      out.reserve(coords.size() * 2 + 2);
      for (int16_t v : coordsToInts(coords)) appendInt16(out, v);
      return out;
    }

    std::vector<uint8_t> anglePositionQuery(const std::array<double, 6>& degrees) {
      std::vector<uint8_t> payload = encodeAngles(degrees);
      payload.push_back(static_cast<uint8_t>(PositionMode::kAngles));
      return payload;
    }

    std::vector<uint8_t> coordPositionQuery(const std::vector<double>& coords) {
      std::vector<uint8_t> payload = encodeCoords(coords);
      payload.push_back(static_cast<uint8_t>(PositionMode::kCoords));
      return payload;
    }

    inline uint8_t joint(Joint id) { return static_cast<uint8_t>(id); }
  }  // namespace

  MyCobotOperator::MyCobotOperator(std::unique_ptr<IConnection> connection)
    : connection_(std::move(connection)) {
  }

  bool MyCobotOperator::sendCommandWrite(uint8_t command, const std::vector<uint8_t>& payload,
                                         std::string& err) {
    if (!connection_) {
      err = "no connection (operator was moved from)";
      return false;
    }
    auto& st = cmd_stats_[command];
    st.attempts++;
    last_command_ = command;
    std::vector<uint8_t> frame = buildFrame(command, payload);
    last_tx_ = toHex(frame);
    last_rx_.clear();
    RCUTILS_LOG_DEBUG("[MyCobotOperator] %s WROTE: %s", command::commandName(command), last_tx_.c_str());
    if (!connection_->write(frame, err)) {
      st.io_fail++;
      RCUTILS_LOG_ERROR("[MyCobotOperator::sendCommandWrite] %s failed: %s",
                        command::commandName(command), err.c_str());
      return false;
    }
    return true;
  }

  bool MyCobotOperator::sendCommandRead(uint8_t command, const std::vector<uint8_t>& payload,
                                        std::vector<uint8_t>& reply, std::string& err) {
    if (!connection_) {
      err = "no connection (operator was moved from)";
      return false;
    }
    auto& st = cmd_stats_[command];
    st.attempts++;
    last_command_ = command;
    std::vector<uint8_t> frame = buildFrame(command, payload);
    last_tx_ = toHex(frame);
    last_rx_.clear();
    RCUTILS_LOG_DEBUG("[MyCobotOperator] %s WROTE: %s", command::commandName(command), last_tx_.c_str());
    if (!connection_->writeAndRead(frame, reply, err)) {
      st.io_fail++;
      last_rx_ = "ERR:" + err;
      RCUTILS_LOG_ERROR("[MyCobotOperator::sendCommandRead] %s failed: %s",
                        command::commandName(command), err.c_str());
      return false;
    }
    last_rx_ = toHex(reply);
    RCUTILS_LOG_DEBUG("[MyCobotOperator] %s READ: %s", command::commandName(command), last_rx_.c_str());
    return true;
  }

  bool MyCobotOperator::readValues(uint8_t command, const std::vector<uint8_t>& payload,
                                   std::vector<int16_t>& values, std::string& err) {
    std::vector<uint8_t> reply;
    if (!sendCommandRead(command, payload, reply, err)) return false;
    values = decodePayload(parseFrame(reply, command), command);
    if (values.empty()) {
      cmd_stats_[command].empty_reply++;
      RCUTILS_LOG_DEBUG("[MyCobotOperator] %s: no matching reply frame", command::commandName(command));
    }
    return true;
  }

  bool MyCobotOperator::readScalar(uint8_t command, const std::vector<uint8_t>& payload, int& out,
                                   std::string& err) {
    std::vector<int16_t> values;
    if (!readValues(command, payload, values, err)) return false;
    out = values.empty() ? -1 : values[0];
    return true;
  }

  bool MyCobotOperator::version(std::string& out, std::string& err) {
    std::vector<uint8_t> reply;
    if (!sendCommandRead(command::kVersion, {}, reply, err)) return false;
    // Every reply byte, framing included, is one Latin-1 character; emit UTF-8.
    out.clear();
    out.reserve(reply.size());
    for (uint8_t b : reply) {
      if (b < 0x80) {
        out.push_back(static_cast<char>(b));
      } else {
        out.push_back(static_cast<char>(0xC0 | (b >> 6)));
        out.push_back(static_cast<char>(0x80 | (b & 0x3F)));
      }
    }
    return true;
  }

  bool MyCobotOperator::powerOn(std::string& err) { return sendCommandWrite(command::kPowerOn, {}, err); }

  bool MyCobotOperator::powerOff(std::string& err) { return sendCommandWrite(command::kPowerOff, {}, err); }

  bool MyCobotOperator::isPowerOn(int& state, std::string& err) {
    return readScalar(command::kIsPowerOn, {}, state, err);
  }

  bool MyCobotOperator::releaseAllServos(std::string& err) {
    return sendCommandWrite(command::kReleaseAllServos, {}, err);
  }

  bool MyCobotOperator::isControllerConnected(int& state, std::string& err) {
    return readScalar(command::kIsControllerConnected, {}, state, err);
  }

  bool MyCobotOperator::getAngles(std::vector<double>& degrees, std::string& err) {
    std::vector<int16_t> values;
    if (!readValues(command::kGetAngles, {}, values, err)) return false;
    degrees.clear();
    degrees.reserve(values.size());
    for (int16_t v : values) degrees.push_back(intToAngle(v));
    return true;
  }

  bool MyCobotOperator::sendAngle(Joint id, double degree, uint8_t speed, std::string& err) {
    std::vector<uint8_t> payload{ joint(id) };
    appendInt16(payload, angleToInt(degree));
    payload.push_back(speed);
    return sendCommandWrite(command::kSendAngle, payload, err);
  }

  bool MyCobotOperator::sendAngles(const std::vector<double>& degrees, uint8_t speed, std::string& err) {
    std::vector<uint8_t> payload = encodeAngles(degrees);
    payload.push_back(speed);
    return sendCommandWrite(command::kSendAngles, payload, err);
  }

  bool MyCobotOperator::getCoords(std::vector<double>& coords, std::string& err) {
    std::vector<int16_t> values;
    if (!readValues(command::kGetCoords, {}, values, err)) return false;
    coords = intsToCoords(values);
    return true;
  }

  bool MyCobotOperator::sendCoord(Axis id, double coord, uint8_t speed, std::string& err) {
    // Single-axis moves address the axis zero based.
    std::vector<uint8_t> payload{ static_cast<uint8_t>(static_cast<uint8_t>(id) - 1) };
    appendInt16(payload, coordToInt(coord));
    payload.push_back(speed);
    return sendCommandWrite(command::kSendCoord, payload, err);
  }

  bool MyCobotOperator::sendCoords(const std::vector<double>& coords, uint8_t speed, uint8_t mode,
                                   std::string& err) {
    std::vector<uint8_t> payload = encodeCoords(coords);
    payload.push_back(speed);
    payload.push_back(mode);
    return sendCommandWrite(command::kSendCoords, payload, err);
  }

  bool MyCobotOperator::isInAnglePosition(const std::array<double, 6>& degrees, int& state,
                                          std::string& err) {
    return readScalar(command::kIsInPosition, anglePositionQuery(degrees), state, err);
  }

  bool MyCobotOperator::isInCoordPosition(const std::vector<double>& coords, int& state,
                                          std::string& err) {
    return readScalar(command::kIsInPosition, coordPositionQuery(coords), state, err);
  }

  bool MyCobotOperator::isMoving(int& state, std::string& err) {
    return readScalar(command::kIsMoving, {}, state, err);
  }

  bool MyCobotOperator::waitInPosition(const std::vector<uint8_t>& query, double timeout_sec,
                                       bool& reached, std::string& err) {
    using clock = std::chrono::steady_clock;
    reached = false;
    if (std::isnan(timeout_sec)) timeout_sec = 0.0;
    // Floating seconds: an infinite or huge timeout never expires.
    const auto start = clock::now();
    const auto poll = std::chrono::duration<double>(sync_poll_interval_sec_);
    for (;;) {
      int state = -1;
      if (!readScalar(command::kIsInPosition, query, state, err)) return false;
      if (state == 1) {
        reached = true;
        return true;
      }
      std::chrono::duration<double> elapsed = clock::now() - start;
      if (elapsed.count() >= timeout_sec) break;
      std::this_thread::sleep_for(poll);
    }
    RCUTILS_LOG_WARN("[MyCobotOperator::waitInPosition] target not reached within %.2f s", timeout_sec);
    return true;
  }

  bool MyCobotOperator::syncSendAngles(const std::array<double, 6>& degrees, uint8_t speed,
                                       double timeout_sec, bool& reached, std::string& err) {
    reached = false;
    if (!sendAngles(std::vector<double>(degrees.begin(), degrees.end()), speed, err)) return false;
    return waitInPosition(anglePositionQuery(degrees), timeout_sec, reached, err);
  }

  bool MyCobotOperator::syncSendCoords(const std::vector<double>& coords, uint8_t speed, uint8_t mode,
                                       double timeout_sec, bool& reached, std::string& err) {
    reached = false;
    if (!sendCoords(coords, speed, mode, err)) return false;
    return waitInPosition(coordPositionQuery(coords), timeout_sec, reached, err);
  }

  bool MyCobotOperator::jogAngle(Joint id, Direction direction, uint8_t speed, std::string& err) {
    std::vector<uint8_t> payload{ joint(id), static_cast<uint8_t>(direction), speed };
    return sendCommandWrite(command::kJogAngle, payload, err);
  }

  bool MyCobotOperator::jogCoord(Axis id, Direction direction, uint8_t speed, std::string& err) {
    std::vector<uint8_t> payload{ static_cast<uint8_t>(id), static_cast<uint8_t>(direction), speed };
    return sendCommandWrite(command::kJogCoord, payload, err);
  }

  bool MyCobotOperator::jogStop(std::string& err) { return sendCommandWrite(command::kJogStop, {}, err); }

  bool MyCobotOperator::pause(std::string& err) { return sendCommandWrite(command::kPause, {}, err); }

  bool MyCobotOperator::isPaused(int& state, std::string& err) {
    return readScalar(command::kIsPaused, {}, state, err);
  }

  bool MyCobotOperator::resume(std::string& err) { return sendCommandWrite(command::kResume, {}, err); }

  bool MyCobotOperator::stop(std::string& err) { return sendCommandWrite(command::kStop, {}, err); }

  bool MyCobotOperator::setEncoder(Joint id, int16_t encoder, std::string& err) {
    std::vector<uint8_t> payload{ joint(id) };
    appendInt16(payload, encoder);
    return sendCommandWrite(command::kSetEncoder, payload, err);
  }

  bool MyCobotOperator::getEncoder(Joint id, int& encoder, std::string& err) {
    return readScalar(command::kGetEncoder, { joint(id) }, encoder, err);
  }

  bool MyCobotOperator::getSpeed(int& speed, std::string& err) {
    return readScalar(command::kGetSpeed, {}, speed, err);
  }

  bool MyCobotOperator::setSpeed(uint8_t speed, std::string& err) {
    return sendCommandWrite(command::kSetSpeed, { speed }, err);
  }

  bool MyCobotOperator::isServoEnable(Joint id, int& state, std::string& err) {
    return readScalar(command::kIsServoEnable, { joint(id) }, state, err);
  }

  bool MyCobotOperator::isAllServoEnable(int& state, std::string& err) {
    return readScalar(command::kIsAllServoEnable, {}, state, err);
  }

  bool MyCobotOperator::releaseServo(Joint id, std::string& err) {
    return sendCommandWrite(command::kReleaseServo, { joint(id) }, err);
  }

  bool MyCobotOperator::focusServo(Joint id, std::string& err) {
    return sendCommandWrite(command::kFocusServo, { joint(id) }, err);
  }

  bool MyCobotOperator::setColor(uint8_t r, uint8_t g, uint8_t b, std::string& err) {
    return sendCommandWrite(command::kSetColor, { r, g, b }, err);
  }

} // namespace mycobot_driver

// MIT License
// myCobot controller client: one transaction per call over an owned connection.
#pragma once
#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "mycobot_driver/command.hpp"
#include "mycobot_driver/transport.hpp"

namespace mycobot_driver {

  // All operations return false only when the connection fails; err then holds
  // the transport message. Replies that cannot be located or belong to another
  // opcode are not errors: scalar queries report -1, vector queries an empty
  // vector. A moved-from operator has no connection and fails every call.
  class MyCobotOperator {
  public:
    explicit MyCobotOperator(std::unique_ptr<IConnection> connection);
    MyCobotOperator(MyCobotOperator&&) = default;
    MyCobotOperator& operator=(MyCobotOperator&&) = default;

    // Every raw reply byte as one Latin-1 character, UTF-8 encoded.
    bool version(std::string& out, std::string& err);

    bool powerOn(std::string& err);
    bool powerOff(std::string& err);
    bool isPowerOn(int& state, std::string& err);
    bool releaseAllServos(std::string& err);
    bool isControllerConnected(int& state, std::string& err);

    bool getAngles(std::vector<double>& degrees, std::string& err);
    bool sendAngle(Joint id, double degree, uint8_t speed, std::string& err);
    bool sendAngles(const std::vector<double>& degrees, uint8_t speed, std::string& err);
    bool getCoords(std::vector<double>& coords, std::string& err);
    bool sendCoord(Axis id, double coord, uint8_t speed, std::string& err);
    bool sendCoords(const std::vector<double>& coords, uint8_t speed, uint8_t mode, std::string& err);

    bool isInAnglePosition(const std::array<double, 6>& degrees, int& state, std::string& err);
    bool isInCoordPosition(const std::vector<double>& coords, int& state, std::string& err);
    bool isMoving(int& state, std::string& err);

    // Blocking moves: send the target, then poll the in-position query every
    // poll interval until it reports 1 or timeout_sec elapses. The position is
    // queried at least once; an infinite timeout waits indefinitely. reached is
    // false on timeout.
    bool syncSendAngles(const std::array<double, 6>& degrees, uint8_t speed, double timeout_sec,
                        bool& reached, std::string& err);
    bool syncSendCoords(const std::vector<double>& coords, uint8_t speed, uint8_t mode,
                        double timeout_sec, bool& reached, std::string& err);

    bool jogAngle(Joint id, Direction direction, uint8_t speed, std::string& err);
    bool jogCoord(Axis id, Direction direction, uint8_t speed, std::string& err);
    bool jogStop(std::string& err);

    bool pause(std::string& err);
    bool isPaused(int& state, std::string& err);
    bool resume(std::string& err);
    bool stop(std::string& err);

    bool setEncoder(Joint id, int16_t encoder, std::string& err);
    bool getEncoder(Joint id, int& encoder, std::string& err);

    bool getSpeed(int& speed, std::string& err);
    bool setSpeed(uint8_t speed, std::string& err);

    bool isServoEnable(Joint id, int& state, std::string& err);
    bool isAllServoEnable(int& state, std::string& err);
    bool releaseServo(Joint id, std::string& err);
    bool focusServo(Joint id, std::string& err);

    bool setColor(uint8_t r, uint8_t g, uint8_t b, std::string& err);

    void setSyncPollInterval(double sec) { sync_poll_interval_sec_ = sec; }
    double syncPollInterval() const { return sync_poll_interval_sec_; }

    // Diagnostics
    std::string lastTx() const { return last_tx_; }
    std::string lastRx() const { return last_rx_; }
    uint8_t lastCommand() const { return last_command_; }

    struct CommandStats { uint32_t attempts = 0; uint32_t io_fail = 0; uint32_t empty_reply = 0; };
    const CommandStats& stats(uint8_t cmd) const { return cmd_stats_[cmd]; }

  private:
    std::unique_ptr<IConnection> connection_;
    double sync_poll_interval_sec_ = 0.1;
    std::string last_tx_;
    std::string last_rx_;
    uint8_t last_command_ = 0;
    std::array<CommandStats, 256> cmd_stats_{};

    bool sendCommandWrite(uint8_t command, const std::vector<uint8_t>& payload, std::string& err);
    bool sendCommandRead(uint8_t command, const std::vector<uint8_t>& payload,
                         std::vector<uint8_t>& reply, std::string& err);
    bool readValues(uint8_t command, const std::vector<uint8_t>& payload,
                    std::vector<int16_t>& values, std::string& err);
    bool readScalar(uint8_t command, const std::vector<uint8_t>& payload, int& out,
                    std::string& err);
    bool waitInPosition(const std::vector<uint8_t>& query, double timeout_sec, bool& reached,
                        std::string& err);
  };

} // namespace mycobot_driver

// MIT License
#pragma once
#include <memory>
#include <string>

#include <rclcpp/rclcpp.hpp>

#include "mycobot_driver/mycobot_operator.hpp"

namespace mycobot_driver {
namespace params {
// Parameter name constants
static constexpr const char* kPort = "device_name";                 // serial path
static constexpr const char* kBaudRate = "baud_rate";
static constexpr const char* kReadTimeout = "read_timeout";          // seconds to wait for a reply
static constexpr const char* kSyncPollInterval = "sync_poll_interval";
static constexpr const char* kDebug = "do_debug";
// Defaults
struct Defaults {
  const char* port = "/dev/ttyUSB0";
  int baud_rate = 115200;
  double read_timeout = 0.1;
  double sync_poll_interval = 0.1;
  bool debug = false;
};
}  // namespace params

struct OperatorParams {
  std::string port = params::Defaults().port;
  int baud_rate = params::Defaults().baud_rate;
  double read_timeout = params::Defaults().read_timeout;
  double sync_poll_interval = params::Defaults().sync_poll_interval;
  bool debug = params::Defaults().debug;
};

// Declares every parameter on node (if not yet declared) and reads it back.
OperatorParams loadParams(rclcpp::Node& node);

// Opens the serial port named in p. Returns nullptr and sets err if the port
// cannot be opened.
std::unique_ptr<MyCobotOperator> makeSerialOperator(const OperatorParams& p, std::string& err);

}  // namespace mycobot_driver

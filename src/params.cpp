// MIT License
#include "mycobot_driver/params.hpp"

#include <rcutils/logging.h>

namespace mycobot_driver {

namespace {
template <typename T>
T declareOrGet(rclcpp::Node& node, const char* name, const T& default_value) {
  if (!node.has_parameter(name)) node.declare_parameter<T>(name, default_value);
  return node.get_parameter(name).get_value<T>();
}
}  // namespace

OperatorParams loadParams(rclcpp::Node& node) {
  params::Defaults d;
  OperatorParams p;
  p.port = declareOrGet<std::string>(node, params::kPort, d.port);
  p.baud_rate = static_cast<int>(declareOrGet<int64_t>(node, params::kBaudRate, d.baud_rate));
  p.read_timeout = declareOrGet<double>(node, params::kReadTimeout, d.read_timeout);
  p.sync_poll_interval = declareOrGet<double>(node, params::kSyncPollInterval, d.sync_poll_interval);
  p.debug = declareOrGet<bool>(node, params::kDebug, d.debug);

  RCLCPP_INFO(node.get_logger(), "=== myCobot Driver Configuration ===");
  RCLCPP_INFO(node.get_logger(), "Device: port=%s, baud=%d, read_timeout=%.3f s", p.port.c_str(),
              p.baud_rate, p.read_timeout);
  RCLCPP_INFO(node.get_logger(), "Sync moves: poll=%.3f s", p.sync_poll_interval);
  if (p.read_timeout <= 0.0) {
    RCLCPP_WARN(node.get_logger(), "%s must be positive, using %.3f", params::kReadTimeout,
                d.read_timeout);
    p.read_timeout = d.read_timeout;
  }
  if (p.sync_poll_interval <= 0.0) {
    RCLCPP_WARN(node.get_logger(), "%s must be positive, using %.3f", params::kSyncPollInterval,
                d.sync_poll_interval);
    p.sync_poll_interval = d.sync_poll_interval;
  }
  return p;
}

std::unique_ptr<MyCobotOperator> makeSerialOperator(const OperatorParams& p, std::string& err) {
  if (p.debug) rcutils_logging_set_default_logger_level(RCUTILS_LOG_SEVERITY_DEBUG);
  auto transport = std::make_unique<SerialTransport>(p.port, p.baud_rate, p.read_timeout);
  if (!transport->ok()) {
    err = transport->openError();
    return nullptr;
  }
  auto op = std::make_unique<MyCobotOperator>(std::move(transport));
  op->setSyncPollInterval(p.sync_poll_interval);
  return op;
}

}  // namespace mycobot_driver

// MIT License
#include <gtest/gtest.h>

#include <rclcpp/rclcpp.hpp>

#include "mycobot_driver/params.hpp"

using namespace mycobot_driver;

class ParamsTest : public ::testing::Test {
 protected:
  static void SetUpTestSuite() { rclcpp::init(0, nullptr); }
  static void TearDownTestSuite() { rclcpp::shutdown(); }
};

TEST_F(ParamsTest, DefaultsWhenNothingIsSet) {
  auto node = std::make_shared<rclcpp::Node>("mycobot_params_defaults");
  OperatorParams p = loadParams(*node);
  EXPECT_EQ(p.port, "/dev/ttyUSB0");
  EXPECT_EQ(p.baud_rate, 115200);
  EXPECT_DOUBLE_EQ(p.read_timeout, 0.1);
  EXPECT_DOUBLE_EQ(p.sync_poll_interval, 0.1);
  EXPECT_FALSE(p.debug);
  EXPECT_TRUE(node->has_parameter(params::kPort));
  EXPECT_TRUE(node->has_parameter(params::kDebug));
}

TEST_F(ParamsTest, OverridesFromNodeOptions) {
  rclcpp::NodeOptions opts;
  opts.parameter_overrides({
    rclcpp::Parameter(params::kPort, std::string("/dev/ttyACM1")),
    rclcpp::Parameter(params::kBaudRate, 1000000),
    rclcpp::Parameter(params::kReadTimeout, 0.25),
  });
  auto node = std::make_shared<rclcpp::Node>("mycobot_params_overrides", opts);
  OperatorParams p = loadParams(*node);
  EXPECT_EQ(p.port, "/dev/ttyACM1");
  EXPECT_EQ(p.baud_rate, 1000000);
  EXPECT_DOUBLE_EQ(p.read_timeout, 0.25);
}

TEST_F(ParamsTest, NonPositiveIntervalsFallBackToDefaults) {
  rclcpp::NodeOptions opts;
  opts.parameter_overrides({
    rclcpp::Parameter(params::kReadTimeout, 0.0),
    rclcpp::Parameter(params::kSyncPollInterval, -1.0),
  });
  auto node = std::make_shared<rclcpp::Node>("mycobot_params_clamp", opts);
  OperatorParams p = loadParams(*node);
  EXPECT_DOUBLE_EQ(p.read_timeout, 0.1);
  EXPECT_DOUBLE_EQ(p.sync_poll_interval, 0.1);
}

TEST_F(ParamsTest, SerialOperatorFailsOnMissingPort) {
  OperatorParams p;
  p.port = "/dev/mycobot_does_not_exist";
  std::string err;
  auto op = makeSerialOperator(p, err);
  EXPECT_EQ(op, nullptr);
  EXPECT_NE(err.find("open failed"), std::string::npos);
}

// MIT License
#include "mycobot_driver/unit_codec.hpp"

#include <cmath>

namespace mycobot_driver {

namespace {
constexpr double kAngleScale = 100.0;
constexpr double kCoordScale = 10.0;
constexpr size_t kCoordAxes = 3;

// Truncate toward zero, then keep the low 16 bits.
int16_t truncateToInt16(double scaled) {
  if (!std::isfinite(scaled)) return 0;
  double wrapped = std::fmod(std::trunc(scaled), 65536.0);
  uint16_t bits = static_cast<uint16_t>(static_cast<int32_t>(wrapped));
  return static_cast<int16_t>(bits);
}
}  // namespace

int16_t angleToInt(double degree) { return truncateToInt16(degree * kAngleScale); }

int16_t coordToInt(double mm) { return truncateToInt16(mm * kCoordScale); }

double intToAngle(int16_t val) { return static_cast<double>(val) / kAngleScale; }

double intToCoord(int16_t val) { return static_cast<double>(val) / kCoordScale; }

std::vector<int16_t> coordsToInts(const std::vector<double>& coords) {
  std::vector<int16_t> out;
  out.reserve(coords.size());
  for (size_t i = 0; i < coords.size(); ++i)
    out.push_back(i < kCoordAxes ? coordToInt(coords[i]) : angleToInt(coords[i]));
  return out;
}

std::vector<double> intsToCoords(const std::vector<int16_t>& vals) {
  std::vector<double> out;
  out.reserve(vals.size());
  for (size_t i = 0; i < vals.size(); ++i)
    out.push_back(i < kCoordAxes ? intToCoord(vals[i]) : intToAngle(vals[i]));
  return out;
}

}  // namespace mycobot_driver

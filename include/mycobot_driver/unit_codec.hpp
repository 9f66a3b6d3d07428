// MIT License
#pragma once
#include <cstdint>
#include <vector>

namespace mycobot_driver {

// Fixed-point conversion between physical units and 16-bit wire integers.
// Angles travel as degrees * 100, coordinates as millimetres * 10. Encoding
// truncates toward zero and wraps modulo 2^16 when out of range.
int16_t angleToInt(double degree);
int16_t coordToInt(double mm);
double intToAngle(int16_t val);
double intToCoord(int16_t val);

// Pose vectors: indices 0-2 are coordinates, 3-5 are angles.
std::vector<int16_t> coordsToInts(const std::vector<double>& coords);
std::vector<double> intsToCoords(const std::vector<int16_t>& vals);

}  // namespace mycobot_driver

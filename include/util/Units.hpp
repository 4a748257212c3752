#pragma once
#include <string>
#include <string_view>

namespace ignitor::util {

// 1 MEU = 10,000,000 EU
inline constexpr double kEuPerMeu = 10'000'000.0;
inline constexpr double kEuPerKeu = 1'000.0;
inline constexpr double kKelvinPerGk = 1e9;
inline constexpr double kKelvinPerMk = 1e6;

struct Scaled {
  double value{0.0};
  std::string_view unit;
};

// Pick the largest unit whose magnitude is >= 0.1; the base unit takes
// anything (zero and negatives included).
[[nodiscard]] Scaled scale_energy(double eu);
[[nodiscard]] Scaled scale_temperature(double kelvin);

// "12.50 MEU", "3.40 KEU", "42 EU" (two decimals except the base unit)
[[nodiscard]] std::string format_energy(double eu);
[[nodiscard]] std::string format_temperature(double kelvin);

} // namespace ignitor::util

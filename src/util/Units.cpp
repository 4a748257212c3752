#include "util/Units.hpp"
#include <cstdio>

namespace ignitor::util {

Scaled scale_energy(double eu) {
  double meu = eu / kEuPerMeu;
  if (meu >= 0.1) return {meu, "MEU"};
  double keu = eu / kEuPerKeu;
  if (keu >= 0.1) return {keu, "KEU"};
  return {eu, "EU"};
}

Scaled scale_temperature(double kelvin) {
  double gk = kelvin / kKelvinPerGk;
  if (gk >= 0.1) return {gk, "GK"};
  double mk = kelvin / kKelvinPerMk;
  if (mk >= 0.1) return {mk, "MK"};
  return {kelvin, "K"};
}

static std::string format_scaled(const Scaled& s, std::string_view base_unit) {
  char buf[64];
  const int precision = (s.unit == base_unit) ? 0 : 2;
  std::snprintf(buf, sizeof(buf), "%.*f %.*s", precision, s.value,
                static_cast<int>(s.unit.size()), s.unit.data());
  return std::string(buf);
}

std::string format_energy(double eu) {
  return format_scaled(scale_energy(eu), "EU");
}

std::string format_temperature(double kelvin) {
  return format_scaled(scale_temperature(kelvin), "K");
}

} // namespace ignitor::util

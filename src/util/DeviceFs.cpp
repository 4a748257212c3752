#include "util/DeviceFs.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iterator>

namespace ignitor::util {

static std::string trimmed(const std::string& s) {
  std::size_t b = 0, e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

auto read_file_string(const std::filesystem::path& p) -> std::optional<std::string> {
  std::ifstream in(p);
  if (!in) return std::nullopt;
  std::string s((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) return std::nullopt;
  return s;
}

auto read_number(const std::filesystem::path& p) -> std::optional<double> {
  auto raw = read_file_string(p);
  if (!raw) return std::nullopt;
  std::string s = trimmed(*raw);
  if (s.empty()) return std::nullopt;
  errno = 0;
  char* end = nullptr;
  double v = std::strtod(s.c_str(), &end);
  if (end != s.c_str() + s.size() || errno == ERANGE) return std::nullopt;
  if (!std::isfinite(v)) return std::nullopt;
  return v;
}

auto read_flag(const std::filesystem::path& p) -> std::optional<bool> {
  auto raw = read_file_string(p);
  if (!raw) return std::nullopt;
  std::string s = trimmed(*raw);
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (s == "1" || s == "true") return true;
  if (s == "0" || s == "false") return false;
  return std::nullopt;
}

bool write_file_string(const std::filesystem::path& p, const std::string& content) {
  std::ofstream out(p, std::ios::trunc);
  if (!out.is_open()) return false;
  out << content;
  out.flush();
  return out.good();
}

} // namespace ignitor::util

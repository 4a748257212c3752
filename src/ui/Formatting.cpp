#include "ui/Formatting.hpp"
#include <algorithm>

namespace ignitor::ui {

int u8_len(unsigned char c){
  if (c < 0x80) return 1;
  if ((c >> 5) == 0x6) return 2;
  if ((c >> 4) == 0xE) return 3;
  if ((c >> 3) == 0x1E) return 4;
  return 1;
}

int display_cols(std::string_view s){
  int cols = 0;
  for (size_t i=0; i<s.size();){
    int len = u8_len((unsigned char)s[i]);
    i += len;
    cols += 1;
  }
  return cols;
}

std::string take_cols(std::string_view s, int cols){
  if (cols <= 0) return std::string();
  std::string out;
  out.reserve(s.size());
  int seen = 0;
  size_t i = 0;
  while (i < s.size() && seen < cols) {
    int len = u8_len((unsigned char)s[i]);
    if (i + (size_t)len > s.size()) len = 1; // guard
    out.append(s, i, len);
    i += len;
    seen += 1;
  }
  return out;
}

std::vector<std::string> split_cols(std::string_view s) {
  std::vector<std::string> out;
  out.reserve(s.size());
  size_t i = 0;
  while (i < s.size()) {
    size_t len = (size_t)u8_len((unsigned char)s[i]);
    if (i + len > s.size()) len = 1;
    out.emplace_back(s.substr(i, len));
    i += len;
  }
  return out;
}

std::string repeat_str(std::string_view ch, int n){
  std::string r;
  r.reserve(std::max(0, n * (int)ch.size()));
  for (int i=0;i<n;i++) r += ch;
  return r;
}

std::string center_pad(std::string_view s, int w) {
  if (w <= 0) return std::string();
  std::string label = take_cols(s, w);
  int pad = w - display_cols(label);
  int left = pad / 2;
  int right = pad - left;
  return std::string(left, ' ') + label + std::string(right, ' ');
}

} // namespace ignitor::ui

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace ignitor::ui {

// UTF-8 text width utilities (one cell per codepoint; our glyph set is
// ASCII plus box-drawing and block characters)
int u8_len(unsigned char c);
int display_cols(std::string_view s);
std::string take_cols(std::string_view s, int cols);
std::vector<std::string> split_cols(std::string_view s);

std::string repeat_str(std::string_view ch, int n);

// Center text in w cells: floor of the padding on the left, the rest on
// the right. Text wider than w is cut to w.
std::string center_pad(std::string_view s, int w);

} // namespace ignitor::ui

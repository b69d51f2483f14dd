#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace cmg::unicode {

// Unicode White_Space plus U+001C..U+001F
bool is_whitespace(uint32_t codepoint);

// Split on runs of Unicode whitespace; no empty pieces
std::vector<std::string> split_whitespace(const std::string& text);

} // namespace cmg::unicode

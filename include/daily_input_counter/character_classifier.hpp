#pragma once

#include <string>
#include <vector>

#include "daily_input_counter/types.hpp"

namespace dic::stats {

// Ranges are tried in the order Chinese, English, Number, Symbol; anything
// unmatched is Other.
[[nodiscard]] Category classify(char32_t code_point) noexcept;

// Malformed sequences decode to U+FFFD.
[[nodiscard]] std::vector<char32_t> decodeUtf8(const std::string& text);

[[nodiscard]] CounterSet analyzeText(const std::string& text);

}  // namespace dic::stats

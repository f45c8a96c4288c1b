#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace rlk::text {

// Lowercases ASCII and keeps runs of [a-z0-9]; everything else separates tokens.
std::vector<std::string> tokenize(std::string_view text);

// Comparison key: the tokens concatenated, so separators never affect a match.
// "My-File_01.MOV" -> "myfile01mov".
std::string normalize(std::string_view text);

std::string to_lower(std::string_view text);

} // namespace rlk::text

#include "rlk/text.h"

namespace rlk::text {

namespace {
char fold(char c) {
  if (c >= 'A' && c <= 'Z') return static_cast<char>(c - 'A' + 'a');
  return c;
}

bool is_token_char(char c) {
  return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
}
} // namespace

std::vector<std::string> tokenize(std::string_view text) {
  std::vector<std::string> tokens;
  std::string current;
  for (char raw : text) {
    const char c = fold(raw);
    if (is_token_char(c)) {
      current.push_back(c);
    } else if (!current.empty()) {
      tokens.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) {
    tokens.push_back(std::move(current));
  }
  return tokens;
}

std::string normalize(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (char raw : text) {
    const char c = fold(raw);
    if (is_token_char(c)) out.push_back(c);
  }
  return out;
}

std::string to_lower(std::string_view text) {
  std::string out(text);
  for (auto& c : out) c = fold(c);
  return out;
}

} // namespace rlk::text

#pragma once

#include <cctype>
#include <string>
#include <vector>

namespace rsvp_reader {

/// A single displayable word. Punctuation stays attached ("begin.").
using Token = std::string;

/// Split raw page text into display tokens.
///
/// Any run of whitespace (space, tab, newline, carriage return, vertical
/// tab, form feed) separates tokens. Delimiters are dropped, order is kept
/// and empty tokens are never produced, so "" and "  \n " both yield an
/// empty sequence.
inline std::vector<Token> tokenize(const std::string& text) {
  std::vector<Token> out;
  std::string current;
  current.reserve(32);
  for (char c : text) {
    unsigned char uc = static_cast<unsigned char>(c);
    if (std::isspace(uc)) {
      if (!current.empty()) {
        out.push_back(current);
        current.clear();
      }
    } else {
      current.push_back(c);
    }
  }
  if (!current.empty()) out.push_back(current);
  return out;
}

}  // namespace rsvp_reader

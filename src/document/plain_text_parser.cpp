#include "document/document_parser.hpp"

#include <algorithm>

#include "errors.hpp"

namespace rsvp_reader {

std::vector<std::string> ordered_page_texts(const PageTextMap& pages) {
  // std::map iterates in ascending key order.
  std::vector<std::string> out;
  out.reserve(pages.size());
  for (const auto& [number, text] : pages) {
    out.push_back(text);
  }
  return out;
}

PageTextMap PlainTextParser::parse(const std::vector<std::uint8_t>& bytes) const {
  if (bytes.empty()) {
    throw DocumentParseError("PlainTextParser: document is empty");
  }
  if (std::find(bytes.begin(), bytes.end(), std::uint8_t{0}) != bytes.end()) {
    throw DocumentParseError("PlainTextParser: input contains NUL bytes, not a text document");
  }

  PageTextMap pages;
  int page_number = 1;
  std::string current;
  for (std::uint8_t b : bytes) {
    char c = static_cast<char>(b);
    if (c == kPageBreak) {
      pages.emplace(page_number++, std::move(current));
      current.clear();
    } else {
      current.push_back(c);
    }
  }
  pages.emplace(page_number, std::move(current));
  return pages;
}

}  // namespace rsvp_reader

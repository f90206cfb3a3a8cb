#include "document/document.hpp"

#include <numeric>
#include <utility>

#include "errors.hpp"

namespace rsvp_reader {

Document Document::placeholder(const std::string& text) {
  return build_document({text});
}

std::size_t Document::word_count() const {
  return std::accumulate(pages_.begin(), pages_.end(), std::size_t{0},
                         [](std::size_t total, const Page& p) { return total + p.size(); });
}

Document build_document(const std::vector<std::string>& pages_raw) {
  std::vector<Page> pages;
  pages.reserve(pages_raw.size());
  for (const auto& raw : pages_raw) {
    Page page = tokenize(raw);
    if (!page.empty()) {
      pages.push_back(std::move(page));
    }
  }
  if (pages.empty()) {
    throw EmptyDocumentError("build_document: no textual content found in " +
                             std::to_string(pages_raw.size()) + " page(s)");
  }
  return Document(std::move(pages));
}

}  // namespace rsvp_reader

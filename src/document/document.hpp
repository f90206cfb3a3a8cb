#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "text/tokenizer.hpp"

namespace rsvp_reader {

/// One page of a document: an ordered, never-empty run of tokens.
using Page = std::vector<Token>;

/// An ordered collection of pages.
///
/// Every Document holds at least one page and every page at least one
/// token; the only ways to obtain one are build_document() and
/// placeholder(), both of which enforce this. A Document carries no
/// presentation state (no cursor, no speed) and is replaced wholesale
/// rather than mutated.
class Document {
public:
  /// Single-page document used before anything has been uploaded.
  /// Throws EmptyDocumentError if `text` has no tokens.
  static Document placeholder(const std::string& text);

  std::size_t page_count() const { return pages_.size(); }
  const Page& page(std::size_t index) const { return pages_.at(index); }
  const std::vector<Page>& pages() const { return pages_; }

  /// Total number of tokens across all pages.
  std::size_t word_count() const;

private:
  explicit Document(std::vector<Page> pages) : pages_(std::move(pages)) {}

  friend Document build_document(const std::vector<std::string>& pages_raw);

  std::vector<Page> pages_;
};

/// Build a Document from raw per-page text.
///
/// Pages are tokenized in input order; pages without tokens are dropped and
/// the survivors keep their relative order. The caller is responsible for
/// passing pages already sorted by page number.
/// Throws EmptyDocumentError if no page has any token.
Document build_document(const std::vector<std::string>& pages_raw);

}  // namespace rsvp_reader

#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace rsvp_reader {

/// Raw text of a document, keyed by 1-based page number.
using PageTextMap = std::map<int, std::string>;

/// Turns uploaded document bytes into per-page raw text.
///
/// Implementations throw DocumentParseError for a document-level failure
/// (unreadable container, wrong format). A page that merely has no text is
/// not an error: it is returned as an empty string and dropped later by
/// build_document().
class DocumentParser {
public:
  virtual ~DocumentParser() = default;

  virtual PageTextMap parse(const std::vector<std::uint8_t>& bytes) const = 0;

  /// Short human-readable format name, used in log lines.
  virtual std::string name() const = 0;
};

/// Flatten a page map into page-number order, ready for build_document().
std::vector<std::string> ordered_page_texts(const PageTextMap& pages);

/// Plain text where a form feed ('\f') starts a new page.
///
/// Pages are numbered from 1 in file order. An empty buffer or one that
/// contains NUL bytes (i.e. is not text at all) is a parse error.
class PlainTextParser : public DocumentParser {
public:
  static constexpr char kPageBreak = '\f';

  PageTextMap parse(const std::vector<std::uint8_t>& bytes) const override;
  std::string name() const override { return "plain text"; }
};

}  // namespace rsvp_reader

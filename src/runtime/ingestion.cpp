#include "runtime/ingestion.hpp"

#include <utility>

#include "document/document.hpp"

namespace rsvp_reader {

void ingest(Reader& reader, const std::vector<std::string>& pages_raw) {
  // build_document() throws before the reader is touched.
  Document document = build_document(pages_raw);
  reader.replace_document(std::move(document));
}

}  // namespace rsvp_reader

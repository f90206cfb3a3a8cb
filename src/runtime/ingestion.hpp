#pragma once

#include <string>
#include <vector>

#include "runtime/reader.hpp"

namespace rsvp_reader {

/// Replace the reader's document with one built from `pages_raw`.
///
/// `pages_raw` must already be in page order. On success the cursor is reset
/// to the first word of the first non-empty page and playback starts. Throws EmptyDocumentError if no page holds any text; the
/// reader is then left exactly as it was.
void ingest(Reader& reader, const std::vector<std::string>& pages_raw);

}  // namespace rsvp_reader

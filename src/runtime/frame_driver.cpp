#include "runtime/frame_driver.hpp"

#include <iostream>
#include <utility>

#include "errors.hpp"
#include "runtime/ingestion.hpp"

namespace rsvp_reader {

const char* to_string(IngestStatus status) {
  switch (status) {
    case IngestStatus::None: return "none";
    case IngestStatus::Ingested: return "ingested";
    case IngestStatus::EmptyDocument: return "empty document";
    case IngestStatus::ParseFailed: return "parse failed";
  }
  return "unknown";
}

FrameDriver::FrameDriver(Reader& reader, UploadMailbox& mailbox, const DocumentParser& parser)
    : reader_(reader), mailbox_(mailbox), parser_(parser) {}

std::optional<DisplayChunk> FrameDriver::frame(PacingClock::Seconds elapsed) {
  ++frame_count_;
  poll_upload();

  const bool was_playing = reader_.is_playing();
  auto chunk = reader_.tick(elapsed);

  if (log_) {
    if (chunk) {
      std::cout << "[reader] frame=" << frame_count_
                << "  page=" << (chunk->page_index + 1) << "/" << reader_.page_count()
                << "  word=" << chunk->first_word
                << "  | " << chunk->text << std::endl;
    } else if (was_playing && !reader_.is_playing()) {
      std::cout << "[reader] frame=" << frame_count_ << "  end of document, paused" << std::endl;
    }
  }
  return chunk;
}

bool FrameDriver::poll_upload() {
  auto bytes = mailbox_.take();
  if (!bytes) return false;

  if (log_) {
    std::cout << "[ingest] received " << bytes->size() << " bytes, parsing as "
              << parser_.name() << std::endl;
  }

  std::vector<std::string> pages;
  try {
    pages = ordered_page_texts(parser_.parse(*bytes));
  } catch (const DocumentParseError& e) {
    report_failure(IngestStatus::ParseFailed, e.what());
    return false;
  }

  try {
    ingest(reader_, pages);
  } catch (const EmptyDocumentError& e) {
    report_failure(IngestStatus::EmptyDocument, e.what());
    return false;
  }

  last_status_ = IngestStatus::Ingested;
  last_message_ = "document loaded: " + std::to_string(reader_.page_count()) + " page(s), " +
                  std::to_string(reader_.document().word_count()) + " word(s)";
  if (log_) {
    std::cout << "[ingest] " << last_message_ << std::endl;
  }
  return true;
}

void FrameDriver::report_failure(IngestStatus status, const std::string& message) {
  last_status_ = status;
  last_message_ = message;
  std::cerr << "Warning: upload rejected (" << to_string(status) << "): " << message << "\n";
}

}  // namespace rsvp_reader

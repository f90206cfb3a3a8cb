#pragma once

#include <optional>
#include <string>

#include "document/document_parser.hpp"
#include "pacing/pacing_clock.hpp"
#include "runtime/reader.hpp"
#include "runtime/upload_mailbox.hpp"

namespace rsvp_reader {

/// Outcome of the most recent upload handled by the frame driver.
enum class IngestStatus {
  None,           ///< Nothing has been uploaded yet.
  Ingested,       ///< The upload replaced the active document.
  EmptyDocument,  ///< Parsed fine but held no text; document kept.
  ParseFailed     ///< The parser rejected the bytes; document kept.
};

const char* to_string(IngestStatus status);

/// Per-frame adapter between the outside world and a Reader.
///
/// Each frame() polls the upload mailbox, parses and ingests at most one
/// upload, then ticks the reader. Failed uploads are reported (status,
/// message and a warning on stderr) and never touch the reader.
///
/// The driver borrows its collaborators; they must outlive it.
class FrameDriver {
public:
  FrameDriver(Reader& reader, UploadMailbox& mailbox, const DocumentParser& parser);

  /// Run one frame. Returns the chunk that became due, if any.
  std::optional<DisplayChunk> frame(PacingClock::Seconds elapsed);

  /// Take a pending upload, if any, and ingest it. Returns true when the
  /// reader's document was replaced.
  bool poll_upload();

  IngestStatus last_ingest_status() const { return last_status_; }
  const std::string& last_ingest_message() const { return last_message_; }

  /// Frames run since construction.
  long long frame_count() const { return frame_count_; }

  /// Enable/disable per-event logging to stdout.
  void set_log(bool enabled) { log_ = enabled; }
  bool log() const { return log_; }

  Reader& reader() { return reader_; }
  const Reader& reader() const { return reader_; }

private:
  void report_failure(IngestStatus status, const std::string& message);

  Reader& reader_;
  UploadMailbox& mailbox_;
  const DocumentParser& parser_;
  bool log_{false};
  IngestStatus last_status_{IngestStatus::None};
  std::string last_message_;
  long long frame_count_{0};
};

}  // namespace rsvp_reader

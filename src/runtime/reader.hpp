#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "document/document.hpp"
#include "pacing/pacing_clock.hpp"

namespace rsvp_reader {

enum class PlaybackMode {
  Paused,
  Playing
};

/// A group of consecutive tokens revealed together at one pacing interval.
struct DisplayChunk {
  std::string text;             ///< Tokens joined by single spaces.
  std::size_t page_index = 0;   ///< Page the tokens came from.
  std::size_t first_word = 0;   ///< Index of the first token on that page.
  std::size_t word_count = 0;   ///< Number of tokens in the chunk.
};

/// The RSVP reading state machine.
///
/// Owns the current Document, the cursor (page index, word index), the
/// pacing configuration and the playback mode. Nothing else mutates them:
/// the frame loop calls tick() once per frame with the time elapsed since
/// the previous frame, and a UI calls the control operations below.
///
/// The word index may equal the current page's length; that "page
/// exhausted" state is resolved on the next chunk, which rolls to the
/// following page within the same tick so a page boundary never produces a
/// blank frame. Exhausting the last page pauses playback.
///
/// Validation failures (OutOfRangeError, InvalidParameterError) leave all
/// state untouched.
class Reader {
public:
  static constexpr const char* kDefaultPlaceholder = "Upload a document to begin.";

  explicit Reader(const PacingConfig& pacing = {});
  Reader(Document document, const PacingConfig& pacing);

  // --- Control surface ---

  /// Paused <-> Playing. Nothing else changes.
  void toggle_play_pause();

  /// Move the cursor to the start of `page_index`. Mode is unchanged.
  /// Throws OutOfRangeError for an index outside [0, page_count()).
  void seek_to_page(int page_index);

  /// Change speed and chunk size. Progress already accumulated towards the
  /// next chunk is kept; if it already covers the new interval the chunk is
  /// due on the next tick. Throws InvalidParameterError on wpm <= 0 or
  /// chunk_size < 1.
  void set_pacing(double words_per_minute, int chunk_size);

  void set_catch_up_policy(CatchUpPolicy policy) { pacing_.catch_up = policy; }

  /// Advance by one frame. Returns the chunk to display when one became due,
  /// std::nullopt otherwise (including while paused, where the pacing clock
  /// does not accumulate).
  std::optional<DisplayChunk> tick(PacingClock::Seconds elapsed);

  /// Swap in a new document and start playing it: cursor goes to (0, 0),
  /// the displayed chunk and clock progress are cleared. Pacing is kept.
  void replace_document(Document document);

  // --- Accessors ---

  PlaybackMode mode() const { return mode_; }
  bool is_playing() const { return mode_ == PlaybackMode::Playing; }
  std::size_t page_index() const { return page_index_; }
  std::size_t word_index() const { return word_index_; }
  std::size_t page_count() const { return document_.page_count(); }
  const Document& document() const { return document_; }
  const PacingConfig& pacing() const { return pacing_; }
  PacingClock::Seconds interval() const { return clock_.interval(); }

  /// Text of the most recently emitted chunk; empty until the first chunk of
  /// the current document. Kept on seek and at end of document.
  const std::string& current_chunk() const { return current_chunk_; }

  /// Fraction of the current page already shown, in [0, 1].
  double progress() const;

private:
  /// Emit the chunk at the cursor, rolling to the next page if the current
  /// one is exhausted. Returns std::nullopt (and pauses) at end of document.
  std::optional<DisplayChunk> next_chunk();

  Document document_;
  PacingConfig pacing_;
  PacingClock clock_;
  PlaybackMode mode_{PlaybackMode::Paused};
  std::size_t page_index_{0};
  std::size_t word_index_{0};
  std::string current_chunk_;
};

}  // namespace rsvp_reader

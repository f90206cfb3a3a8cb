#include "runtime/reader.hpp"

#include <algorithm>
#include <utility>

#include "errors.hpp"

namespace rsvp_reader {

Reader::Reader(const PacingConfig& pacing)
    : Reader(Document::placeholder(kDefaultPlaceholder), pacing) {}

Reader::Reader(Document document, const PacingConfig& pacing)
    : document_(std::move(document)),
      pacing_(pacing),
      clock_(pacing.words_per_minute, pacing.chunk_size) {}

void Reader::toggle_play_pause() {
  mode_ = (mode_ == PlaybackMode::Playing) ? PlaybackMode::Paused : PlaybackMode::Playing;
}

void Reader::seek_to_page(int page_index) {
  if (page_index < 0 || static_cast<std::size_t>(page_index) >= document_.page_count()) {
    throw OutOfRangeError("Reader::seek_to_page: page " + std::to_string(page_index) +
                          " outside [0, " + std::to_string(document_.page_count()) + ")");
  }
  page_index_ = static_cast<std::size_t>(page_index);
  word_index_ = 0;
}

void Reader::set_pacing(double words_per_minute, int chunk_size) {
  // set_rate() validates before touching the clock.
  clock_.set_rate(words_per_minute, chunk_size);
  pacing_.words_per_minute = words_per_minute;
  pacing_.chunk_size = chunk_size;
}

std::optional<DisplayChunk> Reader::tick(PacingClock::Seconds elapsed) {
  if (mode_ == PlaybackMode::Paused || document_.page_count() == 0) {
    return std::nullopt;
  }

  const int due = clock_.advance(elapsed);
  if (due == 0) return std::nullopt;

  // A stalled frame that covers several intervals still reveals a single
  // chunk unless catch-up was asked for.
  const int steps = (pacing_.catch_up == CatchUpPolicy::CatchUp) ? due : 1;

  std::optional<DisplayChunk> last;
  for (int i = 0; i < steps; ++i) {
    auto chunk = next_chunk();
    if (!chunk) break;
    last = std::move(chunk);
  }
  if (last) current_chunk_ = last->text;
  return last;
}

void Reader::replace_document(Document document) {
  document_ = std::move(document);
  page_index_ = 0;
  word_index_ = 0;
  current_chunk_.clear();
  clock_.reset();
  mode_ = PlaybackMode::Playing;
}

double Reader::progress() const {
  const std::size_t len = document_.page(page_index_).size();
  const double p = static_cast<double>(word_index_) / static_cast<double>(std::max<std::size_t>(1, len));
  return std::min(p, 1.0);
}

std::optional<DisplayChunk> Reader::next_chunk() {
  const Page* page = &document_.page(page_index_);
  if (word_index_ >= page->size()) {
    if (page_index_ + 1 >= document_.page_count()) {
      mode_ = PlaybackMode::Paused;
      return std::nullopt;
    }
    ++page_index_;
    word_index_ = 0;
    page = &document_.page(page_index_);
  }

  const std::size_t end =
      std::min(word_index_ + static_cast<std::size_t>(pacing_.chunk_size), page->size());

  DisplayChunk chunk;
  chunk.page_index = page_index_;
  chunk.first_word = word_index_;
  chunk.word_count = end - word_index_;
  for (std::size_t i = word_index_; i < end; ++i) {
    if (i > word_index_) chunk.text += ' ';
    chunk.text += (*page)[i];
  }
  word_index_ = end;
  return chunk;
}

}  // namespace rsvp_reader

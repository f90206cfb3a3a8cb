#pragma once

#include <algorithm>
#include <chrono>
#include <cmath>
#include <limits>
#include <string>

#include "errors.hpp"

namespace rsvp_reader {

/// What a tick does when several pacing intervals elapsed since the last one.
enum class CatchUpPolicy {
  FixedStep,  ///< Reveal exactly one chunk, however many intervals passed.
  CatchUp     ///< Reveal one chunk per elapsed interval.
};

/// Reading speed and reveal granularity.
struct PacingConfig {
  double words_per_minute = 300.0;  ///< Target reading rate, > 0.
  int chunk_size = 1;               ///< Words revealed together, >= 1.
  CatchUpPolicy catch_up = CatchUpPolicy::FixedStep;
};

/// Throws InvalidParameterError unless wpm is a positive finite number and
/// chunk_size is at least 1.
inline void validate_pacing(double words_per_minute, int chunk_size) {
  if (!std::isfinite(words_per_minute) || words_per_minute <= 0.0) {
    throw InvalidParameterError("pacing: words_per_minute must be > 0, got " +
                                std::to_string(words_per_minute));
  }
  if (chunk_size < 1) {
    throw InvalidParameterError("pacing: chunk_size must be >= 1, got " +
                                std::to_string(chunk_size));
  }
}

/// Turns wall-clock time into chunk reveals.
///
/// The clock accumulates elapsed time and fires once each time the running
/// total reaches one interval, where
///
///   interval = (60 / words_per_minute) * chunk_size  seconds.
///
/// Changing the rate keeps the partial progress already accumulated. If that
/// progress already covers one or more of the new (shorter) intervals they
/// fire immediately: the firings are held as pending and reported by the
/// next advance() call.
///
/// The clock has no notion of pause; the owner simply stops calling
/// advance() while paused.
class PacingClock {
public:
  using Seconds = std::chrono::duration<double>;

  PacingClock() : PacingClock(300.0, 1) {}

  PacingClock(double words_per_minute, int chunk_size)
      : interval_(compute_interval(words_per_minute, chunk_size)) {}

  static Seconds compute_interval(double words_per_minute, int chunk_size) {
    validate_pacing(words_per_minute, chunk_size);
    return Seconds((60.0 / words_per_minute) * static_cast<double>(chunk_size));
  }

  /// Most intervals a single advance() can report.
  static constexpr int kMaxFired = std::numeric_limits<int>::max();

  /// Add `elapsed` to the running total and return how many intervals were
  /// consumed, including any left pending by set_rate(). Negative or
  /// non-finite elapsed time counts as zero. The count saturates at
  /// kMaxFired.
  int advance(Seconds elapsed) {
    if (std::isfinite(elapsed.count()) && elapsed > Seconds::zero()) accumulated_ += elapsed;
    const int fired = saturating_add(pending_, consume());
    pending_ = 0;
    total_fired_ += fired;
    return fired;
  }

  /// Switch to a new rate without discarding accumulated progress.
  void set_rate(double words_per_minute, int chunk_size) {
    interval_ = compute_interval(words_per_minute, chunk_size);
    pending_ = saturating_add(pending_, consume());
  }

  /// Forget accumulated progress and pending firings.
  void reset() {
    accumulated_ = Seconds::zero();
    pending_ = 0;
  }

  Seconds interval() const { return interval_; }
  Seconds accumulated() const { return accumulated_; }
  int pending() const { return pending_; }

  /// Total intervals reported by advance() since construction.
  long long total_fired() const { return total_fired_; }

private:
  /// Remove every whole interval from the running total and return how many
  /// there were. Only the remainder is kept.
  int consume() {
    if (!std::isfinite(accumulated_.count())) {
      accumulated_ = Seconds::zero();
      return kMaxFired;
    }
    if (accumulated_ < interval_) return 0;
    const double whole = std::floor(accumulated_ / interval_);
    accumulated_ = Seconds(std::fmod(accumulated_.count(), interval_.count()));
    if (whole >= static_cast<double>(kMaxFired)) return kMaxFired;
    return std::max(1, static_cast<int>(whole));
  }

  static int saturating_add(int a, int b) {
    return (a > kMaxFired - b) ? kMaxFired : a + b;
  }

  Seconds interval_;
  Seconds accumulated_{Seconds::zero()};
  int pending_{0};
  long long total_fired_{0};
};

}  // namespace rsvp_reader

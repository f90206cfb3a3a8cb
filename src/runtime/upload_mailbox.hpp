#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace rsvp_reader {

/// Single-slot hand-off for uploaded document bytes.
///
/// Any thread may post(); the frame loop take()s at most once per frame.
/// A post overwrites whatever is still waiting (last write wins), there is
/// no queue. The lock only guards the slot: bytes are moved in and out, and
/// parsing happens after take() has returned.
class UploadMailbox {
public:
  using Bytes = std::vector<std::uint8_t>;

  UploadMailbox() = default;
  UploadMailbox(const UploadMailbox&) = delete;
  UploadMailbox& operator=(const UploadMailbox&) = delete;

  void post(Bytes bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (slot_) ++overwritten_;
    slot_ = std::move(bytes);
  }

  void post(const std::uint8_t* data, std::size_t size) {
    post(Bytes(data, data + size));
  }

  /// Take and clear the slot.
  std::optional<Bytes> take() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::optional<Bytes> out = std::move(slot_);
    slot_.reset();
    return out;
  }

  bool has_pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slot_.has_value();
  }

  /// Number of uploads replaced before anyone took them.
  std::size_t overwritten() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return overwritten_;
  }

private:
  mutable std::mutex mutex_;
  std::optional<Bytes> slot_;
  std::size_t overwritten_{0};
};

}  // namespace rsvp_reader

#pragma once

#include <chrono>
#include <mutex>
#include <optional>

namespace cue {

// Single-slot mailbox: a producer overwrites, consumers take a copy of the
// newest value together with the time it was published.
template <typename T> class LatestValue {
public:
  using TimePoint = std::chrono::steady_clock::time_point;

  struct Sample {
    T value;
    TimePoint published;

    std::chrono::milliseconds age() const {
      return std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - published);
    }
  };

  void publish(T value) {
    std::lock_guard<std::mutex> lock(slot_mutex);
    slot = Sample{std::move(value), std::chrono::steady_clock::now()};
  }

  std::optional<Sample> latest() const {
    std::lock_guard<std::mutex> lock(slot_mutex);
    return slot;
  }

  // Value only if it is younger than `max_age`.
  std::optional<T> fresh(std::chrono::milliseconds max_age) const {
    std::lock_guard<std::mutex> lock(slot_mutex);
    if (slot && std::chrono::steady_clock::now() - slot->published < max_age) {
      return slot->value;
    }
    return std::nullopt;
  }

  void clear() {
    std::lock_guard<std::mutex> lock(slot_mutex);
    slot.reset();
  }

private:
  mutable std::mutex slot_mutex;
  std::optional<Sample> slot;
};

} // namespace cue

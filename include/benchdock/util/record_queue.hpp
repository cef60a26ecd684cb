#pragma once

#include <algorithm>
#include <atomic>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace benchdock::log {

enum class Level : std::uint8_t {
  Trace,
  Debug,
  Info,
  Warn,
  Error
};

struct Record {
  Level level{Level::Info};
  std::string stamp;
  std::size_t tid{0};
  std::string message;
};

// Hand-off between the job workers that log and the single writer thread.
// Slots hold live Records that are move-assigned in and out, so their string
// buffers are reused across laps. A rejected offer leaves the Record with the
// caller, who prints it synchronously; such offers are counted.
class RecordQueue {
public:
  explicit RecordQueue(std::size_t capacity)
      : size_(std::bit_ceil(std::max<std::size_t>(capacity, 2))),
        slots_(std::make_unique<Slot[]>(size_)) {
    for (std::size_t i = 0; i < size_; ++i) {
      slots_[i].turn.store(i, std::memory_order_relaxed);
    }
  }

  RecordQueue(const RecordQueue&) = delete;
  RecordQueue& operator=(const RecordQueue&) = delete;

  [[nodiscard]] auto offer(Record& rec) noexcept -> bool {
    auto ticket = enqueue_.load(std::memory_order_relaxed);
    for (;;) {
      Slot& slot = slots_[ticket & (size_ - 1)];
      auto turn = slot.turn.load(std::memory_order_acquire);
      if (turn == ticket) {
        if (enqueue_.compare_exchange_weak(ticket, ticket + 1,
                                           std::memory_order_relaxed)) {
          slot.rec = std::move(rec);
          slot.turn.store(ticket + 1, std::memory_order_release);
          return true;
        }
      } else if (turn < ticket) {
        // Slot still holds the record from the previous lap: full.
        rejected_.fetch_add(1, std::memory_order_relaxed);
        return false;
      } else {
        ticket = enqueue_.load(std::memory_order_relaxed);
      }
    }
  }

  // Moves up to `max` records onto `out` in arrival order. Single consumer.
  auto drain(std::vector<Record>& out, std::size_t max) -> std::size_t {
    std::size_t taken = 0;
    while (taken < max) {
      Slot& slot = slots_[dequeue_ & (size_ - 1)];
      if (slot.turn.load(std::memory_order_acquire) != dequeue_ + 1) {
        break;
      }
      out.push_back(std::move(slot.rec));
      slot.turn.store(dequeue_ + size_, std::memory_order_release);
      ++dequeue_;
      ++taken;
    }
    return taken;
  }

  [[nodiscard]] auto capacity() const noexcept -> std::size_t { return size_; }

  [[nodiscard]] auto rejected() const noexcept -> std::uint64_t {
    return rejected_.load(std::memory_order_relaxed);
  }

private:
  struct Slot {
    std::atomic<std::uint64_t> turn{0};
    Record rec;
  };

  std::size_t size_;
  std::unique_ptr<Slot[]> slots_;
  alignas(64) std::atomic<std::uint64_t> enqueue_{0};
  alignas(64) std::uint64_t dequeue_{0};
  std::atomic<std::uint64_t> rejected_{0};
};

}  // namespace benchdock::log

#pragma once

#include <mutex>
#include <shared_mutex>

namespace entitystore::util {

/*
  Per-store reader/writer coordination.

  Any number of readers may hold the lock together; a writer excludes readers
  and other writers. A waiting writer holds the gate, so readers that arrive
  after it queue behind it and a steady read load cannot starve writes.
  No FIFO ordering among writers is promised.

  Not re-entrant on either side: code already holding the lock must call
  unlocked helpers instead of public store operations.
*/
class ReaderWriterLock {
 public:
  ReaderWriterLock() = default;

  ReaderWriterLock(const ReaderWriterLock&)            = delete;
  ReaderWriterLock& operator=(const ReaderWriterLock&) = delete;

  [[nodiscard]] std::shared_lock<std::shared_mutex> ReaderLock() const {
    std::lock_guard<std::mutex> gate(gate_);
    return std::shared_lock<std::shared_mutex>(mutex_);
  }

  [[nodiscard]] std::unique_lock<std::shared_mutex> WriterLock() const {
    std::lock_guard<std::mutex> gate(gate_);
    return std::unique_lock<std::shared_mutex>(mutex_);
  }

 private:
  mutable std::mutex        gate_;
  mutable std::shared_mutex mutex_;
};

} // namespace entitystore::util

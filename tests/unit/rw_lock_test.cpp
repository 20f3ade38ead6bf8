#include "internal/util/rw_lock.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>
#include <vector>

namespace {

using entitystore::util::ReaderWriterLock;

void TestReadersShareTheLock() {
  ReaderWriterLock lock;

  auto first = lock.ReaderLock();
  assert(first.owns_lock());

  std::atomic<bool> second_acquired{false};
  std::thread       reader([&] {
    auto second = lock.ReaderLock();
    second_acquired.store(second.owns_lock());
  });
  reader.join();

  assert(second_acquired.load());
}

void TestWriterExcludesReaders() {
  ReaderWriterLock lock;

  std::atomic<bool> reader_done{false};
  auto              writer = lock.WriterLock();

  std::thread reader([&] {
    auto guard = lock.ReaderLock();
    reader_done.store(true);
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  assert(!reader_done.load());

  writer.unlock();
  reader.join();
  assert(reader_done.load());
}

void TestWritersAreSerialized() {
  ReaderWriterLock lock;
  int              counter = 0;

  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < 1000; ++i) {
        auto guard = lock.WriterLock();
        ++counter;
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }

  assert(counter == 8000);
}

void TestWriterProgressesUnderReadLoad() {
  ReaderWriterLock lock;

  const auto        deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
  std::atomic<int>  writes{0};
  std::atomic<bool> stop{false};

  // overlapping readers keep the shared side held at all times
  std::vector<std::thread> readers;
  for (int r = 0; r < 4; ++r) {
    readers.emplace_back([&] {
      while (!stop.load() && std::chrono::steady_clock::now() < deadline) {
        auto guard = lock.ReaderLock();
        std::this_thread::sleep_for(std::chrono::microseconds(200));
      }
    });
  }

  std::this_thread::sleep_for(std::chrono::milliseconds(20));

  std::thread writer([&] {
    for (int i = 0; i < 5; ++i) {
      auto guard = lock.WriterLock();
      writes.fetch_add(1);
    }
    stop.store(true);
  });

  for (auto& r : readers) r.join();
  writer.join();

  assert(writes.load() == 5);
  assert(std::chrono::steady_clock::now() < deadline);
}

} // namespace

int main() {
  TestReadersShareTheLock();
  TestWriterExcludesReaders();
  TestWritersAreSerialized();
  TestWriterProgressesUnderReadLoad();

  std::cout << "entitystore_unit_rw_lock: pass\n";
  return 0;
}

#pragma once

#include <arrow/buffer.h>

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>

#include "transfer_strategy.hpp"

namespace vault::transfer {

// One part's bytes, held until its transfer succeeds or gives up.
struct PartJob {
  PartWindow                     window;
  std::shared_ptr<arrow::Buffer> data;
};

/*
  Bounded blocking queue between the archive reader and part workers.

  Enqueue() blocks while the queue is full, which caps buffered part
  bytes at capacity windows. Close() lets consumers drain what is queued;
  Shutdown() drops queued jobs and wakes everybody.
*/
class WindowQueue {
 public:
  explicit WindowQueue(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {
  }

  // false once the queue was closed or shut down
  bool Enqueue(PartJob job);

  // blocking wait; nullopt when closed and drained, or shut down
  std::optional<PartJob> Dequeue();

  void Close();
  void Shutdown();

 private:
  const size_t            capacity_;
  std::mutex              mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::queue<PartJob>     queue_;
  bool                    closed_   = false;
  bool                    shutdown_ = false;
};

} // namespace vault::transfer

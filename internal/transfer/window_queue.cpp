#include "window_queue.hpp"

namespace vault::transfer {

bool WindowQueue::Enqueue(PartJob job) {
  {
    std::unique_lock lock(mutex_);
    not_full_.wait(lock, [&] { return shutdown_ || closed_ || queue_.size() < capacity_; });
    if (shutdown_ || closed_) return false;
    queue_.push(std::move(job));
  }
  not_empty_.notify_one();
  return true;
}

std::optional<PartJob> WindowQueue::Dequeue() {
  std::optional<PartJob> job;
  {
    std::unique_lock lock(mutex_);
    not_empty_.wait(lock, [&] { return shutdown_ || closed_ || !queue_.empty(); });

    if (shutdown_ || queue_.empty()) return std::nullopt;

    job = std::move(queue_.front());
    queue_.pop();
  }
  not_full_.notify_one();
  return job;
}

void WindowQueue::Close() {
  {
    std::lock_guard lock(mutex_);
    closed_ = true;
  }
  not_empty_.notify_all();
  not_full_.notify_all();
}

void WindowQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
    std::queue<PartJob>().swap(queue_);
  }
  not_empty_.notify_all();
  not_full_.notify_all();
}

} // namespace vault::transfer

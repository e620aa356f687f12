#include "ingest_queue.hpp"

namespace tripgraph::ingest {

IngestQueue::IngestQueue(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {
}

bool IngestQueue::Enqueue(IngestTask task) {
  {
    std::unique_lock lock(mutex_);
    not_full_.wait(lock, [&] { return shutdown_ || queue_.size() < capacity_; });
    if (shutdown_) return false;
    queue_.push(std::move(task));
  }
  not_empty_.notify_one();
  return true;
}

std::optional<IngestTask> IngestQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  not_empty_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (queue_.empty()) return std::nullopt;

  IngestTask task = std::move(queue_.front());
  queue_.pop();
  lock.unlock();
  not_full_.notify_one();
  return task;
}

void IngestQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  not_empty_.notify_all();
  not_full_.notify_all();
}

} // namespace tripgraph::ingest

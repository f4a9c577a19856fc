// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "request_queue.hpp"

namespace kiln {
namespace server {

RequestQueue::RequestQueue(size_t capacity)
    : capacity_(capacity) {}

RequestQueue::~RequestQueue() {
  shutdown();
}

bool RequestQueue::enqueue(QueuedRequest item) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (shutdown_) {
    return false;
  }
  // Check capacity (0 = unlimited)
  if (capacity_ > 0 && queue_.size() >= capacity_) {
    return false;
  }

  queue_.push(std::move(item));
  cv_.notify_one();
  return true;
}

std::optional<QueuedRequest> RequestQueue::dequeue() {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] {
    return shutdown_ || !queue_.empty();
  });

  if (shutdown_) {
    return std::nullopt;
  }
  QueuedRequest item = std::move(queue_.front());
  queue_.pop();
  return item;
}

std::optional<QueuedRequest> RequestQueue::dequeue_with_timeout(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  bool ready = cv_.wait_for(lock, timeout, [this] {
    return shutdown_ || !queue_.empty();
  });

  if (!ready || shutdown_) {
    return std::nullopt;
  }
  QueuedRequest item = std::move(queue_.front());
  queue_.pop();
  return item;
}

size_t RequestQueue::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

bool RequestQueue::empty() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.empty();
}

size_t RequestQueue::shutdown() {
  std::lock_guard<std::mutex> lock(mutex_);
  shutdown_ = true;
  size_t dropped = queue_.size();
  std::queue<QueuedRequest> empty;
  queue_.swap(empty);
  cv_.notify_all();
  return dropped;
}

bool RequestQueue::is_shutdown() const {
  return shutdown_.load();
}

}  // namespace server
}  // namespace kiln

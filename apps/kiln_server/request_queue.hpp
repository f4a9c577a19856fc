// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef KILN_SERVER_REQUEST_QUEUE_HPP
#define KILN_SERVER_REQUEST_QUEUE_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>
#include <string>

namespace kiln {
namespace server {

/**
 * One accepted connection waiting for a worker
 */
struct QueuedRequest {
  std::function<void()> handler;  // serves the connection to completion
  std::string peer;               // remote address, for logging
  std::chrono::steady_clock::time_point enqueued_at;

  QueuedRequest()
      : enqueued_at(std::chrono::steady_clock::now()) {}

  QueuedRequest(std::function<void()> fn, std::string peer_address)
      : handler(std::move(fn))
      , peer(std::move(peer_address))
      , enqueued_at(std::chrono::steady_clock::now()) {}
};

/**
 * Bounded hand-off between the accept thread and the worker pool.
 *
 * Single producer (acceptor), multiple consumers (workers). The acceptor
 * answers 503 itself when enqueue() reports the queue full.
 */
class RequestQueue {
public:
  /**
   * @param capacity Maximum number of waiting requests (0 = unlimited)
   */
  explicit RequestQueue(size_t capacity = 0);
  ~RequestQueue();

  // Non-copyable, non-movable
  RequestQueue(const RequestQueue&) = delete;
  RequestQueue& operator=(const RequestQueue&) = delete;
  RequestQueue(RequestQueue&&) = delete;
  RequestQueue& operator=(RequestQueue&&) = delete;

  /**
   * @return true if enqueued, false if the queue is full or shut down
   */
  bool enqueue(QueuedRequest item);

  /**
   * Block until an item is available or shutdown is requested.
   *
   * @return Item if available, std::nullopt if queue is shutting down
   */
  std::optional<QueuedRequest> dequeue();

  /**
   * @return Item if available within timeout, std::nullopt otherwise
   */
  std::optional<QueuedRequest> dequeue_with_timeout(std::chrono::milliseconds timeout);

  size_t size() const;

  bool empty() const;

  size_t capacity() const {
    return capacity_;
  }

  /**
   * Wake all waiting workers and drop pending items.
   *
   * @return number of requests dropped
   */
  size_t shutdown();

  bool is_shutdown() const;

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<QueuedRequest> queue_;
  size_t capacity_;
  std::atomic<bool> shutdown_{false};
};

}  // namespace server
}  // namespace kiln

#endif  // KILN_SERVER_REQUEST_QUEUE_HPP

#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>

namespace vidconv_core::async {

using Job = std::function<void()>;

// FIFO of pending jobs shared by the workers of a pool.
class JobQueue {
 public:
  JobQueue() = default;

  JobQueue(const JobQueue&) = delete;
  JobQueue& operator=(const JobQueue&) = delete;

  // Returns false if the queue was closed and the job was not accepted.
  bool push(Job job);

  // Blocks until a job is available. Returns std::nullopt once the queue is
  // closed and drained.
  std::optional<Job> pop();

  void close();

  bool is_closed() const;
  size_t size() const;

 private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<Job> jobs_;
  bool closed_ = false;
};

}  // namespace vidconv_core::async

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "vidconv_core/types/conversion_request.hpp"

namespace vidconv_core {

class Connection;
class ConversionRunner;

namespace async {
class WorkerPool;
}

enum class TaskStatus { PENDING, RUNNING, COMPLETED, FAILED, CANCELLED };

inline std::string to_string(TaskStatus status) {
  switch (status) {
    case TaskStatus::PENDING: return "PENDING";
    case TaskStatus::RUNNING: return "RUNNING";
    case TaskStatus::COMPLETED: return "COMPLETED";
    case TaskStatus::FAILED: return "FAILED";
    case TaskStatus::CANCELLED: return "CANCELLED";
  }
  return "UNKNOWN";
}

/**
 * @class TaskManager
 * @brief Tracks the conversions started by one connection.
 *
 * Each submitted conversion runs as a job on the shared WorkerPool and reports
 * its events to the owning connection as `progress` messages tagged with the
 * task id. Only live tasks (pending or running) are tracked; a task leaves the
 * live set when it finishes or is cancelled.
 *
 * Must be owned by a std::shared_ptr: jobs hold a weak reference to report
 * status changes back.
 */
class TaskManager : public std::enable_shared_from_this<TaskManager> {
 public:
  TaskManager(std::string connection_key,
              std::shared_ptr<Connection> connection,
              async::WorkerPool& worker_pool,
              ConversionRunner& runner);

  // Cancels whatever is still live without waiting for the workers.
  ~TaskManager();

  TaskManager(const TaskManager&) = delete;
  TaskManager& operator=(const TaskManager&) = delete;

  using RegisteredCallback = std::function<void(const std::string& task_id)>;

  // Queues the conversion and returns its id without waiting for it to start.
  // on_registered runs before the job is queued, so nothing it sends can be
  // overtaken by the task's own events.
  // Throws VidconvError if the worker pool no longer accepts jobs.
  std::string submit(const ConversionRequest& request,
                     const RegisteredCallback& on_registered = nullptr);

  // Signals cancellation and returns immediately.
  // Throws VidconvError (NotFound) if the task is not live.
  void cancel(const std::string& task_id);

  // Cancels every live task and waits up to ack_timeout for the workers to
  // let go of them. Returns the number of tasks cancelled.
  size_t cancel_all(std::chrono::milliseconds ack_timeout);

  std::optional<TaskStatus> status(const std::string& task_id) const;

  size_t active_count() const;

 private:
  struct TaskEntry;

  void mark_running(const std::string& task_id);
  void finish(const std::string& task_id, TaskStatus final_status);

  const std::string connection_key_;
  std::shared_ptr<Connection> connection_;
  async::WorkerPool& worker_pool_;
  ConversionRunner& runner_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<TaskEntry>> tasks_;
  unsigned long long next_sequence_ = 0;
};

}  // namespace vidconv_core

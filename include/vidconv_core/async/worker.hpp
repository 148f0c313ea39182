#pragma once

#include <atomic>
#include <thread>

namespace vidconv_core {
namespace async {

class JobQueue;

/**
 * @class Worker
 * @brief Represents a single background thread that executes jobs from the queue.
 *
 * A Worker is a long-lived object that blocks on the shared JobQueue. When a
 * job is available, the Worker runs it to completion (for conversions this
 * means until the external process exits or is killed).
 *
 * This class is designed to be managed by a WorkerPool. It is non-copyable
 * and non-movable to ensure clear ownership of the underlying thread.
 */
class Worker {
 public:
  /**
   * @brief Constructs a Worker instance.
   * @param worker_id A unique identifier for this worker, used for logging.
   * @param queue The queue shared with the other workers of the pool.
   */
  Worker(int worker_id, JobQueue& queue);

  /**
   * @brief Destructor. Ensures the worker thread is stopped and joined cleanly.
   *
   * The queue must have been closed before, otherwise the join waits for the
   * next job.
   */
  ~Worker();

  /**
   * @brief Starts the worker's processing loop in a new background thread.
   *
   * This method will throw an exception if the worker is already running.
   */
  void start();

  /**
   * @brief Signals the worker to stop after its current job.
   *
   * Does not block and does not wake a worker waiting on the queue; closing
   * the queue does that.
   */
  void stop();

  /**
   * @brief Waits for the worker thread to exit.
   */
  void join();

  /**
   * @brief Pops and runs a single job on the calling thread.
   * @return false if the queue is closed and empty.
   */
  bool run_one_job();

  Worker(const Worker&) = delete;
  Worker& operator=(const Worker&) = delete;
  Worker(Worker&&) = delete;
  Worker& operator=(Worker&&) = delete;

 private:
  void run_loop();

  int worker_id_;
  JobQueue& queue_;
  std::atomic<bool> should_stop_{false};
  std::thread thread_;
};

}  // namespace async
}  // namespace vidconv_core

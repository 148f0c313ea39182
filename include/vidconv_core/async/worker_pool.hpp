#pragma once

#include <memory>
#include <vector>

#include "vidconv_core/async/job_queue.hpp"
#include "vidconv_core/async/worker.hpp"

namespace vidconv_core::async {

/**
 * @class WorkerPool
 * @brief Manages a collection of Worker threads for concurrent job processing.
 *
 * This class is responsible for the entire lifecycle of the worker threads:
 * creating them, starting them, and ensuring they are safely shut down
 * when the pool is destroyed. It follows the RAII principle.
 */
class WorkerPool {
 public:
  /**
   * @brief Constructs the WorkerPool and creates the worker instances.
   *
   * @param num_threads The number of worker threads to create in the pool.
   * @throw std::invalid_argument if num_threads is zero.
   */
  explicit WorkerPool(size_t num_threads);

  /**
   * @brief Destructor. Automatically stops and joins all worker threads.
   */
  ~WorkerPool();

  /**
   * @brief Starts all worker threads in the pool.
   */
  void start();

  /**
   * @brief Closes the queue and waits for the workers to exit.
   *
   * Jobs already queued are still executed before the workers exit. Blocks
   * until every worker thread has been joined.
   */
  void stop();

  /**
   * @brief Queues a job for execution on one of the workers.
   * @return false if the pool has been stopped.
   */
  bool submit(Job job);

  size_t size() const {
    return m_workers.size();
  }

  size_t pending_jobs() const {
    return m_queue.size();
  }

  // --- Rule of Five: Make the class non-copyable and non-movable ---
  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;
  WorkerPool(WorkerPool&&) = delete;
  WorkerPool& operator=(WorkerPool&&) = delete;

 private:
  JobQueue m_queue;
  std::vector<std::unique_ptr<Worker>> m_workers;
  bool m_is_running = false;
};

}  // namespace vidconv_core::async

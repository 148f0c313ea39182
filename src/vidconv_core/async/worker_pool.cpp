#include "vidconv_core/async/worker_pool.hpp"

#include <iostream>
#include <stdexcept>

namespace vidconv_core::async {

WorkerPool::WorkerPool(size_t num_threads) {
  if (num_threads == 0) {
    throw std::invalid_argument("WorkerPool must have at least one thread.");
  }

  m_workers.reserve(num_threads);
  for (size_t i = 0; i < num_threads; ++i) {
    m_workers.emplace_back(std::make_unique<Worker>(static_cast<int>(i), m_queue));
  }
  std::cout << "WorkerPool created with " << num_threads << " workers." << std::endl;
}

WorkerPool::~WorkerPool() {
  std::cout << "WorkerPool destructor called. Shutting down all workers..." << std::endl;
  // Workers block on the queue; it must be closed before they can be joined.
  m_queue.close();
  m_workers.clear();
}

void WorkerPool::start() {
  if (m_is_running) {
    std::cerr << "Warning: WorkerPool is already running." << std::endl;
    return;
  }
  if (m_queue.is_closed()) {
    throw std::runtime_error("WorkerPool cannot be restarted after stop().");
  }
  std::cout << "Starting all workers in the pool..." << std::endl;
  for (const auto& worker : m_workers) {
    worker->start();
  }
  m_is_running = true;
}

void WorkerPool::stop() {
  m_queue.close();
  if (!m_is_running) {
    return;
  }
  std::cout << "Stopping all workers in the pool..." << std::endl;
  for (const auto& worker : m_workers) {
    worker->join();
  }
  m_is_running = false;
}

bool WorkerPool::submit(Job job) {
  return m_queue.push(std::move(job));
}

}  // namespace vidconv_core::async

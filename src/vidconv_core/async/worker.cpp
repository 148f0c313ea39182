#include "vidconv_core/async/worker.hpp"

#include <iostream>
#include <stdexcept>

#include "vidconv_core/async/job_queue.hpp"

namespace vidconv_core {
namespace async {

Worker::Worker(int worker_id, JobQueue& queue) : worker_id_(worker_id), queue_(queue) {
  std::cout << "Worker [" << worker_id_ << "] created." << std::endl;
}

Worker::~Worker() {
  stop();
  join();
  std::cout << "Worker [" << worker_id_ << "] joined and shut down." << std::endl;
}

void Worker::start() {
  if (thread_.joinable()) {
    throw std::runtime_error("Worker is already running.");
  }
  should_stop_.store(false);
  thread_ = std::thread(&Worker::run_loop, this);
}

void Worker::stop() {
  should_stop_.store(true);
}

void Worker::join() {
  if (thread_.joinable()) {
    thread_.join();
  }
}

void Worker::run_loop() {
  std::cout << "Worker [" << worker_id_ << "] starting run loop." << std::endl;
  while (!should_stop_.load()) {
    if (!run_one_job()) {
      break;
    }
  }
  std::cout << "Worker [" << worker_id_ << "] run loop terminated." << std::endl;
}

bool Worker::run_one_job() {
  std::optional<Job> job = queue_.pop();
  if (!job) {
    return false;
  }
  try {
    (*job)();
  } catch (const std::exception& e) {
    std::cerr << "Worker [" << worker_id_ << "] ERROR running job: " << e.what() << std::endl;
  }
  return true;
}

}  // namespace async
}  // namespace vidconv_core

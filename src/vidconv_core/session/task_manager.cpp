#include "vidconv_core/session/task_manager.hpp"

#include <future>
#include <iostream>
#include <vector>

#include <nlohmann/json.hpp>

#include "vidconv_core/async/cancellation_token.hpp"
#include "vidconv_core/async/worker_pool.hpp"
#include "vidconv_core/conversion/conversion_runner.hpp"
#include "vidconv_core/errors.hpp"
#include "vidconv_core/session/connection.hpp"

namespace vidconv_core {

namespace {

// Forwards a task's events to its connection. Once a terminal event went out,
// or the task was cancelled, everything else for this task is dropped.
class TaskEventSink : public ProgressSink {
 public:
  TaskEventSink(std::string task_id, std::shared_ptr<Connection> connection)
      : task_id_(std::move(task_id)), connection_(std::move(connection)) {}

  void emit(const ProgressEvent& event) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_ || terminal_sent_) {
      return;
    }
    if (event.is_terminal()) {
      terminal_sent_ = true;
    }
    nlohmann::json message = to_json(event);
    message["type"] = "progress";
    message["task_id"] = task_id_;
    connection_->send_text(message.dump());
  }

  // Returns false if the terminal event was already delivered.
  bool try_cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (terminal_sent_) {
      return false;
    }
    cancelled_ = true;
    return true;
  }

 private:
  const std::string task_id_;
  std::shared_ptr<Connection> connection_;
  std::mutex mutex_;
  bool cancelled_ = false;
  bool terminal_sent_ = false;
};

}  // namespace

struct TaskManager::TaskEntry {
  std::string id;
  ConversionRequest request;
  TaskStatus status = TaskStatus::PENDING;
  std::shared_ptr<async::CancellationToken> token;
  std::shared_ptr<TaskEventSink> sink;
  std::shared_future<void> done;

  void request_cancel() {
    sink->try_cancel();
    token->cancel();
  }
};

TaskManager::TaskManager(std::string connection_key,
                         std::shared_ptr<Connection> connection,
                         async::WorkerPool& worker_pool,
                         ConversionRunner& runner)
    : connection_key_(std::move(connection_key)),
      connection_(std::move(connection)),
      worker_pool_(worker_pool),
      runner_(runner) {}

TaskManager::~TaskManager() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto& [id, entry] : tasks_) {
    entry->request_cancel();
  }
  tasks_.clear();
}

std::string TaskManager::submit(const ConversionRequest& request,
                                const RegisteredCallback& on_registered) {
  auto entry = std::make_shared<TaskEntry>();
  entry->request = request;
  entry->token = std::make_shared<async::CancellationToken>();

  auto done = std::make_shared<std::promise<void>>();
  entry->done = done->get_future().share();

  {
    std::lock_guard<std::mutex> lock(mutex_);
    entry->id = connection_key_ + "_" + std::to_string(next_sequence_++);
    entry->sink = std::make_shared<TaskEventSink>(entry->id, connection_);
    tasks_.emplace(entry->id, entry);
  }

  if (on_registered) {
    on_registered(entry->id);
  }

  std::weak_ptr<TaskManager> weak_self = weak_from_this();
  ConversionRunner& runner = runner_;
  bool accepted = worker_pool_.submit([weak_self, entry, done, &runner]() {
    if (auto self = weak_self.lock()) {
      self->mark_running(entry->id);
    }

    bool succeeded = false;
    try {
      succeeded = runner.run(entry->request, *entry->sink, *entry->token);
    } catch (const std::exception& e) {
      std::cerr << "[TaskManager] task " << entry->id << " aborted: " << e.what() << std::endl;
    }

    TaskStatus final_status = TaskStatus::FAILED;
    if (entry->token->is_cancelled()) {
      final_status = TaskStatus::CANCELLED;
    } else if (succeeded) {
      final_status = TaskStatus::COMPLETED;
    }
    if (auto self = weak_self.lock()) {
      self->finish(entry->id, final_status);
    }
    done->set_value();
  });

  if (!accepted) {
    std::lock_guard<std::mutex> lock(mutex_);
    tasks_.erase(entry->id);
    throw VidconvError(ErrorKind::ProcessFailure, "Server is not accepting conversion tasks");
  }

  std::cout << "[TaskManager] task " << entry->id << " queued: '" << request.input_file
            << "' -> '" << request.output_file << "'" << std::endl;
  return entry->id;
}

void TaskManager::cancel(const std::string& task_id) {
  std::shared_ptr<TaskEntry> entry;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(task_id);
    if (it == tasks_.end()) {
      throw VidconvError(ErrorKind::NotFound, "Task " + task_id + " not found");
    }
    entry = it->second;
    tasks_.erase(it);
  }

  if (!entry->sink->try_cancel()) {
    throw VidconvError(ErrorKind::NotFound, "Task " + task_id + " already finished");
  }
  entry->token->cancel();
  std::cout << "[TaskManager] task " << task_id << " cancelled" << std::endl;
}

size_t TaskManager::cancel_all(std::chrono::milliseconds ack_timeout) {
  std::vector<std::shared_ptr<TaskEntry>> entries;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    entries.reserve(tasks_.size());
    for (auto& [id, entry] : tasks_) {
      entries.push_back(entry);
    }
    tasks_.clear();
  }

  for (const auto& entry : entries) {
    entry->request_cancel();
  }

  const auto deadline = std::chrono::steady_clock::now() + ack_timeout;
  for (const auto& entry : entries) {
    if (entry->done.wait_until(deadline) != std::future_status::ready) {
      std::cerr << "[TaskManager] task " << entry->id
                << " did not acknowledge cancellation in time" << std::endl;
    }
  }
  return entries.size();
}

std::optional<TaskStatus> TaskManager::status(const std::string& task_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = tasks_.find(task_id);
  if (it == tasks_.end()) {
    return std::nullopt;
  }
  return it->second->status;
}

size_t TaskManager::active_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tasks_.size();
}

void TaskManager::mark_running(const std::string& task_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = tasks_.find(task_id);
  if (it != tasks_.end() && it->second->status == TaskStatus::PENDING) {
    it->second->status = TaskStatus::RUNNING;
  }
}

void TaskManager::finish(const std::string& task_id, TaskStatus final_status) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = tasks_.find(task_id);
  if (it == tasks_.end()) {
    return;
  }
  tasks_.erase(it);
  std::cout << "[TaskManager] task " << task_id << " finished: " << to_string(final_status)
            << std::endl;
}

}  // namespace vidconv_core

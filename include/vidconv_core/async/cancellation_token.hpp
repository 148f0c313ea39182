#pragma once

#include <functional>
#include <mutex>

namespace vidconv_core::async {

/**
 * @class CancellationToken
 * @brief One-shot cancellation signal shared between a requester and a worker.
 *
 * The worker registers a handler (typically "kill the child process") with
 * on_cancel(). If cancel() was already called the handler runs immediately on
 * the registering thread, otherwise it runs on the thread calling cancel().
 * Handlers must not call back into the token.
 */
class CancellationToken {
 public:
  CancellationToken() = default;

  CancellationToken(const CancellationToken&) = delete;
  CancellationToken& operator=(const CancellationToken&) = delete;

  void cancel();

  bool is_cancelled() const;

  void on_cancel(std::function<void()> handler);

  // Drops the registered handler, e.g. once the child it would kill is gone.
  void clear_handler();

 private:
  mutable std::mutex mutex_;
  bool cancelled_ = false;
  std::function<void()> handler_;
};

}  // namespace vidconv_core::async

#include "vidconv_core/async/cancellation_token.hpp"

namespace vidconv_core::async {

// The handler runs under the lock so clear_handler() can guarantee it is not
// executing once it returns.
void CancellationToken::cancel() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (cancelled_) {
    return;
  }
  cancelled_ = true;
  if (handler_) {
    handler_();
  }
}

bool CancellationToken::is_cancelled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cancelled_;
}

void CancellationToken::on_cancel(std::function<void()> handler) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!cancelled_) {
      handler_ = std::move(handler);
      return;
    }
  }
  if (handler) {
    handler();
  }
}

void CancellationToken::clear_handler() {
  std::lock_guard<std::mutex> lock(mutex_);
  handler_ = nullptr;
}

}  // namespace vidconv_core::async

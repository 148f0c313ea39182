#include <gtest/gtest.h>

#include <atomic>
#include <thread>

#include "vidconv_core/async/cancellation_token.hpp"

namespace vidconv_tests {

using vidconv_core::async::CancellationToken;

TEST(CancellationTokenTest, StartsNotCancelled) {
  CancellationToken token;
  EXPECT_FALSE(token.is_cancelled());
}

TEST(CancellationTokenTest, CancelRunsRegisteredHandlerOnce) {
  CancellationToken token;
  int calls = 0;
  token.on_cancel([&calls] { ++calls; });

  token.cancel();
  token.cancel();

  EXPECT_TRUE(token.is_cancelled());
  EXPECT_EQ(calls, 1);
}

TEST(CancellationTokenTest, HandlerRegisteredAfterCancelRunsImmediately) {
  CancellationToken token;
  token.cancel();

  bool ran = false;
  token.on_cancel([&ran] { ran = true; });
  EXPECT_TRUE(ran);
}

TEST(CancellationTokenTest, ClearedHandlerDoesNotRun) {
  CancellationToken token;
  bool ran = false;
  token.on_cancel([&ran] { ran = true; });
  token.clear_handler();

  token.cancel();
  EXPECT_TRUE(token.is_cancelled());
  EXPECT_FALSE(ran);
}

TEST(CancellationTokenTest, CancelFromAnotherThreadIsObserved) {
  CancellationToken token;
  std::atomic<bool> handler_ran{false};
  token.on_cancel([&handler_ran] { handler_ran = true; });

  std::thread canceller([&token] { token.cancel(); });
  canceller.join();

  EXPECT_TRUE(token.is_cancelled());
  EXPECT_TRUE(handler_ran.load());
}

}  // namespace vidconv_tests

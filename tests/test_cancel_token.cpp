#include <gtest/gtest.h>

#include "core/cancel_token.h"

#include <atomic>
#include <chrono>
#include <thread>

using namespace spine::core;
using namespace std::chrono_literals;

TEST(CancelToken, StartsUncanceled) {
  auto token = CancelToken::create();
  EXPECT_FALSE(token->is_canceled());
}

TEST(CancelToken, CancelIsIdempotentAndRunsCallbacksOnce) {
  auto token = CancelToken::create();
  int calls = 0;
  token->on_cancel([&calls] { ++calls; });

  token->request_cancel();
  token->request_cancel();

  EXPECT_TRUE(token->is_canceled());
  EXPECT_EQ(calls, 1);
}

TEST(CancelToken, CallbackAfterCancelRunsImmediately) {
  auto token = CancelToken::create();
  token->request_cancel();

  bool called = false;
  token->on_cancel([&called] { called = true; });
  EXPECT_TRUE(called);
}

TEST(CancelToken, SleepRunsFullDuration) {
  auto token = CancelToken::create();
  const auto start = std::chrono::steady_clock::now();

  EXPECT_TRUE(token->sleep_for(50ms));
  EXPECT_GE(std::chrono::steady_clock::now() - start, 45ms);
}

TEST(CancelToken, SleepWakesOnCancel) {
  auto token = CancelToken::create();
  std::thread canceler([token] {
    std::this_thread::sleep_for(50ms);
    token->request_cancel();
  });

  const auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(token->sleep_for(5s));
  EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
  canceler.join();
}

TEST(CancelToken, DefaultSleepHonoursToken) {
  auto sleep = default_sleep();
  auto token = CancelToken::create();
  token->request_cancel();

  EXPECT_FALSE(sleep(1s, token));
  EXPECT_TRUE(sleep(1ms, nullptr));
}

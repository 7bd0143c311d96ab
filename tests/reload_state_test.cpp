#include "server/reload_state.hpp"
#include <atomic>
#include <gtest/gtest.h>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

TEST(ReloadStateTest, StartsAtZeroAndBumps) {
  ReloadState state;
  EXPECT_EQ(state.get(), 0u);

  state.bump();
  state.bump();
  EXPECT_EQ(state.get(), 2u);
}

TEST(ReloadStateTest, WaitTimesOutWithoutChange) {
  ReloadState state;
  auto started = std::chrono::steady_clock::now();

  EXPECT_EQ(state.wait_for_change(0, 30ms), std::nullopt);
  EXPECT_GE(std::chrono::steady_clock::now() - started, 25ms);
}

TEST(ReloadStateTest, WaitReturnsAtOnceWhenAlreadyChanged) {
  ReloadState state;
  state.bump();

  EXPECT_EQ(state.wait_for_change(0, 5s), 1u);
}

TEST(ReloadStateTest, BumpWakesWaiter) {
  ReloadState state;
  std::thread bumper([&] {
    std::this_thread::sleep_for(20ms);
    state.bump();
  });

  EXPECT_EQ(state.wait_for_change(0, 5s), 1u);
  bumper.join();
}

TEST(ReloadStateTest, BumpWakesEveryWaiter) {
  ReloadState state;
  std::atomic<int> woken{0};
  std::vector<std::thread> waiters;

  for (int i = 0; i < 8; ++i) {
    waiters.emplace_back([&] {
      if (state.wait_for_change(0, 5s)) {
        woken++;
      }
    });
  }

  std::this_thread::sleep_for(20ms);
  state.bump();
  for (auto &waiter : waiters) {
    waiter.join();
  }

  EXPECT_EQ(woken.load(), 8);
}

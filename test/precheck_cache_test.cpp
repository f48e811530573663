#include <atomic>
#include <chrono>
#include <future>
#include <thread>
#include <vector>
#include <stdexcept>

#include <gtest/gtest.h>
#include <remex/dispatcher.h>

namespace {

TemplateSandboxConfig Sized(int cpu_count) {
  TemplateSandboxConfig ret;
  ret.api_key = "key";
  ret.cpu_count = cpu_count;
  return ret;
}

} // namespace

TEST(PrecheckCache, OncePerDistinctConfig) {
  PrecheckCache cache;
  int calls = 0;
  auto check = [&]() { calls++; };
  EXPECT_TRUE(cache.RunOnce(Sized(2), check));
  EXPECT_FALSE(cache.RunOnce(Sized(2), check));
  // equal by value, not identity
  ExecutionConfig copy = Sized(2);
  EXPECT_FALSE(cache.RunOnce(copy, check));
  EXPECT_EQ(calls, 1);
  EXPECT_TRUE(cache.RunOnce(Sized(4), check));
  EXPECT_TRUE(cache.RunOnce(LocalProcessConfig(), check));
  EXPECT_EQ(calls, 3);
  EXPECT_EQ(cache.size(), 3u);
  EXPECT_TRUE(cache.Contains(Sized(4)));
  EXPECT_FALSE(cache.Contains(Sized(8)));
}

TEST(PrecheckCache, FailureNotRecorded) {
  PrecheckCache cache;
  int calls = 0;
  EXPECT_THROW(cache.RunOnce(Sized(2), [&]() {
    calls++;
    throw EnvironmentUnavailable("not yet");
  }), EnvironmentUnavailable);
  EXPECT_FALSE(cache.Contains(Sized(2)));
  EXPECT_TRUE(cache.RunOnce(Sized(2), [&]() { calls++; }));
  EXPECT_EQ(calls, 2);
}

TEST(PrecheckCache, ConcurrentSameConfig) {
  PrecheckCache cache;
  std::atomic<int> calls{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; i++) {
    threads.emplace_back([&]() {
      cache.RunOnce(Sized(2), [&]() {
        calls++;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
      });
    });
  }
  for (auto& i : threads) i.join();
  EXPECT_EQ(calls, 1);
}

TEST(PrecheckCache, ConcurrentDistinctConfigsDoNotBlock) {
  PrecheckCache cache;
  std::promise<void> b_started;
  auto b_future = b_started.get_future();
  std::atomic<int> calls{0};
  // A can only finish once B's check is running alongside it
  auto a = std::async(std::launch::async, [&]() {
    cache.RunOnce(Sized(2), [&]() {
      calls++;
      if (b_future.wait_for(std::chrono::seconds(5)) != std::future_status::ready) {
        throw std::runtime_error("checks were serialized");
      }
    });
  });
  auto b = std::async(std::launch::async, [&]() {
    cache.RunOnce(Sized(4), [&]() {
      calls++;
      b_started.set_value();
    });
  });
  EXPECT_NO_THROW(a.get());
  EXPECT_NO_THROW(b.get());
  EXPECT_EQ(calls, 2);
}

TEST(PrecheckCache, IndependentInstances) {
  PrecheckCache x, y;
  int calls = 0;
  x.RunOnce(Sized(2), [&]() { calls++; });
  y.RunOnce(Sized(2), [&]() { calls++; });
  EXPECT_EQ(calls, 2);
}

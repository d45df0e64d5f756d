#include <gtest/gtest.h>
#include <resonance/common/retry.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <thread>

using namespace std::chrono_literals;
using resonance::common::breaker_state_t;

TEST(retry_policy, delays_grow_exponentially_and_cap) {
  auto policy = resonance::common::retry_policy{
      .max_attempts = 6, .initial_delay = 100ms, .max_delay = 1000ms,
      .multiplier = 2.0};
  EXPECT_EQ(policy.delay_for(0), 0ms);
  EXPECT_EQ(policy.delay_for(1), 100ms);
  EXPECT_EQ(policy.delay_for(2), 200ms);
  EXPECT_EQ(policy.delay_for(3), 400ms);
  EXPECT_EQ(policy.delay_for(4), 800ms);
  EXPECT_EQ(policy.delay_for(5), 1000ms);
  EXPECT_EQ(policy.delay_for(30), 1000ms);
}

TEST(retry, returns_first_success) {
  auto policy = resonance::common::retry_policy{
      .max_attempts = 5, .initial_delay = 1ms, .max_delay = 2ms};
  auto calls = 0;
  auto error = std::string{};
  auto result = resonance::common::retry(
      policy, nullptr, "test call", error,
      [&](std::string& e) -> std::optional<int> {
        if (++calls < 3) {
          e = "not yet";
          return std::nullopt;
        }
        return 42;
      });
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, 42);
  EXPECT_EQ(calls, 3);
  EXPECT_TRUE(error.empty());
}

TEST(retry, gives_up_after_max_attempts_with_last_error) {
  auto policy = resonance::common::retry_policy{
      .max_attempts = 3, .initial_delay = 1ms, .max_delay = 1ms};
  auto calls = 0;
  auto error = std::string{};
  auto result = resonance::common::retry(
      policy, nullptr, "test call", error,
      [&](std::string& e) -> std::optional<int> {
        e = "failure " + std::to_string(++calls);
        return std::nullopt;
      });
  EXPECT_FALSE(result.has_value());
  EXPECT_EQ(calls, 3);
  EXPECT_EQ(error, "failure 3");
}

TEST(retry, stop_signal_cancels_backoff) {
  auto policy = resonance::common::retry_policy{
      .max_attempts = 5, .initial_delay = 10s, .max_delay = 10s};
  auto stop = resonance::common::stop_signal{};
  stop.request_stop();
  auto calls = 0;
  auto error = std::string{};
  auto started = std::chrono::steady_clock::now();
  auto result = resonance::common::retry(
      policy, &stop, "test call", error,
      [&](std::string& e) -> std::optional<int> {
        ++calls;
        e = "down";
        return std::nullopt;
      });
  EXPECT_FALSE(result.has_value());
  EXPECT_EQ(calls, 1);
  EXPECT_EQ(error, "cancelled");
  EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
}

TEST(stop_signal, wait_for_wakes_on_request) {
  auto stop = resonance::common::stop_signal{};
  EXPECT_FALSE(stop.wait_for(1ms));
  auto waker = std::thread{[&] {
    std::this_thread::sleep_for(20ms);
    stop.request_stop();
  }};
  EXPECT_TRUE(stop.wait_for(10s));
  waker.join();
  EXPECT_TRUE(stop.stop_requested());
  stop.reset();
  EXPECT_FALSE(stop.stop_requested());
}

TEST(circuit_breaker, opens_after_threshold_consecutive_failures) {
  auto breaker = resonance::common::circuit_breaker{3, 10s};
  EXPECT_TRUE(breaker.allow());
  breaker.record_failure();
  breaker.record_failure();
  EXPECT_EQ(breaker.state(), breaker_state_t::closed);
  breaker.record_success();
  EXPECT_EQ(breaker.consecutive_failures(), 0u);

  breaker.record_failure();
  breaker.record_failure();
  breaker.record_failure();
  EXPECT_EQ(breaker.state(), breaker_state_t::open);
  EXPECT_FALSE(breaker.allow());
}

TEST(circuit_breaker, half_open_trial_closes_or_reopens) {
  auto breaker = resonance::common::circuit_breaker{1, 20ms};
  breaker.record_failure();
  EXPECT_FALSE(breaker.allow());
  std::this_thread::sleep_for(40ms);

  EXPECT_TRUE(breaker.allow());
  EXPECT_EQ(breaker.state(), breaker_state_t::half_open);
  EXPECT_FALSE(breaker.allow());
  breaker.record_failure();
  EXPECT_EQ(breaker.state(), breaker_state_t::open);

  std::this_thread::sleep_for(40ms);
  EXPECT_TRUE(breaker.allow());
  breaker.record_success();
  EXPECT_EQ(breaker.state(), breaker_state_t::closed);
  EXPECT_TRUE(breaker.allow());
  EXPECT_EQ(resonance::common::to_string(breaker.state()), "closed");
}

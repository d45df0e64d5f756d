#pragma once

#include <resonance/schema/enum_string.hpp>
#include <spdlog/spdlog.h>

#include <array>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

namespace resonance::common {

/// Capped exponential backoff for calls to external services.
struct retry_policy final {
  uint32_t max_attempts{5};
  std::chrono::milliseconds initial_delay{200};
  std::chrono::milliseconds max_delay{10000};
  double multiplier{2.0};

  /// Delay to wait after failed attempt number `attempt` (1-based).
  std::chrono::milliseconds delay_for(uint32_t attempt) const;
};

/// Interruptible sleep shared by a worker loop and whoever stops it.
class stop_signal final {
 public:
  /// Wait up to `timeout`. Returns true when a stop was requested.
  bool wait_for(std::chrono::milliseconds timeout);
  void request_stop();
  bool stop_requested() const;
  void reset();

 private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool stop_{false};
};

enum class breaker_state_t : uint8_t { closed = 0, open = 1, half_open = 2 };

inline constexpr auto kBreakerStateMappings = std::array{
    std::pair<std::string_view, breaker_state_t>{"closed",
                                                 breaker_state_t::closed},
    std::pair<std::string_view, breaker_state_t>{"open", breaker_state_t::open},
    std::pair<std::string_view, breaker_state_t>{"half_open",
                                                 breaker_state_t::half_open}};

inline constexpr std::string_view to_string(const breaker_state_t value) {
  return resonance::schema::name_of(value, kBreakerStateMappings);
}

/// Consecutive-failure circuit breaker.
///
/// Opens after `failure_threshold` failures in a row. Once `cooldown` has
/// elapsed a single trial call is let through; its outcome closes or
/// re-opens the breaker.
class circuit_breaker final {
 public:
  using clock_t = std::chrono::steady_clock;

  circuit_breaker(uint32_t failure_threshold,
                  std::chrono::milliseconds cooldown);

  /// True if a call may proceed now.
  bool allow();
  void record_success();
  void record_failure();

  breaker_state_t state() const;
  uint32_t consecutive_failures() const;

 private:
  mutable std::mutex mutex_;
  uint32_t failure_threshold_;
  std::chrono::milliseconds cooldown_;
  breaker_state_t state_{breaker_state_t::closed};
  uint32_t consecutive_failures_{};
  clock_t::time_point opened_at_{};
  bool trial_in_flight_{false};
};

/// Call `fn(error)` until it yields a value, the policy runs out of attempts
/// or `stop` is signalled. `fn` returns std::optional<T> and fills `error`
/// on failure. `error` holds the last failure when std::nullopt is returned.
template <typename Fn>
auto retry(const retry_policy& policy,
           stop_signal* stop,
           const std::string_view& what,
           std::string& error,
           Fn&& fn) -> decltype(fn(error)) {
  for (auto attempt = uint32_t{1}; attempt <= policy.max_attempts; ++attempt) {
    error.clear();
    auto result = fn(error);
    if (result) {
      return result;
    }
    if (attempt == policy.max_attempts) {
      break;
    }
    auto delay = policy.delay_for(attempt);
    spdlog::warn("{} failed (attempt {}/{}): {}; retrying in {} ms", what,
                 attempt, policy.max_attempts, error, delay.count());
    if (stop != nullptr) {
      if (stop->wait_for(delay)) {
        error = "cancelled";
        return std::nullopt;
      }
    } else {
      std::this_thread::sleep_for(delay);
    }
  }
  return std::nullopt;
}

}  // namespace resonance::common

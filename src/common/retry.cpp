#include <resonance/common/retry.hpp>

#include <algorithm>
#include <cmath>

namespace resonance::common {

std::chrono::milliseconds retry_policy::delay_for(uint32_t attempt) const {
  if (attempt == 0) {
    return std::chrono::milliseconds{0};
  }
  auto scaled = static_cast<double>(initial_delay.count()) *
                std::pow(multiplier, static_cast<double>(attempt - 1));
  auto capped = std::min(scaled, static_cast<double>(max_delay.count()));
  return std::chrono::milliseconds{static_cast<int64_t>(capped)};
}

bool stop_signal::wait_for(std::chrono::milliseconds timeout) {
  auto lock = std::unique_lock{mutex_};
  return cv_.wait_for(lock, timeout, [this] { return stop_; });
}

void stop_signal::request_stop() {
  {
    auto lock = std::scoped_lock{mutex_};
    stop_ = true;
  }
  cv_.notify_all();
}

bool stop_signal::stop_requested() const {
  auto lock = std::scoped_lock{mutex_};
  return stop_;
}

void stop_signal::reset() {
  auto lock = std::scoped_lock{mutex_};
  stop_ = false;
}

circuit_breaker::circuit_breaker(uint32_t failure_threshold,
                                 std::chrono::milliseconds cooldown)
    : failure_threshold_{std::max(failure_threshold, uint32_t{1})},
      cooldown_{cooldown} {}

bool circuit_breaker::allow() {
  auto lock = std::scoped_lock{mutex_};
  switch (state_) {
    case breaker_state_t::closed:
      return true;
    case breaker_state_t::open:
      if (clock_t::now() - opened_at_ < cooldown_) {
        return false;
      }
      state_ = breaker_state_t::half_open;
      trial_in_flight_ = true;
      spdlog::info("Circuit breaker half-open; allowing a trial call");
      return true;
    case breaker_state_t::half_open:
      if (trial_in_flight_) {
        return false;
      }
      trial_in_flight_ = true;
      return true;
  }
  return false;
}

void circuit_breaker::record_success() {
  auto lock = std::scoped_lock{mutex_};
  if (state_ != breaker_state_t::closed) {
    spdlog::info("Circuit breaker closed");
  }
  state_ = breaker_state_t::closed;
  consecutive_failures_ = 0;
  trial_in_flight_ = false;
}

void circuit_breaker::record_failure() {
  auto lock = std::scoped_lock{mutex_};
  ++consecutive_failures_;
  trial_in_flight_ = false;
  if (state_ == breaker_state_t::half_open ||
      consecutive_failures_ >= failure_threshold_) {
    if (state_ != breaker_state_t::open) {
      spdlog::warn("Circuit breaker open after {} consecutive failure(s)",
                   consecutive_failures_);
    }
    state_ = breaker_state_t::open;
    opened_at_ = clock_t::now();
  }
}

breaker_state_t circuit_breaker::state() const {
  auto lock = std::scoped_lock{mutex_};
  return state_;
}

uint32_t circuit_breaker::consecutive_failures() const {
  auto lock = std::scoped_lock{mutex_};
  return consecutive_failures_;
}

}  // namespace resonance::common

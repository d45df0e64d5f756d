#pragma once

#include <resonance/common/retry.hpp>
#include <resonance/schema/enum_string.hpp>
#include <resonance/schema/merkle_commitment.hpp>
#include <resonance/schema/primitives.hpp>
#include <resonance/storage/rocksdb/storage.hpp>

#include <array>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

namespace resonance::reconciler {

/// Registry write. Returns the registry's reference for the update, or
/// std::nullopt with `error` filled.
using root_submitter_t = std::function<std::optional<std::string>(
    const resonance::schema::hash32_t& root,
    std::string& error)>;

/// Registry read of the currently published root. std::nullopt with an
/// empty `error` means nothing is published yet.
using latest_root_reader_t =
    std::function<std::optional<resonance::schema::hash32_t>(
        std::string& error)>;

enum class anchor_outcome_t : uint8_t {
  anchored = 0,
  unchanged = 1,
  stale = 2,
  failed = 3,
  circuit_open = 4,
  cancelled = 5
};

inline constexpr auto kAnchorOutcomeMappings = std::array{
    std::pair<std::string_view, anchor_outcome_t>{"anchored",
                                                  anchor_outcome_t::anchored},
    std::pair<std::string_view, anchor_outcome_t>{"unchanged",
                                                  anchor_outcome_t::unchanged},
    std::pair<std::string_view, anchor_outcome_t>{"stale",
                                                  anchor_outcome_t::stale},
    std::pair<std::string_view, anchor_outcome_t>{"failed",
                                                  anchor_outcome_t::failed},
    std::pair<std::string_view, anchor_outcome_t>{
        "circuit_open", anchor_outcome_t::circuit_open},
    std::pair<std::string_view, anchor_outcome_t>{
        "cancelled", anchor_outcome_t::cancelled}};

inline constexpr std::string_view to_string(const anchor_outcome_t value) {
  return resonance::schema::name_of(value, kAnchorOutcomeMappings);
}

struct anchor_options_t final {
  resonance::common::retry_policy retry{};
  uint32_t breaker_threshold{5};
  std::chrono::milliseconds breaker_cooldown{30000};
};

/// Publishes Merkle commitments to the external registry.
///
/// A root equal to the last anchored one is never resubmitted, and a
/// commitment older or smaller than the last anchored one is rejected so
/// the registry never moves backwards. `submit` hands a commitment to a
/// background worker through a single-slot mailbox; a newer commitment
/// replaces one that has not been picked up yet.
class anchor_publisher final {
 public:
  using storage_t = resonance::storage::rocksdb_storage_t;

  anchor_publisher(root_submitter_t submit_root,
                   latest_root_reader_t read_latest_root,
                   anchor_options_t options = {},
                   const storage_t* storage = nullptr);
  ~anchor_publisher();

  anchor_publisher(const anchor_publisher&) = delete;
  anchor_publisher& operator=(const anchor_publisher&) = delete;

  /// Anchor synchronously on the calling thread.
  anchor_outcome_t anchor(const resonance::schema::merkle_commitment_t& commitment);

  /// Queue a commitment for the worker. Never blocks on the registry.
  void submit(resonance::schema::merkle_commitment_t commitment);

  void start();
  void stop();
  bool running() const;

  std::optional<resonance::schema::anchor_record_t> last_anchored() const;
  /// Number of registry writes made by this process.
  uint64_t submissions() const;
  resonance::common::breaker_state_t breaker_state() const;

 private:
  void run();
  void record_anchor(const resonance::schema::merkle_commitment_t& commitment,
                     const std::string& reference);

  root_submitter_t submit_root_;
  latest_root_reader_t read_latest_root_;
  anchor_options_t options_;
  const storage_t* storage_{nullptr};
  resonance::common::circuit_breaker breaker_;
  resonance::common::stop_signal stop_;

  std::mutex anchor_mutex_;
  mutable std::mutex mutex_;
  std::optional<resonance::schema::anchor_record_t> last_anchored_;
  uint64_t submissions_{};

  mutable std::mutex mailbox_mutex_;
  std::condition_variable mailbox_cv_;
  std::optional<resonance::schema::merkle_commitment_t> mailbox_;
  bool stopping_{false};
  std::thread worker_;
};

}  // namespace resonance::reconciler

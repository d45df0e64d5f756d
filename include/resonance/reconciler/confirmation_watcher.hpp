#pragma once

#include <resonance/common/retry.hpp>
#include <resonance/ledger/marker_table.hpp>
#include <resonance/reconciler/anchor_publisher.hpp>
#include <resonance/schema/enum_string.hpp>
#include <resonance/schema/error_code.hpp>
#include <resonance/schema/merkle_commitment.hpp>
#include <resonance/schema/transfer_event.hpp>
#include <resonance/storage/record_store.hpp>
#include <resonance/storage/rocksdb/storage.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

namespace resonance::reconciler {

/// Upstream event source: confirmations at or after `from_cursor`, at most
/// `limit` of them. std::nullopt with `error` filled when the source could
/// not be reached; undecodable transfers travel in the batch's `rejected`.
using event_fetcher_t =
    std::function<std::optional<resonance::schema::transfer_batch_t>(
        uint64_t from_cursor,
        uint32_t limit,
        std::string& error)>;

enum class watcher_state_t : uint8_t {
  idle = 0,
  running = 1,
  retrying = 2,
  stopped = 3
};

inline constexpr auto kWatcherStateMappings = std::array{
    std::pair<std::string_view, watcher_state_t>{"idle", watcher_state_t::idle},
    std::pair<std::string_view, watcher_state_t>{"running",
                                                 watcher_state_t::running},
    std::pair<std::string_view, watcher_state_t>{"retrying",
                                                 watcher_state_t::retrying},
    std::pair<std::string_view, watcher_state_t>{"stopped",
                                                 watcher_state_t::stopped}};

inline constexpr std::string_view to_string(const watcher_state_t value) {
  return resonance::schema::name_of(value, kWatcherStateMappings);
}

struct watcher_options_t final {
  std::chrono::milliseconds poll_interval{10000};
  std::chrono::milliseconds commit_interval{60000};
  uint32_t batch_limit{500};
  /// Used only when no cursor has been persisted.
  uint64_t start_cursor{};
  resonance::common::retry_policy retry{};
  uint32_t breaker_threshold{5};
  std::chrono::milliseconds breaker_cooldown{30000};
};

/// Outcome of one polling cycle. `malformed_event` still advances the
/// cursor: rejected transfers are logged and skipped.
struct cycle_result_t final {
  resonance::schema::error_code_t code{resonance::schema::error_code_t::ok};
  std::string log;
  uint64_t events_seen{};
  uint64_t records_written{};
  uint64_t duplicates{};
  uint64_t synthesized{};
  uint64_t rejected{};
  uint64_t cursor{};
};

struct watcher_status_t final {
  watcher_state_t state{watcher_state_t::idle};
  uint32_t consecutive_failures{};
  std::string last_error;
  uint64_t cursor{};
  std::optional<resonance::schema::merkle_commitment_t> latest_commitment;
};

/// Drives marker confirmation, record persistence and periodic commitment.
///
/// Cycles run one at a time. Events of a batch are processed in order and
/// the cursor only advances, and is persisted, once the whole batch has
/// been handled. Every step is idempotent so a batch replayed after a crash
/// leaves the same records and markers behind.
class confirmation_watcher final {
 public:
  using storage_t = resonance::storage::rocksdb_storage_t;

  confirmation_watcher(event_fetcher_t fetch_events,
                       resonance::ledger::marker_table& markers,
                       const resonance::storage::record_store& records,
                       anchor_publisher& publisher,
                       watcher_options_t options = {},
                       const storage_t* storage = nullptr);
  ~confirmation_watcher();

  confirmation_watcher(const confirmation_watcher&) = delete;
  confirmation_watcher& operator=(const confirmation_watcher&) = delete;

  /// Fetch and process one batch from the current cursor.
  cycle_result_t poll_once();

  /// Commit the current record set and hand a changed root to the
  /// publisher. std::nullopt with `error` filled when there is nothing to
  /// commit or the store could not be read.
  std::optional<resonance::schema::merkle_commitment_t> commit_once(
      std::string& error);

  /// Start the polling loop on a background thread. False if already
  /// running.
  bool start();
  /// Stop accepting cycles, let the in-flight batch finish and join.
  void stop();
  bool running() const;

  watcher_status_t status() const;
  uint64_t cursor() const;
  std::optional<resonance::schema::merkle_commitment_t> latest_commitment()
      const;

 private:
  void run();
  bool process_event(const resonance::schema::transfer_event_t& event,
                     cycle_result_t& result,
                     std::string& error);
  void persist_cursor(uint64_t cursor) const;
  void persist_commitment(
      const resonance::schema::merkle_commitment_t& commitment) const;
  void set_state(watcher_state_t state);

  event_fetcher_t fetch_events_;
  resonance::ledger::marker_table& markers_;
  const resonance::storage::record_store& records_;
  anchor_publisher& publisher_;
  watcher_options_t options_;
  const storage_t* storage_{nullptr};
  resonance::common::circuit_breaker breaker_;
  resonance::common::stop_signal stop_;

  std::mutex cycle_mutex_;
  mutable std::mutex mutex_;
  watcher_state_t state_{watcher_state_t::idle};
  uint32_t consecutive_failures_{};
  std::string last_error_;
  uint64_t cursor_{};
  std::optional<resonance::schema::merkle_commitment_t> latest_commitment_;

  std::mutex thread_mutex_;
  std::thread worker_;
};

}  // namespace resonance::reconciler

#pragma once

#include <resonance/crypto/key_material.hpp>
#include <resonance/ledger/marker_table.hpp>
#include <resonance/ledger/merkle.hpp>
#include <resonance/ledger/supply_controller.hpp>
#include <resonance/reconciler/anchor_publisher.hpp>
#include <resonance/reconciler/confirmation_watcher.hpp>
#include <resonance/reconciler/transfer_submitter.hpp>
#include <resonance/schema/confirmed_record.hpp>
#include <resonance/schema/instant_marker.hpp>
#include <resonance/schema/merkle_commitment.hpp>
#include <resonance/schema/primitives.hpp>
#include <resonance/schema/supply_state.hpp>
#include <resonance/schema/transfer_event.hpp>
#include <resonance/storage/record_store.hpp>
#include <resonance/storage/rocksdb/storage.hpp>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace resonance::reconciler {

struct context_options_t final {
  /// Holds `records/` (encrypted blobs) and `state/` (RocksDB).
  std::filesystem::path data_dir{"resonance_data"};
  watcher_options_t watcher{};
  anchor_options_t anchor{};
  resonance::schema::supply_state_t supply{};
};

/// Read-only snapshot for observers. May be slightly stale.
struct status_snapshot_t final {
  resonance::ledger::marker_counts_t markers{};
  std::size_t records{};
  watcher_status_t watcher{};
  std::optional<resonance::schema::anchor_record_t> last_anchored;
  resonance::common::breaker_state_t anchor_breaker{
      resonance::common::breaker_state_t::closed};
  resonance::schema::supply_state_t supply{};
};

struct inclusion_proof_t final {
  resonance::schema::hash32_t resonance_id{};
  resonance::schema::hash32_t leaf{};
  uint64_t leaf_index{};
  std::vector<resonance::ledger::proof_step_t> steps;
  resonance::schema::hash32_t root{};
  uint64_t sequence{};
};

struct transfer_submission_t final {
  resonance::schema::hash32_t marker_id{};
  std::string external_ref;
};

/// Transfer described by a marker payload: `to` and `amount` (or `value`)
/// are required, `from` is optional. A payload that already names an
/// `external_ref` describes a transfer that was sent elsewhere.
std::optional<resonance::schema::transfer_request_t> make_transfer_request(
    const resonance::schema::payload_t& payload,
    std::string& error);

/// Everything the reconciler process owns, constructed once at startup and
/// handed to the control surface. Holds no global state.
class context final {
 public:
  /// Opens the record store and RocksDB state under `options.data_dir`.
  /// Failure to open either is fatal.
  context(context_options_t options,
          resonance::crypto::key_material keys,
          event_fetcher_t fetch_events,
          root_submitter_t submit_root,
          latest_root_reader_t read_latest_root,
          transfer_submitter_t submit_transfer = {});
  ~context();

  context(const context&) = delete;
  context& operator=(const context&) = delete;

  resonance::schema::hash32_t record_marker(
      resonance::schema::payload_t payload);
  std::optional<resonance::schema::instant_marker_t> find_marker(
      const resonance::schema::hash32_t& marker_id) const;

  /// Record a pending marker for `payload`, then broadcast the transfer it
  /// describes and attach the returned reference to the marker. The send is
  /// not retried; when it fails the marker stays pending and can still be
  /// confirmed by correlation.
  std::optional<transfer_submission_t> submit_transfer(
      resonance::schema::payload_t payload,
      std::string& error);

  /// Start the watcher loop and the anchoring worker.
  bool start();
  /// Stop the watcher after its in-flight batch, then the anchoring worker.
  void stop();

  status_snapshot_t status() const;

  /// Returns the amount burned by this report.
  resonance::schema::amount_t report_supply(
      const resonance::schema::amount_t& circulating_supply);

  std::optional<resonance::schema::confirmed_record_t> get_record(
      const resonance::schema::hash32_t& resonance_id,
      std::string& error) const;

  /// Proof that the record is a leaf of the latest commitment.
  std::optional<inclusion_proof_t> inclusion_proof(
      const resonance::schema::hash32_t& resonance_id,
      std::string& error) const;

  resonance::ledger::marker_table& markers() { return markers_; }
  const resonance::storage::record_store& records() const { return records_; }
  resonance::ledger::supply_controller& supply() { return supply_; }
  anchor_publisher& publisher() { return publisher_; }
  confirmation_watcher& watcher() { return watcher_; }

 private:
  context_options_t options_;
  resonance::crypto::key_material keys_;
  transfer_submitter_t submit_transfer_;
  resonance::storage::rocksdb_storage_t storage_;
  resonance::storage::record_store records_;
  resonance::ledger::marker_table markers_;
  resonance::ledger::supply_controller supply_;
  anchor_publisher publisher_;
  confirmation_watcher watcher_;
};

}  // namespace resonance::reconciler

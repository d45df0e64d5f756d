#pragma once

#include <resonance/schema/enum_string.hpp>
#include <resonance/schema/instant_marker.hpp>
#include <resonance/schema/primitives.hpp>
#include <resonance/schema/transfer_event.hpp>
#include <resonance/storage/rocksdb/storage.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace resonance::ledger {

enum class link_outcome_t : uint8_t {
  confirmed = 0,
  already_confirmed = 1,
  synthesized = 2,
  conflict = 3
};

inline constexpr auto kLinkOutcomeMappings = std::array{
    std::pair<std::string_view, link_outcome_t>{"confirmed",
                                                link_outcome_t::confirmed},
    std::pair<std::string_view, link_outcome_t>{
        "already_confirmed", link_outcome_t::already_confirmed},
    std::pair<std::string_view, link_outcome_t>{"synthesized",
                                                link_outcome_t::synthesized},
    std::pair<std::string_view, link_outcome_t>{"conflict",
                                                link_outcome_t::conflict}};

inline constexpr std::string_view to_string(const link_outcome_t value) {
  return resonance::schema::name_of(value, kLinkOutcomeMappings);
}

struct marker_counts_t final {
  std::size_t pending{};
  std::size_t confirmed{};
};

/// Table of locally originated intents and their confirmation state.
///
/// Producers add pending markers concurrently; the confirmation watcher is
/// the only writer of the pending -> confirmed transition. Every transition
/// is taken under one lock and, when a storage backend is supplied, written
/// through to RocksDB so pending intents survive a restart.
class marker_table final {
 public:
  using storage_t = resonance::storage::rocksdb_storage_t;

  /// Construct the table, reloading persisted markers from `storage`.
  /// A null `storage` keeps the table in memory only.
  explicit marker_table(const storage_t* storage = nullptr);

  /// Register a new pending intent and return its id.
  resonance::schema::hash32_t record_marker(resonance::schema::payload_t payload);

  /// Mark `marker_id` confirmed by `external_ref`.
  ///
  /// An unknown id is not an error: a confirmed marker is synthesized under
  /// that id with `synthesized_payload`. A marker that is already confirmed
  /// is never changed.
  link_outcome_t link_confirmation(
      const resonance::schema::hash32_t& marker_id,
      const std::string& external_ref,
      const resonance::schema::payload_t& synthesized_payload = {});

  /// Record the reference a pending marker's transfer was sent under, so
  /// the confirmation resolves to it by reference. False when the marker is
  /// unknown or no longer pending.
  bool attach_external_ref(const resonance::schema::hash32_t& marker_id,
                           const std::string& external_ref);

  /// Find the marker an incoming confirmation belongs to.
  ///
  /// Order: a marker already confirmed with the same reference, then the
  /// oldest pending marker whose `external_ref` payload entry names the
  /// event, then the oldest pending marker whose `from`/`to`/`amount`
  /// entries all agree with the event.
  std::optional<resonance::schema::hash32_t> resolve(
      const resonance::schema::transfer_event_t& event) const;

  std::optional<resonance::schema::instant_marker_t> find(
      const resonance::schema::hash32_t& marker_id) const;
  std::optional<resonance::schema::instant_marker_t> find_by_external_ref(
      const std::string_view& external_ref) const;

  marker_counts_t counts() const;
  std::vector<resonance::schema::instant_marker_t> list(
      std::optional<resonance::schema::marker_status_t> status =
          std::nullopt) const;

 private:
  void load_persisted_markers();
  void persist(const resonance::schema::instant_marker_t& marker) const;
  void index(const resonance::schema::instant_marker_t& marker);
  resonance::schema::hash32_t make_marker_id(
      const resonance::schema::payload_t& payload,
      uint64_t sequence,
      resonance::schema::timestamp_milliseconds_t created_at) const;

  mutable std::mutex mutex_;
  const storage_t* storage_{nullptr};
  std::map<resonance::schema::hash32_t, resonance::schema::instant_marker_t>
      markers_;
  std::map<std::string, resonance::schema::hash32_t, std::less<>>
      by_external_ref_;
  std::map<uint64_t, resonance::schema::hash32_t> pending_by_sequence_;
  uint64_t next_sequence_{1};
  std::array<uint8_t, 32> salt_{};
};

}  // namespace resonance::ledger

#pragma once

#include <resonance/schema/primitives.hpp>
#include <resonance/schema/supply_state.hpp>
#include <resonance/storage/rocksdb/storage.hpp>

#include <mutex>

namespace resonance::ledger {

/// One-way burn bookkeeping driven by external supply reports.
///
/// The burn fires at most once per state: when the reported circulating
/// supply reaches the total supply while nothing has been burned yet,
/// `burned_total` grows by exactly `burn_target`. Later reports only update
/// the circulating figure.
class supply_controller final {
 public:
  using storage_t = resonance::storage::rocksdb_storage_t;

  /// A persisted state in `storage` takes precedence over `initial`.
  explicit supply_controller(resonance::schema::supply_state_t initial = {},
                             const storage_t* storage = nullptr);

  /// Apply a supply report and return the amount burned by it (zero unless
  /// this report fired the burn).
  resonance::schema::amount_t evaluate(
      const resonance::schema::amount_t& circulating_supply);

  resonance::schema::supply_state_t state() const;
  resonance::schema::amount_t remaining_supply() const;

 private:
  void persist() const;

  mutable std::mutex mutex_;
  resonance::schema::supply_state_t state_;
  const storage_t* storage_{nullptr};
};

}  // namespace resonance::ledger

#pragma once
#include <resonance/schema/primitives.hpp>
#include <string>
#include <vector>

namespace resonance::schema {

/// Confirmation observed on the upstream transfer feed.
struct transfer_event_t final {
  std::string external_ref;
  std::string from_party;
  std::string to_party;
  amount_t value{};
  uint64_t cursor_position{};
  uint32_t log_index{};
};

/// Transfer the bridge delivered but that could not be decoded. Retrying
/// cannot fix it, so it is reported and skipped rather than failing the
/// batch.
struct rejected_transfer_t final {
  std::string external_ref;
  uint64_t cursor_position{};
  std::string reason;
};

/// Outgoing transfer handed to the bridge for broadcast.
struct transfer_request_t final {
  std::string from_party;
  std::string to_party;
  amount_t value{};
};

struct transfer_batch_t final {
  std::vector<transfer_event_t> events;
  // Position to request from once every event above has been processed.
  uint64_t next_cursor{};
  std::vector<rejected_transfer_t> rejected;
};

}  // namespace resonance::schema

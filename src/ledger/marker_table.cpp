#include <boost/algorithm/string/predicate.hpp>
#include <resonance/blake3/hash.hpp>
#include <resonance/common/critical.hpp>
#include <resonance/crypto/digest.hpp>
#include <resonance/ledger/marker_table.hpp>
#include <resonance/schema/encoding/scale/encoder.hpp>
#include <resonance/schema/key/keys.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>

using namespace resonance::schema;

namespace {

constexpr auto kExternalRefKey = std::string_view{"external_ref"};

std::optional<std::string_view> lookup(const payload_t& payload,
                                       const std::string_view& key) {
  auto it = payload.find(std::string{key});
  if (it == std::end(payload)) {
    return std::nullopt;
  }
  return std::string_view{it->second};
}

// Every correlation entry present in the payload must agree with the event,
// and at least one must be present.
bool correlates(const payload_t& payload, const transfer_event_t& event) {
  auto present = 0u;
  if (auto from = lookup(payload, "from")) {
    ++present;
    if (!boost::algorithm::iequals(*from, event.from_party)) {
      return false;
    }
  }
  if (auto to = lookup(payload, "to")) {
    ++present;
    if (!boost::algorithm::iequals(*to, event.to_party)) {
      return false;
    }
  }
  for (const auto key : {std::string_view{"amount"}, std::string_view{"value"}}) {
    if (auto amount = lookup(payload, key)) {
      ++present;
      auto parsed = try_parse_amount(*amount);
      if (!parsed || *parsed != event.value) {
        return false;
      }
    }
  }
  return present > 0;
}

}  // namespace

namespace resonance::ledger {

marker_table::marker_table(const storage_t* storage) : storage_{storage} {
  if (!resonance::crypto::random_bytes(salt_)) {
    resonance::common::critical("failed to seed marker id salt");
  }
  if (storage_ != nullptr) {
    load_persisted_markers();
  }
}

hash32_t marker_table::record_marker(payload_t payload) {
  auto lock = std::scoped_lock{mutex_};
  auto marker = instant_marker_t{};
  marker.sequence = next_sequence_++;
  marker.created_at = now_milliseconds();
  marker.marker_id = make_marker_id(payload, marker.sequence, marker.created_at);
  marker.payload = std::move(payload);

  persist(marker);
  index(marker);
  markers_.emplace(marker.marker_id, marker);
  spdlog::info("Recorded instant marker {}", to_hex(marker.marker_id));
  return marker.marker_id;
}

link_outcome_t marker_table::link_confirmation(
    const hash32_t& marker_id,
    const std::string& external_ref,
    const payload_t& synthesized_payload) {
  auto lock = std::scoped_lock{mutex_};

  auto bound = by_external_ref_.find(external_ref);
  auto it = markers_.find(marker_id);
  if (it == std::end(markers_)) {
    if (bound != std::end(by_external_ref_)) {
      spdlog::warn("Reference {} already confirms marker {}; not synthesizing {}",
                   external_ref, to_hex(bound->second), to_hex(marker_id));
      return link_outcome_t::conflict;
    }
    auto marker = instant_marker_t{};
    marker.marker_id = marker_id;
    marker.sequence = next_sequence_++;
    marker.status = marker_status_t::confirmed;
    marker.external_ref = external_ref;
    marker.payload = synthesized_payload;
    marker.created_at = now_milliseconds();
    marker.confirmed_at = marker.created_at;
    marker.synthesized = true;

    persist(marker);
    index(marker);
    markers_.emplace(marker_id, marker);
    spdlog::info("No local intent for confirmation {}; synthesized marker {}",
                 external_ref, to_hex(marker_id));
    return link_outcome_t::synthesized;
  }

  auto& marker = it->second;
  if (marker.status == marker_status_t::confirmed) {
    if (marker.external_ref == external_ref) {
      return link_outcome_t::already_confirmed;
    }
    spdlog::warn("Marker {} is already confirmed by {}; ignoring {}",
                 to_hex(marker_id), marker.external_ref.value_or(""),
                 external_ref);
    return link_outcome_t::conflict;
  }
  if (bound != std::end(by_external_ref_)) {
    spdlog::warn("Reference {} already confirms marker {}; marker {} stays "
                 "pending",
                 external_ref, to_hex(bound->second), to_hex(marker_id));
    return link_outcome_t::conflict;
  }

  auto updated = marker;
  updated.status = marker_status_t::confirmed;
  updated.external_ref = external_ref;
  updated.confirmed_at = now_milliseconds();
  persist(updated);

  pending_by_sequence_.erase(marker.sequence);
  marker = std::move(updated);
  index(marker);
  spdlog::info("Linked marker {} -> {}", to_hex(marker_id), external_ref);
  return link_outcome_t::confirmed;
}

bool marker_table::attach_external_ref(const hash32_t& marker_id,
                                       const std::string& external_ref) {
  auto lock = std::scoped_lock{mutex_};
  auto it = markers_.find(marker_id);
  if (it == std::end(markers_) ||
      it->second.status != marker_status_t::pending) {
    return false;
  }
  auto updated = it->second;
  updated.payload[std::string{kExternalRefKey}] = external_ref;
  persist(updated);
  it->second = std::move(updated);
  spdlog::debug("Marker {} expects reference {}", to_hex(marker_id),
                external_ref);
  return true;
}

std::optional<hash32_t> marker_table::resolve(
    const transfer_event_t& event) const {
  auto lock = std::scoped_lock{mutex_};
  if (auto bound = by_external_ref_.find(event.external_ref);
      bound != std::end(by_external_ref_)) {
    return bound->second;
  }

  for (const auto& [sequence, id] : pending_by_sequence_) {
    const auto& payload = markers_.at(id).payload;
    if (lookup(payload, kExternalRefKey) == event.external_ref) {
      return id;
    }
  }
  for (const auto& [sequence, id] : pending_by_sequence_) {
    const auto& payload = markers_.at(id).payload;
    if (lookup(payload, kExternalRefKey)) {
      continue;
    }
    if (correlates(payload, event)) {
      return id;
    }
  }
  return std::nullopt;
}

std::optional<instant_marker_t> marker_table::find(
    const hash32_t& marker_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto it = markers_.find(marker_id);
  if (it == std::end(markers_)) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<instant_marker_t> marker_table::find_by_external_ref(
    const std::string_view& external_ref) const {
  auto lock = std::scoped_lock{mutex_};
  auto bound = by_external_ref_.find(external_ref);
  if (bound == std::end(by_external_ref_)) {
    return std::nullopt;
  }
  return markers_.at(bound->second);
}

marker_counts_t marker_table::counts() const {
  auto lock = std::scoped_lock{mutex_};
  auto counts = marker_counts_t{};
  counts.pending = pending_by_sequence_.size();
  counts.confirmed = markers_.size() - counts.pending;
  return counts;
}

std::vector<instant_marker_t> marker_table::list(
    std::optional<marker_status_t> status) const {
  auto lock = std::scoped_lock{mutex_};
  auto out = std::vector<instant_marker_t>{};
  for (const auto& [id, marker] : markers_) {
    if (!status || marker.status == *status) {
      out.push_back(marker);
    }
  }
  std::sort(std::begin(out), std::end(out),
            [](const instant_marker_t& lhs, const instant_marker_t& rhs) {
              return lhs.sequence < rhs.sequence;
            });
  return out;
}

void marker_table::load_persisted_markers() {
  auto prefix = key::make_system_key(key::kMarkerPrefix);
  auto rows =
      storage_->list_by_prefix(bytes_view_t{prefix.data(), prefix.size()});
  auto encoder = scale_encoder_t{};
  for (const auto& [row_key, value] : rows) {
    auto marker = encoder.try_decode<instant_marker_t>(
        bytes_view_t{value.data(), value.size()});
    if (!marker) {
      resonance::common::critical("failed to decode persisted marker");
    }
    next_sequence_ = std::max(next_sequence_, marker->sequence + 1);
    index(*marker);
    markers_.emplace(marker->marker_id, std::move(*marker));
  }
  auto counts = marker_counts_t{pending_by_sequence_.size(),
                                markers_.size() - pending_by_sequence_.size()};
  spdlog::info("Loaded {} pending and {} confirmed marker(s)", counts.pending,
               counts.confirmed);
}

void marker_table::persist(const instant_marker_t& marker) const {
  if (storage_ == nullptr) {
    return;
  }
  auto encoder = scale_encoder_t{};
  auto marker_key = key::make_marker_key(marker.marker_id);
  storage_->put(encoder, bytes_view_t{marker_key.data(), marker_key.size()},
                marker);
}

void marker_table::index(const instant_marker_t& marker) {
  if (marker.status == marker_status_t::pending) {
    pending_by_sequence_[marker.sequence] = marker.marker_id;
  } else if (marker.external_ref) {
    by_external_ref_[*marker.external_ref] = marker.marker_id;
  }
}

hash32_t marker_table::make_marker_id(
    const payload_t& payload,
    const uint64_t sequence,
    const timestamp_milliseconds_t created_at) const {
  auto encoder = scale_encoder_t{};
  auto encoded_payload = encoder.encode(payload);
  return resonance::blake3::hasher{}
      .update(std::span<const uint8_t>{salt_.data(), salt_.size()})
      .update(sequence)
      .update(created_at)
      .update(std::span<const uint8_t>{encoded_payload.data(),
                                       encoded_payload.size()})
      .finalize();
}

}  // namespace resonance::ledger

#include <resonance/reconciler/context.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>

using namespace resonance::schema;

namespace {

resonance::storage::rocksdb_storage_t open_state(
    const std::filesystem::path& data_dir) {
  return resonance::storage::make_storage<
      resonance::storage::rocksdb_storage_tag>((data_dir / "state").string());
}

std::optional<std::string_view> lookup(const payload_t& payload,
                                       const std::string& key) {
  auto it = payload.find(key);
  if (it == std::end(payload) || it->second.empty()) {
    return std::nullopt;
  }
  return std::string_view{it->second};
}

}  // namespace

namespace resonance::reconciler {

std::optional<transfer_request_t> make_transfer_request(
    const payload_t& payload,
    std::string& error) {
  if (lookup(payload, "external_ref")) {
    error = "payload already names an external_ref";
    return std::nullopt;
  }
  auto to = lookup(payload, "to");
  if (!to) {
    error = "payload has no 'to' entry";
    return std::nullopt;
  }
  auto amount = lookup(payload, "amount");
  if (!amount) {
    amount = lookup(payload, "value");
  }
  if (!amount) {
    error = "payload has no 'amount' entry";
    return std::nullopt;
  }
  auto value = try_parse_amount(*amount);
  if (!value) {
    error = "invalid amount '" + std::string{*amount} + "'";
    return std::nullopt;
  }
  auto request = transfer_request_t{};
  request.from_party = std::string{lookup(payload, "from").value_or("")};
  request.to_party = std::string{*to};
  request.value = *value;
  return request;
}

context::context(context_options_t options,
                 resonance::crypto::key_material keys,
                 event_fetcher_t fetch_events,
                 root_submitter_t submit_root,
                 latest_root_reader_t read_latest_root,
                 transfer_submitter_t submit_transfer)
    : options_{std::move(options)},
      keys_{std::move(keys)},
      submit_transfer_{std::move(submit_transfer)},
      storage_{open_state(options_.data_dir)},
      records_{options_.data_dir / "records", keys_},
      markers_{&storage_},
      supply_{options_.supply, &storage_},
      publisher_{std::move(submit_root), std::move(read_latest_root),
                 options_.anchor, &storage_},
      watcher_{std::move(fetch_events), markers_,         records_,
               publisher_,              options_.watcher, &storage_} {
  auto counts = markers_.counts();
  spdlog::info("Reconciler ready: {} record(s), {} pending marker(s)",
               records_.size(), counts.pending);
}

context::~context() {
  stop();
}

hash32_t context::record_marker(payload_t payload) {
  return markers_.record_marker(std::move(payload));
}

std::optional<instant_marker_t> context::find_marker(
    const hash32_t& marker_id) const {
  return markers_.find(marker_id);
}

std::optional<transfer_submission_t> context::submit_transfer(
    payload_t payload,
    std::string& error) {
  if (!submit_transfer_) {
    error = "transfer submission is not configured";
    return std::nullopt;
  }
  auto request = make_transfer_request(payload, error);
  if (!request) {
    return std::nullopt;
  }

  auto submission = transfer_submission_t{};
  submission.marker_id = markers_.record_marker(std::move(payload));
  auto reference = submit_transfer_(*request, error);
  if (!reference) {
    spdlog::warn("Transfer for marker {} was not sent: {}",
                 to_hex(submission.marker_id), error);
    error = "marker " + to_hex(submission.marker_id) +
            " stays pending: " + error;
    return std::nullopt;
  }

  submission.external_ref = std::move(*reference);
  if (!markers_.attach_external_ref(submission.marker_id,
                                    submission.external_ref)) {
    spdlog::debug("Marker {} was confirmed before {} was attached",
                  to_hex(submission.marker_id), submission.external_ref);
  }
  spdlog::info("Sent transfer {} for marker {}", submission.external_ref,
               to_hex(submission.marker_id));
  return submission;
}

bool context::start() {
  publisher_.start();
  return watcher_.start();
}

void context::stop() {
  watcher_.stop();
  publisher_.stop();
}

status_snapshot_t context::status() const {
  auto snapshot = status_snapshot_t{};
  snapshot.markers = markers_.counts();
  snapshot.records = records_.size();
  snapshot.watcher = watcher_.status();
  snapshot.last_anchored = publisher_.last_anchored();
  snapshot.anchor_breaker = publisher_.breaker_state();
  snapshot.supply = supply_.state();
  return snapshot;
}

amount_t context::report_supply(const amount_t& circulating_supply) {
  return supply_.evaluate(circulating_supply);
}

std::optional<confirmed_record_t> context::get_record(const hash32_t& resonance_id,
                                                      std::string& error) const {
  return records_.get(resonance_id, error);
}

std::optional<inclusion_proof_t> context::inclusion_proof(
    const hash32_t& resonance_id,
    std::string& error) const {
  auto commitment = watcher_.latest_commitment();
  if (!commitment) {
    error = "no commitment has been made yet";
    return std::nullopt;
  }
  auto stored = records_.enumerate(error);
  if (!stored) {
    return std::nullopt;
  }
  auto record = std::ranges::find_if(*stored, [&](const record_leaf_t& leaf) {
    return leaf.resonance_id == resonance_id;
  });
  if (record == std::end(*stored)) {
    error = "unknown record " + to_hex(resonance_id);
    return std::nullopt;
  }
  auto leaf = std::ranges::find(commitment->leaves, record->blob_digest);
  if (leaf == std::end(commitment->leaves)) {
    error = "record " + to_hex(resonance_id) +
            " is not part of commitment " +
            std::to_string(commitment->sequence);
    return std::nullopt;
  }

  auto index = static_cast<std::size_t>(
      std::distance(std::begin(commitment->leaves), leaf));
  auto tree = resonance::ledger::build(commitment->leaves);
  auto steps = resonance::ledger::make_proof(tree, index);
  if (!steps) {
    error = "failed to build proof";
    return std::nullopt;
  }

  auto proof = inclusion_proof_t{};
  proof.resonance_id = resonance_id;
  proof.leaf = *leaf;
  proof.leaf_index = index;
  proof.steps = std::move(*steps);
  proof.root = commitment->root;
  proof.sequence = commitment->sequence;
  return proof;
}

}  // namespace resonance::reconciler

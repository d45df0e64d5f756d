#include <resonance/ledger/merkle.hpp>
#include <resonance/reconciler/confirmation_watcher.hpp>
#include <resonance/schema/encoding/scale/encoder.hpp>
#include <resonance/schema/key/keys.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>

using namespace resonance::schema;

namespace {

constexpr auto kMarkerIdMetadataKey = "marker_id";

payload_t make_synthesized_payload(const transfer_event_t& event) {
  return payload_t{{"from", event.from_party},
                   {"to", event.to_party},
                   {"value", resonance::schema::to_string(event.value)},
                   {"external_ref", event.external_ref}};
}

}  // namespace

namespace resonance::reconciler {

confirmation_watcher::confirmation_watcher(
    event_fetcher_t fetch_events,
    resonance::ledger::marker_table& markers,
    const resonance::storage::record_store& records,
    anchor_publisher& publisher,
    watcher_options_t options,
    const storage_t* storage)
    : fetch_events_{std::move(fetch_events)},
      markers_{markers},
      records_{records},
      publisher_{publisher},
      options_{std::move(options)},
      storage_{storage},
      breaker_{options_.breaker_threshold, options_.breaker_cooldown},
      cursor_{options_.start_cursor} {
  if (storage_ == nullptr) {
    return;
  }
  auto encoder = scale_encoder_t{};
  if (auto cursor = storage_->get<uint64_t>(
          encoder, make_bytes_view(key::kWatcherCursorKey))) {
    cursor_ = *cursor;
    spdlog::info("Resuming confirmation watcher from cursor {}", cursor_);
  } else {
    spdlog::info("No persisted cursor; starting from {}", cursor_);
  }
  latest_commitment_ = storage_->get<merkle_commitment_t>(
      encoder, make_bytes_view(key::kLatestCommitmentKey));
}

confirmation_watcher::~confirmation_watcher() {
  stop();
}

cycle_result_t confirmation_watcher::poll_once() {
  auto cycle = std::scoped_lock{cycle_mutex_};
  auto result = cycle_result_t{};
  auto from_cursor = cursor();
  result.cursor = from_cursor;

  auto fail = [&](error_code_t code, std::string log) {
    result.code = code;
    result.log = std::move(log);
    auto lock = std::scoped_lock{mutex_};
    ++consecutive_failures_;
    last_error_ = result.log;
    return result;
  };

  if (!breaker_.allow()) {
    return fail(error_code_t::circuit_open,
                "event source circuit breaker is open");
  }

  auto error = std::string{};
  auto batch = fetch_events_(from_cursor, options_.batch_limit, error);
  if (!batch) {
    breaker_.record_failure();
    spdlog::warn("Polling events from cursor {} failed: {}", from_cursor,
                 error);
    return fail(error_code_t::transient_network_error, error);
  }
  breaker_.record_success();

  for (const auto& event : batch->events) {
    ++result.events_seen;
    if (!process_event(event, result, error)) {
      spdlog::error("Batch at cursor {} stopped at {}: {}", from_cursor,
                    event.external_ref, error);
      return fail(error_code_t::storage_write_failure, error);
    }
  }

  for (const auto& rejected : batch->rejected) {
    ++result.rejected;
    result.code = error_code_t::malformed_event;
    result.log = "skipped malformed transfer " + rejected.external_ref +
                 " at cursor " + std::to_string(rejected.cursor_position) +
                 ": " + rejected.reason;
    spdlog::error("Confirmation watcher {}", result.log);
  }

  auto next_cursor = std::max(from_cursor, batch->next_cursor);
  if (next_cursor != from_cursor) {
    persist_cursor(next_cursor);
  }
  {
    auto lock = std::scoped_lock{mutex_};
    cursor_ = next_cursor;
    consecutive_failures_ = 0;
    last_error_ = result.log;
  }
  result.cursor = next_cursor;
  if (result.events_seen > 0 || result.rejected > 0) {
    spdlog::info(
        "Processed {} event(s) from cursor {}: {} written, {} duplicate(s), "
        "{} synthesized, {} rejected; cursor now {}",
        result.events_seen, from_cursor, result.records_written,
        result.duplicates, result.synthesized, result.rejected, next_cursor);
  } else {
    spdlog::debug("No new events at cursor {}", from_cursor);
  }
  return result;
}

bool confirmation_watcher::process_event(const transfer_event_t& event,
                                         cycle_result_t& result,
                                         std::string& error) {
  auto resonance_id = records_.derive_id(event.external_ref);
  auto marker_id = markers_.resolve(event);
  auto marker =
      marker_id ? markers_.find(*marker_id) : std::optional<instant_marker_t>{};

  if (marker && marker->status == marker_status_t::confirmed &&
      marker->external_ref == event.external_ref &&
      records_.contains(resonance_id)) {
    ++result.duplicates;
    spdlog::debug("Duplicate confirmation {}", event.external_ref);
    return true;
  }

  auto linked_id =
      marker_id ? *marker_id : key::make_synthesized_marker_id(event.external_ref);
  auto metadata = marker ? marker->payload : payload_t{};
  metadata[kMarkerIdMetadataKey] = to_hex(linked_id);

  auto payload = record_payload_t{};
  payload.from_party = event.from_party;
  payload.to_party = event.to_party;
  payload.value = event.value;
  payload.cursor_position = event.cursor_position;

  auto receipt = records_.put(event.external_ref, payload, metadata, error);
  if (!receipt) {
    return false;
  }
  ++result.records_written;

  auto outcome = markers_.link_confirmation(
      linked_id, event.external_ref, make_synthesized_payload(event));
  if (outcome == resonance::ledger::link_outcome_t::synthesized) {
    ++result.synthesized;
  }
  spdlog::debug("Confirmation {} -> record {} ({})", event.external_ref,
                to_hex(receipt->resonance_id),
                resonance::ledger::to_string(outcome));
  return true;
}

std::optional<merkle_commitment_t> confirmation_watcher::commit_once(
    std::string& error) {
  auto cycle = std::scoped_lock{cycle_mutex_};
  auto leaves = records_.enumerate_hashes(error);
  if (!leaves) {
    return std::nullopt;
  }
  auto tree = resonance::ledger::build(*leaves);
  if (!tree.root) {
    error = "no records to commit";
    return std::nullopt;
  }

  auto previous = latest_commitment();
  auto commitment = merkle_commitment_t{};
  if (previous && previous->root == *tree.root) {
    commitment = *previous;
  } else {
    commitment.sequence = previous ? previous->sequence + 1 : 1;
    commitment.root = *tree.root;
    commitment.leaves = std::move(*leaves);
    commitment.committed_at = now_milliseconds();
  }

  auto anchored = publisher_.last_anchored();
  if (anchored && anchored->root == commitment.root) {
    if (!commitment.anchored_ref) {
      commitment.anchored_ref = anchored->reference;
    }
  } else {
    publisher_.submit(commitment);
  }

  if (!previous || previous->sequence != commitment.sequence ||
      previous->anchored_ref != commitment.anchored_ref) {
    persist_commitment(commitment);
    spdlog::info("Committed {} leaves as sequence {} with root {}",
                 commitment.leaves.size(), commitment.sequence,
                 to_hex(commitment.root));
  }
  auto lock = std::scoped_lock{mutex_};
  latest_commitment_ = commitment;
  return commitment;
}

bool confirmation_watcher::start() {
  auto lock = std::scoped_lock{thread_mutex_};
  if (worker_.joinable()) {
    return false;
  }
  stop_.reset();
  set_state(watcher_state_t::running);
  worker_ = std::thread{[this] { run(); }};
  return true;
}

void confirmation_watcher::stop() {
  auto lock = std::scoped_lock{thread_mutex_};
  if (!worker_.joinable()) {
    return;
  }
  stop_.request_stop();
  worker_.join();
  set_state(watcher_state_t::stopped);
  spdlog::info("Confirmation watcher stopped at cursor {}", cursor());
}

bool confirmation_watcher::running() const {
  auto lock = std::scoped_lock{mutex_};
  return state_ == watcher_state_t::running ||
         state_ == watcher_state_t::retrying;
}

watcher_status_t confirmation_watcher::status() const {
  auto lock = std::scoped_lock{mutex_};
  auto status = watcher_status_t{};
  status.state = state_;
  status.consecutive_failures = consecutive_failures_;
  status.last_error = last_error_;
  status.cursor = cursor_;
  status.latest_commitment = latest_commitment_;
  return status;
}

uint64_t confirmation_watcher::cursor() const {
  auto lock = std::scoped_lock{mutex_};
  return cursor_;
}

std::optional<merkle_commitment_t> confirmation_watcher::latest_commitment()
    const {
  auto lock = std::scoped_lock{mutex_};
  return latest_commitment_;
}

void confirmation_watcher::run() {
  spdlog::info("Confirmation watcher started at cursor {}", cursor());
  auto next_commit =
      std::chrono::steady_clock::now() + options_.commit_interval;
  while (!stop_.stop_requested()) {
    auto result = poll_once();
    auto wait = options_.poll_interval;
    if (result.code == error_code_t::ok ||
        result.code == error_code_t::malformed_event) {
      set_state(watcher_state_t::running);
    } else {
      auto failures = status().consecutive_failures;
      wait = options_.retry.delay_for(failures);
      set_state(watcher_state_t::retrying);
    }

    if (std::chrono::steady_clock::now() >= next_commit) {
      auto error = std::string{};
      if (!commit_once(error)) {
        spdlog::debug("Skipped commitment: {}", error);
      }
      next_commit =
          std::chrono::steady_clock::now() + options_.commit_interval;
    }

    if (stop_.wait_for(wait)) {
      break;
    }
  }
}

void confirmation_watcher::persist_cursor(uint64_t cursor) const {
  if (storage_ == nullptr) {
    return;
  }
  auto encoder = scale_encoder_t{};
  storage_->put(encoder, make_bytes_view(key::kWatcherCursorKey), cursor);
}

void confirmation_watcher::persist_commitment(
    const merkle_commitment_t& commitment) const {
  if (storage_ == nullptr) {
    return;
  }
  auto encoder = scale_encoder_t{};
  storage_->put(encoder, make_bytes_view(key::kLatestCommitmentKey),
                commitment);
}

void confirmation_watcher::set_state(watcher_state_t state) {
  auto lock = std::scoped_lock{mutex_};
  state_ = state;
}

}  // namespace resonance::reconciler

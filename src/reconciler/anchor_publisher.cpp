#include <resonance/reconciler/anchor_publisher.hpp>
#include <resonance/schema/encoding/scale/encoder.hpp>
#include <resonance/schema/key/keys.hpp>
#include <spdlog/spdlog.h>

using namespace resonance::schema;

namespace resonance::reconciler {

anchor_publisher::anchor_publisher(root_submitter_t submit_root,
                                   latest_root_reader_t read_latest_root,
                                   anchor_options_t options,
                                   const storage_t* storage)
    : submit_root_{std::move(submit_root)},
      read_latest_root_{std::move(read_latest_root)},
      options_{std::move(options)},
      storage_{storage},
      breaker_{options_.breaker_threshold, options_.breaker_cooldown} {
  if (storage_ == nullptr) {
    return;
  }
  auto encoder = scale_encoder_t{};
  last_anchored_ = storage_->get<anchor_record_t>(
      encoder, make_bytes_view(key::kAnchorStateKey));
  if (last_anchored_) {
    spdlog::info("Last anchored root {} (sequence {}, {} leaves)",
                 to_hex(last_anchored_->root), last_anchored_->sequence,
                 last_anchored_->leaf_count);
  }
}

anchor_publisher::~anchor_publisher() {
  stop();
}

anchor_outcome_t anchor_publisher::anchor(const merkle_commitment_t& commitment) {
  auto serial = std::scoped_lock{anchor_mutex_};

  auto last = last_anchored();
  if (last && last->root == commitment.root) {
    spdlog::debug("Root {} already anchored", to_hex(commitment.root));
    return anchor_outcome_t::unchanged;
  }
  if (last && (commitment.sequence <= last->sequence ||
               commitment.leaves.size() < last->leaf_count)) {
    spdlog::warn(
        "Refusing stale commitment {} ({} leaves); sequence {} ({} leaves) "
        "is already anchored",
        commitment.sequence, commitment.leaves.size(), last->sequence,
        last->leaf_count);
    return anchor_outcome_t::stale;
  }

  if (read_latest_root_) {
    auto error = std::string{};
    auto published = read_latest_root_(error);
    if (published && *published == commitment.root) {
      spdlog::info("Registry already holds root {}; recording as anchored",
                   to_hex(commitment.root));
      record_anchor(commitment, "registry:" + to_hex(commitment.root));
      return anchor_outcome_t::anchored;
    }
    if (!published && !error.empty()) {
      spdlog::debug("Could not read registry root: {}", error);
    }
  }

  auto blocked = false;
  auto error = std::string{};
  auto reference = resonance::common::retry(
      options_.retry, &stop_, "Anchor submission", error,
      [&](std::string& attempt_error) -> std::optional<std::string> {
        if (!breaker_.allow()) {
          blocked = true;
          attempt_error = "circuit breaker open";
          return std::nullopt;
        }
        blocked = false;
        {
          auto lock = std::scoped_lock{mutex_};
          ++submissions_;
        }
        auto result = submit_root_(commitment.root, attempt_error);
        if (result) {
          breaker_.record_success();
        } else {
          breaker_.record_failure();
        }
        return result;
      });

  if (!reference) {
    if (stop_.stop_requested()) {
      spdlog::info("Anchoring of sequence {} cancelled", commitment.sequence);
      return anchor_outcome_t::cancelled;
    }
    if (blocked) {
      spdlog::warn("Anchoring of sequence {} skipped: {}", commitment.sequence,
                   error);
      return anchor_outcome_t::circuit_open;
    }
    spdlog::warn("Anchoring of sequence {} failed: {}", commitment.sequence,
                 error);
    return anchor_outcome_t::failed;
  }

  record_anchor(commitment, *reference);
  spdlog::info("Anchored root {} (sequence {}, {} leaves) as {}",
               to_hex(commitment.root), commitment.sequence,
               commitment.leaves.size(), *reference);
  return anchor_outcome_t::anchored;
}

void anchor_publisher::submit(merkle_commitment_t commitment) {
  {
    auto lock = std::scoped_lock{mailbox_mutex_};
    mailbox_ = std::move(commitment);
  }
  mailbox_cv_.notify_one();
}

void anchor_publisher::start() {
  auto lock = std::scoped_lock{mailbox_mutex_};
  if (worker_.joinable()) {
    return;
  }
  stopping_ = false;
  stop_.reset();
  worker_ = std::thread{[this] { run(); }};
}

void anchor_publisher::stop() {
  {
    auto lock = std::scoped_lock{mailbox_mutex_};
    stopping_ = true;
  }
  stop_.request_stop();
  mailbox_cv_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }
}

bool anchor_publisher::running() const {
  auto lock = std::scoped_lock{mailbox_mutex_};
  return worker_.joinable() && !stopping_;
}

std::optional<anchor_record_t> anchor_publisher::last_anchored() const {
  auto lock = std::scoped_lock{mutex_};
  return last_anchored_;
}

uint64_t anchor_publisher::submissions() const {
  auto lock = std::scoped_lock{mutex_};
  return submissions_;
}

resonance::common::breaker_state_t anchor_publisher::breaker_state() const {
  return breaker_.state();
}

void anchor_publisher::run() {
  spdlog::info("Anchor publisher started");
  while (true) {
    auto commitment = std::optional<merkle_commitment_t>{};
    {
      auto lock = std::unique_lock{mailbox_mutex_};
      mailbox_cv_.wait(lock, [this] { return stopping_ || mailbox_; });
      if (stopping_) {
        break;
      }
      commitment = std::move(mailbox_);
      mailbox_.reset();
    }
    auto outcome = anchor(*commitment);
    spdlog::debug("Anchor worker: sequence {} -> {}", commitment->sequence,
                  to_string(outcome));
  }
  spdlog::info("Anchor publisher stopped");
}

void anchor_publisher::record_anchor(const merkle_commitment_t& commitment,
                                     const std::string& reference) {
  auto record = anchor_record_t{};
  record.sequence = commitment.sequence;
  record.root = commitment.root;
  record.leaf_count = commitment.leaves.size();
  record.reference = reference;
  record.anchored_at = now_milliseconds();
  if (storage_ != nullptr) {
    auto encoder = scale_encoder_t{};
    storage_->put(encoder, make_bytes_view(key::kAnchorStateKey), record);
  }
  auto lock = std::scoped_lock{mutex_};
  last_anchored_ = std::move(record);
}

}  // namespace resonance::reconciler

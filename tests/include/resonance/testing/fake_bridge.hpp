#pragma once

#include <resonance/reconciler/anchor_publisher.hpp>
#include <resonance/reconciler/confirmation_watcher.hpp>
#include <resonance/reconciler/transfer_submitter.hpp>
#include <resonance/schema/primitives.hpp>
#include <resonance/schema/transfer_event.hpp>

#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace resonance::testing {

/// Scripted upstream feed. Each poll consumes the next scripted response;
/// an exhausted script answers with an empty batch at the requested cursor.
class fake_event_source final {
 public:
  void push_batch(resonance::schema::transfer_batch_t batch) {
    auto lock = std::scoped_lock{mutex_};
    script_.push_back(std::move(batch));
  }

  void push_failure(std::string error) {
    auto lock = std::scoped_lock{mutex_};
    script_.push_back(std::move(error));
  }

  std::vector<uint64_t> requested_cursors() const {
    auto lock = std::scoped_lock{mutex_};
    return requested_;
  }

  resonance::reconciler::event_fetcher_t fetcher() {
    return [this](uint64_t from_cursor, uint32_t,
                  std::string& error)
               -> std::optional<resonance::schema::transfer_batch_t> {
      auto lock = std::scoped_lock{mutex_};
      requested_.push_back(from_cursor);
      if (script_.empty()) {
        return resonance::schema::transfer_batch_t{{}, from_cursor};
      }
      auto next = std::move(script_.front());
      script_.pop_front();
      if (auto* failure = std::get_if<std::string>(&next)) {
        error = *failure;
        return std::nullopt;
      }
      return std::get<resonance::schema::transfer_batch_t>(std::move(next));
    };
  }

 private:
  mutable std::mutex mutex_;
  std::deque<std::variant<resonance::schema::transfer_batch_t, std::string>>
      script_;
  std::vector<uint64_t> requested_;
};

/// In-memory registry. Fails the next `failures` writes.
class fake_registry final {
 public:
  void fail_next(uint32_t failures) {
    auto lock = std::scoped_lock{mutex_};
    failures_ = failures;
  }

  void publish(const resonance::schema::hash32_t& root) {
    auto lock = std::scoped_lock{mutex_};
    latest_ = root;
  }

  std::vector<resonance::schema::hash32_t> writes() const {
    auto lock = std::scoped_lock{mutex_};
    return writes_;
  }

  uint32_t attempts() const {
    auto lock = std::scoped_lock{mutex_};
    return attempts_;
  }

  std::optional<resonance::schema::hash32_t> latest() const {
    auto lock = std::scoped_lock{mutex_};
    return latest_;
  }

  resonance::reconciler::root_submitter_t submitter() {
    return [this](const resonance::schema::hash32_t& root,
                  std::string& error) -> std::optional<std::string> {
      auto lock = std::scoped_lock{mutex_};
      ++attempts_;
      if (failures_ > 0) {
        --failures_;
        error = "registry unavailable";
        return std::nullopt;
      }
      writes_.push_back(root);
      latest_ = root;
      return "tx-" + std::to_string(writes_.size());
    };
  }

  resonance::reconciler::latest_root_reader_t reader() {
    return [this](std::string&) -> std::optional<resonance::schema::hash32_t> {
      auto lock = std::scoped_lock{mutex_};
      return latest_;
    };
  }

 private:
  mutable std::mutex mutex_;
  uint32_t failures_{};
  uint32_t attempts_{};
  std::vector<resonance::schema::hash32_t> writes_;
  std::optional<resonance::schema::hash32_t> latest_;
};

/// Transfer sender handing out "0xsent-N" references. Fails the next
/// `failures` sends.
class fake_transfer_sink final {
 public:
  void fail_next(uint32_t failures) {
    auto lock = std::scoped_lock{mutex_};
    failures_ = failures;
  }

  std::vector<resonance::schema::transfer_request_t> sent() const {
    auto lock = std::scoped_lock{mutex_};
    return sent_;
  }

  resonance::reconciler::transfer_submitter_t submitter() {
    return [this](const resonance::schema::transfer_request_t& request,
                  std::string& error) -> std::optional<std::string> {
      auto lock = std::scoped_lock{mutex_};
      if (failures_ > 0) {
        --failures_;
        error = "bridge unavailable";
        return std::nullopt;
      }
      sent_.push_back(request);
      return "0xsent-" + std::to_string(sent_.size());
    };
  }

 private:
  mutable std::mutex mutex_;
  uint32_t failures_{};
  std::vector<resonance::schema::transfer_request_t> sent_;
};

inline resonance::schema::transfer_event_t make_transfer(
    std::string external_ref,
    const uint64_t value,
    const uint64_t cursor_position,
    std::string from_party = "0xfrom",
    std::string to_party = "0xto") {
  auto event = resonance::schema::transfer_event_t{};
  event.external_ref = std::move(external_ref);
  event.from_party = std::move(from_party);
  event.to_party = std::move(to_party);
  event.value = resonance::schema::amount_t{value};
  event.cursor_position = cursor_position;
  return event;
}

}  // namespace resonance::testing

#pragma once

#include <grpcpp/grpcpp.h>
#include <resonance/reconciler/anchor_publisher.hpp>
#include <resonance/reconciler/confirmation_watcher.hpp>
#include <resonance/reconciler/transfer_submitter.hpp>
#include <resonance/schema/primitives.hpp>
#include <resonance/schema/transfer_event.hpp>
#include <resonance/v1/bridge.grpc.pb.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace resonance::bridge {

/// Blocking client for the chain bridge. Every call carries a deadline and
/// reports failure through `error`; nothing here retries.
class client final {
 public:
  client(std::shared_ptr<grpc::Channel> channel,
         std::chrono::milliseconds timeout);

  /// Insecure channel to `endpoint` (host:port).
  static client connect(const std::string& endpoint,
                        std::chrono::milliseconds timeout);

  /// Fails only when the call itself fails. Transfers that cannot be
  /// decoded come back in `rejected`.
  std::optional<resonance::schema::transfer_batch_t> transfers(
      uint64_t from_cursor,
      uint32_t limit,
      std::string& error) const;

  /// Returns the new transfer's reference. A deadline expiry leaves it
  /// unknown whether the transfer was sent.
  std::optional<std::string> submit_transfer(
      const resonance::schema::transfer_request_t& request,
      std::string& error) const;

  std::optional<std::string> update_root(
      const resonance::schema::hash32_t& root,
      std::string& error) const;

  /// std::nullopt with an empty `error` when no root is published.
  std::optional<resonance::schema::hash32_t> latest_root(
      std::string& error) const;

  /// Adapters for the reconciler. The client must outlive them.
  resonance::reconciler::event_fetcher_t event_fetcher() const;
  resonance::reconciler::transfer_submitter_t transfer_submitter() const;
  resonance::reconciler::root_submitter_t root_submitter() const;
  resonance::reconciler::latest_root_reader_t latest_root_reader() const;

 private:
  void set_deadline(grpc::ClientContext& context) const;

  std::unique_ptr<resonance::v1::Bridge::Stub> stub_;
  std::chrono::milliseconds timeout_;
};

/// Convert a wire transfer. Fails on a malformed value.
std::optional<resonance::schema::transfer_event_t> make_transfer_event(
    const resonance::v1::Transfer& transfer,
    std::string& error);

}  // namespace resonance::bridge

#pragma once

#include <grpcpp/grpcpp.h>
#include <resonance/reconciler/context.hpp>
#include <resonance/v1/control.grpc.pb.h>

namespace resonance::control {

/// Callback listener for the control surface used by producers and
/// dashboards.
///
/// Quick reference:
/// - RecordMarker: register a pending intent.
/// - SubmitTransfer: register an intent and broadcast its transfer.
/// - GetMarker: look a marker up by id or confirming reference.
/// - Status: marker counts, watcher state, latest commitment and anchor,
///   supply state.
/// - StartWatcher/StopWatcher: control the polling loop.
/// - ReportSupply: feed a circulating supply figure to the burn controller.
/// - InclusionProof: Merkle path of a record in the latest commitment.
struct listener final : public resonance::v1::Control::CallbackService {
  explicit listener(resonance::reconciler::context& context);

  virtual grpc::ServerUnaryReactor* RecordMarker(
      grpc::CallbackServerContext* context,
      const resonance::v1::RecordMarkerRequest* request,
      resonance::v1::RecordMarkerResponse* response) override final;

  /// Runs the bridge call on the callback thread.
  virtual grpc::ServerUnaryReactor* SubmitTransfer(
      grpc::CallbackServerContext* context,
      const resonance::v1::SubmitTransferRequest* request,
      resonance::v1::SubmitTransferResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetMarker(
      grpc::CallbackServerContext* context,
      const resonance::v1::GetMarkerRequest* request,
      resonance::v1::GetMarkerResponse* response) override final;

  virtual grpc::ServerUnaryReactor* Status(
      grpc::CallbackServerContext* context,
      const resonance::v1::StatusRequest* request,
      resonance::v1::StatusResponse* response) override final;

  /// Starting an already running watcher is not an error.
  virtual grpc::ServerUnaryReactor* StartWatcher(
      grpc::CallbackServerContext* context,
      const resonance::v1::StartWatcherRequest* request,
      resonance::v1::WatcherControlResponse* response) override final;

  /// Returns once the in-flight batch has finished.
  virtual grpc::ServerUnaryReactor* StopWatcher(
      grpc::CallbackServerContext* context,
      const resonance::v1::StopWatcherRequest* request,
      resonance::v1::WatcherControlResponse* response) override final;

  virtual grpc::ServerUnaryReactor* ReportSupply(
      grpc::CallbackServerContext* context,
      const resonance::v1::ReportSupplyRequest* request,
      resonance::v1::ReportSupplyResponse* response) override final;

  virtual grpc::ServerUnaryReactor* InclusionProof(
      grpc::CallbackServerContext* context,
      const resonance::v1::InclusionProofRequest* request,
      resonance::v1::InclusionProofResponse* response) override final;

 private:
  resonance::reconciler::context& context_;
};

}  // namespace resonance::control

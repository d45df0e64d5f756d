#include <resonance/control/server.hpp>
#include <resonance/schema/marker_status.hpp>
#include <spdlog/spdlog.h>

#include <string>

using namespace resonance::control;
using namespace resonance::schema;

namespace {

grpc::ServerUnaryReactor* finish(grpc::CallbackServerContext* context,
                                 const grpc::Status& status) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(status);
  return reactor;
}

grpc::ServerUnaryReactor* finish_ok(grpc::CallbackServerContext* context) {
  return finish(context, grpc::Status::OK);
}

std::string to_wire(const hash32_t& hash) {
  return std::string{std::begin(hash), std::end(hash)};
}

std::optional<hash32_t> from_wire(const std::string& bytes) {
  if (bytes.size() != 32) {
    return std::nullopt;
  }
  return make_hash32(make_bytes_view(bytes));
}

void populate_marker(const instant_marker_t& source,
                     resonance::v1::Marker* destination) {
  destination->set_marker_id(to_wire(source.marker_id));
  destination->set_sequence(source.sequence);
  destination->set_status(std::string{to_string(source.status)});
  destination->set_external_ref(source.external_ref.value_or(""));
  destination->mutable_payload()->insert(std::begin(source.payload),
                                         std::end(source.payload));
  destination->set_created_at(source.created_at);
  destination->set_confirmed_at(source.confirmed_at.value_or(0));
  destination->set_synthesized(source.synthesized);
}

}  // namespace

listener::listener(resonance::reconciler::context& context)
    : context_{context} {}

grpc::ServerUnaryReactor* listener::RecordMarker(
    grpc::CallbackServerContext* context,
    const resonance::v1::RecordMarkerRequest* request,
    resonance::v1::RecordMarkerResponse* response) {
  auto payload =
      payload_t{std::begin(request->payload()), std::end(request->payload())};
  auto marker_id = context_.record_marker(std::move(payload));
  response->set_marker_id(to_wire(marker_id));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::SubmitTransfer(
    grpc::CallbackServerContext* context,
    const resonance::v1::SubmitTransferRequest* request,
    resonance::v1::SubmitTransferResponse* response) {
  auto payload =
      payload_t{std::begin(request->payload()), std::end(request->payload())};
  auto error = std::string{};
  if (!resonance::reconciler::make_transfer_request(payload, error)) {
    return finish(context,
                  grpc::Status{grpc::StatusCode::INVALID_ARGUMENT, error});
  }
  auto submission = context_.submit_transfer(std::move(payload), error);
  if (!submission) {
    return finish(context, grpc::Status{grpc::StatusCode::UNAVAILABLE, error});
  }
  response->set_marker_id(to_wire(submission->marker_id));
  response->set_external_ref(submission->external_ref);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetMarker(
    grpc::CallbackServerContext* context,
    const resonance::v1::GetMarkerRequest* request,
    resonance::v1::GetMarkerResponse* response) {
  auto marker = std::optional<instant_marker_t>{};
  switch (request->key_case()) {
    case resonance::v1::GetMarkerRequest::kMarkerId: {
      auto marker_id = from_wire(request->marker_id());
      if (!marker_id) {
        return finish(context,
                      grpc::Status{grpc::StatusCode::INVALID_ARGUMENT,
                                   "marker_id must be 32 bytes"});
      }
      marker = context_.find_marker(*marker_id);
      break;
    }
    case resonance::v1::GetMarkerRequest::kExternalRef:
      marker =
          context_.markers().find_by_external_ref(request->external_ref());
      break;
    default:
      return finish(context,
                    grpc::Status{grpc::StatusCode::INVALID_ARGUMENT,
                                 "marker_id or external_ref is required"});
  }
  if (!marker) {
    return finish(context,
                  grpc::Status{grpc::StatusCode::NOT_FOUND, "unknown marker"});
  }
  populate_marker(*marker, response->mutable_marker());
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Status(
    grpc::CallbackServerContext* context,
    const resonance::v1::StatusRequest*,
    resonance::v1::StatusResponse* response) {
  auto status = context_.status();
  response->set_pending_markers(status.markers.pending);
  response->set_confirmed_markers(status.markers.confirmed);
  response->set_records(status.records);
  response->set_watcher_state(
      std::string{resonance::reconciler::to_string(status.watcher.state)});
  response->set_cursor(status.watcher.cursor);
  response->set_consecutive_failures(status.watcher.consecutive_failures);
  response->set_last_error(status.watcher.last_error);
  if (status.watcher.latest_commitment) {
    response->set_latest_sequence(status.watcher.latest_commitment->sequence);
    response->set_latest_root(to_wire(status.watcher.latest_commitment->root));
  }
  if (status.last_anchored) {
    response->set_anchored_sequence(status.last_anchored->sequence);
    response->set_anchored_root(to_wire(status.last_anchored->root));
    response->set_anchored_reference(status.last_anchored->reference);
  }
  response->set_anchor_breaker(
      std::string{resonance::common::to_string(status.anchor_breaker)});
  response->set_circulating_supply(
      to_string(status.supply.circulating_supply));
  response->set_burned_total(to_string(status.supply.burned_total));
  response->set_burn_target(to_string(status.supply.burn_target));
  response->set_total_supply(to_string(status.supply.total_supply));
  response->set_burn_status(std::string{to_string(status.supply.status)});
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::StartWatcher(
    grpc::CallbackServerContext* context,
    const resonance::v1::StartWatcherRequest*,
    resonance::v1::WatcherControlResponse* response) {
  auto changed = context_.start();
  spdlog::info("Watcher start requested ({})",
               changed ? "started" : "already running");
  response->set_changed(changed);
  response->set_watcher_state(std::string{
      resonance::reconciler::to_string(context_.watcher().status().state)});
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::StopWatcher(
    grpc::CallbackServerContext* context,
    const resonance::v1::StopWatcherRequest*,
    resonance::v1::WatcherControlResponse* response) {
  auto changed = context_.watcher().running();
  context_.watcher().stop();
  spdlog::info("Watcher stop requested ({})",
               changed ? "stopped" : "not running");
  response->set_changed(changed);
  response->set_watcher_state(std::string{
      resonance::reconciler::to_string(context_.watcher().status().state)});
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::ReportSupply(
    grpc::CallbackServerContext* context,
    const resonance::v1::ReportSupplyRequest* request,
    resonance::v1::ReportSupplyResponse* response) {
  auto circulating = try_parse_amount(request->circulating_supply());
  if (!circulating) {
    return finish(
        context,
        grpc::Status{grpc::StatusCode::INVALID_ARGUMENT,
                     "circulating_supply must be an unsigned decimal"});
  }
  auto burned = context_.report_supply(*circulating);
  auto state = context_.supply().state();
  response->set_burned(to_string(burned));
  response->set_burned_total(to_string(state.burned_total));
  response->set_remaining_supply(
      to_string(context_.supply().remaining_supply()));
  response->set_burn_status(std::string{to_string(state.status)});
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::InclusionProof(
    grpc::CallbackServerContext* context,
    const resonance::v1::InclusionProofRequest* request,
    resonance::v1::InclusionProofResponse* response) {
  auto resonance_id = std::optional<hash32_t>{};
  switch (request->key_case()) {
    case resonance::v1::InclusionProofRequest::kResonanceId:
      resonance_id = from_wire(request->resonance_id());
      break;
    case resonance::v1::InclusionProofRequest::kExternalRef:
      resonance_id = context_.records().derive_id(request->external_ref());
      break;
    default:
      break;
  }
  if (!resonance_id) {
    return finish(
        context,
        grpc::Status{grpc::StatusCode::INVALID_ARGUMENT,
                     "a 32-byte resonance_id or an external_ref is required"});
  }

  auto error = std::string{};
  auto proof = context_.inclusion_proof(*resonance_id, error);
  if (!proof) {
    return finish(context, grpc::Status{grpc::StatusCode::NOT_FOUND, error});
  }
  response->set_resonance_id(to_wire(proof->resonance_id));
  response->set_leaf(to_wire(proof->leaf));
  response->set_leaf_index(proof->leaf_index);
  for (const auto& step : proof->steps) {
    auto* out = response->add_steps();
    out->set_sibling(to_wire(step.sibling));
    out->set_sibling_on_left(step.sibling_on_left);
  }
  response->set_root(to_wire(proof->root));
  response->set_sequence(proof->sequence);
  return finish_ok(context);
}

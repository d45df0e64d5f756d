#include <resonance/bridge/client.hpp>
#include <spdlog/spdlog.h>

using namespace resonance::schema;

namespace {

std::string describe(const grpc::Status& status) {
  return "bridge call failed (" + std::to_string(status.error_code()) +
         "): " + status.error_message();
}

}  // namespace

namespace resonance::bridge {

client::client(std::shared_ptr<grpc::Channel> channel,
               std::chrono::milliseconds timeout)
    : stub_{resonance::v1::Bridge::NewStub(std::move(channel))},
      timeout_{timeout} {}

client client::connect(const std::string& endpoint,
                       std::chrono::milliseconds timeout) {
  spdlog::info("Using chain bridge at {}", endpoint);
  return client{
      grpc::CreateChannel(endpoint, grpc::InsecureChannelCredentials()),
      timeout};
}

std::optional<transfer_batch_t> client::transfers(uint64_t from_cursor,
                                                  uint32_t limit,
                                                  std::string& error) const {
  auto context = grpc::ClientContext{};
  set_deadline(context);
  auto request = resonance::v1::TransfersRequest{};
  request.set_from_cursor(from_cursor);
  request.set_limit(limit);
  auto response = resonance::v1::TransfersResponse{};
  auto status = stub_->Transfers(&context, request, &response);
  if (!status.ok()) {
    error = describe(status);
    return std::nullopt;
  }

  auto batch = transfer_batch_t{};
  batch.next_cursor = response.next_cursor();
  batch.events.reserve(static_cast<std::size_t>(response.transfers_size()));
  for (const auto& transfer : response.transfers()) {
    auto reason = std::string{};
    auto event = make_transfer_event(transfer, reason);
    if (!event) {
      spdlog::warn("Rejecting transfer at cursor {}: {}",
                   transfer.cursor_position(), reason);
      batch.rejected.push_back(rejected_transfer_t{
          .external_ref = transfer.external_ref(),
          .cursor_position = transfer.cursor_position(),
          .reason = std::move(reason)});
      continue;
    }
    batch.events.push_back(std::move(*event));
  }
  return batch;
}

std::optional<std::string> client::submit_transfer(
    const transfer_request_t& request,
    std::string& error) const {
  auto context = grpc::ClientContext{};
  set_deadline(context);
  auto wire = resonance::v1::SubmitTransferRequest{};
  wire.set_from_party(request.from_party);
  wire.set_to_party(request.to_party);
  wire.set_value(to_string(request.value));
  auto response = resonance::v1::SubmitTransferResponse{};
  auto status = stub_->SubmitTransfer(&context, wire, &response);
  if (!status.ok()) {
    error = describe(status);
    return std::nullopt;
  }
  if (response.external_ref().empty()) {
    error = "bridge accepted the transfer without a reference";
    return std::nullopt;
  }
  return response.external_ref();
}

std::optional<std::string> client::update_root(const hash32_t& root,
                                               std::string& error) const {
  auto context = grpc::ClientContext{};
  set_deadline(context);
  auto request = resonance::v1::UpdateRootRequest{};
  request.set_root(std::string{std::begin(root), std::end(root)});
  auto response = resonance::v1::UpdateRootResponse{};
  auto status = stub_->UpdateRoot(&context, request, &response);
  if (!status.ok()) {
    error = describe(status);
    return std::nullopt;
  }
  return response.reference();
}

std::optional<hash32_t> client::latest_root(std::string& error) const {
  auto context = grpc::ClientContext{};
  set_deadline(context);
  auto request = resonance::v1::LatestRootRequest{};
  auto response = resonance::v1::LatestRootResponse{};
  auto status = stub_->LatestRoot(&context, request, &response);
  if (!status.ok()) {
    error = describe(status);
    return std::nullopt;
  }
  if (response.root().empty()) {
    return std::nullopt;
  }
  if (response.root().size() != 32) {
    error = "bridge returned a root of " +
            std::to_string(response.root().size()) + " bytes";
    return std::nullopt;
  }
  return make_hash32(make_bytes_view(response.root()));
}

resonance::reconciler::event_fetcher_t client::event_fetcher() const {
  return [this](uint64_t from_cursor, uint32_t limit, std::string& error) {
    return transfers(from_cursor, limit, error);
  };
}

resonance::reconciler::transfer_submitter_t client::transfer_submitter()
    const {
  return [this](const transfer_request_t& request, std::string& error) {
    return submit_transfer(request, error);
  };
}

resonance::reconciler::root_submitter_t client::root_submitter() const {
  return [this](const hash32_t& root, std::string& error) {
    return update_root(root, error);
  };
}

resonance::reconciler::latest_root_reader_t client::latest_root_reader()
    const {
  return [this](std::string& error) { return latest_root(error); };
}

void client::set_deadline(grpc::ClientContext& context) const {
  context.set_deadline(std::chrono::system_clock::now() + timeout_);
}

std::optional<transfer_event_t> make_transfer_event(
    const resonance::v1::Transfer& transfer,
    std::string& error) {
  if (transfer.external_ref().empty()) {
    error = "transfer without external reference";
    return std::nullopt;
  }
  auto value = try_parse_amount(transfer.value());
  if (!value) {
    error = "transfer " + transfer.external_ref() + " has invalid value '" +
            transfer.value() + "'";
    return std::nullopt;
  }
  auto event = transfer_event_t{};
  event.external_ref = transfer.external_ref();
  event.from_party = transfer.from_party();
  event.to_party = transfer.to_party();
  event.value = *value;
  event.cursor_position = transfer.cursor_position();
  event.log_index = transfer.log_index();
  return event;
}

}  // namespace resonance::bridge

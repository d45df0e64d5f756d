#include <grpcpp/grpcpp.h>
#include <gtest/gtest.h>
#include <resonance/control/server.hpp>
#include <resonance/ledger/merkle.hpp>
#include <resonance/testing/common.hpp>
#include <resonance/testing/fake_bridge.hpp>

#include <chrono>
#include <memory>
#include <string>

using namespace std::chrono_literals;
using resonance::schema::transfer_batch_t;
using resonance::testing::make_transfer;

namespace {

std::string to_wire(const resonance::schema::hash32_t& hash) {
  return std::string{std::begin(hash), std::end(hash)};
}

resonance::schema::hash32_t from_wire(const std::string& bytes) {
  return resonance::schema::make_hash32(
      resonance::schema::make_bytes_view(bytes));
}

class control_server_test : public ::testing::Test {
 protected:
  void SetUp() override {
    auto options = resonance::reconciler::context_options_t{};
    options.data_dir = dir_.path;
    options.watcher.poll_interval = 5ms;
    options.watcher.commit_interval = 10ms;
    options.anchor.retry.initial_delay = 1ms;
    options.anchor.retry.max_delay = 1ms;
    context_ = std::make_unique<resonance::reconciler::context>(
        options, resonance::testing::make_keys(), source_.fetcher(),
        registry_.submitter(), registry_.reader(), sink_.submitter());
    listener_ =
        std::make_unique<resonance::control::listener>(*context_);

    auto builder = grpc::ServerBuilder{};
    builder.RegisterService(listener_.get());
    server_ = builder.BuildAndStart();
    ASSERT_NE(server_, nullptr);
    stub_ = resonance::v1::Control::NewStub(
        server_->InProcessChannel(grpc::ChannelArguments{}));
  }

  void TearDown() override {
    server_->Shutdown();
    context_->stop();
  }

  resonance::testing::scoped_path dir_{"resonance_control_server"};
  resonance::testing::fake_event_source source_;
  resonance::testing::fake_registry registry_;
  resonance::testing::fake_transfer_sink sink_;
  std::unique_ptr<resonance::reconciler::context> context_;
  std::unique_ptr<resonance::control::listener> listener_;
  std::unique_ptr<grpc::Server> server_;
  std::unique_ptr<resonance::v1::Control::Stub> stub_;
};

}  // namespace

TEST_F(control_server_test, record_and_get_marker) {
  auto record = resonance::v1::RecordMarkerRequest{};
  (*record.mutable_payload())["amount"] = "10";
  auto recorded = resonance::v1::RecordMarkerResponse{};
  {
    auto client = grpc::ClientContext{};
    ASSERT_TRUE(stub_->RecordMarker(&client, record, &recorded).ok());
  }
  ASSERT_EQ(recorded.marker_id().size(), 32u);

  auto get = resonance::v1::GetMarkerRequest{};
  get.set_marker_id(recorded.marker_id());
  auto found = resonance::v1::GetMarkerResponse{};
  {
    auto client = grpc::ClientContext{};
    ASSERT_TRUE(stub_->GetMarker(&client, get, &found).ok());
  }
  EXPECT_EQ(found.marker().status(), "PENDING");
  EXPECT_EQ(found.marker().sequence(), 1u);
  EXPECT_EQ(found.marker().payload().at("amount"), "10");
  EXPECT_FALSE(found.marker().synthesized());

  source_.push_batch(transfer_batch_t{{make_transfer("0xabc", 10, 1)}, 2});
  context_->watcher().poll_once();

  get.set_external_ref("0xabc");
  {
    auto client = grpc::ClientContext{};
    ASSERT_TRUE(stub_->GetMarker(&client, get, &found).ok());
  }
  EXPECT_EQ(found.marker().marker_id(), recorded.marker_id());
  EXPECT_EQ(found.marker().status(), "CONFIRMED");
  EXPECT_EQ(found.marker().external_ref(), "0xabc");
  EXPECT_NE(found.marker().confirmed_at(), 0u);
}

TEST_F(control_server_test, get_marker_rejects_bad_keys) {
  auto response = resonance::v1::GetMarkerResponse{};

  auto empty = resonance::v1::GetMarkerRequest{};
  {
    auto client = grpc::ClientContext{};
    EXPECT_EQ(stub_->GetMarker(&client, empty, &response).error_code(),
              grpc::StatusCode::INVALID_ARGUMENT);
  }

  auto short_id = resonance::v1::GetMarkerRequest{};
  short_id.set_marker_id("abc");
  {
    auto client = grpc::ClientContext{};
    EXPECT_EQ(stub_->GetMarker(&client, short_id, &response).error_code(),
              grpc::StatusCode::INVALID_ARGUMENT);
  }

  auto unknown = resonance::v1::GetMarkerRequest{};
  unknown.set_marker_id(to_wire(resonance::testing::make_hash(9)));
  {
    auto client = grpc::ClientContext{};
    EXPECT_EQ(stub_->GetMarker(&client, unknown, &response).error_code(),
              grpc::StatusCode::NOT_FOUND);
  }
}

TEST_F(control_server_test, status_and_supply_reports) {
  auto report = resonance::v1::ReportSupplyRequest{};
  report.set_circulating_supply("not a number");
  auto reported = resonance::v1::ReportSupplyResponse{};
  {
    auto client = grpc::ClientContext{};
    EXPECT_EQ(stub_->ReportSupply(&client, report, &reported).error_code(),
              grpc::StatusCode::INVALID_ARGUMENT);
  }

  report.set_circulating_supply("1021000000");
  {
    auto client = grpc::ClientContext{};
    ASSERT_TRUE(stub_->ReportSupply(&client, report, &reported).ok());
  }
  EXPECT_EQ(reported.burned(), "1000000000");
  EXPECT_EQ(reported.burned_total(), "1000000000");
  EXPECT_EQ(reported.remaining_supply(), "21000000");
  EXPECT_EQ(reported.burn_status(), "TRIGGERED");

  {
    auto client = grpc::ClientContext{};
    ASSERT_TRUE(stub_->ReportSupply(&client, report, &reported).ok());
  }
  EXPECT_EQ(reported.burned(), "0");
  EXPECT_EQ(reported.burned_total(), "1000000000");

  source_.push_batch(transfer_batch_t{{make_transfer("0x1", 5, 1)}, 7});
  context_->watcher().poll_once();
  auto error = std::string{};
  ASSERT_TRUE(context_->watcher().commit_once(error).has_value()) << error;

  auto status = resonance::v1::StatusResponse{};
  {
    auto client = grpc::ClientContext{};
    ASSERT_TRUE(
        stub_->Status(&client, resonance::v1::StatusRequest{}, &status).ok());
  }
  EXPECT_EQ(status.pending_markers(), 0u);
  EXPECT_EQ(status.confirmed_markers(), 1u);
  EXPECT_EQ(status.records(), 1u);
  EXPECT_EQ(status.watcher_state(), "idle");
  EXPECT_EQ(status.cursor(), 7u);
  EXPECT_EQ(status.latest_sequence(), 1u);
  EXPECT_EQ(status.latest_root().size(), 32u);
  EXPECT_EQ(status.anchor_breaker(), "closed");
  EXPECT_EQ(status.circulating_supply(), "1021000000");
  EXPECT_EQ(status.burned_total(), "1000000000");
  EXPECT_EQ(status.burn_target(), "1000000000");
  EXPECT_EQ(status.total_supply(), "1021000000");
  EXPECT_EQ(status.burn_status(), "TRIGGERED");
}

TEST_F(control_server_test, inclusion_proof_by_external_ref) {
  auto request = resonance::v1::InclusionProofRequest{};
  request.set_external_ref("0x2");
  auto response = resonance::v1::InclusionProofResponse{};
  {
    auto client = grpc::ClientContext{};
    EXPECT_EQ(stub_->InclusionProof(&client, request, &response).error_code(),
              grpc::StatusCode::NOT_FOUND);
  }

  source_.push_batch(transfer_batch_t{{make_transfer("0x1", 1, 1),
                                       make_transfer("0x2", 2, 1),
                                       make_transfer("0x3", 3, 2)},
                                      3});
  context_->watcher().poll_once();
  auto error = std::string{};
  ASSERT_TRUE(context_->watcher().commit_once(error).has_value()) << error;

  {
    auto client = grpc::ClientContext{};
    ASSERT_TRUE(stub_->InclusionProof(&client, request, &response).ok());
  }
  EXPECT_EQ(from_wire(response.resonance_id()),
            context_->records().derive_id("0x2"));
  EXPECT_EQ(response.sequence(), 1u);

  auto steps = std::vector<resonance::ledger::proof_step_t>{};
  for (const auto& step : response.steps()) {
    steps.push_back(resonance::ledger::proof_step_t{from_wire(step.sibling()),
                                                    step.sibling_on_left()});
  }
  EXPECT_TRUE(resonance::ledger::verify_proof(
      from_wire(response.leaf()), steps, from_wire(response.root())));

  auto malformed = resonance::v1::InclusionProofRequest{};
  malformed.set_resonance_id("short");
  {
    auto client = grpc::ClientContext{};
    EXPECT_EQ(
        stub_->InclusionProof(&client, malformed, &response).error_code(),
        grpc::StatusCode::INVALID_ARGUMENT);
  }
}

TEST_F(control_server_test, watcher_can_be_started_and_stopped) {
  auto response = resonance::v1::WatcherControlResponse{};
  {
    auto client = grpc::ClientContext{};
    ASSERT_TRUE(stub_
                    ->StartWatcher(&client,
                                   resonance::v1::StartWatcherRequest{},
                                   &response)
                    .ok());
  }
  EXPECT_TRUE(response.changed());
  EXPECT_TRUE(context_->watcher().running());

  {
    auto client = grpc::ClientContext{};
    ASSERT_TRUE(stub_
                    ->StartWatcher(&client,
                                   resonance::v1::StartWatcherRequest{},
                                   &response)
                    .ok());
  }
  EXPECT_FALSE(response.changed());

  {
    auto client = grpc::ClientContext{};
    ASSERT_TRUE(
        stub_
            ->StopWatcher(&client, resonance::v1::StopWatcherRequest{},
                          &response)
            .ok());
  }
  EXPECT_TRUE(response.changed());
  EXPECT_EQ(response.watcher_state(), "stopped");
  EXPECT_FALSE(context_->watcher().running());

  {
    auto client = grpc::ClientContext{};
    ASSERT_TRUE(
        stub_
            ->StopWatcher(&client, resonance::v1::StopWatcherRequest{},
                          &response)
            .ok());
  }
  EXPECT_FALSE(response.changed());
}

TEST_F(control_server_test, submit_transfer_links_reference_to_marker) {
  auto request = resonance::v1::SubmitTransferRequest{};
  (*request.mutable_payload())["to"] = "0xyou";
  (*request.mutable_payload())["amount"] = "40";
  auto response = resonance::v1::SubmitTransferResponse{};
  {
    auto client = grpc::ClientContext{};
    auto status = stub_->SubmitTransfer(&client, request, &response);
    ASSERT_TRUE(status.ok()) << status.error_message();
  }
  ASSERT_EQ(response.marker_id().size(), 32u);
  EXPECT_EQ(response.external_ref(), "0xsent-1");

  source_.push_batch(transfer_batch_t{{make_transfer("0xsent-1", 40, 1)}, 2});
  context_->watcher().poll_once();

  auto get = resonance::v1::GetMarkerRequest{};
  get.set_external_ref("0xsent-1");
  auto found = resonance::v1::GetMarkerResponse{};
  {
    auto client = grpc::ClientContext{};
    ASSERT_TRUE(stub_->GetMarker(&client, get, &found).ok());
  }
  EXPECT_EQ(found.marker().marker_id(), response.marker_id());
  EXPECT_EQ(found.marker().status(), "CONFIRMED");
}

TEST_F(control_server_test, submit_transfer_maps_failures_to_status_codes) {
  auto invalid = resonance::v1::SubmitTransferRequest{};
  (*invalid.mutable_payload())["amount"] = "40";
  auto response = resonance::v1::SubmitTransferResponse{};
  {
    auto client = grpc::ClientContext{};
    EXPECT_EQ(stub_->SubmitTransfer(&client, invalid, &response).error_code(),
              grpc::StatusCode::INVALID_ARGUMENT);
  }

  sink_.fail_next(1);
  auto valid = resonance::v1::SubmitTransferRequest{};
  (*valid.mutable_payload())["to"] = "0xyou";
  (*valid.mutable_payload())["amount"] = "40";
  {
    auto client = grpc::ClientContext{};
    auto status = stub_->SubmitTransfer(&client, valid, &response);
    EXPECT_EQ(status.error_code(), grpc::StatusCode::UNAVAILABLE);
    EXPECT_NE(status.error_message().find("stays pending"), std::string::npos);
  }
  EXPECT_EQ(context_->status().markers.pending, 1u);
}

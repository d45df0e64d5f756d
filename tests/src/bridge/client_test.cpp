#include <grpcpp/grpcpp.h>
#include <gtest/gtest.h>
#include <resonance/bridge/client.hpp>
#include <resonance/testing/common.hpp>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace {

/// In-process chain bridge keeping its published root in memory.
struct fake_bridge_service final
    : public resonance::v1::Bridge::CallbackService {
  grpc::ServerUnaryReactor* Transfers(
      grpc::CallbackServerContext* context,
      const resonance::v1::TransfersRequest* request,
      resonance::v1::TransfersResponse* response) override {
    {
      auto lock = std::scoped_lock{mutex};
      last_from_cursor = request->from_cursor();
      last_limit = request->limit();
    }
    auto* transfer = response->add_transfers();
    transfer->set_external_ref("0xabc");
    transfer->set_from_party("0xfrom");
    transfer->set_to_party("0xto");
    transfer->set_value(value);
    transfer->set_cursor_position(request->from_cursor());
    transfer->set_log_index(2);
    response->set_next_cursor(request->from_cursor() + 1);
    auto* reactor = context->DefaultReactor();
    reactor->Finish(grpc::Status::OK);
    return reactor;
  }

  grpc::ServerUnaryReactor* SubmitTransfer(
      grpc::CallbackServerContext* context,
      const resonance::v1::SubmitTransferRequest* request,
      resonance::v1::SubmitTransferResponse* response) override {
    auto* reactor = context->DefaultReactor();
    if (request->to_party().empty()) {
      reactor->Finish(grpc::Status{grpc::StatusCode::FAILED_PRECONDITION,
                                   "no recipient"});
      return reactor;
    }
    {
      auto lock = std::scoped_lock{mutex};
      sent.push_back(*request);
      response->set_external_ref("0xsent-" + std::to_string(sent.size()));
    }
    reactor->Finish(grpc::Status::OK);
    return reactor;
  }

  grpc::ServerUnaryReactor* UpdateRoot(
      grpc::CallbackServerContext* context,
      const resonance::v1::UpdateRootRequest* request,
      resonance::v1::UpdateRootResponse* response) override {
    auto* reactor = context->DefaultReactor();
    if (request->root().size() != 32) {
      reactor->Finish(
          grpc::Status{grpc::StatusCode::INVALID_ARGUMENT, "bad root"});
      return reactor;
    }
    {
      auto lock = std::scoped_lock{mutex};
      root = request->root();
      ++updates;
    }
    response->set_reference("tx-" + std::to_string(updates));
    reactor->Finish(grpc::Status::OK);
    return reactor;
  }

  grpc::ServerUnaryReactor* LatestRoot(
      grpc::CallbackServerContext* context,
      const resonance::v1::LatestRootRequest*,
      resonance::v1::LatestRootResponse* response) override {
    if (delay > 0ms) {
      std::this_thread::sleep_for(delay);
    }
    {
      auto lock = std::scoped_lock{mutex};
      response->set_root(root);
    }
    auto* reactor = context->DefaultReactor();
    reactor->Finish(grpc::Status::OK);
    return reactor;
  }

  std::mutex mutex;
  std::string value{"10"};
  std::string root;
  int updates{};
  std::vector<resonance::v1::SubmitTransferRequest> sent;
  uint64_t last_from_cursor{};
  uint32_t last_limit{};
  std::chrono::milliseconds delay{0};
};

class bridge_client_test : public ::testing::Test {
 protected:
  void SetUp() override {
    auto builder = grpc::ServerBuilder{};
    builder.AddListeningPort("127.0.0.1:0", grpc::InsecureServerCredentials(),
                             &port_);
    builder.RegisterService(&service_);
    server_ = builder.BuildAndStart();
    ASSERT_NE(server_, nullptr);
    ASSERT_NE(port_, 0);
  }

  void TearDown() override { server_->Shutdown(); }

  resonance::bridge::client make_client(
      std::chrono::milliseconds timeout = 2000ms) {
    return resonance::bridge::client::connect(
        "127.0.0.1:" + std::to_string(port_), timeout);
  }

  fake_bridge_service service_;
  std::unique_ptr<grpc::Server> server_;
  int port_{};
};

}  // namespace

TEST_F(bridge_client_test, transfers_are_converted) {
  auto client = make_client();
  auto error = std::string{};
  auto batch = client.transfers(7, 50, error);
  ASSERT_TRUE(batch.has_value()) << error;
  EXPECT_EQ(service_.last_from_cursor, 7u);
  EXPECT_EQ(service_.last_limit, 50u);
  EXPECT_EQ(batch->next_cursor, 8u);
  ASSERT_EQ(batch->events.size(), 1u);
  const auto& event = batch->events.front();
  EXPECT_EQ(event.external_ref, "0xabc");
  EXPECT_EQ(event.from_party, "0xfrom");
  EXPECT_EQ(event.to_party, "0xto");
  EXPECT_EQ(event.value, resonance::schema::amount_t{10});
  EXPECT_EQ(event.cursor_position, 7u);
  EXPECT_EQ(event.log_index, 2u);
}

TEST_F(bridge_client_test, malformed_value_is_rejected_not_fatal) {
  service_.value = "-5";
  auto client = make_client();
  auto error = std::string{};
  auto batch = client.transfers(4, 10, error);
  ASSERT_TRUE(batch.has_value()) << error;
  EXPECT_TRUE(error.empty());
  EXPECT_TRUE(batch->events.empty());
  EXPECT_EQ(batch->next_cursor, 5u);
  ASSERT_EQ(batch->rejected.size(), 1u);
  EXPECT_EQ(batch->rejected.front().external_ref, "0xabc");
  EXPECT_EQ(batch->rejected.front().cursor_position, 4u);
  EXPECT_NE(batch->rejected.front().reason.find("invalid value"),
            std::string::npos);
}

TEST_F(bridge_client_test, root_update_then_latest_root) {
  auto client = make_client();
  auto error = std::string{};
  EXPECT_FALSE(client.latest_root(error).has_value());
  EXPECT_TRUE(error.empty());

  auto root = resonance::testing::make_hash(5);
  auto reference = client.update_root(root, error);
  ASSERT_TRUE(reference.has_value()) << error;
  EXPECT_EQ(*reference, "tx-1");

  auto latest = client.latest_root(error);
  ASSERT_TRUE(latest.has_value()) << error;
  EXPECT_EQ(*latest, root);
}

TEST_F(bridge_client_test, transfer_is_submitted_with_decimal_value) {
  auto client = make_client();
  auto request = resonance::schema::transfer_request_t{};
  request.from_party = "0xme";
  request.to_party = "0xyou";
  request.value =
      *resonance::schema::try_parse_amount("123456789012345678901234567890");
  auto error = std::string{};
  auto reference = client.submit_transfer(request, error);
  ASSERT_TRUE(reference.has_value()) << error;
  EXPECT_EQ(*reference, "0xsent-1");
  ASSERT_EQ(service_.sent.size(), 1u);
  EXPECT_EQ(service_.sent.front().from_party(), "0xme");
  EXPECT_EQ(service_.sent.front().to_party(), "0xyou");
  EXPECT_EQ(service_.sent.front().value(), "123456789012345678901234567890");
}

TEST_F(bridge_client_test, refused_transfer_reports_status) {
  auto client = make_client();
  auto error = std::string{};
  EXPECT_FALSE(client.submit_transfer({}, error).has_value());
  EXPECT_NE(error.find("no recipient"), std::string::npos);
  EXPECT_TRUE(service_.sent.empty());
}

TEST_F(bridge_client_test, adapters_forward_to_the_bridge) {
  auto client = make_client();
  auto fetch = client.event_fetcher();
  auto submit = client.root_submitter();
  auto read = client.latest_root_reader();
  auto send = client.transfer_submitter();
  auto error = std::string{};

  ASSERT_TRUE(fetch(3, 1, error).has_value()) << error;
  auto request = resonance::schema::transfer_request_t{};
  request.to_party = "0xto";
  request.value = resonance::schema::amount_t{1};
  EXPECT_EQ(send(request, error), std::optional<std::string>{"0xsent-1"});
  ASSERT_TRUE(submit(resonance::testing::make_hash(1), error).has_value())
      << error;
  EXPECT_EQ(read(error), resonance::testing::make_hash(1));
}

TEST_F(bridge_client_test, deadline_is_enforced) {
  service_.delay = 500ms;
  auto client = make_client(50ms);
  auto error = std::string{};
  EXPECT_FALSE(client.latest_root(error).has_value());
  EXPECT_FALSE(error.empty());
}

TEST(bridge_client, unreachable_bridge_reports_error) {
  auto client =
      resonance::bridge::client::connect("127.0.0.1:1", std::chrono::milliseconds{200});
  auto error = std::string{};
  EXPECT_FALSE(client.transfers(0, 10, error).has_value());
  EXPECT_NE(error.find("bridge call failed"), std::string::npos);
}

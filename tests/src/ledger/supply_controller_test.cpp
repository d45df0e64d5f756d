#include <gtest/gtest.h>
#include <resonance/ledger/supply_controller.hpp>
#include <resonance/testing/common.hpp>

using resonance::schema::amount_t;
using resonance::schema::burn_status_t;

TEST(supply_controller, below_threshold_is_a_no_op) {
  auto controller = resonance::ledger::supply_controller{};
  EXPECT_EQ(controller.evaluate(amount_t{1020999999}), amount_t{0});
  auto state = controller.state();
  EXPECT_EQ(state.circulating_supply, amount_t{1020999999});
  EXPECT_EQ(state.burned_total, amount_t{0});
  EXPECT_EQ(state.status, burn_status_t::not_triggered);
  EXPECT_EQ(controller.remaining_supply(), amount_t{1021000000});
}

TEST(supply_controller, burn_fires_exactly_once) {
  auto controller = resonance::ledger::supply_controller{};
  EXPECT_EQ(controller.evaluate(amount_t{1021000000}), amount_t{1000000000});
  EXPECT_EQ(controller.evaluate(amount_t{1021000000}), amount_t{0});
  EXPECT_EQ(controller.evaluate(amount_t{2000000000}), amount_t{0});

  auto state = controller.state();
  EXPECT_EQ(state.burned_total, amount_t{1000000000});
  EXPECT_EQ(state.status, burn_status_t::triggered);
  EXPECT_EQ(controller.remaining_supply(), amount_t{21000000});
}

TEST(supply_controller, dipping_below_and_back_does_not_refire) {
  auto controller = resonance::ledger::supply_controller{};
  controller.evaluate(amount_t{1100000000});
  controller.evaluate(amount_t{5});
  EXPECT_EQ(controller.evaluate(amount_t{1100000000}), amount_t{0});
  EXPECT_EQ(controller.state().burned_total, amount_t{1000000000});
}

TEST(supply_controller, custom_parameters_are_honoured) {
  auto initial = resonance::schema::supply_state_t{};
  initial.total_supply = amount_t{100};
  initial.burn_target = amount_t{40};
  auto controller = resonance::ledger::supply_controller{initial};
  EXPECT_EQ(controller.evaluate(amount_t{99}), amount_t{0});
  EXPECT_EQ(controller.evaluate(amount_t{100}), amount_t{40});
  EXPECT_EQ(controller.remaining_supply(), amount_t{60});
}

TEST(supply_controller, triggered_state_survives_restart) {
  auto db = resonance::testing::scoped_path{"resonance_supply_state"};
  auto storage = resonance::storage::make_storage<
      resonance::storage::rocksdb_storage_tag>(db.path);
  {
    auto controller = resonance::ledger::supply_controller{{}, &storage};
    EXPECT_EQ(controller.evaluate(amount_t{1021000000}), amount_t{1000000000});
  }
  auto restarted = resonance::ledger::supply_controller{{}, &storage};
  EXPECT_EQ(restarted.state().status, burn_status_t::triggered);
  EXPECT_EQ(restarted.evaluate(amount_t{1021000000}), amount_t{0});
  EXPECT_EQ(restarted.state().burned_total, amount_t{1000000000});
}

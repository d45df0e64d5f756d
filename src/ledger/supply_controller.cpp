#include <resonance/ledger/supply_controller.hpp>
#include <resonance/schema/encoding/scale/encoder.hpp>
#include <resonance/schema/key/keys.hpp>
#include <spdlog/spdlog.h>

using namespace resonance::schema;

namespace resonance::ledger {

supply_controller::supply_controller(supply_state_t initial,
                                     const storage_t* storage)
    : state_{std::move(initial)}, storage_{storage} {
  if (storage_ == nullptr) {
    return;
  }
  auto encoder = scale_encoder_t{};
  auto persisted = storage_->get<supply_state_t>(
      encoder, make_bytes_view(key::kSupplyStateKey));
  if (persisted) {
    state_ = std::move(*persisted);
    spdlog::info("Restored supply state: burned {} of target {} ({})",
                 to_string(state_.burned_total), to_string(state_.burn_target),
                 to_string(state_.status));
  }
}

amount_t supply_controller::evaluate(const amount_t& circulating_supply) {
  auto lock = std::scoped_lock{mutex_};
  state_.circulating_supply = circulating_supply;

  auto delta = amount_t{0};
  if (state_.status == burn_status_t::not_triggered &&
      state_.circulating_supply >= state_.total_supply &&
      state_.burned_total < state_.burn_target) {
    state_.burned_total += state_.burn_target;
    state_.status = burn_status_t::triggered;
    delta = state_.burn_target;
    spdlog::info("Burn triggered at circulating supply {}: burned {}",
                 to_string(circulating_supply), to_string(delta));
  } else {
    spdlog::debug("Supply report {} left burn state {}",
                  to_string(circulating_supply), to_string(state_.status));
  }
  persist();
  return delta;
}

supply_state_t supply_controller::state() const {
  auto lock = std::scoped_lock{mutex_};
  return state_;
}

amount_t supply_controller::remaining_supply() const {
  auto lock = std::scoped_lock{mutex_};
  if (state_.burned_total >= state_.total_supply) {
    return amount_t{0};
  }
  return state_.total_supply - state_.burned_total;
}

void supply_controller::persist() const {
  if (storage_ == nullptr) {
    return;
  }
  auto encoder = scale_encoder_t{};
  storage_->put(encoder, make_bytes_view(key::kSupplyStateKey), state_);
}

}  // namespace resonance::ledger

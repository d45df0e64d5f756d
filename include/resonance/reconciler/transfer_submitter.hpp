#pragma once

#include <resonance/schema/transfer_event.hpp>

#include <functional>
#include <optional>
#include <string>

namespace resonance::reconciler {

/// Broadcast a transfer. Returns the reference the transfer will carry on
/// the upstream feed, or std::nullopt with `error` filled.
using transfer_submitter_t = std::function<std::optional<std::string>(
    const resonance::schema::transfer_request_t& request,
    std::string& error)>;

}  // namespace resonance::reconciler

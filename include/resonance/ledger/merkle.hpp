#pragma once

#include <resonance/schema/primitives.hpp>

#include <cstddef>
#include <optional>
#include <vector>

namespace resonance::ledger {

/// Binary SHA-256 tree over 32-byte leaves.
///
/// `levels[0]` is the leaf snapshot and `levels.back()` holds the root. An
/// odd node at the end of a level is paired with itself. No leaves means no
/// root; a single leaf is its own root.
struct merkle_tree_t final {
  std::optional<resonance::schema::hash32_t> root;
  std::vector<std::vector<resonance::schema::hash32_t>> levels;
};

struct proof_step_t final {
  resonance::schema::hash32_t sibling{};
  bool sibling_on_left{false};
};

merkle_tree_t build(const std::vector<resonance::schema::hash32_t>& leaves);

/// Sibling path from leaf `index` to the root, or std::nullopt when the
/// index is out of range.
std::optional<std::vector<proof_step_t>> make_proof(const merkle_tree_t& tree,
                                                    std::size_t index);

bool verify_proof(const resonance::schema::hash32_t& leaf,
                  const std::vector<proof_step_t>& proof,
                  const resonance::schema::hash32_t& root);

}  // namespace resonance::ledger

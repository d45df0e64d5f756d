#include <resonance/crypto/digest.hpp>
#include <resonance/ledger/merkle.hpp>

namespace resonance::ledger {

merkle_tree_t build(const std::vector<resonance::schema::hash32_t>& leaves) {
  auto tree = merkle_tree_t{};
  if (leaves.empty()) {
    return tree;
  }
  tree.levels.push_back(leaves);
  while (tree.levels.back().size() > 1) {
    const auto& level = tree.levels.back();
    auto next = std::vector<resonance::schema::hash32_t>{};
    next.reserve((level.size() + 1) / 2);
    for (std::size_t i = 0; i < level.size(); i += 2) {
      const auto& left = level[i];
      const auto& right = (i + 1 < level.size()) ? level[i + 1] : left;
      next.push_back(resonance::crypto::sha256(left, right));
    }
    tree.levels.push_back(std::move(next));
  }
  tree.root = tree.levels.back().front();
  return tree;
}

std::optional<std::vector<proof_step_t>> make_proof(const merkle_tree_t& tree,
                                                    std::size_t index) {
  if (tree.levels.empty() || index >= tree.levels.front().size()) {
    return std::nullopt;
  }
  auto proof = std::vector<proof_step_t>{};
  for (std::size_t level = 0; level + 1 < tree.levels.size(); ++level) {
    const auto& nodes = tree.levels[level];
    if (index % 2 == 0) {
      auto sibling = (index + 1 < nodes.size()) ? index + 1 : index;
      proof.push_back(
          proof_step_t{.sibling = nodes[sibling], .sibling_on_left = false});
    } else {
      proof.push_back(
          proof_step_t{.sibling = nodes[index - 1], .sibling_on_left = true});
    }
    index /= 2;
  }
  return proof;
}

bool verify_proof(const resonance::schema::hash32_t& leaf,
                  const std::vector<proof_step_t>& proof,
                  const resonance::schema::hash32_t& root) {
  auto current = leaf;
  for (const auto& step : proof) {
    current = step.sibling_on_left
                  ? resonance::crypto::sha256(step.sibling, current)
                  : resonance::crypto::sha256(current, step.sibling);
  }
  return current == root;
}

}  // namespace resonance::ledger

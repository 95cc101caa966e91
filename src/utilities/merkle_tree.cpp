#include "utilities/merkle_tree.hpp"
#include "utilities/hasher.hpp"

#include <algorithm>
#include <stdexcept>

namespace merkleclaim {

Digest MerkleVerifier::encodeLeaf(const Address &recipient, Amount amount) {
  std::array<uint8_t, AMOUNT_FIELD_SIZE> amountField{};
  for (size_t i = 0; i < sizeof(Amount); ++i) {
    amountField[AMOUNT_FIELD_SIZE - 1 - i] =
        static_cast<uint8_t>((amount >> (8 * i)) & 0xff);
  }

  Hasher h;
  h.ingestByte(LEAF_TAG);
  h.ingest(recipient);
  h.ingest(amountField);
  return h.finalize();
}

Digest MerkleVerifier::hashPair(const Digest &a, const Digest &b) {
  const Digest &lo = a < b ? a : b;
  const Digest &hi = a < b ? b : a;

  Hasher h;
  h.ingestByte(NODE_TAG);
  h.ingest(lo);
  h.ingest(hi);
  return h.finalize();
}

bool MerkleVerifier::verify(const Digest &leaf, const ProofPath &proof,
                            const Digest &root, size_t maxDepth) {
  if (proof.size() > maxDepth)
    return false;

  Digest computed = leaf;
  for (const auto &sibling : proof) {
    if (sibling.size() != DIGEST_SIZE)
      return false;
    Digest s{};
    std::copy(sibling.begin(), sibling.end(), s.begin());
    computed = hashPair(computed, s);
  }
  return computed == root;
}

bool MerkleVerifier::verify(const Digest &leaf,
                            const std::vector<Digest> &proof,
                            const Digest &root, size_t maxDepth) {
  return verify(leaf, toProofPath(proof), root, maxDepth);
}

ProofPath MerkleVerifier::toProofPath(const std::vector<Digest> &proof) {
  ProofPath out;
  out.reserve(proof.size());
  for (const auto &d : proof) {
    out.emplace_back(d.begin(), d.end());
  }
  return out;
}

MerkleTree::MerkleTree(const std::vector<Entitlement> &entitlements) {
  if (entitlements.empty()) {
    throw std::invalid_argument("Cannot build a Merkle tree with no leaves");
  }

  std::vector<Digest> leaves;
  leaves.reserve(entitlements.size());
  for (const auto &e : entitlements) {
    leaves.push_back(MerkleVerifier::encodeLeaf(e.recipient, e.amount));
  }
  std::sort(leaves.begin(), leaves.end());
  levels_.push_back(std::move(leaves));

  while (levels_.back().size() > 1) {
    const auto &level = levels_.back();
    std::vector<Digest> next;
    next.reserve((level.size() + 1) / 2);
    for (size_t i = 0; i + 1 < level.size(); i += 2) {
      next.push_back(MerkleVerifier::hashPair(level[i], level[i + 1]));
    }
    if (level.size() % 2 == 1) {
      next.push_back(level.back());
    }
    levels_.push_back(std::move(next));
  }
}

std::vector<Digest> MerkleTree::proof(const Address &recipient,
                                      Amount amount) const {
  return proofForLeaf(MerkleVerifier::encodeLeaf(recipient, amount));
}

std::vector<Digest> MerkleTree::proofForLeaf(const Digest &leaf) const {
  const auto &leaves = levels_.front();
  auto it = std::lower_bound(leaves.begin(), leaves.end(), leaf);
  if (it == leaves.end() || *it != leaf) {
    throw std::out_of_range("Leaf " + toHex(leaf) + " is not in the tree");
  }

  std::vector<Digest> path;
  size_t index = static_cast<size_t>(it - leaves.begin());
  for (size_t lvl = 0; lvl + 1 < levels_.size(); ++lvl) {
    const auto &level = levels_[lvl];
    size_t sibling = index ^ 1u;
    if (sibling < level.size()) {
      path.push_back(level[sibling]);
    }
    index /= 2;
  }
  return path;
}

} // namespace merkleclaim

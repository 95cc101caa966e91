#ifndef MERKLECLAIM_MERKLE_TREE_HPP
#define MERKLECLAIM_MERKLE_TREE_HPP

#include "utilities/digest.hpp"

#include <cstddef>
#include <vector>

namespace merkleclaim {

/// Sibling digests as supplied by a claimant. Entries are raw bytes so that
/// a malformed entry (wrong width) can be rejected rather than truncated.
using ProofPath = std::vector<Bytes>;

/// Longest proof accepted unless a ledger is configured otherwise.
inline constexpr size_t DEFAULT_MAX_PROOF_DEPTH = 32;

/// Domain tags prefixed to every hash preimage.
inline constexpr uint8_t LEAF_TAG = 0x00;
inline constexpr uint8_t NODE_TAG = 0x01;

/**
 * @brief Stateless Merkle membership checks.
 *
 * Leaf:  SHA256(0x00 || recipient[20] || amount[32, big-endian])
 * Node:  SHA256(0x01 || min(a, b) || max(a, b))
 *
 * Pairs are ordered by value (bytewise), so proofs carry no direction bits
 * and a tree built with index-parity ordering will not verify here.
 */
class MerkleVerifier {
public:
  static Digest encodeLeaf(const Address &recipient, Amount amount);

  // Order-independent: hashPair(a, b) == hashPair(b, a).
  static Digest hashPair(const Digest &a, const Digest &b);

  /**
   * @brief Check that @p leaf is committed to by @p root.
   *
   * Returns false for a proof longer than @p maxDepth or for any sibling
   * that is not exactly DIGEST_SIZE bytes. An empty proof verifies only
   * when leaf == root.
   */
  static bool verify(const Digest &leaf, const ProofPath &proof,
                     const Digest &root,
                     size_t maxDepth = DEFAULT_MAX_PROOF_DEPTH);

  static bool verify(const Digest &leaf, const std::vector<Digest> &proof,
                     const Digest &root,
                     size_t maxDepth = DEFAULT_MAX_PROOF_DEPTH);

  static ProofPath toProofPath(const std::vector<Digest> &proof);
};

/** A (recipient, amount) pair from a committed distribution. */
struct Entitlement {
  Address recipient{};
  Amount amount{0};
};

/**
 * @brief Builds a complete tree over a list of entitlements.
 *
 * Used by tooling and tests to produce roots and proofs. Leaves are sorted
 * before pairing so the root does not depend on input order. An unpaired
 * node at the end of a level is carried up unchanged.
 */
class MerkleTree {
public:
  /**
   * @throw std::invalid_argument If @p entitlements is empty.
   */
  explicit MerkleTree(const std::vector<Entitlement> &entitlements);

  const Digest &root() const { return levels_.back().front(); }

  // Number of levels above the leaves; the longest possible proof.
  size_t depth() const { return levels_.size() - 1; }

  size_t leafCount() const { return levels_.front().size(); }

  /**
   * @brief Leaf-to-root sibling list for an entitlement.
   * @throw std::out_of_range If the entitlement is not in the tree.
   */
  std::vector<Digest> proof(const Address &recipient, Amount amount) const;

  std::vector<Digest> proofForLeaf(const Digest &leaf) const;

private:
  std::vector<std::vector<Digest>> levels_;
};

} // namespace merkleclaim

#endif // MERKLECLAIM_MERKLE_TREE_HPP

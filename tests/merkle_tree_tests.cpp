#include "test_helpers.hpp"
#include "utilities/hasher.hpp"
#include "utilities/merkle_tree.hpp"
#include <algorithm>
#include <gtest/gtest.h>
#include <random>
#include <stdexcept>

using namespace merkleclaim;
using testutil::addr;

namespace {

std::vector<Entitlement> makeEntitlements(size_t n) {
  std::vector<Entitlement> out;
  for (size_t i = 0; i < n; ++i) {
    out.push_back({addr(static_cast<uint8_t>(i + 1)), (i + 1) * 10});
  }
  return out;
}

} // namespace

/**
 * @brief Leaf encoding is the tagged, fixed-width preimage.
 */
TEST(MerkleVerifier, LeafEncodingLayout) {
  Address a = addr(0xab);
  Amount amount = 0x0102030405060708ULL;

  std::vector<uint8_t> preimage;
  preimage.push_back(LEAF_TAG);
  preimage.insert(preimage.end(), a.begin(), a.end());
  std::vector<uint8_t> amountField(AMOUNT_FIELD_SIZE, 0);
  for (int i = 0; i < 8; ++i)
    amountField[AMOUNT_FIELD_SIZE - 8 + i] = static_cast<uint8_t>(i + 1);
  preimage.insert(preimage.end(), amountField.begin(), amountField.end());
  ASSERT_EQ(preimage.size(), 1 + ADDRESS_SIZE + AMOUNT_FIELD_SIZE);

  EXPECT_EQ(MerkleVerifier::encodeLeaf(a, amount),
            Hasher::sha256(preimage.data(), preimage.size()));
}

TEST(MerkleVerifier, LeafDistinguishesRecipientAndAmount) {
  Digest base = MerkleVerifier::encodeLeaf(addr(1), 10);
  EXPECT_EQ(base, MerkleVerifier::encodeLeaf(addr(1), 10));
  EXPECT_NE(base, MerkleVerifier::encodeLeaf(addr(1), 11));
  EXPECT_NE(base, MerkleVerifier::encodeLeaf(addr(2), 10));
}

TEST(MerkleVerifier, HashPairIsOrderIndependentAndTagged) {
  Digest a = MerkleVerifier::encodeLeaf(addr(1), 1);
  Digest b = MerkleVerifier::encodeLeaf(addr(2), 2);
  EXPECT_EQ(MerkleVerifier::hashPair(a, b), MerkleVerifier::hashPair(b, a));

  // Untagged concatenation must not collide with the node hash.
  const Digest &lo = std::min(a, b);
  const Digest &hi = std::max(a, b);
  std::vector<uint8_t> raw(lo.begin(), lo.end());
  raw.insert(raw.end(), hi.begin(), hi.end());
  EXPECT_NE(MerkleVerifier::hashPair(a, b), Hasher::sha256(raw.data(), raw.size()));
}

TEST(MerkleVerifier, EmptyProofOnlyForSingleLeaf) {
  Digest leaf = MerkleVerifier::encodeLeaf(addr(7), 70);
  EXPECT_TRUE(MerkleVerifier::verify(leaf, ProofPath{}, leaf));
  Digest other = MerkleVerifier::encodeLeaf(addr(8), 80);
  EXPECT_FALSE(MerkleVerifier::verify(leaf, ProofPath{}, other));

  MerkleTree single({{addr(7), 70}});
  EXPECT_EQ(single.root(), leaf);
  EXPECT_EQ(single.depth(), 0u);
  EXPECT_TRUE(single.proof(addr(7), 70).empty());
}

/**
 * @brief Every entitlement verifies for trees of assorted shapes,
 * including odd levels where a node is carried up.
 */
TEST(MerkleTree, CompletenessAcrossSizes) {
  for (size_t n = 1; n <= 17; ++n) {
    auto entitlements = makeEntitlements(n);
    MerkleTree tree(entitlements);
    EXPECT_EQ(tree.leafCount(), n);
    for (const auto &e : entitlements) {
      auto proof = tree.proof(e.recipient, e.amount);
      EXPECT_LE(proof.size(), tree.depth());
      EXPECT_TRUE(MerkleVerifier::verify(
          MerkleVerifier::encodeLeaf(e.recipient, e.amount), proof,
          tree.root()))
          << "n=" << n;
    }
  }
}

TEST(MerkleTree, RootIndependentOfInputOrder) {
  auto entitlements = makeEntitlements(9);
  MerkleTree a(entitlements);
  std::reverse(entitlements.begin(), entitlements.end());
  MerkleTree b(entitlements);
  EXPECT_EQ(a.root(), b.root());
}

TEST(MerkleTree, RejectsEmptyAndUnknownEntitlements) {
  EXPECT_THROW(MerkleTree(std::vector<Entitlement>{}), std::invalid_argument);
  MerkleTree tree(makeEntitlements(4));
  EXPECT_THROW(tree.proof(addr(1), 11), std::out_of_range);
  EXPECT_THROW(tree.proof(addr(99), 10), std::out_of_range);
}

/**
 * @brief Randomly flipped bits in the leaf, any sibling or the root all
 * cause verification to fail.
 */
TEST(MerkleVerifier, SoundnessUnderRandomMutation) {
  auto entitlements = makeEntitlements(13);
  MerkleTree tree(entitlements);
  std::mt19937 rng(20261019);

  for (int round = 0; round < 200; ++round) {
    const auto &e = entitlements[rng() % entitlements.size()];
    Digest leaf = MerkleVerifier::encodeLeaf(e.recipient, e.amount);
    auto proof = tree.proof(e.recipient, e.amount);
    Digest root = tree.root();
    ASSERT_TRUE(MerkleVerifier::verify(leaf, proof, root));

    size_t target = rng() % (proof.size() + 2);
    size_t byte = rng() % DIGEST_SIZE;
    uint8_t bit = static_cast<uint8_t>(1u << (rng() % 8));
    if (target == 0) {
      leaf[byte] ^= bit;
    } else if (target == 1) {
      root[byte] ^= bit;
    } else {
      proof[target - 2][byte] ^= bit;
    }
    EXPECT_FALSE(MerkleVerifier::verify(leaf, proof, root));
  }
}

TEST(MerkleVerifier, DroppedOrReorderedSiblingsFail) {
  auto entitlements = makeEntitlements(8);
  MerkleTree tree(entitlements);
  Digest leaf = MerkleVerifier::encodeLeaf(addr(3), 30);
  auto proof = tree.proof(addr(3), 30);
  ASSERT_EQ(proof.size(), 3u);

  auto shorter = proof;
  shorter.pop_back();
  EXPECT_FALSE(MerkleVerifier::verify(leaf, shorter, tree.root()));

  auto swapped = proof;
  std::swap(swapped[0], swapped[1]);
  EXPECT_FALSE(MerkleVerifier::verify(leaf, swapped, tree.root()));
}

TEST(MerkleVerifier, RejectsMalformedSiblingWidth) {
  MerkleTree tree(makeEntitlements(2));
  Digest leaf = MerkleVerifier::encodeLeaf(addr(1), 10);
  ProofPath good = MerkleVerifier::toProofPath(tree.proof(addr(1), 10));
  ASSERT_TRUE(MerkleVerifier::verify(leaf, good, tree.root()));

  ProofPath shortEntry = good;
  shortEntry[0].pop_back();
  EXPECT_FALSE(MerkleVerifier::verify(leaf, shortEntry, tree.root()));

  ProofPath longEntry = good;
  longEntry[0].push_back(0x00);
  EXPECT_FALSE(MerkleVerifier::verify(leaf, longEntry, tree.root()));

  ProofPath emptyEntry{Bytes{}};
  EXPECT_FALSE(MerkleVerifier::verify(leaf, emptyEntry, tree.root()));
}

TEST(MerkleVerifier, RejectsProofsBeyondMaxDepth) {
  MerkleTree tree(makeEntitlements(8));
  Digest leaf = MerkleVerifier::encodeLeaf(addr(5), 50);
  auto proof = tree.proof(addr(5), 50);
  ASSERT_EQ(proof.size(), 3u);
  EXPECT_TRUE(MerkleVerifier::verify(leaf, proof, tree.root(), 3));
  EXPECT_FALSE(MerkleVerifier::verify(leaf, proof, tree.root(), 2));
  // Both proof forms share one depth rule.
  ProofPath raw = MerkleVerifier::toProofPath(proof);
  EXPECT_TRUE(MerkleVerifier::verify(leaf, raw, tree.root(), 3));
  EXPECT_FALSE(MerkleVerifier::verify(leaf, raw, tree.root(), 2));

  std::vector<Digest> huge(DEFAULT_MAX_PROOF_DEPTH + 1, Digest{});
  EXPECT_FALSE(MerkleVerifier::verify(leaf, huge, tree.root()));
  EXPECT_FALSE(MerkleVerifier::verify(
      leaf, MerkleVerifier::toProofPath(huge), tree.root()));
}

/**
 * @brief Pairs are ordered by value, not by position. A root computed with
 * positional (left || right) ordering does not verify when left > right.
 */
TEST(MerkleVerifier, ValueOrderingNotPositional) {
  Digest x = MerkleVerifier::encodeLeaf(addr(1), 10);
  Digest y = MerkleVerifier::encodeLeaf(addr(2), 20);
  Digest left = std::max(x, y);
  Digest right = std::min(x, y);

  std::vector<uint8_t> positional{NODE_TAG};
  positional.insert(positional.end(), left.begin(), left.end());
  positional.insert(positional.end(), right.begin(), right.end());
  Digest positionalRoot = Hasher::sha256(positional.data(), positional.size());

  EXPECT_FALSE(MerkleVerifier::verify(left, std::vector<Digest>{right},
                                      positionalRoot));
  Digest sortedRoot = MerkleVerifier::hashPair(left, right);
  EXPECT_TRUE(MerkleVerifier::verify(left, std::vector<Digest>{right}, sortedRoot));
  EXPECT_TRUE(MerkleVerifier::verify(right, std::vector<Digest>{left}, sortedRoot));
}

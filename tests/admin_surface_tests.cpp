#include "claims/admin_surface.h"
#include "mocks/mock_token_ledger.h"
#include "test_helpers.hpp"
#include <gmock/gmock.h>
#include <fstream>
#include <gtest/gtest.h>

using namespace merkleclaim;
using testutil::addr;
using ::testing::_;
using ::testing::Return;

class AdminSurfaceTest : public ::testing::Test {
protected:
  const Address owner = addr(0x11);
  const Address admin = addr(0x22);
  const Address guardian = addr(0x33);
  const Address stranger = addr(0x44);

  MerkleTree tree{std::vector<Entitlement>{{addr(0xA1), 10}, {addr(0xB2), 20}}};
  InMemoryTokenLedger tokens{"CLAIM", 100};
  PauseSwitch pauseSwitch;
  ClaimEventLog events;
  ClaimLedger ledger{std::make_unique<ClaimStore>(), tokens, pauseSwitch,
                     events};
  RolePolicy policy{owner};
  AdminSurface surface{ledger, policy, pauseSwitch, events};

  void SetUp() override {
    policy.allow("admin", Action::SetRoot);
    policy.allow("admin", Action::Pause);
    policy.allow("admin", Action::Unpause);
    policy.allow("admin", Action::Sweep);
    policy.allow("admin", Action::Reconcile);
    policy.allow("guardian", Action::Pause);
    policy.assignRole(admin, "admin");
    policy.assignRole(guardian, "guardian");
  }
};

TEST_F(AdminSurfaceTest, SetRootRequiresAuthority) {
  EXPECT_EQ(surface.setRoot(stranger, tree.root()), ErrorKind::Unauthorized);
  EXPECT_EQ(surface.setRoot(guardian, tree.root()), ErrorKind::Unauthorized);
  EXPECT_EQ(ledger.currentRoot(), Digest{});
  EXPECT_EQ(events.size(), 0u);

  EXPECT_EQ(surface.setRoot(admin, tree.root()), ErrorKind::None);
  EXPECT_EQ(ledger.currentRoot(), tree.root());
  EXPECT_EQ(surface.setRoot(owner, Digest{}), ErrorKind::None);
  EXPECT_EQ(ledger.currentRoot(), Digest{});

  auto log = events.events();
  ASSERT_EQ(log.size(), 2u);
  EXPECT_EQ(log[0].type, ClaimEventLog::EventType::RootRotated);
  EXPECT_EQ(log[0].detail, toHex(tree.root()));
}

TEST_F(AdminSurfaceTest, PauseGatesClaims) {
  ASSERT_EQ(surface.setRoot(admin, tree.root()), ErrorKind::None);
  EXPECT_EQ(surface.pause(stranger), ErrorKind::Unauthorized);
  EXPECT_TRUE(pauseSwitch.isAcceptingClaims());

  EXPECT_EQ(surface.pause(guardian), ErrorKind::None);
  EXPECT_TRUE(pauseSwitch.isPaused());
  EXPECT_EQ(ledger.claim(addr(0xA1), 10, tree.proof(addr(0xA1), 10)).error,
            ErrorKind::ClaimsPaused);
  EXPECT_EQ(tokens.transferCount(), 0u);

  // Guardians may stop claims but not resume them.
  EXPECT_EQ(surface.unpause(guardian), ErrorKind::Unauthorized);
  EXPECT_TRUE(pauseSwitch.isPaused());
  EXPECT_EQ(surface.unpause(admin), ErrorKind::None);
  EXPECT_TRUE(ledger.claim(addr(0xA1), 10, tree.proof(addr(0xA1), 10)).ok());

  auto log = events.events();
  ASSERT_EQ(log.size(), 4u);
  EXPECT_EQ(log[1].type, ClaimEventLog::EventType::Paused);
  EXPECT_EQ(log[1].subject, toHex(guardian));
  EXPECT_EQ(log[2].type, ClaimEventLog::EventType::Unpaused);
  EXPECT_EQ(log[3].type, ClaimEventLog::EventType::ClaimCompleted);
}

TEST_F(AdminSurfaceTest, SweepMovesForeignAssetOnly) {
  InMemoryTokenLedger stray("STRAY", 50);
  EXPECT_EQ(surface.sweepForeignAsset(stranger, stray, admin, 50),
            ErrorKind::Unauthorized);
  EXPECT_EQ(surface.sweepForeignAsset(admin, tokens, admin, 50),
            ErrorKind::ProtectedAsset);
  EXPECT_EQ(tokens.poolBalance(), 100u);

  EXPECT_EQ(surface.sweepForeignAsset(admin, stray, stranger, 50),
            ErrorKind::None);
  EXPECT_EQ(stray.balanceOf(stranger), 50u);
  EXPECT_EQ(stray.poolBalance(), 0u);

  EXPECT_EQ(surface.sweepForeignAsset(owner, stray, stranger, 1),
            ErrorKind::TransferFailed);

  auto log = events.events();
  ASSERT_EQ(log.size(), 1u);
  EXPECT_EQ(log[0].type, ClaimEventLog::EventType::AssetSwept);
  EXPECT_EQ(log[0].subject, toHex(stranger));
  EXPECT_EQ(log[0].detail, "STRAY:50");
}

TEST_F(AdminSurfaceTest, SweepRefusesAnotherHandleOnClaimToken) {
  InMemoryTokenLedger sameToken("CLAIM", 50);
  EXPECT_EQ(surface.sweepForeignAsset(admin, sameToken, admin, 50),
            ErrorKind::ProtectedAsset);
  EXPECT_EQ(sameToken.poolBalance(), 50u);
  EXPECT_EQ(sameToken.transferCount(), 0u);
  EXPECT_EQ(events.size(), 0u);
}

TEST_F(AdminSurfaceTest, SweepSurvivesThrowingAsset) {
  MockTokenLedger asset;
  EXPECT_CALL(asset, transfer(_, 5))
      .WillOnce(::testing::Throw(std::runtime_error("rpc down")));
  EXPECT_CALL(asset, symbol()).WillRepeatedly(Return("MOCK"));
  EXPECT_EQ(surface.sweepForeignAsset(admin, asset, admin, 5),
            ErrorKind::TransferFailed);
  EXPECT_EQ(events.size(), 0u);
}

TEST_F(AdminSurfaceTest, TwoPhaseAuthorityHandoff) {
  EXPECT_EQ(surface.nominateAuthority(admin, stranger),
            ErrorKind::Unauthorized);
  EXPECT_FALSE(policy.pendingOwner());

  EXPECT_EQ(surface.nominateAuthority(owner, stranger), ErrorKind::None);
  EXPECT_EQ(*policy.pendingOwner(), stranger);
  // Nomination alone grants nothing.
  EXPECT_EQ(*policy.owner(), owner);
  EXPECT_EQ(surface.pause(stranger), ErrorKind::Unauthorized);
  EXPECT_EQ(surface.acceptAuthority(admin), ErrorKind::Unauthorized);

  EXPECT_EQ(surface.acceptAuthority(stranger), ErrorKind::None);
  EXPECT_EQ(*policy.owner(), stranger);
  EXPECT_FALSE(policy.pendingOwner());
  EXPECT_EQ(surface.pause(stranger), ErrorKind::None);
  EXPECT_EQ(surface.setRoot(owner, tree.root()), ErrorKind::Unauthorized);
  EXPECT_EQ(surface.acceptAuthority(stranger), ErrorKind::Unauthorized);

  auto log = events.events();
  ASSERT_EQ(log.size(), 3u);
  EXPECT_EQ(log[0].type, ClaimEventLog::EventType::AuthorityNominated);
  EXPECT_EQ(log[0].detail, toHex(stranger));
  EXPECT_EQ(log[1].type, ClaimEventLog::EventType::AuthorityTransferred);
  EXPECT_EQ(log[1].subject, toHex(stranger));
}

TEST_F(AdminSurfaceTest, RenominationReplacesPendingOwner) {
  ASSERT_EQ(surface.nominateAuthority(owner, stranger), ErrorKind::None);
  ASSERT_EQ(surface.nominateAuthority(owner, guardian), ErrorKind::None);
  EXPECT_EQ(surface.acceptAuthority(stranger), ErrorKind::Unauthorized);
  EXPECT_EQ(surface.acceptAuthority(guardian), ErrorKind::None);
  EXPECT_EQ(*policy.owner(), guardian);
}

TEST_F(AdminSurfaceTest, ReconcileRequiresAuthority) {
  EXPECT_EQ(surface.reconcile(stranger, addr(0xA1), true),
            ErrorKind::Unauthorized);
  EXPECT_EQ(surface.reconcile(admin, addr(0xA1), true),
            ErrorKind::NotPending);
}

TEST(AdminSurfaceStorage, UnwritableRootReportsStorageFailure) {
  auto dir = testutil::freshDir("admin_blocked");
  std::string blocker = dir + "/blocker";
  { std::ofstream(blocker) << "x"; }

  InMemoryTokenLedger tokens("CLAIM", 10);
  PauseSwitch pauseSwitch;
  ClaimEventLog events;
  ClaimLedger ledger(std::make_unique<ClaimStore>(blocker + "/root.dat",
                                                  dir + "/redemptions.dat"),
                     tokens, pauseSwitch, events);
  RolePolicy policy(addr(0x11));
  AdminSurface surface(ledger, policy, pauseSwitch, events);

  Digest root = MerkleTree({{addr(1), 1}}).root();
  EXPECT_EQ(surface.setRoot(addr(0x11), root), ErrorKind::StorageFailed);
  EXPECT_EQ(ledger.currentRoot(), Digest{});
  EXPECT_EQ(events.size(), 0u);
}

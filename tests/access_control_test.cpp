#include <gtest/gtest.h>

#include "TestSupport.hpp"
#include "core/access/AccessControl.hpp"
#include "core/events/EventLog.hpp"
#include "core/registry/Registry.hpp"
#include "core/store/InMemoryStore.hpp"

using namespace docguard;
using namespace docguard::test;

namespace {

class AccessControlTest : public ::testing::Test {
protected:
  InMemoryStore store;
  EventLog      log{store};
  Registry      registry{store, log};
  AccessControl access{store, registry, log};

  const FileHash  file  = make_hash(1);
  const Principal owner = make_principal(1);
  const Principal alice = make_principal(2);
  const Principal bob   = make_principal(3);

  void SetUp() override {
    ASSERT_TRUE(registry.put(file, owner, "ipfs://doc", make_signature(1), LocationLock{}, 100).ok());
  }

  size_t countEvents(EventKind k) const {
    EventQuery q;
    q.kind = k;
    return log.query(q).size();
  }
};

} // namespace

TEST_F(AccessControlTest, UploaderHasAccessAfterPut) {
  EXPECT_TRUE(access.canAccess(file, owner));
  EXPECT_FALSE(access.canAccess(file, alice));
}

TEST_F(AccessControlTest, UnknownFileGrantsNothing) {
  EXPECT_FALSE(access.canAccess(make_hash(9), owner));
  EXPECT_EQ(access.grant(make_hash(9), owner, alice, 1).kind(), AccessError::NotFound);
  EXPECT_EQ(access.revoke(make_hash(9), owner, alice, 1).kind(), AccessError::NotFound);
}

TEST_F(AccessControlTest, GrantThenRevoke) {
  ASSERT_TRUE(access.grant(file, owner, alice, 200).ok());
  EXPECT_TRUE(access.canAccess(file, alice));

  ASSERT_TRUE(access.revoke(file, owner, alice, 300).ok());
  EXPECT_FALSE(access.canAccess(file, alice));

  auto events = log.query();
  ASSERT_EQ(events.size(), 3u);
  EXPECT_EQ(events[0].kind, EventKind::AccessRevoked);
  EXPECT_EQ(events[0].principal, alice);
  EXPECT_EQ(events[0].timestamp, 300);
  EXPECT_EQ(events[1].kind, EventKind::AccessGranted);
  EXPECT_EQ(events[1].timestamp, 200);
}

TEST_F(AccessControlTest, NonUploaderIsUnauthorized) {
  EXPECT_EQ(access.grant(file, alice, bob, 1).kind(), AccessError::Unauthorized);
  ASSERT_TRUE(access.grant(file, owner, alice, 1).ok());
  // holding access does not confer the right to manage it
  EXPECT_EQ(access.grant(file, alice, bob, 2).kind(), AccessError::Unauthorized);
  EXPECT_EQ(access.revoke(file, alice, owner, 3).kind(), AccessError::Unauthorized);
  EXPECT_EQ(access.revoke(file, alice, alice, 4).kind(), AccessError::Unauthorized);
  EXPECT_FALSE(access.canAccess(file, bob));
  EXPECT_TRUE(access.canAccess(file, owner));
}

TEST_F(AccessControlTest, NullGranteeIsRejected) {
  auto r = access.grant(file, owner, Principal{}, 1);
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.kind(), AccessError::InvalidGrantee);
  EXPECT_EQ(countEvents(EventKind::AccessGranted), 0u);
}

TEST_F(AccessControlTest, UploaderCannotRevokeSelf) {
  auto r = access.revoke(file, owner, owner, 1);
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.kind(), AccessError::SelfRevocation);
  EXPECT_TRUE(access.canAccess(file, owner));
  EXPECT_EQ(countEvents(EventKind::AccessRevoked), 0u);
}

TEST_F(AccessControlTest, RepeatedGrantAndRevokeEmitOneEventPerCall) {
  ASSERT_TRUE(access.grant(file, owner, alice, 1).ok());
  ASSERT_TRUE(access.grant(file, owner, alice, 2).ok());
  EXPECT_TRUE(access.canAccess(file, alice));
  EXPECT_EQ(countEvents(EventKind::AccessGranted), 2u);

  ASSERT_TRUE(access.revoke(file, owner, bob, 3).ok());   // never granted
  ASSERT_TRUE(access.revoke(file, owner, bob, 4).ok());
  EXPECT_FALSE(access.canAccess(file, bob));
  EXPECT_EQ(countEvents(EventKind::AccessRevoked), 2u);
}

TEST_F(AccessControlTest, OwnerMayRegrantOwnAccess) {
  EXPECT_TRUE(access.grant(file, owner, owner, 5).ok());
  EXPECT_TRUE(access.canAccess(file, owner));
}

TEST_F(AccessControlTest, AccessIsPerFile) {
  auto other = make_hash(2);
  ASSERT_TRUE(registry.put(other, alice, "ipfs://other", {}, LocationLock{}, 5).ok());
  ASSERT_TRUE(access.grant(file, owner, bob, 6).ok());
  EXPECT_TRUE(access.canAccess(file, bob));
  EXPECT_FALSE(access.canAccess(other, bob));
  EXPECT_EQ(access.grant(other, owner, bob, 7).kind(), AccessError::Unauthorized);
}

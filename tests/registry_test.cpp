#include <gtest/gtest.h>

#include <stdexcept>

#include "TestSupport.hpp"
#include "core/events/EventLog.hpp"
#include "core/registry/Registry.hpp"
#include "core/store/InMemoryStore.hpp"

using namespace docguard;
using namespace docguard::test;

namespace {

class RegistryTest : public ::testing::Test {
protected:
  InMemoryStore store;
  EventLog      log{store};
  Registry      registry{store, log};
};

} // namespace

TEST_F(RegistryTest, PutStoresRecordAndReturnsIt) {
  auto h = make_hash(1);
  auto r = registry.put(h, make_principal(7), "ipfs://QmAbc", make_signature(3), la_lock(), 1700000000);
  ASSERT_TRUE(r.ok());
  EXPECT_EQ(r.value().fileHash, h);
  EXPECT_EQ(r.value().uploader, make_principal(7));
  EXPECT_EQ(r.value().storagePointer, "ipfs://QmAbc");
  EXPECT_EQ(r.value().signature, make_signature(3));
  EXPECT_EQ(r.value().timestamp, 1700000000);
  EXPECT_EQ(r.value().lock, la_lock());

  auto got = registry.get(h);
  ASSERT_TRUE(got.has_value());
  EXPECT_EQ(*got, r.value());
  EXPECT_TRUE(registry.exists(h));
}

TEST_F(RegistryTest, SecondPutOfSameHashIsRejected) {
  auto h = make_hash(1);
  auto first = registry.put(h, make_principal(7), "ipfs://first", make_signature(1), LocationLock{}, 10);
  ASSERT_TRUE(first.ok());

  auto again = registry.put(h, make_principal(8), "ipfs://second", make_signature(2), la_lock(), 20);
  ASSERT_FALSE(again.ok());
  EXPECT_EQ(again.kind(), RegistryError::AlreadyExists);
  EXPECT_FALSE(again.error().message.empty());

  // identical resubmission is an error too
  auto same = registry.put(h, make_principal(7), "ipfs://first", make_signature(1), LocationLock{}, 10);
  EXPECT_EQ(same.kind(), RegistryError::AlreadyExists);

  EXPECT_EQ(*registry.get(h), first.value());
  EXPECT_EQ(log.query().size(), 1u);
}

TEST_F(RegistryTest, EmptyPointerIsRejectedWithoutTrace) {
  auto h = make_hash(2);
  auto r = registry.put(h, make_principal(7), "", make_signature(1), LocationLock{}, 10);
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.kind(), RegistryError::InvalidPointer);
  EXPECT_FALSE(registry.exists(h));
  EXPECT_TRUE(log.query().empty());
  EXPECT_FALSE(store.findAccess(h, make_principal(7)).has_value());
}

TEST_F(RegistryTest, UnknownHashIsAbsent) {
  EXPECT_FALSE(registry.get(make_hash(42)).has_value());
  EXPECT_FALSE(registry.exists(make_hash(42)));
}

TEST_F(RegistryTest, PutAppendsUploadedEvent) {
  auto h = make_hash(3);
  ASSERT_TRUE(registry.put(h, make_principal(7), "ipfs://x", make_signature(9), la_lock(250), 55).ok());

  auto events = log.query();
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].kind, EventKind::Uploaded);
  EXPECT_EQ(events[0].fileHash, h);
  EXPECT_EQ(events[0].principal, make_principal(7));
  EXPECT_EQ(events[0].storagePointer, "ipfs://x");
  EXPECT_EQ(events[0].signature, make_signature(9));
  EXPECT_EQ(events[0].timestamp, 55);
  EXPECT_EQ(events[0].lock, la_lock(250));
  EXPECT_EQ(events[0].sequence, 1u);
}

TEST_F(RegistryTest, ListenersRunOnCreateAndCanAbortIt) {
  int calls = 0;
  registry.onRecordCreated([&](const FileRecord&) { ++calls; });
  ASSERT_TRUE(registry.put(make_hash(1), make_principal(1), "p", {}, LocationLock{}, 1).ok());
  EXPECT_EQ(calls, 1);

  registry.onRecordCreated([](const FileRecord& r) {
    if (r.fileHash == make_hash(2)) throw std::runtime_error("disk full");
  });
  auto r = registry.put(make_hash(2), make_principal(1), "p", {}, LocationLock{}, 2);
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.kind(), RegistryError::StorageFailure);
  EXPECT_FALSE(registry.exists(make_hash(2)));
  EXPECT_EQ(log.query().size(), 1u);
}

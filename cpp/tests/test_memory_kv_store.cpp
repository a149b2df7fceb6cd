/*
 * Tests for MemoryKvStore
 */

#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include "microshop/registry/MemoryKvStore.hpp"

using namespace microshop::registry;
using namespace std::chrono_literals;

namespace {

/// Clock that only moves when told to.
struct ManualClock {
    MemoryKvStore::Clock::time_point now = MemoryKvStore::Clock::time_point() + 1h;

    MemoryKvStore::Now fn() {
        return [this]() { return now; };
    }
};

} // namespace

TEST(MemoryKvStoreTest, GrantReturnsDistinctLeases) {
    MemoryKvStore store;
    auto a = store.grant_lease(30s);
    auto b = store.grant_lease(30s);
    EXPECT_TRUE(a.valid());
    EXPECT_NE(a.id, b.id);
    EXPECT_EQ(a.ttl, 30s);
    EXPECT_EQ(store.lease_count(), 2u);
}

TEST(MemoryKvStoreTest, NonPositiveTtlRejected) {
    MemoryKvStore store;
    EXPECT_THROW(store.grant_lease(0s), RegistryError);
}

TEST(MemoryKvStoreTest, PutAndPrefixRange) {
    MemoryKvStore store;
    auto lease = store.grant_lease(30s);
    store.put("/svc/a/1", "1", lease.id);
    store.put("/svc/a/2", "2", lease.id);
    store.put("/svc/ab/3", "3", lease.id);
    store.put("/svc/b/4", "4", NO_LEASE);

    auto kvs = store.get_prefix("/svc/a/");
    ASSERT_EQ(kvs.size(), 2u);
    EXPECT_EQ(kvs[0].key, "/svc/a/1");
    EXPECT_EQ(kvs[1].value, "2");
    EXPECT_EQ(kvs[1].lease, lease.id);

    EXPECT_EQ(store.get_prefix("/svc/").size(), 4u);
    EXPECT_TRUE(store.get_prefix("/nothing/").empty());
}

TEST(MemoryKvStoreTest, PutUnknownLeaseThrows) {
    MemoryKvStore store;
    EXPECT_THROW(store.put("/k", "v", 12345), LeaseNotFoundError);
    EXPECT_TRUE(store.get_prefix("/").empty());
}

TEST(MemoryKvStoreTest, OverwriteKeepsOneRecord) {
    MemoryKvStore store;
    auto lease = store.grant_lease(30s);
    store.put("/k", "old", lease.id);
    store.put("/k", "new", lease.id);

    auto kvs = store.get_prefix("/k");
    ASSERT_EQ(kvs.size(), 1u);
    EXPECT_EQ(kvs[0].value, "new");
}

TEST(MemoryKvStoreTest, ExpiryRemovesBoundKeys) {
    ManualClock clock;
    MemoryKvStore store(clock.fn());
    auto lease = store.grant_lease(10s);
    store.put("/svc/x", "x", lease.id);
    store.put("/svc/static", "s", NO_LEASE);

    clock.now += 9s;
    EXPECT_EQ(store.get_prefix("/svc/").size(), 2u);

    clock.now += 1s;  // deadline reached
    auto kvs = store.get_prefix("/svc/");
    ASSERT_EQ(kvs.size(), 1u);
    EXPECT_EQ(kvs[0].key, "/svc/static");
    EXPECT_FALSE(store.keep_alive(lease.id));
    EXPECT_EQ(store.lease_count(), 0u);
}

TEST(MemoryKvStoreTest, KeepAliveExtendsFullTtl) {
    ManualClock clock;
    MemoryKvStore store(clock.fn());
    auto lease = store.grant_lease(10s);
    store.put("/k", "v", lease.id);

    clock.now += 8s;
    EXPECT_TRUE(store.keep_alive(lease.id));
    EXPECT_EQ(store.time_to_live(lease.id), 10s);

    clock.now += 8s;
    EXPECT_EQ(store.get_prefix("/k").size(), 1u);

    clock.now += 2s;
    EXPECT_TRUE(store.get_prefix("/k").empty());
}

TEST(MemoryKvStoreTest, RevokeDeletesKeys) {
    MemoryKvStore store;
    auto lease = store.grant_lease(30s);
    store.put("/a", "1", lease.id);
    store.put("/b", "2", lease.id);

    store.revoke_lease(lease.id);
    EXPECT_TRUE(store.get_prefix("/").empty());
    EXPECT_FALSE(store.keep_alive(lease.id));

    store.revoke_lease(lease.id);  // unknown lease ignored
}

TEST(MemoryKvStoreTest, EraseKey) {
    MemoryKvStore store;
    auto lease = store.grant_lease(30s);
    store.put("/a", "1", lease.id);

    EXPECT_TRUE(store.erase("/a"));
    EXPECT_FALSE(store.erase("/a"));
    EXPECT_TRUE(store.get_prefix("/").empty());
    EXPECT_TRUE(store.keep_alive(lease.id));  // lease outlives its key
}

TEST(MemoryKvStoreTest, RebindingKeyToNewLease) {
    ManualClock clock;
    MemoryKvStore store(clock.fn());
    auto old_lease = store.grant_lease(5s);
    auto new_lease = store.grant_lease(30s);
    store.put("/k", "v", old_lease.id);
    store.put("/k", "v", new_lease.id);

    clock.now += 6s;  // old lease expires, key must survive on the new one
    ASSERT_EQ(store.get_prefix("/k").size(), 1u);
    EXPECT_EQ(store.get_prefix("/k")[0].lease, new_lease.id);
}

TEST(MemoryKvStoreTest, ClosedStoreIsUnavailable) {
    MemoryKvStore store;
    store.close();
    EXPECT_THROW(store.grant_lease(30s), StoreUnavailableError);
    EXPECT_THROW(store.get_prefix("/"), StoreUnavailableError);
    EXPECT_THROW(store.keep_alive(1), StoreUnavailableError);
}

/*
 * Tests for the ZeroMQ transport, the store daemon protocol and an
 * end-to-end order request over loopback TCP
 */

#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include "microshop/act/ActorSystem.hpp"
#include "microshop/client/ConnectionManager.hpp"
#include "microshop/order/OrderRpc.hpp"
#include "microshop/registry/MemoryKvStore.hpp"
#include "microshop/registry/RegistryClient.hpp"
#include "microshop/remote/FrameServer.hpp"
#include "microshop/remote/StoreFactory.hpp"
#include "microshop/remote/StoreProtocol.hpp"
#include "microshop/remote/StoreServer.hpp"
#include "microshop/remote/Zmq.hpp"
#include "microshop/remote/ZmqChannel.hpp"
#include "microshop/remote/ZmqKvStore.hpp"

using namespace microshop;
using namespace microshop::remote;
using namespace std::chrono_literals;

namespace {

const std::string LOOPBACK = "tcp://127.0.0.1:*";

// Nothing listens here.
const std::string DEAD_ADDRESS = "127.0.0.1:1";

int port_of(const std::string& endpoint) {
    return std::stoi(endpoint.substr(endpoint.rfind(':') + 1));
}

class StoreFixture : public ::testing::Test {
protected:
    void SetUp() override {
        backing = std::make_shared<registry::MemoryKvStore>();
        server = std::make_unique<StoreServer>(LOOPBACK, backing);
        server->start();
    }

    void TearDown() override { server->stop(); }

    std::shared_ptr<ZmqKvStore> connect() {
        return ZmqKvStore::connect({server->endpoint()}, 1s, 1s);
    }

    std::shared_ptr<registry::MemoryKvStore> backing;
    std::unique_ptr<StoreServer> server;
};

} // namespace

TEST(ZmqTest, EndpointAddressConversion) {
    EXPECT_EQ(to_endpoint("localhost:50052"), "tcp://localhost:50052");
    EXPECT_EQ(to_endpoint("ipc:///tmp/x"), "ipc:///tmp/x");
    EXPECT_EQ(to_address("tcp://127.0.0.1:2379"), "127.0.0.1:2379");
    EXPECT_EQ(to_address("127.0.0.1:2379"), "127.0.0.1:2379");
}

TEST(FrameServerTest, BindConflictIsReportedToCaller) {
    FrameServer first(LOOPBACK, [](const std::string&, const client::Frames&) { return client::Frames{"ok"}; });
    EXPECT_THROW(FrameServer(first.endpoint(), [](const std::string&, const client::Frames&) {
                     return client::Frames{"ok"};
                 }),
                 ZmqError);
}

TEST(FrameServerTest, CallRoundTrip) {
    FrameServer server(LOOPBACK, [](const std::string& method, const client::Frames& args) {
        client::Frames reply{"ok", method};
        reply.insert(reply.end(), args.begin(), args.end());
        return reply;
    });
    server.start();

    auto ch = ZmqChannel::dial(to_address(server.endpoint()), 1s);
    EXPECT_EQ(ch->call("echo", {"a", "", "c"}, 1s), (client::Frames{"ok", "echo", "a", "", "c"}));
    EXPECT_EQ(ch->call("echo", {}, 1s), (client::Frames{"ok", "echo"}));
    ch->close();
    EXPECT_THROW(ch->call("echo", {}, 1s), client::ChannelError);
    server.stop();
}

TEST(FrameServerTest, HandlerExceptionBecomesErrorReply) {
    FrameServer server(LOOPBACK, [](const std::string&, const client::Frames&) -> client::Frames {
        throw std::runtime_error("nope");
    });
    server.start();

    auto ch = ZmqChannel::dial(to_address(server.endpoint()), 1s);
    EXPECT_EQ(ch->call("x", {}, 1s), (client::Frames{"error", "nope"}));
}

TEST(ZmqChannelTest, DialUnreachableFailsFast) {
    ZmqChannelFactory factory;
    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(factory.dial(DEAD_ADDRESS, 200ms), client::ChannelTimeoutError);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
}

TEST(ZmqChannelTest, LateReplyIsDropped) {
    FrameServer server(LOOPBACK, [](const std::string& method, const client::Frames&) {
        if (method == "slow") {
            std::this_thread::sleep_for(300ms);
        }
        return client::Frames{method + "-done"};
    });
    server.start();

    auto ch = ZmqChannel::dial(to_address(server.endpoint()), 1s);
    EXPECT_THROW(ch->call("slow", {}, 50ms), client::ChannelTimeoutError);

    // The slow reply arrives first and must not be taken for this one.
    EXPECT_EQ(ch->call("fast", {}, 2s), client::Frames{"fast-done"});
    EXPECT_EQ(ch->late_replies(), 1u);
}

TEST_F(StoreFixture, LeaseAndKeyOperations) {
    auto store = connect();

    auto lease = store->grant_lease(30s);
    EXPECT_TRUE(lease.valid());
    EXPECT_EQ(lease.ttl, 30s);

    store->put("/svc/a/1", "1", lease.id);
    store->put("/svc/a/2", "2", registry::NO_LEASE);
    auto kvs = store->get_prefix("/svc/a/");
    ASSERT_EQ(kvs.size(), 2u);
    EXPECT_EQ(kvs[0].key, "/svc/a/1");
    EXPECT_EQ(kvs[0].value, "1");
    EXPECT_EQ(kvs[0].lease, lease.id);

    EXPECT_TRUE(store->keep_alive(lease.id));
    EXPECT_TRUE(store->erase("/svc/a/2"));
    EXPECT_FALSE(store->erase("/svc/a/2"));

    store->revoke_lease(lease.id);
    EXPECT_FALSE(store->keep_alive(lease.id));
    EXPECT_TRUE(store->get_prefix("/svc/").empty());

    EXPECT_THROW(store->put("/k", "v", lease.id), registry::LeaseNotFoundError);
}

TEST_F(StoreFixture, ClosedConnectionIsUnavailable) {
    auto store = connect();
    store->close();
    EXPECT_THROW(store->get_prefix("/"), registry::StoreUnavailableError);
}

TEST_F(StoreFixture, RegistryClientsShareTheDaemon) {
    registry::RegistryClient provider(connect());
    registry::RegistryClient consumer(connect());

    provider.register_instance({"order-service", "10.0.0.5", 50052});
    EXPECT_EQ(consumer.discover("order-service"), std::vector<std::string>{"10.0.0.5:50052"});

    EXPECT_TRUE(provider.deregister({"order-service", "10.0.0.5", 50052}));
    EXPECT_TRUE(consumer.discover("order-service").empty());
}

TEST_F(StoreFixture, DaemonGoneMeansUnavailable) {
    auto store = connect();
    server->stop();
    EXPECT_THROW(store->get_prefix("/"), registry::StoreUnavailableError);
}

TEST(StoreServerTest, BadRequests) {
    StoreServer server(LOOPBACK, std::make_shared<registry::MemoryKvStore>());
    EXPECT_EQ(server.handle(store::KV_PUT, {"k"})[0], store::ERROR);
    EXPECT_EQ(server.handle(store::LEASE_GRANT, {"abc"})[0], store::ERROR);
    EXPECT_EQ(server.handle("kv.watch", {"/"})[0], store::ERROR);
    EXPECT_EQ(server.handle(store::KV_PUT, {"k", "v", "77"}), (client::Frames{store::LEASE_NOT_FOUND, "77"}));
}

TEST(StoreServerTest, BackingStoreOutageIsUnavailable) {
    auto backing = std::make_shared<registry::MemoryKvStore>();
    StoreServer server(LOOPBACK, backing);
    backing->close();

    auto reply = server.handle(store::KV_RANGE, {"/"});
    ASSERT_FALSE(reply.empty());
    EXPECT_EQ(reply[0], store::UNAVAILABLE);
    EXPECT_EQ(server.handle(store::LEASE_KEEPALIVE, {"1"})[0], store::UNAVAILABLE);
}

TEST_F(StoreFixture, BackingStoreOutageReachesClientAsUnavailable) {
    auto store = connect();
    registry::RegistryClient discovery(store);
    backing->close();

    EXPECT_THROW(store->keep_alive(1), registry::StoreUnavailableError);
    EXPECT_THROW(store->grant_lease(30s), registry::StoreUnavailableError);
    EXPECT_THROW(discovery.discover("order-service"), registry::StoreUnavailableError);
}

TEST(StoreFactoryTest, UnreachableStore) {
    config::RegistryConfig cfg;
    cfg.endpoints = {"tcp://" + DEAD_ADDRESS};
    cfg.dial_timeout = 1s;
    EXPECT_THROW(open_store(cfg), registry::StoreUnavailableError);
}

TEST(StoreFactoryTest, MemoryEndpoint) {
    config::RegistryConfig cfg;
    cfg.endpoints = {MEMORY_ENDPOINT};
    auto store = open_store(cfg);
    EXPECT_NE(std::dynamic_pointer_cast<registry::MemoryKvStore>(store), nullptr);
}

TEST_F(StoreFixture, OrderRequestEndToEnd) {
    // Order service side
    ActorSystem system("order-service");
    auto orders = system.spawn<order::OrderActor>("order-actor", 10ms);
    auto book = system.spawn<order::OrderBookActor>("order-book");
    auto notifications = system.spawn<order::NotificationActor>("notification-actor");
    FrameServer rpc(LOOPBACK, order::OrderRpcHandler(system, orders, book, notifications, 2s));
    rpc.start();

    registry::RegistryClient provider(connect());
    registry::ServiceInstance self{"order-service", "127.0.0.1", port_of(rpc.endpoint())};
    provider.register_instance(self);

    // Gateway side
    registry::RegistryClient discovery(connect());
    client::ConnectionManager conns({{"order-service", DEAD_ADDRESS}}, &discovery,
                                    std::make_shared<ZmqChannelFactory>(), 1s);
    conns.connect();
    EXPECT_EQ(conns.resolved_address("order-service"), self.address());

    order::OrderClient gateway(conns.channel("order-service"), 2s);
    auto created = gateway.create_order("user-123", {{"prod-1", "Product 1", 2, 99.99}});
    EXPECT_EQ(created.status, "created");
    EXPECT_EQ(created.message, "Order created successfully");

    auto tracked = gateway.track_order("user-123", {});
    EXPECT_EQ(gateway.lookup_order(tracked.order_id).status, "pending");

    conns.close();
    provider.deregister(self);
    rpc.stop();
    system.shutdown();
}

/*
 * Tests for OrderRpcHandler and OrderClient
 */

#include <gtest/gtest.h>
#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include "microshop/act/ActorSystem.hpp"
#include "microshop/order/OrderRpc.hpp"

using namespace microshop;
using namespace microshop::order;
using namespace std::chrono_literals;

namespace {

/// Channel that hands each call straight to a function.
class LoopbackChannel : public client::Channel {
public:
    using Fn = std::function<client::Frames(const std::string&, const client::Frames&)>;

    explicit LoopbackChannel(Fn fn) : fn_(std::move(fn)) {}

    client::Frames call(const std::string& method, const client::Frames& args,
                        std::chrono::milliseconds) override {
        return fn_(method, args);
    }

    void close() override {}

    const std::string& address() const override { return address_; }

private:
    Fn fn_;
    std::string address_ = "loopback";
};

class OrderRpcTest : public ::testing::Test {
protected:
    void SetUp() override {
        orders = system.spawn<OrderActor>("order-actor", 10ms);
        book = system.spawn<OrderBookActor>("order-book");
        notifications = system.spawn<NotificationActor>("notification-actor");
    }

    OrderRpcHandler handler(std::chrono::milliseconds timeout = 1s) {
        return OrderRpcHandler(system, orders, book, notifications, timeout);
    }

    OrderClient make_client(std::chrono::milliseconds timeout = 1s) {
        return OrderClient(std::make_shared<LoopbackChannel>(handler(timeout)), 1s);
    }

    ActorSystem system;
    ActorRef<OrderActor> orders;
    ActorRef<OrderBookActor> book;
    ActorRef<NotificationActor> notifications;
};

const std::vector<OrderItem> ITEMS{{"prod-1", "Product 1", 2, 99.99}, {"prod-2", "Product 2", 1, 5.5}};

} // namespace

TEST(OrderItemsTest, EncodeDecode) {
    client::Frames frames{"user-1"};
    append_items(frames, ITEMS);
    ASSERT_EQ(frames.size(), 9u);

    auto items = parse_items(frames, 1);
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0].product_name, "Product 1");
    EXPECT_EQ(items[0].quantity, 2);
    EXPECT_DOUBLE_EQ(items[0].price, 99.99);
    EXPECT_DOUBLE_EQ(items[1].price, 5.5);
}

TEST(OrderItemsTest, RejectsShortOrBadItems) {
    EXPECT_THROW(parse_items({"u", "p", "name", "2"}, 1), std::invalid_argument);
    EXPECT_THROW(parse_items({"u", "p", "name", "two", "1.0"}, 1), std::invalid_argument);
    EXPECT_TRUE(parse_items({"u"}, 1).empty());
}

TEST_F(OrderRpcTest, CreateOrder) {
    auto reply = handler()(METHOD_CREATE, {"user-123", "prod-1", "Product 1", "2", "99.99"});
    ASSERT_EQ(reply.size(), 4u);
    EXPECT_EQ(reply[0], "ok");
    EXPECT_EQ(reply[1].rfind("ORD-", 0), 0u);
    EXPECT_EQ(reply[2], "created");
    EXPECT_EQ(reply[3], "Order created successfully");
}

TEST_F(OrderRpcTest, StatusAndNotify) {
    auto h = handler();
    EXPECT_EQ(h(METHOD_STATUS, {"ORD-1"}), (client::Frames{"ok", "ORD-1", "processing"}));
    EXPECT_EQ(h(METHOD_NOTIFY, {"bob", "sms", "hi"}),
              (client::Frames{"ok", "1", "Notification sent successfully"}));
}

TEST_F(OrderRpcTest, BadRequestsAreErrors) {
    auto h = handler();
    EXPECT_EQ(h("order.cancel", {})[0], "error");
    EXPECT_EQ(h(METHOD_CREATE, {})[0], "error");
    EXPECT_EQ(h(METHOD_STATUS, {})[0], "error");
    EXPECT_EQ(h(METHOD_CREATE, {"u", "p", "name", "x", "1"})[0], "error");
    EXPECT_EQ(h(METHOD_NOTIFY, {"only-one"})[0], "error");
}

TEST_F(OrderRpcTest, SlowActorIsTimeout) {
    auto reply = handler(1ms)(METHOD_CREATE, {"u"});
    ASSERT_EQ(reply.size(), 2u);
    EXPECT_EQ(reply[0], "timeout");
}

TEST_F(OrderRpcTest, StoppedActorIsError) {
    system.stop(book.id());
    system.await_stopped(book.id(), 2s);
    EXPECT_EQ(handler()(METHOD_LOOKUP, {"ORD-1"})[0], "error");
}

TEST_F(OrderRpcTest, ClientTracksAndLooksUp) {
    auto c = make_client();
    auto created = c.track_order("user-9", ITEMS);
    EXPECT_EQ(created.status, "pending");

    auto status = c.lookup_order(created.order_id);
    EXPECT_EQ(status.order_id, created.order_id);
    EXPECT_EQ(status.status, "pending");

    EXPECT_EQ(c.lookup_order("ORD-0").status, "not found");
}

TEST_F(OrderRpcTest, ClientCreateStatusNotify) {
    auto c = make_client();
    EXPECT_EQ(c.create_order("user-123", ITEMS).status, "created");
    EXPECT_EQ(c.order_status("ORD-5").status, "processing");

    auto n = c.send_notification("alice", "email", "hello");
    EXPECT_TRUE(n.success);
}

TEST_F(OrderRpcTest, ClientMapsTimeoutReply) {
    auto c = make_client(1ms);
    EXPECT_THROW(c.create_order("u", ITEMS), UpstreamTimeoutError);
}

TEST(OrderClientTest, ChannelTimeoutIsUpstreamTimeout) {
    auto ch = std::make_shared<LoopbackChannel>([](const std::string& method, const client::Frames&) -> client::Frames {
        throw client::ChannelTimeoutError(method);
    });
    OrderClient c(ch, 10ms);
    EXPECT_THROW(c.order_status("ORD-1"), UpstreamTimeoutError);
}

TEST(OrderClientTest, ErrorAndMalformedReplies) {
    auto error = std::make_shared<LoopbackChannel>([](const std::string&, const client::Frames&) {
        return client::Frames{"error", "database on fire"};
    });
    try {
        OrderClient(error, 10ms).order_status("ORD-1");
        FAIL() << "expected UpstreamError";
    } catch (const UpstreamTimeoutError&) {
        FAIL() << "error reply is not a timeout";
    } catch (const UpstreamError& e) {
        EXPECT_NE(std::string(e.what()).find("database on fire"), std::string::npos);
    }

    auto short_reply = std::make_shared<LoopbackChannel>([](const std::string&, const client::Frames&) {
        return client::Frames{"ok"};
    });
    EXPECT_THROW(OrderClient(short_reply, 10ms).order_status("ORD-1"), UpstreamError);
}

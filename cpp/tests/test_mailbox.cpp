/*
 * Tests for Mailbox
 */

#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>
#include "microshop/Mailbox.hpp"

using namespace microshop;

TEST(MailboxTest, BasicPushPop) {
    Mailbox<int> q;
    EXPECT_TRUE(q.push(1));
    EXPECT_TRUE(q.push(2));

    auto [val1, last1] = q.pop();
    EXPECT_EQ(val1, 1);
    EXPECT_FALSE(last1);

    auto [val2, last2] = q.pop();
    EXPECT_EQ(val2, 2);
    EXPECT_TRUE(last2);  // Last item
}

TEST(MailboxTest, IsEmpty) {
    Mailbox<int> q;
    EXPECT_TRUE(q.is_empty());
    q.push(1);
    EXPECT_FALSE(q.is_empty());
}

TEST(MailboxTest, Length) {
    Mailbox<int> q;
    EXPECT_EQ(q.length(), 0u);
    q.push(1);
    EXPECT_EQ(q.length(), 1u);
    q.push(2);
    EXPECT_EQ(q.length(), 2u);
}

TEST(MailboxTest, Unbounded) {
    Mailbox<int> q;
    for (int i = 0; i < 10000; i++) {
        q.push(i);
    }
    EXPECT_EQ(q.length(), 10000u);

    for (int i = 0; i < 10000; i++) {
        auto [val, last] = q.pop();
        EXPECT_EQ(val, i);
    }
    EXPECT_TRUE(q.is_empty());
}

TEST(MailboxTest, SealAppendsTrailingAndRejectsPush) {
    Mailbox<std::string> q;
    q.push("a");
    EXPECT_TRUE(q.seal({"stopping", "stopped"}));
    EXPECT_TRUE(q.is_sealed());

    EXPECT_FALSE(q.push("b"));  // after seal
    EXPECT_EQ(q.length(), 3u);

    EXPECT_EQ(q.pop().first, "a");
    EXPECT_EQ(q.pop().first, "stopping");
    auto [val, last] = q.pop();
    EXPECT_EQ(val, "stopped");
    EXPECT_TRUE(last);
}

TEST(MailboxTest, SealTwice) {
    Mailbox<int> q;
    EXPECT_TRUE(q.seal({1}));
    EXPECT_FALSE(q.seal({2}));
    EXPECT_EQ(q.length(), 1u);
}

TEST(MailboxTest, PopBlocksUntilPush) {
    Mailbox<int> q;
    int got = -1;
    std::thread consumer([&q, &got]() {
        got = q.pop().first;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    q.push(7);
    consumer.join();
    EXPECT_EQ(got, 7);
}

TEST(MailboxTest, ThreadSafety) {
    Mailbox<int> q;
    const int count = 100;

    // Producer thread
    std::thread producer([&q, count]() {
        for (int i = 0; i < count; i++) {
            q.push(i);
        }
    });

    // Consumer thread
    std::thread consumer([&q, count]() {
        int received = 0;
        while (received < count) {
            auto [val, last] = q.pop();
            EXPECT_EQ(val, received);
            received++;
        }
    });

    producer.join();
    consumer.join();
}

TEST(MailboxTest, PerProducerOrderWithManyProducers) {
    Mailbox<std::pair<int, int>> q;
    const int producers = 4;
    const int per_producer = 250;

    std::vector<std::thread> threads;
    for (int p = 0; p < producers; p++) {
        threads.emplace_back([&q, p, per_producer]() {
            for (int i = 0; i < per_producer; i++) {
                q.push({p, i});
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    std::vector<int> next(producers, 0);
    for (int n = 0; n < producers * per_producer; n++) {
        auto [item, last] = q.pop();
        EXPECT_EQ(item.second, next[item.first]);
        next[item.first]++;
    }
}

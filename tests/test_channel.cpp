#include <gtest/gtest.h>
#include <jdkrun/core/channel.hpp>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace jdkrun;

TEST(Channel, FifoOrder) {
    Channel<int> ch;
    EXPECT_TRUE(ch.push(1));
    EXPECT_TRUE(ch.push(2));
    EXPECT_TRUE(ch.push(3));
    EXPECT_EQ(*ch.pop(), 1);
    EXPECT_EQ(*ch.pop(), 2);
    EXPECT_EQ(*ch.pop(), 3);
}

TEST(Channel, CloseDrainsQueuedMessagesFirst) {
    Channel<std::string> ch;
    ch.push("a"); ch.push("b");
    ch.close();
    EXPECT_TRUE(ch.closed());
    EXPECT_EQ(*ch.pop(), "a");
    EXPECT_EQ(*ch.pop(), "b");
    EXPECT_FALSE(ch.pop().has_value());
}

TEST(Channel, PushAfterCloseIsDropped) {
    Channel<int> ch;
    ch.close();
    EXPECT_FALSE(ch.push(7));
    EXPECT_FALSE(ch.pop().has_value());
}

TEST(Channel, CloseWakesBlockedConsumer) {
    Channel<int> ch;
    bool got_nothing = false;
    std::thread consumer([&]{ got_nothing = !ch.pop().has_value(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    ch.close();
    consumer.join();
    EXPECT_TRUE(got_nothing);
}

TEST(Channel, ManyProducersOneConsumer) {
    Channel<int> ch;
    std::vector<std::thread> producers;
    for (int p=0;p<4;++p) producers.emplace_back([&ch, p]{ for (int i=0;i<250;++i) ch.push(p*1000+i); });
    for (auto &t : producers) t.join();
    ch.close();
    int n = 0, last[4] = {-1,-1,-1,-1};
    while (auto v = ch.pop()) {
        int p = *v / 1000, i = *v % 1000;
        EXPECT_GT(i, last[p]); // per-producer order is kept
        last[p] = i; ++n;
    }
    EXPECT_EQ(n, 1000);
}

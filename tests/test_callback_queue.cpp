// tests/test_callback_queue.cpp
#include <gtest/gtest.h>
#include <thread>
#include <vector>

#include "manager/callback_queue.hpp"

TEST(CallbackQueue, DrainsInEnqueueOrderWithoutCoalescing)
{
    manager::CallbackQueue q;
    std::vector<int>       seen;
    q.push([&] { seen.push_back(1); });
    q.push([&] { seen.push_back(2); });
    q.push([&] { seen.push_back(2); });  // identical payload still delivered
    EXPECT_EQ(q.pending(), 3u);

    EXPECT_TRUE(seen.empty());  // nothing runs before the drain
    EXPECT_EQ(q.drain(), 3u);
    EXPECT_EQ(seen, (std::vector<int>{1, 2, 2}));
    EXPECT_EQ(q.pending(), 0u);
    EXPECT_EQ(q.drain(), 0u);
}

TEST(CallbackQueue, PushDuringDrainWaitsForNextDrain)
{
    manager::CallbackQueue q;
    int                    runs = 0;
    q.push([&] {
        ++runs;
        q.push([&] { ++runs; });
    });
    EXPECT_EQ(q.drain(), 1u);
    EXPECT_EQ(runs, 1);
    EXPECT_EQ(q.pending(), 1u);
    EXPECT_EQ(q.drain(), 1u);
    EXPECT_EQ(runs, 2);
}

TEST(CallbackQueue, ManyProducersOneConsumer)
{
    manager::CallbackQueue   q;
    constexpr int            kThreads = 4;
    constexpr int            kEach    = 250;
    std::vector<std::thread> producers;
    std::vector<int>         per_thread(kThreads, 0);
    std::vector<int>         last(kThreads, -1);
    bool                     ordered = true;

    for (int t = 0; t < kThreads; ++t)
    {
        producers.emplace_back([&, t] {
            for (int i = 0; i < kEach; ++i)
                q.push([&, t, i] {
                    // per-producer order survives interleaving
                    if (i != last[t] + 1)
                        ordered = false;
                    last[t] = i;
                    ++per_thread[t];
                });
        });
    }
    for (auto &th : producers)
        th.join();

    EXPECT_EQ(q.drain(), static_cast<std::size_t>(kThreads * kEach));
    EXPECT_TRUE(ordered);
    for (int t = 0; t < kThreads; ++t)
        EXPECT_EQ(per_thread[t], kEach);
}

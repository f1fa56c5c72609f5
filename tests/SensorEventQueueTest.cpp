#include "hal/SensorEventQueue.hpp"

#include <gtest/gtest.h>

#include <thread>
#include <vector>

static SensorData reading(int id, int cid = 0) {
    return SensorData("oregon", "temp1", id, 1, "20.0", 1700000000, cid);
}

TEST(SensorEventQueueTest, DrainsInArrivalOrder) {
    SensorEventQueue queue;
    queue.push(reading(3));
    queue.push(reading(1));
    queue.push(reading(2));

    std::vector<int> ids;
    EXPECT_EQ(queue.drain([&](const SensorData& data) { ids.push_back(data.id()); }), 3u);
    EXPECT_EQ(ids, (std::vector<int>{3, 1, 2}));
    EXPECT_EQ(queue.size(), 0u);
}

TEST(SensorEventQueueTest, EmptyDrainDeliversNothing) {
    SensorEventQueue queue;
    int calls = 0;
    EXPECT_EQ(queue.drain([&](const SensorData&) { calls++; }), 0u);
    EXPECT_EQ(calls, 0);
}

TEST(SensorEventQueueTest, PushDuringDrainLandsInNextBatch) {
    SensorEventQueue queue;
    queue.push(reading(1));

    std::vector<int> ids;
    queue.drain([&](const SensorData& data) {
        ids.push_back(data.id());
        queue.push(reading(data.id() + 1));
    });
    EXPECT_EQ(ids, (std::vector<int>{1}));
    EXPECT_EQ(queue.size(), 1u);
}

TEST(SensorEventQueueTest, ConcurrentProducersLoseNothing) {
    SensorEventQueue queue;
    const int producers = 4;
    const int perProducer = 500;

    std::vector<std::thread> threads;
    for (int p = 0; p < producers; p++) {
        threads.emplace_back([&queue, p]() {
            for (int i = 0; i < perProducer; i++)
                queue.push(reading(p, i));
        });
    }

    std::vector<int> lastCid(producers, -1);
    bool ordered = true;
    size_t total = 0;
    auto consume = [&](const SensorData& data) {
        if (data.cid() <= lastCid[data.id()])
            ordered = false;
        lastCid[data.id()] = data.cid();
    };

    while (total < static_cast<size_t>(producers * perProducer)) {
        total += queue.drain(consume);
        std::this_thread::yield();
    }

    for (auto& thread : threads)
        thread.join();

    EXPECT_EQ(total, static_cast<size_t>(producers * perProducer));
    EXPECT_TRUE(ordered);
}

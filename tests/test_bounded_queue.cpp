#include <doctest/doctest.h>
#include "tablestream/bounded_queue.hpp"

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace tablestream;

TEST_CASE("BoundedQueue is FIFO") {
    BoundedQueue<int, 4> q;
    CHECK(q.capacity() == 4);
    for (int i = 0; i < 4; ++i) REQUIRE(q.push(i));
    CHECK(q.size() == 4);

    int v = -1;
    for (int i = 0; i < 4; ++i) {
        REQUIRE(q.pop(v));
        CHECK(v == i);
    }
    CHECK_FALSE(q.try_pop(v));
}

TEST_CASE("push blocks while full until a consumer pops") {
    BoundedQueue<int, 2> q;
    REQUIRE(q.push(1));
    REQUIRE(q.push(2));

    std::atomic<bool> pushed{false};
    std::thread producer([&] {
        q.push(3);
        pushed = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    CHECK_FALSE(pushed.load());

    int v = 0;
    REQUIRE(q.pop(v));
    CHECK(v == 1);
    producer.join();
    CHECK(pushed.load());
    CHECK(q.size() == 2);
}

TEST_CASE("close wakes blocked consumers and rejects further pushes") {
    BoundedQueue<std::string, 2> q;
    std::atomic<int> result{-1};
    std::thread consumer([&] {
        std::string s;
        result = q.pop(s) ? 1 : 0;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    q.close();
    consumer.join();
    CHECK(result.load() == 0);
    CHECK(q.closed());
    CHECK_FALSE(q.push("late"));
}

TEST_CASE("items survive a move through the queue") {
    BoundedQueue<std::vector<uint32_t>, 3> q;
    REQUIRE(q.push(std::vector<uint32_t>(1000, 7)));
    std::vector<uint32_t> out;
    REQUIRE(q.pop(out));
    CHECK(out.size() == 1000);
    CHECK(out.back() == 7);
}

TEST_CASE("many producers and consumers deliver every item once") {
    BoundedQueue<int> q;
    constexpr int PER_PRODUCER = 500;
    std::atomic<long> sum{0};
    std::atomic<int> count{0};

    std::vector<std::thread> consumers;
    for (int c = 0; c < 3; ++c) {
        consumers.emplace_back([&] {
            int v = 0;
            while (q.pop(v)) {
                if (v < 0) return;   // sentinel
                sum += v;
                ++count;
            }
        });
    }
    std::vector<std::thread> producers;
    for (int p = 0; p < 2; ++p) {
        producers.emplace_back([&] {
            for (int i = 1; i <= PER_PRODUCER; ++i) q.push(i);
        });
    }
    for (auto& t : producers) t.join();
    for (int c = 0; c < 3; ++c) q.push(-1);
    for (auto& t : consumers) t.join();

    CHECK(count.load() == 2 * PER_PRODUCER);
    CHECK(sum.load() == 2L * PER_PRODUCER * (PER_PRODUCER + 1) / 2);
}

TEST_CASE("OneShotSignal stays set") {
    OneShotSignal s;
    CHECK_FALSE(s.is_set());
    CHECK_FALSE(s.wait_for(std::chrono::milliseconds(5)));

    std::thread t([&] { s.set(); });
    s.wait();
    t.join();
    CHECK(s.is_set());
    CHECK(s.wait_for(std::chrono::milliseconds(0)));
}

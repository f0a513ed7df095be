#include <doctest/doctest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include <rangeloader/bounded_queue.hpp>

using namespace rangeloader;
using namespace std::chrono_literals;

TEST_SUITE("bounded_queue")
{
    TEST_CASE("fifo_order")
    {
        BoundedQueue<int> queue(3);
        CHECK_EQ(queue.push(1), QueueStatus::kOK);
        CHECK_EQ(queue.push(2), QueueStatus::kOK);
        CHECK_EQ(queue.push(3), QueueStatus::kOK);
        CHECK_EQ(queue.size(), 3);

        int value = 0;
        REQUIRE(queue.pop(value));
        CHECK_EQ(value, 1);
        REQUIRE(queue.pop(value));
        CHECK_EQ(value, 2);
    }

    TEST_CASE("push_times_out_when_full")
    {
        BoundedQueue<int> queue(1);
        REQUIRE_EQ(queue.push(1), QueueStatus::kOK);

        const auto start = clock_type::now();
        auto status = queue.push_until(2, deadline_after(50ms));
        CHECK_EQ(status, QueueStatus::kTIMEOUT);
        CHECK_GE(clock_type::now() - start, 40ms);
        CHECK_EQ(queue.size(), 1);
    }

    TEST_CASE("expired_deadline_with_room")
    {
        BoundedQueue<int> queue(2);
        deadline_t past = clock_type::now() - 1s;
        // room is available, the item goes in
        CHECK_EQ(queue.push_until(1, past), QueueStatus::kOK);
    }

    TEST_CASE("close_drains_then_stops")
    {
        BoundedQueue<int> queue(4);
        queue.push(1);
        queue.push(2);
        queue.close();

        CHECK(queue.closed());
        CHECK_EQ(queue.push(3), QueueStatus::kCLOSED);

        int value = 0;
        CHECK(queue.pop(value));
        CHECK_EQ(value, 1);
        CHECK(queue.pop(value));
        CHECK_EQ(value, 2);
        CHECK_FALSE(queue.pop(value));
    }

    TEST_CASE("close_wakes_blocked_producer")
    {
        BoundedQueue<int> queue(1);
        queue.push(1);

        std::thread closer(
            [&]
            {
                std::this_thread::sleep_for(20ms);
                queue.close();
            });
        CHECK_EQ(queue.push(2), QueueStatus::kCLOSED);
        closer.join();
    }

    TEST_CASE("producer_consumers")
    {
        BoundedQueue<int> queue(2);
        std::atomic<int> sum{ 0 };
        std::atomic<int> popped{ 0 };

        std::vector<std::thread> consumers;
        for (int i = 0; i < 4; ++i)
        {
            consumers.emplace_back(
                [&]
                {
                    int value = 0;
                    while (queue.pop(value))
                    {
                        sum += value;
                        ++popped;
                    }
                });
        }

        for (int i = 1; i <= 100; ++i)
        {
            REQUIRE_EQ(queue.push(i), QueueStatus::kOK);
        }
        queue.close();
        for (auto& t : consumers)
        {
            t.join();
        }

        CHECK_EQ(popped.load(), 100);
        CHECK_EQ(sum.load(), 5050);
    }

    TEST_CASE("zero_capacity")
    {
        CHECK_THROWS_AS(BoundedQueue<int>(0), std::invalid_argument);
    }
}

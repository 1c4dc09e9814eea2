#include <gtest/gtest.h>
#include "gurgeh/engine/request_queue.hpp"
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace gurgeh;
using namespace gurgeh::engine;

namespace {

ExchangeRequest make_request(const std::string& text) {
    return ExchangeRequest({}, Message::user(text));
}

} // namespace

class RequestQueueTest : public ::testing::Test {
protected:
    RequestQueue queue;
};

// ============================================================================
// Basic Operations
// ============================================================================

TEST_F(RequestQueueTest, PushPopPreservesOrder) {
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(queue.push(make_request("Move " + std::to_string(i))).has_value());
    }
    EXPECT_EQ(queue.size(), 3u);

    for (int i = 0; i < 3; ++i) {
        auto popped = queue.pop();
        ASSERT_TRUE(popped.has_value());
        EXPECT_EQ(popped->user_message.content, "Move " + std::to_string(i));
    }
    EXPECT_TRUE(queue.empty());
}

TEST_F(RequestQueueTest, RequestKeepsCancelToken) {
    auto request = make_request("x");
    auto token = request.cancelled;
    ASSERT_TRUE(queue.push(std::move(request)).has_value());

    token->store(true);
    auto popped = queue.pop();
    ASSERT_TRUE(popped.has_value());
    EXPECT_TRUE(popped->cancelled->load());
}

// ============================================================================
// Capacity
// ============================================================================

TEST_F(RequestQueueTest, BoundedQueueRejectsWhenFull) {
    RequestQueue bounded(2);
    EXPECT_TRUE(bounded.push(make_request("1")).has_value());
    EXPECT_TRUE(bounded.push(make_request("2")).has_value());

    auto full = bounded.push(make_request("3"));
    ASSERT_FALSE(full.has_value());
    EXPECT_EQ(full.error().code, ErrorCode::QueueFull);

    ASSERT_TRUE(bounded.pop_for(std::chrono::milliseconds(10)).has_value());
    EXPECT_TRUE(bounded.push(make_request("3")).has_value());
    EXPECT_EQ(bounded.size(), 2u);
}

// ============================================================================
// Blocking and timeouts
// ============================================================================

TEST_F(RequestQueueTest, BlockingPopWakesOnPush) {
    std::atomic<bool> popped{false};
    std::thread consumer([this, &popped]() {
        if (queue.pop().has_value()) {
            popped = true;
        }
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    EXPECT_FALSE(popped.load());
    ASSERT_TRUE(queue.push(make_request("Unblock")).has_value());

    consumer.join();
    EXPECT_TRUE(popped.load());
}

TEST_F(RequestQueueTest, PopForTimesOut) {
    auto start = std::chrono::steady_clock::now();
    auto request = queue.pop_for(std::chrono::milliseconds(50));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(request.has_value());
    EXPECT_GE(elapsed, std::chrono::milliseconds(50));
}

// ============================================================================
// Shutdown
// ============================================================================

TEST_F(RequestQueueTest, ShutdownRefusesPush) {
    queue.shutdown();
    auto pushed = queue.push(make_request("late"));
    ASSERT_FALSE(pushed.has_value());
    EXPECT_EQ(pushed.error().code, ErrorCode::AgentNotRunning);
    EXPECT_TRUE(queue.is_shutdown());
}

TEST_F(RequestQueueTest, ShutdownUnblocksAllConsumers) {
    std::atomic<int> unblocked{0};
    std::vector<std::thread> consumers;
    for (int i = 0; i < 4; ++i) {
        consumers.emplace_back([this, &unblocked]() {
            if (!queue.pop().has_value()) {
                ++unblocked;
            }
        });
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    queue.shutdown();
    for (auto& t : consumers) t.join();

    EXPECT_EQ(unblocked.load(), 4);
}

TEST_F(RequestQueueTest, PendingRequestsSurviveShutdownUntilDrained) {
    ASSERT_TRUE(queue.push(make_request("a")).has_value());
    ASSERT_TRUE(queue.push(make_request("b")).has_value());
    ASSERT_TRUE(queue.push(make_request("c")).has_value());
    queue.shutdown();

    auto first = queue.pop();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->user_message.content, "a");

    auto rest = queue.drain();
    ASSERT_EQ(rest.size(), 2u);
    EXPECT_EQ(rest[0].user_message.content, "b");
    EXPECT_EQ(rest[1].user_message.content, "c");
    EXPECT_FALSE(queue.pop().has_value());
}

TEST_F(RequestQueueTest, ConcurrentProducersAndConsumers) {
    constexpr int producers = 4;
    constexpr int per_producer = 50;
    constexpr int total = producers * per_producer;
    std::atomic<int> consumed{0};

    std::vector<std::thread> threads;
    for (int p = 0; p < producers; ++p) {
        threads.emplace_back([this, p]() {
            for (int i = 0; i < per_producer; ++i) {
                EXPECT_TRUE(queue.push(make_request(std::to_string(p) + ":" + std::to_string(i))).has_value());
            }
        });
    }
    for (int c = 0; c < 2; ++c) {
        threads.emplace_back([this, &consumed]() {
            while (consumed.load() < total) {
                if (queue.pop_for(std::chrono::milliseconds(20)).has_value()) {
                    ++consumed;
                }
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(consumed.load(), total);
    EXPECT_TRUE(queue.empty());
}

/**
 * @file result_box_test.cpp
 * @brief Unit tests for ResultBox and Outcome
 */

#include <gtest/gtest.h>
#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "tasklane/core/result_box.hpp"

using namespace tasklane;
using namespace std::chrono_literals;

class ResultBoxTest : public ::testing::Test {
protected:
    ResultBox<int> box;
};

TEST_F(ResultBoxTest, PublishThenAwait) {
    box.reserve("a");
    EXPECT_TRUE(box.publish("a", Outcome<int>::ok(7)));

    auto outcome = box.await("a");
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome.value(), 7);
}

TEST_F(ResultBoxTest, AwaitBlocksUntilPublished) {
    box.reserve("a");

    std::thread publisher([this]() {
        std::this_thread::sleep_for(50ms);
        box.publish("a", Outcome<int>::ok(11));
    });

    auto outcome = box.await("a");
    publisher.join();
    EXPECT_EQ(outcome.value(), 11);
}

TEST_F(ResultBoxTest, ConsumedOnRead) {
    box.reserve("a");
    box.publish("a", Outcome<int>::ok(1));
    box.await("a");

    EXPECT_FALSE(box.contains("a"));
    EXPECT_THROW(box.await("a"), UnknownTaskError);
}

TEST_F(ResultBoxTest, UnknownIdThrows) {
    EXPECT_THROW(box.await("missing"), UnknownTaskError);
    EXPECT_THROW(box.try_take("missing"), UnknownTaskError);
    EXPECT_FALSE(box.publish("missing", Outcome<int>::ok(0)));
}

TEST_F(ResultBoxTest, DuplicateReserveRejected) {
    box.reserve("a");
    EXPECT_THROW(box.reserve("a"), DuplicateTaskError);

    // Reusable once consumed
    box.publish("a", Outcome<int>::ok(1));
    box.await("a");
    EXPECT_NO_THROW(box.reserve("a"));
}

TEST_F(ResultBoxTest, PublishIsSingleShot) {
    box.reserve("a");
    EXPECT_TRUE(box.publish("a", Outcome<int>::ok(1)));
    EXPECT_FALSE(box.publish("a", Outcome<int>::ok(2)));
    EXPECT_EQ(box.await("a").value(), 1);
}

TEST_F(ResultBoxTest, TimeoutKeepsResult) {
    box.reserve("a");
    EXPECT_THROW(box.await("a", 10ms), TimeoutError);
    EXPECT_TRUE(box.contains("a"));

    box.publish("a", Outcome<int>::ok(5));
    EXPECT_EQ(box.await("a", 1s).value(), 5);
}

TEST_F(ResultBoxTest, TryTake) {
    box.reserve("a");
    EXPECT_FALSE(box.try_take("a").has_value());

    box.publish("a", Outcome<int>::ok(3));
    auto outcome = box.try_take("a");
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->value(), 3);
    EXPECT_FALSE(box.contains("a"));
}

TEST_F(ResultBoxTest, ErrorOutcomeCarriesException) {
    box.reserve("a");
    box.publish("a", Outcome<int>::err(std::make_exception_ptr(std::invalid_argument("boom"))));

    auto outcome = box.await("a");
    ASSERT_TRUE(outcome.has_error());
    EXPECT_TRUE(outcome.holds_error<std::invalid_argument>());
    EXPECT_FALSE(outcome.holds_error<std::out_of_range>());
    EXPECT_EQ(describe(outcome.error()), "boom");
}

TEST_F(ResultBoxTest, DiscardWakesWaiters) {
    box.reserve("a");

    std::thread waiter([this]() {
        EXPECT_THROW(box.await("a"), UnknownTaskError);
    });

    std::this_thread::sleep_for(20ms);
    EXPECT_TRUE(box.discard("a"));
    waiter.join();

    // A late publish is dropped
    EXPECT_FALSE(box.publish("a", Outcome<int>::ok(1)));
    EXPECT_EQ(box.size(), 0u);
}

TEST_F(ResultBoxTest, ConcurrentWaitersOnSameIdAllReceive) {
    box.reserve("shared");
    std::atomic<int> received{0};

    std::vector<std::thread> waiters;
    for (int i = 0; i < 3; i++) {
        waiters.emplace_back([&]() {
            try {
                if (box.await("shared").value() == 9) {
                    received.fetch_add(1);
                }
            } catch (const UnknownTaskError&) {
                ADD_FAILURE() << "waiter arrived after the result was consumed";
            }
        });
    }

    std::this_thread::sleep_for(50ms);
    box.publish("shared", Outcome<int>::ok(9));
    for (auto& t : waiters) {
        t.join();
    }

    EXPECT_EQ(received.load(), 3);
    EXPECT_FALSE(box.contains("shared"));
}

TEST_F(ResultBoxTest, WaitersOnDifferentIds) {
    constexpr int n = 16;
    for (int i = 0; i < n; i++) {
        box.reserve("t" + std::to_string(i));
    }

    std::vector<int> got(n, -1);
    std::vector<std::thread> waiters;
    for (int i = 0; i < n; i++) {
        waiters.emplace_back([&, i]() { got[i] = box.await("t" + std::to_string(i)).value(); });
    }

    for (int i = n - 1; i >= 0; i--) {
        box.publish("t" + std::to_string(i), Outcome<int>::ok(i * 10));
    }
    for (auto& t : waiters) {
        t.join();
    }

    for (int i = 0; i < n; i++) {
        EXPECT_EQ(got[i], i * 10);
    }
}

TEST_F(ResultBoxTest, PublishListenerSeesError) {
    std::exception_ptr seen;
    bool called = false;
    box.reserve("a", [&](const std::exception_ptr& error) {
        called = true;
        seen = error;
    });

    box.publish("a", Outcome<int>::err(std::make_exception_ptr(std::runtime_error("x"))));
    EXPECT_TRUE(called);
    EXPECT_TRUE(seen != nullptr);
}

TEST(ResultBoxTtlTest, UnclaimedResultsEvicted) {
    std::vector<TaskId> evicted;
    ResultBox<int> box(20ms, [&](const TaskId& id) { evicted.push_back(id); });

    box.reserve("old");
    box.publish("old", Outcome<int>::ok(1));
    box.reserve("pending");

    std::this_thread::sleep_for(40ms);
    EXPECT_EQ(box.evict_expired(), 1u);

    ASSERT_EQ(evicted.size(), 1u);
    EXPECT_EQ(evicted[0], "old");
    EXPECT_FALSE(box.contains("old"));
    // Unpublished slots are never evicted
    EXPECT_TRUE(box.contains("pending"));
}

TEST(ResultBoxTtlTest, ZeroTtlKeepsResults) {
    ResultBox<int> box;
    box.reserve("a");
    box.publish("a", Outcome<int>::ok(1));
    std::this_thread::sleep_for(5ms);
    EXPECT_EQ(box.evict_expired(), 0u);
    EXPECT_TRUE(box.contains("a"));
}

TEST(ResultBoxMoveOnlyTest, MoveOnlyValues) {
    ResultBox<std::unique_ptr<int>> box;
    box.reserve("p");
    box.publish("p", Outcome<std::unique_ptr<int>>::ok(std::make_unique<int>(4)));

    auto outcome = box.await("p");
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(*outcome.value(), 4);
}

TEST(ResultBoxTtlTest, PinnedResultsNeverEvicted) {
    ResultBox<int> box(20ms);
    box.reserve("pinned", {}, true);
    box.reserve("loose");
    box.publish("pinned", Outcome<int>::ok(1));
    box.publish("loose", Outcome<int>::ok(2));

    std::this_thread::sleep_for(40ms);
    EXPECT_EQ(box.evict_expired(), 1u);
    EXPECT_FALSE(box.contains("loose"));
    EXPECT_EQ(box.await("pinned").value(), 1);
}

/**
 * @file engine_test.cpp
 * @brief Unit tests for TaskEngine lifecycle, submission and retrieval
 */

#include <gtest/gtest.h>
#include <any>
#include <atomic>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "tasklane/tasklane.hpp"

using namespace tasklane;
using namespace std::chrono_literals;

namespace {

// Blocks the task that runs it until release() is called
class Gate {
public:
    Gate() : future_(promise_.get_future().share()) {}

    int pass() {
        started_.store(true);
        future_.wait();
        return 0;
    }

    void release() { promise_.set_value(); }

    void wait_started() const {
        while (!started_.load()) {
            std::this_thread::sleep_for(1ms);
        }
    }

private:
    std::promise<void> promise_;
    std::shared_future<void> future_;
    std::atomic<bool> started_{false};
};

EngineConfig quiet_config(std::uint32_t workers) {
    EngineConfig config;
    config.num_workers = workers;
    return config;
}

} // namespace

class EngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::set_level(LogLevel::Error);
    }
};

TEST_F(EngineTest, LifecycleStates) {
    TaskEngine<int> engine(quiet_config(2));
    EXPECT_EQ(engine.state(), EngineState::Created);
    EXPECT_EQ(engine.num_workers(), 0u);

    engine.start();
    EXPECT_EQ(engine.state(), EngineState::Running);
    EXPECT_EQ(engine.num_workers(), 2u);

    engine.stop();
    EXPECT_EQ(engine.state(), EngineState::Stopped);
}

TEST_F(EngineTest, StartTwiceThrows) {
    TaskEngine<int> engine;
    engine.start(1);
    EXPECT_THROW(engine.start(1), InvalidStateError);
}

TEST_F(EngineTest, StartAfterStopThrows) {
    TaskEngine<int> engine;
    engine.stop();
    EXPECT_EQ(engine.state(), EngineState::Stopped);
    EXPECT_THROW(engine.start(1), InvalidStateError);
}

TEST_F(EngineTest, ZeroWorkersMeansHostConcurrency) {
    TaskEngine<int> engine;
    engine.start(0);
    EXPECT_GE(engine.num_workers(), 1u);
}

TEST_F(EngineTest, SubmitBeforeStartThrows) {
    TaskEngine<int> engine;
    EXPECT_THROW(engine.submit("a", [] { return 1; }), InvalidStateError);
}

TEST_F(EngineTest, SubmitWithArguments) {
    TaskEngine<int> engine(quiet_config(2));
    engine.start();

    engine.submit("sum", [](int a, int b, int c) { return a + b + c; }, 1, 2, 3);
    std::string text = "hello";
    engine.submit("len", [](const std::string& s) { return static_cast<int>(s.size()); }, text);

    EXPECT_EQ(engine.get_result("sum"), 6);
    EXPECT_EQ(engine.get_result("len"), 5);
}

TEST_F(EngineTest, ArgumentsAreCopiedAtSubmission) {
    TaskEngine<int> engine(quiet_config(1));
    engine.start();

    Gate gate;
    engine.submit("block", [&gate] { return gate.pass(); });

    int value = 10;
    engine.submit("copy", [](int v) { return v; }, value);
    value = 99;

    gate.release();
    EXPECT_EQ(engine.get_result("copy"), 10);
}

TEST_F(EngineTest, DuplicateIdRejected) {
    TaskEngine<int> engine(quiet_config(1));
    engine.start();

    engine.submit("dup", [] { return 1; });
    EXPECT_THROW(engine.submit("dup", [] { return 2; }), DuplicateTaskError);
    EXPECT_EQ(engine.get_result("dup"), 1);

    // Consumed ids may be reused
    engine.submit("dup", [] { return 3; });
    EXPECT_EQ(engine.get_result("dup"), 3);
}

TEST_F(EngineTest, ResultConsumedOnRead) {
    TaskEngine<int> engine(quiet_config(1));
    engine.start();

    engine.submit("once", [] { return 1; });
    EXPECT_EQ(engine.get_result("once"), 1);
    EXPECT_THROW(engine.get_result("once"), UnknownTaskError);
    EXPECT_THROW(engine.get_result("never-submitted"), UnknownTaskError);
}

TEST_F(EngineTest, TaskErrorCarriesOriginal) {
    TaskEngine<int> engine(quiet_config(1));
    engine.start();

    engine.submit("bad", []() -> int { throw std::invalid_argument("boom"); });

    try {
        engine.get_result("bad");
        FAIL() << "expected TaskError";
    } catch (const TaskError& e) {
        EXPECT_EQ(e.id(), "bad");
        EXPECT_NE(std::string(e.what()).find("boom"), std::string::npos);
        EXPECT_THROW(e.rethrow_original(), std::invalid_argument);
    }
}

TEST_F(EngineTest, NonStandardExceptionCaptured) {
    TaskEngine<int> engine(quiet_config(1));
    engine.start();

    engine.submit("odd", []() -> int { throw 42; });
    EXPECT_THROW(engine.get_result("odd"), TaskError);

    // Worker survived
    engine.submit("after", [] { return 7; });
    EXPECT_EQ(engine.get_result("after"), 7);
}

TEST_F(EngineTest, TryGetResult) {
    TaskEngine<int> engine(quiet_config(1));
    engine.start();

    Gate gate;
    engine.submit("slow", [&gate] { return gate.pass() + 5; });
    gate.wait_started();

    EXPECT_FALSE(engine.try_get_result("slow").has_value());
    gate.release();

    auto value = engine.get_result("slow", 2s);
    EXPECT_EQ(value, 5);
}

TEST_F(EngineTest, QueueFullRejectsSubmit) {
    EngineConfig config = quiet_config(1);
    config.queue_capacity = 2;
    TaskEngine<int> engine(config);
    engine.start();

    Gate gate;
    engine.submit("block", [&gate] { return gate.pass(); });
    gate.wait_started();

    engine.submit("q1", [] { return 1; });
    engine.submit("q2", [] { return 2; });
    EXPECT_THROW(engine.submit("q3", [] { return 3; }), QueueFullError);

    // The rejected id left no trace
    EXPECT_THROW(engine.get_result("q3"), UnknownTaskError);
    EXPECT_EQ(engine.metrics().submissions_rejected().value(), 1u);

    gate.release();
    EXPECT_EQ(engine.get_result("q1"), 1);
    EXPECT_EQ(engine.get_result("q2"), 2);
}

TEST_F(EngineTest, StopWithoutDrainCancelsQueued) {
    TaskEngine<int> engine(quiet_config(1));
    engine.start();

    Gate gate;
    engine.submit("running", [&gate] { return gate.pass() + 1; });
    gate.wait_started();

    for (int i = 0; i < 3; i++) {
        engine.submit("queued-" + std::to_string(i), [] { return 0; });
    }

    std::thread releaser([&gate] {
        std::this_thread::sleep_for(50ms);
        gate.release();
    });
    auto cancelled = engine.stop(false);
    releaser.join();

    EXPECT_EQ(cancelled, 3u);
    EXPECT_EQ(engine.state(), EngineState::Stopped);

    // In-flight task was allowed to finish
    EXPECT_EQ(engine.get_result("running"), 1);
    for (int i = 0; i < 3; i++) {
        EXPECT_THROW(engine.get_result("queued-" + std::to_string(i)), CancelledError);
    }
    EXPECT_EQ(engine.metrics().tasks_cancelled().value(), 3u);
}

TEST_F(EngineTest, StopWithDrainRunsQueued) {
    TaskEngine<int> engine(quiet_config(1));
    engine.start();

    std::atomic<int> ran{0};
    for (int i = 0; i < 20; i++) {
        engine.submit("t" + std::to_string(i), [&ran] {
            std::this_thread::sleep_for(1ms);
            return ran.fetch_add(1) + 1;
        });
    }

    EXPECT_EQ(engine.stop(true), 0u);
    EXPECT_EQ(ran.load(), 20);
    for (int i = 0; i < 20; i++) {
        EXPECT_NO_THROW(engine.get_result("t" + std::to_string(i)));
    }
}

TEST_F(EngineTest, StopIsIdempotent) {
    TaskEngine<int> engine(quiet_config(2));
    engine.start();
    engine.stop();
    EXPECT_EQ(engine.stop(), 0u);
    EXPECT_EQ(engine.stop(false), 0u);
    EXPECT_EQ(engine.state(), EngineState::Stopped);
}

TEST_F(EngineTest, ConcurrentStopCalls) {
    TaskEngine<int> engine(quiet_config(2));
    engine.start();
    for (int i = 0; i < 10; i++) {
        engine.submit("t" + std::to_string(i), [] {
            std::this_thread::sleep_for(2ms);
            return 0;
        });
    }

    std::vector<std::thread> stoppers;
    for (int i = 0; i < 4; i++) {
        stoppers.emplace_back([&engine] { engine.stop(); });
    }
    for (auto& t : stoppers) {
        t.join();
    }
    EXPECT_EQ(engine.state(), EngineState::Stopped);
}

TEST_F(EngineTest, SubmitAfterStopThrows) {
    TaskEngine<int> engine(quiet_config(1));
    engine.start();
    engine.stop();
    EXPECT_THROW(engine.submit("late", [] { return 1; }), InvalidStateError);
}

TEST_F(EngineTest, DestructorDrains) {
    std::atomic<int> ran{0};
    {
        TaskEngine<int> engine(quiet_config(2));
        engine.start();
        for (int i = 0; i < 8; i++) {
            engine.submit("t" + std::to_string(i), [&ran] { return ran.fetch_add(1); });
        }
    }
    EXPECT_EQ(ran.load(), 8);
}

TEST_F(EngineTest, HeterogeneousResultsWithAny) {
    TaskEngine<std::any> engine(quiet_config(2));
    engine.start();

    engine.submit("num", [] { return std::any(21); });
    engine.submit("str", [] { return std::any(std::string("text")); });

    EXPECT_EQ(std::any_cast<int>(engine.get_result("num")), 21);
    EXPECT_EQ(std::any_cast<std::string>(engine.get_result("str")), "text");
}

TEST_F(EngineTest, MoveOnlyResults) {
    TaskEngine<std::unique_ptr<int>> engine(quiet_config(1));
    engine.start();

    engine.submit("ptr", [](int v) { return std::make_unique<int>(v); }, 8);
    auto result = engine.get_result("ptr");
    ASSERT_TRUE(result);
    EXPECT_EQ(*result, 8);
}

TEST_F(EngineTest, MetricsAndWorkerStats) {
    TaskEngine<int> engine(quiet_config(2));
    engine.start();

    for (int i = 0; i < 5; i++) {
        engine.submit("ok" + std::to_string(i), [] { return 1; });
    }
    engine.submit("fail", []() -> int { throw std::runtime_error("x"); });
    engine.stop();

    auto m = engine.metrics().snapshot();
    EXPECT_EQ(m.tasks_submitted, 6u);
    EXPECT_EQ(m.tasks_completed, 5u);
    EXPECT_EQ(m.tasks_failed, 1u);
    EXPECT_EQ(m.queue_depth, 0);
    EXPECT_EQ(m.in_flight, 0);

    auto stats = engine.worker_stats();
    ASSERT_EQ(stats.size(), 2u);
    std::uint64_t processed = 0;
    std::uint64_t failed = 0;
    for (const auto& s : stats) {
        processed += s.tasks_processed;
        failed += s.tasks_failed;
    }
    EXPECT_EQ(processed, 6u);
    EXPECT_EQ(failed, 1u);
}

TEST_F(EngineTest, MetricsDisabled) {
    EngineConfig config = quiet_config(1);
    config.enable_metrics = false;
    TaskEngine<int> engine(config);
    engine.start();

    engine.submit("a", [] { return 1; });
    EXPECT_EQ(engine.get_result("a"), 1);
    EXPECT_EQ(engine.metrics().snapshot().tasks_submitted, 0u);
}

TEST_F(EngineTest, UnclaimedResultsEvictedAfterTtl) {
    EngineConfig config = quiet_config(1);
    config.result_ttl = 20ms;
    TaskEngine<int> engine(config);
    engine.start();

    engine.submit("forgotten", [] { return 1; });
    engine.stop();

    std::this_thread::sleep_for(40ms);
    EXPECT_EQ(engine.results().evict_expired(), 1u);
    EXPECT_THROW(engine.get_result("forgotten"), UnknownTaskError);
    EXPECT_EQ(engine.metrics().results_evicted().value(), 1u);
}

TEST_F(EngineTest, InvalidConfigRejected) {
    EngineConfig config;
    config.worker_name_prefix.clear();
    EXPECT_THROW(TaskEngine<int> engine(config), std::invalid_argument);
}

TEST_F(EngineTest, IntrospectionDuringStart) {
    TaskEngine<int> engine(quiet_config(3));

    std::atomic<bool> done{false};
    std::thread reader([&] {
        while (!done.load()) {
            auto n = engine.num_workers();
            EXPECT_TRUE(n == 0u || n == 3u);
            auto stats = engine.worker_stats();
            EXPECT_TRUE(stats.empty() || stats.size() == 3u);
        }
    });

    engine.start();
    std::this_thread::sleep_for(5ms);
    done.store(true);
    reader.join();

    EXPECT_EQ(engine.num_workers(), 3u);
    EXPECT_EQ(engine.worker_stats().size(), 3u);
}

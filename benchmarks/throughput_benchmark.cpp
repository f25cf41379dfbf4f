/**
 * @file throughput_benchmark.cpp
 * @brief Throughput benchmarks for tasklane
 */

#include <benchmark/benchmark.h>

#include <string>
#include <vector>

#include "tasklane/tasklane.hpp"

using namespace tasklane;

static void BM_QueuePushPop(benchmark::State& state) {
    TaskQueue<int> queue(4096);

    for (auto _ : state) {
        queue.push(42);
        auto result = queue.pop();
        benchmark::DoNotOptimize(result);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_QueuePushPop);

static void BM_ResultBoxPublishAwait(benchmark::State& state) {
    ResultBox<int> box;
    const TaskId id = "bench";

    for (auto _ : state) {
        box.reserve(id);
        box.publish(id, Outcome<int>::ok(1));
        auto outcome = box.await(id);
        benchmark::DoNotOptimize(outcome);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_ResultBoxPublishAwait);

static void BM_SubmitGetResult(benchmark::State& state) {
    Logger::set_level(LogLevel::Error);
    EngineConfig config;
    config.num_workers = static_cast<std::uint32_t>(state.range(0));
    config.queue_capacity = 0;

    TaskEngine<int> engine(config);
    engine.start();

    std::vector<TaskId> ids;
    for (int i = 0; i < 1000; i++) {
        ids.push_back("t" + std::to_string(i));
    }

    for (auto _ : state) {
        for (int i = 0; i < 1000; i++) {
            engine.submit(ids[static_cast<std::size_t>(i)], [](int x) { return x + 1; }, i);
        }
        for (const auto& id : ids) {
            benchmark::DoNotOptimize(engine.get_result(id));
        }
    }

    state.SetItemsProcessed(state.iterations() * 1000);
}
BENCHMARK(BM_SubmitGetResult)->Arg(1)->Arg(2)->Arg(4)->Arg(8);

static void BM_MapTasks(benchmark::State& state) {
    Logger::set_level(LogLevel::Error);
    EngineConfig config;
    config.num_workers = 4;

    TaskEngine<std::int64_t> engine(config);
    engine.start();

    std::vector<std::int64_t> items(static_cast<std::size_t>(state.range(0)));
    for (std::size_t i = 0; i < items.size(); i++) {
        items[i] = static_cast<std::int64_t>(i);
    }

    for (auto _ : state) {
        auto results = engine.map_tasks([](std::int64_t x) { return x * x; }, items);
        benchmark::DoNotOptimize(results);
    }

    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_MapTasks)->Arg(64)->Arg(1024)->Arg(8192);

BENCHMARK_MAIN();

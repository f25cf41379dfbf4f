/**
 * @file latency_benchmark.cpp
 * @brief Latency benchmarks for tasklane
 */

#include <benchmark/benchmark.h>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "tasklane/tasklane.hpp"

using namespace tasklane;

static void BM_RoundTripLatency(benchmark::State& state) {
    Logger::set_level(LogLevel::Error);
    EngineConfig config;
    config.num_workers = static_cast<std::uint32_t>(state.range(0));

    TaskEngine<int> engine(config);
    engine.start();

    std::uint64_t n = 0;
    for (auto _ : state) {
        auto id = "rt-" + std::to_string(n++);
        auto start = std::chrono::high_resolution_clock::now();
        engine.submit(id, [] { return 1; });
        benchmark::DoNotOptimize(engine.get_result(id));
        auto end = std::chrono::high_resolution_clock::now();

        auto duration = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start);
        state.SetIterationTime(static_cast<double>(duration.count()) / 1e9);
    }
}
BENCHMARK(BM_RoundTripLatency)->Arg(1)->Arg(2)->Arg(4)->UseManualTime();

static void BM_BatchLatency(benchmark::State& state) {
    Logger::set_level(LogLevel::Error);
    const auto batch_size = static_cast<std::size_t>(state.range(0));

    EngineConfig config;
    config.num_workers = 4;
    TaskEngine<int> engine(config);
    engine.start();

    std::vector<int> items(1000);
    for (std::size_t i = 0; i < items.size(); i++) {
        items[i] = static_cast<int>(i);
    }

    for (auto _ : state) {
        auto start = std::chrono::high_resolution_clock::now();
        auto results = engine.batch_process([](int x) {
            std::this_thread::sleep_for(std::chrono::microseconds(10));
            return x;
        }, items, batch_size);
        auto end = std::chrono::high_resolution_clock::now();
        benchmark::DoNotOptimize(results);

        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start);
        state.SetIterationTime(static_cast<double>(duration.count()) / 1e6);
    }

    state.SetItemsProcessed(state.iterations() * 1000);
}
BENCHMARK(BM_BatchLatency)->Arg(4)->Arg(32)->Arg(256)->Arg(1000)->UseManualTime();

BENCHMARK_MAIN();

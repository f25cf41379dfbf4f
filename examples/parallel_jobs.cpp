/**
 * @file parallel_jobs.cpp
 * @brief Example: submit/get, parallel map, batches, failures and cancellation
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <numeric>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "tasklane/tasklane.hpp"

std::atomic<bool> g_shutdown{false};

void signal_handler(int /*signal*/) {
    g_shutdown.store(true);
}

// Stand-in for real work: checksum of a generated block
std::uint64_t checksum(std::uint64_t seed) {
    std::uint64_t h = 1469598103934665603ULL ^ seed;
    for (int i = 0; i < 200000; i++) {
        h = (h ^ static_cast<std::uint64_t>(i)) * 1099511628211ULL;
    }
    return h;
}

int main() {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::cout << "=== tasklane example ===" << std::endl;
    std::cout << "Version: " << tasklane::VERSION << std::endl;
    std::cout << std::endl;

    tasklane::EngineConfig config;
    try {
        config = tasklane::EngineConfig::from_env();
    } catch (const std::invalid_argument& e) {
        std::cerr << "bad configuration: " << e.what() << std::endl;
        return 1;
    }

    tasklane::TaskEngine<std::uint64_t> engine(config);
    engine.start();
    std::cout << "Workers: " << engine.num_workers() << std::endl;

    // Individual submissions
    engine.submit("block-a", checksum, 1);
    engine.submit("block-b", checksum, 2);
    engine.submit("broken", [](std::uint64_t) -> std::uint64_t {
        throw std::runtime_error("disk unavailable");
    }, 3);

    std::cout << "block-a: " << engine.get_result("block-a") << std::endl;
    std::cout << "block-b: " << engine.get_result("block-b", std::chrono::seconds(5)) << std::endl;
    try {
        engine.get_result("broken");
    } catch (const tasklane::TaskError& e) {
        std::cout << "broken: " << e.what() << std::endl;
    }

    // Parallel map, results in input order
    std::vector<std::uint64_t> seeds(64);
    std::iota(seeds.begin(), seeds.end(), 100);

    auto start = std::chrono::steady_clock::now();
    auto mapped = engine.map_tasks(checksum, seeds);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    std::cout << "map_tasks: " << mapped.size() << " results in " << elapsed.count() << " ms"
              << std::endl;

    // Same work in bounded chunks
    auto batched = engine.batch_process(checksum, seeds, 8);
    std::cout << "batch_process matches map_tasks: " << std::boolalpha << (batched == mapped)
              << std::endl;

    // Collect-all mode
    auto settled = engine.map_settled([](std::uint64_t x) -> std::uint64_t {
        if (x % 5 == 0) {
            throw std::domain_error("multiple of five: " + std::to_string(x));
        }
        return x;
    }, std::vector<std::uint64_t>{1, 5, 7, 10});
    for (const auto& outcome : settled) {
        if (outcome) {
            std::cout << "  ok  " << outcome.value() << std::endl;
        } else {
            std::cout << "  err " << tasklane::describe(outcome.error()) << std::endl;
        }
    }

    // Queue more work than can finish, then stop without draining
    int queued = 0;
    for (int i = 0; i < 200 && !g_shutdown.load(); i++) {
        try {
            engine.submit("late-" + std::to_string(i), checksum, static_cast<std::uint64_t>(i));
            queued++;
        } catch (const tasklane::QueueFullError& e) {
            std::cout << "Stopped submitting: " << e.what() << std::endl;
            break;
        }
    }
    std::cout << "Queued late tasks: " << queued << std::endl;
    auto cancelled = engine.stop(false);
    std::cout << "Cancelled on stop: " << cancelled << std::endl;

    std::cout << "\n=== Final Statistics ===" << std::endl;
    std::cout << engine.metrics().format() << std::endl;
    std::cout << "Uptime: " << engine.metrics().uptime().count() << " ms" << std::endl;

    return 0;
}

#include <gtest/gtest.h>
#include "flow_governor.hpp"
#include "memory_storage.hpp"
#include "metrics.hpp"
#include "clock.hpp"
#include <thread>
#include <vector>
#include <atomic>
#include <chrono>
#include <iostream>

using namespace llmgate;

TEST(StressTest, GovernorHighConcurrency) {
    MetricsRegistry::instance().reset();

    GovernorConfig config;
    config.requests_per_window = 1000000;
    config.tokens_per_window = 1000000000;
    config.max_concurrent = 4;
    config.failure_threshold = 1000000;
    SteadyClock clock;
    FlowGovernor governor(config, clock);

    const int num_threads = 16;
    const int calls_per_thread = 500;
    std::atomic<int> active{0};
    std::atomic<int> peak{0};
    std::atomic<int> admitted{0};

    auto worker = [&](int thread_id) {
        for (int i = 0; i < calls_per_thread; ++i) {
            GovernedCall call = governor.try_enter(10);
            if (!call) continue;
            admitted++;

            int now_active = ++active;
            int seen = peak.load();
            while (now_active > seen && !peak.compare_exchange_weak(seen, now_active)) {}
            std::this_thread::yield();
            --active;

            if ((thread_id + i) % 7 == 0) {
                call.fail(10);
            } else {
                call.succeed(10);
            }
        }
    };

    std::vector<std::thread> threads;
    auto start = std::chrono::high_resolution_clock::now();
    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back(worker, i);
    }
    for (auto& t : threads) {
        t.join();
    }
    auto end = std::chrono::high_resolution_clock::now();

    std::chrono::duration<double> diff = end - start;
    std::cout << "[*] Governed " << admitted << " calls in " << diff.count() << "s" << std::endl;

    GovernorState state = governor.metrics();
    EXPECT_EQ(admitted.load(), num_threads * calls_per_thread);
    EXPECT_LE(peak.load(), static_cast<int>(config.max_concurrent));
    EXPECT_EQ(state.in_flight, 0u);
    EXPECT_EQ(state.requests_in_window, static_cast<uint64_t>(admitted.load()));
    EXPECT_EQ(MetricsRegistry::instance().get_counter("governor_released_total"),
              static_cast<double>(admitted.load()));
}

TEST(StressTest, RequestBudgetNeverOvershoots) {
    GovernorConfig config;
    config.requests_per_window = 100;
    config.max_concurrent = 8;
    config.window_duration_ms = 3600000;
    SteadyClock clock;
    FlowGovernor governor(config, clock);

    std::atomic<int> admitted{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 12; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 50; ++i) {
                GovernedCall call = governor.try_enter(1);
                if (call) {
                    admitted++;
                    call.succeed(1);
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(admitted.load(), 100);
    EXPECT_EQ(governor.metrics().requests_in_window, 100u);
}

TEST(StressTest, OptimisticWritesSerialize) {
    SystemClock clock;
    MemoryStorage storage(clock);
    storage.put("counter", "0");

    const int num_threads = 8;
    const int increments = 200;
    std::atomic<int> conflicts{0};

    auto worker = [&] {
        for (int i = 0; i < increments; ++i) {
            while (true) {
                auto current = storage.get("counter");
                int value = std::stoi(current->value);
                try {
                    storage.put("counter", std::to_string(value + 1), current->generation);
                    break;
                } catch (const StorageConflictError&) {
                    conflicts++;
                }
            }
        }
    };

    std::vector<std::thread> threads;
    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back(worker);
    }
    for (auto& t : threads) {
        t.join();
    }

    auto final_value = storage.get("counter");
    ASSERT_TRUE(final_value.has_value());
    EXPECT_EQ(std::stoi(final_value->value), num_threads * increments);
    EXPECT_EQ(final_value->generation, static_cast<uint64_t>(num_threads * increments + 1));
    std::cout << "[*] Retried " << conflicts << " conflicting writes" << std::endl;
}

#include <ttlcache/TtlCache.hpp>
#include <ttlcache/concurrency/ShardedTtlCache.hpp>

#include <iostream>
#include <iomanip>
#include <chrono>
#include <thread>
#include <vector>
#include <atomic>
#include <random>
#include <functional>
#include <memory>
#include <string>

/**
 * @brief Бенчмарк многопоточности кэша с TTL
 *
 * Сравниваем:
 * 1. TtlCache               — один shared_mutex на весь кэш
 * 2. ShardedTtlCache<8>     — 8 шардов
 * 3. ShardedTtlCache<32>    — 32 шарда
 *
 * Сценарии:
 * - Read-only (100% get, предзаполненный кэш) — выигрыш shared lock
 * - Mixed (80% get, 20% set)
 * - Sweep (стоимость одного прохода очистки по большому кэшу)
 */

// ==================== Утилиты ====================

using Clock = std::chrono::high_resolution_clock;
using Duration = std::chrono::duration<double, std::milli>;

struct BenchmarkResult {
    std::string name;
    int threads;
    double timeMs;
    double opsPerSec;
    size_t totalOps;
};

void printHeader() {
    std::cout << std::left
              << std::setw(25) << "Cache Type"
              << std::setw(10) << "Threads"
              << std::setw(15) << "Time (ms)"
              << std::setw(18) << "Throughput"
              << std::setw(12) << "Speedup"
              << "\n";
    std::cout << std::string(80, '-') << "\n";
}

void printResult(const BenchmarkResult& result, double baselineOps = 0) {
    std::cout << std::left
              << std::setw(25) << result.name
              << std::setw(10) << result.threads
              << std::fixed << std::setprecision(1)
              << std::setw(15) << result.timeMs
              << std::setw(18) << std::setprecision(0) << result.opsPerSec;

    if (baselineOps > 0) {
        std::cout << std::setprecision(2) << (result.opsPerSec / baselineOps) << "x";
    }
    std::cout << "\n";
}

/**
 * @brief Запустить нагрузку в numThreads потоках и замерить время
 * @param worker Функция потока, принимает номер потока
 */
BenchmarkResult runThreads(const std::string& name, int numThreads, int opsPerThread,
                           const std::function<void(int)>& worker) {
    std::vector<std::thread> threads;

    auto start = Clock::now();

    for (int t = 0; t < numThreads; ++t) {
        threads.emplace_back(worker, t);
    }
    for (auto& th : threads) {
        th.join();
    }

    Duration duration = Clock::now() - start;

    size_t totalOps = static_cast<size_t>(numThreads) * opsPerThread;
    double opsPerSec = (totalOps / duration.count()) * 1000.0;

    return {name, numThreads, duration.count(), opsPerSec, totalOps};
}

// ==================== Бенчмарки ====================

/**
 * @brief Бенчмарк чтения (get)
 * Кэш предзаполнен, каждый поток читает случайные ключи
 */
BenchmarkResult benchmarkRead(ICache<int, int>& cache, const std::string& name,
                              int numThreads, int opsPerThread, int keyRange) {
    for (int i = 0; i < keyRange; ++i) {
        cache.set(i, i * 2);
    }

    std::atomic<int> hits{0};

    return runThreads(name, numThreads, opsPerThread, [&](int t) {
        std::mt19937 rng(42 + t);
        std::uniform_int_distribution<int> dist(0, keyRange - 1);

        for (int i = 0; i < opsPerThread; ++i) {
            if (cache.get(dist(rng)).has_value()) {
                ++hits;
            }
        }
    });
}

/**
 * @brief Смешанная нагрузка (80% read, 20% write)
 */
BenchmarkResult benchmarkMixed(ICache<int, int>& cache, const std::string& name,
                               int numThreads, int opsPerThread, int keyRange) {
    for (int i = 0; i < keyRange / 2; ++i) {
        cache.set(i, i);
    }

    return runThreads(name, numThreads, opsPerThread, [&](int t) {
        std::mt19937 rng(42 + t);
        std::uniform_int_distribution<int> keyDist(0, keyRange - 1);
        std::uniform_int_distribution<int> opDist(0, 99);

        for (int i = 0; i < opsPerThread; ++i) {
            int key = keyDist(rng);
            if (opDist(rng) < 80) {
                cache.get(key);
            } else {
                cache.set(key, i, std::chrono::seconds(60));
            }
        }
    });
}

// ==================== Фабрики кэшей ====================

using CacheFactory = std::function<std::unique_ptr<ICache<int, int>>()>;

struct NamedFactory {
    std::string name;
    CacheFactory make;
};

std::vector<NamedFactory> cacheFactories() {
    using namespace std::chrono_literals;
    return {
        {"TtlCache", []() {
            return std::make_unique<TtlCache<int, int>>(60s, 0s);
        }},
        {"ShardedTtlCache<8>", []() {
            return std::make_unique<ShardedTtlCache<int, int, 8>>(60s, 0s);
        }},
        {"ShardedTtlCache<32>", []() {
            return std::make_unique<ShardedTtlCache<int, int, 32>>(60s, 0s);
        }},
    };
}

// ==================== Запуск бенчмарков ====================

using Benchmark = std::function<BenchmarkResult(ICache<int, int>&, const std::string&, int)>;

void runBenchmark(const std::string& title, const Benchmark& benchmark) {
    std::cout << "\n=== " << title << " ===\n\n";

    std::vector<int> threadCounts = {1, 2, 4, 8, 16};
    double baseline = 0;

    for (int numThreads : threadCounts) {
        std::cout << "Threads: " << numThreads << "\n";
        printHeader();

        for (const auto& factory : cacheFactories()) {
            auto cache = factory.make();
            auto result = benchmark(*cache, factory.name, numThreads);
            if (baseline == 0) baseline = result.opsPerSec;
            printResult(result, baseline);
        }

        std::cout << "\n";
    }
}

/**
 * @brief Стоимость прохода очистки
 * Половина записей просрочена, половина живая
 */
void runSweepBenchmark() {
    using namespace std::chrono_literals;

    std::cout << "\n=== SWEEP BENCHMARK (half of entries expired) ===\n\n";

    for (int size : {10'000, 100'000, 1'000'000}) {
        TtlCache<int, int> cache(0s, 0s);
        for (int i = 0; i < size; ++i) {
            cache.set(i, i, (i % 2 == 0) ? 1ms : 60s);
        }
        std::this_thread::sleep_for(5ms);

        auto start = Clock::now();
        size_t removed = cache.removeExpired();
        Duration duration = Clock::now() - start;

        std::cout << std::left << std::setw(12) << size
                  << "removed " << std::setw(10) << removed
                  << std::fixed << std::setprecision(2) << duration.count() << " ms\n";
    }
}

int main() {
    const int OPS_PER_THREAD = 50000;
    const int KEY_RANGE = 50000;

    std::cout << "TtlCache Concurrency Benchmark\n";
    std::cout << "Hardware threads: " << std::thread::hardware_concurrency() << "\n";

    runBenchmark("READ BENCHMARK (100% get, pre-filled)",
        [&](ICache<int, int>& cache, const std::string& name, int threads) {
            return benchmarkRead(cache, name, threads, OPS_PER_THREAD, KEY_RANGE);
        });

    runBenchmark("MIXED BENCHMARK (80% read, 20% write)",
        [&](ICache<int, int>& cache, const std::string& name, int threads) {
            return benchmarkMixed(cache, name, threads, OPS_PER_THREAD, KEY_RANGE);
        });

    runSweepBenchmark();

    return 0;
}

#include <gtest/gtest.h>
#include <ttlcache/TtlCache.hpp>
#include <thread>
#include <vector>
#include <atomic>
#include <chrono>
#include <string>

/**
 * @brief Многопоточные тесты для TtlCache
 *
 * Проверяем:
 * - Корректность данных после конкурентной записи
 * - Смешанную нагрузку set/get/remove на пересекающихся ключах
 * - Работу фоновой очистки под нагрузкой
 * - Отсутствие потерянных обновлений в пределах одного ключа
 * - Перезапись ключа во время очистки не теряется
 *
 * Имеет смысл запускать под ThreadSanitizer (-DTTLCACHE_SANITIZE=thread).
 */

using namespace std::chrono_literals;

// ==================== Конкурентная запись ====================

TEST(TtlCacheConcurrencyTest, ConcurrentWrites) {
    TtlCache<int, int> cache(0s, 0s);

    const int numThreads = 4;
    const int opsPerThread = 250;
    std::vector<std::thread> threads;

    for (int t = 0; t < numThreads; ++t) {
        threads.emplace_back([&cache, t, opsPerThread]() {
            for (int i = 0; i < opsPerThread; ++i) {
                int key = t * opsPerThread + i;
                cache.set(key, key * 2);
            }
        });
    }

    for (auto& th : threads) {
        th.join();
    }

    EXPECT_EQ(cache.count(), numThreads * opsPerThread);

    // Проверяем корректность данных
    for (int t = 0; t < numThreads; ++t) {
        for (int i = 0; i < opsPerThread; ++i) {
            int key = t * opsPerThread + i;
            auto val = cache.get(key);
            ASSERT_TRUE(val.has_value()) << "Key " << key << " not found";
            EXPECT_EQ(val.value(), key * 2);
        }
    }
}

TEST(TtlCacheConcurrencyTest, ConcurrentReadsAndWrites) {
    TtlCache<int, int> cache(0s, 0s);

    // Предзаполняем
    for (int i = 0; i < 100; ++i) {
        cache.set(i, i * 2);
    }

    std::atomic<int> readCount{0};
    std::atomic<int> badValues{0};

    std::vector<std::thread> readers;
    std::vector<std::thread> writers;

    // 4 читателя
    for (int t = 0; t < 4; ++t) {
        readers.emplace_back([&cache, &readCount, &badValues]() {
            for (int i = 0; i < 500; ++i) {
                int key = i % 100;
                auto val = cache.get(key);
                ++readCount;
                // Писатели кладут только key * 2 или key * 3
                if (val && val.value() != key * 2 && val.value() != key * 3) {
                    ++badValues;
                }
            }
        });
    }

    // 2 писателя
    for (int t = 0; t < 2; ++t) {
        writers.emplace_back([&cache]() {
            for (int i = 0; i < 500; ++i) {
                int key = i % 100;
                cache.set(key, key * 3);
            }
        });
    }

    for (auto& th : readers) th.join();
    for (auto& th : writers) th.join();

    EXPECT_EQ(readCount.load(), 4 * 500);
    EXPECT_EQ(badValues.load(), 0);
    EXPECT_EQ(cache.count(), 100);
}

// ==================== Пересекающиеся ключи ====================

TEST(TtlCacheConcurrencyTest, MixedOperationsOnOverlappingKeys) {
    TtlCache<std::string, int> cache(0s, 5ms);

    const int numThreads = 8;
    const int numKeys = 16;
    std::atomic<bool> stop{false};
    std::vector<std::thread> threads;

    for (int t = 0; t < numThreads; ++t) {
        threads.emplace_back([&cache, &stop, t, numKeys]() {
            int i = 0;
            while (!stop) {
                std::string key = "key" + std::to_string((i + t) % numKeys);
                switch (i % 4) {
                    case 0: cache.set(key, i, 2ms); break;
                    case 1: cache.get(key); break;
                    case 2: cache.remove(key); break;
                    default: cache.getItem(key); break;
                }
                ++i;
            }
        });
    }

    std::this_thread::sleep_for(200ms);
    stop = true;
    for (auto& th : threads) {
        th.join();
    }

    EXPECT_LE(cache.count(), static_cast<size_t>(numKeys));

    // Кэш пригоден к работе
    cache.set("final", 42);
    EXPECT_EQ(cache.get("final").value(), 42);
}

TEST(TtlCacheConcurrencyTest, LastWritePerKeyWins) {
    TtlCache<int, int> cache(0s, 0s);

    const int numThreads = 4;
    const int writesPerThread = 1000;
    std::vector<std::thread> threads;

    // Каждый поток пишет в свой ключ возрастающие значения
    for (int t = 0; t < numThreads; ++t) {
        threads.emplace_back([&cache, t, writesPerThread]() {
            for (int i = 1; i <= writesPerThread; ++i) {
                cache.set(t, i);
                cache.get((t + 1) % 4);
            }
        });
    }

    for (auto& th : threads) {
        th.join();
    }

    for (int t = 0; t < numThreads; ++t) {
        auto val = cache.get(t);
        ASSERT_TRUE(val.has_value());
        EXPECT_EQ(val.value(), writesPerThread);
    }
}

// ==================== Очистка под нагрузкой ====================

TEST(TtlCacheConcurrencyTest, SweepUnderLoad) {
    TtlCache<int, int> cache(5ms, 10ms);

    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t) {
        writers.emplace_back([&cache, t]() {
            for (int i = 0; i < 2000; ++i) {
                cache.set(t * 2000 + i, i);
                cache.count();
            }
        });
    }

    for (auto& th : writers) {
        th.join();
    }

    // Все записи с default TTL 5ms — очистка должна всё убрать
    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (cache.count() != 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }

    EXPECT_EQ(cache.count(), 0);
}

TEST(TtlCacheConcurrencyTest, ConcurrentClose) {
    TtlCache<int, int> cache(0s, 5ms);

    std::vector<std::thread> closers;
    for (int t = 0; t < 4; ++t) {
        closers.emplace_back([&cache]() {
            cache.close();
        });
    }

    for (auto& th : closers) {
        th.join();
    }

    EXPECT_FALSE(cache.sweepRunning());
}

TEST(TtlCacheConcurrencyTest, RefreshDuringSweepIsNeverLost) {
    const int numKeys = 500;
    const int rounds = 20;

    for (int round = 0; round < rounds; ++round) {
        TtlCache<int, int> cache(0s, 0s);
        for (int i = 0; i < numKeys; ++i) {
            cache.set(i, -1, 1ms);
        }
        std::this_thread::sleep_for(5ms);

        std::atomic<bool> refreshed{false};
        std::thread sweeper([&cache, &refreshed]() {
            while (!refreshed) {
                cache.removeExpired();
            }
        });
        std::thread writer([&cache, &refreshed, numKeys, round]() {
            for (int i = 0; i < numKeys; ++i) {
                cache.set(i, round, 10s);
            }
            refreshed = true;
        });

        writer.join();
        sweeper.join();

        // Каждый ключ перезаписан с TTL 10s: ни одна очистка не могла его удалить
        ASSERT_EQ(cache.count(), static_cast<size_t>(numKeys)) << "round " << round;
        for (int i = 0; i < numKeys; ++i) {
            auto value = cache.get(i);
            ASSERT_TRUE(value.has_value()) << "round " << round << ", key " << i;
            EXPECT_EQ(value.value(), round);
        }
    }
}

/**
 * @brief Слушатель, который спрашивает состояние очистки из потока очистки
 */
class SweepStateListener : public ICacheListener<int, int> {
public:
    explicit SweepStateListener(const TtlCache<int, int>& cache) : cache_(cache) {}

    void onExpire(const int& key) override {
        (void)key;
        entered = true;
        std::this_thread::sleep_for(50ms);
        // close() в этот момент уже ждёт поток очистки
        cache_.sweepRunning();
        finished = true;
    }

    std::atomic<bool> entered{false};
    std::atomic<bool> finished{false};

private:
    const TtlCache<int, int>& cache_;
};

TEST(TtlCacheConcurrencyTest, ListenerQueriesSweepStateDuringClose) {
    TtlCache<int, int> cache(0s, 10ms);
    auto listener = std::make_shared<SweepStateListener>(cache);
    cache.addListener(listener);

    cache.set(1, 1, 1ms);

    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (!listener->entered && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }
    ASSERT_TRUE(listener->entered);

    cache.close();

    EXPECT_TRUE(listener->finished);
    EXPECT_FALSE(cache.sweepRunning());
}

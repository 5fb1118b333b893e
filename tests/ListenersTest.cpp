#include <gtest/gtest.h>
#include <ttlcache/TtlCache.hpp>
#include <ttlcache/listeners/LoggingListener.hpp>
#include <ttlcache/listeners/StatsListener.hpp>
#include <sstream>
#include <thread>
#include <chrono>

/**
 * @brief Тесты для слушателей
 *
 * Проверяем:
 * - StatsListener корректно считает статистику
 * - LoggingListener выводит сообщения
 * - События очистки (expire/sweep)
 * - Множественные слушатели и их удаление
 */

using namespace std::chrono_literals;

// ==================== StatsListener ====================

TEST(StatsListenerTest, InitiallyZero) {
    StatsListener<std::string, int> stats;

    EXPECT_EQ(stats.hits(), 0);
    EXPECT_EQ(stats.misses(), 0);
    EXPECT_EQ(stats.inserts(), 0);
    EXPECT_EQ(stats.updates(), 0);
    EXPECT_EQ(stats.removes(), 0);
    EXPECT_EQ(stats.expirations(), 0);
    EXPECT_EQ(stats.sweeps(), 0);
    EXPECT_EQ(stats.clears(), 0);
    EXPECT_DOUBLE_EQ(stats.hitRate(), 0.0);
}

TEST(StatsListenerTest, CountsHitsAndMisses) {
    TtlCache<std::string, int> cache(0s, 0s);
    auto stats = std::make_shared<StatsListener<std::string, int>>();
    cache.addListener(stats);

    cache.set("key1", 42);
    cache.get("key1");      // Hit
    cache.getItem("key1");  // Hit
    cache.get("missing");   // Miss

    EXPECT_EQ(stats->hits(), 2);
    EXPECT_EQ(stats->misses(), 1);
    EXPECT_EQ(stats->totalRequests(), 3);
}

TEST(StatsListenerTest, ExpiredReadIsMiss) {
    TtlCache<std::string, int> cache(0s, 0s);
    auto stats = std::make_shared<StatsListener<std::string, int>>();
    cache.addListener(stats);

    cache.set("key1", 42, 10ms);
    std::this_thread::sleep_for(30ms);
    cache.get("key1");

    EXPECT_EQ(stats->hits(), 0);
    EXPECT_EQ(stats->misses(), 1);
}

TEST(StatsListenerTest, HitRateCalculation) {
    TtlCache<std::string, int> cache(0s, 0s);
    auto stats = std::make_shared<StatsListener<std::string, int>>();
    cache.addListener(stats);

    cache.set("key1", 42);
    cache.get("key1");
    cache.get("key1");
    cache.get("key1");
    cache.get("missing");

    EXPECT_DOUBLE_EQ(stats->hitRate(), 0.75);
}

TEST(StatsListenerTest, CountsInsertsAndUpdates) {
    TtlCache<std::string, int> cache(0s, 0s);
    auto stats = std::make_shared<StatsListener<std::string, int>>();
    cache.addListener(stats);

    cache.set("key1", 1);
    cache.set("key2", 2);
    cache.set("key1", 10);

    EXPECT_EQ(stats->inserts(), 2);
    EXPECT_EQ(stats->updates(), 1);
}

TEST(StatsListenerTest, CountsRemovesAndClears) {
    TtlCache<std::string, int> cache(0s, 0s);
    auto stats = std::make_shared<StatsListener<std::string, int>>();
    cache.addListener(stats);

    cache.set("key1", 1);
    cache.set("key2", 2);
    cache.remove("key1");
    cache.remove("missing");  // Не считается
    cache.clear();

    EXPECT_EQ(stats->removes(), 1);
    EXPECT_EQ(stats->clears(), 1);
}

TEST(StatsListenerTest, CountsExpirationsAndSweeps) {
    TtlCache<std::string, int> cache(0s, 0s);
    auto stats = std::make_shared<StatsListener<std::string, int>>();
    cache.addListener(stats);

    cache.set("a", 1, 10ms);
    cache.set("b", 2, 10ms);
    cache.set("c", 3);
    std::this_thread::sleep_for(30ms);

    cache.removeExpired();
    cache.removeExpired();  // Пустой проход не уведомляет

    EXPECT_EQ(stats->expirations(), 2);
    EXPECT_EQ(stats->sweeps(), 1);
}

TEST(StatsListenerTest, Reset) {
    TtlCache<std::string, int> cache(0s, 0s);
    auto stats = std::make_shared<StatsListener<std::string, int>>();
    cache.addListener(stats);

    cache.set("key1", 1);
    cache.get("key1");
    stats->reset();

    EXPECT_EQ(stats->hits(), 0);
    EXPECT_EQ(stats->inserts(), 0);
}

// ==================== LoggingListener ====================

TEST(LoggingListenerTest, LogsOperations) {
    std::ostringstream oss;
    TtlCache<std::string, int> cache(0s, 0s);
    auto logger = std::make_shared<LoggingListener<std::string, int>>("Test", oss);
    cache.addListener(logger);

    cache.set("key1", 42);
    cache.get("key1");
    cache.get("missing");
    cache.set("key1", 43);
    cache.remove("key1");

    std::string output = oss.str();

    EXPECT_NE(output.find("[Test] INSERT: key1 = 42"), std::string::npos);
    EXPECT_NE(output.find("[Test] HIT: key1"), std::string::npos);
    EXPECT_NE(output.find("[Test] MISS: missing"), std::string::npos);
    EXPECT_NE(output.find("[Test] UPDATE: key1 = 43"), std::string::npos);
    EXPECT_NE(output.find("[Test] REMOVE: key1"), std::string::npos);
}

TEST(LoggingListenerTest, LogsSweep) {
    std::ostringstream oss;
    TtlCache<std::string, int> cache(0s, 0s);
    auto logger = std::make_shared<LoggingListener<std::string, int>>("Sweep", oss);
    cache.addListener(logger);

    cache.set("old", 1, 10ms);
    std::this_thread::sleep_for(30ms);
    cache.removeExpired();
    cache.clear();

    std::string output = oss.str();

    EXPECT_NE(output.find("[Sweep] EXPIRE: old"), std::string::npos);
    EXPECT_NE(output.find("[Sweep] SWEEP: 1 expired elements"), std::string::npos);
    EXPECT_NE(output.find("[Sweep] CLEAR: 0 elements"), std::string::npos);
}

TEST(LoggingListenerTest, LogsFromSweeperThread) {
    std::ostringstream oss;
    auto logger = std::make_shared<LoggingListener<std::string, int>>("Bg", oss);
    {
        TtlCache<std::string, int> cache(0s, 10ms);
        cache.addListener(logger);
        cache.set("old", 1, 5ms);

        auto deadline = std::chrono::steady_clock::now() + 1s;
        while (cache.count() != 0 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(5ms);
        }
        // Поток очистки остановлен — дальше читать oss безопасно
        cache.close();
    }

    EXPECT_NE(oss.str().find("[Bg] EXPIRE: old"), std::string::npos);
}

// ==================== Управление слушателями ====================

TEST(ListenersTest, MultipleListeners) {
    TtlCache<std::string, int> cache(0s, 0s);
    auto stats1 = std::make_shared<StatsListener<std::string, int>>();
    auto stats2 = std::make_shared<StatsListener<std::string, int>>();
    cache.addListener(stats1);
    cache.addListener(stats2);

    cache.set("key1", 1);
    cache.get("key1");

    EXPECT_EQ(stats1->hits(), 1);
    EXPECT_EQ(stats2->hits(), 1);
}

TEST(ListenersTest, RemoveListener) {
    TtlCache<std::string, int> cache(0s, 0s);
    auto stats = std::make_shared<StatsListener<std::string, int>>();
    cache.addListener(stats);

    cache.set("key1", 1);
    cache.removeListener(stats);
    cache.set("key2", 2);

    EXPECT_EQ(stats->inserts(), 1);
}

TEST(ListenersTest, NullListenerIgnored) {
    TtlCache<std::string, int> cache(0s, 0s);

    cache.addListener(nullptr);

    EXPECT_NO_THROW(cache.set("key1", 1));
    EXPECT_NO_THROW(cache.get("key1"));
}

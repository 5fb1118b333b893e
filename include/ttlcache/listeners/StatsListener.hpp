#pragma once

#include <ttlcache/ICacheListener.hpp>
#include <cstdint>
#include <atomic>

/**
 * @brief Слушатель для сбора статистики кэша
 * @tparam K Тип ключа
 * @tparam V Тип значения
 *
 * Собирает:
 * - hits/misses — для расчёта hit rate (просроченная запись — miss)
 * - inserts/updates/removes — операции вызывающего кода
 * - expirations/sweeps — работа фоновой очистки
 *
 * Использование:
 *   auto stats = std::make_shared<StatsListener<std::string, int>>();
 *   cache.addListener(stats);
 *   // ... работа с кэшем ...
 *   std::cout << "Hit rate: " << stats->hitRate() << std::endl;
 *
 * Примечание: счётчики atomic — события приходят и из потока очистки.
 */
template<typename K, typename V>
class StatsListener : public ICacheListener<K, V> {
public:
    void onHit(const K& key) override {
        (void)key;
        ++hits_;
    }

    void onMiss(const K& key) override {
        (void)key;
        ++misses_;
    }

    void onInsert(const K& key, const V& value) override {
        (void)key; (void)value;
        ++inserts_;
    }

    void onUpdate(const K& key, const V& value) override {
        (void)key; (void)value;
        ++updates_;
    }

    void onRemove(const K& key) override {
        (void)key;
        ++removes_;
    }

    void onExpire(const K& key) override {
        (void)key;
        ++expirations_;
    }

    void onSweep(size_t removed) override {
        (void)removed;
        ++sweeps_;
    }

    void onClear(size_t count) override {
        (void)count;
        ++clears_;
    }

    // ==================== Геттеры ====================

    uint64_t hits() const { return hits_; }
    uint64_t misses() const { return misses_; }
    uint64_t inserts() const { return inserts_; }
    uint64_t updates() const { return updates_; }
    uint64_t removes() const { return removes_; }
    uint64_t expirations() const { return expirations_; }
    uint64_t sweeps() const { return sweeps_; }
    uint64_t clears() const { return clears_; }

    uint64_t totalRequests() const {
        return hits_ + misses_;
    }

    /**
     * @brief Доля попаданий в кэш (0.0 - 1.0)
     * @return hit rate или 0.0 если запросов не было
     */
    double hitRate() const {
        uint64_t total = totalRequests();
        if (total == 0) return 0.0;
        return static_cast<double>(hits_) / static_cast<double>(total);
    }

    void reset() {
        hits_ = 0;
        misses_ = 0;
        inserts_ = 0;
        updates_ = 0;
        removes_ = 0;
        expirations_ = 0;
        sweeps_ = 0;
        clears_ = 0;
    }

private:
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> inserts_{0};
    std::atomic<uint64_t> updates_{0};
    std::atomic<uint64_t> removes_{0};
    std::atomic<uint64_t> expirations_{0};
    std::atomic<uint64_t> sweeps_{0};
    std::atomic<uint64_t> clears_{0};
};

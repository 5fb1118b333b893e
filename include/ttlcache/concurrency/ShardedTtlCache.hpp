#pragma once

#include <ttlcache/ICache.hpp>
#include <ttlcache/TtlCache.hpp>
#include <ttlcache/CacheConfig.hpp>
#include <ttlcache/concurrency/Sweeper.hpp>

#include <algorithm>
#include <array>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <vector>

/**
 * @brief Шардированный кэш с TTL для высокой конкурентности
 * @tparam K Тип ключа (должен быть hashable)
 * @tparam V Тип значения
 * @tparam ShardCount Количество шардов (рекомендуется степень 2)
 *
 * Распределяет ключи по независимым TtlCache через хэш-функцию.
 * У каждого шарда свой shared_mutex — потоки, работающие с разными
 * шардами, не блокируют друг друга.
 *
 * Фоновая очистка одна на весь кэш: шарды создаются без собственного
 * Sweeper, а общий поток по очереди чистит каждый. onExpire приходит
 * из шардов, onSweep и onClear — один раз на весь кэш с общим счётом.
 *
 * @code
 *   ShardedTtlCache<std::string, int, 16> cache(
 *       CacheConfig::withSweep(std::chrono::minutes(5), std::chrono::seconds(30)));
 *   cache.set("key", 42);
 * @endcode
 *
 * @note count() — сумма по шардам, не атомарный snapshot.
 */
template<typename K, typename V, size_t ShardCount = 16>
class ShardedTtlCache : public ICache<K, V> {
public:
    static_assert(ShardCount > 0, "ShardCount must be greater than 0");

    using Duration = ExpirationClock::Duration;
    using Shard = TtlCache<K, V>;
    using Listener = ICacheListener<K, V>;

    /**
     * @brief Конструктор
     * @param config Конфигурация; defaultTtl применяется в каждом шарде,
     *               cleanupInterval — к общему потоку очистки
     */
    explicit ShardedTtlCache(CacheConfig config)
        : config_(std::move(config))
    {
        CacheConfig shardConfig = CacheConfig::lazyOnly(config_.defaultTtl);
        shardConfig.name = config_.name;

        for (size_t i = 0; i < ShardCount; ++i) {
            shards_[i] = std::make_unique<Shard>(shardConfig);
        }

        if (config_.sweepEnabled()) {
            sweeper_ = std::make_unique<Sweeper>(config_.cleanupInterval,
                                                 [this]() { removeExpired(); });
        }
    }

    ShardedTtlCache(Duration defaultTtl, Duration cleanupInterval)
        : ShardedTtlCache(CacheConfig::withSweep(defaultTtl, cleanupInterval))
    {}

    ~ShardedTtlCache() override {
        close();
    }

    ShardedTtlCache(const ShardedTtlCache&) = delete;
    ShardedTtlCache& operator=(const ShardedTtlCache&) = delete;

    void set(const K& key, const V& value,
             Duration ttl = ExpirationClock::kUseDefaultTtl) override {
        getShard(key).set(key, value, ttl);
    }

    std::optional<V> get(const K& key) override {
        return getShard(key).get(key);
    }

    std::optional<Entry<V>> getItem(const K& key) override {
        return getShard(key).getItem(key);
    }

    bool remove(const K& key) override {
        return getShard(key).remove(key);
    }

    bool isExpired(const K& key) const override {
        return getShard(key).isExpired(key);
    }

    /**
     * @brief Общее количество записей
     * @note Сумма размеров всех шардов (не атомарный snapshot)
     */
    size_t count() const override {
        size_t total = 0;
        for (const auto& shard : shards_) {
            total += shard->count();
        }
        return total;
    }

    /**
     * @brief Очистить весь кэш
     * @note Шарды очищаются последовательно
     */
    void clear() override {
        size_t removed = 0;
        for (auto& shard : shards_) {
            removed += shard->clearEntries();
        }
        notify([&](Listener& l) { l.onClear(removed); });
    }

    std::optional<Duration> timeToLive(const K& key) const override {
        return getShard(key).timeToLive(key);
    }

    /**
     * @brief Один проход очистки по всем шардам
     * @return Общее количество удалённых записей
     */
    size_t removeExpired() override {
        size_t removed = 0;
        for (auto& shard : shards_) {
            removed += shard->expireEntries();
        }
        if (removed > 0) {
            notify([&](Listener& l) { l.onSweep(removed); });
        }
        return removed;
    }

    void close() override {
        if (sweeper_) {
            sweeper_->stop();
        }
    }

    bool sweepRunning() const {
        return sweeper_ && sweeper_->running();
    }

    /**
     * @brief Ключи живых записей всех шардов
     * @note Шарды обходятся по очереди, не атомарный snapshot
     */
    std::vector<K> keys() const {
        std::vector<K> result;
        for (const auto& shard : shards_) {
            auto shardKeys = shard->keys();
            result.insert(result.end(), shardKeys.begin(), shardKeys.end());
        }
        return result;
    }

    /**
     * @brief Добавить слушателя во все шарды
     */
    void addListener(std::shared_ptr<Listener> listener) {
        if (!listener) {
            return;
        }
        for (auto& shard : shards_) {
            shard->addListener(listener);
        }
        std::lock_guard<std::mutex> lock(listenersMutex_);
        listeners_.push_back(std::move(listener));
    }

    /**
     * @brief Удалить слушателя из всех шардов
     */
    void removeListener(const std::shared_ptr<Listener>& listener) {
        for (auto& shard : shards_) {
            shard->removeListener(listener);
        }
        std::lock_guard<std::mutex> lock(listenersMutex_);
        listeners_.erase(
            std::remove(listeners_.begin(), listeners_.end(), listener),
            listeners_.end()
        );
    }

    const CacheConfig& config() const {
        return config_;
    }

    /**
     * @brief Количество шардов
     */
    static constexpr size_t shardCount() { return ShardCount; }

    /**
     * @brief Размер конкретного шарда
     */
    size_t shardSize(size_t shardIndex) const {
        if (shardIndex >= ShardCount) {
            throw std::out_of_range("Shard index out of range");
        }
        return shards_[shardIndex]->count();
    }

private:
    Shard& getShard(const K& key) {
        return *shards_[getShardIndex(key)];
    }

    const Shard& getShard(const K& key) const {
        return *shards_[getShardIndex(key)];
    }

    size_t getShardIndex(const K& key) const {
        std::hash<K> hasher;
        return hasher(key) % ShardCount;
    }

    template<typename Action>
    void notify(Action&& action) {
        std::vector<std::shared_ptr<Listener>> snapshot;
        {
            std::lock_guard<std::mutex> lock(listenersMutex_);
            if (listeners_.empty()) return;
            snapshot = listeners_;
        }
        for (auto& listener : snapshot) {
            action(*listener);
        }
    }

private:
    CacheConfig config_;
    std::array<std::unique_ptr<Shard>, ShardCount> shards_;

    // Слушатели событий уровня всего кэша (onSweep, onClear)
    std::vector<std::shared_ptr<Listener>> listeners_;
    std::mutex listenersMutex_;

    std::unique_ptr<Sweeper> sweeper_;
};

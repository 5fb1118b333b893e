#pragma once

#include <ttlcache/ICacheListener.hpp>
#include <iostream>
#include <mutex>
#include <string>

/**
 * @brief Слушатель для логирования событий кэша
 * @tparam K Тип ключа (должен поддерживать вывод в ostream)
 * @tparam V Тип значения (должен поддерживать вывод в ostream)
 *
 * Использование:
 *   auto logger = std::make_shared<LoggingListener<std::string, int>>(
 *       cache.config().name);
 *   cache.addListener(logger);
 *
 * Строки пишутся под мьютексом: события приходят из разных потоков,
 * включая поток фоновой очистки.
 */
template<typename K, typename V>
class LoggingListener : public ICacheListener<K, V> {
public:
    /**
     * @param prefix Префикс для всех сообщений (например, имя кэша)
     * @param os Поток вывода (по умолчанию std::cout)
     */
    explicit LoggingListener(const std::string& prefix = "TtlCache",
                             std::ostream& os = std::cout)
        : prefix_(prefix)
        , os_(os)
    {}

    void onHit(const K& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        os_ << "[" << prefix_ << "] HIT: " << key << "\n";
    }

    void onMiss(const K& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        os_ << "[" << prefix_ << "] MISS: " << key << "\n";
    }

    void onInsert(const K& key, const V& value) override {
        std::lock_guard<std::mutex> lock(mutex_);
        os_ << "[" << prefix_ << "] INSERT: " << key << " = " << value << "\n";
    }

    void onUpdate(const K& key, const V& value) override {
        std::lock_guard<std::mutex> lock(mutex_);
        os_ << "[" << prefix_ << "] UPDATE: " << key << " = " << value << "\n";
    }

    void onRemove(const K& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        os_ << "[" << prefix_ << "] REMOVE: " << key << "\n";
    }

    void onExpire(const K& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        os_ << "[" << prefix_ << "] EXPIRE: " << key << "\n";
    }

    void onSweep(size_t removed) override {
        std::lock_guard<std::mutex> lock(mutex_);
        os_ << "[" << prefix_ << "] SWEEP: " << removed << " expired elements\n";
    }

    void onClear(size_t count) override {
        std::lock_guard<std::mutex> lock(mutex_);
        os_ << "[" << prefix_ << "] CLEAR: " << count << " elements\n";
    }

private:
    std::string prefix_;
    std::ostream& os_;
    std::mutex mutex_;
};

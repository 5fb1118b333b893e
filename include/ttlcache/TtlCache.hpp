#pragma once

#include <ttlcache/ICache.hpp>
#include <ttlcache/ICacheListener.hpp>
#include <ttlcache/CacheConfig.hpp>
#include <ttlcache/Entry.hpp>
#include <ttlcache/concurrency/Sweeper.hpp>
#include <ttlcache/expiration/ExpirationClock.hpp>

#include <algorithm>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

template<typename K, typename V, size_t ShardCount>
class ShardedTtlCache;

/**
 * @brief Потокобезопасный кэш с TTL на каждую запись и фоновой очисткой
 * @tparam K Тип ключа (должен быть hashable для unordered_map)
 * @tparam V Тип значения
 *
 * Архитектура:
 * - Данные хранятся в std::unordered_map<K, Entry<V>> — O(1) доступ
 * - Один shared_mutex на карту:
 *   get, getItem, isExpired, count, timeToLive, keys — shared lock
 *   set, remove, clear, фаза удаления очистки        — exclusive lock
 * - Слушатели вызываются после снятия блокировки (Observer pattern)
 *
 * Два механизма истечения:
 * 1. Lazy — get() скрывает просроченную запись, но не удаляет её
 * 2. Sweep — фоновый Sweeper раз в cleanupInterval удаляет просроченные
 *
 * Пример использования:
 * @code
 *   // TTL 5 минут, очистка раз в 10 минут
 *   TtlCache<std::string, int> cache(std::chrono::minutes(5),
 *                                    std::chrono::minutes(10));
 *
 *   cache.set("a", 1);                           // default TTL
 *   cache.set("b", 2, std::chrono::seconds(1));  // свой TTL
 *   cache.set("c", 3, ExpirationClock::kNoExpiration);
 *
 *   if (auto value = cache.get("a")) { ... }
 *   cache.close();  // остановить фоновую очистку
 * @endcode
 *
 * @note count() возвращает число хранимых записей, включая просроченные,
 *       которые ещё не удалены очисткой. Это не число живых записей.
 * @note remove() работает по физическому наличию: просроченную, но ещё
 *       не удалённую запись можно удалить, и это считается успехом.
 */
template<typename K, typename V>
class TtlCache : public ICache<K, V> {
public:
    using Duration = ExpirationClock::Duration;
    using Listener = ICacheListener<K, V>;

    /**
     * @brief Конструктор из двух длительностей
     * @param defaultTtl TTL для set() без явного времени жизни (<= 0 — бессрочно)
     * @param cleanupInterval Период фоновой очистки (<= 0 — отключена)
     */
    TtlCache(Duration defaultTtl, Duration cleanupInterval)
        : TtlCache(CacheConfig::withSweep(defaultTtl, cleanupInterval))
    {}

    /**
     * @brief Конструктор из конфигурации
     *
     * Если cleanupInterval > 0, запускает фоновый Sweeper,
     * привязанный к этому экземпляру.
     */
    explicit TtlCache(CacheConfig config)
        : config_(std::move(config))
    {
        if (config_.sweepEnabled()) {
            sweeper_ = std::make_unique<Sweeper>(config_.cleanupInterval,
                                                 [this]() { removeExpired(); });
        }
    }

    ~TtlCache() override {
        close();
    }

    // Запрещаем копирование и перемещение: фоновый поток держит this
    TtlCache(const TtlCache&) = delete;
    TtlCache& operator=(const TtlCache&) = delete;
    TtlCache(TtlCache&&) = delete;
    TtlCache& operator=(TtlCache&&) = delete;

    /**
     * @brief Добавить или перезаписать значение
     *
     * Логика:
     * 1. ttl == 0 — подставляем defaultTtl из конфигурации
     * 2. ttl > 0  — expiration = now + ttl, иначе запись бессрочна
     * 3. Под exclusive lock безусловно заменяем запись целиком
     */
    void set(const K& key, const V& value,
             Duration ttl = ExpirationClock::kUseDefaultTtl) override {
        if (ttl == ExpirationClock::kUseDefaultTtl) {
            ttl = config_.defaultTtl;
        }

        Entry<V> entry;
        entry.value = value;
        entry.expiration = ExpirationClock::stampFor(ttl);

        bool existed = false;
        {
            std::unique_lock lock(mutex_);
            entry.created = Entry<V>::SystemClock::now();
            auto [it, inserted] = data_.insert_or_assign(key, std::move(entry));
            (void)it;
            existed = !inserted;
        }

        if (existed) {
            notify([&](Listener& l) { l.onUpdate(key, value); });
        } else {
            notify([&](Listener& l) { l.onInsert(key, value); });
        }
    }

    /**
     * @brief Получить значение по ключу
     *
     * Просроченная запись возвращается как отсутствующая, но из карты
     * не удаляется — это задача очистки или следующего set/remove.
     */
    std::optional<V> get(const K& key) override {
        std::optional<V> result;
        {
            std::shared_lock lock(mutex_);
            auto it = data_.find(key);
            if (it != data_.end() && !it->second.isExpired()) {
                result = it->second.value;
            }
        }

        if (result) {
            notify([&](Listener& l) { l.onHit(key); });
        } else {
            notify([&](Listener& l) { l.onMiss(key); });
        }
        return result;
    }

    /**
     * @brief Получить копию записи целиком
     * @return Entry (значение, время создания, метка истечения) или nullopt
     */
    std::optional<Entry<V>> getItem(const K& key) override {
        std::optional<Entry<V>> result;
        {
            std::shared_lock lock(mutex_);
            auto it = data_.find(key);
            if (it != data_.end() && !it->second.isExpired()) {
                result = it->second;
            }
        }

        if (result) {
            notify([&](Listener& l) { l.onHit(key); });
        } else {
            notify([&](Listener& l) { l.onMiss(key); });
        }
        return result;
    }

    /**
     * @brief Удалить запись
     * @return false если ключа физически нет в карте
     *
     * Срок действия не проверяется.
     */
    bool remove(const K& key) override {
        {
            std::unique_lock lock(mutex_);
            if (data_.erase(key) == 0) {
                return false;
            }
        }

        notify([&](Listener& l) { l.onRemove(key); });
        return true;
    }

    /**
     * @brief true если ключа нет или он просрочен
     *
     * Только запрос — запись не удаляется.
     */
    bool isExpired(const K& key) const override {
        std::shared_lock lock(mutex_);
        auto it = data_.find(key);
        if (it == data_.end()) {
            return true;
        }
        return it->second.isExpired();
    }

    size_t count() const override {
        std::shared_lock lock(mutex_);
        return data_.size();
    }

    void clear() override {
        size_t removed = clearEntries();
        notify([&](Listener& l) { l.onClear(removed); });
    }

    std::optional<Duration> timeToLive(const K& key) const override {
        std::shared_lock lock(mutex_);
        auto it = data_.find(key);
        if (it == data_.end()) {
            return std::nullopt;
        }

        auto now = ExpirationClock::now();
        if (it->second.isExpired(now)) {
            return std::nullopt;
        }
        return ExpirationClock::remaining(it->second.expiration, now);
    }

    /**
     * @brief Ключи живых записей (снимок)
     */
    std::vector<K> keys() const {
        std::vector<K> result;
        std::shared_lock lock(mutex_);
        auto now = ExpirationClock::now();
        result.reserve(data_.size());
        for (const auto& [key, entry] : data_) {
            if (!entry.isExpired(now)) {
                result.push_back(key);
            }
        }
        return result;
    }

    /**
     * @brief Один проход очистки
     * @return Количество удалённых записей
     *
     * Две фазы:
     * 1. Под shared lock собираем ключи с истёкшей меткой
     * 2. Под exclusive lock удаляем каждый, перепроверив метку —
     *    запись могла быть перезаписана с новым TTL между фазами
     *
     * Этот же метод выполняет фоновый Sweeper.
     */
    size_t removeExpired() override {
        size_t removed = expireEntries();
        if (removed > 0) {
            notify([&](Listener& l) { l.onSweep(removed); });
        }
        return removed;
    }

    /**
     * @brief Остановить фоновую очистку и дождаться выхода потока
     *
     * Идемпотентен. После close() кэш продолжает работать,
     * истечение остаётся только ленивым.
     */
    void close() override {
        if (sweeper_) {
            sweeper_->stop();
        }
    }

    /**
     * @brief Работает ли фоновая очистка
     *
     * Без блокировок: sweeper_ задаётся только в конструкторе,
     * поэтому метод можно вызывать из слушателя во время close().
     */
    bool sweepRunning() const {
        return sweeper_ && sweeper_->running();
    }

    const CacheConfig& config() const {
        return config_;
    }

    // ==================== Управление слушателями ====================

    /**
     * @brief Добавить слушателя событий
     */
    void addListener(std::shared_ptr<Listener> listener) {
        if (!listener) {
            return;
        }
        std::lock_guard<std::mutex> lock(listenersMutex_);
        listeners_.push_back(std::move(listener));
    }

    /**
     * @brief Удалить слушателя
     */
    void removeListener(const std::shared_ptr<Listener>& listener) {
        std::lock_guard<std::mutex> lock(listenersMutex_);
        listeners_.erase(
            std::remove(listeners_.begin(), listeners_.end(), listener),
            listeners_.end()
        );
    }

private:
    // Шардированный кэш сам сообщает об очистке одним событием на проход
    template<typename, typename, size_t>
    friend class ShardedTtlCache;

    /**
     * @brief Проход очистки без события onSweep
     *
     * onExpire отправляется по каждому удалённому ключу.
     */
    size_t expireEntries() {
        std::vector<K> candidates = collectExpired();
        if (candidates.empty()) {
            return 0;
        }
        beforeExpiredDelete();

        std::vector<K> removed;
        removed.reserve(candidates.size());
        {
            std::unique_lock lock(mutex_);
            auto now = ExpirationClock::now();
            for (auto& key : candidates) {
                auto it = data_.find(key);
                if (it != data_.end() && it->second.isExpired(now)) {
                    data_.erase(it);
                    removed.push_back(std::move(key));
                }
            }
        }

        for (const auto& key : removed) {
            notify([&](Listener& l) { l.onExpire(key); });
        }
        return removed.size();
    }

    /**
     * @brief Удалить все записи без события onClear
     * @return Сколько записей было
     */
    size_t clearEntries() {
        std::unique_lock lock(mutex_);
        size_t removed = data_.size();
        data_.clear();
        return removed;
    }

    std::vector<K> collectExpired() const {
        std::vector<K> expired;
        std::shared_lock lock(mutex_);
        auto now = ExpirationClock::now();
        for (const auto& [key, entry] : data_) {
            if (entry.isExpired(now)) {
                expired.push_back(key);
            }
        }
        return expired;
    }

    /**
     * @brief Разослать событие слушателям
     *
     * Список копируется под мьютексом, колбэки вызываются без него.
     */
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

protected:
    /**
     * @brief Точка между фазами очистки: ключи собраны, exclusive lock ещё не взят
     *
     * Ничего не делает. Наследник в тестах переопределяет её, чтобы
     * перезаписать ключ ровно в этом окне.
     */
    virtual void beforeExpiredDelete() {}

private:
    CacheConfig config_;
    std::unordered_map<K, Entry<V>> data_;
    mutable std::shared_mutex mutex_;

    std::vector<std::shared_ptr<Listener>> listeners_;
    mutable std::mutex listenersMutex_;

    // Объявлен после карты и слушателей: поток очистки должен остановиться раньше,
    // чем будут разрушены карта и слушатели
    std::unique_ptr<Sweeper> sweeper_;
};

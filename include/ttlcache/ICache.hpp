#pragma once

#include <ttlcache/Entry.hpp>
#include <ttlcache/expiration/ExpirationClock.hpp>
#include <optional>
#include <cstddef>

/**
 * @brief Базовый интерфейс кэша с TTL
 * @tparam K Тип ключа
 * @tparam V Тип значения
 *
 * "Не найдено" возвращается значением (nullopt / false), а не исключением.
 */
template <typename K, typename V>
class ICache
{
public:
    using Duration = ExpirationClock::Duration;

    virtual ~ICache() = default;

    /**
     * @brief Поместить значение в кэш
     * @param key Ключ
     * @param value Значение
     * @param ttl Время жизни; kUseDefaultTtl — TTL из конфигурации,
     *            kNoExpiration — бессрочно
     */
    virtual void set(const K &key, const V &value,
                     Duration ttl = ExpirationClock::kUseDefaultTtl) = 0;

    /**
     * @brief Получить значение по ключу
     * @return Значение, либо nullopt если ключа нет или он просрочен
     */
    virtual std::optional<V> get(const K &key) = 0;

    /**
     * @brief Получить копию записи целиком (значение, время создания, метку истечения)
     * @return Запись, либо nullopt если ключа нет или он просрочен
     */
    virtual std::optional<Entry<V>> getItem(const K &key) = 0;

    /**
     * @brief Удалить значение по ключу
     * @return true если запись существовала (даже просроченная), иначе false
     */
    virtual bool remove(const K &key) = 0;

    /**
     * @brief Проверить, отсутствует ли живая запись
     * @return true если ключа нет или он просрочен
     */
    virtual bool isExpired(const K &key) const = 0;

    /**
     * @brief Количество хранимых записей, включая ещё не удалённые просроченные
     */
    virtual size_t count() const = 0;

    /**
     * @brief Очистить кэш
     */
    virtual void clear() = 0;

    /**
     * @brief Оставшееся время жизни
     * @return nullopt если ключа нет, он просрочен или бессрочен
     */
    virtual std::optional<Duration> timeToLive(const K &key) const = 0;

    /**
     * @brief Синхронно удалить все просроченные записи
     * @return Количество удалённых записей
     */
    virtual size_t removeExpired() = 0;

    /**
     * @brief Остановить фоновую очистку и дождаться её завершения
     */
    virtual void close() = 0;
};

#pragma once

#include <ttlcache/expiration/ExpirationClock.hpp>
#include <chrono>

/**
 * @brief Запись кэша
 * @tparam V Тип значения
 *
 * - value      — хранимое значение
 * - created    — момент вставки (только для диагностики)
 * - expiration — метка истечения в наносекундах, 0 = бессрочно
 *
 * Запись заменяется целиком при повторном set() того же ключа.
 * Чтение запись не изменяет: TTL фиксированный, не скользящий.
 */
template<typename V>
struct Entry {
    using SystemClock = std::chrono::system_clock;

    V value{};
    SystemClock::time_point created{};
    ExpirationClock::Stamp expiration = ExpirationClock::kNeverExpires;

    bool neverExpires() const {
        return expiration == ExpirationClock::kNeverExpires;
    }

    bool isExpired(ExpirationClock::Stamp now = ExpirationClock::now()) const {
        return ExpirationClock::isExpired(expiration, now);
    }
};

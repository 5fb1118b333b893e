#pragma once

#include <chrono>
#include <cstdint>
#include <limits>
#include <optional>

/**
 * @brief Источник времени и метки истечения для TtlCache
 *
 * Время истечения хранится в записи как целое число наносекунд
 * от эпохи steady_clock (Stamp). Значение 0 зарезервировано под
 * "никогда не истекает".
 *
 * Три варианта TTL при вставке:
 * - kUseDefaultTtl (0)  — берём TTL из конфигурации кэша
 * - > 0                 — истекает через ttl от текущего момента
 * - kNoExpiration (< 0) — живёт вечно, даже если задан default TTL
 *
 * @code
 *   auto stamp = ExpirationClock::stampFor(std::chrono::seconds(5));
 *   ExpirationClock::isExpired(stamp, ExpirationClock::now());  // false
 * @endcode
 */
struct ExpirationClock {
    using Clock = std::chrono::steady_clock;
    using Duration = Clock::duration;
    using Stamp = int64_t;

    /// Метка "никогда не истекает"
    static constexpr Stamp kNeverExpires = 0;

    /// TTL не задан — использовать default TTL кэша
    static constexpr Duration kUseDefaultTtl = Duration::zero();

    /// Явный бесконечный TTL
    static constexpr Duration kNoExpiration = Duration(-1);

    /// Самая дальняя метка: now + ttl насыщается до неё
    static constexpr Stamp kMaxStamp = std::numeric_limits<Stamp>::max();

    /**
     * @brief Текущее время в наносекундах
     * @note Всегда > 0, поэтому не пересекается с kNeverExpires
     */
    static Stamp now() {
        auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
            Clock::now().time_since_epoch()).count();
        return ns > 0 ? ns : 1;
    }

    /**
     * @brief Метка истечения для TTL, отсчитанного от текущего момента
     * @param ttl Время жизни
     * @return now() + ttl (не больше kMaxStamp), либо kNeverExpires если ttl <= 0
     */
    static Stamp stampFor(Duration ttl) {
        if (ttl <= Duration::zero()) {
            return kNeverExpires;
        }
        Stamp current = now();
        Stamp ttlNs = std::chrono::duration_cast<std::chrono::nanoseconds>(ttl).count();
        if (ttlNs > kMaxStamp - current) {
            return kMaxStamp;
        }
        return current + ttlNs;
    }

    /**
     * @brief Истёк ли срок
     *
     * Истёкшей считается только метка строго в прошлом.
     */
    static bool isExpired(Stamp expiration, Stamp now) {
        return expiration > kNeverExpires && now > expiration;
    }

    /**
     * @brief Оставшееся время жизни
     * @return nullopt для бессрочной метки, zero если уже истекла
     */
    static std::optional<Duration> remaining(Stamp expiration, Stamp now) {
        if (expiration == kNeverExpires) {
            return std::nullopt;
        }
        if (now >= expiration) {
            return Duration::zero();
        }
        return std::chrono::duration_cast<Duration>(
            std::chrono::nanoseconds(expiration - now));
    }
};

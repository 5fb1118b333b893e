#pragma once

#include <ttlcache/expiration/ExpirationClock.hpp>
#include <string>

/**
 * @brief Конфигурация TtlCache
 *
 * Два параметра определяют поведение:
 * - defaultTtl      — TTL для set() без явного времени жизни
 * - cleanupInterval — период фоновой очистки (0 — очистка отключена,
 *                     просроченные записи только скрываются при чтении)
 *
 * @code
 *   // Записи живут 5 минут, очистка раз в минуту
 *   auto config = CacheConfig::withSweep(std::chrono::minutes(5),
 *                                        std::chrono::minutes(1));
 *   TtlCache<std::string, int> cache(config);
 * @endcode
 */
struct CacheConfig {
    using Duration = ExpirationClock::Duration;

    /// TTL по умолчанию (<= 0 — бессрочно)
    Duration defaultTtl = Duration::zero();

    /// Период фоновой очистки (<= 0 — без фонового потока)
    Duration cleanupInterval = Duration::zero();

    /// Имя кэша, используется как префикс в логах
    std::string name = "TtlCache";

    // ========== ПРЕДУСТАНОВЛЕННЫЕ КОНФИГУРАЦИИ ==========

    /// Только ленивое истечение, без фонового потока
    static CacheConfig lazyOnly(Duration defaultTtl) {
        CacheConfig config;
        config.defaultTtl = defaultTtl;
        return config;
    }

    /// Ленивое истечение плюс периодическая очистка
    static CacheConfig withSweep(Duration defaultTtl, Duration interval) {
        CacheConfig config;
        config.defaultTtl = defaultTtl;
        config.cleanupInterval = interval;
        return config;
    }

    // ========== ВСПОМОГАТЕЛЬНЫЕ МЕТОДЫ ==========

    bool sweepEnabled() const {
        return cleanupInterval > Duration::zero();
    }

    bool hasDefaultTtl() const {
        return defaultTtl > Duration::zero();
    }
};

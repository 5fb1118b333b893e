#pragma once

#include <ttlcache/TtlCache.hpp>
#include <ttlcache/listeners/StatsListener.hpp>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

/**
 * @brief Данные сессии пользователя
 */
struct Session {
    std::string userId;
    std::string role;
    uint64_t issuedAt = 0;
};

inline std::ostream& operator<<(std::ostream& os, const Session& session) {
    return os << session.userId << "(" << session.role << ")";
}

/**
 * @brief Хранилище сессий поверх TtlCache
 *
 * Архитектура:
 * - sessions_: токен -> сессия, TTL сессии по умолчанию
 * - "remember me" токены живут дольше (явный TTL при login)
 * - сервисные токены бессрочны (kNoExpiration)
 *
 * Фоновая очистка убирает сессии, к которым никто не обращается,
 * чтобы память не росла от брошенных токенов.
 */
class SessionService {
public:
    using Duration = ExpirationClock::Duration;

    /**
     * @param sessionTtl Время жизни обычной сессии
     * @param cleanupInterval Период фоновой очистки
     */
    SessionService(Duration sessionTtl, Duration cleanupInterval)
        : sessions_(makeConfig(sessionTtl, cleanupInterval))
        , stats_(std::make_shared<StatsListener<std::string, Session>>())
    {
        sessions_.addListener(stats_);
    }

    /**
     * @brief Выдать токен
     * @param rememberMe Увеличенный TTL вместо default
     */
    std::string login(const std::string& userId, const std::string& role,
                      bool rememberMe = false) {
        std::string token = "tok-" + userId + "-" + std::to_string(++issued_);
        Session session{userId, role, issued_};

        if (rememberMe) {
            sessions_.set(token, session, sessions_.config().defaultTtl * 10);
        } else {
            sessions_.set(token, session);
        }
        return token;
    }

    /**
     * @brief Бессрочный токен для внутренних сервисов
     */
    std::string issueServiceToken(const std::string& serviceName) {
        std::string token = "svc-" + serviceName;
        sessions_.set(token, Session{serviceName, "service", ++issued_},
                      ExpirationClock::kNoExpiration);
        return token;
    }

    std::optional<Session> authenticate(const std::string& token) {
        return sessions_.get(token);
    }

    /**
     * @return false если токен неизвестен
     */
    bool logout(const std::string& token) {
        return sessions_.remove(token);
    }

    std::optional<Duration> remaining(const std::string& token) const {
        return sessions_.timeToLive(token);
    }

    size_t storedSessions() const {
        return sessions_.count();
    }

    void shutdown() {
        sessions_.close();
    }

    void printStats() const {
        std::cout << "\n=== SessionService Statistics ===\n\n";
        std::cout << "  Stored:      " << sessions_.count() << "\n";
        std::cout << "  Hits:        " << stats_->hits() << "\n";
        std::cout << "  Misses:      " << stats_->misses() << "\n";
        std::cout << "  Expired:     " << stats_->expirations() << "\n";
        std::cout << "  Hit Rate:    " << std::fixed << std::setprecision(1)
                  << (stats_->hitRate() * 100) << "%\n\n";
    }

    TtlCache<std::string, Session>& cache() { return sessions_; }

private:
    static CacheConfig makeConfig(Duration sessionTtl, Duration cleanupInterval) {
        auto config = CacheConfig::withSweep(sessionTtl, cleanupInterval);
        config.name = "Sessions";
        return config;
    }

private:
    TtlCache<std::string, Session> sessions_;
    std::shared_ptr<StatsListener<std::string, Session>> stats_;
    uint64_t issued_ = 0;
};

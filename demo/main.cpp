#include "services/SessionService.hpp"
#include <ttlcache/TtlCache.hpp>
#include <ttlcache/listeners/LoggingListener.hpp>
#include <iostream>
#include <thread>
#include <chrono>

/**
 * @brief Демонстрация кэша с TTL на примере хранилища сессий
 *
 * Сценарии:
 * 1. Default TTL, увеличенный TTL и бессрочные токены
 * 2. Ленивое истечение без фоновой очистки — память не освобождается
 * 3. Фоновая очистка освобождает память сама
 * 4. Явная остановка очистки через close()
 */

using namespace std::chrono_literals;

void printSeparator(const std::string& title) {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << "  " << title << "\n";
    std::cout << std::string(60, '=') << "\n\n";
}

void printAuth(SessionService& service, const std::string& token) {
    auto session = service.authenticate(token);
    std::cout << "  " << token << ": ";
    if (session.has_value()) {
        std::cout << "valid, user " << session.value() << "\n";
    } else {
        std::cout << "rejected\n";
    }
}

/**
 * @brief Демо 1: Разные TTL в одном кэше
 */
void demoTtlKinds() {
    printSeparator("Demo 1: Default, Extended and Permanent Tokens");

    SessionService service(300ms, 0ms);

    auto regular = service.login("alice", "user");
    auto remembered = service.login("bob", "admin", true);
    auto serviceToken = service.issueServiceToken("billing");

    std::cout << "Session TTL is 300ms, remember-me is 10x\n\n";
    std::cout << "t=0ms:\n";
    printAuth(service, regular);
    printAuth(service, remembered);
    printAuth(service, serviceToken);

    std::this_thread::sleep_for(400ms);

    std::cout << "\nt=400ms:\n";
    printAuth(service, regular);
    printAuth(service, remembered);
    printAuth(service, serviceToken);

    service.printStats();
}

/**
 * @brief Демо 2: Только ленивое истечение
 *
 * cleanupInterval = 0: просроченные сессии скрываются при чтении,
 * но остаются в памяти, пока их не удалят явно.
 */
void demoLazyOnly() {
    printSeparator("Demo 2: Lazy Expiration Only");

    SessionService service(50ms, 0ms);

    for (int i = 0; i < 100; ++i) {
        service.login("user" + std::to_string(i), "user");
    }

    std::cout << "Stored after 100 logins: " << service.storedSessions() << "\n";
    std::this_thread::sleep_for(200ms);
    std::cout << "Stored 200ms later (all expired): " << service.storedSessions() << "\n";
    std::cout << "Nobody reads them, nobody removes them.\n";
}

/**
 * @brief Демо 3: Фоновая очистка
 */
void demoBackgroundSweep() {
    printSeparator("Demo 3: Background Sweep");

    SessionService service(50ms, 100ms);

    auto logger = std::make_shared<LoggingListener<std::string, Session>>(
        service.cache().config().name);
    service.cache().addListener(logger);

    for (int i = 0; i < 3; ++i) {
        service.login("guest" + std::to_string(i), "guest");
    }

    std::cout << "\nStored after 3 logins: " << service.storedSessions() << "\n";
    std::this_thread::sleep_for(300ms);
    std::cout << "Stored 300ms later: " << service.storedSessions() << "\n";

    service.shutdown();
    service.cache().removeListener(logger);
    service.printStats();
}

/**
 * @brief Демо 4: Остановка фоновой очистки
 */
void demoClose() {
    printSeparator("Demo 4: Closing the Cache");

    TtlCache<std::string, int> cache(20ms, 50ms);
    std::cout << "Sweep running: " << std::boolalpha << cache.sweepRunning() << "\n";

    cache.close();
    std::cout << "Sweep running after close(): " << cache.sweepRunning() << "\n";

    cache.set("counter", 1);
    std::this_thread::sleep_for(100ms);
    std::cout << "Expired entry still stored: count=" << cache.count()
              << ", isExpired=" << cache.isExpired("counter") << "\n";
    std::cout << "Manual sweep removed: " << cache.removeExpired() << "\n";
}

int main() {
    std::cout << "TtlCache Demo\n";

    demoTtlKinds();
    demoLazyOnly();
    demoBackgroundSweep();
    demoClose();

    std::cout << "\nDone.\n";
    return 0;
}

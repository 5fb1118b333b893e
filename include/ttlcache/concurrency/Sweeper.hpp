#pragma once

#include <ttlcache/expiration/ExpirationClock.hpp>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <thread>

/**
 * @brief Периодическая фоновая задача с возможностью остановки
 *
 * Поток ждёт interval на condition_variable, затем выполняет task,
 * и так по кругу до вызова stop().
 *
 * Особенности:
 * - stop() будит поток сразу, не дожидаясь конца интервала
 * - stop() идемпотентен, деструктор вызывает его сам
 * - исключение из task логируется в std::cerr, цикл продолжается
 * - длинный интервал выжидается шагами не больше kMaxWaitStep
 *
 * @code
 *   Sweeper sweeper(std::chrono::seconds(1), [&cache]() {
 *       cache.removeExpired();
 *   });
 *   // ...
 *   sweeper.stop();
 * @endcode
 *
 * @warning stop() нельзя вызывать из самой task — поток не может
 *          дождаться сам себя.
 */
class Sweeper {
public:
    using Duration = ExpirationClock::Duration;
    using Task = std::function<void()>;

    /// Максимальный шаг ожидания на condition_variable
    static constexpr Duration kMaxWaitStep = std::chrono::hours(24);

    /**
     * @brief Конструктор, сразу запускает поток
     * @param interval Период между проходами (должен быть > 0)
     * @param task Задача, выполняемая на каждом проходе
     */
    Sweeper(Duration interval, Task task)
        : interval_(interval)
        , task_(std::move(task))
    {
        if (interval_ <= Duration::zero()) {
            throw std::invalid_argument("Sweep interval must be greater than 0");
        }
        if (!task_) {
            throw std::invalid_argument("Sweep task cannot be empty");
        }

        running_ = true;
        thread_ = std::thread(&Sweeper::loop, this);
    }

    ~Sweeper() {
        stop();
    }

    // Запрещаем копирование и перемещение: поток держит this
    Sweeper(const Sweeper&) = delete;
    Sweeper& operator=(const Sweeper&) = delete;
    Sweeper(Sweeper&&) = delete;
    Sweeper& operator=(Sweeper&&) = delete;

    /**
     * @brief Остановить поток и дождаться его завершения
     *
     * Проход, выполняющийся в момент вызова, доводится до конца.
     */
    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopRequested_ = true;
        }
        condVar_.notify_all();

        std::lock_guard<std::mutex> joinLock(joinMutex_);
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    bool running() const {
        return running_;
    }

    /**
     * @brief Количество завершённых проходов
     */
    uint64_t passes() const {
        return passes_;
    }

    Duration interval() const {
        return interval_;
    }

private:
    void loop() {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!stopRequested_) {
            if (!waitInterval(lock)) {
                break;
            }

            lock.unlock();
            runTask();
            ++passes_;
            lock.lock();
        }
        running_ = false;
    }

    /**
     * @brief Выждать interval_ или до stop()
     * @return false если запрошена остановка
     *
     * wait_for с огромной длительностью переполняет now + rtime
     * внутри стандартной библиотеки, поэтому ждём ограниченными шагами.
     */
    bool waitInterval(std::unique_lock<std::mutex>& lock) {
        Duration left = interval_;
        while (left > Duration::zero()) {
            Duration step = std::min(left, kMaxWaitStep);
            if (condVar_.wait_for(lock, step, [this] { return stopRequested_; })) {
                return false;
            }
            left -= step;
        }
        return true;
    }

    void runTask() {
        try {
            task_();
        } catch (const std::exception& e) {
            std::cerr << "[Sweeper] Sweep pass failed: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "[Sweeper] Sweep pass failed: unknown error" << std::endl;
        }
    }

private:
    Duration interval_;
    Task task_;

    std::thread thread_;
    std::mutex mutex_;
    std::mutex joinMutex_;
    std::condition_variable condVar_;
    bool stopRequested_ = false;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> passes_{0};
};

#pragma once

#include <cstddef>


/**
 * @brief Интерфейс слушателя событий кэша
 * @tparam K Тип ключа
 * @tparam V Тип значения
 *
 * Колбэки вызываются после снятия блокировки кэша: в потоке вызывающего
 * для get/set/remove/clear и в потоке очистки для onExpire/onSweep.
 */
template<typename K, typename V>
class ICacheListener {
public:
    virtual ~ICacheListener() = default;

    virtual void onHit(const K& key) { (void)key; }
    virtual void onMiss(const K& key) { (void)key; }
    virtual void onInsert(const K& key, const V& value) { (void)key; (void)value; }
    virtual void onUpdate(const K& key, const V& value) { (void)key; (void)value; }
    virtual void onRemove(const K& key) { (void)key; }
    virtual void onExpire(const K& key) { (void)key; }
    virtual void onSweep(size_t removed) { (void)removed; }
    virtual void onClear(size_t count) { (void)count; }
};

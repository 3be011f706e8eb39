#pragma once

#include <stepcache/key/CacheKey.hpp>
#include <stepcache/store/StoredRecord.hpp>
#include <cstddef>

/**
 * @brief Интерфейс слушателя событий DiskCache
 *
 * Вызывается синхронно из потока, выполняющего операцию.
 */
class ICacheListener {
public:
    virtual ~ICacheListener() = default;

    virtual void onHit(const CacheKey& key) { (void)key; }
    virtual void onMiss(const CacheKey& key) { (void)key; }
    virtual void onStore(const CacheKey& key, const StoredRecord& record) {
        (void)key; (void)record;
    }
    virtual void onUpdate(const CacheKey& key, const StoredRecord& oldRecord,
                          const StoredRecord& newRecord) {
        (void)key; (void)oldRecord; (void)newRecord;
    }
    virtual void onRemove(const CacheKey& key) { (void)key; }
    virtual void onClear(size_t count) { (void)count; }
};

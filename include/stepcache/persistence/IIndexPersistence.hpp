#pragma once

#include <stepcache/key/CacheKey.hpp>
#include <stepcache/store/StoredRecord.hpp>
#include <utility>
#include <vector>

using IndexEntries = std::vector<std::pair<CacheKey, StoredRecord>>;

/**
 * @brief Интерфейс персистентности индекса кэша (ключ → запись)
 *
 * Отвечает за стратегию сохранения/загрузки индекса.
 * Сами значения лежат в IStorage, индекс хранит только StoredRecord.
 *
 * Реализации:
 * - SnapshotIndexPersistence - полный снимок в одном файле
 */
class IIndexPersistence {
public:
    virtual ~IIndexPersistence() = default;

    /**
     * @brief Загрузить весь индекс
     * @throws CorruptData, StorageIOFailure при ошибке чтения
     */
    virtual IndexEntries load() = 0;

    /**
     * @brief Сохранить весь индекс (полный snapshot)
     * @throws StorageIOFailure при ошибке записи
     */
    virtual void saveAll(const IndexEntries& entries) = 0;

    /**
     * @brief Уведомление о добавлении/обновлении записи
     *
     * Реализация решает, нужно ли сразу сохранять или накапливать.
     */
    virtual void onPut(const CacheKey& key, const StoredRecord& record) = 0;

    virtual void onRemove(const CacheKey& key) = 0;

    virtual void onClear() = 0;

    /**
     * @brief Принудительно сбросить изменения на диск
     */
    virtual void flush() = 0;

    virtual bool exists() const = 0;
};

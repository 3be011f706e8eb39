#pragma once

#include <stepcache/Settings.hpp>
#include <stepcache/cache/ICache.hpp>
#include <stepcache/key/CacheKey.hpp>
#include <stepcache/listeners/ICacheListener.hpp>
#include <stepcache/persistence/SnapshotIndexPersistence.hpp>
#include <stepcache/store/DiskStorage.hpp>
#include <stepcache/store/TypeRoutingStore.hpp>
#include <algorithm>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <unordered_map>
#include <vector>

/**
 * @brief Кэш значений на диске
 *
 * Архитектура:
 * - Индекс CacheKey → StoredRecord в памяти (std::unordered_map)
 * - Значения лежат в DiskStorage, формат выбирает TypeRoutingStore
 * - Индекс сохраняется в <directory>/index.bin через SnapshotIndexPersistence
 *   и загружается при создании кэша
 * - Слушатели получают уведомления о событиях (Observer pattern)
 *
 * Вытеснения нет: записи живут, пока их не удалят явно.
 *
 * Потокобезопасность через shared_mutex:
 * - get, contains, size, record - shared lock
 * - put, remove, clear, addListener - exclusive lock
 * Кодирование значения в put() выполняется до захвата блокировки.
 * Слушатели вызываются по одному (listenersMutex_), даже из
 * параллельных get().
 *
 * @code
 *   auto settings = std::make_shared<const Settings>(Settings::defaults());
 *   DiskCache cache("/tmp/prices", settings);
 *   cache.put(key, Value::object(table));
 *   auto hit = cache.get(key);
 * @endcode
 */
class DiskCache : public ICache {
public:
    static constexpr const char* INDEX_FILE = "index.bin";

    /**
     * @brief Конструктор
     * @param directory Каталог кэша (создаётся при необходимости)
     * @param settings Реестры сериализаторов
     * @param autoFlush Сохранять индекс после каждого изменения
     * @throws CorruptData если файл индекса повреждён
     */
    DiskCache(const std::filesystem::path& directory,
              std::shared_ptr<const Settings> settings,
              bool autoFlush = true)
        : directory_(directory)
        , storage_(std::make_shared<DiskStorage>(directory))
        , store_(std::move(settings), storage_)
        , persistence_(directory / INDEX_FILE, autoFlush)
    {
        for (auto& [key, record] : persistence_.load()) {
            index_[key] = record;
        }
    }

    /**
     * @brief Значение по ключу
     *
     * Запись индекса, блок данных которой пропал с диска, считается
     * промахом и удаляется из индекса.
     */
    std::optional<Value> get(const CacheKey& key) override {
        StoredRecord stale;
        {
            std::shared_lock lock(mutex_);

            auto it = index_.find(key);
            if (it == index_.end()) {
                notifyMiss(key);
                return std::nullopt;
            }

            if (storage_->exists(it->second.locator)) {
                Value value = store_.fetch(it->second);
                notifyHit(key);
                return value;
            }
            stale = it->second;
        }

        std::unique_lock lock(mutex_);
        auto it = index_.find(key);
        if (it != index_.end() && it->second.locator == stale.locator) {
            persistence_.onRemove(key);
            index_.erase(it);
        }
        notifyMiss(key);
        return std::nullopt;
    }

    /**
     * @brief Добавить или заменить значение
     *
     * Индекс на диске обновляется до изменения индекса в памяти.
     * Если сохранить индекс не удалось, новый блок данных удаляется,
     * и кэш остаётся в прежнем состоянии. При успешной замене старый
     * блок данных удаляется из хранилища.
     *
     * @throws UnsupportedType если значение нельзя закодировать
     * @throws StorageIOFailure если не удалось записать данные или индекс
     */
    void put(const CacheKey& key, const Value& value) override {
        StoredRecord record = store_.store(value);

        std::unique_lock lock(mutex_);
        try {
            persistence_.onPut(key, record);
        } catch (const StepCacheError&) {
            storage_->remove(record.locator);
            throw;
        }

        auto it = index_.find(key);
        if (it != index_.end()) {
            StoredRecord oldRecord = it->second;
            it->second = record;
            storage_->remove(oldRecord.locator);
            notifyUpdate(key, oldRecord, record);
            return;
        }

        index_.emplace(key, record);
        notifyStore(key, record);
    }

    bool remove(const CacheKey& key) override {
        std::unique_lock lock(mutex_);

        auto it = index_.find(key);
        if (it == index_.end()) {
            return false;
        }

        persistence_.onRemove(key);
        StoredRecord record = it->second;
        index_.erase(it);
        storage_->remove(record.locator);
        notifyRemove(key);
        return true;
    }

    void clear() override {
        std::unique_lock lock(mutex_);

        persistence_.onClear();
        size_t count = index_.size();
        for (const auto& [key, record] : index_) {
            storage_->remove(record.locator);
        }
        index_.clear();
        notifyClear(count);
    }

    size_t size() const override {
        std::shared_lock lock(mutex_);
        return index_.size();
    }

    bool contains(const CacheKey& key) const override {
        std::shared_lock lock(mutex_);
        return index_.find(key) != index_.end();
    }

    /**
     * @brief Запись индекса для ключа (маркер, размер, локатор)
     */
    std::optional<StoredRecord> record(const CacheKey& key) const {
        std::shared_lock lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    /**
     * @brief Сохранить индекс на диск (нужно при autoFlush = false)
     */
    void flush() {
        std::unique_lock lock(mutex_);
        persistence_.flush();
    }

    const std::filesystem::path& directory() const {
        return directory_;
    }

    // ==================== Управление слушателями ====================

    void addListener(std::shared_ptr<ICacheListener> listener) {
        if (listener) {
            std::unique_lock lock(mutex_);
            listeners_.push_back(std::move(listener));
        }
    }

    void removeListener(const std::shared_ptr<ICacheListener>& listener) {
        std::unique_lock lock(mutex_);
        listeners_.erase(
            std::remove(listeners_.begin(), listeners_.end(), listener),
            listeners_.end()
        );
    }

private:
    // ==================== Уведомления слушателей ====================
    // get() уведомляет под shared lock, поэтому вызовы слушателей
    // дополнительно сериализуются listenersMutex_: слушателю не нужна
    // своя синхронизация.

    void notifyHit(const CacheKey& key) {
        std::lock_guard<std::mutex> lock(listenersMutex_);
        for (auto& listener : listeners_) {
            listener->onHit(key);
        }
    }

    void notifyMiss(const CacheKey& key) {
        std::lock_guard<std::mutex> lock(listenersMutex_);
        for (auto& listener : listeners_) {
            listener->onMiss(key);
        }
    }

    void notifyStore(const CacheKey& key, const StoredRecord& record) {
        std::lock_guard<std::mutex> lock(listenersMutex_);
        for (auto& listener : listeners_) {
            listener->onStore(key, record);
        }
    }

    void notifyUpdate(const CacheKey& key, const StoredRecord& oldRecord,
                      const StoredRecord& newRecord) {
        std::lock_guard<std::mutex> lock(listenersMutex_);
        for (auto& listener : listeners_) {
            listener->onUpdate(key, oldRecord, newRecord);
        }
    }

    void notifyRemove(const CacheKey& key) {
        std::lock_guard<std::mutex> lock(listenersMutex_);
        for (auto& listener : listeners_) {
            listener->onRemove(key);
        }
    }

    void notifyClear(size_t count) {
        std::lock_guard<std::mutex> lock(listenersMutex_);
        for (auto& listener : listeners_) {
            listener->onClear(count);
        }
    }

    std::filesystem::path directory_;
    std::shared_ptr<DiskStorage> storage_;
    TypeRoutingStore store_;
    SnapshotIndexPersistence persistence_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<CacheKey, StoredRecord> index_;
    std::vector<std::shared_ptr<ICacheListener>> listeners_;
    std::mutex listenersMutex_;
};

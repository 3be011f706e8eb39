#pragma once

#include <stepcache/listeners/ICacheListener.hpp>
#include <atomic>
#include <cstdint>

/**
 * @brief Слушатель для сбора статистики кэша
 *
 * Собирает:
 * - hits/misses - для расчёта hit rate
 * - stores/updates/removes/clears - для анализа поведения
 * - bytesWritten - суммарный размер сохранённых значений
 *
 * Примечание: счётчики atomic для потокобезопасности.
 */
class StatsListener : public ICacheListener {
public:
    void onHit(const CacheKey& key) override {
        (void)key;
        ++hits_;
    }

    void onMiss(const CacheKey& key) override {
        (void)key;
        ++misses_;
    }

    void onStore(const CacheKey& key, const StoredRecord& record) override {
        (void)key;
        ++stores_;
        bytesWritten_ += record.size;
    }

    void onUpdate(const CacheKey& key, const StoredRecord& oldRecord,
                  const StoredRecord& newRecord) override {
        (void)key; (void)oldRecord;
        ++updates_;
        bytesWritten_ += newRecord.size;
    }

    void onRemove(const CacheKey& key) override {
        (void)key;
        ++removes_;
    }

    void onClear(size_t count) override {
        (void)count;
        ++clears_;
    }

    // ==================== Геттеры ====================

    uint64_t hits() const { return hits_; }
    uint64_t misses() const { return misses_; }
    uint64_t stores() const { return stores_; }
    uint64_t updates() const { return updates_; }
    uint64_t removes() const { return removes_; }
    uint64_t clears() const { return clears_; }
    uint64_t bytesWritten() const { return bytesWritten_; }

    uint64_t totalRequests() const {
        return hits_ + misses_;
    }

    /**
     * @brief Доля попаданий в кэш (0.0 - 1.0)
     * @return hit rate или 0.0 если запросов не было
     */
    double hitRate() const {
        uint64_t total = totalRequests();
        if (total == 0) return 0.0;
        return static_cast<double>(hits_) / static_cast<double>(total);
    }

    void reset() {
        hits_ = 0;
        misses_ = 0;
        stores_ = 0;
        updates_ = 0;
        removes_ = 0;
        clears_ = 0;
        bytesWritten_ = 0;
    }

private:
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> stores_{0};
    std::atomic<uint64_t> updates_{0};
    std::atomic<uint64_t> removes_{0};
    std::atomic<uint64_t> clears_{0};
    std::atomic<uint64_t> bytesWritten_{0};
};

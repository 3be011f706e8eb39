#pragma once

#include <stepcache/listeners/ICacheListener.hpp>
#include <iostream>
#include <string>

/**
 * @brief Слушатель для логирования событий кэша
 *
 * Использование:
 *   auto logger = std::make_shared<LoggingListener>("load_prices");
 *   cache.addListener(logger);
 *
 * Строки вида:
 *   [load_prices] MISS: (1, 3fa1...)
 *   [load_prices] STORE: (1, 3fa1...) -> stepcache.Table (2048 bytes, binary)
 *
 * Своей синхронизации нет: DiskCache вызывает слушателей по одному.
 */
class LoggingListener : public ICacheListener {
public:
    /**
     * @brief Конструктор
     * @param prefix Префикс для всех сообщений (например, имя функции)
     * @param os Поток вывода (по умолчанию std::cout)
     */
    explicit LoggingListener(const std::string& prefix = "Cache",
                             std::ostream& os = std::cout)
        : prefix_(prefix)
        , os_(os)
    {}

    void onHit(const CacheKey& key) override {
        os_ << "[" << prefix_ << "] HIT: " << key << "\n";
    }

    void onMiss(const CacheKey& key) override {
        os_ << "[" << prefix_ << "] MISS: " << key << "\n";
    }

    void onStore(const CacheKey& key, const StoredRecord& record) override {
        os_ << "[" << prefix_ << "] STORE: " << key << " -> " << record << "\n";
    }

    void onUpdate(const CacheKey& key, const StoredRecord& oldRecord,
                  const StoredRecord& newRecord) override {
        os_ << "[" << prefix_ << "] UPDATE: " << key
            << " (" << oldRecord << " -> " << newRecord << ")\n";
    }

    void onRemove(const CacheKey& key) override {
        os_ << "[" << prefix_ << "] REMOVE: " << key << "\n";
    }

    void onClear(size_t count) override {
        os_ << "[" << prefix_ << "] CLEAR: " << count << " elements\n";
    }

private:
    std::string prefix_;
    std::ostream& os_;
};

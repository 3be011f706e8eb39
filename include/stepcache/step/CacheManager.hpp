#pragma once

#include <stepcache/Settings.hpp>
#include <stepcache/cache/DiskCache.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

/**
 * @brief Кэши функций-шагов: один DiskCache на имя функции
 *
 * Кэш функции лежит в <settings.cacheDirectory>/<name> и создаётся
 * при первом обращении.
 */
class CacheManager {
public:
    explicit CacheManager(std::shared_ptr<const Settings> settings)
        : settings_(std::move(settings))
    {
        if (!settings_) {
            throw std::invalid_argument("Settings cannot be null");
        }
    }

    /**
     * @throws std::invalid_argument при пустом имени
     */
    std::shared_ptr<DiskCache> getCache(const std::string& name) {
        if (name.empty()) {
            throw std::invalid_argument("Cache name cannot be empty");
        }

        std::lock_guard<std::mutex> lock(mutex_);
        auto it = caches_.find(name);
        if (it != caches_.end()) {
            return it->second;
        }
        auto cache = std::make_shared<DiskCache>(settings_->cacheDirectory / name, settings_);
        caches_.emplace(name, cache);
        return cache;
    }

    /**
     * @brief Сбросить индексы на диск и закрыть все кэши
     */
    void closeAll() {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [name, cache] : caches_) {
            cache->flush();
        }
        caches_.clear();
    }

    size_t openCaches() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return caches_.size();
    }

    const std::shared_ptr<const Settings>& settings() const {
        return settings_;
    }

private:
    std::shared_ptr<const Settings> settings_;
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<DiskCache>> caches_;
};

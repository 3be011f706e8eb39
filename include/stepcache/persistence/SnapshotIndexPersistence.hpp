#pragma once

#include <stepcache/Errors.hpp>
#include <stepcache/persistence/IIndexPersistence.hpp>
#include <stepcache/persistence/IndexCodec.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <system_error>

/**
 * @brief Персистентность индекса на основе полного снимка (snapshot)
 *
 * Стратегия:
 * - При load() - читает весь файл
 * - При изменениях - накапливает в памяти текущее состояние
 * - При flush() или saveAll() - записывает полный снимок
 *
 * Снимок пишется во временный файл и переименовывается,
 * поэтому файл индекса всегда целый.
 */
class SnapshotIndexPersistence : public IIndexPersistence {
public:
    /**
     * @brief Конструктор
     * @param filePath Путь к файлу индекса
     * @param autoFlush Автоматически сохранять при каждом изменении
     */
    explicit SnapshotIndexPersistence(std::filesystem::path filePath, bool autoFlush = false)
        : filePath_(std::move(filePath))
        , autoFlush_(autoFlush)
    {}

    IndexEntries load() override {
        std::lock_guard<std::mutex> lock(mutex_);

        if (!std::filesystem::exists(filePath_)) {
            return {};
        }

        std::ifstream file(filePath_, std::ios::binary);
        if (!file) {
            throw StorageIOFailure("Failed to open file for reading: " + filePath_.string());
        }
        Bytes data = readStream(file);
        if (data.empty()) {
            return {};
        }

        currentState_ = IndexCodec::decode(data);
        dirty_ = false;
        return currentState_;
    }

    void saveAll(const IndexEntries& entries) override {
        std::lock_guard<std::mutex> lock(mutex_);

        IndexEntries previous = std::move(currentState_);
        currentState_ = entries;
        try {
            writeToFile();
        } catch (const StorageIOFailure&) {
            currentState_ = std::move(previous);
            throw;
        }
        dirty_ = false;
    }

    void onPut(const CacheKey& key, const StoredRecord& record) override {
        std::lock_guard<std::mutex> lock(mutex_);

        change([this, &key, &record] {
            auto it = find(key);
            if (it != currentState_.end()) {
                it->second = record;
            } else {
                currentState_.emplace_back(key, record);
            }
        });
    }

    void onRemove(const CacheKey& key) override {
        std::lock_guard<std::mutex> lock(mutex_);

        if (find(key) == currentState_.end()) {
            return;
        }
        change([this, &key] {
            currentState_.erase(find(key));
        });
    }

    void onClear() override {
        std::lock_guard<std::mutex> lock(mutex_);

        change([this] {
            currentState_.clear();
        });
    }

    void flush() override {
        std::lock_guard<std::mutex> lock(mutex_);

        if (dirty_) {
            writeToFile();
            dirty_ = false;
        }
    }

    bool exists() const override {
        return std::filesystem::exists(filePath_);
    }

    bool isDirty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return dirty_;
    }

    const std::filesystem::path& filePath() const {
        return filePath_;
    }

private:
    IndexEntries::iterator find(const CacheKey& key) {
        return std::find_if(currentState_.begin(), currentState_.end(),
            [&key](const auto& entry) {
                return entry.first == key;
            });
    }

    /**
     * @brief Применить изменение к состоянию
     *
     * При autoFlush снимок пишется сразу. Если запись не удалась,
     * состояние возвращается к прежнему и исключение пробрасывается:
     * вызывающий код видит либо сохранённое изменение, либо никакого.
     *
     * @note Вызывать под lock!
     */
    template<typename Change>
    void change(Change apply) {
        if (!autoFlush_) {
            apply();
            dirty_ = true;
            return;
        }

        IndexEntries previous = currentState_;
        apply();
        try {
            writeToFile();
        } catch (const StorageIOFailure&) {
            currentState_ = std::move(previous);
            throw;
        }
        dirty_ = false;
    }

    /**
     * @brief Записать текущее состояние в файл
     * @note Вызывать под lock!
     */
    void writeToFile() {
        Bytes data = IndexCodec::encode(currentState_);

        std::filesystem::path tempPath = filePath_.string() + ".tmp";
        {
            std::ofstream file(tempPath, std::ios::binary | std::ios::trunc);
            if (!file) {
                throw StorageIOFailure("Failed to open temp file for writing: " +
                                       tempPath.string());
            }
            writeStream(file, data);
            file.flush();
            if (!file) {
                file.close();
                discard(tempPath);
                throw StorageIOFailure("Failed to write to temp file: " + tempPath.string());
            }
        }

        // Атомарно заменяем файл
        std::error_code ec;
        std::filesystem::rename(tempPath, filePath_, ec);
        if (ec) {
            discard(tempPath);
            throw StorageIOFailure("Failed to replace " + filePath_.string() +
                                   ": " + ec.message());
        }
    }

    /// Удалить недописанный временный файл
    static void discard(const std::filesystem::path& tempPath) {
        std::error_code ignored;
        std::filesystem::remove(tempPath, ignored);
    }

    std::filesystem::path filePath_;
    bool autoFlush_;

    mutable std::mutex mutex_;
    IndexEntries currentState_;
    bool dirty_ = false;
};

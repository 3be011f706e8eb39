#pragma once

#include <stepcache/Errors.hpp>
#include <stepcache/store/IStorage.hpp>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <random>
#include <stdexcept>
#include <string>
#include <system_error>

/**
 * @brief Запись во временный файл с переименованием при commit()
 */
class FilePendingWrite : public PendingWrite {
public:
    explicit FilePendingWrite(std::filesystem::path target)
        : target_(std::move(target))
        , temp_(target_.string() + ".tmp")
    {
        std::error_code ec;
        std::filesystem::create_directories(target_.parent_path(), ec);
        if (ec) {
            throw StorageIOFailure("Failed to create directory " +
                                   target_.parent_path().string() + ": " + ec.message());
        }
        file_.open(temp_, std::ios::binary | std::ios::trunc);
        if (!file_) {
            throw StorageIOFailure("Failed to open temp file for writing: " + temp_.string());
        }
    }

    ~FilePendingWrite() override {
        if (!committed_) {
            file_.close();
            std::error_code ec;
            std::filesystem::remove(temp_, ec);
        }
    }

    FilePendingWrite(const FilePendingWrite&) = delete;
    FilePendingWrite& operator=(const FilePendingWrite&) = delete;

    std::ostream& stream() override {
        return file_;
    }

    uint64_t commit() override {
        if (committed_) {
            throw std::logic_error("Pending write already committed: " + target_.string());
        }
        file_.flush();
        if (!file_) {
            throw StorageIOFailure("Failed to write to temp file: " + temp_.string());
        }
        file_.close();

        std::error_code ec;
        uint64_t size = std::filesystem::file_size(temp_, ec);
        if (ec) {
            throw StorageIOFailure("Failed to stat temp file " + temp_.string() +
                                   ": " + ec.message());
        }

        // Атомарно заменяем файл
        std::filesystem::rename(temp_, target_, ec);
        if (ec) {
            throw StorageIOFailure("Failed to rename " + temp_.string() + " to " +
                                   target_.string() + ": " + ec.message());
        }
        committed_ = true;
        return size;
    }

private:
    std::filesystem::path target_;
    std::filesystem::path temp_;
    std::ofstream file_;
    bool committed_ = false;
};

/**
 * @brief Хранилище блоков в каталоге на диске
 *
 * Локатор - относительный путь вида "ab/cd/<28 hex>.val".
 * Два уровня подкаталогов не дают одному каталогу разрастись.
 *
 * Потокобезопасность: allocate() защищён мьютексом, остальные
 * операции работают с разными файлами и блокировок не требуют.
 */
class DiskStorage : public IStorage {
public:
    static constexpr const char* EXTENSION = ".val";

    /**
     * @brief Конструктор
     * @param directory Корневой каталог (создаётся при необходимости)
     */
    explicit DiskStorage(std::filesystem::path directory)
        : directory_(std::move(directory))
        , random_(std::random_device{}())
    {
        std::error_code ec;
        std::filesystem::create_directories(directory_, ec);
        if (ec) {
            throw StorageIOFailure("Failed to create storage directory " +
                                   directory_.string() + ": " + ec.message());
        }
    }

    std::string allocate() override {
        std::lock_guard<std::mutex> lock(mutex_);
        while (true) {
            std::string name = randomHex(32);
            std::string locator = name.substr(0, 2) + "/" + name.substr(2, 2) + "/" +
                                  name.substr(4) + EXTENSION;
            if (!std::filesystem::exists(directory_ / locator)) {
                return locator;
            }
        }
    }

    std::unique_ptr<PendingWrite> openWrite(const std::string& locator) override {
        return std::make_unique<FilePendingWrite>(path(locator));
    }

    std::unique_ptr<std::istream> openRead(const std::string& locator) const override {
        auto file = std::make_unique<std::ifstream>(path(locator), std::ios::binary);
        if (!*file) {
            throw StorageIOFailure("Failed to open file for reading: " + path(locator).string());
        }
        return file;
    }

    uint64_t sizeOf(const std::string& locator) const override {
        std::error_code ec;
        uint64_t size = std::filesystem::file_size(path(locator), ec);
        if (ec) {
            throw StorageIOFailure("Failed to stat " + path(locator).string() +
                                   ": " + ec.message());
        }
        return size;
    }

    bool exists(const std::string& locator) const override {
        std::error_code ec;
        bool found = std::filesystem::is_regular_file(path(locator), ec);
        if (ec && ec != std::errc::no_such_file_or_directory) {
            throw StorageIOFailure("Failed to stat " + path(locator).string() +
                                   ": " + ec.message());
        }
        return found;
    }

    bool remove(const std::string& locator) override {
        std::error_code ec;
        bool removed = std::filesystem::remove(path(locator), ec);
        if (ec) {
            throw StorageIOFailure("Failed to remove " + path(locator).string() +
                                   ": " + ec.message());
        }
        return removed;
    }

    /**
     * @brief Полный путь файла по локатору
     * @throws std::invalid_argument если локатор выходит за пределы каталога
     */
    std::filesystem::path path(const std::string& locator) const {
        std::filesystem::path relative(locator);
        if (locator.empty() || relative.is_absolute()) {
            throw std::invalid_argument("Invalid storage locator: " + locator);
        }
        for (const auto& part : relative) {
            if (part == "..") {
                throw std::invalid_argument("Invalid storage locator: " + locator);
            }
        }
        return directory_ / relative;
    }

    const std::filesystem::path& directory() const {
        return directory_;
    }

private:
    std::string randomHex(size_t length) {
        static const char DIGITS[] = "0123456789abcdef";
        std::uniform_int_distribution<int> digit(0, 15);
        std::string hex;
        hex.reserve(length);
        for (size_t i = 0; i < length; ++i) {
            hex.push_back(DIGITS[digit(random_)]);
        }
        return hex;
    }

    std::filesystem::path directory_;
    std::mutex mutex_;
    std::mt19937_64 random_;
};

#pragma once

#include <filesystem>
#include <random>
#include <string>
#include <system_error>

/**
 * @brief Уникальный каталог во временной директории, удаляется в деструкторе
 */
class TempDirectory {
public:
    TempDirectory() {
        std::random_device device;
        std::mt19937_64 random(device());
        do {
            path_ = std::filesystem::temp_directory_path() /
                    ("stepcache_test_" + std::to_string(random()));
        } while (std::filesystem::exists(path_));
        std::filesystem::create_directories(path_);
    }

    ~TempDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

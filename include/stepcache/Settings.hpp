#pragma once

#include <stepcache/key/Sha256.hpp>
#include <stepcache/registry/HashRegistry.hpp>
#include <stepcache/registry/SerializerRegistry.hpp>
#include <stepcache/registry/TypeRegistry.hpp>
#include <stepcache/serialization/ArrayCodec.hpp>
#include <stepcache/serialization/TableSerializer.hpp>
#include <stepcache/value/NdArray.hpp>
#include <stepcache/value/Table.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>

/**
 * @brief Контекст конфигурации: реестры и каталог кэша
 *
 * Заполняется один раз при старте, затем раздаётся как
 * std::shared_ptr<const Settings> и больше не меняется.
 *
 * @code
 *   auto settings = std::make_shared<Settings>(Settings::fromEnvironment());
 *   settings->registerSerializer<Quote>("market.Quote", std::make_shared<QuoteSerializer>());
 *   std::shared_ptr<const Settings> shared = settings;
 * @endcode
 */
struct Settings {
    // ========== ПЕРЕМЕННЫЕ ОКРУЖЕНИЯ ==========

    static constexpr const char* CACHE_DIRECTORY_ENV = "STEPCACHE_CACHE_DIRECTORY";

    // ========== ПАРАМЕТРЫ ==========

    /// Корневой каталог кэша; у каждой функции свой подкаталог
    std::filesystem::path cacheDirectory = defaultCacheDirectory();

    TypeRegistry types;
    SerializerRegistry serializers;
    HashRegistry hashes;

    // ========== РЕГИСТРАЦИЯ ==========

    /**
     * @brief Зарегистрировать тип: тег и сериализатор вместе
     * @throws std::invalid_argument при недопустимом теге или null сериализаторе
     */
    template<typename T>
    void registerSerializer(const std::string& tag,
                            std::shared_ptr<const ISerializer> serializer) {
        if (!serializer) {
            throw std::invalid_argument("Serializer cannot be null");
        }
        types.registerType<T>(tag);
        serializers.registerSerializer<T>(std::move(serializer));
    }

    template<typename T>
    void registerHash(HashFunction hash) {
        hashes.registerHash<T>(std::move(hash));
    }

    // ========== ПРЕДУСТАНОВЛЕННЫЕ КОНФИГУРАЦИИ ==========

    /// Массивы и таблицы с сериализаторами и хэшами
    static Settings defaults() {
        Settings settings;
        settings.registerSerializer<NdArray>("stepcache.NdArray",
                                             std::make_shared<NdArraySerializer>());
        settings.registerHash<NdArray>([](const Value& value) {
            return sha256Hex(ArrayCodec::encode(value.as<NdArray>()));
        });

        settings.registerSerializer<Table>("stepcache.Table",
                                           std::make_shared<TableSerializer>());
        settings.registerHash<Table>([](const Value& value) {
            return sha256Hex(TableSerializer::encode(value.as<Table>()));
        });
        return settings;
    }

    /**
     * @brief defaults() + каталог кэша из .env и окружения
     *
     * Окружение процесса имеет приоритет над файлом.
     * Отсутствующий файл не ошибка.
     */
    static Settings fromEnvironment(const std::filesystem::path& envFile = ".env") {
        Settings settings = defaults();

        auto fileValues = readEnvFile(envFile);
        auto it = fileValues.find(CACHE_DIRECTORY_ENV);
        if (it != fileValues.end() && !it->second.empty()) {
            settings.cacheDirectory = it->second;
        }

        const char* env = std::getenv(CACHE_DIRECTORY_ENV);
        if (env != nullptr && *env != '\0') {
            settings.cacheDirectory = env;
        }
        return settings;
    }

    // ========== ВСПОМОГАТЕЛЬНЫЕ МЕТОДЫ ==========

    /// $HOME/.stepcache, без HOME - ./.stepcache
    static std::filesystem::path defaultCacheDirectory() {
        const char* home = std::getenv("HOME");
        if (home != nullptr && *home != '\0') {
            return std::filesystem::path(home) / ".stepcache";
        }
        return std::filesystem::path(".stepcache");
    }

    /**
     * @brief Разобрать файл KEY=VALUE
     *
     * Пустые строки и строки с # пропускаются, кавычки вокруг
     * значения снимаются.
     */
    static std::map<std::string, std::string> readEnvFile(const std::filesystem::path& path) {
        std::map<std::string, std::string> values;
        std::ifstream file(path);
        if (!file) {
            return values;
        }

        std::string line;
        while (std::getline(file, line)) {
            line = trim(line);
            if (line.empty() || line[0] == '#') {
                continue;
            }
            auto eq = line.find('=');
            if (eq == std::string::npos) {
                continue;
            }
            std::string key = trim(line.substr(0, eq));
            std::string value = trim(line.substr(eq + 1));
            if (value.size() >= 2 &&
                (value.front() == '"' || value.front() == '\'') &&
                value.back() == value.front()) {
                value = value.substr(1, value.size() - 2);
            }
            values[key] = value;
        }
        return values;
    }

private:
    static std::string trim(const std::string& text) {
        const char* spaces = " \t\r\n";
        auto begin = text.find_first_not_of(spaces);
        if (begin == std::string::npos) {
            return "";
        }
        auto end = text.find_last_not_of(spaces);
        return text.substr(begin, end - begin + 1);
    }
};

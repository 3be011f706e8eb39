#include <gtest/gtest.h>
#include <stepcache/Settings.hpp>
#include <stepcache/serialization/GenericSerializer.hpp>
#include "TempDirectory.hpp"
#include <cstdlib>
#include <fstream>
#include <memory>

/**
 * @brief Тесты для Settings
 *
 * Проверяем:
 * - Предустановленные регистрации массивов и таблиц
 * - Регистрацию тега и сериализатора вместе
 * - Чтение .env и приоритет окружения
 */

class SettingsTest : public ::testing::Test {
protected:
    void SetUp() override {
        directory_ = std::make_unique<TempDirectory>();
        envFile_ = directory_->path() / ".env";
        unsetenv(Settings::CACHE_DIRECTORY_ENV);
    }

    void TearDown() override {
        unsetenv(Settings::CACHE_DIRECTORY_ENV);
        directory_.reset();
    }

    void writeEnvFile(const std::string& content) {
        std::ofstream file(envFile_);
        file << content;
    }

    std::unique_ptr<TempDirectory> directory_;
    std::filesystem::path envFile_;
};

// ==================== Регистрации ====================

TEST_F(SettingsTest, DefaultsRegisterArrayAndTable) {
    Settings settings = Settings::defaults();

    EXPECT_EQ(settings.types.tagOf(typeid(NdArray)), std::optional<std::string>("stepcache.NdArray"));
    EXPECT_EQ(settings.types.tagOf(typeid(Table)), std::optional<std::string>("stepcache.Table"));
    EXPECT_TRUE(settings.serializers.contains(typeid(NdArray)));
    EXPECT_TRUE(settings.serializers.contains(typeid(Table)));
    EXPECT_NE(settings.hashes.lookup(typeid(Table)), nullptr);
}

TEST_F(SettingsTest, EmptySettingsHaveOnlyBuiltins) {
    Settings settings;

    EXPECT_FALSE(settings.types.tagOf(typeid(Table)).has_value());
    EXPECT_EQ(settings.serializers.size(), 0u);
    EXPECT_EQ(settings.hashes.size(), 0u);
}

TEST_F(SettingsTest, RegisterSerializerBindsTagAndSerializer) {
    struct Point { int x; int y; };
    Settings settings;

    settings.registerSerializer<Point>("geometry.Point", std::make_shared<GenericSerializer>());

    EXPECT_EQ(settings.types.resolve("geometry.Point"), std::optional<std::type_index>(typeid(Point)));
    EXPECT_TRUE(settings.serializers.contains(typeid(Point)));
}

TEST_F(SettingsTest, NullSerializerLeavesRegistriesUntouched) {
    struct Point { int x; };
    Settings settings;

    EXPECT_THROW(settings.registerSerializer<Point>("geometry.Point", nullptr),
                 std::invalid_argument);
    EXPECT_FALSE(settings.types.resolve("geometry.Point").has_value());
}

TEST_F(SettingsTest, ReservedTagIsRejected) {
    struct Point { int x; };
    Settings settings;

    EXPECT_THROW(settings.registerSerializer<Point>("__list__",
                                                    std::make_shared<GenericSerializer>()),
                 std::invalid_argument);
    EXPECT_FALSE(settings.serializers.contains(typeid(Point)));
}

// ==================== Окружение ====================

TEST_F(SettingsTest, ReadEnvFileParsesPairs) {
    writeEnvFile(
        "# comment\n"
        "\n"
        "STEPCACHE_CACHE_DIRECTORY = \"/data/cache\"\n"
        "OTHER='single'\n"
        "BROKEN LINE\n");

    auto values = Settings::readEnvFile(envFile_);

    EXPECT_EQ(values.size(), 2u);
    EXPECT_EQ(values["STEPCACHE_CACHE_DIRECTORY"], "/data/cache");
    EXPECT_EQ(values["OTHER"], "single");
}

TEST_F(SettingsTest, MissingEnvFileIsEmpty) {
    EXPECT_TRUE(Settings::readEnvFile(directory_->path() / "absent.env").empty());
}

TEST_F(SettingsTest, CacheDirectoryFromEnvFile) {
    writeEnvFile("STEPCACHE_CACHE_DIRECTORY=/from/file\n");

    Settings settings = Settings::fromEnvironment(envFile_);

    EXPECT_EQ(settings.cacheDirectory, std::filesystem::path("/from/file"));
}

TEST_F(SettingsTest, EnvironmentOverridesEnvFile) {
    writeEnvFile("STEPCACHE_CACHE_DIRECTORY=/from/file\n");
    setenv(Settings::CACHE_DIRECTORY_ENV, "/from/env", 1);

    Settings settings = Settings::fromEnvironment(envFile_);

    EXPECT_EQ(settings.cacheDirectory, std::filesystem::path("/from/env"));
}

TEST_F(SettingsTest, DefaultDirectoryWithoutConfiguration) {
    Settings settings = Settings::fromEnvironment(directory_->path() / "absent.env");

    EXPECT_EQ(settings.cacheDirectory, Settings::defaultCacheDirectory());
    EXPECT_TRUE(settings.serializers.contains(typeid(Table)));
}

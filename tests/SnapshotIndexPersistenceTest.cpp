#include <gtest/gtest.h>
#include <stepcache/persistence/IndexCodec.hpp>
#include <stepcache/persistence/SnapshotIndexPersistence.hpp>
#include "TempDirectory.hpp"
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

/**
 * @brief Тесты для SnapshotIndexPersistence и IndexCodec
 *
 * Проверяем:
 * - Сохранение и загрузка индекса
 * - Инкрементальные операции (onPut, onRemove, onClear)
 * - Режимы autoFlush
 * - Работа с несуществующим и повреждённым файлом
 */

class SnapshotIndexPersistenceTest : public ::testing::Test {
protected:
    void SetUp() override {
        directory_ = std::make_unique<TempDirectory>();
        testFile_ = directory_->path() / "index.bin";
    }

    void TearDown() override {
        directory_.reset();
    }

    static CacheKey key(int64_t version, const std::string& digest) {
        return CacheKey{version, digest};
    }

    static StoredRecord record(const std::string& locator, uint64_t size = 10,
                               StorageMode mode = StorageMode::Binary,
                               const std::string& marker = "stepcache.Table") {
        StoredRecord result;
        result.size = size;
        result.mode = mode;
        result.locator = locator;
        result.marker = marker;
        return result;
    }

    std::unique_ptr<TempDirectory> directory_;
    std::filesystem::path testFile_;
};

// ==================== Базовые операции ====================

TEST_F(SnapshotIndexPersistenceTest, ExistsReturnsFalseForNewFile) {
    SnapshotIndexPersistence persistence(testFile_);

    EXPECT_FALSE(persistence.exists());
}

TEST_F(SnapshotIndexPersistenceTest, LoadReturnsEmptyForNonExistentFile) {
    SnapshotIndexPersistence persistence(testFile_);

    auto data = persistence.load();

    EXPECT_TRUE(data.empty());
}

TEST_F(SnapshotIndexPersistenceTest, SaveAllAndLoad) {
    SnapshotIndexPersistence persistence(testFile_);

    IndexEntries entries = {
        {key(1, "alpha"), record("aa/bb/1.val", 100)},
        {key(1, "beta"), record("aa/bb/2.val", 200, StorageMode::Pickle, "__list__")},
        {key(2, "gamma"), record("aa/bb/3.val", 300, StorageMode::Pickle, "__generic__")}
    };

    persistence.saveAll(entries);

    EXPECT_TRUE(persistence.exists());

    auto loaded = persistence.load();

    ASSERT_EQ(loaded.size(), 3u);
    EXPECT_EQ(loaded, entries);
}

TEST_F(SnapshotIndexPersistenceTest, SaveAllOverwrites) {
    SnapshotIndexPersistence persistence(testFile_);

    persistence.saveAll({{key(1, "a"), record("1.val")}, {key(1, "b"), record("2.val")}});
    persistence.saveAll({{key(1, "c"), record("3.val")}});

    auto loaded = persistence.load();

    ASSERT_EQ(loaded.size(), 1u);
    EXPECT_EQ(loaded[0].first, key(1, "c"));
}

// ==================== Инкрементальные операции ====================

TEST_F(SnapshotIndexPersistenceTest, OnPutAddsEntry) {
    SnapshotIndexPersistence persistence(testFile_, true);

    persistence.onPut(key(1, "a"), record("1.val"));
    persistence.onPut(key(1, "b"), record("2.val"));

    auto loaded = persistence.load();
    ASSERT_EQ(loaded.size(), 2u);
}

TEST_F(SnapshotIndexPersistenceTest, OnPutUpdatesEntry) {
    SnapshotIndexPersistence persistence(testFile_, true);

    persistence.onPut(key(1, "a"), record("1.val", 10));
    persistence.onPut(key(1, "a"), record("2.val", 20));

    auto loaded = persistence.load();
    ASSERT_EQ(loaded.size(), 1u);
    EXPECT_EQ(loaded[0].second.locator, "2.val");
    EXPECT_EQ(loaded[0].second.size, 20u);
}

TEST_F(SnapshotIndexPersistenceTest, SameDigestDifferentVersionsAreDistinct) {
    SnapshotIndexPersistence persistence(testFile_, true);

    persistence.onPut(key(1, "a"), record("1.val"));
    persistence.onPut(key(2, "a"), record("2.val"));

    EXPECT_EQ(persistence.load().size(), 2u);
}

TEST_F(SnapshotIndexPersistenceTest, OnRemoveDeletesEntry) {
    SnapshotIndexPersistence persistence(testFile_, true);

    persistence.onPut(key(1, "a"), record("1.val"));
    persistence.onPut(key(1, "b"), record("2.val"));
    persistence.onRemove(key(1, "a"));

    auto loaded = persistence.load();
    ASSERT_EQ(loaded.size(), 1u);
    EXPECT_EQ(loaded[0].first, key(1, "b"));
}

TEST_F(SnapshotIndexPersistenceTest, OnRemoveNonExistentDoesNothing) {
    SnapshotIndexPersistence persistence(testFile_);

    persistence.onRemove(key(1, "missing"));

    EXPECT_FALSE(persistence.isDirty());
}

TEST_F(SnapshotIndexPersistenceTest, OnClearRemovesAll) {
    SnapshotIndexPersistence persistence(testFile_, true);

    persistence.onPut(key(1, "a"), record("1.val"));
    persistence.onPut(key(1, "b"), record("2.val"));
    persistence.onClear();

    EXPECT_TRUE(persistence.exists());
    EXPECT_TRUE(persistence.load().empty());
}

// ==================== autoFlush ====================

TEST_F(SnapshotIndexPersistenceTest, AutoFlushDisabledRequiresExplicitFlush) {
    SnapshotIndexPersistence persistence(testFile_, false);

    persistence.onPut(key(1, "a"), record("1.val"));

    EXPECT_FALSE(persistence.exists());
    EXPECT_TRUE(persistence.isDirty());

    persistence.flush();

    EXPECT_TRUE(persistence.exists());
    EXPECT_FALSE(persistence.isDirty());
}

TEST_F(SnapshotIndexPersistenceTest, AutoFlushEnabledWritesImmediately) {
    SnapshotIndexPersistence persistence(testFile_, true);

    persistence.onPut(key(1, "a"), record("1.val"));

    EXPECT_TRUE(persistence.exists());
    EXPECT_FALSE(persistence.isDirty());
}

TEST_F(SnapshotIndexPersistenceTest, FlushWhenNotDirtyDoesNothing) {
    SnapshotIndexPersistence persistence(testFile_);

    persistence.flush();

    EXPECT_FALSE(persistence.exists());
}

TEST_F(SnapshotIndexPersistenceTest, DataPersistsBetweenInstances) {
    {
        SnapshotIndexPersistence persistence(testFile_, true);
        persistence.onPut(key(3, "persisted"), record("xx/yy/z.val", 42));
    }

    SnapshotIndexPersistence reopened(testFile_);
    auto loaded = reopened.load();

    ASSERT_EQ(loaded.size(), 1u);
    EXPECT_EQ(loaded[0].first, key(3, "persisted"));
    EXPECT_EQ(loaded[0].second, record("xx/yy/z.val", 42));
}

TEST_F(SnapshotIndexPersistenceTest, NoTempFileLeftAfterWrite) {
    SnapshotIndexPersistence persistence(testFile_, true);

    persistence.onPut(key(1, "a"), record("1.val"));

    EXPECT_FALSE(std::filesystem::exists(testFile_.string() + ".tmp"));
}

TEST_F(SnapshotIndexPersistenceTest, FilePath) {
    SnapshotIndexPersistence persistence(testFile_);

    EXPECT_EQ(persistence.filePath(), testFile_);
}

// ==================== Повреждённые данные ====================

TEST_F(SnapshotIndexPersistenceTest, CorruptFileThrows) {
    {
        std::ofstream file(testFile_, std::ios::binary);
        file << "this is not an index file";
    }
    SnapshotIndexPersistence persistence(testFile_);

    EXPECT_THROW(persistence.load(), CorruptData);
}

TEST(IndexCodecTest, RejectsInvalidStorageMode) {
    IndexEntries entries = {{CacheKey{1, "a"}, StoredRecord{}}};
    Bytes data = IndexCodec::encode(entries);

    // Байт режима: заголовок 16 + версия 8 + дайджест 8+1 + размер 8
    data[16 + 8 + 9 + 8] = 7;

    EXPECT_THROW(IndexCodec::decode(data), CorruptData);
}

TEST(IndexCodecTest, RejectsTruncatedData) {
    IndexEntries entries = {{CacheKey{1, "abc"}, StoredRecord{}}};
    Bytes data = IndexCodec::encode(entries);
    data.resize(data.size() - 3);

    EXPECT_THROW(IndexCodec::decode(data), CorruptData);
}

TEST(IndexCodecTest, EmptyIndexIsValid) {
    Bytes data = IndexCodec::encode({});

    EXPECT_TRUE(IndexCodec::decode(data).empty());
}

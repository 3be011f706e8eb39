#include <gtest/gtest.h>
#include <stepcache/Settings.hpp>
#include <stepcache/cache/DiskCache.hpp>
#include <stepcache/listeners/LoggingListener.hpp>
#include <stepcache/listeners/StatsListener.hpp>
#include "TempDirectory.hpp"
#include <algorithm>
#include <atomic>
#include <memory>
#include <sstream>
#include <thread>
#include <vector>

/**
 * @brief Тесты для слушателей
 *
 * Проверяем:
 * - StatsListener корректно считает статистику
 * - LoggingListener выводит сообщения
 * - Множественные слушатели работают вместе
 * - Удаление слушателей
 * - Вызовы слушателей из параллельных get() не пересекаются
 */

class ListenersTest : public ::testing::Test {
protected:
    void SetUp() override {
        directory_ = std::make_unique<TempDirectory>();
        auto settings = std::make_shared<const Settings>(Settings::defaults());
        cache_ = std::make_unique<DiskCache>(directory_->path(), settings);
    }

    void TearDown() override {
        cache_.reset();
        directory_.reset();
    }

    static CacheKey key(const std::string& digest) {
        return CacheKey{1, digest};
    }

    std::unique_ptr<TempDirectory> directory_;
    std::unique_ptr<DiskCache> cache_;
};

// ==================== StatsListener ====================

TEST(StatsListenerTest, InitiallyZero) {
    StatsListener stats;

    EXPECT_EQ(stats.hits(), 0u);
    EXPECT_EQ(stats.misses(), 0u);
    EXPECT_EQ(stats.stores(), 0u);
    EXPECT_EQ(stats.updates(), 0u);
    EXPECT_EQ(stats.removes(), 0u);
    EXPECT_EQ(stats.clears(), 0u);
    EXPECT_EQ(stats.bytesWritten(), 0u);
    EXPECT_DOUBLE_EQ(stats.hitRate(), 0.0);
}

TEST_F(ListenersTest, CountsHitsAndMisses) {
    auto stats = std::make_shared<StatsListener>();
    cache_->addListener(stats);

    cache_->put(key("a"), Value(42));
    cache_->get(key("a"));        // Hit
    cache_->get(key("a"));        // Hit
    cache_->get(key("missing"));  // Miss

    EXPECT_EQ(stats->hits(), 2u);
    EXPECT_EQ(stats->misses(), 1u);
    EXPECT_EQ(stats->totalRequests(), 3u);
}

TEST_F(ListenersTest, HitRateCalculation) {
    auto stats = std::make_shared<StatsListener>();
    cache_->addListener(stats);

    cache_->put(key("a"), Value(1));
    cache_->get(key("a"));
    cache_->get(key("a"));
    cache_->get(key("a"));
    cache_->get(key("missing"));

    EXPECT_DOUBLE_EQ(stats->hitRate(), 0.75);
}

TEST_F(ListenersTest, CountsStoresAndBytes) {
    auto stats = std::make_shared<StatsListener>();
    cache_->addListener(stats);

    cache_->put(key("a"), Value("payload"));

    EXPECT_EQ(stats->stores(), 1u);
    EXPECT_EQ(stats->bytesWritten(), cache_->record(key("a"))->size);
}

TEST_F(ListenersTest, CountsUpdates) {
    auto stats = std::make_shared<StatsListener>();
    cache_->addListener(stats);

    cache_->put(key("a"), Value(1));
    cache_->put(key("a"), Value(2));

    EXPECT_EQ(stats->stores(), 1u);
    EXPECT_EQ(stats->updates(), 1u);
}

TEST_F(ListenersTest, CountsRemovesAndClears) {
    auto stats = std::make_shared<StatsListener>();
    cache_->addListener(stats);

    cache_->put(key("a"), Value(1));
    cache_->put(key("b"), Value(2));
    cache_->remove(key("a"));
    cache_->remove(key("missing"));
    cache_->clear();

    EXPECT_EQ(stats->removes(), 1u);
    EXPECT_EQ(stats->clears(), 1u);
}

TEST(StatsListenerTest, Reset) {
    StatsListener stats;
    stats.onHit(CacheKey{1, "a"});
    stats.onMiss(CacheKey{1, "b"});

    stats.reset();

    EXPECT_EQ(stats.hits(), 0u);
    EXPECT_EQ(stats.misses(), 0u);
}

// ==================== LoggingListener ====================

TEST(LoggingListenerTest, LogsHit) {
    std::ostringstream oss;
    LoggingListener logger("Test", oss);

    logger.onHit(CacheKey{1, "abc123"});

    EXPECT_EQ(oss.str(), "[Test] HIT: (1, abc123)\n");
}

TEST(LoggingListenerTest, LogsMiss) {
    std::ostringstream oss;
    LoggingListener logger("Test", oss);

    logger.onMiss(CacheKey{2, "missing"});

    EXPECT_NE(oss.str().find("MISS"), std::string::npos);
    EXPECT_NE(oss.str().find("missing"), std::string::npos);
}

TEST(LoggingListenerTest, LogsStoreWithRecord) {
    std::ostringstream oss;
    LoggingListener logger("Test", oss);
    StoredRecord record;
    record.size = 128;
    record.mode = StorageMode::Binary;
    record.marker = "stepcache.Table";

    logger.onStore(CacheKey{1, "key1"}, record);

    EXPECT_EQ(oss.str(), "[Test] STORE: (1, key1) -> stepcache.Table (128 bytes, binary)\n");
}

TEST(LoggingListenerTest, LogsClearCount) {
    std::ostringstream oss;
    LoggingListener logger("Test", oss);

    logger.onClear(5);

    EXPECT_EQ(oss.str(), "[Test] CLEAR: 5 elements\n");
}

TEST_F(ListenersTest, LoggingIntegrationWithCache) {
    std::ostringstream oss;
    cache_->addListener(std::make_shared<LoggingListener>("step", oss));

    cache_->put(key("a"), Value(1));
    cache_->get(key("a"));
    cache_->get(key("missing"));

    std::string output = oss.str();
    EXPECT_NE(output.find("[step] STORE"), std::string::npos);
    EXPECT_NE(output.find("[step] HIT"), std::string::npos);
    EXPECT_NE(output.find("[step] MISS"), std::string::npos);
    EXPECT_NE(output.find("__generic__"), std::string::npos);
}

// ==================== Управление слушателями ====================

TEST_F(ListenersTest, MultipleListeners) {
    std::ostringstream oss;
    auto stats = std::make_shared<StatsListener>();
    cache_->addListener(stats);
    cache_->addListener(std::make_shared<LoggingListener>("Cache", oss));

    cache_->put(key("a"), Value(1));
    cache_->get(key("a"));

    EXPECT_EQ(stats->stores(), 1u);
    EXPECT_EQ(stats->hits(), 1u);
    EXPECT_NE(oss.str().find("STORE"), std::string::npos);
    EXPECT_NE(oss.str().find("HIT"), std::string::npos);
}

TEST_F(ListenersTest, RemoveListener) {
    auto stats = std::make_shared<StatsListener>();
    cache_->addListener(stats);

    cache_->get(key("a"));
    cache_->removeListener(stats);
    cache_->get(key("a"));

    EXPECT_EQ(stats->misses(), 1u);
}

TEST_F(ListenersTest, AddNullListenerIgnored) {
    cache_->addListener(nullptr);

    EXPECT_NO_THROW(cache_->put(key("a"), Value(1)));
    EXPECT_NO_THROW(cache_->get(key("a")));
}

// ==================== Многопоточность ====================

namespace {

/// Слушатель без собственной синхронизации, замечает параллельные вызовы
class OverlapDetector : public ICacheListener {
public:
    void onHit(const CacheKey&) override { enter(); }
    void onMiss(const CacheKey&) override { enter(); }

    int calls = 0;
    std::atomic<int> overlaps{0};

private:
    void enter() {
        if (inside_.exchange(true)) {
            ++overlaps;
        }
        ++calls;
        std::this_thread::yield();
        inside_.store(false);
    }

    std::atomic<bool> inside_{false};
};

}  // namespace

TEST_F(ListenersTest, ConcurrentReadsNotifyListenersOneAtATime) {
    auto detector = std::make_shared<OverlapDetector>();
    std::ostringstream log;
    cache_->addListener(detector);
    cache_->put(key("a"), Value(1));
    cache_->addListener(std::make_shared<LoggingListener>("Test", log));

    const int threadCount = 4;
    const int perThread = 50;
    std::vector<std::thread> threads;
    for (int t = 0; t < threadCount; ++t) {
        threads.emplace_back([this, perThread]() {
            for (int i = 0; i < perThread; ++i) {
                cache_->get(key(i % 2 == 0 ? "a" : "missing"));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(detector->overlaps.load(), 0);
    EXPECT_EQ(detector->calls, threadCount * perThread);

    std::string output = log.str();
    EXPECT_EQ(static_cast<int>(std::count(output.begin(), output.end(), '\n')),
              threadCount * perThread);
}

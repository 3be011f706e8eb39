#include <stepcache/Settings.hpp>
#include <stepcache/listeners/LoggingListener.hpp>
#include <stepcache/listeners/StatsListener.hpp>
#include <stepcache/step/CacheManager.hpp>
#include <stepcache/step/Step.hpp>
#include <stepcache/value/NdArray.hpp>
#include <stepcache/value/Table.hpp>
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

/**
 * @brief Демонстрация мемоизации шагов обработки таблиц
 *
 * Сценарии:
 * 1. Повторный вызов с равной таблицей - результат берётся из кэша
 * 2. Таблица и кортеж с массивом как результат шага
 * 3. Статистика и лог событий кэша через слушателей
 *
 * Каталог кэша: STEPCACHE_CACHE_DIRECTORY из окружения или .env,
 * иначе ~/.stepcache.
 */

void printSeparator(const std::string& title) {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << "  " << title << "\n";
    std::cout << std::string(60, '=') << "\n\n";
}

/// Дневные цены закрытия: тикер, цена, объём
Table makePrices(int days) {
    std::vector<Value> tickers;
    std::vector<Value> closes;
    std::vector<Value> volumes;
    for (int i = 0; i < days; ++i) {
        tickers.push_back(i % 2 == 0 ? "SBER" : "GAZP");
        closes.push_back(250.0 + i * 1.5);
        volumes.push_back(1000 + i * 10);
    }

    Table prices;
    prices.addColumn("ticker", tickers);
    prices.addColumn("close", closes);
    prices.addColumn("volume", volumes);
    return prices;
}

/**
 * @brief Демо 1: Повторные вызовы
 *
 * Вторая таблица - другой объект с тем же содержимым, поэтому вызов
 * попадает в кэш. Таблица из четырёх строк даёт новый ключ.
 */
void demoRepeatedCalls(const std::shared_ptr<CacheManager>& manager) {
    printSeparator("Demo 1: Repeated Calls");

    Step countRows("count_rows", Signature{"df"},
        [](const BoundArguments& args) {
            const Table& df = argument(args, "df").as<Table>();
            return Value(static_cast<int64_t>(df.rows()));
        },
        StepOptions{&std::cout, CacheConfig{1}}, manager);

    std::cout << "rows = " << countRows({Value::object(makePrices(3))}) << "\n";
    std::cout << "rows = " << countRows({Value::object(makePrices(3))}) << "\n";
    std::cout << "rows = " << countRows({Value::object(makePrices(4))}) << "\n";
}

/**
 * @brief Демо 2: Составные результаты
 *
 * Шаг возвращает кортеж (таблица, массив, число). Таблица и массив
 * пишутся своими сериализаторами, число generic-кодеком.
 */
void demoCompositeResult(const std::shared_ptr<CacheManager>& manager) {
    printSeparator("Demo 2: Composite Result");

    Step summarize("summarize", Signature{"df", Parameter{"window", 2}},
        [](const BoundArguments& args) {
            const Table& df = argument(args, "df").as<Table>();
            size_t window = static_cast<size_t>(argument(args, "window").as<int64_t>());

            std::vector<double> averages;
            const auto& closes = df.column("close");
            for (size_t i = 0; i + window <= closes.size(); ++i) {
                double sum = 0.0;
                for (size_t j = 0; j < window; ++j) {
                    sum += closes[i + j].as<double>();
                }
                averages.push_back(sum / static_cast<double>(window));
            }

            Table head;
            size_t headRows = std::min<size_t>(2, closes.size());
            head.addColumn("close", std::vector<Value>(closes.begin(), closes.begin() + headRows));
            return Value(Tuple{
                Value::object(head),
                Value::object(NdArray::fromVector<double>(averages)),
                static_cast<int64_t>(averages.size())
            });
        },
        StepOptions{&std::cout, CacheConfig{1}}, manager);

    Value prices = Value::object(makePrices(6));
    Value first = summarize({prices}, {{"window", 3}});
    Value second = summarize({prices}, {{"window", 3}});

    std::cout << "equal results: " << std::boolalpha << (first == second) << "\n";

    auto record = manager->getCache("summarize")->record(summarize.keyFor({prices}, {{"window", 3}}));
    if (record) {
        std::cout << "stored as: " << *record << "\n";
    }
}

/**
 * @brief Демо 3: Слушатели
 *
 * Слушатели подключаются к кэшу конкретного шага.
 */
void demoListeners(const std::shared_ptr<CacheManager>& manager) {
    printSeparator("Demo 3: Listeners");

    auto stats = std::make_shared<StatsListener>();
    auto cache = manager->getCache("total_volume");
    cache->addListener(stats);
    cache->addListener(std::make_shared<LoggingListener>("total_volume"));

    Step totalVolume("total_volume", Signature{"df"},
        [](const BoundArguments& args) {
            int64_t total = 0;
            for (const auto& cell : argument(args, "df").as<Table>().column("volume")) {
                total += cell.as<int64_t>();
            }
            return Value(total);
        },
        StepOptions{nullptr, CacheConfig{1}}, manager);

    for (int days : {3, 5, 3, 5, 8}) {
        totalVolume({Value::object(makePrices(days))});
    }

    std::cout << "\nhits: " << stats->hits()
              << ", misses: " << stats->misses()
              << ", stores: " << stats->stores() << "\n";
    std::cout << "hit rate: " << std::fixed << std::setprecision(1)
              << stats->hitRate() * 100 << "%\n";
    std::cout << "bytes written: " << stats->bytesWritten() << "\n";
}

int main() {
    try {
        auto settings = std::make_shared<const Settings>(Settings::fromEnvironment());
        auto manager = std::make_shared<CacheManager>(settings);

        std::cout << "Cache directory: " << settings->cacheDirectory.string() << "\n";

        demoRepeatedCalls(manager);
        demoCompositeResult(manager);
        demoListeners(manager);

        manager->closeAll();
    } catch (const StepCacheError& e) {
        std::cerr << "Cache error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}

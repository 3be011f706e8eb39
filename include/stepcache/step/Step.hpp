#pragma once

#include <stepcache/key/CacheKeyBuilder.hpp>
#include <stepcache/step/CacheManager.hpp>
#include <stepcache/step/Signature.hpp>
#include <stepcache/value/Value.hpp>
#include <chrono>
#include <functional>
#include <iomanip>
#include <memory>
#include <optional>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @brief Параметры кэширования шага
 *
 * version меняют при изменении логики функции: все прежние
 * результаты становятся промахами.
 */
struct CacheConfig {
    int64_t version = 0;
};

struct StepOptions {
    /// Поток для строк "<name> completed in X.XXXX seconds"; nullptr - без лога
    std::ostream* log = nullptr;
    /// Без значения результат не кэшируется
    std::optional<CacheConfig> cache;
};

using StepFunction = std::function<Value(const BoundArguments&)>;

/**
 * @brief Мемоизирующая обёртка над функцией
 *
 * Вызов:
 * 1. Связывает аргументы с сигнатурой
 * 2. Строит ключ из версии и аргументов
 * 3. При попадании возвращает сохранённое значение
 * 4. Иначе вызывает функцию и сохраняет результат
 *
 * @code
 *   Step countRows("count_rows", Signature{"df"},
 *       [](const BoundArguments& args) {
 *           return Value(argument(args, "df").as<Table>().rows());
 *       },
 *       StepOptions{&std::cout, CacheConfig{1}}, manager);
 *
 *   Value rows = countRows({Value::object(table)});
 * @endcode
 */
class Step {
public:
    /**
     * @throws std::invalid_argument если задано кэширование, но нет manager,
     *         или function пуста
     */
    Step(std::string name,
         Signature signature,
         StepFunction function,
         StepOptions options = {},
         std::shared_ptr<CacheManager> manager = nullptr)
        : name_(std::move(name))
        , signature_(std::move(signature))
        , function_(std::move(function))
        , options_(options)
        , manager_(std::move(manager))
    {
        if (!function_) {
            throw std::invalid_argument("Step function cannot be empty: " + name_);
        }
        if (options_.cache && !manager_) {
            throw std::invalid_argument("Cached step requires a cache manager: " + name_);
        }
        if (options_.cache) {
            keyBuilder_ = std::make_unique<CacheKeyBuilder>(manager_->settings());
        }
    }

    Value operator()(const std::vector<Value>& positional = {},
                     const KeywordArguments& keyword = {}) {
        auto start = std::chrono::steady_clock::now();
        BoundArguments bound = signature_.bind(positional, keyword);

        if (!options_.cache) {
            Value result = function_(bound);
            logCompletion(start, false);
            return result;
        }

        CacheKey key = keyBuilder_->build(options_.cache->version, bound);
        auto cache = manager_->getCache(name_);
        if (auto cached = cache->get(key)) {
            logCompletion(start, true);
            return std::move(*cached);
        }

        Value result = function_(bound);
        cache->put(key, result);
        logCompletion(start, false);
        return result;
    }

    /**
     * @brief Ключ, под которым был бы сохранён результат вызова
     */
    CacheKey keyFor(const std::vector<Value>& positional,
                    const KeywordArguments& keyword = {}) const {
        if (!keyBuilder_) {
            throw std::logic_error("Step is not cached: " + name_);
        }
        return keyBuilder_->build(options_.cache->version, signature_.bind(positional, keyword));
    }

    const std::string& name() const { return name_; }
    const Signature& signature() const { return signature_; }

private:
    void logCompletion(std::chrono::steady_clock::time_point start, bool cached) const {
        if (options_.log == nullptr) {
            return;
        }
        std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
        std::ostringstream line;
        line << name_ << " completed in " << std::fixed << std::setprecision(4)
             << elapsed.count() << " seconds";
        if (cached) {
            line << " (cached)";
        }
        *options_.log << line.str() << "\n";
    }

    std::string name_;
    Signature signature_;
    StepFunction function_;
    StepOptions options_;
    std::shared_ptr<CacheManager> manager_;
    std::unique_ptr<CacheKeyBuilder> keyBuilder_;
};

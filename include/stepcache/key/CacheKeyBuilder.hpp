#pragma once

#include <stepcache/Errors.hpp>
#include <stepcache/Settings.hpp>
#include <stepcache/key/CacheKey.hpp>
#include <stepcache/key/Sha256.hpp>
#include <stepcache/serialization/GenericSerializer.hpp>
#include <stepcache/serialization/ISerializer.hpp>
#include <stepcache/value/Value.hpp>
#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief Аргументы вызова после связывания: имя → значение
 *
 * Порядок - порядок объявления параметров, значения по умолчанию
 * уже подставлены. Строится Signature::bind().
 */
using BoundArguments = std::vector<std::pair<std::string, Value>>;

/**
 * @brief Построитель ключей кэша
 *
 * Хэш аргумента:
 * - есть зарегистрированная функция для точного типа - она
 * - List/Tuple - хэши элементов по порядку
 * - Set - отсортированные хэши элементов
 * - Dict - отсортированные хэши пар (ключ, значение)
 * - Object с зарегистрированным сериализатором - байты сериализатора
 * - остальное - generic-кодировка
 *
 * Аргументы сортируются по имени, поэтому ключ не зависит от того,
 * передан аргумент позиционно или по имени.
 */
class CacheKeyBuilder {
public:
    explicit CacheKeyBuilder(std::shared_ptr<const Settings> settings)
        : settings_(std::move(settings))
    {
        if (!settings_) {
            throw std::invalid_argument("Settings cannot be null");
        }
    }

    /**
     * @brief Ключ для версии функции и её аргументов
     * @throws std::invalid_argument при повторяющемся имени аргумента
     * @throws UnsupportedType если аргумент нельзя ни хэшировать, ни закодировать
     */
    CacheKey build(int64_t version, const BoundArguments& arguments) const {
        return CacheKey{version, digest(arguments)};
    }

    std::string digest(const BoundArguments& arguments) const {
        std::vector<const std::pair<std::string, Value>*> sorted;
        sorted.reserve(arguments.size());
        for (const auto& argument : arguments) {
            sorted.push_back(&argument);
        }
        std::sort(sorted.begin(), sorted.end(), [](const auto* lhs, const auto* rhs) {
            return lhs->first < rhs->first;
        });
        for (size_t i = 1; i < sorted.size(); ++i) {
            if (sorted[i - 1]->first == sorted[i]->first) {
                throw std::invalid_argument("Duplicate argument name: " + sorted[i]->first);
            }
        }

        Sha256 hasher;
        for (const auto* argument : sorted) {
            hasher.updateField(argument->first);
            hasher.updateField(settings_->types.stableTag(argument->second.type()));
            hasher.updateField(hashValue(argument->second));
        }
        return hasher.hexDigest();
    }

    /**
     * @brief Хэш одного значения (hex SHA-256 или результат
     *        зарегистрированной функции)
     */
    std::string hashValue(const Value& value) const {
        if (const HashFunction* hash = settings_->hashes.lookup(value.type())) {
            return (*hash)(value);
        }

        if (value.is<List>()) {
            return hashSequence("list", value.as<List>().items);
        }
        if (value.is<Tuple>()) {
            return hashSequence("tuple", value.as<Tuple>().items);
        }
        if (value.is<Set>()) {
            std::vector<std::string> hashes;
            for (const Value& item : value.as<Set>().items) {
                hashes.push_back(hashValue(item));
            }
            std::sort(hashes.begin(), hashes.end());
            return combine("set", hashes);
        }
        if (value.is<Dict>()) {
            std::vector<std::string> hashes;
            for (const auto& [key, item] : value.as<Dict>().items) {
                Sha256 pair;
                pair.updateField(hashValue(key));
                pair.updateField(hashValue(item));
                hashes.push_back(pair.hexDigest());
            }
            std::sort(hashes.begin(), hashes.end());
            return combine("dict", hashes);
        }

        if (const ISerializer* serializer = settings_->serializers.lookup(value.type())) {
            return sha256Hex(serializeToBytes(*serializer, value));
        }
        return sha256Hex(GenericSerializer::encode(value));
    }

private:
    std::string hashSequence(const char* kind, const std::vector<Value>& items) const {
        std::vector<std::string> hashes;
        hashes.reserve(items.size());
        for (const Value& item : items) {
            hashes.push_back(hashValue(item));
        }
        return combine(kind, hashes);
    }

    static std::string combine(const char* kind, const std::vector<std::string>& hashes) {
        Sha256 hasher;
        hasher.updateField(kind);
        for (const auto& hash : hashes) {
            hasher.updateField(hash);
        }
        return hasher.hexDigest();
    }

    std::shared_ptr<const Settings> settings_;
};

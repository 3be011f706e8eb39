#pragma once

#include <stepcache/value/Value.hpp>
#include <functional>
#include <stdexcept>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>

/**
 * @brief Функция хэширования аргумента: значение → стабильная строка
 *
 * Результат должен зависеть только от содержимого значения,
 * а не от адреса объекта.
 */
using HashFunction = std::function<std::string(const Value&)>;

/**
 * @brief Реестр функций хэширования по точному типу
 */
class HashRegistry {
public:
    template<typename T>
    void registerHash(HashFunction hash) {
        registerHash(std::type_index(typeid(T)), std::move(hash));
    }

    void registerHash(std::type_index type, HashFunction hash) {
        if (!hash) {
            throw std::invalid_argument("Hash function cannot be empty");
        }
        hashes_[type] = std::move(hash);
    }

    /**
     * @return nullptr если функция для типа не зарегистрирована
     */
    const HashFunction* lookup(std::type_index type) const {
        auto it = hashes_.find(type);
        return it != hashes_.end() ? &it->second : nullptr;
    }

    size_t size() const {
        return hashes_.size();
    }

private:
    std::unordered_map<std::type_index, HashFunction> hashes_;
};

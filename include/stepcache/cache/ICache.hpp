#pragma once

#include <stepcache/key/CacheKey.hpp>
#include <stepcache/value/Value.hpp>
#include <cstddef>
#include <optional>

/**
 * @brief Базовый интерфейс кэша результатов
 */
class ICache
{
public:
    virtual ~ICache() = default;

    /**
     * @brief Получить значение по ключу
     * @param key Ключ
     * @return Значение, если ключ существует, иначе std::nullopt.
     *         Сохранённый null возвращается как Value(), а не nullopt.
     */
    virtual std::optional<Value> get(const CacheKey &key) = 0;

    /**
     * @brief Поместить значение в кэш
     * @param key Ключ
     * @param value Значение
     */
    virtual void put(const CacheKey &key, const Value &value) = 0;

    /**
     * @brief Удалить значение по ключу
     * @param key Ключ
     * @return true, если элемент был удален, иначе false
     */
    virtual bool remove(const CacheKey &key) = 0;

    /**
     * @brief Очистить кэш
     */
    virtual void clear() = 0;

    /**
     * @brief Получить текущий размер кэша
     * @return Размер кэша
     */
    virtual size_t size() const = 0;

    /**
     * @brief Проверить наличие ключа в кэше
     * @param key Ключ
     * @return true, если ключ существует, иначе false
     */
    virtual bool contains(const CacheKey &key) const = 0;
};

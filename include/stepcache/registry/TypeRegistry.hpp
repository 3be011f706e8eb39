#pragma once

#include <stepcache/Errors.hpp>
#include <stepcache/value/Value.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <variant>

/**
 * @brief Зарезервированные маркеры записей
 *
 * Четыре составных маркера всегда означают декодирование через
 * CompositeCodec. GENERIC помечает записи generic-кодека.
 * Ни один из них не может быть тегом типа.
 */
struct Markers {
    static constexpr const char* TUPLE = "__tuple__";
    static constexpr const char* LIST = "__list__";
    static constexpr const char* SET = "__set__";
    static constexpr const char* DICT = "__dict__";
    static constexpr const char* GENERIC = "__generic__";

    static bool isComposite(const std::string& marker) {
        return marker == TUPLE || marker == LIST || marker == SET || marker == DICT;
    }

    static bool isReserved(const std::string& marker) {
        return isComposite(marker) || marker == GENERIC;
    }
};

/**
 * @brief Кодек тегов типов: std::type_index ↔ стабильная строка
 *
 * Тег записывается на диск рядом с данными и при чтении разрешается
 * обратно в тип. Вместо отражения - явная таблица, которую заполняет
 * приложение при старте. Формат тега: "<пространство имён>.<имя типа>".
 *
 * Встроенные типы Value зарегистрированы заранее под тегами builtins.*.
 *
 * Потокобезопасность: после заполнения реестр только читается,
 * чтение не требует блокировок.
 */
class TypeRegistry {
public:
    /// Префикс описания незарегистрированного типа; как тег не принимается
    static constexpr const char* UNREGISTERED = "<unregistered>";

    TypeRegistry() {
        registerType<std::monostate>("builtins.NoneType");
        registerType<bool>("builtins.bool");
        registerType<int64_t>("builtins.int");
        registerType<double>("builtins.float");
        registerType<std::string>("builtins.str");
        registerType<Bytes>("builtins.bytes");
        registerType<List>("builtins.list");
        registerType<Tuple>("builtins.tuple");
        registerType<Set>("builtins.set");
        registerType<Dict>("builtins.dict");
    }

    template<typename T>
    void registerType(const std::string& tag) {
        registerType(std::type_index(typeid(T)), tag);
    }

    /**
     * @brief Связать тип с тегом
     *
     * Повторная регистрация типа заменяет его тег.
     *
     * @throws std::invalid_argument если тег пуст, зарезервирован
     *         или уже связан с другим типом
     */
    void registerType(std::type_index type, const std::string& tag) {
        if (tag.empty()) {
            throw std::invalid_argument("Type tag cannot be empty");
        }
        if (Markers::isReserved(tag)) {
            throw std::invalid_argument("Type tag collides with reserved marker: " + tag);
        }
        if (tag.rfind(UNREGISTERED, 0) == 0) {
            throw std::invalid_argument("Type tag cannot start with " +
                                        std::string(UNREGISTERED) + ": " + tag);
        }
        auto bound = typesByTag_.find(tag);
        if (bound != typesByTag_.end() && bound->second != type) {
            throw std::invalid_argument("Type tag already bound to another type: " + tag);
        }

        auto previous = tagsByType_.find(type);
        if (previous != tagsByType_.end()) {
            typesByTag_.erase(previous->second);
        }
        tagsByType_[type] = tag;
        typesByTag_.emplace(tag, type);
    }

    /**
     * @brief Тег типа или nullopt, если тип не зарегистрирован
     */
    std::optional<std::string> tagOf(std::type_index type) const {
        auto it = tagsByType_.find(type);
        if (it == tagsByType_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    /**
     * @brief Тег для записи на диск
     *
     * Для незарегистрированного типа - описание, которое никогда
     * не разрешается (при чтении сработает fallback).
     */
    std::string describe(std::type_index type) const {
        auto tag = tagOf(type);
        if (tag) {
            return *tag;
        }
        return std::string(UNREGISTERED) + type.name();
    }

    /**
     * @brief Тег для хэширования в ключ кэша
     *
     * В отличие от describe() не зависит от компилятора: для всех
     * незарегистрированных типов возвращает UNREGISTERED.
     */
    std::string stableTag(std::type_index type) const {
        auto tag = tagOf(type);
        return tag ? *tag : std::string(UNREGISTERED);
    }

    /**
     * @brief Разрешить тег обратно в тип
     * @return nullopt для неизвестного тега - это не ошибка
     */
    std::optional<std::type_index> resolve(const std::string& tag) const {
        auto it = typesByTag_.find(tag);
        if (it == typesByTag_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    /**
     * @brief Разрешить тег или бросить TypeResolutionFailure
     */
    std::type_index resolveOrThrow(const std::string& tag) const {
        auto type = resolve(tag);
        if (!type) {
            throw TypeResolutionFailure("Cannot resolve type tag: " + tag);
        }
        return *type;
    }

    size_t size() const {
        return tagsByType_.size();
    }

private:
    std::unordered_map<std::type_index, std::string> tagsByType_;
    std::unordered_map<std::string, std::type_index> typesByTag_;
};

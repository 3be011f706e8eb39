#pragma once

#include <stepcache/Errors.hpp>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <ostream>
#include <string>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <variant>
#include <vector>

/**
 * @brief Модель значений, которые проходят через кэш
 *
 * Value - tagged union над примитивами (null, bool, int64, double,
 * string, bytes), контейнерами (List, Tuple, Set, Dict) и Object -
 * разделяемым неизменяемым экземпляром любого другого C++ типа
 * (NdArray, Table, пользовательские типы).
 *
 * Точный тип времени выполнения (Value::type()) - ключ диспетчеризации
 * в реестрах: для Object это тип хранимого объекта, для остальных -
 * тип альтернативы variant.
 */

class Value;

using Bytes = std::vector<uint8_t>;

/**
 * @brief Упорядоченная последовательность (семантика list)
 */
struct List {
    std::vector<Value> items;

    List() = default;
    List(std::initializer_list<Value> init);
    explicit List(std::vector<Value> values);

    size_t size() const;
};

/**
 * @brief Упорядоченная последовательность (семантика tuple)
 */
struct Tuple {
    std::vector<Value> items;

    Tuple() = default;
    Tuple(std::initializer_list<Value> init);
    explicit Tuple(std::vector<Value> values);

    size_t size() const;
};

/**
 * @brief Неупорядоченное множество без дубликатов
 *
 * Порядок хранения - порядок вставки, но сравнение его не учитывает.
 */
struct Set {
    std::vector<Value> items;

    Set() = default;
    Set(std::initializer_list<Value> init);

    /**
     * @brief Добавить элемент, если такого ещё нет
     * @return true если элемент добавлен
     */
    bool insert(Value value);
    bool contains(const Value& value) const;
    size_t size() const;
};

/**
 * @brief Отображение ключ → значение с порядком вставки
 */
struct Dict {
    std::vector<std::pair<Value, Value>> items;

    Dict() = default;
    Dict(std::initializer_list<std::pair<Value, Value>> init);

    /**
     * @brief Вставить пару; существующий ключ получает новое значение
     */
    void insert(Value key, Value value);
    const Value* find(const Value& key) const;
    size_t size() const;
};

template<typename T, typename = void>
struct IsEqualityComparable : std::false_type {};

template<typename T>
struct IsEqualityComparable<T, std::void_t<decltype(
        std::declval<const T&>() == std::declval<const T&>())>>
    : std::true_type {};

/**
 * @brief Экземпляр произвольного типа внутри Value
 *
 * Хранит shared_ptr на неизменяемый объект и его std::type_index.
 * Сравнение - через operator== хранимого типа, если он есть,
 * иначе по идентичности.
 */
class Object {
public:
    template<typename T>
    static Object make(T value) {
        using Stored = std::decay_t<T>;
        Object object{std::type_index(typeid(Stored))};
        object.ptr_ = std::make_shared<const Stored>(std::move(value));
        object.equals_ = &Object::equalsImpl<Stored>;
        return object;
    }

    std::type_index type() const { return type_; }

    /**
     * @brief Указатель на объект, если он имеет ровно тип T
     */
    template<typename T>
    const T* get() const {
        if (type_ != std::type_index(typeid(T))) {
            return nullptr;
        }
        return static_cast<const T*>(ptr_.get());
    }

    bool operator==(const Object& other) const {
        if (type_ != other.type_) {
            return false;
        }
        if (ptr_ == other.ptr_) {
            return true;
        }
        return equals_(ptr_.get(), other.ptr_.get());
    }

    bool operator!=(const Object& other) const {
        return !(*this == other);
    }

private:
    explicit Object(std::type_index type) : type_(type) {}

    template<typename T>
    static bool equalsImpl(const void* lhs, const void* rhs) {
        if constexpr (IsEqualityComparable<T>::value) {
            return *static_cast<const T*>(lhs) == *static_cast<const T*>(rhs);
        } else {
            (void)lhs; (void)rhs;
            return false;
        }
    }

    std::shared_ptr<const void> ptr_;
    std::type_index type_;
    bool (*equals_)(const void*, const void*) = nullptr;
};

template<typename T, typename Variant>
struct IsVariantAlternative;

template<typename T, typename... Ts>
struct IsVariantAlternative<T, std::variant<Ts...>>
    : std::disjunction<std::is_same<T, Ts>...> {};

class Value {
public:
    using Storage = std::variant<std::monostate, bool, int64_t, double,
                                 std::string, Bytes,
                                 List, Tuple, Set, Dict, Object>;

    template<typename T>
    using IsAlternative = IsVariantAlternative<T, Storage>;

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool value) : data_(value) {}

    /// Все целые типы хранятся как int64 (uint64 выше INT64_MAX переполняется)
    template<typename T, typename std::enable_if<
        std::is_integral<T>::value && !std::is_same<T, bool>::value, int>::type = 0>
    Value(T value) : data_(static_cast<int64_t>(value)) {}

    template<typename T, typename std::enable_if<
        std::is_floating_point<T>::value, int>::type = 0>
    Value(T value) : data_(static_cast<double>(value)) {}

    Value(const char* value) : data_(std::string(value)) {}
    Value(std::string value) : data_(std::move(value)) {}
    Value(Bytes value) : data_(std::move(value)) {}
    Value(List value) : data_(std::move(value)) {}
    Value(Tuple value) : data_(std::move(value)) {}
    Value(Set value) : data_(std::move(value)) {}
    Value(Dict value) : data_(std::move(value)) {}
    Value(Object value) : data_(std::move(value)) {}

    /**
     * @brief Обернуть экземпляр пользовательского типа
     * @code
     *   Value v = Value::object(Table{...});
     * @endcode
     */
    template<typename T>
    static Value object(T value) {
        static_assert(!IsAlternative<std::decay_t<T>>::value,
                      "Built-in value types are stored directly");
        return Value(Object::make(std::move(value)));
    }

    bool isNull() const {
        return std::holds_alternative<std::monostate>(data_);
    }

    template<typename T>
    bool is() const {
        if constexpr (IsAlternative<T>::value) {
            return std::holds_alternative<T>(data_);
        } else {
            const Object* object = std::get_if<Object>(&data_);
            return object != nullptr && object->type() == std::type_index(typeid(T));
        }
    }

    /**
     * @brief Доступ к содержимому
     * @throws TypeMismatch если Value хранит другой тип
     */
    template<typename T>
    const T& as() const {
        if constexpr (IsAlternative<T>::value) {
            if (const T* value = std::get_if<T>(&data_)) {
                return *value;
            }
        } else {
            if (const Object* object = std::get_if<Object>(&data_)) {
                if (const T* value = object->get<T>()) {
                    return *value;
                }
            }
        }
        throw TypeMismatch(std::string("Value holds ") + kindName() +
                           ", requested " + typeid(T).name());
    }

    /**
     * @brief Точный тип времени выполнения
     */
    std::type_index type() const {
        return std::visit([](const auto& value) -> std::type_index {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same<T, Object>::value) {
                return value.type();
            } else {
                return std::type_index(typeid(T));
            }
        }, data_);
    }

    /**
     * @brief Короткое имя вида значения (для сообщений об ошибках)
     */
    const char* kindName() const {
        static constexpr const char* NAMES[] = {
            "none", "bool", "int", "float", "str", "bytes",
            "list", "tuple", "set", "dict", "object"
        };
        return NAMES[data_.index()];
    }

    const Storage& storage() const { return data_; }

private:
    Storage data_;
};

bool operator==(const Value& lhs, const Value& rhs);
bool operator!=(const Value& lhs, const Value& rhs);

// ==================== Контейнеры ====================

inline List::List(std::initializer_list<Value> init) : items(init) {}
inline List::List(std::vector<Value> values) : items(std::move(values)) {}
inline size_t List::size() const { return items.size(); }

inline Tuple::Tuple(std::initializer_list<Value> init) : items(init) {}
inline Tuple::Tuple(std::vector<Value> values) : items(std::move(values)) {}
inline size_t Tuple::size() const { return items.size(); }

inline Set::Set(std::initializer_list<Value> init) {
    for (const Value& value : init) {
        insert(value);
    }
}

inline bool Set::insert(Value value) {
    if (contains(value)) {
        return false;
    }
    items.push_back(std::move(value));
    return true;
}

inline bool Set::contains(const Value& value) const {
    for (const Value& item : items) {
        if (item == value) {
            return true;
        }
    }
    return false;
}

inline size_t Set::size() const { return items.size(); }

inline Dict::Dict(std::initializer_list<std::pair<Value, Value>> init) {
    for (const auto& [key, value] : init) {
        insert(key, value);
    }
}

inline void Dict::insert(Value key, Value value) {
    for (auto& item : items) {
        if (item.first == key) {
            item.second = std::move(value);
            return;
        }
    }
    items.emplace_back(std::move(key), std::move(value));
}

inline const Value* Dict::find(const Value& key) const {
    for (const auto& item : items) {
        if (item.first == key) {
            return &item.second;
        }
    }
    return nullptr;
}

inline size_t Dict::size() const { return items.size(); }

// ==================== Сравнение ====================

inline bool operator==(const List& lhs, const List& rhs) {
    return lhs.items == rhs.items;
}

inline bool operator==(const Tuple& lhs, const Tuple& rhs) {
    return lhs.items == rhs.items;
}

/**
 * @brief Сравнение множеств без учёта порядка, O(n²)
 */
inline bool operator==(const Set& lhs, const Set& rhs) {
    if (lhs.items.size() != rhs.items.size()) {
        return false;
    }
    std::vector<bool> matched(rhs.items.size(), false);
    for (const Value& item : lhs.items) {
        bool found = false;
        for (size_t i = 0; i < rhs.items.size(); ++i) {
            if (!matched[i] && rhs.items[i] == item) {
                matched[i] = true;
                found = true;
                break;
            }
        }
        if (!found) {
            return false;
        }
    }
    return true;
}

inline bool operator==(const Dict& lhs, const Dict& rhs) {
    if (lhs.items.size() != rhs.items.size()) {
        return false;
    }
    for (const auto& [key, value] : lhs.items) {
        const Value* other = rhs.find(key);
        if (other == nullptr || *other != value) {
            return false;
        }
    }
    return true;
}

inline bool operator!=(const List& lhs, const List& rhs) { return !(lhs == rhs); }
inline bool operator!=(const Tuple& lhs, const Tuple& rhs) { return !(lhs == rhs); }
inline bool operator!=(const Set& lhs, const Set& rhs) { return !(lhs == rhs); }
inline bool operator!=(const Dict& lhs, const Dict& rhs) { return !(lhs == rhs); }

inline bool operator==(const Value& lhs, const Value& rhs) {
    return lhs.storage() == rhs.storage();
}

inline bool operator!=(const Value& lhs, const Value& rhs) {
    return !(lhs == rhs);
}

// ==================== Вывод ====================

inline std::ostream& operator<<(std::ostream& os, const Value& value);

namespace detail {

template<typename Items>
void printItems(std::ostream& os, const Items& items) {
    bool first = true;
    for (const auto& item : items) {
        if (!first) {
            os << ", ";
        }
        os << item;
        first = false;
    }
}

}  // namespace detail

inline std::ostream& operator<<(std::ostream& os, const Value& value) {
    std::visit([&os](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same<T, std::monostate>::value) {
            os << "None";
        } else if constexpr (std::is_same<T, bool>::value) {
            os << (v ? "True" : "False");
        } else if constexpr (std::is_same<T, std::string>::value) {
            os << '\'' << v << '\'';
        } else if constexpr (std::is_same<T, Bytes>::value) {
            os << "bytes[" << v.size() << "]";
        } else if constexpr (std::is_same<T, List>::value) {
            os << '[';
            detail::printItems(os, v.items);
            os << ']';
        } else if constexpr (std::is_same<T, Tuple>::value) {
            os << '(';
            detail::printItems(os, v.items);
            os << (v.items.size() == 1 ? ",)" : ")");
        } else if constexpr (std::is_same<T, Set>::value) {
            os << '{';
            detail::printItems(os, v.items);
            os << '}';
        } else if constexpr (std::is_same<T, Dict>::value) {
            os << '{';
            bool first = true;
            for (const auto& [key, item] : v.items) {
                if (!first) {
                    os << ", ";
                }
                os << key << ": " << item;
                first = false;
            }
            os << '}';
        } else if constexpr (std::is_same<T, Object>::value) {
            os << "<object " << v.type().name() << '>';
        } else {
            os << v;
        }
    }, value.storage());
    return os;
}

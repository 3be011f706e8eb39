#pragma once

#include <stepcache/key/CacheKeyBuilder.hpp>
#include <stepcache/value/Value.hpp>
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief Параметр функции: имя и необязательное значение по умолчанию
 */
struct Parameter {
    std::string name;
    std::optional<Value> defaultValue;

    Parameter(std::string parameterName)
        : name(std::move(parameterName))
    {}

    Parameter(const char* parameterName)
        : name(parameterName)
    {}

    Parameter(std::string parameterName, Value value)
        : name(std::move(parameterName))
        , defaultValue(std::move(value))
    {}
};

using KeywordArguments = std::vector<std::pair<std::string, Value>>;

/**
 * @brief Сигнатура функции-шага
 *
 * Связывает позиционные и именованные аргументы вызова с параметрами
 * так же, как это делает обычный вызов функции с именованными
 * аргументами.
 *
 * @code
 *   Signature signature{Parameter{"df"}, Parameter{"offset", 10.0}};
 *   auto bound = signature.bind({Value::object(table)}, {{"offset", 5.0}});
 * @endcode
 */
class Signature {
public:
    Signature() = default;

    Signature(std::initializer_list<Parameter> parameters)
        : Signature(std::vector<Parameter>(parameters))
    {}

    /**
     * @throws std::invalid_argument при повторяющемся имени параметра
     */
    explicit Signature(std::vector<Parameter> parameters)
        : parameters_(std::move(parameters))
    {
        for (size_t i = 0; i < parameters_.size(); ++i) {
            for (size_t j = 0; j < i; ++j) {
                if (parameters_[i].name == parameters_[j].name) {
                    throw std::invalid_argument("Duplicate parameter name: " +
                                                parameters_[i].name);
                }
            }
        }
    }

    /**
     * @brief Связать аргументы вызова с параметрами
     * @return Аргументы в порядке объявления параметров,
     *         значения по умолчанию подставлены
     * @throws std::invalid_argument если позиционных аргументов слишком много,
     *         именованный аргумент неизвестен или задан дважды,
     *         или обязательный параметр не получил значения
     */
    BoundArguments bind(const std::vector<Value>& positional,
                        const KeywordArguments& keyword = {}) const {
        if (positional.size() > parameters_.size()) {
            throw std::invalid_argument(
                "Too many positional arguments: expected at most " +
                std::to_string(parameters_.size()) + ", got " +
                std::to_string(positional.size()));
        }

        std::vector<std::optional<Value>> slots(parameters_.size());
        for (size_t i = 0; i < positional.size(); ++i) {
            slots[i] = positional[i];
        }

        for (const auto& [name, value] : keyword) {
            size_t index = indexOf(name);
            if (slots[index]) {
                throw std::invalid_argument("Multiple values for argument: " + name);
            }
            slots[index] = value;
        }

        BoundArguments bound;
        bound.reserve(parameters_.size());
        for (size_t i = 0; i < parameters_.size(); ++i) {
            const Parameter& parameter = parameters_[i];
            if (slots[i]) {
                bound.emplace_back(parameter.name, std::move(*slots[i]));
            } else if (parameter.defaultValue) {
                bound.emplace_back(parameter.name, *parameter.defaultValue);
            } else {
                throw std::invalid_argument("Missing required argument: " + parameter.name);
            }
        }
        return bound;
    }

    const std::vector<Parameter>& parameters() const {
        return parameters_;
    }

private:
    size_t indexOf(const std::string& name) const {
        for (size_t i = 0; i < parameters_.size(); ++i) {
            if (parameters_[i].name == name) {
                return i;
            }
        }
        throw std::invalid_argument("Unexpected keyword argument: " + name);
    }

    std::vector<Parameter> parameters_;
};

/**
 * @brief Значение связанного аргумента по имени
 * @throws std::out_of_range если аргумента нет
 */
inline const Value& argument(const BoundArguments& bound, const std::string& name) {
    for (const auto& [argumentName, value] : bound) {
        if (argumentName == name) {
            return value;
        }
    }
    throw std::out_of_range("No such argument: " + name);
}

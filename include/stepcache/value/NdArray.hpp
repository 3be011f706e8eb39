#pragma once

#include <stepcache/Errors.hpp>
#include <stepcache/value/Value.hpp>
#include <algorithm>
#include <cstdint>
#include <cstring>
#include <functional>
#include <numeric>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

/**
 * @brief Тип элемента массива
 *
 * Значения кодов сохраняются на диск - не переупорядочивать.
 */
enum class DType : uint8_t {
    Bool    = 1,
    Int8    = 2,
    Int16   = 3,
    Int32   = 4,
    Int64   = 5,
    UInt8   = 6,
    UInt16  = 7,
    UInt32  = 8,
    UInt64  = 9,
    Float32 = 10,
    Float64 = 11,
    String  = 12   ///< строки фиксированной ширины, дополненные '\0'
};

/**
 * @brief Размер элемента для числовых типов (для String - 0, ширина задаётся отдельно)
 */
inline size_t dtypeItemSize(DType dtype) {
    switch (dtype) {
        case DType::Bool:
        case DType::Int8:
        case DType::UInt8:   return 1;
        case DType::Int16:
        case DType::UInt16:  return 2;
        case DType::Int32:
        case DType::UInt32:
        case DType::Float32: return 4;
        case DType::Int64:
        case DType::UInt64:
        case DType::Float64: return 8;
        case DType::String:  return 0;
    }
    return 0;
}

inline const char* dtypeName(DType dtype) {
    switch (dtype) {
        case DType::Bool:    return "bool";
        case DType::Int8:    return "int8";
        case DType::Int16:   return "int16";
        case DType::Int32:   return "int32";
        case DType::Int64:   return "int64";
        case DType::UInt8:   return "uint8";
        case DType::UInt16:  return "uint16";
        case DType::UInt32:  return "uint32";
        case DType::UInt64:  return "uint64";
        case DType::Float32: return "float32";
        case DType::Float64: return "float64";
        case DType::String:  return "str";
    }
    return "unknown";
}

inline bool isValidDType(uint8_t code) {
    return code >= static_cast<uint8_t>(DType::Bool) &&
           code <= static_cast<uint8_t>(DType::String);
}

template<typename T>
constexpr DType dtypeOf() {
    if constexpr (std::is_same<T, bool>::value) {
        return DType::Bool;
    } else if constexpr (std::is_same<T, int8_t>::value) {
        return DType::Int8;
    } else if constexpr (std::is_same<T, int16_t>::value) {
        return DType::Int16;
    } else if constexpr (std::is_same<T, int32_t>::value) {
        return DType::Int32;
    } else if constexpr (std::is_same<T, int64_t>::value) {
        return DType::Int64;
    } else if constexpr (std::is_same<T, uint8_t>::value) {
        return DType::UInt8;
    } else if constexpr (std::is_same<T, uint16_t>::value) {
        return DType::UInt16;
    } else if constexpr (std::is_same<T, uint32_t>::value) {
        return DType::UInt32;
    } else if constexpr (std::is_same<T, uint64_t>::value) {
        return DType::UInt64;
    } else if constexpr (std::is_same<T, float>::value) {
        return DType::Float32;
    } else {
        static_assert(std::is_same<T, double>::value, "Unsupported array element type");
        return DType::Float64;
    }
}

/**
 * @brief N-мерный массив фиксированной формы
 *
 * Данные хранятся плотно, C-порядок, little-endian.
 * Сам массив ничего не знает о файлах - формат описан в ArrayCodec.
 *
 * Пример:
 * @code
 *   auto a = NdArray::fromVector<double>({1.0, 2.0, 3.0, 4.0}, {2, 2});
 *   double x = a.values<double>()[3];
 * @endcode
 */
class NdArray {
public:
    NdArray() : dtype_(DType::Float64), shape_{0}, itemSize_(8) {}

    /**
     * @brief Конструктор из сырых данных
     * @param itemSize Ширина элемента; обязателен только для DType::String
     * @throws std::invalid_argument если размер данных не совпадает с формой
     */
    NdArray(DType dtype, std::vector<size_t> shape, Bytes data, size_t itemSize = 0)
        : dtype_(dtype)
        , shape_(std::move(shape))
        , itemSize_(dtype == DType::String ? itemSize : dtypeItemSize(dtype))
        , data_(std::move(data))
    {
        if (dtype_ == DType::String && itemSize_ == 0 && size() != 0) {
            throw std::invalid_argument("String array requires a positive item size");
        }
        if (data_.size() != size() * itemSize_) {
            throw std::invalid_argument(
                "Array data size " + std::to_string(data_.size()) +
                " does not match shape (" + std::to_string(size()) +
                " x " + std::to_string(itemSize_) + " bytes)");
        }
    }

    template<typename T>
    static NdArray fromVector(const std::vector<T>& values,
                              std::vector<size_t> shape = {}) {
        if (shape.empty()) {
            shape.push_back(values.size());
        }
        Bytes data(values.size() * sizeof(T));
        if constexpr (std::is_same<T, bool>::value) {
            for (size_t i = 0; i < values.size(); ++i) {
                data[i] = values[i] ? 1 : 0;
            }
        } else if (!values.empty()) {
            std::memcpy(data.data(), values.data(), data.size());
        }
        return NdArray(dtypeOf<T>(), std::move(shape), std::move(data));
    }

    /**
     * @brief Массив строк фиксированной ширины (ширина = самая длинная строка)
     */
    static NdArray fromStrings(const std::vector<std::string>& values,
                               std::vector<size_t> shape = {}) {
        if (shape.empty()) {
            shape.push_back(values.size());
        }
        size_t width = 1;
        for (const auto& value : values) {
            width = std::max(width, value.size());
        }
        Bytes data(values.size() * width, 0);
        for (size_t i = 0; i < values.size(); ++i) {
            std::memcpy(data.data() + i * width, values[i].data(), values[i].size());
        }
        return NdArray(DType::String, std::move(shape), std::move(data), width);
    }

    /**
     * @brief Склеить массивы одинаковой формы вдоль новой первой оси
     * @throws std::invalid_argument при пустом списке или несовпадении dtype/формы
     */
    static NdArray stack(const std::vector<NdArray>& arrays) {
        if (arrays.empty()) {
            throw std::invalid_argument("Cannot stack an empty list of arrays");
        }
        const NdArray& first = arrays.front();
        size_t itemSize = first.itemSize_;
        for (const auto& array : arrays) {
            if (array.dtype_ != first.dtype_) {
                throw std::invalid_argument(std::string("Cannot stack ") +
                    dtypeName(array.dtype_) + " with " + dtypeName(first.dtype_));
            }
            if (array.shape_ != first.shape_) {
                throw std::invalid_argument("Cannot stack arrays of different shapes");
            }
            itemSize = std::max(itemSize, array.itemSize_);
        }

        std::vector<size_t> shape;
        shape.push_back(arrays.size());
        shape.insert(shape.end(), first.shape_.begin(), first.shape_.end());

        Bytes data;
        data.reserve(arrays.size() * first.size() * itemSize);
        for (const auto& array : arrays) {
            if (array.itemSize_ == itemSize) {
                data.insert(data.end(), array.data_.begin(), array.data_.end());
                continue;
            }
            // Строки разной ширины - переупаковываем до общей
            for (size_t i = 0; i < array.size(); ++i) {
                auto begin = array.data_.begin() + i * array.itemSize_;
                data.insert(data.end(), begin, begin + array.itemSize_);
                data.insert(data.end(), itemSize - array.itemSize_, 0);
            }
        }
        return NdArray(first.dtype_, std::move(shape), std::move(data), itemSize);
    }

    /**
     * @brief Элементы массива в C-порядке
     * @throws TypeMismatch если T не соответствует dtype
     */
    template<typename T>
    std::vector<T> values() const {
        if (dtypeOf<T>() != dtype_) {
            throw TypeMismatch(std::string("Array holds ") + dtypeName(dtype_) +
                               ", requested " + dtypeName(dtypeOf<T>()));
        }
        std::vector<T> result(size());
        if constexpr (std::is_same<T, bool>::value) {
            for (size_t i = 0; i < result.size(); ++i) {
                result[i] = data_[i] != 0;
            }
        } else if (!result.empty()) {
            std::memcpy(result.data(), data_.data(), data_.size());
        }
        return result;
    }

    std::vector<std::string> strings() const {
        if (dtype_ != DType::String) {
            throw TypeMismatch(std::string("Array holds ") + dtypeName(dtype_) +
                               ", requested str");
        }
        std::vector<std::string> result;
        result.reserve(size());
        for (size_t i = 0; i < size(); ++i) {
            const char* begin = reinterpret_cast<const char*>(data_.data() + i * itemSize_);
            size_t length = 0;
            while (length < itemSize_ && begin[length] != '\0') {
                ++length;
            }
            result.emplace_back(begin, length);
        }
        return result;
    }

    DType dtype() const { return dtype_; }
    size_t itemSize() const { return itemSize_; }
    const std::vector<size_t>& shape() const { return shape_; }
    size_t ndim() const { return shape_.size(); }
    const Bytes& data() const { return data_; }

    /**
     * @brief Количество элементов (произведение измерений)
     */
    size_t size() const {
        return std::accumulate(shape_.begin(), shape_.end(), size_t{1},
                               std::multiplies<size_t>());
    }

    bool operator==(const NdArray& other) const {
        return dtype_ == other.dtype_ &&
               itemSize_ == other.itemSize_ &&
               shape_ == other.shape_ &&
               data_ == other.data_;
    }

    bool operator!=(const NdArray& other) const {
        return !(*this == other);
    }

private:
    DType dtype_;
    std::vector<size_t> shape_;
    size_t itemSize_;
    Bytes data_;
};

#pragma once

#include <stepcache/serialization/BinaryIO.hpp>
#include <stepcache/value/Value.hpp>
#include <istream>
#include <ostream>
#include <sstream>
#include <string>

/**
 * @brief Интерфейс сериализатора значений одного типа
 *
 * Отвечает только за формат данных: куда пишутся байты
 * (файл хранилища или буфер в памяти), решает вызывающий код.
 *
 * Реализации:
 * - GenericSerializer - встроенные типы Value (fallback)
 * - NdArraySerializer - массивы
 * - TableSerializer - таблицы с колонками-массивами
 *
 * Методы const: зарегистрированный сериализатор разделяется
 * между потоками и не должен иметь изменяемого состояния.
 */
class ISerializer {
public:
    virtual ~ISerializer() = default;

    /**
     * @brief Записать значение в поток
     * @param value Значение (тип проверяет сама реализация)
     * @param out Поток назначения
     * @throws TypeMismatch если value не того типа
     * @throws StorageIOFailure при ошибке записи
     */
    virtual void serialize(const Value& value, std::ostream& out) const = 0;

    /**
     * @brief Прочитать значение из потока
     * @param in Поток, позиционированный на начало данных
     * @return Восстановленное значение
     * @throws CorruptData если данные не распознаны
     */
    virtual Value deserialize(std::istream& in) const = 0;
};

/**
 * @brief Сериализовать в буфер в памяти
 */
inline Bytes serializeToBytes(const ISerializer& serializer, const Value& value) {
    std::ostringstream out(std::ios::binary);
    serializer.serialize(value, out);
    const std::string buffer = out.str();
    return Bytes(buffer.begin(), buffer.end());
}

/**
 * @brief Десериализовать из буфера в памяти
 */
inline Value deserializeFromBytes(const ISerializer& serializer, const Bytes& data) {
    std::istringstream in(std::string(data.begin(), data.end()), std::ios::binary);
    return serializer.deserialize(in);
}

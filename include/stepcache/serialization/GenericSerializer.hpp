#pragma once

#include <stepcache/Errors.hpp>
#include <stepcache/serialization/ArrayCodec.hpp>
#include <stepcache/serialization/BinaryIO.hpp>
#include <stepcache/serialization/ISerializer.hpp>
#include <stepcache/value/NdArray.hpp>
#include <stepcache/value/Value.hpp>
#include <string>
#include <type_traits>
#include <variant>

/**
 * @brief Generic-кодек: сериализатор по умолчанию для встроенных типов Value
 *
 * Используется, когда для точного типа значения нет зарегистрированного
 * сериализатора. Поддерживает только то, что выражается в модели Value:
 * null, bool, int64, double, string, bytes, List, Tuple, Set, Dict
 * (рекурсивно) и NdArray. Любой другой Object - UnsupportedType:
 * такой тип нужно зарегистрировать в Settings.
 *
 * Формат:
 * [4 байта: magic "SCPK"]
 * [4 байта: версия формата]
 * [значение]
 *
 * Значение: [1 байт: тег][данные]
 * - NONE    - нет данных
 * - BOOL    - 1 байт
 * - INT64   - 8 байт
 * - FLOAT64 - 8 байт (IEEE 754)
 * - STRING, BYTES - [8 байт: длина][байты]
 * - LIST, TUPLE, SET - [8 байт: количество][значения...]
 * - DICT    - [8 байт: количество][ключ, значение...]
 * - ARRAY   - блоб ArrayCodec
 */
class GenericSerializer : public ISerializer {
public:
    static constexpr uint32_t MAGIC = 0x4B504353;  // "SCPK" в little-endian
    static constexpr uint32_t VERSION = 1;
    static constexpr size_t MAX_DEPTH = 100;

    // Теги значений
    static constexpr uint8_t TAG_NONE    = 0x00;
    static constexpr uint8_t TAG_BOOL    = 0x01;
    static constexpr uint8_t TAG_INT64   = 0x02;
    static constexpr uint8_t TAG_FLOAT64 = 0x03;
    static constexpr uint8_t TAG_STRING  = 0x04;
    static constexpr uint8_t TAG_BYTES   = 0x05;
    static constexpr uint8_t TAG_LIST    = 0x06;
    static constexpr uint8_t TAG_TUPLE   = 0x07;
    static constexpr uint8_t TAG_SET     = 0x08;
    static constexpr uint8_t TAG_DICT    = 0x09;
    static constexpr uint8_t TAG_ARRAY   = 0x0A;

    void serialize(const Value& value, std::ostream& out) const override {
        writeStream(out, encode(value));
    }

    Value deserialize(std::istream& in) const override {
        return decode(readStream(in));
    }

    /**
     * @brief Закодировать значение в буфер
     * @throws UnsupportedType если внутри есть Object без generic-представления
     *         или вложенность глубже MAX_DEPTH (такое значение не прочитать)
     */
    static Bytes encode(const Value& value) {
        BinaryWriter writer;
        writer.writeUint32(MAGIC);
        writer.writeUint32(VERSION);
        writeValue(writer, value, 0);
        return writer.release();
    }

    /**
     * @brief Раскодировать буфер целиком
     * @throws CorruptData при неверном заголовке, теге или лишних байтах
     */
    static Value decode(const Bytes& data) {
        BinaryReader reader(data);
        if (data.size() < 8 || reader.readUint32() != MAGIC) {
            throw CorruptData("Invalid generic blob: wrong magic number");
        }
        uint32_t version = reader.readUint32();
        if (version != VERSION) {
            throw CorruptData("Unsupported generic format version: " +
                              std::to_string(version));
        }
        Value value = readValue(reader, 0);
        if (!reader.atEnd()) {
            throw CorruptData("Trailing bytes after generic value");
        }
        return value;
    }

    /**
     * @brief Начинается ли блоб с magic generic-кодека
     */
    static bool isGenericBlob(const Bytes& data) {
        if (data.size() < 4) {
            return false;
        }
        BinaryReader reader(data);
        return reader.readUint32() == MAGIC;
    }

private:
    template<typename Items>
    static void writeItems(BinaryWriter& writer, uint8_t tag, const Items& items,
                           size_t depth) {
        writer.writeUint8(tag);
        writer.writeUint64(items.size());
        for (const Value& item : items) {
            writeValue(writer, item, depth + 1);
        }
    }

    static void writeValue(BinaryWriter& writer, const Value& value, size_t depth) {
        if (depth > MAX_DEPTH) {
            throw UnsupportedType("Generic value nested deeper than " +
                                  std::to_string(MAX_DEPTH));
        }

        std::visit([&writer, depth](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same<T, std::monostate>::value) {
                writer.writeUint8(TAG_NONE);
            } else if constexpr (std::is_same<T, bool>::value) {
                writer.writeUint8(TAG_BOOL);
                writer.writeUint8(v ? 1 : 0);
            } else if constexpr (std::is_same<T, int64_t>::value) {
                writer.writeUint8(TAG_INT64);
                writer.writeInt64(v);
            } else if constexpr (std::is_same<T, double>::value) {
                writer.writeUint8(TAG_FLOAT64);
                writer.writeDouble(v);
            } else if constexpr (std::is_same<T, std::string>::value) {
                writer.writeUint8(TAG_STRING);
                writer.writeString(v);
            } else if constexpr (std::is_same<T, Bytes>::value) {
                writer.writeUint8(TAG_BYTES);
                writer.writeBlob(v);
            } else if constexpr (std::is_same<T, List>::value) {
                writeItems(writer, TAG_LIST, v.items, depth);
            } else if constexpr (std::is_same<T, Tuple>::value) {
                writeItems(writer, TAG_TUPLE, v.items, depth);
            } else if constexpr (std::is_same<T, Set>::value) {
                writeItems(writer, TAG_SET, v.items, depth);
            } else if constexpr (std::is_same<T, Dict>::value) {
                writer.writeUint8(TAG_DICT);
                writer.writeUint64(v.items.size());
                for (const auto& [key, item] : v.items) {
                    writeValue(writer, key, depth + 1);
                    writeValue(writer, item, depth + 1);
                }
            } else {
                static_assert(std::is_same<T, Object>::value, "Unhandled value alternative");
                const NdArray* array = v.template get<NdArray>();
                if (array == nullptr) {
                    throw UnsupportedType(
                        std::string("No generic encoding for type ") + v.type().name() +
                        "; register a serializer for it");
                }
                writer.writeUint8(TAG_ARRAY);
                ArrayCodec::write(writer, *array);
            }
        }, value.storage());
    }

    static Value readValue(BinaryReader& reader, size_t depth) {
        if (depth > MAX_DEPTH) {
            throw CorruptData("Generic value nested deeper than " +
                              std::to_string(MAX_DEPTH));
        }

        uint8_t tag = reader.readUint8();
        switch (tag) {
            case TAG_NONE:
                return Value();
            case TAG_BOOL:
                return Value(reader.readUint8() != 0);
            case TAG_INT64:
                return Value(reader.readInt64());
            case TAG_FLOAT64:
                return Value(reader.readDouble());
            case TAG_STRING:
                return Value(reader.readString());
            case TAG_BYTES:
                return Value(reader.readBlob());
            case TAG_LIST: {
                List list;
                readItems(reader, depth, list.items);
                return Value(std::move(list));
            }
            case TAG_TUPLE: {
                Tuple tuple;
                readItems(reader, depth, tuple.items);
                return Value(std::move(tuple));
            }
            case TAG_SET: {
                std::vector<Value> items;
                readItems(reader, depth, items);
                Set set;
                for (auto& item : items) {
                    set.insert(std::move(item));
                }
                return Value(std::move(set));
            }
            case TAG_DICT: {
                uint64_t count = reader.readUint64();
                Dict dict;
                for (uint64_t i = 0; i < count; ++i) {
                    Value key = readValue(reader, depth + 1);
                    Value item = readValue(reader, depth + 1);
                    dict.insert(std::move(key), std::move(item));
                }
                return Value(std::move(dict));
            }
            case TAG_ARRAY:
                return Value::object(ArrayCodec::read(reader));
            default:
                throw CorruptData("Unknown generic value tag: " + std::to_string(tag));
        }
    }

    static void readItems(BinaryReader& reader, size_t depth, std::vector<Value>& items) {
        uint64_t count = reader.readUint64();
        // Каждый элемент занимает минимум байт тега
        if (count > reader.remaining()) {
            throw CorruptData("Generic container count exceeds remaining data");
        }
        items.reserve(static_cast<size_t>(count));
        for (uint64_t i = 0; i < count; ++i) {
            items.push_back(readValue(reader, depth + 1));
        }
    }
};

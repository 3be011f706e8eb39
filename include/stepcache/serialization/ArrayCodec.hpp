#pragma once

#include <stepcache/Errors.hpp>
#include <stepcache/serialization/BinaryIO.hpp>
#include <stepcache/serialization/ISerializer.hpp>
#include <stepcache/value/NdArray.hpp>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @brief Бинарный формат одного массива (dtype + форма + сырые байты)
 *
 * Формат:
 * [4 байта: magic "SCND"]
 * [4 байта: версия формата]
 * [1 байт: код DType]
 * [4 байта: размер элемента]
 * [4 байта: число измерений N]
 * [N x 8 байт: измерения]
 * [8 байт: размер данных][данные]
 *
 * Формат сохраняет и тип, и длину: decode(encode(a)) == a побайтно.
 */
class ArrayCodec {
public:
    static constexpr uint32_t MAGIC = 0x444E4353;  // "SCND" в little-endian
    static constexpr uint32_t VERSION = 1;

    static void write(BinaryWriter& writer, const NdArray& array) {
        writer.writeUint32(MAGIC);
        writer.writeUint32(VERSION);
        writer.writeUint8(static_cast<uint8_t>(array.dtype()));
        writer.writeUint32(static_cast<uint32_t>(array.itemSize()));
        writer.writeUint32(static_cast<uint32_t>(array.ndim()));
        for (size_t dim : array.shape()) {
            writer.writeUint64(dim);
        }
        writer.writeBlob(array.data());
    }

    /**
     * @brief Прочитать массив с текущей позиции
     * @throws CorruptData при неверном заголовке или несогласованных размерах
     */
    static NdArray read(BinaryReader& reader) {
        if (reader.readUint32() != MAGIC) {
            throw CorruptData("Invalid array blob: wrong magic number");
        }
        uint32_t version = reader.readUint32();
        if (version != VERSION) {
            throw CorruptData("Unsupported array format version: " +
                              std::to_string(version));
        }

        uint8_t code = reader.readUint8();
        if (!isValidDType(code)) {
            throw CorruptData("Invalid array dtype code: " + std::to_string(code));
        }
        DType dtype = static_cast<DType>(code);

        uint32_t itemSize = reader.readUint32();
        if (dtype != DType::String && itemSize != dtypeItemSize(dtype)) {
            throw CorruptData(std::string("Invalid item size for ") + dtypeName(dtype));
        }

        uint32_t ndim = reader.readUint32();
        if (static_cast<uint64_t>(ndim) * 8 > reader.remaining()) {
            throw CorruptData("Array dimension count exceeds blob size");
        }
        std::vector<size_t> shape;
        shape.reserve(ndim);
        for (uint32_t i = 0; i < ndim; ++i) {
            shape.push_back(static_cast<size_t>(reader.readUint64()));
        }

        Bytes data = reader.readBlob();
        try {
            return NdArray(dtype, std::move(shape), std::move(data), itemSize);
        } catch (const std::invalid_argument& e) {
            throw CorruptData(std::string("Invalid array blob: ") + e.what());
        }
    }

    static Bytes encode(const NdArray& array) {
        BinaryWriter writer;
        write(writer, array);
        return writer.release();
    }

    static NdArray decode(const Bytes& data) {
        BinaryReader reader(data);
        NdArray array = read(reader);
        if (!reader.atEnd()) {
            throw CorruptData("Trailing bytes after array blob");
        }
        return array;
    }

    /**
     * @brief Начинается ли блоб с magic массива
     */
    static bool isArrayBlob(const Bytes& data) {
        if (data.size() < 4) {
            return false;
        }
        BinaryReader reader(data);
        return reader.readUint32() == MAGIC;
    }
};

/**
 * @brief Сериализатор для NdArray, регистрируется под тегом "stepcache.NdArray"
 */
class NdArraySerializer : public ISerializer {
public:
    void serialize(const Value& value, std::ostream& out) const override {
        if (!value.is<NdArray>()) {
            throw TypeMismatch(std::string("NdArraySerializer can only serialize arrays, got ") +
                               value.kindName());
        }
        writeStream(out, ArrayCodec::encode(value.as<NdArray>()));
    }

    Value deserialize(std::istream& in) const override {
        return Value::object(ArrayCodec::decode(readStream(in)));
    }
};

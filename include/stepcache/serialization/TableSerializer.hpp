#pragma once

#include <stepcache/Errors.hpp>
#include <stepcache/serialization/ArrayCodec.hpp>
#include <stepcache/serialization/BinaryIO.hpp>
#include <stepcache/serialization/GenericSerializer.hpp>
#include <stepcache/serialization/ISerializer.hpp>
#include <stepcache/serialization/ParquetTable.hpp>
#include <stepcache/value/NdArray.hpp>
#include <stepcache/value/Table.hpp>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @brief Запись метаданных сериализатора таблиц (JSON)
 *
 * {"ndarray_columns": [...], "object_columns": [...]}
 *
 * ndarray_columns - колонки, где есть массивы; object_columns - прочие
 * колонки, которые Parquet не хранит как плоские (контейнеры, объекты,
 * смесь несовместимых типов). Ячейки обеих упакованы в binary.
 * Неизвестные поля при чтении пропускаются.
 */
struct TableMetadata {
    static constexpr const char* NDARRAY_COLUMNS = "ndarray_columns";
    static constexpr const char* OBJECT_COLUMNS = "object_columns";

    std::vector<std::string> ndarrayColumns;
    std::vector<std::string> objectColumns;

    std::string encode() const {
        nlohmann::json json;
        json[NDARRAY_COLUMNS] = ndarrayColumns;
        json[OBJECT_COLUMNS] = objectColumns;
        return json.dump();
    }

    /**
     * @throws CorruptData если это не JSON-объект ожидаемой формы
     */
    static TableMetadata decode(const std::string& text) {
        TableMetadata metadata;
        try {
            nlohmann::json json = nlohmann::json::parse(text);
            if (!json.is_object()) {
                throw CorruptData("Table metadata is not a JSON object");
            }
            metadata.ndarrayColumns =
                json.value(NDARRAY_COLUMNS, std::vector<std::string>{});
            metadata.objectColumns =
                json.value(OBJECT_COLUMNS, std::vector<std::string>{});
        } catch (const nlohmann::json::exception& e) {
            throw CorruptData(std::string("Invalid table metadata: ") + e.what());
        }
        return metadata;
    }

    /// Все упакованные колонки
    std::vector<std::string> packedColumns() const {
        std::vector<std::string> names = ndarrayColumns;
        names.insert(names.end(), objectColumns.begin(), objectColumns.end());
        return names;
    }
};

/**
 * @brief Сериализатор таблиц с колонками-массивами
 *
 * Таблица пишется в Parquet (ParquetTable), который хранит только
 * плоские колонки. Колонки, где есть массивы (NdArray или список
 * массивов), и колонки, которые нельзя записать плоскими, упаковываются:
 * каждая непустая ячейка превращается в блоб (ArrayCodec для массива,
 * generic-кодек для всего остального). Имена упакованных колонок
 * записываются в метаданные файла под ключом METADATA_KEY, по ним
 * при чтении ячейки распаковываются обратно.
 *
 * Перед упаковкой ячейки колонок-массивов нормализуются (только при записи):
 * - список массивов одинаковой формы склеивается в один массив
 * - список строк превращается в строковый массив
 * Если нормализация не удалась, ячейка пишется как есть.
 *
 * Колонка из int64 и float64 не упаковывается: ParquetTable расширяет
 * её до float64.
 */
class TableSerializer : public ISerializer {
public:
    static constexpr const char* METADATA_KEY = "serializer_metadata";

    void serialize(const Value& value, std::ostream& out) const override {
        if (!value.is<Table>()) {
            throw TypeMismatch(std::string("TableSerializer can only serialize tables, got ") +
                               value.kindName());
        }
        writeStream(out, encode(value.as<Table>()));
    }

    Value deserialize(std::istream& in) const override {
        return Value::object(decode(readStream(in)));
    }

    static Bytes encode(const Table& table) {
        TableMetadata metadata;
        Table packed;
        for (const auto& column : table.columns()) {
            if (isArrayColumn(column)) {
                metadata.ndarrayColumns.push_back(column.name);
                packed.addColumn(column.name, packColumn(column, true));
            } else if (!ParquetTable::storesNatively(column)) {
                metadata.objectColumns.push_back(column.name);
                packed.addColumn(column.name, packColumn(column, false));
            } else {
                packed.addColumn(column.name, column.cells);
            }
        }

        ParquetTable::Metadata fileMetadata;
        fileMetadata[METADATA_KEY] = metadata.encode();
        return ParquetTable::write(packed, fileMetadata);
    }

    /**
     * @throws CorruptData если метаданные ссылаются на отсутствующую колонку
     *         или ячейка упакованной колонки не блоб
     */
    static Table decode(const Bytes& data) {
        ParquetTable::Contents contents = ParquetTable::read(data);
        auto it = contents.metadata.find(METADATA_KEY);
        if (it == contents.metadata.end()) {
            return std::move(contents.table);
        }

        TableMetadata metadata = TableMetadata::decode(it->second);
        for (const auto& name : metadata.packedColumns()) {
            if (!contents.table.hasColumn(name)) {
                throw CorruptData("Table metadata names missing column: " + name);
            }
            for (Value& cell : contents.table.column(name)) {
                cell = unpackCell(cell);
            }
        }
        return std::move(contents.table);
    }

    /**
     * @brief Есть ли в колонке хотя бы одна ячейка-массив
     */
    static bool isArrayColumn(const Column& column) {
        for (const Value& cell : column.cells) {
            if (cell.is<NdArray>() || isArrayList(cell)) {
                return true;
            }
        }
        return false;
    }

private:
    static const std::vector<Value>* sequenceItems(const Value& cell) {
        if (cell.is<List>()) {
            return &cell.as<List>().items;
        }
        if (cell.is<Tuple>()) {
            return &cell.as<Tuple>().items;
        }
        return nullptr;
    }

    template<typename T>
    static bool allItemsAre(const std::vector<Value>& items) {
        if (items.empty()) {
            return false;
        }
        for (const Value& item : items) {
            if (!item.is<T>()) {
                return false;
            }
        }
        return true;
    }

    static bool isArrayList(const Value& cell) {
        const std::vector<Value>* items = sequenceItems(cell);
        return items != nullptr && allItemsAre<NdArray>(*items);
    }

    static Value normalize(const Value& cell) {
        const std::vector<Value>* items = sequenceItems(cell);
        if (items == nullptr) {
            return cell;
        }
        if (allItemsAre<NdArray>(*items)) {
            std::vector<NdArray> arrays;
            arrays.reserve(items->size());
            for (const Value& item : *items) {
                arrays.push_back(item.as<NdArray>());
            }
            try {
                return Value::object(NdArray::stack(arrays));
            } catch (const std::invalid_argument&) {
                return cell;  // разные формы: пишем список через generic
            }
        }
        if (allItemsAre<std::string>(*items)) {
            std::vector<std::string> strings;
            strings.reserve(items->size());
            for (const Value& item : *items) {
                strings.push_back(item.as<std::string>());
            }
            return Value::object(NdArray::fromStrings(strings));
        }
        return cell;
    }

    static std::vector<Value> packColumn(const Column& column, bool arrays) {
        std::vector<Value> cells;
        cells.reserve(column.cells.size());
        for (const Value& cell : column.cells) {
            cells.push_back(packCell(cell, arrays));
        }
        return cells;
    }

    static Value packCell(const Value& cell, bool arrays) {
        if (cell.isNull()) {
            return cell;
        }
        Value normalized = arrays ? normalize(cell) : cell;
        if (normalized.is<NdArray>()) {
            return Value(ArrayCodec::encode(normalized.as<NdArray>()));
        }
        return Value(GenericSerializer::encode(normalized));
    }

    static Value unpackCell(const Value& cell) {
        if (cell.isNull()) {
            return cell;
        }
        if (!cell.is<Bytes>()) {
            throw CorruptData(std::string("Packed table cell is not binary: ") +
                              cell.kindName());
        }
        const Bytes& blob = cell.as<Bytes>();
        if (ArrayCodec::isArrayBlob(blob)) {
            return Value::object(ArrayCodec::decode(blob));
        }
        return GenericSerializer::decode(blob);
    }
};

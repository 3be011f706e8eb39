#pragma once

#include <stepcache/Errors.hpp>
#include <stepcache/value/Table.hpp>
#include <stepcache/value/Value.hpp>
#include <arrow/api.h>
#include <arrow/io/memory.h>
#include <parquet/arrow/reader.h>
#include <parquet/arrow/writer.h>
#include <parquet/exception.h>
#include <parquet/properties.h>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

/**
 * @brief Таблица в формате Parquet (через Apache Arrow)
 *
 * Хранит только плоские колонки: bool, int64, float64, string, binary
 * и колонки из одних null. Колонка, где рядом int64 и float64,
 * расширяется до float64. Остальное (контейнеры, объекты, смесь
 * несовместимых типов) нужно заранее упаковать в binary, этим
 * занимается TableSerializer.
 *
 * Метаданные пишутся в key/value метаданные схемы и попадают
 * в key/value метаданные файла Parquet.
 */
class ParquetTable {
public:
    using Metadata = std::map<std::string, std::string>;

    struct Contents {
        Table table;
        Metadata metadata;
    };

    enum class ColumnType {
        Null,
        Bool,
        Int64,
        Float64,
        String,
        Binary
    };

    /**
     * @brief Тип колонки в файле или nullopt, если колонка не плоская
     */
    static std::optional<ColumnType> columnType(const Column& column) {
        std::optional<ColumnType> result = ColumnType::Null;
        for (const Value& cell : column.cells) {
            std::optional<ColumnType> cellType = cellTypeOf(cell);
            if (!cellType) {
                return std::nullopt;
            }
            result = merge(*result, *cellType);
            if (!result) {
                return std::nullopt;
            }
        }
        return result;
    }

    static bool storesNatively(const Column& column) {
        return columnType(column).has_value();
    }

    /**
     * @brief Записать таблицу в буфер Parquet
     * @throws UnsupportedType если колонка не плоская или Arrow отказал в записи
     */
    static Bytes write(const Table& table, const Metadata& metadata) {
        arrow::Result<std::shared_ptr<arrow::Buffer>> buffer = writeBuffer(table, metadata);
        if (!buffer.ok()) {
            throw UnsupportedType("Failed to write Parquet table: " +
                                  buffer.status().ToString());
        }
        const std::shared_ptr<arrow::Buffer>& data = *buffer;
        return Bytes(data->data(), data->data() + data->size());
    }

    /**
     * @brief Прочитать таблицу и метаданные
     * @throws CorruptData если буфер не файл Parquet или тип колонки неизвестен
     */
    static Contents read(const Bytes& data) {
        std::shared_ptr<arrow::Table> arrowTable;
        try {
            auto input = std::make_shared<arrow::io::BufferReader>(
                std::make_shared<arrow::Buffer>(data.data(), static_cast<int64_t>(data.size())));

            parquet::arrow::FileReaderBuilder builder;
            raiseOnCorrupt(builder.Open(input));
            std::unique_ptr<parquet::arrow::FileReader> reader;
            raiseOnCorrupt(builder.Build(&reader));
            raiseOnCorrupt(reader->ReadTable(&arrowTable));
        } catch (const parquet::ParquetException& e) {
            throw CorruptData(std::string("Invalid Parquet table: ") + e.what());
        }

        Contents contents;
        std::shared_ptr<const arrow::KeyValueMetadata> fileMetadata =
            arrowTable->schema()->metadata();
        if (fileMetadata) {
            for (int64_t i = 0; i < fileMetadata->size(); ++i) {
                contents.metadata[fileMetadata->key(i)] = fileMetadata->value(i);
            }
        }

        for (int i = 0; i < arrowTable->num_columns(); ++i) {
            const std::string& name = arrowTable->schema()->field(i)->name();
            std::vector<Value> cells = readColumn(name, *arrowTable->column(i));
            try {
                contents.table.addColumn(name, std::move(cells));
            } catch (const std::invalid_argument& e) {
                throw CorruptData(std::string("Invalid Parquet table: ") + e.what());
            }
        }
        return contents;
    }

private:
    static std::optional<ColumnType> cellTypeOf(const Value& cell) {
        return std::visit([](const auto& v) -> std::optional<ColumnType> {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same<T, std::monostate>::value) {
                return ColumnType::Null;
            } else if constexpr (std::is_same<T, bool>::value) {
                return ColumnType::Bool;
            } else if constexpr (std::is_same<T, int64_t>::value) {
                return ColumnType::Int64;
            } else if constexpr (std::is_same<T, double>::value) {
                return ColumnType::Float64;
            } else if constexpr (std::is_same<T, std::string>::value) {
                return ColumnType::String;
            } else if constexpr (std::is_same<T, Bytes>::value) {
                return ColumnType::Binary;
            } else {
                return std::nullopt;
            }
        }, cell.storage());
    }

    static std::optional<ColumnType> merge(ColumnType column, ColumnType cell) {
        if (column == ColumnType::Null || column == cell) {
            return cell;
        }
        if (cell == ColumnType::Null) {
            return column;
        }
        bool numeric = (column == ColumnType::Int64 || column == ColumnType::Float64) &&
                       (cell == ColumnType::Int64 || cell == ColumnType::Float64);
        if (numeric) {
            return ColumnType::Float64;
        }
        return std::nullopt;
    }

    static void raiseOnCorrupt(const arrow::Status& status) {
        if (!status.ok()) {
            throw CorruptData("Invalid Parquet table: " + status.ToString());
        }
    }

    // ==================== Запись ====================

    static arrow::Result<std::shared_ptr<arrow::Buffer>> writeBuffer(
            const Table& table, const Metadata& metadata) {
        std::vector<std::shared_ptr<arrow::Field>> fields;
        std::vector<std::shared_ptr<arrow::Array>> arrays;
        for (const auto& column : table.columns()) {
            std::optional<ColumnType> type = columnType(column);
            if (!type) {
                return arrow::Status::TypeError("Column '", column.name,
                                                "' cannot be stored as a flat Parquet column");
            }
            ARROW_ASSIGN_OR_RAISE(auto array, buildArray(column, *type));
            fields.push_back(arrow::field(column.name, array->type()));
            arrays.push_back(std::move(array));
        }

        std::vector<std::string> keys;
        std::vector<std::string> values;
        for (const auto& [key, value] : metadata) {
            keys.push_back(key);
            values.push_back(value);
        }
        auto schema = arrow::schema(fields)->WithMetadata(
            arrow::KeyValueMetadata::Make(std::move(keys), std::move(values)));
        auto arrowTable = arrow::Table::Make(schema, arrays,
                                             static_cast<int64_t>(table.rows()));

        auto arrowProperties = parquet::ArrowWriterProperties::Builder().store_schema()->build();
        ARROW_ASSIGN_OR_RAISE(auto sink, arrow::io::BufferOutputStream::Create());
        ARROW_RETURN_NOT_OK(parquet::arrow::WriteTable(
            *arrowTable, arrow::default_memory_pool(), sink,
            parquet::DEFAULT_MAX_ROW_GROUP_LENGTH,
            parquet::default_writer_properties(), arrowProperties));
        return sink->Finish();
    }

    static arrow::Result<std::shared_ptr<arrow::Array>> buildArray(
            const Column& column, ColumnType type) {
        switch (type) {
            case ColumnType::Null: {
                arrow::NullBuilder builder;
                ARROW_RETURN_NOT_OK(builder.AppendNulls(static_cast<int64_t>(column.cells.size())));
                return builder.Finish();
            }
            case ColumnType::Bool:
                return buildWith<arrow::BooleanBuilder>(column, [](const Value& cell) {
                    return cell.as<bool>();
                });
            case ColumnType::Int64:
                return buildWith<arrow::Int64Builder>(column, [](const Value& cell) {
                    return cell.as<int64_t>();
                });
            case ColumnType::Float64:
                return buildWith<arrow::DoubleBuilder>(column, [](const Value& cell) {
                    // int64 в смешанной колонке расширяется до float64
                    return cell.is<int64_t>() ? static_cast<double>(cell.as<int64_t>())
                                              : cell.as<double>();
                });
            case ColumnType::String:
                return buildWith<arrow::StringBuilder>(column, [](const Value& cell) {
                    return cell.as<std::string>();
                });
            case ColumnType::Binary:
                return buildWith<arrow::BinaryBuilder>(column, [](const Value& cell) {
                    const Bytes& bytes = cell.as<Bytes>();
                    return std::string(bytes.begin(), bytes.end());
                });
        }
        return arrow::Status::Invalid("Unknown column type");
    }

    template<typename Builder, typename Convert>
    static arrow::Result<std::shared_ptr<arrow::Array>> buildWith(
            const Column& column, Convert convert) {
        Builder builder;
        ARROW_RETURN_NOT_OK(builder.Reserve(static_cast<int64_t>(column.cells.size())));
        for (const Value& cell : column.cells) {
            if (cell.isNull()) {
                ARROW_RETURN_NOT_OK(builder.AppendNull());
            } else {
                ARROW_RETURN_NOT_OK(builder.Append(convert(cell)));
            }
        }
        return builder.Finish();
    }

    // ==================== Чтение ====================

    static std::vector<Value> readColumn(const std::string& name,
                                         const arrow::ChunkedArray& column) {
        std::vector<Value> cells;
        cells.reserve(static_cast<size_t>(column.length()));
        for (const auto& chunk : column.chunks()) {
            switch (chunk->type_id()) {
                case arrow::Type::NA:
                    cells.resize(cells.size() + static_cast<size_t>(chunk->length()));
                    break;
                case arrow::Type::BOOL:
                    readChunk<arrow::BooleanArray>(*chunk, cells, [](const auto& array, int64_t i) {
                        return Value(array.Value(i));
                    });
                    break;
                case arrow::Type::INT64:
                    readChunk<arrow::Int64Array>(*chunk, cells, [](const auto& array, int64_t i) {
                        return Value(static_cast<int64_t>(array.Value(i)));
                    });
                    break;
                case arrow::Type::DOUBLE:
                    readChunk<arrow::DoubleArray>(*chunk, cells, [](const auto& array, int64_t i) {
                        return Value(array.Value(i));
                    });
                    break;
                case arrow::Type::STRING:
                    readChunk<arrow::StringArray>(*chunk, cells, [](const auto& array, int64_t i) {
                        return Value(array.GetString(i));
                    });
                    break;
                case arrow::Type::BINARY:
                    readChunk<arrow::BinaryArray>(*chunk, cells, [](const auto& array, int64_t i) {
                        std::string bytes = array.GetString(i);
                        return Value(Bytes(bytes.begin(), bytes.end()));
                    });
                    break;
                default:
                    throw CorruptData("Unsupported Parquet column type for '" + name +
                                      "': " + chunk->type()->ToString());
            }
        }
        return cells;
    }

    template<typename ArrayType, typename Convert>
    static void readChunk(const arrow::Array& chunk, std::vector<Value>& cells,
                          Convert convert) {
        const auto& array = static_cast<const ArrayType&>(chunk);
        for (int64_t i = 0; i < array.length(); ++i) {
            cells.push_back(array.IsNull(i) ? Value() : convert(array, i));
        }
    }
};

#include <gtest/gtest.h>
#include <stepcache/Settings.hpp>
#include <stepcache/key/CacheKeyBuilder.hpp>
#include <stepcache/serialization/ParquetTable.hpp>
#include <stepcache/serialization/TableSerializer.hpp>
#include <stepcache/value/NdArray.hpp>
#include <stepcache/value/Table.hpp>
#include <memory>
#include <sstream>

/**
 * @brief Тесты для ParquetTable и TableSerializer
 *
 * Проверяем:
 * - Плоские колонки всех типов и null
 * - Расширение int64 до float64 в смешанной колонке
 * - Упаковку колонок-массивов и колонок-контейнеров, метаданные
 * - Нормализацию списков массивов и списков строк
 * - Поведение при отсутствии метаданных и повреждённых данных
 */

namespace {

TableMetadata metadataOf(const Bytes& data) {
    ParquetTable::Contents contents = ParquetTable::read(data);
    return TableMetadata::decode(contents.metadata.at(TableSerializer::METADATA_KEY));
}

}  // namespace

// ==================== ParquetTable ====================

TEST(ParquetTableTest, RoundTripFlatColumns) {
    Table table{
        {"flag", {true, Value(), false}},
        {"count", {1, 2, Value()}},
        {"price", {1.5, Value(), 3.25}},
        {"name", {"a", "b", "c"}},
        {"raw", {Bytes{1}, Bytes{}, Value()}},
        {"empty", {Value(), Value(), Value()}}
    };

    ParquetTable::Contents contents = ParquetTable::read(ParquetTable::write(table, {}));

    EXPECT_EQ(contents.table, table);
}

TEST(ParquetTableTest, KeepsMetadata) {
    Table table{{"a", {1}}};

    ParquetTable::Contents contents =
        ParquetTable::read(ParquetTable::write(table, {{"origin", "xy"}}));

    EXPECT_EQ(contents.metadata.at("origin"), "xy");
}

TEST(ParquetTableTest, ColumnTypes) {
    using Type = ParquetTable::ColumnType;

    EXPECT_EQ(ParquetTable::columnType(Column{"a", {1, Value(), 2}}), Type::Int64);
    EXPECT_EQ(ParquetTable::columnType(Column{"a", {1, 2.5}}), Type::Float64);
    EXPECT_EQ(ParquetTable::columnType(Column{"a", {Value()}}), Type::Null);
    EXPECT_FALSE(ParquetTable::columnType(Column{"a", {1, "one"}}).has_value());
    EXPECT_FALSE(ParquetTable::columnType(Column{"a", {true, 1}}).has_value());
    EXPECT_FALSE(ParquetTable::columnType(Column{"a", {List{1, 2}}}).has_value());
}

TEST(ParquetTableTest, MixedNumericColumnIsWidenedToFloat) {
    Table table{{"a", {1, 2.5, Value()}}};

    ParquetTable::Contents contents = ParquetTable::read(ParquetTable::write(table, {}));

    const auto& cells = contents.table.column("a");
    ASSERT_EQ(cells.size(), 3u);
    EXPECT_EQ(cells[0], Value(1.0));
    EXPECT_EQ(cells[1], Value(2.5));
    EXPECT_TRUE(cells[2].isNull());
}

TEST(ParquetTableTest, RejectsNestedCells) {
    Table table{{"a", {List{1, 2}}}};

    EXPECT_THROW(ParquetTable::write(table, {}), UnsupportedType);
}

TEST(ParquetTableTest, RejectsTruncatedFile) {
    Bytes data = ParquetTable::write(Table{{"a", {1}}}, {});
    data.resize(data.size() - 4);

    EXPECT_THROW(ParquetTable::read(data), CorruptData);
}

TEST(ParquetTableTest, RejectsGarbage) {
    EXPECT_THROW(ParquetTable::read(Bytes{1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12}), CorruptData);
}

// ==================== TableSerializer ====================

TEST(TableSerializerTest, RoundTripPlainTable) {
    Table table{{"a", {1, 2, 3}}, {"b", {"x", "y", "z"}}};

    EXPECT_EQ(TableSerializer::decode(TableSerializer::encode(table)), table);
}

TEST(TableSerializerTest, MetadataIsWrittenForPlainTable) {
    Table table{{"a", {1, 2, 3}}};

    TableMetadata metadata = metadataOf(TableSerializer::encode(table));

    EXPECT_TRUE(metadata.ndarrayColumns.empty());
    EXPECT_TRUE(metadata.objectColumns.empty());
}

TEST(TableSerializerTest, RoundTripArrayColumn) {
    Table table{
        {"id", {1, 2}},
        {"vector", {
            Value::object(NdArray::fromVector<double>({1.0, 2.0, 3.0})),
            Value::object(NdArray::fromVector<double>({4.0, 5.0, 6.0}))
        }}
    };

    Bytes data = TableSerializer::encode(table);
    Table decoded = TableSerializer::decode(data);

    EXPECT_EQ(decoded, table);
    EXPECT_TRUE(decoded.column("vector")[0].is<NdArray>());
    EXPECT_EQ(metadataOf(data).ndarrayColumns, (std::vector<std::string>{"vector"}));
}

TEST(TableSerializerTest, NullCellsStayNull) {
    Table table{
        {"vector", {Value::object(NdArray::fromVector<int32_t>({1, 2})), Value()}}
    };

    Table decoded = TableSerializer::decode(TableSerializer::encode(table));

    EXPECT_TRUE(decoded.column("vector")[1].isNull());
    EXPECT_EQ(decoded, table);
}

TEST(TableSerializerTest, NonArrayCellsInArrayColumnUseGenericCodec) {
    Table table{
        {"vector", {Value::object(NdArray::fromVector<int32_t>({1, 2})), List{1, "a"}}}
    };

    Table decoded = TableSerializer::decode(TableSerializer::encode(table));

    EXPECT_EQ(decoded.column("vector")[1], Value(List{1, "a"}));
}

TEST(TableSerializerTest, MixedNumericColumnIsStoredAsFloat) {
    Table table{{"a", {1, 2.5}}};

    Bytes data = TableSerializer::encode(table);
    Table decoded = TableSerializer::decode(data);

    EXPECT_EQ(decoded, (Table{{"a", {1.0, 2.5}}}));
    EXPECT_TRUE(metadataOf(data).objectColumns.empty());
    EXPECT_EQ(TableSerializer::decode(TableSerializer::encode(decoded)), decoded);
}

TEST(TableSerializerTest, ListCellsArePackedAsObjectColumn) {
    Table table{{"a", {List{1, 2}, List{3}, Value()}}, {"b", {1, 2, 3}}};

    Bytes data = TableSerializer::encode(table);
    Table decoded = TableSerializer::decode(data);

    EXPECT_EQ(decoded, table);
    TableMetadata metadata = metadataOf(data);
    EXPECT_EQ(metadata.objectColumns, (std::vector<std::string>{"a"}));
    EXPECT_TRUE(metadata.ndarrayColumns.empty());
}

TEST(TableSerializerTest, IncompatibleCellsArePackedAsObjectColumn) {
    Value dict = Dict{{"k", 1}};
    Table table{{"a", {1, "one", dict, true}}};

    Table decoded = TableSerializer::decode(TableSerializer::encode(table));

    EXPECT_EQ(decoded, table);
}

TEST(TableSerializerTest, TablesWithNestedCellsCanBeHashed) {
    auto settings = std::make_shared<const Settings>(Settings::defaults());
    CacheKeyBuilder builder(settings);
    Value first = Value::object(Table{{"a", {List{1, 2}, List{3}}}});
    Value second = Value::object(Table{{"a", {List{1, 2}, List{4}}}});

    EXPECT_EQ(builder.build(0, {{"df", first}}), builder.build(0, {{"df", first}}));
    EXPECT_NE(builder.build(0, {{"df", first}}), builder.build(0, {{"df", second}}));
}

TEST(TableSerializerTest, ListOfArraysIsStacked) {
    auto a = NdArray::fromVector<int32_t>({1, 2});
    auto b = NdArray::fromVector<int32_t>({3, 4});
    Table table{{"frames", {List{Value::object(a), Value::object(b)}}}};

    Table decoded = TableSerializer::decode(TableSerializer::encode(table));

    const Value& cell = decoded.column("frames")[0];
    ASSERT_TRUE(cell.is<NdArray>());
    EXPECT_EQ(cell.as<NdArray>(), NdArray::stack({a, b}));
}

TEST(TableSerializerTest, ListOfArraysWithDifferentShapesIsKept) {
    auto a = NdArray::fromVector<int32_t>({1, 2});
    auto b = NdArray::fromVector<int32_t>({3});
    Value cell = List{Value::object(a), Value::object(b)};
    Table table{{"frames", {cell}}};

    Table decoded = TableSerializer::decode(TableSerializer::encode(table));

    EXPECT_EQ(decoded.column("frames")[0], cell);
}

TEST(TableSerializerTest, ListOfStringsInArrayColumnBecomesStringArray) {
    Table table{
        {"labels", {Value::object(NdArray::fromStrings({"x"})), List{"ab", "c"}}}
    };

    Table decoded = TableSerializer::decode(TableSerializer::encode(table));

    const Value& cell = decoded.column("labels")[1];
    ASSERT_TRUE(cell.is<NdArray>());
    EXPECT_EQ(cell.as<NdArray>().strings(), (std::vector<std::string>{"ab", "c"}));
}

TEST(TableSerializerTest, MissingMetadataReturnsTableUnchanged) {
    Table table{{"blob", {Bytes{1, 2, 3}}}};

    Table decoded = TableSerializer::decode(ParquetTable::write(table, {}));

    EXPECT_EQ(decoded, table);
}

TEST(TableSerializerTest, MetadataNamingMissingColumnIsCorrupt) {
    TableMetadata metadata;
    metadata.ndarrayColumns = {"ghost"};

    Bytes data = ParquetTable::write(Table{{"a", {1}}},
                                     {{TableSerializer::METADATA_KEY, metadata.encode()}});

    EXPECT_THROW(TableSerializer::decode(data), CorruptData);
}

TEST(TableSerializerTest, MalformedMetadataIsCorrupt) {
    Bytes data = ParquetTable::write(Table{{"a", {1}}},
                                     {{TableSerializer::METADATA_KEY, "{not json"}});

    EXPECT_THROW(TableSerializer::decode(data), CorruptData);
}

TEST(TableSerializerTest, StreamInterfaceRejectsOtherTypes) {
    TableSerializer serializer;
    std::stringstream stream;

    EXPECT_THROW(serializer.serialize(Value(1), stream), TypeMismatch);
}

TEST(TableSerializerTest, StreamInterfaceRoundTrip) {
    TableSerializer serializer;
    Value value = Value::object(Table{{"a", {1, 2}}});
    std::stringstream stream;

    serializer.serialize(value, stream);

    EXPECT_EQ(serializer.deserialize(stream), value);
}

TEST(TableSerializerTest, MetadataSkipsUnknownFields) {
    TableMetadata metadata = TableMetadata::decode(
        R"({"future_field": [9, 9, 9], "ndarray_columns": ["v"]})");

    EXPECT_EQ(metadata.ndarrayColumns, (std::vector<std::string>{"v"}));
    EXPECT_TRUE(metadata.objectColumns.empty());
}

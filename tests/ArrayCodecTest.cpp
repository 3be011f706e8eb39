#include <gtest/gtest.h>
#include <stepcache/serialization/ArrayCodec.hpp>
#include <stepcache/value/NdArray.hpp>
#include <sstream>

/**
 * @brief Тесты для ArrayCodec и NdArraySerializer
 */

TEST(ArrayCodecTest, PreservesDtypeShapeAndBytes) {
    auto array = NdArray::fromVector<int16_t>({1, -2, 3, -4, 5, -6}, {3, 2});

    NdArray decoded = ArrayCodec::decode(ArrayCodec::encode(array));

    EXPECT_EQ(decoded.dtype(), DType::Int16);
    EXPECT_EQ(decoded.shape(), (std::vector<size_t>{3, 2}));
    EXPECT_EQ(decoded.data(), array.data());
}

TEST(ArrayCodecTest, PreservesStringWidth) {
    auto array = NdArray::fromStrings({"alpha", "b"});

    NdArray decoded = ArrayCodec::decode(ArrayCodec::encode(array));

    EXPECT_EQ(decoded.itemSize(), 5u);
    EXPECT_EQ(decoded.strings(), (std::vector<std::string>{"alpha", "b"}));
}

TEST(ArrayCodecTest, EmptyArray) {
    auto array = NdArray::fromVector<double>({});

    NdArray decoded = ArrayCodec::decode(ArrayCodec::encode(array));

    EXPECT_EQ(decoded, array);
    EXPECT_EQ(decoded.size(), 0u);
}

TEST(ArrayCodecTest, DetectsArrayBlobs) {
    Bytes blob = ArrayCodec::encode(NdArray::fromVector<uint8_t>({1, 2}));

    EXPECT_TRUE(ArrayCodec::isArrayBlob(blob));
    EXPECT_FALSE(ArrayCodec::isArrayBlob(Bytes{1, 2, 3}));
}

TEST(ArrayCodecTest, RejectsInvalidDtype) {
    Bytes blob = ArrayCodec::encode(NdArray::fromVector<uint8_t>({1, 2}));
    blob[8] = 0x7F;  // код dtype сразу после magic и версии

    EXPECT_THROW(ArrayCodec::decode(blob), CorruptData);
}

TEST(ArrayCodecTest, RejectsDataSizeMismatch) {
    Bytes blob = ArrayCodec::encode(NdArray::fromVector<int32_t>({1, 2, 3}));
    blob.resize(blob.size() - 4);

    EXPECT_THROW(ArrayCodec::decode(blob), CorruptData);
}

// ==================== NdArraySerializer ====================

TEST(NdArraySerializerTest, RoundTrip) {
    NdArraySerializer serializer;
    Value value = Value::object(NdArray::fromVector<bool>({true, false, true}));

    std::stringstream stream;
    serializer.serialize(value, stream);

    EXPECT_EQ(serializer.deserialize(stream), value);
}

TEST(NdArraySerializerTest, RejectsOtherTypes) {
    NdArraySerializer serializer;
    std::stringstream stream;

    EXPECT_THROW(serializer.serialize(Value(List{1, 2}), stream), TypeMismatch);
}

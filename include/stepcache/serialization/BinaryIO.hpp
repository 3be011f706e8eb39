#pragma once

#include <stepcache/Errors.hpp>
#include <stepcache/value/Value.hpp>
#include <cstdint>
#include <cstring>
#include <istream>
#include <iterator>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief Буфер для записи бинарных форматов
 *
 * Все целые пишутся little-endian, кроме явно помеченных *BE.
 * Строки и блобы - с префиксом длины uint64.
 */
class BinaryWriter {
public:
    void writeUint8(uint8_t value) {
        data_.push_back(value);
    }

    void writeUint32(uint32_t value) {
        for (int shift = 0; shift < 32; shift += 8) {
            data_.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
        }
    }

    void writeUint64(uint64_t value) {
        for (int shift = 0; shift < 64; shift += 8) {
            data_.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
        }
    }

    void writeUint64BE(uint64_t value) {
        for (int shift = 56; shift >= 0; shift -= 8) {
            data_.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
        }
    }

    void writeInt64(int64_t value) {
        writeUint64(static_cast<uint64_t>(value));
    }

    void writeDouble(double value) {
        uint64_t bits = 0;
        std::memcpy(&bits, &value, sizeof(bits));
        writeUint64(bits);
    }

    void writeString(const std::string& value) {
        writeUint64(value.size());
        data_.insert(data_.end(), value.begin(), value.end());
    }

    void writeBlob(const Bytes& value) {
        writeUint64(value.size());
        writeRaw(value);
    }

    void writeRaw(const Bytes& value) {
        data_.insert(data_.end(), value.begin(), value.end());
    }

    void writeRaw(const uint8_t* data, size_t size) {
        data_.insert(data_.end(), data, data + size);
    }

    size_t size() const { return data_.size(); }
    const Bytes& data() const { return data_; }

    Bytes release() {
        return std::move(data_);
    }

private:
    Bytes data_;
};

/**
 * @brief Последовательное чтение бинарных форматов
 *
 * Любой выход за границу буфера - CorruptData.
 * Буфер не копируется: он должен жить дольше читателя.
 */
class BinaryReader {
public:
    BinaryReader(const uint8_t* data, size_t size)
        : data_(data)
        , size_(size)
    {}

    explicit BinaryReader(const Bytes& data)
        : BinaryReader(data.data(), data.size())
    {}

    uint8_t readUint8() {
        require(1);
        return data_[offset_++];
    }

    uint32_t readUint32() {
        require(4);
        uint32_t value = 0;
        for (int i = 0; i < 4; ++i) {
            value |= static_cast<uint32_t>(data_[offset_ + i]) << (8 * i);
        }
        offset_ += 4;
        return value;
    }

    uint64_t readUint64() {
        require(8);
        uint64_t value = 0;
        for (int i = 0; i < 8; ++i) {
            value |= static_cast<uint64_t>(data_[offset_ + i]) << (8 * i);
        }
        offset_ += 8;
        return value;
    }

    uint64_t readUint64BE() {
        require(8);
        uint64_t value = 0;
        for (int i = 0; i < 8; ++i) {
            value = (value << 8) | data_[offset_ + i];
        }
        offset_ += 8;
        return value;
    }

    int64_t readInt64() {
        return static_cast<int64_t>(readUint64());
    }

    double readDouble() {
        uint64_t bits = readUint64();
        double value = 0;
        std::memcpy(&value, &bits, sizeof(value));
        return value;
    }

    std::string readString() {
        uint64_t length = readUint64();
        require(length);
        std::string value(reinterpret_cast<const char*>(data_ + offset_), length);
        offset_ += length;
        return value;
    }

    Bytes readBlob() {
        return readRaw(readUint64());
    }

    Bytes readRaw(uint64_t length) {
        require(length);
        Bytes value(data_ + offset_, data_ + offset_ + length);
        offset_ += length;
        return value;
    }

    void skip(uint64_t length) {
        require(length);
        offset_ += length;
    }

    size_t offset() const { return offset_; }
    size_t remaining() const { return size_ - offset_; }
    bool atEnd() const { return offset_ == size_; }

private:
    void require(uint64_t length) const {
        if (length > size_ - offset_) {
            throw CorruptData("Unexpected end of data at offset " +
                              std::to_string(offset_) + " (need " +
                              std::to_string(length) + " bytes, have " +
                              std::to_string(size_ - offset_) + ")");
        }
    }

    const uint8_t* data_;
    size_t size_;
    size_t offset_ = 0;
};

// ==================== Потоки ====================

/**
 * @brief Прочитать поток до конца
 * @throws StorageIOFailure при ошибке чтения
 */
inline Bytes readStream(std::istream& in) {
    Bytes data{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    if (in.bad()) {
        throw StorageIOFailure("Failed to read stream");
    }
    return data;
}

/**
 * @brief Записать буфер в поток целиком
 * @throws StorageIOFailure при ошибке записи
 */
inline void writeStream(std::ostream& out, const Bytes& data) {
    out.write(reinterpret_cast<const char*>(data.data()),
              static_cast<std::streamsize>(data.size()));
    if (!out) {
        throw StorageIOFailure("Failed to write " + std::to_string(data.size()) +
                               " bytes to stream");
    }
}

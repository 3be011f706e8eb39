#pragma once

#include <stepcache/Errors.hpp>
#include <stepcache/persistence/IIndexPersistence.hpp>
#include <stepcache/serialization/BinaryIO.hpp>
#include <string>

/**
 * @brief Бинарный формат файла индекса
 *
 * Формат файла:
 * [4 байта: magic "SCIX"]
 * [4 байта: версия формата]
 * [8 байт: количество записей]
 * [записи...]
 *
 * Формат записи:
 * [8 байт: версия ключа][дайджест (строка)]
 * [8 байт: размер данных][1 байт: режим][локатор (строка)][маркер (строка)]
 *
 * Строки - [8 байт: длина][байты].
 */
class IndexCodec {
public:
    static constexpr uint32_t MAGIC = 0x58494353;  // "SCIX" в little-endian
    static constexpr uint32_t VERSION = 1;

    static Bytes encode(const IndexEntries& entries) {
        BinaryWriter writer;
        writer.writeUint32(MAGIC);
        writer.writeUint32(VERSION);
        writer.writeUint64(entries.size());

        for (const auto& [key, record] : entries) {
            writer.writeInt64(key.version);
            writer.writeString(key.digest);
            writer.writeUint64(record.size);
            writer.writeUint8(static_cast<uint8_t>(record.mode));
            writer.writeString(record.locator);
            writer.writeString(record.marker);
        }
        return writer.release();
    }

    /**
     * @throws CorruptData при неверном magic, версии или обрыве данных
     */
    static IndexEntries decode(const Bytes& data) {
        if (data.size() < 16) {
            throw CorruptData("Invalid index file: too small");
        }

        BinaryReader reader(data);
        if (reader.readUint32() != MAGIC) {
            throw CorruptData("Invalid index file: wrong magic number");
        }
        uint32_t version = reader.readUint32();
        if (version != VERSION) {
            throw CorruptData("Unsupported index file version: " + std::to_string(version));
        }

        uint64_t count = reader.readUint64();
        IndexEntries entries;
        for (uint64_t i = 0; i < count; ++i) {
            CacheKey key;
            key.version = reader.readInt64();
            key.digest = reader.readString();

            StoredRecord record;
            record.size = reader.readUint64();
            uint8_t mode = reader.readUint8();
            if (!isValidStorageMode(mode)) {
                throw CorruptData("Invalid storage mode at entry " + std::to_string(i));
            }
            record.mode = static_cast<StorageMode>(mode);
            record.locator = reader.readString();
            record.marker = reader.readString();

            entries.emplace_back(std::move(key), std::move(record));
        }

        if (!reader.atEnd()) {
            throw CorruptData("Trailing bytes after index entries");
        }
        return entries;
    }
};

#pragma once

#include <stepcache/Errors.hpp>
#include <stepcache/registry/TypeRegistry.hpp>
#include <stepcache/serialization/BinaryIO.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief Вид составного значения
 */
enum class CompositeKind : uint8_t {
    Tuple = 1,
    List = 2,
    Set = 3,
    Dict = 4
};

inline const char* markerOf(CompositeKind kind) {
    switch (kind) {
        case CompositeKind::Tuple: return Markers::TUPLE;
        case CompositeKind::List:  return Markers::LIST;
        case CompositeKind::Set:   return Markers::SET;
        case CompositeKind::Dict:  return Markers::DICT;
    }
    return "";
}

inline std::optional<CompositeKind> kindFromMarker(const std::string& marker) {
    if (marker == Markers::TUPLE) return CompositeKind::Tuple;
    if (marker == Markers::LIST) return CompositeKind::List;
    if (marker == Markers::SET) return CompositeKind::Set;
    if (marker == Markers::DICT) return CompositeKind::Dict;
    return std::nullopt;
}

/**
 * @brief Описание одного элемента составного значения
 */
struct ElementDescriptor {
    std::string typeTag;    ///< тег типа или описание незарегистрированного типа
    uint64_t locator = 0;   ///< порядковый номер блока данных в потоке
    bool custom = false;    ///< записан зарегистрированным сериализатором

    bool operator==(const ElementDescriptor& other) const {
        return typeTag == other.typeTag && locator == other.locator &&
               custom == other.custom;
    }
};

/**
 * @brief Манифест составного значения
 *
 * Для последовательностей заполнен elements, для словарей - pairs.
 * length всегда равен числу элементов (или пар).
 */
struct Manifest {
    CompositeKind kind = CompositeKind::List;
    uint64_t length = 0;
    std::vector<ElementDescriptor> elements;
    std::vector<std::pair<ElementDescriptor, ElementDescriptor>> pairs;

    /// Число блоков данных, которые следуют за заголовком
    uint64_t payloadCount() const {
        return kind == CompositeKind::Dict ? pairs.size() * 2 : elements.size();
    }
};

/**
 * @brief Бинарный формат заголовка манифеста
 *
 * Формат:
 * [4 байта: magic "SCMF"]
 * [4 байта: версия формата]
 * [8 байт: размер тела заголовка]
 * тело:
 *   [1 байт: вид]
 *   [8 байт: объявленная длина]
 *   [8 байт: число дескрипторов]
 *   [для каждого: 4 байта размер, затем тег (строка), 8 байт локатор, 1 байт custom]
 *
 * Размеры тела и дескрипторов позволяют будущим версиям дописывать
 * поля в конец: старый читатель пропустит их.
 */
class ManifestCodec {
public:
    static constexpr uint32_t MAGIC = 0x464D4353;  // "SCMF" в little-endian
    static constexpr uint32_t VERSION = 1;

    static void write(BinaryWriter& writer, const Manifest& manifest) {
        BinaryWriter body;
        body.writeUint8(static_cast<uint8_t>(manifest.kind));
        body.writeUint64(manifest.length);

        if (manifest.kind == CompositeKind::Dict) {
            body.writeUint64(manifest.pairs.size() * 2);
            for (const auto& [key, value] : manifest.pairs) {
                writeDescriptor(body, key);
                writeDescriptor(body, value);
            }
        } else {
            body.writeUint64(manifest.elements.size());
            for (const auto& element : manifest.elements) {
                writeDescriptor(body, element);
            }
        }

        writer.writeUint32(MAGIC);
        writer.writeUint32(VERSION);
        writer.writeUint64(body.size());
        writer.writeRaw(body.data());
    }

    /**
     * @brief Прочитать заголовок
     * @throws CorruptManifest при неверном формате или несовпадении длины
     */
    static Manifest read(BinaryReader& reader) {
        try {
            return readUnchecked(reader);
        } catch (const CorruptData& e) {
            throw CorruptManifest(std::string("Truncated manifest: ") + e.what());
        }
    }

private:
    static void writeDescriptor(BinaryWriter& writer, const ElementDescriptor& descriptor) {
        BinaryWriter entry;
        entry.writeString(descriptor.typeTag);
        entry.writeUint64(descriptor.locator);
        entry.writeUint8(descriptor.custom ? 1 : 0);
        writer.writeUint32(static_cast<uint32_t>(entry.size()));
        writer.writeRaw(entry.data());
    }

    static ElementDescriptor readDescriptor(BinaryReader& reader) {
        uint32_t size = reader.readUint32();
        Bytes entry = reader.readRaw(size);
        BinaryReader fields(entry);

        ElementDescriptor descriptor;
        descriptor.typeTag = fields.readString();
        descriptor.locator = fields.readUint64();
        descriptor.custom = fields.readUint8() != 0;
        // Остаток записи - поля будущих версий
        return descriptor;
    }

    static Manifest readUnchecked(BinaryReader& reader) {
        if (reader.readUint32() != MAGIC) {
            throw CorruptManifest("Invalid manifest: wrong magic number");
        }
        uint32_t version = reader.readUint32();
        if (version != VERSION) {
            throw CorruptManifest("Unsupported manifest version: " + std::to_string(version));
        }

        uint64_t bodySize = reader.readUint64();
        Bytes body = reader.readRaw(bodySize);
        BinaryReader fields(body);

        Manifest manifest;
        uint8_t kind = fields.readUint8();
        if (kind < static_cast<uint8_t>(CompositeKind::Tuple) ||
            kind > static_cast<uint8_t>(CompositeKind::Dict)) {
            throw CorruptManifest("Unknown composite kind: " + std::to_string(kind));
        }
        manifest.kind = static_cast<CompositeKind>(kind);
        manifest.length = fields.readUint64();

        uint64_t count = fields.readUint64();
        uint64_t expected = manifest.kind == CompositeKind::Dict
            ? manifest.length * 2 : manifest.length;
        if (count != expected) {
            throw CorruptManifest("Manifest declares " + std::to_string(manifest.length) +
                                  " elements but has " + std::to_string(count) +
                                  " descriptors");
        }
        if (count > fields.remaining()) {
            throw CorruptManifest("Descriptor count exceeds manifest size");
        }

        if (manifest.kind == CompositeKind::Dict) {
            for (uint64_t i = 0; i < manifest.length; ++i) {
                ElementDescriptor key = readDescriptor(fields);
                ElementDescriptor value = readDescriptor(fields);
                manifest.pairs.emplace_back(std::move(key), std::move(value));
            }
        } else {
            for (uint64_t i = 0; i < manifest.length; ++i) {
                manifest.elements.push_back(readDescriptor(fields));
            }
        }
        return manifest;
    }
};

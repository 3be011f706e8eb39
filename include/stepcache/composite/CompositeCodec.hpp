#pragma once

#include <stepcache/Errors.hpp>
#include <stepcache/Settings.hpp>
#include <stepcache/composite/Manifest.hpp>
#include <stepcache/serialization/BinaryIO.hpp>
#include <stepcache/serialization/GenericSerializer.hpp>
#include <stepcache/serialization/ISerializer.hpp>
#include <stepcache/value/Value.hpp>
#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @brief Поэлементное кодирование контейнеров
 *
 * Tuple, List, Set и Dict, у которых хотя бы один прямой элемент
 * (ключ или значение для Dict) имеет зарегистрированный сериализатор,
 * кодируются поэлементно: зарегистрированные элементы своим
 * сериализатором, остальные generic-кодеком. Проверка неглубокая:
 * список списков таблиц кодируется целиком generic-кодеком.
 *
 * Поток:
 * [заголовок манифеста (ManifestCodec)]
 * [для каждого элемента: 8 байт длина (big-endian)][байты элемента]
 *
 * Для Dict элементы идут парами: ключ, значение.
 */
class CompositeCodec {
public:
    explicit CompositeCodec(std::shared_ptr<const Settings> settings)
        : settings_(std::move(settings))
    {
        if (!settings_) {
            throw std::invalid_argument("Settings cannot be null");
        }
    }

    /**
     * @brief Нужно ли поэлементное кодирование для значения
     */
    bool applies(const Value& value) const {
        if (const std::vector<Value>* items = sequenceItems(value)) {
            for (const Value& item : *items) {
                if (isRegistered(item)) {
                    return true;
                }
            }
            return false;
        }
        if (value.is<Dict>()) {
            for (const auto& [key, item] : value.as<Dict>().items) {
                if (isRegistered(key) || isRegistered(item)) {
                    return true;
                }
            }
        }
        return false;
    }

    /**
     * @brief Закодировать значение в поток
     * @return маркер вида или nullopt, если кодек неприменим
     *         (тогда в поток ничего не записано)
     */
    std::optional<std::string> encode(const Value& value, std::ostream& out) const {
        if (!applies(value)) {
            return std::nullopt;
        }

        Manifest manifest;
        std::vector<Bytes> payloads;

        if (value.is<Dict>()) {
            manifest.kind = CompositeKind::Dict;
            const auto& items = value.as<Dict>().items;
            manifest.length = items.size();
            for (const auto& [key, item] : items) {
                ElementDescriptor keyDescriptor = encodeElement(key, payloads);
                ElementDescriptor valueDescriptor = encodeElement(item, payloads);
                manifest.pairs.emplace_back(std::move(keyDescriptor),
                                            std::move(valueDescriptor));
            }
        } else {
            manifest.kind = kindOf(value);
            const std::vector<Value>& items = *sequenceItems(value);
            manifest.length = items.size();
            for (const Value& item : items) {
                manifest.elements.push_back(encodeElement(item, payloads));
            }
        }

        BinaryWriter writer;
        ManifestCodec::write(writer, manifest);
        for (const auto& payload : payloads) {
            writer.writeUint64BE(payload.size());
            writer.writeRaw(payload);
        }
        writeStream(out, writer.data());
        return std::string(markerOf(manifest.kind));
    }

    /**
     * @brief Раскодировать поток, записанный encode()
     * @param marker Маркер вида, сохранённый рядом с данными
     * @throws CorruptManifest при несогласованном заголовке или обрыве данных
     * @throws std::invalid_argument если marker не составной
     */
    Value decode(const std::string& marker, std::istream& in) const {
        auto expected = kindFromMarker(marker);
        if (!expected) {
            throw std::invalid_argument("Not a composite marker: " + marker);
        }

        Bytes data = readStream(in);
        BinaryReader reader(data);
        Manifest manifest = ManifestCodec::read(reader);
        if (manifest.kind != *expected) {
            throw CorruptManifest(std::string("Manifest kind disagrees with marker ") + marker);
        }

        uint64_t ordinal = 0;
        auto next = [&](const ElementDescriptor& descriptor) {
            if (descriptor.locator != ordinal) {
                throw CorruptManifest("Element locator " + std::to_string(descriptor.locator) +
                                      " out of sequence, expected " + std::to_string(ordinal));
            }
            ++ordinal;
            return decodeElement(descriptor, readPayload(reader));
        };

        Value result;
        switch (manifest.kind) {
            case CompositeKind::Tuple: {
                Tuple tuple;
                for (const auto& element : manifest.elements) {
                    tuple.items.push_back(next(element));
                }
                result = Value(std::move(tuple));
                break;
            }
            case CompositeKind::List: {
                List list;
                for (const auto& element : manifest.elements) {
                    list.items.push_back(next(element));
                }
                result = Value(std::move(list));
                break;
            }
            case CompositeKind::Set: {
                Set set;
                for (const auto& element : manifest.elements) {
                    set.insert(next(element));
                }
                result = Value(std::move(set));
                break;
            }
            case CompositeKind::Dict: {
                Dict dict;
                for (const auto& [keyDescriptor, valueDescriptor] : manifest.pairs) {
                    Value key = next(keyDescriptor);
                    Value item = next(valueDescriptor);
                    dict.insert(std::move(key), std::move(item));
                }
                result = Value(std::move(dict));
                break;
            }
        }

        if (!reader.atEnd()) {
            throw CorruptManifest("Trailing bytes after composite payloads");
        }
        return result;
    }

private:
    static const std::vector<Value>* sequenceItems(const Value& value) {
        if (value.is<Tuple>()) return &value.as<Tuple>().items;
        if (value.is<List>()) return &value.as<List>().items;
        if (value.is<Set>()) return &value.as<Set>().items;
        return nullptr;
    }

    static CompositeKind kindOf(const Value& value) {
        if (value.is<Tuple>()) return CompositeKind::Tuple;
        if (value.is<Set>()) return CompositeKind::Set;
        return CompositeKind::List;
    }

    bool isRegistered(const Value& value) const {
        return settings_->serializers.contains(value.type());
    }

    ElementDescriptor encodeElement(const Value& value, std::vector<Bytes>& payloads) const {
        ElementDescriptor descriptor;
        descriptor.typeTag = settings_->types.describe(value.type());
        descriptor.locator = payloads.size();

        const ISerializer* serializer = settings_->serializers.lookup(value.type());
        auto tag = settings_->types.tagOf(value.type());
        if (serializer != nullptr && tag) {
            descriptor.custom = true;
            payloads.push_back(serializeToBytes(*serializer, value));
        } else {
            payloads.push_back(GenericSerializer::encode(value));
        }
        return descriptor;
    }

    Value decodeElement(const ElementDescriptor& descriptor, const Bytes& payload) const {
        if (descriptor.custom) {
            auto type = settings_->types.resolve(descriptor.typeTag);
            if (type) {
                if (const ISerializer* serializer = settings_->serializers.lookup(*type)) {
                    return deserializeFromBytes(*serializer, payload);
                }
            }
        }
        return GenericSerializer::decode(payload);
    }

    static Bytes readPayload(BinaryReader& reader) {
        try {
            uint64_t length = reader.readUint64BE();
            return reader.readRaw(length);
        } catch (const CorruptData& e) {
            throw CorruptManifest(std::string("Truncated composite payload: ") + e.what());
        }
    }

    std::shared_ptr<const Settings> settings_;
};

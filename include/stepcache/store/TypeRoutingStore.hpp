#pragma once

#include <stepcache/Settings.hpp>
#include <stepcache/composite/CompositeCodec.hpp>
#include <stepcache/registry/TypeRegistry.hpp>
#include <stepcache/serialization/GenericSerializer.hpp>
#include <stepcache/store/IStorage.hpp>
#include <stepcache/store/StoredRecord.hpp>
#include <stepcache/value/Value.hpp>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

/**
 * @brief Выбор кодека при сохранении и чтении значений
 *
 * Порядок при сохранении:
 * 1. CompositeCodec, если контейнер содержит зарегистрированные элементы
 * 2. Зарегистрированный сериализатор точного типа (маркер - тег типа)
 * 3. Generic-кодек (маркер "__generic__")
 *
 * При чтении маркер определяет декодер; тег, который не удалось
 * разрешить, читается generic-кодеком.
 *
 * Собственного состояния нет, кроме ссылок на настройки и хранилище.
 */
class TypeRoutingStore {
public:
    TypeRoutingStore(std::shared_ptr<const Settings> settings,
                     std::shared_ptr<IStorage> storage)
        : settings_(std::move(settings))
        , storage_(std::move(storage))
        , composite_(settings_)
    {
        if (!storage_) {
            throw std::invalid_argument("Storage cannot be null");
        }
    }

    /**
     * @brief Сохранить значение в новый блок хранилища
     * @throws UnsupportedType если значение нельзя закодировать
     * @throws StorageIOFailure при ошибке записи
     */
    StoredRecord store(const Value& value) {
        StoredRecord record;
        record.locator = storage_->allocate();

        auto pending = storage_->openWrite(record.locator);
        std::ostream& out = pending->stream();

        if (auto marker = composite_.encode(value, out)) {
            record.mode = StorageMode::Pickle;
            record.marker = *marker;
        } else if (auto serializer = customSerializer(value.type())) {
            serializer->first->serialize(value, out);
            record.mode = StorageMode::Binary;
            record.marker = serializer->second;
        } else {
            generic_.serialize(value, out);
            record.mode = StorageMode::Pickle;
            record.marker = Markers::GENERIC;
        }

        record.size = pending->commit();
        return record;
    }

    Value fetch(const StoredRecord& record) const {
        return fetch(record.mode, record.locator, record.marker);
    }

    /**
     * @brief Прочитать значение по локатору
     * @throws CorruptManifest, CorruptData при повреждённых данных
     * @throws StorageIOFailure если данных нет
     */
    Value fetch(StorageMode mode, const std::string& locator, const std::string& marker) const {
        auto in = storage_->openRead(locator);

        if (Markers::isComposite(marker)) {
            return composite_.decode(marker, *in);
        }
        if (mode == StorageMode::Binary) {
            if (auto type = settings_->types.resolve(marker)) {
                if (const ISerializer* serializer = settings_->serializers.lookup(*type)) {
                    return serializer->deserialize(*in);
                }
            }
        }
        return generic_.deserialize(*in);
    }

    IStorage& storage() {
        return *storage_;
    }

private:
    std::optional<std::pair<const ISerializer*, std::string>>
    customSerializer(std::type_index type) const {
        const ISerializer* serializer = settings_->serializers.lookup(type);
        auto tag = settings_->types.tagOf(type);
        if (serializer == nullptr || !tag) {
            return std::nullopt;
        }
        return std::make_pair(serializer, *tag);
    }

    std::shared_ptr<const Settings> settings_;
    std::shared_ptr<IStorage> storage_;
    CompositeCodec composite_;
    GenericSerializer generic_;
};

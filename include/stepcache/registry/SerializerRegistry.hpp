#pragma once

#include <stepcache/serialization/ISerializer.hpp>
#include <memory>
#include <stdexcept>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>

/**
 * @brief Реестр сериализаторов: точный тип → сериализатор
 *
 * Диспетчеризация только по точному типу, без учёта иерархии:
 * сериализатор базового класса не применяется к наследнику.
 * Регистрация по принципу last-write-wins.
 *
 * Сериализаторы хранятся как shared_ptr<const ISerializer> и
 * разделяются всеми копиями реестра.
 */
class SerializerRegistry {
public:
    template<typename T>
    void registerSerializer(std::shared_ptr<const ISerializer> serializer) {
        registerSerializer(std::type_index(typeid(T)), std::move(serializer));
    }

    /**
     * @throws std::invalid_argument если serializer == nullptr
     */
    void registerSerializer(std::type_index type,
                            std::shared_ptr<const ISerializer> serializer) {
        if (!serializer) {
            throw std::invalid_argument("Serializer cannot be null");
        }
        serializers_[type] = std::move(serializer);
    }

    /**
     * @brief Сериализатор для точного типа
     * @return nullptr если тип не зарегистрирован
     */
    const ISerializer* lookup(std::type_index type) const {
        auto it = serializers_.find(type);
        return it != serializers_.end() ? it->second.get() : nullptr;
    }

    bool contains(std::type_index type) const {
        return serializers_.find(type) != serializers_.end();
    }

    bool unregisterSerializer(std::type_index type) {
        return serializers_.erase(type) > 0;
    }

    size_t size() const {
        return serializers_.size();
    }

private:
    std::unordered_map<std::type_index, std::shared_ptr<const ISerializer>> serializers_;
};

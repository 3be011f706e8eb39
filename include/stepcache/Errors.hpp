#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief Базовое исключение библиотеки
 *
 * Все ошибки сериализации и хранения наследуются от него,
 * поэтому вызывающий код может ловить их одним catch.
 */
class StepCacheError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Тег типа не удалось разрешить обратно в тип
 *
 * Не фатальна: при чтении всегда заменяется fallback на generic-кодек.
 * Бросается только явным TypeRegistry::resolveOrThrow().
 */
class TypeResolutionFailure : public StepCacheError {
public:
    using StepCacheError::StepCacheError;
};

/**
 * @brief Сериализатор получил значение не своего типа
 */
class TypeMismatch : public StepCacheError {
public:
    using StepCacheError::StepCacheError;
};

/**
 * @brief Манифест составного значения повреждён или противоречив
 */
class CorruptManifest : public StepCacheError {
public:
    using StepCacheError::StepCacheError;
};

/**
 * @brief Повреждённые данные (неверный magic, обрыв, неизвестная версия)
 */
class CorruptData : public StepCacheError {
public:
    using StepCacheError::StepCacheError;
};

/**
 * @brief Ошибка чтения/записи носителя
 */
class StorageIOFailure : public StepCacheError {
public:
    using StepCacheError::StepCacheError;
};

/**
 * @brief Для значения нет ни сериализатора, ни generic-представления
 *
 * Это ошибка конфигурации: тип нужно зарегистрировать в Settings.
 */
class UnsupportedType : public StepCacheError {
public:
    using StepCacheError::StepCacheError;
};

#pragma once

#include <cstdint>
#include <istream>
#include <memory>
#include <ostream>
#include <string>

/**
 * @brief Незавершённая запись в хранилище
 *
 * Данные пишутся во временное место и становятся видны под
 * локатором только после commit(). Если объект уничтожен без
 * commit(), временные данные удаляются.
 */
class PendingWrite {
public:
    virtual ~PendingWrite() = default;

    virtual std::ostream& stream() = 0;

    /**
     * @brief Опубликовать данные под локатором
     * @return Размер записанных данных, байт
     * @throws StorageIOFailure при ошибке записи или переименования
     */
    virtual uint64_t commit() = 0;
};

/**
 * @brief Интерфейс хранилища блоков данных
 *
 * Отвечает только за размещение байтов. Формат данных выбирает
 * TypeRoutingStore.
 *
 * Реализации:
 * - DiskStorage - файлы в каталоге
 */
class IStorage {
public:
    virtual ~IStorage() = default;

    /**
     * @brief Выделить новый уникальный локатор
     */
    virtual std::string allocate() = 0;

    /**
     * @throws StorageIOFailure если запись нельзя начать
     */
    virtual std::unique_ptr<PendingWrite> openWrite(const std::string& locator) = 0;

    /**
     * @throws StorageIOFailure если данных нет или их нельзя открыть
     */
    virtual std::unique_ptr<std::istream> openRead(const std::string& locator) const = 0;

    virtual uint64_t sizeOf(const std::string& locator) const = 0;

    virtual bool exists(const std::string& locator) const = 0;

    /**
     * @return true если данные существовали
     */
    virtual bool remove(const std::string& locator) = 0;
};

#pragma once

#include <cstdint>
#include <ostream>
#include <string>

/**
 * @brief Режим хранения записи
 *
 * Binary - данные записаны зарегистрированным сериализатором,
 * Pickle - generic-кодеком или CompositeCodec.
 */
enum class StorageMode : uint8_t {
    Binary = 2,
    Pickle = 4
};

inline const char* storageModeName(StorageMode mode) {
    switch (mode) {
        case StorageMode::Binary: return "binary";
        case StorageMode::Pickle: return "pickle";
    }
    return "unknown";
}

inline bool isValidStorageMode(uint8_t code) {
    return code == static_cast<uint8_t>(StorageMode::Binary) ||
           code == static_cast<uint8_t>(StorageMode::Pickle);
}

/**
 * @brief Описание сохранённого значения
 *
 * marker - составной маркер, "__generic__" или тег типа;
 * по нему fetch() выбирает декодер.
 */
struct StoredRecord {
    uint64_t size = 0;                     ///< размер данных на диске, байт
    StorageMode mode = StorageMode::Pickle;
    std::string locator;                   ///< относительный путь в хранилище
    std::string marker;

    bool operator==(const StoredRecord& other) const {
        return size == other.size && mode == other.mode &&
               locator == other.locator && marker == other.marker;
    }

    bool operator!=(const StoredRecord& other) const {
        return !(*this == other);
    }
};

inline std::ostream& operator<<(std::ostream& os, const StoredRecord& record) {
    return os << record.marker << " (" << record.size << " bytes, "
              << storageModeName(record.mode) << ')';
}

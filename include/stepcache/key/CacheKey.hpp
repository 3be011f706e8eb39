#pragma once

#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <tuple>

/**
 * @brief Ключ кэша: (версия функции, дайджест аргументов)
 *
 * Версию меняет автор функции, когда меняется её логика:
 * все старые записи становятся промахами.
 */
struct CacheKey {
    int64_t version = 0;
    std::string digest;

    bool operator==(const CacheKey& other) const {
        return version == other.version && digest == other.digest;
    }

    bool operator!=(const CacheKey& other) const {
        return !(*this == other);
    }

    bool operator<(const CacheKey& other) const {
        return std::tie(version, digest) < std::tie(other.version, other.digest);
    }
};

inline std::ostream& operator<<(std::ostream& os, const CacheKey& key) {
    return os << '(' << key.version << ", " << key.digest << ')';
}

namespace std {

template<>
struct hash<CacheKey> {
    size_t operator()(const CacheKey& key) const {
        size_t seed = std::hash<std::string>()(key.digest);
        return seed ^ (std::hash<int64_t>()(key.version) + 0x9e3779b9 + (seed << 6) + (seed >> 2));
    }
};

}  // namespace std

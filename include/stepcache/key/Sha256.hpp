#pragma once

#include <stepcache/Errors.hpp>
#include <stepcache/value/Value.hpp>
#include <openssl/evp.h>
#include <cstdint>
#include <string>

/**
 * @brief Инкрементальный SHA-256 поверх OpenSSL EVP
 *
 * @code
 *   Sha256 hasher;
 *   hasher.update("name");
 *   hasher.update(bytes);
 *   std::string hex = hasher.hexDigest();
 * @endcode
 *
 * Объект одноразовый: после hexDigest() новые данные не принимаются.
 */
class Sha256 {
public:
    Sha256() : ctx_(EVP_MD_CTX_new()) {
        if (ctx_ == nullptr) {
            throw StepCacheError("Failed to create digest context");
        }
        if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
            EVP_MD_CTX_free(ctx_);
            throw StepCacheError("Failed to initialize SHA-256");
        }
    }

    ~Sha256() {
        EVP_MD_CTX_free(ctx_);
    }

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    void update(const uint8_t* data, size_t size) {
        if (finished_) {
            throw StepCacheError("SHA-256 already finalized");
        }
        if (EVP_DigestUpdate(ctx_, data, size) != 1) {
            throw StepCacheError("SHA-256 update failed");
        }
    }

    void update(const Bytes& data) {
        update(data.data(), data.size());
    }

    void update(const std::string& data) {
        update(reinterpret_cast<const uint8_t*>(data.data()), data.size());
    }

    /**
     * @brief Дописать строку с префиксом длины
     *
     * Разделяет соседние поля: ("ab", "c") и ("a", "bc") дают разные хэши.
     */
    void updateField(const std::string& data) {
        uint8_t length[8];
        uint64_t size = data.size();
        for (int i = 0; i < 8; ++i) {
            length[i] = static_cast<uint8_t>((size >> (8 * i)) & 0xFF);
        }
        update(length, sizeof(length));
        update(data);
    }

    std::string hexDigest() {
        if (finished_) {
            throw StepCacheError("SHA-256 already finalized");
        }
        unsigned char digest[EVP_MAX_MD_SIZE];
        unsigned int length = 0;
        if (EVP_DigestFinal_ex(ctx_, digest, &length) != 1) {
            throw StepCacheError("SHA-256 finalization failed");
        }
        finished_ = true;
        return toHex(digest, length);
    }

    static std::string toHex(const unsigned char* data, size_t size) {
        static const char DIGITS[] = "0123456789abcdef";
        std::string hex;
        hex.reserve(size * 2);
        for (size_t i = 0; i < size; ++i) {
            hex.push_back(DIGITS[data[i] >> 4]);
            hex.push_back(DIGITS[data[i] & 0x0F]);
        }
        return hex;
    }

private:
    EVP_MD_CTX* ctx_;
    bool finished_ = false;
};

/**
 * @brief SHA-256 буфера одним вызовом, hex в нижнем регистре
 */
inline std::string sha256Hex(const uint8_t* data, size_t size) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_Digest(data, size, digest, &length, EVP_sha256(), nullptr) != 1) {
        throw StepCacheError("SHA-256 computation failed");
    }
    return Sha256::toHex(digest, length);
}

inline std::string sha256Hex(const Bytes& data) {
    return sha256Hex(data.data(), data.size());
}

inline std::string sha256Hex(const std::string& data) {
    return sha256Hex(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

#include "digest.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <memory>
#include <stdexcept>

std::vector<uint8_t> sha256(const uint8_t* data, size_t size) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }

    std::vector<uint8_t> digest(EVP_MAX_MD_SIZE);
    unsigned int length = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data, size) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest.data(), &length) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }
    digest.resize(length);
    return digest;
}

std::string sha256Hex(const std::vector<uint8_t>& data) {
    return toHex(sha256(data.data(), data.size()));
}

std::string sha256Hex(const std::string& data) {
    return toHex(sha256(reinterpret_cast<const uint8_t*>(data.data()), data.size()));
}

std::vector<uint8_t> hmacSha256(const std::vector<uint8_t>& key, const std::string& message) {
    std::vector<uint8_t> mac(EVP_MAX_MD_SIZE);
    unsigned int length = 0;
    const unsigned char* result = HMAC(
        EVP_sha256(),
        key.data(), static_cast<int>(key.size()),
        reinterpret_cast<const unsigned char*>(message.data()), message.size(),
        mac.data(), &length
    );
    if (result == nullptr) {
        throw std::runtime_error("HMAC-SHA256 failed");
    }
    mac.resize(length);
    return mac;
}

std::string toHex(const std::vector<uint8_t>& bytes) {
    static const char digits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(bytes.size() * 2);
    for (uint8_t b : bytes) {
        hex.push_back(digits[b >> 4]);
        hex.push_back(digits[b & 0x0F]);
    }
    return hex;
}

#ifndef DIGEST_HPP
#define DIGEST_HPP

#include <cstdint>
#include <string>
#include <vector>

// SHA-256 and HMAC-SHA256 over OpenSSL. All functions throw
// std::runtime_error if OpenSSL reports a failure.

std::vector<uint8_t> sha256(const uint8_t* data, size_t size);
std::string sha256Hex(const std::vector<uint8_t>& data);
std::string sha256Hex(const std::string& data);

std::vector<uint8_t> hmacSha256(const std::vector<uint8_t>& key, const std::string& message);

std::string toHex(const std::vector<uint8_t>& bytes);

#endif // DIGEST_HPP

#ifndef OBJECT_STORAGE_HPP
#define OBJECT_STORAGE_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& what) : std::runtime_error(what) {}
};

// A time-boxed authorization to write one object.
struct WriteTarget {
    std::string url;
    std::string method = "PUT";
    std::map<std::string, std::string> headers;  // headers the client must send
    int expires_in_seconds = 0;
};

class ObjectStorage {
public:
    virtual ~ObjectStorage() = default;

    virtual WriteTarget issueWriteTarget(const std::string& key,
                                         const std::string& content_type,
                                         int ttl_seconds) = 0;

    // std::nullopt when no object exists under `key`. Throws StorageError on
    // transport failures.
    virtual std::optional<std::vector<uint8_t>> fetchObject(const std::string& key) = 0;

    virtual std::string publicUrl(const std::string& key) const = 0;
};

#endif // OBJECT_STORAGE_HPP

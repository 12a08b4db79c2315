#ifndef FILE_STORAGE_HPP
#define FILE_STORAGE_HPP

#include <string>

#include "object_storage.hpp"

// Objects are plain files below a root directory. Used for local runs where
// uploads are copied into place instead of PUT to a bucket.
class FileStorage : public ObjectStorage {
public:
    explicit FileStorage(const std::string& root);

    WriteTarget issueWriteTarget(const std::string& key,
                                 const std::string& content_type,
                                 int ttl_seconds) override;
    std::optional<std::vector<uint8_t>> fetchObject(const std::string& key) override;
    std::string publicUrl(const std::string& key) const override;

    std::string pathFor(const std::string& key) const;

private:
    std::string root_;
};

#endif // FILE_STORAGE_HPP

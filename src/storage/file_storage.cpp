#include "file_storage.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

FileStorage::FileStorage(const std::string& root) : root_(root) {
    while (root_.size() > 1 && root_.back() == '/') {
        root_.pop_back();
    }
}

std::string FileStorage::pathFor(const std::string& key) const {
    if (key.empty() || key.front() == '/' || key.find("..") != std::string::npos) {
        throw StorageError("Invalid storage key: " + key);
    }
    return root_ + "/" + key;
}

WriteTarget FileStorage::issueWriteTarget(const std::string& key,
                                          const std::string& content_type,
                                          int ttl_seconds) {
    std::string path = pathFor(key);

    std::error_code ec;
    fs::create_directories(fs::path(path).parent_path(), ec);
    if (ec) {
        throw StorageError("Failed to create directory for " + key + ": " + ec.message());
    }

    WriteTarget target;
    target.url = "file://" + fs::absolute(path).string();
    target.method = "PUT";
    target.headers["Content-Type"] = content_type;
    target.expires_in_seconds = ttl_seconds;
    return target;
}

std::optional<std::vector<uint8_t>> FileStorage::fetchObject(const std::string& key) {
    std::string path = pathFor(key);

    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return std::nullopt;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw StorageError("Failed to open object: " + path);
    }

    std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)),
                              std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw StorageError("Failed to read object: " + path);
    }
    return data;
}

std::string FileStorage::publicUrl(const std::string& key) const {
    return "file://" + fs::absolute(pathFor(key)).string();
}

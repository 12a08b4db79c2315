#ifndef STORAGE_FACTORY_HPP
#define STORAGE_FACTORY_HPP

#include <memory>
#include <stdexcept>

#include "../utils/config.hpp"
#include "file_storage.hpp"
#include "s3_storage.hpp"

inline std::shared_ptr<ObjectStorage> createStorage(const Config& config) {
    if (config.storage_backend == "file") {
        return std::make_shared<FileStorage>(config.storage_root);
    }
    if (config.storage_backend == "s3") {
        S3Config s3;
        s3.bucket = config.s3_bucket;
        s3.region = config.s3_region;
        s3.endpoint = config.s3_endpoint;
        s3.public_base_url = config.s3_public_base_url;
        s3.access_key_id = config.s3_access_key_id;
        s3.secret_access_key = config.s3_secret_access_key;
        return std::make_shared<S3Storage>(s3);
    }
    throw std::invalid_argument("Unknown storage_backend: " + config.storage_backend);
}

#endif // STORAGE_FACTORY_HPP

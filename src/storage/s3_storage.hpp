#ifndef S3_STORAGE_HPP
#define S3_STORAGE_HPP

#include <ctime>
#include <string>

#include "object_storage.hpp"

struct S3Config {
    std::string bucket = "skinsage";
    std::string region = "us-east-1";
    std::string endpoint;          // e.g. http://localhost:9000, empty for AWS
    std::string public_base_url;   // display URL prefix, empty for s3://bucket/key
    std::string access_key_id;
    std::string secret_access_key;
};

// S3 compatible storage addressed through SigV4 presigned URLs. Uploads are
// done by the client against the presigned PUT; downloads use a presigned GET
// sent over Boost.Beast.
//
// A custom endpoint switches to path-style addressing (MinIO, localstack).
class S3Storage : public ObjectStorage {
public:
    explicit S3Storage(const S3Config& config);

    WriteTarget issueWriteTarget(const std::string& key,
                                 const std::string& content_type,
                                 int ttl_seconds) override;
    std::optional<std::vector<uint8_t>> fetchObject(const std::string& key) override;
    std::string publicUrl(const std::string& key) const override;

    // Builds a presigned URL. `content_type` is signed as a header when
    // non-empty, in which case the request must carry the same Content-Type.
    std::string presign(const std::string& method,
                        const std::string& key,
                        const std::string& content_type,
                        int ttl_seconds,
                        std::time_t now) const;

    // RFC 3986 percent-encoding as SigV4 wants it. '/' survives only when
    // `keep_slash` is set.
    static std::string uriEncode(const std::string& value, bool keep_slash);

private:
    struct Endpoint {
        std::string scheme;
        std::string host;       // without port
        std::string port;
        std::string authority;  // value of the Host header
        std::string path_prefix;
    };

    Endpoint endpointFor() const;
    std::string canonicalUri(const std::string& key) const;

    S3Config config_;
    Endpoint endpoint_;
};

#endif // S3_STORAGE_HPP

#ifndef UPLOAD_TARGET_ISSUER_HPP
#define UPLOAD_TARGET_ISSUER_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../storage/object_storage.hpp"
#include "../store/scan_store.hpp"

struct UploadRequest {
    ScanAngle angle;
    std::string content_type;
    std::optional<std::string> checksum;
};

struct UploadTarget {
    ScanAngle angle;
    WriteTarget target;
    std::string storage_key;
    std::string display_url;
};

// Hands out upload URLs for scan angles and records where each angle's bytes
// are expected. Nothing is scored here; that happens on ingestion.
class UploadTargetIssuer {
public:
    UploadTargetIssuer(std::shared_ptr<ScanStore> store, std::shared_ptr<ObjectStorage> storage);

    // Throws ScanNotFound. A storage or store failure part way through is
    // rethrown after missing angles are brought in line with the rows saved
    // so far.
    std::vector<UploadTarget> issue(const std::string& scan_id,
                                    const std::vector<UploadRequest>& items);

    // png and webp by substring, anything else is treated as jpg.
    static std::string extensionForContentType(const std::string& content_type);

    static std::string storageKeyFor(const std::string& scan_id,
                                     const std::string& patient_id,
                                     ScanAngle angle,
                                     const std::string& extension);

private:
    std::vector<ScanAngle> refreshMissingAngles(const std::string& scan_id);

    std::shared_ptr<ScanStore> store_;
    std::shared_ptr<ObjectStorage> storage_;
};

#endif // UPLOAD_TARGET_ISSUER_HPP

#include "upload_target_issuer.hpp"

#include <iostream>

UploadTargetIssuer::UploadTargetIssuer(std::shared_ptr<ScanStore> store,
                                       std::shared_ptr<ObjectStorage> storage)
    : store_(std::move(store)),
      storage_(std::move(storage)) {
}

std::string UploadTargetIssuer::extensionForContentType(const std::string& content_type) {
    if (content_type.find("png") != std::string::npos) return "png";
    if (content_type.find("webp") != std::string::npos) return "webp";
    return "jpg";
}

std::string UploadTargetIssuer::storageKeyFor(const std::string& scan_id,
                                              const std::string& patient_id,
                                              ScanAngle angle,
                                              const std::string& extension) {
    return "scans/" + patient_id + "/" + scan_id + "/" + toString(angle) + "." + extension;
}

// Recompute over every stored row, not only the angles of one call.
std::vector<ScanAngle> UploadTargetIssuer::refreshMissingAngles(const std::string& scan_id) {
    std::optional<Scan> updated = store_->findScan(scan_id);
    if (!updated) {
        throw ScanNotFound(scan_id);
    }
    std::vector<ScanAngle> missing = computeMissingAngles(updated->images);
    store_->updateMissingAngles(scan_id, missing);
    return missing;
}

std::vector<UploadTarget> UploadTargetIssuer::issue(const std::string& scan_id,
                                                    const std::vector<UploadRequest>& items) {
    std::optional<Scan> scan = store_->findScan(scan_id);
    if (!scan) {
        throw ScanNotFound(scan_id);
    }

    std::vector<UploadTarget> results;
    results.reserve(items.size());

    try {
        for (const auto& item : items) {
            UploadTarget result;
            result.angle = item.angle;
            result.storage_key = storageKeyFor(scan->id, scan->patient_id, item.angle,
                                               extensionForContentType(item.content_type));
            result.target = storage_->issueWriteTarget(result.storage_key, item.content_type,
                                                       kUploadTargetTtlSeconds);
            result.display_url = storage_->publicUrl(result.storage_key);

            store_->upsertImage(scan->id, item.angle, result.storage_key, result.display_url, item.checksum);
            results.push_back(result);
        }
    } catch (const std::exception& e) {
        // Rows written before the failure still count toward missing angles.
        std::cerr << "Upload target issuance for scan " << scan_id << " stopped after "
                  << results.size() << " of " << items.size() << " items: " << e.what() << std::endl;
        refreshMissingAngles(scan_id);
        throw;
    }

    std::vector<ScanAngle> missing = refreshMissingAngles(scan_id);

    std::cout << "Issued " << results.size() << " upload targets for scan " << scan_id
              << " (" << missing.size() << " angles missing)" << std::endl;

    return results;
}

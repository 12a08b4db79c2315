#include "memory_scan_store.hpp"

#include <algorithm>

#include "../utils/time_utils.hpp"

Scan& MemoryScanStore::require(const std::string& scan_id) {
    auto it = scans_.find(scan_id);
    if (it == scans_.end()) {
        throw ScanNotFound(scan_id);
    }
    return it->second;
}

Scan MemoryScanStore::createScan(const NewScan& input) {
    Scan scan;
    scan.id = generateScanId();
    scan.patient_id = input.patient_id;
    scan.captured_at = input.captured_at
        ? formatIso8601(parseIso8601(*input.captured_at))
        : formatIso8601(Clock::now());
    scan.status = ScanStatus::Pending;

    for (const auto& declared : input.angles) {
        auto it = std::find_if(scan.images.begin(), scan.images.end(),
                               [&declared](const ScanImage& image) { return image.angle == declared.angle; });
        if (it != scan.images.end()) {
            it->checksum = declared.checksum;
            continue;
        }
        ScanImage image;
        image.scan_id = scan.id;
        image.angle = declared.angle;
        image.checksum = declared.checksum;
        scan.images.push_back(image);
    }
    scan.missing_angles = computeMissingAngles(scan.images);

    std::lock_guard<std::mutex> lock(mutex_);
    scans_[scan.id] = scan;
    return scan;
}

std::optional<Scan> MemoryScanStore::findScan(const std::string& scan_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = scans_.find(scan_id);
    if (it == scans_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Scan> MemoryScanStore::listScans(const std::string& patient_id) {
    std::vector<Scan> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : scans_) {
            if (entry.second.patient_id == patient_id) {
                result.push_back(entry.second);
            }
        }
    }
    std::stable_sort(result.begin(), result.end(), [](const Scan& a, const Scan& b) {
        return parseIso8601(a.captured_at) > parseIso8601(b.captured_at);
    });
    return result;
}

void MemoryScanStore::upsertImage(const std::string& scan_id,
                                  ScanAngle angle,
                                  const std::string& storage_key,
                                  const std::string& url,
                                  const std::optional<std::string>& checksum) {
    std::lock_guard<std::mutex> lock(mutex_);
    Scan& scan = require(scan_id);

    for (auto& image : scan.images) {
        if (image.angle == angle) {
            image.storage_key = storage_key;
            image.url = url;
            image.checksum = checksum;
            return;
        }
    }

    ScanImage image;
    image.scan_id = scan_id;
    image.angle = angle;
    image.storage_key = storage_key;
    image.url = url;
    image.checksum = checksum;
    scan.images.push_back(image);
}

void MemoryScanStore::updateImageAnalysis(const std::string& scan_id,
                                          ScanAngle angle,
                                          const QualityReport& report) {
    std::lock_guard<std::mutex> lock(mutex_);
    Scan& scan = require(scan_id);

    for (auto& image : scan.images) {
        if (image.angle == angle) {
            image.blur_score = report.blur_score;
            image.light_score = report.light_score;
            image.pose_ok = report.pose_ok;
            image.landmarks = report.landmarks;
            return;
        }
    }
    throw std::runtime_error("No " + toString(angle) + " image recorded for scan " + scan_id);
}

void MemoryScanStore::updateMissingAngles(const std::string& scan_id,
                                          const std::vector<ScanAngle>& missing_angles) {
    std::lock_guard<std::mutex> lock(mutex_);
    require(scan_id).missing_angles = missing_angles;
}

Scan MemoryScanStore::updateScanState(const std::string& scan_id,
                                      const QualityFlags& flags,
                                      const std::vector<ScanAngle>& missing_angles,
                                      ScanStatus status) {
    std::lock_guard<std::mutex> lock(mutex_);
    Scan& scan = require(scan_id);
    scan.quality_flags = flags.values();
    scan.missing_angles = missing_angles;
    scan.status = status;
    return scan;
}
